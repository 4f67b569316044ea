/*
 * POSIX process executor implementation - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/exec/process.hpp>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace coderunner {

constexpr size_t kChunk = 64 * 1024;

// Owning file descriptor.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : m_fd(fd) {}
    ~Fd() { reset(); }
    Fd(Fd&& o) noexcept : m_fd(o.release()) {}
    Fd& operator=(Fd&& o) noexcept { if (this != &o) reset(o.release()); return *this; }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    int get() const { return m_fd; }
    int release() { int fd = m_fd; m_fd = -1; return fd; }
    void reset(int fd = -1) { if (m_fd >= 0) ::close(m_fd); m_fd = fd; }
    explicit operator bool() const { return m_fd >= 0; }
private:
    int m_fd = -1;
};

// Parent must not die on EPIPE while feeding stdin.
class IgnoreSigpipe {
public:
    IgnoreSigpipe() {
        struct sigaction sa{};
        sa.sa_handler = SIG_IGN;
        sigemptyset(&sa.sa_mask);
        m_active = ::sigaction(SIGPIPE, &sa, &m_old) == 0;
    }
    ~IgnoreSigpipe() { if (m_active) ::sigaction(SIGPIPE, &m_old, nullptr); }
    IgnoreSigpipe(const IgnoreSigpipe&) = delete;
    IgnoreSigpipe& operator=(const IgnoreSigpipe&) = delete;
private:
    struct sigaction m_old{};
    bool m_active = false;
};

static bool make_pipe(Fd& read_end, Fd& write_end) {
    int p[2];
    if (::pipe2(p, O_CLOEXEC) != 0) return false;
    read_end.reset(p[0]);
    write_end.reset(p[1]);
    return true;
}

static bool set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

static std::string os_error(int err) {
    return std::string(std::strerror(err)) + " (os error " + std::to_string(err) + ")";
}

static ExecuteError fail(ExecuteErrorKind kind, int err) {
    ExecuteError e; e.kind = kind; e.error_number = err;
    return e;
}

// Child side: only async-signal-safe calls until exec.
[[noreturn]] static void child_fail(int report_fd) {
    int err = errno;
    ssize_t n;
    do { n = ::write(report_fd, &err, sizeof(err)); } while (n < 0 && errno == EINTR);
    _exit(127);
}

static void redirect(int fd, int target, int report_fd) {
    if (fd == target) {
        // dup2 onto itself keeps FD_CLOEXEC set
        if (::fcntl(fd, F_SETFD, 0) != 0) child_fail(report_fd);
        return;
    }
    if (::dup2(fd, target) < 0) child_fail(report_fd);
}

// Reads everything currently available. Returns false on a hard read error.
static bool drain(Fd& fd, std::string& out) {
    char buf[kChunk];
    while (true) {
        ssize_t r = ::read(fd.get(), buf, sizeof(buf));
        if (r > 0) { out.append(buf, static_cast<size_t>(r)); continue; }
        if (r == 0) { fd.reset(); return true; } // EOF
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

static int wait_child(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return errno;
    }
    return 0;
}

static ExitStatus decode_status(int st) {
    ExitStatus s;
    if (WIFEXITED(st)) {
        s.code = WEXITSTATUS(st);
        s.success = (*s.code == 0);
    } else if (WIFSIGNALED(st)) {
        s.signal = WTERMSIG(st);
    }
    return s;
}

std::string ExecuteError::to_string() const {
    switch (kind) {
        case ExecuteErrorKind::Spawn:
            return os_error(error_number);
        case ExecuteErrorKind::CaptureStdin:
            return "Failed to capture stdin.";
        case ExecuteErrorKind::WriteStdin:
            return "Failed to write to stdin. " + os_error(error_number);
        case ExecuteErrorKind::WaitForChild:
            return "Failed while waiting for child. " + os_error(error_number);
    }
    return "unknown execute error";
}

ExecuteResult execute(const ExecOptions& opts) {
    Fd in_r, in_w, out_r, out_w, err_r, err_w, report_r, report_w;
    if (!make_pipe(in_r, in_w) || !set_nonblocking(in_w.get())) return fail(ExecuteErrorKind::CaptureStdin, errno);
    if (!make_pipe(out_r, out_w) || !make_pipe(err_r, err_w) || !make_pipe(report_r, report_w)) {
        return fail(ExecuteErrorKind::Spawn, errno);
    }
    if (!set_nonblocking(out_r.get()) || !set_nonblocking(err_r.get())) return fail(ExecuteErrorKind::Spawn, errno);

    // argv prepared before fork: no allocation in the child
    std::vector<char*> cargv;
    std::string dash_c = "-c";
    cargv.push_back(const_cast<char*>(opts.shell.c_str()));
    cargv.push_back(const_cast<char*>(dash_c.c_str()));
    cargv.push_back(const_cast<char*>(opts.command.c_str()));
    cargv.push_back(nullptr);

    IgnoreSigpipe sigpipe_guard;
    auto start = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) return fail(ExecuteErrorKind::Spawn, errno);
    if (pid == 0) {
        std::signal(SIGPIPE, SIG_DFL);
        std::signal(SIGINT, SIG_DFL);
        int report = report_w.get();
        redirect(in_r.get(), STDIN_FILENO, report);
        redirect(out_w.get(), STDOUT_FILENO, report);
        redirect(err_w.get(), STDERR_FILENO, report);
        if (!opts.work_path.empty() && ::chdir(opts.work_path.c_str()) != 0) child_fail(report);
        ::execvp(cargv[0], cargv.data());
        child_fail(report);
    }

    in_r.reset(); out_w.reset(); err_w.reset(); report_w.reset();

    // The report pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n;
    do { n = ::read(report_r.get(), &child_errno, sizeof(child_errno)); } while (n < 0 && errno == EINTR);
    report_r.reset();
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int st = 0;
        wait_child(pid, st);
        return fail(ExecuteErrorKind::Spawn, child_errno);
    }

    const std::string* input = opts.stdin_data ? &*opts.stdin_data : nullptr;
    size_t written = 0;
    if (!input || input->empty()) in_w.reset();

    ProcessOutcome outcome;
    int write_errno = 0;
    int io_errno = 0;
    while (out_r || err_r || in_w) {
        pollfd fds[3];
        Fd* owners[3];
        nfds_t nfds = 0;
        if (in_w) { fds[nfds] = {in_w.get(), POLLOUT, 0}; owners[nfds++] = &in_w; }
        if (out_r) { fds[nfds] = {out_r.get(), POLLIN, 0}; owners[nfds++] = &out_r; }
        if (err_r) { fds[nfds] = {err_r.get(), POLLIN, 0}; owners[nfds++] = &err_r; }

        int ready = ::poll(fds, nfds, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            io_errno = errno;
            break;
        }
        for (nfds_t i = 0; i < nfds; ++i) {
            if (fds[i].revents == 0) continue;
            Fd& fd = *owners[i];
            if (&fd == &in_w) {
                size_t len = std::min(kChunk, input->size() - written);
                ssize_t w = ::write(fd.get(), input->data() + written, len);
                if (w > 0) {
                    written += static_cast<size_t>(w);
                    if (written == input->size()) fd.reset();
                } else if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    write_errno = errno;
                    fd.reset();
                }
            } else {
                std::string& sink = (&fd == &out_r) ? outcome.stdout_data : outcome.stderr_data;
                if (!drain(fd, sink)) { io_errno = errno; break; }
            }
        }
        if (io_errno != 0) break;
    }
    // on error, closing our ends lets the child run to completion
    in_w.reset(); out_r.reset(); err_r.reset();

    int st = 0;
    int wait_errno = wait_child(pid, st);
    outcome.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);

    if (write_errno != 0) return fail(ExecuteErrorKind::WriteStdin, write_errno);
    if (io_errno != 0) return fail(ExecuteErrorKind::WaitForChild, io_errno);
    if (wait_errno != 0) return fail(ExecuteErrorKind::WaitForChild, wait_errno);

    outcome.status = decode_status(st);
    return outcome;
}

} // namespace coderunner
