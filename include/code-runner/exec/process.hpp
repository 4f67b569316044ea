/*
 * POSIX process executor - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace coderunner {

struct ExecOptions {
    std::string work_path;                 // child cwd
    std::string command;                   // passed to `<shell> -c`
    std::optional<std::string> stdin_data; // nullopt: child gets EOF immediately
    std::string shell = "sh";              // looked up in PATH
};

struct ExitStatus {
    bool success = false;
    std::optional<int> code;   // absent when terminated by a signal
    std::optional<int> signal;
};

struct ProcessOutcome {
    std::string stdout_data; // raw bytes
    std::string stderr_data;
    ExitStatus status;
    std::chrono::nanoseconds duration{0}; // spawn through wait
};

enum class ExecuteErrorKind {
    Spawn,        // fork/pipe failed, or chdir/exec failed in the child
    CaptureStdin, // stdin pipe unavailable
    WriteStdin,   // writing stdin failed (e.g. EPIPE)
    WaitForChild, // poll/read/waitpid failed
};

struct ExecuteError {
    ExecuteErrorKind kind = ExecuteErrorKind::Spawn;
    int error_number = 0; // errno, 0 when not applicable
    std::string to_string() const;
};

using ExecuteResult = std::variant<ProcessOutcome, ExecuteError>;

// Runs `opts.shell -c opts.command` in opts.work_path with all three standard
// streams piped. Blocks until the child exits; no timeout.
ExecuteResult execute(const ExecOptions& opts);

} // namespace coderunner
