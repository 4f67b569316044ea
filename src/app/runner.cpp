/*
 * Request runner implementation - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/app/runner.hpp>
#include <chrono>
#include <system_error>
#include <utility>

namespace coderunner {

namespace fs = std::filesystem;

RunnerError from_file_error(const FileError& err) {
    RunnerErrorKind kind = RunnerErrorKind::WriteFile;
    switch (err.kind) {
        case FileErrorKind::EmptyFileName: kind = RunnerErrorKind::EmptyFileName; break;
        case FileErrorKind::EmptyFileContent: kind = RunnerErrorKind::EmptyFileContent; break;
        case FileErrorKind::NoFiles: kind = RunnerErrorKind::NoFiles; break;
        case FileErrorKind::StripWorkPath: kind = RunnerErrorKind::StripWorkPath; break;
        case FileErrorKind::GetParentDir: kind = RunnerErrorKind::GetParentDir; break;
        case FileErrorKind::CreateParentDir: kind = RunnerErrorKind::CreateParentDir; break;
        case FileErrorKind::WriteFile: kind = RunnerErrorKind::WriteFile; break;
    }
    return RunnerError{kind, err.to_string(), std::nullopt};
}

Runner::Runner(RunnerConfig cfg, std::ostream& log) : m_cfg(std::move(cfg)), m_log(log) {}

void Runner::debug(const std::string& msg) const {
    if (m_cfg.debug) m_log << "[code-runner] " << msg << '\n';
}

std::variant<fs::path, RunnerError> Runner::choose_work_path(const std::optional<std::string>& work_path) const {
    if (work_path) return fs::path(*work_path);

    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
    if (seconds < 0) return RunnerError{RunnerErrorKind::WorkDirTimestamp, "Failed to get timestamp for work directory, system time is before the unix epoch", std::nullopt};

    fs::path base;
    if (!m_cfg.temp_dir.empty()) {
        base = m_cfg.temp_dir;
    } else {
        std::error_code ec;
        base = fs::temp_directory_path(ec);
        if (ec) base = "/tmp";
    }
    return base / (m_cfg.work_dir_prefix + std::to_string(seconds));
}

std::optional<RunnerError> Runner::bootstrap(Pipeline& pipeline) {
    if (m_cfg.bootstrap_file.empty()) return std::nullopt;
    std::error_code ec;
    if (!fs::exists(m_cfg.bootstrap_file, ec)) return std::nullopt;

    debug("unpacking " + m_cfg.bootstrap_file);
    auto result = pipeline.exec("tar -zxf " + m_cfg.bootstrap_file, std::nullopt);
    if (auto err = std::get_if<CommandError>(&result)) {
        return RunnerError{RunnerErrorKind::Bootstrap, "Failed to unpack bootstrap file: " + err->to_string(), *err};
    }
    return std::nullopt;
}

std::optional<RunnerError> Runner::write_files(const std::vector<SourceFile>& files) {
    for (auto &f : files) {
        if (auto err = write_file(f)) return from_file_error(*err);
        debug("wrote " + f.path.string());
    }
    return std::nullopt;
}

RunnerResult Runner::finish(PipelineResult result) {
    if (auto failure = std::get_if<BuildFailure>(&result)) {
        return RunnerError{RunnerErrorKind::Compile, "Failed to compile: " + failure->error.to_string(), failure->error};
    }
    return std::get<RunResult>(std::move(result));
}

RunnerResult Runner::dispatch(Pipeline& pipeline, const fs::path& work, const RunRequest& req, const std::vector<SourceFile>& files) {
    const auto& input = request_stdin(req);
    if (auto v2 = std::get_if<InstructionsRequest>(&req)) {
        return finish(pipeline.run(v2->run_instructions, input));
    }

    auto &v1 = std::get<LanguageRequest>(req);
    if (v1.command && !v1.command->empty()) {
        return pipeline.run_command(*v1.command, input);
    }

    auto paths = relative_paths(work, files);
    if (auto err = std::get_if<FileError>(&paths)) return from_file_error(*err);
    auto instructions = resolve(v1.language, std::get<NonEmpty<fs::path>>(paths));
    debug("language " + to_string(v1.language) + ": " + std::to_string(instructions.build_commands.size()) + " build step(s)");
    return finish(pipeline.run(instructions, input));
}

RunnerResult Runner::run(std::string_view request_json, const std::optional<std::string>& work_path) {
    m_history.clear();

    auto decoded = parse_request(request_json);
    if (auto err = std::get_if<DecodeError>(&decoded)) {
        for (auto &why : err->attempts) debug(why);
        return RunnerError{RunnerErrorKind::ParseRequest, "Failed to parse request json, " + err->message, std::nullopt};
    }
    const RunRequest& req = std::get<RunRequest>(decoded);

    auto chosen = choose_work_path(work_path);
    if (auto err = std::get_if<RunnerError>(&chosen)) return *err;
    fs::path work = std::get<fs::path>(chosen);
    debug("work dir: " + work.string());

    std::error_code ec;
    fs::create_directories(work, ec);
    if (ec) return RunnerError{RunnerErrorKind::CreateWorkDir, "Failed to create work directory '" + work.string() + "'. " + ec.message(), std::nullopt};

    PipelineContext ctx;
    ctx.work_path = work.string();
    ctx.shell = m_cfg.shell;
    ctx.log = m_cfg.debug ? &m_log : nullptr;
    Pipeline pipeline(ctx);

    auto result = [&]() -> RunnerResult {
        // every entry is checked before the bootstrap archive is unpacked
        auto sources = to_source_files(work, request_files(req));
        if (auto err = std::get_if<FileError>(&sources)) return from_file_error(*err);
        auto &files = std::get<std::vector<SourceFile>>(sources);
        if (auto err = bootstrap(pipeline)) return *err;
        if (auto err = write_files(files)) return *err;
        return dispatch(pipeline, work, req, files);
    }();
    m_history = ctx.history;
    return result;
}

} // namespace coderunner
