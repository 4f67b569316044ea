/*
 * Request runner - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Handles one request end to end: decode, pick and create the work
 *   directory, unpack the bootstrap archive, write the submitted files, then
 *   run either the direct command, the language recipe or the supplied
 *   instructions.
 */
#pragma once
#include <code-runner/app/config.hpp>
#include <code-runner/io/files.hpp>
#include <code-runner/io/request.hpp>
#include <code-runner/run/pipeline.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace coderunner {

enum class RunnerErrorKind {
    ParseRequest,
    NoFiles,
    StripWorkPath,
    EmptyFileName,
    EmptyFileContent,
    WorkDirTimestamp,
    CreateWorkDir,
    GetParentDir,
    CreateParentDir,
    WriteFile,
    Bootstrap,
    Compile,
};

struct RunnerError {
    RunnerErrorKind kind = RunnerErrorKind::ParseRequest;
    std::string message;
    std::optional<CommandError> command; // set for Bootstrap and Compile

    const std::string& to_string() const { return message; }
};

RunnerError from_file_error(const FileError& err);

using RunnerResult = std::variant<RunResult, RunnerError>;

class Runner {
public:
    explicit Runner(RunnerConfig cfg, std::ostream& log = std::cerr);

    // work_path overrides the time-seeded default directory.
    RunnerResult run(std::string_view request_json, const std::optional<std::string>& work_path = std::nullopt);

    std::variant<std::filesystem::path, RunnerError> choose_work_path(const std::optional<std::string>& work_path) const;

    // Commands attempted by the last run() (bootstrap included).
    const std::vector<std::string>& history() const { return m_history; }

private:
    std::optional<RunnerError> bootstrap(Pipeline& pipeline);
    std::optional<RunnerError> write_files(const std::vector<SourceFile>& files);
    RunnerResult dispatch(Pipeline& pipeline, const std::filesystem::path& work, const RunRequest& req, const std::vector<SourceFile>& files);
    RunnerResult finish(PipelineResult result);
    void debug(const std::string& msg) const;

    RunnerConfig m_cfg;
    std::ostream& m_log;
    std::vector<std::string> m_history;
};

} // namespace coderunner
