/*
 * Build/run pipeline - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <code-runner/exec/command.hpp>
#include <code-runner/lang/instructions.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace coderunner {

// What the caller receives, serialized as JSON.
struct RunResult {
    std::string stdout_text;
    std::string stderr_text;
    std::string error;          // empty on success
    std::uint64_t duration = 0; // nanoseconds
};

// A build command failed; later builds and the run command were skipped.
struct BuildFailure {
    std::string command;
    CommandError error;
};

using PipelineResult = std::variant<RunResult, BuildFailure>;

struct PipelineContext {
    std::string work_path;
    std::string shell = "sh";
    std::ostream* log = nullptr;       // debug trace, null when quiet
    std::vector<std::string> history;  // commands attempted, in order
};

class Pipeline {
public:
    Pipeline(PipelineContext& ctx) : m_ctx(ctx) {}

    // Builds in order without stdin, then the run command with stdin.
    PipelineResult run(const RunInstructions& instructions, const std::optional<std::string>& stdin_data);

    // Direct command path: a single command, never a BuildFailure.
    RunResult run_command(const std::string& command, const std::optional<std::string>& stdin_data);

    // One traced command in the work directory, recorded in the history.
    CommandResult exec(const std::string& command, const std::optional<std::string>& stdin_data);

private:
    PipelineContext& m_ctx;
};

RunResult to_success_result(const SuccessOutput& output);
RunResult to_error_result(const CommandError& error);

} // namespace coderunner
