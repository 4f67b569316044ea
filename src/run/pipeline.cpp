/*
 * Build/run pipeline implementation - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/run/pipeline.hpp>
#include <utility>

namespace coderunner {

RunResult to_success_result(const SuccessOutput& output) {
    RunResult r;
    r.stdout_text = output.stdout_text;
    r.stderr_text = output.stderr_text;
    r.duration = static_cast<std::uint64_t>(output.duration.count());
    return r;
}

RunResult to_error_result(const CommandError& error) {
    RunResult r;
    r.duration = static_cast<std::uint64_t>(error.duration.count());
    if (auto out = error.exit_failure()) {
        r.stdout_text = out->stdout_text;
        r.stderr_text = out->stderr_text;
        // killed by a signal: no code, error stays empty
        if (out->exit_code) r.error = "Exit code: " + std::to_string(*out->exit_code);
        return r;
    }
    r.error = error.to_string();
    return r;
}

CommandResult Pipeline::exec(const std::string& command, const std::optional<std::string>& stdin_data) {
    m_ctx.history.push_back(command);
    if (m_ctx.log) *m_ctx.log << "[code-runner] exec: " << command << '\n';
    ExecOptions opts;
    opts.work_path = m_ctx.work_path;
    opts.command = command;
    opts.stdin_data = stdin_data;
    opts.shell = m_ctx.shell;
    auto result = coderunner::run_command(opts);
    if (m_ctx.log) {
        if (auto err = std::get_if<CommandError>(&result)) *m_ctx.log << "[code-runner]   failed: " << err->to_string() << '\n';
        else *m_ctx.log << "[code-runner]   ok (" << std::get<SuccessOutput>(result).duration.count() << " ns)\n";
    }
    return result;
}

PipelineResult Pipeline::run(const RunInstructions& instructions, const std::optional<std::string>& stdin_data) {
    for (auto &cmd : instructions.build_commands) {
        auto built = exec(cmd, std::nullopt);
        if (auto err = std::get_if<CommandError>(&built)) {
            return BuildFailure{cmd, std::move(*err)};
        }
    }
    return run_command(instructions.run_command, stdin_data);
}

RunResult Pipeline::run_command(const std::string& command, const std::optional<std::string>& stdin_data) {
    auto result = exec(command, stdin_data);
    if (auto err = std::get_if<CommandError>(&result)) return to_error_result(*err);
    return to_success_result(std::get<SuccessOutput>(result));
}

} // namespace coderunner
