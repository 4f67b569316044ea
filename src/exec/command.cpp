/*
 * Timed command execution implementation - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/exec/command.hpp>
#include <type_traits>
#include <utility>

namespace coderunner {

const ErrorOutput* CommandError::exit_failure() const {
    auto out = std::get_if<OutputError>(&cause);
    if (!out || out->kind != OutputErrorKind::ExitFailure) return nullptr;
    return &out->output;
}

std::string CommandError::to_string() const {
    return std::visit([](auto &err) -> std::string {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, ExecuteError>) {
            return "Error while executing command. " + err.to_string();
        } else {
            return "Error in output from command. " + err.to_string();
        }
    }, cause);
}

CommandResult run_command(const ExecOptions& opts) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
    };

    auto executed = execute(opts);
    if (auto err = std::get_if<ExecuteError>(&executed)) {
        return CommandError{*err, elapsed()};
    }
    auto classified = classify(std::move(std::get<ProcessOutcome>(executed)));
    if (auto err = std::get_if<OutputError>(&classified)) {
        return CommandError{std::move(*err), elapsed()};
    }
    return std::get<SuccessOutput>(std::move(classified));
}

} // namespace coderunner
