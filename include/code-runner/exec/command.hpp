/*
 * Timed command execution - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <code-runner/exec/process.hpp>
#include <code-runner/exec/output.hpp>
#include <chrono>
#include <string>
#include <variant>

namespace coderunner {

struct CommandError {
    std::variant<ExecuteError, OutputError> cause;
    std::chrono::nanoseconds duration{0};

    bool is_execute() const { return std::holds_alternative<ExecuteError>(cause); }
    // Non-null only for a process that ran and exited non-zero (or was killed).
    const ErrorOutput* exit_failure() const;
    std::string to_string() const;
};

using CommandResult = std::variant<SuccessOutput, CommandError>;

// execute() + classify(), timed from before spawn.
CommandResult run_command(const ExecOptions& opts);

} // namespace coderunner
