/*
 * Output classification - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <code-runner/exec/process.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace coderunner {

struct SuccessOutput {
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::nanoseconds duration{0};
};

// Output of a process that did not exit with 0.
struct ErrorOutput {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code; // nullopt when killed by a signal
    // "code: N, stdout: ..., stderr: ..." with empty parts omitted
    std::string to_string() const;
};

struct Utf8Error {
    size_t valid_up_to = 0;
    std::optional<size_t> error_len; // nullopt: input ended mid-sequence
    std::string to_string() const;
};

enum class OutputErrorKind { ExitFailure, ReadStdout, ReadStderr };

struct OutputError {
    OutputErrorKind kind = OutputErrorKind::ExitFailure;
    ErrorOutput output;  // ExitFailure
    Utf8Error utf8;      // ReadStdout / ReadStderr
    std::string to_string() const;
};

using OutputResult = std::variant<SuccessOutput, OutputError>;

// Strict validation: no replacement characters, no overlongs or surrogates.
std::optional<Utf8Error> validate_utf8(std::string_view bytes);

OutputResult classify(ProcessOutcome outcome);

} // namespace coderunner
