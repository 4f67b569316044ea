/*
 * Output classification implementation - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/exec/output.hpp>
#include <utility>
#include <vector>

namespace coderunner {

static bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

std::optional<Utf8Error> validate_utf8(std::string_view bytes) {
    const size_t n = bytes.size();
    size_t i = 0;
    auto at = [&](size_t k) { return static_cast<unsigned char>(bytes[k]); };
    while (i < n) {
        unsigned char c = at(i);
        if (c < 0x80) { ++i; continue; }

        size_t width = 0;
        unsigned char lo = 0x80, hi = 0xBF; // range of the second byte
        if (c >= 0xC2 && c <= 0xDF) { width = 2; }
        else if (c == 0xE0) { width = 3; lo = 0xA0; }
        else if (c >= 0xE1 && c <= 0xEC) { width = 3; }
        else if (c == 0xED) { width = 3; hi = 0x9F; } // no surrogates
        else if (c >= 0xEE && c <= 0xEF) { width = 3; }
        else if (c == 0xF0) { width = 4; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) { width = 4; }
        else if (c == 0xF4) { width = 4; hi = 0x8F; } // <= U+10FFFF
        else return Utf8Error{i, 1};

        // second byte
        if (i + 1 >= n) return Utf8Error{i, std::nullopt};
        unsigned char c1 = at(i + 1);
        if (c1 < lo || c1 > hi) return Utf8Error{i, 1};
        // remaining continuation bytes
        for (size_t k = 2; k < width; ++k) {
            if (i + k >= n) return Utf8Error{i, std::nullopt};
            if (!is_cont(at(i + k))) return Utf8Error{i, k};
        }
        i += width;
    }
    return std::nullopt;
}

std::string Utf8Error::to_string() const {
    if (error_len) {
        return "invalid utf-8 sequence of " + std::to_string(*error_len) + " bytes from index " + std::to_string(valid_up_to);
    }
    return "incomplete utf-8 byte sequence from index " + std::to_string(valid_up_to);
}

std::string ErrorOutput::to_string() const {
    std::vector<std::string> parts;
    if (exit_code) parts.push_back("code: " + std::to_string(*exit_code));
    if (!stdout_text.empty()) parts.push_back("stdout: " + stdout_text);
    if (!stderr_text.empty()) parts.push_back("stderr: " + stderr_text);
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ", ";
        out += parts[i];
    }
    return out;
}

std::string OutputError::to_string() const {
    switch (kind) {
        case OutputErrorKind::ExitFailure:
            return "Exited with non-zero exit code. " + output.to_string();
        case OutputErrorKind::ReadStdout:
            return "Failed to read stdout. " + utf8.to_string();
        case OutputErrorKind::ReadStderr:
            return "Failed to read stderr. " + utf8.to_string();
    }
    return "unknown output error";
}

OutputResult classify(ProcessOutcome outcome) {
    if (auto bad = validate_utf8(outcome.stdout_data)) {
        OutputError e; e.kind = OutputErrorKind::ReadStdout; e.utf8 = *bad;
        return e;
    }
    if (auto bad = validate_utf8(outcome.stderr_data)) {
        OutputError e; e.kind = OutputErrorKind::ReadStderr; e.utf8 = *bad;
        return e;
    }
    if (outcome.status.success) {
        return SuccessOutput{std::move(outcome.stdout_data), std::move(outcome.stderr_data), outcome.duration};
    }
    OutputError e;
    e.kind = OutputErrorKind::ExitFailure;
    e.output = ErrorOutput{std::move(outcome.stdout_data), std::move(outcome.stderr_data), outcome.status.code};
    return e;
}

} // namespace coderunner
