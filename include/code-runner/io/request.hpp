/*
 * Request/result wire format - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   A request is one JSON object read from stdin. Two shapes are accepted and
 *   told apart by their fields (language-tagged first, then pre-resolved
 *   instructions). Unknown keys are ignored and null counts as absent.
 */
#pragma once
#include <code-runner/io/files.hpp>
#include <code-runner/io/json.hpp>
#include <code-runner/lang/instructions.hpp>
#include <code-runner/lang/language.hpp>
#include <code-runner/run/pipeline.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace coderunner {

// {"language", "files", "stdin"?, "command"?}
struct LanguageRequest {
    Language language = Language::Bash;
    std::vector<RequestFile> files;
    std::optional<std::string> stdin_data;
    // Absent and empty both fall through to the language recipe.
    std::optional<std::string> command;
};

// {"runInstructions": {"buildCommands", "runCommand"}, "files", "stdin"?}
struct InstructionsRequest {
    RunInstructions run_instructions;
    std::vector<RequestFile> files;
    std::optional<std::string> stdin_data;
};

using RunRequest = std::variant<LanguageRequest, InstructionsRequest>;

struct DecodeError {
    std::string message;
    // Why each request shape was rejected, for debug output.
    std::vector<std::string> attempts;
};

using DecodeResult = std::variant<RunRequest, DecodeError>;

DecodeResult decode_request(const json::Value& value);
DecodeResult parse_request(std::string_view text);

const std::vector<RequestFile>& request_files(const RunRequest& req);
const std::optional<std::string>& request_stdin(const RunRequest& req);

// {"stdout","stderr","error","duration"} in that order, no trailing newline.
std::string to_json(const RunResult& result);

} // namespace coderunner
