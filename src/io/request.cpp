/*
 * Request/result wire format implementation - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/io/request.hpp>
#include <utility>

namespace coderunner {

struct Mismatch {
    std::string message;
};

static std::string invalid_type(const json::Value& v, const std::string& expected) {
    std::string found = v.type_name();
    if (auto s = v.as_string()) found = "string " + json::quote(*s);
    return "invalid type: " + found + ", expected " + expected;
}

static const json::Object& expect_object(const json::Value& v, const std::string& what) {
    auto obj = v.as_object();
    if (!obj) throw Mismatch{invalid_type(v, what)};
    return *obj;
}

// Present and non-null member; duplicates are rejected.
static const json::Value* member(const json::Value& obj, const std::string& key) {
    if (obj.count(key) > 1) throw Mismatch{"duplicate field `" + key + "`"};
    auto v = obj.find(key);
    if (!v || v->is_null()) return nullptr;
    return v;
}

static const json::Value& required(const json::Value& obj, const std::string& key) {
    auto v = member(obj, key);
    if (!v) {
        if (obj.find(key)) throw Mismatch{invalid_type(*obj.find(key), "a value for `" + key + "`")};
        throw Mismatch{"missing field `" + key + "`"};
    }
    return *v;
}

static std::string string_of(const json::Value& v) {
    auto s = v.as_string();
    if (!s) throw Mismatch{invalid_type(v, "a string")};
    return *s;
}

static std::optional<std::string> optional_string(const json::Value& obj, const std::string& key) {
    auto v = member(obj, key);
    if (!v) return std::nullopt;
    return string_of(*v);
}

static std::vector<std::string> strings_of(const json::Value& v) {
    auto arr = v.as_array();
    if (!arr) throw Mismatch{invalid_type(v, "a sequence")};
    std::vector<std::string> out;
    out.reserve(arr->size());
    for (auto &item : *arr) out.push_back(string_of(item));
    return out;
}

static std::vector<RequestFile> files_of(const json::Value& v) {
    auto arr = v.as_array();
    if (!arr) throw Mismatch{invalid_type(v, "a sequence")};
    std::vector<RequestFile> out;
    out.reserve(arr->size());
    for (auto &item : *arr) {
        expect_object(item, "struct RequestFile");
        RequestFile f;
        f.name = string_of(required(item, "name"));
        f.content = string_of(required(item, "content"));
        out.push_back(std::move(f));
    }
    return out;
}

static LanguageRequest decode_language(const json::Value& v) {
    expect_object(v, "struct LanguageRequest");
    LanguageRequest req;
    std::string tag = string_of(required(v, "language"));
    auto lang = language_from_string(tag);
    if (!lang) throw Mismatch{"unknown variant `" + tag + "`"};
    req.language = *lang;
    req.files = files_of(required(v, "files"));
    req.stdin_data = optional_string(v, "stdin");
    req.command = optional_string(v, "command");
    return req;
}

static InstructionsRequest decode_instructions(const json::Value& v) {
    expect_object(v, "struct InstructionsRequest");
    InstructionsRequest req;
    const json::Value& ri = required(v, "runInstructions");
    expect_object(ri, "struct RunInstructions");
    req.run_instructions.build_commands = strings_of(required(ri, "buildCommands"));
    req.run_instructions.run_command = string_of(required(ri, "runCommand"));
    req.files = files_of(required(v, "files"));
    req.stdin_data = optional_string(v, "stdin");
    return req;
}

DecodeResult decode_request(const json::Value& value) {
    DecodeError err;
    err.message = "data did not match any variant of untagged enum RunRequest";
    try {
        return RunRequest{decode_language(value)};
    } catch (const Mismatch& m) {
        err.attempts.push_back("language request: " + m.message);
    }
    try {
        return RunRequest{decode_instructions(value)};
    } catch (const Mismatch& m) {
        err.attempts.push_back("instructions request: " + m.message);
    }
    return err;
}

DecodeResult parse_request(std::string_view text) {
    auto parsed = json::parse(text);
    if (auto pe = std::get_if<json::ParseError>(&parsed)) return DecodeError{pe->to_string(), {}};
    return decode_request(std::get<json::Value>(parsed));
}

const std::vector<RequestFile>& request_files(const RunRequest& req) {
    return std::visit([](const auto& r) -> const std::vector<RequestFile>& { return r.files; }, req);
}

const std::optional<std::string>& request_stdin(const RunRequest& req) {
    return std::visit([](const auto& r) -> const std::optional<std::string>& { return r.stdin_data; }, req);
}

std::string to_json(const RunResult& result) {
    std::string out = "{";
    out += "\"stdout\":" + json::quote(result.stdout_text) + ",";
    out += "\"stderr\":" + json::quote(result.stderr_text) + ",";
    out += "\"error\":" + json::quote(result.error) + ",";
    out += "\"duration\":" + std::to_string(result.duration);
    out += "}";
    return out;
}

} // namespace coderunner
