/*
 * Minimal JSON reader/writer implementation - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <code-runner/io/json.hpp>
#include <code-runner/exec/output.hpp>
#include <cstdio>
#include <cstdlib>
#include <optional>

namespace coderunner::json {

const Value* Value::find(const std::string& key) const {
    auto obj = as_object();
    if (!obj) return nullptr;
    for (auto &kv : *obj) if (kv.first == key) return &kv.second;
    return nullptr;
}

std::size_t Value::count(const std::string& key) const {
    auto obj = as_object();
    if (!obj) return 0;
    std::size_t n = 0;
    for (auto &kv : *obj) if (kv.first == key) ++n;
    return n;
}

const char* Value::type_name() const {
    switch (m_data.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "number";
        case 3: return "string";
        case 4: return "array";
        default: return "object";
    }
}

std::string ParseError::to_string() const {
    return message + " at line " + std::to_string(line) + " column " + std::to_string(column);
}

constexpr int kMaxDepth = 128;

// Thrown only inside this file, converted to ParseError by parse().
struct Failure {
    std::string message;
    std::size_t pos;
};

class Parser {
public:
    explicit Parser(std::string_view input) : m_input(input) {}

    Value run() {
        skip_space();
        Value v = value(0);
        skip_space();
        if (!eof()) fail("trailing characters");
        return v;
    }

private:
    [[noreturn]] void fail(const std::string& msg) const { throw Failure{msg, m_pos}; }
    [[noreturn]] void fail_at(const std::string& msg, std::size_t pos) const { throw Failure{msg, pos}; }
    bool eof() const { return m_pos >= m_input.size(); }
    char peek() const { return eof() ? '\0' : m_input[m_pos]; }
    char get() { return m_input[m_pos++]; }

    void skip_space() {
        while (!eof()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') ++m_pos; else break;
        }
    }

    Value value(int depth) {
        if (eof()) fail("EOF while parsing a value");
        char c = peek();
        switch (c) {
            case '{': return object(depth + 1);
            case '[': return array(depth + 1);
            case '"': ++m_pos; return Value(string_body());
            case 't': literal("true"); return Value(true);
            case 'f': literal("false"); return Value(false);
            case 'n': literal("null"); return Value(nullptr);
            default:
                if (c == '-' || (c >= '0' && c <= '9')) return Value(number());
                fail("expected value");
        }
    }

    void literal(const char* word) {
        std::size_t start = m_pos;
        for (const char* p = word; *p; ++p) {
            if (eof()) fail("EOF while parsing a value");
            if (get() != *p) fail_at("expected ident", start);
        }
    }

    double number() {
        std::size_t start = m_pos;
        if (peek() == '-') ++m_pos;
        if (peek() == '0') {
            ++m_pos;
        } else if (peek() >= '1' && peek() <= '9') {
            while (peek() >= '0' && peek() <= '9') ++m_pos;
        } else {
            fail("invalid number");
        }
        if (peek() == '.') {
            ++m_pos;
            if (!(peek() >= '0' && peek() <= '9')) fail("invalid number");
            while (peek() >= '0' && peek() <= '9') ++m_pos;
        }
        if (peek() == 'e' || peek() == 'E') {
            ++m_pos;
            if (peek() == '+' || peek() == '-') ++m_pos;
            if (!(peek() >= '0' && peek() <= '9')) fail("invalid number");
            while (peek() >= '0' && peek() <= '9') ++m_pos;
        }
        std::string text(m_input.substr(start, m_pos - start));
        return std::strtod(text.c_str(), nullptr);
    }

    unsigned hex4() {
        unsigned v = 0;
        for (int i = 0; i < 4; ++i) {
            if (eof()) fail("EOF while parsing a string");
            char c = get();
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(c - 'A' + 10);
            else fail("invalid escape");
        }
        return v;
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    // Opening quote already consumed.
    std::string string_body() {
        std::string out;
        while (true) {
            if (eof()) fail("EOF while parsing a string");
            char c = get();
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character (\\u0000-\\u001F) found while parsing a string");
            if (c != '\\') { out.push_back(c); continue; }
            if (eof()) fail("EOF while parsing a string");
            char e = get();
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned cp = hex4();
                    if (cp >= 0xDC00 && cp <= 0xDFFF) fail("lone leading surrogate in hex escape");
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (peek() != '\\') fail("unexpected end of hex escape");
                        ++m_pos;
                        if (peek() != 'u') fail("unexpected end of hex escape");
                        ++m_pos;
                        unsigned lo = hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) fail("lone leading surrogate in hex escape");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail("invalid escape");
            }
        }
    }

    Value array(int depth) {
        if (depth > kMaxDepth) fail("recursion limit exceeded");
        ++m_pos; // [
        Array items;
        skip_space();
        if (peek() == ']') { ++m_pos; return Value(std::move(items)); }
        while (true) {
            skip_space();
            items.push_back(value(depth));
            skip_space();
            if (eof()) fail("EOF while parsing a list");
            char c = get();
            if (c == ']') break;
            if (c != ',') fail_at("expected `,` or `]`", m_pos - 1);
            skip_space();
            if (peek() == ']') fail("trailing comma");
        }
        return Value(std::move(items));
    }

    Value object(int depth) {
        if (depth > kMaxDepth) fail("recursion limit exceeded");
        ++m_pos; // {
        Object members;
        skip_space();
        if (peek() == '}') { ++m_pos; return Value(std::move(members)); }
        while (true) {
            skip_space();
            if (eof()) fail("EOF while parsing an object");
            if (peek() != '"') fail("key must be a string");
            ++m_pos;
            std::string key = string_body();
            skip_space();
            if (eof()) fail("EOF while parsing an object");
            if (get() != ':') fail_at("expected `:`", m_pos - 1);
            skip_space();
            Value v = value(depth);
            members.emplace_back(std::move(key), std::move(v));
            skip_space();
            if (eof()) fail("EOF while parsing an object");
            char c = get();
            if (c == '}') break;
            if (c != ',') fail_at("expected `,` or `}`", m_pos - 1);
            skip_space();
            if (peek() == '}') fail("trailing comma");
        }
        return Value(std::move(members));
    }

    std::string_view m_input;
    std::size_t m_pos = 0;
};

// 1-based line, column of the byte at `pos` (column 0 for an empty line).
static std::pair<std::size_t, std::size_t> position(std::string_view text, std::size_t pos) {
    std::size_t line = 1, column = 0;
    for (std::size_t i = 0; i < pos && i < text.size(); ++i) {
        if (text[i] == '\n') { ++line; column = 0; } else { ++column; }
    }
    if (pos < text.size() && text[pos] != '\n') ++column;
    return {line, column};
}

ParseResult parse(std::string_view text) {
    if (auto bad = validate_utf8(text)) {
        auto lc = position(text, bad->valid_up_to);
        return ParseError{"invalid unicode code point", lc.first, lc.second};
    }
    try {
        Parser p(text);
        return p.run();
    } catch (const Failure& f) {
        auto lc = position(text, f.pos);
        return ParseError{f.message, lc.first, lc.second};
    }
}

std::string quote(std::string_view s) {
    std::string out; out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c)); out += buf;
                } else out.push_back(c);
        }
    }
    out.push_back('"');
    return out;
}

} // namespace coderunner::json
