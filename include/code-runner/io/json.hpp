/*
 * Minimal JSON reader/writer - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Just enough JSON for the request/result wire format: a tree reader with
 *   line/column errors and string quoting for the writer side. Object keys
 *   keep their input order.
 */
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace coderunner::json {

class Value;
using Array = std::vector<Value>;
using Object = std::vector<std::pair<std::string, Value>>;

class Value {
public:
    Value() : m_data(nullptr) {}
    Value(std::nullptr_t) : m_data(nullptr) {}
    Value(bool b) : m_data(b) {}
    Value(double d) : m_data(d) {}
    Value(std::string s) : m_data(std::move(s)) {}
    Value(const char* s) : m_data(std::string(s)) {}
    Value(Array a) : m_data(std::move(a)) {}
    Value(Object o) : m_data(std::move(o)) {}

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(m_data); }
    const bool* as_bool() const { return std::get_if<bool>(&m_data); }
    const double* as_number() const { return std::get_if<double>(&m_data); }
    const std::string* as_string() const { return std::get_if<std::string>(&m_data); }
    const Array* as_array() const { return std::get_if<Array>(&m_data); }
    const Object* as_object() const { return std::get_if<Object>(&m_data); }

    // First member named `key`; nullptr when absent or not an object.
    const Value* find(const std::string& key) const;
    // Number of members named `key` (0 when not an object).
    std::size_t count(const std::string& key) const;

    // JSON type name used in error messages ("string", "array", ...).
    const char* type_name() const;

private:
    std::variant<std::nullptr_t, bool, double, std::string, Array, Object> m_data;
};

struct ParseError {
    std::string message;
    std::size_t line = 1;
    std::size_t column = 0;
    std::string to_string() const; // "<message> at line L column C"
};

using ParseResult = std::variant<Value, ParseError>;

ParseResult parse(std::string_view text);

// Quoted JSON string literal with standard escaping. Bytes >= 0x80 pass through.
std::string quote(std::string_view s);

} // namespace coderunner::json
