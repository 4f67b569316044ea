/*
 * Non-empty ordered list - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <vector>
#include <optional>
#include <utility>

namespace coderunner {

// Ordered sequence with at least one element. The head is the main file
// when used for submissions; the tail holds the auxiliary files.
template <typename T>
class NonEmpty {
public:
    NonEmpty(T head, std::vector<T> tail = {}) : m_head(std::move(head)), m_tail(std::move(tail)) {}

    const T& head() const { return m_head; }
    const std::vector<T>& tail() const { return m_tail; }
    std::size_t size() const { return m_tail.size() + 1; }

    std::vector<T> to_vector() const {
        std::vector<T> out; out.reserve(size());
        out.push_back(m_head);
        out.insert(out.end(), m_tail.begin(), m_tail.end());
        return out;
    }

    bool operator==(const NonEmpty& other) const { return m_head == other.m_head && m_tail == other.m_tail; }
    bool operator!=(const NonEmpty& other) const { return !(*this == other); }

private:
    T m_head;
    std::vector<T> m_tail;
};

// nullopt when the vector is empty.
template <typename T>
std::optional<NonEmpty<T>> from_vector(std::vector<T> vec) {
    if (vec.empty()) return std::nullopt;
    T head = std::move(vec.front());
    vec.erase(vec.begin());
    return NonEmpty<T>(std::move(head), std::move(vec));
}

} // namespace coderunner
