/**
 * @file compare.hpp
 * @brief Comparison, hashing and stream output for ExactString.
 *
 * Everything here works on view(), so a buffer compares, hashes and prints
 * exactly like the text it holds. TextHash and TextEqual allow looking up
 * ExactString keys in unordered containers with a plain std::string_view:
 *
 * @code
 * std::unordered_map<ExactString, int, TextHash, TextEqual> counts;
 * auto it = counts.find(std::string_view("key"));
 * @endcode
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef EXACTSTR_COMPARE_HPP
#define EXACTSTR_COMPARE_HPP

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string_view>

#include "exact_string.hpp"

namespace exactstr {

template <typename Alloc>
bool operator==(const BasicExactString<Alloc>& lhs, const BasicExactString<Alloc>& rhs) noexcept {
    return lhs.view() == rhs.view();
}

template <typename Alloc>
bool operator==(const BasicExactString<Alloc>& lhs, std::string_view rhs) noexcept {
    return lhs.view() == rhs;
}

/**
 * @brief Byte-wise lexicographic ordering.
 */
template <typename Alloc>
std::strong_ordering operator<=>(const BasicExactString<Alloc>& lhs,
                                 const BasicExactString<Alloc>& rhs) noexcept {
    return lhs.view().compare(rhs.view()) <=> 0;
}

template <typename Alloc>
std::strong_ordering operator<=>(const BasicExactString<Alloc>& lhs, std::string_view rhs) noexcept {
    return lhs.view().compare(rhs) <=> 0;
}

template <typename Alloc>
std::ostream& operator<<(std::ostream& os, const BasicExactString<Alloc>& str) {
    return os << str.view();
}

/**
 * @brief Transparent hash over text content.
 *
 * Produces the same value for a buffer and for a string_view holding the
 * same bytes.
 */
struct TextHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view text) const noexcept {
        return std::hash<std::string_view>{}(text);
    }
};

/**
 * @brief Transparent equality over text content.
 */
struct TextEqual {
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
        return lhs == rhs;
    }
};

} // namespace exactstr

namespace std {

template <typename Alloc>
struct hash<exactstr::BasicExactString<Alloc>> {
    std::size_t operator()(const exactstr::BasicExactString<Alloc>& str) const noexcept {
        return std::hash<std::string_view>{}(str.view());
    }
};

} // namespace std

#endif // EXACTSTR_COMPARE_HPP
