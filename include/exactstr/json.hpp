/**
 * @file json.hpp
 * @brief nlohmann::json support for ExactString.
 *
 * A buffer is encoded as a plain JSON string. Only JSON strings decode
 * back into a buffer; anything else raises nlohmann::json::type_error.
 *
 * Not included by exactstr.hpp; include it where persistence needs it.
 * Requires exceptions.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef EXACTSTR_JSON_HPP
#define EXACTSTR_JSON_HPP

#include <nlohmann/json.hpp>

#include <string>

#include "exact_string.hpp"

namespace exactstr {

template <typename Alloc>
void to_json(nlohmann::json& j, const BasicExactString<Alloc>& str) {
    j = str.view();
}

/**
 * @brief Decode a buffer from a JSON string.
 *
 * @throws nlohmann::json::type_error if j is not a string
 * @throws AllocationException if the block cannot be allocated
 */
template <typename Alloc>
void from_json(const nlohmann::json& j, BasicExactString<Alloc>& str) {
    const auto& text = j.get_ref<const std::string&>();
    Error result = BasicExactString<Alloc>::from(text, str);
    if (result != Error::Ok) {
        throw AllocationException(error_string(result));
    }
}

} // namespace exactstr

#endif // EXACTSTR_JSON_HPP
