/**
 * @file exactstr.hpp
 * @brief exactstr umbrella header.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * Pulls in the buffer and its comparison/hashing support. The JSON adapter
 * (json.hpp) is separate so that nlohmann::json stays optional.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef EXACTSTR_HPP
#define EXACTSTR_HPP

#include "allocator.hpp"
#include "compare.hpp"
#include "config.hpp"
#include "error.hpp"
#include "exact_string.hpp"

namespace exactstr {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace exactstr

#endif // EXACTSTR_HPP
