/**
 * @file config.hpp
 * @brief exactstr compile-time configuration.
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
 * Exact-fit mutable text buffer: two machine words, no spare capacity.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef EXACTSTR_CONFIG_HPP
#define EXACTSTR_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace exactstr {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Footprint of a buffer instance: owning pointer + byte length
inline constexpr std::size_t FOOTPRINT_BYTES = 2U * sizeof(void*);

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define EXACTSTR_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * Only the error-code API is available in that mode.
 * @{
 */
#ifndef EXACTSTR_NO_EXCEPTIONS
#define EXACTSTR_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace exactstr

#endif // EXACTSTR_CONFIG_HPP
