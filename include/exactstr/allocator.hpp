/**
 * @file allocator.hpp
 * @brief Allocation policy for exact-fit text blocks.
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
 * A buffer never stores its allocator. The policy is a stateless type with
 * two static functions:
 *
 * @code
 * static char* allocate(std::size_t size) noexcept;  // nullptr on failure
 * static void deallocate(char* ptr) noexcept;
 * @endcode
 *
 * allocate() is never called with a size of zero; deallocate() is never
 * called with nullptr.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef EXACTSTR_ALLOCATOR_HPP
#define EXACTSTR_ALLOCATOR_HPP

#include <cstdlib>

#include "config.hpp"

namespace exactstr {

/**
 * @brief Default policy backed by std::malloc / std::free.
 *
 * Byte blocks need no alignment beyond 1, and malloc reports failure as
 * nullptr instead of throwing, which keeps the core noexcept.
 */
struct HeapAllocator {
    static char* allocate(std::size_t size) noexcept {
        return static_cast<char*>(std::malloc(size));
    }

    static void deallocate(char* ptr) noexcept {
        std::free(ptr);
    }
};

namespace detail {

/**
 * @brief Deleter handing a block back to its policy.
 *
 * Empty, so a std::unique_ptr using it stays one pointer wide.
 */
template <typename Alloc>
struct Release {
    void operator()(char* ptr) const noexcept {
        Alloc::deallocate(ptr);
    }
};

} // namespace detail

} // namespace exactstr

#endif // EXACTSTR_ALLOCATOR_HPP
