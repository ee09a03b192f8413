/**
 * @file exact_string.hpp
 * @brief Mutable text buffer with an exact-fit heap block.
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
 * An ExactString is an owning pointer plus a byte length and nothing else.
 * There is no capacity field: the heap block is always exactly size()
 * bytes long, so every mutation that changes the length allocates a new
 * block, copies the surviving content into it, publishes it and releases
 * the old one.
 *
 * @par Memory Layout
 * - data_: owning handle to a block of size_ bytes (nullptr when empty)
 * - size_: byte length of the content, equal to the block size
 *
 * @par Failure Semantics
 * Every mutating operation either publishes its result completely or
 * returns Error::OutOfMemory with the buffer untouched.
 *
 * @par Content
 * Bytes are expected to be valid UTF-8. The buffer does not validate;
 * passing anything else is a caller error.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef EXACTSTR_EXACT_STRING_HPP
#define EXACTSTR_EXACT_STRING_HPP

#include <cstring>
#include <limits>
#include <memory>
#include <string_view>
#include <utility>

#include "allocator.hpp"
#include "config.hpp"
#include "error.hpp"

namespace exactstr {

/**
 * @brief Exact-fit mutable text buffer.
 *
 * @tparam Alloc Stateless allocation policy (see allocator.hpp)
 *
 * Move-only. A moved-from buffer is empty.
 */
template <typename Alloc = HeapAllocator>
class BasicExactString {
public:
    using value_type = char;
    using size_type = std::size_t;
    using iterator = char*;
    using const_iterator = const char*;

    /**
     * @brief Default constructor - empty buffer, no allocation.
     */
    BasicExactString() noexcept = default;

#if !EXACTSTR_NO_EXCEPTIONS
    /**
     * @brief Construct from text.
     *
     * @param text Initial content
     * @throws AllocationException if the block cannot be allocated
     */
    explicit BasicExactString(std::string_view text) {
        throw_on_failure(replace_with(text));
    }
#endif

    BasicExactString(const BasicExactString&) = delete;
    BasicExactString& operator=(const BasicExactString&) = delete;

    BasicExactString(BasicExactString&& other) noexcept
        : data_(std::move(other.data_)), size_(std::exchange(other.size_, 0)) {}

    BasicExactString& operator=(BasicExactString&& other) noexcept {
        if (this != &other) {
            data_ = std::move(other.data_);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    ~BasicExactString() = default;

    /**
     * @brief Build a buffer from text without exceptions.
     *
     * @param text Initial content
     * @param[out] out Receives the new buffer; untouched on failure
     * @return Error::Ok on success, Error::OutOfMemory otherwise
     */
    [[nodiscard]] static Error from(std::string_view text, BasicExactString& out) noexcept {
        BasicExactString fresh;
        Error result = fresh.replace_with(text);
        if (result == Error::Ok) {
            out = std::move(fresh);
        }
        return result;
    }

    /**
     * @brief Get content length in bytes.
     */
    [[nodiscard]] size_type size() const noexcept { return size_; }

    /**
     * @brief Alias of size().
     */
    [[nodiscard]] size_type length() const noexcept { return size_; }

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    /**
     * @brief Largest content length a buffer may reach.
     */
    [[nodiscard]] static constexpr size_type max_size() noexcept {
        return static_cast<size_type>(std::numeric_limits<std::ptrdiff_t>::max());
    }

    /**
     * @brief Borrow the content.
     *
     * No copy is made. The view is invalidated by the next mutation,
     * move or destruction of this buffer.
     *
     * @return View over exactly size() bytes
     */
    [[nodiscard]] std::string_view view() const noexcept {
        return std::string_view(data_.get(), size_);
    }

    operator std::string_view() const noexcept {
        return view();
    }

    /**
     * @brief Borrow part of the content.
     *
     * @param pos First byte; past the end yields an empty view
     * @param count Maximum number of bytes, clamped to the content
     * @return View into the current block
     */
    [[nodiscard]] std::string_view substr(size_type pos,
                                          size_type count = std::string_view::npos) const noexcept {
        if (pos >= size_) {
            return {};
        }
        size_type available = size_ - pos;
        return std::string_view(data_.get() + pos, count < available ? count : available);
    }

    /**
     * @brief Raw pointer to the first byte (nullptr when empty).
     *
     * The mutable overload allows overwriting bytes in place; the length
     * cannot change through it and the content must stay valid UTF-8.
     */
    [[nodiscard]] const char* data() const noexcept { return data_.get(); }
    [[nodiscard]] char* data() noexcept { return data_.get(); }

    [[nodiscard]] const_iterator begin() const noexcept { return data_.get(); }
    [[nodiscard]] const_iterator end() const noexcept { return data_.get() + size_; }
    [[nodiscard]] iterator begin() noexcept { return data_.get(); }
    [[nodiscard]] iterator end() noexcept { return data_.get() + size_; }

    /**
     * @brief Append a fragment.
     *
     * Allocates a block of size() + fragment.size() bytes, copies the
     * current content followed by the fragment, then releases the old
     * block. The fragment may point into this buffer.
     *
     * @param fragment Text to add; empty is a no-op
     * @return Error::Ok on success, Error::OutOfMemory with the buffer
     *         unchanged otherwise
     */
    [[nodiscard]] Error append(std::string_view fragment) noexcept {
        if (fragment.empty()) {
            return Error::Ok;
        }
        if (fragment.size() > max_size() - size_) [[unlikely]] {
            return Error::OutOfMemory;
        }

        size_type new_size = size_ + fragment.size();
        Block block = allocate_block(new_size);
        if (!block) [[unlikely]] {
            return Error::OutOfMemory;
        }

        if (size_ > 0) {
            std::memcpy(block.get(), data_.get(), size_);
        }
        std::memcpy(block.get() + size_, fragment.data(), fragment.size());

        publish(std::move(block), new_size);
        return Error::Ok;
    }

    /**
     * @brief Remove occurrences of a fragment.
     *
     * Occurrences are found left to right in the current content and never
     * overlap; bytes that become adjacent once a match is cut out are not
     * rescanned. The first min(count, found) are dropped. Asking for more
     * than exist removes all of them and still succeeds.
     *
     * When nothing matches, nothing is allocated. When the result is empty
     * the block is released and nothing is allocated either.
     *
     * @param fragment Text to remove; empty matches nowhere
     * @param count Maximum number of occurrences to remove
     * @param[out] removed Optional, receives the number actually removed
     * @return Error::Ok on success, Error::OutOfMemory with the buffer
     *         unchanged otherwise
     */
    [[nodiscard]] Error remove(std::string_view fragment, size_type count = 1,
                               size_type* removed = nullptr) noexcept {
        if (removed != nullptr) {
            *removed = 0;
        }

        size_type matches = count_occurrences(fragment, count);
        if (matches == 0) {
            return Error::Ok;
        }

        size_type new_size = size_ - matches * fragment.size();
        if (new_size == 0) {
            clear();
        } else {
            Block block = allocate_block(new_size);
            if (!block) [[unlikely]] {
                return Error::OutOfMemory;
            }
            copy_without(fragment, matches, block.get());
            publish(std::move(block), new_size);
        }

        if (removed != nullptr) {
            *removed = matches;
        }
        return Error::Ok;
    }

    /**
     * @brief Remove every occurrence of a fragment.
     * @see remove()
     */
    [[nodiscard]] Error remove_all(std::string_view fragment, size_type* removed = nullptr) noexcept {
        return remove(fragment, std::numeric_limits<size_type>::max(), removed);
    }

    /**
     * @brief Overwrite the whole content.
     *
     * Same length: bytes are copied in place and nothing is allocated.
     * Otherwise a new exact-fit block replaces the old one.
     *
     * @param text New content; may point into this buffer
     * @return Error::Ok on success, Error::OutOfMemory with the buffer
     *         unchanged otherwise
     */
    [[nodiscard]] Error replace_with(std::string_view text) noexcept {
        if (text.empty()) {
            clear();
            return Error::Ok;
        }
        if (text.size() == size_) {
            std::memmove(data_.get(), text.data(), size_);
            return Error::Ok;
        }

        Block block = allocate_block(text.size());
        if (!block) [[unlikely]] {
            return Error::OutOfMemory;
        }
        std::memcpy(block.get(), text.data(), text.size());

        publish(std::move(block), text.size());
        return Error::Ok;
    }

    /**
     * @brief Release the block; the buffer becomes empty.
     */
    void clear() noexcept {
        data_.reset();
        size_ = 0;
    }

    void swap(BasicExactString& other) noexcept {
        data_.swap(other.data_);
        std::swap(size_, other.size_);
    }

#if !EXACTSTR_NO_EXCEPTIONS
    /**
     * @brief Append, throwing on failure.
     * @throws AllocationException, buffer unchanged
     */
    BasicExactString& operator+=(std::string_view fragment) {
        throw_on_failure(append(fragment));
        return *this;
    }

    BasicExactString& operator+=(const BasicExactString& other) {
        throw_on_failure(append(other.view()));
        return *this;
    }

    /**
     * @brief Remove the first occurrence, throwing on failure.
     * @throws AllocationException, buffer unchanged
     */
    BasicExactString& operator-=(std::string_view fragment) {
        throw_on_failure(remove(fragment, 1));
        return *this;
    }
#endif

private:
    using Block = std::unique_ptr<char[], detail::Release<Alloc>>;

    Block data_;
    size_type size_ = 0;

    static Block allocate_block(size_type size) noexcept {
        return Block(Alloc::allocate(size));
    }

    /**
     * @brief Swap in a populated block; the previous one is freed.
     */
    void publish(Block block, size_type size) noexcept {
        data_ = std::move(block);
        size_ = size;
    }

    /**
     * @brief Count non-overlapping occurrences, stopping at limit.
     */
    size_type count_occurrences(std::string_view fragment, size_type limit) const noexcept {
        if (fragment.empty() || limit == 0 || fragment.size() > size_) {
            return 0;
        }

        std::string_view content = view();
        size_type found = 0;
        for (size_type pos = content.find(fragment); pos != std::string_view::npos;
             pos = content.find(fragment, pos + fragment.size())) {
            if (++found == limit) {
                break;
            }
        }
        return found;
    }

    /**
     * @brief Copy the content minus its first matches occurrences into dst.
     *
     * @warning dst must hold size_ - matches * fragment.size() bytes and
     *          matches must not exceed count_occurrences(fragment, matches).
     */
    void copy_without(std::string_view fragment, size_type matches, char* dst) const noexcept {
        std::string_view content = view();
        size_type src = 0;

        for (size_type i = 0; i < matches; ++i) {
            size_type pos = content.find(fragment, src);
            size_type keep = pos - src;
            std::memcpy(dst, content.data() + src, keep);
            dst += keep;
            src = pos + fragment.size();
        }

        // Tail after the last removed occurrence
        std::memcpy(dst, content.data() + src, content.size() - src);
    }

#if !EXACTSTR_NO_EXCEPTIONS
    static void throw_on_failure(Error result) {
        if (result != Error::Ok) [[unlikely]] {
            throw AllocationException(error_string(result));
        }
    }
#endif
};

template <typename Alloc>
void swap(BasicExactString<Alloc>& a, BasicExactString<Alloc>& b) noexcept {
    a.swap(b);
}

/// Buffer using the default heap policy
using ExactString = BasicExactString<HeapAllocator>;

static_assert(sizeof(ExactString) == FOOTPRINT_BYTES,
              "ExactString must stay a pointer plus a length");

extern template class BasicExactString<HeapAllocator>;

} // namespace exactstr

#endif // EXACTSTR_EXACT_STRING_HPP
