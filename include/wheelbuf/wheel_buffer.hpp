#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <ranges>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include "wheelbuf/error.hpp"
#include "wheelbuf/storage_concept.hpp"
#include "wheelbuf/push_iterator.hpp"
#include "wheelbuf/detail/utf8.hpp"
#include "wheelbuf/log/logger.hpp"


namespace wheelbuf {

//------------------------------------------------------------------------------
// Fixed-capacity overwriting ring buffer without a read cursor.
//
// A wheel buffer keeps the most recent capacity() pushes. Once full, every
// push overwrites the oldest element. Reading never consumes anything: any
// number of cursors (or STL iterators) can walk the live elements, oldest to
// newest, independently of each other.
//
// Characteristics:
//   • O(1) push, O(1) random skip while reading
//   • No allocation: works inside the storage handed to the constructor
//   • Capacity is the length of that storage and never changes
//   • Monotonic total() counter, so callers can detect overwrites
//
// Storage:
//   wheel_buffer w{buf};                      // char buf[64]  -> borrows
//   wheel_buffer w{std::span<char>{v}};       // span          -> borrows
//   wheel_buffer w{std::array<char, 64>{}};   // container     -> owns
//
// Thread-safety:
//   - NOT thread-safe. Pushes must be serialized by the caller and must not
//     run concurrently with reads. Readers see live state, not a snapshot.
//
// Zero capacity:
//   - Construction succeeds and all queries report an empty buffer.
//   - Writes are rejected with Error::InvalidCapacity.
//
// Example:
//   char storage[8];
//   wheelbuf::wheel_buffer wheel{storage};
//   (void)wheel.write_str("Hello World");
//   std::string tail(wheel.begin(), wheel.end());   // "lo World"
//------------------------------------------------------------------------------
template <WheelStorage Storage>
class wheel_buffer {
public:
    using storage_type = Storage;
    using value_type   = storage_value_t<Storage>;
    using size_type    = std::size_t;

    // -------------------------------------------------------------------------
    // Pull-style reader: next() / nth() / has_next().
    //
    // Single pass. Length is re-read from the buffer on every step, but once
    // next() has reported the end (nullptr) the cursor stays exhausted.
    // -------------------------------------------------------------------------
    class cursor {
    public:
        explicit cursor(const wheel_buffer& buffer) noexcept
            : buffer_(&buffer) {}

        [[nodiscard]] inline bool has_next() const noexcept {
            return !exhausted_ && cur_ < buffer_->length();
        }

        // Oldest-first element at the cursor, or nullptr at the end
        inline const value_type* next() noexcept {
            if (exhausted_ || cur_ >= buffer_->length()) {
                exhausted_ = true;
                return nullptr;
            }
            return &buffer_->at_logical_(cur_++);
        }

        // Skips n elements then returns the next one. The skip is clamped to
        // the live length, so oversized requests simply end the sequence.
        inline const value_type* nth(size_type n) noexcept {
            if (n > 0 && !exhausted_) {
                cur_ += std::min(n, buffer_->length());
            }
            return next();
        }

        [[nodiscard]] inline size_type position() const noexcept { return cur_; }

    private:
        const wheel_buffer* buffer_;
        size_type cur_{0};
        bool exhausted_{false};
    };

    // -------------------------------------------------------------------------
    // Forward iterator over the live elements (oldest first)
    // -------------------------------------------------------------------------
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using iterator_concept  = std::forward_iterator_tag;
        using value_type        = storage_value_t<Storage>;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const value_type*;
        using reference         = const value_type&;

        const_iterator() noexcept = default;

        reference operator*() const noexcept { return buffer_->at_logical_(k_); }
        pointer operator->() const noexcept { return &buffer_->at_logical_(k_); }

        const_iterator& operator++() noexcept {
            ++k_;
            return *this;
        }

        const_iterator operator++(int) noexcept {
            const_iterator tmp = *this;
            ++k_;
            return tmp;
        }

        friend bool operator==(const const_iterator& a, const const_iterator& b) noexcept {
            return a.k_ == b.k_;
        }

    private:
        friend class wheel_buffer;

        const_iterator(const wheel_buffer* buffer, size_type k) noexcept
            : buffer_(buffer), k_(k) {}

        const wheel_buffer* buffer_{nullptr};
        size_type k_{0};
    };

    using iterator = const_iterator;

    explicit wheel_buffer(Storage storage) noexcept(std::is_nothrow_move_constructible_v<Storage>)
        : storage_(std::move(storage)) {}

    // Cursors and iterators refer to the buffer by address
    wheel_buffer(const wheel_buffer&) = delete;
    wheel_buffer& operator=(const wheel_buffer&) = delete;
    wheel_buffer(wheel_buffer&&) = default;
    wheel_buffer& operator=(wheel_buffer&&) = default;

    // -------------------------------------------------------------------------
    // Writing
    // -------------------------------------------------------------------------

    inline Error push(const value_type& item) {
        if (capacity() == 0) [[unlikely]] {
            return reject_();
        }
        store_(item);
        return Error::None;
    }

    inline Error push(value_type&& item) {
        if (capacity() == 0) [[unlikely]] {
            return reject_();
        }
        store_(std::move(item));
        return Error::None;
    }

    // Pushes every character of `text` in order. For char32_t buffers the
    // text is decoded from UTF-8 first.
    Error write_str(std::string_view text)
        requires std::same_as<value_type, char> || std::same_as<value_type, char32_t>
    {
        if (capacity() == 0) [[unlikely]] {
            return reject_();
        }
        if constexpr (std::same_as<value_type, char>) {
            for (const char c : text) {
                store_(c);
            }
        } else {
            detail::decode_utf8(text, [this](char32_t cp) { store_(cp); });
        }
        return Error::None;
    }

    // std::format straight into the wheel, no intermediate string
    template <typename... Args>
    Error write_fmt(std::format_string<Args...> fmt, Args&&... args)
        requires std::same_as<value_type, char>
    {
        if (capacity() == 0) [[unlikely]] {
            return reject_();
        }
        const auto out = std::format_to(pusher(*this), fmt, std::forward<Args>(args)...);
        return out.error();
    }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]] inline size_type capacity() const noexcept {
        return static_cast<size_type>(std::ranges::size(storage_));
    }

    // Pushes performed over the buffer's lifetime
    [[nodiscard]] inline std::uint64_t total() const noexcept { return total_; }

    [[nodiscard]] inline size_type length() const noexcept {
        const size_type cap = capacity();
        return total_ < cap ? static_cast<size_type>(total_) : cap;
    }

    [[nodiscard]] inline bool is_empty() const noexcept {
        return total_ == 0 || capacity() == 0;
    }

    // -------------------------------------------------------------------------
    // Reading
    // -------------------------------------------------------------------------

    [[nodiscard]] inline cursor iter() const noexcept { return cursor(*this); }

    [[nodiscard]] inline const_iterator begin() const noexcept { return const_iterator(this, 0); }
    [[nodiscard]] inline const_iterator end() const noexcept { return const_iterator(this, length()); }

private:
    template <typename U>
    inline void store_(U&& item) {
        storage_[pos_] = std::forward<U>(item);
        ++total_;
        pos_ = (pos_ + 1) % capacity();
    }

    Error reject_() const {
        WB_WARN("[wheel_buffer] write rejected: " << to_string(Error::InvalidCapacity));
        return Error::InvalidCapacity;
    }

    // Physical slot of the oldest live element. Requires capacity() > 0.
    // Capacity is added before subtracting so the unsigned math never wraps.
    inline size_type read_start_() const noexcept {
        const size_type cap = capacity();
        return (pos_ + cap - (length() % cap)) % cap;
    }

    // Requires k < length()
    inline const value_type& at_logical_(size_type k) const noexcept {
        return storage_[(read_start_() + k) % capacity()];
    }

private:
    Storage storage_;
    size_type pos_{0};
    std::uint64_t total_{0};
};

// C arrays are borrowed
template <typename T, std::size_t N>
wheel_buffer(T (&)[N]) -> wheel_buffer<std::span<T>>;

} // namespace wheelbuf
