#pragma once

#include <cstddef>
#include <iterator>
#include <utility>

#include "wheelbuf/error.hpp"


namespace wheelbuf {

//------------------------------------------------------------------------------
// Output iterator that pushes every assigned value into a wheel buffer.
//
// The wheel counterpart of std::back_insert_iterator. Lets standard
// algorithms and std::format_to write straight into the buffer:
//
//   std::format_to(wheelbuf::pusher(wheel), "t={} v={}", t, v);
//   std::ranges::copy(samples, wheelbuf::pusher(wheel));
//
// The first failed push is remembered and reported by error(). Since the
// iterator is passed by value, read it from the iterator the algorithm
// returns.
//------------------------------------------------------------------------------
template <typename Buffer>
class push_iterator {
public:
    using iterator_category = std::output_iterator_tag;
    using value_type        = void;
    using difference_type   = std::ptrdiff_t;
    using pointer           = void;
    using reference         = void;
    using container_type    = Buffer;

    push_iterator() noexcept = default;

    explicit push_iterator(Buffer& buffer) noexcept
        : buffer_(&buffer) {}

    push_iterator& operator=(const typename Buffer::value_type& item) {
        record_(buffer_->push(item));
        return *this;
    }

    push_iterator& operator=(typename Buffer::value_type&& item) {
        record_(buffer_->push(std::move(item)));
        return *this;
    }

    push_iterator& operator*() noexcept { return *this; }
    push_iterator& operator++() noexcept { return *this; }
    push_iterator& operator++(int) noexcept { return *this; }

    [[nodiscard]] Error error() const noexcept { return error_; }

private:
    void record_(Error err) noexcept {
        if (error_ == Error::None) error_ = err;
    }

    Buffer* buffer_ = nullptr;
    Error error_ = Error::None;
};

template <typename Buffer>
[[nodiscard]] inline push_iterator<Buffer> pusher(Buffer& buffer) noexcept {
    return push_iterator<Buffer>(buffer);
}

} // namespace wheelbuf
