#pragma once

#include <string_view>

namespace wheelbuf {

/*
===============================================================================
 wheelbuf::Error
===============================================================================

Outcome of a write into a wheel_buffer.

Reads never fail and overwriting the oldest element is the normal behavior of
the container, so the only failure is a write into a buffer whose storage has
no slots at all. The write is rejected and the buffer is left untouched.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Contract errors (caller responsibility) ----------------------------
    InvalidCapacity,  // Write attempted on a zero-capacity buffer
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:             return "None";
    case Error::InvalidCapacity:  return "InvalidCapacity";
    default:                      return "Unknown";
    }
}

} // namespace wheelbuf
