#pragma once

namespace wheelbuf {

// Semantic versioning for the public API
inline constexpr int version_major = 1;
inline constexpr int version_minor = 0;
inline constexpr int version_patch = 0;

} // namespace wheelbuf
