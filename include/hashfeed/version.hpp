#pragma once

namespace hashfeed {

// Semantic versioning for the hashfeed API
inline constexpr int version_major = 1;
inline constexpr int version_minor = 0;
inline constexpr int version_patch = 0;

} // namespace hashfeed
