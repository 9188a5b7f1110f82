#pragma once

namespace trianglecheck {

inline constexpr const char *kToolVersion = "0.1.0";

} // namespace trianglecheck
