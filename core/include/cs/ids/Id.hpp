#pragma once
#include <cstdint>

namespace cs {

using DrawingId = std::uint64_t;

inline constexpr DrawingId kInvalidDrawingId = 0;

} // namespace cs
