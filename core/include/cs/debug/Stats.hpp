#pragma once
#include <cstdint>

namespace cs {

// Per-surface counters, read by tests and the demo title bar.
struct OverlayStats {
  // Repaint scheduling
  std::uint64_t repaintRequests = 0;
  std::uint64_t paintsExecuted = 0;

  // Last paint
  std::uint32_t segmentsDrawn = 0;
  std::uint32_t elementsSkipped = 0;

  // Navigation lock transitions
  std::uint32_t navigationLocks = 0;
  std::uint32_t navigationUnlocks = 0;
};

} // namespace cs
