#pragma once
#include <cstdint>

namespace cs {

// Keys the host forwards to the annotation layer.
enum class KeyCode : std::uint8_t {
  None = 0, Escape, Delete, T, H, F, Z, Y, C, S, L
};

// Generic per-frame navigation input. NOT GLFW-specific.
struct ViewportInputState {
  double cursorX{0}, cursorY{0};  // pixels, 0=left/top
  double dragDx{0}, dragDy{0};    // pixel deltas this frame (pan drag)
  double scrollDelta{0};          // positive = zoom in
  bool dragging{false};
};

struct NavigationConfig {
  double zoomSensitivity{0.1};
};

enum class PointerAction : std::uint8_t {
  Down = 0,
  Move,
  Up,
  Leave
};

// A single pointer event in surface pixels, as queued by the host window.
struct PointerEvent {
  PointerAction action{PointerAction::Move};
  double x{0}, y{0};
};

} // namespace cs
