#pragma once
#include "cs/viewport/InputState.hpp"

#ifdef CS_HAS_GLFW

#include <vector>

struct GLFWwindow;

namespace cs {

// Everything the window produced since the previous poll.
struct WindowInput {
  ViewportInputState navigation;       // right-drag pan + scroll zoom
  std::vector<PointerEvent> pointer;   // left button gestures, in order
  std::vector<KeyCode> keys;
  bool shouldClose{false};
};

class GlfwContext {
public:
  GlfwContext() = default;
  ~GlfwContext();

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height, const char* title);
  void swapBuffers();

  // Framebuffer size, refreshed on every poll.
  int width() const { return width_; }
  int height() const { return height_; }

  WindowInput pollInput();
  bool shouldClose() const;

private:
  void pushPointer(PointerAction action);

  GLFWwindow* window_{nullptr};
  int width_{0};
  int height_{0};

  // Accumulated by callbacks, drained by pollInput()
  double scrollAccum_{0};
  double lastCursorX_{0};
  double lastCursorY_{0};
  double panDx_{0};
  double panDy_{0};
  bool panning_{false};
  bool leftDown_{false};
  std::vector<PointerEvent> pointer_;
  std::vector<KeyCode> keys_;

  static void scrollCallback(GLFWwindow* w, double xoff, double yoff);
  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void cursorEnterCallback(GLFWwindow* w, int entered);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
  static void keyCallback(GLFWwindow* w, int key, int scancode, int action, int mods);
};

} // namespace cs

#endif // CS_HAS_GLFW
