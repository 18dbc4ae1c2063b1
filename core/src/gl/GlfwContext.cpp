#ifdef CS_HAS_GLFW

#include "cs/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cstdio>

namespace cs {

GlfwContext::~GlfwContext() {
  if (window_) glfwDestroyWindow(window_);
  glfwTerminate();
}

bool GlfwContext::init(int width, int height, const char* title) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext::init: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
  glfwWindowHint(GLFW_SAMPLES, 4);

  window_ = glfwCreateWindow(width, height, title, nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext::init: glfwCreateWindow failed\n");
    return false;
  }
  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1);

  if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(glfwGetProcAddress))) {
    std::fprintf(stderr, "GlfwContext::init: gladLoadGL failed\n");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    return false;
  }

  glfwGetFramebufferSize(window_, &width_, &height_);

  glfwSetWindowUserPointer(window_, this);
  glfwSetScrollCallback(window_, scrollCallback);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetCursorEnterCallback(window_, cursorEnterCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);
  glfwSetKeyCallback(window_, keyCallback);

  glfwGetCursorPos(window_, &lastCursorX_, &lastCursorY_);
  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) glfwSwapBuffers(window_);
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

WindowInput GlfwContext::pollInput() {
  glfwPollEvents();
  if (window_) glfwGetFramebufferSize(window_, &width_, &height_);

  WindowInput in;
  in.shouldClose = shouldClose();
  in.navigation.cursorX = lastCursorX_;
  in.navigation.cursorY = lastCursorY_;
  in.navigation.dragDx = panDx_;
  in.navigation.dragDy = panDy_;
  in.navigation.scrollDelta = scrollAccum_;
  in.navigation.dragging = panning_;
  in.pointer.swap(pointer_);
  in.keys.swap(keys_);

  scrollAccum_ = 0;
  panDx_ = 0;
  panDy_ = 0;
  return in;
}

void GlfwContext::pushPointer(PointerAction action) {
  pointer_.push_back({action, lastCursorX_, lastCursorY_});
}

void GlfwContext::scrollCallback(GLFWwindow* w, double /*xoff*/, double yoff) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (self) self->scrollAccum_ += yoff;
}

void GlfwContext::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  if (self->panning_) {
    self->panDx_ += x - self->lastCursorX_;
    self->panDy_ += y - self->lastCursorY_;
  }
  self->lastCursorX_ = x;
  self->lastCursorY_ = y;
  self->pushPointer(PointerAction::Move);
}

void GlfwContext::cursorEnterCallback(GLFWwindow* w, int entered) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (self && !entered) {
    self->leftDown_ = false;
    self->pushPointer(PointerAction::Leave);
  }
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  if (button == GLFW_MOUSE_BUTTON_LEFT) {
    self->leftDown_ = (action == GLFW_PRESS);
    self->pushPointer(self->leftDown_ ? PointerAction::Down : PointerAction::Up);
  } else if (button == GLFW_MOUSE_BUTTON_RIGHT) {
    self->panning_ = (action == GLFW_PRESS);
  }
}

void GlfwContext::keyCallback(GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self || action != GLFW_PRESS) return;

  KeyCode code = KeyCode::None;
  switch (key) {
    case GLFW_KEY_ESCAPE:    code = KeyCode::Escape; break;
    case GLFW_KEY_DELETE:
    case GLFW_KEY_BACKSPACE: code = KeyCode::Delete; break;
    case GLFW_KEY_T: code = KeyCode::T; break;
    case GLFW_KEY_H: code = KeyCode::H; break;
    case GLFW_KEY_F: code = KeyCode::F; break;
    case GLFW_KEY_Z: code = KeyCode::Z; break;
    case GLFW_KEY_Y: code = KeyCode::Y; break;
    case GLFW_KEY_C: code = KeyCode::C; break;
    case GLFW_KEY_S: code = KeyCode::S; break;
    case GLFW_KEY_L: code = KeyCode::L; break;
    default: break;
  }
  if (code != KeyCode::None) self->keys_.push_back(code);
}

} // namespace cs

#endif // CS_HAS_GLFW
