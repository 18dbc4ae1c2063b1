#pragma once
#include "cs/gl/ShaderProgram.hpp"
#include "cs/render/OverlayFrame.hpp"

#include <vector>

namespace cs {

// Draws a recorded OverlayFrame with the antialiased line shader.
// Segments, markers and label backgrounds all become instanced line quads
// in pixel space; dashes are split on the CPU.
class OverlayRenderer {
public:
  OverlayRenderer() = default;
  ~OverlayRenderer();

  OverlayRenderer(const OverlayRenderer&) = delete;
  OverlayRenderer& operator=(const OverlayRenderer&) = delete;

  bool init();

  // Clear to `background` and draw the frame into a fbW x fbH viewport.
  // Returns the number of draw calls issued.
  int render(const OverlayFrame& frame, int fbW, int fbH, const Rgba& background);

  // Approximate glyph advance for label background sizing.
  void setLabelCharWidth(float px) { charWidthPx_ = px; }

private:
  struct Batch {
    Rgba color;
    float width{1.0f};
    std::vector<float> rects;  // x0, y0, x1, y1 per instance
  };

  void addSegment(const ScreenPoint& a, const ScreenPoint& b,
                  const Rgba& color, float width);
  int flush(int fbW, int fbH);

  ShaderProgram lineProg_;
  GLuint vao_{0};
  GLuint vbo_{0};
  std::vector<Batch> batches_;
  float charWidthPx_{7.0f};
  bool inited_{false};
};

} // namespace cs
