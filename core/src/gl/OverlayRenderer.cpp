#include "cs/gl/OverlayRenderer.hpp"
#include "cs/render/DashPattern.hpp"

#include <cstdio>

namespace cs {

// ---- lineAA shader: one instanced quad per segment ----

static const char* kLineAAVert = R"GLSL(
#version 330 core
in vec4 a_rect;
uniform mat3 u_transform;
uniform float u_lineWidth;
uniform float u_aaWidth;
out float v_dist;
void main() {
    vec3 c0 = u_transform * vec3(a_rect.xy, 1.0);
    vec3 c1 = u_transform * vec3(a_rect.zw, 1.0);

    vec2 dir = c1.xy - c0.xy;
    float len = length(dir);
    vec2 d = (len > 0.0001) ? dir / len : vec2(1.0, 0.0);
    vec2 perp = vec2(-d.y, d.x);

    float hw = u_lineWidth * 0.5;
    float totalHW = hw + u_aaWidth;

    int vid = gl_VertexID % 6;
    vec2 uv;
    if (vid == 0)      uv = vec2(0.0, -1.0);
    else if (vid == 1) uv = vec2(1.0, -1.0);
    else if (vid == 2) uv = vec2(0.0,  1.0);
    else if (vid == 3) uv = vec2(0.0,  1.0);
    else if (vid == 4) uv = vec2(1.0, -1.0);
    else               uv = vec2(1.0,  1.0);

    vec2 pos = mix(c0.xy, c1.xy, uv.x) + perp * (uv.y * totalHW);
    gl_Position = vec4(pos, 0.0, 1.0);
    v_dist = uv.y * totalHW / max(hw, 0.0001);
}
)GLSL";

static const char* kLineAAFrag = R"GLSL(
#version 330 core
uniform vec4 u_color;
uniform float u_fringeEdge;
in float v_dist;
out vec4 outColor;
void main() {
    float a = 1.0 - smoothstep(1.0, u_fringeEdge, abs(v_dist));
    outColor = vec4(u_color.rgb, u_color.a * a);
}
)GLSL";

OverlayRenderer::~OverlayRenderer() {
  if (vbo_) glDeleteBuffers(1, &vbo_);
  if (vao_) glDeleteVertexArrays(1, &vao_);
}

bool OverlayRenderer::init() {
  if (!lineProg_.build("lineAA", kLineAAVert, kLineAAFrag)) {
    std::fprintf(stderr, "OverlayRenderer::init: failed to build lineAA shader\n");
    return false;
  }
  glGenVertexArrays(1, &vao_);
  glGenBuffers(1, &vbo_);
  inited_ = true;
  return true;
}

void OverlayRenderer::addSegment(const ScreenPoint& a, const ScreenPoint& b,
                                 const Rgba& color, float width) {
  // Consecutive commands with the same stroke share one draw call.
  if (batches_.empty() || batches_.back().color != color ||
      batches_.back().width != width) {
    Batch batch;
    batch.color = color;
    batch.width = width;
    batches_.push_back(std::move(batch));
  }
  auto& r = batches_.back().rects;
  r.push_back(static_cast<float>(a.x));
  r.push_back(static_cast<float>(a.y));
  r.push_back(static_cast<float>(b.x));
  r.push_back(static_cast<float>(b.y));
}

int OverlayRenderer::render(const OverlayFrame& frame, int fbW, int fbH,
                            const Rgba& background) {
  glViewport(0, 0, fbW, fbH);
  glClearColor(background.r, background.g, background.b, background.a);
  glClear(GL_COLOR_BUFFER_BIT);
  if (!inited_ || fbW <= 0 || fbH <= 0) return 0;

  batches_.clear();

  for (const auto& s : frame.segments()) {
    for (const auto& piece : splitDashed(s.a, s.b, s.style.dash, s.style.width))
      addSegment(piece.a, piece.b, s.style.color, s.style.width);
  }

  // Markers: a square cap of side 2r.
  for (const auto& m : frame.markers()) {
    addSegment({m.center.x - m.radius, m.center.y}, {m.center.x + m.radius, m.center.y},
               m.color, static_cast<float>(m.radius * 2.0));
  }

  // Labels: background plate only, sized from the text length.
  for (const auto& l : frame.labels()) {
    double w = charWidthPx_ * static_cast<double>(l.text.size()) + 8.0;
    double x0 = l.at.x;
    if (l.style.anchor == LabelAnchor::Center) x0 -= w * 0.5;
    else if (l.style.anchor == LabelAnchor::Right) x0 -= w;
    double y = (l.style.anchor == LabelAnchor::Center) ? l.at.y - 13.0 : l.at.y;
    addSegment({x0, y}, {x0 + w, y}, l.style.background, 18.0f);
  }

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
  return flush(fbW, fbH);
}

int OverlayRenderer::flush(int fbW, int fbH) {
  if (batches_.empty()) return 0;

  float w = static_cast<float>(fbW);
  float h = static_cast<float>(fbH);

  // Column-major pixel -> clip transform (y flipped).
  const float xform[9] = {
    2.0f / w, 0.0f,      0.0f,
    0.0f,     -2.0f / h, 0.0f,
    -1.0f,    1.0f,      1.0f
  };

  lineProg_.use();
  lineProg_.setMat3("u_transform", xform);

  glBindVertexArray(vao_);
  glBindBuffer(GL_ARRAY_BUFFER, vbo_);
  GLint aRect = lineProg_.attrib("a_rect");
  glEnableVertexAttribArray(static_cast<GLuint>(aRect));
  glVertexAttribPointer(static_cast<GLuint>(aRect), 4, GL_FLOAT, GL_FALSE,
                        4 * sizeof(float), nullptr);
  glVertexAttribDivisor(static_cast<GLuint>(aRect), 1);

  int calls = 0;
  for (const auto& b : batches_) {
    // Widths are in pixels; the shader works in clip units.
    float lineWidthClip = b.width / w * 2.0f;
    float aaWidthClip = 1.5f / w * 2.0f;
    float hw = lineWidthClip * 0.5f;
    float fringeEdge = (hw > 0.0001f) ? ((hw + aaWidthClip) / hw) : 2.0f;

    lineProg_.setVec4("u_color", b.color.r, b.color.g, b.color.b, b.color.a);
    lineProg_.setFloat("u_lineWidth", lineWidthClip);
    lineProg_.setFloat("u_aaWidth", aaWidthClip);
    lineProg_.setFloat("u_fringeEdge", fringeEdge);

    glBufferData(GL_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(b.rects.size() * sizeof(float)),
                 b.rects.data(), GL_STREAM_DRAW);
    glDrawArraysInstanced(GL_TRIANGLES, 0, 6,
                          static_cast<GLsizei>(b.rects.size() / 4));
    calls++;
  }

  glVertexAttribDivisor(static_cast<GLuint>(aRect), 0);
  glDisableVertexAttribArray(static_cast<GLuint>(aRect));
  glBindVertexArray(0);
  return calls;
}

} // namespace cs
