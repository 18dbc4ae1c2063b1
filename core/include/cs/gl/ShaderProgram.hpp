#pragma once
#include <glad/gl.h>

#include <string>
#include <unordered_map>

namespace cs {

// Linked GLSL program with a per-name uniform location cache.
class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile and link. Returns false on failure (log goes to stderr
  // tagged with `label`).
  bool build(const char* label, const char* vertSrc, const char* fragSrc);

  void use() const;
  bool valid() const { return program_ != 0; }

  GLint attrib(const char* name) const;

  void setMat3(const char* name, const float* data);
  void setVec4(const char* name, float x, float y, float z, float w);
  void setFloat(const char* name, float v);

private:
  GLint uniform(const char* name);

  GLuint program_{0};
  std::string label_;
  std::unordered_map<std::string, GLint> uniforms_;
};

} // namespace cs
