#include "cs/gl/ShaderProgram.hpp"
#include <cstdio>
#include <vector>

namespace cs {

namespace {

GLuint compileStage(const char* label, GLenum stage, const char* src) {
  GLuint s = glCreateShader(stage);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (ok) return s;

  GLint len = 0;
  glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
  std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
  glGetShaderInfoLog(s, len, nullptr, log.data());
  std::fprintf(stderr, "ShaderProgram(%s): %s stage failed:\n%s\n", label,
               stage == GL_VERTEX_SHADER ? "vertex" : "fragment", log.data());
  glDeleteShader(s);
  return 0;
}

} // namespace

ShaderProgram::~ShaderProgram() {
  if (program_) glDeleteProgram(program_);
}

bool ShaderProgram::build(const char* label, const char* vertSrc, const char* fragSrc) {
  label_ = label;
  uniforms_.clear();

  GLuint vs = compileStage(label, GL_VERTEX_SHADER, vertSrc);
  if (!vs) return false;
  GLuint fs = compileStage(label, GL_FRAGMENT_SHADER, fragSrc);
  if (!fs) {
    glDeleteShader(vs);
    return false;
  }

  GLuint prog = glCreateProgram();
  glAttachShader(prog, vs);
  glAttachShader(prog, fs);
  glLinkProgram(prog);
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint ok = 0;
  glGetProgramiv(prog, GL_LINK_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetProgramiv(prog, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
    glGetProgramInfoLog(prog, len, nullptr, log.data());
    std::fprintf(stderr, "ShaderProgram(%s): link failed:\n%s\n", label, log.data());
    glDeleteProgram(prog);
    return false;
  }

  if (program_) glDeleteProgram(program_);
  program_ = prog;
  return true;
}

void ShaderProgram::use() const {
  glUseProgram(program_);
}

GLint ShaderProgram::attrib(const char* name) const {
  return glGetAttribLocation(program_, name);
}

GLint ShaderProgram::uniform(const char* name) {
  auto it = uniforms_.find(name);
  if (it != uniforms_.end()) return it->second;
  GLint loc = glGetUniformLocation(program_, name);
  if (loc < 0)
    std::fprintf(stderr, "ShaderProgram(%s): no uniform '%s'\n", label_.c_str(), name);
  uniforms_.emplace(name, loc);
  return loc;
}

void ShaderProgram::setMat3(const char* name, const float* data) {
  glUniformMatrix3fv(uniform(name), 1, GL_FALSE, data);
}

void ShaderProgram::setVec4(const char* name, float x, float y, float z, float w) {
  glUniform4f(uniform(name), x, y, z, w);
}

void ShaderProgram::setFloat(const char* name, float v) {
  glUniform1f(uniform(name), v);
}

} // namespace cs
