#pragma once

#include <initializer_list>
#include <utility>

#include <glad/glad.h>

namespace gl
{

// Both throw std::runtime_error carrying the driver's info log.
[[nodiscard]] GLuint compileShader(GLenum type, const char* source);
[[nodiscard]] GLuint linkProgram(std::initializer_list<std::pair<GLenum, const char*>> stages);

} // namespace gl
