#include "opengl/gl_program.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace gl
{
namespace
{
template <typename GetParam, typename GetLog>
std::string readInfoLog(GLuint object, GetParam getParam, GetLog getLog)
{
    GLint logLength = 0;
    getParam(object, GL_INFO_LOG_LENGTH, &logLength);

    std::string infoLog;
    if (logLength > 0)
    {
        infoLog.resize(static_cast<size_t>(logLength));
        GLsizei written = 0;
        getLog(object, logLength, &written, infoLog.data());
        infoLog.resize(static_cast<size_t>(written));
    }
    if (infoLog.empty())
    {
        infoLog = "unknown error";
    }
    return infoLog;
}
} // namespace

GLuint compileShader(GLenum type, const char* source)
{
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    GLint success = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (success == GL_FALSE)
    {
        const std::string infoLog = readInfoLog(shader, glGetShaderiv, glGetShaderInfoLog);
        glDeleteShader(shader);
        throw std::runtime_error("Shader compilation failed: " + infoLog);
    }

    return shader;
}

GLuint linkProgram(std::initializer_list<std::pair<GLenum, const char*>> stages)
{
    std::vector<GLuint> shaders;
    shaders.reserve(stages.size());
    try
    {
        for (const auto& [type, source] : stages)
        {
            shaders.push_back(compileShader(type, source));
        }
    }
    catch (const std::exception&)
    {
        for (GLuint shader : shaders)
        {
            glDeleteShader(shader);
        }
        throw;
    }

    GLuint program = glCreateProgram();
    for (GLuint shader : shaders)
    {
        glAttachShader(program, shader);
    }
    glLinkProgram(program);

    GLint success = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    for (GLuint shader : shaders)
    {
        glDetachShader(program, shader);
        glDeleteShader(shader);
    }

    if (success == GL_FALSE)
    {
        const std::string infoLog = readInfoLog(program, glGetProgramiv, glGetProgramInfoLog);
        glDeleteProgram(program);
        throw std::runtime_error("Program linkage failed: " + infoLog);
    }

    return program;
}

} // namespace gl
