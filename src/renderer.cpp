#include "renderer.h"

#include <algorithm>
#include <iostream>

#include "opengl/gl_atlas_backend.h"
#include "opengl/gl_program.h"
#include "opengl/raymarch_shaders.h"

namespace
{
constexpr GLuint kCameraBinding = 0;
constexpr GLuint kOutputImageUnit = 0;
constexpr GLuint kWorkgroupSize = 8;
} // namespace

Renderer::Renderer(std::uint32_t width, std::uint32_t height, const Palette& palette)
    : width_(std::max(width, 1u)),
      height_(std::max(height, 1u))
{
    computeProgram_ = gl::linkProgram({{GL_COMPUTE_SHADER, gl::kRaymarchComputeShader}});
    try
    {
        blitProgram_ = gl::linkProgram({{GL_VERTEX_SHADER, gl::kBlitVertexShader},
                                        {GL_FRAGMENT_SHADER, gl::kBlitFragmentShader}});
    }
    catch (const std::exception&)
    {
        glDeleteProgram(computeProgram_);
        throw;
    }

    glGenBuffers(1, &cameraBuffer_);
    glBindBuffer(GL_UNIFORM_BUFFER, cameraBuffer_);
    glBufferData(GL_UNIFORM_BUFFER, sizeof(CameraUniform), nullptr, GL_DYNAMIC_DRAW);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);

    glGenBuffers(1, &paletteBuffer_);
    uploadPalette(palette);

    glGenVertexArrays(1, &emptyVao_);
    createOutputTexture();

    std::cout << "[Renderer] Ray-march pass ready at " << width_ << "x" << height_ << std::endl;
}

Renderer::~Renderer()
{
    glDeleteVertexArrays(1, &emptyVao_);
    glDeleteTextures(1, &outputTexture_);
    glDeleteBuffers(1, &paletteBuffer_);
    glDeleteBuffers(1, &cameraBuffer_);
    glDeleteProgram(blitProgram_);
    glDeleteProgram(computeProgram_);
}

void Renderer::createOutputTexture()
{
    if (outputTexture_ != 0)
    {
        glDeleteTextures(1, &outputTexture_);
    }
    glGenTextures(1, &outputTexture_);
    glBindTexture(GL_TEXTURE_2D, outputTexture_);
    glTexStorage2D(GL_TEXTURE_2D, 1, GL_RGBA8, static_cast<GLsizei>(width_), static_cast<GLsizei>(height_));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glBindTexture(GL_TEXTURE_2D, 0);
}

void Renderer::resize(std::uint32_t width, std::uint32_t height)
{
    width = std::max(width, 1u);
    height = std::max(height, 1u);
    if (width == width_ && height == height_)
    {
        return;
    }
    width_ = width;
    height_ = height;
    createOutputTexture();
}

void Renderer::uploadPalette(const Palette& palette)
{
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, paletteBuffer_);
    glBufferData(GL_SHADER_STORAGE_BUFFER, sizeof(Palette), palette.data(), GL_STATIC_DRAW);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);
}

void Renderer::render(const CameraUniform& camera, const gl::GlAtlasBackend& atlas)
{
    glBindBuffer(GL_UNIFORM_BUFFER, cameraBuffer_);
    glBufferSubData(GL_UNIFORM_BUFFER, 0, sizeof(CameraUniform), &camera);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);

    glUseProgram(computeProgram_);
    glBindBufferBase(GL_UNIFORM_BUFFER, kCameraBinding, cameraBuffer_);
    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, gl::kPaletteBinding, paletteBuffer_);
    atlas.bind();
    glBindImageTexture(kOutputImageUnit, outputTexture_, 0, GL_FALSE, 0, GL_WRITE_ONLY, GL_RGBA8);

    const GLuint groupsX = (width_ + kWorkgroupSize - 1) / kWorkgroupSize;
    const GLuint groupsY = (height_ + kWorkgroupSize - 1) / kWorkgroupSize;
    glDispatchCompute(groupsX, groupsY, 1);
    glMemoryBarrier(GL_SHADER_IMAGE_ACCESS_BARRIER_BIT | GL_TEXTURE_FETCH_BARRIER_BIT);

    glUseProgram(blitProgram_);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, outputTexture_);
    glBindVertexArray(emptyVao_);
    glDrawArrays(GL_TRIANGLES, 0, 3);

    glBindVertexArray(0);
    glBindTexture(GL_TEXTURE_2D, 0);
    glUseProgram(0);
}
