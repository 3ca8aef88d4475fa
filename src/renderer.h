#pragma once
// renderer.h
// Frame renderer: dispatches the ray-march compute shader into an offscreen image
// and blits it to the default framebuffer.

#include <cstdint>

#include <glad/glad.h>

#include "camera.h"
#include "raymarcher.h"

namespace gl
{
class GlAtlasBackend;
}

class Renderer
{
public:
    Renderer(std::uint32_t width, std::uint32_t height, const Palette& palette);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    void resize(std::uint32_t width, std::uint32_t height);
    void uploadPalette(const Palette& palette);
    void render(const CameraUniform& camera, const gl::GlAtlasBackend& atlas);

    [[nodiscard]] std::uint32_t width() const noexcept
    {
        return width_;
    }

    [[nodiscard]] std::uint32_t height() const noexcept
    {
        return height_;
    }

private:
    void createOutputTexture();

    std::uint32_t width_{0};
    std::uint32_t height_{0};
    GLuint computeProgram_{0};
    GLuint blitProgram_{0};
    GLuint outputTexture_{0};
    GLuint cameraBuffer_{0};
    GLuint paletteBuffer_{0};
    GLuint emptyVao_{0};
};
