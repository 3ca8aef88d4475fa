#pragma once
// gl_atlas_backend.h
// GPU residency for the chunk atlas: a 3D RGBA8UI texture holding packed voxels, plus the
// slot index and occupancy storage buffers read by the ray-march compute shader.

#include <cstdint>
#include <span>

#include <glad/glad.h>
#include <glm/glm.hpp>

#include "chunk_atlas.h"

namespace gl
{

inline constexpr GLuint kAtlasTextureUnit = 0;
inline constexpr GLuint kOccupancyBinding = 1;
inline constexpr GLuint kPaletteBinding = 2;
inline constexpr GLuint kSlotTableBinding = 3;

class GlAtlasBackend final : public AtlasBackend
{
public:
    explicit GlAtlasBackend(const glm::uvec3& slotsPerAxis);
    ~GlAtlasBackend() override;

    GlAtlasBackend(const GlAtlasBackend&) = delete;
    GlAtlasBackend& operator=(const GlAtlasBackend&) = delete;

    void uploadVoxels(std::uint32_t slot, const glm::uvec3& texelOrigin, std::span<const std::uint32_t> voxels) override;
    void writeSlot(std::uint32_t slot, const ChunkSlotGpu& entry) override;
    void writeOccupancy(std::uint32_t slot, std::uint64_t mask) override;

    void bind() const;

    [[nodiscard]] GLuint texture() const noexcept
    {
        return texture_;
    }

private:
    GLuint texture_{0};
    GLuint occupancyBuffer_{0};
    GLuint slotBuffer_{0};
};

} // namespace gl
