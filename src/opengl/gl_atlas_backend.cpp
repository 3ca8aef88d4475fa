#include "opengl/gl_atlas_backend.h"

#include <array>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "voxel.h"

namespace gl
{
namespace
{
GLuint createStorageBuffer(GLsizeiptr size)
{
    GLuint buffer = 0;
    glGenBuffers(1, &buffer);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, buffer);
    // Zero-filled so unoccupied slots read as flags == 0 and an empty mask.
    const std::vector<std::uint8_t> zeros(static_cast<std::size_t>(size), 0);
    glBufferData(GL_SHADER_STORAGE_BUFFER, size, zeros.data(), GL_DYNAMIC_DRAW);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);
    return buffer;
}
} // namespace

GlAtlasBackend::GlAtlasBackend(const glm::uvec3& slotsPerAxis)
{
    const glm::ivec3 texels = glm::ivec3(slotsPerAxis) * kChunkSize;
    GLint maxSize = 0;
    glGetIntegerv(GL_MAX_3D_TEXTURE_SIZE, &maxSize);
    if (texels.x > maxSize || texels.y > maxSize || texels.z > maxSize)
    {
        std::ostringstream oss;
        oss << "Atlas texture " << texels.x << "x" << texels.y << "x" << texels.z << " exceeds GL_MAX_3D_TEXTURE_SIZE "
            << maxSize;
        throw std::runtime_error(oss.str());
    }

    glGenTextures(1, &texture_);
    glBindTexture(GL_TEXTURE_3D, texture_);
    glTexStorage3D(GL_TEXTURE_3D, 1, GL_RGBA8UI, texels.x, texels.y, texels.z);
    glTexParameteri(GL_TEXTURE_3D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_3D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_3D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_3D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_3D, GL_TEXTURE_WRAP_R, GL_CLAMP_TO_EDGE);
    glBindTexture(GL_TEXTURE_3D, 0);

    const GLsizeiptr slotCount = static_cast<GLsizeiptr>(slotsPerAxis.x) * slotsPerAxis.y * slotsPerAxis.z;
    occupancyBuffer_ = createStorageBuffer(slotCount * static_cast<GLsizeiptr>(sizeof(std::uint32_t) * 2));
    slotBuffer_ = createStorageBuffer(slotCount * static_cast<GLsizeiptr>(sizeof(ChunkSlotGpu)));

    const double megabytes = static_cast<double>(texels.x) * texels.y * texels.z * 4.0 / (1024.0 * 1024.0);
    std::cout << "[Renderer] Atlas texture " << texels.x << "x" << texels.y << "x" << texels.z << " (" << megabytes
              << " MiB)" << std::endl;
}

GlAtlasBackend::~GlAtlasBackend()
{
    glDeleteBuffers(1, &slotBuffer_);
    glDeleteBuffers(1, &occupancyBuffer_);
    glDeleteTextures(1, &texture_);
}

void GlAtlasBackend::uploadVoxels(std::uint32_t /*slot*/,
                                  const glm::uvec3& texelOrigin,
                                  std::span<const std::uint32_t> voxels)
{
    // Packed little-endian words land as (material, param0, param1, flags) in RGBA.
    glBindTexture(GL_TEXTURE_3D, texture_);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    glTexSubImage3D(GL_TEXTURE_3D,
                    0,
                    static_cast<GLint>(texelOrigin.x),
                    static_cast<GLint>(texelOrigin.y),
                    static_cast<GLint>(texelOrigin.z),
                    kChunkSize,
                    kChunkSize,
                    kChunkSize,
                    GL_RGBA_INTEGER,
                    GL_UNSIGNED_BYTE,
                    voxels.data());
    glBindTexture(GL_TEXTURE_3D, 0);
}

void GlAtlasBackend::writeSlot(std::uint32_t slot, const ChunkSlotGpu& entry)
{
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, slotBuffer_);
    glBufferSubData(GL_SHADER_STORAGE_BUFFER,
                    static_cast<GLintptr>(slot) * static_cast<GLintptr>(sizeof(ChunkSlotGpu)),
                    sizeof(ChunkSlotGpu),
                    &entry);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);
}

void GlAtlasBackend::writeOccupancy(std::uint32_t slot, std::uint64_t mask)
{
    const std::array<std::uint32_t, 2> words{static_cast<std::uint32_t>(mask & 0xFFFFFFFFull),
                                             static_cast<std::uint32_t>(mask >> 32)};
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, occupancyBuffer_);
    glBufferSubData(GL_SHADER_STORAGE_BUFFER,
                    static_cast<GLintptr>(slot) * static_cast<GLintptr>(sizeof(words)),
                    sizeof(words),
                    words.data());
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);
}

void GlAtlasBackend::bind() const
{
    glActiveTexture(GL_TEXTURE0 + kAtlasTextureUnit);
    glBindTexture(GL_TEXTURE_3D, texture_);
    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, kOccupancyBinding, occupancyBuffer_);
    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, kSlotTableBinding, slotBuffer_);
}

} // namespace gl
