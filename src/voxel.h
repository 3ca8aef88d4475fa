#pragma once
// voxel.h
// Packed voxel format, dense chunk storage, and chunk/world coordinate helpers.

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <glm/glm.hpp>

inline constexpr int kChunkSize = 32;
inline constexpr int kChunkVoxelCount = kChunkSize * kChunkSize * kChunkSize;
inline constexpr int kSubRegionSize = 8;
inline constexpr int kSubRegionsPerAxis = kChunkSize / kSubRegionSize;

enum class MaterialId : std::uint8_t
{
    Air = 0,
    Grass = 1,
    Dirt = 2,
    Stone = 3,
};

constexpr std::uint8_t toIndex(MaterialId material) noexcept
{
    return static_cast<std::uint8_t>(material);
}

// Byte 0 material, byte 1 param0, byte 2 param1, byte 3 flags.
constexpr std::uint32_t packVoxel(std::uint8_t material,
                                  std::uint8_t param0 = 0,
                                  std::uint8_t param1 = 0,
                                  std::uint8_t flags = 0) noexcept
{
    return static_cast<std::uint32_t>(material)
           | (static_cast<std::uint32_t>(param0) << 8)
           | (static_cast<std::uint32_t>(param1) << 16)
           | (static_cast<std::uint32_t>(flags) << 24);
}

constexpr std::uint32_t packVoxel(MaterialId material) noexcept
{
    return packVoxel(toIndex(material));
}

constexpr std::uint8_t materialId(std::uint32_t voxel) noexcept
{
    return static_cast<std::uint8_t>(voxel & 0xFFu);
}

constexpr std::uint8_t param0(std::uint32_t voxel) noexcept
{
    return static_cast<std::uint8_t>((voxel >> 8) & 0xFFu);
}

constexpr std::uint8_t param1(std::uint32_t voxel) noexcept
{
    return static_cast<std::uint8_t>((voxel >> 16) & 0xFFu);
}

constexpr std::uint8_t voxelFlags(std::uint32_t voxel) noexcept
{
    return static_cast<std::uint8_t>((voxel >> 24) & 0xFFu);
}

constexpr bool isSolidVoxel(std::uint32_t voxel) noexcept
{
    return materialId(voxel) != toIndex(MaterialId::Air);
}

constexpr std::size_t voxelIndex(int x, int y, int z) noexcept
{
    return static_cast<std::size_t>(z) * (kChunkSize * kChunkSize)
           + static_cast<std::size_t>(y) * kChunkSize
           + static_cast<std::size_t>(x);
}

// Bit layout matches the occupancy buffer read by the ray-march shader.
constexpr int subRegionBit(int sx, int sy, int sz) noexcept
{
    return sz * kSubRegionsPerAxis * kSubRegionsPerAxis + sy * kSubRegionsPerAxis + sx;
}

inline int floorDiv(int value, int divisor) noexcept
{
    int quotient = value / divisor;
    const int remainder = value % divisor;
    if ((remainder != 0) && ((remainder < 0) != (divisor < 0)))
    {
        --quotient;
    }
    return quotient;
}

inline int wrapIndex(int value, int modulus) noexcept
{
    int result = value % modulus;
    if (result < 0)
    {
        result += modulus;
    }
    return result;
}

// Finite and inside the int range once floored; NaN fails both comparisons.
inline bool isVoxelAddressable(const glm::vec3& worldPos) noexcept
{
    constexpr float kLowest = -2147483648.0f;
    constexpr float kPastHighest = 2147483648.0f;
    for (int axis = 0; axis < 3; ++axis)
    {
        if (!(worldPos[axis] >= kLowest && worldPos[axis] < kPastHighest))
        {
            return false;
        }
    }
    return true;
}

// Requires isVoxelAddressable(worldPos).
inline glm::ivec3 worldToVoxel(const glm::vec3& worldPos) noexcept
{
    return glm::ivec3(glm::floor(worldPos));
}

inline glm::ivec3 voxelToChunkCoord(const glm::ivec3& voxel) noexcept
{
    return {floorDiv(voxel.x, kChunkSize), floorDiv(voxel.y, kChunkSize), floorDiv(voxel.z, kChunkSize)};
}

inline glm::ivec3 voxelToLocal(const glm::ivec3& voxel) noexcept
{
    return {wrapIndex(voxel.x, kChunkSize), wrapIndex(voxel.y, kChunkSize), wrapIndex(voxel.z, kChunkSize)};
}

inline glm::ivec3 worldToChunkCoord(const glm::vec3& worldPos) noexcept
{
    return voxelToChunkCoord(worldToVoxel(worldPos));
}

struct VoxelChunk
{
    VoxelChunk();

    [[nodiscard]] std::uint32_t at(int x, int y, int z) const noexcept
    {
        return voxels[voxelIndex(x, y, z)];
    }

    void set(int x, int y, int z, std::uint32_t voxel) noexcept
    {
        voxels[voxelIndex(x, y, z)] = voxel;
    }

    // Full scan; lets callers skip upload and collision for all-air chunks.
    [[nodiscard]] bool isEmpty() const noexcept;
    [[nodiscard]] std::size_t solidCount() const noexcept;

    // Bit subRegionBit(sx, sy, sz) is set when that 8x8x8 region holds a solid voxel.
    [[nodiscard]] std::uint64_t occupancyMask() const noexcept;

    [[nodiscard]] std::span<const std::uint32_t> data() const noexcept
    {
        return voxels;
    }

    bool operator==(const VoxelChunk& other) const noexcept
    {
        return voxels == other.voxels;
    }

    std::vector<std::uint32_t> voxels;
};
