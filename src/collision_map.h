#pragma once
// collision_map.h
// One bit per voxel solidity field built once per chunk load.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include <glm/glm.hpp>

#include "voxel.h"

class CollisionMap
{
public:
    static constexpr std::size_t kBitCount = static_cast<std::size_t>(kChunkVoxelCount);
    static constexpr std::size_t kByteCount = kBitCount / 8;

    CollisionMap() = default;

    // Bit i = z*32*32 + y*32 + x is set when voxels[i] has a non-zero material.
    static CollisionMap fromVoxels(std::span<const std::uint32_t> voxels);

    // Out-of-range local coordinates are never solid.
    [[nodiscard]] bool isSolid(int x, int y, int z) const noexcept;
    [[nodiscard]] bool isSolid(const glm::ivec3& local) const noexcept
    {
        return isSolid(local.x, local.y, local.z);
    }

    [[nodiscard]] std::size_t solidCount() const noexcept;

    [[nodiscard]] const std::array<std::uint8_t, kByteCount>& bytes() const noexcept
    {
        return bits_;
    }

    // Integer voxel of old and new differ on any axis.
    static bool crossesVoxelBoundary(const glm::vec3& oldPos, const glm::vec3& newPos) noexcept;

private:
    std::array<std::uint8_t, kByteCount> bits_{};
};
