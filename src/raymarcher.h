#pragma once
// raymarcher.h
// Reference implementation of the three-level traversal in the ray-march compute shader (opengl/raymarch_shaders.h).
// Chunk DDA over the visible grid, occupancy-mask DDA over 8^3 sub-regions, then voxel DDA.
// Runs over the atlas CPU mirror so frames can be rendered and compared without a GPU.

#include <array>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "camera.h"
#include "chunk_atlas.h"
#include "chunk_manager.h"

inline constexpr int kPaletteSize = 256;
inline constexpr int kAoRayCount = 6;
inline constexpr float kAoRayLength = 4.0f;
inline constexpr float kAmbientLight = 0.3f;

using Palette = std::array<glm::vec4, kPaletteSize>;

// 1 grass, 2 dirt, 3 stone; every other entry opaque black.
Palette buildDefaultPalette();

struct RayHit
{
    bool hit{false};
    glm::ivec3 voxel{0};
    glm::ivec3 normal{0};
    float distance{0.0f};
    std::uint8_t material{0};
};

// One cell-by-cell walk at a fixed cell size (32 chunk, 8 sub-region, 1 voxel).
struct GridWalk
{
    glm::ivec3 cell{0};
    glm::ivec3 step{0};
    glm::vec3 tMax{0.0f};
    glm::vec3 tDelta{0.0f};
    float t{0.0f};
    int axis{0};

    [[nodiscard]] float nextBoundary() const noexcept;
    void advance() noexcept;
};

// Deterministic hemisphere around an axis-aligned normal.
std::array<glm::vec3, kAoRayCount> aoDirections(const glm::ivec3& normal);

class Raymarcher
{
public:
    // The atlas must mirror its voxels on the CPU.
    explicit Raymarcher(const ChunkAtlas& atlas);

    [[nodiscard]] RayHit traceRay(const glm::vec3& origin,
                                  const glm::vec3& direction,
                                  const GridInfo& grid,
                                  float maxDistance) const;

    // Boolean hit test used by shadow and AO rays.
    [[nodiscard]] bool occluded(const glm::vec3& origin,
                                const glm::vec3& direction,
                                const GridInfo& grid,
                                float maxDistance) const;

    [[nodiscard]] glm::vec3 primaryRayDirection(const CameraUniform& camera, std::uint32_t px, std::uint32_t py) const;
    [[nodiscard]] glm::vec3 shadePixel(const CameraUniform& camera, const Palette& palette, std::uint32_t px, std::uint32_t py) const;

    // Tightly packed RGBA8, row 0 at the top.
    [[nodiscard]] std::vector<std::uint8_t> renderImage(const CameraUniform& camera, const Palette& palette) const;

private:
    RayHit traceChunk(const glm::vec3& origin,
                      const glm::vec3& direction,
                      const glm::vec3& invDirection,
                      const glm::ivec3& chunkCoord,
                      std::uint32_t slot,
                      float tEnter,
                      float tExit,
                      int entryAxis) const;

    const ChunkAtlas& atlas_;
};
