#pragma once

#include <array>
#include <functional>
#include <memory>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "terrain/worldgen_profile.h"
#include "voxel.h"

namespace terrain
{

// Seeded fractal Perlin noise; each octave samples glm::perlin at a per-seed offset.
class HeightNoise
{
public:
    explicit HeightNoise(unsigned seed = 0);

    void reseed(unsigned seed);

    [[nodiscard]] float fbm(float x, float y, const FbmSettings& settings) const noexcept;

    [[nodiscard]] unsigned seed() const noexcept
    {
        return seed_;
    }

private:
    unsigned seed_{0};
    std::array<glm::vec2, 16> octaveOffsets_{};
};

// Strategy the chunk manager calls for every chunk it streams in.
// Implementations must be deterministic in (chunkCoord).
class ChunkGenerator
{
public:
    virtual ~ChunkGenerator() = default;

    [[nodiscard]] virtual VoxelChunk generate(const glm::ivec3& chunkCoord) const = 0;
};

class HeightfieldGenerator final : public ChunkGenerator
{
public:
    HeightfieldGenerator(unsigned seed, const WorldgenProfile& profile);

    [[nodiscard]] VoxelChunk generate(const glm::ivec3& chunkCoord) const override;

    // World y of the topmost solid voxel; sampled in world space so columns agree across chunks.
    [[nodiscard]] int columnHeight(int worldX, int worldZ) const noexcept;

    [[nodiscard]] int dirtDepth() const noexcept
    {
        return dirtDepth_;
    }

private:
    HeightNoise noise_;
    FbmSettings fbm_{};
    float baseHeight_{0.0f};
    float heightAmplitude_{0.0f};
    int dirtDepth_{0};
};

class MapFeature
{
public:
    virtual ~MapFeature() = default;

    virtual void apply(VoxelChunk& chunk, const glm::ivec3& chunkCoord) const = 0;
};

// Pulls the surface toward a fixed height around the world origin.
// Fully flat inside flatRadius (Chebyshev), linear falloff to untouched at blendRadius.
class FlattenNearOrigin final : public MapFeature
{
public:
    using SurfaceSampler = std::function<int(int worldX, int worldZ)>;

    FlattenNearOrigin(const FlattenSettings& settings, int dirtDepth, SurfaceSampler sampler);

    void apply(VoxelChunk& chunk, const glm::ivec3& chunkCoord) const override;

    [[nodiscard]] float flatness(int worldX, int worldZ) const noexcept;

private:
    FlattenSettings settings_{};
    int dirtDepth_{0};
    SurfaceSampler sampler_;
};

class FeatureComposedGenerator final : public ChunkGenerator
{
public:
    FeatureComposedGenerator(std::unique_ptr<ChunkGenerator> base, std::vector<std::unique_ptr<MapFeature>> features);

    [[nodiscard]] VoxelChunk generate(const glm::ivec3& chunkCoord) const override;

    [[nodiscard]] std::size_t featureCount() const noexcept
    {
        return features_.size();
    }

private:
    std::unique_ptr<ChunkGenerator> base_;
    std::vector<std::unique_ptr<MapFeature>> features_;
};

// Grass on top, dirtDepth dirt voxels below it, stone underneath, air above.
void writeLayeredColumn(VoxelChunk& chunk, int localX, int localZ, int chunkBaseY, int surfaceWorldY, int dirtDepth) noexcept;

// Default heightfield terrain with no features.
[[nodiscard]] VoxelChunk generateTerrainChunk(unsigned seed, const glm::ivec3& chunkCoord);

[[nodiscard]] std::unique_ptr<ChunkGenerator> makeChunkGenerator(unsigned seed, const WorldgenProfile& profile);

} // namespace terrain
