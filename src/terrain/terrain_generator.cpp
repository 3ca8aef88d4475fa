#include "terrain/terrain_generator.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <random>
#include <stdexcept>
#include <utility>

#include <glm/gtc/noise.hpp>

namespace terrain
{

HeightNoise::HeightNoise(unsigned seed)
{
    reseed(seed);
}

void HeightNoise::reseed(unsigned seed)
{
    seed_ = seed;

    std::mt19937 rng(seed_);
    std::uniform_real_distribution<float> dist(-1000.0f, 1000.0f);
    for (auto& offset : octaveOffsets_)
    {
        offset = {dist(rng), dist(rng)};
    }
}

float HeightNoise::fbm(float x, float y, const FbmSettings& settings) const noexcept
{
    float amplitude = 1.0f;
    float frequency = settings.frequency;
    float value = 0.0f;
    float normalization = 0.0f;

    const int octaveCount = std::min<int>(settings.octaves, static_cast<int>(octaveOffsets_.size()));
    for (int i = 0; i < octaveCount; ++i)
    {
        const glm::vec2 sample{x * frequency + octaveOffsets_[i].x, y * frequency + octaveOffsets_[i].y};
        value += glm::perlin(sample) * amplitude;
        normalization += amplitude;

        amplitude *= settings.gain;
        frequency *= settings.lacunarity;
    }

    if (normalization > 0.0f)
    {
        value /= normalization;
    }

    return std::clamp(value, -1.0f, 1.0f);
}

HeightfieldGenerator::HeightfieldGenerator(unsigned seed, const WorldgenProfile& profile)
    : noise_(seed),
      fbm_(profile.noise),
      baseHeight_(profile.baseHeight),
      heightAmplitude_(profile.heightAmplitude),
      dirtDepth_(profile.dirtDepth)
{
}

int HeightfieldGenerator::columnHeight(int worldX, int worldZ) const noexcept
{
    const float n = noise_.fbm(static_cast<float>(worldX), static_cast<float>(worldZ), fbm_);
    return static_cast<int>(std::floor((n + 1.0f) * 0.5f * heightAmplitude_ + baseHeight_));
}

VoxelChunk HeightfieldGenerator::generate(const glm::ivec3& chunkCoord) const
{
    VoxelChunk chunk;
    const int baseX = chunkCoord.x * kChunkSize;
    const int baseY = chunkCoord.y * kChunkSize;
    const int baseZ = chunkCoord.z * kChunkSize;

    for (int z = 0; z < kChunkSize; ++z)
    {
        for (int x = 0; x < kChunkSize; ++x)
        {
            const int surfaceY = columnHeight(baseX + x, baseZ + z);
            writeLayeredColumn(chunk, x, z, baseY, surfaceY, dirtDepth_);
        }
    }

    return chunk;
}

void writeLayeredColumn(VoxelChunk& chunk, int localX, int localZ, int chunkBaseY, int surfaceWorldY, int dirtDepth) noexcept
{
    for (int y = 0; y < kChunkSize; ++y)
    {
        const int worldY = chunkBaseY + y;
        MaterialId material = MaterialId::Air;
        if (worldY == surfaceWorldY)
        {
            material = MaterialId::Grass;
        }
        else if (worldY < surfaceWorldY)
        {
            material = (worldY + dirtDepth >= surfaceWorldY) ? MaterialId::Dirt : MaterialId::Stone;
        }
        chunk.set(localX, y, localZ, packVoxel(material));
    }
}

FlattenNearOrigin::FlattenNearOrigin(const FlattenSettings& settings, int dirtDepth, SurfaceSampler sampler)
    : settings_(settings),
      dirtDepth_(dirtDepth),
      sampler_(std::move(sampler))
{
    if (!sampler_)
    {
        throw std::invalid_argument("FlattenNearOrigin requires a surface sampler");
    }
    if (settings_.blendRadius <= settings_.flatRadius)
    {
        throw std::invalid_argument("FlattenNearOrigin blend radius must exceed flat radius");
    }
}

float FlattenNearOrigin::flatness(int worldX, int worldZ) const noexcept
{
    const float distance = static_cast<float>(std::max(std::abs(worldX), std::abs(worldZ)));
    if (distance <= settings_.flatRadius)
    {
        return 1.0f;
    }
    const float t = (settings_.blendRadius - distance) / (settings_.blendRadius - settings_.flatRadius);
    return std::clamp(t, 0.0f, 1.0f);
}

void FlattenNearOrigin::apply(VoxelChunk& chunk, const glm::ivec3& chunkCoord) const
{
    const int baseX = chunkCoord.x * kChunkSize;
    const int baseY = chunkCoord.y * kChunkSize;
    const int baseZ = chunkCoord.z * kChunkSize;

    for (int z = 0; z < kChunkSize; ++z)
    {
        for (int x = 0; x < kChunkSize; ++x)
        {
            const int worldX = baseX + x;
            const int worldZ = baseZ + z;
            const float weight = flatness(worldX, worldZ);
            if (weight <= 0.0f)
            {
                continue;
            }

            const int naturalY = sampler_(worldX, worldZ);
            const int targetY = static_cast<int>(std::lround(static_cast<float>(settings_.surfaceHeight) * weight
                                                             + static_cast<float>(naturalY) * (1.0f - weight)));
            writeLayeredColumn(chunk, x, z, baseY, targetY, dirtDepth_);
        }
    }
}

FeatureComposedGenerator::FeatureComposedGenerator(std::unique_ptr<ChunkGenerator> base,
                                                   std::vector<std::unique_ptr<MapFeature>> features)
    : base_(std::move(base)),
      features_(std::move(features))
{
    if (!base_)
    {
        throw std::invalid_argument("FeatureComposedGenerator requires a base generator");
    }
}

VoxelChunk FeatureComposedGenerator::generate(const glm::ivec3& chunkCoord) const
{
    VoxelChunk chunk = base_->generate(chunkCoord);
    for (const auto& feature : features_)
    {
        feature->apply(chunk, chunkCoord);
    }
    return chunk;
}

VoxelChunk generateTerrainChunk(unsigned seed, const glm::ivec3& chunkCoord)
{
    const HeightfieldGenerator generator(seed, WorldgenProfile{});
    return generator.generate(chunkCoord);
}

std::unique_ptr<ChunkGenerator> makeChunkGenerator(unsigned seed, const WorldgenProfile& profile)
{
    auto heightfield = std::make_unique<HeightfieldGenerator>(seed, profile);
    if (profile.features.empty())
    {
        return heightfield;
    }

    const HeightfieldGenerator* surface = heightfield.get();
    std::vector<std::unique_ptr<MapFeature>> features;
    for (const FeatureSpec& spec : profile.features)
    {
        if (spec.type == "flatten_near_origin")
        {
            features.push_back(std::make_unique<FlattenNearOrigin>(
                spec.flatten, profile.dirtDepth, [surface](int worldX, int worldZ) {
                    return surface->columnHeight(worldX, worldZ);
                }));
        }
        else
        {
            throw std::invalid_argument("Unknown terrain feature: " + spec.type);
        }
    }

    std::cout << "[Terrain] Seed " << seed << " with " << features.size() << " map feature(s)" << std::endl;
    return std::make_unique<FeatureComposedGenerator>(std::move(heightfield), std::move(features));
}

} // namespace terrain
