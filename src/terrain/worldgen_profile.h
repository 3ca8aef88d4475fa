#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace terrain
{

struct FbmSettings
{
    float frequency{1.0f};
    int octaves{1};
    float gain{0.5f};
    float lacunarity{2.0f};
};

struct FlattenSettings
{
    float flatRadius{32.0f};
    float blendRadius{64.0f};
    int surfaceHeight{24};
};

struct FeatureSpec
{
    std::string type;
    FlattenSettings flatten{};
};

struct WorldgenProfile
{
    std::optional<unsigned> seedOverride{};
    FbmSettings noise{0.125f, 1, 0.5f, 2.0f};
    float baseHeight{8.0f};
    float heightAmplitude{16.0f};
    int dirtDepth{3};
    std::vector<FeatureSpec> features{};

    [[nodiscard]] unsigned effectiveSeed(unsigned fallback) const noexcept
    {
        return seedOverride.value_or(fallback);
    }

    static WorldgenProfile load(const std::filesystem::path& path);
};

} // namespace terrain
