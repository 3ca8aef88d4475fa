#include "terrain/worldgen_profile.h"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <toml++/toml.h>

namespace terrain
{
namespace
{
float readFloat(const toml::table& table, std::string_view key, float fallback)
{
    if (auto value = table[key].value<double>())
    {
        return static_cast<float>(*value);
    }
    return fallback;
}

int readInt(const toml::table& table, std::string_view key, int fallback)
{
    if (auto value = table[key].value<std::int64_t>())
    {
        return static_cast<int>(*value);
    }
    return fallback;
}

void applyFbmSettings(const toml::table& noiseTable, FbmSettings& settings, const std::filesystem::path& filePath)
{
    settings.frequency = readFloat(noiseTable, "frequency", settings.frequency);
    settings.gain = readFloat(noiseTable, "gain", settings.gain);
    settings.lacunarity = readFloat(noiseTable, "lacunarity", settings.lacunarity);
    settings.octaves = readInt(noiseTable, "octaves", settings.octaves);

    if (settings.frequency < 0.0f || !std::isfinite(settings.frequency))
    {
        std::ostringstream oss;
        oss << "Noise frequency in " << filePath << " must be non-negative";
        throw std::runtime_error(oss.str());
    }

    if (settings.octaves <= 0 || settings.octaves > 16)
    {
        std::ostringstream oss;
        oss << "Noise octaves in " << filePath << " must be in [1, 16]";
        throw std::runtime_error(oss.str());
    }

    if (!std::isfinite(settings.gain) || !std::isfinite(settings.lacunarity))
    {
        std::ostringstream oss;
        oss << "Noise parameters in " << filePath << " must be finite";
        throw std::runtime_error(oss.str());
    }
}

FeatureSpec readFeature(const toml::table& featureTable, const std::filesystem::path& filePath)
{
    FeatureSpec spec{};
    const auto type = featureTable["type"].value<std::string>();
    if (!type)
    {
        std::ostringstream oss;
        oss << "Terrain feature in " << filePath << " is missing 'type'";
        throw std::runtime_error(oss.str());
    }
    spec.type = *type;

    if (spec.type == "flatten_near_origin")
    {
        spec.flatten.flatRadius = readFloat(featureTable, "flat_radius", spec.flatten.flatRadius);
        spec.flatten.blendRadius = readFloat(featureTable, "blend_radius", spec.flatten.blendRadius);
        spec.flatten.surfaceHeight = readInt(featureTable, "height", spec.flatten.surfaceHeight);
        if (spec.flatten.flatRadius < 0.0f || spec.flatten.blendRadius <= spec.flatten.flatRadius)
        {
            std::ostringstream oss;
            oss << "flatten_near_origin in " << filePath << " requires 0 <= flat_radius < blend_radius";
            throw std::runtime_error(oss.str());
        }
    }
    else
    {
        std::ostringstream oss;
        oss << "Unknown terrain feature '" << spec.type << "' in " << filePath;
        throw std::runtime_error(oss.str());
    }

    return spec;
}

} // namespace

WorldgenProfile WorldgenProfile::load(const std::filesystem::path& path)
{
    WorldgenProfile profile{};
    if (!std::filesystem::exists(path))
    {
        std::cout << "[Config] " << path << " not found, using default terrain profile" << std::endl;
        return profile;
    }

    toml::table table;
    try
    {
        table = toml::parse_file(path.string());
    }
    catch (const toml::parse_error& err)
    {
        std::ostringstream oss;
        oss << "Failed to parse " << path << ": " << err.description();
        throw std::runtime_error(oss.str());
    }

    if (auto seedValue = table["seed"].value<std::int64_t>())
    {
        if (*seedValue < 0 || *seedValue > static_cast<std::int64_t>(std::numeric_limits<unsigned>::max()))
        {
            std::ostringstream oss;
            oss << "Seed value out of range in " << path;
            throw std::runtime_error(oss.str());
        }
        profile.seedOverride = static_cast<unsigned>(*seedValue);
    }

    if (const toml::table* terrainTable = table["terrain"].as_table())
    {
        profile.baseHeight = readFloat(*terrainTable, "base_height", profile.baseHeight);
        profile.heightAmplitude = readFloat(*terrainTable, "height_amplitude", profile.heightAmplitude);
        profile.dirtDepth = readInt(*terrainTable, "dirt_depth", profile.dirtDepth);
        if (profile.dirtDepth < 0 || profile.heightAmplitude < 0.0f)
        {
            std::ostringstream oss;
            oss << "dirt_depth and height_amplitude in " << path << " must be non-negative";
            throw std::runtime_error(oss.str());
        }

        if (const toml::table* noiseTable = (*terrainTable)["noise"].as_table())
        {
            applyFbmSettings(*noiseTable, profile.noise, path);
        }

        if (const toml::array* features = (*terrainTable)["features"].as_array())
        {
            for (const toml::node& node : *features)
            {
                const toml::table* featureTable = node.as_table();
                if (!featureTable)
                {
                    std::ostringstream oss;
                    oss << "terrain.features entries in " << path << " must be tables";
                    throw std::runtime_error(oss.str());
                }
                profile.features.push_back(readFeature(*featureTable, path));
            }
        }
    }

    return profile;
}

} // namespace terrain
