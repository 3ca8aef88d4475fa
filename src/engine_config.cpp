#include "engine_config.h"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <toml++/toml.h>

#include "raymarcher.h"

namespace
{
[[noreturn]] void failKey(const std::filesystem::path& path, std::string_view key, std::string_view reason)
{
    std::ostringstream oss;
    oss << "Invalid '" << key << "' in " << path << ": " << reason;
    throw std::runtime_error(oss.str());
}

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

template <int N>
glm::vec<N, float> readFloatArray(const toml::table& table,
                                  std::string_view key,
                                  const glm::vec<N, float>& fallback,
                                  const std::filesystem::path& path)
{
    const toml::array* array = table[key].as_array();
    if (array == nullptr)
    {
        return fallback;
    }
    if (array->size() != static_cast<std::size_t>(N))
    {
        failKey(path, key, "expected " + std::to_string(N) + " numbers");
    }

    glm::vec<N, float> result(0.0f);
    for (int i = 0; i < N; ++i)
    {
        const auto value = (*array)[static_cast<std::size_t>(i)].value<double>();
        if (!value || !std::isfinite(*value))
        {
            failKey(path, key, "entries must be finite numbers");
        }
        result[i] = static_cast<float>(*value);
    }
    return result;
}

void readStreaming(const toml::table& table, StreamingConfig& streaming, const std::filesystem::path& path)
{
    streaming.viewDistance = readInt(table, "view_distance", streaming.viewDistance);
    streaming.chunkBudget = readInt(table, "chunk_budget", streaming.chunkBudget);
    streaming.maxRayDistance = readFloat(table, "max_ray_distance", streaming.maxRayDistance);
    streaming.prefetchViewDistance = readInt(table, "prefetch_view_distance", streaming.prefetchViewDistance);

    const glm::vec3 slots = readFloatArray<3>(table, "atlas_slots", glm::vec3(streaming.atlasSlots), path);
    if (slots.x < 1.0f || slots.y < 1.0f || slots.z < 1.0f)
    {
        failKey(path, "streaming.atlas_slots", "every axis must be at least 1");
    }
    streaming.atlasSlots = glm::uvec3(slots);

    if (streaming.viewDistance < 0)
    {
        failKey(path, "streaming.view_distance", "must be non-negative");
    }
    if (streaming.prefetchViewDistance < 0)
    {
        failKey(path, "streaming.prefetch_view_distance", "must be non-negative");
    }
    if (streaming.chunkBudget < 0)
    {
        failKey(path, "streaming.chunk_budget", "must be non-negative");
    }
}

void readRender(const toml::table& table, RenderSettings& render, const std::filesystem::path& path)
{
    render.sunDirection = readFloatArray<3>(table, "sun_direction", render.sunDirection, path);
    render.skyColor = readFloatArray<3>(table, "sky_color", render.skyColor, path);
    render.shadowBias = readFloat(table, "shadow_bias", render.shadowBias);
    render.aoStrength = readFloat(table, "ao_strength", render.aoStrength);
    render.fovDegrees = readFloat(table, "fov_degrees", render.fovDegrees);

    if (glm::length(render.sunDirection) <= 0.0f)
    {
        failKey(path, "render.sun_direction", "must not be zero");
    }
    if (render.aoStrength < 0.0f || render.aoStrength > 1.0f)
    {
        failKey(path, "render.ao_strength", "must be in [0, 1]");
    }
    if (render.fovDegrees <= 0.0f || render.fovDegrees >= 180.0f)
    {
        failKey(path, "render.fov_degrees", "must be in (0, 180)");
    }

    if (const toml::array* materials = table["materials"].as_array())
    {
        for (const toml::node& node : *materials)
        {
            const toml::table* entry = node.as_table();
            if (entry == nullptr)
            {
                failKey(path, "render.materials", "entries must be tables");
            }

            const int id = readInt(*entry, "id", -1);
            if (id < 1 || id >= kPaletteSize)
            {
                failKey(path, "render.materials.id", "must be in [1, 255]");
            }
            const glm::vec4 color = readFloatArray<4>(*entry, "color", glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), path);
            render.materialOverrides.emplace_back(id, color);
        }
    }
}

void readCamera(const toml::table& table, CameraSettings& camera, const std::filesystem::path& path)
{
    camera.initialPose.position = readFloatArray<3>(table, "position", camera.initialPose.position, path);
    camera.initialPose.yaw = readFloat(table, "yaw", camera.initialPose.yaw);
    camera.initialPose.pitch = readFloat(table, "pitch", camera.initialPose.pitch);
    camera.moveSpeed = readFloat(table, "move_speed", camera.moveSpeed);
    if (camera.moveSpeed < 0.0f)
    {
        failKey(path, "camera.move_speed", "must be non-negative");
    }
}

void readWindow(const toml::table& table, WindowSettings& window, const std::filesystem::path& path)
{
    window.width = readInt(table, "width", window.width);
    window.height = readInt(table, "height", window.height);
    if (auto vsync = table["vsync"].value<bool>())
    {
        window.vsync = *vsync;
    }
    if (window.width <= 0 || window.height <= 0)
    {
        failKey(path, "window", "width and height must be positive");
    }
}
} // namespace

EngineConfig EngineConfig::load(const std::filesystem::path& path)
{
    EngineConfig config{};
    if (!std::filesystem::exists(path))
    {
        std::cout << "[Config] " << path << " not found, using defaults" << std::endl;
        return config;
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

    config.worldgen = terrain::WorldgenProfile::load(path);
    config.seed = config.worldgen.effectiveSeed(kDefaultSeed);

    if (const toml::table* streaming = table["streaming"].as_table())
    {
        readStreaming(*streaming, config.streaming, path);
    }
    if (const toml::table* render = table["render"].as_table())
    {
        readRender(*render, config.render, path);
    }
    if (const toml::table* camera = table["camera"].as_table())
    {
        readCamera(*camera, config.camera, path);
    }
    if (const toml::table* window = table["window"].as_table())
    {
        readWindow(*window, config.window, path);
    }

    std::cout << "[Config] Loaded " << path << " (seed " << config.seed << ", view distance "
              << config.streaming.viewDistance << ", budget " << config.streaming.chunkBudget << ")" << std::endl;
    return config;
}
