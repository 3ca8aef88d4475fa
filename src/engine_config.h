#pragma once

#include <filesystem>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "camera.h"
#include "chunk_manager.h"
#include "terrain/worldgen_profile.h"

inline constexpr unsigned kDefaultSeed = 42u;

struct RenderSettings
{
    glm::vec3 sunDirection{0.4f, 0.8f, 0.3f};
    glm::vec3 skyColor{0.55f, 0.78f, 0.95f};
    float shadowBias{0.01f};
    float aoStrength{0.5f};
    float fovDegrees{60.0f};
    // (material id, rgba) applied on top of the default palette.
    std::vector<std::pair<int, glm::vec4>> materialOverrides{};
};

struct CameraSettings
{
    CameraPose initialPose{{16.0f, 40.0f, 48.0f}, -90.0f, -20.0f};
    float moveSpeed{10.0f};
};

struct WindowSettings
{
    int width{1280};
    int height{720};
    bool vsync{true};
};

struct EngineConfig
{
    unsigned seed{kDefaultSeed};
    StreamingConfig streaming{};
    terrain::WorldgenProfile worldgen{};
    RenderSettings render{};
    CameraSettings camera{};
    WindowSettings window{};

    // Missing file yields defaults; malformed values throw std::runtime_error.
    static EngineConfig load(const std::filesystem::path& path);
};
