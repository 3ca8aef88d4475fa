#include "test_framework.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "engine_config.h"

namespace
{
// Writes the text to a uniquely named file in the temp directory and removes it on scope exit.
class TempToml
{
public:
    TempToml(const std::string& name, const std::string& text)
        : path_(std::filesystem::temp_directory_path() / ("voxelmarch_" + name + ".toml"))
    {
        std::ofstream out(path_, std::ios::trunc);
        out << text;
    }

    ~TempToml()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempToml(const TempToml&) = delete;
    TempToml& operator=(const TempToml&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return path_;
    }

private:
    std::filesystem::path path_;
};
} // namespace

TEST_CASE(config_missing_file_uses_defaults)
{
    const EngineConfig config = EngineConfig::load("/nonexistent/voxelmarch/engine.toml");
    CHECK(config.seed == 42u);
    CHECK(config.streaming.viewDistance == kDefaultViewDistance);
    CHECK(config.streaming.chunkBudget == kDefaultChunkBudget);
    CHECK(config.streaming.atlasSlots == glm::uvec3(8u));
    CHECK(config.worldgen.features.empty());
    CHECK(config.window.width == 1280);
}

TEST_CASE(config_parses_every_section)
{
    const TempToml file("full", R"(
seed = 7

[streaming]
view_distance = 2
chunk_budget = 16
atlas_slots = [6, 5, 7]
max_ray_distance = 0.0
prefetch_view_distance = 2

[terrain]
base_height = 10.0
height_amplitude = 4.0
dirt_depth = 2

[terrain.noise]
frequency = 0.05
octaves = 3

[[terrain.features]]
type = "flatten_near_origin"
flat_radius = 8.0
blend_radius = 20.0
height = 30

[render]
sun_direction = [0.0, 1.0, 0.0]
sky_color = [0.1, 0.2, 0.3]
shadow_bias = 0.05
ao_strength = 0.75
fov_degrees = 75.0

[[render.materials]]
id = 9
color = [1.0, 0.5, 0.25, 1.0]

[camera]
position = [1.0, 2.0, 3.0]
yaw = 45.0
pitch = -10.0
move_speed = 3.5

[window]
width = 800
height = 600
vsync = false
)");

    const EngineConfig config = EngineConfig::load(file.path());
    CHECK(config.seed == 7u);
    CHECK(config.streaming.viewDistance == 2);
    CHECK(config.streaming.chunkBudget == 16);
    CHECK(config.streaming.atlasSlots == glm::uvec3(6u, 5u, 7u));
    CHECK(config.streaming.maxRayDistance == 0.0f);
    CHECK(config.streaming.prefetchViewDistance == 2);

    CHECK(config.worldgen.baseHeight == 10.0f);
    CHECK(config.worldgen.heightAmplitude == 4.0f);
    CHECK(config.worldgen.dirtDepth == 2);
    CHECK(config.worldgen.noise.octaves == 3);
    CHECK_NEAR(config.worldgen.noise.frequency, 0.05f, 1e-6f);
    REQUIRE(config.worldgen.features.size() == 1u);
    CHECK(config.worldgen.features[0].type == "flatten_near_origin");
    CHECK(config.worldgen.features[0].flatten.surfaceHeight == 30);

    CHECK(config.render.sunDirection == glm::vec3(0.0f, 1.0f, 0.0f));
    CHECK_NEAR(config.render.skyColor.z, 0.3f, 1e-6f);
    CHECK_NEAR(config.render.shadowBias, 0.05f, 1e-6f);
    CHECK(config.render.aoStrength == 0.75f);
    CHECK(config.render.fovDegrees == 75.0f);
    REQUIRE(config.render.materialOverrides.size() == 1u);
    CHECK(config.render.materialOverrides[0].first == 9);
    CHECK(config.render.materialOverrides[0].second == glm::vec4(1.0f, 0.5f, 0.25f, 1.0f));

    CHECK(config.camera.initialPose.position == glm::vec3(1.0f, 2.0f, 3.0f));
    CHECK(config.camera.initialPose.yaw == 45.0f);
    CHECK(config.camera.initialPose.pitch == -10.0f);
    CHECK(config.camera.moveSpeed == 3.5f);

    CHECK(config.window.width == 800);
    CHECK(config.window.height == 600);
    CHECK_FALSE(config.window.vsync);
}

TEST_CASE(config_shipped_file_loads)
{
    const EngineConfig config = EngineConfig::load(std::filesystem::path(VOXELMARCH_ASSET_DIR) / "engine.toml");
    CHECK(config.seed == 42u);
    CHECK(config.streaming.viewDistance == 3);
    CHECK(config.streaming.atlasSlots == glm::uvec3(8u));
    CHECK(config.worldgen.features.size() == 1u);
}

TEST_CASE(config_rejects_malformed_toml)
{
    const TempToml file("malformed", "[streaming\nview_distance = 2\n");
    CHECK_THROWS_AS(EngineConfig::load(file.path()), std::runtime_error);
}

TEST_CASE(config_rejects_out_of_range_values)
{
    const TempToml ao("ao", "[render]\nao_strength = 2.0\n");
    CHECK_THROWS_AS(EngineConfig::load(ao.path()), std::runtime_error);

    const TempToml slots("slots", "[streaming]\natlas_slots = [8, 8]\n");
    CHECK_THROWS_AS(EngineConfig::load(slots.path()), std::runtime_error);

    const TempToml material("material", "[[render.materials]]\nid = 0\ncolor = [1.0, 1.0, 1.0, 1.0]\n");
    CHECK_THROWS_AS(EngineConfig::load(material.path()), std::runtime_error);

    const TempToml distance("distance", "[streaming]\nview_distance = -1\n");
    CHECK_THROWS_AS(EngineConfig::load(distance.path()), std::runtime_error);

    const TempToml feature("feature", "[[terrain.features]]\ntype = \"volcano\"\n");
    CHECK_THROWS_AS(EngineConfig::load(feature.path()), std::runtime_error);

    const TempToml window("window", "[window]\nwidth = 0\n");
    CHECK_THROWS_AS(EngineConfig::load(window.path()), std::runtime_error);
}
