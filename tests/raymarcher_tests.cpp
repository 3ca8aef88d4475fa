#include "test_framework.h"
#include "test_generators.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <optional>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

#include "chunk_manager.h"
#include "raymarcher.h"

using voxelmarch::test::SolidBox;

namespace
{
StreamingConfig mirroredConfig(glm::uvec3 atlasSlots = glm::uvec3(8u))
{
    StreamingConfig config{};
    config.viewDistance = 1;
    config.atlasSlots = atlasSlots;
    config.maxRayDistance = 0.0f;
    config.mirrorVoxels = true;
    return config;
}

// Floor at y < 4 plus a stone roof over x, z in [8, 24) at y in [12, 14).
std::unique_ptr<ChunkManager> makeRoofedScene()
{
    std::vector<SolidBox> roof{{glm::ivec3(8, 12, 8), glm::ivec3(24, 14, 24), MaterialId::Stone}};
    auto manager = std::make_unique<ChunkManager>(voxelmarch::test::makeFloorGenerator(4, std::move(roof)),
                                                  mirroredConfig());
    manager->tickBudgeted(glm::vec3(16.0f, 20.0f, 16.0f), 100);
    return manager;
}

CameraUniform downwardCamera(const GridInfo& grid, const glm::vec3& position)
{
    CameraUniform camera{};
    camera.position = position;
    camera.forward = glm::vec3(0.0f, -1.0f, 0.0f);
    camera.right = glm::vec3(1.0f, 0.0f, 0.0f);
    camera.up = glm::vec3(0.0f, 0.0f, -1.0f);
    camera.fovY = glm::radians(10.0f);
    camera.width = 1;
    camera.height = 1;
    camera.gridOrigin = grid.origin;
    camera.gridSize = grid.size;
    camera.atlasSlots = grid.atlasSlots;
    camera.maxRayDistance = grid.maxRayDistance;
    camera.sunDirection = glm::normalize(glm::vec3(0.4f, 0.8f, 0.3f));
    camera.shadowBias = 0.01f;
    camera.skyColor = glm::vec3(0.55f, 0.78f, 0.95f);
    camera.aoStrength = 0.5f;
    return camera;
}
// Scattered small boxes inside the chunk grid around the origin, leaving most sub-regions empty.
std::vector<SolidBox> scatteredBoxes(std::mt19937& rng, int count)
{
    std::uniform_int_distribution<int> extent(1, 4);
    std::vector<SolidBox> boxes;
    for (int i = 0; i < count; ++i)
    {
        SolidBox box;
        for (int axis = 0; axis < 3; ++axis)
        {
            const int size = extent(rng);
            box.min[axis] = std::uniform_int_distribution<int>(-kChunkSize, 2 * kChunkSize - size)(rng);
            box.max[axis] = box.min[axis] + size;
        }
        boxes.push_back(box);
    }
    return boxes;
}

// First t >= 0 at which floor(origin + t * direction) lies inside the box, solved per axis.
std::optional<double> firstEntry(const glm::vec3& origin, const glm::vec3& direction, const SolidBox& box)
{
    double lo = 0.0;
    bool loClosed = true;
    double hi = std::numeric_limits<double>::infinity();
    bool hiClosed = false;

    for (int axis = 0; axis < 3; ++axis)
    {
        const double o = origin[axis];
        const double d = direction[axis];
        const double minEdge = box.min[axis];
        const double maxEdge = box.max[axis];
        if (d == 0.0)
        {
            if (o < minEdge || o >= maxEdge)
            {
                return std::nullopt;
            }
            continue;
        }

        double enter = (minEdge - o) / d;
        double leave = (maxEdge - o) / d;
        bool enterClosed = true;
        bool leaveClosed = false;
        if (d < 0.0)
        {
            std::swap(enter, leave);
            std::swap(enterClosed, leaveClosed);
        }

        if (enter > lo)
        {
            lo = enter;
            loClosed = enterClosed;
        }
        else if (enter == lo)
        {
            loClosed = loClosed && enterClosed;
        }

        if (leave < hi)
        {
            hi = leave;
            hiClosed = leaveClosed;
        }
        else if (leave == hi)
        {
            hiClosed = hiClosed && leaveClosed;
        }
    }

    if (lo < hi || (lo == hi && loClosed && hiClosed))
    {
        return lo;
    }
    return std::nullopt;
}

std::optional<double> nearestEntry(const glm::vec3& origin, const glm::vec3& direction, const std::vector<SolidBox>& boxes)
{
    std::optional<double> nearest;
    for (const SolidBox& box : boxes)
    {
        const std::optional<double> t = firstEntry(origin, direction, box);
        if (t && (!nearest || *t < *nearest))
        {
            nearest = t;
        }
    }
    return nearest;
}

glm::vec3 randomDirection(std::mt19937& rng)
{
    std::normal_distribution<float> gauss(0.0f, 1.0f);
    glm::vec3 direction(0.0f);
    while (glm::length(direction) < 1e-3f)
    {
        direction = glm::vec3(gauss(rng), gauss(rng), gauss(rng));
    }
    return glm::normalize(direction);
}
} // namespace

TEST_CASE(raymarch_requires_cpu_mirror)
{
    const ChunkAtlas atlas(glm::uvec3(4u));
    CHECK_THROWS_AS(Raymarcher(atlas), std::invalid_argument);
}

TEST_CASE(raymarch_default_palette)
{
    const Palette palette = buildDefaultPalette();
    CHECK(palette[toIndex(MaterialId::Grass)] == glm::vec4(0.3f, 0.7f, 0.2f, 1.0f));
    CHECK(palette[toIndex(MaterialId::Dirt)] == glm::vec4(0.5f, 0.3f, 0.1f, 1.0f));
    CHECK(palette[toIndex(MaterialId::Stone)] == glm::vec4(0.5f, 0.5f, 0.5f, 1.0f));
    CHECK(palette[0] == glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    CHECK(palette[200] == glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
}

TEST_CASE(raymarch_hits_floor_from_above)
{
    auto manager = makeRoofedScene();
    const Raymarcher marcher(manager->atlas());
    const GridInfo& grid = manager->gridInfo();

    const RayHit hit = marcher.traceRay(glm::vec3(2.5f, 20.5f, 2.5f), glm::vec3(0.0f, -1.0f, 0.0f), grid,
                                        grid.maxRayDistance);
    REQUIRE(hit.hit);
    CHECK(hit.voxel == glm::ivec3(2, 3, 2));
    CHECK(hit.normal == glm::ivec3(0, 1, 0));
    CHECK_NEAR(hit.distance, 16.5f, 1e-4f);
    CHECK(hit.material == toIndex(MaterialId::Stone));
}

TEST_CASE(raymarch_hits_roof_before_floor)
{
    auto manager = makeRoofedScene();
    const Raymarcher marcher(manager->atlas());
    const GridInfo& grid = manager->gridInfo();

    const RayHit hit = marcher.traceRay(glm::vec3(16.5f, 20.5f, 16.5f), glm::vec3(0.0f, -1.0f, 0.0f), grid,
                                        grid.maxRayDistance);
    REQUIRE(hit.hit);
    CHECK(hit.voxel == glm::ivec3(16, 13, 16));
    CHECK_NEAR(hit.distance, 6.5f, 1e-4f);
}

TEST_CASE(raymarch_side_hit_reports_face_normal)
{
    auto manager = makeRoofedScene();
    const Raymarcher marcher(manager->atlas());
    const GridInfo& grid = manager->gridInfo();

    // Crosses a chunk boundary at x = 0 before reaching the roof's west face at x = 8.
    const RayHit hit = marcher.traceRay(glm::vec3(-20.5f, 12.5f, 16.5f), glm::vec3(1.0f, 0.0f, 0.0f), grid,
                                        grid.maxRayDistance);
    REQUIRE(hit.hit);
    CHECK(hit.voxel == glm::ivec3(8, 12, 16));
    CHECK(hit.normal == glm::ivec3(-1, 0, 0));
    CHECK_NEAR(hit.distance, 28.5f, 1e-4f);
}

TEST_CASE(raymarch_enters_grid_from_outside)
{
    auto manager = makeRoofedScene();
    const Raymarcher marcher(manager->atlas());
    const GridInfo& grid = manager->gridInfo();

    // Grid spans y in [-32, 64); start above it and fall onto the floor.
    const RayHit hit = marcher.traceRay(glm::vec3(40.5f, 100.0f, 40.5f), glm::vec3(0.0f, -1.0f, 0.0f), grid, 1000.0f);
    REQUIRE(hit.hit);
    CHECK(hit.voxel == glm::ivec3(40, 3, 40));
    CHECK(hit.normal == glm::ivec3(0, 1, 0));
    CHECK_NEAR(hit.distance, 96.0f, 1e-4f);
}

TEST_CASE(raymarch_misses_into_sky)
{
    auto manager = makeRoofedScene();
    const Raymarcher marcher(manager->atlas());
    const GridInfo& grid = manager->gridInfo();

    CHECK_FALSE(marcher.traceRay(glm::vec3(2.5f, 20.5f, 2.5f), glm::vec3(0.0f, 1.0f, 0.0f), grid, grid.maxRayDistance).hit);
    CHECK_FALSE(marcher.traceRay(glm::vec3(2.5f, 20.5f, 2.5f), glm::vec3(0.0f, -1.0f, 0.0f), grid, 10.0f).hit);

    const CameraUniform camera = downwardCamera(grid, glm::vec3(2.5f, 20.5f, 2.5f));
    CameraUniform upward = camera;
    upward.forward = glm::vec3(0.0f, 1.0f, 0.0f);
    upward.up = glm::vec3(0.0f, 0.0f, 1.0f);
    CHECK(marcher.shadePixel(upward, buildDefaultPalette(), 0, 0) == camera.skyColor);
}

TEST_CASE(raymarch_shadow_under_roof)
{
    auto manager = makeRoofedScene();
    const Raymarcher marcher(manager->atlas());
    const GridInfo& grid = manager->gridInfo();
    const glm::vec3 up(0.0f, 1.0f, 0.0f);

    CHECK(marcher.occluded(glm::vec3(16.5f, 4.01f, 16.5f), up, grid, grid.maxRayDistance));
    CHECK_FALSE(marcher.occluded(glm::vec3(2.5f, 4.01f, 2.5f), up, grid, grid.maxRayDistance));

    const Palette palette = buildDefaultPalette();
    const glm::vec3 lit = marcher.shadePixel(downwardCamera(grid, glm::vec3(2.5f, 8.5f, 2.5f)), palette, 0, 0);
    const glm::vec3 shaded = marcher.shadePixel(downwardCamera(grid, glm::vec3(16.5f, 8.5f, 16.5f)), palette, 0, 0);

    // Open floor: full diffuse, nothing within AO range.
    const glm::vec3 sun = glm::normalize(glm::vec3(0.4f, 0.8f, 0.3f));
    const float expectedLit = 0.5f * (kAmbientLight + (1.0f - kAmbientLight) * sun.y);
    CHECK_NEAR(lit.r, expectedLit, 1e-3f);
    // Under the roof only ambient light remains.
    CHECK(shaded.r < lit.r);
    CHECK_NEAR(shaded.r, 0.5f * kAmbientLight, 1e-3f);
}

TEST_CASE(raymarch_ambient_occlusion_darkens_corners)
{
    // Wall along x = 10 next to an open floor.
    std::vector<SolidBox> wall{{glm::ivec3(10, 4, -32), glm::ivec3(11, 12, 64), MaterialId::Stone}};
    ChunkManager manager(voxelmarch::test::makeFloorGenerator(4, std::move(wall)), mirroredConfig());
    manager.tickBudgeted(glm::vec3(16.0f, 20.0f, 16.0f), 100);
    const Raymarcher marcher(manager.atlas());
    const GridInfo& grid = manager.gridInfo();
    const Palette palette = buildDefaultPalette();

    CameraUniform open = downwardCamera(grid, glm::vec3(2.5f, 8.5f, 16.5f));
    CameraUniform corner = downwardCamera(grid, glm::vec3(9.5f, 8.5f, 16.5f));
    open.sunDirection = corner.sunDirection = glm::vec3(0.0f, 1.0f, 0.0f);

    const glm::vec3 openColor = marcher.shadePixel(open, palette, 0, 0);
    const glm::vec3 cornerColor = marcher.shadePixel(corner, palette, 0, 0);
    CHECK_NEAR(openColor.r, 0.5f, 1e-3f);
    CHECK(cornerColor.r < openColor.r);
}

TEST_CASE(raymarch_skips_empty_and_stale_slots)
{
    StreamingConfig config = mirroredConfig(glm::uvec3(4u));
    ChunkManager manager(voxelmarch::test::makeFloorGenerator(4), config);
    manager.loadChunk(glm::ivec3(0, 0, 0));
    const Raymarcher marcher(manager.atlas());

    GridInfo grid;
    grid.origin = glm::ivec3(0);
    grid.size = glm::ivec3(1);
    grid.atlasSlots = config.atlasSlots;
    grid.maxRayDistance = 100.0f;

    const glm::vec3 origin(5.5f, 20.5f, 5.5f);
    const glm::vec3 down(0.0f, -1.0f, 0.0f);
    CHECK(marcher.traceRay(origin, down, grid, 100.0f).hit);

    // Same slot now holds (4, 0, 0); the traversal must not read it as (0, 0, 0).
    manager.loadChunk(glm::ivec3(4, 0, 0));
    CHECK(manager.atlas().isOccupied(manager.atlas().slotFor(glm::ivec3(0))));
    CHECK_FALSE(marcher.traceRay(origin, down, grid, 100.0f).hit);

    manager.unloadChunk(glm::ivec3(4, 0, 0));
    CHECK_FALSE(manager.atlas().isOccupied(manager.atlas().slotFor(glm::ivec3(0))));
    CHECK_FALSE(marcher.traceRay(origin, down, grid, 100.0f).hit);
}

TEST_CASE(raymarch_render_image_layout)
{
    auto manager = makeRoofedScene();
    const Raymarcher marcher(manager->atlas());
    CameraUniform camera = downwardCamera(manager->gridInfo(), glm::vec3(2.5f, 20.5f, 2.5f));
    camera.width = 3;
    camera.height = 2;

    const std::vector<std::uint8_t> pixels = marcher.renderImage(camera, buildDefaultPalette());
    REQUIRE(pixels.size() == 3u * 2u * 4u);
    for (std::size_t i = 3; i < pixels.size(); i += 4)
    {
        CHECK(pixels[i] == 255);
    }
    // Every pixel sees stone: equal channels, darker than full white.
    CHECK(pixels[0] == pixels[1]);
    CHECK(pixels[0] < 255);
    CHECK(pixels[0] > 0);
}

TEST_CASE(raymarch_oblique_rays_match_exact_intersection)
{
    std::mt19937 rng(20240611u);
    const std::vector<SolidBox> boxes = scatteredBoxes(rng, 160);
    ChunkManager manager(std::make_unique<voxelmarch::test::BoxGenerator>(boxes), mirroredConfig());
    manager.tickBudgeted(glm::vec3(16.0f), 100);
    const Raymarcher marcher(manager.atlas());
    const GridInfo& grid = manager.gridInfo();
    REQUIRE(grid.origin == glm::ivec3(-1));
    REQUIRE(grid.size == glm::ivec3(3));

    constexpr float kMaxDistance = 1000.0f;
    std::vector<std::pair<glm::vec3, glm::vec3>> rays;

    // Starting inside the grid.
    std::uniform_real_distribution<float> inside(-32.0f, 64.0f);
    for (int i = 0; i < 200; ++i)
    {
        rays.emplace_back(glm::vec3(inside(rng), inside(rng), inside(rng)), randomDirection(rng));
    }

    // Starting outside and aimed at a point in the grid.
    for (int i = 0; i < 100; ++i)
    {
        const glm::vec3 origin = glm::vec3(16.0f) + randomDirection(rng) * 120.0f;
        const glm::vec3 target(inside(rng), inside(rng), inside(rng));
        rays.emplace_back(origin, glm::normalize(target - origin));
    }

    // Integer origins on voxel, sub-region and chunk planes, some with a zero direction component.
    std::uniform_int_distribution<int> lattice(-36, 63);
    for (int i = 0; i < 200; ++i)
    {
        const glm::vec3 origin(glm::ivec3(lattice(rng), lattice(rng), lattice(rng)));
        glm::vec3 direction = randomDirection(rng);
        const int flatAxis = i % 4;
        if (flatAxis < 3)
        {
            direction[flatAxis] = 0.0f;
            if (glm::length(direction) < 1e-3f)
            {
                direction[(flatAxis + 1) % 3] = 1.0f;
            }
            direction = glm::normalize(direction);
        }
        rays.emplace_back(origin, direction);
    }

    int hits = 0;
    int presenceMismatches = 0;
    int distanceMismatches = 0;
    for (const auto& [origin, direction] : rays)
    {
        const RayHit hit = marcher.traceRay(origin, direction, grid, kMaxDistance);
        const std::optional<double> expected = nearestEntry(origin, direction, boxes);
        if (hit.hit != expected.has_value())
        {
            ++presenceMismatches;
            continue;
        }
        if (!hit.hit)
        {
            continue;
        }
        ++hits;
        if (std::abs(static_cast<double>(hit.distance) - *expected) > 0.01)
        {
            ++distanceMismatches;
        }
    }

    CHECK(presenceMismatches == 0);
    CHECK(distanceMismatches == 0);
    CHECK(hits > 0);
    CHECK(hits < static_cast<int>(rays.size()));
}

TEST_CASE(raymarch_ao_directions_stay_in_hemisphere)
{
    const std::array<glm::ivec3, 6> normals{glm::ivec3(1, 0, 0), glm::ivec3(-1, 0, 0), glm::ivec3(0, 1, 0),
                                            glm::ivec3(0, -1, 0), glm::ivec3(0, 0, 1), glm::ivec3(0, 0, -1)};
    for (const glm::ivec3& normal : normals)
    {
        const std::array<glm::vec3, kAoRayCount> directions = aoDirections(normal);
        CHECK(directions == aoDirections(normal));
        for (std::size_t i = 0; i < directions.size(); ++i)
        {
            CHECK_NEAR(glm::length(directions[i]), 1.0f, 1e-5f);
            CHECK(glm::dot(directions[i], glm::vec3(normal)) > 0.5f);
            for (std::size_t j = i + 1; j < directions.size(); ++j)
            {
                CHECK(glm::distance(directions[i], directions[j]) > 0.1f);
            }
        }
    }
}
