#include "raymarcher.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace
{
constexpr float kInfinity = 1e30f;

glm::vec3 safeInverse(const glm::vec3& direction) noexcept
{
    glm::vec3 inv;
    for (int axis = 0; axis < 3; ++axis)
    {
        inv[axis] = direction[axis] != 0.0f ? 1.0f / direction[axis] : kInfinity;
    }
    return inv;
}

int dominantAxis(const glm::vec3& v) noexcept
{
    const glm::vec3 a = glm::abs(v);
    if (a.x >= a.y && a.x >= a.z)
    {
        return 0;
    }
    return a.y >= a.z ? 1 : 2;
}

int largestAxis(const glm::vec3& v) noexcept
{
    if (v.x >= v.y && v.x >= v.z)
    {
        return 0;
    }
    return v.y >= v.z ? 1 : 2;
}

GridWalk beginWalk(const glm::vec3& origin,
                   const glm::vec3& direction,
                   const glm::vec3& invDirection,
                   float tEntry,
                   float cellSize,
                   int entryAxis,
                   const glm::ivec3& minCell,
                   const glm::ivec3& maxCell) noexcept
{
    GridWalk walk;
    const glm::vec3 point = origin + direction * tEntry;
    walk.cell = glm::clamp(glm::ivec3(glm::floor(point / cellSize)), minCell, maxCell);
    walk.t = tEntry;
    walk.axis = entryAxis;

    for (int axis = 0; axis < 3; ++axis)
    {
        if (direction[axis] > 0.0f)
        {
            walk.step[axis] = 1;
        }
        else if (direction[axis] < 0.0f)
        {
            walk.step[axis] = -1;
        }

        if (walk.step[axis] == 0)
        {
            walk.tMax[axis] = kInfinity;
            walk.tDelta[axis] = kInfinity;
            continue;
        }

        const float boundary = static_cast<float>(walk.cell[axis] + (walk.step[axis] > 0 ? 1 : 0)) * cellSize;
        walk.tMax[axis] = (boundary - origin[axis]) * invDirection[axis];
        walk.tDelta[axis] = cellSize * std::abs(invDirection[axis]);
    }
    return walk;
}

bool insideCells(const glm::ivec3& cell, const glm::ivec3& minCell, const glm::ivec3& maxCell) noexcept
{
    return glm::all(glm::greaterThanEqual(cell, minCell)) && glm::all(glm::lessThanEqual(cell, maxCell));
}

std::uint8_t toByte(float value) noexcept
{
    return static_cast<std::uint8_t>(std::lround(std::clamp(value, 0.0f, 1.0f) * 255.0f));
}
} // namespace

Palette buildDefaultPalette()
{
    Palette palette;
    palette.fill(glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    palette[toIndex(MaterialId::Grass)] = glm::vec4(0.3f, 0.7f, 0.2f, 1.0f);
    palette[toIndex(MaterialId::Dirt)] = glm::vec4(0.5f, 0.3f, 0.1f, 1.0f);
    palette[toIndex(MaterialId::Stone)] = glm::vec4(0.5f, 0.5f, 0.5f, 1.0f);
    return palette;
}

float GridWalk::nextBoundary() const noexcept
{
    return std::min(tMax.x, std::min(tMax.y, tMax.z));
}

void GridWalk::advance() noexcept
{
    if (tMax.x <= tMax.y && tMax.x <= tMax.z)
    {
        axis = 0;
    }
    else if (tMax.y <= tMax.z)
    {
        axis = 1;
    }
    else
    {
        axis = 2;
    }

    t = tMax[axis];
    cell[axis] += step[axis];
    tMax[axis] += tDelta[axis];
}

std::array<glm::vec3, kAoRayCount> aoDirections(const glm::ivec3& normal)
{
    const glm::vec3 n(normal);
    const int axis = dominantAxis(n);
    glm::vec3 tangent(0.0f);
    glm::vec3 bitangent(0.0f);
    tangent[(axis + 1) % 3] = 1.0f;
    bitangent[(axis + 2) % 3] = 1.0f;

    return {
        glm::normalize(n + tangent),
        glm::normalize(n - tangent),
        glm::normalize(n + bitangent),
        glm::normalize(n - bitangent),
        glm::normalize(n + 0.5f * (tangent + bitangent)),
        glm::normalize(n - 0.5f * (tangent + bitangent)),
    };
}

Raymarcher::Raymarcher(const ChunkAtlas& atlas)
    : atlas_(atlas)
{
    if (!atlas_.mirrorsVoxels())
    {
        throw std::invalid_argument("Raymarcher requires an atlas with a CPU voxel mirror");
    }
}

RayHit Raymarcher::traceRay(const glm::vec3& origin,
                            const glm::vec3& direction,
                            const GridInfo& grid,
                            float maxDistance) const
{
    if (grid.size.x <= 0 || grid.size.y <= 0 || grid.size.z <= 0)
    {
        return {};
    }

    const glm::vec3 invDirection = safeInverse(direction);
    const glm::vec3 gridMin = glm::vec3(grid.origin * kChunkSize);
    const glm::vec3 gridMax = glm::vec3((grid.origin + grid.size) * kChunkSize);

    const glm::vec3 t1 = (gridMin - origin) * invDirection;
    const glm::vec3 t2 = (gridMax - origin) * invDirection;
    const glm::vec3 tNear = glm::min(t1, t2);
    const glm::vec3 tFar = glm::max(t1, t2);
    const float tEnterBox = std::max(tNear.x, std::max(tNear.y, tNear.z));
    const float tExitBox = std::min(tFar.x, std::min(tFar.y, tFar.z));

    const float tStart = std::max(tEnterBox, 0.0f);
    const float tEnd = std::min(tExitBox, maxDistance);
    if (tStart >= tEnd)
    {
        return {};
    }

    // Rays starting inside the grid take the dominant direction axis as their entry face.
    const int entryAxis = tEnterBox > 0.0f ? largestAxis(tNear) : dominantAxis(direction);

    const glm::ivec3 minChunk = grid.origin;
    const glm::ivec3 maxChunk = grid.origin + grid.size - glm::ivec3(1);
    GridWalk chunks = beginWalk(origin, direction, invDirection, tStart, static_cast<float>(kChunkSize), entryAxis, minChunk, maxChunk);

    while (insideCells(chunks.cell, minChunk, maxChunk) && chunks.t < tEnd)
    {
        const float chunkExit = std::min(chunks.nextBoundary(), tEnd);
        const std::uint32_t slot = worldToSlot(chunks.cell, grid.atlasSlots);
        if (atlas_.isOccupied(slot) && atlas_.slots()[slot].worldPos == chunks.cell && atlas_.occupancy()[slot] != 0)
        {
            const RayHit hit = traceChunk(origin, direction, invDirection, chunks.cell, slot, chunks.t, chunkExit, chunks.axis);
            if (hit.hit)
            {
                return hit;
            }
        }

        if (chunkExit >= tEnd)
        {
            break;
        }
        chunks.advance();
    }

    return {};
}

RayHit Raymarcher::traceChunk(const glm::vec3& origin,
                              const glm::vec3& direction,
                              const glm::vec3& invDirection,
                              const glm::ivec3& chunkCoord,
                              std::uint32_t slot,
                              float tEnter,
                              float tExit,
                              int entryAxis) const
{
    const VoxelChunk* voxels = atlas_.mirroredVoxels(slot);
    if (voxels == nullptr)
    {
        return {};
    }

    const std::uint64_t mask = atlas_.occupancy()[slot];
    const glm::ivec3 voxelBase = chunkCoord * kChunkSize;
    const glm::ivec3 regionBase = chunkCoord * kSubRegionsPerAxis;
    const glm::ivec3 regionMax = regionBase + glm::ivec3(kSubRegionsPerAxis - 1);

    GridWalk regions = beginWalk(origin, direction, invDirection, tEnter, static_cast<float>(kSubRegionSize), entryAxis, regionBase, regionMax);
    while (insideCells(regions.cell, regionBase, regionMax))
    {
        const float regionExit = std::min(regions.nextBoundary(), tExit);
        const glm::ivec3 region = regions.cell - regionBase;
        if ((mask >> subRegionBit(region.x, region.y, region.z)) & 1u)
        {
            const glm::ivec3 voxelMin = regions.cell * kSubRegionSize;
            const glm::ivec3 voxelMax = voxelMin + glm::ivec3(kSubRegionSize - 1);
            GridWalk cells = beginWalk(origin, direction, invDirection, regions.t, 1.0f, regions.axis, voxelMin, voxelMax);
            while (insideCells(cells.cell, voxelMin, voxelMax))
            {
                const glm::ivec3 local = cells.cell - voxelBase;
                const std::uint32_t voxel = voxels->at(local.x, local.y, local.z);
                if (isSolidVoxel(voxel))
                {
                    RayHit hit;
                    hit.hit = true;
                    hit.voxel = cells.cell;
                    hit.normal[cells.axis] = -cells.step[cells.axis];
                    hit.distance = cells.t;
                    hit.material = materialId(voxel);
                    return hit;
                }

                if (cells.nextBoundary() >= regionExit)
                {
                    break;
                }
                cells.advance();
            }
        }

        if (regionExit >= tExit)
        {
            break;
        }
        regions.advance();
    }

    return {};
}

bool Raymarcher::occluded(const glm::vec3& origin, const glm::vec3& direction, const GridInfo& grid, float maxDistance) const
{
    return traceRay(origin, direction, grid, maxDistance).hit;
}

glm::vec3 Raymarcher::primaryRayDirection(const CameraUniform& camera, std::uint32_t px, std::uint32_t py) const
{
    const float width = static_cast<float>(std::max(camera.width, 1u));
    const float height = static_cast<float>(std::max(camera.height, 1u));
    const float u = ((static_cast<float>(px) + 0.5f) / width) * 2.0f - 1.0f;
    const float v = 1.0f - ((static_cast<float>(py) + 0.5f) / height) * 2.0f;
    const float halfHeight = std::tan(camera.fovY * 0.5f);
    const float aspect = width / height;
    return glm::normalize(camera.forward + camera.right * (u * halfHeight * aspect) + camera.up * (v * halfHeight));
}

glm::vec3 Raymarcher::shadePixel(const CameraUniform& camera, const Palette& palette, std::uint32_t px, std::uint32_t py) const
{
    GridInfo grid;
    grid.origin = camera.gridOrigin;
    grid.size = camera.gridSize;
    grid.atlasSlots = camera.atlasSlots;
    grid.maxRayDistance = camera.maxRayDistance;

    const glm::vec3 direction = primaryRayDirection(camera, px, py);
    const RayHit hit = traceRay(camera.position, direction, grid, camera.maxRayDistance);
    if (!hit.hit)
    {
        return camera.skyColor;
    }

    const glm::vec3 normal(hit.normal);
    const glm::vec3 hitPoint = camera.position + direction * hit.distance;
    const glm::vec3 biasedOrigin = hitPoint + normal * camera.shadowBias;
    const glm::vec3 sun = glm::normalize(camera.sunDirection);

    const bool inShadow = occluded(biasedOrigin, sun, grid, camera.maxRayDistance);
    const float diffuse = inShadow ? 0.0f : std::max(glm::dot(normal, sun), 0.0f);

    int blocked = 0;
    for (const glm::vec3& aoDir : aoDirections(hit.normal))
    {
        blocked += occluded(biasedOrigin, aoDir, grid, kAoRayLength) ? 1 : 0;
    }
    const float ao = 1.0f - camera.aoStrength * (static_cast<float>(blocked) / static_cast<float>(kAoRayCount));

    const glm::vec3 base(palette[hit.material]);
    return base * (kAmbientLight + (1.0f - kAmbientLight) * diffuse) * ao;
}

std::vector<std::uint8_t> Raymarcher::renderImage(const CameraUniform& camera, const Palette& palette) const
{
    std::vector<std::uint8_t> pixels(static_cast<std::size_t>(camera.width) * camera.height * 4);
    for (std::uint32_t y = 0; y < camera.height; ++y)
    {
        for (std::uint32_t x = 0; x < camera.width; ++x)
        {
            const glm::vec3 color = shadePixel(camera, palette, x, y);
            const std::size_t offset = (static_cast<std::size_t>(y) * camera.width + x) * 4;
            pixels[offset + 0] = toByte(color.r);
            pixels[offset + 1] = toByte(color.g);
            pixels[offset + 2] = toByte(color.b);
            pixels[offset + 3] = 255;
        }
    }
    return pixels;
}
