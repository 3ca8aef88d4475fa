#pragma once
// raymarch_shaders.h
// GLSL sources for the ray-march compute pass and the fullscreen blit.
// The traversal mirrors Raymarcher (raymarcher.cpp) step for step; keep the two in sync.

namespace gl
{

inline constexpr const char* kRaymarchComputeShader = R"(#version 430 core
layout(local_size_x = 8, local_size_y = 8) in;

layout(rgba8, binding = 0) uniform writeonly image2D uOutput;

layout(std140, binding = 0) uniform Camera
{
    vec3 position;
    float pad0;
    vec3 forward;
    float pad1;
    vec3 right;
    float pad2;
    vec3 up;
    float pad3;
    float fovY;
    uint width;
    uint height;
    uint pad4;
    ivec3 gridOrigin;
    int pad5;
    ivec3 gridSize;
    int pad6;
    uvec3 atlasSlots;
    float maxRayDistance;
    vec3 sunDirection;
    float shadowBias;
    vec3 skyColor;
    float aoStrength;
} uCamera;

layout(binding = 0) uniform usampler3D uAtlas;

layout(std430, binding = 1) readonly buffer Occupancy
{
    uvec2 masks[];
};

layout(std430, binding = 2) readonly buffer PaletteBuffer
{
    vec4 palette[];
};

struct ChunkSlot
{
    ivec3 worldPos;
    uint flags;
};

layout(std430, binding = 3) readonly buffer SlotTable
{
    ChunkSlot slots[];
};

const float INF = 1e30;
const int CHUNK_SIZE = 32;
const int REGION_SIZE = 8;
const int REGIONS_PER_AXIS = 4;
const float AO_RAY_LENGTH = 4.0;
const float AMBIENT = 0.3;

struct Walk
{
    ivec3 cell;
    ivec3 stepDir;
    vec3 tMax;
    vec3 tDelta;
    float t;
    int axis;
};

struct Hit
{
    bool hit;
    ivec3 voxel;
    ivec3 normal;
    float dist;
    uint material;
};

Hit noHit()
{
    return Hit(false, ivec3(0), ivec3(0), 0.0, 0u);
}

vec3 safeInverse(vec3 d)
{
    return vec3(d.x != 0.0 ? 1.0 / d.x : INF,
                d.y != 0.0 ? 1.0 / d.y : INF,
                d.z != 0.0 ? 1.0 / d.z : INF);
}

int dominantAxis(vec3 v)
{
    vec3 a = abs(v);
    if (a.x >= a.y && a.x >= a.z)
    {
        return 0;
    }
    return a.y >= a.z ? 1 : 2;
}

int largestAxis(vec3 v)
{
    if (v.x >= v.y && v.x >= v.z)
    {
        return 0;
    }
    return v.y >= v.z ? 1 : 2;
}

Walk beginWalk(vec3 o, vec3 d, vec3 inv, float tEntry, float cellSize, int entryAxis, ivec3 minCell, ivec3 maxCell)
{
    Walk w;
    vec3 p = o + d * tEntry;
    w.cell = clamp(ivec3(floor(p / cellSize)), minCell, maxCell);
    w.t = tEntry;
    w.axis = entryAxis;
    w.stepDir = ivec3(sign(d));
    for (int i = 0; i < 3; ++i)
    {
        if (w.stepDir[i] == 0)
        {
            w.tMax[i] = INF;
            w.tDelta[i] = INF;
            continue;
        }
        float boundary = float(w.cell[i] + (w.stepDir[i] > 0 ? 1 : 0)) * cellSize;
        w.tMax[i] = (boundary - o[i]) * inv[i];
        w.tDelta[i] = cellSize * abs(inv[i]);
    }
    return w;
}

float nextBoundary(Walk w)
{
    return min(w.tMax.x, min(w.tMax.y, w.tMax.z));
}

void advance(inout Walk w)
{
    if (w.tMax.x <= w.tMax.y && w.tMax.x <= w.tMax.z)
    {
        w.axis = 0;
    }
    else if (w.tMax.y <= w.tMax.z)
    {
        w.axis = 1;
    }
    else
    {
        w.axis = 2;
    }
    w.t = w.tMax[w.axis];
    w.cell[w.axis] += w.stepDir[w.axis];
    w.tMax[w.axis] += w.tDelta[w.axis];
}

bool insideCells(ivec3 c, ivec3 lo, ivec3 hi)
{
    return all(greaterThanEqual(c, lo)) && all(lessThanEqual(c, hi));
}

// Euclidean modulo; GLSL leaves % undefined for negative operands.
int wrapIndex(int v, int m)
{
    return v >= 0 ? v % m : (m - 1) - ((-v - 1) % m);
}

uint worldToSlot(ivec3 c)
{
    ivec3 s = ivec3(uCamera.atlasSlots);
    int x = wrapIndex(c.x, s.x);
    int y = wrapIndex(c.y, s.y);
    int z = wrapIndex(c.z, s.z);
    return uint(z * s.x * s.y + y * s.x + x);
}

ivec3 slotToAtlasOrigin(uint slot)
{
    uvec3 s = uCamera.atlasSlots;
    return ivec3(uvec3(slot % s.x, (slot / s.x) % s.y, slot / (s.x * s.y)) * uint(CHUNK_SIZE));
}

bool regionOccupied(uvec2 mask, int bit)
{
    uint word = bit < 32 ? mask.x : mask.y;
    return ((word >> uint(bit & 31)) & 1u) != 0u;
}

Hit traceChunk(vec3 o, vec3 d, vec3 inv, ivec3 chunkCoord, uint slot, float tEnter, float tExit, int entryAxis)
{
    uvec2 mask = masks[slot];
    ivec3 voxelBase = chunkCoord * CHUNK_SIZE;
    ivec3 atlasOrigin = slotToAtlasOrigin(slot);
    ivec3 regionBase = chunkCoord * REGIONS_PER_AXIS;
    ivec3 regionMax = regionBase + ivec3(REGIONS_PER_AXIS - 1);

    Walk regions = beginWalk(o, d, inv, tEnter, float(REGION_SIZE), entryAxis, regionBase, regionMax);
    while (insideCells(regions.cell, regionBase, regionMax))
    {
        float regionExit = min(nextBoundary(regions), tExit);
        ivec3 region = regions.cell - regionBase;
        int bit = region.z * REGIONS_PER_AXIS * REGIONS_PER_AXIS + region.y * REGIONS_PER_AXIS + region.x;
        if (regionOccupied(mask, bit))
        {
            ivec3 voxelMin = regions.cell * REGION_SIZE;
            ivec3 voxelMax = voxelMin + ivec3(REGION_SIZE - 1);
            Walk cells = beginWalk(o, d, inv, regions.t, 1.0, regions.axis, voxelMin, voxelMax);
            while (insideCells(cells.cell, voxelMin, voxelMax))
            {
                ivec3 local = cells.cell - voxelBase;
                uint material = texelFetch(uAtlas, atlasOrigin + local, 0).r;
                if (material != 0u)
                {
                    Hit hit = noHit();
                    hit.hit = true;
                    hit.voxel = cells.cell;
                    hit.normal[cells.axis] = -cells.stepDir[cells.axis];
                    hit.dist = cells.t;
                    hit.material = material;
                    return hit;
                }
                if (nextBoundary(cells) >= regionExit)
                {
                    break;
                }
                advance(cells);
            }
        }
        if (regionExit >= tExit)
        {
            break;
        }
        advance(regions);
    }
    return noHit();
}

Hit traceRay(vec3 o, vec3 d, float maxDistance)
{
    ivec3 gridSize = uCamera.gridSize;
    if (gridSize.x <= 0 || gridSize.y <= 0 || gridSize.z <= 0)
    {
        return noHit();
    }

    vec3 inv = safeInverse(d);
    vec3 gridMin = vec3(uCamera.gridOrigin * CHUNK_SIZE);
    vec3 gridMax = vec3((uCamera.gridOrigin + gridSize) * CHUNK_SIZE);
    vec3 t1 = (gridMin - o) * inv;
    vec3 t2 = (gridMax - o) * inv;
    vec3 tNear = min(t1, t2);
    vec3 tFar = max(t1, t2);
    float tEnterBox = max(tNear.x, max(tNear.y, tNear.z));
    float tExitBox = min(tFar.x, min(tFar.y, tFar.z));

    float tStart = max(tEnterBox, 0.0);
    float tEnd = min(tExitBox, maxDistance);
    if (tStart >= tEnd)
    {
        return noHit();
    }

    int entryAxis = tEnterBox > 0.0 ? largestAxis(tNear) : dominantAxis(d);
    ivec3 minChunk = uCamera.gridOrigin;
    ivec3 maxChunk = uCamera.gridOrigin + gridSize - ivec3(1);
    Walk chunks = beginWalk(o, d, inv, tStart, float(CHUNK_SIZE), entryAxis, minChunk, maxChunk);

    while (insideCells(chunks.cell, minChunk, maxChunk) && chunks.t < tEnd)
    {
        float chunkExit = min(nextBoundary(chunks), tEnd);
        uint slot = worldToSlot(chunks.cell);
        ChunkSlot entry = slots[slot];
        uvec2 mask = masks[slot];
        if ((entry.flags & 1u) != 0u && entry.worldPos == chunks.cell && (mask.x | mask.y) != 0u)
        {
            Hit hit = traceChunk(o, d, inv, chunks.cell, slot, chunks.t, chunkExit, chunks.axis);
            if (hit.hit)
            {
                return hit;
            }
        }
        if (chunkExit >= tEnd)
        {
            break;
        }
        advance(chunks);
    }
    return noHit();
}

vec3 aoDirection(vec3 n, int index)
{
    int axis = dominantAxis(n);
    vec3 tangent = vec3(0.0);
    vec3 bitangent = vec3(0.0);
    tangent[(axis + 1) % 3] = 1.0;
    bitangent[(axis + 2) % 3] = 1.0;
    if (index == 0) return normalize(n + tangent);
    if (index == 1) return normalize(n - tangent);
    if (index == 2) return normalize(n + bitangent);
    if (index == 3) return normalize(n - bitangent);
    if (index == 4) return normalize(n + 0.5 * (tangent + bitangent));
    return normalize(n - 0.5 * (tangent + bitangent));
}

void main()
{
    uvec2 pixel = gl_GlobalInvocationID.xy;
    if (pixel.x >= uCamera.width || pixel.y >= uCamera.height)
    {
        return;
    }

    float width = float(max(uCamera.width, 1u));
    float height = float(max(uCamera.height, 1u));
    float u = ((float(pixel.x) + 0.5) / width) * 2.0 - 1.0;
    float v = 1.0 - ((float(pixel.y) + 0.5) / height) * 2.0;
    float halfHeight = tan(uCamera.fovY * 0.5);
    float aspect = width / height;
    vec3 dir = normalize(uCamera.forward + uCamera.right * (u * halfHeight * aspect) + uCamera.up * (v * halfHeight));

    vec3 color = uCamera.skyColor;
    Hit hit = traceRay(uCamera.position, dir, uCamera.maxRayDistance);
    if (hit.hit)
    {
        vec3 normal = vec3(hit.normal);
        vec3 hitPoint = uCamera.position + dir * hit.dist;
        vec3 biased = hitPoint + normal * uCamera.shadowBias;
        vec3 sun = normalize(uCamera.sunDirection);

        bool inShadow = traceRay(biased, sun, uCamera.maxRayDistance).hit;
        float diffuse = inShadow ? 0.0 : max(dot(normal, sun), 0.0);

        int blocked = 0;
        for (int i = 0; i < 6; ++i)
        {
            if (traceRay(biased, aoDirection(normal, i), AO_RAY_LENGTH).hit)
            {
                ++blocked;
            }
        }
        float ao = 1.0 - uCamera.aoStrength * (float(blocked) / 6.0);
        color = palette[hit.material].rgb * (AMBIENT + (1.0 - AMBIENT) * diffuse) * ao;
    }

    // Row 0 of the CPU image is the top; flip into GL's bottom-up texture space.
    ivec2 texel = ivec2(int(pixel.x), int(uCamera.height) - 1 - int(pixel.y));
    imageStore(uOutput, texel, vec4(clamp(color, 0.0, 1.0), 1.0));
}
)";

inline constexpr const char* kBlitVertexShader = R"(#version 430 core
out vec2 vUv;

void main()
{
    vec2 corner = vec2(float((gl_VertexID << 1) & 2), float(gl_VertexID & 2));
    vUv = corner;
    gl_Position = vec4(corner * 2.0 - 1.0, 0.0, 1.0);
}
)";

inline constexpr const char* kBlitFragmentShader = R"(#version 430 core
in vec2 vUv;
out vec4 FragColor;

layout(binding = 0) uniform sampler2D uFrame;

void main()
{
    FragColor = texture(uFrame, vUv);
}
)";

} // namespace gl
