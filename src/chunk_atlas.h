#pragma once
// chunk_atlas.h
// Fixed-size slot atlas holding the resident chunk working set. Slots are addressed
// purely from world chunk coordinates, so a chunk never moves while it stays loaded.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include <glm/glm.hpp>

#include "voxel.h"

inline constexpr std::uint32_t kSlotFlagOccupied = 1u;

// Matches the std430 ChunkSlot struct in the ray-march compute shader (opengl/raymarch_shaders.h).
struct ChunkSlotGpu
{
    glm::ivec3 worldPos{0};
    std::uint32_t flags{0};
};

static_assert(offsetof(ChunkSlotGpu, worldPos) == 0);
static_assert(offsetof(ChunkSlotGpu, flags) == 12);
static_assert(sizeof(ChunkSlotGpu) == 16);

// Per-axis Euclidean modulo, then z * sx * sy + y * sx + x.
// The compute shader implements the same arithmetic.
std::uint32_t worldToSlot(const glm::ivec3& chunkCoord, const glm::uvec3& atlasSlots) noexcept;

// Texel origin of a slot inside the atlas texture: x fastest, then y, then z.
glm::uvec3 slotToAtlasOrigin(std::uint32_t slot, const glm::uvec3& atlasSlots) noexcept;

// Device side of the atlas. The OpenGL implementation lives in src/opengl.
class AtlasBackend
{
public:
    virtual ~AtlasBackend() = default;

    virtual void uploadVoxels(std::uint32_t slot, const glm::uvec3& texelOrigin, std::span<const std::uint32_t> voxels) = 0;
    virtual void writeSlot(std::uint32_t slot, const ChunkSlotGpu& entry) = 0;
    virtual void writeOccupancy(std::uint32_t slot, std::uint64_t mask) = 0;
};

class ChunkAtlas
{
public:
    // mirrorVoxels keeps a CPU copy of every uploaded chunk for the reference ray marcher.
    explicit ChunkAtlas(const glm::uvec3& slotsPerAxis,
                        std::unique_ptr<AtlasBackend> backend = nullptr,
                        bool mirrorVoxels = false);

    ChunkAtlas(const ChunkAtlas&) = delete;
    ChunkAtlas& operator=(const ChunkAtlas&) = delete;

    void uploadChunk(std::uint32_t slot, const VoxelChunk& chunk, const glm::ivec3& worldCoord);

    // Marks the slot unoccupied; the traversal then treats it as "no chunk here".
    void clearSlot(std::uint32_t slot);

    [[nodiscard]] std::uint32_t slotFor(const glm::ivec3& chunkCoord) const noexcept
    {
        return worldToSlot(chunkCoord, slotsPerAxis_);
    }

    [[nodiscard]] const glm::uvec3& slotsPerAxis() const noexcept
    {
        return slotsPerAxis_;
    }

    [[nodiscard]] std::uint32_t slotCount() const noexcept
    {
        return static_cast<std::uint32_t>(slots_.size());
    }

    [[nodiscard]] std::uint32_t usedSlotCount() const noexcept
    {
        return usedSlots_;
    }

    [[nodiscard]] bool isOccupied(std::uint32_t slot) const noexcept;

    [[nodiscard]] const std::vector<ChunkSlotGpu>& slots() const noexcept
    {
        return slots_;
    }

    [[nodiscard]] const std::vector<std::uint64_t>& occupancy() const noexcept
    {
        return occupancy_;
    }

    // nullptr unless mirroring is enabled and the slot is occupied.
    [[nodiscard]] const VoxelChunk* mirroredVoxels(std::uint32_t slot) const noexcept;

    [[nodiscard]] bool mirrorsVoxels() const noexcept
    {
        return mirrorVoxels_;
    }

    [[nodiscard]] std::size_t residentBytes() const noexcept;

    [[nodiscard]] AtlasBackend* backend() const noexcept
    {
        return backend_.get();
    }

private:
    glm::uvec3 slotsPerAxis_{0u};
    std::unique_ptr<AtlasBackend> backend_;
    bool mirrorVoxels_{false};
    std::uint32_t usedSlots_{0};
    std::vector<ChunkSlotGpu> slots_;
    std::vector<std::uint64_t> occupancy_;
    std::vector<std::unique_ptr<VoxelChunk>> mirror_;
};
