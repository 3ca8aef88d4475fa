#include "chunk_atlas.h"

#include <sstream>
#include <stdexcept>

std::uint32_t worldToSlot(const glm::ivec3& chunkCoord, const glm::uvec3& atlasSlots) noexcept
{
    const glm::ivec3 slots(atlasSlots);
    const int x = wrapIndex(chunkCoord.x, slots.x);
    const int y = wrapIndex(chunkCoord.y, slots.y);
    const int z = wrapIndex(chunkCoord.z, slots.z);
    return static_cast<std::uint32_t>(z * slots.x * slots.y + y * slots.x + x);
}

glm::uvec3 slotToAtlasOrigin(std::uint32_t slot, const glm::uvec3& atlasSlots) noexcept
{
    const auto chunk = static_cast<std::uint32_t>(kChunkSize);
    return {
        (slot % atlasSlots.x) * chunk,
        ((slot / atlasSlots.x) % atlasSlots.y) * chunk,
        (slot / (atlasSlots.x * atlasSlots.y)) * chunk
    };
}

ChunkAtlas::ChunkAtlas(const glm::uvec3& slotsPerAxis, std::unique_ptr<AtlasBackend> backend, bool mirrorVoxels)
    : slotsPerAxis_(slotsPerAxis),
      backend_(std::move(backend)),
      mirrorVoxels_(mirrorVoxels)
{
    if (slotsPerAxis.x == 0 || slotsPerAxis.y == 0 || slotsPerAxis.z == 0)
    {
        std::ostringstream oss;
        oss << "ChunkAtlas dimensions must be non-zero, got (" << slotsPerAxis.x << ", " << slotsPerAxis.y << ", "
            << slotsPerAxis.z << ")";
        throw std::invalid_argument(oss.str());
    }

    const std::size_t total = static_cast<std::size_t>(slotsPerAxis.x) * slotsPerAxis.y * slotsPerAxis.z;
    slots_.assign(total, ChunkSlotGpu{});
    occupancy_.assign(total, 0);
    if (mirrorVoxels_)
    {
        mirror_.resize(total);
    }
}

void ChunkAtlas::uploadChunk(std::uint32_t slot, const VoxelChunk& chunk, const glm::ivec3& worldCoord)
{
    if (slot >= slots_.size())
    {
        throw std::out_of_range("ChunkAtlas slot " + std::to_string(slot) + " out of range");
    }

    if ((slots_[slot].flags & kSlotFlagOccupied) == 0)
    {
        ++usedSlots_;
    }

    slots_[slot] = ChunkSlotGpu{worldCoord, kSlotFlagOccupied};
    occupancy_[slot] = chunk.occupancyMask();

    if (mirrorVoxels_)
    {
        mirror_[slot] = std::make_unique<VoxelChunk>(chunk);
    }

    if (backend_)
    {
        backend_->uploadVoxels(slot, slotToAtlasOrigin(slot, slotsPerAxis_), chunk.data());
        backend_->writeOccupancy(slot, occupancy_[slot]);
        backend_->writeSlot(slot, slots_[slot]);
    }
}

void ChunkAtlas::clearSlot(std::uint32_t slot)
{
    if (slot >= slots_.size())
    {
        throw std::out_of_range("ChunkAtlas slot " + std::to_string(slot) + " out of range");
    }

    if ((slots_[slot].flags & kSlotFlagOccupied) != 0)
    {
        --usedSlots_;
    }

    slots_[slot].flags = 0;
    occupancy_[slot] = 0;
    if (mirrorVoxels_)
    {
        mirror_[slot].reset();
    }

    if (backend_)
    {
        backend_->writeOccupancy(slot, 0);
        backend_->writeSlot(slot, slots_[slot]);
    }
}

bool ChunkAtlas::isOccupied(std::uint32_t slot) const noexcept
{
    return slot < slots_.size() && (slots_[slot].flags & kSlotFlagOccupied) != 0;
}

const VoxelChunk* ChunkAtlas::mirroredVoxels(std::uint32_t slot) const noexcept
{
    if (!mirrorVoxels_ || !isOccupied(slot))
    {
        return nullptr;
    }
    return mirror_[slot].get();
}

std::size_t ChunkAtlas::residentBytes() const noexcept
{
    return static_cast<std::size_t>(usedSlots_) * static_cast<std::size_t>(kChunkVoxelCount) * sizeof(std::uint32_t);
}
