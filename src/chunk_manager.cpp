#include "chunk_manager.h"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "camera_animation.h"
#include "terrain/terrain_generator.h"

namespace
{
using ChunkCoordSet = std::unordered_set<glm::ivec3, ChunkCoordHasher>;
using VoxelEdits = std::unordered_map<std::size_t, std::uint32_t>;

int distanceSquared(const glm::ivec3& a, const glm::ivec3& b) noexcept
{
    const glm::ivec3 d = a - b;
    return d.x * d.x + d.y * d.y + d.z * d.z;
}

// Closest first; equal distances fall back to lexicographic (x, y, z).
bool loadsBefore(const glm::ivec3& a, const glm::ivec3& b, const glm::ivec3& center) noexcept
{
    const int da = distanceSquared(a, center);
    const int db = distanceSquared(b, center);
    if (da != db)
    {
        return da < db;
    }
    return std::tie(a.x, a.y, a.z) < std::tie(b.x, b.y, b.z);
}

const StreamingConfig& validated(const StreamingConfig& config)
{
    if (config.viewDistance < 0 || config.prefetchViewDistance < 0)
    {
        std::ostringstream oss;
        oss << "View distances must be non-negative, got view " << config.viewDistance << " and prefetch "
            << config.prefetchViewDistance;
        throw std::invalid_argument(oss.str());
    }

    const auto required = static_cast<unsigned>(2 * config.viewDistance + 1);
    const glm::uvec3& slots = config.atlasSlots;
    if (slots.x < required || slots.y < required || slots.z < required)
    {
        std::ostringstream oss;
        oss << "Atlas slots (" << slots.x << ", " << slots.y << ", " << slots.z << ") must be at least " << required
            << " per axis for view distance " << config.viewDistance;
        throw std::invalid_argument(oss.str());
    }
    return config;
}

struct LoadRequest
{
    glm::ivec3 coord{0};
    bool prefetch{false};
};
} // namespace

std::string_view toString(StreamingState state) noexcept
{
    switch (state)
    {
    case StreamingState::Idle:
        return "Idle";
    case StreamingState::Loading:
        return "Loading";
    case StreamingState::Stalled:
        return "Stalled";
    }
    return "Unknown";
}

struct ChunkManager::Impl
{
    Impl(std::unique_ptr<terrain::ChunkGenerator> generator,
         const StreamingConfig& config,
         std::unique_ptr<AtlasBackend> backend);

    TickStats tickBudgeted(const glm::vec3& cameraPos, int budget, const CameraAnimation* animation);
    std::vector<LoadRequest> collectLoadRequests(const glm::ivec3& cameraChunk, const CameraAnimation* animation) const;

    PreloadResult preload(const glm::vec3& position, int budget);

    // Returns the number of chunks evicted to make room.
    int loadChunk(const glm::ivec3& coord);
    bool unloadChunk(const glm::ivec3& coord);
    bool mutateVoxel(const glm::ivec3& worldVoxel, std::uint32_t voxel);

    VoxelChunk buildChunk(const glm::ivec3& coord) const;
    void residentize(const glm::ivec3& coord, std::uint32_t slot, const VoxelChunk& chunk);
    void updateGridInfo();

    bool isSolidAt(const glm::ivec3& worldVoxel) const noexcept;

    std::unique_ptr<terrain::ChunkGenerator> generator_;
    StreamingConfig config_;
    ChunkAtlas atlas_;

    std::unordered_map<glm::ivec3, LoadedChunk, ChunkCoordHasher> loaded_;
    std::vector<std::optional<glm::ivec3>> slotOwners_;
    std::vector<glm::ivec3> visible_;
    ChunkCoordSet visibleSet_;
    std::unordered_map<glm::ivec3, VoxelEdits, ChunkCoordHasher> edits_;

    GridInfo gridInfo_{};
    TickStats lastStats_{};
    bool hasTicked_{false};
    ChunkLoadedCallback onChunkLoaded_;
};

ChunkManager::Impl::Impl(std::unique_ptr<terrain::ChunkGenerator> generator,
                         const StreamingConfig& config,
                         std::unique_ptr<AtlasBackend> backend)
    : generator_(std::move(generator)),
      config_(validated(config)),
      atlas_(config.atlasSlots, std::move(backend), config.mirrorVoxels)
{
    if (!generator_)
    {
        throw std::invalid_argument("ChunkManager requires a chunk generator");
    }

    slotOwners_.resize(atlas_.slotCount());
    gridInfo_.atlasSlots = config_.atlasSlots;
    gridInfo_.maxRayDistance = config_.maxRayDistance;

    std::cout << "[ChunkManager] View distance " << config_.viewDistance << ", atlas " << config_.atlasSlots.x << "x"
              << config_.atlasSlots.y << "x" << config_.atlasSlots.z << " (" << atlas_.slotCount() << " slots)"
              << std::endl;
}

std::vector<LoadRequest> ChunkManager::Impl::collectLoadRequests(const glm::ivec3& cameraChunk,
                                                                 const CameraAnimation* animation) const
{
    std::vector<LoadRequest> requests;
    for (const glm::ivec3& coord : visible_)
    {
        if (loaded_.find(coord) == loaded_.end())
        {
            requests.push_back({coord, false});
        }
    }

    std::sort(requests.begin(), requests.end(), [&cameraChunk](const LoadRequest& a, const LoadRequest& b) {
        return loadsBefore(a.coord, b.coord, cameraChunk);
    });

    if (animation == nullptr || animation->finished())
    {
        return requests;
    }

    // Slots held or about to be held by the current view are off limits to prefetch.
    // Among prefetch coordinates sharing a slot, the earliest sample keeps it.
    std::unordered_set<std::uint32_t> claimedSlots;
    claimedSlots.reserve(visible_.size());
    for (const glm::ivec3& coord : visible_)
    {
        claimedSlots.insert(atlas_.slotFor(coord));
    }

    ChunkCoordSet queued;
    for (const float t : kPrefetchSampleTimes)
    {
        const CameraPose pose = animation->sample(t);
        for (const glm::ivec3& coord : ChunkManager::computeVisibleSet(pose.position, config_.prefetchViewDistance))
        {
            if (visibleSet_.count(coord) != 0 || !queued.insert(coord).second)
            {
                continue;
            }
            if (!claimedSlots.insert(atlas_.slotFor(coord)).second || loaded_.count(coord) != 0)
            {
                continue;
            }
            requests.push_back({coord, true});
        }
    }

    return requests;
}

TickStats ChunkManager::Impl::tickBudgeted(const glm::vec3& cameraPos, int budget, const CameraAnimation* animation)
{
    visible_ = ChunkManager::computeVisibleSet(cameraPos, config_.viewDistance);
    visibleSet_ = ChunkCoordSet(visible_.begin(), visible_.end());

    const glm::ivec3 cameraChunk = worldToChunkCoord(cameraPos);
    const std::vector<LoadRequest> requests = collectLoadRequests(cameraChunk, animation);

    TickStats stats{};
    const std::size_t allowed = budget > 0 ? static_cast<std::size_t>(budget) : 0;
    const std::size_t processed = std::min(allowed, requests.size());
    for (std::size_t i = 0; i < processed; ++i)
    {
        stats.unloadedThisTick += loadChunk(requests[i].coord);
        ++stats.loadedThisTick;
        stats.prefetchedThisTick += requests[i].prefetch ? 1 : 0;
    }

    stats.pendingCount = static_cast<int>(requests.size() - processed);
    stats.totalLoaded = static_cast<int>(loaded_.size());
    stats.totalVisible = static_cast<int>(visible_.size());

    int visibleResident = 0;
    for (const glm::ivec3& coord : visible_)
    {
        visibleResident += loaded_.count(coord) != 0 ? 1 : 0;
    }
    // Visible chunks still pending are not loaded, so subtracting the whole visible set would go negative.
    stats.cachedCount = stats.totalLoaded - visibleResident;

    if (stats.pendingCount == 0)
    {
        stats.state = StreamingState::Idle;
    }
    else if (stats.loadedThisTick > 0)
    {
        stats.state = StreamingState::Loading;
    }
    else
    {
        stats.state = StreamingState::Stalled;
    }

    if (!hasTicked_ || stats.state != lastStats_.state)
    {
        std::cout << "[ChunkManager] Streaming " << toString(stats.state) << " (pending " << stats.pendingCount
                  << ", loaded " << stats.totalLoaded << ", cached " << stats.cachedCount << ")" << std::endl;
    }
    hasTicked_ = true;
    lastStats_ = stats;

    updateGridInfo();
    return stats;
}

PreloadResult ChunkManager::Impl::preload(const glm::vec3& position, int budget)
{
    std::vector<glm::ivec3> missing;
    for (const glm::ivec3& coord : ChunkManager::computeVisibleSet(position, config_.viewDistance))
    {
        if (loaded_.count(coord) != 0)
        {
            continue;
        }
        const std::optional<glm::ivec3>& occupant = slotOwners_[atlas_.slotFor(coord)];
        if (occupant && visibleSet_.count(*occupant) != 0)
        {
            continue;
        }
        missing.push_back(coord);
    }

    const glm::ivec3 center = worldToChunkCoord(position);
    std::sort(missing.begin(), missing.end(), [&center](const glm::ivec3& a, const glm::ivec3& b) {
        return loadsBefore(a, b, center);
    });

    PreloadResult result;
    const std::size_t allowed = budget > 0 ? static_cast<std::size_t>(budget) : 0;
    const std::size_t processed = std::min(allowed, missing.size());
    for (std::size_t i = 0; i < processed; ++i)
    {
        loadChunk(missing[i]);
        ++result.loaded;
    }
    result.pending = static_cast<int>(missing.size() - processed);
    return result;
}

void ChunkManager::Impl::updateGridInfo()
{
    gridInfo_.atlasSlots = config_.atlasSlots;
    if (visible_.empty())
    {
        gridInfo_.origin = glm::ivec3(0);
        gridInfo_.size = glm::ivec3(0);
    }
    else
    {
        glm::ivec3 minCoord = visible_.front();
        glm::ivec3 maxCoord = visible_.front();
        for (const glm::ivec3& coord : visible_)
        {
            minCoord = glm::min(minCoord, coord);
            maxCoord = glm::max(maxCoord, coord);
        }
        gridInfo_.origin = minCoord;
        gridInfo_.size = maxCoord - minCoord + glm::ivec3(1);
    }

    if (config_.maxRayDistance > 0.0f)
    {
        gridInfo_.maxRayDistance = config_.maxRayDistance;
    }
    else
    {
        gridInfo_.maxRayDistance = glm::length(glm::vec3(gridInfo_.size)) * static_cast<float>(kChunkSize);
    }
}

VoxelChunk ChunkManager::Impl::buildChunk(const glm::ivec3& coord) const
{
    VoxelChunk chunk = generator_->generate(coord);
    const auto editsIt = edits_.find(coord);
    if (editsIt != edits_.end())
    {
        for (const auto& [index, voxel] : editsIt->second)
        {
            chunk.voxels[index] = voxel;
        }
    }
    return chunk;
}

void ChunkManager::Impl::residentize(const glm::ivec3& coord, std::uint32_t slot, const VoxelChunk& chunk)
{
    LoadedChunk entry{};
    entry.slot = slot;
    if (chunk.isEmpty())
    {
        if (atlas_.isOccupied(slot))
        {
            atlas_.clearSlot(slot);
        }
    }
    else
    {
        entry.collision = CollisionMap::fromVoxels(chunk.data());
        atlas_.uploadChunk(slot, chunk, coord);
    }

    loaded_[coord] = std::move(entry);
    slotOwners_[slot] = coord;

    if (onChunkLoaded_)
    {
        onChunkLoaded_(coord, chunk);
    }
}

int ChunkManager::Impl::loadChunk(const glm::ivec3& coord)
{
    if (loaded_.count(coord) != 0)
    {
        return 0;
    }

    const std::uint32_t slot = atlas_.slotFor(coord);
    int evicted = 0;
    if (const std::optional<glm::ivec3> occupant = slotOwners_[slot]; occupant && *occupant != coord)
    {
        evicted = unloadChunk(*occupant) ? 1 : 0;
    }

    residentize(coord, slot, buildChunk(coord));
    return evicted;
}

bool ChunkManager::Impl::unloadChunk(const glm::ivec3& coord)
{
    const auto it = loaded_.find(coord);
    if (it == loaded_.end())
    {
        return false;
    }

    const std::uint32_t slot = it->second.slot;
    if (it->second.collision)
    {
        atlas_.clearSlot(slot);
    }
    slotOwners_[slot].reset();
    loaded_.erase(it);
    return true;
}

bool ChunkManager::Impl::mutateVoxel(const glm::ivec3& worldVoxel, std::uint32_t voxel)
{
    const glm::ivec3 coord = voxelToChunkCoord(worldVoxel);
    const glm::ivec3 local = voxelToLocal(worldVoxel);
    edits_[coord][voxelIndex(local.x, local.y, local.z)] = voxel;

    const auto it = loaded_.find(coord);
    if (it == loaded_.end())
    {
        return false;
    }

    residentize(coord, it->second.slot, buildChunk(coord));
    return true;
}

bool ChunkManager::Impl::isSolidAt(const glm::ivec3& worldVoxel) const noexcept
{
    const auto it = loaded_.find(voxelToChunkCoord(worldVoxel));
    if (it == loaded_.end() || !it->second.collision)
    {
        return false;
    }
    return it->second.collision->isSolid(voxelToLocal(worldVoxel));
}

ChunkManager::ChunkManager(std::unique_ptr<terrain::ChunkGenerator> generator,
                           const StreamingConfig& config,
                           std::unique_ptr<AtlasBackend> backend)
    : impl_(std::make_unique<Impl>(std::move(generator), config, std::move(backend)))
{
}

ChunkManager::~ChunkManager() = default;

std::vector<glm::ivec3> ChunkManager::computeVisibleSet(const glm::vec3& cameraPos, int viewDistance)
{
    const int radius = std::max(viewDistance, 0);
    const glm::ivec3 center = worldToChunkCoord(cameraPos);
    const int edge = 2 * radius + 1;

    std::vector<glm::ivec3> coords;
    coords.reserve(static_cast<std::size_t>(edge) * edge * edge);
    for (int dz = -radius; dz <= radius; ++dz)
    {
        for (int dy = -radius; dy <= radius; ++dy)
        {
            for (int dx = -radius; dx <= radius; ++dx)
            {
                coords.push_back(center + glm::ivec3(dx, dy, dz));
            }
        }
    }
    return coords;
}

TickStats ChunkManager::tickBudgeted(const glm::vec3& cameraPos, int budget, const CameraAnimation* animation)
{
    return impl_->tickBudgeted(cameraPos, budget, animation);
}

PreloadResult ChunkManager::preload(const glm::vec3& position, int budget)
{
    return impl_->preload(position, budget);
}

void ChunkManager::loadChunk(const glm::ivec3& coord)
{
    impl_->loadChunk(coord);
}

void ChunkManager::unloadChunk(const glm::ivec3& coord)
{
    impl_->unloadChunk(coord);
}

bool ChunkManager::mutateVoxel(const glm::ivec3& worldVoxel, std::uint32_t voxel)
{
    return impl_->mutateVoxel(worldVoxel, voxel);
}

bool ChunkManager::isSolid(const glm::vec3& worldPos) const noexcept
{
    if (!isVoxelAddressable(worldPos))
    {
        return false;
    }
    return impl_->isSolidAt(worldToVoxel(worldPos));
}

bool ChunkManager::isSolidAt(const glm::ivec3& worldVoxel) const noexcept
{
    return impl_->isSolidAt(worldVoxel);
}

bool ChunkManager::isLoaded(const glm::ivec3& coord) const noexcept
{
    return impl_->loaded_.count(coord) != 0;
}

const LoadedChunk* ChunkManager::findLoaded(const glm::ivec3& coord) const noexcept
{
    const auto it = impl_->loaded_.find(coord);
    return it != impl_->loaded_.end() ? &it->second : nullptr;
}

std::size_t ChunkManager::loadedCount() const noexcept
{
    return impl_->loaded_.size();
}

std::size_t ChunkManager::visibleCount() const noexcept
{
    return impl_->visible_.size();
}

const std::vector<glm::ivec3>& ChunkManager::visible() const noexcept
{
    return impl_->visible_;
}

const GridInfo& ChunkManager::gridInfo() const noexcept
{
    return impl_->gridInfo_;
}

const TickStats& ChunkManager::lastTickStats() const noexcept
{
    return impl_->lastStats_;
}

StreamingState ChunkManager::streamingState() const noexcept
{
    return impl_->lastStats_.state;
}

const StreamingConfig& ChunkManager::config() const noexcept
{
    return impl_->config_;
}

const ChunkAtlas& ChunkManager::atlas() const noexcept
{
    return impl_->atlas_;
}

void ChunkManager::setChunkLoadedCallback(ChunkLoadedCallback callback)
{
    impl_->onChunkLoaded_ = std::move(callback);
}
