#pragma once
// chunk_manager.h
// Declares the chunk streaming subsystem: visible-set computation, budgeted loading,
// slot-collision eviction, and trajectory prefetch into the chunk atlas.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

#include "chunk_atlas.h"
#include "collision_map.h"
#include "voxel.h"

namespace terrain
{
class ChunkGenerator;
}

class CameraAnimation;

inline constexpr int kDefaultViewDistance = 3;
inline constexpr int kDefaultChunkBudget = 8;
inline constexpr int kDefaultPrefetchViewDistance = 1;
inline constexpr float kDefaultMaxRayDistance = 256.0f;

// Normalized animation times sampled for trajectory prefetch.
inline constexpr float kPrefetchSampleTimes[] = {0.25f, 0.5f, 0.75f, 1.0f};

struct StreamingConfig
{
    int viewDistance{kDefaultViewDistance};
    int chunkBudget{kDefaultChunkBudget};
    glm::uvec3 atlasSlots{8u, 8u, 8u};
    // <= 0 derives the distance from the visible grid extent.
    float maxRayDistance{kDefaultMaxRayDistance};
    int prefetchViewDistance{kDefaultPrefetchViewDistance};
    // Keeps CPU copies of resident chunks for the reference ray marcher.
    bool mirrorVoxels{false};
};

enum class StreamingState : std::uint8_t
{
    Idle = 0,
    Loading = 1,
    Stalled = 2,
};

std::string_view toString(StreamingState state) noexcept;

struct TickStats
{
    int loadedThisTick{0};
    int unloadedThisTick{0};
    // Subset of loadedThisTick that came from trajectory prefetch.
    int prefetchedThisTick{0};
    int pendingCount{0};
    int totalLoaded{0};
    int totalVisible{0};
    int cachedCount{0};
    StreamingState state{StreamingState::Idle};
};

// Bounding box of the visible set, in chunk coordinates, as consumed by the traversal.
struct GridInfo
{
    glm::ivec3 origin{0};
    glm::ivec3 size{0};
    glm::uvec3 atlasSlots{0u};
    float maxRayDistance{0.0f};
};

struct LoadedChunk
{
    std::uint32_t slot{0};
    // Empty for all-air chunks, which are tracked but never uploaded.
    std::optional<CollisionMap> collision{};
};

struct PreloadResult
{
    int loaded{0};
    int pending{0};
};

struct ChunkCoordHasher
{
    std::size_t operator()(const glm::ivec3& v) const noexcept
    {
        std::size_t hash = static_cast<std::size_t>(v.x) * 73856093u;
        hash ^= static_cast<std::size_t>(v.y) * 19349663u;
        hash ^= static_cast<std::size_t>(v.z) * 83492791u;
        return hash;
    }
};

class ChunkManager
{
public:
    using ChunkLoadedCallback = std::function<void(const glm::ivec3& coord, const VoxelChunk& chunk)>;

    // Throws std::invalid_argument when the atlas is smaller than 2 * viewDistance + 1 on any axis.
    ChunkManager(std::unique_ptr<terrain::ChunkGenerator> generator,
                 const StreamingConfig& config,
                 std::unique_ptr<AtlasBackend> backend = nullptr);
    ~ChunkManager();

    ChunkManager(const ChunkManager&) = delete;
    ChunkManager& operator=(const ChunkManager&) = delete;
    ChunkManager(ChunkManager&&) = delete;
    ChunkManager& operator=(ChunkManager&&) = delete;

    // (2 * viewDistance + 1)^3 coordinates centered on the camera's chunk, x fastest.
    static std::vector<glm::ivec3> computeVisibleSet(const glm::vec3& cameraPos, int viewDistance);

    TickStats tickBudgeted(const glm::vec3& cameraPos, int budget, const CameraAnimation* animation = nullptr);

    // Loads the view box around position without moving the view. Never evicts a visible chunk.
    PreloadResult preload(const glm::vec3& position, int budget);

    // Loads immediately, evicting whatever occupies the target slot.
    void loadChunk(const glm::ivec3& coord);
    void unloadChunk(const glm::ivec3& coord);

    // Records an edit that survives eviction; returns true when the chunk was resident and re-uploaded.
    bool mutateVoxel(const glm::ivec3& worldVoxel, std::uint32_t voxel);

    [[nodiscard]] bool isSolid(const glm::vec3& worldPos) const noexcept;
    [[nodiscard]] bool isSolidAt(const glm::ivec3& worldVoxel) const noexcept;
    [[nodiscard]] bool isLoaded(const glm::ivec3& coord) const noexcept;
    [[nodiscard]] const LoadedChunk* findLoaded(const glm::ivec3& coord) const noexcept;

    [[nodiscard]] std::size_t loadedCount() const noexcept;
    [[nodiscard]] std::size_t visibleCount() const noexcept;
    [[nodiscard]] const std::vector<glm::ivec3>& visible() const noexcept;

    [[nodiscard]] const GridInfo& gridInfo() const noexcept;
    [[nodiscard]] const TickStats& lastTickStats() const noexcept;
    [[nodiscard]] StreamingState streamingState() const noexcept;
    [[nodiscard]] const StreamingConfig& config() const noexcept;
    [[nodiscard]] const ChunkAtlas& atlas() const noexcept;

    void setChunkLoadedCallback(ChunkLoadedCallback callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
