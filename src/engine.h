#pragma once
// engine.h
// Owned engine context: camera, animation, streaming, and the query surface used by
// the game-logic layer. One instance per rendering context; nothing is global.

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

#include "camera.h"
#include "camera_animation.h"
#include "chunk_manager.h"
#include "engine_config.h"
#include "raymarcher.h"

namespace terrain
{
class ChunkGenerator;
}

// Index of each value in the frame stats vector.
enum class FrameStat : std::size_t
{
    FrameTimeMs = 0,
    CameraX,
    CameraY,
    CameraZ,
    CameraYaw,
    CameraPitch,
    LoadedChunks,
    AtlasTotalSlots,
    AtlasUsedSlots,
    AtlasResidentBytes,
    PendingChunks,
    StreamingState,
    LoadedThisTick,
    UnloadedThisTick,
    ChunkBudget,
    CachedChunks,
    CameraChunkX,
    CameraChunkY,
    CameraChunkZ,
    Count
};

inline constexpr std::size_t kFrameStatCount = static_cast<std::size_t>(FrameStat::Count);
using FrameStats = std::array<float, kFrameStatCount>;

static_assert(kFrameStatCount == 19);

constexpr std::size_t toIndex(FrameStat stat) noexcept
{
    return static_cast<std::size_t>(stat);
}

// Surface bytes of one freshly loaded, non-empty chunk (see terrain::TerrainGrid::toBytes).
struct TerrainUpdate
{
    glm::ivec3 coord{0};
    std::vector<std::uint8_t> surfaces;
};

class Engine
{
public:
    // A null generator selects the configured heightfield terrain.
    explicit Engine(const EngineConfig& config,
                    std::unique_ptr<AtlasBackend> backend = nullptr,
                    std::unique_ptr<terrain::ChunkGenerator> generator = nullptr);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Immediate; drops any active animation.
    void setCamera(const CameraPose& pose);
    void animateCamera(const CameraPose& to, float duration, Easing easing);
    void animateCamera(const CameraPose& to, float duration, std::string_view easingName);

    // Streams in the view around position without moving the camera.
    void preloadView(const glm::vec3& position);

    void lookAt(const glm::vec3& target);
    void applyLookDelta(float dyaw, float dpitch);
    void applyDolly(float amount);
    void applyPan(float dx, float dy);
    void beginIntent(CameraIntent intent);
    void endIntent(CameraIntent intent);

    // Advances animation or intents, then runs one budgeted streaming tick.
    TickStats tick(float dt);

    // Moves unless the destination voxel is solid; sub-voxel moves skip the lookup.
    bool tryMoveCamera(const glm::vec3& destination);

    [[nodiscard]] bool isSolid(const glm::vec3& worldPos) const noexcept;
    [[nodiscard]] bool isChunkLoaded(const glm::ivec3& chunkCoord) const noexcept;
    [[nodiscard]] FrameStats collectFrameStats() const;

    [[nodiscard]] bool isAnimating() const noexcept;
    // True exactly once after an animation reaches its target.
    bool takeAnimationCompleted() noexcept;

    std::vector<TerrainUpdate> drainTerrainUpdates();

    [[nodiscard]] CameraUniform cameraUniform(std::uint32_t width, std::uint32_t height) const;

    [[nodiscard]] const Camera& camera() const noexcept
    {
        return camera_;
    }

    [[nodiscard]] const Palette& palette() const noexcept
    {
        return palette_;
    }

    [[nodiscard]] const ChunkManager& chunkManager() const noexcept
    {
        return *chunkManager_;
    }

    [[nodiscard]] ChunkManager& chunkManager() noexcept
    {
        return *chunkManager_;
    }

    [[nodiscard]] const EngineConfig& config() const noexcept
    {
        return config_;
    }

private:
    void onChunkLoaded(const glm::ivec3& coord, const VoxelChunk& chunk);

    EngineConfig config_;
    Camera camera_;
    Palette palette_{};
    std::unique_ptr<ChunkManager> chunkManager_;
    std::optional<CameraAnimation> animation_;
    std::optional<glm::vec3> preloadTarget_;
    std::vector<TerrainUpdate> terrainUpdates_;
    bool animationCompleted_{false};
    float lastFrameMs_{0.0f};
};
