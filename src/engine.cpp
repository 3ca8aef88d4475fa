#include "engine.h"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "collision_map.h"
#include "terrain/terrain_generator.h"
#include "terrain/terrain_grid.h"

Engine::Engine(const EngineConfig& config,
               std::unique_ptr<AtlasBackend> backend,
               std::unique_ptr<terrain::ChunkGenerator> generator)
    : config_(config),
      palette_(buildDefaultPalette())
{
    for (const auto& [id, color] : config_.render.materialOverrides)
    {
        if (id < 1 || id >= kPaletteSize)
        {
            std::ostringstream oss;
            oss << "Material override id " << id << " is outside [1, " << kPaletteSize - 1 << "]";
            throw std::invalid_argument(oss.str());
        }
        palette_[static_cast<std::size_t>(id)] = color;
    }

    if (!generator)
    {
        generator = terrain::makeChunkGenerator(config_.seed, config_.worldgen);
    }

    chunkManager_ = std::make_unique<ChunkManager>(std::move(generator), config_.streaming, std::move(backend));
    chunkManager_->setChunkLoadedCallback([this](const glm::ivec3& coord, const VoxelChunk& chunk) {
        onChunkLoaded(coord, chunk);
    });

    camera_.fovDegrees = config_.render.fovDegrees;
    camera_.moveSpeed = config_.camera.moveSpeed;
    camera_.setPose(config_.camera.initialPose);

    std::cout << "[Engine] Seed " << config_.seed << ", camera at (" << camera_.position.x << ", "
              << camera_.position.y << ", " << camera_.position.z << ")" << std::endl;
}

void Engine::setCamera(const CameraPose& pose)
{
    animation_.reset();
    camera_.setPose(pose);
}

void Engine::animateCamera(const CameraPose& to, float duration, Easing easing)
{
    animation_.emplace(camera_.pose(), to, duration, easing);
    animationCompleted_ = false;
    std::cout << "[Engine] Animating camera over " << duration << "s (" << easingName(easing) << ")" << std::endl;
}

void Engine::animateCamera(const CameraPose& to, float duration, std::string_view easingName)
{
    animateCamera(to, duration, easingFromName(easingName));
}

void Engine::preloadView(const glm::vec3& position)
{
    preloadTarget_ = position;
}

void Engine::lookAt(const glm::vec3& target)
{
    camera_.lookAt(target);
}

void Engine::applyLookDelta(float dyaw, float dpitch)
{
    camera_.processMouse(dyaw, dpitch);
}

void Engine::applyDolly(float amount)
{
    tryMoveCamera(camera_.position + camera_.front() * amount);
}

void Engine::applyPan(float dx, float dy)
{
    tryMoveCamera(camera_.position + camera_.right() * dx + camera_.up() * dy);
}

void Engine::beginIntent(CameraIntent intent)
{
    camera_.setIntent(intent, true);
}

void Engine::endIntent(CameraIntent intent)
{
    camera_.setIntent(intent, false);
}

TickStats Engine::tick(float dt)
{
    lastFrameMs_ = dt * 1000.0f;

    if (animation_)
    {
        animation_->advance(dt);
        camera_.setPose(animation_->interpolate());
    }
    else if (camera_.intents().any())
    {
        tryMoveCamera(camera_.position + camera_.intentDisplacement(dt));
    }

    const CameraAnimation* active = animation_ ? &*animation_ : nullptr;
    TickStats stats = chunkManager_->tickBudgeted(camera_.position, config_.streaming.chunkBudget, active);

    if (animation_ && animation_->finished())
    {
        animation_.reset();
        animationCompleted_ = true;
    }

    // Preload only spends budget the current view left unused.
    if (preloadTarget_ && stats.pendingCount == 0)
    {
        const int spare = config_.streaming.chunkBudget - stats.loadedThisTick;
        const PreloadResult preload = chunkManager_->preload(*preloadTarget_, spare);
        if (preload.pending == 0)
        {
            preloadTarget_.reset();
        }
    }

    return stats;
}

bool Engine::tryMoveCamera(const glm::vec3& destination)
{
    if (CollisionMap::crossesVoxelBoundary(camera_.position, destination) && chunkManager_->isSolid(destination))
    {
        return false;
    }
    camera_.position = destination;
    return true;
}

bool Engine::isSolid(const glm::vec3& worldPos) const noexcept
{
    return chunkManager_->isSolid(worldPos);
}

bool Engine::isChunkLoaded(const glm::ivec3& chunkCoord) const noexcept
{
    return chunkManager_->isLoaded(chunkCoord);
}

FrameStats Engine::collectFrameStats() const
{
    FrameStats stats{};
    const TickStats& tick = chunkManager_->lastTickStats();
    const ChunkAtlas& atlas = chunkManager_->atlas();
    const glm::ivec3 cameraChunk = worldToChunkCoord(camera_.position);

    stats[toIndex(FrameStat::FrameTimeMs)] = lastFrameMs_;
    stats[toIndex(FrameStat::CameraX)] = camera_.position.x;
    stats[toIndex(FrameStat::CameraY)] = camera_.position.y;
    stats[toIndex(FrameStat::CameraZ)] = camera_.position.z;
    stats[toIndex(FrameStat::CameraYaw)] = camera_.yaw;
    stats[toIndex(FrameStat::CameraPitch)] = camera_.pitch;
    stats[toIndex(FrameStat::LoadedChunks)] = static_cast<float>(chunkManager_->loadedCount());
    stats[toIndex(FrameStat::AtlasTotalSlots)] = static_cast<float>(atlas.slotCount());
    stats[toIndex(FrameStat::AtlasUsedSlots)] = static_cast<float>(atlas.usedSlotCount());
    stats[toIndex(FrameStat::AtlasResidentBytes)] = static_cast<float>(atlas.residentBytes());
    stats[toIndex(FrameStat::PendingChunks)] = static_cast<float>(tick.pendingCount);
    stats[toIndex(FrameStat::StreamingState)] = static_cast<float>(static_cast<int>(tick.state));
    stats[toIndex(FrameStat::LoadedThisTick)] = static_cast<float>(tick.loadedThisTick);
    stats[toIndex(FrameStat::UnloadedThisTick)] = static_cast<float>(tick.unloadedThisTick);
    stats[toIndex(FrameStat::ChunkBudget)] = static_cast<float>(config_.streaming.chunkBudget);
    stats[toIndex(FrameStat::CachedChunks)] = static_cast<float>(tick.cachedCount);
    stats[toIndex(FrameStat::CameraChunkX)] = static_cast<float>(cameraChunk.x);
    stats[toIndex(FrameStat::CameraChunkY)] = static_cast<float>(cameraChunk.y);
    stats[toIndex(FrameStat::CameraChunkZ)] = static_cast<float>(cameraChunk.z);
    return stats;
}

bool Engine::isAnimating() const noexcept
{
    return animation_.has_value();
}

bool Engine::takeAnimationCompleted() noexcept
{
    return std::exchange(animationCompleted_, false);
}

std::vector<TerrainUpdate> Engine::drainTerrainUpdates()
{
    return std::exchange(terrainUpdates_, {});
}

CameraUniform Engine::cameraUniform(std::uint32_t width, std::uint32_t height) const
{
    CameraUniform uniform = camera_.toUniform(width, height, chunkManager_->gridInfo());
    uniform.sunDirection = glm::normalize(config_.render.sunDirection);
    uniform.shadowBias = config_.render.shadowBias;
    uniform.skyColor = config_.render.skyColor;
    uniform.aoStrength = config_.render.aoStrength;
    return uniform;
}

void Engine::onChunkLoaded(const glm::ivec3& coord, const VoxelChunk& chunk)
{
    if (chunk.isEmpty())
    {
        return;
    }
    terrainUpdates_.push_back({coord, terrain::TerrainGrid::fromChunk(chunk).toBytes()});
}
