#pragma once

#include <cstddef>
#include <cstdint>

#include <glm/glm.hpp>

struct GridInfo;

struct CameraPose
{
    glm::vec3 position{0.0f};
    float yaw{0.0f};
    float pitch{0.0f};
};

// Held movement keys, advanced once per tick.
struct MovementIntents
{
    bool forward{false};
    bool backward{false};
    bool left{false};
    bool right{false};
    bool up{false};
    bool down{false};

    [[nodiscard]] bool any() const noexcept
    {
        return forward || backward || left || right || up || down;
    }
};

enum class CameraIntent
{
    Forward,
    Backward,
    Left,
    Right,
    Up,
    Down,
};

// Matches the std140 Camera block in the ray-march compute shader (opengl/raymarch_shaders.h).
struct CameraUniform
{
    glm::vec3 position{0.0f};
    float pad0{0.0f};
    glm::vec3 forward{0.0f, 0.0f, -1.0f};
    float pad1{0.0f};
    glm::vec3 right{1.0f, 0.0f, 0.0f};
    float pad2{0.0f};
    glm::vec3 up{0.0f, 1.0f, 0.0f};
    float pad3{0.0f};
    float fovY{0.0f};
    std::uint32_t width{0};
    std::uint32_t height{0};
    std::uint32_t pad4{0};
    glm::ivec3 gridOrigin{0};
    std::int32_t pad5{0};
    glm::ivec3 gridSize{0};
    std::int32_t pad6{0};
    glm::uvec3 atlasSlots{0u};
    float maxRayDistance{0.0f};
    glm::vec3 sunDirection{0.0f, 1.0f, 0.0f};
    float shadowBias{0.0f};
    glm::vec3 skyColor{0.0f};
    float aoStrength{0.0f};
};

static_assert(offsetof(CameraUniform, position) == 0);
static_assert(offsetof(CameraUniform, forward) == 16);
static_assert(offsetof(CameraUniform, right) == 32);
static_assert(offsetof(CameraUniform, up) == 48);
static_assert(offsetof(CameraUniform, fovY) == 64);
static_assert(offsetof(CameraUniform, width) == 68);
static_assert(offsetof(CameraUniform, height) == 72);
static_assert(offsetof(CameraUniform, gridOrigin) == 80);
static_assert(offsetof(CameraUniform, gridSize) == 96);
static_assert(offsetof(CameraUniform, atlasSlots) == 112);
static_assert(offsetof(CameraUniform, maxRayDistance) == 124);
static_assert(offsetof(CameraUniform, sunDirection) == 128);
static_assert(offsetof(CameraUniform, shadowBias) == 140);
static_assert(offsetof(CameraUniform, skyColor) == 144);
static_assert(offsetof(CameraUniform, aoStrength) == 156);
static_assert(sizeof(CameraUniform) == 160);

class Camera
{
public:
    glm::vec3 position{16.0f, 20.0f, 48.0f};
    float yaw{-90.0f};
    float pitch{-17.0f};
    float fovDegrees{60.0f};
    float moveSpeed{10.0f};
    float mouseSensitivity{0.12f};

    Camera();

    const glm::vec3& front() const noexcept;
    const glm::vec3& up() const noexcept;
    const glm::vec3& right() const noexcept;
    const glm::vec3& worldUp() const noexcept;

    [[nodiscard]] CameraPose pose() const noexcept;
    void setPose(const CameraPose& pose);

    void processMouse(float xoffset, float yoffset);
    void lookAt(const glm::vec3& target);
    void updateVectors();

    void setIntent(CameraIntent intent, bool active) noexcept;
    [[nodiscard]] const MovementIntents& intents() const noexcept
    {
        return intents_;
    }

    // Displacement the held intents request over dt seconds; zero when nothing is held.
    [[nodiscard]] glm::vec3 intentDisplacement(float dt) const noexcept;

    [[nodiscard]] CameraUniform toUniform(std::uint32_t width, std::uint32_t height, const GridInfo& grid) const;

private:
    glm::vec3 front_{0.0f, 0.0f, -1.0f};
    glm::vec3 up_{0.0f, 1.0f, 0.0f};
    glm::vec3 right_{1.0f, 0.0f, 0.0f};
    glm::vec3 worldUp_{0.0f, 1.0f, 0.0f};
    MovementIntents intents_{};
};
