#include "camera.h"

#include <algorithm>
#include <cmath>

#include "chunk_manager.h"

namespace
{
constexpr float kEpsilon = 1e-6f;
constexpr float kPitchLimit = 89.0f;
} // namespace

Camera::Camera()
{
    updateVectors();
}

const glm::vec3& Camera::front() const noexcept
{
    return front_;
}

const glm::vec3& Camera::up() const noexcept
{
    return up_;
}

const glm::vec3& Camera::right() const noexcept
{
    return right_;
}

const glm::vec3& Camera::worldUp() const noexcept
{
    return worldUp_;
}

CameraPose Camera::pose() const noexcept
{
    return {position, yaw, pitch};
}

void Camera::setPose(const CameraPose& pose)
{
    position = pose.position;
    yaw = pose.yaw;
    pitch = std::clamp(pose.pitch, -kPitchLimit, kPitchLimit);
    updateVectors();
}

void Camera::processMouse(float xoffset, float yoffset)
{
    xoffset *= mouseSensitivity;
    yoffset *= mouseSensitivity;

    yaw += xoffset;
    pitch += yoffset;
    pitch = std::clamp(pitch, -kPitchLimit, kPitchLimit);
    updateVectors();
}

void Camera::lookAt(const glm::vec3& target)
{
    const glm::vec3 delta = target - position;
    const float distance = glm::length(delta);
    if (distance < kEpsilon)
    {
        return;
    }

    const glm::vec3 direction = delta / distance;
    yaw = glm::degrees(std::atan2(direction.z, direction.x));
    pitch = std::clamp(glm::degrees(std::asin(std::clamp(direction.y, -1.0f, 1.0f))), -kPitchLimit, kPitchLimit);
    updateVectors();
}

void Camera::updateVectors()
{
    const float yawRad = glm::radians(yaw);
    const float pitchRad = glm::radians(pitch);

    glm::vec3 direction;
    direction.x = std::cos(yawRad) * std::cos(pitchRad);
    direction.y = std::sin(pitchRad);
    direction.z = std::sin(yawRad) * std::cos(pitchRad);
    front_ = glm::normalize(direction);

    glm::vec3 rightCandidate = glm::cross(front_, worldUp_);
    if (glm::length(rightCandidate) < kEpsilon)
    {
        rightCandidate = glm::vec3(1.0f, 0.0f, 0.0f);
    }
    else
    {
        rightCandidate = glm::normalize(rightCandidate);
    }
    right_ = rightCandidate;
    up_ = glm::normalize(glm::cross(right_, front_));
}

void Camera::setIntent(CameraIntent intent, bool active) noexcept
{
    switch (intent)
    {
    case CameraIntent::Forward:
        intents_.forward = active;
        break;
    case CameraIntent::Backward:
        intents_.backward = active;
        break;
    case CameraIntent::Left:
        intents_.left = active;
        break;
    case CameraIntent::Right:
        intents_.right = active;
        break;
    case CameraIntent::Up:
        intents_.up = active;
        break;
    case CameraIntent::Down:
        intents_.down = active;
        break;
    }
}

glm::vec3 Camera::intentDisplacement(float dt) const noexcept
{
    glm::vec3 direction(0.0f);
    if (intents_.forward)
    {
        direction += front_;
    }
    if (intents_.backward)
    {
        direction -= front_;
    }
    if (intents_.right)
    {
        direction += right_;
    }
    if (intents_.left)
    {
        direction -= right_;
    }
    if (intents_.up)
    {
        direction += worldUp_;
    }
    if (intents_.down)
    {
        direction -= worldUp_;
    }

    if (glm::length(direction) < kEpsilon)
    {
        return glm::vec3(0.0f);
    }
    return glm::normalize(direction) * (moveSpeed * dt);
}

CameraUniform Camera::toUniform(std::uint32_t width, std::uint32_t height, const GridInfo& grid) const
{
    CameraUniform uniform{};
    uniform.position = position;
    uniform.forward = front_;
    uniform.right = right_;
    uniform.up = up_;
    uniform.fovY = glm::radians(fovDegrees);
    uniform.width = width;
    uniform.height = height;
    uniform.gridOrigin = grid.origin;
    uniform.gridSize = grid.size;
    uniform.atlasSlots = grid.atlasSlots;
    uniform.maxRayDistance = grid.maxRayDistance;
    return uniform;
}
