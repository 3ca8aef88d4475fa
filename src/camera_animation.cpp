#include "camera_animation.h"

#include <algorithm>
#include <cmath>

#include <glm/gtc/constants.hpp>

float applyEasing(Easing easing, float t) noexcept
{
    t = std::clamp(t, 0.0f, 1.0f);
    switch (easing)
    {
    case Easing::Linear:
        return t;
    case Easing::QuadInOut:
        return t < 0.5f ? 2.0f * t * t : 1.0f - std::pow(-2.0f * t + 2.0f, 2.0f) * 0.5f;
    case Easing::CubicInOut:
        return t < 0.5f ? 4.0f * t * t * t : 1.0f - std::pow(-2.0f * t + 2.0f, 3.0f) * 0.5f;
    case Easing::SineInOut:
        return -(std::cos(glm::pi<float>() * t) - 1.0f) * 0.5f;
    case Easing::ExpoInOut:
        if (t <= 0.0f)
        {
            return 0.0f;
        }
        if (t >= 1.0f)
        {
            return 1.0f;
        }
        return t < 0.5f ? std::pow(2.0f, 20.0f * t - 10.0f) * 0.5f
                        : (2.0f - std::pow(2.0f, -20.0f * t + 10.0f)) * 0.5f;
    }
    return t;
}

Easing easingFromName(std::string_view name) noexcept
{
    if (name == "quad_in_out")
    {
        return Easing::QuadInOut;
    }
    if (name == "cubic_in_out")
    {
        return Easing::CubicInOut;
    }
    if (name == "sine_in_out")
    {
        return Easing::SineInOut;
    }
    if (name == "expo_in_out")
    {
        return Easing::ExpoInOut;
    }
    return Easing::Linear;
}

std::string_view easingName(Easing easing) noexcept
{
    switch (easing)
    {
    case Easing::Linear:
        return "linear";
    case Easing::QuadInOut:
        return "quad_in_out";
    case Easing::CubicInOut:
        return "cubic_in_out";
    case Easing::SineInOut:
        return "sine_in_out";
    case Easing::ExpoInOut:
        return "expo_in_out";
    }
    return "linear";
}

CameraAnimation::CameraAnimation(const CameraPose& from, const CameraPose& to, float duration, Easing easing)
    : from_(from),
      to_(to),
      duration_(std::max(duration, 0.0f)),
      easing_(easing)
{
}

void CameraAnimation::advance(float dt) noexcept
{
    elapsed_ = std::clamp(elapsed_ + std::max(dt, 0.0f), 0.0f, duration_);
}

float CameraAnimation::progress() const noexcept
{
    if (duration_ <= 0.0f)
    {
        return 1.0f;
    }
    return std::clamp(elapsed_ / duration_, 0.0f, 1.0f);
}

bool CameraAnimation::finished() const noexcept
{
    return elapsed_ >= duration_;
}

CameraPose CameraAnimation::interpolate() const noexcept
{
    if (finished())
    {
        return to_;
    }
    return sample(progress());
}

CameraPose CameraAnimation::sample(float t) const noexcept
{
    if (t >= 1.0f)
    {
        return to_;
    }

    const float eased = applyEasing(easing_, t);
    CameraPose pose;
    pose.position = glm::mix(from_.position, to_.position, eased);
    pose.yaw = from_.yaw + (to_.yaw - from_.yaw) * eased;
    pose.pitch = from_.pitch + (to_.pitch - from_.pitch) * eased;
    return pose;
}
