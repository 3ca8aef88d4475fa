#pragma once

#include <string_view>

#include "camera.h"

enum class Easing
{
    Linear,
    QuadInOut,
    CubicInOut,
    SineInOut,
    ExpoInOut,
};

// Maps t in [0, 1] to eased progress; input is clamped first.
[[nodiscard]] float applyEasing(Easing easing, float t) noexcept;

// Unknown identifiers fall back to Linear.
[[nodiscard]] Easing easingFromName(std::string_view name) noexcept;
[[nodiscard]] std::string_view easingName(Easing easing) noexcept;

class CameraAnimation
{
public:
    CameraAnimation(const CameraPose& from, const CameraPose& to, float duration, Easing easing);

    // elapsed stays within [0, duration].
    void advance(float dt) noexcept;

    // Exactly `to` once finished.
    [[nodiscard]] CameraPose interpolate() const noexcept;

    // Pose at normalized time t without touching elapsed; used for trajectory prefetch.
    [[nodiscard]] CameraPose sample(float t) const noexcept;

    [[nodiscard]] bool finished() const noexcept;
    [[nodiscard]] float progress() const noexcept;

    [[nodiscard]] const CameraPose& from() const noexcept
    {
        return from_;
    }

    [[nodiscard]] const CameraPose& to() const noexcept
    {
        return to_;
    }

    [[nodiscard]] float duration() const noexcept
    {
        return duration_;
    }

    [[nodiscard]] float elapsed() const noexcept
    {
        return elapsed_;
    }

    [[nodiscard]] Easing easing() const noexcept
    {
        return easing_;
    }

private:
    CameraPose from_{};
    CameraPose to_{};
    float duration_{0.0f};
    float elapsed_{0.0f};
    Easing easing_{Easing::Linear};
};
