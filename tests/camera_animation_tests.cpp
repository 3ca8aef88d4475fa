#include "test_framework.h"

#include "camera_animation.h"

namespace
{
constexpr Easing kAllEasings[] = {
    Easing::Linear, Easing::QuadInOut, Easing::CubicInOut, Easing::SineInOut, Easing::ExpoInOut};

const CameraPose kFrom{glm::vec3(0.0f, 10.0f, 0.0f), -90.0f, 0.0f};
const CameraPose kTo{glm::vec3(100.0f, 30.0f, -50.0f), 45.0f, -30.0f};

bool samePose(const CameraPose& a, const CameraPose& b)
{
    return a.position == b.position && a.yaw == b.yaw && a.pitch == b.pitch;
}
} // namespace

TEST_CASE(easing_endpoints_and_midpoint)
{
    for (const Easing easing : kAllEasings)
    {
        CHECK(applyEasing(easing, 0.0f) == 0.0f);
        CHECK(applyEasing(easing, 1.0f) == 1.0f);
        CHECK_NEAR(applyEasing(easing, 0.5f), 0.5f, 1e-5f);
        CHECK(applyEasing(easing, -2.0f) == 0.0f);
        CHECK(applyEasing(easing, 3.0f) == 1.0f);
    }
    CHECK_NEAR(applyEasing(Easing::QuadInOut, 0.25f), 0.125f, 1e-6f);
    CHECK_NEAR(applyEasing(Easing::CubicInOut, 0.25f), 0.0625f, 1e-6f);
    CHECK(applyEasing(Easing::ExpoInOut, 0.1f) < 0.01f);
}

TEST_CASE(easing_names_round_trip)
{
    for (const Easing easing : kAllEasings)
    {
        CHECK(easingFromName(easingName(easing)) == easing);
    }
    CHECK(easingFromName("bounce") == Easing::Linear);
    CHECK(easingFromName("") == Easing::Linear);
}

TEST_CASE(animation_lands_exactly_on_target)
{
    for (const Easing easing : kAllEasings)
    {
        CameraAnimation animation(kFrom, kTo, 2.0f, easing);
        for (int i = 0; i < 7; ++i)
        {
            animation.advance(1.0f / 3.0f);
        }
        REQUIRE(animation.finished());
        CHECK(animation.elapsed() == animation.duration());
        CHECK(samePose(animation.interpolate(), kTo));
    }
}

TEST_CASE(animation_progress_is_clamped)
{
    CameraAnimation animation(kFrom, kTo, 4.0f, Easing::Linear);
    CHECK(animation.progress() == 0.0f);
    CHECK(samePose(animation.interpolate(), kFrom));

    animation.advance(-1.0f);
    CHECK(animation.elapsed() == 0.0f);

    animation.advance(1.0f);
    CHECK_NEAR(animation.progress(), 0.25f, 1e-6f);
    const CameraPose quarter = animation.interpolate();
    CHECK_NEAR(quarter.position.x, 25.0f, 1e-4f);
    CHECK_NEAR(quarter.position.y, 15.0f, 1e-4f);
    CHECK_NEAR(quarter.yaw, -56.25f, 1e-4f);
    CHECK_FALSE(animation.finished());

    animation.advance(100.0f);
    CHECK(animation.elapsed() == 4.0f);
    CHECK(animation.progress() == 1.0f);
}

TEST_CASE(animation_without_duration_is_immediate)
{
    const CameraAnimation zero(kFrom, kTo, 0.0f, Easing::SineInOut);
    CHECK(zero.finished());
    CHECK(zero.progress() == 1.0f);
    CHECK(samePose(zero.interpolate(), kTo));

    const CameraAnimation negative(kFrom, kTo, -5.0f, Easing::Linear);
    CHECK(negative.duration() == 0.0f);
    CHECK(negative.finished());
    CHECK(samePose(negative.interpolate(), kTo));
}

TEST_CASE(animation_sample_does_not_advance)
{
    const CameraAnimation animation(kFrom, kTo, 10.0f, Easing::QuadInOut);
    CHECK(samePose(animation.sample(1.0f), kTo));
    CHECK(samePose(animation.sample(0.0f), kFrom));
    CHECK_NEAR(animation.sample(0.5f).position.x, 50.0f, 1e-4f);
    CHECK(animation.elapsed() == 0.0f);
}
