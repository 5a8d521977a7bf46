#include "lumen/effects/transition.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace lumen;
using namespace std::chrono_literals;

namespace {

Clock::time_point const T0 = Clock::time_point{} + 100s;

} // namespace

TEST_CASE("A new effect is ready with zero progress", "[effects][transition]")
{
    TransitionEffect effect(EffectKind::FadeIn, 200ms);
    REQUIRE(effect.state() == EffectState::Ready);
    REQUIRE(effect.progress() == 0.0f);
    REQUIRE_FALSE(effect.update(T0));
    REQUIRE_FALSE(effect.start_time().has_value());
}

TEST_CASE("Linear progress follows elapsed time", "[effects][transition]")
{
    TransitionEffect effect(EffectKind::FadeIn, 200ms);
    effect.start(T0);
    REQUIRE(effect.state() == EffectState::Running);
    REQUIRE(effect.end_time() == T0 + 200ms);

    REQUIRE(effect.update(T0 + 50ms));
    REQUIRE(effect.progress() == Catch::Approx(0.25f));

    REQUIRE(effect.update(T0 + 100ms));
    REQUIRE(effect.progress() == Catch::Approx(0.5f));
}

TEST_CASE("The tick reaching the end completes the effect exactly once", "[effects][transition]")
{
    TransitionEffect effect(EffectKind::ScaleIn, 100ms, Easing::Back);
    effect.start(T0);

    REQUIRE(effect.update(T0 + 250ms));
    REQUIRE(effect.progress() == 1.0f);
    REQUIRE(effect.state() == EffectState::Completed);
    REQUIRE(effect.finished());

    REQUIRE_FALSE(effect.update(T0 + 300ms));
    REQUIRE(effect.progress() == 1.0f);
}

TEST_CASE("Updating twice at the same time reports no change", "[effects][transition]")
{
    TransitionEffect effect(EffectKind::FadeOut, 100ms);
    effect.start(T0);
    REQUIRE(effect.update(T0 + 40ms));
    REQUIRE_FALSE(effect.update(T0 + 40ms));
}

TEST_CASE("Delayed effects hold at zero until they start", "[effects][transition]")
{
    TransitionEffect effect(EffectKind::SlideIn, 100ms);
    effect.with_delay(50ms).with_slide_direction(SlideDirection::FromLeft);
    effect.start(T0);

    REQUIRE(effect.start_time() == T0 + 50ms);
    REQUIRE_FALSE(effect.update(T0 + 30ms));
    REQUIRE(effect.progress() == 0.0f);

    REQUIRE(effect.update(T0 + 100ms));
    REQUIRE(effect.progress() == Catch::Approx(0.5f));
    REQUIRE(effect.slide_direction() == SlideDirection::FromLeft);
}

TEST_CASE("Easing shapes the reported progress", "[effects][transition]")
{
    TransitionEffect effect(EffectKind::FadeIn, 100ms, Easing::EaseIn);
    effect.start(T0);
    effect.update(T0 + 50ms);
    REQUIRE(effect.progress() == Catch::Approx(0.25f));
}

TEST_CASE("Zero duration effects complete on their first tick", "[effects][transition]")
{
    TransitionEffect effect(EffectKind::FadeIn, 0ms);
    effect.start(T0);
    REQUIRE(effect.update(T0));
    REQUIRE(effect.state() == EffectState::Completed);
    REQUIRE(effect.progress() == 1.0f);
}

TEST_CASE("Cancelled effects stop updating", "[effects][transition]")
{
    TransitionEffect effect(EffectKind::Blur, 100ms);
    effect.start(T0);
    effect.update(T0 + 20ms);
    effect.cancel();

    REQUIRE(effect.state() == EffectState::Cancelled);
    REQUIRE_FALSE(effect.update(T0 + 50ms));
    REQUIRE(effect.progress() == Catch::Approx(0.2f));

    // Completed effects stay completed
    TransitionEffect done(EffectKind::Blur, 10ms);
    done.start(T0);
    done.update(T0 + 20ms);
    done.cancel();
    REQUIRE(done.state() == EffectState::Completed);
}

TEST_CASE("Value scales progress by strength", "[effects][transition]")
{
    TransitionEffect effect(EffectKind::Ripple, 100ms);
    effect.with_strength(0.5f).with_param("frequency", 3.0f).with_custom_id(9);
    effect.start(T0);
    effect.update(T0 + 100ms);

    REQUIRE(effect.value() == Catch::Approx(0.5f));
    REQUIRE(effect.param("frequency") == 3.0f);
    REQUIRE_FALSE(effect.param("amplitude").has_value());
    REQUIRE(effect.param_or("amplitude", 2.0f) == 2.0f);
    REQUIRE(effect.custom_id() == 9);
}

TEST_CASE("Restarting resets progress", "[effects][transition]")
{
    TransitionEffect effect(EffectKind::FadeIn, 100ms);
    effect.start(T0);
    effect.update(T0 + 200ms);
    REQUIRE(effect.state() == EffectState::Completed);

    effect.start(T0 + 1s);
    REQUIRE(effect.state() == EffectState::Running);
    REQUIRE(effect.progress() == 0.0f);
}
