#include "gesture_test_util.hpp"
#include "lumen/gesture/recognizers.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <numbers>

using namespace lumen;
using namespace lumen::test;

namespace {

InputEvent begin(uint32_t id, double x, double y, uint64_t t)
{
    return touch(InputEventType::TouchBegin, id, x, y, t);
}

InputEvent update(uint32_t id, double x, double y, uint64_t t)
{
    return touch(InputEventType::TouchUpdate, id, x, y, t);
}

InputEvent end(uint32_t id, double x, double y, uint64_t t)
{
    return touch(InputEventType::TouchEnd, id, x, y, t);
}

} // namespace

TEST_CASE("Spreading two fingers is a pinch out", "[gesture][pinch]")
{
    PinchRecognizer pinch(20.0, 0.05);
    pinch.update(begin(1, 100, 100, 0));
    pinch.update(begin(2, 200, 100, 10));
    REQUIRE(pinch.tracks(Contact{ true, 1 }));
    REQUIRE(pinch.tracks(Contact{ true, 2 }));

    // 100 -> 102: below the minimum scale change
    REQUIRE_FALSE(pinch.update(update(2, 202, 100, 20)).has_value());

    auto began = pinch.update(update(2, 250, 100, 30));
    REQUIRE(began.has_value());
    REQUIRE(began->kind == GestureKind::Pinch);
    REQUIRE(began->state == GestureState::Began);
    REQUIRE(*began->scale == Catch::Approx(1.5));
    REQUIRE(began->pinch_direction == PinchDirection::Out);
    REQUIRE(began->touch_count == 2);
    REQUIRE(began->position == Point{ 175, 100 });

    // 1.5 -> 1.52 is below the step; 1.5 -> 1.6 is not
    REQUIRE_FALSE(pinch.update(update(2, 252, 100, 40)).has_value());
    auto changed = pinch.update(update(2, 260, 100, 50));
    REQUIRE(changed.has_value());
    REQUIRE(changed->state == GestureState::Changed);
    REQUIRE(*changed->scale == Catch::Approx(1.6));

    auto ended = pinch.update(end(1, 100, 100, 60));
    REQUIRE(ended.has_value());
    REQUIRE(ended->state == GestureState::Ended);
    REQUIRE_FALSE(pinch.is_tracking());
}

TEST_CASE("Bringing two fingers together is a pinch in", "[gesture][pinch]")
{
    PinchRecognizer pinch(20.0, 0.05);
    pinch.update(begin(1, 0, 0, 0));
    pinch.update(begin(2, 200, 0, 0));

    auto began = pinch.update(update(2, 100, 0, 10));
    REQUIRE(began.has_value());
    REQUIRE(*began->scale == Catch::Approx(0.5));
    REQUIRE(began->pinch_direction == PinchDirection::In);
}

TEST_CASE("Fingers that start too close together never pinch", "[gesture][pinch]")
{
    PinchRecognizer pinch(20.0, 0.05);
    pinch.update(begin(1, 100, 100, 0));
    pinch.update(begin(2, 110, 100, 0));
    REQUIRE_FALSE(pinch.update(update(2, 400, 100, 10)).has_value());
}

TEST_CASE("Lifting a finger before recognition lets another take its place", "[gesture][pinch]")
{
    PinchRecognizer pinch(20.0, 0.05);
    pinch.update(begin(1, 0, 0, 0));
    pinch.update(begin(2, 100, 0, 0));
    REQUIRE_FALSE(pinch.update(end(2, 100, 0, 10)).has_value());
    REQUIRE(pinch.is_tracking());

    pinch.update(begin(3, 0, 100, 20));
    auto began = pinch.update(update(3, 0, 200, 30));
    REQUIRE(began.has_value());
    REQUIRE(*began->scale == Catch::Approx(2.0));
}

TEST_CASE("A third finger is ignored by a pinch", "[gesture][pinch]")
{
    PinchRecognizer pinch(20.0, 0.05);
    pinch.update(begin(1, 0, 0, 0));
    pinch.update(begin(2, 100, 0, 0));
    pinch.update(begin(3, 500, 500, 0));

    REQUIRE_FALSE(pinch.tracks(Contact{ true, 3 }));
    REQUIRE_FALSE(pinch.update(update(3, 900, 900, 10)).has_value());
    REQUIRE_FALSE(pinch.update(end(3, 900, 900, 20)).has_value());
}

TEST_CASE("Pointer events never reach the pinch state", "[gesture][pinch]")
{
    PinchRecognizer pinch;
    REQUIRE_FALSE(pinch.update(press(0, 0, 0)).has_value());
    REQUIRE_FALSE(pinch.is_tracking());
    REQUIRE_FALSE(pinch.is_exclusive());
}

TEST_CASE("Angle normalization wraps into (-pi, pi]", "[gesture][rotate]")
{
    using std::numbers::pi;
    REQUIRE(RotateRecognizer::normalize_angle(0.0) == Catch::Approx(0.0));
    REQUIRE(RotateRecognizer::normalize_angle(pi) == Catch::Approx(pi));
    REQUIRE(RotateRecognizer::normalize_angle(-pi) == Catch::Approx(pi));
    REQUIRE(RotateRecognizer::normalize_angle(3.0 * pi / 2.0) == Catch::Approx(-pi / 2.0));
    REQUIRE(RotateRecognizer::normalize_angle(-3.0 * pi / 2.0) == Catch::Approx(pi / 2.0));
    REQUIRE(RotateRecognizer::normalize_angle(4.0 * pi + 0.25) == Catch::Approx(0.25));
}

TEST_CASE("Turning two fingers clockwise on screen is a positive rotation", "[gesture][rotate]")
{
    RotateRecognizer rotate(0.05);
    rotate.update(begin(1, 0, 0, 0));
    rotate.update(begin(2, 100, 0, 0));

    REQUIRE_FALSE(rotate.update(update(2, 100, 2, 10)).has_value());

    // Second finger moves downward: clockwise with y pointing down
    auto began = rotate.update(update(2, 100, 100, 20));
    REQUIRE(began.has_value());
    REQUIRE(began->kind == GestureKind::Rotate);
    REQUIRE(began->state == GestureState::Began);
    REQUIRE(*began->rotation == Catch::Approx(std::numbers::pi / 4.0));

    auto ended = rotate.update(end(2, 100, 100, 30));
    REQUIRE(ended.has_value());
    REQUIRE(ended->state == GestureState::Ended);
    REQUIRE(*ended->rotation == Catch::Approx(std::numbers::pi / 4.0));
}

TEST_CASE("Rotation keeps accumulating past half a turn", "[gesture][rotate]")
{
    RotateRecognizer rotate(0.05);
    rotate.update(begin(1, 0, 0, 0));
    rotate.update(begin(2, 100, 0, 0));

    // Walk the second finger three quarters of the way around the first
    rotate.update(update(2, 0, 100, 10));
    rotate.update(update(2, -100, 0, 20));
    auto last = rotate.update(update(2, 0, -100, 30));

    REQUIRE(last.has_value());
    REQUIRE(last->state == GestureState::Changed);
    REQUIRE(*last->rotation == Catch::Approx(3.0 * std::numbers::pi / 2.0));
}

TEST_CASE("Cancel reports only a recognized rotation", "[gesture][rotate]")
{
    RotateRecognizer rotate(0.05);
    rotate.update(begin(1, 0, 0, 0));
    rotate.update(begin(2, 100, 0, 0));
    REQUIRE_FALSE(rotate.cancel(5).has_value());
    REQUIRE_FALSE(rotate.is_tracking());

    rotate.update(begin(1, 0, 0, 10));
    rotate.update(begin(2, 100, 0, 10));
    rotate.update(update(2, 0, 100, 20));
    auto cancelled = rotate.cancel(30);
    REQUIRE(cancelled.has_value());
    REQUIRE(cancelled->state == GestureState::Cancelled);
}
