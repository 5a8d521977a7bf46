#include "easing.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <utility>

namespace lumen {

namespace {

double bounce_out(double t)
{
    constexpr double n = 7.5625;
    constexpr double d = 2.75;

    if (t < 1.0 / d)
        return n * t * t;
    if (t < 2.0 / d)
    {
        t -= 1.5 / d;
        return n * t * t + 0.75;
    }
    if (t < 2.5 / d)
    {
        t -= 2.25 / d;
        return n * t * t + 0.9375;
    }
    t -= 2.625 / d;
    return n * t * t + 0.984375;
}

constexpr std::array<std::pair<Easing, std::string_view>, 7> EASING_NAMES = { {
    { Easing::Linear, "linear" },
    { Easing::EaseIn, "ease-in" },
    { Easing::EaseOut, "ease-out" },
    { Easing::EaseInOut, "ease-in-out" },
    { Easing::Bounce, "bounce" },
    { Easing::Elastic, "elastic" },
    { Easing::Back, "back" },
} };

} // namespace

double ease(Easing easing, double t)
{
    t = std::clamp(t, 0.0, 1.0);

    switch (easing)
    {
        case Easing::Linear:
            return t;
        case Easing::EaseIn:
            return t * t;
        case Easing::EaseOut:
            return t * (2.0 - t);
        case Easing::EaseInOut:
            return t < 0.5 ? 2.0 * t * t : -1.0 + (4.0 - 2.0 * t) * t;
        case Easing::Bounce:
            return bounce_out(t);
        case Easing::Elastic:
        {
            if (t >= 1.0)
                return 1.0;
            constexpr double p = 0.3;
            constexpr double s = p / 4.0;
            return -(std::pow(2.0, 10.0 * (t - 1.0)) * std::sin((t - 1.0 - s) * 2.0 * std::numbers::pi / p));
        }
        case Easing::Back:
        {
            constexpr double s = 1.70158;
            return t * t * ((s + 1.0) * t - s);
        }
    }
    return t;
}

std::string_view to_string(Easing easing)
{
    for (auto const& [value, name] : EASING_NAMES)
    {
        if (value == easing)
            return name;
    }
    return "linear";
}

std::optional<Easing> easing_from_string(std::string_view name)
{
    for (auto const& [value, candidate] : EASING_NAMES)
    {
        if (candidate == name)
            return value;
    }
    return std::nullopt;
}

} // namespace lumen
