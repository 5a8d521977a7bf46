#pragma once

#include <optional>
#include <string_view>

namespace lumen {

enum class Easing
{
    Linear,
    EaseIn,
    EaseOut,
    EaseInOut,
    Bounce,
    Elastic,
    Back,
};

/// Map linear progress to eased progress. `t` is clamped to [0, 1] first.
///
/// Every curve maps 0 to 0 and 1 to 1 (Elastic to within 1e-3 at 0). Back and
/// Elastic overshoot in between.
double ease(Easing easing, double t);

std::string_view to_string(Easing easing);
std::optional<Easing> easing_from_string(std::string_view name);

} // namespace lumen
