#pragma once

#include "vec2.hpp"
#include <cmath>
#include <concepts>
#include <numbers>

namespace oculo::core {

template <typename T>
concept DoubleConvertible = std::convertible_to<T, double>;

double euclidean(const DoubleConvertible auto x0, const DoubleConvertible auto y0,
                 const DoubleConvertible auto x1, const DoubleConvertible auto y1) {
    const double dx = static_cast<double>(x1) - static_cast<double>(x0);
    const double dy = static_cast<double>(y1) - static_cast<double>(y0);
    return std::sqrt(dx * dx + dy * dy);
}

// Direction of travel from `from` to `to` in radians, in [-pi, pi]
inline double heading(const vec2<double> &from, const vec2<double> &to) {
    return std::atan2(to.y - from.y, to.x - from.x);
}

// Absolute difference of two headings. When `wrap` is set the result is
// folded into [0, pi]; otherwise it is the raw difference in [0, 2*pi].
inline double headingChange(double first, double second, bool wrap) {
    double delta = std::abs(second - first);
    if (wrap && delta > std::numbers::pi) {
        delta = 2.0 * std::numbers::pi - delta;
    }
    return delta;
}

// Turning angle at `b` along the path a -> b -> c
inline double turningAngle(const vec2<double> &a, const vec2<double> &b,
                           const vec2<double> &c, bool wrap) {
    return headingChange(heading(a, b), heading(b, c), wrap);
}

} // namespace oculo::core
