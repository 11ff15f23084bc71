#pragma once

namespace oculo {

template <typename T> struct vec2 {
    T x{};
    T y{};

    constexpr vec2 operator/(T scalar) const { return {x / scalar, y / scalar}; }

    constexpr vec2 &operator+=(const vec2 &other) {
        x += other.x;
        y += other.y;
        return *this;
    }

    constexpr bool operator==(const vec2 &other) const = default;
};

// z component of the 3-D cross product; zero for parallel vectors
template <typename T> constexpr T cross(const vec2<T> &a, const vec2<T> &b) {
    return a.x * b.y - a.y * b.x;
}

} // namespace oculo
