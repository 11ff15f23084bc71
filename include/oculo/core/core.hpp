#pragma once

#include "vec2.hpp"
#include <cstdint>
#include <optional>

namespace oculo::core {

// One gaze sample as delivered by the tracker adapter. Coordinates are
// screen pixels, timestamps are milliseconds on the tracker clock.
struct GazeSample {
    float x{};
    float y{};
    int64_t timestamp_ms{};
    bool left_valid{};
    bool right_valid{};
    float left_pupil_diameter{};
    float right_pupil_diameter{};

    // Dropout frames carry neither eye and never reach the detector
    bool isValid() const { return left_valid || right_valid; }

    vec2<double> position() const {
        return {static_cast<double>(x), static_cast<double>(y)};
    }
};

struct Fixation {
    float x{};
    float y{};
    int64_t duration_ms{};
    int64_t start_timestamp_ms{};
};

struct Saccade {
    float start_x{};
    float start_y{};
    float end_x{};
    float end_y{};
    int64_t duration_ms{};
    bool is_regression{};

    vec2<double> direction() const {
        return {static_cast<double>(end_x) - static_cast<double>(start_x),
                static_cast<double>(end_y) - static_cast<double>(start_y)};
    }
};

struct EyeTrackingMetrics {
    uint64_t total_fixations{0};
    double average_fixation_duration{0.0};
    uint64_t regression_count{0};
    uint64_t prolonged_fixations{0};
    double chaos_index{0.0};
    double fixation_intersection_coefficient{0.0};

    bool operator==(const EyeTrackingMetrics &other) const = default;
};

// Events produced by a single processed sample
struct DetectionResult {
    std::optional<Fixation> fixation;
    std::optional<Saccade> saccade;

    bool empty() const { return !fixation && !saccade; }
};

} // namespace oculo::core
