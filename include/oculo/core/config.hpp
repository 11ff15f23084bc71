#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <glaze/core/meta.hpp>
#include <string_view>
#include <system_error>

namespace oculo::core {

// How the chaos index treats heading changes that cross the +/-pi seam
enum class AngleMode : uint8_t {
    wrapped, // fold into [0, pi]
    literal, // raw |a2 - a1|, up to 2*pi
};

enum class Preset : uint8_t {
    clinical, // hardware trackers with sub-degree precision
    webcam,   // camera-based trackers
};

struct DetectorConfig {
    double dispersion_threshold_px = 15.0;
    int64_t min_fixation_duration_ms = 80;
    int64_t prolonged_fixation_ms = 400;
    size_t window_capacity = 1001;
    double parallel_epsilon = 0.001;
    AngleMode angle_mode = AngleMode::wrapped;
    bool clamp_indices = false;
};

DetectorConfig presetConfig(Preset preset);

// Moving-average length applied before detection; 1 disables smoothing
size_t presetSmoothingWindow(Preset preset);

std::error_code validate(const DetectorConfig &config);

std::expected<DetectorConfig, std::error_code>
parseDetectorConfig(std::string_view json);

std::expected<DetectorConfig, std::error_code>
loadDetectorConfig(const std::filesystem::path &path);

} // namespace oculo::core

template <> struct glz::meta<oculo::core::AngleMode> {
    using enum oculo::core::AngleMode;
    static constexpr auto value = enumerate(wrapped, literal);
};

template <> struct glz::meta<oculo::core::Preset> {
    using enum oculo::core::Preset;
    static constexpr auto value = enumerate(clinical, webcam);
};
