#include "oculo/core/config.hpp"
#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace oculo::core {

DetectorConfig presetConfig(Preset preset) {
    switch (preset) {
    case Preset::webcam:
        return DetectorConfig{
            .dispersion_threshold_px = 30.0,
            .min_fixation_duration_ms = 100,
            .prolonged_fixation_ms = 400,
            .window_capacity = 501,
            .parallel_epsilon = 0.001,
            .angle_mode = AngleMode::wrapped,
            .clamp_indices = true,
        };
    case Preset::clinical:
    default:
        return DetectorConfig{};
    }
}

size_t presetSmoothingWindow(Preset preset) {
    return preset == Preset::webcam ? 5 : 1;
}

std::error_code validate(const DetectorConfig &config) {
    if (!(config.dispersion_threshold_px > 0.0) ||
        config.min_fixation_duration_ms <= 0 ||
        config.prolonged_fixation_ms < 0 || config.window_capacity < 3 ||
        config.parallel_epsilon < 0.0) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    return {};
}

std::expected<DetectorConfig, std::error_code>
parseDetectorConfig(std::string_view json) {
    DetectorConfig config{};
    const std::string buffer(json);
    if (auto err = glz::read_json(config, buffer)) {
        spdlog::warn("Failed to parse detector configuration: {}",
                     glz::format_error(err, buffer));
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    if (auto ec = validate(config)) {
        spdlog::warn("Detector configuration out of range");
        return std::unexpected(ec);
    }
    return config;
}

std::expected<DetectorConfig, std::error_code>
loadDetectorConfig(const std::filesystem::path &path) {
    std::error_code fs_ec;
    if (!std::filesystem::is_regular_file(path, fs_ec)) {
        return std::unexpected(
            std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::string buffer;
    if (auto err = glz::file_to_buffer(buffer, path.string());
        err != glz::error_code::none) {
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
    return parseDetectorConfig(buffer);
}

} // namespace oculo::core
