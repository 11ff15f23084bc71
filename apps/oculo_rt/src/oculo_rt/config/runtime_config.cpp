#include "oculo_rt/config/runtime_config.hpp"
#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>

namespace oculo_rt::config {

oculo::core::DetectorConfig detectorConfig(const RuntimeConfig &config) {
    if (config.detector)
        return *config.detector;
    return oculo::core::presetConfig(config.preset);
}

size_t smoothingWindow(const RuntimeConfig &config) {
    if (config.smoothing_window)
        return *config.smoothing_window;
    return oculo::core::presetSmoothingWindow(config.preset);
}

std::error_code validate(const RuntimeConfig &config) {
    const auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("Unknown log level '{}'", config.log_level);
        return std::make_error_code(std::errc::invalid_argument);
    }

    if (config.metrics_interval_ms == 0 || smoothingWindow(config) == 0) {
        spdlog::warn("Runtime intervals must be positive");
        return std::make_error_code(std::errc::invalid_argument);
    }

    if (config.gaze_address.empty() || config.publish_address.empty() ||
        config.reply_address.empty()) {
        spdlog::warn("Socket addresses must not be empty");
        return std::make_error_code(std::errc::invalid_argument);
    }

    return oculo::core::validate(detectorConfig(config));
}

std::expected<RuntimeConfig, std::error_code>
parseRuntimeConfig(std::string_view json) {
    RuntimeConfig config{};
    const std::string buffer(json);
    if (auto err = glz::read_json(config, buffer)) {
        spdlog::warn("Failed to parse runtime configuration: {}",
                     glz::format_error(err, buffer));
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    if (auto ec = validate(config))
        return std::unexpected(ec);
    return config;
}

std::expected<RuntimeConfig, std::error_code>
loadRuntimeConfig(const std::filesystem::path &path) {
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
    return parseRuntimeConfig(buffer);
}

} // namespace oculo_rt::config
