#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <oculo/core/config.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace oculo_rt::config {

struct RuntimeConfig {
    std::string log_level = "info";

    // Starting point for detection; `detector` and `smoothing_window`
    // override the preset's values when present
    oculo::core::Preset preset = oculo::core::Preset::clinical;
    std::optional<oculo::core::DetectorConfig> detector;
    std::optional<size_t> smoothing_window;

    std::string gaze_address = "ipc:///tmp/oculo-gaze.sock";
    std::string publish_address = "ipc:///tmp/oculo-pub.sock";
    std::string reply_address = "ipc:///tmp/oculo-rep.sock";

    uint32_t metrics_interval_ms = 500;
    bool publish_events = true;
};

oculo::core::DetectorConfig detectorConfig(const RuntimeConfig &config);

size_t smoothingWindow(const RuntimeConfig &config);

std::error_code validate(const RuntimeConfig &config);

std::expected<RuntimeConfig, std::error_code>
parseRuntimeConfig(std::string_view json);

std::expected<RuntimeConfig, std::error_code>
loadRuntimeConfig(const std::filesystem::path &path);

} // namespace oculo_rt::config
