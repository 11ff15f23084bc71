#undef NDEBUG
#include "oculo_rt/config/runtime_config.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

using namespace oculo_rt::config;

int main() {
    std::cout << "=== Testing RuntimeConfig ===" << std::endl;

    std::cout << "\nDefaults run the clinical preset..." << std::endl;
    RuntimeConfig defaults;
    assert(!validate(defaults));
    assert(detectorConfig(defaults).dispersion_threshold_px == 15.0);
    assert(smoothingWindow(defaults) == 1);
    assert(defaults.gaze_address == "ipc:///tmp/oculo-gaze.sock");
    assert(defaults.metrics_interval_ms == 500);

    std::cout << "Preset and overrides from JSON..." << std::endl;
    auto webcam = parseRuntimeConfig(
        R"({"preset":"webcam","metrics_interval_ms":250,"log_level":"debug"})");
    assert(webcam);
    assert(detectorConfig(*webcam).dispersion_threshold_px == 30.0);
    assert(detectorConfig(*webcam).clamp_indices);
    assert(smoothingWindow(*webcam) == 5);
    assert(webcam->metrics_interval_ms == 250);

    auto overridden = parseRuntimeConfig(
        R"({"preset":"webcam","smoothing_window":1,
            "detector":{"dispersion_threshold_px":40.0,"window_capacity":128}})");
    assert(overridden);
    assert(smoothingWindow(*overridden) == 1);
    assert(detectorConfig(*overridden).dispersion_threshold_px == 40.0);
    assert(detectorConfig(*overridden).window_capacity == 128);
    // An explicit detector block replaces the preset entirely
    assert(!detectorConfig(*overridden).clamp_indices);

    std::cout << "Bad values are rejected..." << std::endl;
    const auto invalid = std::make_error_code(std::errc::invalid_argument);
    auto bad_level = parseRuntimeConfig(R"({"log_level":"chatty"})");
    assert(!bad_level && bad_level.error() == invalid);

    auto zero_interval = parseRuntimeConfig(R"({"metrics_interval_ms":0})");
    assert(!zero_interval && zero_interval.error() == invalid);

    auto bad_detector =
        parseRuntimeConfig(R"({"detector":{"window_capacity":1}})");
    assert(!bad_detector && bad_detector.error() == invalid);

    auto bad_preset = parseRuntimeConfig(R"({"preset":"infrared"})");
    assert(!bad_preset);

    assert(parseRuntimeConfig(R"({"log_level":"off"})"));

    std::cout << "Loading from disk..." << std::endl;
    const auto path =
        std::filesystem::temp_directory_path() / "oculo-test-runtime.json";
    {
        std::ofstream out(path);
        out << R"({"reply_address":"ipc:///tmp/oculo-test-rep.sock"})";
    }
    auto loaded = loadRuntimeConfig(path);
    std::filesystem::remove(path);
    assert(loaded);
    assert(loaded->reply_address == "ipc:///tmp/oculo-test-rep.sock");

    auto missing = loadRuntimeConfig(path);
    assert(!missing);
    assert(missing.error() ==
           std::make_error_code(std::errc::no_such_file_or_directory));

    std::cout << "\n=== All RuntimeConfig tests passed ===" << std::endl;
    return 0;
}
