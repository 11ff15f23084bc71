#include "oculo_rt/sources/gaze_subscriber.hpp"
#include <chrono>
#include <format>
#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

namespace oculo_rt::sources {

namespace {
constexpr glz::opts kSampleOpts{.error_on_unknown_keys = false};
}

GazeSubscriber::GazeSubscriber() { setName("gaze_subscriber"); }

void GazeSubscriber::onInit() {
    const auto &config = getConfig();

    if (auto ec =
            sub_.Init(std::chrono::milliseconds(config.receive_timeout_ms)))
        throw std::runtime_error(std::format(
            "Failed to initialize gaze socket: {}", ec.message()));

    if (auto ec = sub_.Subscribe())
        throw std::runtime_error(
            std::format("Failed to subscribe gaze socket: {}", ec.message()));

    if (auto ec = sub_.Connect(config.address))
        throw std::runtime_error(std::format(
            "Failed to connect gaze socket to {}: {}", config.address,
            ec.message()));

    spdlog::info("GazeSubscriber listening to {}", config.address);
}

void GazeSubscriber::onShutdown() {
    sub_.Shutdown();
    if (malformed_ > 0)
        spdlog::warn("GazeSubscriber: {} malformed sample(s) dropped",
                     malformed_);
}

bool GazeSubscriber::onProduce(oculo::core::GazeSample &out) {
    if (auto ec = sub_.Receive(recv_buffer_)) {
        if (net::detail::isTimeout(ec))
            return false;
        spdlog::warn("GazeSubscriber: receive failed: {}", ec.message());
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        return false;
    }

    if (auto err = glz::read<kSampleOpts>(out, recv_buffer_)) {
        if (malformed_++ == 0)
            spdlog::warn("GazeSubscriber: malformed sample: {}",
                         glz::format_error(err, recv_buffer_));
        return false;
    }
    return true;
}

} // namespace oculo_rt::sources
