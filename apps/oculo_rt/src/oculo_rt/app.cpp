#include "oculo_rt/app.hpp"
#include "oculo_rt/sources/gaze_subscriber.hpp"
#include "oculo_rt/stages/moving_average_filter.hpp"
#include "oculo_rt/stages/session_sink.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

namespace oculo_rt {

namespace {

std::atomic<bool> g_shutdown_requested{false};

void handleSignal(int) {
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}

} // namespace

App::App(int argc, char **argv) {
    if (argc > 1)
        config_path_ = std::filesystem::path(argv[1]);
}

App::~App() = default;

config::RuntimeConfig App::loadConfig_() const {
    if (!config_path_)
        return config::RuntimeConfig{};

    auto loaded = config::loadRuntimeConfig(*config_path_);
    if (!loaded)
        throw std::runtime_error(
            std::format("Failed to load configuration {}: {}",
                        config_path_->string(), loaded.error().message()));
    return loaded.value();
}

void App::buildPipeline_() {
    auto source = std::make_unique<sources::GazeSubscriber>();
    source->setConfig({.address = config_.gaze_address});
    ingestManager_->SetSource(std::move(source));

    if (const size_t window = config::smoothingWindow(config_); window > 1) {
        auto smoothing = std::make_unique<stages::MovingAverageFilter>();
        smoothing->setConfig({.window = window});
        ingestManager_->AddStage(std::move(smoothing));
    }

    stages::SessionSink::EventCallback on_events;
    if (config_.publish_events) {
        on_events = [broadcast = std::weak_ptr<managers::BroadcastManager>(
                         broadcastManager_)](
                        const oculo::core::DetectionResult &result) {
            if (auto manager = broadcast.lock())
                manager->BroadcastEvents(result);
        };
    }
    ingestManager_->AddSink(
        std::make_unique<stages::SessionSink>(session_, std::move(on_events)));
}

void App::Launch() {
    config_ = loadConfig_();
    spdlog::set_level(spdlog::level::from_str(config_.log_level));

    session_ = std::make_shared<oculo::detection::TrackingSession>(
        config::detectorConfig(config_));
    broadcastManager_ = std::make_shared<managers::BroadcastManager>(
        config_.publish_address, session_,
        std::chrono::milliseconds(config_.metrics_interval_ms));
    ingestManager_ = std::make_shared<managers::IngestManager>();
    messageManager_ = std::make_shared<managers::MessageManager>(
        config_.reply_address, session_, ingestManager_);
    buildPipeline_();

    broadcastManager_->Open();
    messageManager_->Open();
    ingestManager_->Open();

    g_shutdown_requested.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    broadcastManager_->Spawn();
    messageManager_->Spawn();
    ingestManager_->Spawn();
    spdlog::info("oculo_rt running");

    while (!g_shutdown_requested.load(std::memory_order_relaxed))
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    spdlog::info("Shutting down");

    // Producer first so the last events still reach the broadcast queue
    ingestManager_->Stop();
    ingestManager_->Close();
    session_->stop();

    messageManager_->Stop();
    broadcastManager_->Stop();
}

} // namespace oculo_rt
