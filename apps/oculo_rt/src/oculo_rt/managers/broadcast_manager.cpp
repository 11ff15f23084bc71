#include "oculo_rt/managers/broadcast_manager.hpp"
#include <algorithm>
#include <format>
#include <glaze/glaze.hpp>
#include <stdexcept>

namespace oculo_rt::managers {

BroadcastManager::BroadcastManager(
    std::string address,
    std::weak_ptr<oculo::detection::TrackingSession> session,
    std::chrono::milliseconds metrics_interval)
    : address_(std::move(address)), session_(std::move(session)),
      metrics_interval_(metrics_interval) {}

BroadcastManager::~BroadcastManager() {
    Stop();
    pub_.Shutdown();
}

void BroadcastManager::Open() {
    std::error_code ec{};

    ec = pub_.Init();
    if (ec)
        throw std::runtime_error(std::format(
            "Failed to initialize broadcast socket: {}", ec.message()));

    pub_.RegisterConnectCallback([this](uint32_t id) {
        subscribers_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Broadcast subscriber {} connected", id);
    });

    pub_.RegisterDisconnectCallback([this](uint32_t id) {
        subscribers_.fetch_sub(1, std::memory_order_relaxed);
        spdlog::debug("Broadcast subscriber {} disconnected", id);
    });

    ec = pub_.Bind(address_);
    if (ec) {
        throw std::runtime_error(std::format(
            "Failed to bind broadcast socket to {}: {}", address_,
            ec.message()));
    }

    spdlog::info("BroadcastManager publishing on {}", address_);
}

void BroadcastManager::Init() {
    next_metrics_ = std::chrono::steady_clock::now() + metrics_interval_;
}

void BroadcastManager::Shutdown() {
    // Flush what was queued before the stop request
    while (auto message = message_queue_.try_pop())
        publish_(*message);
    pub_.Shutdown();
    spdlog::info("BroadcastManager shut down");
}

void BroadcastManager::Run() {
    const auto now = std::chrono::steady_clock::now();
    if (now >= next_metrics_) {
        publishMetrics_();
        next_metrics_ += metrics_interval_;
        if (next_metrics_ <= now)
            next_metrics_ = now + metrics_interval_;
    }

    const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        next_metrics_ - std::chrono::steady_clock::now());

    net::message::BroadcastMessage message;
    if (message_queue_.wait_for_and_pop(
            message, std::max(wait, std::chrono::milliseconds(0)),
            get_stop_token()))
        publish_(message);
}

void BroadcastManager::Broadcast(net::message::BroadcastMessage message) {
    if (message_queue_.push(std::move(message)))
        spdlog::debug("Broadcast queue full, dropped oldest message");
}

void BroadcastManager::BroadcastEvents(
    const oculo::core::DetectionResult &result) {
    if (result.fixation)
        Broadcast(net::message::BroadcastTopic::FIXATION, *result.fixation);
    if (result.saccade)
        Broadcast(net::message::BroadcastTopic::SACCADE, *result.saccade);
}

void BroadcastManager::publish_(const net::message::BroadcastMessage &message) {
    if (auto ec = glz::write_json(message, send_buffer_)) {
        spdlog::warn("Failed to serialize broadcast message: {}",
                     glz::format_error(ec));
        return;
    }

    // EAGAIN only means no subscriber can take it right now
    if (auto ec = pub_.Publish(send_buffer_);
        ec && !net::detail::isTimeout(ec)) {
        spdlog::warn("Failed to publish broadcast message: {}", ec.message());
    }
}

void BroadcastManager::publishMetrics_() {
    auto session = session_.lock();
    if (!session)
        return;

    net::message::BroadcastMessage message{
        .topic = net::message::BroadcastTopic::METRICS};
    if (auto ec = glz::write_json(session->getMetrics(), message.payload)) {
        spdlog::warn("Failed to serialize metrics: {}", glz::format_error(ec));
        return;
    }
    publish_(message);
}

} // namespace oculo_rt::managers
