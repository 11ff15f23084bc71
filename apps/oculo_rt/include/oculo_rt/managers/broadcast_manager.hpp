#pragma once

#include "oculo_rt/net/message_types.hpp"
#include "oculo_rt/net/publish_socket.hpp"
#include <atomic>
#include <chrono>
#include <glaze/json/write.hpp>
#include <memory>
#include <oculo/core/core.hpp>
#include <oculo/core/queue.hpp>
#include <oculo/core/thread.hpp>
#include <oculo/detection/tracking_session.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace oculo_rt::managers {

// Publishes detected events as they arrive and a metrics snapshot every
// `metrics_interval`.
class BroadcastManager : public oculo::core::Thread<BroadcastManager> {
  public:
    BroadcastManager(std::string address,
                     std::weak_ptr<oculo::detection::TrackingSession> session,
                     std::chrono::milliseconds metrics_interval);

    // Binds the PUB socket; throws std::runtime_error on failure
    void Open();

    void Init();
    void Shutdown();
    void Run();

    void Broadcast(net::message::BroadcastMessage message);

    // Serializes `payload` and queues it under `topic`. Payloads that fail to
    // serialize are logged and dropped.
    template <typename T>
    void Broadcast(net::message::BroadcastTopic topic, const T &payload) {
        net::message::BroadcastMessage message{.topic = topic};
        if (auto ec = glz::write_json(payload, message.payload)) {
            spdlog::warn("Failed to serialize broadcast payload: {}",
                         glz::format_error(ec));
            return;
        }

        Broadcast(std::move(message));
    }

    void BroadcastEvents(const oculo::core::DetectionResult &result);

    uint32_t Subscribers() const {
        return subscribers_.load(std::memory_order_relaxed);
    }

    ~BroadcastManager();

  private:
    void publish_(const net::message::BroadcastMessage &message);
    void publishMetrics_();

    std::string address_;
    std::weak_ptr<oculo::detection::TrackingSession> session_;
    std::chrono::milliseconds metrics_interval_;
    std::chrono::steady_clock::time_point next_metrics_;

    // Declared before pub_: the socket's pipe callbacks update it until the
    // socket is closed
    std::atomic<uint32_t> subscribers_{0};

    net::PublishSocket pub_;
    std::string send_buffer_;
    oculo::core::Queue<net::message::BroadcastMessage> message_queue_{4096};
};

} // namespace oculo_rt::managers
