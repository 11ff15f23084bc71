#pragma once

#include "oculo_rt/net/subscribe_socket.hpp"
#include <cstdint>
#include <oculo/core/core.hpp>
#include <oculo/plugin/interfaces.hpp>
#include <string>

namespace oculo_rt::sources {

struct GazeSubscriberConfig {
    std::string address = "ipc:///tmp/oculo-gaze.sock";
    uint32_t receive_timeout_ms = 100;
};

// Receives JSON-encoded GazeSample objects from the tracker adapter's PUB
// socket. Unknown keys in a sample are ignored.
class GazeSubscriber
    : public oculo::plugin::SourcePluginBase<GazeSubscriberConfig> {
  public:
    GazeSubscriber();

    uint64_t malformed() const { return malformed_; }

  protected:
    void onInit() override;
    void onShutdown() override;
    bool onProduce(oculo::core::GazeSample &out) override;

  private:
    net::SubscribeSocket sub_;
    std::string recv_buffer_;
    uint64_t malformed_ = 0;
};

} // namespace oculo_rt::sources
