#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <oculo/core/core.hpp>
#include <oculo/detection/tracking_session.hpp>
#include <oculo/plugin/interfaces.hpp>

namespace oculo_rt::stages {

// Terminal sink: feeds every sample into the tracking session and reports
// the events it produced.
class SessionSink
    : public oculo::plugin::PluginBase<oculo::plugin::GazeSinkBase> {
  public:
    using EventCallback =
        std::function<void(const oculo::core::DetectionResult &)>;

    explicit SessionSink(
        std::shared_ptr<oculo::detection::TrackingSession> session,
        EventCallback on_events = {});

    uint64_t consumed() const { return consumed_; }

  protected:
    void onConsume(const oculo::core::GazeSample &sample) override;
    void onReset() override;
    void onShutdown() override;

  private:
    std::shared_ptr<oculo::detection::TrackingSession> session_;
    EventCallback on_events_;
    uint64_t consumed_ = 0;
};

} // namespace oculo_rt::stages
