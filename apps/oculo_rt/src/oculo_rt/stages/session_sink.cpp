#include "oculo_rt/stages/session_sink.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace oculo_rt::stages {

SessionSink::SessionSink(
    std::shared_ptr<oculo::detection::TrackingSession> session,
    EventCallback on_events)
    : session_(std::move(session)), on_events_(std::move(on_events)) {
    if (!session_)
        throw std::invalid_argument("SessionSink requires a session");
    setName("session_sink");
}

void SessionSink::onConsume(const oculo::core::GazeSample &sample) {
    ++consumed_;
    auto result = session_->processSample(sample);
    if (!result.empty() && on_events_)
        on_events_(result);
}

void SessionSink::onReset() { session_->reset(); }

void SessionSink::onShutdown() {
    spdlog::info("SessionSink: {} sample(s) consumed", consumed_);
}

} // namespace oculo_rt::stages
