#include "oculo/detection/tracking_session.hpp"
#include <spdlog/spdlog.h>

namespace oculo::detection {

TrackingSession::TrackingSession(core::DetectorConfig config)
    : config_(config), detector_(config_), store_(config_.window_capacity),
      aggregator_(config_) {
    spdlog::info("Session: dispersion {} px, min fixation {} ms, window {}",
                 config_.dispersion_threshold_px,
                 config_.min_fixation_duration_ms, config_.window_capacity);
}

core::DetectionResult
TrackingSession::processSample(const core::GazeSample &sample) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!accepting_) {
        if (rejected_++ == 0)
            spdlog::debug("Session: stopped, rejecting samples");
        return {};
    }

    if (!sample.isValid())
        return {};

    auto result = detector_.processSample(sample);

    store_.recordSample(sample);
    aggregator_.onSample(store_.window());

    if (result.fixation) {
        aggregator_.onFixation(*result.fixation);
        store_.appendFixation(*result.fixation);
    }

    if (result.saccade) {
        aggregator_.onSaccade(*result.saccade, store_.saccades());
        store_.appendSaccade(*result.saccade);
    }

    return result;
}

core::EyeTrackingMetrics TrackingSession::getMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregator_.snapshot();
}

void TrackingSession::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    detector_.reset();
    store_.clear();
    aggregator_.reset();
    rejected_ = 0;
    spdlog::info("Session: reset");
}

void TrackingSession::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_)
        return;
    accepting_ = false;

    if (auto fixation = detector_.flush()) {
        aggregator_.onFixation(*fixation);
        store_.appendFixation(*fixation);
    }
    spdlog::info("Session: stopped after {} fixation(s), {} saccade(s)",
                 store_.fixations().size(), store_.saccades().size());
}

void TrackingSession::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (accepting_)
        return;
    accepting_ = true;
    if (rejected_ > 0)
        spdlog::info("Session: resumed, {} sample(s) were rejected while stopped",
                     rejected_);
    rejected_ = 0;
}

bool TrackingSession::isAccepting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepting_;
}

std::vector<core::Fixation> TrackingSession::fixations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.fixations();
}

std::vector<core::Saccade> TrackingSession::saccades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.saccades();
}

std::vector<core::GazeSample> TrackingSession::window() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.window().toVector();
}

std::optional<core::GazeSample> TrackingSession::latestGaze() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detector_.lastValidSample();
}

uint64_t TrackingSession::rejectedSamples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

} // namespace oculo::detection
