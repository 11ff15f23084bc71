#pragma once

#include "oculo/core/config.hpp"
#include "oculo/core/core.hpp"
#include "oculo/detection/event_store.hpp"
#include "oculo/detection/fixation_detector.hpp"
#include "oculo/detection/metrics_aggregator.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace oculo::detection {

// One tracking session: the detector, the events it produced and the running
// metrics. processSample() is called by a single producer; every other member
// may be called from any thread.
class TrackingSession {
  public:
    explicit TrackingSession(core::DetectorConfig config);

    TrackingSession(const TrackingSession &) = delete;
    TrackingSession &operator=(const TrackingSession &) = delete;

    core::DetectionResult processSample(const core::GazeSample &sample);

    core::EyeTrackingMetrics getMetrics() const;

    // Clears events, the sample window and detector state. Does not change
    // whether the session accepts samples.
    void reset();

    // Cancellation point: samples arriving after stop() returns are rejected.
    // A fixation still open at that point is closed at the last valid sample
    // and recorded.
    void stop();
    void start();
    bool isAccepting() const;

    std::vector<core::Fixation> fixations() const;
    std::vector<core::Saccade> saccades() const;
    std::vector<core::GazeSample> window() const;
    std::optional<core::GazeSample> latestGaze() const;

    uint64_t rejectedSamples() const;

    const core::DetectorConfig &config() const { return config_; }

  private:
    const core::DetectorConfig config_;

    mutable std::mutex mutex_;
    FixationDetector detector_;
    EventStore store_;
    MetricsAggregator aggregator_;
    bool accepting_ = true;
    uint64_t rejected_ = 0;
};

} // namespace oculo::detection
