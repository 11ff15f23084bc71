#pragma once

#include "oculo/core/config.hpp"
#include "oculo/core/core.hpp"
#include <cstdint>
#include <optional>
#include <variant>

namespace oculo::detection {

struct FixationAnchor {
    float x{};
    float y{};
    int64_t start_timestamp_ms{};
};

namespace state {
// No steady run in progress
struct Idle {};

// Steady run in progress, anchored at its first sample
struct InFixation {
    FixationAnchor anchor;
};
} // namespace state

using DetectorState = std::variant<state::Idle, state::InFixation>;

struct Transition {
    DetectorState next;
    std::optional<core::Fixation> fixation;
};

// Applies one valid sample to the fixation state. `steady` is whether the
// sample stayed within the dispersion threshold of the previous valid one.
//
//   Idle       + steady -> InFixation(anchor = sample)
//   Idle       + jump   -> Idle
//   InFixation + steady -> InFixation (anchor unchanged)
//   InFixation + jump   -> Idle, Fixation if duration >= minimum
Transition step(const DetectorState &current, const core::GazeSample &sample,
                bool steady, const core::DetectorConfig &config);

// Dispersion-threshold classifier. One call per sample, O(1) work, no
// failure path: dropout samples are ignored.
//
// Gaps caused by invalid samples are invisible to duration accounting; a
// fixation keeps running across a dropout burst and its duration includes
// the gap.
class FixationDetector {
  public:
    explicit FixationDetector(core::DetectorConfig config);

    core::DetectionResult processSample(const core::GazeSample &sample);

    // Closes an open fixation at the last valid sample, as when the stream
    // ends without a terminating jump. The fixation is returned only if it
    // meets the minimum duration. The last valid sample is kept.
    std::optional<core::Fixation> flush();

    void reset();

    const DetectorState &state() const { return state_; }

    bool inFixation() const {
        return std::holds_alternative<state::InFixation>(state_);
    }

    const std::optional<core::GazeSample> &lastValidSample() const {
        return last_valid_;
    }

    const core::DetectorConfig &config() const { return config_; }

  private:
    core::DetectorConfig config_;
    DetectorState state_;
    std::optional<core::GazeSample> last_valid_;
};

} // namespace oculo::detection
