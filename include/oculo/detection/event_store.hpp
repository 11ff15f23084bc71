#pragma once

#include "oculo/core/core.hpp"
#include "oculo/core/ring_buffer.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace oculo::detection {

// Append-only event sequences for one tracking session, plus a bounded window
// of the most recent valid samples.
class EventStore {
  public:
    explicit EventStore(size_t window_capacity);

    void appendFixation(const core::Fixation &fixation);
    void appendSaccade(const core::Saccade &saccade);

    // Returns the sample pushed out of the window, if it was full
    std::optional<core::GazeSample> recordSample(const core::GazeSample &sample);

    const std::vector<core::Fixation> &fixations() const { return fixations_; }
    const std::vector<core::Saccade> &saccades() const { return saccades_; }
    const core::RingBuffer<core::GazeSample> &window() const { return window_; }

    bool empty() const {
        return fixations_.empty() && saccades_.empty() && window_.empty();
    }

    void clear();

  private:
    std::vector<core::Fixation> fixations_;
    std::vector<core::Saccade> saccades_;
    core::RingBuffer<core::GazeSample> window_;
};

} // namespace oculo::detection
