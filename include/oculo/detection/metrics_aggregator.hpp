#pragma once

#include "oculo/core/config.hpp"
#include "oculo/core/core.hpp"
#include "oculo/core/ring_buffer.hpp"
#include "oculo/detection/event_store.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace oculo::detection {

/**
 * Running aggregation of the session indices.
 *
 * The aggregator is fed each event as it is appended to the EventStore and
 * keeps just enough state to answer snapshot() in O(1):
 *  - fixation count, duration sum and prolonged count,
 *  - saccade and regression counts,
 *  - the number of non-parallel saccade pairs, updated against every earlier
 *    saccade on append,
 *  - the turning-angle term of every consecutive sample triple in the window,
 *    with a running sum that is re-summed exactly once per window turnover.
 *
 * compute() derives the same metrics from scratch and is the reference the
 * running values are checked against.
 */
class MetricsAggregator {
  public:
    explicit MetricsAggregator(const core::DetectorConfig &config);

    void onFixation(const core::Fixation &fixation);

    // `previous` holds every saccade recorded before this one
    void onSaccade(const core::Saccade &saccade,
                   std::span<const core::Saccade> previous);

    // Call after the sample has been pushed into `window`
    void onSample(const core::RingBuffer<core::GazeSample> &window);

    core::EyeTrackingMetrics snapshot() const;

    void reset();

    static core::EyeTrackingMetrics compute(const EventStore &store,
                                            const core::DetectorConfig &config);

    static double chaosIndex(const core::RingBuffer<core::GazeSample> &window,
                             core::AngleMode mode);

    static double
    intersectionCoefficient(std::span<const core::Saccade> saccades,
                            double parallel_epsilon);

  private:
    void resumTurns_();

    core::DetectorConfig config_;

    uint64_t fixation_count_ = 0;
    int64_t fixation_duration_sum_ = 0;
    uint64_t prolonged_count_ = 0;

    uint64_t saccade_count_ = 0;
    uint64_t regression_count_ = 0;
    uint64_t non_parallel_pairs_ = 0;

    core::RingBuffer<double> turns_;
    double turn_sum_ = 0.0;
    size_t evictions_since_resum_ = 0;
};

} // namespace oculo::detection
