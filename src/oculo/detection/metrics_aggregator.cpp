#include "oculo/detection/metrics_aggregator.hpp"
#include "oculo/core/utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace oculo::detection {

namespace {

bool nonParallel(const core::Saccade &a, const core::Saccade &b,
                 double epsilon) {
    return std::abs(cross(a.direction(), b.direction())) > epsilon;
}

double pairCount(uint64_t n) {
    return static_cast<double>(n) * static_cast<double>(n - 1) / 2.0;
}

core::EyeTrackingMetrics clampIndices(core::EyeTrackingMetrics metrics,
                                      const core::DetectorConfig &config) {
    if (config.clamp_indices) {
        metrics.chaos_index = std::min(metrics.chaos_index, 1.0);
        metrics.fixation_intersection_coefficient =
            std::min(metrics.fixation_intersection_coefficient, 1.0);
    }
    return metrics;
}

const core::DetectorConfig &checked(const core::DetectorConfig &config) {
    if (core::validate(config))
        throw std::invalid_argument("Invalid detector configuration");
    return config;
}

} // namespace

MetricsAggregator::MetricsAggregator(const core::DetectorConfig &config)
    : config_(checked(config)), turns_(config_.window_capacity - 2) {}

void MetricsAggregator::onFixation(const core::Fixation &fixation) {
    ++fixation_count_;
    fixation_duration_sum_ += fixation.duration_ms;
    if (fixation.duration_ms > config_.prolonged_fixation_ms)
        ++prolonged_count_;
}

void MetricsAggregator::onSaccade(const core::Saccade &saccade,
                                  std::span<const core::Saccade> previous) {
    for (const auto &earlier : previous) {
        if (nonParallel(earlier, saccade, config_.parallel_epsilon))
            ++non_parallel_pairs_;
    }
    ++saccade_count_;
    if (saccade.is_regression)
        ++regression_count_;
}

void MetricsAggregator::onSample(
    const core::RingBuffer<core::GazeSample> &window) {
    const size_t n = window.size();
    if (n < 3)
        return;

    const double term = core::turningAngle(
        window[n - 3].position(), window[n - 2].position(),
        window[n - 1].position(), config_.angle_mode == core::AngleMode::wrapped);

    turn_sum_ += term;
    if (auto evicted = turns_.push(term)) {
        turn_sum_ -= *evicted;
        if (++evictions_since_resum_ >= turns_.capacity())
            resumTurns_();
    }
}

void MetricsAggregator::resumTurns_() {
    double sum = 0.0;
    for (size_t i = 0; i < turns_.size(); ++i)
        sum += turns_[i];
    turn_sum_ = sum;
    evictions_since_resum_ = 0;
}

core::EyeTrackingMetrics MetricsAggregator::snapshot() const {
    core::EyeTrackingMetrics metrics;
    metrics.total_fixations = fixation_count_;
    metrics.average_fixation_duration =
        fixation_count_ > 0 ? static_cast<double>(fixation_duration_sum_) /
                                  static_cast<double>(fixation_count_)
                            : 0.0;
    metrics.regression_count = regression_count_;
    metrics.prolonged_fixations = prolonged_count_;
    metrics.chaos_index =
        turns_.empty() ? 0.0
                       : std::max(0.0, turn_sum_) /
                             static_cast<double>(turns_.size());
    metrics.fixation_intersection_coefficient =
        saccade_count_ > 1 ? static_cast<double>(non_parallel_pairs_) /
                                 pairCount(saccade_count_)
                           : 0.0;
    return clampIndices(metrics, config_);
}

void MetricsAggregator::reset() {
    fixation_count_ = 0;
    fixation_duration_sum_ = 0;
    prolonged_count_ = 0;
    saccade_count_ = 0;
    regression_count_ = 0;
    non_parallel_pairs_ = 0;
    turns_.clear();
    turn_sum_ = 0.0;
    evictions_since_resum_ = 0;
}

core::EyeTrackingMetrics
MetricsAggregator::compute(const EventStore &store,
                           const core::DetectorConfig &config) {
    const auto &fixations = store.fixations();
    const auto &saccades = store.saccades();

    core::EyeTrackingMetrics metrics;
    metrics.total_fixations = fixations.size();

    int64_t duration_sum = 0;
    for (const auto &fixation : fixations) {
        duration_sum += fixation.duration_ms;
        if (fixation.duration_ms > config.prolonged_fixation_ms)
            ++metrics.prolonged_fixations;
    }
    if (!fixations.empty()) {
        metrics.average_fixation_duration =
            static_cast<double>(duration_sum) /
            static_cast<double>(fixations.size());
    }

    metrics.regression_count = static_cast<uint64_t>(
        std::count_if(saccades.begin(), saccades.end(),
                      [](const core::Saccade &s) { return s.is_regression; }));

    metrics.chaos_index = chaosIndex(store.window(), config.angle_mode);
    metrics.fixation_intersection_coefficient =
        intersectionCoefficient(saccades, config.parallel_epsilon);

    return clampIndices(metrics, config);
}

double
MetricsAggregator::chaosIndex(const core::RingBuffer<core::GazeSample> &window,
                              core::AngleMode mode) {
    const size_t n = window.size();
    if (n < 3)
        return 0.0;

    const bool wrap = mode == core::AngleMode::wrapped;
    double total = 0.0;
    for (size_t i = 2; i < n; ++i) {
        total += core::turningAngle(window[i - 2].position(),
                                    window[i - 1].position(),
                                    window[i].position(), wrap);
    }
    return total / static_cast<double>(n - 2);
}

double MetricsAggregator::intersectionCoefficient(
    std::span<const core::Saccade> saccades, double parallel_epsilon) {
    const size_t n = saccades.size();
    if (n < 2)
        return 0.0;

    uint64_t non_parallel = 0;
    for (size_t i = 0; i + 1 < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (nonParallel(saccades[i], saccades[j], parallel_epsilon))
                ++non_parallel;
        }
    }
    return static_cast<double>(non_parallel) / pairCount(n);
}

} // namespace oculo::detection
