#include "oculo/detection/fixation_detector.hpp"
#include "oculo/core/utils.hpp"
#include <stdexcept>
#include <utility>

namespace oculo::detection {

namespace {
template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
} // namespace

Transition step(const DetectorState &current, const core::GazeSample &sample,
                bool steady, const core::DetectorConfig &config) {
    return std::visit(
        overloaded{
            [&](const state::Idle &) -> Transition {
                if (!steady)
                    return {state::Idle{}, std::nullopt};
                return {state::InFixation{
                            {sample.x, sample.y, sample.timestamp_ms}},
                        std::nullopt};
            },
            [&](const state::InFixation &open) -> Transition {
                if (steady)
                    return {open, std::nullopt};

                const auto &anchor = open.anchor;
                const int64_t duration =
                    sample.timestamp_ms - anchor.start_timestamp_ms;
                if (duration < config.min_fixation_duration_ms)
                    return {state::Idle{}, std::nullopt};

                return {state::Idle{},
                        core::Fixation{anchor.x, anchor.y, duration,
                                       anchor.start_timestamp_ms}};
            },
        },
        current);
}

FixationDetector::FixationDetector(core::DetectorConfig config)
    : config_(config) {
    if (core::validate(config_)) {
        throw std::invalid_argument("Invalid detector configuration");
    }
}

core::DetectionResult
FixationDetector::processSample(const core::GazeSample &sample) {
    if (!sample.isValid())
        return {};

    if (!last_valid_) {
        last_valid_ = sample;
        return {};
    }

    const core::GazeSample previous = *last_valid_;
    const double d =
        core::euclidean(previous.x, previous.y, sample.x, sample.y);
    const bool steady = d < config_.dispersion_threshold_px;

    core::DetectionResult result;
    auto transition = step(state_, sample, steady, config_);
    state_ = std::move(transition.next);
    result.fixation = transition.fixation;

    if (!steady) {
        result.saccade = core::Saccade{
            .start_x = previous.x,
            .start_y = previous.y,
            .end_x = sample.x,
            .end_y = sample.y,
            .duration_ms = sample.timestamp_ms - previous.timestamp_ms,
            .is_regression = sample.x < previous.x,
        };
    }

    last_valid_ = sample;
    return result;
}

std::optional<core::Fixation> FixationDetector::flush() {
    const auto *open = std::get_if<state::InFixation>(&state_);
    if (!open || !last_valid_)
        return std::nullopt;

    const auto anchor = open->anchor;
    state_ = state::Idle{};

    const int64_t duration =
        last_valid_->timestamp_ms - anchor.start_timestamp_ms;
    if (duration < config_.min_fixation_duration_ms)
        return std::nullopt;
    return core::Fixation{anchor.x, anchor.y, duration,
                          anchor.start_timestamp_ms};
}

void FixationDetector::reset() {
    state_ = state::Idle{};
    last_valid_.reset();
}

} // namespace oculo::detection
