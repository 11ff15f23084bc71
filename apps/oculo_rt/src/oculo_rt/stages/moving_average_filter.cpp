#include "oculo_rt/stages/moving_average_filter.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace oculo_rt::stages {

MovingAverageFilter::MovingAverageFilter()
    : positions_(MovingAverageConfig{}.window) {
    setName("moving_average_filter");
}

void MovingAverageFilter::onProcess(oculo::core::GazeSample &sample) {
    if (!sample.isValid())
        return;

    positions_.push(sample.position());

    oculo::vec2<double> sum{};
    for (size_t i = 0; i < positions_.size(); ++i)
        sum += positions_[i];

    const auto mean = sum / static_cast<double>(positions_.size());
    sample.x = static_cast<float>(mean.x);
    sample.y = static_cast<float>(mean.y);
}

void MovingAverageFilter::onReset() {
    positions_.clear();
}

void MovingAverageFilter::onConfigChanged() {
    const size_t window = std::max<size_t>(getConfig().window, 1);
    if (getConfig().window == 0)
        spdlog::warn("Smoothing window of 0 treated as 1 (no smoothing)");

    positions_ = oculo::core::RingBuffer<oculo::vec2<double>>(window);
    spdlog::debug("Smoothing over {} sample(s)", window);
}

} // namespace oculo_rt::stages
