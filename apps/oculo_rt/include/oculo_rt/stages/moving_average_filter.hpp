#pragma once

#include <cstddef>
#include <oculo/core/core.hpp>
#include <oculo/core/ring_buffer.hpp>
#include <oculo/core/vec2.hpp>
#include <oculo/plugin/interfaces.hpp>

namespace oculo_rt::stages {

struct MovingAverageConfig {
    size_t window = 5;
};

// Replaces each valid sample's position with the mean of the last `window`
// valid positions. Dropout samples pass through untouched and do not enter
// the average.
class MovingAverageFilter
    : public oculo::plugin::StagePluginBase<MovingAverageConfig> {
  public:
    MovingAverageFilter();

    size_t size() const { return positions_.size(); }

  protected:
    void onProcess(oculo::core::GazeSample &sample) override;
    void onReset() override;
    void onConfigChanged() override;

  private:
    oculo::core::RingBuffer<oculo::vec2<double>> positions_;
};

} // namespace oculo_rt::stages
