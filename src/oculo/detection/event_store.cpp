#include "oculo/detection/event_store.hpp"

namespace oculo::detection {

EventStore::EventStore(size_t window_capacity) : window_(window_capacity) {}

void EventStore::appendFixation(const core::Fixation &fixation) {
    fixations_.push_back(fixation);
}

void EventStore::appendSaccade(const core::Saccade &saccade) {
    saccades_.push_back(saccade);
}

std::optional<core::GazeSample>
EventStore::recordSample(const core::GazeSample &sample) {
    return window_.push(sample);
}

void EventStore::clear() {
    fixations_.clear();
    saccades_.clear();
    window_.clear();
}

} // namespace oculo::detection
