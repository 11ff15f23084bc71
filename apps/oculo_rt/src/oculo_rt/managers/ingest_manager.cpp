#include "oculo_rt/managers/ingest_manager.hpp"
#include <chrono>
#include <thread>

namespace oculo_rt::managers {

IngestManager::~IngestManager() {
    Stop();
    Close();
}

void IngestManager::Open() {
    try {
        pipeline_.init();
    } catch (...) {
        pipeline_.shutdown();
        throw;
    }
    spdlog::info("Pipeline: initialized with {} stage(s), {} sink(s)",
                 pipeline_.stageCount(), pipeline_.sinkCount());
}

void IngestManager::Close() {
    if (!pipeline_.isInitialized())
        return;
    pipeline_.shutdown();
    spdlog::info("Pipeline: shut down after {} sample(s)", Processed());
}

void IngestManager::RequestReset() {
    reset_requested_.store(true, std::memory_order_release);
}

void IngestManager::applyPendingReset_() {
    if (!reset_requested_.exchange(false, std::memory_order_acq_rel))
        return;
    pipeline_.reset();
    spdlog::info("Pipeline: reset");
}

void IngestManager::Init() {}

void IngestManager::Run() {
    auto *source = pipeline_.getSourceInterface();
    if (!source) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        return;
    }

    oculo::core::GazeSample sample{};
    if (!source->waitForData(sample, get_stop_token()))
        return;

    // Stages see the reset before the first sample that follows it
    applyPendingReset_();
    pipeline_.processData(sample);
    processed_.fetch_add(1, std::memory_order_relaxed);
}

void IngestManager::Shutdown() {}

} // namespace oculo_rt::managers
