#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <oculo/core/thread.hpp>
#include <oculo/plugin/pipeline.hpp>
#include <spdlog/spdlog.h>
#include <vector>

namespace oculo_rt::managers {

// Owns the sample pipeline and drives it from its own thread: one
// waitForData() and one pass through stages and sinks per Run().
class IngestManager : public oculo::core::Thread<IngestManager> {
  public:
    IngestManager() = default;
    ~IngestManager();

    template <typename P> void SetSource(std::unique_ptr<P> source) {
        pipeline_.setSource(source.get(), source.get());
        plugins_.push_back(std::move(source));
    }

    template <typename P> void AddStage(std::unique_ptr<P> stage) {
        pipeline_.addStage(stage.get(), stage.get());
        plugins_.push_back(std::move(stage));
    }

    template <typename P> void AddSink(std::unique_ptr<P> sink) {
        pipeline_.addSink(sink.get(), sink.get());
        plugins_.push_back(std::move(sink));
    }

    // Initializes every plugin on the calling thread; plugin setup errors
    // propagate to the caller
    void Open();

    // Shuts the plugins down; call after Stop()
    void Close();

    // Resets every stage and sink on the ingest thread before the next
    // sample goes through. Safe to call from any thread.
    void RequestReset();

    bool ResetPending() const {
        return reset_requested_.load(std::memory_order_acquire);
    }

    void Init();
    void Run();
    void Shutdown();

    uint64_t Processed() const {
        return processed_.load(std::memory_order_relaxed);
    }

    const oculo::plugin::GazePipeline &pipeline() const { return pipeline_; }

  private:
    oculo::plugin::GazePipeline pipeline_;
    std::vector<std::unique_ptr<oculo::plugin::IPlugin>> plugins_;
    std::atomic<uint64_t> processed_{0};
    std::atomic<bool> reset_requested_{false};

    void applyPendingReset_();
};

} // namespace oculo_rt::managers
