#undef NDEBUG
#include "oculo_rt/managers/ingest_manager.hpp"
#include "oculo_rt/stages/moving_average_filter.hpp"
#include "oculo_rt/stages/session_sink.hpp"
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <oculo/core/core.hpp>
#include <oculo/detection/tracking_session.hpp>
#include <oculo/plugin/pipeline.hpp>
#include <string>
#include <thread>
#include <vector>

using namespace oculo_rt;
using namespace std::chrono_literals;

namespace {

oculo::core::GazeSample sample(float x, float y, int64_t t) {
    return oculo::core::GazeSample{.x = x,
                                   .y = y,
                                   .timestamp_ms = t,
                                   .left_valid = true,
                                   .right_valid = true};
}

struct ScriptConfig {
    size_t repeat = 1;
};

// Replays a fixed list of samples from the producer thread
class ScriptedSource : public oculo::plugin::SourcePluginBase<ScriptConfig> {
  public:
    explicit ScriptedSource(std::vector<oculo::core::GazeSample> script)
        : script_(std::move(script)) {
        setName("scripted_source");
    }

    void append(const oculo::core::GazeSample &s) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(s);
    }

  protected:
    bool onProduce(oculo::core::GazeSample &out) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (next_ >= script_.size()) {
            std::this_thread::sleep_for(1ms);
            return false;
        }
        out = script_[next_++];
        return true;
    }

  private:
    std::mutex mutex_;
    std::vector<oculo::core::GazeSample> script_;
    size_t next_ = 0;
};

// Records lifecycle calls into a shared journal
class RecordingSink
    : public oculo::plugin::PluginBase<oculo::plugin::GazeSinkBase> {
  public:
    RecordingSink(std::string tag, std::vector<std::string> &journal)
        : tag_(std::move(tag)), journal_(journal) {}

    std::vector<oculo::core::GazeSample> seen;

  protected:
    void onInit() override { journal_.push_back(tag_ + ":init"); }
    void onShutdown() override { journal_.push_back(tag_ + ":shutdown"); }
    void onReset() override { journal_.push_back(tag_ + ":reset"); }
    void onConsume(const oculo::core::GazeSample &s) override {
        seen.push_back(s);
    }

  private:
    std::string tag_;
    std::vector<std::string> &journal_;
};

class OffsetStage
    : public oculo::plugin::PluginBase<oculo::plugin::GazeStageBase> {
  public:
    explicit OffsetStage(std::vector<std::string> &journal)
        : journal_(journal) {}

  protected:
    void onInit() override { journal_.push_back("stage:init"); }
    void onShutdown() override { journal_.push_back("stage:shutdown"); }
    void onReset() override { journal_.push_back("stage:reset"); }
    void onProcess(oculo::core::GazeSample &s) override { s.x += 10.0f; }

  private:
    std::vector<std::string> &journal_;
};

void testLifecycleAndOrder() {
    std::cout << "\nPipeline sequences lifecycle and data..." << std::endl;
    std::vector<std::string> journal;
    OffsetStage stage(journal);
    RecordingSink first("first", journal);
    RecordingSink second("second", journal);

    oculo::plugin::GazePipeline pipeline;
    pipeline.addStage(&stage, &stage);
    pipeline.addSink(&first, &first);
    pipeline.addSink(&second, &second);
    assert(pipeline.getSourceInterface() == nullptr);
    assert(pipeline.stageCount() == 1 && pipeline.sinkCount() == 2);

    pipeline.init();
    assert(pipeline.isInitialized());
    assert((journal == std::vector<std::string>{"first:init", "second:init",
                                                "stage:init"}));

    pipeline.processData(sample(1, 2, 3));
    assert(first.seen.size() == 1 && second.seen.size() == 1);
    assert(first.seen[0].x == 11.0f && second.seen[0].x == 11.0f);

    journal.clear();
    pipeline.reset();
    assert((journal == std::vector<std::string>{"stage:reset", "first:reset",
                                                "second:reset"}));

    journal.clear();
    pipeline.shutdown();
    assert(!pipeline.isInitialized());
    assert((journal == std::vector<std::string>{
                           "stage:shutdown", "first:shutdown",
                           "second:shutdown"}));
}

void testSourceCancel() {
    std::cout << "Cancelling a source releases a blocked reader..."
              << std::endl;
    ScriptedSource source(std::vector<oculo::core::GazeSample>{});
    source.init();

    std::atomic<bool> returned{false};
    std::jthread reader([&](std::stop_token stoken) {
        oculo::core::GazeSample out{};
        const bool got = source.waitForData(out, stoken);
        assert(!got);
        returned.store(true);
    });

    std::this_thread::sleep_for(20ms);
    assert(!returned.load());
    reader.request_stop();
    reader.join();
    assert(returned.load());

    source.shutdown();
}

void testIngestEndToEnd() {
    std::cout << "IngestManager drives source, stages and session..."
              << std::endl;
    std::vector<oculo::core::GazeSample> script;
    int64_t t = 0;
    for (float x : {100.0f, 300.0f, 120.0f, 500.0f}) {
        for (int i = 0; i < 12; ++i) {
            script.push_back(sample(x + (i % 2), 400.0f, t));
            t += 16;
        }
    }

    auto session = std::make_shared<oculo::detection::TrackingSession>(
        oculo::core::DetectorConfig{});
    std::atomic<size_t> events{0};

    managers::IngestManager ingest;
    ingest.SetSource(std::make_unique<ScriptedSource>(script));
    auto smoothing = std::make_unique<stages::MovingAverageFilter>();
    smoothing->setConfig({.window = 2});
    ingest.AddStage(std::move(smoothing));
    ingest.AddSink(std::make_unique<stages::SessionSink>(
        session, [&](const oculo::core::DetectionResult &) { ++events; }));

    ingest.Open();
    ingest.Spawn();

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (ingest.Processed() < script.size() &&
           std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);

    ingest.Stop();
    ingest.Close();

    assert(ingest.Processed() == script.size());

    // Smoothing puts one midpoint sample on every jump, so each jump is
    // seen as two saccades
    const auto metrics = session->getMetrics();
    assert(metrics.total_fixations == 3);
    assert(metrics.regression_count == 2);
    assert(session->saccades().size() == 6);
    assert(events.load() == 6);
}

template <typename Pred> bool waitUntil(Pred pred) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

void testIngestReset() {
    std::cout << "Reset clears smoothing before the next sample..."
              << std::endl;
    std::vector<oculo::core::GazeSample> script;
    for (int i = 0; i < 4; ++i)
        script.push_back(sample(100.0f, 0.0f, i * 10));

    auto session = std::make_shared<oculo::detection::TrackingSession>(
        oculo::core::DetectorConfig{});
    std::vector<std::string> journal;

    auto source = std::make_unique<ScriptedSource>(script);
    auto *feed = source.get();
    auto smoothing = std::make_unique<stages::MovingAverageFilter>();
    smoothing->setConfig({.window = 5});
    auto recorder = std::make_unique<RecordingSink>("recorder", journal);
    auto *seen = &recorder->seen;

    managers::IngestManager ingest;
    ingest.SetSource(std::move(source));
    ingest.AddStage(std::move(smoothing));
    ingest.AddSink(std::move(recorder));
    ingest.AddSink(std::make_unique<stages::SessionSink>(session));

    ingest.Open();
    ingest.Spawn();
    assert(waitUntil([&] { return ingest.Processed() == 4; }));
    assert(session->window().size() == 4);

    ingest.RequestReset();
    assert(ingest.ResetPending());
    feed->append(sample(500.0f, 0.0f, 40));
    assert(waitUntil([&] { return ingest.Processed() == 5; }));

    ingest.Stop();
    ingest.Close();

    assert(!ingest.ResetPending());
    assert(seen->size() == 5);
    assert(seen->back().x == 500.0f);
    assert(std::count(journal.begin(), journal.end(), "recorder:reset") == 1);

    // The session sink was reset too: only the post-reset sample is left
    const auto window = session->window();
    assert(window.size() == 1 && window[0].x == 500.0f);
}

} // namespace

int main() {
    std::cout << "=== Testing Pipeline ===" << std::endl;

    testLifecycleAndOrder();
    testSourceCancel();
    testIngestEndToEnd();
    testIngestReset();

    std::cout << "\n=== All Pipeline tests passed ===" << std::endl;
    return 0;
}
