#undef NDEBUG
#include "oculo/core/config.hpp"
#include "oculo/core/core.hpp"
#include "oculo/detection/tracking_session.hpp"
#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

using namespace oculo;
using detection::TrackingSession;

namespace {

core::GazeSample sample(float x, float y, int64_t t, bool valid = true) {
    return core::GazeSample{.x = x,
                            .y = y,
                            .timestamp_ms = t,
                            .left_valid = valid,
                            .right_valid = false,
                            .left_pupil_diameter = 4.25f,
                            .right_pupil_diameter = 0.0f};
}

// Steady clusters separated by rightward jumps, with every 4th cluster
// jumping back to the left
std::vector<core::GazeSample> readingStream(int clusters) {
    std::vector<core::GazeSample> samples;
    int64_t t = 0;
    for (int c = 0; c < clusters; ++c) {
        const float x = (c % 4 == 3) ? 50.0f : 100.0f + 80.0f * (c % 4);
        for (int i = 0; i < 15; ++i) {
            samples.push_back(sample(x + (i % 2), 200.0f, t));
            t += 16;
        }
    }
    return samples;
}

void testReadingSession() {
    std::cout << "\nScripted session produces events and metrics..."
              << std::endl;
    TrackingSession session(core::DetectorConfig{});

    for (const auto &s : {sample(0, 0, 0), sample(2, 1, 50), sample(1, 2, 100),
                          sample(50, 50, 150)})
        session.processSample(s);

    const auto metrics = session.getMetrics();
    assert(metrics.total_fixations == 1);
    assert(metrics.average_fixation_duration == 100.0);
    assert(metrics.regression_count == 0);
    assert(metrics.prolonged_fixations == 0);
    assert(session.fixations().size() == 1);
    assert(session.saccades().size() == 1);
    assert(session.window().size() == 4);

    auto latest = session.latestGaze();
    assert(latest && latest->x == 50.0f);
    assert(latest->left_pupil_diameter == 4.25f);
}

void testInvalidOnly() {
    std::cout << "Only invalid samples leave the session empty..."
              << std::endl;
    TrackingSession session(core::DetectorConfig{});
    for (int i = 0; i < 50; ++i) {
        auto result = session.processSample(sample(i * 100.0f, 0, i * 10, false));
        assert(result.empty());
    }
    assert(session.getMetrics() == core::EyeTrackingMetrics{});
    assert(session.window().empty());
    assert(!session.latestGaze());
}

void testReset() {
    std::cout << "Reset is idempotent and keeps the session open..."
              << std::endl;
    TrackingSession session(core::DetectorConfig{});
    for (const auto &s : readingStream(8))
        session.processSample(s);
    assert(session.getMetrics().total_fixations > 0);

    session.reset();
    const auto once = session.getMetrics();
    const auto window_once = session.window().size();
    session.reset();
    assert(session.getMetrics() == once);
    assert(session.window().size() == window_once);

    assert(once == core::EyeTrackingMetrics{});
    assert(window_once == 0);
    assert(session.fixations().empty() && session.saccades().empty());
    assert(!session.latestGaze());
    assert(session.isAccepting());

    // Detector state was cleared: the next sample only primes it
    assert(session.processSample(sample(900, 900, 0)).empty());
}

void testStop() {
    std::cout << "Stop rejects later samples; start resumes..." << std::endl;
    TrackingSession session(core::DetectorConfig{});
    const auto stream = readingStream(8);
    const size_t half = stream.size() / 2;

    for (size_t i = 0; i < half; ++i)
        session.processSample(stream[i]);

    session.stop();
    assert(!session.isAccepting());
    const auto before = session.getMetrics();
    const auto window_before = session.window().size();

    for (size_t i = half; i < stream.size(); ++i)
        assert(session.processSample(stream[i]).empty());

    assert(session.getMetrics() == before);
    assert(session.window().size() == window_before);
    assert(session.rejectedSamples() == stream.size() - half);

    session.stop();
    assert(!session.isAccepting());

    session.start();
    assert(session.isAccepting());
    assert(session.rejectedSamples() == 0);
    session.processSample(sample(2000, 2000, 100000));
    assert(session.latestGaze()->x == 2000.0f);
}

void testStopClosesOpenFixation() {
    std::cout << "Stop closes a steady run as one fixation..." << std::endl;
    TrackingSession session(core::DetectorConfig{});
    for (int i = 0; i < 20; ++i)
        assert(session.processSample(sample(300.0f + i, 200.0f, i * 10))
                   .empty());
    assert(session.fixations().empty());

    session.stop();
    const auto fixations = session.fixations();
    assert(fixations.size() == 1);
    assert(session.saccades().empty());
    assert(fixations[0].start_timestamp_ms == 10);
    assert(fixations[0].duration_ms == 180);

    const auto metrics = session.getMetrics();
    assert(metrics.total_fixations == 1);
    assert(metrics.average_fixation_duration == 180.0);

    // Stopping again does not close anything twice
    session.stop();
    session.start();
    session.stop();
    assert(session.fixations().size() == 1);
}

void testWindowBound() {
    std::cout << "Window holds the newest valid samples only..." << std::endl;
    core::DetectorConfig config;
    config.window_capacity = 5;
    TrackingSession session(config);

    for (int i = 0; i < 20; ++i) {
        session.processSample(sample(i * 3.0f, 0, i * 10));
        session.processSample(sample(-1, -1, i * 10 + 5, false));
        assert(session.window().size() <= 5);
    }

    const auto window = session.window();
    assert(window.size() == 5);
    assert(window.front().timestamp_ms == 150);
    assert(window.back().timestamp_ms == 190);
    for (const auto &s : window)
        assert(s.isValid());
}

void testEvictionDoesNotChangeEvents() {
    std::cout << "Eviction does not affect emitted events..." << std::endl;
    core::DetectorConfig small;
    small.window_capacity = 3;
    TrackingSession bounded(small);
    TrackingSession roomy(core::DetectorConfig{});

    for (const auto &s : readingStream(20)) {
        bounded.processSample(s);
        roomy.processSample(s);
    }

    const auto a = bounded.fixations();
    const auto b = roomy.fixations();
    assert(a.size() == b.size() && !a.empty());
    for (size_t i = 0; i < a.size(); ++i) {
        assert(a[i].start_timestamp_ms == b[i].start_timestamp_ms);
        assert(a[i].duration_ms == b[i].duration_ms);
    }
    assert(bounded.saccades().size() == roomy.saccades().size());
    assert(bounded.getMetrics().regression_count ==
           roomy.getMetrics().regression_count);
    assert(roomy.getMetrics().regression_count > 0);
}

void testConcurrentReaders() {
    std::cout << "Readers run alongside the producer..." << std::endl;
    TrackingSession session(core::DetectorConfig{});
    const auto stream = readingStream(400);
    std::atomic<bool> done{false};
    std::atomic<size_t> reads{0};

    std::jthread reader([&] {
        uint64_t last_total = 0;
        while (!done.load()) {
            const auto metrics = session.getMetrics();
            assert(metrics.total_fixations >= last_total);
            assert(metrics.prolonged_fixations <= metrics.total_fixations);
            assert(metrics.fixation_intersection_coefficient >= 0.0 &&
                   metrics.fixation_intersection_coefficient <= 1.0);
            last_total = metrics.total_fixations;

            const auto window = session.window();
            assert(window.size() <= session.config().window_capacity);
            reads.fetch_add(1);
        }
    });

    for (const auto &s : stream)
        session.processSample(s);
    done.store(true);
    reader.join();

    assert(reads.load() > 0);
    assert(session.getMetrics().total_fixations == session.fixations().size());
}

} // namespace

int main() {
    std::cout << "=== Testing TrackingSession ===" << std::endl;

    testReadingSession();
    testInvalidOnly();
    testReset();
    testStop();
    testStopClosesOpenFixation();
    testWindowBound();
    testEvictionDoesNotChangeEvents();
    testConcurrentReaders();

    std::cout << "\n=== All TrackingSession tests passed ===" << std::endl;
    return 0;
}
