#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>
#include "application/ProgressTracker.hpp"

using namespace localkb::application;

namespace {

void TestCoalescing() {
    std::cout << "[Test] Rapid updates are coalesced, finish always notifies..." << std::endl;
    std::vector<ProgressInfo> seen;
    ProgressTracker tracker(100, [&](const ProgressInfo& info) { seen.push_back(info); },
                            "Work", std::chrono::milliseconds(500));
    for (int i = 0; i < 50; ++i) tracker.update(1, "step");
    assert(seen.size() == 1);           // only the first update got through
    assert(tracker.current() == 50);

    tracker.finish("done");
    assert(seen.size() == 2);
    assert(seen.back().current == 100);
    assert(seen.back().message == "done");
    assert(seen.back().percentage() == 100.0);
    std::cout << "[PASS]" << std::endl;
}

void TestIntervalElapses() {
    std::cout << "[Test] Updates after the interval notify again..." << std::endl;
    int calls = 0;
    ProgressTracker tracker(10, [&](const ProgressInfo&) { ++calls; }, "Work", std::chrono::milliseconds(10));
    tracker.update();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    tracker.setCurrent(5, "half");
    assert(calls == 2);
    assert(tracker.info().rate() == 0.5);
    std::cout << "[PASS]" << std::endl;
}

void TestInfoMath() {
    std::cout << "[Test] ProgressInfo derived values..." << std::endl;
    ProgressInfo info;
    info.total = 0;
    assert(info.rate() == 0.0);
    info.total = 4;
    info.current = 0;
    assert(!info.estimatedRemainingSeconds().has_value());
    info.current = 2;
    info.startTime = ProgressInfo::Clock::now() - std::chrono::seconds(2);
    auto eta = info.estimatedRemainingSeconds();
    assert(eta.has_value() && *eta > 1.5 && *eta < 3.0);
    info.current = 4;
    assert(!info.estimatedRemainingSeconds().has_value());

    assert(ShouldShowProgress(5.0));
    assert(!ShouldShowProgress(1.0));
    assert(EstimateProcessingTime(10, 2.0) == 5.0);
    assert(EstimateProcessingTime(10, 0.0) == 0.0);
    std::cout << "[PASS]" << std::endl;
}

void TestAggregator() {
    std::cout << "[Test] Aggregator weights sub-trackers and keeps original callbacks..." << std::endl;
    int last = -1;
    int originalCalls = 0;
    ProgressAggregator aggregator([&](const ProgressInfo& info) { last = info.current; });

    ProgressTracker read(10, [&](const ProgressInfo&) { ++originalCalls; }, "Read", std::chrono::milliseconds(0));
    ProgressTracker embed(10, nullptr, "Embed", std::chrono::milliseconds(0));
    aggregator.addTracker(read, 1.0);
    aggregator.addTracker(embed, 3.0);

    read.finish();
    assert(originalCalls == 1);
    assert(last == 25);
    embed.setCurrent(5);
    assert(last == 62);
    embed.finish();
    assert(aggregator.aggregateCurrent() == 100);
    std::cout << "[PASS]" << std::endl;
}

void TestCancelFlag() {
    std::cout << "[Test] cancel marks the tracker..." << std::endl;
    ProgressTracker tracker(3);
    assert(!tracker.isCancelled());
    tracker.cancel();
    assert(tracker.isCancelled());
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    TestCoalescing();
    TestIntervalElapses();
    TestInfoMath();
    TestAggregator();
    TestCancelFlag();
    std::cout << "[Test] All progress tests passed." << std::endl;
    return 0;
}
