#include "ClickDetector.hpp"
#include "Fakes.hpp"
#include <catch2/catch.hpp>
#include <thread>

using namespace std;
using namespace std::chrono;

/** Collects classifications from the timer thread. */
struct Results {
    mutex mtx;
    vector<ClickResult> results;

    void push(ClickResult r) {
        lock_guard<mutex> lock(mtx);
        results.push_back(r);
    }

    vector<ClickResult> get() {
        lock_guard<mutex> lock(mtx);
        return results;
    }

    function<void(ClickResult)> slot() {
        return [this](ClickResult r) { push(r); };
    }
};

TEST_CASE("Defaults", "[ClickDetector]") {
    Scheduler timers("timers");
    ClickDetector det("test", timers);

    REQUIRE(det.getClickThreshold() == milliseconds(800));
    REQUIRE(det.getClickDebounce() == milliseconds(50));
    REQUIRE(det.getMaxClickCount() == 3);
    REQUIRE(KEY_SIMULATION_DELAY == milliseconds(100));
}

TEST_CASE("Single click fires after the threshold", "[ClickDetector]") {
    Scheduler timers("timers");
    ClickDetector det("test", timers);
    det.setClickThreshold(milliseconds(200));
    det.setClickDebounce(milliseconds(0));
    Results res;
    det.onClick(res.slot());

    det.registerClick();
    this_thread::sleep_for(milliseconds(100));
    REQUIRE(res.get().empty());
    REQUIRE(det.getCount() == 1);

    this_thread::sleep_for(milliseconds(250));
    REQUIRE(res.get() == vector<ClickResult>{ClickResult::SingleClick});
    REQUIRE(det.getCount() == 0);
}

TEST_CASE("Double click", "[ClickDetector]") {
    Scheduler timers("timers");
    ClickDetector det("test", timers);
    det.setClickThreshold(milliseconds(200));
    det.setClickDebounce(milliseconds(0));
    Results res;
    det.onClick(res.slot());

    det.registerClick();
    this_thread::sleep_for(milliseconds(50));
    det.registerClick();

    REQUIRE(waitFor([&]() { return !res.get().empty(); }));
    this_thread::sleep_for(milliseconds(250));
    REQUIRE(res.get() == vector<ClickResult>{ClickResult::DoubleClick});
}

TEST_CASE("Triple click fires immediately, exactly once", "[ClickDetector]") {
    Scheduler timers("timers");
    ClickDetector det("test", timers);
    det.setClickThreshold(milliseconds(1000));
    det.setClickDebounce(milliseconds(0));
    Results res;
    det.onClick(res.slot());

    for (int i = 0; i < 3; i++) {
        if (i)
            this_thread::sleep_for(milliseconds(60));
        det.registerClick();
    }

    // Reaching the max count classifies on the caller's thread.
    REQUIRE(res.get() == vector<ClickResult>{ClickResult::TripleClick});
    REQUIRE(det.getCount() == 0);

    // The cancelled timer must not add a late classification.
    this_thread::sleep_for(milliseconds(1200));
    REQUIRE(res.get() == vector<ClickResult>{ClickResult::TripleClick});
}

TEST_CASE("Lower max click count", "[ClickDetector]") {
    Scheduler timers("timers");
    ClickDetector det("test", timers, 2);
    det.setClickThreshold(milliseconds(1000));
    det.setClickDebounce(milliseconds(0));
    Results res;
    det.onClick(res.slot());

    det.registerClick();
    det.registerClick();
    REQUIRE(res.get() == vector<ClickResult>{ClickResult::DoubleClick});

    ClickDetector one("one", timers, 1);
    Results one_res;
    one.onClick(one_res.slot());
    one.registerClick();
    REQUIRE(one_res.get() == vector<ClickResult>{ClickResult::SingleClick});
}

TEST_CASE("Invalid max click count", "[ClickDetector]") {
    Scheduler timers("timers");
    REQUIRE_THROWS_AS(ClickDetector("test", timers, 0), invalid_argument);
    REQUIRE_THROWS_AS(ClickDetector("test", timers, 4), invalid_argument);

    ClickDetector det("test", timers);
    REQUIRE_THROWS_AS(det.setMaxClickCount(5), invalid_argument);
    REQUIRE(det.getMaxClickCount() == 3);
}

TEST_CASE("Clicks within the debounce window are dropped", "[ClickDetector]") {
    Scheduler timers("timers");
    ClickDetector det("test", timers);
    det.setClickThreshold(milliseconds(300));
    det.setClickDebounce(milliseconds(50));
    Results res;
    det.onClick(res.slot());

    det.registerClick();
    det.registerClick();
    det.registerClick();
    REQUIRE(det.getCount() == 1);

    this_thread::sleep_for(milliseconds(80));
    det.registerClick();
    REQUIRE(det.getCount() == 2);

    REQUIRE(waitFor([&]() { return !res.get().empty(); }));
    REQUIRE(res.get() == vector<ClickResult>{ClickResult::DoubleClick});
}

TEST_CASE("Reset discards the sequence", "[ClickDetector]") {
    Scheduler timers("timers");
    ClickDetector det("test", timers);
    det.setClickThreshold(milliseconds(100));
    det.setClickDebounce(milliseconds(0));
    Results res;
    det.onClick(res.slot());

    det.registerClick();
    det.registerClick();
    det.reset();
    REQUIRE(det.getCount() == 0);

    this_thread::sleep_for(milliseconds(250));
    REQUIRE(res.get().empty());

    det.registerClick();
    REQUIRE(waitFor([&]() { return !res.get().empty(); }));
    REQUIRE(res.get() == vector<ClickResult>{ClickResult::SingleClick});
}

TEST_CASE("Disposed detector", "[ClickDetector]") {
    Scheduler timers("timers");
    ClickDetector det("test", timers);
    det.setClickThreshold(milliseconds(100));
    det.setClickDebounce(milliseconds(0));
    Results res;
    det.onClick(res.slot());

    det.registerClick();
    det.dispose();
    REQUIRE(det.isDisposed());
    REQUIRE_THROWS_AS(det.registerClick(), DisposedError);
    REQUIRE_NOTHROW(det.dispose());

    this_thread::sleep_for(milliseconds(250));
    REQUIRE(res.get().empty());
}

TEST_CASE("Pending timer outliving the detector", "[ClickDetector]") {
    Scheduler timers("timers");
    Results res;
    {
        ClickDetector det("test", timers);
        det.setClickThreshold(milliseconds(50));
        det.setClickDebounce(milliseconds(0));
        det.onClick(res.slot());
        det.registerClick();
    }
    this_thread::sleep_for(milliseconds(150));
    REQUIRE(res.get().empty());
}

TEST_CASE("Result names", "[ClickDetector]") {
    REQUIRE(string(clickResultName(ClickResult::Pending)) == "Pending");
    REQUIRE(string(clickResultName(ClickResult::TripleClick)) == "TripleClick");
}
