#include "Scheduler.hpp"
#include "Signal.hpp"
#include "Fakes.hpp"
#include <catch2/catch.hpp>
#include <atomic>
#include <memory>
#include <stdexcept>

using namespace std;
using namespace std::chrono;

TEST_CASE("Tasks run in due order", "[Scheduler]") {
    Scheduler sched("test");
    mutex mtx;
    vector<int> order;
    auto push = [&](int n) {
        return [&, n]() {
            lock_guard<mutex> lock(mtx);
            order.push_back(n);
        };
    };

    sched.schedule(milliseconds(60), push(3));
    sched.schedule(milliseconds(30), push(2));
    sched.post(push(1));

    REQUIRE(waitFor([&]() {
        lock_guard<mutex> lock(mtx);
        return order.size() == 3;
    }));
    REQUIRE(order == vector<int>{1, 2, 3});
}

TEST_CASE("Cancelled tasks never run", "[Scheduler]") {
    Scheduler sched("test");
    atomic<int> runs {0};

    auto id = sched.schedule(milliseconds(50), [&]() { runs++; });
    REQUIRE(id != 0);
    REQUIRE(sched.pending() == 1);
    REQUIRE(sched.cancel(id));
    REQUIRE(!sched.cancel(id));
    REQUIRE(sched.pending() == 0);

    this_thread::sleep_for(milliseconds(100));
    REQUIRE(runs == 0);
}

TEST_CASE("A failing task does not stop the worker", "[Scheduler]") {
    Scheduler sched("test");
    atomic<bool> ran {false};

    sched.post([]() { throw runtime_error("boom"); });
    sched.post([&]() { ran = true; });

    REQUIRE(waitFor([&]() { return ran.load(); }));
}

TEST_CASE("Stopped scheduler rejects tasks", "[Scheduler]") {
    Scheduler sched("test");
    atomic<int> runs {0};

    sched.schedule(milliseconds(500), [&]() { runs++; });
    sched.stop();
    REQUIRE(!sched.isRunning());
    REQUIRE(sched.pending() == 0);
    REQUIRE(sched.post([&]() { runs++; }) == 0);

    // Stopping twice is fine
    sched.stop();
    REQUIRE(runs == 0);
}

TEST_CASE("A task may stop its own scheduler", "[Scheduler]") {
    auto sched = make_unique<Scheduler>("test");
    atomic<bool> stopped {false};
    atomic<bool> finished {false};
    atomic<int> runs {0};

    sched->post([&]() {
        sched->stop();
        stopped = true;
        this_thread::sleep_for(milliseconds(50));
        finished = true;
    });
    sched->schedule(milliseconds(10), [&]() { runs++; });

    REQUIRE(waitFor([&]() { return stopped.load(); }));
    REQUIRE(!sched->isRunning());
    REQUIRE(sched->post([&]() { runs++; }) == 0);

    // Destruction waits for the running task
    sched.reset();
    REQUIRE(finished);
    REQUIRE(runs == 0);
}

TEST_CASE("Signal subscriptions", "[Signal]") {
    Signal<int> sig;
    int a = 0, b = 0;

    auto sa = sig.connect([&](int n) { a += n; });
    auto sb = sig.connect([&](int n) { b += n; });
    REQUIRE(sig.size() == 2);

    sig.emit(2);
    REQUIRE(a == 2);
    REQUIRE(b == 2);

    sa.unsubscribe();
    REQUIRE(!sa.isConnected());
    sig.emit(3);
    REQUIRE(a == 2);
    REQUIRE(b == 5);

    // Unsubscribing after the signal is gone is harmless
    {
        Signal<int> tmp;
        sb = tmp.connect([](int) {});
    }
    sb.unsubscribe();
    REQUIRE(sig.size() == 1);
}
