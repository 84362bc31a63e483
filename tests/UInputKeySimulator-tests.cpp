#include "UInputKeySimulator.hpp"
#include "SystemError.hpp"
#include "Fakes.hpp"
#include <catch2/catch.hpp>
#include <thread>

extern "C" {
    #include <linux/input.h>
}

using namespace std;

static vector<InputEvent> keyFrames(KeyCode key, int32_t value) {
    return {makeInputEvent(EVTYPE_KEY, key, value), makeInputEvent(EVTYPE_SYN, SYNC_REPORT, 0)};
}

static vector<InputEvent> concat(initializer_list<vector<InputEvent>> parts) {
    vector<InputEvent> out;
    for (const auto& part : parts)
        out.insert(out.end(), part.begin(), part.end());
    return out;
}

TEST_CASE("Single key press", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    UInputKeySimulator sim(sys, KeySimulatorTimings::none());

    sim.simulateKeyPress(KEY_CAPSLOCK);

    auto calls = sys.snapshot();
    REQUIRE(calls.front().name == "open");
    REQUIRE(calls.front().path == "/dev/uinput");
    REQUIRE(calls.front().flags == (OPEN_WRONLY | OPEN_NONBLOCK));

    REQUIRE(sys.ioctls(IOCTL_UI_SET_EVBIT) == vector<long>{EVTYPE_KEY});
    REQUIRE(sys.ioctls(IOCTL_UI_SET_KEYBIT) == vector<long>{KEY_CAPSLOCK});
    REQUIRE(sys.ioctls(IOCTL_UI_DEV_CREATE).size() == 1);
    REQUIRE(sys.ioctls(IOCTL_UI_DEV_DESTROY).size() == 1);

    REQUIRE(sys.events() == concat({keyFrames(KEY_CAPSLOCK, KEY_VAL_DOWN),
                                    keyFrames(KEY_CAPSLOCK, KEY_VAL_UP)}));

    REQUIRE(calls[calls.size() - 2].request == IOCTL_UI_DEV_DESTROY);
    REQUIRE(calls.back().name == "close");
}

TEST_CASE("Device is described before it is created", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    UInputKeySimulator sim(sys, KeySimulatorTimings::none());

    sim.simulateKeyPress(KEY_ENTER);

    auto calls = sys.snapshot();
    size_t desc_idx = 0, create_idx = 0;
    for (size_t i = 0; i < calls.size(); i++) {
        if (calls[i].name == "write" && calls[i].arg == long(UINPUT_USER_DEV_SIZE))
            desc_idx = i;
        if (calls[i].name == "ioctl" && calls[i].request == IOCTL_UI_DEV_CREATE)
            create_idx = i;
    }
    REQUIRE(desc_idx > 0);
    REQUIRE(create_idx > desc_idx);

    auto desc = sys.writes.front();
    REQUIRE(desc.size() == UINPUT_USER_DEV_SIZE);
    REQUIRE(string(reinterpret_cast<const char *>(desc.data())) == "evclick-kbd");
}

TEST_CASE("Ctrl+C ordering", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    UInputKeySimulator sim(sys, KeySimulatorTimings::none());

    sim.simulateKeyCombo(KEY_LEFTCTRL, KEY_C);

    REQUIRE(sys.ioctls(IOCTL_UI_SET_KEYBIT) == vector<long>{KEY_LEFTCTRL, KEY_C});
    REQUIRE(sys.events() == concat({keyFrames(KEY_LEFTCTRL, KEY_VAL_DOWN),
                                    keyFrames(KEY_C, KEY_VAL_DOWN),
                                    keyFrames(KEY_C, KEY_VAL_UP),
                                    keyFrames(KEY_LEFTCTRL, KEY_VAL_UP)}));
}

TEST_CASE("Ctrl+Shift+V releases modifiers in reverse", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    UInputKeySimulator sim(sys, KeySimulatorTimings::none());

    sim.simulateKeyCombo(KEY_LEFTCTRL, KEY_LEFTSHIFT, KEY_V);

    REQUIRE(sys.events() == concat({keyFrames(KEY_LEFTCTRL, KEY_VAL_DOWN),
                                    keyFrames(KEY_LEFTSHIFT, KEY_VAL_DOWN),
                                    keyFrames(KEY_V, KEY_VAL_DOWN),
                                    keyFrames(KEY_V, KEY_VAL_UP),
                                    keyFrames(KEY_LEFTSHIFT, KEY_VAL_UP),
                                    keyFrames(KEY_LEFTCTRL, KEY_VAL_UP)}));
}

TEST_CASE("Duplicate keys are enabled once", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    UInputKeySimulator sim(sys, KeySimulatorTimings::none());

    sim.simulateKeys({KEY_LEFTSHIFT, KEY_LEFTSHIFT}, KEY_A);
    REQUIRE(sys.ioctls(IOCTL_UI_SET_KEYBIT) == vector<long>{KEY_LEFTSHIFT, KEY_A});
}

TEST_CASE("Open failure", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    sys.open_errors["/dev/uinput"] = EACCES;
    UInputKeySimulator sim(sys, KeySimulatorTimings::none());

    try {
        sim.simulateKeyPress(KEY_ESC);
        FAIL("simulateKeyPress() should have thrown");
    } catch (const SystemError &e) {
        REQUIRE(e.code() == EACCES);
    }
    REQUIRE(sys.count("ioctl") == 0);
    REQUIRE(sys.count("write") == 0);
    REQUIRE(sys.count("close") == 0);
}

TEST_CASE("Setup ioctl failures are not fatal", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    sys.ioctl_errors[IOCTL_UI_SET_EVBIT] = EINVAL;
    sys.ioctl_errors[IOCTL_UI_SET_KEYBIT] = EINVAL;
    UInputKeySimulator sim(sys, KeySimulatorTimings::none());

    REQUIRE_NOTHROW(sim.simulateKeyPress(KEY_ESC));
    REQUIRE(sys.events().size() == 4);
    REQUIRE(sys.ioctls(IOCTL_UI_DEV_DESTROY).size() == 1);
}

TEST_CASE("Device is not destroyed if it was never created", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    sys.ioctl_errors[IOCTL_UI_DEV_CREATE] = EINVAL;
    UInputKeySimulator sim(sys, KeySimulatorTimings::none());

    REQUIRE_NOTHROW(sim.simulateKeyPress(KEY_ESC));
    REQUIRE(sys.ioctls(IOCTL_UI_DEV_DESTROY).empty());
    REQUIRE(sys.count("close") == 1);
}

TEST_CASE("Short writes throw and still clean up", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    UInputKeySimulator sim(sys, KeySimulatorTimings::none());

    SECTION("descriptor") {
        sys.write_limit = 100;
        REQUIRE_THROWS_AS(sim.simulateKeyPress(KEY_ESC), SystemError);
        REQUIRE(sys.ioctls(IOCTL_UI_DEV_CREATE).empty());
        REQUIRE(sys.ioctls(IOCTL_UI_DEV_DESTROY).empty());
    }

    SECTION("event") {
        sys.write_errno = EIO;
        REQUIRE_THROWS_AS(sim.simulateKeyPress(KEY_ESC), SystemError);
    }

    REQUIRE(sys.count("close") == 1);
}

TEST_CASE("Default timings", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    UInputKeySimulator sim(sys);
    const auto& t = sim.getTimings();
    REQUIRE(t.device_setup == chrono::milliseconds(100));
    REQUIRE(t.key_press == chrono::milliseconds(50));
    REQUIRE(t.modifier == chrono::milliseconds(20));
    REQUIRE(t.device_cleanup == chrono::milliseconds(100));
}

TEST_CASE("Concurrent sequences are serialized", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    KeySimulatorTimings timings {chrono::milliseconds(2), chrono::milliseconds(2),
                                 chrono::milliseconds(1), chrono::milliseconds(2)};
    UInputKeySimulator sim(sys, timings);

    thread copy([&]() { sim.simulateKeyCombo(KEY_LEFTCTRL, KEY_C); });
    thread paste([&]() { sim.simulateKeyCombo(KEY_LEFTCTRL, KEY_V); });
    copy.join();
    paste.join();

    // Each virtual keyboard is destroyed and closed before the next is opened
    int open_devices = 0, live_devices = 0;
    for (const auto& call : sys.snapshot()) {
        if (call.name == "open")
            open_devices++;
        else if (call.name == "close")
            open_devices--;
        else if (call.name == "ioctl" && call.request == IOCTL_UI_DEV_CREATE)
            live_devices++;
        else if (call.name == "ioctl" && call.request == IOCTL_UI_DEV_DESTROY)
            live_devices--;
        REQUIRE(open_devices >= 0);
        REQUIRE(open_devices <= 1);
        REQUIRE(live_devices >= 0);
        REQUIRE(live_devices <= 1);
    }
    REQUIRE(open_devices == 0);
    REQUIRE(live_devices == 0);
    REQUIRE(sys.ioctls(IOCTL_UI_DEV_CREATE).size() == 2);

    auto combo = [](KeyCode key) {
        return concat({keyFrames(KEY_LEFTCTRL, KEY_VAL_DOWN),
                       keyFrames(key, KEY_VAL_DOWN),
                       keyFrames(key, KEY_VAL_UP),
                       keyFrames(KEY_LEFTCTRL, KEY_VAL_UP)});
    };
    auto events = sys.events();
    bool copy_first = events == concat({combo(KEY_C), combo(KEY_V)});
    bool paste_first = events == concat({combo(KEY_V), combo(KEY_C)});
    REQUIRE((copy_first || paste_first));
}

TEST_CASE("Open errors are reported per thread", "[UInputKeySimulator]") {
    FakeSysCalls sys;
    sys.open_errors["/dev/uinput-a"] = EACCES;
    sys.open_errors["/dev/uinput-b"] = ENOENT;
    UInputKeySimulator sim_a(sys, KeySimulatorTimings::none(), "/dev/uinput-a");
    UInputKeySimulator sim_b(sys, KeySimulatorTimings::none(), "/dev/uinput-b");

    auto collect = [](UInputKeySimulator& sim, vector<int>& codes) {
        for (int i = 0; i < 200; i++) {
            try {
                sim.simulateKeyPress(KEY_ESC);
                codes.push_back(0);
            } catch (const SystemError &e) {
                codes.push_back(e.code());
            }
        }
    };

    vector<int> codes_a, codes_b;
    thread a([&]() { collect(sim_a, codes_a); });
    thread b([&]() { collect(sim_b, codes_b); });
    a.join();
    b.join();

    REQUIRE(codes_a == vector<int>(200, EACCES));
    REQUIRE(codes_b == vector<int>(200, ENOENT));
}
