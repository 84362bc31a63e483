#include "DeviceMonitor.hpp"
#include "UInputKeySimulator.hpp"
#include "Fakes.hpp"
#include <catch2/catch.hpp>

extern "C" {
    #include <linux/input.h>
}

using namespace std;
using namespace std::chrono;

TEST_CASE("Single click toggles CapsLock", "[EndToEnd]") {
    FakeSysCalls input;
    FakeSysCalls uinput;
    FakeDiscovery discovery {string("/dev/input/event20")};
    RecordingKeyboardMonitor kbd;
    UInputKeySimulator sim(uinput, KeySimulatorTimings::none());
    Scheduler timers("timers");
    Scheduler worker("actions");
    ActionRunner runner(sim, kbd, worker, [](const string&) {}, KEY_SIMULATION_DELAY);

    MonitorOptions opts;
    opts.name = "Bluetooth mouse";
    opts.pattern = "BluetoothMouse3600";
    opts.reconnect_interval = milliseconds(20);
    opts.poll_timeout = milliseconds(5);
    DeviceMonitor monitor(opts, input, discovery);

    auto handler = make_unique<ButtonClickHandler>(
        "left", ButtonAction::keyPress(KEY_CAPSLOCK, "CapsLock (toggle recording)"),
        ButtonAction::none(), ButtonAction::none(), runner, timers);
    handler->getDetector().setClickThreshold(milliseconds(200));
    monitor.bind(MouseButton::Left, std::move(handler));

    monitor.start();
    REQUIRE(waitFor([&]() { return monitor.getState() == MonitorState::Monitoring; }));

    auto clicked = steady_clock::now();
    input.pushEvent(makeInputEvent(EVTYPE_KEY, BTN_LEFT, KEY_VAL_DOWN));
    input.pushEvent(makeInputEvent(EVTYPE_SYN, SYNC_REPORT, 0));
    input.pushEvent(makeInputEvent(EVTYPE_KEY, BTN_LEFT, KEY_VAL_UP));
    input.pushEvent(makeInputEvent(EVTYPE_SYN, SYNC_REPORT, 0));

    REQUIRE(waitFor([&]() { return kbd.getReleased().size() == 1; }));
    REQUIRE(kbd.getReleased().front() == KEY_CAPSLOCK);
    // Classification after the threshold, then the release notification
    // after the key simulation delay.
    REQUIRE(kbd.getReleasedAt().front() - clicked >= milliseconds(300));

    auto events = uinput.events();
    REQUIRE(events.size() == 4);
    REQUIRE(events[0] == makeInputEvent(EVTYPE_KEY, KEY_CAPSLOCK, KEY_VAL_DOWN));
    REQUIRE(events[2] == makeInputEvent(EVTYPE_KEY, KEY_CAPSLOCK, KEY_VAL_UP));

    // The click never reaches the desktop.
    REQUIRE(monitor.isGrabbed());

    monitor.stop();
    REQUIRE(input.ioctls(IOCTL_EVIOCGRAB) == vector<long>{1, 0});
}
