#include "KeyboardMonitor.hpp"
#include "Fakes.hpp"
#include <catch2/catch.hpp>

extern "C" {
    #include <linux/input.h>
}

using namespace std;

TEST_CASE("CapsLock LED state", "[KeyboardMonitor]") {
    FakeSysCalls sys;
    EvdevKeyboardMonitor kbd(sys, "/dev/input/event3");

    REQUIRE(!kbd.isCapsLockOn());
    sys.caps_lock = true;
    REQUIRE(kbd.isCapsLockOn());

    // Every query opens and closes the device.
    REQUIRE(sys.count("open") == 2);
    REQUIRE(sys.count("close") == 2);
    REQUIRE(sys.snapshot().front().flags == (OPEN_RDONLY | OPEN_NONBLOCK));
}

TEST_CASE("LED state without a keyboard", "[KeyboardMonitor]") {
    FakeSysCalls sys;
    sys.caps_lock = true;

    EvdevKeyboardMonitor none(sys);
    REQUIRE(!none.isCapsLockOn());
    REQUIRE(sys.count("open") == 0);

    sys.open_errors["/dev/input/event3"] = ENOENT;
    EvdevKeyboardMonitor missing(sys, "/dev/input/event3");
    REQUIRE(!missing.isCapsLockOn());
    REQUIRE(sys.count("close") == 0);
}

TEST_CASE("Key released notifications", "[KeyboardMonitor]") {
    FakeSysCalls sys;
    EvdevKeyboardMonitor kbd(sys);
    vector<KeyCode> released;

    auto sub = kbd.onKeyReleased([&](KeyCode key) { released.push_back(key); });
    kbd.raiseKeyReleasedEvent(KEY_CAPSLOCK);
    sub.unsubscribe();
    kbd.raiseKeyReleasedEvent(KEY_ESC);

    REQUIRE(released == vector<KeyCode>{KEY_CAPSLOCK});
}
