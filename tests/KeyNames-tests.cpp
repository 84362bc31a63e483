#include "KeyNames.hpp"
#include <catch2/catch.hpp>

extern "C" {
    #include <linux/input.h>
}

using namespace std;

TEST_CASE("Key lookup by name", "[KeyNames]") {
    REQUIRE(keyFromName("CapsLock") == KEY_CAPSLOCK);
    REQUIRE(keyFromName("capslock") == KEY_CAPSLOCK);
    REQUIRE(keyFromName("KEY_CAPSLOCK") == KEY_CAPSLOCK);
    REQUIRE(keyFromName("Caps_Lock") == KEY_CAPSLOCK);
    REQUIRE(keyFromName("Escape") == KEY_ESC);
    REQUIRE(keyFromName("esc") == KEY_ESC);
    REQUIRE(keyFromName("Return") == KEY_ENTER);
    REQUIRE(keyFromName("LeftCtrl") == KEY_LEFTCTRL);
    REQUIRE(keyFromName("KEY_LEFTSHIFT") == KEY_LEFTSHIFT);
    REQUIRE(keyFromName("v") == KEY_V);
    REQUIRE(keyFromName("F12") == KEY_F12);
}

TEST_CASE("Unknown keys", "[KeyNames]") {
    REQUIRE(!keyFromName(""));
    REQUIRE(!keyFromName("KEY_"));
    REQUIRE(!keyFromName("Hyperspace"));
}

TEST_CASE("Canonical names", "[KeyNames]") {
    REQUIRE(keyName(KEY_ESC) == "Escape");
    REQUIRE(keyName(KEY_LEFTCTRL) == "LeftCtrl");
    REQUIRE(keyName(KEY_CAPSLOCK) == "CapsLock");
    REQUIRE(keyName(0x2fe) == "KEY_766");
}

TEST_CASE("Modifiers", "[KeyNames]") {
    REQUIRE(isModifier(KEY_LEFTCTRL));
    REQUIRE(isModifier(KEY_RIGHTSHIFT));
    REQUIRE(isModifier(KEY_LEFTMETA));
    REQUIRE(!isModifier(KEY_C));
    REQUIRE(!isModifier(KEY_CAPSLOCK));
}
