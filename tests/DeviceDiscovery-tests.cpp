#include "DeviceDiscovery.hpp"
#include <catch2/catch.hpp>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>

extern "C" {
    #include <unistd.h>
}

using namespace std;

static const string REGISTRY =
    "I: Bus=0011 Vendor=0001 Product=0001 Version=ab41\n"
    "N: Name=\"AT Translated Set 2 keyboard\"\n"
    "P: Phys=isa0060/serio0/input0\n"
    "H: Handlers=sysrq kbd leds event3 \n"
    "B: EV=120013\n"
    "\n"
    "I: Bus=0005 Vendor=046d Product=b02a Version=0001\n"
    "N: Name=\"BluetoothMouse3600 Keyboard\"\n"
    "P: Phys=a0:b1:c2:d3:e4:f5\n"
    "H: Handlers=sysrq kbd leds event21 \n"
    "\n"
    "I: Bus=0005 Vendor=046d Product=b02a Version=0001\n"
    "N: Name=\"BluetoothMouse3600 Mouse\"\n"
    "P: Phys=a0:b1:c2:d3:e4:f5\n"
    "H: Handlers=event20 mouse2 \n"
    "\n"
    "I: Bus=0003 Vendor=046d Product=c092 Version=0111\n"
    "N: Name=\"Logitech G203 LIGHTSYNC Gaming Mouse\"\n"
    "H: Handlers=event5 mouse0 \n"
    "\n"
    "I: Bus=0003 Vendor=0461 Product=4d81 Version=0111\n"
    "N: Name=\"PixArt USB Optical Mouse\"\n"
    "H: Handlers=mouse1 event7 \n"
    "\n"
    "N: Name=\"Power Button\"\n"
    "H: Handlers=kbd\n";

struct TmpRegistry {
    string path;

    explicit TmpRegistry(const string& contents) {
        path = "/tmp/evclick-registry-" + to_string(getpid()) + "-" +
               to_string(reinterpret_cast<uintptr_t>(this));
        ofstream out(path);
        out << contents;
    }

    ~TmpRegistry() {
        unlink(path.c_str());
    }
};

TEST_CASE("Parse registry", "[DeviceDiscovery]") {
    istringstream in(REGISTRY);
    auto devices = ProcInputDiscovery::parse(in);

    REQUIRE(devices.size() == 6);
    REQUIRE(devices[0].name == "AT Translated Set 2 keyboard");
    REQUIRE(devices[0].phys == "isa0060/serio0/input0");
    REQUIRE(devices[0].event_path == "/dev/input/event3");
    REQUIRE(devices[0].handlers.size() == 4);
    REQUIRE(!devices[0].isPointer());
    REQUIRE(devices[2].isPointer());
    REQUIRE(devices[4].event_path == "/dev/input/event7");
    REQUIRE(devices[5].event_path.empty());
}

TEST_CASE("CRLF line endings", "[DeviceDiscovery]") {
    istringstream in("N: Name=\"Mouse\"\r\nH: Handlers=event9\r\n\r\n");
    auto devices = ProcInputDiscovery::parse(in);
    REQUIRE(devices.size() == 1);
    REQUIRE(devices[0].name == "Mouse");
    REQUIRE(devices[0].event_path == "/dev/input/event9");
}

TEST_CASE("Find by name", "[DeviceDiscovery]") {
    TmpRegistry reg(REGISTRY);

    ProcInputDiscovery discovery({}, reg.path);
    REQUIRE(discovery.find("USB Optical Mouse") == optional<string>("/dev/input/event7"));
    REQUIRE(discovery.find("AT Translated") == optional<string>("/dev/input/event3"));
    REQUIRE(!discovery.find("Trackball"));
    // Case sensitive
    REQUIRE(!discovery.find("usb optical mouse"));
    // Devices without an event handler never match
    REQUIRE(!discovery.find("Power Button"));
}

TEST_CASE("Pointer devices are preferred", "[DeviceDiscovery]") {
    TmpRegistry reg(REGISTRY);

    ProcInputDiscovery discovery({}, reg.path);
    REQUIRE(discovery.find("BluetoothMouse3600") == optional<string>("/dev/input/event20"));
}

TEST_CASE("Excluded devices", "[DeviceDiscovery]") {
    TmpRegistry reg(REGISTRY);

    ProcInputDiscovery all({}, reg.path);
    REQUIRE(all.find("Mouse") == optional<string>("/dev/input/event20"));

    ProcInputDiscovery filtered({"BluetoothMouse3600", "G203 LIGHTSYNC"}, reg.path);
    REQUIRE(filtered.find("Mouse") == optional<string>("/dev/input/event7"));
    REQUIRE(!filtered.find("G203"));
}

TEST_CASE("Unreadable registry", "[DeviceDiscovery]") {
    ProcInputDiscovery discovery({}, "/nonexistent/evclick/devices");
    REQUIRE(discovery.list().empty());
    REQUIRE(!discovery.find("Mouse"));
}
