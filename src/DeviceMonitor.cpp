/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * DeviceMonitor.cpp, grab and read a mouse event device.                            *
 *                                                                                   *
 * Copyright (C) 2026 The evclick authors                                            *
 * All rights reserved.                                                              *
 *                                                                                   *
 * Redistribution and use in source and binary forms, with or without                *
 * modification, are permitted provided that the following conditions are met:       *
 *                                                                                   *
 * 1. Redistributions of source code must retain the above copyright notice, this    *
 *    list of conditions and the following disclaimer.                               *
 * 2. Redistributions in binary form must reproduce the above copyright notice,      *
 *    this list of conditions and the following disclaimer in the documentation      *
 *    and/or other materials provided with the distribution.                         *
 *                                                                                   *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND   *
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED     *
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE            *
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE      *
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL        *
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR        *
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER        *
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,     *
 * OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE     *
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.              *
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

extern "C" {
    #include <errno.h>
}

#include "DeviceMonitor.hpp"
#include "SystemError.hpp"
#include "Logging.hpp"

using namespace std;

const char *monitorStateName(MonitorState state) noexcept {
    switch (state) {
        case MonitorState::Disconnected: return "Disconnected";
        case MonitorState::Connecting: return "Connecting";
        case MonitorState::Grabbing: return "Grabbing";
        case MonitorState::Monitoring: return "Monitoring";
    }
    return "Unknown";
}

DeviceMonitor::DeviceMonitor(MonitorOptions opts, ISysCalls& sys, IDeviceDiscovery& discovery)
    : opts(std::move(opts)),
      sys(sys),
      discovery(discovery)
{
    if (this->opts.log_interval_attempts < 1)
        this->opts.log_interval_attempts = 1;
}

DeviceMonitor::~DeviceMonitor() {
    stop();
}

void DeviceMonitor::bind(MouseButton button, unique_ptr<ButtonClickHandler> handler) {
    lock_guard<mutex> lock(mtx);
    if (started)
        throw logic_error("Buttons must be bound before the monitor is started");
    handlers[button] = std::move(handler);
}

ButtonClickHandler *DeviceMonitor::getHandler(MouseButton button) {
    auto it = handlers.find(button);
    return (it == handlers.end()) ? nullptr : it->second.get();
}

void DeviceMonitor::start() {
    lock_guard<mutex> lock(mtx);
    if (stop_requested)
        throw DisposedError("Monitor for " + opts.name + " has been stopped");
    if (started) {
        Log::warn("{} monitoring is already active", opts.name);
        return;
    }
    started = true;
    monitoring = true;
    thread = std::thread([this]() { run(); });
    Log::info("{} monitoring started (looking for '{}')", opts.name, opts.pattern);
}

void DeviceMonitor::stop() {
    bool was_started;
    {
        lock_guard<mutex> lock(mtx);
        stop_requested = true;
        was_started = started;
    }
    cv.notify_all();

    if (thread.joinable() && thread.get_id() == this_thread::get_id()) {
        // Called from an observer, run() closes the device on its way out and
        // the next stop() from another thread joins and disposes.
        Log::debug("{} monitor stop requested from the monitor thread", opts.name);
        return;
    }

    lock_guard<mutex> stop_lock(stop_mtx);
    if (finished)
        return;

    if (thread.joinable())
        thread.join();

    closeDevice();
    setState(MonitorState::Disconnected);
    monitoring = false;

    for (auto& entry : handlers)
        if (entry.second)
            entry.second->dispose();

    finished = true;
    if (was_started)
        Log::info("{} monitoring stopped", opts.name);
}

bool DeviceMonitor::stopRequested() {
    lock_guard<mutex> lock(mtx);
    return stop_requested;
}

void DeviceMonitor::waitInterval() {
    unique_lock<mutex> lock(mtx);
    cv.wait_for(lock, opts.reconnect_interval, [this]() { return stop_requested; });
}

void DeviceMonitor::setState(MonitorState new_state) {
    MonitorState old = state.exchange(new_state);
    if (old != new_state)
        Log::debug("{}: {} -> {}", opts.name, monitorStateName(old), monitorStateName(new_state));
}

void DeviceMonitor::run() {
    int attempts = 0;

    while (!stopRequested()) {
        setState(MonitorState::Disconnected);

        try {
            auto path = discovery.find(opts.pattern);
            if (!path) {
                if (attempts % opts.log_interval_attempts == 0)
                    Log::info("{} '{}' not found, waiting for connection ...",
                              opts.name, opts.pattern);
                attempts++;
                waitInterval();
                continue;
            }
            attempts = 0;

            if (!connect(*path)) {
                waitInterval();
                continue;
            }

            Log::info("Connected to {}: {}", opts.name, *path);
            connected.emit(*path);

            monitorEvents();
            closeDevice();

            if (stopRequested())
                break;

            Log::warn("{} disconnected, will attempt reconnection ...", opts.name);
            disconnected.emit(*path);
            waitInterval();
        } catch (const exception &e) {
            Log::error("Error in {} reconnect loop: {}", opts.name, e.what());
            closeDevice();
            waitInterval();
        }
    }

    closeDevice();
    setState(MonitorState::Disconnected);
    monitoring = false;
}

bool DeviceMonitor::connect(const string& path) {
    setState(MonitorState::Connecting);

    int new_fd = sys.open(path, OPEN_RDONLY);
    if (new_fd < 0) {
        int err = sys.lastError();
        if (err == EACCES || err == EPERM)
            Log::error("Permission denied opening {}. Add user to 'input' group: "
                       "sudo usermod -a -G input $USER", path);
        else if (err == ENOENT)
            Log::debug("Device not found: {}", path);
        else
            Log::error("Failed to open device {}: {}", path, SystemError::getErrorString(err));
        return false;
    }
    fd = new_fd;
    device_path = path;

    setState(MonitorState::Grabbing);
    if (sys.ioctl(fd, IOCTL_EVIOCGRAB, 1) == 0) {
        grabbed = true;
        Log::info("Device grabbed exclusively, {} events will not propagate to the desktop",
                  opts.name);
    } else {
        grabbed = false;
        Log::warn("Failed to grab device exclusively ({}), {} events will propagate to the desktop!",
                  SystemError::getErrorString(sys.lastError()), opts.name);
    }

    return true;
}

void DeviceMonitor::monitorEvents() {
    setState(MonitorState::Monitoring);
    uint8_t buf[INPUT_EVENT_SIZE];
    int timeout = static_cast<int>(opts.poll_timeout.count());

    while (!stopRequested()) {
        int ready = sys.poll(fd, timeout);
        if (ready < 0) {
            int err = sys.lastError();
            if (err == EINTR)
                continue;
            Log::error("Error in poll() on {}: {}", device_path, SystemError::getErrorString(err));
            return;
        }
        if (ready == 0)
            continue;

        ssize_t n = sys.read(fd, buf, sizeof(buf));
        if (n < 0) {
            int err = sys.lastError();
            if (err == EINTR || err == EAGAIN)
                continue;
            Log::debug("Error in read() on {}, device likely disconnected: {}",
                       device_path, SystemError::getErrorString(err));
            return;
        }
        if (n == 0) {
            Log::debug("End of file on {}", device_path);
            return;
        }

        InputEvent ev;
        try {
            ev = parseInputEvent(buf, static_cast<size_t>(n));
        } catch (const MalformedEventError &e) {
            Log::warn("Malformed event from {}: {}", device_path, e.what());
            return;
        }
        handleEvent(ev);
    }
}

void DeviceMonitor::closeDevice() {
    if (fd < 0)
        return;

    if (grabbed) {
        if (sys.ioctl(fd, IOCTL_EVIOCGRAB, 0) < 0)
            Log::warn("Error ungrabbing {}: {}", device_path,
                      SystemError::getErrorString(sys.lastError()));
        else
            Log::debug("Device ungrabbed: {}", device_path);
        grabbed = false;
    }

    if (sys.close(fd) < 0)
        Log::warn("Unable to close {}: {}", device_path,
                  SystemError::getErrorString(sys.lastError()));
    fd = -1;
}

void DeviceMonitor::handleEvent(const InputEvent& ev) {
    if (ev.type != EVTYPE_KEY)
        return;
    if (ev.value != KEY_VAL_DOWN && ev.value != KEY_VAL_UP)
        return;

    MouseButton button = buttonFromCode(ev.code);
    if (button == MouseButton::Unknown)
        return;

    ButtonEvent event {button, ev.code, ev.value == KEY_VAL_DOWN, chrono::system_clock::now()};

    if (!event.pressed) {
        Log::debug("{} button released: {}", opts.name, mouseButtonName(button));
        button_released.emit(event);
        return;
    }

    Log::debug("{} button pressed: {}", opts.name, mouseButtonName(button));
    button_pressed.emit(event);
    if (stopRequested())
        return;

    auto it = handlers.find(button);
    if (it == handlers.end() || !it->second)
        return;
    try {
        it->second->registerClick();
    } catch (const DisposedError &e) {
        Log::debug("Ignoring {} click: {}", mouseButtonName(button), e.what());
    }
}

Subscription DeviceMonitor::onButtonPressed(function<void(const ButtonEvent&)> fn) {
    return button_pressed.connect(std::move(fn));
}

Subscription DeviceMonitor::onButtonReleased(function<void(const ButtonEvent&)> fn) {
    return button_released.connect(std::move(fn));
}

Subscription DeviceMonitor::onConnected(function<void(const string&)> fn) {
    return connected.connect(std::move(fn));
}

Subscription DeviceMonitor::onDisconnected(function<void(const string&)> fn) {
    return disconnected.connect(std::move(fn));
}
