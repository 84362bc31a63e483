/** @file Fakes.hpp
 *
 * @brief Test doubles for the syscall, discovery, synthesis and keyboard
 *        seams.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

extern "C" {
    #include <errno.h>
}

#include "DeviceDiscovery.hpp"
#include "InputABI.hpp"
#include "KeySimulator.hpp"
#include "KeyboardMonitor.hpp"
#include "SysCalls.hpp"

struct SysCall {
    std::string name;
    int fd = -1;
    unsigned long request = 0;
    long arg = 0;
    std::string path;
    int flags = 0;
};

/** One scripted result of read(), `err` makes the call fail. */
struct FakeRead {
    std::vector<uint8_t> data;
    int err = 0;
};

/**
 * Records every call and replays scripted results.
 *
 * Once the scripted reads are used up poll() times out, unless
 * `eof_when_drained` is set, in which case read() reports end of file.
 */
class FakeSysCalls : public ISysCalls {
private:
    mutable std::mutex mtx;
    int next_fd = 3;
    /** Per calling thread, like errno. */
    std::map<std::thread::id, int> last_errors;

    int fail(int err) {
        last_errors[std::this_thread::get_id()] = err;
        return -1;
    }

public:
    std::vector<SysCall> calls;
    std::vector<std::vector<uint8_t>> writes;

    /** path -> errno for open() */
    std::map<std::string, int> open_errors;
    /** request -> errno for ioctl() */
    std::map<unsigned long, int> ioctl_errors;
    int write_errno = 0;
    /** Accept at most this many bytes per write(), 0 for no limit. */
    size_t write_limit = 0;
    std::deque<FakeRead> reads;
    bool eof_when_drained = false;
    bool caps_lock = false;

    void pushEvent(const InputEvent& ev) {
        std::lock_guard<std::mutex> lock(mtx);
        auto buf = encodeInputEvent(ev);
        reads.push_back(FakeRead {std::vector<uint8_t>(buf.begin(), buf.end()), 0});
    }

    void pushRead(FakeRead r) {
        std::lock_guard<std::mutex> lock(mtx);
        reads.push_back(std::move(r));
    }

    virtual int open(const std::string& path, int flags) override {
        std::lock_guard<std::mutex> lock(mtx);
        SysCall call;
        call.name = "open";
        call.path = path;
        call.flags = flags;
        calls.push_back(call);
        auto it = open_errors.find(path);
        if (it != open_errors.end())
            return fail(it->second);
        return next_fd++;
    }

    virtual int close(int fd) override {
        std::lock_guard<std::mutex> lock(mtx);
        SysCall call;
        call.name = "close";
        call.fd = fd;
        calls.push_back(call);
        return 0;
    }

    virtual ssize_t read(int fd, void *buf, size_t count) override {
        std::lock_guard<std::mutex> lock(mtx);
        SysCall call;
        call.name = "read";
        call.fd = fd;
        calls.push_back(call);
        if (reads.empty())
            return eof_when_drained ? 0 : fail(EAGAIN);
        FakeRead r = std::move(reads.front());
        reads.pop_front();
        if (r.err)
            return fail(r.err);
        size_t n = std::min(count, r.data.size());
        std::memcpy(buf, r.data.data(), n);
        return static_cast<ssize_t>(n);
    }

    virtual ssize_t write(int fd, const void *buf, size_t count) override {
        std::lock_guard<std::mutex> lock(mtx);
        SysCall call;
        call.name = "write";
        call.fd = fd;
        call.arg = static_cast<long>(count);
        calls.push_back(call);
        if (write_errno)
            return fail(write_errno);
        size_t n = (write_limit && count > write_limit) ? write_limit : count;
        auto bytes = static_cast<const uint8_t *>(buf);
        writes.emplace_back(bytes, bytes + n);
        return static_cast<ssize_t>(n);
    }

    virtual int ioctl(int fd, unsigned long request, int arg) override {
        std::lock_guard<std::mutex> lock(mtx);
        SysCall call;
        call.name = "ioctl";
        call.fd = fd;
        call.request = request;
        call.arg = arg;
        calls.push_back(call);
        auto it = ioctl_errors.find(request);
        if (it != ioctl_errors.end())
            return fail(it->second);
        return 0;
    }

    virtual int ioctl(int fd, unsigned long request, void *arg) override {
        std::lock_guard<std::mutex> lock(mtx);
        SysCall call;
        call.name = "ioctl";
        call.fd = fd;
        call.request = request;
        calls.push_back(call);
        auto it = ioctl_errors.find(request);
        if (it != ioctl_errors.end())
            return fail(it->second);
        // Only EVIOCGLED uses a pointer argument, LED_CAPSL is bit 1.
        auto leds = static_cast<uint8_t *>(arg);
        leds[0] = caps_lock ? 0x02 : 0x00;
        return 0;
    }

    virtual int poll(int, int timeout_ms) override {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!reads.empty() || eof_when_drained)
                return 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(timeout_ms, 5)));
        return 0;
    }

    virtual int lastError() const override {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = last_errors.find(std::this_thread::get_id());
        return (it == last_errors.end()) ? 0 : it->second;
    }

    std::vector<SysCall> snapshot() const {
        std::lock_guard<std::mutex> lock(mtx);
        return calls;
    }

    size_t count(const std::string& name) const {
        size_t n = 0;
        for (const auto& call : snapshot())
            if (call.name == name)
                n++;
        return n;
    }

    /** Arguments of every ioctl() with the given request, in order. */
    std::vector<long> ioctls(unsigned long request) const {
        std::vector<long> args;
        for (const auto& call : snapshot())
            if (call.name == "ioctl" && call.request == request)
                args.push_back(call.arg);
        return args;
    }

    /** Every written input_event frame, decoded. */
    std::vector<InputEvent> events() const {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<InputEvent> out;
        for (const auto& w : writes)
            if (w.size() == INPUT_EVENT_SIZE)
                out.push_back(parseInputEvent(w.data(), w.size()));
        return out;
    }
};

class FakeDiscovery : public IDeviceDiscovery {
private:
    std::mutex mtx;
    std::optional<std::string> result;
    int calls = 0;

public:
    explicit FakeDiscovery(std::optional<std::string> result = std::nullopt)
        : result(std::move(result)) {}

    void setResult(std::optional<std::string> r) {
        std::lock_guard<std::mutex> lock(mtx);
        result = std::move(r);
    }

    int getCalls() {
        std::lock_guard<std::mutex> lock(mtx);
        return calls;
    }

    virtual std::optional<std::string> find(const std::string&) override {
        std::lock_guard<std::mutex> lock(mtx);
        calls++;
        return result;
    }
};

/** Records each synthesized sequence as modifiers followed by the key. */
class RecordingKeySimulator : public IKeySimulator {
private:
    std::mutex mtx;
    std::vector<std::vector<KeyCode>> sequences;

public:
    /** Thrown from every call when set. */
    std::optional<std::string> error;

    virtual void simulateKeyPress(KeyCode key) override {
        simulateKeys({}, key);
    }

    virtual void simulateKeyCombo(KeyCode modifier, KeyCode key) override {
        simulateKeys({modifier}, key);
    }

    virtual void simulateKeyCombo(KeyCode modifier1, KeyCode modifier2, KeyCode key) override {
        simulateKeys({modifier1, modifier2}, key);
    }

    virtual void simulateKeys(const std::vector<KeyCode>& modifiers, KeyCode key) override {
        std::lock_guard<std::mutex> lock(mtx);
        if (error)
            throw std::runtime_error(*error);
        std::vector<KeyCode> seq(modifiers);
        seq.push_back(key);
        sequences.push_back(seq);
    }

    std::vector<std::vector<KeyCode>> getSequences() {
        std::lock_guard<std::mutex> lock(mtx);
        return sequences;
    }
};

class RecordingKeyboardMonitor : public IKeyboardMonitor {
private:
    using Clock = std::chrono::steady_clock;

    std::mutex mtx;
    std::vector<KeyCode> released;
    std::vector<Clock::time_point> released_at;

public:
    bool caps_lock = false;

    virtual bool isCapsLockOn() override {
        return caps_lock;
    }

    virtual void raiseKeyReleasedEvent(KeyCode key) override {
        std::lock_guard<std::mutex> lock(mtx);
        released.push_back(key);
        released_at.push_back(Clock::now());
    }

    std::vector<KeyCode> getReleased() {
        std::lock_guard<std::mutex> lock(mtx);
        return released;
    }

    std::vector<Clock::time_point> getReleasedAt() {
        std::lock_guard<std::mutex> lock(mtx);
        return released_at;
    }
};

/** Poll `pred` until it holds or `timeout` passes. */
template <class Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}
