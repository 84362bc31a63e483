/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ClickDetector.hpp, single/double/triple click classification.                     *
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

/** @file ClickDetector.hpp
 *
 * @brief Classify button presses into single, double and triple clicks.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "Scheduler.hpp"
#include "Signal.hpp"

enum class ClickResult {
    Pending,
    SingleClick,
    DoubleClick,
    TripleClick,
};

const char *clickResultName(ClickResult result) noexcept;

/** Raised when an object is used after dispose(). */
class DisposedError : public std::runtime_error {
public:
    explicit DisposedError(const std::string& msg) : std::runtime_error(msg) {}
};

constexpr std::chrono::milliseconds DEFAULT_CLICK_THRESHOLD {800};
constexpr std::chrono::milliseconds DEFAULT_CLICK_DEBOUNCE {50};
/** Delay between a synthesized key press and its key released notification. */
constexpr std::chrono::milliseconds KEY_SIMULATION_DELAY {100};
constexpr int MAX_SUPPORTED_CLICKS = 3;

/**
 * Per-button gesture state machine.
 *
 * Each accepted click (re)arms a timer of `clickThreshold`, when it expires
 * the accumulated count is classified. Reaching the max click count
 * classifies immediately. A click arriving less than `clickDebounce` after
 * the previously accepted click is contact bounce, it is dropped without
 * touching the count or the pending timer.
 *
 * Timers run on a shared Scheduler, observers are called from whichever
 * thread triggered the classification (the monitor thread or the timer
 * thread), never with the detector lock held.
 */
class ClickDetector {
public:
    using Clock = std::chrono::steady_clock;

private:
    struct State {
        std::mutex mtx;
        std::string name;
        Scheduler& timers;
        int count = 0;
        std::optional<Clock::time_point> last_click;
        Scheduler::TaskId pending_timer = 0;
        uint64_t generation = 0;
        std::chrono::milliseconds threshold = DEFAULT_CLICK_THRESHOLD;
        std::chrono::milliseconds debounce = DEFAULT_CLICK_DEBOUNCE;
        int max_clicks = MAX_SUPPORTED_CLICKS;
        bool disposed = false;
        Signal<ClickResult> clicked;

        State(std::string name, Scheduler& timers)
            : name(std::move(name)), timers(timers) {}

        /** Cancel the timer and zero the count, must hold mtx. */
        void clear();
    };

    std::shared_ptr<State> state;

    static ClickResult classify(int count) noexcept;
    static void onTimeout(const std::weak_ptr<State>& weak, uint64_t generation);

public:
    /**
     * @param name Used in log messages, usually the button name.
     * @param timers Scheduler running the classification timers.
     * @param max_clicks Count that triggers an immediate classification.
     */
    ClickDetector(std::string name, Scheduler& timers, int max_clicks = MAX_SUPPORTED_CLICKS);

    ~ClickDetector();

    ClickDetector(const ClickDetector&) = delete;
    ClickDetector& operator=(const ClickDetector&) = delete;

    /**
     * Register a button press.
     *
     * @throws DisposedError after dispose().
     */
    void registerClick();

    /** Forget the current sequence without classifying it. */
    void reset();

    /** Reset and refuse further clicks, repeated calls are harmless. */
    void dispose();

    Subscription onClick(std::function<void(ClickResult)> fn);

    void setClickThreshold(std::chrono::milliseconds threshold);
    void setClickDebounce(std::chrono::milliseconds debounce);

    /** @throws std::invalid_argument if not within 1..MAX_SUPPORTED_CLICKS */
    void setMaxClickCount(int max_clicks);

    std::chrono::milliseconds getClickThreshold() const;
    std::chrono::milliseconds getClickDebounce() const;
    int getMaxClickCount() const;
    int getCount() const;
    bool isDisposed() const;

    inline const std::string& getName() const noexcept {
        return state->name;
    }
};
