/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ClickDetector.cpp, single/double/triple click classification.                     *
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

#include "ClickDetector.hpp"
#include "Logging.hpp"

using namespace std;
using namespace std::chrono;

const char *clickResultName(ClickResult result) noexcept {
    switch (result) {
        case ClickResult::Pending: return "Pending";
        case ClickResult::SingleClick: return "SingleClick";
        case ClickResult::DoubleClick: return "DoubleClick";
        case ClickResult::TripleClick: return "TripleClick";
    }
    return "Unknown";
}

void ClickDetector::State::clear() {
    if (pending_timer != 0) {
        timers.cancel(pending_timer);
        pending_timer = 0;
    }
    count = 0;
    generation++;
}

ClickDetector::ClickDetector(string name, Scheduler& timers, int max_clicks)
    : state(make_shared<State>(std::move(name), timers))
{
    setMaxClickCount(max_clicks);
}

ClickDetector::~ClickDetector() {
    dispose();
}

ClickResult ClickDetector::classify(int count) noexcept {
    if (count >= 3)
        return ClickResult::TripleClick;
    if (count == 2)
        return ClickResult::DoubleClick;
    if (count == 1)
        return ClickResult::SingleClick;
    return ClickResult::Pending;
}

void ClickDetector::registerClick() {
    ClickResult result = ClickResult::Pending;
    {
        lock_guard<mutex> lock(state->mtx);
        if (state->disposed)
            throw DisposedError("ClickDetector '" + state->name + "' has been disposed");

        auto now = Clock::now();
        if (state->last_click && now - *state->last_click < state->debounce) {
            Log::debug("[{}] click ignored, within {}ms debounce window",
                       state->name, state->debounce.count());
            return;
        }

        state->last_click = now;
        state->count++;
        if (state->pending_timer != 0) {
            state->timers.cancel(state->pending_timer);
            state->pending_timer = 0;
        }
        state->generation++;

        if (state->count >= state->max_clicks) {
            result = classify(state->count);
            state->count = 0;
        } else {
            weak_ptr<State> weak = state;
            uint64_t generation = state->generation;
            state->pending_timer = state->timers.schedule(state->threshold, [weak, generation]() {
                onTimeout(weak, generation);
            });
        }
    }

    if (result != ClickResult::Pending) {
        Log::debug("[{}] {} (max click count reached)", state->name, clickResultName(result));
        state->clicked.emit(result);
    }
}

void ClickDetector::onTimeout(const weak_ptr<State>& weak, uint64_t generation) {
    auto state = weak.lock();
    if (!state)
        return;

    ClickResult result;
    {
        lock_guard<mutex> lock(state->mtx);
        // Superseded by a click or a reset while waiting for the lock.
        if (state->disposed || state->generation != generation)
            return;
        result = classify(state->count);
        state->pending_timer = 0;
        state->count = 0;
        state->generation++;
    }

    if (result != ClickResult::Pending) {
        Log::debug("[{}] {}", state->name, clickResultName(result));
        state->clicked.emit(result);
    }
}

void ClickDetector::reset() {
    lock_guard<mutex> lock(state->mtx);
    state->clear();
}

void ClickDetector::dispose() {
    lock_guard<mutex> lock(state->mtx);
    if (state->disposed)
        return;
    state->clear();
    state->disposed = true;
}

Subscription ClickDetector::onClick(function<void(ClickResult)> fn) {
    return state->clicked.connect(std::move(fn));
}

void ClickDetector::setClickThreshold(milliseconds threshold) {
    lock_guard<mutex> lock(state->mtx);
    state->threshold = threshold;
}

void ClickDetector::setClickDebounce(milliseconds debounce) {
    lock_guard<mutex> lock(state->mtx);
    state->debounce = debounce;
}

void ClickDetector::setMaxClickCount(int max_clicks) {
    if (max_clicks < 1 || max_clicks > MAX_SUPPORTED_CLICKS)
        throw invalid_argument("max click count must be between 1 and " +
                               to_string(MAX_SUPPORTED_CLICKS) + ", got " +
                               to_string(max_clicks));
    lock_guard<mutex> lock(state->mtx);
    state->max_clicks = max_clicks;
}

milliseconds ClickDetector::getClickThreshold() const {
    lock_guard<mutex> lock(state->mtx);
    return state->threshold;
}

milliseconds ClickDetector::getClickDebounce() const {
    lock_guard<mutex> lock(state->mtx);
    return state->debounce;
}

int ClickDetector::getMaxClickCount() const {
    lock_guard<mutex> lock(state->mtx);
    return state->max_clicks;
}

int ClickDetector::getCount() const {
    lock_guard<mutex> lock(state->mtx);
    return state->count;
}

bool ClickDetector::isDisposed() const {
    lock_guard<mutex> lock(state->mtx);
    return state->disposed;
}
