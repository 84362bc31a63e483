/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Scheduler.cpp, single-threaded delayed task runner.                               *
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

#include <stdexcept>

#include "Scheduler.hpp"
#include "Logging.hpp"

using namespace std;

Scheduler::Scheduler(string name)
    : name(std::move(name))
{
    worker = thread([this]() { run(); });
}

Scheduler::~Scheduler() {
    stop();
}

Scheduler::TaskId Scheduler::post(Task task) {
    return schedule(chrono::milliseconds(0), std::move(task));
}

Scheduler::TaskId Scheduler::schedule(chrono::milliseconds delay, Task task) {
    lock_guard<mutex> lock(mtx);
    if (!running)
        return 0;
    TaskId id = next_id++;
    auto due = Clock::now() + delay;
    queue.emplace(make_pair(due, id), std::move(task));
    index.emplace(id, due);
    cv.notify_one();
    return id;
}

bool Scheduler::cancel(TaskId id) {
    lock_guard<mutex> lock(mtx);
    auto it = index.find(id);
    if (it == index.end())
        return false;
    queue.erase(make_pair(it->second, id));
    index.erase(it);
    return true;
}

void Scheduler::stop() {
    {
        lock_guard<mutex> lock(mtx);
        running = false;
        queue.clear();
        index.clear();
    }
    cv.notify_all();

    // From one of our own tasks the worker exits once the task returns, it is
    // joined by the next stop() on another thread.
    if (worker.joinable() && worker.get_id() != this_thread::get_id())
        worker.join();
}

bool Scheduler::isRunning() {
    lock_guard<mutex> lock(mtx);
    return running;
}

size_t Scheduler::pending() {
    lock_guard<mutex> lock(mtx);
    return queue.size();
}

void Scheduler::run() {
    unique_lock<mutex> lock(mtx);
    while (running) {
        if (queue.empty()) {
            cv.wait(lock);
            continue;
        }

        auto it = queue.begin();
        auto due = it->first.first;
        if (Clock::now() < due) {
            cv.wait_until(lock, due);
            continue;
        }

        Task task = std::move(it->second);
        index.erase(it->first.second);
        queue.erase(it);

        lock.unlock();
        try {
            task();
        } catch (const exception &e) {
            Log::error("[{}] task failed: {}", name, e.what());
        }
        lock.lock();
    }
}
