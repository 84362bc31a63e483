/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Scheduler.hpp, single-threaded delayed task runner.                               *
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

/** @file Scheduler.hpp
 *
 * @brief Single thread running immediate and delayed tasks.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

/**
 * Runs tasks one at a time on a worker thread, in order of their due time.
 *
 * Tasks are executed without holding the scheduler lock, so a task may post
 * or cancel other tasks.
 */
class Scheduler {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    /** 0 is never a valid id. */
    using TaskId = uint64_t;

private:
    std::string name;
    std::mutex mtx;
    std::condition_variable cv;
    std::map<std::pair<Clock::time_point, TaskId>, Task> queue;
    std::unordered_map<TaskId, Clock::time_point> index;
    TaskId next_id = 1;
    bool running = true;
    std::thread worker;

    void run();

public:
    explicit Scheduler(std::string name);

    /**
     * Stops the worker, pending tasks are dropped.
     *
     * Must not run on the worker thread, i.e a task may stop() its scheduler
     * but not destroy it.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /** Run the task as soon as possible. */
    TaskId post(Task task);

    /**
     * Run the task after `delay`.
     *
     * @return Id usable with cancel(), 0 if the scheduler has been stopped.
     */
    TaskId schedule(std::chrono::milliseconds delay, Task task);

    /**
     * Cancel a task that has not started yet.
     *
     * @return True if the task was removed.
     */
    bool cancel(TaskId id);

    /**
     * Stop the worker thread, waits for a running task to finish.
     *
     * Called from a task, the worker is only told to exit and is joined by
     * the destructor.
     */
    void stop();

    bool isRunning();

    /** Number of tasks waiting to run. */
    size_t pending();

    inline const std::string& getName() const noexcept {
        return name;
    }
};
