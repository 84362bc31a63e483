/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ButtonAction.hpp, actions bound to mouse clicks.                                  *
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

/** @file ButtonAction.hpp
 *
 * @brief Actions bound to click patterns, and the runner executing them.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <variant>

#include "InputABI.hpp"
#include "KeySimulator.hpp"
#include "KeyboardMonitor.hpp"
#include "Scheduler.hpp"

/** Press and release one key. */
struct KeyPress {
    KeyCode key;
    /** Also notify the keyboard monitor that the key was released. */
    bool raise_release;
};

/** modifier+key, e.g Ctrl+C */
struct KeyCombo {
    KeyCode modifier;
    KeyCode key;
};

/** modifier1+modifier2+key, e.g Ctrl+Shift+V */
struct KeyComboTwoModifiers {
    KeyCode modifier1;
    KeyCode modifier2;
    KeyCode key;
};

/** Fire-and-forget `/bin/bash -c command` */
struct ShellCommand {
    std::string command;
};

struct NoAction {};

using ActionKind = std::variant<KeyPress, KeyCombo, KeyComboTwoModifiers, ShellCommand, NoAction>;

struct ButtonAction {
    std::string name;
    ActionKind kind;

    static ButtonAction keyPress(KeyCode key, std::string name, bool raise_release = true);
    static ButtonAction keyCombo(KeyCode modifier, KeyCode key, std::string name);
    static ButtonAction keyCombo(KeyCode modifier1, KeyCode modifier2, KeyCode key,
                                 std::string name);
    static ButtonAction shellCommand(std::string command, std::string name = "");

    /** The shared no-op action, named "NoAction". */
    static const ButtonAction& none();

    inline bool isNone() const noexcept {
        return std::holds_alternative<NoAction>(kind);
    }
};

/** Launches a shell command, see spawnShell() */
using SpawnFn = std::function<void(const std::string&)>;

/**
 * Executes actions, either inline with execute() or on the action worker
 * with post().
 */
class ActionRunner {
private:
    IKeySimulator& simulator;
    IKeyboardMonitor& keyboard;
    Scheduler& worker;
    SpawnFn spawn;
    std::chrono::milliseconds release_delay;

public:
    /**
     * @param worker Scheduler that runs posted actions, one at a time.
     * @param spawn Used for ShellCommand actions.
     * @param release_delay Delay between a synthesized KeyPress and the
     *                      released notification.
     */
    ActionRunner(IKeySimulator& simulator,
                 IKeyboardMonitor& keyboard,
                 Scheduler& worker,
                 SpawnFn spawn,
                 std::chrono::milliseconds release_delay);

    ActionRunner(IKeySimulator& simulator, IKeyboardMonitor& keyboard, Scheduler& worker);

    /**
     * Run the action on the calling thread.
     *
     * @throws SystemError when key synthesis or process launch fails.
     */
    void execute(const ButtonAction& action);

    /**
     * Queue the action on the worker. Failures are logged, they never reach
     * the caller.
     */
    void post(ButtonAction action);
};
