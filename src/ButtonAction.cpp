/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ButtonAction.cpp, actions bound to mouse clicks.                                  *
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

#include <thread>

extern "C" {
    #include <linux/input.h>
}

#include "ButtonAction.hpp"
#include "ClickDetector.hpp"
#include "Subprocess.hpp"
#include "SystemError.hpp"
#include "Logging.hpp"
#include "utils.hpp"

using namespace std;

ButtonAction ButtonAction::keyPress(KeyCode key, string name, bool raise_release) {
    return {std::move(name), KeyPress {key, raise_release}};
}

ButtonAction ButtonAction::keyCombo(KeyCode modifier, KeyCode key, string name) {
    return {std::move(name), KeyCombo {modifier, key}};
}

ButtonAction ButtonAction::keyCombo(KeyCode modifier1, KeyCode modifier2, KeyCode key,
                                    string name) {
    return {std::move(name), KeyComboTwoModifiers {modifier1, modifier2, key}};
}

ButtonAction ButtonAction::shellCommand(string command, string name) {
    if (name.empty())
        name = "Shell: " + command;
    return {std::move(name), ShellCommand {std::move(command)}};
}

const ButtonAction& ButtonAction::none() {
    static const ButtonAction no_action {"NoAction", NoAction {}};
    return no_action;
}

ActionRunner::ActionRunner(IKeySimulator& simulator,
                           IKeyboardMonitor& keyboard,
                           Scheduler& worker,
                           SpawnFn spawn,
                           chrono::milliseconds release_delay)
    : simulator(simulator),
      keyboard(keyboard),
      worker(worker),
      spawn(std::move(spawn)),
      release_delay(release_delay)
{}

ActionRunner::ActionRunner(IKeySimulator& simulator, IKeyboardMonitor& keyboard, Scheduler& worker)
    : ActionRunner(simulator, keyboard, worker,
                   [](const string& cmd) { spawnShell(cmd); },
                   KEY_SIMULATION_DELAY)
{}

void ActionRunner::execute(const ButtonAction& action) {
    Log::debug("Executing action: {}", action.name);

    visit(overloaded {
        [&](const KeyPress& a) {
            simulator.simulateKeyPress(a.key);
            if (a.key == KEY_CAPSLOCK)
                Log::debug("CapsLock is now {}", keyboard.isCapsLockOn() ? "on" : "off");
            if (a.raise_release) {
                if (release_delay.count() > 0)
                    this_thread::sleep_for(release_delay);
                keyboard.raiseKeyReleasedEvent(a.key);
            }
        },
        [&](const KeyCombo& a) {
            simulator.simulateKeyCombo(a.modifier, a.key);
        },
        [&](const KeyComboTwoModifiers& a) {
            simulator.simulateKeyCombo(a.modifier1, a.modifier2, a.key);
        },
        [&](const ShellCommand& a) {
            spawn(a.command);
        },
        [](const NoAction&) {},
    }, action.kind);
}

void ActionRunner::post(ButtonAction action) {
    if (action.isNone())
        return;

    string name = action.name;
    auto id = worker.post([this, action = std::move(action)]() {
        try {
            execute(action);
        } catch (const SystemError &e) {
            Log::error("Action '{}' failed: {}", action.name, e.what());
        } catch (const runtime_error &e) {
            Log::error("Action '{}' failed: {}", action.name, e.what());
        }
    });

    if (id == 0)
        Log::warn("Action worker has been stopped, dropping '{}'", name);
}
