/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Config.cpp, Lua configuration of evclickd.                                        *
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

#include <memory>
#include <optional>

#include "Config.hpp"
#include "KeyNames.hpp"
#include "LuaUtils.hpp"
#include "Logging.hpp"
#include "utils.hpp"

using namespace std;
using namespace std::chrono;
using Lua::getField;
using Lua::LuaError;

namespace {
    constexpr KeyCode MAX_KEY_CODE = 0x2ff;

    /** Key given as a name or a raw code, the key value is at the top of the stack. */
    KeyCode parseKey(lua_State *L, const string& where) {
        if (lua_isinteger(L, -1)) {
            lua_Integer code = lua_tointeger(L, -1);
            if (code <= 0 || code > MAX_KEY_CODE)
                throw ConfigError(where + ": key code out of range: " + to_string(code));
            return static_cast<KeyCode>(code);
        }
        if (lua_type(L, -1) == LUA_TSTRING) {
            string name = lua_tostring(L, -1);
            auto code = keyFromName(name);
            if (!code)
                throw ConfigError(where + ": unknown key '" + name + "'");
            return *code;
        }
        throw ConfigError(where + ": expected key name or code, got " + Lua::typeName(L, -1));
    }

    string comboName(const vector<KeyCode>& keys) {
        string name;
        for (KeyCode key : keys) {
            if (!name.empty())
                name += "+";
            name += keyName(key);
        }
        return name;
    }

    /** Parse the action at the top of the stack, nil is NoAction. */
    ButtonAction parseAction(lua_State *L, const string& where) {
        if (lua_isnil(L, -1))
            return ButtonAction::none();

        // Shorthand, single = "Enter"
        if (lua_type(L, -1) == LUA_TSTRING || lua_isinteger(L, -1)) {
            KeyCode key = parseKey(L, where);
            return ButtonAction::keyPress(key, keyName(key));
        }

        if (!lua_istable(L, -1))
            throw ConfigError(where + ": expected action table, got " + Lua::typeName(L, -1));

        optional<string> name, shell;
        optional<bool> release_event;
        try {
            name = getField<string>(L, -1, "name");
            shell = getField<string>(L, -1, "shell");
            release_event = getField<bool>(L, -1, "release_event");
        } catch (const LuaError &e) {
            throw ConfigError(where + "." + e.what());
        }

        lua_getfield(L, -1, "key");
        bool has_key = !lua_isnil(L, -1);
        KeyCode key = 0;
        if (has_key)
            key = parseKey(L, where + ".key");
        lua_pop(L, 1);

        vector<KeyCode> combo;
        lua_getfield(L, -1, "combo");
        bool has_combo = !lua_isnil(L, -1);
        if (has_combo) {
            if (!lua_istable(L, -1)) {
                lua_pop(L, 1);
                throw ConfigError(where + ".combo: expected table of keys");
            }
            lua_Integer len = luaL_len(L, -1);
            for (lua_Integer i = 1; i <= len; i++) {
                lua_geti(L, -1, i);
                try {
                    combo.push_back(parseKey(L, where + ".combo[" + to_string(i) + "]"));
                } catch (const ConfigError &) {
                    lua_pop(L, 2);
                    throw;
                }
                lua_pop(L, 1);
            }
        }
        lua_pop(L, 1);

        int kinds = int(has_key) + int(has_combo) + int(bool(shell));
        if (kinds == 0)
            throw ConfigError(where + ": action needs one of key, combo or shell");
        if (kinds > 1)
            throw ConfigError(where + ": only one of key, combo and shell may be given");

        if (has_key)
            return ButtonAction::keyPress(key, name.value_or(keyName(key)),
                                          release_event.value_or(true));

        if (has_combo) {
            string label = name.value_or(comboName(combo));
            if (combo.size() == 2)
                return ButtonAction::keyCombo(combo[0], combo[1], label);
            if (combo.size() == 3)
                return ButtonAction::keyCombo(combo[0], combo[1], combo[2], label);
            throw ConfigError(where + ".combo: expected 2 or 3 keys, got " +
                              to_string(combo.size()));
        }

        if (shell->empty())
            throw ConfigError(where + ".shell: empty command");
        return ButtonAction::shellCommand(*shell, name.value_or(""));
    }

    ButtonConfig parseButton(lua_State *L, const string& where) {
        if (!lua_istable(L, -1))
            throw ConfigError(where + ": expected table, got " + Lua::typeName(L, -1));

        ButtonConfig button;
        optional<int> max_clicks;
        try {
            max_clicks = getField<int>(L, -1, "max_clicks");
        } catch (const LuaError &e) {
            throw ConfigError(where + "." + e.what());
        }
        if (max_clicks) {
            if (*max_clicks < 1 || *max_clicks > MAX_SUPPORTED_CLICKS)
                throw ConfigError(where + ".max_clicks: must be between 1 and " +
                                  to_string(MAX_SUPPORTED_CLICKS));
            button.max_clicks = *max_clicks;
        }

        struct { const char *key; ButtonAction *action; } slots[] = {
            {"single", &button.single},
            {"double", &button.double_click},
            {"triple", &button.triple},
        };
        for (auto& slot : slots) {
            lua_getfield(L, -1, slot.key);
            try {
                *slot.action = parseAction(L, where + "." + slot.key);
            } catch (const ConfigError &) {
                lua_pop(L, 1);
                throw;
            }
            lua_pop(L, 1);
        }

        return button;
    }

    DeviceConfig parseDevice(lua_State *L, const string& where) {
        if (!lua_istable(L, -1))
            throw ConfigError(where + ": expected table, got " + Lua::typeName(L, -1));

        DeviceConfig dev;
        dev.pattern = getField<string>(L, -1, "pattern").value_or("");
        if (dev.pattern.empty())
            throw ConfigError(where + ".pattern: must be set");
        dev.name = getField<string>(L, -1, "name").value_or(dev.pattern);
        dev.exclude = getField<vector<string>>(L, -1, "exclude").value_or(vector<string>{});

        lua_getfield(L, -1, "buttons");
        if (!lua_istable(L, -1)) {
            lua_pop(L, 1);
            throw ConfigError(where + ".buttons: expected table");
        }
        const pair<const char *, MouseButton> names[] = {
            {"left", MouseButton::Left},
            {"middle", MouseButton::Middle},
            {"right", MouseButton::Right},
        };
        for (const auto& [key, button] : names) {
            lua_getfield(L, -1, key);
            try {
                if (!lua_isnil(L, -1))
                    dev.buttons[button] = parseButton(L, where + ".buttons." + key);
            } catch (const ConfigError &) {
                lua_pop(L, 2);
                throw;
            }
            lua_pop(L, 1);
        }
        lua_pop(L, 1);

        if (dev.buttons.empty())
            throw ConfigError(where + ".buttons: no buttons configured");
        return dev;
    }

    milliseconds parseDelay(lua_State *L, const char *key, milliseconds fallback, int min) {
        auto val = getField<int>(L, -1, key);
        if (!val)
            return fallback;
        if (*val < min)
            throw ConfigError(string(key) + ": must be at least " + to_string(min));
        return milliseconds(*val);
    }

    Config parse(lua_State *L) {
        Config cfg = Config::defaults();

        lua_pushglobaltable(L);
        // Pop the globals table whatever happens below.
        auto pop = mkuniq(L, [](lua_State *S) { lua_pop(S, 1); });

        try {
            cfg.click_threshold = parseDelay(L, "click_threshold_ms", cfg.click_threshold, 1);
            cfg.click_debounce = parseDelay(L, "click_debounce_ms", cfg.click_debounce, 0);
            cfg.key_simulation_delay = parseDelay(L, "key_simulation_delay_ms",
                                                  cfg.key_simulation_delay, 0);
            cfg.reconnect_interval = parseDelay(L, "reconnect_interval_ms",
                                                cfg.reconnect_interval, 1);
            if (auto attempts = getField<int>(L, -1, "log_interval_attempts")) {
                if (*attempts < 1)
                    throw ConfigError("log_interval_attempts: must be at least 1");
                cfg.log_interval_attempts = *attempts;
            }
            cfg.notify = getField<bool>(L, -1, "notify").value_or(cfg.notify);
            cfg.keyboard_device = getField<string>(L, -1, "keyboard_device").value_or("");
            cfg.key_released_command = getField<string>(L, -1, "key_released_command").value_or("");
        } catch (const LuaError &e) {
            throw ConfigError(e.what());
        }

        lua_getfield(L, -1, "devices");
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            return cfg;
        }
        if (!lua_istable(L, -1)) {
            lua_pop(L, 1);
            throw ConfigError("devices: expected table");
        }

        cfg.devices.clear();
        lua_Integer len = luaL_len(L, -1);
        for (lua_Integer i = 1; i <= len; i++) {
            lua_geti(L, -1, i);
            try {
                cfg.devices.push_back(parseDevice(L, "devices[" + to_string(i) + "]"));
            } catch (const LuaError &e) {
                lua_pop(L, 2);
                throw ConfigError("devices[" + to_string(i) + "]." + e.what());
            } catch (const ConfigError &) {
                lua_pop(L, 2);
                throw;
            }
            lua_pop(L, 1);
        }
        lua_pop(L, 1);

        if (cfg.devices.empty())
            throw ConfigError("devices: no devices configured");
        return cfg;
    }
}

Config Config::defaults() {
    Config cfg;

    DeviceConfig bt;
    bt.name = "Bluetooth mouse";
    bt.pattern = "BluetoothMouse3600";
    bt.buttons[MouseButton::Left] = ButtonConfig {
        3,
        ButtonAction::keyPress(*keyFromName("CapsLock"), "CapsLock (toggle recording)"),
        ButtonAction::none(),
        ButtonAction::none(),
    };
    bt.buttons[MouseButton::Middle] = ButtonConfig {
        3,
        ButtonAction::keyPress(*keyFromName("Enter"), "Enter"),
        ButtonAction::shellCommand("~/.local/bin/focus-chrome.sh", "Focus Chrome"),
        ButtonAction::keyCombo(*keyFromName("LeftCtrl"), *keyFromName("C"), "Ctrl+C (copy)"),
    };
    bt.buttons[MouseButton::Right] = ButtonConfig {
        3,
        ButtonAction::keyPress(*keyFromName("Escape"), "ESC (cancel transcription)"),
        ButtonAction::keyCombo(*keyFromName("LeftCtrl"), *keyFromName("LeftShift"),
                               *keyFromName("V"), "Ctrl+Shift+V (terminal paste)"),
        ButtonAction::shellCommand("~/.local/bin/focus-claude.sh", "Focus Claude"),
    };
    cfg.devices.push_back(bt);

    DeviceConfig usb;
    usb.name = "USB mouse";
    usb.pattern = "USB Optical Mouse";
    usb.exclude = {"G203 LIGHTSYNC"};
    usb.buttons[MouseButton::Left] = ButtonConfig {
        2,
        ButtonAction::keyPress(*keyFromName("CapsLock"), "CapsLock (toggle recording)"),
        ButtonAction::keyPress(*keyFromName("Escape"), "ESC (cancel transcription)"),
        ButtonAction::none(),
    };
    usb.buttons[MouseButton::Right] = ButtonConfig {
        3,
        ButtonAction::none(),
        ButtonAction::keyCombo(*keyFromName("LeftCtrl"), *keyFromName("LeftShift"),
                               *keyFromName("V"), "Ctrl+Shift+V (terminal paste)"),
        ButtonAction::keyCombo(*keyFromName("LeftCtrl"), *keyFromName("C"), "Ctrl+C (copy)"),
    };
    cfg.devices.push_back(usb);

    return cfg;
}

Config Config::fromFile(const string& path) {
    try {
        Lua::Script script(path);
        Log::info("Loaded config: {}", script.abs_src.empty() ? path : script.abs_src);
        return parse(script.getL());
    } catch (const LuaError &e) {
        throw ConfigError(path + ": " + e.what());
    }
}

Config Config::fromString(const string& src) {
    try {
        Lua::Script script;
        script.exec(src);
        return parse(script.getL());
    } catch (const LuaError &e) {
        throw ConfigError(e.what());
    }
}

string Config::defaultPath() {
    string home = envString("HOME");
    string config_home = envString("XDG_CONFIG_HOME", home + "/.config");
    return config_home + "/evclick/config.lua";
}
