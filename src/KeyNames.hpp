/** @file KeyNames.hpp
 *
 * @brief Translation between key names and Linux key codes.
 */

#pragma once

#include <optional>
#include <string>

#include "InputABI.hpp"

/**
 * Look up a key by name.
 *
 * Matching is case-insensitive, a "KEY_" prefix and underscores are ignored,
 * so "KEY_LEFTCTRL", "leftctrl" and "Left_Ctrl" are all the same key. A few
 * aliases like "LeftControl", "Esc" and "Super" are understood as well.
 */
std::optional<KeyCode> keyFromName(const std::string& name);

/** Canonical name of the key, e.g "LeftCtrl", or "KEY_<code>" if unknown. */
std::string keyName(KeyCode code);

/** Whether the key is one of the Ctrl/Shift/Alt/Meta keys. */
bool isModifier(KeyCode code) noexcept;
