/** @file KeySimulator.hpp
 *
 * @brief Key synthesis interface.
 */

#pragma once

#include <vector>

#include "InputABI.hpp"

class IKeySimulator {
public:
    virtual ~IKeySimulator() {}

    /**
     * Press and release one key.
     *
     * @throws SystemError if the virtual keyboard could not be set up.
     */
    virtual void simulateKeyPress(KeyCode key) = 0;

    /** Hold the modifier while pressing the key, e.g Ctrl+C */
    virtual void simulateKeyCombo(KeyCode modifier, KeyCode key) = 0;

    /** Hold both modifiers while pressing the key, e.g Ctrl+Shift+V */
    virtual void simulateKeyCombo(KeyCode modifier1, KeyCode modifier2, KeyCode key) = 0;

    /**
     * General form, modifiers are pressed in order and released in reverse
     * order.
     */
    virtual void simulateKeys(const std::vector<KeyCode>& modifiers, KeyCode key) = 0;
};
