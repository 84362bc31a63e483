/** @file ButtonClickHandler.hpp
 *
 * @brief Wires a ClickDetector to the actions of one button.
 */

#pragma once

#include <memory>
#include <string>

#include "ButtonAction.hpp"
#include "ClickDetector.hpp"

class ButtonClickHandler {
private:
    struct Bindings {
        std::string name;
        ButtonAction single;
        ButtonAction double_click;
        ButtonAction triple;
        ActionRunner& runner;
    };

    std::shared_ptr<Bindings> bindings;
    ClickDetector detector;
    Subscription subscription;

    static void onClick(const Bindings& bindings, ClickResult result);

public:
    ButtonClickHandler(std::string name,
                       ButtonAction single,
                       ButtonAction double_click,
                       ButtonAction triple,
                       ActionRunner& runner,
                       Scheduler& timers,
                       int max_clicks = MAX_SUPPORTED_CLICKS);

    ~ButtonClickHandler();

    ButtonClickHandler(const ButtonClickHandler&) = delete;
    ButtonClickHandler& operator=(const ButtonClickHandler&) = delete;

    /** @throws DisposedError after dispose() */
    void registerClick();

    void reset();

    void dispose();

    /** Action bound to a classification, NoAction for Pending. */
    const ButtonAction& actionFor(ClickResult result) const;

    inline ClickDetector& getDetector() noexcept {
        return detector;
    }

    inline const std::string& getName() const noexcept {
        return bindings->name;
    }
};
