#include "ButtonClickHandler.hpp"
#include "Logging.hpp"

using namespace std;

ButtonClickHandler::ButtonClickHandler(string name,
                                       ButtonAction single,
                                       ButtonAction double_click,
                                       ButtonAction triple,
                                       ActionRunner& runner,
                                       Scheduler& timers,
                                       int max_clicks)
    : bindings(make_shared<Bindings>(Bindings {name, std::move(single),
                                               std::move(double_click),
                                               std::move(triple), runner})),
      detector(name, timers, max_clicks)
{
    // Detector state can outlive the handler on the timer thread.
    weak_ptr<Bindings> weak = bindings;
    subscription = detector.onClick([weak](ClickResult result) {
        if (auto b = weak.lock())
            onClick(*b, result);
    });
}

ButtonClickHandler::~ButtonClickHandler() {
    dispose();
    subscription.unsubscribe();
}

void ButtonClickHandler::onClick(const Bindings& bindings, ClickResult result) {
    const ButtonAction *action = nullptr;
    switch (result) {
        case ClickResult::SingleClick: action = &bindings.single; break;
        case ClickResult::DoubleClick: action = &bindings.double_click; break;
        case ClickResult::TripleClick: action = &bindings.triple; break;
        case ClickResult::Pending: return;
    }

    Log::info("[{}] {} -> {}", bindings.name, clickResultName(result), action->name);
    bindings.runner.post(*action);
}

void ButtonClickHandler::registerClick() {
    detector.registerClick();
}

void ButtonClickHandler::reset() {
    detector.reset();
}

void ButtonClickHandler::dispose() {
    detector.dispose();
}

const ButtonAction& ButtonClickHandler::actionFor(ClickResult result) const {
    switch (result) {
        case ClickResult::SingleClick: return bindings->single;
        case ClickResult::DoubleClick: return bindings->double_click;
        case ClickResult::TripleClick: return bindings->triple;
        default: return ButtonAction::none();
    }
}
