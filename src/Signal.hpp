/** @file Signal.hpp
 *
 * @brief Minimal publish/subscribe channel.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

/**
 * Handle returned by Signal::connect.
 *
 * Dropping the handle does not disconnect, call unsubscribe() for that. The
 * handle stays valid (and harmless) after the signal itself is gone.
 */
class Subscription {
private:
    std::function<void()> disconnect;

public:
    Subscription() {}
    explicit Subscription(std::function<void()> disconnect)
        : disconnect(std::move(disconnect)) {}

    void unsubscribe() {
        if (disconnect) {
            disconnect();
            disconnect = nullptr;
        }
    }

    inline bool isConnected() const noexcept {
        return static_cast<bool>(disconnect);
    }
};

template <class... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;

private:
    struct Slots {
        std::mutex mtx;
        std::map<uint64_t, Slot> slots;
        uint64_t next_id = 0;
    };
    std::shared_ptr<Slots> state = std::make_shared<Slots>();

public:
    Subscription connect(Slot slot) {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(state->mtx);
            id = state->next_id++;
            state->slots.emplace(id, std::move(slot));
        }
        std::weak_ptr<Slots> weak = state;
        return Subscription([weak, id]() {
            if (auto s = weak.lock()) {
                std::lock_guard<std::mutex> lock(s->mtx);
                s->slots.erase(id);
            }
        });
    }

    /** Call every connected slot, outside of the signal lock. */
    void emit(Args... args) const {
        std::map<uint64_t, Slot> slots;
        {
            std::lock_guard<std::mutex> lock(state->mtx);
            slots = state->slots;
        }
        for (auto& entry : slots)
            entry.second(args...);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(state->mtx);
        return state->slots.size();
    }
};
