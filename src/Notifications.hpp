/** @file Notifications.hpp
 *
 * @brief Desktop notifications through libnotify.
 */

#pragma once

#include <string>
#include <mutex>
#include <tuple>
#include <fmt/format.h>

/**
 * Shows device connect/disconnect notifications.
 *
 * Repeating the previous notification is a no-op. When notifications are
 * disabled, or D-Bus is unavailable, the message goes to syslog instead.
 */
class Notifier {
private:
    std::string app_name;
    bool enabled;
    bool initialized = false;
    std::mutex mtx;
    std::tuple<std::string, std::string> last_notification;

public:
    Notifier(std::string app_name, bool enabled);

    ~Notifier();

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    void notify(const std::string& title, const std::string& msg);

    template <class... T>
    inline void notify(const std::string& title, fmt::format_string<T...> fmt, T&&... args) {
        notify(title, fmt::format(fmt, std::forward<T>(args)...));
    }

    inline bool isEnabled() const noexcept {
        return enabled && initialized;
    }
};
