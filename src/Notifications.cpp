extern "C" {
    #include <libnotify/notify.h>
}

#include "Notifications.hpp"
#include "Logging.hpp"

using namespace std;

static constexpr int NOTIFICATION_TIMEOUT_MS = 6000;

Notifier::Notifier(string app_name, bool enabled)
    : app_name(std::move(app_name)),
      enabled(enabled)
{
    if (!enabled)
        return;
    initialized = notify_init(this->app_name.c_str());
    if (!initialized)
        Log::warn("Unable to initialize libnotify, notifications go to syslog.");
}

Notifier::~Notifier() {
    if (initialized)
        notify_uninit();
}

void Notifier::notify(const string& title, const string& msg) {
    lock_guard<mutex> lock(mtx);
    tuple<string, string> notif(title, msg);
    if (notif == last_notification)
        return;
    last_notification = notif;

    if (!isEnabled()) {
        Log::info("{}: {}", title, msg);
        return;
    }

    NotifyNotification *n = notify_notification_new(title.c_str(), msg.c_str(), "input-mouse");
    if (n == nullptr) {
        Log::warn("D-Bus notifications cannot be shown, logging them to syslog.");
        Log::info("{}: {}", title, msg);
        return;
    }
    notify_notification_set_timeout(n, NOTIFICATION_TIMEOUT_MS);
    notify_notification_set_urgency(n, NOTIFY_URGENCY_NORMAL);
    notify_notification_set_app_name(n, app_name.c_str());

    GError *err = nullptr;
    if (!notify_notification_show(n, &err)) {
        Log::warn("D-Bus notifications cannot be shown ({}), logging them to syslog.",
                  err ? err->message : "unknown error");
        Log::info("{}: {}", title, msg);
        if (err)
            g_error_free(err);
    }
    g_object_unref(G_OBJECT(n));
}
