#pragma once

#include <fmt/format.h>

extern "C" {
    #include <syslog.h>
}

class Log {
    template <class... T>
    static inline auto sendLog(int level, fmt::format_string<T...> fmt, T&&... args) {
        auto msg = fmt::format(fmt, std::forward<T>(args)...);
        return ::syslog(level, "%s", msg.c_str());
    }

  public:
    template <class... T>
    static inline auto error(fmt::format_string<T...> fmt, T&&... args) {
        return sendLog(LOG_ERR, fmt, std::forward<T>(args)...);
    }

    template <class... T>
    static inline auto warn(fmt::format_string<T...> fmt, T&&... args) {
        return sendLog(LOG_WARNING, fmt, std::forward<T>(args)...);
    }

    template <class... T>
    static inline auto info(fmt::format_string<T...> fmt, T&&... args) {
        return sendLog(LOG_INFO, fmt, std::forward<T>(args)...);
    }

    template <class... T>
    static inline auto debug(fmt::format_string<T...> fmt, T&&... args) {
        return sendLog(LOG_DEBUG, fmt, std::forward<T>(args)...);
    }

    template <class... T>
    static inline auto notice(fmt::format_string<T...> fmt, T&&... args) {
        return sendLog(LOG_NOTICE, fmt, std::forward<T>(args)...);
    }

    template <class... T>
    static inline auto crit(fmt::format_string<T...> fmt, T&&... args) {
        return sendLog(LOG_CRIT, fmt, std::forward<T>(args)...);
    }
};
