#pragma once

#include <string>
#include <exception>
#include <mutex>

extern "C" {
    #include <string.h>
    #include <errno.h>
    #include <syslog.h>
}

/**
 * Error raised when a system call fails.
 *
 * The explanation is suffixed with strerror(errnum), and the raw errno value
 * is kept so that callers can tell e.g ENOENT and EACCES apart.
 */
class SystemError : public std::exception {
private:
    std::string expl;
    int errnum = 0;

    static inline std::mutex& strerrorMutex() {
        static std::mutex mtx;
        return mtx;
    }

public:
    explicit SystemError(const std::string &expl) : expl(expl) {}

    inline SystemError(const std::string &expl, int errnum)
        : expl(expl),
          errnum(errnum)
    {
        this->expl += getErrorString(errnum);
        syslog(LOG_DEBUG, "SystemError: %s", this->expl.c_str());
    }

    static inline std::string getErrorString(int errnum) {
        // strerror() is not thread safe.
        std::lock_guard<std::mutex> lock(strerrorMutex());
        return std::string(strerror(errnum));
    }

    static inline std::string getErrorString() {
        return getErrorString(errno);
    }

    /** The errno value this error was raised with, 0 if none. */
    inline int code() const noexcept {
        return errnum;
    }

    virtual const char *what() const noexcept override {
        return expl.c_str();
    }
};
