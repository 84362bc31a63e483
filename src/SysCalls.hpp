/** @file SysCalls.hpp
 *
 * @brief Thin facade over the system calls used for device I/O.
 *
 * Everything that talks to /dev/input or /dev/uinput goes through an
 * ISysCalls, so that tests can substitute a recording fake.
 */

#pragma once

#include <string>
#include <cstddef>

extern "C" {
    #include <sys/types.h>
}

class ISysCalls {
public:
    virtual ~ISysCalls() {}

    /** @return File descriptor, or -1 on failure. */
    virtual int open(const std::string& path, int flags) = 0;

    virtual int close(int fd) = 0;

    virtual ssize_t read(int fd, void *buf, size_t count) = 0;

    virtual ssize_t write(int fd, const void *buf, size_t count) = 0;

    /** ioctl with an integer argument, e.g EVIOCGRAB or UI_SET_KEYBIT. */
    virtual int ioctl(int fd, unsigned long request, int arg) = 0;

    /** ioctl with a pointer argument, e.g EVIOCGLED. */
    virtual int ioctl(int fd, unsigned long request, void *arg) = 0;

    /**
     * Wait for the fd to become readable.
     *
     * @return >0 when readable (or in an error/hangup state), 0 on timeout,
     *         -1 on failure.
     */
    virtual int poll(int fd, int timeout_ms) = 0;

    /** errno of the last failed call on this thread. */
    virtual int lastError() const = 0;
};

/** Forwards to libc. */
class LinuxSysCalls : public ISysCalls {
public:
    virtual int open(const std::string& path, int flags) override;
    virtual int close(int fd) override;
    virtual ssize_t read(int fd, void *buf, size_t count) override;
    virtual ssize_t write(int fd, const void *buf, size_t count) override;
    virtual int ioctl(int fd, unsigned long request, int arg) override;
    virtual int ioctl(int fd, unsigned long request, void *arg) override;
    virtual int poll(int fd, int timeout_ms) override;
    virtual int lastError() const override;
};
