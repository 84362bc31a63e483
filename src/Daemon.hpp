/** @file Daemon.hpp
 *
 * @brief Daemonization utilities.
 */

#pragma once

#include <string>

/**
 * Change stdout and stderr to point to different files, specified
 * by the given paths.
 *
 * Stdin will always be redirected from /dev/null. Note that after this call
 * any blocking reads on stdin will halt the program.
 *
 * @throws SystemError if /dev/null or the new streams cannot be opened.
 */
void dup_streams(const std::string &stdout_path,
                 const std::string &stderr_path);

/** Turn the calling process into a daemon, output goes to /dev/null.
 */
void daemonize();

/** Turn the calling process into a daemon.
 *
 * @param logfile_path The logfile to redirect stderr and stdout
 *                     into.
 */
void daemonize(const std::string &logfile_path);

/**
 * Holds an exclusive flock() on a lock file for as long as it lives, used to
 * keep a second daemon from grabbing the same devices.
 */
class InstanceLock {
private:
    int fd = -1;
    std::string path;

public:
    /**
     * @throws SystemError if the file can't be opened, or is locked by
     *         another process (code() is EWOULDBLOCK then).
     */
    explicit InstanceLock(std::string path);

    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    /** $XDG_RUNTIME_DIR/evclickd.lock, or /tmp/evclickd-<uid>.lock */
    static std::string defaultPath();

    inline const std::string& getPath() const noexcept {
        return path;
    }
};
