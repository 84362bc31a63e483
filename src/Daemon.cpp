extern "C" {
    #include <unistd.h>
    #include <fcntl.h>
    #include <errno.h>
    #include <stdlib.h>
    #include <stdio.h>
    #include <sys/file.h>
    #include <sys/stat.h>
    #include <sys/types.h>
    #include <syslog.h>
}

#include <string>

#include "SystemError.hpp"
#include "Daemon.hpp"
#include "utils.hpp"

using namespace std;

static constexpr size_t BD_MAX_CLOSE = 8192;

void dup_streams(const string &stdout_path, const string &stderr_path) {
    auto openStream = [](const string& path, int flags) {
        int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
        if (fd == -1)
            throw SystemError("Unable to open " + path + ": ", errno);
        return fd;
    };

    int fds[] = {
        openStream("/dev/null", O_RDONLY),
        openStream(stdout_path, O_WRONLY | O_CREAT | O_APPEND),
        openStream(stderr_path, O_WRONLY | O_CREAT | O_APPEND),
    };
    const int targets[] = {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO};

    for (int i = 0; i < 3; i++) {
        if (fds[i] == targets[i]) {
            // Already in place, just keep it across exec.
            fcntl(fds[i], F_SETFD, 0);
            continue;
        }
        if (::dup2(fds[i], targets[i]) == -1)
            throw SystemError("Error in dup2(): ", errno);
    }
    for (int i = 0; i < 3; i++)
        if (fds[i] > STDERR_FILENO)
            ::close(fds[i]);
}

/**
 * Fork through, i.e fork and become the subprocess while the original process
 * stops.
 *
 * @throws SystemError If the fork() call fails.
 */
static inline void forkThrough() {
    switch (fork()) {
        case -1: throw SystemError("Unable to fork(): ", errno);
        case 0: break;
        default: _exit(0);
    }
}

/**
 * Adapted to C++ from Michael Kerrisks TLPI book.
 */
void daemonize(const string &logfile_path) {
    forkThrough();

    if (setsid() == -1)
        throw SystemError("Unable to setsid(): ", errno);

    forkThrough();

    umask(0);

    if (chdir("/") == -1)
        throw SystemError("Unable to chdir(\"/\"): ", errno);

    // Close all files, syslog reopens its socket on demand.
    closelog();
    int maxfd = sysconf(_SC_OPEN_MAX);
    maxfd = (maxfd == -1) ? BD_MAX_CLOSE : maxfd;
    for (int fd = 0; fd < maxfd; fd++)
        close(fd);

    dup_streams(logfile_path, logfile_path);
}

void daemonize() {
    daemonize("/dev/null");
}

InstanceLock::InstanceLock(string path) : path(std::move(path)) {
    fd = ::open(this->path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd == -1)
        throw SystemError("Unable to open lock file " + this->path + ": ", errno);

    if (flock(fd, LOCK_EX | LOCK_NB) == -1) {
        int err = errno;
        ::close(fd);
        fd = -1;
        throw SystemError("Unable to lock " + this->path + ", is evclickd already running? ", err);
    }
}

InstanceLock::~InstanceLock() {
    if (fd != -1) {
        // Did not find any failure conditions for LOCK_UN in the documentation.
        flock(fd, LOCK_UN);
        ::close(fd);
    }
}

string InstanceLock::defaultPath() {
    string runtime_dir = envString("XDG_RUNTIME_DIR");
    if (runtime_dir.empty())
        return "/tmp/evclickd-" + to_string(getuid()) + ".lock";
    return runtime_dir + "/evclickd.lock";
}
