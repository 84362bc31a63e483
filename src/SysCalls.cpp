extern "C" {
    #include <errno.h>
    #include <fcntl.h>
    #include <poll.h>
    #include <sys/ioctl.h>
    #include <unistd.h>
}

#include "SysCalls.hpp"

int LinuxSysCalls::open(const std::string& path, int flags) {
    return ::open(path.c_str(), flags | O_CLOEXEC);
}

int LinuxSysCalls::close(int fd) {
    return ::close(fd);
}

ssize_t LinuxSysCalls::read(int fd, void *buf, size_t count) {
    return ::read(fd, buf, count);
}

ssize_t LinuxSysCalls::write(int fd, const void *buf, size_t count) {
    return ::write(fd, buf, count);
}

int LinuxSysCalls::ioctl(int fd, unsigned long request, int arg) {
    return ::ioctl(fd, request, arg);
}

int LinuxSysCalls::ioctl(int fd, unsigned long request, void *arg) {
    return ::ioctl(fd, request, arg);
}

int LinuxSysCalls::poll(int fd, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    return ::poll(&pfd, 1, timeout_ms);
}

int LinuxSysCalls::lastError() const {
    return errno;
}
