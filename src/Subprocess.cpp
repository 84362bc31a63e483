#include <vector>

extern "C" {
    #include <errno.h>
    #include <fcntl.h>
    #include <unistd.h>
    #include <sys/wait.h>
}

#include "Subprocess.hpp"
#include "SystemError.hpp"
#include "Logging.hpp"

using namespace std;

/**
 * Only async-signal-safe calls from here on, we may have been forked from a
 * multithreaded process.
 */
[[noreturn]] static void execShell(char *const argv[]) {
    if (setsid() == -1)
        _exit(127);

    switch (fork()) {
        case -1:
            _exit(127);
        case 0:
            break;
        default:
            _exit(0);
    }

    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd != -1) {
        dup2(null_fd, STDIN_FILENO);
        if (null_fd > STDERR_FILENO)
            close(null_fd);
    }

    execv(SHELL_PATH, argv);
    _exit(127);
}

pid_t spawnShell(const string& cmd) {
    // Build argv before forking, allocation is not safe in the child.
    string arg0 = "bash", arg1 = "-c", arg2 = cmd;
    vector<char *> argv = {&arg0[0], &arg1[0], &arg2[0], nullptr};

    pid_t pid = fork();
    if (pid == -1)
        throw SystemError("Unable to fork(): ", errno);
    if (pid == 0)
        execShell(argv.data());

    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR)
            throw SystemError("Error in waitpid(): ", errno);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
        Log::warn("Unable to launch command: {}", cmd);
    else
        Log::info("Launched command: {}", cmd);

    return pid;
}
