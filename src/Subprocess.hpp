/** @file Subprocess.hpp
 *
 * @brief Launch detached shell commands.
 */

#pragma once

#include <string>

extern "C" {
    #include <sys/types.h>
}

/** Shell used for commands. */
constexpr const char *SHELL_PATH = "/bin/bash";

/**
 * Run `cmd` with `/bin/bash -c` in the background.
 *
 * The command is double-forked into its own session so that it is reparented
 * to init and never becomes a zombie of the daemon. Output is not captured
 * and the exit status is not reported.
 *
 * @throws SystemError if fork() fails.
 * @return pid of the intermediate child, which has already been reaped.
 */
pid_t spawnShell(const std::string& cmd);
