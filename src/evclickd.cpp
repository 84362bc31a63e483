/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * evclickd, turns mouse clicks into key presses and commands.                       *
 *                                                                                   *
 * Copyright (C) 2026 The evclick authors                                            *
 * All rights reserved.                                                              *
 *                                                                                   *
 * Redistribution and use in source and binary forms, with or without                *
 * modification, are permitted provided that the following conditions are met:       *
 *                                                                                   *
 * 1. Redistributions of source code must retain the above copyright notice, this    *
 *    list of conditions and the following disclaimer.                               *
 * 2. Redistributions in binary form must reproduce the above copyright notice,      *
 *    this list of conditions and the following disclaimer in the documentation      *
 *    and/or other materials provided with the distribution.                         *
 *                                                                                   *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND   *
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED     *
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE            *
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE      *
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL        *
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR        *
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER        *
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,     *
 * OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE     *
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.              *
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

extern "C" {
    #include <getopt.h>
    #include <signal.h>
    #include <syslog.h>
    #include <unistd.h>
}

#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "ButtonAction.hpp"
#include "ButtonClickHandler.hpp"
#include "Config.hpp"
#include "Daemon.hpp"
#include "DeviceDiscovery.hpp"
#include "DeviceMonitor.hpp"
#include "KeyNames.hpp"
#include "KeyboardMonitor.hpp"
#include "Logging.hpp"
#include "Notifications.hpp"
#include "Scheduler.hpp"
#include "Subprocess.hpp"
#include "SysCalls.hpp"
#include "SystemError.hpp"
#include "UInputKeySimulator.hpp"

#ifndef EVCLICK_VERSION
#define EVCLICK_VERSION "unknown"
#endif

using namespace std;

static int no_fork;
static int verbose;

/** Replace every "%k" in the command with the key name. */
static string expandKeyCommand(string cmd, KeyCode key) {
    const string name = keyName(key);
    for (size_t pos = cmd.find("%k"); pos != string::npos; pos = cmd.find("%k", pos + name.size()))
        cmd.replace(pos, 2, name);
    return cmd;
}

static Config loadConfig(const string& explicit_path) {
    if (!explicit_path.empty())
        return Config::fromFile(explicit_path);

    string path = Config::defaultPath();
    if (access(path.c_str(), F_OK) == -1) {
        Log::info("No config at {}, using the built-in profile", path);
        return Config::defaults();
    }
    return Config::fromFile(path);
}

/**
 * Owns everything that runs while the daemon is up, members are declared
 * in dependency order so that destruction tears down the monitors before
 * the threads and devices they use.
 */
class EvclickDaemon {
private:
    Config cfg;
    LinuxSysCalls sys;
    Scheduler timers {"click-timers"};
    Scheduler actions {"actions"};
    UInputKeySimulator simulator;
    EvdevKeyboardMonitor keyboard;
    ActionRunner runner;
    Notifier notifier;
    vector<unique_ptr<ProcInputDiscovery>> discoveries;
    vector<unique_ptr<DeviceMonitor>> monitors;
    vector<Subscription> subscriptions;

    void addDevice(const DeviceConfig& dev);

public:
    explicit EvclickDaemon(Config config);

    ~EvclickDaemon();

    void start();
    void stop();
};

EvclickDaemon::EvclickDaemon(Config config)
    : cfg(std::move(config)),
      simulator(sys),
      keyboard(sys, cfg.keyboard_device),
      runner(simulator, keyboard, actions,
             [](const string& cmd) { spawnShell(cmd); },
             cfg.key_simulation_delay),
      notifier("evclick", cfg.notify)
{
    if (!cfg.key_released_command.empty()) {
        string cmd = cfg.key_released_command;
        subscriptions.push_back(keyboard.onKeyReleased([cmd](KeyCode key) {
            try {
                spawnShell(expandKeyCommand(cmd, key));
            } catch (const SystemError &e) {
                Log::error("Unable to run key released command: {}", e.what());
            }
        }));
    }

    for (const auto& dev : cfg.devices)
        addDevice(dev);
}

EvclickDaemon::~EvclickDaemon() {
    stop();
}

void EvclickDaemon::addDevice(const DeviceConfig& dev) {
    discoveries.push_back(make_unique<ProcInputDiscovery>(dev.exclude));

    MonitorOptions opts;
    opts.name = dev.name;
    opts.pattern = dev.pattern;
    opts.reconnect_interval = cfg.reconnect_interval;
    opts.log_interval_attempts = cfg.log_interval_attempts;
    auto monitor = make_unique<DeviceMonitor>(opts, sys, *discoveries.back());

    for (const auto& [button, bcfg] : dev.buttons) {
        auto handler = make_unique<ButtonClickHandler>(
            dev.name + " " + mouseButtonName(button),
            bcfg.single, bcfg.double_click, bcfg.triple,
            runner, timers, bcfg.max_clicks);
        handler->getDetector().setClickThreshold(cfg.click_threshold);
        handler->getDetector().setClickDebounce(cfg.click_debounce);
        monitor->bind(button, std::move(handler));
    }

    string name = dev.name;
    subscriptions.push_back(monitor->onConnected([this, name](const string& path) {
        notifier.notify("Device connected", "{} ({})", name, path);
    }));
    subscriptions.push_back(monitor->onDisconnected([this, name](const string& path) {
        notifier.notify("Device disconnected", "{} ({})", name, path);
    }));

    monitors.push_back(std::move(monitor));
}

void EvclickDaemon::start() {
    for (auto& monitor : monitors) {
        const auto& opts = monitor->getOptions();
        Log::info("Watching for {} (pattern: '{}')", opts.name, opts.pattern);
        monitor->start();
    }
}

void EvclickDaemon::stop() {
    for (auto& subscription : subscriptions)
        subscription.unsubscribe();
    for (auto& monitor : monitors)
        monitor->stop();
    timers.stop();
    actions.stop();
}

int main(int argc, char *argv[]) {
    signal(SIGPIPE, SIG_IGN);

    string HELP =
        "Usage: evclickd [--config <file>] [--no-fork] [--verbose]\n"
        "\n"
        "Grabs the configured mice and turns single, double and triple clicks\n"
        "into key presses, key combinations and shell commands.\n"
        "\n"
        "Options:\n"
        "  -c, --config   Lua config file, default: $XDG_CONFIG_HOME/evclick/config.lua\n"
        "  --no-fork      Don't daemonize/fork, also log to stderr.\n"
        "  -v, --verbose  Log debug messages.\n"
        "  -h, --help     Display this help information.\n"
        "  --version      Display version and exit.\n"
    ;

    static struct option long_options[] =
        {
            {"no-fork", no_argument, &no_fork, 1},
            {"version", no_argument, 0, 0},
            {"help",    no_argument, 0, 'h'},
            {"verbose", no_argument, 0, 'v'},
            {"config",  required_argument, 0, 'c'},
            {0, 0, 0, 0}
        };
    int option_index = 0;
    string config_path;

    do {
        int c = getopt_long(argc, argv, "hvc:", long_options, &option_index);
        if (c == -1)
            break;

        switch (c) {
            case 0:
                if (long_options[option_index].flag != 0)
                    break;
                if (string(long_options[option_index].name) == "version") {
                    cout << "evclickd v" EVCLICK_VERSION << endl;
                    return 0;
                }
                break;

            case 'c':
                config_path = optarg;
                break;

            case 'v':
                verbose = 1;
                break;

            case 'h':
                cout << HELP;
                return 0;

            case '?':
                /* getopt_long already printed an error message. */
                cout << HELP;
                return 1;

            default:
                return 1;
        }
    } while (true);

    openlog("evclickd", LOG_PID | (no_fork ? LOG_PERROR : 0), LOG_DAEMON);
    setlogmask(LOG_UPTO(verbose ? LOG_DEBUG : LOG_INFO));

    Config cfg;
    try {
        cfg = loadConfig(config_path);
    } catch (const ConfigError &e) {
        cerr << "evclickd: " << e.what() << endl;
        Log::crit("Invalid configuration: {}", e.what());
        return 1;
    }

    cout << "Starting evclickd v" EVCLICK_VERSION " for:" << endl;
    for (const auto& dev : cfg.devices)
        cout << "  - " << dev.name << " <" << dev.pattern << ">" << endl;

    try {
        if (!no_fork)
            daemonize();

        // daemonize() closes every descriptor, so the lock is taken afterwards.
        InstanceLock lock(InstanceLock::defaultPath());

        // Block the termination signals before any thread is spawned so that
        // only sigwait() below sees them.
        sigset_t sigs;
        sigemptyset(&sigs);
        sigaddset(&sigs, SIGINT);
        sigaddset(&sigs, SIGTERM);
        sigaddset(&sigs, SIGHUP);
        if (int err = pthread_sigmask(SIG_BLOCK, &sigs, nullptr))
            throw SystemError("Unable to block signals: ", err);

        EvclickDaemon daemon(std::move(cfg));
        Log::info("Running evclickd v{} ...", EVCLICK_VERSION);
        daemon.start();

        int sig = 0;
        if (int err = sigwait(&sigs, &sig))
            throw SystemError("Error in sigwait(): ", err);
        Log::info("Received {}, shutting down", strsignal(sig));
        daemon.stop();
    } catch (const SystemError &e) {
        Log::crit("Abort due to exception: {}", e.what());
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    Log::info("Stopped");
    return 0;
}
