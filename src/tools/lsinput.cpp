/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * evclick-lsinput, list input devices from /proc/bus/input.                         *
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

/** @file */

#include <iostream>
#include <string>

extern "C" {
    #include <unistd.h>
    #include <stdlib.h>
    #include <syslog.h>
}

#include "DeviceDiscovery.hpp"

#ifndef EVCLICK_VERSION
#define EVCLICK_VERSION "unknown"
#endif

using namespace std;

static string joinHandlers(const InputDeviceInfo& dev) {
    string out;
    for (const auto& handler : dev.handlers) {
        if (!out.empty())
            out += " ";
        out += handler;
    }
    return out;
}

int main(int argc, char *argv[]) {
    int c;
    bool small = false;
    bool pointers_only = false;
    string registry = ProcInputDiscovery::DEFAULT_REGISTRY;

    while ((c = getopt(argc, argv, "hvspr:")) != -1)
        switch (c) {
            case 'h':
                cout <<
                    "Usage: evclick-lsinput [-hvsp] [-r <registry>]\n"
                    "\n"
                    "Lists input devices, the names are what the `pattern` of a\n"
                    "device in the evclick config is matched against.\n"
                    "\n"
                    "Options:\n"
                    "  -h    Display this help info.\n"
                    "  -v    Display version.\n"
                    "  -s    Print each input device on a single line, easier for\n"
                    "        stream editors like awk and sed to deal with.\n"
                    "  -p    Only list pointer devices (those with a mouseN handler).\n"
                    "  -r    Read the device registry from another file.\n";
                return EXIT_SUCCESS;
            case 'v':
                cout << "evclick-lsinput v" EVCLICK_VERSION << endl;
                return EXIT_SUCCESS;
            case 's':
                small = true;
                break;
            case 'p':
                pointers_only = true;
                break;
            case 'r':
                registry = optarg;
                break;
            default:
                return EXIT_FAILURE;
        }

    openlog("evclick-lsinput", LOG_PERROR, LOG_USER);

    ProcInputDiscovery discovery({}, registry);
    auto devices = discovery.list();
    if (devices.empty()) {
        cerr << "No input devices found in " << registry << endl;
        return EXIT_FAILURE;
    }

    for (const auto& dev : devices) {
        if (dev.event_path.empty() || (pointers_only && !dev.isPointer()))
            continue;

        if (small) {
            cout << dev.event_path << "\t\"" << dev.name << "\"\t"
                 << joinHandlers(dev) << endl;
        } else {
            cout << dev.event_path << ": " << dev.name
                 << (dev.isPointer() ? " (pointer)" : "") << endl;
            if (!dev.phys.empty())
                cout << "    phys: " << dev.phys << endl;
            cout << "    handlers: " << joinHandlers(dev) << endl;
        }
    }

    return EXIT_SUCCESS;
}
