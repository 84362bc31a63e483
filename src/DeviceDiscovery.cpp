/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * DeviceDiscovery.cpp, find event devices by name.                                  *
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

#include <fstream>
#include <sstream>
#include <cctype>

#include "DeviceDiscovery.hpp"
#include "Logging.hpp"
#include "utils.hpp"

using namespace std;

static const string NAME_PREFIX = "N: Name=";
static const string PHYS_PREFIX = "P: Phys=";
static const string HANDLERS_PREFIX = "H: Handlers=";

static string unquote(const string& str) {
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"')
        return str.substr(1, str.size() - 2);
    return str;
}

static bool isNumbered(const string& handler, const string& prefix) {
    if (!stringStartsWith(handler, prefix))
        return false;
    for (size_t i = prefix.size(); i < handler.size(); i++)
        if (!isdigit(static_cast<unsigned char>(handler[i])))
            return false;
    return true;
}

bool InputDeviceInfo::isPointer() const {
    for (const auto& handler : handlers)
        if (isNumbered(handler, "mouse"))
            return true;
    return false;
}

ProcInputDiscovery::ProcInputDiscovery(vector<string> excluded, string registry_path)
    : excluded(std::move(excluded)),
      registry_path(std::move(registry_path))
{}

vector<InputDeviceInfo> ProcInputDiscovery::parse(istream& in) {
    vector<InputDeviceInfo> devices;
    InputDeviceInfo cur;
    bool in_block = false;
    string line;

    auto finish = [&]() {
        if (in_block)
            devices.push_back(cur);
        cur = InputDeviceInfo();
        in_block = false;
    };

    while (getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty()) {
            finish();
            continue;
        }
        in_block = true;
        if (line.compare(0, NAME_PREFIX.size(), NAME_PREFIX) == 0) {
            cur.name = unquote(line.substr(NAME_PREFIX.size()));
        } else if (line.compare(0, PHYS_PREFIX.size(), PHYS_PREFIX) == 0) {
            cur.phys = line.substr(PHYS_PREFIX.size());
        } else if (line.compare(0, HANDLERS_PREFIX.size(), HANDLERS_PREFIX) == 0) {
            cur.handlers = splitWords(line.substr(HANDLERS_PREFIX.size()));
            for (const auto& handler : cur.handlers)
                if (isNumbered(handler, "event"))
                    cur.event_path = "/dev/input/" + handler;
        }
    }
    finish();

    return devices;
}

vector<InputDeviceInfo> ProcInputDiscovery::list() const {
    ifstream in(registry_path);
    if (!in.is_open()) {
        Log::warn("Unable to read input device registry: {}", registry_path);
        return {};
    }
    return parse(in);
}

optional<string> ProcInputDiscovery::find(const string& pattern) {
    optional<string> found;
    for (const auto& dev : list()) {
        if (dev.event_path.empty() || dev.name.find(pattern) == string::npos)
            continue;

        bool skip = false;
        for (const auto& ex : excluded)
            if (!ex.empty() && dev.name.find(ex) != string::npos)
                skip = true;
        if (skip) {
            Log::debug("Skipping excluded device '{}' at {}", dev.name, dev.event_path);
            continue;
        }

        if (dev.isPointer())
            return dev.event_path;
        if (!found)
            found = dev.event_path;
    }
    return found;
}
