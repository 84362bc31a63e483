/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * LuaUtils.cpp, utilities for reading Lua state.                                    *
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

#include <memory>

#include "LuaUtils.hpp"
#include "utils.hpp"

using namespace std;

namespace Lua {
    static string popError(lua_State *L) {
        const char *msg = lua_tostring(L, -1);
        string err(msg ? msg : "unknown error");
        lua_pop(L, 1);
        return err;
    }

    Script::Script(string path) : src(path) {
        if (src.size() == 0)
            throw Lua::LuaError("No path given");

        auto L = unique_ptr<lua_State, decltype(&lua_close)>(luaL_newstate(),
                                                             &lua_close);
        if (L == nullptr)
            throw Lua::LuaError("Unable to allocate Lua state");
        this->L = L.get();
        luaL_openlibs(L.get());

        from(path);

        L.release();
    }

    Script::Script() {
        L = luaL_newstate();
        if (L == nullptr)
            throw Lua::LuaError("Unable to allocate Lua state");
        luaL_openlibs(L);
    }

    void Script::from(const std::string& path) {
        if (luaL_loadfile(L, path.c_str()) != LUA_OK)
            throw Lua::LuaError("Lua error: " + popError(L));
        if (lua_pcall(L, 0, 0, 0) != LUA_OK)
            throw Lua::LuaError("Lua error: " + popError(L));

        abs_src = realpath_safe(path);
    }

    Script::~Script() noexcept {
        lua_close(L);
    }

    lua_State *Script::getL() noexcept {
        return L;
    }

    void Script::exec(const std::string &str) {
        if (luaL_loadstring(L, str.c_str()) != LUA_OK)
            throw LuaError("Lua error: " + popError(L));
        if (lua_pcall(L, 0, 0, 0) != LUA_OK)
            throw LuaError("Lua error: " + popError(L));
    }
}
