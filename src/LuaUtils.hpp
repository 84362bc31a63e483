/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * LuaUtils.hpp, utilities for reading Lua state.                                    *
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

/** @file LuaUtils.hpp
 *
 * @brief Lua state management and value extraction utilities.
 */

#pragma once

#include <exception>
#include <optional>
#include <string>
#include <vector>

extern "C" {
    #include <lua.h>
    #include <lauxlib.h>
    #include <lualib.h>
}

namespace Lua {
    class LuaError : public std::exception {
    private:
        std::string expl;

    public:
        explicit LuaError(const std::string& expl)
            : expl(expl)
        {}

        /** Lua errors are reported like this:
         *  /long/winding/path/file.lua:<line>: <error message>
         *  We are only interested in this part:
         *  file.lua:<line>: <error message>
         *
         * If your paths have the ':' symbol in them this function will
         * break, the script itself may contain ':' characters without
         * causing any problems.
         */
        inline const char *fmtError() const noexcept {
            const char *ptr = expl.c_str();
            const char *start = ptr;
            for (size_t i = 0; i < expl.size(); i++)
                if (ptr[i] == '/')
                    start = &ptr[i+1];
                else if (ptr[i] == ':')
                    break;
            return start;
        }

        virtual const char *what() const noexcept override {
            return fmtError();
        }
    };

    /** Name of the type of the value at idx, for error messages. */
    inline std::string typeName(lua_State *L, int idx) {
        return lua_typename(L, lua_type(L, idx));
    }

    template <class T> struct LuaValue;

    /** Lua integers. */
    template <> struct LuaValue<int> {
        /** Retrieve an integer from the Lua state.
         *
         * @param L Lua state.
         * @param idx The index of the integer on the stack.
         */
        int get(lua_State *L, int idx) {
            if (!lua_isinteger(L, idx))
                throw LuaError("Expected integer, got " + typeName(L, idx));
            return static_cast<int>(lua_tointeger(L, idx));
        }
    };

    /** Lua booleans. */
    template <> struct LuaValue<bool> {
        bool get(lua_State *L, int idx) {
            if (!lua_isboolean(L, idx))
                throw LuaError("Expected boolean, got " + typeName(L, idx));
            return lua_toboolean(L, idx);
        }
    };

    /** Lua strings, numbers are not converted. */
    template <> struct LuaValue<std::string> {
        std::string get(lua_State *L, int idx) {
            if (lua_type(L, idx) != LUA_TSTRING)
                throw LuaError("Expected string, got " + typeName(L, idx));
            size_t sz;
            const char *s = lua_tolstring(L, idx, &sz);
            return std::string(s, sz);
        }
    };

    /** Lua arrays of strings. */
    template <> struct LuaValue<std::vector<std::string>> {
        std::vector<std::string> get(lua_State *L, int idx) {
            if (!lua_istable(L, idx))
                throw LuaError("Expected table, got " + typeName(L, idx));
            idx = lua_absindex(L, idx);
            std::vector<std::string> vec;
            lua_Integer len = luaL_len(L, idx);
            for (lua_Integer i = 1; i <= len; i++) {
                lua_geti(L, idx, i);
                try {
                    vec.push_back(LuaValue<std::string>().get(L, -1));
                } catch (const LuaError &) {
                    lua_pop(L, 1);
                    throw;
                }
                lua_pop(L, 1);
            }
            return vec;
        }
    };

    /**
     * Read `key` from the table at idx.
     *
     * @return Empty if the field is nil.
     * @throws LuaError if the field has the wrong type, the message names
     *         the key.
     */
    template <class T>
    std::optional<T> getField(lua_State *L, int idx, const char *key) {
        idx = lua_absindex(L, idx);
        lua_getfield(L, idx, key);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            return std::nullopt;
        }
        try {
            T val = LuaValue<T>().get(L, -1);
            lua_pop(L, 1);
            return val;
        } catch (const LuaError &e) {
            lua_pop(L, 1);
            throw LuaError(std::string(key) + ": " + e.what());
        }
    }

    /**
     * Owns a Lua state.
     */
    class Script {
    private:
        lua_State *L;

    public:
        std::string src;
        std::string abs_src;

        /** Initialize a Lua state and load a script.
         *
         * @param path Path to the Lua script.
         */
        explicit Script(std::string path);

        /** Initialize a Lua state. */
        Script();

        /** Destroy a Lua state. */
        ~Script() noexcept;

        Script(const Script&) = delete;
        Script& operator=(const Script&) = delete;

        /** Get the raw Lua state. */
        lua_State *getL() noexcept;

        /** Load a script into the Lua state and run it.
         *
         * @param path Path to the Lua script.
         */
        void from(const std::string& path);

        /** Run a chunk of Lua code. */
        void exec(const std::string& str);
    };
}
