#pragma once

/** @file utils.hpp
 *
 * @brief Miscellaneous utilities used throughout evclick.
 */

#include <memory>
#include <sstream>
#include <string>
#include <vector>

extern "C" {
    #include <limits.h>
    #include <stdlib.h>
}

/**
 * Create a unique_ptr<T> value with a custom deleter.
 *
 *   auto path = mkuniq(realpath(p, nullptr), &free);
 */
template <class T, class F>
inline std::unique_ptr<T, F> mkuniq(T *p, F fn) {
    return std::unique_ptr<T, F>(p, fn);
}

/**
 * Visitor built from a set of lambdas, for use with std::visit.
 *
 *   std::visit(overloaded {
 *       [](const A& a) { ... },
 *       [](const B& b) { ... },
 *   }, variant);
 */
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

inline std::string realpath_safe(const std::string& path) {
    auto rpath = mkuniq(realpath(path.c_str(), nullptr), &free);
    if (rpath == nullptr)
        return "";
    return std::string(rpath.get());
}

/**
 * Check if string `a` starts with string `b`.
 * NOTE: This is a strict starts with, so it will return false if a == b.
 */
static inline bool stringStartsWith(const std::string& a, const std::string& b) {
    return a.size() > b.size() && a.compare(0, b.size(), b) == 0;
}

/** Split on whitespace, empty fields are dropped. */
static inline std::vector<std::string> splitWords(const std::string& str) {
    std::vector<std::string> words;
    std::stringstream ss(str);
    std::string word;
    while (ss >> word)
        words.push_back(word);
    return words;
}

/** Value of an environment variable, `fallback` if it is unset or empty. */
static inline std::string envString(const char *name, const std::string& fallback = "") {
    const char *val = getenv(name);
    return (val == nullptr || val[0] == '\0') ? fallback : std::string(val);
}
