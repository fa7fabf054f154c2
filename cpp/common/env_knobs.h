// cpp/common/env_knobs.h
#pragma once

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>
#include <system_error>

// Environment knobs (CDXJ_*). Unset or empty values fall back to the default;
// a value that does not parse completely is reported and ignored, so
// CDXJ_THRESHOLD=10k never turns into 10.

// nullptr when unset or empty
inline const char* env_raw(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

inline void env_ignored(const char* name, const char* v, const char* expected) {
    std::cerr << "[env] WARN: ignoring " << name << "='" << v << "' (expected " << expected << ")\n";
}

inline long env_long(const char* name, long defv) {
    const char* v = env_raw(name);
    if (!v) return defv;

    const char* end = v + std::strlen(v);
    long x = 0;
    const auto res = std::from_chars(v, end, x, 10);
    if (res.ec != std::errc() || res.ptr != end) {
        env_ignored(name, v, "an integer");
        return defv;
    }
    return x;
}

inline int env_int(const char* name, int defv) {
    const long x = env_long(name, defv);
    if (x < std::numeric_limits<int>::min() || x > std::numeric_limits<int>::max()) {
        env_ignored(name, env_raw(name), "an int");
        return defv;
    }
    return static_cast<int>(x);
}

// 1/0, true/false, yes/no, on/off (any case)
inline bool env_bool(const char* name, bool defv) {
    const char* v = env_raw(name);
    if (!v) return defv;

    std::string s(v);
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    env_ignored(name, v, "a boolean");
    return defv;
}

inline std::string env_str(const char* name, const std::string& defv) {
    const char* v = env_raw(name);
    return v ? std::string(v) : defv;
}

inline bool env_is_set(const char* name) {
    return env_raw(name) != nullptr;
}
