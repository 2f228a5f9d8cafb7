// Environment switches for diagnostics and sensitive logging.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace opendir {

// Lower-cased, trimmed value of an environment variable; empty when unset.
inline std::string envValue(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    std::string v(raw);
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    v.erase(v.begin(), std::find_if(v.begin(), v.end(), notSpace));
    v.erase(std::find_if(v.rbegin(), v.rend(), notSpace).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = envValue(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

struct LogPolicy {
    bool debug = false;     // OPENDIR_DEBUG
    bool sensitive = false; // OPENDIR_ENV=dev plus OPENDIR_LOG_SENSITIVE

    static LogPolicy fromEnvironment() {
        LogPolicy p;
        p.debug = envFlagEnabled("OPENDIR_DEBUG");
        const std::string env = envValue("OPENDIR_ENV");
        const bool dev = env == "dev" || env == "development";
        // Remote paths, hosts and AI prompts stay redacted otherwise.
        p.sensitive = dev && envFlagEnabled("OPENDIR_LOG_SENSITIVE");
        return p;
    }
};

inline bool sensitiveLoggingEnabled() {
    return LogPolicy::fromEnvironment().sensitive;
}

inline bool debugLoggingEnabled() { return LogPolicy::fromEnvironment().debug; }

} // namespace opendir
