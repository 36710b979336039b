#include "scriptbox/config.h"
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace scriptbox {

Profile detect_profile() {
    const char* env = std::getenv("SCRIPTBOX_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("SCRIPTBOX_RLIMIT_AS_MB",    "0",   NO_OVERWRITE);
            setenv("SCRIPTBOX_RLIMIT_FSIZE_MB", "0",   NO_OVERWRITE);
            setenv("SCRIPTBOX_RLIMIT_NOFILE",   "0",   NO_OVERWRITE);
            setenv("SCRIPTBOX_RLIMIT_CPU_SEC",  "0",   NO_OVERWRITE);
            setenv("SCRIPTBOX_SWEEP_INTERVAL_SEC", "600", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("SCRIPTBOX_RLIMIT_AS_MB",    "2048", NO_OVERWRITE);
            setenv("SCRIPTBOX_RLIMIT_FSIZE_MB", "64",   NO_OVERWRITE);
            setenv("SCRIPTBOX_RLIMIT_NOFILE",   "256",  NO_OVERWRITE);
            setenv("SCRIPTBOX_RLIMIT_CPU_SEC",  "60",   NO_OVERWRITE);
            setenv("SCRIPTBOX_SWEEP_INTERVAL_SEC", "300", NO_OVERWRITE);
            break;
    }
}

int getenv_int(const char* key, int defv) {
    if (const char* v = std::getenv(key)) {
        try { return std::stoi(v); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

int64_t getenv_i64(const char* key, int64_t defv) {
    if (const char* v = std::getenv(key)) {
        try { return (int64_t)std::stoll(v); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

std::string getenv_str(const char* key, const std::string& defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    return std::string(v);
}

bool env_true(const char* key) {
    const char* v = std::getenv(key);
    if (!v) return false;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return (s == "1" || s == "true" || s == "yes" || s == "on");
}

} // namespace scriptbox
