#pragma once
#include <cstdint>
#include <string>

namespace scriptbox {

enum class Profile { DEV, PROD };

// Detect profile from SCRIPTBOX_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no rlimits beyond the wall-clock deadline)
// PROD: strict (address-space, file-size, fd and CPU rlimits on the child)
void apply_profile_defaults(Profile p);

// Environment lookups with fallback. Malformed values return the default.
int getenv_int(const char* key, int defv);
int64_t getenv_i64(const char* key, int64_t defv);
std::string getenv_str(const char* key, const std::string& defv);
bool env_true(const char* key);

} // namespace scriptbox
