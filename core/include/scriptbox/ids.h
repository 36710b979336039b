#pragma once
#include <string>

namespace scriptbox {

// Random RFC 4122 version-4 UUID ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx"),
// drawn from getrandom(2) with a /dev/urandom fallback.
// Throws std::runtime_error if no kernel entropy source is available.
std::string gen_execution_id();

// True for the canonical lowercase 36-char form produced above. Used to
// reject artifact requests that could escape the output root.
bool is_execution_id(const std::string& s);

} // namespace scriptbox
