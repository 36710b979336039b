#pragma once

#include "scriptbox/policy.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scriptbox {

// ---- Utility functions shared by the subcommands ----

// Read a whole file; "-" reads stdin. Throws std::runtime_error on failure.
std::string slurp(const std::string& path);

// Strip "--policy <file>" from args and load the policy (defaults, file or
// SCRIPTBOX_POLICY_FILE, env overrides). Prints the error and returns nullopt
// on failure.
std::optional<SandboxPolicy> load_policy_from_args(std::vector<std::string>& args);

// Parse a non-negative count of `unit_sec`-second units into seconds.
// nullopt on junk, a sign, or a product that does not fit in int64_t.
std::optional<int64_t> parse_age_seconds(const std::string& text, int64_t unit_sec);

// Cap on source read from a file or stdin.
constexpr size_t kMaxSourceBytes = 4ULL * 1024 * 1024;

} // namespace scriptbox
