#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

// Interpreter the build linked for parsing; children run the same one.
#ifndef SCRIPTBOX_DEFAULT_PYTHON
#define SCRIPTBOX_DEFAULT_PYTHON "python3"
#endif

namespace scriptbox {

// Immutable sandbox configuration. Built once at startup (defaults, then an
// optional JSON policy file, then environment overrides) and handed by const
// reference to the validator, the isolation host and the sweeper.
struct SandboxPolicy {
    std::set<std::string> allowed_modules;
    std::set<std::string> blocked_builtins;
    std::set<std::string> blocked_attributes;

    int timeout_sec{30};
    size_t stdout_max_bytes{50000};
    size_t stderr_max_bytes{10000};
    int retention_hours{1};

    std::string python{SCRIPTBOX_DEFAULT_PYTHON};
    std::filesystem::path output_root;
    // Parent of the per-execution scratch directories; empty means the
    // system temp directory.
    std::filesystem::path work_root;
    std::string resource_namespace{"/api/code-output"};
    std::string artifact_extension{".png"};

    // Best-effort child rlimits; 0 leaves the limit untouched.
    int rlimit_cpu_sec{0};
    size_t rlimit_as_mb{0};
    size_t rlimit_fsize_mb{0};
    int rlimit_nofile{0};

    // Exact name, or top-level package ("scipy" covers "scipy.anything").
    bool module_allowed(const std::string& module) const;

    // Sorted, comma-separated allow-list used in violation messages.
    std::string allowed_modules_joined() const;
};

// Age after which an output directory may be swept: retention_hours, but
// never less than the longest an execution can still be writing to it.
std::chrono::seconds retention_window(const SandboxPolicy& p);

// Built-in tables and limits. output_root defaults to ./code_output.
SandboxPolicy default_policy();

// Overlay a JSON policy file on `base`. Returns nullopt (and sets *err) when
// the file cannot be read, is not a JSON object, or a known key has the
// wrong type.
std::optional<SandboxPolicy> load_policy_file(const std::filesystem::path& path,
                                              const SandboxPolicy& base,
                                              std::string* err);

// Overlay SCRIPTBOX_* environment variables on `base`.
SandboxPolicy apply_env_overrides(SandboxPolicy base);

// defaults -> policy file (explicit path, else SCRIPTBOX_POLICY_FILE) -> env.
// output_root is made absolute.
std::optional<SandboxPolicy> load_policy(const std::string& policy_file, std::string* err);

} // namespace scriptbox
