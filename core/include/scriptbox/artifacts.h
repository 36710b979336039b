#pragma once

#include "scriptbox/policy.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scriptbox {

// "<namespace>/<execution_id>/<filename>"
std::string artifact_resource(const std::string& ns, const std::string& execution_id,
                              const std::string& filename);

// Enumerate regular files with the policy's artifact extension in `out_dir`,
// sorted by filename (generated names are zero-padded, so this is creation
// order), and map them to resource identifiers. When nothing qualifies the
// directory is removed. Filesystem errors are logged and yield no artifacts.
std::vector<std::string> collect_artifacts(const std::filesystem::path& out_dir,
                                           const std::string& execution_id,
                                           const SandboxPolicy& policy);

// Map a resource identifier back to a file under policy.output_root.
// Returns nullopt unless the path is exactly "<namespace>/<uuid>/<name>" with
// a plain file name (no separators, no leading dot, the artifact extension)
// and <uuid>/<name> exist as a real directory and a regular file. Symlinks
// at either level are refused.
std::optional<std::filesystem::path> resolve_artifact(const SandboxPolicy& policy,
                                                      const std::string& resource);

// Contents of a file returned by resolve_artifact. Opened without following
// a final symlink and checked to be a regular file once open; nullopt
// otherwise or on a read error.
std::optional<std::string> read_artifact(const std::filesystem::path& file);

// Content type from the file extension; application/octet-stream otherwise.
const char* content_type_for(const std::filesystem::path& p);

} // namespace scriptbox
