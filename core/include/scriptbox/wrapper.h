#pragma once

#include <filesystem>
#include <string>

namespace scriptbox {

// Name under which the submission is compiled, so tracebacks point at the
// submitter's own line numbers.
inline constexpr const char* kScriptFileName = "script.py";
inline constexpr const char* kRunnerFileName = "_runner.py";

// Python single-quoted literal for `s` (backslash, quote, control bytes escaped).
std::string python_str_literal(const std::string& s);

// Launcher program run by the interpreter. It selects the Agg backend when
// matplotlib is importable, turns pyplot.show() into "save every open figure
// as plot_NNN.png under output_dir, then close all", runs the submission read
// from script_path in a fresh __main__ namespace, and finally saves figures
// that were never shown. Without matplotlib the plotting hooks are skipped.
std::string build_runner(const std::filesystem::path& script_path,
                         const std::filesystem::path& output_dir);

} // namespace scriptbox
