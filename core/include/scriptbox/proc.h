#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace scriptbox {

// Lifecycle of one child process:
//   CREATED -> RUNNING -> { COMPLETED | TIMED_OUT | FAILED }
// FAILED means the runner itself could not start or supervise the child
// (pipe/fork/exec failure); a child that runs and exits non-zero is COMPLETED.
enum class ProcState { CREATED, RUNNING, COMPLETED, TIMED_OUT, FAILED };

const char* procstate_to_str(ProcState s);

struct ProcLimits {
    int timeout_ms{30000};
    size_t stdout_max_bytes{50000};
    size_t stderr_max_bytes{10000};

    // 0 leaves the limit untouched.
    int rlimit_cpu_sec{0};
    size_t rlimit_as_mb{0};
    size_t rlimit_fsize_mb{0};
    int rlimit_nofile{0};

    bool no_new_privs{true};
};

struct ProcSpec {
    std::vector<std::string> argv; // argv[0] is resolved through PATH
    std::string cwd;
    // Set in the child on top of the inherited environment.
    std::vector<std::pair<std::string, std::string>> env_set;
};

struct ProcResult {
    ProcState state{ProcState::CREATED};
    int exit_code{-1};   // 128+signal when killed by a signal
    int term_signal{0};
    std::string out;
    std::string err;
    bool out_truncated{false};
    bool err_truncated{false};
    std::string error;   // runner fault, not child stderr
    int64_t duration_ms{0};
};

// Run a process to completion or deadline with stdin bound to /dev/null and
// stdout/stderr captured on separate pipes. Each stream keeps its first
// N bytes; the remainder is read and discarded so the child never blocks on
// a full pipe. The deadline races child exit through a pidfd in the same poll
// set as the pipes. On every path the child's process group is SIGKILLed and
// the child reaped before returning.
//
// SCRIPTBOX_PROC_WRAPPER (with SCRIPTBOX_PROC_WRAPPER_ENABLE=1) prepends an
// operator-supplied launcher such as bwrap or nsjail to argv.
ProcResult proc_run(const ProcSpec& spec, const ProcLimits& lim);

// Split a command string into argv tokens.
// Supports single/double quotes and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace scriptbox
