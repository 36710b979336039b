#pragma once

#include "scriptbox/policy.h"
#include "scriptbox/proc.h"
#include "scriptbox/types.h"

#include <string>

namespace scriptbox {

// Runs already-validated source in a single supervised child process.
//
// Per call: a fresh execution id, an output directory <output_root>/<id>
// that outlives the call only if artifacts were produced, and a scratch
// working directory that is removed on every exit path. Concurrent run()
// calls share nothing but the output root.
class IsolationHost {
public:
    explicit IsolationHost(const SandboxPolicy& policy) : policy_(policy) {}

    ExecutionResult run(const std::string& source) const;

    // Limits handed to the process runner, derived from the policy.
    ProcLimits limits() const;

    // "major.minor" of policy.python, or empty when it cannot be run.
    std::string interpreter_version() const;

private:
    const SandboxPolicy& policy_;
};

} // namespace scriptbox
