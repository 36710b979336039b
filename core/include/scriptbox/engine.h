#pragma once

#include "scriptbox/isolation.h"
#include "scriptbox/policy.h"
#include "scriptbox/types.h"
#include "scriptbox/validator.h"

#include <string>

namespace scriptbox {

// validate -> run -> collect, for one submission. Holds no per-call state;
// execute() may be called concurrently from any number of threads.
class SandboxEngine {
public:
    explicit SandboxEngine(SandboxPolicy policy);

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    // Rejected submissions come back with validation_errors set and no
    // execution_id; everything else is an attempted execution.
    ExecutionResult execute(const std::string& source) const;

    const SandboxPolicy& policy() const { return policy_; }
    const PolicyValidator& validator() const { return validator_; }

private:
    const SandboxPolicy policy_;
    PolicyValidator validator_;
    IsolationHost host_;
};

// {"success","stdout","stderr","images","execution_id","errors",
//  "validation_errors","status","exit_code","stdout_truncated",
//  "stderr_truncated","duration_ms"}
std::string result_to_json(const ExecutionResult& r);

// Text handed back to the calling agent as the tool result.
std::string format_for_agent(const ExecutionResult& r);

} // namespace scriptbox
