#pragma once

#include "scriptbox/policy.h"
#include "scriptbox/pyast.h"
#include "scriptbox/types.h"

#include <string>

namespace scriptbox {

// Static policy check over the syntax tree of a submission.
//
// Pure function of (policy, source): no I/O, no shared state, safe to call
// from any number of threads against the same policy. Every violation in the
// tree is reported; a parse failure yields exactly one "Syntax error" entry.
//
// Only direct calls by literal name are matched against the blocked-builtin
// table, so `f = eval; f("1")` is not caught.
class PolicyValidator {
public:
    explicit PolicyValidator(const SandboxPolicy& policy) : policy_(policy) {}

    ValidationResult validate(const std::string& source) const;

    // Check an already-parsed tree (exposed for tests).
    ValidationResult check_tree(const pyast::Node& root) const;

private:
    void check_node(const pyast::Node& n, ValidationResult& out) const;
    void import_violation(int line, const std::string& module, ValidationResult& out) const;

    const SandboxPolicy& policy_;
};

} // namespace scriptbox
