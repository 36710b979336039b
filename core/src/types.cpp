#include "scriptbox/types.h"

namespace scriptbox {

const char* execstatus_to_str(ExecStatus s) {
    switch (s) {
        case ExecStatus::OK:               return "OK";
        case ExecStatus::SYNTAX_ERROR:     return "SYNTAX_ERROR";
        case ExecStatus::POLICY_VIOLATION: return "POLICY_VIOLATION";
        case ExecStatus::RUNTIME_FAILURE:  return "RUNTIME_FAILURE";
        case ExecStatus::TIMEOUT:          return "TIMEOUT";
        case ExecStatus::INTERNAL_FAULT:   return "INTERNAL_FAULT";
    }
    return "INTERNAL_FAULT";
}

std::optional<ExecStatus> execstatus_from_str(const std::string& s) {
    if (s == "OK") return ExecStatus::OK;
    if (s == "SYNTAX_ERROR") return ExecStatus::SYNTAX_ERROR;
    if (s == "POLICY_VIOLATION") return ExecStatus::POLICY_VIOLATION;
    if (s == "RUNTIME_FAILURE") return ExecStatus::RUNTIME_FAILURE;
    if (s == "TIMEOUT") return ExecStatus::TIMEOUT;
    if (s == "INTERNAL_FAULT") return ExecStatus::INTERNAL_FAULT;
    return std::nullopt;
}

std::vector<std::string> ValidationResult::messages() const {
    std::vector<std::string> out;
    out.reserve(violations.size());
    for (const auto& v : violations) out.push_back(v.message);
    return out;
}

} // namespace scriptbox
