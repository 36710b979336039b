#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scriptbox {

// Outcome of one execute() call.
enum class ExecStatus {
    OK,
    SYNTAX_ERROR,
    POLICY_VIOLATION,
    RUNTIME_FAILURE,
    TIMEOUT,
    INTERNAL_FAULT,
};

const char* execstatus_to_str(ExecStatus s);
std::optional<ExecStatus> execstatus_from_str(const std::string& s);

// A single static policy finding. `message` is already prefixed with the line.
struct Violation {
    int line{0};
    std::string message;
};

struct ValidationResult {
    bool accepted{false};
    bool syntax_error{false};
    std::vector<Violation> violations;

    std::vector<std::string> messages() const;
};

struct ExecutionResult {
    bool success{false};
    ExecStatus status{ExecStatus::INTERNAL_FAULT};
    std::string stdout_text;
    std::string stderr_text;
    std::vector<std::string> artifacts;         // resource identifiers, creation order
    std::string execution_id;                   // empty when rejected
    std::vector<std::string> validation_errors; // non-empty only when rejected
    std::vector<std::string> errors;            // timeout / internal fault messages
    int exit_code{-1};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    int64_t duration_ms{0};

    bool attempted() const { return !execution_id.empty(); }
};

} // namespace scriptbox
