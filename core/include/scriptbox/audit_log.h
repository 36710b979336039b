#pragma once

#include <json-c/json.h>

#include <fstream>
#include <mutex>
#include <string>

namespace scriptbox {

struct ExecutionResult;
struct SweepReport;

// Append-only JSONL audit trail. Each line is one canonical JSON object
// (keys sorted, no whitespace) carrying "event", "ts" and the event fields.
class AuditLog {
public:
    explicit AuditLog(const std::string& path);

    bool ok() const { return static_cast<bool>(out_); }
    const std::string& path() const { return path_; }

    // Takes ownership of `fields` (a json object, may be null).
    void event(const std::string& name, json_object* fields);

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mu_;
};

// Sorted-key serialization used for every audit line.
std::string canonical_json(json_object* obj);

// Process-wide sink opened on first use from SCRIPTBOX_AUDIT_LOG; null when
// the variable is unset or the file cannot be opened.
AuditLog* audit_sink();

// exec.rejected / exec.completed
void audit_execution(const ExecutionResult& r);
// sweep.completed
void audit_sweep(const SweepReport& r);

} // namespace scriptbox
