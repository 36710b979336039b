#include "scriptbox/engine.h"
#include "scriptbox/audit_log.h"
#include "scriptbox/json_util.h"

#include <iostream>

namespace scriptbox {

SandboxEngine::SandboxEngine(SandboxPolicy policy)
    : policy_(std::move(policy)), validator_(policy_), host_(policy_) {}

ExecutionResult SandboxEngine::execute(const std::string& source) const {
    ValidationResult v;
    try {
        v = validator_.validate(source);
    } catch (const std::exception& e) {
        ExecutionResult r;
        r.success = false;
        r.status = ExecStatus::INTERNAL_FAULT;
        r.errors = {std::string("validation failed: ") + e.what()};
        std::cerr << "[sandbox][ERROR] " << r.errors.front() << "\n";
        audit_execution(r);
        return r;
    }
    if (!v.accepted) {
        ExecutionResult r;
        r.success = false;
        r.status = v.syntax_error ? ExecStatus::SYNTAX_ERROR : ExecStatus::POLICY_VIOLATION;
        r.validation_errors = v.messages();
        r.errors = r.validation_errors;
        std::cerr << "[sandbox] rejected submission: " << r.validation_errors.size() << " violation(s)\n";
        audit_execution(r);
        return r;
    }

    ExecutionResult r = host_.run(source);
    std::cerr << "[sandbox] execution " << r.execution_id << " status=" << execstatus_to_str(r.status)
              << " exit=" << r.exit_code << " stdout=" << r.stdout_text.size() << "B"
              << " artifacts=" << r.artifacts.size() << " " << r.duration_ms << "ms\n";
    audit_execution(r);
    return r;
}

std::string result_to_json(const ExecutionResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "success", json_object_new_boolean(r.success));
    json_object_object_add(o, "stdout", json_util::new_string(r.stdout_text));
    json_object_object_add(o, "stderr", json_util::new_string(r.stderr_text));
    json_object_object_add(o, "images", json_util::new_string_array(r.artifacts));
    json_object_object_add(o, "execution_id", json_util::new_string(r.execution_id));
    json_object_object_add(o, "errors", json_util::new_string_array(r.errors));
    json_object_object_add(o, "validation_errors", json_util::new_string_array(r.validation_errors));
    json_object_object_add(o, "status", json_object_new_string(execstatus_to_str(r.status)));
    json_object_object_add(o, "exit_code", json_object_new_int(r.exit_code));
    json_object_object_add(o, "stdout_truncated", json_object_new_boolean(r.stdout_truncated));
    json_object_object_add(o, "stderr_truncated", json_object_new_boolean(r.stderr_truncated));
    json_object_object_add(o, "duration_ms", json_object_new_int64(r.duration_ms));
    json_util::Doc doc(o);
    return json_util::to_string(doc.root);
}

std::string format_for_agent(const ExecutionResult& r) {
    auto join = [](const std::vector<std::string>& items) {
        std::string s;
        for (const auto& i : items) {
            if (!s.empty()) s += "\n";
            s += i;
        }
        return s;
    };

    std::vector<std::string> parts;
    if (!r.validation_errors.empty()) {
        parts.push_back("VALIDATION ERRORS:\n" + join(r.validation_errors));
    } else if (!r.errors.empty()) {
        parts.push_back("ERRORS:\n" + join(r.errors));
    }
    if (!r.stdout_text.empty()) parts.push_back("STDOUT:\n" + r.stdout_text);
    if (!r.stderr_text.empty()) parts.push_back("STDERR:\n" + r.stderr_text);
    if (!r.artifacts.empty()) parts.push_back("IMAGES:\n" + join(r.artifacts));
    if (parts.empty()) return "Code executed successfully with no output.";

    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += "\n\n";
        out += p;
    }
    return out;
}

} // namespace scriptbox
