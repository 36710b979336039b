#include "scriptbox/audit_log.h"
#include "scriptbox/config.h"
#include "scriptbox/sweeper.h"
#include "scriptbox/types.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <vector>

namespace scriptbox {

namespace {

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) {
        out << "null";
        return;
    }
    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
        break;
    }
}

} // namespace

std::string canonical_json(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

AuditLog::AuditLog(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::app) {}

void AuditLog::event(const std::string& name, json_object* fields) {
    json_object* rec = fields ? fields : json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));
    std::string line = canonical_json(rec);
    json_object_put(rec);

    std::lock_guard<std::mutex> lk(mu_);
    out_ << line << "\n";
    out_.flush();
}

AuditLog* audit_sink() {
    static std::unique_ptr<AuditLog> sink = []() -> std::unique_ptr<AuditLog> {
        std::string path = getenv_str("SCRIPTBOX_AUDIT_LOG", "");
        if (path.empty()) return nullptr;
        auto log = std::make_unique<AuditLog>(path);
        if (!log->ok()) {
            std::cerr << "[WARN] cannot open audit log " << path << "; auditing disabled\n";
            return nullptr;
        }
        return log;
    }();
    return sink.get();
}

void audit_execution(const ExecutionResult& r) {
    AuditLog* log = audit_sink();
    if (!log) return;

    json_object* f = json_object_new_object();
    json_object_object_add(f, "status", json_object_new_string(execstatus_to_str(r.status)));
    if (!r.attempted()) {
        json_object_object_add(f, "violations", json_object_new_int((int)r.validation_errors.size()));
        log->event("exec.rejected", f);
        return;
    }
    json_object_object_add(f, "execution_id", json_object_new_string(r.execution_id.c_str()));
    json_object_object_add(f, "exit_code", json_object_new_int(r.exit_code));
    json_object_object_add(f, "duration_ms", json_object_new_int64(r.duration_ms));
    json_object_object_add(f, "artifacts", json_object_new_int((int)r.artifacts.size()));
    json_object_object_add(f, "stdout_truncated", json_object_new_boolean(r.stdout_truncated));
    json_object_object_add(f, "stderr_truncated", json_object_new_boolean(r.stderr_truncated));
    log->event("exec.completed", f);
}

void audit_sweep(const SweepReport& r) {
    AuditLog* log = audit_sink();
    if (!log) return;

    json_object* f = json_object_new_object();
    json_object_object_add(f, "scanned", json_object_new_int64((int64_t)r.scanned));
    json_object_object_add(f, "removed", json_object_new_int64((int64_t)r.removed));
    json_object_object_add(f, "failed", json_object_new_int64((int64_t)r.failed));
    log->event("sweep.completed", f);
}

} // namespace scriptbox
