#include "test_common.h"
#include "scriptbox/audit_log.h"
#include "scriptbox/json_util.h"
#include "scriptbox/sweeper.h"
#include "scriptbox/types.h"

#include <cstdlib>
#include <fstream>
#include <thread>
#include <vector>

using namespace scriptbox;

static std::vector<std::string> read_lines(const std::filesystem::path& p) {
    std::vector<std::string> out;
    std::ifstream f(p);
    std::string line;
    while (std::getline(f, line)) out.push_back(line);
    return out;
}

int main() {
    const auto dir = make_temp_dir("audit");
    const auto sink_path = dir / "sink.jsonl";
    // Must be set before the process-wide sink is first used.
    setenv("SCRIPTBOX_AUDIT_LOG", sink_path.c_str(), 1);

    // Test 1: canonical serialization sorts keys at every level
    {
        json_util::Doc d(json_object_new_object());
        json_object_object_add(d.root, "zeta", json_object_new_int(1));
        json_object* inner = json_object_new_object();
        json_object_object_add(inner, "b", json_object_new_string("x/y"));
        json_object_object_add(inner, "a", json_object_new_boolean(1));
        json_object_object_add(d.root, "alpha", inner);
        json_object* arr = json_object_new_array();
        json_object_array_add(arr, json_object_new_int(2));
        json_object_array_add(arr, nullptr);
        json_object_object_add(d.root, "mid", arr);
        expect_eq_str(canonical_json(d.root), "{\"alpha\":{\"a\":true,\"b\":\"x/y\"},\"mid\":[2,null],\"zeta\":1}",
                      "canonical form");
    }

    // Test 2: direct AuditLog appends one line per event
    {
        const auto p = dir / "direct.jsonl";
        AuditLog log(p.string());
        expect_true(log.ok(), "log opens");
        json_object* f = json_object_new_object();
        json_object_object_add(f, "k", json_object_new_int(7));
        log.event("test.one", f);
        log.event("test.two", nullptr);
        auto lines = read_lines(p);
        expect_eq_ll((long long)lines.size(), 2, "two lines");
        auto d = json_util::parse(lines[0]);
        expect_true(json_util::get_string(d.root, "event").value_or("") == "test.one", "event name");
        expect_eq_ll(json_util::get_int(d.root, "k").value_or(0), 7, "event field");
        std::string ts = json_util::get_string(d.root, "ts").value_or("");
        expect_true(ts.size() == 20 && ts.back() == 'Z', "UTC timestamp: " + ts);
    }

    // Test 3: an unwritable path reports !ok()
    {
        AuditLog bad((dir / "no-such-dir" / "x.jsonl").string());
        expect_true(!bad.ok(), "unwritable log not ok");
    }

    // Test 4: the process-wide sink records executions and sweeps
    {
        expect_true(audit_sink() != nullptr, "sink enabled from env");

        ExecutionResult rejected;
        rejected.status = ExecStatus::POLICY_VIOLATION;
        rejected.validation_errors = {"Line 1: import of 'os' is not allowed."};
        audit_execution(rejected);

        ExecutionResult done;
        done.success = true;
        done.status = ExecStatus::OK;
        done.execution_id = "01234567-89ab-4def-8123-456789abcdef";
        done.exit_code = 0;
        done.duration_ms = 42;
        done.artifacts = {"/api/code-output/x/plot_001.png"};
        done.stdout_truncated = true;
        audit_execution(done);

        SweepReport rep;
        rep.scanned = 3;
        rep.removed = 2;
        audit_sweep(rep);

        auto lines = read_lines(sink_path);
        expect_eq_ll((long long)lines.size(), 3, "three sink events");

        auto r0 = json_util::parse(lines[0]);
        expect_true(json_util::get_string(r0.root, "event").value_or("") == "exec.rejected", "rejected event");
        expect_eq_ll(json_util::get_int(r0.root, "violations").value_or(-1), 1, "violation count");
        expect_true(json_util::member(r0.root, "execution_id") == nullptr, "rejected has no execution id");

        auto r1 = json_util::parse(lines[1]);
        expect_true(json_util::get_string(r1.root, "event").value_or("") == "exec.completed", "completed event");
        expect_true(json_util::get_string(r1.root, "status").value_or("") == "OK", "status");
        expect_eq_ll(json_util::get_int(r1.root, "duration_ms").value_or(-1), 42, "duration");
        expect_eq_ll(json_util::get_int(r1.root, "artifacts").value_or(-1), 1, "artifact count");
        expect_true(json_object_get_boolean(json_util::member(r1.root, "stdout_truncated")), "truncation flag");

        auto r2 = json_util::parse(lines[2]);
        expect_true(json_util::get_string(r2.root, "event").value_or("") == "sweep.completed", "sweep event");
        expect_eq_ll(json_util::get_int(r2.root, "removed").value_or(-1), 2, "sweep removed");
    }

    // Test 5: concurrent writers never interleave lines
    {
        const auto p = dir / "concurrent.jsonl";
        AuditLog log(p.string());
        std::vector<std::thread> ts;
        for (int t = 0; t < 8; t++) {
            ts.emplace_back([&log, t]() {
                for (int i = 0; i < 200; i++) {
                    json_object* f = json_object_new_object();
                    json_object_object_add(f, "t", json_object_new_int(t));
                    json_object_object_add(f, "i", json_object_new_int(i));
                    log.event("tick", f);
                }
            });
        }
        for (auto& th : ts) th.join();
        auto lines = read_lines(p);
        expect_eq_ll((long long)lines.size(), 1600, "all lines written");
        for (const auto& l : lines) expect_true(static_cast<bool>(json_util::parse(l)), "line is valid JSON: " + l);
    }

    unsetenv("SCRIPTBOX_AUDIT_LOG");
    std::filesystem::remove_all(dir);
    std::cerr << "test_audit_log: ALL PASSED" << std::endl;
    return 0;
}
