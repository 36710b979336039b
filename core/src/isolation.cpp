#include "scriptbox/isolation.h"
#include "scriptbox/artifacts.h"
#include "scriptbox/ids.h"
#include "scriptbox/wrapper.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace scriptbox {

namespace {

// mkdtemp-backed scratch directory, removed recursively on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const fs::path& parent) {
        fs::path base = parent.empty() ? fs::temp_directory_path() : parent;
        fs::create_directories(base);
        std::string tmpl = (base / "scriptbox_exec_XXXXXX").string();
        if (!::mkdtemp(tmpl.data())) {
            throw std::runtime_error("mkdtemp " + tmpl + ": " + std::strerror(errno));
        }
        path_ = tmpl;
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) std::cerr << "[sandbox][ERROR] cannot remove work dir " << path_ << ": " << ec.message() << "\n";
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

void write_text(const fs::path& p, const std::string& text) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot create " + p.string());
    f << text;
    f.flush();
    if (!f) throw std::runtime_error("cannot write " + p.string());
}

std::string timeout_message(int sec) {
    return "Execution timed out after " + std::to_string(sec) + " seconds.";
}

void mark_fault(ExecutionResult& r, const std::string& msg) {
    r.success = false;
    r.status = ExecStatus::INTERNAL_FAULT;
    r.stdout_text.clear();
    r.stderr_text = msg;
    r.errors = {msg};
    std::cerr << "[sandbox][ERROR] execution " << r.execution_id << ": " << msg << "\n";
}

} // namespace

ProcLimits IsolationHost::limits() const {
    ProcLimits lim;
    lim.timeout_ms = std::min(policy_.timeout_sec, 86400) * 1000;
    lim.stdout_max_bytes = policy_.stdout_max_bytes;
    lim.stderr_max_bytes = policy_.stderr_max_bytes;
    lim.rlimit_cpu_sec = policy_.rlimit_cpu_sec;
    lim.rlimit_as_mb = policy_.rlimit_as_mb;
    lim.rlimit_fsize_mb = policy_.rlimit_fsize_mb;
    lim.rlimit_nofile = policy_.rlimit_nofile;
    return lim;
}

std::string IsolationHost::interpreter_version() const {
    ProcSpec spec;
    spec.argv = {policy_.python, "-c", "import sys; print('%d.%d' % sys.version_info[:2])"};
    ProcLimits lim;
    lim.timeout_ms = 10000;
    lim.stdout_max_bytes = 64;
    lim.stderr_max_bytes = 4096;
    ProcResult pr = proc_run(spec, lim);
    if (pr.state != ProcState::COMPLETED || pr.exit_code != 0) return "";
    std::string v = pr.out;
    while (!v.empty() && (v.back() == '\n' || v.back() == '\r')) v.pop_back();
    return v;
}

ExecutionResult IsolationHost::run(const std::string& source) const {
    ExecutionResult r;
    try {
        r.execution_id = gen_execution_id();
    } catch (const std::exception& e) {
        mark_fault(r, e.what());
        return r;
    }

    const fs::path out_dir = policy_.output_root / r.execution_id;
    try {
        fs::create_directories(out_dir);
        ScratchDir work(policy_.work_root);

        const fs::path script = work.path() / kScriptFileName;
        const fs::path runner = work.path() / kRunnerFileName;
        write_text(script, source);
        write_text(runner, build_runner(script, out_dir));

        ProcSpec spec;
        spec.argv = {policy_.python, "-B", runner.string()};
        spec.cwd = work.path().string();
        spec.env_set = {{"MPLBACKEND", "Agg"}, {"PYTHONIOENCODING", "utf-8"}};

        ProcResult pr = proc_run(spec, limits());
        r.duration_ms = pr.duration_ms;
        r.exit_code = pr.exit_code;

        switch (pr.state) {
        case ProcState::COMPLETED:
            r.stdout_text = std::move(pr.out);
            r.stderr_text = std::move(pr.err);
            r.stdout_truncated = pr.out_truncated;
            r.stderr_truncated = pr.err_truncated;
            r.success = pr.exit_code == 0;
            r.status = r.success ? ExecStatus::OK : ExecStatus::RUNTIME_FAILURE;
            break;
        case ProcState::TIMED_OUT: {
            const std::string msg = timeout_message(policy_.timeout_sec);
            r.success = false;
            r.status = ExecStatus::TIMEOUT;
            r.stderr_text = msg;
            r.errors = {msg};
            std::cerr << "[sandbox][WARN] execution " << r.execution_id << " timed out\n";
            break;
        }
        case ProcState::FAILED:
        case ProcState::CREATED:
        case ProcState::RUNNING:
            mark_fault(r, pr.error.empty() ? std::string("process runner failed") : pr.error);
            break;
        }
    } catch (const std::exception& e) {
        mark_fault(r, e.what());
    }

    // The child is reaped on every path above, including a timeout.
    r.artifacts = collect_artifacts(out_dir, r.execution_id, policy_);
    return r;
}

} // namespace scriptbox
