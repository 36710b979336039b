#include "scriptbox/policy.h"
#include "scriptbox/config.h"
#include "scriptbox/json_util.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace scriptbox {

bool SandboxPolicy::module_allowed(const std::string& module) const {
    if (allowed_modules.count(module)) return true;
    const std::string top = module.substr(0, module.find('.'));
    return allowed_modules.count(top) > 0;
}

std::string SandboxPolicy::allowed_modules_joined() const {
    std::string out;
    for (const auto& m : allowed_modules) {
        if (!out.empty()) out += ", ";
        out += m;
    }
    return out;
}

std::chrono::seconds retention_window(const SandboxPolicy& p) {
    const std::chrono::seconds retention = std::chrono::hours(std::max(p.retention_hours, 0));
    // timeout plus room for the kill, the drain and artifact collection
    const std::chrono::seconds in_flight = std::chrono::seconds(std::max(p.timeout_sec, 0) + 60);
    return std::max(retention, in_flight);
}

SandboxPolicy default_policy() {
    SandboxPolicy p;
    p.allowed_modules = {
        // math & science
        "math", "cmath", "decimal", "fractions", "statistics", "random",
        // data
        "numpy", "np", "pandas", "pd",
        // plotting
        "matplotlib", "matplotlib.pyplot", "matplotlib.figure", "matplotlib.dates",
        "mpl_toolkits", "mpl_toolkits.mplot3d",
        "seaborn", "sns",
        // finance
        "yfinance", "yf",
        // ml / scipy
        "scipy", "scipy.stats", "scipy.optimize", "scipy.interpolate",
        "scipy.signal", "scipy.linalg", "scipy.integrate",
        "sklearn", "sklearn.linear_model", "sklearn.cluster", "sklearn.preprocessing",
        "sklearn.model_selection", "sklearn.metrics", "sklearn.ensemble",
        "sklearn.tree", "sklearn.neighbors", "sklearn.svm",
        "sklearn.decomposition", "sklearn.pipeline",
        // http client (yfinance depends on it)
        "requests",
        // safe stdlib
        "datetime", "json", "csv", "collections", "itertools", "functools",
        "re", "string", "textwrap", "operator", "copy", "pprint",
        "typing", "dataclasses", "enum", "abc",
        "io", "base64", "hashlib", "hmac",
        "time", "calendar",
    };
    p.blocked_builtins = {
        "exec", "eval", "compile", "__import__", "globals", "locals",
        "getattr", "setattr", "delattr", "vars",
        "open", "input", "breakpoint",
        "exit", "quit",
    };
    p.blocked_attributes = {
        "__subclasses__", "__bases__", "__mro__", "__class__",
        "__globals__", "__code__", "__builtins__",
        "__import__", "__loader__", "__spec__",
    };
    p.output_root = std::filesystem::path("code_output");
    return p;
}

static bool read_file(const std::filesystem::path& path, std::string* out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    *out = ss.str();
    return true;
}

std::optional<SandboxPolicy> load_policy_file(const std::filesystem::path& path,
                                              const SandboxPolicy& base,
                                              std::string* err) {
    auto fail = [&](const std::string& msg) -> std::optional<SandboxPolicy> {
        if (err) *err = path.string() + ": " + msg;
        return std::nullopt;
    };

    std::string raw;
    if (!read_file(path, &raw)) return fail("cannot read policy file");

    json_util::Doc doc = json_util::parse(raw);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        return fail("policy file is not a JSON object");
    }

    SandboxPolicy p = base;

    struct SetKey { const char* key; std::set<std::string>* dst; };
    const SetKey sets[] = {
        {"allowed_modules", &p.allowed_modules},
        {"blocked_builtins", &p.blocked_builtins},
        {"blocked_attributes", &p.blocked_attributes},
    };
    for (const auto& sk : sets) {
        if (!json_util::member(doc.root, sk.key)) continue;
        auto v = json_util::get_string_array(doc.root, sk.key);
        if (!v) return fail(std::string(sk.key) + " must be an array of strings");
        *sk.dst = std::set<std::string>(v->begin(), v->end());
    }

    struct IntKey { const char* key; int64_t min; int64_t* dst; };
    int64_t timeout = p.timeout_sec;
    int64_t out_max = (int64_t)p.stdout_max_bytes;
    int64_t err_max = (int64_t)p.stderr_max_bytes;
    int64_t retention = p.retention_hours;
    const IntKey ints[] = {
        {"timeout_sec", 1, &timeout},
        {"stdout_max_bytes", 0, &out_max},
        {"stderr_max_bytes", 0, &err_max},
        {"retention_hours", 1, &retention},
    };
    for (const auto& ik : ints) {
        if (!json_util::member(doc.root, ik.key)) continue;
        auto v = json_util::get_int(doc.root, ik.key);
        if (!v) return fail(std::string(ik.key) + " must be an integer");
        if (*v < ik.min) return fail(std::string(ik.key) + " out of range");
        *ik.dst = *v;
    }
    p.timeout_sec = (int)timeout;
    p.stdout_max_bytes = (size_t)out_max;
    p.stderr_max_bytes = (size_t)err_max;
    p.retention_hours = (int)retention;

    struct StrKey { const char* key; std::string* dst; };
    std::string output_root = p.output_root.string();
    std::string work_root = p.work_root.string();
    const StrKey strs[] = {
        {"python", &p.python},
        {"output_root", &output_root},
        {"work_root", &work_root},
        {"resource_namespace", &p.resource_namespace},
    };
    for (const auto& sk : strs) {
        if (!json_util::member(doc.root, sk.key)) continue;
        auto v = json_util::get_string(doc.root, sk.key);
        if (!v || v->empty()) return fail(std::string(sk.key) + " must be a non-empty string");
        *sk.dst = *v;
    }
    p.output_root = output_root;
    p.work_root = work_root;

    return p;
}

SandboxPolicy apply_env_overrides(SandboxPolicy p) {
    int timeout = getenv_int("SCRIPTBOX_TIMEOUT_SEC", p.timeout_sec);
    if (timeout > 0) p.timeout_sec = timeout;

    int64_t out_max = getenv_i64("SCRIPTBOX_STDOUT_MAX", (int64_t)p.stdout_max_bytes);
    if (out_max >= 0) p.stdout_max_bytes = (size_t)out_max;
    int64_t err_max = getenv_i64("SCRIPTBOX_STDERR_MAX", (int64_t)p.stderr_max_bytes);
    if (err_max >= 0) p.stderr_max_bytes = (size_t)err_max;

    int retention = getenv_int("SCRIPTBOX_RETENTION_HOURS", p.retention_hours);
    if (retention > 0) p.retention_hours = retention;

    p.python = getenv_str("SCRIPTBOX_PYTHON", p.python);
    p.output_root = getenv_str("SCRIPTBOX_OUTPUT_ROOT", p.output_root.string());
    p.work_root = getenv_str("SCRIPTBOX_WORK_ROOT", p.work_root.string());

    int cpu = getenv_int("SCRIPTBOX_RLIMIT_CPU_SEC", p.rlimit_cpu_sec);
    if (cpu >= 0) p.rlimit_cpu_sec = cpu;
    int64_t as_mb = getenv_i64("SCRIPTBOX_RLIMIT_AS_MB", (int64_t)p.rlimit_as_mb);
    if (as_mb >= 0) p.rlimit_as_mb = (size_t)as_mb;
    int64_t fsize_mb = getenv_i64("SCRIPTBOX_RLIMIT_FSIZE_MB", (int64_t)p.rlimit_fsize_mb);
    if (fsize_mb >= 0) p.rlimit_fsize_mb = (size_t)fsize_mb;
    int nofile = getenv_int("SCRIPTBOX_RLIMIT_NOFILE", p.rlimit_nofile);
    if (nofile >= 0) p.rlimit_nofile = nofile;

    return p;
}

std::optional<SandboxPolicy> load_policy(const std::string& policy_file, std::string* err) {
    SandboxPolicy p = default_policy();

    std::string file = policy_file.empty() ? getenv_str("SCRIPTBOX_POLICY_FILE", "") : policy_file;
    if (!file.empty()) {
        auto loaded = load_policy_file(file, p, err);
        if (!loaded) return std::nullopt;
        p = std::move(*loaded);
    }

    p = apply_env_overrides(std::move(p));

    std::error_code ec;
    auto abs = std::filesystem::absolute(p.output_root, ec);
    if (ec) {
        if (err) *err = "cannot resolve output root " + p.output_root.string() + ": " + ec.message();
        return std::nullopt;
    }
    p.output_root = abs.lexically_normal();
    return p;
}

} // namespace scriptbox
