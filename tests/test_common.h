#pragma once

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

inline void die(const std::string& msg) {
    std::cerr << "TEST FAIL: " << msg << std::endl;
    std::exit(1);
}

inline void expect_true(bool cond, const std::string& msg) {
    if (!cond) die(msg);
}

inline void expect_eq_ll(long long a, long long b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=" + std::to_string(a) + ", want=" + std::to_string(b) + ")");
    }
}

inline void expect_eq_str(const std::string& a, const std::string& b, const std::string& msg) {
    if (a != b) die(msg + "\n  got:  " + a + "\n  want: " + b);
}

inline bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

// Fresh directory under the system temp dir; caller removes it.
inline std::filesystem::path make_temp_dir(const std::string& tag) {
    std::string tmpl = (std::filesystem::temp_directory_path() / ("scriptbox_test_" + tag + "_XXXXXX")).string();
    if (!::mkdtemp(tmpl.data())) die("mkdtemp failed for " + tag);
    return tmpl;
}

// True when `python` runs and can import every module in `modules`
// (comma separated, may be empty).
inline bool python_has(const std::string& python, const std::string& modules) {
    std::string cmd = python + " -c \"import sys";
    if (!modules.empty()) cmd += "; import " + modules;
    cmd += "\" >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

inline std::string test_python() {
    const char* e = std::getenv("SCRIPTBOX_PYTHON");
    #ifdef SCRIPTBOX_DEFAULT_PYTHON
    return (e && *e) ? e : SCRIPTBOX_DEFAULT_PYTHON;
#else
    return (e && *e) ? e : "python3";
#endif
}
