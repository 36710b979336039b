#include "runner_utils.h"

#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace scriptbox {

std::string slurp(const std::string& path) {
    std::string data;
    if (path == "-") {
        char rbuf[8192];
        while (std::cin.read(rbuf, sizeof(rbuf)) || std::cin.gcount()) {
            data.append(rbuf, (size_t)std::cin.gcount());
            if (data.size() > kMaxSourceBytes) throw std::runtime_error("stdin exceeds source size limit");
        }
        return data;
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    data = ss.str();
    if (data.size() > kMaxSourceBytes) throw std::runtime_error("source exceeds size limit: " + path);
    return data;
}

std::optional<int64_t> parse_age_seconds(const std::string& text, int64_t unit_sec) {
    if (text.empty() || unit_sec <= 0) return std::nullopt;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    int64_t n = 0;
    try {
        n = std::stoll(text);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (n > std::numeric_limits<int64_t>::max() / unit_sec) return std::nullopt;
    return n * unit_sec;
}

std::optional<SandboxPolicy> load_policy_from_args(std::vector<std::string>& args) {
    std::string policy_file;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--policy" && i + 1 < args.size()) {
            policy_file = args[i + 1];
            args.erase(args.begin() + (long)i, args.begin() + (long)i + 2);
            break;
        }
    }
    std::string err;
    auto policy = load_policy(policy_file, &err);
    if (!policy) std::cerr << "[ERROR] policy: " << err << "\n";
    return policy;
}

} // namespace scriptbox
