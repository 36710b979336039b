#include "cmd_run.h"
#include "runner_utils.h"

#include "scriptbox/engine.h"
#include "scriptbox/sweeper.h"
#include "scriptbox/validator.h"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace scriptbox;

namespace {

std::vector<std::string> collect_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) args.emplace_back(argv[i]);
    return args;
}

} // namespace

int cmd_validate(int argc, char** argv) {
    auto args = collect_args(argc, argv);
    auto policy = load_policy_from_args(args);
    if (!policy) return 2;
    if (args.size() != 1) {
        std::cerr << "usage: scriptbox_cli validate [--policy <file>] <script.py|->\n";
        return 2;
    }

    std::string src;
    try {
        src = slurp(args[0]);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }

    PolicyValidator validator(*policy);
    ValidationResult v;
    try {
        v = validator.validate(src);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
    if (v.accepted) {
        std::cout << "OK\n";
        return 0;
    }
    for (const auto& m : v.messages()) std::cout << m << "\n";
    return 1;
}

int cmd_run(int argc, char** argv) {
    auto args = collect_args(argc, argv);
    auto policy = load_policy_from_args(args);
    if (!policy) return 2;

    bool agent_text = false;
    std::string input;
    for (const auto& a : args) {
        if (a == "--agent") { agent_text = true; continue; }
        if (!input.empty()) { input.clear(); break; }
        input = a;
    }
    if (input.empty()) {
        std::cerr << "usage: scriptbox_cli run [--policy <file>] [--agent] <script.py|->\n";
        std::cerr << "env: SCRIPTBOX_PROFILE=DEV|PROD, SCRIPTBOX_OUTPUT_ROOT, SCRIPTBOX_TIMEOUT_SEC, SCRIPTBOX_PYTHON\n";
        return 2;
    }

    std::string src;
    try {
        src = slurp(input);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }

    SandboxEngine engine(std::move(*policy));
    ExecutionResult r = engine.execute(src);
    if (agent_text) {
        std::cout << format_for_agent(r) << "\n";
    } else {
        std::cout << result_to_json(r) << "\n";
    }
    return r.success ? 0 : 1;
}

int cmd_sweep(int argc, char** argv) {
    auto args = collect_args(argc, argv);
    auto policy = load_policy_from_args(args);
    if (!policy) return 2;

    int64_t max_age_sec = retention_window(*policy).count();
    std::filesystem::path root = policy->output_root;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        if ((a == "--max-age-hours" || a == "--max-age-sec") && i + 1 < args.size()) {
            auto age = parse_age_seconds(args[++i], a == "--max-age-hours" ? 3600 : 1);
            if (!age) {
                std::cerr << "bad " << a << ": " << args[i] << "\n";
                return 2;
            }
            max_age_sec = *age;
            continue;
        }
        if (a == "--root" && i + 1 < args.size()) { root = args[++i]; continue; }
        std::cerr << "usage: scriptbox_cli sweep [--policy <file>] [--root <dir>] [--max-age-hours N | --max-age-sec N]\n";
        return 2;
    }
    SweepReport rep = sweep_outputs(root, std::chrono::seconds(max_age_sec));
    std::cout << "sweep " << root.string() << ": scanned=" << rep.scanned << " removed=" << rep.removed
              << " failed=" << rep.failed << "\n";
    for (const auto& e : rep.errors) std::cout << "  " << e << "\n";
    return rep.failed == 0 ? 0 : 1;
}
