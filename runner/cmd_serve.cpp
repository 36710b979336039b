#include "cmd_serve.h"
#include "runner_utils.h"
#include "serve_http.h"

#include "scriptbox/artifacts.h"
#include "scriptbox/config.h"
#include "scriptbox/engine.h"
#include "scriptbox/isolation.h"
#include "scriptbox/json_util.h"
#include "scriptbox/pyparse.h"
#include "scriptbox/sweeper.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace scriptbox;

namespace {

struct ConnThread {
    std::thread th;
    std::shared_ptr<std::atomic<bool>> done;
};

std::string error_json(const std::string& msg) {
    json_util::Doc d(json_object_new_object());
    json_object_object_add(d.root, "ok", json_object_new_boolean(0));
    json_object_object_add(d.root, "error", json_util::new_string(msg));
    return json_util::to_string(d.root);
}

void serve_artifact(int cfd, const SandboxPolicy& policy, const std::string& path) {
    auto file = resolve_artifact(policy, path);
    auto data = file ? read_artifact(*file) : std::nullopt;
    if (!data) {
        send_json(cfd, 404, error_json("not found"));
        return;
    }
    send_bytes(cfd, 200, content_type_for(*file), *data);
}

} // namespace

int cmd_serve(int argc, char** argv) {
    // Writing to a disconnected client must not kill the server
    ::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) args.emplace_back(argv[i]);
    auto policy_opt = load_policy_from_args(args);
    if (!policy_opt) return 2;

    std::string host = "127.0.0.1";
    int port = 8080;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        if (a == "--host" && i + 1 < args.size()) { host = args[++i]; continue; }
        if (a == "--port" && i + 1 < args.size()) { port = std::atoi(args[++i].c_str()); continue; }
        std::cerr << "usage: scriptbox_cli serve [--policy <file>] [--host H] [--port P]\n";
        return 2;
    }
    if (port <= 0 || port > 65535) {
        std::cerr << "bad port\n";
        return 2;
    }

    SandboxEngine engine(std::move(*policy_opt));
    const SandboxPolicy& policy = engine.policy();

    const std::string api_token = getenv_str("SCRIPTBOX_API_TOKEN", "");
    if (api_token.empty()) {
        std::cerr << "[WARN] SCRIPTBOX_API_TOKEN is unset; /execute accepts unauthenticated requests.\n";
    }
    // Submissions are parsed by the embedded interpreter and run by this one.
    const std::string child_version = IsolationHost(policy).interpreter_version();
    try {
        const std::string parser_version = pyast::parser_python_version();
        if (child_version.empty()) {
            std::cerr << "[serve][WARN] cannot run " << policy.python << "; executions will fail\n";
        } else if (parser_version.rfind(child_version + ".", 0) != 0) {
            std::cerr << "[serve][WARN] " << policy.python << " is python " << child_version
                      << " but submissions are parsed as python " << parser_version << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[serve][ERROR] python parser: " << e.what() << "\n";
        return 2;
    }
    const size_t max_body_bytes = (size_t)std::max<int64_t>(1024, getenv_i64("SCRIPTBOX_API_MAX_BODY_BYTES", 1024 * 1024));
    const int max_http_conns = std::max(1, getenv_int("SCRIPTBOX_SERVE_MAX_CONNS", 32));
    const int sweep_interval = getenv_int("SCRIPTBOX_SWEEP_INTERVAL_SEC", 600);

    TokenBucket tb_execute;
    tb_execute.init(getenv_int("SCRIPTBOX_API_RPM", 0), now_ms_steady());
    std::mutex http_mu; // protects tb_execute

    // Create the server socket before starting the sweeper thread, so that
    // failures here leave nothing running.
    int sfd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sfd < 0) { std::cerr << "socket failed\n"; return 2; }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "bad host\n";
        ::close(sfd);
        return 2;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "bind failed: " << std::strerror(errno) << "\n";
        ::close(sfd);
        return 2;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "listen failed\n";
        ::close(sfd);
        return 2;
    }
    // accept() wakes up once a second so /shutdown is noticed.
    set_socket_timeouts(sfd, 1);

    RetentionSweeper sweeper(policy.output_root, retention_window(policy),
                             std::chrono::seconds(sweep_interval));
    sweeper.start();

    std::cerr << "[serve] http://" << host << ":" << port << " output_root=" << policy.output_root.string()
              << " namespace=" << policy.resource_namespace << " profile=" << profile_name(detect_profile()) << "\n";

    std::atomic<int> active_conns{0};
    std::atomic<bool> running{true};
    std::vector<ConnThread> http_threads;

    auto reap = [&](bool all) {
        for (auto it = http_threads.begin(); it != http_threads.end();) {
            if (all || it->done->load()) {
                if (it->th.joinable()) it->th.join();
                it = http_threads.erase(it);
            } else {
                ++it;
            }
        }
    };

    while (running.load()) {
        reap(false);
        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        int cfd = ::accept4(sfd, (sockaddr*)&caddr, &clen, SOCK_CLOEXEC);
        if (cfd < 0) continue;
        if (active_conns.load() >= max_http_conns) {
            send_json(cfd, 503, error_json("too many connections"));
            ::close(cfd);
            continue;
        }
        set_socket_timeouts(cfd, 10);

        auto done = std::make_shared<std::atomic<bool>>(false);
        auto handler = [&, cfd, done]() {
            struct ConnGuard {
                std::atomic<int>& c;
                std::atomic<bool>& d;
                int fd;
                ~ConnGuard() {
                    ::close(fd);
                    c.fetch_sub(1);
                    d.store(true);
                }
            } cg{active_conns, *done, cfd};

            std::string head, body;
            if (!read_http_request(cfd, head, body, max_body_bytes)) {
                send_json(cfd, 400, error_json("bad request"));
                return;
            }

            std::istringstream iss(head);
            std::string method, path, ver;
            iss >> method >> path >> ver;

            if (method == "GET" && path == "/health") {
                send_json(cfd, 200, "{\"ok\":true}");
                return;
            }

            if (method == "GET" && path.rfind(policy.resource_namespace + "/", 0) == 0) {
                serve_artifact(cfd, policy, path);
                return;
            }

            if (method == "POST" && path == "/execute") {
                if (!api_token_ok(head, api_token)) {
                    send_json(cfd, 401, error_json("unauthorized"));
                    return;
                }
                {
                    std::lock_guard<std::mutex> lk(http_mu);
                    if (!tb_execute.allow(1, now_ms_steady())) {
                        send_json(cfd, 429, error_json("rate limited"));
                        return;
                    }
                }
                auto doc = json_util::parse(body);
                auto code = json_util::get_string(doc.root, "code");
                if (!code) {
                    send_json(cfd, 400, error_json("body must be a JSON object with a string \"code\""));
                    return;
                }
                ExecutionResult r = engine.execute(*code);
                if (json_util::get_string(doc.root, "format").value_or("") == "agent") {
                    json_util::Doc out(json_object_new_object());
                    json_object_object_add(out.root, "success", json_object_new_boolean(r.success));
                    json_object_object_add(out.root, "output", json_util::new_string(format_for_agent(r)));
                    send_json(cfd, 200, json_util::to_string(out.root));
                } else {
                    send_json(cfd, 200, result_to_json(r));
                }
                return;
            }

            if (method == "POST" && path == "/shutdown") {
                // Disabled entirely unless a token is configured
                if (api_token.empty()) {
                    send_json(cfd, 403, error_json("shutdown disabled: no auth configured"));
                    return;
                }
                if (!api_token_ok(head, api_token)) {
                    send_json(cfd, 401, error_json("unauthorized"));
                    return;
                }
                send_json(cfd, 200, "{\"ok\":true,\"message\":\"shutting_down\"}");
                running.store(false);
                return;
            }

            send_json(cfd, 404, error_json("not found"));
        };
        start_connection(active_conns, cfd, [&]() {
            http_threads.reserve(http_threads.size() + 1);
            std::thread t(handler);
            http_threads.push_back(ConnThread{std::move(t), done});
        });
    }

    reap(true);
    ::close(sfd);
    sweeper.stop();
    std::cerr << "[serve] stopped after " << sweeper.sweeps_completed() << " sweep(s)\n";
    return 0;
}
