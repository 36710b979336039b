#include "scriptbox/proc.h"
#include "scriptbox/config.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <set>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

extern char** environ;

namespace scriptbox {

const char* procstate_to_str(ProcState s) {
    switch (s) {
    case ProcState::CREATED: return "CREATED";
    case ProcState::RUNNING: return "RUNNING";
    case ProcState::COMPLETED: return "COMPLETED";
    case ProcState::TIMED_OUT: return "TIMED_OUT";
    case ProcState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

namespace {

void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

int open_pidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    long fd = ::syscall(SYS_pidfd_open, pid, 0);
    return fd >= 0 ? (int)fd : -1;
#else
    (void)pid;
    return -1;
#endif
}

// One captured output stream.
struct Capture {
    int fd{-1};
    size_t cap{0};
    std::string data;
    bool truncated{false};

    bool open() const { return fd >= 0; }

    // Read whatever is available without blocking; closes the fd on EOF.
    void drain() {
        char buf[4096];
        while (fd >= 0) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) {
                size_t can = cap > data.size() ? cap - data.size() : 0;
                size_t take = std::min(can, (size_t)n);
                if (take > 0) data.append(buf, take);
                if (take < (size_t)n) truncated = true;
                continue;
            }
            if (n == -1 && errno == EINTR) continue;
            if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            ::close(fd);
            fd = -1;
        }
    }

    void close_fd() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

// Child exited but is not yet reaped (so its pid and pgid stay reserved).
bool child_exited_unreaped(pid_t pid) {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (::waitid(P_PID, (id_t)pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) return false;
    return info.si_pid == pid;
}

void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

std::vector<std::string> build_env(const ProcSpec& spec) {
    std::set<std::string> drop = {"LD_PRELOAD", "LD_LIBRARY_PATH"};
    for (const auto& kv : spec.env_set) drop.insert(kv.first);

    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string kv = *e;
        if (drop.count(kv.substr(0, kv.find('=')))) continue;
        env.push_back(std::move(kv));
    }
    for (const auto& kv : spec.env_set) env.push_back(kv.first + "=" + kv.second);
    return env;
}

} // namespace

ProcResult proc_run(const ProcSpec& spec, const ProcLimits& lim) {
    ProcResult res;
    const auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&]() -> int64_t {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };
    auto fail = [&](const std::string& msg) {
        res.state = ProcState::FAILED;
        res.error = msg;
        res.duration_ms = elapsed_ms();
        return res;
    };

    if (spec.argv.empty() || spec.argv[0].empty()) return fail("empty argv");

    std::vector<std::string> eff_argv = spec.argv;
    if (env_true("SCRIPTBOX_PROC_WRAPPER_ENABLE")) {
        if (const char* w = std::getenv("SCRIPTBOX_PROC_WRAPPER")) {
            auto toks = split_argv_quoted(w);
            if (!toks.empty()) eff_argv.insert(eff_argv.begin(), toks.begin(), toks.end());
        }
    }

    // Everything the child touches is prepared before fork: the parent may be
    // multi-threaded, so the child only makes async-signal-safe calls.
    std::vector<std::string> env = build_env(spec);
    std::vector<char*> cargv;
    for (auto& s : eff_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    std::vector<char*> cenv;
    for (auto& s : env) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) return fail(std::string("open /dev/null failed: ") + std::strerror(errno));

    int out_pipe[2], err_pipe[2], exec_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        ::close(devnull);
        return fail(std::string("pipe(stdout) failed: ") + std::strerror(errno));
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        ::close(devnull);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        return fail(std::string("pipe(stderr) failed: ") + std::strerror(errno));
    }
    // Closed by a successful exec; carries errno back otherwise.
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        ::close(devnull);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);
        return fail(std::string("pipe(exec) failed: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        ::close(devnull);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) ::close(fd);
        return fail(std::string("fork failed: ") + std::strerror(e));
    }

    if (pid == 0) {
        (void)dup2(devnull, STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // own process group so the deadline can kill the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != exec_pipe[1]) (void)::close(fd);
        }

        int e = 0;
        if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
            e = errno;
            (void)!::write(exec_pipe[1], &e, sizeof(e));
            _exit(127);
        }

#ifdef __linux__
        if (lim.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
        if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
        if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);

        execvpe(cargv[0], cargv.data(), cenv.data());
        e = errno;
        (void)!::write(exec_pipe[1], &e, sizeof(e));
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    ::close(devnull);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    Capture out{out_pipe[0], lim.stdout_max_bytes, {}, false};
    Capture err{err_pipe[0], lim.stderr_max_bytes, {}, false};
    int status = 0;

    auto kill_and_reap = [&]() {
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    };

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);
    if (n == (ssize_t)sizeof(exec_errno)) {
        kill_and_reap();
        out.close_fd();
        err.close_fd();
        return fail("cannot start '" + eff_argv[0] + "': " + std::strerror(exec_errno));
    }

    res.state = ProcState::RUNNING;
    set_nonblock(out.fd);
    set_nonblock(err.fd);
    int pidfd = open_pidfd(pid);

    bool exited = false;
    while (!exited) {
        int64_t remaining = lim.timeout_ms > 0 ? lim.timeout_ms - elapsed_ms() : 1000;
        if (lim.timeout_ms > 0 && remaining <= 0) {
            res.state = ProcState::TIMED_OUT;
            break;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (out.open()) fds[nfds++] = {out.fd, POLLIN, 0};
        if (err.open()) fds[nfds++] = {err.fd, POLLIN, 0};
        if (pidfd >= 0) fds[nfds++] = {pidfd, POLLIN, 0};

        // Without a pidfd, exit is only observable by polling waitid.
        int slice = (int)std::min<int64_t>(remaining, pidfd >= 0 ? remaining : 50);
        int pr = poll(fds, nfds, slice);
        if (pr < 0 && errno != EINTR) {
            res.state = ProcState::FAILED;
            res.error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        out.drain();
        err.drain();
        exited = child_exited_unreaped(pid);
    }

    // Kill any descendants left in the group, then reap.
    kill_and_reap();
    if (pidfd >= 0) ::close(pidfd);

    // Writers are gone unless a descendant escaped the group; bound the wait.
    const int64_t drain_until = elapsed_ms() + 500;
    while ((out.open() || err.open()) && elapsed_ms() < drain_until) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out.open()) fds[nfds++] = {out.fd, POLLIN, 0};
        if (err.open()) fds[nfds++] = {err.fd, POLLIN, 0};
        (void)poll(fds, nfds, 100);
        out.drain();
        err.drain();
    }
    out.close_fd();
    err.close_fd();

    res.out = std::move(out.data);
    res.err = std::move(err.data);
    res.out_truncated = out.truncated;
    res.err_truncated = err.truncated;

    if (res.state == ProcState::RUNNING) res.state = ProcState::COMPLETED;
    if (WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.term_signal = WTERMSIG(status);
        res.exit_code = 128 + res.term_signal;
    }
    res.duration_ms = elapsed_ms();
    return res;
}

} // namespace scriptbox
