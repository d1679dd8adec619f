#include "redeployer.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "audit_fields.h"

namespace cdnd::deploy {

// Children must not keep the server's listening socket alive: the restart
// script starts a new server on the same port. `keep_fd` survives.
static void close_inherited_fds(int keep_fd = -1) {
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
    for (int fd = 3; fd < (int)max_fd; fd++) {
        if (fd != keep_fd) ::close(fd);
    }
}

static std::vector<char*> to_cargv(const std::vector<std::string>& argv) {
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    return cargv;
}

static bool run_cmd_capture_stderr(const std::vector<std::string>& argv,
                                   int timeout_sec,
                                   std::string& err) {
    err.clear();
    if (argv.empty()) { err = "empty argv"; return false; }

    std::vector<char*> cargv = to_cargv(argv);

    int pipefd[2];
    if (pipe(pipefd) != 0) { err = "pipe() failed"; return false; }

    pid_t pid = fork();
    if (pid < 0) {
        ::close(pipefd[0]); ::close(pipefd[1]);
        err = "fork() failed";
        return false;
    }

    if (pid == 0) {
        // own process group so a timeout can take down git's helpers too
        setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
        }
        dup2(pipefd[1], STDERR_FILENO);
        close_inherited_fds();
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    ::close(pipefd[1]);

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(timeout_sec);

    std::string out;
    bool timed_out = false;
    char buf[4096];
    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now()).count();
        if (left <= 0) { timed_out = true; break; }

        struct pollfd pfd{pipefd[0], POLLIN, 0};
        int pr = poll(&pfd, 1, (int)left);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) { timed_out = true; break; }

        ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n <= 0) break;
        out.append(buf, buf + n);
    }
    ::close(pipefd[0]);

    if (timed_out) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
    }

    int st = 0;
    while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}

    if (timed_out) {
        err = "timed out after " + std::to_string(timeout_sec) + "s";
        return false;
    }
    if (!WIFEXITED(st) || WEXITSTATUS(st) != 0) {
        err = cdnd::shorten(out, 400);
        if (err.empty()) {
            err = WIFEXITED(st) ? "exit status " + std::to_string(WEXITSTATUS(st))
                                : std::string("killed by signal");
        }
        return false;
    }
    return true;
}

// Double fork + setsid: the grandchild is reparented to init, so it survives
// this process being stopped by the very script it runs.
//
// Exec status travels back over a close-on-exec pipe: a successful execv
// closes it with nothing written, a failed one writes its errno.
static bool spawn_detached(const std::vector<std::string>& argv,
                           const std::string& log_path,
                           std::string& err) {
    err.clear();
    if (argv.empty()) { err = "empty argv"; return false; }
    std::vector<char*> cargv = to_cargv(argv);

    int errpipe[2];
    if (pipe2(errpipe, O_CLOEXEC) != 0) { err = "pipe2() failed"; return false; }

    pid_t pid = fork();
    if (pid < 0) {
        ::close(errpipe[0]); ::close(errpipe[1]);
        err = "fork() failed";
        return false;
    }

    if (pid == 0) {
        ::close(errpipe[0]);
        setsid();
        pid_t pid2 = fork();
        if (pid2 != 0) _exit(pid2 < 0 ? 1 : 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        int logfd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (logfd >= 0) {
            dup2(logfd, STDOUT_FILENO);
            dup2(logfd, STDERR_FILENO);
        }
        close_inherited_fds(errpipe[1]);
        execv(cargv[0], cargv.data());

        const int e = errno;
        ssize_t w;
        do { w = ::write(errpipe[1], &e, sizeof(e)); } while (w < 0 && errno == EINTR);
        _exit(127);
    }

    ::close(errpipe[1]);

    int st = 0;
    while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    if (!WIFEXITED(st) || WEXITSTATUS(st) != 0) {
        ::close(errpipe[0]);
        err = "detach fork failed";
        return false;
    }

    // Returns once the grandchild has exec'd (EOF) or reported a failure.
    int child_errno = 0;
    ssize_t n;
    do { n = ::read(errpipe[0], &child_errno, sizeof(child_errno)); } while (n < 0 && errno == EINTR);
    ::close(errpipe[0]);

    if (n == (ssize_t)sizeof(child_errno)) {
        err = std::string("exec failed: ") + std::strerror(child_errno);
        return false;
    }
    return true;
}

class GitRedeployer final : public Redeployer {
public:
    explicit GitRedeployer(GitRedeployConfig cfg) : cfg_(std::move(cfg)) {}

    CmdResult sync_to_remote() override {
        CmdResult r;

        // fetch + hard reset (not pull): force pushes on the remote must win
        std::string e;
        if (!run_cmd_capture_stderr({"git", "-C", cfg_.repo_dir, "fetch", cfg_.remote},
                                    cfg_.timeout_sec, e)) {
            r.err = "git fetch failed: " + e;
            return r;
        }

        if (!run_cmd_capture_stderr({"git", "-C", cfg_.repo_dir, "reset", "--hard",
                                     cfg_.remote + "/" + cfg_.branch},
                                    cfg_.timeout_sec, e)) {
            r.err = "git reset failed: " + e;
            return r;
        }

        r.ok = true;
        return r;
    }

    CmdResult schedule_restart() override {
        CmdResult r;

        std::error_code ec;
        if (!std::filesystem::is_regular_file(cfg_.restart_script, ec)) {
            r.err = "restart script not found: " + cfg_.restart_script;
            return r;
        }
        if (::access(cfg_.restart_script.c_str(), X_OK) != 0) {
            r.err = "restart script not executable: " + cfg_.restart_script;
            return r;
        }

        r.ok = spawn_detached({cfg_.restart_script}, cfg_.restart_log, r.err);
        return r;
    }

private:
    GitRedeployConfig cfg_;
};

std::unique_ptr<Redeployer> make_git_redeployer(const GitRedeployConfig& cfg) {
    return std::make_unique<GitRedeployer>(cfg);
}

} // namespace cdnd::deploy
