#include "kestrel/proc.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <poll.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace kestrel {

std::vector<std::string> build_session_argv(const SpawnSpec& spec) {
    std::vector<std::string> out;
    out.reserve(spec.wrapper.size() + spec.argv.size() + spec.mounts.size() * 2);
    for (const auto& tok : spec.wrapper) {
        if (tok != "{mounts}") {
            out.push_back(tok);
            continue;
        }
        for (const auto& m : spec.mounts) {
            out.push_back("-v");
            out.push_back(m.host_path.string() + ":" + m.container_path + (m.readonly ? ":ro" : ""));
        }
    }
    out.insert(out.end(), spec.argv.begin(), spec.argv.end());
    return out;
}

std::string encode_mounts_env(const std::vector<ValidatedMount>& mounts) {
    std::string s;
    for (const auto& m : mounts) {
        s += m.readonly ? "ro " : "rw ";
        s += m.host_path.string();
        s += " ";
        s += m.container_path;
        s += "\n";
    }
    return s;
}

static void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 128;
}

namespace {

class PosixProcessHandle : public ProcessHandle {
public:
    PosixProcessHandle(pid_t pid, int out_fd, int in_fd, std::string stdin_data)
        : pid_(pid), out_fd_(out_fd), in_fd_(in_fd), stdin_data_(std::move(stdin_data)) {
        if (in_fd_ >= 0 && stdin_data_.empty()) {
            close(in_fd_);
            in_fd_ = -1;
        }
    }

    ~PosixProcessHandle() override {
        if (!poll_exit()) {
            kill();
            (void)wait();
        }
        if (in_fd_ >= 0) close(in_fd_);
        if (out_fd_ >= 0) close(out_fd_);
    }

    int pid() const override { return (int)pid_; }

    ReadStatus read_some(std::string& out, int wait_ms) override {
        if (out_fd_ < 0) return ReadStatus::END;

        // Interleave the pending stdin write with output reads so a large
        // payload cannot deadlock against a child blocked on stdout.
        struct pollfd fds[2];
        int nfds = 0;
        int in_idx = -1;
        if (in_fd_ >= 0) {
            in_idx = nfds;
            fds[nfds].fd = in_fd_;
            fds[nfds].events = POLLOUT;
            fds[nfds].revents = 0;
            nfds++;
        }
        int out_idx = nfds;
        fds[nfds].fd = out_fd_;
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        nfds++;

        int pr = poll(fds, (nfds_t)nfds, std::max(0, wait_ms));
        if (pr < 0) return errno == EINTR ? ReadStatus::NONE : ReadStatus::END;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off_ < stdin_data_.size()) {
                ssize_t n = write(in_fd_, stdin_data_.data() + write_off_, stdin_data_.size() - write_off_);
                if (n > 0) { write_off_ += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off_ = stdin_data_.size();  // reader gone
                break;
            }
            if (write_off_ >= stdin_data_.size()) {
                close(in_fd_);
                in_fd_ = -1;
            }
        }

        bool got = false;
        if (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP)) {
            char buf[4096];
            while (true) {
                ssize_t n = read(out_fd_, buf, sizeof(buf));
                if (n > 0) { out.append(buf, buf + n); got = true; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                // EOF or hard error
                close(out_fd_);
                out_fd_ = -1;
                return got ? ReadStatus::DATA : ReadStatus::END;
            }
        }
        return got ? ReadStatus::DATA : ReadStatus::NONE;
    }

    std::optional<int> poll_exit() override {
        std::lock_guard<std::mutex> lk(mu_);
        if (exit_code_) return exit_code_;
        int status = 0;
        pid_t w = waitpid(pid_, &status, WNOHANG);
        if (w == pid_) exit_code_ = decode_status(status);
        else if (w < 0 && errno == ECHILD) exit_code_ = 128;
        return exit_code_;
    }

    int wait() override {
        std::lock_guard<std::mutex> lk(mu_);
        if (exit_code_) return *exit_code_;
        int status = 0;
        pid_t w;
        do {
            w = waitpid(pid_, &status, 0);
        } while (w < 0 && errno == EINTR);
        exit_code_ = (w == pid_) ? decode_status(status) : 128;
        return *exit_code_;
    }

    void terminate() override { signal_group(SIGTERM); }
    void kill() override { signal_group(SIGKILL); }

private:
    void signal_group(int sig) {
        std::lock_guard<std::mutex> lk(mu_);
        if (exit_code_) return;
        // process group first (best-effort), then the direct pid
        (void)::kill(-pid_, sig);
        (void)::kill(pid_, sig);
    }

    pid_t pid_;
    int out_fd_;
    int in_fd_;
    std::string stdin_data_;
    size_t write_off_{0};
    std::mutex mu_;
    std::optional<int> exit_code_;
};

} // namespace

std::unique_ptr<ProcessHandle> PosixProcessLauncher::spawn(const SpawnSpec& spec, std::string* err) {
    std::vector<std::string> eff_argv = build_session_argv(spec);
    if (eff_argv.empty() || eff_argv[0].empty()) {
        if (err) *err = "empty argv";
        return nullptr;
    }

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        if (err) *err = std::string("pipe(out) failed: ") + std::strerror(errno);
        return nullptr;
    }
    int in_pipe[2];
    if (pipe(in_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        if (err) *err = std::string("pipe(in) failed: ") + std::strerror(errno);
        return nullptr;
    }
    // Lets the parent detect exec failure: closed on successful exec.
    int exec_pipe[2];
    if (pipe(exec_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(in_pipe[0]); close(in_pipe[1]);
        if (err) *err = std::string("pipe(exec) failed: ") + std::strerror(errno);
        return nullptr;
    }
    (void)fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

    // Everything the child needs is prepared before fork.
    std::vector<char*> cargv;
    cargv.reserve(eff_argv.size() + 1);
    for (const auto& s : eff_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::string mounts_env = encode_mounts_env(spec.mounts);

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(in_pipe[0]); close(in_pipe[1]);
        close(exec_pipe[0]); close(exec_pipe[1]);
        if (err) *err = std::string("fork failed: ") + std::strerror(errno);
        return nullptr;
    }

    if (pid == 0) {
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(out_pipe[1], STDERR_FILENO);
        int report_fd = exec_pipe[1];

        // isolate process group so termination reaches the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != report_fd) (void)close(fd);
        }

        auto fail = [&](int code) {
            int e = errno;
            (void)!write(report_fd, &e, sizeof(e));
            _exit(code);
        };

        if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) fail(126);

        unsetenv("LD_PRELOAD");
        unsetenv("LD_LIBRARY_PATH");
        for (const auto& [k, v] : spec.env) setenv(k.c_str(), v.c_str(), 1);
        setenv("KESTREL_MOUNTS", mounts_env.c_str(), 1);

#ifdef __linux__
        if (spec.limits.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        const ProcLimits& lim = spec.limits;
        if (lim.rlimit_as_mb > 0) {
            rlim_t bytes = (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL;
            set_rlimit(RLIMIT_AS, bytes, bytes);
        }
        if (lim.rlimit_fsize_mb > 0) {
            rlim_t bytes = (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL;
            set_rlimit(RLIMIT_FSIZE, bytes, bytes);
        }
        if (lim.rlimit_nofile > 0) {
            set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile, (rlim_t)lim.rlimit_nofile);
        }
#ifdef RLIMIT_NPROC
        if (lim.rlimit_nproc > 0) {
            set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc, (rlim_t)lim.rlimit_nproc);
        }
#endif

        execvp(cargv[0], cargv.data());
        fail(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(in_pipe[0]);
    close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);
    if (n == (ssize_t)sizeof(child_errno)) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close(out_pipe[0]);
        close(in_pipe[1]);
        if (err) *err = "exec " + eff_argv[0] + " failed: " + std::strerror(child_errno);
        return nullptr;
    }

    set_nonblock(out_pipe[0]);
    set_nonblock(in_pipe[1]);
    // SIGPIPE on a closed stdin must not take the host down.
    std::signal(SIGPIPE, SIG_IGN);
    return std::make_unique<PosixProcessHandle>(pid, out_pipe[0], in_pipe[1], spec.stdin_data);
}

} // namespace kestrel
