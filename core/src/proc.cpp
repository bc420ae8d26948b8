#include "kyotee/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <ctime>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace kyotee {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            have_token = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
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

// Writing the prompt to a worker that exits without reading it must not
// kill the orchestrator.
class SigpipeIgnoreGuard {
public:
    SigpipeIgnoreGuard() {
        struct sigaction ign;
        std::memset(&ign, 0, sizeof(ign));
        ign.sa_handler = SIG_IGN;
        sigemptyset(&ign.sa_mask);
        installed_ = (sigaction(SIGPIPE, &ign, &prev_) == 0);
    }
    ~SigpipeIgnoreGuard() {
        if (installed_) (void)sigaction(SIGPIPE, &prev_, nullptr);
    }
    SigpipeIgnoreGuard(const SigpipeIgnoreGuard&) = delete;
    SigpipeIgnoreGuard& operator=(const SigpipeIgnoreGuard&) = delete;

private:
    struct sigaction prev_;
    bool installed_{false};
};

int64_t elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }

    int in_pipe[2];
    if (pipe(in_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }

    int flags = fcntl(out_pipe[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);

    SigpipeIgnoreGuard sigpipe_guard;
    auto start = std::chrono::steady_clock::now();

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(in_pipe[0]); close(in_pipe[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(in_pipe[0]);
        close(in_pipe[1]);

        // own process group so a timeout can kill the whole subtree
        (void)setpgid(0, 0);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            (void)close(fd);
        }

        signal(SIGPIPE, SIG_DFL);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(126);
        }

#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
        cargv.push_back(nullptr);

        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(in_pipe[0]);

    // Interleave stdin writes with output reads so a large prompt cannot
    // deadlock against a child blocked on a full stdout pipe.
    int in_fd = in_pipe[1];
    if (!stdin_data.empty()) {
        int fl = fcntl(in_fd, F_GETFL, 0);
        if (fl >= 0) (void)fcntl(in_fd, F_SETFL, fl | O_NONBLOCK);
    } else {
        close(in_fd);
        in_fd = -1;
    }
    size_t write_off = 0;

    std::string out;
    bool child_exited = false;
    bool out_eof = false;
    int status = 0;

    auto append_output = [&](const char* buf, ssize_t n) {
        if (lim.output_max_bytes == 0) {
            out.append(buf, buf + n);
            return;
        }
        size_t can = lim.output_max_bytes > out.size() ? (lim.output_max_bytes - out.size()) : 0;
        size_t take = std::min(can, (size_t)n);
        if (take < (size_t)n) res->output_truncated = true;
        out.append(buf, buf + take);
    };

    auto drain = [&]() {
        char buf[4096];
        while (true) {
            ssize_t n = read(out_pipe[0], buf, sizeof(buf));
            if (n > 0) { append_output(buf, n); continue; }
            if (n == 0) out_eof = true;
            if (n == -1 && errno == EINTR) continue;
            break;
        }
    };

    while (true) {
        struct pollfd fds[2];
        int nfds = 0;
        int in_idx = -1;
        int out_idx = -1;
        if (in_fd >= 0) {
            in_idx = nfds;
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            fds[nfds].revents = 0;
            nfds++;
        }
        if (!out_eof) {
            out_idx = nfds;
            fds[nfds].fd = out_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            nfds++;
        }

        int slice = 100;
        if (lim.timeout_ms > 0) {
            int64_t remaining = (int64_t)lim.timeout_ms - elapsed_ms_since(start);
            if (remaining <= 0) {
                res->timed_out = true;
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                (void)waitpid(pid, &status, 0);
                child_exited = true;
                break;
            }
            if (remaining < slice) slice = (int)remaining;
        }

        if (nfds > 0) {
            int pr = poll(fds, (nfds_t)nfds, slice);
            if (pr < 0 && errno == EINTR) continue;
        } else {
            // stdin done and stdout at EOF: only waiting for the exit status
            struct timespec ts{0, 10 * 1000 * 1000};
            (void)nanosleep(&ts, nullptr);
        }

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data.size(); // EPIPE: child stopped reading
                break;
            }
            if (write_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            drain();
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);

    // Grandchildren may still hold the write end; read only what is buffered.
    drain();
    close(out_pipe[0]);

    res->output = std::move(out);
    res->duration_ms = elapsed_ms_since(start);
    if (!child_exited) {
        res->exit_code = 128;
        res->error = "child did not exit";
        return true;
    }

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    return true;
}

bool proc_run_shell(const std::string& command,
                    const std::string& cwd,
                    const ProcLimits& lim,
                    ProcResult* res) {
    return proc_run_capture({"/bin/sh", "-c", command}, cwd, std::string(), lim, res);
}

} // namespace kyotee
