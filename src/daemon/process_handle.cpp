#include "daemon/process_handle.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Upper bound on reads per stream per poll round, so one chatty stream
// cannot starve the other
constexpr int MAX_READS_PER_ROUND = 16;

int64_t steady_now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::string errno_text(const char* what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

ExitInfo decode_status(int status) {
    ExitInfo info;
    if (WIFEXITED(status)) {
        info.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        info.signal = WTERMSIG(status);
    }
    return info;
}

} // namespace

uint64_t next_instance_token() {
    static std::atomic<uint64_t> next{1};
    return next.fetch_add(1);
}

ProcessEvent ProcessEvent::output(OutputStream stream, std::string line) {
    ProcessEvent ev;
    ev.kind = Kind::OutputLine;
    ev.stream = stream;
    ev.text = std::move(line);
    return ev;
}

ProcessEvent ProcessEvent::error(std::string message) {
    ProcessEvent ev;
    ev.kind = Kind::ExecutionError;
    ev.text = std::move(message);
    return ev;
}

ProcessEvent ProcessEvent::terminated(ExitInfo exit) {
    ProcessEvent ev;
    ev.kind = Kind::Terminated;
    ev.exit = exit;
    return ev;
}

// ── Spawn ───────────────────────────────────────────────────

ProcessHandle::ProcessHandle(pid_t pid, int stdout_fd, int stderr_fd)
    : instance_(next_instance_token()),
      pid_(pid),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd) {}

ProcessHandle::SpawnOutcome ProcessHandle::spawn(const std::string& binary_path,
                                                 const std::vector<std::string>& args) {
    SpawnOutcome outcome;
    if (binary_path.empty()) {
        outcome.error = "no executable configured";
        return outcome;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // carries execvp's errno back to us
    auto close_all = [&]() {
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (pipe2(out_pipe, O_CLOEXEC) < 0 ||
        pipe2(err_pipe, O_CLOEXEC) < 0 ||
        pipe2(exec_pipe, O_CLOEXEC) < 0) {
        outcome.error = errno_text("pipe", errno);
        close_all();
        return outcome;
    }

    // Build argv array before fork; the child must not allocate
    std::vector<const char*> argv;
    argv.push_back(binary_path.c_str());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        outcome.error = errno_text("fork", errno);
        close_all();
        return outcome;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        execvp(binary_path.c_str(), const_cast<char* const*>(argv.data()));

        // If execvp returns, it failed
        int exec_errno = errno;
        ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // EOF here means exec succeeded (the close-on-exec end went away)
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_all();
        outcome.error = errno_text(("exec " + binary_path).c_str(), exec_errno);
        return outcome;
    }

    fcntl(out_pipe[0], F_SETFL, fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    outcome.handle.reset(new ProcessHandle(pid, out_pipe[0], err_pipe[0]));
    spdlog::debug("Spawned {} (pid {}, instance {})", binary_path, pid,
                  outcome.handle->instance());
    return outcome;
}

ProcessHandle::~ProcessHandle() {
    {
        std::lock_guard<std::mutex> lock(pid_mutex_);
        if (!reaped_.load()) {
            ::kill(pid_, SIGKILL);
            int status = 0;
            while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
            reaped_.store(true);
        }
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

// ── Signals ─────────────────────────────────────────────────

bool ProcessHandle::send_signal(int sig, std::string& err) {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    if (reaped_.load()) {
        // Already gone; the pid may belong to someone else by now
        return true;
    }
    if (::kill(pid_, sig) < 0) {
        err = errno_text("kill", errno);
        return false;
    }
    return true;
}

bool ProcessHandle::terminate(std::chrono::milliseconds grace, std::string& err) {
    if (!send_signal(SIGTERM, err)) {
        return false;
    }
    kill_after(grace);
    return true;
}

bool ProcessHandle::kill(std::string& err) {
    return send_signal(SIGKILL, err);
}

void ProcessHandle::kill_after(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) return;
    int64_t deadline = steady_now_ns() +
        std::chrono::duration_cast<std::chrono::nanoseconds>(timeout).count();
    kill_deadline_ns_.store(deadline);
}

void ProcessHandle::enforce_deadline() {
    int64_t deadline = kill_deadline_ns_.load();
    if (deadline == 0 || steady_now_ns() < deadline || reaped_.load()) {
        return;
    }
    if (!kill_deadline_ns_.compare_exchange_strong(deadline, 0)) {
        return;
    }
    deadline_fired_.store(true);
    spdlog::warn("pid {} still running past its deadline, sending SIGKILL", pid_);
    std::string err;
    if (!send_signal(SIGKILL, err)) {
        spdlog::error("SIGKILL to pid {} failed: {}", pid_, err);
    }
}

// ── Event stream ────────────────────────────────────────────

bool ProcessHandle::try_reap() {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    if (reaped_.load()) return true;

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        exit_ = decode_status(status);
        reaped_.store(true);
        return true;
    }
    if (result < 0 && errno != EINTR) {
        // Exit status is lost; the stream ends without a Terminated event
        pending_.push_back(ProcessEvent::error(errno_text("waitpid", errno)));
        lost_exit_ = true;
        reaped_.store(true);
        return true;
    }
    return false;
}

void ProcessHandle::flush_partial(std::string& buffer, OutputStream stream) {
    if (buffer.empty()) return;
    if (buffer.back() == '\r') buffer.pop_back();
    pending_.push_back(ProcessEvent::output(stream, std::move(buffer)));
    buffer.clear();
}

void ProcessHandle::read_stream(int& fd, std::string& buffer, OutputStream stream) {
    char chunk[4096];
    for (int i = 0; i < MAX_READS_PER_ROUND; ++i) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                pending_.push_back(ProcessEvent::output(stream, std::move(line)));
                buffer.erase(0, pos + 1);
            }
            continue;
        }
        if (n == 0) {
            flush_partial(buffer, stream);
            close_fd(fd);
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;

        const char* name = stream == OutputStream::Stdout ? "read stdout" : "read stderr";
        pending_.push_back(ProcessEvent::error(errno_text(name, errno)));
        flush_partial(buffer, stream);
        close_fd(fd);
        return;
    }
}

void ProcessHandle::finish() {
    flush_partial(stdout_buf_, OutputStream::Stdout);
    flush_partial(stderr_buf_, OutputStream::Stderr);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    if (!lost_exit_) {
        pending_.push_back(ProcessEvent::terminated(exit_));
    }
    finished_ = true;
}

std::optional<ProcessEvent> ProcessHandle::next_event() {
    while (true) {
        if (!pending_.empty()) {
            ProcessEvent ev = std::move(pending_.front());
            pending_.pop_front();
            return ev;
        }
        if (finished_) {
            return std::nullopt;
        }

        enforce_deadline();

        if (stdout_fd_ < 0 && stderr_fd_ < 0) {
            // Both streams at EOF; wait for the exit status
            if (try_reap()) {
                finish();
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            continue;
        }

        struct pollfd fds[2];
        int* owners[2];
        int nfds = 0;
        if (stdout_fd_ >= 0) {
            fds[nfds] = {stdout_fd_, POLLIN, 0};
            owners[nfds++] = &stdout_fd_;
        }
        if (stderr_fd_ >= 0) {
            fds[nfds] = {stderr_fd_, POLLIN, 0};
            owners[nfds++] = &stderr_fd_;
        }

        int ret = poll(fds, static_cast<nfds_t>(nfds), 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            pending_.push_back(ProcessEvent::error(errno_text("poll", errno)));
            close_fd(stdout_fd_);
            close_fd(stderr_fd_);
            continue;
        }
        if (ret == 0) {
            // Quiet pipes after the child is gone: a descendant holds them open
            if (try_reap()) {
                finish();
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            if (fds[i].revents == 0) continue;
            if (owners[i] == &stdout_fd_) {
                read_stream(stdout_fd_, stdout_buf_, OutputStream::Stdout);
            } else {
                read_stream(stderr_fd_, stderr_buf_, OutputStream::Stderr);
            }
        }
    }
}
