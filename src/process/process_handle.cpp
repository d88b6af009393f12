#include "stdioprobe/process/process_handle.hpp"
#include "stdioprobe/log/logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <mutex>
#include <thread>

extern char** environ;

namespace stdioprobe {

namespace {

constexpr std::chrono::milliseconds kExitPollInterval{10};
constexpr std::chrono::milliseconds kDestructorGrace{100};
constexpr int kEofWindowDivisor = 4;  // Share of the grace period spent waiting for EOF exit
constexpr std::size_t kReadChunkSize = 8192;

using Clock = std::chrono::steady_clock;

// Written by the child to the status pipe when chdir or exec fails
struct ChildFailure {
    int stage;
    int error_number;
};

std::string errno_message(int error_number) {
    return std::string(std::strerror(error_number));
}

void ignore_sigpipe_once() {
    // A write to a child that already exited must surface as EPIPE
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

bool make_pipe(std::array<int, 2>& fds) {
    if (::pipe(fds.data()) == -1) {
        return false;
    }
    // Close-on-exec keeps our ends out of the child after exec; the child's
    // dup2 copies onto 0/1/2 do not inherit the flag
    for (int fd : fds) {
        if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1) {
            return false;
        }
    }
    return true;
}

bool set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL);
    if (flags == -1) {
        return false;
    }
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

int remaining_ms(Clock::time_point deadline) {
    const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());
    const auto clamped = std::clamp<std::chrono::milliseconds::rep>(
        remaining.count(), 0, std::numeric_limits<int>::max());
    return static_cast<int>(clamped);
}

[[noreturn]] void report_child_failure(int status_fd, LaunchError::Stage stage) {
    // Child side of fork(): async-signal-safe calls only
    const ChildFailure failure{static_cast<int>(stage), errno};
    const ssize_t written = ::write(status_fd, &failure, sizeof(failure));
    static_cast<void>(written);
    ::_exit(127);
}

std::vector<std::string> build_environment(const LaunchConfig& config) {
    std::vector<std::string> entries;

    if (config.inherit_environment) {
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            std::string_view text(*entry);
            const auto equals = text.find('=');
            const std::string name(text.substr(0, equals));
            if (config.environment.count(name) == 0) {
                entries.emplace_back(text);
            }
        }
    }

    for (const auto& [name, value] : config.environment) {
        entries.push_back(name + "=" + value);
    }
    return entries;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& storage) {
    std::vector<char*> pointers;
    pointers.reserve(storage.size() + 1);
    for (auto& str : storage) {
        pointers.push_back(str.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

}  // namespace

std::string_view to_string(LaunchError::Stage stage) noexcept {
    switch (stage) {
        case LaunchError::Stage::Config: return "config";
        case LaunchError::Stage::Pipe:   return "pipe";
        case LaunchError::Stage::Fork:   return "fork";
        case LaunchError::Stage::Chdir:  return "chdir";
        case LaunchError::Stage::Exec:   return "exec";
    }
    return "unknown";
}

std::string describe_command(const LaunchConfig& config) {
    std::string description = config.command;
    for (const auto& arg : config.args) {
        description += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            description += '\'' + arg + '\'';
        } else {
            description += arg;
        }
    }
    return description;
}

// ═══════════════════════════════════════════════════════════════════════════
// Launch
// ═══════════════════════════════════════════════════════════════════════════

LaunchResult<std::unique_ptr<ProcessHandle>> launch(const LaunchConfig& config) {
    if (config.command.empty()) {
        return tl::unexpected(LaunchError{
            LaunchError::Stage::Config, 0, "No server command configured"});
    }
    if (config.working_directory.empty()) {
        return tl::unexpected(LaunchError{
            LaunchError::Stage::Config, 0, "No working directory configured"});
    }

    ignore_sigpipe_once();

    // Everything the child touches is allocated BEFORE fork(). After fork()
    // only the calling thread exists in the child, and a malloc lock held by
    // another thread would deadlock it.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config.args.size() + 1);
    argv_storage.push_back(config.command);
    argv_storage.insert(argv_storage.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv = to_pointer_array(argv_storage);

    std::vector<std::string> env_storage = build_environment(config);
    std::vector<char*> envp = to_pointer_array(env_storage);

    std::array<int, 2> stdin_pipe{-1, -1};   // we write [1]
    std::array<int, 2> stdout_pipe{-1, -1};  // we read [0]
    std::array<int, 2> stderr_pipe{-1, -1};  // we read [0]
    std::array<int, 2> status_pipe{-1, -1};  // child reports exec failure on [1]

    auto close_pipes = [&]() {
        for (auto* p : {&stdin_pipe, &stdout_pipe, &stderr_pipe, &status_pipe}) {
            for (int& fd : *p) {
                if (fd != -1) {
                    ::close(fd);
                    fd = -1;
                }
            }
        }
    };

    if (!make_pipe(stdin_pipe) || !make_pipe(stdout_pipe) ||
        !make_pipe(stderr_pipe) || !make_pipe(status_pipe)) {
        const int error_number = errno;
        close_pipes();
        return tl::unexpected(LaunchError{
            LaunchError::Stage::Pipe, error_number,
            "Failed to create pipes: " + errno_message(error_number)});
    }

    const pid_t pid = ::fork();

    if (pid == -1) {
        const int error_number = errno;
        close_pipes();
        return tl::unexpected(LaunchError{
            LaunchError::Stage::Fork, error_number,
            "Failed to fork: " + errno_message(error_number)});
    }

    if (pid == 0) {
        // Child process - NO ALLOCATIONS ALLOWED
        struct sigaction default_action {};
        default_action.sa_handler = SIG_DFL;
        ::sigaction(SIGPIPE, &default_action, nullptr);

        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                       stderr_pipe[0], stderr_pipe[1], status_pipe[0]}) {
            if (fd > STDERR_FILENO) {
                ::close(fd);
            }
        }

        if (::chdir(config.working_directory.c_str()) == -1) {
            report_child_failure(status_pipe[1], LaunchError::Stage::Chdir);
        }

        environ = envp.data();
        ::execvp(argv[0], argv.data());
        report_child_failure(status_pipe[1], LaunchError::Stage::Exec);
    }

    // Parent process - close the child's ends
    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);
    ::close(status_pipe[1]);
    stdin_pipe[0] = stdout_pipe[1] = stderr_pipe[1] = status_pipe[1] = -1;

    // EOF on the status pipe means exec succeeded (close-on-exec fired)
    ChildFailure failure{};
    ssize_t status_bytes = 0;
    do {
        status_bytes = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (status_bytes == -1 && errno == EINTR);
    ::close(status_pipe[0]);
    status_pipe[0] = -1;

    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        close_pipes();

        const auto stage = static_cast<LaunchError::Stage>(failure.stage);
        std::string message = (stage == LaunchError::Stage::Chdir)
            ? "Cannot change to working directory '" + config.working_directory + "': "
            : "Cannot execute '" + config.command + "': ";
        message += errno_message(failure.error_number);

        STDIOPROBE_LOG_ERROR(message);
        return tl::unexpected(LaunchError{stage, failure.error_number, std::move(message)});
    }

    for (int fd : {stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]}) {
        if (!set_nonblocking(fd)) {
            const int error_number = errno;
            ::kill(pid, SIGKILL);
            int status = 0;
            while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
            }
            close_pipes();
            return tl::unexpected(LaunchError{
                LaunchError::Stage::Pipe, error_number,
                "Failed to configure pipes: " + errno_message(error_number)});
        }
    }

    get_logger().info_fmt("Started server pid {}: {} (cwd {})",
                          static_cast<int>(pid), describe_command(config), config.working_directory);

    return std::make_unique<ProcessHandle>(ProcessHandle::ConstructionKey{}, pid, stdin_pipe[1],
                                           stdout_pipe[0], stderr_pipe[0], config.max_line_length);
}

// ═══════════════════════════════════════════════════════════════════════════
// ProcessHandle
// ═══════════════════════════════════════════════════════════════════════════

ProcessHandle::ProcessHandle(ConstructionKey /*key*/, pid_t pid, int stdin_fd, int stdout_fd,
                             int stderr_fd, std::size_t max_line_length)
    : pid_(pid)
    , stdin_fd_(stdin_fd)
    , stdout_fd_(stdout_fd)
    , stderr_fd_(stderr_fd)
    , max_line_length_(max_line_length)
{}

ProcessHandle::~ProcessHandle() {
    if (reaped_ == false) {
        terminate(kDestructorGrace);
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

int ProcessHandle::pid() const noexcept {
    return static_cast<int>(pid_);
}

void ProcessHandle::close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

void ProcessHandle::close_stdin() {
    close_fd(stdin_fd_);
}

ProcessResult<void> ProcessHandle::write_all(std::string_view bytes,
                                             std::chrono::milliseconds timeout) {
    if (stdin_fd_ == -1) {
        return tl::unexpected(ProcessError{ProcessError::Code::Closed, "stdin is closed"});
    }

    const auto deadline = Clock::now() + timeout;
    const char* ptr = bytes.data();
    std::size_t remaining = bytes.size();

    // Loop for partial writes; the pipe is non-blocking, so a full pipe
    // waits for POLLOUT until the deadline
    while (remaining > 0) {
        const ssize_t written = ::write(stdin_fd_, ptr, remaining);
        if (written >= 0) {
            ptr += written;
            remaining -= static_cast<std::size_t>(written);
            continue;
        }

        const int error_number = errno;
        if (error_number == EINTR) {
            continue;
        }
        if (error_number == EAGAIN || error_number == EWOULDBLOCK) {
            const int wait_ms = remaining_ms(deadline);
            if (wait_ms == 0) {
                return tl::unexpected(ProcessError{
                    ProcessError::Code::Timeout,
                    "Timed out writing to process stdin"});
            }
            struct pollfd pfd{};
            pfd.fd = stdin_fd_;
            pfd.events = POLLOUT;
            if (::poll(&pfd, 1, wait_ms) == -1 && errno != EINTR) {
                return tl::unexpected(ProcessError{
                    ProcessError::Code::Io,
                    "poll on process stdin failed: " + errno_message(errno)});
            }
            continue;
        }
        if (error_number == EPIPE) {
            close_fd(stdin_fd_);
            return tl::unexpected(ProcessError{
                ProcessError::Code::BrokenPipe,
                "Failed to write to process: " + errno_message(error_number)});
        }
        return tl::unexpected(ProcessError{
            ProcessError::Code::Io,
            "Failed to write to process: " + errno_message(error_number)});
    }

    return {};
}

LineRead ProcessHandle::read_line(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    bool final_poll = false;

    while (true) {
        const auto newline = stdout_buffer_.find('\n');
        if (newline != std::string::npos && newline > max_line_length_) {
            LineRead read{LineRead::Status::TooLong, stdout_buffer_.substr(0, max_line_length_)};
            stdout_buffer_.erase(0, newline + 1);
            return read;
        }
        if (newline != std::string::npos) {
            LineRead read{LineRead::Status::Line, stdout_buffer_.substr(0, newline)};
            stdout_buffer_.erase(0, newline + 1);
            return read;
        }

        if (stdout_buffer_.size() > max_line_length_) {
            LineRead read{LineRead::Status::TooLong, std::move(stdout_buffer_)};
            stdout_buffer_.clear();
            return read;
        }

        if (stdout_fd_ == -1) {
            LineRead read{LineRead::Status::EndOfStream, std::move(stdout_buffer_)};
            stdout_buffer_.clear();
            return read;
        }

        if (final_poll) {
            return LineRead{LineRead::Status::TimedOut, {}};
        }

        // Always poll once, even with a zero budget, so data that is already
        // waiting in the pipe is seen
        const int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            final_poll = true;
        }

        auto pumped = pump(std::chrono::milliseconds(wait_ms));
        if (!pumped) {
            return LineRead{LineRead::Status::Failed, pumped.error().message};
        }
    }
}

ProcessResult<void> ProcessHandle::pump(std::chrono::milliseconds timeout) {
    std::array<struct pollfd, 2> fds{};
    nfds_t count = 0;
    int stdout_index = -1;
    int stderr_index = -1;

    if (stdout_fd_ != -1) {
        fds[count] = pollfd{stdout_fd_, POLLIN, 0};
        stdout_index = static_cast<int>(count++);
    }
    if (stderr_fd_ != -1) {
        fds[count] = pollfd{stderr_fd_, POLLIN, 0};
        stderr_index = static_cast<int>(count++);
    }
    if (count == 0) {
        return {};
    }

    const int result = ::poll(fds.data(), count, static_cast<int>(timeout.count()));
    if (result == -1) {
        if (errno == EINTR) {
            return {};
        }
        return tl::unexpected(ProcessError{
            ProcessError::Code::Io, "poll failed: " + errno_message(errno)});
    }
    if (result == 0) {
        return {};
    }

    if (stderr_index != -1 && fds[static_cast<std::size_t>(stderr_index)].revents != 0) {
        read_stderr_chunk();
    }
    if (stdout_index != -1 && fds[static_cast<std::size_t>(stdout_index)].revents != 0) {
        return read_stdout_chunk();
    }
    return {};
}

ProcessResult<void> ProcessHandle::read_stdout_chunk() {
    std::array<char, kReadChunkSize> chunk{};
    const ssize_t n = ::read(stdout_fd_, chunk.data(), chunk.size());
    if (n > 0) {
        STDIOPROBE_LOG_TRACE("stdout: " + std::string(chunk.data(), static_cast<std::size_t>(n)));
        stdout_buffer_.append(chunk.data(), static_cast<std::size_t>(n));
        return {};
    }
    if (n == 0) {
        STDIOPROBE_LOG_DEBUG("Server closed stdout");
        close_fd(stdout_fd_);
        return {};
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return {};
    }
    const int error_number = errno;
    close_fd(stdout_fd_);
    return tl::unexpected(ProcessError{
        ProcessError::Code::Io,
        "Failed to read from process: " + errno_message(error_number)});
}

void ProcessHandle::read_stderr_chunk() {
    std::array<char, kReadChunkSize> chunk{};
    const ssize_t n = ::read(stderr_fd_, chunk.data(), chunk.size());
    if (n > 0) {
        stderr_buffer_.append(chunk.data(), static_cast<std::size_t>(n));
        return;
    }
    if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
        return;
    }
    // EOF or a read error: either way nothing more will arrive
    close_fd(stderr_fd_);
}

void ProcessHandle::record_status(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -WTERMSIG(status);  // Negative indicates signal
    }
    reaped_ = true;
}

bool ProcessHandle::has_exited() {
    if (reaped_ || pid_ <= 0) {
        return true;
    }

    int status = 0;
    const pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        record_status(status);
        get_logger().debug_fmt("Server pid {} exited with status {}",
                               static_cast<int>(pid_), exit_code_.value_or(-1));
        return true;
    }
    if (result == -1 && errno == ECHILD) {
        // Reaped elsewhere; the status is lost
        reaped_ = true;
        return true;
    }
    return false;
}

bool ProcessHandle::wait_for_exit(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (true) {
        if (has_exited()) {
            return true;
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto nap = std::min<Clock::duration>(kExitPollInterval, deadline - now);
        std::this_thread::sleep_for(nap);
    }
}

std::optional<int> ProcessHandle::exit_code() const {
    return exit_code_;
}

ResidualOutput ProcessHandle::drain(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;

    while (stdout_fd_ != -1 || stderr_fd_ != -1) {
        const int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            break;
        }
        auto pumped = pump(std::chrono::milliseconds(wait_ms));
        if (!pumped) {
            STDIOPROBE_LOG_WARN("Draining server output failed: " + pumped.error().message);
            break;
        }
    }

    ResidualOutput residual{std::move(stdout_buffer_), stderr_buffer_};
    stdout_buffer_.clear();
    return residual;
}

std::optional<int> ProcessHandle::terminate(std::chrono::milliseconds grace) {
    // One grace budget covers both the EOF window and the SIGTERM wait
    const auto deadline = Clock::now() + grace;

    // Most servers exit on their own once stdin reaches EOF
    close_stdin();
    if (wait_for_exit(grace / kEofWindowDivisor)) {
        return exit_code_;
    }

    get_logger().debug_fmt("Sending SIGTERM to server pid {}", static_cast<int>(pid_));
    ::kill(pid_, SIGTERM);

    if (wait_for_exit(std::chrono::milliseconds(remaining_ms(deadline)))) {
        return exit_code_;
    }

    get_logger().warn_fmt("Server pid {} still running {} ms after teardown began; sending SIGKILL",
                          static_cast<int>(pid_), grace.count());
    ::kill(pid_, SIGKILL);

    int status = 0;
    pid_t result = -1;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result == -1 && errno == EINTR);

    if (result == pid_) {
        record_status(status);
    } else {
        reaped_ = true;
    }
    return exit_code_;
}

}  // namespace stdioprobe
