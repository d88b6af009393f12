#pragma once

// ProcessHandle requires POSIX process and pipe APIs
#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ProcessHandle is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "stdioprobe/process/process.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>  // For pid_t

namespace stdioprobe {

// ═══════════════════════════════════════════════════════════════════════════
// Launch Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct LaunchConfig {
    std::string command;                          // Resolved through PATH
    std::vector<std::string> args;
    std::string working_directory;                // Required, never inferred
    std::map<std::string, std::string> environment;  // Overrides / additions
    bool inherit_environment{true};               // Start from the parent environment
    std::size_t max_line_length{1 << 20};         // 1 MiB per stdout line
};

struct LaunchError {
    enum class Stage {
        Config,  // Rejected before anything was created
        Pipe,
        Fork,
        Chdir,   // Working directory missing or not accessible
        Exec     // Executable missing or not runnable
    };

    Stage stage{Stage::Config};
    int os_error{0};  // errno, 0 when not an OS failure
    std::string message;
};

[[nodiscard]] std::string_view to_string(LaunchError::Stage stage) noexcept;

template <typename T>
using LaunchResult = tl::expected<T, LaunchError>;

// ═══════════════════════════════════════════════════════════════════════════
// Process Handle
// ═══════════════════════════════════════════════════════════════════════════
// An owned child process with three non-blocking pipes. Reads are bounded by
// poll(2) deadlines; stderr is collected whenever stdout is polled so the
// child never stalls on a full stderr pipe. The destructor terminates and
// reaps a child that is still running.

class ProcessHandle final : public IProcess {
    // Private passkey: only launch() can name it
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    ProcessHandle(ConstructionKey key, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                  std::size_t max_line_length);
    ~ProcessHandle() override;

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;
    ProcessHandle(ProcessHandle&&) = delete;
    ProcessHandle& operator=(ProcessHandle&&) = delete;

    [[nodiscard]] ProcessResult<void> write_all(
        std::string_view bytes, std::chrono::milliseconds timeout) override;
    [[nodiscard]] LineRead read_line(std::chrono::milliseconds timeout) override;
    [[nodiscard]] bool has_exited() override;
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::optional<int> exit_code() const override;
    [[nodiscard]] ResidualOutput drain(std::chrono::milliseconds timeout) override;
    std::optional<int> terminate(std::chrono::milliseconds grace) override;
    [[nodiscard]] int pid() const noexcept override;

    /// Close our end of the child's stdin (the child sees EOF)
    void close_stdin();

private:
    friend LaunchResult<std::unique_ptr<ProcessHandle>> launch(const LaunchConfig& config);

    /// Poll stdout/stderr once for at most `timeout`; appends to the buffers
    [[nodiscard]] ProcessResult<void> pump(std::chrono::milliseconds timeout);
    void read_stderr_chunk();
    [[nodiscard]] ProcessResult<void> read_stdout_chunk();
    void record_status(int status);
    static void close_fd(int& fd);

    pid_t pid_{-1};
    bool reaped_{false};
    std::optional<int> exit_code_;

    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};

    std::size_t max_line_length_;
    std::string stdout_buffer_;
    std::string stderr_buffer_;
};

/// Spawn `config.command` with redirected standard streams.
/// Exec and chdir failures in the child are reported as LaunchError.
[[nodiscard]] LaunchResult<std::unique_ptr<ProcessHandle>> launch(const LaunchConfig& config);

/// Human readable command line for logs and reports
[[nodiscard]] std::string describe_command(const LaunchConfig& config);

}  // namespace stdioprobe
