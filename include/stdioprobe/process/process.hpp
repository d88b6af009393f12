#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Child Process Interface
// ═══════════════════════════════════════════════════════════════════════════
// The operations the framer and the orchestrator perform on a launched
// server. ProcessHandle implements it over POSIX pipes; tests substitute a
// scripted fake.

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace stdioprobe {

/// Error type for I/O on a child's streams
struct ProcessError {
    enum class Code {
        Closed,      // Stream already closed on our side
        BrokenPipe,  // Child closed its end (usually: it exited)
        Timeout,     // Child did not drain its input in time
        Io           // Any other OS error
    };

    Code code{Code::Io};
    std::string message;
};

template <typename T>
using ProcessResult = tl::expected<T, ProcessError>;

/// Result of one bounded attempt to read a line from the child's stdout
struct LineRead {
    enum class Status {
        Line,         // text holds one line without its terminator
        EndOfStream,  // stdout closed; text holds any unterminated tail
        TimedOut,     // nothing complete arrived before the deadline
        TooLong,      // text holds the oversized prefix, which was discarded
        Failed        // text holds the OS error description
    };

    Status status{Status::TimedOut};
    std::string text;
};

/// Output left in the pipes when a run ends
struct ResidualOutput {
    std::string stdout_text;  // stdout bytes never consumed as a response
    std::string stderr_text;  // everything the child wrote to stderr
};

class IProcess {
public:
    virtual ~IProcess() = default;

    /// Write all bytes to the child's stdin, waiting at most `timeout`
    [[nodiscard]] virtual ProcessResult<void> write_all(
        std::string_view bytes, std::chrono::milliseconds timeout) = 0;

    /// Read one newline-terminated line from stdout, waiting at most `timeout`
    [[nodiscard]] virtual LineRead read_line(std::chrono::milliseconds timeout) = 0;

    /// Non-blocking liveness check. Reaps the child when it has exited.
    [[nodiscard]] virtual bool has_exited() = 0;

    /// Wait up to `timeout` for the child to exit
    [[nodiscard]] virtual bool wait_for_exit(std::chrono::milliseconds timeout) = 0;

    /// Exit status once reaped: the exit code, or -signal for signal deaths
    [[nodiscard]] virtual std::optional<int> exit_code() const = 0;

    /// Collect what is still buffered on stdout/stderr, reading for at most `timeout`
    [[nodiscard]] virtual ResidualOutput drain(std::chrono::milliseconds timeout) = 0;

    /// Close stdin, SIGTERM if still alive, SIGKILL once `grace` has elapsed.
    /// A short EOF window at the start of `grace` precedes the SIGTERM.
    /// Returns the final exit status.
    virtual std::optional<int> terminate(std::chrono::milliseconds grace) = 0;

    [[nodiscard]] virtual int pid() const noexcept = 0;
};

}  // namespace stdioprobe
