#ifndef STDIOPROBE_TESTS_FAKE_PROCESS_HPP
#define STDIOPROBE_TESTS_FAKE_PROCESS_HPP

#include "stdioprobe/process/process.hpp"

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stdioprobe::testing {

// ─────────────────────────────────────────────────────────────────────────────
// FakeProcess
// ─────────────────────────────────────────────────────────────────────────────
// A scripted IProcess for orchestrator and framer tests. Reads are served from
// a queue of LineRead results; an empty queue behaves like a silent server
// (TimedOut) unless the fake has been told to exit. Everything the code under
// test does is recorded in a shared log that outlives the fake, since the
// orchestrator destroys the process it owns before returning.
//
// Usage:
//   auto log = std::make_shared<FakeProcess::Log>();
//   auto process = std::make_unique<FakeProcess>(log);
//   process->push_line(R"({"jsonrpc":"2.0","id":1,"result":{}})");
//   auto report = orchestrator.run(std::move(process), script);
//   REQUIRE(log->writes.size() == 2);

class FakeProcess final : public IProcess {
public:
    struct Log {
        std::vector<std::string> writes;
        int read_calls = 0;
        int terminate_calls = 0;
        bool destroyed = false;
    };

    explicit FakeProcess(std::shared_ptr<Log> log = std::make_shared<Log>())
        : log_(std::move(log))
    {}

    ~FakeProcess() override {
        log_->destroyed = true;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Scripting
    // ─────────────────────────────────────────────────────────────────────────

    void push_line(std::string text) {
        reads_.push_back(LineRead{LineRead::Status::Line, std::move(text)});
    }

    void push_read(LineRead read) {
        reads_.push_back(std::move(read));
    }

    /// Exit with `code` once the queued reads before this call are consumed.
    /// Writes after that point fail with BrokenPipe.
    void exit_after_reads(int code) {
        exit_after_ = reads_.size();
        pending_exit_code_ = code;
    }

    /// Exit immediately, before any step runs
    void exit_now(int code) {
        exited_ = true;
        exit_code_ = code;
    }

    /// Close stdout without exiting (the process stays alive)
    void close_stdout_after_reads() {
        close_stdout_after_ = reads_.size();
    }

    void set_stderr(std::string text) { stderr_text_ = std::move(text); }

    // ─────────────────────────────────────────────────────────────────────────
    // IProcess
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ProcessResult<void> write_all(
        std::string_view bytes, std::chrono::milliseconds /*timeout*/) override {
        if (exited_) {
            return tl::unexpected(ProcessError{ProcessError::Code::BrokenPipe, "Broken pipe"});
        }
        log_->writes.emplace_back(bytes);
        return {};
    }

    [[nodiscard]] LineRead read_line(std::chrono::milliseconds /*timeout*/) override {
        ++log_->read_calls;

        if (exit_after_.has_value() && consumed_ >= *exit_after_) {
            exited_ = true;
            exit_code_ = pending_exit_code_;
        }
        if (exited_ || (close_stdout_after_.has_value() && consumed_ >= *close_stdout_after_)) {
            return LineRead{LineRead::Status::EndOfStream, {}};
        }
        if (reads_.empty()) {
            return LineRead{LineRead::Status::TimedOut, {}};
        }

        LineRead next = std::move(reads_.front());
        reads_.pop_front();
        ++consumed_;
        return next;
    }

    [[nodiscard]] bool has_exited() override { return exited_; }

    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds /*timeout*/) override {
        return exited_;
    }

    [[nodiscard]] std::optional<int> exit_code() const override {
        return exited_ ? std::optional<int>(exit_code_) : std::nullopt;
    }

    [[nodiscard]] ResidualOutput drain(std::chrono::milliseconds /*timeout*/) override {
        ResidualOutput residual;
        residual.stderr_text = stderr_text_;
        return residual;
    }

    std::optional<int> terminate(std::chrono::milliseconds /*grace*/) override {
        ++log_->terminate_calls;
        if (!exited_) {
            exited_ = true;
            exit_code_ = -15;
        }
        return exit_code_;
    }

    [[nodiscard]] int pid() const noexcept override { return 4242; }

private:
    std::shared_ptr<Log> log_;
    std::deque<LineRead> reads_;
    std::size_t consumed_ = 0;

    std::optional<std::size_t> exit_after_;
    std::optional<std::size_t> close_stdout_after_;
    int pending_exit_code_ = 0;

    bool exited_ = false;
    int exit_code_ = 0;
    std::string stderr_text_;
};

}  // namespace stdioprobe::testing

#endif  // STDIOPROBE_TESTS_FAKE_PROCESS_HPP
