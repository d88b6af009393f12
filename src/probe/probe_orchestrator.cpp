#include "stdioprobe/probe/probe_orchestrator.hpp"
#include "stdioprobe/log/logger.hpp"

#include <algorithm>
#include <type_traits>

namespace stdioprobe {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::chrono::milliseconds remaining_until(Clock::time_point deadline) {
    return std::max(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()),
        std::chrono::milliseconds{0});
}

}  // namespace

std::string_view to_string(ProbeState state) noexcept {
    switch (state) {
        case ProbeState::NotStarted:   return "NotStarted";
        case ProbeState::Launched:     return "Launched";
        case ProbeState::StepPending:  return "StepPending";
        case ProbeState::StepComplete: return "StepComplete";
        case ProbeState::Terminating:  return "Terminating";
        case ProbeState::Terminated:   return "Terminated";
    }
    return "Unknown";
}

ProbeOrchestrator::ProbeOrchestrator(ProbeOptions options)
    : options_(options)
{}

void ProbeOrchestrator::transition(ProbeState next) {
    get_logger().debug_fmt("probe state {} -> {}", to_string(state_), to_string(next));
    state_ = next;
}

// ═══════════════════════════════════════════════════════════════════════════
// Entry points
// ═══════════════════════════════════════════════════════════════════════════

ProbeReport ProbeOrchestrator::run(const LaunchConfig& config, const ProbeScript& script) {
    state_ = ProbeState::NotStarted;
    const auto start = Clock::now();

    auto launched = launch(config);
    if (!launched) {
        ProbeReport report;
        report.script_name = script.name;
        report.command = describe_command(config);
        report.launch_error = launched.error();
        report.elapsed = elapsed_since(start);
        transition(ProbeState::Terminated);
        return report;
    }

    ProbeReport report = run(std::move(*launched), script);
    report.command = describe_command(config);
    report.elapsed = elapsed_since(start);
    return report;
}

std::vector<ProbeReport> ProbeOrchestrator::run_all(const LaunchConfig& config,
                                                    const std::vector<ProbeScript>& scripts) {
    std::vector<ProbeReport> reports;
    reports.reserve(scripts.size());

    for (const auto& script : scripts) {
        get_logger().info_fmt("Running script '{}'", script.name);
        reports.push_back(run(config, script));
        if (reports.back().launch_error.has_value()) {
            STDIOPROBE_LOG_ERROR("Launch failed; remaining scripts skipped");
            break;
        }
    }
    return reports;
}

ProbeReport ProbeOrchestrator::run(std::unique_ptr<IProcess> process, const ProbeScript& script) {
    const auto start = Clock::now();
    exited_.reset();

    ProbeReport report;
    report.script_name = script.name;
    report.steps.reserve(script.steps.size());

    transition(ProbeState::Launched);

    // A server that crashes on startup is caught here rather than by a full
    // response timeout on the first step
    if (process->wait_for_exit(options_.settle_timeout)) {
        get_logger().warn_fmt("Server exited during startup (pid {})", process->pid());
        static_cast<void>(capture_exit(*process));
    }

    RequestFramer framer(*process, FramerOptions{options_.response_timeout});

    for (const auto& request : script.steps) {
        transition(ProbeState::StepPending);
        const auto step_start = Clock::now();

        StepResult step;
        step.method = request.method();
        step.id = request.id();
        step.outcome = run_step(*process, framer, request, report);
        step.elapsed = elapsed_since(step_start);

        get_logger().info_fmt("[{}] {} (id {}): {}",
                              script.name, step.method, step.id, to_string(step.kind()));

        finish_handshake(framer, request, step.outcome);
        report.steps.push_back(std::move(step));
        transition(ProbeState::StepComplete);
    }

    transition(ProbeState::Terminating);
    report.exit_code = process->terminate(options_.grace_period);
    ResidualOutput residual = process->drain(options_.drain_timeout);
    report.residual_stdout = std::move(residual.stdout_text);
    report.stderr_text = std::move(residual.stderr_text);
    process.reset();
    transition(ProbeState::Terminated);

    report.elapsed = elapsed_since(start);
    return report;
}

// ═══════════════════════════════════════════════════════════════════════════
// Steps
// ═══════════════════════════════════════════════════════════════════════════

ProbeOutcome ProbeOrchestrator::run_step(IProcess& process,
                                         RequestFramer& framer,
                                         const JsonRpcRequest& request,
                                         ProbeReport& report) {
    if (!exited_.has_value() && process.has_exited()) {
        static_cast<void>(capture_exit(process));
    }
    if (exited_.has_value()) {
        return *exited_;
    }

    auto written = framer.write_request(request);
    if (!written) {
        STDIOPROBE_LOG_WARN("Write failed: " + written.error().message);
        if (process.wait_for_exit(options_.settle_timeout)) {
            return capture_exit(process);
        }
        return WriteError{written.error().message};
    }

    return await_response(process, framer, request, report);
}

ProbeOutcome ProbeOrchestrator::await_response(IProcess& process,
                                               RequestFramer& framer,
                                               const JsonRpcRequest& request,
                                               ProbeReport& report) {
    const auto start = Clock::now();
    const auto deadline = start + options_.response_timeout;

    while (true) {
        ReadResponse read = framer.read_response(remaining_until(deadline));

        if (auto* notification = std::get_if<ReceivedNotification>(&read)) {
            if (options_.skip_notifications) {
                STDIOPROBE_LOG_DEBUG("Skipping notification: " + notification->raw_line);
                report.notifications.push_back(std::move(notification->message));
                continue;
            }
            return DecodeError{
                std::move(notification->raw_line),
                "expected a response, received a notification"};
        }

        return std::visit([&](auto&& value) -> ProbeOutcome {
            using T = std::decay_t<decltype(value)>;

            if constexpr (std::is_same_v<T, ReceivedResponse>) {
                // Steps are matched positionally; a mismatched id is only noted
                if (value.response.id.has_value() && *value.response.id != request.id()) {
                    get_logger().warn_fmt("Response id {} does not match request id {}",
                                          *value.response.id, request.id());
                }
                return Success{std::move(value.response), std::move(value.raw_line)};
            } else if constexpr (std::is_same_v<T, MalformedLine>) {
                STDIOPROBE_LOG_WARN("Undecodable line: " + value.cause);
                return DecodeError{std::move(value.raw_line), std::move(value.cause)};
            } else if constexpr (std::is_same_v<T, ReadTimedOut>) {
                return Timeout{elapsed_since(start)};
            } else if constexpr (std::is_same_v<T, StreamClosed>) {
                STDIOPROBE_LOG_DEBUG("stdout closed; checking whether the server exited");
                if (process.wait_for_exit(options_.settle_timeout)) {
                    return capture_exit(process, std::move(value.partial));
                }
                // Output closed but still running: no response can ever arrive
                STDIOPROBE_LOG_WARN("Server closed stdout but is still running");
                ResidualOutput residual = process.drain(options_.drain_timeout);
                exited_ = ProcessExited{
                    std::nullopt,
                    std::move(value.partial) + residual.stdout_text,
                    std::move(residual.stderr_text)};
                return *exited_;
            } else {
                // Notifications are handled above
                return DecodeError{value.raw_line, "unexpected notification"};
            }
        }, std::move(read));
    }
}

ProbeOutcome ProbeOrchestrator::capture_exit(IProcess& process, std::string partial_stdout) {
    ResidualOutput residual = process.drain(options_.drain_timeout);
    exited_ = ProcessExited{
        process.exit_code(),
        std::move(partial_stdout) + residual.stdout_text,
        std::move(residual.stderr_text)};

    if (exited_->exit_code.has_value()) {
        get_logger().warn_fmt("Server exited with status {}", *exited_->exit_code);
    } else {
        STDIOPROBE_LOG_WARN("Server exited; status unavailable");
    }
    return *exited_;
}

void ProbeOrchestrator::finish_handshake(RequestFramer& framer,
                                         const JsonRpcRequest& request,
                                         const ProbeOutcome& outcome) {
    if (!options_.send_initialized_notification || request.method() != "initialize") {
        return;
    }
    const auto* success = std::get_if<Success>(&outcome);
    if (success == nullptr || success->response.is_error()) {
        return;
    }

    // Not a step: no outcome is recorded. A broken pipe shows up on the next step.
    auto written = framer.write_notification(make_initialized_notification());
    if (!written) {
        STDIOPROBE_LOG_WARN("Sending notifications/initialized failed: " + written.error().message);
    }
}

}  // namespace stdioprobe
