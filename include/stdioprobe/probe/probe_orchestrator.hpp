#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Probe Orchestrator
// ═══════════════════════════════════════════════════════════════════════════
// Runs a ProbeScript against one server process and records one outcome per
// step. Every failure except a launch error is captured as data, so a report
// is always produced.
//
//   NotStarted -> Launched -> {StepPending -> StepComplete}* -> Terminating -> Terminated
//
// Once the server is confirmed gone, the current and all remaining steps are
// recorded as ProcessExited and nothing more is written to it.

#include "stdioprobe/framing/request_framer.hpp"
#include "stdioprobe/probe/probe_outcome.hpp"
#include "stdioprobe/probe/probe_script.hpp"
#include "stdioprobe/process/process_handle.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace stdioprobe {

struct ProbeOptions {
    /// Per-step wait for a response
    std::chrono::milliseconds response_timeout{std::chrono::seconds(10)};

    /// Liveness wait right after launch; also bounds the exit check after
    /// stdout closes or a write fails
    std::chrono::milliseconds settle_timeout{std::chrono::seconds(1)};

    /// Total teardown wait before SIGKILL, covering the EOF window and SIGTERM
    std::chrono::milliseconds grace_period{std::chrono::seconds(2)};

    /// Upper bound for collecting residual output from the pipes
    std::chrono::milliseconds drain_timeout{std::chrono::milliseconds(500)};

    /// Skip (and record) server notifications that arrive before a response
    bool skip_notifications{true};

    /// Send notifications/initialized after a successful initialize
    bool send_initialized_notification{false};
};

enum class ProbeState {
    NotStarted,
    Launched,
    StepPending,
    StepComplete,
    Terminating,
    Terminated
};

[[nodiscard]] std::string_view to_string(ProbeState state) noexcept;

class ProbeOrchestrator {
public:
    explicit ProbeOrchestrator(ProbeOptions options = {});

    /// Launch the server described by `config` and run `script` against it
    [[nodiscard]] ProbeReport run(const LaunchConfig& config, const ProbeScript& script);

    /// Run `script` against an already launched process. Takes ownership and
    /// tears the process down before returning.
    [[nodiscard]] ProbeReport run(std::unique_ptr<IProcess> process, const ProbeScript& script);

    /// Run several scripts, each against a fresh process. Stops after the
    /// first launch error.
    [[nodiscard]] std::vector<ProbeReport> run_all(const LaunchConfig& config,
                                                   const std::vector<ProbeScript>& scripts);

    [[nodiscard]] ProbeState state() const noexcept { return state_; }
    [[nodiscard]] const ProbeOptions& options() const noexcept { return options_; }

private:
    void transition(ProbeState next);

    [[nodiscard]] ProbeOutcome run_step(IProcess& process,
                                        RequestFramer& framer,
                                        const JsonRpcRequest& request,
                                        ProbeReport& report);

    [[nodiscard]] ProbeOutcome await_response(IProcess& process,
                                              RequestFramer& framer,
                                              const JsonRpcRequest& request,
                                              ProbeReport& report);

    /// Drain what the dead server left behind and remember it for later steps
    [[nodiscard]] ProbeOutcome capture_exit(IProcess& process, std::string partial_stdout = {});

    void finish_handshake(RequestFramer& framer, const JsonRpcRequest& request,
                          const ProbeOutcome& outcome);

    ProbeOptions options_;
    ProbeState state_{ProbeState::NotStarted};
    std::optional<ProcessExited> exited_;
};

}  // namespace stdioprobe
