#include "stdioprobe/probe/probe_outcome.hpp"

#include <algorithm>

namespace stdioprobe {

static_assert(std::variant_size_v<ProbeOutcome> == 5);

// ProbeOutcome alternatives are declared in OutcomeKind order
OutcomeKind kind_of(const ProbeOutcome& outcome) noexcept {
    return static_cast<OutcomeKind>(outcome.index());
}

std::string_view to_string(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Success:       return "Success";
        case OutcomeKind::Timeout:       return "Timeout";
        case OutcomeKind::ProcessExited: return "ProcessExited";
        case OutcomeKind::DecodeError:   return "DecodeError";
        case OutcomeKind::WriteError:    return "WriteError";
    }
    return "Unknown";
}

bool ProbeReport::passed() const noexcept {
    if (launch_error.has_value()) {
        return false;
    }
    return std::all_of(steps.begin(), steps.end(), [](const StepResult& step) {
        return step.kind() == OutcomeKind::Success;
    });
}

}  // namespace stdioprobe
