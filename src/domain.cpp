#include "cpe/domain.hpp"

namespace caravel {

EventKind parse_event_kind(std::string_view name) {
    if (name == "push")
        return EventKind::Push;
    if (name == "pull_request")
        return EventKind::PullRequest;
    return EventKind::Unknown;
}

std::string_view to_string(EventKind kind) {
    switch (kind) {
    case EventKind::Push:
        return "push";
    case EventKind::PullRequest:
        return "pull_request";
    case EventKind::Unknown:
        break;
    }
    return "unknown";
}

std::string_view to_string(ContextState state) {
    switch (state) {
    case ContextState::Pending:
        return "pending";
    case ContextState::Running:
        return "running";
    case ContextState::Succeeded:
        return "succeeded";
    case ContextState::Failed:
        return "failed";
    case ContextState::Skipped:
        return "skipped";
    }
    return "unknown";
}

std::string_view to_string(StepStatus status) {
    switch (status) {
    case StepStatus::Succeeded:
        return "succeeded";
    case StepStatus::Failed:
        return "failed";
    case StepStatus::Skipped:
        return "skipped";
    }
    return "unknown";
}

} // namespace caravel
