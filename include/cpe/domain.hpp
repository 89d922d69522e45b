#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace caravel {

enum class EventKind : uint8_t { Push, PullRequest, Unknown };

struct Event {
    EventKind kind = EventKind::Unknown;
    std::string branch;
};

// Unrecognised names map to EventKind::Unknown, never an error.
EventKind parse_event_kind(std::string_view name);
std::string_view to_string(EventKind kind);

using Environment = std::map<std::string, std::string>;
using Inputs = std::map<std::string, std::string>;

struct ShellAction {
    std::string script;
    std::string shell; // "sh" or "bash"
};

struct ExternalAction {
    std::string uses; // e.g. "upload-artifact@v4"
    Inputs with;
};

struct Step {
    std::string name;
    std::optional<std::string> guard; // `if` expression
    std::variant<ShellAction, ExternalAction> action;
    Environment env;
};

struct MatrixAxis {
    std::string name;
    std::vector<std::string> values;
};

using Matrix = std::vector<MatrixAxis>; // declaration order
using MatrixAssignment = std::vector<std::pair<std::string, std::string>>;

struct Job {
    std::string name;
    std::optional<std::string> condition; // `if` expression
    std::string runs_on;
    Matrix matrix;
    Environment env;
    std::vector<Step> steps;
    std::vector<std::string> needs;
};

enum class ContextState : uint8_t { Pending, Running, Succeeded, Failed, Skipped };

constexpr bool is_terminal(ContextState state) {
    return state == ContextState::Succeeded || state == ContextState::Failed || state == ContextState::Skipped;
}

constexpr bool can_transition(ContextState from, ContextState to) {
    switch (from) {
    case ContextState::Pending:
        return to == ContextState::Running || to == ContextState::Skipped;
    case ContextState::Running:
        return to == ContextState::Succeeded || to == ContextState::Failed;
    default:
        return false;
    }
}

std::string_view to_string(ContextState state);

enum class StepStatus : uint8_t { Succeeded, Failed, Skipped };

struct StepRecord {
    std::string name;
    StepStatus status = StepStatus::Skipped;
    int exit_code = 0;
    std::string error;
};

struct ExecutionContext {
    size_t job_id;
    size_t ordinal; // position within the job's expansion
    MatrixAssignment matrix;
    std::string name;
    std::filesystem::path work_dir;
    ContextState state = ContextState::Pending;
    std::vector<StepRecord> steps;
};

std::string_view to_string(StepStatus status);

} // namespace caravel
