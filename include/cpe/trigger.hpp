#pragma once

#include "cpe/domain.hpp"
#include "cpe/expression.hpp"
#include "cpe/utility.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace caravel {

// Pipeline-level `on` block. An event kind absent from `filters` never triggers.
struct TriggerFilter {
    // nullopt: no branch filter, any branch matches
    std::map<EventKind, std::optional<std::vector<std::string>>> filters;

    void allow(EventKind kind, std::optional<std::vector<std::string>> branches = std::nullopt) {
        filters.insert_or_assign(kind, std::move(branches));
    }
};

bool matches(const TriggerFilter &filter, const Event &event);

// Seeds the `github` scope (event_name, ref, ref_name, run_number) from an event.
void bind_event(ExprContext &ctx, const Event &event, uint64_t run_number);

/**
 * @brief Decides whether a job runs for an event.
 *
 * The pipeline filter is consulted first, then the job's own `if` condition.
 * Returns false (job Skipped) on a mismatch; an error only for a malformed condition.
 */
Result<bool> job_triggered(const TriggerFilter &filter, const Job &job, const Event &event, const ExprContext &ctx);

} // namespace caravel
