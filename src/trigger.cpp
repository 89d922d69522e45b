#include "cpe/trigger.hpp"

#include "cpe/filesystem.hpp"

#include <format>
#include <string>

namespace caravel {

bool matches(const TriggerFilter &filter, const Event &event) {
    if (event.kind == EventKind::Unknown)
        return false;

    auto it = filter.filters.find(event.kind);
    if (it == filter.filters.end())
        return false;

    const auto &branches = it->second;
    if (!branches.has_value())
        return true;
    for (const auto &pattern : *branches) {
        if (glob_match(pattern, event.branch))
            return true;
    }
    return false;
}

void bind_event(ExprContext &ctx, const Event &event, uint64_t run_number) {
    ctx.set("github", "event_name", std::string(to_string(event.kind)));
    ctx.set("github", "ref_name", event.branch);
    ctx.set("github", "ref", event.branch.empty() ? std::string() : std::format("refs/heads/{}", event.branch));
    ctx.set("github", "run_number", std::to_string(run_number));
}

Result<bool> job_triggered(const TriggerFilter &filter, const Job &job, const Event &event,
                           const ExprContext &ctx) {
    if (!matches(filter, event))
        return false;
    if (!job.condition.has_value())
        return true;

    auto res = evaluate_condition(*job.condition, ctx);
    if (!res)
        return std::unexpected(std::format("Job '{}': {}", job.name, res.error()));
    return *res;
}

} // namespace caravel
