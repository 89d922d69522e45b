#pragma once

#include "cpe/actions.hpp"
#include "cpe/console.hpp"
#include "cpe/domain.hpp"
#include "cpe/expression.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace caravel {

// Read-only during a run; shared by all workers.
struct RunEnvironment {
    uint64_t run_number = 0;
    Event event;
    Environment pipeline_env;
    ExprContext base; // github, secrets
    std::filesystem::path source_dir;
    std::filesystem::path run_dir; // per-run workspace root
    std::vector<std::filesystem::path> checkout_skip;
    bool dry_run = false;
};

// "Linux", "macOS" or "Windows" for a runs-on label.
std::string runner_os(std::string_view label);

/**
 * @brief Runs the steps of one ExecutionContext in order.
 *
 * A false guard skips the step. The first failing step (non-zero exit, failed
 * action, bad expression) fails the context and no further steps run. Returns the
 * terminal state; the caller owns the Running transition.
 */
class StepRunner {
public:
    StepRunner(const RunEnvironment &env, const ActionRegistry &actions, Services &services, Console &console)
        : env_(env), actions_(actions), services_(services), console_(console) {
    }

    ContextState run(const Job &job, ExecutionContext &ctx);

private:
    // Extra CPE_*/CI variables for a context.
    Environment runner_variables(const Job &job, const ExecutionContext &ctx, const std::string &os) const;
    bool run_shell(const ShellAction &action, const Environment &env, ExecutionContext &ctx, StepRecord &record,
                   const ExprContext &expr);
    bool run_action(const ExternalAction &action, Environment &exports, ExecutionContext &ctx, StepRecord &record,
                    const ExprContext &expr);
    void load_env_file(const std::filesystem::path &path, Environment &exports, ExecutionContext &ctx);

    const RunEnvironment &env_;
    const ActionRegistry &actions_;
    Services &services_;
    Console &console_;
};

} // namespace caravel
