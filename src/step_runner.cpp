#include "cpe/step_runner.hpp"

#include "cpe/process_exec.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <string>
#include <system_error>
#include <variant>

namespace caravel {

namespace fs = std::filesystem;

std::string runner_os(std::string_view label) {
    std::string lower(label);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.find("windows") != std::string::npos)
        return "Windows";
    if (lower.find("macos") != std::string::npos || lower.find("osx") != std::string::npos)
        return "macOS";
    return "Linux";
}

namespace {

Result<Environment> interpolate_env(const Environment &env, const ExprContext &expr) {
    Environment out;
    for (const auto &[key, value] : env) {
        auto res = interpolate(value, expr);
        if (!res)
            return std::unexpected(std::format("env.{}: {}", key, res.error()));
        out.emplace(key, std::move(*res));
    }
    return out;
}

std::vector<std::string> process_env(const std::vector<const Environment *> &layers) {
    Environment merged;
    for (const auto &entry : current_environment()) {
        auto eq = entry.find('=');
        if (eq != std::string::npos && eq != 0)
            merged.insert_or_assign(entry.substr(0, eq), entry.substr(eq + 1));
    }
    for (const auto *layer : layers) {
        for (const auto &[key, value] : *layer)
            merged.insert_or_assign(key, value);
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto &[key, value] : merged)
        out.push_back(key + "=" + value);
    return out;
}

} // namespace

Environment StepRunner::runner_variables(const Job &job, const ExecutionContext &ctx, const std::string &os) const {
    return {
        {"CI", "true"},
        {"CPE_EVENT_NAME", std::string(to_string(env_.event.kind))},
        {"CPE_REF_NAME", env_.event.branch},
        {"CPE_JOB", job.name},
        {"CPE_RUN_NUMBER", std::to_string(env_.run_number)},
        {"CPE_WORKSPACE", ctx.work_dir.string()},
        {"RUNNER_OS", os},
    };
}

ContextState StepRunner::run(const Job &job, ExecutionContext &ctx) {
    ExprContext expr = env_.base;
    for (const auto &[axis, value] : ctx.matrix)
        expr.set("matrix", axis, value);

    auto fail_setup = [&](const std::string &message) {
        ctx.steps.push_back({"Set up job", StepStatus::Failed, 0, message});
        console_.error(std::format("{}: {}", ctx.name, message));
        return ContextState::Failed;
    };

    auto label = interpolate(job.runs_on, expr);
    if (!label)
        return fail_setup(std::format("runs-on: {}", label.error()));
    const std::string os = runner_os(*label);
    expr.set("runner", "os", os);
    expr.set("runner", "name", *label);

    auto pipeline_env = interpolate_env(env_.pipeline_env, expr);
    if (!pipeline_env)
        return fail_setup(pipeline_env.error());
    expr.set_scope("env", *pipeline_env);
    auto job_env = interpolate_env(job.env, expr);
    if (!job_env)
        return fail_setup(job_env.error());
    expr.set_scope("env", *job_env);

    if (!env_.dry_run) {
        std::error_code ec;
        fs::create_directories(ctx.work_dir, ec);
        if (ec)
            return fail_setup(std::format("Failed to create {}: {}", ctx.work_dir.string(), ec.message()));
    }

    const Environment runner_vars = runner_variables(job, ctx, os);
    Environment exports;

    for (const auto &step : job.steps) {
        StepRecord record;
        auto display = interpolate(step.name, expr);
        record.name = display ? *display : step.name;

        ExprContext step_expr = expr;
        step_expr.set_scope("env", exports);

        if (step.guard.has_value()) {
            auto admitted = evaluate_condition(*step.guard, step_expr);
            if (!admitted) {
                record.status = StepStatus::Failed;
                record.error = std::format("if: {}", admitted.error());
                console_.error(std::format("{}: {}: {}", ctx.name, record.name, record.error));
                ctx.steps.push_back(std::move(record));
                return ContextState::Failed;
            }
            if (!*admitted) {
#if FF_cpe__logging
                console_.info(std::format("  {}: skipping '{}' (condition false)", ctx.name, record.name));
#endif
                record.status = StepStatus::Skipped;
                ctx.steps.push_back(std::move(record));
                continue;
            }
        }

        console_.step(ctx.name, record.name);
        if (env_.dry_run) {
            record.status = StepStatus::Skipped;
            ctx.steps.push_back(std::move(record));
            continue;
        }

        auto step_env = interpolate_env(step.env, step_expr);
        if (!step_env) {
            record.status = StepStatus::Failed;
            record.error = step_env.error();
            console_.error(std::format("{}: {}: {}", ctx.name, record.name, record.error));
            ctx.steps.push_back(std::move(record));
            return ContextState::Failed;
        }
        step_expr.set_scope("env", *step_env);

        bool ok = false;
        if (const auto *shell = std::get_if<ShellAction>(&step.action)) {
            Environment env = runner_vars;
            for (const auto *layer : {&*pipeline_env, &*job_env, &exports, &*step_env}) {
                for (const auto &[key, value] : *layer)
                    env.insert_or_assign(key, value);
            }
            ok = run_shell(*shell, env, ctx, record, step_expr);
            if (ok) {
                load_env_file(env_.run_dir / (ctx.work_dir.filename().string() + ".env"), exports, ctx);
            }
        } else {
            ok = run_action(std::get<ExternalAction>(step.action), exports, ctx, record, step_expr);
        }

        if (!ok) {
            record.status = StepStatus::Failed;
            ctx.steps.push_back(std::move(record));
            return ContextState::Failed;
        }
        record.status = StepStatus::Succeeded;
        ctx.steps.push_back(std::move(record));
    }
    return ContextState::Succeeded;
}

bool StepRunner::run_shell(const ShellAction &action, const Environment &env, ExecutionContext &ctx,
                           StepRecord &record, const ExprContext &expr) {
    auto script = interpolate(action.script, expr);
    if (!script) {
        record.error = script.error();
        console_.error(std::format("{}: {}: {}", ctx.name, record.name, record.error));
        return false;
    }

    // Steps append KEY=VALUE lines here to export variables to later steps.
    const fs::path env_file = env_.run_dir / (ctx.work_dir.filename().string() + ".env");
    {
        std::ofstream truncate(env_file, std::ios::trunc);
    }
    Environment full_env = env;
    full_env.insert_or_assign("CPE_ENV", env_file.string());

    std::vector<std::string> args;
    if (action.shell == "bash")
        args = {"bash", "--noprofile", "--norc", "-eo", "pipefail", "-c", *script};
    else
        args = {"sh", "-e", "-c", *script};

    ProcessOptions options;
    options.cwd = ctx.work_dir;
    options.env = process_env({&full_env});
    options.on_line = [&](std::string_view line) { console_.output(ctx.name, line); };

    auto res = process_exec(std::move(args), options);
    if (!res) {
        record.exit_code = -1;
        record.error = std::format("Failed to execute: {}", res.error());
        console_.error(std::format("{}: {}: {}", ctx.name, record.name, record.error));
        return false;
    }
    record.exit_code = *res;
    if (*res != 0) {
        record.error = std::format("Process completed with exit code {}", *res);
        console_.error(std::format("Step failed: {} -> {} (exit code {})", ctx.name, record.name, *res));
        return false;
    }
    return true;
}

bool StepRunner::run_action(const ExternalAction &action, Environment &exports, ExecutionContext &ctx,
                            StepRecord &record, const ExprContext &expr) {
    const ActionHandler *handler = actions_.find(action.uses);
    if (handler == nullptr) {
        record.error = std::format("{}: unknown action '{}'", to_string(ErrorKind::StepExecution), action.uses);
        console_.error(std::format("{}: {}", ctx.name, record.error));
        return false;
    }

    Inputs with;
    for (const auto &[key, value] : action.with) {
        auto res = interpolate(value, expr);
        if (!res) {
            record.error = std::format("with.{}: {}", key, res.error());
            console_.error(std::format("{}: {}: {}", ctx.name, record.name, record.error));
            return false;
        }
        with.emplace(key, std::move(*res));
    }

    ActionCall call{ctx,
                    with,
                    exports,
                    services_,
                    env_.source_dir,
                    env_.checkout_skip,
                    env_.run_number,
                    [&](std::string_view line) { console_.output(ctx.name, line); }};
    auto res = (*handler)(call);
    if (!res) {
        record.error = std::format("{}: {}", to_string(res.error().kind), res.error().message);
        console_.error(std::format("{}: {}: {}", ctx.name, record.name, record.error));
        return false;
    }
    return true;
}

void StepRunner::load_env_file(const fs::path &path, Environment &exports, ExecutionContext &ctx) {
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        auto eq = line.find('=');
        if (line.empty() || eq == std::string::npos || eq == 0) {
            if (!line.empty())
                console_.output(ctx.name, std::format("warning: ignoring malformed CPE_ENV line '{}'", line));
            continue;
        }
        exports.insert_or_assign(line.substr(0, eq), line.substr(eq + 1));
    }
}

} // namespace caravel
