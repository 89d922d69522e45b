#include "cpe/executor.hpp"

#include "cpe/artifact_store.hpp"
#include "cpe/builder.hpp"
#include "cpe/console.hpp"
#include "cpe/filesystem.hpp"
#include "cpe/matrix.hpp"
#include "cpe/release.hpp"
#include "cpe/step_runner.hpp"
#include "cpe/trigger.hpp"
#include "cpe/utility.hpp"

#include <algorithm>
#if FF_cpe__profiling
#include <chrono>
#endif
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <print>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace caravel {

namespace {

bool transition(ExecutionContext &ctx, ContextState to) {
    if (!can_transition(ctx.state, to))
        return false;
    ctx.state = to;
    return true;
}

std::string dot_escape(std::string_view s) {
    std::string out;
    for (char c : s) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    return out;
}

std::string secret_token(const std::map<std::string, std::string> &secrets) {
    for (const char *key : {"CPE_TOKEN", "GITHUB_TOKEN"}) {
        if (auto it = secrets.find(key); it != secrets.end() && !it->second.empty())
            return it->second;
    }
    return {};
}

} // namespace

Executor::Executor(PipelineBuilder &&builder, const ExecutorConfig &config, ServiceOverrides overrides)
    : builder(std::move(builder)), config(config), overrides(overrides) {
    register_builtin_actions(actions);
}

Result<uint64_t> Executor::resolve_run_number() const {
    if (config.run_number.has_value())
        return *config.run_number;

    const auto counter = config.state_dir / "run_number";
    if (!config.dry_run)
        return next_run_number(counter);

    // A dry run previews the next number without consuming it.
    uint64_t current = 0;
    std::ifstream in(counter);
    if (in && !(in >> current))
        return std::unexpected(std::format("Corrupt run counter: {}", counter.string()));
    return current + 1;
}

Result<void> Executor::clean() {
    std::println("Cleaning pipeline workspace...");
    std::error_code ec;
    if (!std::filesystem::exists(config.workspace_dir, ec))
        return {};
    std::filesystem::remove_all(config.workspace_dir, ec);
    if (ec)
        return std::unexpected(std::format("Failed to remove {}: {}", config.workspace_dir.string(), ec.message()));
    std::println("Removed {}", config.workspace_dir.string());
    return {};
}

Result<void> Executor::emit_graph(std::ostream &out) {
    const JobGraph &graph = builder.graph();

    ExprContext expr;
    bind_event(expr, config.event, config.run_number.value_or(0));
    expr.set_scope("env", builder.env());

    out << "digraph cpe_pipeline {\n";
    out << "  rankdir=LR;\n";
    out << "  node [shape=box, style=filled, fontname=\"Helvetica\"];\n";

    for (size_t i = 0; i < graph.nodes().size(); ++i) {
        const auto &node = graph.nodes()[i];
        std::string color = "0.9 0.9 0.9"; // light gray for jobs the event does not reach
        std::string label = dot_escape(node.name);

        if (node.job_id.has_value()) {
            const Job &job = graph.jobs()[*node.job_id];
            auto triggered = job_triggered(builder.trigger(), job, config.event, expr);
            if (!triggered)
                return std::unexpected(triggered.error());
            if (*triggered)
                color = "green";
            for (const auto &assignment : expand_matrix(job.matrix)) {
                if (!assignment.empty())
                    label += "\\n" + dot_escape(context_name(job.name, assignment));
            }
        }

        out << "  n" << i << " [label=\"" << label << "\", fillcolor=\"" << color << "\"];\n";

        for (size_t target_idx : node.out_edges) {
            out << "  n" << i << " -> n" << target_idx << ";\n";
        }
    }
    out << "}\n";
    return {};
}

Result<void> Executor::emit_report(const RunReport &report, const std::filesystem::path &path) const {
    using json = nlohmann::ordered_json;
    json doc;
    doc["pipeline"] = report.pipeline;
    doc["run_number"] = report.run_number;
    doc["event"] = {{"name", std::string(to_string(report.event.kind))}, {"branch", report.event.branch}};
    doc["status"] = report.succeeded ? "succeeded" : "failed";

    json contexts = json::array();
    for (const auto &ctx : report.contexts) {
        json entry;
        entry["job"] = report.job_names[ctx.job_id];
        entry["name"] = ctx.name;
        json matrix = json::object();
        for (const auto &[axis, value] : ctx.matrix)
            matrix[axis] = value;
        entry["matrix"] = matrix;
        entry["state"] = std::string(to_string(ctx.state));
        entry["work_dir"] = ctx.work_dir.string();

        json steps = json::array();
        for (const auto &step : ctx.steps) {
            json s;
            s["name"] = step.name;
            s["status"] = std::string(to_string(step.status));
            s["exit_code"] = step.exit_code;
            if (!step.error.empty())
                s["error"] = step.error;
            steps.push_back(s);
        }
        entry["steps"] = steps;
        contexts.push_back(entry);
    }
    doc["contexts"] = contexts;

    std::ofstream f(path);
    f << doc.dump(4);
    if (!f)
        return std::unexpected(std::format("Failed to write report {}", path.string()));
    return {};
}

Result<RunReport> Executor::execute() {
    pool.clear(); // Ensure clean state

    const JobGraph &graph = builder.graph();
    const auto &jobs = graph.jobs();

    std::vector<size_t> order;
    if (auto res = graph.topo_sort(); !res) {
        return std::unexpected(res.error());
    } else {
        order = *res;
    }

    // Steps run with their work dir as cwd, so every path they are handed is absolute.
    for (auto *dir : {&config.source_dir, &config.workspace_dir, &config.state_dir}) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(*dir, ec);
        if (ec)
            return std::unexpected(std::format("Failed to resolve {}: {}", dir->string(), ec.message()));
        *dir = std::move(absolute);
    }

    auto run_number = resolve_run_number();
    if (!run_number)
        return std::unexpected(run_number.error());

    RunEnvironment env;
    env.run_number = *run_number;
    env.event = config.event;
    env.pipeline_env = builder.env();
    env.source_dir = config.source_dir;
    env.run_dir = config.workspace_dir / std::to_string(*run_number);
    env.checkout_skip = {config.workspace_dir, config.state_dir};
    env.dry_run = config.dry_run;
    bind_event(env.base, config.event, *run_number);
    env.base.set_scope("secrets", config.secrets);
    env.base.set_scope("env", builder.env());

    if (!config.dry_run) {
        std::error_code ec;
        std::filesystem::create_directories(env.run_dir, ec);
        if (ec)
            return std::unexpected(std::format("Failed to create {}: {}", env.run_dir.string(), ec.message()));
    }

    RunReport report;
    report.pipeline = builder.name();
    report.run_number = *run_number;
    report.event = config.event;
    for (const auto &job : jobs)
        report.job_names.push_back(job.name);

    // Plan: trigger evaluation and matrix expansion happen before anything runs.
    std::vector<ExecutionContext> contexts;
    std::vector<std::vector<size_t>> job_contexts(jobs.size());
    std::vector<bool> job_skipped(jobs.size(), false);
    std::set<std::string> slugs;

    for (size_t job_id : order) {
        const Job &job = jobs[job_id];
        auto triggered = job_triggered(builder.trigger(), job, config.event, env.base);
        if (!triggered)
            return std::unexpected(triggered.error());

        bool skipped = !*triggered;
        for (size_t dep : graph.dependencies(job_id)) {
            if (job_skipped[dep])
                skipped = true;
        }
        job_skipped[job_id] = skipped;

        size_t ordinal = 0;
        for (auto &assignment : expand_matrix(job.matrix)) {
            std::string slug = context_slug(job.name, assignment);
            for (size_t n = 2; slugs.contains(slug); ++n)
                slug = std::format("{}-{}", context_slug(job.name, assignment), n);
            slugs.insert(slug);

            ExecutionContext ctx{job_id, ordinal++, assignment, context_name(job.name, assignment),
                                 env.run_dir / slug, ContextState::Pending, {}};
            if (skipped)
                transition(ctx, ContextState::Skipped);
            job_contexts[job_id].push_back(contexts.size());
            contexts.push_back(std::move(ctx));
        }
    }

    // Collaborators not injected by the caller.
    std::unique_ptr<ArtifactStore> own_artifacts;
    std::unique_ptr<TagService> own_tags;
    std::unique_ptr<ReleaseService> own_releases;
    std::unique_ptr<FileSystem> own_fs;
    ArtifactStore *artifacts = overrides.artifacts;
    TagService *tags = overrides.tags;
    ReleaseService *releases = overrides.releases;
    FileSystem *fs = overrides.fs;
    if (artifacts == nullptr) {
        own_artifacts = std::make_unique<LocalArtifactStore>(config.state_dir / "artifacts", *run_number);
        artifacts = own_artifacts.get();
    }
    if (tags == nullptr) {
        own_tags = std::make_unique<GitTagService>(config.remote, secret_token(config.secrets), config.push_tags);
        tags = own_tags.get();
    }
    if (releases == nullptr) {
        own_releases = std::make_unique<LocalReleaseService>(config.state_dir / "releases");
        releases = own_releases.get();
    }
    if (fs == nullptr) {
        own_fs = std::make_unique<RealFileSystem>();
        fs = own_fs.get();
    }
    Services services{*artifacts, *tags, *releases, *fs};

    Console console(env.base.secret_values());
    StepRunner runner(env, actions, services, console);

    if (config.dry_run)
        console.info(std::format("[DRY RUN] {} #{} on {} {}", report.pipeline, *run_number,
                                 to_string(config.event.kind), config.event.branch));

    // Scheduling state, guarded by mtx.
    std::mutex mtx;
    std::condition_variable cv_ready;
    std::deque<size_t> ready_queue;
    size_t active_workers = 0;
    size_t started = 0;

    std::vector<size_t> remaining_deps(jobs.size(), 0);
    std::vector<size_t> remaining_contexts(jobs.size(), 0);
    std::vector<bool> job_failed(jobs.size(), false);
    std::vector<bool> job_blocked(jobs.size(), false);
    std::vector<bool> job_admitted(jobs.size(), false);
    std::vector<std::vector<size_t>> dependents(jobs.size());
    size_t total_runnable = 0;

    for (size_t job_id = 0; job_id < jobs.size(); ++job_id) {
        auto deps = graph.dependencies(job_id);
        remaining_deps[job_id] = deps.size();
        for (size_t dep : deps)
            dependents[dep].push_back(job_id);
        if (!job_skipped[job_id]) {
            remaining_contexts[job_id] = job_contexts[job_id].size();
            total_runnable += job_contexts[job_id].size();
        }
    }

    std::function<void(size_t)> block = [&](size_t job_id) {
        if (job_blocked[job_id])
            return;
        job_blocked[job_id] = true;
        for (size_t dependent : dependents[job_id])
            block(dependent);
    };

    std::function<void(size_t)> admit;
    std::function<void(size_t)> complete_job = [&](size_t job_id) {
        for (size_t dependent : dependents[job_id]) {
            if (job_skipped[dependent])
                continue;
            if (job_failed[job_id] || job_blocked[job_id]) {
                block(dependent);
            } else if (--remaining_deps[dependent] == 0 && !job_blocked[dependent]) {
                admit(dependent);
            }
        }
    };
    admit = [&](size_t job_id) {
        if (job_admitted[job_id])
            return;
        job_admitted[job_id] = true;
        if (remaining_contexts[job_id] == 0) {
            complete_job(job_id);
            return;
        }
        for (size_t idx : job_contexts[job_id])
            ready_queue.push_back(idx);
    };

    for (size_t job_id : order) {
        if (!job_skipped[job_id] && remaining_deps[job_id] == 0)
            admit(job_id);
    }

    auto worker = [&]() {
        while (true) {
            size_t idx;
            size_t position;
            {
                std::unique_lock lock(mtx);
                cv_ready.wait(lock, [&] { return !ready_queue.empty() || active_workers == 0; });

                if (ready_queue.empty()) {
                    // Nothing queued and nothing running: remaining contexts are blocked.
                    cv_ready.notify_all();
                    return;
                }

                idx = ready_queue.front();
                ready_queue.pop_front();
                active_workers++;
                position = ++started;
                if (!transition(contexts[idx], ContextState::Running))
                    console.error(std::format("{}: cannot start from state {}", contexts[idx].name,
                                              to_string(contexts[idx].state)));
            }

            ExecutionContext &ctx = contexts[idx];
            const Job &job = jobs[ctx.job_id];
            console.progress(position, total_runnable, job.name, ctx.name);

#if FF_cpe__profiling
            auto start = std::chrono::steady_clock::now();
#endif
            ContextState result = runner.run(job, ctx);
#if FF_cpe__profiling
            auto end = std::chrono::steady_clock::now();
            std::chrono::duration<double> diff = end - start;
            console.info(std::format("Context {} took {:.4f}s", ctx.name, diff.count()));
#endif

            {
                std::lock_guard lock(mtx);
                active_workers--;
                if (!transition(ctx, result))
                    console.error(std::format("{}: cannot finish as {}", ctx.name, to_string(result)));
                if (result == ContextState::Failed)
                    job_failed[ctx.job_id] = true;
                if (--remaining_contexts[ctx.job_id] == 0)
                    complete_job(ctx.job_id);
            }
            cv_ready.notify_all();
        }
    };

    size_t thread_count = config.jobs;
    if (thread_count == 0)
        thread_count = std::thread::hardware_concurrency();
    if (thread_count == 0)
        thread_count = 1;
    thread_count = std::min(thread_count, std::max<size_t>(total_runnable, 1));

    for (size_t i = 0; i < thread_count; ++i) {
        pool.emplace_back(worker);
    }

    pool.clear(); // Join all threads

    size_t succeeded = 0, failed = 0, skipped = 0, pending = 0;
    for (const auto &ctx : contexts) {
        switch (ctx.state) {
        case ContextState::Succeeded:
            ++succeeded;
            break;
        case ContextState::Failed:
            ++failed;
            break;
        case ContextState::Skipped:
            ++skipped;
            break;
        default:
            ++pending;
            break;
        }
    }
    report.succeeded = failed == 0;
    report.contexts = std::move(contexts);

    console.info(std::format("{} #{}: {} ({} succeeded, {} failed, {} skipped, {} not started)", report.pipeline,
                             report.run_number, report.succeeded ? "succeeded" : "failed", succeeded, failed,
                             skipped, pending));
    return report;
}

} // namespace caravel
