#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "cpe/builder.hpp"
#include "cpe/executor.hpp"
#include "cpe/expression.hpp"
#include "cpe/parser.hpp"

#include <filesystem>
#include <sstream>

using namespace caravel;

namespace {

// Mirrors a typical package workflow: a build matrix uploads one artifact per
// Python version, release tags and publishes them on pushes to main.
constexpr const char *package_pipeline = R"({
    "name": "ci",
    "on": {
        "push": { "branches": ["main"] },
        "pull_request": {}
    },
    "jobs": {
        "build": {
            "runs-on": "${{ matrix.os }}",
            "strategy": {
                "matrix": {
                    "os": ["ubuntu-latest"],
                    "python-version": ["3.11", "3.12"]
                }
            },
            "steps": [
                { "uses": "actions/checkout@v4" },
                { "uses": "actions/setup-python@v5", "with": { "python-version": "${{ matrix.python-version }}" } },
                { "name": "Build", "run": "sh ./build.sh" },
                {
                    "uses": "actions/upload-artifact@v4",
                    "with": { "name": "dist-${{ matrix.python-version }}", "path": "dist/" }
                }
            ]
        },
        "release": {
            "needs": "build",
            "if": "${{ github.event_name == 'push' && github.ref_name == 'main' }}",
            "runs-on": "ubuntu-latest",
            "steps": [
                { "uses": "actions/download-artifact@v4", "with": { "path": "dist" } },
                { "uses": "create-tag", "with": { "tag": "v${{ github.run_number }}" } },
                {
                    "uses": "create-release",
                    "with": {
                        "tag": "v${{ github.run_number }}",
                        "title": "Release v${{ github.run_number }}",
                        "files": "dist/*/*.txt"
                    }
                }
            ]
        },
        "notify": {
            "needs": ["release"],
            "steps": [ { "run": "echo released $CPE_RUN_NUMBER" } ]
        }
    }
})";

constexpr const char *build_ok = R"(set -e
mkdir -p dist
echo "$PYTHON_VERSION" > "dist/pkg-$PYTHON_VERSION.txt"
test "$RUNNER_OS" = Linux
)";

constexpr const char *build_fails_on_312 = R"(set -e
mkdir -p dist
echo "$PYTHON_VERSION" > "dist/pkg-$PYTHON_VERSION.txt"
test "$PYTHON_VERSION" != 3.12
)";

ExecutorConfig scratch_config(const ScratchDir &dir, Event event) {
    ExecutorConfig config;
    config.event = std::move(event);
    config.run_number = 42;
    config.source_dir = dir / "src";
    config.workspace_dir = dir / "work";
    config.state_dir = dir / "state";
    config.jobs = 2;
    return config;
}

Result<RunReport> run_pipeline(const char *pipeline, const ExecutorConfig &config, FakeTagService &tags,
                               FakeReleaseService &releases) {
    PipelineBuilder builder;
    if (auto res = parse_string(builder, pipeline); !res)
        return std::unexpected(res.error());

    Executor executor(std::move(builder), config, {nullptr, &tags, &releases, nullptr});
    return executor.execute();
}

const ExecutionContext *find_context(const RunReport &report, std::string_view name) {
    for (const auto &ctx : report.contexts) {
        if (ctx.name == name)
            return &ctx;
    }
    return nullptr;
}

bool context_in(const RunReport &report, std::string_view name, ContextState state) {
    const auto *ctx = find_context(report, name);
    if (ctx == nullptr) {
        std::println(std::cerr, "no context named '{}'", name);
        return false;
    }
    if (ctx->state != state) {
        std::println(std::cerr, "context '{}' is {}, expected {}", name, to_string(ctx->state), to_string(state));
        return false;
    }
    return true;
}

// Switches the process into `dir` for the lifetime of the object.
class WorkingDir {
public:
    explicit WorkingDir(const std::filesystem::path &dir) : previous_(std::filesystem::current_path()) {
        std::filesystem::current_path(dir);
    }
    ~WorkingDir() {
        std::error_code ec;
        std::filesystem::current_path(previous_, ec);
    }

    WorkingDir(const WorkingDir &) = delete;
    WorkingDir &operator=(const WorkingDir &) = delete;

private:
    std::filesystem::path previous_;
};

} // namespace

bool integration_test() {
    std::println("Starting Integration Test...");
    ScratchDir dir("integration");
    create_file(dir / "src/build.sh", build_ok);
    create_file(dir / "src/README.md", "package");

    FakeTagService tags;
    FakeReleaseService releases;
    const auto config = scratch_config(dir, {EventKind::Push, "main"});
    auto report = run_pipeline(package_pipeline, config, tags, releases);
    if (!report) {
        std::println(std::cerr, "Execution failed: {}", report.error());
        return false;
    }

    EXPECT(report->succeeded);
    EXPECT(report->pipeline == "ci");
    EXPECT(report->run_number == 42);
    EXPECT(report->contexts.size() == 4);
    EXPECT(report->contexts[0].name == "build (ubuntu-latest, 3.11)");
    EXPECT(report->contexts[1].name == "build (ubuntu-latest, 3.12)");
    EXPECT(context_in(*report, "build (ubuntu-latest, 3.11)", ContextState::Succeeded));
    EXPECT(context_in(*report, "build (ubuntu-latest, 3.12)", ContextState::Succeeded));
    EXPECT(context_in(*report, "release", ContextState::Succeeded));
    EXPECT(context_in(*report, "notify", ContextState::Succeeded));

    for (const auto &ctx : report->contexts) {
        for (const auto &step : ctx.steps)
            EXPECT(step.status == StepStatus::Succeeded);
    }

    EXPECT(tags.tags == std::vector<std::string>{"v42"});
    auto release = releases.find("v42");
    EXPECT(release.has_value());
    EXPECT(release->title == "Release v42");
    EXPECT((release->assets == std::vector<std::string>{"pkg-3.11.txt", "pkg-3.12.txt"}));

    EXPECT(std::filesystem::exists(dir / "state/artifacts/42/dist-3.11.json"));
    EXPECT(std::filesystem::exists(dir / "work/42/build-ubuntu-latest-3.12/README.md"));

    // The run report and graph describe the same run.
    PipelineBuilder builder;
    EXPECT(parse_string(builder, package_pipeline).has_value());
    Executor executor(std::move(builder), config);
    EXPECT(executor.emit_report(*report, dir / "report.json").has_value());
    const std::string json = read_file(dir / "report.json");
    EXPECT(json.find("\"status\": \"succeeded\"") != std::string::npos);
    EXPECT(json.find("\"python-version\": \"3.12\"") != std::string::npos);

    std::ostringstream dot;
    EXPECT(executor.emit_graph(dot).has_value());
    EXPECT(dot.str().starts_with("digraph"));
    EXPECT(dot.str().find("n0 -> n1") != std::string::npos);
    EXPECT(dot.str().find("build (ubuntu-latest, 3.11)") != std::string::npos);

    std::println("Test passed!");
    return true;
}

bool failed_context_test() {
    ScratchDir dir("failed-context");
    create_file(dir / "src/build.sh", build_fails_on_312);

    FakeTagService tags;
    FakeReleaseService releases;
    auto report = run_pipeline(package_pipeline, scratch_config(dir, {EventKind::Push, "main"}), tags, releases);
    if (!report) {
        std::println(std::cerr, "Execution failed: {}", report.error());
        return false;
    }

    EXPECT(!report->succeeded);
    EXPECT(context_in(*report, "build (ubuntu-latest, 3.11)", ContextState::Succeeded));
    EXPECT(context_in(*report, "build (ubuntu-latest, 3.12)", ContextState::Failed));
    // dependents of a failed job never start
    EXPECT(context_in(*report, "release", ContextState::Pending));
    EXPECT(context_in(*report, "notify", ContextState::Pending));
    EXPECT(tags.tags.empty());
    EXPECT(releases.releases.empty());

    // fail fast: the upload after the failing step never ran
    const auto *failed = find_context(*report, "build (ubuntu-latest, 3.12)");
    EXPECT(failed->steps.size() == 3);
    EXPECT(failed->steps.back().name == "Build");
    EXPECT(failed->steps.back().status == StepStatus::Failed);
    EXPECT(failed->steps.back().exit_code == 1);
    EXPECT(!failed->steps.back().error.empty());
    return true;
}

bool pull_request_test() {
    ScratchDir dir("pull-request");
    create_file(dir / "src/build.sh", build_ok);

    FakeTagService tags;
    FakeReleaseService releases;
    auto report =
        run_pipeline(package_pipeline, scratch_config(dir, {EventKind::PullRequest, "feature"}), tags, releases);
    if (!report) {
        std::println(std::cerr, "Execution failed: {}", report.error());
        return false;
    }

    EXPECT(report->succeeded);
    EXPECT(context_in(*report, "build (ubuntu-latest, 3.11)", ContextState::Succeeded));
    EXPECT(context_in(*report, "build (ubuntu-latest, 3.12)", ContextState::Succeeded));
    EXPECT(context_in(*report, "release", ContextState::Skipped));
    EXPECT(context_in(*report, "notify", ContextState::Skipped));
    EXPECT(tags.tags.empty());

    // A push to another branch is not in the trigger at all.
    ScratchDir other("push-dev");
    create_file(other / "src/build.sh", build_ok);
    auto dev = run_pipeline(package_pipeline, scratch_config(other, {EventKind::Push, "dev"}), tags, releases);
    EXPECT(dev.has_value());
    EXPECT(dev->succeeded);
    for (const auto &ctx : dev->contexts)
        EXPECT(ctx.state == ContextState::Skipped);

    // Unknown events fail closed.
    auto unknown = run_pipeline(package_pipeline, scratch_config(other, {EventKind::Unknown, "main"}), tags, releases);
    EXPECT(unknown.has_value());
    for (const auto &ctx : unknown->contexts)
        EXPECT(ctx.state == ContextState::Skipped);
    return true;
}

bool step_env_test() {
    constexpr const char *pipeline = R"({
        "on": "push",
        "env": { "GREETING": "hello" },
        "jobs": {
            "env": {
                "runs-on": "macos-latest",
                "env": { "TARGET": "${{ github.ref_name }}" },
                "steps": [
                    { "run": "echo \"FROM_STEP=$GREETING-$TARGET\" >> \"$CPE_ENV\"" },
                    { "name": "guarded", "if": "env.FROM_STEP == 'nope'", "run": "exit 1" },
                    {
                        "name": "check",
                        "shell": "bash",
                        "env": { "LEVEL": "step" },
                        "run": "test \"$FROM_STEP\" = hello-main && test \"$RUNNER_OS\" = macOS && test \"$LEVEL\" = step && test \"$CI\" = true"
                    },
                    { "name": "secret", "run": "test \"${{ secrets.TOKEN }}\" = hunter2" }
                ]
            }
        }
    })";

    ScratchDir dir("step-env");
    std::filesystem::create_directories(dir / "src");
    auto config = scratch_config(dir, {EventKind::Push, "main"});
    config.secrets = {{"TOKEN", "hunter2"}};

    FakeTagService tags;
    FakeReleaseService releases;
    auto report = run_pipeline(pipeline, config, tags, releases);
    if (!report) {
        std::println(std::cerr, "Execution failed: {}", report.error());
        return false;
    }

    EXPECT(report->succeeded);
    EXPECT(report->contexts.size() == 1);
    const auto &steps = report->contexts[0].steps;
    EXPECT(steps.size() == 4);
    EXPECT(steps[0].status == StepStatus::Succeeded);
    EXPECT(steps[1].name == "guarded");
    EXPECT(steps[1].status == StepStatus::Skipped);
    EXPECT(steps[2].status == StepStatus::Succeeded);
    EXPECT(steps[3].status == StepStatus::Succeeded);
    return true;
}

bool dry_run_test() {
    ScratchDir dir("dry-run");
    create_file(dir / "src/build.sh", build_fails_on_312);

    auto config = scratch_config(dir, {EventKind::Push, "main"});
    config.run_number.reset();
    config.dry_run = true;

    FakeTagService tags;
    FakeReleaseService releases;
    auto report = run_pipeline(package_pipeline, config, tags, releases);
    EXPECT(report.has_value());

    // previews the next number without consuming it
    EXPECT(report->run_number == 1);
    EXPECT(!std::filesystem::exists(dir / "state/run_number"));
    EXPECT(!std::filesystem::exists(dir / "work/1"));

    EXPECT(report->succeeded);
    for (const auto &ctx : report->contexts) {
        EXPECT(ctx.state == ContextState::Succeeded);
        for (const auto &step : ctx.steps)
            EXPECT(step.status == StepStatus::Skipped);
    }
    EXPECT(tags.tags.empty());
    return true;
}

bool relative_workspace_test() {
    constexpr const char *pipeline = R"({
        "on": "push",
        "jobs": {
            "export": {
                "steps": [
                    { "run": "echo FOO=bar >> \"$CPE_ENV\"" },
                    { "run": "test \"$FOO\" = bar && test -f \"$CPE_ENV\" && test -d \"$CPE_WORKSPACE\"" }
                ]
            }
        }
    })";

    ScratchDir dir("relative-workspace");

    // The defaults: source ".", workspace ".cpe/work", state ".cpe/state".
    ExecutorConfig config;
    config.event = {EventKind::Push, "main"};
    config.jobs = 1;

    FakeTagService tags;
    FakeReleaseService releases;
    Result<RunReport> report = std::unexpected("not run");
    {
        WorkingDir cwd(dir.path());
        PipelineBuilder builder;
        EXPECT(parse_string(builder, pipeline).has_value());
        Executor executor(std::move(builder), config, {nullptr, &tags, &releases, nullptr});
        report = executor.execute();
    }
    if (!report) {
        std::println(std::cerr, "Execution failed: {}", report.error());
        return false;
    }

    EXPECT(report->run_number == 1);
    EXPECT(report->succeeded);
    EXPECT(context_in(*report, "export", ContextState::Succeeded));
    EXPECT(report->contexts[0].work_dir.is_absolute());
    EXPECT(std::filesystem::exists(dir / ".cpe/state/run_number"));
    EXPECT(std::filesystem::exists(dir / ".cpe/work/1/export.env"));
    return true;
}

bool example_pipeline_test() {
    const auto example = std::filesystem::path(CPE_SOURCE_DIR) / "examples/ci.json";

    PipelineBuilder builder;
    auto parsed = parse(builder, example);
    if (!parsed) {
        std::println(std::cerr, "Failed to load {}: {}", example.string(), parsed.error());
        return false;
    }
    EXPECT(builder.name() == "ci");

    ScratchDir dir("example");
    std::filesystem::create_directories(dir / "src");
    auto config = scratch_config(dir, {EventKind::Push, "main"});
    config.dry_run = true;

    FakeTagService tags;
    FakeReleaseService releases;
    Executor executor(std::move(builder), config, {nullptr, &tags, &releases, nullptr});
    auto report = executor.execute();
    if (!report) {
        std::println(std::cerr, "Execution failed: {}", report.error());
        return false;
    }

    // One build per OS, in axis order, then the release.
    EXPECT(report->contexts.size() == 4);
    EXPECT(report->contexts[0].name == "build (macos-latest, 3.12)");
    EXPECT(report->contexts[1].name == "build (ubuntu-latest, 3.12)");
    EXPECT(report->contexts[2].name == "build (windows-latest, 3.12)");
    EXPECT(report->contexts[3].name == "release");
    for (const auto &ctx : report->contexts)
        EXPECT(ctx.state == ContextState::Succeeded);
    EXPECT(tags.tags.empty());

    // The Windows-only steps are guarded on the matrix OS.
    PipelineBuilder reloaded;
    EXPECT(parse(reloaded, example).has_value());
    const Job &build = reloaded.graph().jobs().front();
    EXPECT(build.steps.size() == 7);
    for (size_t i = 0; i < 3; ++i) {
        const auto &ctx = report->contexts[i];
        EXPECT(ctx.steps.size() == build.steps.size());

        ExprContext expr;
        for (const auto &[axis, value] : ctx.matrix)
            expr.set("matrix", axis, value);
        const bool windows = ctx.name.find("windows") != std::string::npos;
        for (const auto &step : build.steps) {
            auto admitted = evaluate_condition(step.guard.value_or(""), expr);
            EXPECT(admitted.has_value());
            const bool windows_only = step.name.find("Windows") != std::string::npos;
            EXPECT(*admitted == (!windows_only || windows));
        }
    }

    // A pull request builds but does not release.
    config.event = {EventKind::PullRequest, "feature"};
    PipelineBuilder for_pr;
    EXPECT(parse(for_pr, example).has_value());
    Executor pr_executor(std::move(for_pr), config, {nullptr, &tags, &releases, nullptr});
    auto pr = pr_executor.execute();
    EXPECT(pr.has_value());
    EXPECT(context_in(*pr, "build (windows-latest, 3.12)", ContextState::Succeeded));
    EXPECT(context_in(*pr, "release", ContextState::Skipped));
    return true;
}
