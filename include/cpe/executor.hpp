#pragma once

#include "cpe/actions.hpp"
#include "cpe/builder.hpp"
#include "cpe/domain.hpp"
#include "cpe/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace caravel {

struct ExecutorConfig {
    std::filesystem::path pipeline_file = "cpe.json";
    Event event{EventKind::Push, "main"};
    std::optional<uint64_t> run_number; // nullopt: next value of <state>/run_number
    std::filesystem::path source_dir = ".";
    std::filesystem::path workspace_dir = ".cpe/work";
    std::filesystem::path state_dir = ".cpe/state";
    size_t jobs = 0; // 0: hardware concurrency
    bool dry_run = false;
    std::string remote = "origin";
    bool push_tags = true;
    std::map<std::string, std::string> secrets;
};

struct RunReport {
    std::string pipeline;
    uint64_t run_number = 0;
    Event event;
    bool succeeded = true;
    std::vector<std::string> job_names; // by job id
    std::vector<ExecutionContext> contexts;
};

// Optional replacements for the collaborators execute() would otherwise create.
struct ServiceOverrides {
    ArtifactStore *artifacts = nullptr;
    TagService *tags = nullptr;
    ReleaseService *releases = nullptr;
    FileSystem *fs = nullptr;
};

class Executor {
public:
    explicit Executor(PipelineBuilder &&builder, const ExecutorConfig &config = {}, ServiceOverrides overrides = {});

    /**
     * @brief Runs the pipeline for config.event.
     *
     * Jobs whose trigger does not admit the event are Skipped, as are dependents
     * of skipped jobs. Dependents of a failed job stay Pending. The report's
     * `succeeded` is false iff some context Failed. An error is returned only when
     * the run cannot start (bad condition expression, run counter, workspace).
     */
    Result<RunReport> execute();

    // Graphviz digraph of jobs and `needs` edges; green jobs are admitted by the event.
    Result<void> emit_graph(std::ostream &out = std::cout);
    Result<void> emit_report(const RunReport &report, const std::filesystem::path &path) const;
    Result<void> clean();

    ActionRegistry &registry() {
        return actions;
    }

private:
    Result<uint64_t> resolve_run_number() const;

    PipelineBuilder builder;
    ExecutorConfig config;
    ServiceOverrides overrides;
    ActionRegistry actions;
    std::vector<std::jthread> pool;
};

} // namespace caravel
