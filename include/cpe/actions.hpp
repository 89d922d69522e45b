#pragma once

#include "cpe/artifact_store.hpp"
#include "cpe/domain.hpp"
#include "cpe/filesystem.hpp"
#include "cpe/release.hpp"
#include "cpe/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace caravel {

// Collaborators shared by every context of a run. Only the artifact store is
// written concurrently and it synchronises itself.
struct Services {
    ArtifactStore &artifacts;
    TagService &tags;
    ReleaseService &releases;
    FileSystem &fs;
};

struct ActionCall {
    const ExecutionContext &context;
    const Inputs &with; // already interpolated
    Environment &exports; // visible to later steps of the same context
    Services &services;
    const std::filesystem::path &source_dir;
    const std::vector<std::filesystem::path> &checkout_skip;
    uint64_t run_number;
    std::function<void(std::string_view)> log;

    // with[key], or `fallback` when absent.
    std::string input(std::string_view key, std::string_view fallback = {}) const;
    // Relative inputs resolve against the context's working directory.
    std::filesystem::path resolve(std::string_view path) const;
};

using ActionHandler = std::function<Outcome<void>(ActionCall &)>;

class ActionRegistry {
public:
    void add(std::string name, ActionHandler handler);

    // "actions/upload-artifact@v4" and "upload-artifact" find the same handler;
    // owner prefix, version suffix and case are ignored.
    const ActionHandler *find(std::string_view uses) const;

    static std::string normalise(std::string_view uses);

private:
    std::unordered_map<std::string, ActionHandler> handlers_;
};

/**
 * @brief Registers checkout, setup-tool (and setup-python/node/go/java aliases),
 * upload-artifact, download-artifact, flatten-artifact, create-tag and
 * create-release (alias github-release-action).
 */
void register_builtin_actions(ActionRegistry &registry);

} // namespace caravel
