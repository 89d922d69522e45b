#pragma once

#include "cpe/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace caravel {

struct Artifact {
    std::string name;
    uint64_t run_id = 0;
    std::string owner; // display name of the uploading context
    std::vector<std::string> files; // relative to the artifact root, sorted
};

// Write-once name -> file tree store, scoped to one pipeline run.
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    /**
     * @brief Packages `matches` as one artifact.
     *
     * Paths are stored relative to the least common ancestor of the matches (a
     * matched directory counts as its own ancestor). Fails with ArtifactConflict if
     * `name` was already uploaded in this run.
     */
    virtual Outcome<Artifact> upload(std::string_view name, std::string_view owner,
                                     const std::vector<std::filesystem::path> &matches) = 0;

    // Copies the artifact's files into `target`. ArtifactNotFound if absent for this run.
    virtual Outcome<Artifact> download(std::string_view name, const std::filesystem::path &target) = 0;

    virtual std::vector<Artifact> list() const = 0;
    virtual uint64_t run_id() const = 0;
};

Result<void> validate_artifact_name(std::string_view name);

/**
 * Keeps artifacts under `<root>/<run id>/<name>/` with a `<name>.json` manifest
 * next to each, so a later invocation with the same run id can consume them.
 */
class LocalArtifactStore final : public ArtifactStore {
public:
    LocalArtifactStore(std::filesystem::path root, uint64_t run_id);

    Outcome<Artifact> upload(std::string_view name, std::string_view owner,
                             const std::vector<std::filesystem::path> &matches) override;
    Outcome<Artifact> download(std::string_view name, const std::filesystem::path &target) override;
    std::vector<Artifact> list() const override;
    uint64_t run_id() const override {
        return run_id_;
    }

    std::filesystem::path run_dir() const {
        return root_ / std::to_string(run_id_);
    }

private:
    Outcome<Artifact> load_manifest(const std::string &name) const;
    Result<void> write_manifest(const Artifact &artifact) const;

    std::filesystem::path root_;
    uint64_t run_id_;

    mutable std::mutex mtx_;
    std::map<std::string, Artifact> committed_;
    std::set<std::string> reserved_; // uploads in flight
};

} // namespace caravel
