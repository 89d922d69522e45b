#pragma once

#include "cpe/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace caravel {

struct ReleaseRequest {
    std::string tag;
    std::string title;
    bool prerelease = false;
    std::vector<std::filesystem::path> assets;
};

struct ReleaseRecord {
    std::string tag;
    std::string title;
    bool prerelease = false;
    std::vector<std::string> assets; // file names
};

class TagService {
public:
    virtual ~TagService() = default;
    // TagConflict if `tag` already exists. Never retried.
    virtual Outcome<void> create_tag(const std::string &tag, const std::filesystem::path &repo_dir) = 0;
};

class ReleaseService {
public:
    virtual ~ReleaseService() = default;
    // TagConflict if a release for request.tag already exists.
    virtual Outcome<ReleaseRecord> create_release(const ReleaseRequest &request) = 0;
    virtual std::optional<ReleaseRecord> find(const std::string &tag) const = 0;
};

/**
 * Tags HEAD of the checkout in `repo_dir` and pushes the tag to `remote`.
 * The token, when set, is handed to git through a one-shot credential helper
 * reading it from the environment.
 */
class GitTagService final : public TagService {
public:
    GitTagService(std::string remote, std::string token, bool push = true)
        : remote_(std::move(remote)), token_(std::move(token)), push_(push) {
    }

    Outcome<void> create_tag(const std::string &tag, const std::filesystem::path &repo_dir) override;

private:
    std::string remote_;
    std::string token_;
    bool push_;
};

// Release records as `<dir>/<tag>.json` with assets copied to `<dir>/<tag>/`.
class LocalReleaseService final : public ReleaseService {
public:
    explicit LocalReleaseService(std::filesystem::path dir) : dir_(std::move(dir)) {
    }

    Outcome<ReleaseRecord> create_release(const ReleaseRequest &request) override;
    std::optional<ReleaseRecord> find(const std::string &tag) const override;

private:
    std::filesystem::path dir_;
    mutable std::mutex mtx_;
};

// Naming used when a pipeline does not spell out its release: tag `v<run>`,
// title `Release v<run>`.
std::string release_tag(uint64_t run_number);
std::string release_title(uint64_t run_number);

// Reads, increments and persists the counter in `counter_file` (starting at 1).
Result<uint64_t> next_run_number(const std::filesystem::path &counter_file);

} // namespace caravel
