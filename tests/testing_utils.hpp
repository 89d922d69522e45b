#pragma once

#include "cpe/release.hpp"
#include "cpe/utility.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <map>
#include <optional>
#include <print>
#include <string>
#include <vector>

// Reports the failed expectation and makes the enclosing bool test return false.
#define EXPECT(cond)                                                                                                   \
    do {                                                                                                               \
        if (!(cond)) {                                                                                                 \
            std::println(std::cerr, "{}:{}: expectation failed: {}", __FILE__, __LINE__, #cond);                     \
            return false;                                                                                              \
        }                                                                                                              \
    } while (0)

void create_file(const std::filesystem::path &path, const std::string &content);
std::string read_file(const std::filesystem::path &path);

// Fresh directory under the system temp dir, removed again on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::string &name);
    ~ScratchDir();

    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    const std::filesystem::path &path() const {
        return path_;
    }
    std::filesystem::path operator/(const std::filesystem::path &rel) const {
        return path_ / rel;
    }

private:
    std::filesystem::path path_;
};

// Records tags instead of talking to git.
class FakeTagService final : public caravel::TagService {
public:
    caravel::Outcome<void> create_tag(const std::string &tag, const std::filesystem::path &) override {
        for (const auto &existing : tags) {
            if (existing == tag)
                return caravel::fail(caravel::ErrorKind::TagConflict, std::format("Tag '{}' already exists", tag));
        }
        tags.push_back(tag);
        return {};
    }

    std::vector<std::string> tags;
};

class FakeReleaseService final : public caravel::ReleaseService {
public:
    caravel::Outcome<caravel::ReleaseRecord> create_release(const caravel::ReleaseRequest &request) override {
        if (releases.contains(request.tag))
            return caravel::fail(caravel::ErrorKind::TagConflict,
                                 std::format("Release for tag '{}' already exists", request.tag));
        caravel::ReleaseRecord record{request.tag, request.title, request.prerelease, {}};
        for (const auto &asset : request.assets)
            record.assets.push_back(asset.filename().string());
        releases.emplace(request.tag, record);
        return record;
    }

    std::optional<caravel::ReleaseRecord> find(const std::string &tag) const override {
        if (auto it = releases.find(tag); it != releases.end())
            return it->second;
        return std::nullopt;
    }

    std::map<std::string, caravel::ReleaseRecord> releases;
};
