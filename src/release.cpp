#include "cpe/release.hpp"

#include "cpe/filesystem.hpp"
#include "cpe/process_exec.hpp"

#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>

namespace caravel {

namespace fs = std::filesystem;

namespace {

Result<void> validate_tag(std::string_view tag) {
    if (tag.empty())
        return std::unexpected("Tag must not be empty");
    if (tag.find("..") != std::string_view::npos || tag.starts_with('-') || tag.ends_with('/') ||
        tag.ends_with(".lock") || tag.find_first_of(" ~^:?*[\\\t\n") != std::string_view::npos) {
        return std::unexpected(std::format("Invalid tag name: '{}'", tag));
    }
    return {};
}

struct GitRun {
    int exit_code = 0;
    std::string output;
};

Result<GitRun> run_git(const fs::path &repo_dir, std::vector<std::string> args, std::vector<std::string> env = {}) {
    args.insert(args.begin(), {"git", "-C", repo_dir.string()});
    GitRun run;
    ProcessOptions options;
    options.env = std::move(env);
    options.on_line = [&run](std::string_view line) {
        run.output += line;
        run.output += '\n';
    };
    auto res = process_exec(std::move(args), options);
    if (!res)
        return std::unexpected(res.error());
    run.exit_code = *res;
    return run;
}

} // namespace

Outcome<void> GitTagService::create_tag(const std::string &tag, const fs::path &repo_dir) {
    if (auto res = validate_tag(tag); !res)
        return fail(ErrorKind::StepExecution, res.error());

    auto existing = run_git(repo_dir, {"rev-parse", "-q", "--verify", "refs/tags/" + tag});
    if (!existing)
        return fail(ErrorKind::StepExecution, existing.error());
    if (existing->exit_code == 0)
        return fail(ErrorKind::TagConflict, std::format("Tag '{}' already exists", tag));

    auto created = run_git(repo_dir, {"tag", tag});
    if (!created)
        return fail(ErrorKind::StepExecution, created.error());
    if (created->exit_code != 0)
        return fail(ErrorKind::StepExecution, std::format("git tag {} failed: {}", tag, created->output));

    if (!push_)
        return {};

    std::vector<std::string> env;
    std::vector<std::string> push_args;
    if (!token_.empty()) {
        env = current_environment();
        env.push_back("CPE_GIT_TOKEN=" + token_);
        push_args = {"-c", "credential.helper=",
                     "-c", "credential.helper=!f() { echo username=x-access-token; echo \"password=$CPE_GIT_TOKEN\"; }; f"};
    }
    push_args.insert(push_args.end(), {"push", remote_, "refs/tags/" + tag});

    auto pushed = run_git(repo_dir, std::move(push_args), std::move(env));
    if (!pushed)
        return fail(ErrorKind::StepExecution, pushed.error());
    if (pushed->exit_code != 0) {
        ErrorKind kind = pushed->output.find("already exists") != std::string::npos ? ErrorKind::TagConflict
                                                                                     : ErrorKind::StepExecution;
        return fail(kind, std::format("git push {} {} failed: {}", remote_, tag, pushed->output));
    }
    return {};
}

Outcome<ReleaseRecord> LocalReleaseService::create_release(const ReleaseRequest &request) {
    if (auto res = validate_tag(request.tag); !res)
        return fail(ErrorKind::StepExecution, res.error());

    std::lock_guard lock(mtx_);
    const fs::path record_path = dir_ / (request.tag + ".json");
    std::error_code ec;
    if (fs::exists(record_path, ec))
        return fail(ErrorKind::TagConflict, std::format("Release for tag '{}' already exists", request.tag));

    fs::create_directories(dir_ / request.tag, ec);
    if (ec)
        return fail(ErrorKind::Io, std::format("Failed to create {}: {}", (dir_ / request.tag).string(), ec.message()));

    ReleaseRecord record{request.tag, request.title, request.prerelease, {}};
    for (const auto &asset : request.assets) {
        auto name = asset.filename().string();
        if (auto res = copy_tree(asset, dir_ / request.tag / name); !res)
            return fail(ErrorKind::Io, res.error());
        record.assets.push_back(std::move(name));
    }

    using json = nlohmann::json;
    json doc;
    doc["tag"] = record.tag;
    doc["title"] = record.title;
    doc["prerelease"] = record.prerelease;
    doc["assets"] = record.assets;

    std::ofstream f(record_path);
    f << doc.dump(4);
    if (!f)
        return fail(ErrorKind::Io, std::format("Failed to write {}", record_path.string()));
    return record;
}

std::optional<ReleaseRecord> LocalReleaseService::find(const std::string &tag) const {
    std::lock_guard lock(mtx_);
    std::ifstream in(dir_ / (tag + ".json"));
    if (!in)
        return std::nullopt;

    using json = nlohmann::json;
    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        return std::nullopt;
    try {
        return ReleaseRecord{doc.value("tag", ""), doc.value("title", ""), doc.value("prerelease", false),
                             doc.value("assets", std::vector<std::string>{})};
    } catch (const json::type_error &) {
        return std::nullopt;
    }
}

std::string release_tag(uint64_t run_number) {
    return std::format("v{}", run_number);
}

std::string release_title(uint64_t run_number) {
    return std::format("Release v{}", run_number);
}

Result<uint64_t> next_run_number(const fs::path &counter_file) {
    uint64_t current = 0;
    {
        std::ifstream in(counter_file);
        if (in && !(in >> current))
            return std::unexpected(std::format("Corrupt run counter: {}", counter_file.string()));
    }
    const uint64_t next = current + 1;

    std::error_code ec;
    if (counter_file.has_parent_path())
        fs::create_directories(counter_file.parent_path(), ec);
    const fs::path tmp = counter_file.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << next << '\n';
        if (!out)
            return std::unexpected(std::format("Failed to write {}", tmp.string()));
    }
    fs::rename(tmp, counter_file, ec);
    if (ec)
        return std::unexpected(std::format("Failed to update {}: {}", counter_file.string(), ec.message()));
    return next;
}

} // namespace caravel
