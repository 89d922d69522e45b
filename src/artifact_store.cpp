#include "cpe/artifact_store.hpp"

#include "cpe/filesystem.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>

namespace caravel {

namespace fs = std::filesystem;

Result<void> validate_artifact_name(std::string_view name) {
    if (name.empty())
        return std::unexpected("Artifact name must not be empty");
    if (name == "." || name == "..")
        return std::unexpected(std::format("Invalid artifact name: '{}'", name));
    static constexpr std::string_view forbidden = "\\/\":<>|*?\r\n";
    if (auto pos = name.find_first_of(forbidden); pos != std::string_view::npos)
        return std::unexpected(std::format("Invalid character '{}' in artifact name: '{}'", name[pos], name));
    return {};
}

namespace {

fs::path common_ancestor(const std::vector<fs::path> &matches) {
    fs::path lca;
    bool first = true;
    for (const auto &match : matches) {
        std::error_code ec;
        fs::path base = fs::is_directory(match, ec) ? match : match.parent_path();
        base = base.lexically_normal();
        if (first) {
            lca = base;
            first = false;
            continue;
        }
        fs::path common;
        auto a = lca.begin();
        auto b = base.begin();
        for (; a != lca.end() && b != base.end() && *a == *b; ++a, ++b)
            common /= *a;
        lca = common;
    }
    return lca;
}

std::vector<std::string> collect_files(const fs::path &root) {
    std::vector<std::string> files;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec))
            files.push_back(it->path().lexically_relative(root).generic_string());
    }
    std::ranges::sort(files);
    return files;
}

} // namespace

LocalArtifactStore::LocalArtifactStore(fs::path root, uint64_t run_id) : root_(std::move(root)), run_id_(run_id) {
}

Outcome<Artifact> LocalArtifactStore::upload(std::string_view name, std::string_view owner,
                                             const std::vector<fs::path> &matches) {
    if (auto res = validate_artifact_name(name); !res)
        return fail(ErrorKind::Io, res.error());
    if (matches.empty())
        return fail(ErrorKind::Io, std::format("No files to upload for artifact '{}'", name));

    const std::string key(name);
    const fs::path dest = run_dir() / key;
    {
        std::lock_guard lock(mtx_);
        std::error_code ec;
        if (committed_.contains(key) || reserved_.contains(key) || fs::exists(dest, ec)) {
            return fail(ErrorKind::ArtifactConflict,
                        std::format("Artifact '{}' already exists for run {}", name, run_id_));
        }
        reserved_.insert(key);
    }

    auto release_reservation = [&] {
        std::lock_guard lock(mtx_);
        reserved_.erase(key);
    };

    const fs::path lca = common_ancestor(matches);
    std::error_code ec;
    fs::create_directories(dest, ec);
    if (ec) {
        release_reservation();
        return fail(ErrorKind::Io, std::format("Failed to create {}: {}", dest.string(), ec.message()));
    }

    for (const auto &match : matches) {
        fs::path rel = match.lexically_normal().lexically_relative(lca);
        fs::path target = (rel.empty() || rel == ".") ? dest : dest / rel;
        if (auto res = copy_tree(match, target); !res) {
            fs::remove_all(dest, ec);
            release_reservation();
            return fail(ErrorKind::Io, res.error());
        }
    }

    Artifact artifact{key, run_id_, std::string(owner), collect_files(dest)};
    if (auto res = write_manifest(artifact); !res) {
        fs::remove_all(dest, ec);
        release_reservation();
        return fail(ErrorKind::Io, res.error());
    }

    std::lock_guard lock(mtx_);
    reserved_.erase(key);
    committed_.emplace(key, artifact);
    return artifact;
}

Outcome<Artifact> LocalArtifactStore::download(std::string_view name, const fs::path &target) {
    if (auto res = validate_artifact_name(name); !res)
        return fail(ErrorKind::ArtifactNotFound, res.error());

    const std::string key(name);
    Artifact artifact;
    {
        std::lock_guard lock(mtx_);
        if (auto it = committed_.find(key); it != committed_.end()) {
            artifact = it->second;
        } else if (reserved_.contains(key)) {
            return fail(ErrorKind::ArtifactNotFound, std::format("Artifact '{}' is still being uploaded", name));
        } else {
            auto loaded = load_manifest(key);
            if (!loaded)
                return std::unexpected(loaded.error());
            artifact = *loaded;
            committed_.emplace(key, artifact);
        }
    }

    if (auto res = copy_tree(run_dir() / key, target); !res)
        return fail(ErrorKind::Io, res.error());
    return artifact;
}

std::vector<Artifact> LocalArtifactStore::list() const {
    std::lock_guard lock(mtx_);
    std::vector<Artifact> out;
    out.reserve(committed_.size());
    for (const auto &[name, artifact] : committed_)
        out.push_back(artifact);
    return out;
}

Outcome<Artifact> LocalArtifactStore::load_manifest(const std::string &name) const {
    const fs::path manifest = run_dir() / (name + ".json");
    std::ifstream in(manifest);
    if (!in)
        return fail(ErrorKind::ArtifactNotFound, std::format("Artifact '{}' not found for run {}", name, run_id_));

    using json = nlohmann::json;
    try {
        json doc = json::parse(in);
        Artifact artifact;
        artifact.name = doc.at("name").get<std::string>();
        artifact.run_id = doc.at("run_id").get<uint64_t>();
        artifact.owner = doc.value("owner", "");
        artifact.files = doc.value("files", std::vector<std::string>{});
        return artifact;
    } catch (const json::exception &err) {
        return fail(ErrorKind::Parse, std::format("Corrupt manifest {}: {}", manifest.string(), err.what()));
    }
}

Result<void> LocalArtifactStore::write_manifest(const Artifact &artifact) const {
    using json = nlohmann::json;
    json doc;
    doc["name"] = artifact.name;
    doc["run_id"] = artifact.run_id;
    doc["owner"] = artifact.owner;
    doc["files"] = artifact.files;

    const fs::path manifest = run_dir() / (artifact.name + ".json");
    std::ofstream f(manifest);
    f << doc.dump(4);
    if (!f)
        return std::unexpected(std::format("Failed to write {}", manifest.string()));
    return {};
}

} // namespace caravel
