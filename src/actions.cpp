#include "cpe/actions.hpp"

#include "cpe/flatten.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <set>
#include <string>
#include <system_error>

namespace caravel {

namespace fs = std::filesystem;

std::string ActionCall::input(std::string_view key, std::string_view fallback) const {
    if (auto it = with.find(std::string(key)); it != with.end() && !it->second.empty())
        return it->second;
    return std::string(fallback);
}

fs::path ActionCall::resolve(std::string_view path) const {
    return (context.work_dir / path).lexically_normal();
}

void ActionRegistry::add(std::string name, ActionHandler handler) {
    handlers_.insert_or_assign(normalise(name), std::move(handler));
}

const ActionHandler *ActionRegistry::find(std::string_view uses) const {
    if (auto it = handlers_.find(normalise(uses)); it != handlers_.end())
        return &it->second;
    return nullptr;
}

std::string ActionRegistry::normalise(std::string_view uses) {
    if (auto at = uses.find('@'); at != std::string_view::npos)
        uses = uses.substr(0, at);
    if (auto slash = uses.rfind('/'); slash != std::string_view::npos)
        uses = uses.substr(slash + 1);
    std::string out(uses);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

namespace {

std::vector<std::string> input_lines(const std::string &value) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find('\n', start);
        if (end == std::string::npos)
            end = value.size();
        std::string line = value.substr(start, end - start);
        auto first = line.find_first_not_of(" \t\r");
        if (first != std::string::npos) {
            auto last = line.find_last_not_of(" \t\r");
            lines.push_back(line.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    return lines;
}

Outcome<std::vector<fs::path>> expand_inputs(const ActionCall &call, const std::string &patterns) {
    std::set<fs::path> unique;
    for (const auto &pattern : input_lines(patterns)) {
        auto matches = expand_glob(call.context.work_dir, pattern);
        if (!matches)
            return fail(ErrorKind::StepExecution, matches.error());
        unique.insert(matches->begin(), matches->end());
    }
    return std::vector<fs::path>(unique.begin(), unique.end());
}

Result<void> copy_filtered(const fs::path &from, const fs::path &to, const std::set<fs::path> &skip) {
    std::error_code ec;
    fs::create_directories(to, ec);
    if (ec)
        return std::unexpected(std::format("Failed to create {}: {}", to.string(), ec.message()));

    for (auto it = fs::directory_iterator(from, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::path &src = it->path();
        if (src.filename() == ".cpe")
            continue;
        std::error_code canon_ec;
        if (skip.contains(fs::weakly_canonical(src, canon_ec)))
            continue;

        const fs::path dst = to / src.filename();
        std::error_code op_ec;
        if (it->is_symlink(op_ec)) {
            fs::remove(dst, op_ec);
            fs::copy_symlink(src, dst, op_ec);
        } else if (it->is_directory(op_ec)) {
            if (auto res = copy_filtered(src, dst, skip); !res)
                return res;
        } else {
            fs::copy_file(src, dst, fs::copy_options::overwrite_existing, op_ec);
        }
        if (op_ec)
            return std::unexpected(std::format("Failed to copy {}: {}", src.string(), op_ec.message()));
    }
    if (ec)
        return std::unexpected(std::format("Failed to read {}: {}", from.string(), ec.message()));
    return {};
}

Outcome<void> checkout(ActionCall &call) {
    const fs::path dest = call.resolve(call.input("path", "."));
    std::error_code ec;
    const fs::path source = fs::weakly_canonical(call.source_dir, ec);
    if (ec || !fs::is_directory(source, ec))
        return fail(ErrorKind::Io, std::format("checkout: source {} is not a directory", call.source_dir.string()));

    std::set<fs::path> skip;
    for (const auto &p : call.checkout_skip) {
        std::error_code canon_ec;
        skip.insert(fs::weakly_canonical(p, canon_ec));
    }
    skip.insert(fs::weakly_canonical(dest, ec));

    if (auto res = copy_filtered(source, dest, skip); !res)
        return fail(ErrorKind::Io, res.error());
    call.log(std::format("Checked out {} into {}", source.string(), dest.string()));
    return {};
}

ActionHandler setup_tool(std::string tool) {
    return [tool = std::move(tool)](ActionCall &call) -> Outcome<void> {
        std::string version;
        for (const auto &[key, value] : call.with) {
            if (key == "version" || key.ends_with("-version")) {
                version = value;
                break;
            }
        }
        if (version.empty())
            return fail(ErrorKind::StepExecution, std::format("setup-{}: a version input is required", tool));

        std::string var = tool;
        std::ranges::transform(var, var.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        call.exports["CPE_TOOL_VERSION"] = version;
        call.exports[var + "_VERSION"] = version;
        call.log(std::format("Using {} {} as provided by the host", tool, version));
        return {};
    };
}

Outcome<void> upload_artifact(ActionCall &call) {
    const std::string name = call.input("name", "artifact");
    const std::string patterns = call.input("path");
    const std::string if_missing = call.input("if-no-files-found", "warn");
    if (patterns.empty())
        return fail(ErrorKind::StepExecution, "upload-artifact: 'path' is required");
    if (if_missing != "warn" && if_missing != "error" && if_missing != "ignore")
        return fail(ErrorKind::StepExecution,
                    std::format("upload-artifact: bad if-no-files-found value '{}'", if_missing));

    auto matches = expand_inputs(call, patterns);
    if (!matches)
        return std::unexpected(matches.error());

    if (matches->empty()) {
        auto message = std::format("No files were found with the provided path: {}", patterns);
        if (if_missing == "error")
            return fail(ErrorKind::StepExecution, message);
        if (if_missing == "warn")
            call.log("warning: " + message + ". No artifacts will be uploaded.");
        return {};
    }

    auto artifact = call.services.artifacts.upload(name, call.context.name, *matches);
    if (!artifact)
        return std::unexpected(artifact.error());
    call.log(std::format("Uploaded artifact '{}' ({} files)", artifact->name, artifact->files.size()));
    return {};
}

Outcome<void> download_artifact(ActionCall &call) {
    const fs::path target = call.resolve(call.input("path", "."));
    const std::string name = call.input("name");

    if (!name.empty()) {
        auto artifact = call.services.artifacts.download(name, target);
        if (!artifact)
            return std::unexpected(artifact.error());
        call.log(std::format("Downloaded artifact '{}' into {}", name, target.string()));
        return {};
    }

    // Without a name every artifact of the run lands in its own folder.
    auto all = call.services.artifacts.list();
    if (all.empty())
        call.log("No artifacts to download");
    for (const auto &artifact : all) {
        auto res = call.services.artifacts.download(artifact.name, target / artifact.name);
        if (!res)
            return std::unexpected(res.error());
        call.log(std::format("Downloaded artifact '{}' into {}", artifact.name, (target / artifact.name).string()));
    }
    return {};
}

Outcome<void> flatten_artifact(ActionCall &call) {
    const fs::path dir = call.resolve(call.input("path", "."));
    const std::string name = call.input("name");
    if (name.empty())
        return fail(ErrorKind::StepExecution, "flatten-artifact: 'name' is required");

    auto changed = flatten_artifact_dir(call.services.fs, dir, name);
    if (!changed)
        return fail(ErrorKind::Io, changed.error());
    if (*changed)
        call.log(std::format("Flattened {}/{} into {}", dir.string(), name, dir.string()));
    else
        call.log(std::format("{} is already flat", dir.string()));
    return {};
}

Outcome<void> create_tag(ActionCall &call) {
    const std::string tag = call.input("tag", release_tag(call.run_number));
    if (auto res = call.services.tags.create_tag(tag, call.context.work_dir); !res)
        return res;
    call.log(std::format("Created tag {}", tag));
    return {};
}

Outcome<void> create_release(ActionCall &call) {
    ReleaseRequest request;
    request.tag = call.input("tag", release_tag(call.run_number));
    request.title = call.input("title", request.tag == release_tag(call.run_number)
                                            ? release_title(call.run_number)
                                            : request.tag);

    std::string prerelease = call.input("prerelease", "false");
    std::ranges::transform(prerelease, prerelease.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (prerelease != "true" && prerelease != "false")
        return fail(ErrorKind::StepExecution, std::format("create-release: bad prerelease value '{}'", prerelease));
    request.prerelease = prerelease == "true";

    if (auto files = call.input("files"); !files.empty()) {
        auto matches = expand_inputs(call, files);
        if (!matches)
            return std::unexpected(matches.error());
        request.assets = std::move(*matches);
    }

    auto record = call.services.releases.create_release(request);
    if (!record)
        return std::unexpected(record.error());
    call.log(std::format("Published '{}' for tag {}{}", record->title, record->tag,
                         record->prerelease ? " (prerelease)" : ""));
    return {};
}

} // namespace

void register_builtin_actions(ActionRegistry &registry) {
    registry.add("checkout", checkout);
    for (const char *tool : {"tool", "python", "node", "go", "java"})
        registry.add(std::format("setup-{}", tool), setup_tool(tool));
    registry.add("upload-artifact", upload_artifact);
    registry.add("download-artifact", download_artifact);
    registry.add("flatten-artifact", flatten_artifact);
    registry.add("create-tag", create_tag);
    registry.add("create-release", create_release);
    registry.add("github-release-action", create_release);
}

} // namespace caravel
