#include "cpe/filesystem.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace caravel {

namespace fs = std::filesystem;

bool RealFileSystem::exists(const fs::path &p) const {
    std::error_code ec;
    return fs::exists(p, ec);
}

bool RealFileSystem::is_directory(const fs::path &p) const {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

Result<std::vector<DirEntry>> RealFileSystem::list(const fs::path &dir) const {
    std::vector<DirEntry> out;
    std::error_code ec;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        bool is_dir = it->is_directory(type_ec);
        out.push_back({it->path().filename().string(), is_dir ? EntryType::Directory : EntryType::File});
    }
    if (ec)
        return std::unexpected(std::format("Failed to list {}: {}", dir.string(), ec.message()));
    std::ranges::sort(out, {}, &DirEntry::name);
    return out;
}

Result<void> RealFileSystem::move(const fs::path &from, const fs::path &to) {
    auto rel = from.lexically_normal().lexically_relative(to.lexically_normal());
    if (!rel.empty() && rel != "." && *rel.begin() != "..")
        return std::unexpected(std::format("Cannot move {} over its ancestor {}", from.string(), to.string()));
    if (rel == ".")
        return {};

    std::error_code ec;
    if (fs::exists(to, ec)) {
        fs::remove_all(to, ec);
        if (ec)
            return std::unexpected(std::format("Failed to replace {}: {}", to.string(), ec.message()));
    }
    fs::rename(from, to, ec);
    if (ec)
        return std::unexpected(std::format("Failed to move {} -> {}: {}", from.string(), to.string(), ec.message()));
    return {};
}

Result<void> RealFileSystem::remove_all(const fs::path &p) {
    std::error_code ec;
    fs::remove_all(p, ec);
    if (ec)
        return std::unexpected(std::format("Failed to remove {}: {}", p.string(), ec.message()));
    return {};
}

namespace {

std::string key_of(const fs::path &p) {
    std::string key = p.lexically_normal().generic_string();
    while (key.size() > 1 && key.back() == '/')
        key.pop_back();
    if (key.empty())
        key = ".";
    return key;
}

std::string parent_key(const std::string &key) {
    auto slash = key.rfind('/');
    if (slash == std::string::npos)
        return ".";
    if (slash == 0)
        return "/";
    return key.substr(0, slash);
}

bool is_under(const std::string &key, const std::string &dir) {
    if (dir == ".")
        return key != ".";
    if (dir == "/")
        return key.size() > 1 && key.front() == '/';
    return key.size() > dir.size() && key.starts_with(dir) && key[dir.size()] == '/';
}

} // namespace

void MemoryFileSystem::add_directory(const fs::path &p) {
    std::string key = key_of(p);
    while (key != "." && key != "/") {
        entries_.insert_or_assign(key, Node{EntryType::Directory, {}});
        key = parent_key(key);
    }
}

void MemoryFileSystem::add_file(const fs::path &p, std::string content) {
    std::string key = key_of(p);
    add_directory(parent_key(key));
    entries_.insert_or_assign(key, Node{EntryType::File, std::move(content)});
}

std::vector<std::string> MemoryFileSystem::snapshot() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto &[key, node] : entries_)
        out.push_back(node.type == EntryType::Directory ? key + "/" : key);
    return out;
}

std::string MemoryFileSystem::read(const fs::path &p) const {
    if (auto it = entries_.find(key_of(p)); it != entries_.end())
        return it->second.content;
    return {};
}

bool MemoryFileSystem::exists(const fs::path &p) const {
    return entries_.contains(key_of(p));
}

bool MemoryFileSystem::is_directory(const fs::path &p) const {
    auto it = entries_.find(key_of(p));
    return it != entries_.end() && it->second.type == EntryType::Directory;
}

Result<std::vector<DirEntry>> MemoryFileSystem::list(const fs::path &dir) const {
    const std::string key = key_of(dir);
    if (!is_directory(dir))
        return std::unexpected(std::format("Not a directory: {}", key));

    std::vector<DirEntry> out;
    for (const auto &[path, node] : entries_) {
        if (parent_key(path) == key)
            out.push_back({fs::path(path).filename().string(), node.type});
    }
    std::ranges::sort(out, {}, &DirEntry::name);
    return out;
}

Result<void> MemoryFileSystem::move(const fs::path &from, const fs::path &to) {
    const std::string src = key_of(from);
    const std::string dst = key_of(to);
    if (!entries_.contains(src))
        return std::unexpected(std::format("No such entry: {}", src));
    if (src == dst)
        return {};
    if (is_under(dst, src))
        return std::unexpected(std::format("Cannot move {} into itself", src));
    if (is_under(src, dst))
        return std::unexpected(std::format("Cannot move {} over its ancestor {}", src, dst));

    if (auto res = remove_all(to); !res)
        return res;

    std::map<std::string, Node> moved;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first == src || is_under(it->first, src)) {
            moved.emplace(dst + it->first.substr(src.size()), std::move(it->second));
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    add_directory(parent_key(dst));
    entries_.merge(moved);
    return {};
}

Result<void> MemoryFileSystem::remove_all(const fs::path &p) {
    const std::string key = key_of(p);
    std::erase_if(entries_, [&](const auto &entry) { return entry.first == key || is_under(entry.first, key); });
    return {};
}

bool glob_match(std::string_view pattern, std::string_view text) {
    while (!pattern.empty()) {
        if (pattern.starts_with("**")) {
            pattern.remove_prefix(2);
            if (pattern.empty())
                return true;
            for (size_t i = 0; i <= text.size(); ++i) {
                if (glob_match(pattern, text.substr(i)))
                    return true;
            }
            return false;
        }
        if (pattern.front() == '*') {
            pattern.remove_prefix(1);
            for (size_t i = 0; i <= text.size(); ++i) {
                if (glob_match(pattern, text.substr(i)))
                    return true;
                if (i < text.size() && text[i] == '/')
                    break;
            }
            return false;
        }
        if (text.empty())
            return false;
        if (pattern.front() == '?') {
            if (text.front() == '/')
                return false;
        } else if (pattern.front() != text.front()) {
            return false;
        }
        pattern.remove_prefix(1);
        text.remove_prefix(1);
    }
    return text.empty();
}

namespace {

bool has_wildcard(std::string_view s) {
    return s.find_first_of("*?") != std::string_view::npos;
}

void walk_glob(const fs::path &dir, const std::vector<std::string> &parts, size_t idx, std::set<fs::path> &out) {
    std::error_code ec;
    if (idx == parts.size()) {
        if (fs::exists(dir, ec))
            out.insert(dir);
        return;
    }

    const std::string &part = parts[idx];
    if (part == "**") {
        walk_glob(dir, parts, idx + 1, out);
        for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_directory(type_ec))
                walk_glob(it->path(), parts, idx, out);
        }
        return;
    }

    if (!has_wildcard(part)) {
        fs::path candidate = dir / part;
        if (fs::exists(candidate, ec))
            walk_glob(candidate, parts, idx + 1, out);
        return;
    }

    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (glob_match(part, it->path().filename().string())) {
            std::error_code type_ec;
            if (idx + 1 == parts.size() || it->is_directory(type_ec))
                walk_glob(it->path(), parts, idx + 1, out);
        }
    }
}

} // namespace

Result<std::vector<fs::path>> expand_glob(const fs::path &root, std::string_view pattern) {
    fs::path pat(pattern);
    if (pat.is_absolute())
        return std::unexpected(std::format("Absolute path patterns are not allowed: {}", pattern));

    std::vector<std::string> parts;
    for (const auto &part : pat.lexically_normal()) {
        std::string s = part.string();
        if (s.empty() || s == ".")
            continue;
        if (s == "..")
            return std::unexpected(std::format("Path pattern escapes the working directory: {}", pattern));
        parts.push_back(std::move(s));
    }
    if (parts.empty())
        return std::vector<fs::path>{root};

    std::set<fs::path> matches;
    walk_glob(root, parts, 0, matches);
    return std::vector<fs::path>(matches.begin(), matches.end());
}

Result<void> copy_tree(const fs::path &from, const fs::path &to) {
    std::error_code ec;
    if (fs::is_directory(from, ec)) {
        fs::create_directories(to, ec);
        if (ec)
            return std::unexpected(std::format("Failed to create {}: {}", to.string(), ec.message()));
        fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    } else {
        if (to.has_parent_path())
            fs::create_directories(to.parent_path(), ec);
        fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    }
    if (ec)
        return std::unexpected(std::format("Failed to copy {} -> {}: {}", from.string(), to.string(), ec.message()));
    return {};
}

} // namespace caravel
