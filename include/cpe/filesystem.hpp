#pragma once

#include "cpe/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace caravel {

enum class EntryType : uint8_t { File, Directory };

struct DirEntry {
    std::string name;
    EntryType type;
};

// The subset of filesystem operations the artifact steps need, so they can be
// exercised against an in-memory tree.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool exists(const std::filesystem::path &p) const = 0;
    virtual bool is_directory(const std::filesystem::path &p) const = 0;
    // Sorted by name.
    virtual Result<std::vector<DirEntry>> list(const std::filesystem::path &dir) const = 0;
    // Replaces `to` if it already exists.
    virtual Result<void> move(const std::filesystem::path &from, const std::filesystem::path &to) = 0;
    virtual Result<void> remove_all(const std::filesystem::path &p) = 0;
};

class RealFileSystem final : public FileSystem {
public:
    bool exists(const std::filesystem::path &p) const override;
    bool is_directory(const std::filesystem::path &p) const override;
    Result<std::vector<DirEntry>> list(const std::filesystem::path &dir) const override;
    Result<void> move(const std::filesystem::path &from, const std::filesystem::path &to) override;
    Result<void> remove_all(const std::filesystem::path &p) override;
};

class MemoryFileSystem final : public FileSystem {
public:
    // Parent directories are created implicitly.
    void add_file(const std::filesystem::path &p, std::string content = {});
    void add_directory(const std::filesystem::path &p);

    // Every entry as "path" (files) or "path/" (directories), sorted.
    std::vector<std::string> snapshot() const;
    std::string read(const std::filesystem::path &p) const;

    bool exists(const std::filesystem::path &p) const override;
    bool is_directory(const std::filesystem::path &p) const override;
    Result<std::vector<DirEntry>> list(const std::filesystem::path &dir) const override;
    Result<void> move(const std::filesystem::path &from, const std::filesystem::path &to) override;
    Result<void> remove_all(const std::filesystem::path &p) override;

private:
    struct Node {
        EntryType type;
        std::string content;
    };
    std::map<std::string, Node> entries_; // keyed by normalised generic path
};

/**
 * @brief Shell-style wildcard match.
 *
 * `*` and `?` do not cross '/', `**` matches any run of characters including '/'.
 */
bool glob_match(std::string_view pattern, std::string_view text);

// Expands a relative glob against `root`; results are sorted absolute paths.
Result<std::vector<std::filesystem::path>> expand_glob(const std::filesystem::path &root, std::string_view pattern);

// Recursive copy that overwrites existing files.
Result<void> copy_tree(const std::filesystem::path &from, const std::filesystem::path &to);

} // namespace caravel
