#pragma once

#include "cpe/filesystem.hpp"
#include "cpe/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace caravel {

struct FlattenOp {
    enum class Kind : uint8_t { Move, Remove };
    Kind kind;
    std::filesystem::path from;
    std::filesystem::path to; // unused for Remove
};

/**
 * @brief Plans hoisting `dir/name/*` into `dir` and dropping the emptied folder.
 *
 * Reads `fs` only. The folder is first renamed to a staging name so an entry
 * called `name` inside it cannot collide with the folder itself. Entries already
 * in `dir` with the same name are replaced. An empty plan means `dir` is already
 * flat.
 */
Result<std::vector<FlattenOp>> plan_flatten(const FileSystem &fs, const std::filesystem::path &dir,
                                            std::string_view name);

Result<void> apply_flatten(FileSystem &fs, const std::vector<FlattenOp> &plan);

// plan + apply; returns whether anything was moved.
Result<bool> flatten_artifact_dir(FileSystem &fs, const std::filesystem::path &dir, std::string_view name);

} // namespace caravel
