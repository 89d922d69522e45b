#include "cpe/flatten.hpp"

#include <format>
#include <string>

namespace caravel {

Result<std::vector<FlattenOp>> plan_flatten(const FileSystem &fs, const std::filesystem::path &dir,
                                            std::string_view name) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string_view::npos)
        return std::unexpected(std::format("Invalid artifact folder name: '{}'", name));

    std::vector<FlattenOp> plan;
    const auto nested = dir / name;
    if (!fs.is_directory(nested))
        return plan;

    auto children = fs.list(nested);
    if (!children)
        return std::unexpected(children.error());

    const auto staging = dir / std::format(".cpe-flatten-{}", name);
    plan.push_back({FlattenOp::Kind::Move, nested, staging});
    for (const auto &child : *children) {
        plan.push_back({FlattenOp::Kind::Move, staging / child.name, dir / child.name});
    }
    plan.push_back({FlattenOp::Kind::Remove, staging, {}});
    return plan;
}

Result<void> apply_flatten(FileSystem &fs, const std::vector<FlattenOp> &plan) {
    for (const auto &op : plan) {
        Result<void> res;
        if (op.kind == FlattenOp::Kind::Move)
            res = fs.move(op.from, op.to);
        else
            res = fs.remove_all(op.from);
        if (!res)
            return res;
    }
    return {};
}

Result<bool> flatten_artifact_dir(FileSystem &fs, const std::filesystem::path &dir, std::string_view name) {
    auto plan = plan_flatten(fs, dir, name);
    if (!plan)
        return std::unexpected(plan.error());
    if (plan->empty())
        return false;
    if (auto res = apply_flatten(fs, *plan); !res)
        return std::unexpected(res.error());
    return true;
}

} // namespace caravel
