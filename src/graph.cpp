#include "cpe/graph.hpp"

#include "cpe/utility.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <functional>

namespace caravel {

size_t JobGraph::get_or_create_node(std::string_view name) {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return it->second;
    }

    size_t id = nodes_.size();
    nodes_.push_back({std::string(name), {}, std::nullopt});
    index_.emplace(name, id);
    return id;
}

Result<size_t> JobGraph::add_job(Job job) {
    if (job.name.empty())
        return std::unexpected("Job name must not be empty");

    size_t node_id = get_or_create_node(job.name);

    if (nodes_[node_id].job_id.has_value()) { // 2 jobs with the same id
        return std::unexpected(std::format("Duplicate job: {}", job.name));
    }

    size_t job_id = jobs_.size();
    nodes_[node_id].job_id = job_id;
    job_nodes_.push_back(node_id);

    // edges: dependency -> dependent
    for (const auto &need : job.needs) {
        if (need == job.name)
            return std::unexpected(std::format("Job '{}' needs itself", job.name));
        size_t dep_id = get_or_create_node(need);
        nodes_[dep_id].out_edges.push_back(node_id);
    }

    jobs_.push_back(std::move(job));
    return job_id;
}

std::optional<size_t> JobGraph::find_job(std::string_view name) const {
    if (auto it = index_.find(std::string(name)); it != index_.end())
        return nodes_[it->second].job_id;
    return std::nullopt;
}

std::vector<size_t> JobGraph::dependencies(size_t job_id) const {
    std::vector<size_t> deps;
    for (const auto &need : jobs_[job_id].needs) {
        if (auto dep = find_job(need); dep && std::ranges::find(deps, *dep) == deps.end())
            deps.push_back(*dep);
    }
    return deps;
}

Result<void> JobGraph::validate() const {
    for (const auto &job : jobs_) {
        for (const auto &need : job.needs) {
            if (!find_job(need).has_value())
                return std::unexpected(std::format("Job '{}' needs undefined job '{}'", job.name, need));
        }
    }
    if (auto order = topo_sort(); !order)
        return std::unexpected(order.error());
    return {};
}

Result<std::vector<size_t>> JobGraph::topo_sort() const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::vector<STATUS> status(nodes_.size(), STATUS::UNSTARTED);
    std::vector<size_t> order;
    order.reserve(nodes_.size());

    std::function<Result<void>(size_t)> dfs = [&](size_t u) -> Result<void> {
        status[u] = STATUS::WORKING;
        for (size_t v : nodes_[u].out_edges) {
            if (status[v] == STATUS::UNSTARTED) {
                if (auto res = dfs(v); !res)
                    return res;
            } else if (status[v] == STATUS::WORKING) {
                return std::unexpected(std::format("Cycle detected in the job graph at: {}", nodes_[v].name));
            }
        }
        status[u] = STATUS::FINISHED;
        order.push_back(u);
        return {};
    };

    // Reverse declaration order here keeps independent jobs in declaration order below.
    for (auto it = job_nodes_.rbegin(); it != job_nodes_.rend(); ++it) {
        size_t node_id = *it;
        if (status[node_id] == STATUS::UNSTARTED) {
            if (auto res = dfs(node_id); !res)
                return std::unexpected(res.error());
        }
    }

    std::reverse(order.begin(), order.end());

    std::vector<size_t> job_order;
    job_order.reserve(jobs_.size());
    for (size_t node_id : order) {
        if (nodes_[node_id].job_id.has_value())
            job_order.push_back(*nodes_[node_id].job_id);
    }
    return job_order;
}

} // namespace caravel
