#pragma once

#include "cpe/domain.hpp"
#include "cpe/utility.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace caravel {

class JobGraph {
public:
    // A node exists for every job and every name mentioned in `needs`;
    // job_id is empty for names nobody declared.
    struct Node {
        std::string name;
        std::vector<size_t> out_edges; // dependents
        std::optional<size_t> job_id;
    };

    size_t get_or_create_node(std::string_view name);
    Result<size_t> add_job(Job job);

    const std::vector<Node> &nodes() const {
        return nodes_;
    }
    const std::vector<Job> &jobs() const {
        return jobs_;
    }

    std::optional<size_t> find_job(std::string_view name) const;
    // Job ids named in jobs()[job_id].needs, in declaration order.
    std::vector<size_t> dependencies(size_t job_id) const;

    // Undeclared `needs` targets and cycles.
    Result<void> validate() const;
    Result<std::vector<size_t>> topo_sort() const;

private:
    std::vector<Node> nodes_;
    std::vector<Job> jobs_;
    std::vector<size_t> job_nodes_; // job id -> node id
    std::unordered_map<std::string, size_t> index_;
};

} // namespace caravel
