#pragma once

#include "cpe/graph.hpp"
#include "cpe/trigger.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace caravel {

class PipelineBuilder {
public:
    Result<void> add_job(Job &&job);

    const JobGraph &graph() const {
        return graph_;
    }
    JobGraph &&emit_graph() {
        return std::move(graph_);
    }

    void set_name(std::string name) {
        name_ = std::move(name);
    }
    const std::string &name() const {
        return name_;
    }

    void add_env(std::string_view key, std::string_view value) {
        env_.insert_or_assign(std::string(key), std::string(value));
    }
    const Environment &env() const {
        return env_;
    }

    TriggerFilter &trigger() {
        return trigger_;
    }
    const TriggerFilter &trigger() const {
        return trigger_;
    }

    friend Result<void> parse(PipelineBuilder &, const std::filesystem::path &);

private:
    JobGraph graph_;
    Environment env_;
    TriggerFilter trigger_;
    std::string name_;
};

} // namespace caravel
