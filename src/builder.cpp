#include "cpe/builder.hpp"

namespace caravel {

Result<void> PipelineBuilder::add_job(Job &&job) {
    auto res = graph_.add_job(std::move(job));
    if (!res)
        return std::unexpected(res.error());
    return {};
}

} // namespace caravel
