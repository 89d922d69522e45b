#pragma once

#include "cpe/builder.hpp"
#include "cpe/utility.hpp"

#include <filesystem>
#include <string_view>

namespace caravel {

/**
 * @brief Parses a JSON pipeline file.
 *
 * Top-level keys: `name`, `on`, `env`, `jobs`. Object key order is kept, so jobs,
 * matrix axes and their values expand in the order they are written. The job graph
 * is validated (undefined `needs`, cycles) before returning.
 *
 * @param builder The builder to populate with the trigger, env and jobs.
 * @param path The pipeline file (typically "cpe.json").
 * @return Success or error.
 */
Result<void> parse(PipelineBuilder &builder, const std::filesystem::path &path);

// Same as parse() for an in-memory document.
Result<void> parse_string(PipelineBuilder &builder, std::string_view content);

} // namespace caravel
