#pragma once

#include "cpe/utility.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace caravel {

struct ProcessOptions {
    std::filesystem::path cwd;    // empty: inherit
    std::vector<std::string> env; // "KEY=VALUE"; empty: inherit
    // Receives merged stdout/stderr one line at a time, without the newline.
    std::function<void(std::string_view)> on_line;
};

// Runs args[0] (PATH lookup) and waits for it. Returns the exit code, or
// 128 + signal number if the child was killed. An error means it never ran.
Result<int> process_exec(std::vector<std::string> args, const ProcessOptions &options = {});

// Snapshot of this process's environment as "KEY=VALUE" entries.
std::vector<std::string> current_environment();

} // namespace caravel
