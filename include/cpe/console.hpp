#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace caravel {

// Serialises output from concurrently running contexts. Escape sequences go to
// the controlling terminal only, so redirected stdout stays plain.
class Console {
public:
    explicit Console(std::vector<std::string> secrets = {});

    // "[3/5] build -> build (ubuntu-latest, 3.12)"
    void progress(size_t done, size_t total, std::string_view job, std::string_view context);
    void step(std::string_view context, std::string_view name);
    void output(std::string_view context, std::string_view line);
    void info(std::string_view message);
    void error(std::string_view message);

    // Replaces every secret value with "***".
    std::string mask(std::string_view text) const;

private:
    std::mutex mtx_;
    std::ofstream tty_;
    std::vector<std::string> secrets_;
};

} // namespace caravel
