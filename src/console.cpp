#include "cpe/console.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <print>

namespace caravel {

Console::Console(std::vector<std::string> secrets) : secrets_(std::move(secrets)) {
#ifdef __linux__
    tty_.open("/dev/tty");
#endif
    // longest first so overlapping secrets mask fully
    std::ranges::sort(secrets_, [](const auto &a, const auto &b) { return a.size() > b.size(); });
    std::erase_if(secrets_, [](const auto &s) { return s.empty(); });
}

void Console::progress(size_t done, size_t total, std::string_view job, std::string_view context) {
    // NOLINTBEGIN(performance-avoid-endl)
    std::lock_guard lock(mtx_);
    tty_ << "\033[1m" << std::flush;
    std::cout << "[" << done << "/" << total << "] " << std::flush;
    tty_ << "\033[0m\033[1;32m" << std::flush;
    std::cout << job << std::flush;
    tty_ << "\033[0m" << std::flush;
    std::cout << " -> " << context << std::endl;
    // NOLINTEND(performance-avoid-endl)
}

void Console::step(std::string_view context, std::string_view name) {
    std::lock_guard lock(mtx_);
    tty_ << "\033[1;36m" << std::flush;
    std::cout << "  " << context << ": " << std::flush;
    tty_ << "\033[0m" << std::flush;
    std::println("{}", mask(name));
}

void Console::output(std::string_view context, std::string_view line) {
    std::lock_guard lock(mtx_);
    std::println("  [{}] {}", context, mask(line));
}

void Console::info(std::string_view message) {
    std::lock_guard lock(mtx_);
    std::println("{}", mask(message));
}

void Console::error(std::string_view message) {
    std::lock_guard lock(mtx_);
    std::cout << std::flush;
    tty_ << "\033[1;31m" << std::flush;
    std::print(stderr, "error: ");
    tty_ << "\033[0m" << std::flush;
    std::println(stderr, "{}", mask(message));
}

std::string Console::mask(std::string_view text) const {
    std::string out(text);
    for (const auto &secret : secrets_) {
        size_t pos = 0;
        while ((pos = out.find(secret, pos)) != std::string::npos) {
            out.replace(pos, secret.size(), "***");
            pos += 3;
        }
    }
    return out;
}

} // namespace caravel
