#include "tests/testing_utils.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <unistd.h>

void create_file(const std::filesystem::path &path, const std::string &content) {
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path());
    std::ofstream f(path);
    f << content;
    f.close();
}

std::string read_file(const std::filesystem::path &path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

ScratchDir::ScratchDir(const std::string &name) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() / std::format("cpe-{}-{}-{}", name, getpid(), counter++);
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
}

ScratchDir::~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}
