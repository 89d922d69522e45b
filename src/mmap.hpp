#pragma once

#include "cpe/utility.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <memory>
#include <string_view>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace caravel {

// Read-only view of a whole file; the mapping lives as long as the object.
class MappedFile {
public:
    static Result<std::unique_ptr<MappedFile>> open(const std::filesystem::path &path) {
        auto file = std::make_unique<MappedFile>(Token{});
        file->fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (file->fd_ == -1)
            return std::unexpected(std::format("Failed to open {}: {}", path.string(), std::strerror(errno)));

        struct stat sb;
        if (fstat(file->fd_, &sb) == -1)
            return std::unexpected(std::format("Failed to stat {}: {}", path.string(), std::strerror(errno)));
        if (S_ISDIR(sb.st_mode))
            return std::unexpected(std::format("{} is a directory", path.string()));
        file->size_ = static_cast<size_t>(sb.st_size);

        if (file->size_ == 0)
            return file;

        void *addr = mmap(nullptr, file->size_, PROT_READ, MAP_PRIVATE, file->fd_, 0);
        if (addr == MAP_FAILED)
            return std::unexpected(std::format("Failed to mmap {}: {}", path.string(), std::strerror(errno)));
        file->data_ = static_cast<char *>(addr);
        return file;
    }

    ~MappedFile() {
        if (data_) {
            munmap(data_, size_);
        }
        if (fd_ != -1) {
            close(fd_);
        }
    }

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

private:
    struct Token {};

public:
    explicit MappedFile(Token) {
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

private:
    int fd_ = -1;
    char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace caravel
