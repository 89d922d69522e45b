#include "cpe/process_exec.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace caravel {

std::vector<std::string> current_environment() {
    std::vector<std::string> out;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry)
        out.emplace_back(*entry);
    return out;
}

Result<int> process_exec(std::vector<std::string> args, const ProcessOptions &options) {
    if (args.empty())
        return std::unexpected("process_exec: empty command");

    // Everything the child touches is prepared before fork.
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (auto &arg : args)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = options.env;
    std::vector<char *> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto &kv : env_storage)
        envp.push_back(kv.data());
    envp.push_back(nullptr);

    const std::string cwd = options.cwd.string();

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1)
        return std::unexpected(std::format("pipe failed: {}", std::strerror(errno)));

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        return std::unexpected(std::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull != -1)
            dup2(devnull, STDIN_FILENO);

        if (!cwd.empty() && chdir(cwd.c_str()) == -1) {
            static constexpr char msg[] = "cpe: cannot enter working directory\n";
            (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
            _exit(127);
        }
        if (env_storage.empty())
            execvp(argv[0], argv.data());
        else
            execvpe(argv[0], argv.data(), envp.data());

        static constexpr char msg[] = "cpe: exec failed\n";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }

    close(fds[1]);

    std::string pending;
    std::array<char, 4096> buffer;
    while (true) {
        ssize_t n = read(fds[0], buffer.data(), buffer.size());
        if (n == -1 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        pending.append(buffer.data(), static_cast<size_t>(n));

        size_t start = 0;
        size_t nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            if (options.on_line)
                options.on_line(std::string_view(pending).substr(start, nl - start));
            start = nl + 1;
        }
        pending.erase(0, start);
    }
    if (!pending.empty() && options.on_line)
        options.on_line(pending);
    close(fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR)
            return std::unexpected(std::format("waitpid failed: {}", std::strerror(errno)));
    }

    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return 1;
}

} // namespace caravel
