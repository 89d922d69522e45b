#include "cpe/builder.hpp"
#include "cpe/executor.hpp"
#include "cpe/parser.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <print>
#include <string>
#include <string_view>

using namespace caravel;

namespace {

constexpr int exit_failed = 1;
constexpr int exit_usage = 2;

void print_usage(const char *prog) {
    std::println("Caravel Pipeline Executor\n");
    std::println("Usage: {} [options] [pipeline.json]\n", prog);
    std::println("Options:");
    std::println("  --event NAME        Triggering event: push or pull_request (default: push)");
    std::println("  --branch NAME       Branch the event refers to (default: main)");
    std::println("  --run-number N      Use N instead of the persisted run counter");
    std::println("  --source DIR        Repository checked out by the checkout step (default: .)");
    std::println("  --workspace DIR     Per-run working directories (default: .cpe/work)");
    std::println("  --state DIR         Run counter, artifacts and releases (default: .cpe/state)");
    std::println("  -j, --jobs N        Contexts run in parallel (default: hardware threads)");
    std::println("  -n, --dry-run       Evaluate triggers and matrices without running steps");
    std::println("  --no-push           Create tags locally without pushing them");
    std::println("  --remote NAME       Remote tags are pushed to (default: origin)");
    std::println("  --secret NAME       Expose environment variable NAME as secrets.NAME");
    std::println("  --graph             Print the job graph in Graphviz format and exit");
    std::println("  --report FILE       Write a JSON run report to FILE");
    std::println("  --clean             Remove the workspace directory and exit");
    std::println("  -h, --help          Show this help");
}

bool parse_number(std::string_view text, uint64_t &out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

int main(int argc, char **argv) {
    ExecutorConfig config;
    std::string event_name = "push";
    std::filesystem::path report_path;
    bool graph = false;
    bool clean = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        auto value = [&](std::string_view flag) -> const char * {
            if (i + 1 >= argc) {
                std::println(std::cerr, "error: {} requires a value", flag);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-n" || arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "--graph") {
            graph = true;
        } else if (arg == "--clean") {
            clean = true;
        } else if (arg == "--no-push") {
            config.push_tags = false;
        } else if (arg == "--event" || arg == "--branch" || arg == "--run-number" || arg == "--source" ||
                   arg == "--workspace" || arg == "--state" || arg == "-j" || arg == "--jobs" ||
                   arg == "--remote" || arg == "--secret" || arg == "--report") {
            const char *v = value(arg);
            if (v == nullptr)
                return exit_usage;

            if (arg == "--event") {
                event_name = v;
            } else if (arg == "--branch") {
                config.event.branch = v;
            } else if (arg == "--run-number") {
                uint64_t n = 0;
                if (!parse_number(v, n)) {
                    std::println(std::cerr, "error: invalid run number '{}'", v);
                    return exit_usage;
                }
                config.run_number = n;
            } else if (arg == "--source") {
                config.source_dir = v;
            } else if (arg == "--workspace") {
                config.workspace_dir = v;
            } else if (arg == "--state") {
                config.state_dir = v;
            } else if (arg == "-j" || arg == "--jobs") {
                uint64_t n = 0;
                if (!parse_number(v, n) || n == 0) {
                    std::println(std::cerr, "error: invalid job count '{}'", v);
                    return exit_usage;
                }
                config.jobs = n;
            } else if (arg == "--remote") {
                config.remote = v;
            } else if (arg == "--report") {
                report_path = v;
            } else {
                const char *secret = std::getenv(v);
                if (secret == nullptr) {
                    std::println(std::cerr, "error: secret '{}' is not set in the environment", v);
                    return exit_usage;
                }
                config.secrets.insert_or_assign(v, secret);
            }
        } else if (arg.starts_with("-")) {
            std::println(std::cerr, "error: unknown option '{}'", arg);
            print_usage(argv[0]);
            return exit_usage;
        } else {
            config.pipeline_file = arg;
        }
    }

    config.event.kind = parse_event_kind(event_name);

    PipelineBuilder builder;
    if (!clean) {
        if (auto res = parse(builder, config.pipeline_file); !res) {
            std::println(std::cerr, "error: {}", res.error());
            return exit_usage;
        }
    }

    Executor executor(std::move(builder), config);

    if (clean) {
        if (auto res = executor.clean(); !res) {
            std::println(std::cerr, "error: {}", res.error());
            return exit_failed;
        }
        return 0;
    }

    if (graph) {
        if (auto res = executor.emit_graph(); !res) {
            std::println(std::cerr, "error: {}", res.error());
            return exit_usage;
        }
        return 0;
    }

    auto report = executor.execute();
    if (!report) {
        std::println(std::cerr, "error: {}", report.error());
        return exit_usage;
    }

    if (!report_path.empty()) {
        if (auto res = executor.emit_report(*report, report_path); !res) {
            std::println(std::cerr, "error: {}", res.error());
            return exit_failed;
        }
    }

    return report->succeeded ? 0 : exit_failed;
}
