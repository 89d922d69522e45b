#include "tests/test_suite.hpp"

#include <iostream>
#include <print>
#include <string_view>

struct TestCase {
    std::string_view name;
    bool (*fn)();
};

int main(int argc, char **argv) {
    static constexpr TestCase tests[] = {
        {"expression", expression_test},
        {"interpolation", interpolation_test},
        {"trigger_filter", trigger_filter_test},
        {"job_condition", job_condition_test},
        {"matrix_expansion", matrix_expansion_test},
        {"matrix_edge_cases", matrix_edge_cases_test},
        {"graph_order", graph_order_test},
        {"graph_validation", graph_validation_test},
        {"state_machine", state_machine_test},
        {"parser", parser_test},
        {"parser_rejects", parser_rejects_test},
        {"flatten", flatten_test},
        {"flatten_same_name", flatten_same_name_test},
        {"artifact_store", artifact_store_test},
        {"artifact_conflict", artifact_conflict_test},
        {"release_naming", release_naming_test},
        {"git_tag_service", git_tag_service_test},
        {"local_release", local_release_test},
        {"run_counter", run_counter_test},
        {"action_registry", action_registry_test},
        {"builtin_actions", builtin_actions_test},
        {"console_mask", console_mask_test},
        {"integration", integration_test},
        {"failed_context", failed_context_test},
        {"pull_request", pull_request_test},
        {"step_env", step_env_test},
        {"dry_run", dry_run_test},
        {"relative_workspace", relative_workspace_test},
        {"example_pipeline", example_pipeline_test},
    };

    // Optional filter: run only tests whose name contains argv[1].
    std::string_view filter = argc > 1 ? argv[1] : "";

    int failed = 0;
    int ran = 0;
    for (const auto &test : tests) {
        if (!filter.empty() && test.name.find(filter) == std::string_view::npos)
            continue;
        ++ran;
        std::println("=== {} ===", test.name);
        if (test.fn()) {
            std::println("--- PASS {}", test.name);
        } else {
            std::println(std::cerr, "--- FAIL {}", test.name);
            ++failed;
        }
    }

    std::println("{} tests, {} failed", ran, failed);
    return failed == 0 ? 0 : 1;
}
