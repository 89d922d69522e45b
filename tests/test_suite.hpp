#pragma once

// expression_test.cpp
bool expression_test();
bool interpolation_test();

// trigger_test.cpp
bool trigger_filter_test();
bool job_condition_test();

// matrix_test.cpp
bool matrix_expansion_test();
bool matrix_edge_cases_test();

// graph_test.cpp
bool graph_order_test();
bool graph_validation_test();
bool state_machine_test();

// parser_test.cpp
bool parser_test();
bool parser_rejects_test();

// flatten_test.cpp
bool flatten_test();
bool flatten_same_name_test();

// artifact_test.cpp
bool artifact_store_test();
bool artifact_conflict_test();

// release_test.cpp
bool release_naming_test();
bool git_tag_service_test();
bool local_release_test();
bool run_counter_test();

// actions_test.cpp
bool action_registry_test();
bool builtin_actions_test();
bool console_mask_test();

// integration.cpp
bool integration_test();
bool failed_context_test();
bool pull_request_test();
bool step_env_test();
bool dry_run_test();
bool relative_workspace_test();
bool example_pipeline_test();
