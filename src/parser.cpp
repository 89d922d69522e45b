#include "cpe/parser.hpp"

#include "cpe/builder.hpp"
#include "cpe/utility.hpp"
#include "mmap.hpp" // Use our internal mmap header

#include <format>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace caravel {

namespace {

using json = nlohmann::ordered_json;

Result<std::string> scalar(const json &value, std::string_view where) {
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_boolean())
        return std::string(value.get<bool>() ? "true" : "false");
    if (value.is_number())
        return value.dump();
    return std::unexpected(std::format("{}: expected a string, number or boolean", where));
}

Result<std::vector<std::string>> string_list(const json &value, std::string_view where) {
    std::vector<std::string> out;
    if (!value.is_array()) {
        auto single = scalar(value, where);
        if (!single)
            return std::unexpected(single.error());
        out.push_back(std::move(*single));
        return out;
    }
    for (const auto &item : value) {
        auto s = scalar(item, where);
        if (!s)
            return std::unexpected(s.error());
        out.push_back(std::move(*s));
    }
    return out;
}

Result<std::map<std::string, std::string>> string_map(const json &value, std::string_view where) {
    std::map<std::string, std::string> out;
    if (!value.is_object())
        return std::unexpected(std::format("{}: expected an object", where));
    for (const auto &[key, item] : value.items()) {
        auto s = scalar(item, std::format("{}.{}", where, key));
        if (!s)
            return std::unexpected(s.error());
        out.emplace(key, std::move(*s));
    }
    return out;
}

Result<void> parse_trigger(const json &on, TriggerFilter &filter) {
    auto allow = [&](const std::string &event, const json *body) -> Result<void> {
        EventKind kind = parse_event_kind(event);
        if (kind == EventKind::Unknown)
            return std::unexpected(std::format("on: unsupported event '{}'", event));

        if (body == nullptr || body->is_null() || !body->contains("branches")) {
            filter.allow(kind);
            return {};
        }
        auto branches = string_list(body->at("branches"), std::format("on.{}.branches", event));
        if (!branches)
            return std::unexpected(branches.error());
        filter.allow(kind, std::move(*branches));
        return {};
    };

    if (on.is_string())
        return allow(on.get<std::string>(), nullptr);

    if (on.is_array()) {
        for (const auto &event : on) {
            if (!event.is_string())
                return std::unexpected("on: event names must be strings");
            if (auto res = allow(event.get<std::string>(), nullptr); !res)
                return res;
        }
        return {};
    }

    if (on.is_object()) {
        for (const auto &[event, body] : on.items()) {
            if (!body.is_null() && !body.is_object())
                return std::unexpected(std::format("on.{}: expected an object", event));
            if (auto res = allow(event, &body); !res)
                return res;
        }
        return {};
    }
    return std::unexpected("on: expected a string, array or object");
}

Result<Step> parse_step(const json &node, const std::string &job, size_t index) {
    const std::string where = std::format("jobs.{}.steps[{}]", job, index);
    if (!node.is_object())
        return std::unexpected(std::format("{}: expected an object", where));

    bool has_run = node.contains("run");
    bool has_uses = node.contains("uses");
    if (has_run == has_uses)
        return std::unexpected(std::format("{}: exactly one of 'run' or 'uses' is required", where));

    Step step;
    if (has_run) {
        if (!node["run"].is_string())
            return std::unexpected(std::format("{}.run: expected a string", where));
        ShellAction action{node["run"].get<std::string>(), "sh"};
        if (node.contains("shell")) {
            if (!node["shell"].is_string())
                return std::unexpected(std::format("{}.shell: expected a string", where));
            action.shell = node["shell"].get<std::string>();
        }
        if (action.shell != "sh" && action.shell != "bash")
            return std::unexpected(std::format("{}.shell: unsupported shell '{}'", where, action.shell));
        std::string first_line = action.script.substr(0, action.script.find('\n'));
        step.name = std::format("Run {}", first_line);
        step.action = std::move(action);
    } else {
        if (!node["uses"].is_string())
            return std::unexpected(std::format("{}.uses: expected a string", where));
        ExternalAction action{node["uses"].get<std::string>(), {}};
        if (node.contains("with")) {
            auto with = string_map(node["with"], where + ".with");
            if (!with)
                return std::unexpected(with.error());
            action.with = std::move(*with);
        }
        step.name = std::format("Run {}", action.uses);
        step.action = std::move(action);
    }

    if (node.contains("name")) {
        auto name = scalar(node["name"], where + ".name");
        if (!name)
            return std::unexpected(name.error());
        step.name = std::move(*name);
    }
    if (node.contains("if")) {
        auto guard = scalar(node["if"], where + ".if");
        if (!guard)
            return std::unexpected(guard.error());
        step.guard = std::move(*guard);
    }
    if (node.contains("env")) {
        auto env = string_map(node["env"], where + ".env");
        if (!env)
            return std::unexpected(env.error());
        step.env = std::move(*env);
    }
    return step;
}

Result<Job> parse_job(const std::string &name, const json &node) {
    const std::string where = std::format("jobs.{}", name);
    if (!node.is_object())
        return std::unexpected(std::format("{}: expected an object", where));

    Job job;
    job.name = name;

    if (node.contains("if")) {
        auto condition = scalar(node["if"], where + ".if");
        if (!condition)
            return std::unexpected(condition.error());
        job.condition = std::move(*condition);
    }
    if (node.contains("needs")) {
        auto needs = string_list(node["needs"], where + ".needs");
        if (!needs)
            return std::unexpected(needs.error());
        job.needs = std::move(*needs);
    }
    if (node.contains("runs-on")) {
        auto runs_on = scalar(node["runs-on"], where + ".runs-on");
        if (!runs_on)
            return std::unexpected(runs_on.error());
        job.runs_on = std::move(*runs_on);
    }
    if (node.contains("env")) {
        auto env = string_map(node["env"], where + ".env");
        if (!env)
            return std::unexpected(env.error());
        job.env = std::move(*env);
    }

    if (node.contains("strategy")) {
        const json &strategy = node["strategy"];
        if (!strategy.is_object() || !strategy.contains("matrix") || !strategy["matrix"].is_object())
            return std::unexpected(std::format("{}.strategy: expected an object with a 'matrix' object", where));

        for (const auto &[axis, values] : strategy["matrix"].items()) {
            if (axis == "include" || axis == "exclude")
                return std::unexpected(std::format("{}.strategy.matrix: '{}' is not supported", where, axis));
            if (!values.is_array())
                return std::unexpected(std::format("{}.strategy.matrix.{}: expected an array", where, axis));
            auto list = string_list(values, std::format("{}.strategy.matrix.{}", where, axis));
            if (!list)
                return std::unexpected(list.error());
            job.matrix.push_back({axis, std::move(*list)});
        }
    }

    if (!node.contains("steps") || !node["steps"].is_array() || node["steps"].empty())
        return std::unexpected(std::format("{}: 'steps' must be a non-empty array", where));

    size_t index = 0;
    for (const auto &step_node : node["steps"]) {
        auto step = parse_step(step_node, name, index++);
        if (!step)
            return std::unexpected(step.error());
        job.steps.push_back(std::move(*step));
    }
    return job;
}

} // namespace

Result<void> parse_string(PipelineBuilder &builder, std::string_view content) {
    json doc = json::parse(content.begin(), content.end(), nullptr, false);
    if (doc.is_discarded())
        return std::unexpected("Malformed JSON in pipeline definition");
    if (!doc.is_object())
        return std::unexpected("Pipeline definition must be a JSON object");

    if (doc.contains("name")) {
        auto name = scalar(doc["name"], "name");
        if (!name)
            return std::unexpected(name.error());
        builder.set_name(std::move(*name));
    }

    if (!doc.contains("on"))
        return std::unexpected("Pipeline definition has no 'on' block");
    if (auto res = parse_trigger(doc["on"], builder.trigger()); !res)
        return res;

    if (doc.contains("env")) {
        auto env = string_map(doc["env"], "env");
        if (!env)
            return std::unexpected(env.error());
        for (const auto &[key, value] : *env)
            builder.add_env(key, value);
    }

    if (!doc.contains("jobs") || !doc["jobs"].is_object() || doc["jobs"].empty())
        return std::unexpected("Pipeline definition needs a non-empty 'jobs' object");

    for (const auto &[name, node] : doc["jobs"].items()) {
        auto job = parse_job(name, node);
        if (!job)
            return std::unexpected(job.error());
        if (auto res = builder.add_job(std::move(*job)); !res)
            return res;
    }

    return builder.graph().validate();
}

Result<void> parse(PipelineBuilder &builder, const std::filesystem::path &path) {
    auto file = MappedFile::open(path);
    if (!file)
        return std::unexpected(file.error());

    if (builder.name_.empty())
        builder.name_ = path.stem().string();

    auto res = parse_string(builder, (*file)->content());
    if (!res)
        return std::unexpected(std::format("{}: {}", path.string(), res.error()));
    return {};
}

} // namespace caravel
