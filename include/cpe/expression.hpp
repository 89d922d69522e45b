#pragma once

#include "cpe/utility.hpp"

#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace caravel {

using ExprValue = std::variant<std::monostate, bool, double, std::string>;

/**
 * @brief Named scopes visible to `${{ }}` expressions and `if` conditions.
 *
 * A scope is a flat key/value table, e.g. `matrix`, `github`, `env`, `secrets`,
 * `runner`. Lookups of unknown keys yield null.
 */
class ExprContext {
public:
    void set(std::string_view scope, std::string_view key, std::string value);
    void set_scope(std::string_view scope, const std::map<std::string, std::string> &values);

    ExprValue lookup(std::string_view scope, std::string_view key) const;

    // Values of the `secrets` scope, for masking console output.
    std::vector<std::string> secret_values() const;

private:
    std::map<std::string, std::map<std::string, std::string>, std::less<>> scopes_;
};

bool truthy(const ExprValue &value);
std::string to_display(const ExprValue &value);

Result<ExprValue> evaluate(std::string_view expr, const ExprContext &ctx);

// Accepts both `a == b` and `${{ a == b }}`; an empty condition is true.
Result<bool> evaluate_condition(std::string_view expr, const ExprContext &ctx);

// Replaces every `${{ expr }}` occurrence in `text`.
Result<std::string> interpolate(std::string_view text, const ExprContext &ctx);

} // namespace caravel
