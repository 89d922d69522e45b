#include "cpe/expression.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace caravel {

void ExprContext::set(std::string_view scope, std::string_view key, std::string value) {
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) {
        it = scopes_.emplace(std::string(scope), std::map<std::string, std::string>{}).first;
    }
    it->second.insert_or_assign(std::string(key), std::move(value));
}

void ExprContext::set_scope(std::string_view scope, const std::map<std::string, std::string> &values) {
    for (const auto &[key, value] : values) {
        set(scope, key, value);
    }
}

ExprValue ExprContext::lookup(std::string_view scope, std::string_view key) const {
    auto it = scopes_.find(scope);
    if (it == scopes_.end())
        return std::monostate{};
    if (auto value = it->second.find(std::string(key)); value != it->second.end())
        return value->second;
    return std::monostate{};
}

std::vector<std::string> ExprContext::secret_values() const {
    std::vector<std::string> values;
    if (auto it = scopes_.find(std::string_view("secrets")); it != scopes_.end()) {
        for (const auto &[key, value] : it->second) {
            if (!value.empty())
                values.push_back(value);
        }
    }
    return values;
}

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

std::string lowered(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

double to_number(const ExprValue &value) {
    if (std::holds_alternative<std::monostate>(value))
        return 0;
    if (const auto *b = std::get_if<bool>(&value))
        return *b ? 1 : 0;
    if (const auto *d = std::get_if<double>(&value))
        return *d;

    const auto &s = std::get<std::string>(value);
    auto first = s.find_first_not_of(" \t\n");
    if (first == std::string::npos)
        return 0;
    auto last = s.find_last_not_of(" \t\n");
    std::string_view trimmed(s.data() + first, last - first + 1);
    double out = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), out);
    if (ec != std::errc{} || ptr != trimmed.data() + trimmed.size())
        return std::numeric_limits<double>::quiet_NaN();
    return out;
}

bool loose_equals(const ExprValue &a, const ExprValue &b) {
    if (a.index() == b.index()) {
        if (const auto *s = std::get_if<std::string>(&a))
            return iequals(*s, std::get<std::string>(b));
        return a == b;
    }
    // Mixed types compare numerically; NaN never equals anything.
    return to_number(a) == to_number(b);
}

enum class Tok : uint8_t {
    End,
    Ident,
    String,
    Number,
    LParen,
    RParen,
    LBracket,
    RBracket,
    Dot,
    Comma,
    Not,
    And,
    Or,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

struct Token {
    Tok kind;
    std::string text;
};

Result<std::vector<Token>> tokenize(std::string_view src) {
    std::vector<Token> out;
    size_t i = 0;
    auto is_ident = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-'; };

    while (i < src.size()) {
        char c = src[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        auto two = src.substr(i, 2);
        if (two == "&&") {
            out.push_back({Tok::And, {}});
            i += 2;
        } else if (two == "||") {
            out.push_back({Tok::Or, {}});
            i += 2;
        } else if (two == "==") {
            out.push_back({Tok::Eq, {}});
            i += 2;
        } else if (two == "!=") {
            out.push_back({Tok::Ne, {}});
            i += 2;
        } else if (two == "<=") {
            out.push_back({Tok::Le, {}});
            i += 2;
        } else if (two == ">=") {
            out.push_back({Tok::Ge, {}});
            i += 2;
        } else if (c == '<' || c == '>' || c == '!' || c == '(' || c == ')' || c == '[' || c == ']' || c == '.' ||
                   c == ',') {
            static constexpr std::string_view singles = "<>!()[].,";
            static constexpr Tok kinds[] = {Tok::Lt,       Tok::Gt,       Tok::Not, Tok::LParen,
                                            Tok::RParen,   Tok::LBracket, Tok::RBracket,
                                            Tok::Dot,      Tok::Comma};
            out.push_back({kinds[singles.find(c)], {}});
            ++i;
        } else if (c == '\'') {
            // '' escapes a quote inside a literal
            std::string text;
            ++i;
            bool closed = false;
            while (i < src.size()) {
                if (src[i] == '\'') {
                    if (i + 1 < src.size() && src[i + 1] == '\'') {
                        text += '\'';
                        i += 2;
                        continue;
                    }
                    closed = true;
                    ++i;
                    break;
                }
                text += src[i++];
            }
            if (!closed)
                return std::unexpected(std::format("Unterminated string literal in expression: {}", src));
            out.push_back({Tok::String, std::move(text)});
        } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                   (c == '-' && i + 1 < src.size() && std::isdigit(static_cast<unsigned char>(src[i + 1])))) {
            size_t start = i++;
            while (i < src.size() && (std::isdigit(static_cast<unsigned char>(src[i])) || src[i] == '.'))
                ++i;
            out.push_back({Tok::Number, std::string(src.substr(start, i - start))});
        } else if (is_ident(c)) {
            size_t start = i;
            while (i < src.size() && is_ident(src[i]))
                ++i;
            out.push_back({Tok::Ident, std::string(src.substr(start, i - start))});
        } else {
            return std::unexpected(std::format("Unexpected character '{}' in expression: {}", c, src));
        }
    }
    out.push_back({Tok::End, {}});
    return out;
}

class Parser {
public:
    Parser(std::vector<Token> tokens, const ExprContext &ctx, std::string_view src)
        : tokens_(std::move(tokens)), ctx_(ctx), src_(src) {
    }

    Result<ExprValue> run() {
        auto value = parse_or();
        if (!value)
            return value;
        if (peek().kind != Tok::End)
            return error("Unexpected trailing tokens");
        return value;
    }

private:
    const Token &peek() const {
        return tokens_[pos_];
    }
    const Token &next() {
        return tokens_[pos_++];
    }
    bool accept(Tok kind) {
        if (peek().kind != kind)
            return false;
        ++pos_;
        return true;
    }
    std::unexpected<std::string> error(std::string_view what) const {
        return std::unexpected(std::format("{} in expression: {}", what, src_));
    }

    // `||` and `&&` yield an operand, not a bool
    Result<ExprValue> parse_or() {
        auto lhs = parse_and();
        if (!lhs)
            return lhs;
        while (accept(Tok::Or)) {
            auto rhs = parse_and();
            if (!rhs)
                return rhs;
            if (!truthy(*lhs))
                lhs = std::move(rhs);
        }
        return lhs;
    }

    Result<ExprValue> parse_and() {
        auto lhs = parse_comparison();
        if (!lhs)
            return lhs;
        while (accept(Tok::And)) {
            auto rhs = parse_comparison();
            if (!rhs)
                return rhs;
            if (truthy(*lhs))
                lhs = std::move(rhs);
        }
        return lhs;
    }

    Result<ExprValue> parse_comparison() {
        auto lhs = parse_unary();
        if (!lhs)
            return lhs;
        Tok op = peek().kind;
        if (op != Tok::Eq && op != Tok::Ne && op != Tok::Lt && op != Tok::Le && op != Tok::Gt && op != Tok::Ge)
            return lhs;
        ++pos_;
        auto rhs = parse_unary();
        if (!rhs)
            return rhs;

        if (op == Tok::Eq)
            return ExprValue{loose_equals(*lhs, *rhs)};
        if (op == Tok::Ne)
            return ExprValue{!loose_equals(*lhs, *rhs)};

        bool both_strings = std::holds_alternative<std::string>(*lhs) && std::holds_alternative<std::string>(*rhs);
        int cmp = 0;
        if (both_strings) {
            auto a = lowered(std::get<std::string>(*lhs));
            auto b = lowered(std::get<std::string>(*rhs));
            cmp = a < b ? -1 : (a > b ? 1 : 0);
        } else {
            double a = to_number(*lhs);
            double b = to_number(*rhs);
            if (std::isnan(a) || std::isnan(b))
                return ExprValue{false};
            cmp = a < b ? -1 : (a > b ? 1 : 0);
        }
        switch (op) {
        case Tok::Lt:
            return ExprValue{cmp < 0};
        case Tok::Le:
            return ExprValue{cmp <= 0};
        case Tok::Gt:
            return ExprValue{cmp > 0};
        default:
            return ExprValue{cmp >= 0};
        }
    }

    Result<ExprValue> parse_unary() {
        if (accept(Tok::Not)) {
            auto value = parse_unary();
            if (!value)
                return value;
            return ExprValue{!truthy(*value)};
        }
        return parse_primary();
    }

    Result<ExprValue> parse_primary() {
        const Token &tok = next();
        switch (tok.kind) {
        case Tok::String:
            return ExprValue{tok.text};
        case Tok::Number: {
            double out = 0;
            auto [ptr, ec] = std::from_chars(tok.text.data(), tok.text.data() + tok.text.size(), out);
            if (ec != std::errc{} || ptr != tok.text.data() + tok.text.size())
                return error(std::format("Malformed number '{}'", tok.text));
            return ExprValue{out};
        }
        case Tok::LParen: {
            auto value = parse_or();
            if (!value)
                return value;
            if (!accept(Tok::RParen))
                return error("Missing ')'");
            return value;
        }
        case Tok::Ident:
            return parse_identifier(tok.text);
        default:
            return error("Unexpected token");
        }
    }

    Result<ExprValue> parse_identifier(const std::string &name) {
        if (name == "true")
            return ExprValue{true};
        if (name == "false")
            return ExprValue{false};
        if (name == "null")
            return ExprValue{};

        if (accept(Tok::LParen))
            return parse_call(name);

        std::string key;
        if (accept(Tok::Dot)) {
            if (peek().kind != Tok::Ident)
                return error("Expected property name after '.'");
            key = next().text;
        } else if (accept(Tok::LBracket)) {
            if (peek().kind != Tok::String)
                return error("Expected string index");
            key = next().text;
            if (!accept(Tok::RBracket))
                return error("Missing ']'");
        } else {
            return error(std::format("Bare context '{}' is not a value", name));
        }
        if (peek().kind == Tok::Dot || peek().kind == Tok::LBracket)
            return error("Nested property access is not supported");
        return ctx_.lookup(name, key);
    }

    Result<ExprValue> parse_call(const std::string &name) {
        std::vector<ExprValue> args;
        if (!accept(Tok::RParen)) {
            while (true) {
                auto arg = parse_or();
                if (!arg)
                    return arg;
                args.push_back(std::move(*arg));
                if (accept(Tok::RParen))
                    break;
                if (!accept(Tok::Comma))
                    return error("Expected ',' or ')' in argument list");
            }
        }

        auto fname = lowered(name);
        if (fname == "startswith" || fname == "endswith" || fname == "contains") {
            if (args.size() != 2)
                return error(std::format("{} expects 2 arguments", name));
            auto hay = lowered(to_display(args[0]));
            auto needle = lowered(to_display(args[1]));
            if (fname == "startswith")
                return ExprValue{hay.starts_with(needle)};
            if (fname == "endswith")
                return ExprValue{hay.ends_with(needle)};
            return ExprValue{hay.find(needle) != std::string::npos};
        }
        if (fname == "format") {
            if (args.empty())
                return error("format expects at least 1 argument");
            return format_call(args);
        }
        return error(std::format("Unknown function '{}'", name));
    }

    Result<ExprValue> format_call(const std::vector<ExprValue> &args) {
        const std::string pattern = to_display(args[0]);
        std::string out;
        for (size_t i = 0; i < pattern.size(); ++i) {
            char c = pattern[i];
            if (c == '{' && i + 1 < pattern.size() && pattern[i + 1] == '{') {
                out += '{';
                ++i;
            } else if (c == '}' && i + 1 < pattern.size() && pattern[i + 1] == '}') {
                out += '}';
                ++i;
            } else if (c == '{') {
                size_t close = pattern.find('}', i);
                if (close == std::string::npos)
                    return error("Unterminated placeholder in format()");
                size_t index = 0;
                auto digits = std::string_view(pattern).substr(i + 1, close - i - 1);
                auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
                if (ec != std::errc{} || ptr != digits.data() + digits.size() || index + 1 >= args.size())
                    return error("Bad placeholder in format()");
                out += to_display(args[index + 1]);
                i = close;
            } else {
                out += c;
            }
        }
        return ExprValue{std::move(out)};
    }

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    const ExprContext &ctx_;
    std::string_view src_;
};

std::string_view strip_braces(std::string_view expr) {
    auto first = expr.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    auto last = expr.find_last_not_of(" \t\r\n");
    expr = expr.substr(first, last - first + 1);
    if (expr.starts_with("${{") && expr.ends_with("}}") && expr.size() >= 5)
        return expr.substr(3, expr.size() - 5);
    return expr;
}

} // namespace

bool truthy(const ExprValue &value) {
    if (std::holds_alternative<std::monostate>(value))
        return false;
    if (const auto *b = std::get_if<bool>(&value))
        return *b;
    if (const auto *d = std::get_if<double>(&value))
        return *d != 0 && !std::isnan(*d);
    return !std::get<std::string>(value).empty();
}

std::string to_display(const ExprValue &value) {
    if (std::holds_alternative<std::monostate>(value))
        return "";
    if (const auto *b = std::get_if<bool>(&value))
        return *b ? "true" : "false";
    if (const auto *d = std::get_if<double>(&value)) {
        if (std::isfinite(*d) && std::trunc(*d) == *d && std::fabs(*d) < 1e15)
            return std::to_string(static_cast<int64_t>(*d));
        return std::format("{}", *d);
    }
    return std::get<std::string>(value);
}

Result<ExprValue> evaluate(std::string_view expr, const ExprContext &ctx) {
    auto tokens = tokenize(expr);
    if (!tokens)
        return std::unexpected(tokens.error());
    if (tokens->size() == 1)
        return std::unexpected(std::format("Empty expression: '{}'", expr));
    Parser parser(std::move(*tokens), ctx, expr);
    return parser.run();
}

Result<bool> evaluate_condition(std::string_view expr, const ExprContext &ctx) {
    auto body = strip_braces(expr);
    if (body.empty())
        return true;
    auto value = evaluate(body, ctx);
    if (!value)
        return std::unexpected(value.error());
    return truthy(*value);
}

Result<std::string> interpolate(std::string_view text, const ExprContext &ctx) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find("${{", pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));
        size_t close = text.find("}}", open + 3);
        if (close == std::string_view::npos)
            return std::unexpected(std::format("Unterminated '${{{{' in: {}", text));

        auto value = evaluate(text.substr(open + 3, close - open - 3), ctx);
        if (!value)
            return std::unexpected(value.error());
        out += to_display(*value);
        pos = close + 2;
    }
    return out;
}

} // namespace caravel
