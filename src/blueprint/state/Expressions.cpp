#include <blueprint/state/Expressions.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace BP::Expressions {
namespace {

[[nodiscard]] auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

[[nodiscard]] auto is_quoted(std::string_view text) -> bool {
    return text.size() >= 2 && (text.front() == '\'' || text.front() == '"') && text.back() == text.front();
}

[[nodiscard]] auto strip_quotes(std::string_view text) -> std::string_view {
    text = trim(text);
    if (is_quoted(text)) {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

[[nodiscard]] auto parse_int(std::string_view text) -> std::optional<std::int64_t> {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    std::int64_t value = 0;
    auto [end, ec]     = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] auto parse_double(std::string_view text) -> std::optional<double> {
    text = trim(text);
    double value   = 0.0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// A bare keypath: identifiers, digits, dots and brackets only.
[[nodiscard]] auto is_path(std::string_view text) -> bool {
    if (text.empty()) {
        return false;
    }
    return std::ranges::all_of(text, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '[' || c == ']' || c == '-';
    });
}

// Position of `target` outside single or double quotes, searching from `from`.
[[nodiscard]] auto find_unquoted(std::string_view text, char target, std::size_t from = 0) -> std::size_t {
    char quote = 0;
    for (std::size_t i = from; i < text.size(); ++i) {
        char c = text[i];
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == target) {
            return i;
        }
    }
    return std::string_view::npos;
}

[[nodiscard]] auto unwrap_view(std::string_view text) -> std::string_view {
    text = trim(text);
    if (text.starts_with("${") && text.ends_with("}")) {
        return trim(text.substr(2, text.size() - 3));
    }
    return text;
}

[[nodiscard]] auto is_truthy(Value const& value) -> bool {
    switch (value.kind()) {
    case Value::Kind::Null:
        return false;
    case Value::Kind::Bool:
        return *value.asBool();
    case Value::Kind::Int:
        return *value.asInt() != 0;
    case Value::Kind::Double:
        return *value.asDouble() != 0.0;
    case Value::Kind::String:
        return !value.asString()->empty();
    case Value::Kind::Array:
        return !value.asArray()->empty();
    case Value::Kind::Object:
        return !value.asObject()->empty();
    }
    return false;
}

// Literal or path operand of contains(...).
[[nodiscard]] auto operand_value(std::string_view operand, StateReader const& state) -> Value {
    operand = trim(operand);
    if (is_quoted(operand)) {
        return Value{std::string{strip_quotes(operand)}};
    }
    if (operand == "true") {
        return Value{true};
    }
    if (operand == "false") {
        return Value{false};
    }
    if (auto asInt = parse_int(operand)) {
        return Value{*asInt};
    }
    if (auto asDouble = parse_double(operand)) {
        return Value{*asDouble};
    }
    auto path = unwrap_view(operand);
    if (auto value = state.read(path)) {
        return *value;
    }
    return Value{};
}

// path.count | path.isEmpty | path.first | path.last | path.contains(x)
[[nodiscard]] auto evaluate_array_expression(std::string_view expression, StateReader const& state) -> std::optional<Value> {
    expression = trim(expression);

    if (expression.ends_with(")")) {
        auto open = expression.find(".contains(");
        if (open == std::string_view::npos) {
            return std::nullopt;
        }
        auto path = expression.substr(0, open);
        if (!is_path(path)) {
            return std::nullopt;
        }
        auto argumentStart = open + std::string_view{".contains("}.size();
        auto argument      = expression.substr(argumentStart, expression.size() - argumentStart - 1);
        auto needle        = operand_value(argument, state);
        auto haystack      = state.read(path);
        if (!haystack) {
            return Value{false};
        }
        if (auto const* array = haystack->asArray()) {
            return Value{std::ranges::any_of(*array, [&](Value const& item) { return item.looselyEquals(needle); })};
        }
        if (auto text = haystack->asString(); text && needle.asString()) {
            return Value{text->find(*needle.asString()) != std::string::npos};
        }
        return Value{false};
    }

    auto dot = expression.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return std::nullopt;
    }
    auto path     = expression.substr(0, dot);
    auto accessor = expression.substr(dot + 1);
    if (!is_path(path)) {
        return std::nullopt;
    }
    if (accessor != "count" && accessor != "isEmpty" && accessor != "first" && accessor != "last") {
        return std::nullopt;
    }

    auto value        = state.read(path);
    auto const* array = value ? value->asArray() : nullptr;
    if (accessor == "count") {
        return Value{static_cast<std::int64_t>(array ? array->size() : 0)};
    }
    if (accessor == "isEmpty") {
        return Value{array == nullptr || array->empty()};
    }
    if (array == nullptr || array->empty()) {
        return Value{};
    }
    return accessor == "first" ? array->front() : array->back();
}

[[nodiscard]] auto evaluate_condition(std::string_view condition, StateReader const& state) -> bool {
    condition = unwrap_view(condition);
    if (condition == "true") {
        return true;
    }
    if (condition == "false") {
        return false;
    }
    if (condition.starts_with("!")) {
        return !evaluate_condition(condition.substr(1), state);
    }
    if (auto arrayValue = evaluate_array_expression(condition, state)) {
        return is_truthy(*arrayValue);
    }
    if (!is_path(condition)) {
        bp_log("Unrecognized ternary condition: " + std::string{condition}, "Expression");
        return false;
    }
    auto value = state.read(condition);
    return value && is_truthy(*value);
}

[[nodiscard]] auto evaluate_ternary(std::string_view expression, StateReader const& state) -> std::optional<Value> {
    auto question = find_unquoted(expression, '?');
    if (question == std::string_view::npos) {
        return std::nullopt;
    }
    auto colon = find_unquoted(expression, ':', question + 1);
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    auto condition = trim(expression.substr(0, question));
    auto whenTrue  = expression.substr(question + 1, colon - question - 1);
    auto whenFalse = expression.substr(colon + 1);
    if (condition.empty()) {
        return std::nullopt;
    }
    auto chosen = evaluate_condition(condition, state) ? whenTrue : whenFalse;
    return Value{std::string{strip_quotes(chosen)}};
}

// base + literal (or base - literal), absent when the result does not fit.
[[nodiscard]] auto checked_step(std::int64_t base, std::int64_t literal, bool subtract) -> std::optional<std::int64_t> {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    if (subtract) {
        if ((literal < 0 && base > max + literal) || (literal > 0 && base < min + literal)) {
            return std::nullopt;
        }
        return base - literal;
    }
    if ((literal > 0 && base > max - literal) || (literal < 0 && base < min - literal)) {
        return std::nullopt;
    }
    return base + literal;
}

// ${path} + N or ${path} - N
[[nodiscard]] auto evaluate_arithmetic(std::string_view expression, StateReader const& state) -> std::optional<Value> {
    expression = trim(expression);
    if (!expression.starts_with("${")) {
        return std::nullopt;
    }
    auto close = expression.find('}');
    if (close == std::string_view::npos) {
        return std::nullopt;
    }
    auto path = trim(expression.substr(2, close - 2));
    auto rest = trim(expression.substr(close + 1));
    if (rest.empty() || (rest.front() != '+' && rest.front() != '-') || !is_path(path)) {
        return std::nullopt;
    }
    bool const subtract = rest.front() == '-';
    auto       literal  = parse_int(rest.substr(1));
    if (!literal) {
        return std::nullopt;
    }
    auto const apply = [&](std::int64_t base) -> Value {
        if (auto result = checked_step(base, *literal, subtract)) {
            return Value{*result};
        }
        bp_log("Arithmetic on " + std::string{path} + " overflows", "Expression");
        return Value{};
    };
    auto const applyDouble = [&](double base) -> Value {
        auto const delta = static_cast<double>(*literal);
        return Value{subtract ? base - delta : base + delta};
    };

    auto operand = state.read(path);
    if (!operand || operand->isNull()) {
        return apply(0);
    }
    if (auto asInt = operand->asInt()) {
        return apply(*asInt);
    }
    if (auto asDouble = operand->asDouble()) {
        return applyDouble(*asDouble);
    }
    if (auto text = operand->asString()) {
        if (auto parsed = parse_int(*text)) {
            return apply(*parsed);
        }
        if (auto parsed = parse_double(*text)) {
            return applyDouble(*parsed);
        }
    }
    bp_log("Arithmetic operand is not numeric: " + std::string{path}, "Expression");
    return Value{};
}

[[nodiscard]] auto evaluate_inner(std::string_view inner, StateReader const& state) -> Value {
    inner = trim(inner);
    if (auto ternary = evaluate_ternary(inner, state)) {
        return *ternary;
    }
    if (auto arrayValue = evaluate_array_expression(inner, state)) {
        return *arrayValue;
    }
    if (!is_path(inner)) {
        bp_log("Unrecognized expression: " + std::string{inner}, "Expression");
        return Value{};
    }
    if (auto value = state.read(inner)) {
        return *value;
    }
    return Value{};
}

} // namespace

auto ContainsExpression(std::string_view text) -> bool {
    auto open = text.find("${");
    return open != std::string_view::npos && text.find('}', open) != std::string_view::npos;
}

auto IsPureExpression(std::string_view text) -> bool {
    text = trim(text);
    if (!text.starts_with("${") || !text.ends_with("}")) {
        return false;
    }
    return text.find('}') == text.size() - 1 && text.find("${", 2) == std::string_view::npos;
}

auto UnwrapExpression(std::string_view text) -> std::optional<std::string> {
    if (!IsPureExpression(text)) {
        return std::nullopt;
    }
    return std::string{unwrap_view(text)};
}

auto Interpolate(std::string_view text, StateReader const& state) -> std::string {
    std::string out;
    out.reserve(text.size());
    std::size_t cursor = 0;
    while (cursor < text.size()) {
        auto open = text.find("${", cursor);
        if (open == std::string_view::npos) {
            break;
        }
        auto close = text.find('}', open + 2);
        if (close == std::string_view::npos) {
            break;
        }
        out.append(text.substr(cursor, open - cursor));
        out.append(evaluate_inner(text.substr(open + 2, close - open - 2), state).stringify());
        cursor = close + 1;
    }
    out.append(text.substr(cursor));
    return out;
}

auto IsTruthy(Value const& value) -> bool {
    return is_truthy(value);
}

auto EvaluateCondition(std::string_view condition, StateReader const& state) -> bool {
    return evaluate_condition(condition, state);
}

auto Evaluate(std::string_view expression, StateReader const& state) -> Value {
    auto trimmed = trim(expression);
    if (trimmed.empty()) {
        return Value{};
    }
    if (IsPureExpression(trimmed)) {
        return evaluate_inner(unwrap_view(trimmed), state);
    }
    if (auto ternary = evaluate_ternary(trimmed, state)) {
        return *ternary;
    }
    if (auto arrayValue = evaluate_array_expression(trimmed, state)) {
        return *arrayValue;
    }
    if (auto arithmetic = evaluate_arithmetic(trimmed, state)) {
        return *arithmetic;
    }
    return Value{Interpolate(trimmed, state)};
}

} // namespace BP::Expressions
