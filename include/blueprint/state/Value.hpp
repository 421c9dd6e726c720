#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace BP {

/**
 * Value: dynamically typed state value.
 *
 * Closed union over null, bool, int, double, string, array and object. The
 * accessors never throw: a mismatched request returns an empty optional (or a
 * null pointer for the container kinds) so that callers can degrade instead of
 * failing.
 */
class Value {
public:
    using Array  = std::vector<Value>;
    using Object = std::map<std::string, Value, std::less<>>;

    enum class Kind { Null, Bool, Int, Double, String, Array, Object };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : storage_(v) {}
    Value(int v) : storage_(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : storage_(v) {}
    Value(double v) : storage_(v) {}
    Value(char const* v) : storage_(std::string{v}) {}
    Value(std::string v) : storage_(std::move(v)) {}
    Value(std::string_view v) : storage_(std::string{v}) {}
    Value(Array v) : storage_(std::move(v)) {}
    Value(Object v) : storage_(std::move(v)) {}

    [[nodiscard]] auto kind() const -> Kind;
    [[nodiscard]] auto isNull() const -> bool { return std::holds_alternative<std::monostate>(storage_); }
    [[nodiscard]] auto isNumber() const -> bool;

    [[nodiscard]] auto asBool() const -> std::optional<bool>;
    [[nodiscard]] auto asInt() const -> std::optional<std::int64_t>;
    [[nodiscard]] auto asDouble() const -> std::optional<double>;
    [[nodiscard]] auto asString() const -> std::optional<std::string>;
    [[nodiscard]] auto asArray() const -> Array const*;
    [[nodiscard]] auto asArray() -> Array*;
    [[nodiscard]] auto asObject() const -> Object const*;
    [[nodiscard]] auto asObject() -> Object*;

    // Text used when the value is substituted into a template.
    [[nodiscard]] auto stringify() const -> std::string;

    // Membership equality used by array helpers: numbers compare by value
    // across int/double, containers never match.
    [[nodiscard]] auto looselyEquals(Value const& other) const -> bool;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto FromJson(nlohmann::json const& json) -> Value;

    friend auto operator==(Value const&, Value const&) -> bool = default;

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string, Array, Object> storage_;
};

[[nodiscard]] auto kindName(Value::Kind kind) -> std::string_view;

} // namespace BP
