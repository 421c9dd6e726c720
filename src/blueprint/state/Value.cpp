#include <blueprint/state/Value.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <cmath>

namespace BP {
namespace {

[[nodiscard]] auto format_double(double value) -> std::string {
    if (!std::isfinite(value)) {
        return std::isnan(value) ? std::string{"nan"} : (value < 0 ? std::string{"-inf"} : std::string{"inf"});
    }
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    std::string text{buffer, end};
    if (text.find_first_of(".eE") == std::string::npos) {
        text.append(".0");
    }
    return text;
}

} // namespace

auto Value::kind() const -> Kind {
    return static_cast<Kind>(storage_.index());
}

auto Value::isNumber() const -> bool {
    return std::holds_alternative<std::int64_t>(storage_) || std::holds_alternative<double>(storage_);
}

auto Value::asBool() const -> std::optional<bool> {
    if (auto const* v = std::get_if<bool>(&storage_)) {
        return *v;
    }
    return std::nullopt;
}

auto Value::asInt() const -> std::optional<std::int64_t> {
    if (auto const* v = std::get_if<std::int64_t>(&storage_)) {
        return *v;
    }
    return std::nullopt;
}

auto Value::asDouble() const -> std::optional<double> {
    if (auto const* v = std::get_if<double>(&storage_)) {
        return *v;
    }
    if (auto const* v = std::get_if<std::int64_t>(&storage_)) {
        return static_cast<double>(*v);
    }
    return std::nullopt;
}

auto Value::asString() const -> std::optional<std::string> {
    if (auto const* v = std::get_if<std::string>(&storage_)) {
        return *v;
    }
    return std::nullopt;
}

auto Value::asArray() const -> Array const* {
    return std::get_if<Array>(&storage_);
}

auto Value::asArray() -> Array* {
    return std::get_if<Array>(&storage_);
}

auto Value::asObject() const -> Object const* {
    return std::get_if<Object>(&storage_);
}

auto Value::asObject() -> Object* {
    return std::get_if<Object>(&storage_);
}

auto Value::stringify() const -> std::string {
    switch (kind()) {
    case Kind::Null:
        return {};
    case Kind::Bool:
        return std::get<bool>(storage_) ? "true" : "false";
    case Kind::Int:
        return std::to_string(std::get<std::int64_t>(storage_));
    case Kind::Double:
        return format_double(std::get<double>(storage_));
    case Kind::String:
        return std::get<std::string>(storage_);
    case Kind::Array:
    case Kind::Object:
        return toJson().dump();
    }
    return {};
}

auto Value::looselyEquals(Value const& other) const -> bool {
    if (isNumber() && other.isNumber()) {
        auto lhsInt = asInt();
        auto rhsInt = other.asInt();
        if (lhsInt && rhsInt) {
            return *lhsInt == *rhsInt;
        }
        return *asDouble() == *other.asDouble();
    }
    switch (kind()) {
    case Kind::Null:
        return other.isNull();
    case Kind::Bool:
        return other.asBool() == asBool();
    case Kind::String:
        return other.kind() == Kind::String && std::get<std::string>(storage_) == std::get<std::string>(other.storage_);
    default:
        return false;
    }
}

auto Value::toJson() const -> nlohmann::json {
    switch (kind()) {
    case Kind::Null:
        return nullptr;
    case Kind::Bool:
        return std::get<bool>(storage_);
    case Kind::Int:
        return std::get<std::int64_t>(storage_);
    case Kind::Double:
        return std::get<double>(storage_);
    case Kind::String:
        return std::get<std::string>(storage_);
    case Kind::Array: {
        auto out = nlohmann::json::array();
        for (auto const& item : std::get<Array>(storage_)) {
            out.push_back(item.toJson());
        }
        return out;
    }
    case Kind::Object: {
        auto out = nlohmann::json::object();
        for (auto const& [key, item] : std::get<Object>(storage_)) {
            out[key] = item.toJson();
        }
        return out;
    }
    }
    return nullptr;
}

auto Value::FromJson(nlohmann::json const& json) -> Value {
    switch (json.type()) {
    case nlohmann::json::value_t::boolean:
        return Value{json.get<bool>()};
    case nlohmann::json::value_t::number_integer:
        return Value{json.get<std::int64_t>()};
    case nlohmann::json::value_t::number_unsigned:
        return Value{static_cast<std::int64_t>(json.get<std::uint64_t>())};
    case nlohmann::json::value_t::number_float:
        return Value{json.get<double>()};
    case nlohmann::json::value_t::string:
        return Value{json.get<std::string>()};
    case nlohmann::json::value_t::array: {
        Array items;
        items.reserve(json.size());
        for (auto const& item : json) {
            items.push_back(FromJson(item));
        }
        return Value{std::move(items)};
    }
    case nlohmann::json::value_t::object: {
        Object fields;
        for (auto it = json.begin(); it != json.end(); ++it) {
            fields.emplace(it.key(), FromJson(it.value()));
        }
        return Value{std::move(fields)};
    }
    default:
        return Value{};
    }
}

auto kindName(Value::Kind kind) -> std::string_view {
    switch (kind) {
    case Value::Kind::Null:
        return "null";
    case Value::Kind::Bool:
        return "bool";
    case Value::Kind::Int:
        return "int";
    case Value::Kind::Double:
        return "double";
    case Value::Kind::String:
        return "string";
    case Value::Kind::Array:
        return "array";
    case Value::Kind::Object:
        return "object";
    }
    return "null";
}

} // namespace BP
