#pragma once

#include <blueprint/state/StateStore.hpp>
#include <blueprint/state/Value.hpp>

#include <optional>
#include <string>
#include <string_view>

// Small embedded expression language evaluated against state.
//
// Recognized forms:
//   ${path}                      value at path
//   ${path} + N, ${path} - N     one integer step; int stays int, double stays double
//   cond ? 'a' : "b"             cond is path, !path, true, false or an array test
//   path.count, path.isEmpty, path.first, path.last, path.contains(x)
//
// Nothing here throws. Unrecognized input degrades to null or to the
// interpolated text.
namespace BP::Expressions {

[[nodiscard]] auto Evaluate(std::string_view expression, StateReader const& state) -> Value;

// Replaces every ${...} span with the stringified result; absent values become "".
[[nodiscard]] auto Interpolate(std::string_view text, StateReader const& state) -> std::string;

// null, false, 0, "" and empty containers are false.
[[nodiscard]] auto IsTruthy(Value const& value) -> bool;

// A ternary condition on its own: path, !path, true, false, ${path} or an array test.
[[nodiscard]] auto EvaluateCondition(std::string_view condition, StateReader const& state) -> bool;

[[nodiscard]] auto ContainsExpression(std::string_view text) -> bool;

// Exactly one ${...} span covering the whole (trimmed) text.
[[nodiscard]] auto IsPureExpression(std::string_view text) -> bool;

[[nodiscard]] auto UnwrapExpression(std::string_view text) -> std::optional<std::string>;

} // namespace BP::Expressions
