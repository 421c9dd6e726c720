#pragma once

#include <blueprint/state/Value.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BP::KeyPath {

// Splits "user.items[2].name" or "user.items.2.name" into its segments.
// Empty segments are dropped.
[[nodiscard]] auto Split(std::string_view path) -> std::vector<std::string>;

// Canonical dot form: "items[0].name" -> "items.0.name".
[[nodiscard]] auto Normalize(std::string_view path) -> std::string;

[[nodiscard]] auto Join(std::vector<std::string> const& segments, std::size_t count) -> std::string;

// Numeric segment used as an array index.
[[nodiscard]] auto AsIndex(std::string_view segment) -> std::optional<std::size_t>;

// "a.b.c" -> {"a", "a.b"}
[[nodiscard]] auto Ancestors(std::string_view normalizedPath) -> std::vector<std::string>;

// True when `ancestor` equals `path` or is a dot-delimited prefix of it.
[[nodiscard]] auto IsSameOrAncestor(std::string_view ancestor, std::string_view path) -> bool;

// True when either path is the same as, or an ancestor of, the other.
[[nodiscard]] auto Overlaps(std::string_view lhs, std::string_view rhs) -> bool;

// Walks `segments` (from `first` on) through nested objects and arrays.
[[nodiscard]] auto Find(Value const& root, std::vector<std::string> const& segments, std::size_t first = 0) -> Value const*;

// Largest number of null elements a single write may pad an array with.
inline constexpr std::size_t MaxArrayPadding = 4096;

// Walks to the slot for `segments`, creating objects for named segments and
// arrays (padded with null) for numeric ones. Returns nullptr, leaving `root`
// untouched, when an index lies more than MaxArrayPadding past the end.
[[nodiscard]] auto Ensure(Value& root, std::vector<std::string> const& segments) -> Value*;

} // namespace BP::KeyPath
