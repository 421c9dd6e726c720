#pragma once

#include <blueprint/core/Error.hpp>
#include <blueprint/document/Document.hpp>

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace BP::Document {

struct ValidationIssue {
    enum class Kind {
        MissingRequiredField,
        InvalidType,
        InvalidEnumValue,
        InvalidFormat,
        UnknownComponentType,
        UnknownActionType,
        MutuallyExclusiveFields,
        InvalidRange,
        UnsupportedVersion
    };

    Kind        kind;
    std::string path;    // e.g. "root.children[0].styleId"
    std::string message;
};

[[nodiscard]] auto issueKindName(ValidationIssue::Kind kind) -> std::string_view;

// All problems found in one pass; errors block loading, warnings do not.
struct ValidationResult {
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;

    [[nodiscard]] auto isValid() const -> bool { return errors.empty(); }
    [[nodiscard]] auto summary() const -> std::string;
};

[[nodiscard]] auto Validate(nlohmann::json const& json) -> ValidationResult;

// Decodes a document that already passed validation. Fields of the wrong type
// are treated as absent.
[[nodiscard]] auto Decode(nlohmann::json const& json) -> Expected<Definition>;

// Parse, validate, decode. Any validation error yields ValidationFailed with
// every issue listed in the message.
[[nodiscard]] auto LoadJson(nlohmann::json const& json) -> Expected<Definition>;
[[nodiscard]] auto Load(std::string_view text) -> Expected<Definition>;

} // namespace BP::Document
