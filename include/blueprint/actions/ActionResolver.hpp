#pragma once

#include <blueprint/core/Error.hpp>
#include <blueprint/document/Document.hpp>
#include <blueprint/ir/ActionDefinition.hpp>

#include <parallel_hashmap/phmap.h>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

// Turns one wire action kind into a normalized IR::ActionDefinition.
class ActionResolver {
public:
    virtual ~ActionResolver() = default;

    [[nodiscard]] virtual auto kind() const -> std::string_view = 0;
    [[nodiscard]] virtual auto resolve(Document::Action const& action) const -> Expected<IR::ActionDefinition> = 0;
};

using ActionResolverPtr = std::shared_ptr<ActionResolver const>;

struct ActionResolutionError {
    std::string actionId;
    Error       error;
};

/**
 * ActionResolverRegistry: wire action kind to ActionResolver.
 *
 * Kinds without a resolver pass through: the definition keeps the wire
 * parameters untouched, is Custom unless the kind names a built-in, and
 * reaches whatever handler is registered for the kind at execution time.
 *
 * Values that depend on state ({"$expr": ...} or ${...} templates) are
 * carried unevaluated; handlers evaluate them when the action runs.
 */
class ActionResolverRegistry {
public:
    auto registerResolver(ActionResolverPtr resolver) -> void;
    auto unregisterResolver(std::string_view kind) -> bool;

    [[nodiscard]] auto hasResolver(std::string_view kind) const -> bool;
    [[nodiscard]] auto registeredKinds() const -> std::vector<std::string>;

    [[nodiscard]] auto resolve(Document::Action const& action) const -> Expected<IR::ActionDefinition>;

    // Resolves every document action; failures are skipped and reported through `errors`.
    [[nodiscard]] auto resolveAll(std::map<std::string, Document::Action> const& actions,
                                  std::vector<ActionResolutionError>*            errors = nullptr) const
            -> std::map<std::string, IR::ActionDefinition>;

    // An id stays an id; an inline action is resolved in place.
    [[nodiscard]] auto resolveBinding(Document::ActionBinding const& binding) const -> Expected<IR::ActionReference>;

private:
    phmap::flat_hash_map<std::string, ActionResolverPtr> resolvers_;
};

// dismiss, setState, toggleState, showAlert, navigate, sequence.
[[nodiscard]] auto MakeDefaultActionResolvers() -> ActionResolverRegistry;

// Parses a raw step (an id string or an {"type": ...} object) into a wire action.
[[nodiscard]] auto ActionFromValue(Value const& value) -> Expected<Document::ActionBinding>;

} // namespace BP
