#pragma once

#include <blueprint/actions/ActionRegistry.hpp>
#include <blueprint/actions/ActionResolver.hpp>
#include <blueprint/core/Error.hpp>
#include <blueprint/document/Document.hpp>
#include <blueprint/ir/ActionDefinition.hpp>
#include <blueprint/state/StateStore.hpp>
#include <blueprint/task/Executor.hpp>

#include <parallel_hashmap/phmap.h>

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

struct AlertButton {
    std::string                            label;
    std::string                            style = "default"; // default | cancel | destructive
    std::optional<Document::ActionBinding> action;
};

struct AlertRequest {
    std::string                title;
    std::optional<std::string> message;
    std::vector<AlertButton>   buttons;
};

// Platform side of the built-in presentation actions.
class ActionPresenter {
public:
    virtual ~ActionPresenter() = default;

    virtual auto dismiss() -> void                                                              = 0;
    virtual auto presentAlert(AlertRequest const& request) -> void                              = 0;
    virtual auto navigate(std::string const& destination, std::string const& presentation) -> void = 0;
};

class ActionContext;

/**
 * ActionExecution: one running action invocation as seen by handlers.
 *
 * Carries the cancellation token of the invocation; nested actions run via
 * run() share it, so cancelling a request stops a sequence between steps.
 * An action id that is re-entered while it is still running, or nesting
 * deeper than MaxDepth, fails with CyclicReference.
 */
class ActionExecution {
public:
    static constexpr std::size_t MaxDepth = 64;

    ActionExecution(ActionContext& context, std::stop_token stopToken, std::string requestId);

    [[nodiscard]] auto cancelled() const -> bool { return stopToken_.stop_requested(); }
    [[nodiscard]] auto stopToken() const -> std::stop_token const& { return stopToken_; }
    [[nodiscard]] auto requestId() const -> std::string const& { return requestId_; }
    [[nodiscard]] auto context() const -> ActionContext& { return *context_; }
    [[nodiscard]] auto store() const -> StateStore&;

    // {"$expr": "..."} and strings holding ${...} are evaluated against the
    // store; everything else is returned unchanged.
    [[nodiscard]] auto evaluate(Value const& value) const -> Value;
    [[nodiscard]] auto interpolate(std::string_view text) const -> std::string;

    // Resolves (for wire actions) and dispatches a nested action to completion.
    auto run(Document::ActionBinding const& binding) -> Expected<void>;
    auto run(IR::ActionReference const& reference) -> Expected<void>;
    auto run(IR::ActionDefinition const& definition) -> Expected<void>;

private:
    ActionContext*           context_;
    std::stop_token          stopToken_;
    std::string              requestId_;
    std::vector<std::string> runningIds_;
    std::size_t              depth_ = 0;
};

/**
 * ActionContext: executes actions for one document session.
 *
 * Purpose
 * -------
 * Looks actions up by id, resolves inline ones, dispatches them to the
 * delegate or registry and reports nothing back except completion: errors
 * (unknown id, bad parameters, missing handler, a throwing handler) are
 * logged and the action is a no-op.
 *
 * Notes
 * -----
 * - execute() runs on the configured Executor and returns immediately, or
 *   runs inline when there is none. Independent invocations are not ordered
 *   with respect to each other and may interleave their state writes.
 * - Each invocation registers a stop source under "<sessionId>:<requestId>";
 *   cancel() and cancelAll() request stop. Cancellation suppresses further
 *   effects and never undoes state already written.
 * - The destructor cancels everything and waits for running invocations.
 */
class ActionContext {
public:
    struct Options {
        std::string      sessionId = "default";
        Executor*        executor  = nullptr;
        ActionPresenter* presenter = nullptr;
        ActionDelegate*  delegate  = nullptr;
    };

    ActionContext(StateStore&                                 store,
                  std::map<std::string, IR::ActionDefinition> actions,
                  ActionRegistry const&                       registry,
                  ActionResolverRegistry const&               resolvers,
                  Options                                     options);
    ActionContext(StateStore& store, std::map<std::string, IR::ActionDefinition> actions,
                  ActionRegistry const& registry, ActionResolverRegistry const& resolvers);
    ~ActionContext();

    ActionContext(ActionContext const&)            = delete;
    ActionContext& operator=(ActionContext const&) = delete;

    // An empty requestId gets a generated one; the future completes when the
    // invocation (including every sequence step) has finished or stopped.
    auto execute(std::string const& actionId, std::string requestId = {}) -> std::future<void>;
    auto execute(IR::ActionReference const& reference, std::string requestId = {}) -> std::future<void>;
    auto execute(Document::ActionBinding const& binding, std::string requestId = {}) -> std::future<void>;

    auto cancel(std::string_view requestId) -> bool;
    auto cancelAll() -> void;
    [[nodiscard]] auto isActive(std::string_view requestId) const -> bool;

    [[nodiscard]] auto store() const -> StateStore& { return *store_; }
    [[nodiscard]] auto options() const -> Options const& { return options_; }
    [[nodiscard]] auto lookup(std::string_view actionId) const -> IR::ActionDefinition const*;
    [[nodiscard]] auto resolve(Document::Action const& action) const -> Expected<IR::ActionDefinition>;

    // Delegate, then registry, then delegate as fallback. Handler exceptions
    // become UnknownError.
    auto dispatch(IR::ActionDefinition const& definition, ActionExecution& execution) -> Expected<void>;

private:
    using Work = std::function<Expected<void>(ActionExecution&)>;

    struct Invocation {
        std::uint64_t    serial;
        std::stop_source source;
    };

    auto launch(Work work, std::string requestId) -> std::future<void>;
    auto registryKey(std::string_view requestId) const -> std::string;
    auto finish(std::string const& key, std::uint64_t serial) -> void;

    StateStore*                                 store_;
    std::map<std::string, IR::ActionDefinition> actions_;
    ActionRegistry const&                       registry_;
    ActionResolverRegistry const&               resolvers_;
    Options                                     options_;

    mutable std::mutex                                          mutex_;
    std::condition_variable                                     idleCV_;
    phmap::flat_hash_map<std::string, std::vector<Invocation>> active_;
    std::uint64_t                                               nextSerial_ = 1;
    std::size_t                                                 inFlight_   = 0;
};

} // namespace BP
