#include <blueprint/actions/ActionContext.hpp>
#include <blueprint/state/Expressions.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace BP {

namespace {

// Runs its callback once when destroyed, including when the owning job is
// dropped by an executor without ever running.
class Ticket {
public:
    explicit Ticket(std::move_only_function<void()> release) : release_(std::move(release)) {}
    Ticket(Ticket&& other) noexcept : release_(std::exchange(other.release_, nullptr)) {}
    Ticket& operator=(Ticket&&) = delete;
    ~Ticket() {
        if (release_) {
            release_();
        }
    }

private:
    std::move_only_function<void()> release_;
};

} // namespace

ActionExecution::ActionExecution(ActionContext& context, std::stop_token stopToken, std::string requestId)
    : context_(&context), stopToken_(std::move(stopToken)), requestId_(std::move(requestId)) {}

auto ActionExecution::store() const -> StateStore& {
    return context_->store();
}

auto ActionExecution::evaluate(Value const& value) const -> Value {
    if (auto const* object = value.asObject()) {
        if (object->size() == 1) {
            if (auto it = object->find("$expr"); it != object->end()) {
                if (auto expression = it->second.asString()) {
                    return Expressions::Evaluate(*expression, store());
                }
            }
        }
        return value;
    }
    if (auto text = value.asString(); text && Expressions::ContainsExpression(*text)) {
        return Expressions::Evaluate(*text, store());
    }
    return value;
}

auto ActionExecution::interpolate(std::string_view text) const -> std::string {
    return Expressions::Interpolate(text, store());
}

auto ActionExecution::run(Document::ActionBinding const& binding) -> Expected<void> {
    if (auto const* id = std::get_if<std::string>(&binding)) {
        return run(IR::ActionReference{*id});
    }
    auto definition = context_->resolve(std::get<Document::Action>(binding));
    if (!definition) {
        return std::unexpected(definition.error());
    }
    return run(*definition);
}

auto ActionExecution::run(IR::ActionReference const& reference) -> Expected<void> {
    if (auto const* inlineDefinition = std::get_if<IR::ActionDefinition>(&reference)) {
        return run(*inlineDefinition);
    }
    auto const& id         = std::get<std::string>(reference);
    auto const* definition = context_->lookup(id);
    if (definition == nullptr) {
        return std::unexpected(Error{Error::Code::NotFound, "No action with id '" + id + "'"});
    }
    if (std::ranges::find(runningIds_, id) != runningIds_.end()) {
        return std::unexpected(Error{Error::Code::CyclicReference, "Action '" + id + "' runs itself"});
    }
    runningIds_.push_back(id);
    auto result = run(*definition);
    runningIds_.pop_back();
    return result;
}

auto ActionExecution::run(IR::ActionDefinition const& definition) -> Expected<void> {
    if (cancelled()) {
        return std::unexpected(Error{Error::Code::Cancelled, definition.kindName() + " cancelled"});
    }
    if (depth_ >= MaxDepth) {
        return std::unexpected(Error{Error::Code::CyclicReference,
                                     definition.kindName() + " nested deeper than " + std::to_string(MaxDepth)});
    }
    ++depth_;
    auto result = context_->dispatch(definition, *this);
    --depth_;
    return result;
}

ActionContext::ActionContext(StateStore&                                 store,
                             std::map<std::string, IR::ActionDefinition> actions,
                             ActionRegistry const&                       registry,
                             ActionResolverRegistry const&               resolvers,
                             Options                                     options)
    : store_(&store),
      actions_(std::move(actions)),
      registry_(registry),
      resolvers_(resolvers),
      options_(std::move(options)) {}

ActionContext::ActionContext(StateStore&                                 store,
                             std::map<std::string, IR::ActionDefinition> actions,
                             ActionRegistry const&                       registry,
                             ActionResolverRegistry const&               resolvers)
    : ActionContext(store, std::move(actions), registry, resolvers, Options{}) {}

ActionContext::~ActionContext() {
    cancelAll();
    std::unique_lock<std::mutex> lock(mutex_);
    idleCV_.wait(lock, [this] { return inFlight_ == 0; });
}

auto ActionContext::lookup(std::string_view actionId) const -> IR::ActionDefinition const* {
    auto it = actions_.find(std::string{actionId});
    return it == actions_.end() ? nullptr : &it->second;
}

auto ActionContext::resolve(Document::Action const& action) const -> Expected<IR::ActionDefinition> {
    return resolvers_.resolve(action);
}

auto ActionContext::dispatch(IR::ActionDefinition const& definition, ActionExecution& execution) -> Expected<void> {
    auto  kind     = definition.kindName();
    auto* delegate = options_.delegate;

    auto delegated = [&]() -> Expected<void> {
        try {
            delegate->handle(definition, execution);
        } catch (std::exception const& error) {
            return std::unexpected(Error{Error::Code::UnknownError, "Delegate failed on " + kind + ": " + error.what()});
        }
        return {};
    };

    if (delegate != nullptr && definition.kind == IR::ActionKind::Custom && delegate->shouldHandle(definition)) {
        return delegated();
    }
    if (auto handler = registry_.handler(kind)) {
        try {
            return handler->execute(definition, execution);
        } catch (std::exception const& error) {
            return std::unexpected(Error{Error::Code::UnknownError, "Handler for " + kind + " threw: " + error.what()});
        }
    }
    if (delegate != nullptr && delegate->shouldHandle(definition)) {
        return delegated();
    }
    return std::unexpected(Error{Error::Code::NotFound, "No handler registered for action kind '" + kind + "'"});
}

auto ActionContext::execute(std::string const& actionId, std::string requestId) -> std::future<void> {
    return launch([actionId](ActionExecution& execution) { return execution.run(IR::ActionReference{actionId}); },
                  std::move(requestId));
}

auto ActionContext::execute(IR::ActionReference const& reference, std::string requestId) -> std::future<void> {
    return launch([reference](ActionExecution& execution) { return execution.run(reference); }, std::move(requestId));
}

auto ActionContext::execute(Document::ActionBinding const& binding, std::string requestId) -> std::future<void> {
    return launch([binding](ActionExecution& execution) { return execution.run(binding); }, std::move(requestId));
}

auto ActionContext::launch(Work work, std::string requestId) -> std::future<void> {
    std::stop_source source;
    std::string      key;
    std::uint64_t    serial = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        serial = nextSerial_++;
        if (requestId.empty()) {
            requestId = "request-" + std::to_string(serial);
        }
        key = registryKey(requestId);
        active_[key].push_back(Invocation{serial, source});
        ++inFlight_;
    }

    auto   promise = std::make_shared<std::promise<void>>();
    auto   future  = promise->get_future();
    Ticket ticket([this, key, serial] { finish(key, serial); });

    Executor::Job job = [this, work = std::move(work), token = source.get_token(), requestId, promise,
                         ticket = std::move(ticket)]() mutable {
        {
            ActionExecution execution(*this, token, requestId);
            auto            result = work(execution);
            if (!result) {
                if (result.error().code == Error::Code::Cancelled) {
                    bp_log("Action request " + requestId + " cancelled", "ActionContext");
                } else {
                    bp_log("Action request " + requestId + " failed: " + describeError(result.error()), "ActionContext",
                           "Error");
                }
            }
        }
        // Deregister before completing so a finished future never reports an active request.
        { Ticket done = std::move(ticket); }
        promise->set_value();
    };

    if (options_.executor == nullptr) {
        job();
        return future;
    }
    if (auto error = options_.executor->submit(std::move(job))) {
        bp_log("Action request " + requestId + " could not be scheduled: " + describeError(*error), "ActionContext",
               "Error");
        promise->set_value();
    }
    return future;
}

auto ActionContext::registryKey(std::string_view requestId) const -> std::string {
    return options_.sessionId + ":" + std::string{requestId};
}

auto ActionContext::finish(std::string const& key, std::uint64_t serial) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = active_.find(key); it != active_.end()) {
        std::erase_if(it->second, [serial](Invocation const& invocation) { return invocation.serial == serial; });
        if (it->second.empty()) {
            active_.erase(it);
        }
    }
    --inFlight_;
    idleCV_.notify_all();
}

auto ActionContext::cancel(std::string_view requestId) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = active_.find(registryKey(requestId));
    if (it == active_.end()) {
        return false;
    }
    for (auto& invocation : it->second) {
        invocation.source.request_stop();
    }
    bp_log("Cancelled action request " + std::string{requestId}, "ActionContext");
    return true;
}

auto ActionContext::cancelAll() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, invocations] : active_) {
        for (auto& invocation : invocations) {
            invocation.source.request_stop();
        }
    }
}

auto ActionContext::isActive(std::string_view requestId) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.contains(registryKey(requestId));
}

} // namespace BP
