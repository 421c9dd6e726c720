#pragma once

#include <blueprint/state/Value.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace BP {

// Read-only view of state used by the expression evaluator. Resolution
// contexts implement it to layer loop variables over the store and to record
// which paths were read.
class StateReader {
public:
    virtual ~StateReader() = default;

    [[nodiscard]] virtual auto read(std::string_view path) const -> std::optional<Value> = 0;
};

/**
 * StateStore: path-addressed mutable state shared by a document session.
 *
 * Purpose
 * -------
 * Holds the document's mutable values as one nested object tree addressed by
 * keypaths ("user.name", "items[0]", "items.0"). Every write marks the written
 * path and all of its ancestors dirty and notifies the observers whose path
 * overlaps the written one.
 *
 * Notes
 * -----
 * - Each operation holds the internal mutex for its whole read-modify-write,
 *   so background threads may call set() directly.
 * - Observers run synchronously on the writing thread after the lock has been
 *   released. Writing to the same store from inside an observer is a
 *   programmer error and asserts.
 * - Unknown paths read as absent; nothing here reports an error.
 */
class StateStore : public StateReader {
public:
    using ChangeCallback = std::function<void(std::string const& path,
                                              std::optional<Value> const& oldValue,
                                              std::optional<Value> const& newValue)>;

    struct ObserverTable;

    // Keeps an observer registered; unregisters on destruction or cancel().
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription();
        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(Subscription const&)            = delete;
        Subscription& operator=(Subscription const&) = delete;

        auto cancel() -> void;
        [[nodiscard]] auto active() const -> bool;

    private:
        friend class StateStore;
        Subscription(std::weak_ptr<ObserverTable> table, std::uint64_t id);

        std::weak_ptr<ObserverTable> table_;
        std::uint64_t                id_ = 0;
    };

    // Opaque copy of the whole state; the host decides how to persist it.
    class Snapshot {
    public:
        [[nodiscard]] auto toJson() const -> nlohmann::json;
        [[nodiscard]] static auto FromJson(nlohmann::json const& json) -> Snapshot;
        [[nodiscard]] auto values() const -> Value::Object const& { return values_; }

    private:
        friend class StateStore;
        Value::Object values_;
    };

    StateStore();
    explicit StateStore(Value::Object initial);
    ~StateStore() override;

    StateStore(StateStore const&)            = delete;
    StateStore& operator=(StateStore const&) = delete;

    // Replaces the whole state without notifying or marking anything dirty.
    auto initialize(Value::Object initial) -> void;

    [[nodiscard]] auto get(std::string_view path) const -> std::optional<Value>;
    [[nodiscard]] auto read(std::string_view path) const -> std::optional<Value> override;
    auto set(std::string_view path, Value value) -> void;
    auto remove(std::string_view path) -> bool;

    [[nodiscard]] auto getArray(std::string_view path) const -> std::optional<Value::Array>;
    [[nodiscard]] auto arrayCount(std::string_view path) const -> std::size_t;
    [[nodiscard]] auto arrayContains(std::string_view path, Value const& value) const -> bool;

    auto append(std::string_view path, Value value) -> void;
    auto removeByValue(std::string_view path, Value const& value) -> bool;
    auto removeAt(std::string_view path, std::size_t index) -> bool;
    // Appends when absent, removes every occurrence otherwise. Returns membership after the call.
    auto toggleMembership(std::string_view path, Value const& value) -> bool;
    auto setArrayItem(std::string_view path, std::size_t index, Value value) -> bool;
    auto clearArray(std::string_view path) -> void;

    [[nodiscard]] auto consumeDirtyPaths() -> std::set<std::string>;
    [[nodiscard]] auto isDirty(std::string_view path) const -> bool;
    auto clearDirtyPaths() -> void;

    // An empty path observes every write.
    [[nodiscard]] auto observe(std::string_view path, ChangeCallback callback) -> Subscription;
    auto removeAllObservers() -> void;

    [[nodiscard]] auto snapshot() const -> Snapshot;
    auto restore(Snapshot const& snapshot) -> void;

private:
    struct Change {
        std::string          path;
        std::optional<Value> oldValue;
        std::optional<Value> newValue;
    };

    template <typename Mutator>
    auto mutate(std::string_view path, Mutator&& mutator) -> bool;

    auto markDirtyLocked(std::string const& normalizedPath) -> void;
    auto notify(std::vector<Change> const& changes) -> void;

    mutable std::mutex             mutex_;
    Value                          root_;
    std::set<std::string>          dirty_;
    std::shared_ptr<ObserverTable> observers_;
};

} // namespace BP
