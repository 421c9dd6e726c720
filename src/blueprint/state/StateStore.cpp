#include <blueprint/state/StateStore.hpp>

#include <blueprint/state/KeyPath.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cassert>
#include <utility>

namespace BP {

struct StateStore::ObserverTable {
    struct Entry {
        std::uint64_t  id;
        std::string    path;
        ChangeCallback callback;
    };

    std::mutex         mutex;
    std::uint64_t      nextId = 1;
    std::vector<Entry> entries;
};

namespace {

// Store whose observers are currently running on this thread.
thread_local StateStore const* notifying_store = nullptr;

// Marks `store` as notifying for the lifetime of the scope, even when an
// observer throws.
class NotifyingScope {
public:
    explicit NotifyingScope(StateStore const* store) : previous_(std::exchange(notifying_store, store)) {}
    ~NotifyingScope() { notifying_store = previous_; }

    NotifyingScope(NotifyingScope const&)            = delete;
    NotifyingScope& operator=(NotifyingScope const&) = delete;

private:
    StateStore const* previous_;
};

auto erase_value(Value& root, std::vector<std::string> const& segments) -> bool {
    if (segments.empty()) {
        return false;
    }
    Value* parent = &root;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        if (auto* object = parent->asObject()) {
            auto it = object->find(segments[i]);
            if (it == object->end()) {
                return false;
            }
            parent = &it->second;
        } else if (auto* array = parent->asArray()) {
            auto index = KeyPath::AsIndex(segments[i]);
            if (!index || *index >= array->size()) {
                return false;
            }
            parent = &(*array)[*index];
        } else {
            return false;
        }
    }
    auto const& last = segments.back();
    if (auto* object = parent->asObject()) {
        return object->erase(last) > 0;
    }
    if (auto* array = parent->asArray()) {
        auto index = KeyPath::AsIndex(last);
        if (!index || *index >= array->size()) {
            return false;
        }
        array->erase(array->begin() + static_cast<std::ptrdiff_t>(*index));
        return true;
    }
    return false;
}

} // namespace

StateStore::Subscription::Subscription(std::weak_ptr<ObserverTable> table, std::uint64_t id)
    : table_(std::move(table)), id_(id) {}

StateStore::Subscription::~Subscription() {
    cancel();
}

StateStore::Subscription::Subscription(Subscription&& other) noexcept
    : table_(std::move(other.table_)), id_(std::exchange(other.id_, 0)) {}

StateStore::Subscription& StateStore::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        cancel();
        table_ = std::move(other.table_);
        id_    = std::exchange(other.id_, 0);
    }
    return *this;
}

auto StateStore::Subscription::cancel() -> void {
    if (id_ == 0) {
        return;
    }
    if (auto table = table_.lock()) {
        std::lock_guard<std::mutex> lock(table->mutex);
        std::erase_if(table->entries, [id = id_](ObserverTable::Entry const& entry) { return entry.id == id; });
    }
    table_.reset();
    id_ = 0;
}

auto StateStore::Subscription::active() const -> bool {
    if (id_ == 0) {
        return false;
    }
    auto table = table_.lock();
    if (!table) {
        return false;
    }
    std::lock_guard<std::mutex> lock(table->mutex);
    return std::ranges::any_of(table->entries, [id = id_](ObserverTable::Entry const& entry) { return entry.id == id; });
}

auto StateStore::Snapshot::toJson() const -> nlohmann::json {
    return Value{values_}.toJson();
}

auto StateStore::Snapshot::FromJson(nlohmann::json const& json) -> Snapshot {
    Snapshot snapshot;
    auto     value = Value::FromJson(json);
    if (auto* object = value.asObject()) {
        snapshot.values_ = std::move(*object);
    }
    return snapshot;
}

StateStore::StateStore()
    : root_(Value::Object{}), observers_(std::make_shared<ObserverTable>()) {}

StateStore::StateStore(Value::Object initial)
    : root_(std::move(initial)), observers_(std::make_shared<ObserverTable>()) {}

StateStore::~StateStore() = default;

auto StateStore::initialize(Value::Object initial) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    root_ = Value{std::move(initial)};
    dirty_.clear();
}

auto StateStore::get(std::string_view path) const -> std::optional<Value> {
    auto                        segments = KeyPath::Split(path);
    std::lock_guard<std::mutex> lock(mutex_);
    if (segments.empty()) {
        return root_;
    }
    if (auto const* found = KeyPath::Find(root_, segments)) {
        return *found;
    }
    return std::nullopt;
}

auto StateStore::read(std::string_view path) const -> std::optional<Value> {
    return get(path);
}

template <typename Mutator>
auto StateStore::mutate(std::string_view path, Mutator&& mutator) -> bool {
    assert(notifying_store != this && "StateStore written from inside one of its own change callbacks");

    auto normalized = KeyPath::Normalize(path);
    if (normalized.empty()) {
        bp_log("StateStore write ignored: empty path", "StateStore");
        return false;
    }
    auto segments = KeyPath::Split(normalized);

    std::vector<Change> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<Value>        current;
        if (auto const* existing = KeyPath::Find(root_, segments)) {
            current = *existing;
        }
        auto updated = current;
        if (!mutator(updated)) {
            return false;
        }
        if (updated) {
            auto* slot = KeyPath::Ensure(root_, segments);
            if (slot == nullptr) {
                bp_log("StateStore write ignored: index out of reach in " + normalized, "StateStore", "Error");
                return false;
            }
            *slot = *updated;
        } else {
            erase_value(root_, segments);
        }
        markDirtyLocked(normalized);
        changes.push_back(Change{normalized, std::move(current), std::move(updated)});
    }
    notify(changes);
    return true;
}

auto StateStore::set(std::string_view path, Value value) -> void {
    mutate(path, [&](std::optional<Value>& slot) {
        slot = std::move(value);
        return true;
    });
}

auto StateStore::remove(std::string_view path) -> bool {
    return mutate(path, [](std::optional<Value>& slot) {
        if (!slot) {
            return false;
        }
        slot.reset();
        return true;
    });
}

auto StateStore::getArray(std::string_view path) const -> std::optional<Value::Array> {
    auto value = get(path);
    if (!value) {
        return std::nullopt;
    }
    if (auto const* array = value->asArray()) {
        return *array;
    }
    return std::nullopt;
}

auto StateStore::arrayCount(std::string_view path) const -> std::size_t {
    auto array = getArray(path);
    return array ? array->size() : 0;
}

auto StateStore::arrayContains(std::string_view path, Value const& value) const -> bool {
    auto array = getArray(path);
    if (!array) {
        return false;
    }
    return std::ranges::any_of(*array, [&](Value const& item) { return item.looselyEquals(value); });
}

auto StateStore::append(std::string_view path, Value value) -> void {
    mutate(path, [&](std::optional<Value>& slot) {
        if (!slot || slot->isNull()) {
            slot = Value{Value::Array{}};
        }
        auto* array = slot->asArray();
        if (array == nullptr) {
            bp_log("StateStore::append target is not an array: " + std::string{path}, "StateStore");
            return false;
        }
        array->push_back(std::move(value));
        return true;
    });
}

auto StateStore::removeByValue(std::string_view path, Value const& value) -> bool {
    return mutate(path, [&](std::optional<Value>& slot) {
        auto* array = slot ? slot->asArray() : nullptr;
        if (array == nullptr) {
            return false;
        }
        return std::erase_if(*array, [&](Value const& item) { return item.looselyEquals(value); }) > 0;
    });
}

auto StateStore::removeAt(std::string_view path, std::size_t index) -> bool {
    return mutate(path, [&](std::optional<Value>& slot) {
        auto* array = slot ? slot->asArray() : nullptr;
        if (array == nullptr || index >= array->size()) {
            return false;
        }
        array->erase(array->begin() + static_cast<std::ptrdiff_t>(index));
        return true;
    });
}

auto StateStore::toggleMembership(std::string_view path, Value const& value) -> bool {
    bool member = false;
    mutate(path, [&](std::optional<Value>& slot) {
        if (!slot || slot->isNull()) {
            slot = Value{Value::Array{}};
        }
        auto* array = slot->asArray();
        if (array == nullptr) {
            return false;
        }
        auto removed = std::erase_if(*array, [&](Value const& item) { return item.looselyEquals(value); });
        if (removed == 0) {
            array->push_back(value);
            member = true;
        }
        return true;
    });
    return member;
}

auto StateStore::setArrayItem(std::string_view path, std::size_t index, Value value) -> bool {
    return mutate(path, [&](std::optional<Value>& slot) {
        auto* array = slot ? slot->asArray() : nullptr;
        if (array == nullptr || index >= array->size()) {
            return false;
        }
        (*array)[index] = std::move(value);
        return true;
    });
}

auto StateStore::clearArray(std::string_view path) -> void {
    mutate(path, [](std::optional<Value>& slot) {
        slot = Value{Value::Array{}};
        return true;
    });
}

auto StateStore::markDirtyLocked(std::string const& normalizedPath) -> void {
    dirty_.insert(normalizedPath);
    for (auto& ancestor : KeyPath::Ancestors(normalizedPath)) {
        dirty_.insert(std::move(ancestor));
    }
}

auto StateStore::consumeDirtyPaths() -> std::set<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(dirty_, {});
}

auto StateStore::isDirty(std::string_view path) const -> bool {
    auto                        normalized = KeyPath::Normalize(path);
    std::lock_guard<std::mutex> lock(mutex_);
    return std::ranges::any_of(dirty_, [&](std::string const& dirty) { return KeyPath::IsSameOrAncestor(normalized, dirty); });
}

auto StateStore::clearDirtyPaths() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    dirty_.clear();
}

auto StateStore::observe(std::string_view path, ChangeCallback callback) -> Subscription {
    std::lock_guard<std::mutex> lock(observers_->mutex);
    auto                        id = observers_->nextId++;
    observers_->entries.push_back(ObserverTable::Entry{id, KeyPath::Normalize(path), std::move(callback)});
    return Subscription{observers_, id};
}

auto StateStore::removeAllObservers() -> void {
    std::lock_guard<std::mutex> lock(observers_->mutex);
    observers_->entries.clear();
}

auto StateStore::notify(std::vector<Change> const& changes) -> void {
    for (auto const& change : changes) {
        std::vector<ChangeCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(observers_->mutex);
            for (auto const& entry : observers_->entries) {
                if (entry.path.empty() || KeyPath::Overlaps(entry.path, change.path)) {
                    callbacks.push_back(entry.callback);
                }
            }
        }
        if (callbacks.empty()) {
            continue;
        }
        NotifyingScope scope(this);
        for (auto const& callback : callbacks) {
            callback(change.path, change.oldValue, change.newValue);
        }
    }
}

auto StateStore::snapshot() const -> Snapshot {
    Snapshot                    snapshot;
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto const* object = root_.asObject()) {
        snapshot.values_ = *object;
    }
    return snapshot;
}

auto StateStore::restore(Snapshot const& snapshot) -> void {
    assert(notifying_store != this && "StateStore restored from inside one of its own change callbacks");

    std::vector<Change> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Value::Object previous;
        if (auto* object = root_.asObject()) {
            previous = std::move(*object);
        }
        std::set<std::string> keys;
        for (auto const& [key, _] : previous) {
            keys.insert(key);
        }
        for (auto const& [key, _] : snapshot.values_) {
            keys.insert(key);
        }
        for (auto const& key : keys) {
            std::optional<Value> before;
            std::optional<Value> after;
            if (auto it = previous.find(key); it != previous.end()) {
                before = it->second;
            }
            if (auto it = snapshot.values_.find(key); it != snapshot.values_.end()) {
                after = it->second;
            }
            dirty_.insert(key);
            changes.push_back(Change{key, std::move(before), std::move(after)});
        }
        root_ = Value{snapshot.values_};
    }
    notify(changes);
}

} // namespace BP
