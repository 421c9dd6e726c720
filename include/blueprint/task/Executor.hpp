#pragma once

#include <blueprint/core/Error.hpp>

#include <cstddef>
#include <functional>
#include <optional>

namespace BP {

/**
 * Executor: interface for scheduling jobs
 *
 * Rationale
 * ---------
 * Resolution and action execution never create threads themselves; they post
 * work to an Executor supplied by the embedding application. A one-thread
 * TaskPool is the designated serial context that owns tree resolution and
 * every ViewNode mutation.
 *
 * Contract
 * --------
 * - submit(...) returns std::nullopt on success, or an Error on refusal
 *   (e.g., executor shutting down).
 * - shutdown() stops accepting new jobs, wakes workers and lets in-flight
 *   jobs finish.
 * - size() returns an implementation-defined measure of capacity
 *   (e.g., number of worker threads).
 *
 * Thread-safety
 * -------------
 * Implementations must be thread-safe for concurrent submit() calls and
 * for shutdown() to be called while jobs may still be in flight.
 */
struct Executor {
    using Job = std::move_only_function<void()>;

    virtual ~Executor() = default;

    virtual auto submit(Job job) -> std::optional<Error> = 0;

    virtual auto shutdown() -> void = 0;

    virtual auto size() const -> size_t = 0;
};

} // namespace BP
