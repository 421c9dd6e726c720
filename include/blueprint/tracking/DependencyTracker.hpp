#pragma once

#include <blueprint/tracking/ViewNode.hpp>

#include <string_view>
#include <vector>

namespace BP {

inline constexpr std::string_view LocalPathPrefix = "local.";

/**
 * DependencyTracker: attributes state reads and writes to view nodes.
 *
 * Each resolver brackets its work with beginTracking()/endTracking(). Reads
 * and writes recorded in between belong to the innermost open bracket only;
 * they are not propagated to enclosing brackets. endTracking() stores the
 * collected sets on the bracket's ViewNode.
 */
class DependencyTracker {
public:
    // Opens a bracket for its lifetime.
    class Scope {
    public:
        Scope(DependencyTracker* tracker, ViewNode* node);
        ~Scope();
        Scope(Scope const&)            = delete;
        Scope& operator=(Scope const&) = delete;

    private:
        DependencyTracker* tracker_;
    };

    auto beginTracking(ViewNode& node) -> void;
    auto endTracking() -> void;

    auto recordRead(std::string_view path) -> void;
    // A write binding also reads the value it displays.
    auto recordWrite(std::string_view path) -> void;
    auto recordLocalRead(std::string_view path) -> void;
    auto recordLocalWrite(std::string_view path) -> void;

    [[nodiscard]] auto isTracking() const -> bool { return !stack_.empty(); }
    [[nodiscard]] auto current() const -> ViewNode*;
    [[nodiscard]] auto depth() const -> std::size_t { return stack_.size(); }

private:
    struct Frame {
        ViewNode* node;
        PathSet   reads;
        PathSet   writes;
    };

    std::vector<Frame> stack_;
};

} // namespace BP
