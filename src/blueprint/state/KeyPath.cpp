#include <blueprint/state/KeyPath.hpp>

#include <charconv>

namespace BP::KeyPath {

auto Split(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    std::string              current;
    auto flush = [&]() {
        if (!current.empty()) {
            segments.push_back(std::move(current));
            current.clear();
        }
    };
    for (char c : path) {
        switch (c) {
        case '.':
        case '[':
        case ']':
            flush();
            break;
        default:
            current.push_back(c);
            break;
        }
    }
    flush();
    return segments;
}

auto Join(std::vector<std::string> const& segments, std::size_t count) -> std::string {
    std::string joined;
    for (std::size_t i = 0; i < count && i < segments.size(); ++i) {
        if (i > 0) {
            joined.push_back('.');
        }
        joined.append(segments[i]);
    }
    return joined;
}

auto Normalize(std::string_view path) -> std::string {
    auto segments = Split(path);
    return Join(segments, segments.size());
}

auto AsIndex(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) {
        return std::nullopt;
    }
    std::size_t index = 0;
    auto [end, ec]    = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (ec != std::errc{} || end != segment.data() + segment.size()) {
        return std::nullopt;
    }
    return index;
}

auto Ancestors(std::string_view normalizedPath) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (std::size_t pos = normalizedPath.find('.'); pos != std::string_view::npos; pos = normalizedPath.find('.', pos + 1)) {
        out.emplace_back(normalizedPath.substr(0, pos));
    }
    return out;
}

auto IsSameOrAncestor(std::string_view ancestor, std::string_view path) -> bool {
    if (ancestor.empty()) {
        return true;
    }
    if (!path.starts_with(ancestor)) {
        return false;
    }
    return path.size() == ancestor.size() || path[ancestor.size()] == '.';
}

auto Overlaps(std::string_view lhs, std::string_view rhs) -> bool {
    return IsSameOrAncestor(lhs, rhs) || IsSameOrAncestor(rhs, lhs);
}

auto Find(Value const& root, std::vector<std::string> const& segments, std::size_t first) -> Value const* {
    Value const* current = &root;
    for (std::size_t i = first; i < segments.size(); ++i) {
        auto const& segment = segments[i];
        if (auto const* object = current->asObject()) {
            auto it = object->find(segment);
            if (it == object->end()) {
                return nullptr;
            }
            current = &it->second;
        } else if (auto const* array = current->asArray()) {
            auto index = AsIndex(segment);
            if (!index || *index >= array->size()) {
                return nullptr;
            }
            current = &(*array)[*index];
        } else {
            return nullptr;
        }
    }
    return current;
}

namespace {

// Dry run of Ensure: false when some index would pad an array too far.
auto within_padding(Value const& root, std::vector<std::string> const& segments) -> bool {
    Value const* current = &root;
    for (auto const& segment : segments) {
        auto index = AsIndex(segment);
        if (current == nullptr || current->isNull()) {
            // A fresh container: an array for a numeric segment, padded from empty.
            if (index && *index > MaxArrayPadding) {
                return false;
            }
            current = nullptr;
            continue;
        }
        if (auto const* array = current->asArray(); array && index) {
            if (*index >= array->size() && *index - array->size() > MaxArrayPadding) {
                return false;
            }
            current = *index < array->size() ? &(*array)[*index] : nullptr;
            continue;
        }
        auto const* object = current->asObject();
        if (object == nullptr) {
            current = nullptr;
            continue;
        }
        auto it = object->find(segment);
        current = it == object->end() ? nullptr : &it->second;
    }
    return true;
}

} // namespace

auto Ensure(Value& root, std::vector<std::string> const& segments) -> Value* {
    if (!within_padding(root, segments)) {
        return nullptr;
    }
    Value* current = &root;
    for (auto const& segment : segments) {
        auto index = AsIndex(segment);
        if (current->isNull()) {
            *current = index ? Value{Value::Array{}} : Value{Value::Object{}};
        }
        if (auto* array = current->asArray(); array && index) {
            if (*index >= array->size()) {
                array->resize(*index + 1);
            }
            current = &(*array)[*index];
            continue;
        }
        if (current->asObject() == nullptr) {
            *current = Value{Value::Object{}};
        }
        current = &(*current->asObject())[segment];
    }
    return current;
}

} // namespace BP::KeyPath
