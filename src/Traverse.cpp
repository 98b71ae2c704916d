/**
 * @file Traverse.cpp
 * @brief Implementation of pointer-based get/set/remove
 */

#include "jptr/Traverse.hpp"
#include "jptr/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace jptr {

std::optional<std::size_t> parse_array_index(const std::string& segment) {
    if (segment.empty()) return std::nullopt;
    // Must be all digits, no leading zeros except "0" itself
    if (segment[0] == '0' && segment.size() > 1) return std::nullopt;
    if (!std::all_of(segment.begin(), segment.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }

    std::size_t index = 0;
    const char* first = segment.data();
    const char* last = first + segment.size();
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt; // overflow
    }
    return index;
}

ContainerKind choose_container_kind(const std::string& next_segment) {
    if (next_segment == kAppendMarker || parse_array_index(next_segment)) {
        return ContainerKind::Array;
    }
    return ContainerKind::Object;
}

namespace {
    Value make_container(ContainerKind kind) {
        return kind == ContainerKind::Array ? Value::array() : Value::object();
    }

    /**
     * @brief Index a write may target in an array
     * @throws IndexError if segment is not an index, or lies more than
     *         kMaxArrayGap slots past the end of the array
     */
    std::size_t writable_index(const Value& array, const std::string& segment,
                               const PointerLike& pointer) {
        auto idx = parse_array_index(segment);
        if (!idx) {
            throw IndexError(pointer.to_string(), segment);
        }
        if (*idx > array.size() && *idx - array.size() > kMaxArrayGap) {
            throw IndexError(pointer.to_string(), segment,
                             "more than " + std::to_string(kMaxArrayGap) +
                             " slots past the end of an array of size " +
                             std::to_string(array.size()));
        }
        return *idx;
    }

    /**
     * @brief Walk the first count segments without creating anything
     * @return The node reached, or nullptr as soon as a segment is missing
     */
    const Value* resolve(const Value& data, const Segments& segments, std::size_t count) {
        const Value* current = &data;

        for (std::size_t i = 0; i < count; ++i) {
            const auto& seg = segments[i];

            if (current->is_object()) {
                auto it = current->find(seg);
                if (it == current->end()) {
                    return nullptr;
                }
                current = &*it;
            } else if (current->is_array()) {
                auto idx = parse_array_index(seg);
                if (!idx || *idx >= current->size()) {
                    return nullptr;
                }
                current = &(*current)[*idx];
            } else {
                return nullptr;
            }
        }

        return current;
    }

    /**
     * @brief Get or create the child of an intermediate container
     *
     * Missing children, and existing children that are not containers, are
     * replaced by a new container suited to next_segment.
     */
    Value& child_for_write(Value& container, const std::string& segment,
                           const std::string& next_segment, const PointerLike& pointer) {
        if (container.is_array()) {
            if (segment == kAppendMarker) {
                container.push_back(make_container(choose_container_kind(next_segment)));
                return container.back();
            }

            // operator[] pads with nulls up to the index
            Value& child = container[writable_index(container, segment, pointer)];
            if (!is_container(child)) {
                child = make_container(choose_container_kind(next_segment));
            }
            return child;
        }

        Value& child = container[segment];
        if (!is_container(child)) {
            child = make_container(choose_container_kind(next_segment));
        }
        return child;
    }

    void assign_child(Value& container, const std::string& segment, Value value,
                      const PointerLike& pointer) {
        if (container.is_array()) {
            if (segment == kAppendMarker) {
                container.push_back(std::move(value));
                return;
            }

            container[writable_index(container, segment, pointer)] = std::move(value);
            return;
        }

        container[segment] = std::move(value);
    }

    void flatten_into(const Value& node, Segments& prefix, bool fragment,
                      std::vector<std::pair<std::string, Value>>& out) {
        if (node.is_object() && !node.empty()) {
            for (auto it = node.begin(); it != node.end(); ++it) {
                prefix.push_back(it.key());
                flatten_into(it.value(), prefix, fragment, out);
                prefix.pop_back();
            }
        } else if (node.is_array() && !node.empty()) {
            for (std::size_t i = 0; i < node.size(); ++i) {
                prefix.push_back(std::to_string(i));
                flatten_into(node[i], prefix, fragment, out);
                prefix.pop_back();
            }
        } else {
            out.emplace_back(join(prefix, fragment), node);
        }
    }
}

const Value* get(const Value& data, const PointerLike& pointer) {
    const auto segments = split(pointer);
    return resolve(data, segments, segments.size());
}

Value* get(Value& data, const PointerLike& pointer) {
    return const_cast<Value*>(get(static_cast<const Value&>(data), pointer));
}

const Value* get(const Value& data, const PointerLike& pointer,
                 const Value& default_val) {
    const Value* found = get(data, pointer);
    return found ? found : &default_val;
}

bool contains(const Value& data, const PointerLike& pointer) {
    return get(data, pointer) != nullptr;
}

Value& set(Value& data, const PointerLike& pointer, Value value) {
    const auto segments = split(pointer);
    if (segments.empty()) {
        // Root pointer: replace root
        data = std::move(value);
        return data;
    }

    if (data.is_null()) {
        data = make_container(choose_container_kind(segments.front()));
    } else if (!is_container(data)) {
        throw TypeError(pointer.to_string(), "object or array", type_name(data));
    }

    Value* current = &data;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        current = &child_for_write(*current, segments[i], segments[i + 1], pointer);
    }

    assign_child(*current, segments.back(), std::move(value), pointer);
    return data;
}

Value& remove(Value& data, const PointerLike& pointer, bool keep_array_indices) {
    const auto segments = split(pointer);
    if (segments.empty()) {
        return data; // the root cannot be removed
    }

    if (!is_container(data)) {
        throw TypeError(pointer.to_string(), "object or array", type_name(data));
    }

    Value* parent = const_cast<Value*>(resolve(data, segments, segments.size() - 1));
    if (!parent) {
        return data;
    }

    const auto& last = segments.back();
    if (parent->is_array()) {
        auto idx = parse_array_index(last);
        if (!idx || *idx >= parent->size()) {
            return data;
        }
        if (keep_array_indices) {
            (*parent)[*idx] = nullptr;
        } else {
            parent->erase(*idx);
        }
    } else if (parent->is_object()) {
        parent->erase(last);
    }

    return data;
}

std::vector<std::pair<std::string, Value>> flatten_to_pointers(const Value& data,
                                                               bool fragment) {
    std::vector<std::pair<std::string, Value>> out;
    Segments prefix;
    flatten_into(data, prefix, fragment, out);
    return out;
}

} // namespace jptr
