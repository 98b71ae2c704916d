/**
 * @file Traverse.hpp
 * @brief Reading and writing nested values through JSON pointers
 *
 * Behavioral rules:
 * - get() never throws for a path that does not resolve; it returns nullptr
 * - remove() is a no-op for a path that does not resolve
 * - set() creates missing intermediate containers; the kind of each new
 *   container is decided by choose_container_kind() on the segment after it
 * - set() and remove() mutate the root in place. set() replaces the root
 *   only when it is null or the pointer is the root pointer; callers should
 *   use the returned reference
 *
 * Array segments are canonical base-10 indices ("0", "17", not "01" or
 * "-1"). The segment "[]" appends to an array in set().
 *
 * Gap-fill policy: set() may write past the end of an array, padding the
 * skipped slots with null, but by at most kMaxArrayGap slots. A farther index
 * throws IndexError and leaves that array unchanged.
 */

#ifndef JPTR_TRAVERSE_HPP
#define JPTR_TRAVERSE_HPP

#include "jptr/Value.hpp"
#include "jptr/Pointer.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jptr {

/**
 * @brief Most null slots set() inserts to reach an index past the end of an array
 */
inline constexpr std::size_t kMaxArrayGap = 1024;

/**
 * @brief Kind of container set() creates for a missing intermediate
 */
enum class ContainerKind {
    Array,
    Object
};

/**
 * @brief Parse a segment as an array index
 * @return The index, or std::nullopt if the segment is not a canonical
 *         non-negative base-10 integer that fits in size_t
 */
std::optional<std::size_t> parse_array_index(const std::string& segment);

/**
 * @brief Decide which container a segment needs as its parent
 *
 * @param next_segment The segment that will be looked up in the container
 * @return Array for "[]" or an array index, Object otherwise
 *
 * Examples:
 * - "[]" → Array
 * - "0", "42" → Array
 * - "name", "01", "-1" → Object
 */
ContainerKind choose_container_kind(const std::string& next_segment);

/**
 * @brief Resolve a pointer against data
 *
 * @param data Source value
 * @param pointer Pointer string or segment list
 * @return Pointer to the addressed value, &data for the root pointer, or
 *         nullptr if any segment does not resolve
 *
 * Examples:
 * ```cpp
 * Value doc = {{"db", {{"hosts", {"a", "b"}}}}};
 * get(doc, "/db/hosts/1");     // → "b"
 * get(doc, "/db/hosts/2");     // → nullptr
 * get(doc, "/db/hosts/x/y");   // → nullptr
 * ```
 */
const Value* get(const Value& data, const PointerLike& pointer);

/**
 * @brief Mutable overload of get()
 */
Value* get(Value& data, const PointerLike& pointer);

/**
 * @brief Resolve a pointer, falling back to a default
 * @return Pointer to the addressed value, or &default_val if absent
 */
const Value* get(const Value& data, const PointerLike& pointer,
                 const Value& default_val);

/**
 * @brief Check whether a pointer resolves
 */
bool contains(const Value& data, const PointerLike& pointer);

/**
 * @brief Write a value, creating intermediate containers as needed
 *
 * @param data Root value (modified in place; a null root is replaced by a
 *             new container)
 * @param pointer Pointer string or segment list; a final "[]" appends
 * @param value Value to store
 * @return Reference to data
 * @throws TypeError if data is a scalar and the pointer is not the root
 * @throws IndexError if an array is addressed with a segment that is
 *                    neither an index nor "[]", or with an index more than
 *                    kMaxArrayGap past its end
 *
 * Intermediate nulls and scalars are replaced by containers. Writing past
 * the end of an array pads it with nulls. Containers created before a
 * failing segment stay in place.
 *
 * Examples:
 * ```cpp
 * Value doc = Value::object();
 * set(doc, "/list/[]/value", 42);   // {"list": [{"value": 42}]}
 * set(doc, "/list/2", true);        // {"list": [{"value": 42}, null, true]}
 *
 * Value none;                        // null
 * set(none, "/0/name", "x");         // [{"name": "x"}]
 * ```
 */
Value& set(Value& data, const PointerLike& pointer, Value value);

/**
 * @brief Remove the value a pointer addresses
 *
 * @param data Root container (modified in place)
 * @param pointer Pointer string or segment list
 * @param keep_array_indices If true, an array element is replaced by null
 *                           instead of being erased
 * @return Reference to data
 * @throws TypeError if data is not a container and the pointer is not the root
 *
 * The root pointer and pointers that do not resolve leave data unchanged.
 * Erasing an array element shifts later elements left.
 */
Value& remove(Value& data, const PointerLike& pointer,
              bool keep_array_indices = false);

/**
 * @brief List every leaf of a value with its pointer
 *
 * Leaves are scalars and empty containers. Order is depth-first in
 * container order (object keys as nlohmann::json iterates them).
 *
 * @param data Source value
 * @param fragment Emit "#"-form pointers
 *
 * Example:
 * - {"a": {"b": 1}, "c": [true]} → [("/a/b", 1), ("/c/0", true)]
 */
std::vector<std::pair<std::string, Value>> flatten_to_pointers(const Value& data,
                                                               bool fragment = false);

} // namespace jptr

#endif // JPTR_TRAVERSE_HPP
