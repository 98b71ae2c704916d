/**
 * @file Pointer.hpp
 * @brief Splitting and joining of JSON pointer strings
 *
 * A pointer is "" (root) or a sequence of "/"-prefixed escaped segments,
 * optionally preceded by "#" (URI fragment form, RFC 6901 section 6):
 *
 *   pointer := "" | "#" | ("#"? "/" segment ("/" segment)*)
 *
 * Every operation accepts either a pointer string or an already decoded
 * segment list (PointerLike); split() is the one place that turns the
 * former into the latter.
 */

#ifndef JPTR_POINTER_HPP
#define JPTR_POINTER_HPP

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jptr {

/// Ordered list of decoded pointer segments
using Segments = std::vector<std::string>;

/// Segment meaning "one past the last array element" in set()
inline const std::string kAppendMarker = "[]";

/**
 * @brief A pointer string or an already split segment list
 *
 * Implicitly constructible from both, so operations can be called as
 * get(data, "/a/0") or get(data, Segments{"a", "0"}).
 */
class PointerLike {
public:
    PointerLike(const char* pointer) : value_(std::string(pointer)) {}
    PointerLike(std::string pointer) : value_(std::move(pointer)) {}
    PointerLike(Segments segments) : value_(std::move(segments)) {}

    bool is_segments() const noexcept {
        return std::holds_alternative<Segments>(value_);
    }

    /// @pre !is_segments()
    const std::string& pointer() const {
        return std::get<std::string>(value_);
    }

    /// @pre is_segments()
    const Segments& segments() const {
        return std::get<Segments>(value_);
    }

    /**
     * @brief Render for diagnostics: the string as given, or the joined list
     */
    std::string to_string() const;

private:
    std::variant<std::string, Segments> value_;
};

/**
 * @brief Decoded pointer together with its fragment flag
 */
struct ParsedPointer {
    Segments segments;
    bool fragment = false;
};

/**
 * @brief Parse a pointer string into decoded segments
 *
 * A leading "#" selects fragment form: the marker is stripped and every
 * segment is URI-decoded before being unescaped. A single leading "/" is
 * stripped; the rest is split on "/".
 *
 * Examples:
 * - "" → {[], false}
 * - "#" → {[], true}
 * - "/" → {[""], false}
 * - "/a~1b/0" → {["a/b", "0"], false}
 * - "#/my%20value" → {["my value"], true}
 */
ParsedPointer parse_pointer(const std::string& pointer);

/**
 * @brief Normalize a pointer to its segment list
 *
 * Strings are parsed with parse_pointer(); segment lists are copied
 * unchanged.
 */
Segments split(const PointerLike& pointer);

/**
 * @brief Check whether a pointer addresses the root ("", "#" or [])
 */
bool is_root(const PointerLike& pointer);

/**
 * @brief Split off the last segment
 *
 * @return Parent pointer (in fragment form if the input was) and the decoded
 *         last segment. The root yields its own form and an empty segment.
 *
 * Examples:
 * - "/a/b~1c" → {"/a", "b/c"}
 * - "#/a/b" → {"#/a", "b"}
 * - "/a" → {"", "a"}
 */
std::pair<std::string, std::string> split_last(const PointerLike& pointer);

/**
 * @brief Build a pointer from raw segments
 *
 * Each segment is one property name: it is escaped, never split, and ".."
 * or "." are kept literally. With fragment=true the result starts with "#"
 * and each escaped segment is URI-encoded. An empty list yields the root
 * ("" or "#").
 *
 * Examples:
 * - ["a/b", "c"] → "/a~1b/c"
 * - ["my value"], fragment → "#/my%20value"
 */
std::string join(const Segments& segments, bool fragment = false);

/**
 * @brief Resolve a list of pointers and keys into one pointer
 *
 * Each part is split with parse_pointer(), so full pointers contribute all
 * their segments and a bare key contributes itself. ".." drops the last
 * collected segment (no-op when nothing is collected), "." is skipped. The
 * result is in fragment form if any part was.
 *
 * Examples:
 * - {"root", "my key", "/to/target"} → "/root/my key/to/target"
 * - {"/a/b", "../c"} → "/a/c"
 * - {"#/my value/to%20parent", "../to~1child"} → "#/my%20value/to~1child"
 */
std::string join_pointers(const std::vector<std::string>& parts);

/**
 * @brief Variadic form of join_pointers()
 *
 * join("/a", "b", "../c") == join_pointers({"/a", "b", "../c"})
 */
template <typename... Parts>
std::string join(const std::string& first, const Parts&... rest) {
    return join_pointers({first, std::string(rest)...});
}

} // namespace jptr

#endif // JPTR_POINTER_HPP
