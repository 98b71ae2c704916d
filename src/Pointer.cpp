/**
 * @file Pointer.cpp
 * @brief Implementation of pointer splitting and joining
 */

#include "jptr/Pointer.hpp"
#include "jptr/Codec.hpp"

namespace jptr {

std::string PointerLike::to_string() const {
    return is_segments() ? join(segments()) : pointer();
}

ParsedPointer parse_pointer(const std::string& pointer) {
    ParsedPointer result;
    if (pointer.empty()) {
        return result;
    }

    size_t start = 0;
    if (pointer[0] == '#') {
        result.fragment = true;
        start = 1;
    }
    if (start == pointer.size()) {
        return result; // "#"
    }
    if (pointer[start] == '/') {
        ++start;
    }

    size_t pos = start;
    while (true) {
        const size_t slash = pointer.find('/', pos);
        std::string piece = pointer.substr(
            pos, slash == std::string::npos ? std::string::npos : slash - pos);

        if (result.fragment) {
            piece = uri_decode(piece);
        }
        result.segments.push_back(unescape(piece));

        if (slash == std::string::npos) break;
        pos = slash + 1;
    }

    return result;
}

Segments split(const PointerLike& pointer) {
    if (pointer.is_segments()) {
        return pointer.segments();
    }
    return parse_pointer(pointer.pointer()).segments;
}

bool is_root(const PointerLike& pointer) {
    if (pointer.is_segments()) {
        return pointer.segments().empty();
    }
    const auto& str = pointer.pointer();
    return str.empty() || str == "#";
}

std::pair<std::string, std::string> split_last(const PointerLike& pointer) {
    ParsedPointer parsed;
    if (pointer.is_segments()) {
        parsed.segments = pointer.segments();
    } else {
        parsed = parse_pointer(pointer.pointer());
    }

    if (parsed.segments.empty()) {
        return {join(parsed.segments, parsed.fragment), ""};
    }

    std::string last = std::move(parsed.segments.back());
    parsed.segments.pop_back();
    return {join(parsed.segments, parsed.fragment), std::move(last)};
}

std::string join(const Segments& segments, bool fragment) {
    std::string result = fragment ? "#" : "";

    for (const auto& seg : segments) {
        result += '/';
        result += fragment ? uri_encode(escape(seg)) : escape(seg);
    }
    return result;
}

std::string join_pointers(const std::vector<std::string>& parts) {
    Segments collected;
    bool fragment = false;

    for (const auto& part : parts) {
        ParsedPointer parsed = parse_pointer(part);
        fragment = fragment || parsed.fragment;

        for (auto& seg : parsed.segments) {
            if (seg == "..") {
                // Popping past the root stays at the root
                if (!collected.empty()) collected.pop_back();
            } else if (seg != ".") {
                collected.push_back(std::move(seg));
            }
        }
    }

    return join(collected, fragment);
}

} // namespace jptr
