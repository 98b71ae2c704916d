/**
 * @file Codec.cpp
 * @brief Implementation of segment escaping
 */

#include "jptr/Codec.hpp"

namespace jptr {

namespace {
    /**
     * @brief Replace every occurrence of from with to, left to right
     */
    std::string replace_all(const std::string& str, const std::string& from,
                            const std::string& to) {
        std::string result;
        result.reserve(str.size());

        size_t pos = 0;
        while (true) {
            size_t hit = str.find(from, pos);
            if (hit == std::string::npos) {
                result.append(str, pos, std::string::npos);
                break;
            }
            result.append(str, pos, hit - pos);
            result += to;
            pos = hit + from.size();
        }
        return result;
    }

    bool is_uri_unreserved(unsigned char c) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            return true;
        }
        switch (c) {
            case '-': case '_': case '.': case '!':
            case '~': case '*': case '\'': case '(': case ')':
                return true;
            default:
                return false;
        }
    }

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string escape(const std::string& raw) {
    // "~" first, otherwise the "~" of "~1" would be escaped again
    return replace_all(replace_all(raw, "~", "~0"), "/", "~1");
}

std::string unescape(const std::string& encoded) {
    if (encoded.find('~') == std::string::npos) {
        return encoded;
    }
    return replace_all(replace_all(encoded, "~1", "/"), "~0", "~");
}

std::string uri_encode(const std::string& segment) {
    static const char digits[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(segment.size());

    for (char ch : segment) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_uri_unreserved(c)) {
            result += ch;
        } else {
            result += '%';
            result += digits[c >> 4];
            result += digits[c & 0x0F];
        }
    }
    return result;
}

std::string uri_decode(const std::string& segment) {
    if (segment.find('%') == std::string::npos) {
        return segment;
    }

    std::string result;
    result.reserve(segment.size());

    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '%' && i + 2 < segment.size()) {
            const int hi = hex_value(segment[i + 1]);
            const int lo = hex_value(segment[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += segment[i];
    }
    return result;
}

} // namespace jptr
