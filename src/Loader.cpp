/**
 * @file Loader.cpp
 * @brief JSON document reading and writing
 */

#include "jptr/Loader.hpp"
#include "jptr/Errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace jptr {

namespace {

/**
 * @brief Convert nlohmann's 1-based byte offset into a line and column
 */
std::pair<int, int> line_and_column(const std::string& text, std::size_t byte) {
    int line = 1;
    int column = 1;
    const std::size_t end = std::min(byte > 0 ? byte - 1 : 0, text.size());
    for (std::size_t i = 0; i < end; ++i) {
        if (text[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

} // anonymous namespace

Value load_json_stream(std::istream& in, const std::string& source_name) {
    const std::string text{std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>()};
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        const auto [line, column] = line_and_column(text, e.byte);
        throw DocumentParseError(source_name, line, column, e.what());
    }
}

Value load_json_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    return load_json_stream(file, path);
}

void write_json_file(const std::string& path, const Value& data, int indent) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open for write: " + path);
    }
    out << data.dump(indent) << "\n";
}

} // namespace jptr
