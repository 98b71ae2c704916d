/**
 * @file Loader.hpp
 * @brief Reading and writing JSON documents for the jptr tool
 *
 * The library itself works on in-memory values; these helpers only feed the
 * command-line tool.
 */

#ifndef JPTR_LOADER_HPP
#define JPTR_LOADER_HPP

#include "jptr/Value.hpp"
#include <istream>
#include <string>

namespace jptr {

/**
 * @brief Load a JSON document from a file
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the JSON is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a JSON document from a stream (e.g. std::cin)
 *
 * @param in Input stream
 * @param source_name Name used in DocumentParseError messages
 * @throws DocumentParseError if the JSON is invalid; line and column point
 *         at the offending character
 */
Value load_json_stream(std::istream& in, const std::string& source_name = "<stdin>");

/**
 * @brief Write a value as JSON
 *
 * @param path Output file (truncated)
 * @param data Value to write
 * @param indent Indentation width; negative writes a single line
 * @throws std::runtime_error if the file cannot be opened for writing
 */
void write_json_file(const std::string& path, const Value& data, int indent = 2);

} // namespace jptr

#endif // JPTR_LOADER_HPP
