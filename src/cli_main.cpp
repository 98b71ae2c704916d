#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "jptr/Loader.hpp"
#include "jptr/Parse.hpp"
#include "jptr/Pointer.hpp"
#include "jptr/Traverse.hpp"

using namespace jptr;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("jptr", "Read and modify JSON documents via JSON pointers");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("f,file", "Path to JSON document (default: stdin)", cxxopts::value<std::string>())
            ("o,out", "Write the modified document to FILE instead of stdout", cxxopts::value<std::string>())
            ("indent", "JSON indentation width, -1 for a single line", cxxopts::value<int>()->default_value("2"))
            ("fragment", "Print '#'-form pointers in `list`")
            ("keep-indices", "`delete` nulls array elements instead of erasing them")
            ("h,help", "Show help");

        // Command + its arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: get POINTER | set POINTER VALUE | delete POINTER | list"
                         " | split POINTER | join PART...\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];
        const int indent = result["indent"].as<int>();

        if (cmdv.size() < 2 && (cmd == "get" || cmd == "set" || cmd == "delete" ||
                                cmd == "split" || cmd == "join")) {
            std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
            return 1;
        }

        // Commands that only manipulate pointer strings
        if (cmd == "split") {
            for (const auto& seg : split(cmdv[1])) {
                std::cout << seg << "\n";
            }
            return 0;
        }

        if (cmd == "join") {
            std::vector<std::string> parts(cmdv.begin() + 1, cmdv.end());
            std::cout << join_pointers(parts) << "\n";
            return 0;
        }

        if (cmd != "get" && cmd != "set" && cmd != "delete" && cmd != "list") {
            std::cerr << "Error: unknown command '" << cmd << "'\n";
            return 1;
        }

        Value doc = result.count("file")
            ? load_json_file(result["file"].as<std::string>())
            : load_json_stream(std::cin);

        auto emit = [&](const Value& v) {
            if (result.count("out")) {
                const auto out = result["out"].as<std::string>();
                write_json_file(out, v, indent);
                std::cout << "Wrote " << out << "\n";
            } else {
                std::cout << v.dump(indent) << "\n";
            }
        };

        if (cmd == "get") {
            const Value* found = get(doc, cmdv[1]);
            if (!found) {
                std::cerr << "Error: not found: " << cmdv[1] << "\n";
                return 1;
            }
            std::cout << found->dump(indent) << "\n";
            return 0;
        }

        if (cmd == "set") {
            if (cmdv.size() < 3) {
                std::cerr << "Error: insufficient arguments for command 'set'\n";
                return 1;
            }
            emit(set(doc, cmdv[1], parse_value(cmdv[2])));
            return 0;
        }

        if (cmd == "delete") {
            emit(remove(doc, cmdv[1], result.count("keep-indices") > 0));
            return 0;
        }

        // list
        for (const auto& [pointer, value] : flatten_to_pointers(doc, result.count("fragment") > 0)) {
            std::cout << pointer << " = " << value.dump() << "\n";
        }
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
