#ifndef PRETENST_CLI_COMMON_HPP
#define PRETENST_CLI_COMMON_HPP

#include <cstdint>
#include <string>
#include <optional>
#include <iostream>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>

namespace pretenst::cli {

// Options shared by the subcommands; each reads the ones it needs
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<int> iterations;
    std::optional<uint32_t> segments;
    bool pretense = false;
    bool verbose = false;
    bool help = false;
};

inline int parse_count(const std::string& flag, const std::string& text) {
    int value = 0;
    try {
        value = std::stoi(text);
    } catch (const std::exception&) {
        throw std::runtime_error(flag + " requires a number, got '" + text + "'");
    }
    if (value <= 0) {
        throw std::runtime_error(flag + " must be positive");
    }
    return value;
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto value_of = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        std::string value = argv[i + 1];
        i += 2;
        return value;
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = value_of("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = value_of("-c/--config");
        } else if (arg == "--iterations") {
            ctx.iterations = parse_count(arg, value_of(arg));
        } else if (arg == "--segments") {
            ctx.segments = static_cast<uint32_t>(parse_count(arg, value_of(arg)));
        } else if (arg == "--pretense") {
            ctx.pretense = true;
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

namespace detail {
inline bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() > suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}  // namespace detail

// Output next to the input: "tower.tsc" and "tower.tree.json" both
// become "tower" plus the suffix. An explicit -o wins.
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }
    for (const char* stage_suffix : {".tree.json", ".fabric.json"}) {
        if (detail::ends_with(input, stage_suffix)) {
            return input.substr(0, input.size() - std::string(stage_suffix).size()) + suffix;
        }
    }
    std::string::size_type stem_end = input.find_last_of('.');
    std::string::size_type dir_end = input.find_last_of('/');
    bool has_extension = stem_end != std::string::npos &&
                         (dir_end == std::string::npos || stem_end > dir_end);
    return (has_extension ? input.substr(0, stem_end) : input) + suffix;
}

// Read entire file to string
inline std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Command function declarations
int command_parse(int argc, char** argv);
int command_grow(int argc, char** argv);
int command_mobius(int argc, char** argv);

}  // namespace pretenst::cli

#endif // PRETENST_CLI_COMMON_HPP
