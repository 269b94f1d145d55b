#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Grows tensegrity structures from tenscript.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  parse   <script> [-o tree.json]     Parse a tenscript and write its tree\n";
    std::cerr << "  grow    <script|tree.json> [-o fabric.json]\n";
    std::cerr << "          Grow, connect and optionally pretense\n";
    std::cerr << "          [-c config.json] [--iterations N] [--pretense]\n";
    std::cerr << "  mobius  -o fabric.json [--segments N] [--iterations N]\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -v, --verbose   Debug logging\n";
    std::cerr << "  -h, --help      Show help\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  PRETENST_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            pretenst::logging::get_logger()->set_level(spdlog::level::debug);
        }
    }

    if (command == "parse") {
        return pretenst::cli::command_parse(argc, argv);
    }
    if (command == "grow") {
        return pretenst::cli::command_grow(argc, argv);
    }
    if (command == "mobius") {
        return pretenst::cli::command_mobius(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
