#include "cli_common.hpp"
#include <tenscript/tokenizer.hpp>
#include <tenscript/parser.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/tenscript_json.hpp>
#include <common/logging.hpp>

namespace pretenst::cli {

int command_parse(int argc, char** argv) {
    auto log = pretenst::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: pretenst parse <script.tenscript> [-o <output.tree.json>]\n";
            return ctx.help ? 0 : 1;
        }
        std::string output_path = resolve_output_path(ctx.input_path, ".tree.json", ctx.output_path);

        log->info("Parsing tenscript: {}", ctx.input_path);

        std::string input = read_file(ctx.input_path);

        tenscript::Tokenizer tokenizer(input);
        tenscript::Parser parser(tokenizer);
        tenscript::Tenscript script = parser.parse();

        if (parser.has_errors()) {
            for (const auto& error : parser.errors()) {
                log->error("Parse error: {}", error);
                std::cerr << "Parse error: " << error << "\n";
            }
            return 1;
        }

        json::SerializedData data;
        data.step = json::STEP_TENSCRIPT;
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.input_path;
        data.data = nlohmann::json(script);
        data.stats = {
            {"forward", script.tree.forward},
            {"subtrees", script.tree.subtrees.size()},
            {"marks", script.marks.size()}
        };

        json::write_serialized(output_path, data);

        log->info("Wrote tree to {}", output_path);
        std::cerr << "Wrote " << output_path << "\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace pretenst::cli
