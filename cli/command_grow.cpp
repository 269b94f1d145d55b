#include "cli_common.hpp"
#include "run_support.hpp"
#include <tenscript/parser.hpp>
#include <serialization/tenscript_json.hpp>
#include <common/logging.hpp>

namespace pretenst::cli {

namespace {
constexpr int DEFAULT_ITERATIONS = 2000;

// Either tenscript source or the tree written by "pretenst parse"
tenscript::Tenscript load_script(const std::string& path) {
    if (detail::ends_with(path, ".json")) {
        json::SerializedData data = json::read_serialized(path, json::STEP_TENSCRIPT);
        return data.data.get<tenscript::Tenscript>();
    }
    return tenscript::parse_tenscript(read_file(path));
}
}

int command_grow(int argc, char** argv) {
    auto log = pretenst::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: pretenst grow <script.tenscript|tree.json> [-o <output.fabric.json>] "
                         "[-c config.json] [--iterations N] [--pretense]\n";
            return ctx.help ? 0 : 1;
        }
        std::string output_path = resolve_output_path(ctx.input_path, ".fabric.json", ctx.output_path);
        int max_iterations = ctx.iterations.value_or(DEFAULT_ITERATIONS);

        RunConfig config = load_run_config(ctx.config_path);
        tenscript::Tenscript script = load_script(ctx.input_path);

        RelaxationFabric engine(config.features.numeric_feature(), config.engine);
        Tensegrity tensegrity(engine, config.features.numeric_feature());
        tensegrity.grow(script);

        int used = run_until(tensegrity, Stage::Shaping, max_iterations);
        log->info("Shaped '{}' after {} iterations: {} joints, {} intervals, {} faces",
                  tensegrity.name(), used, tensegrity.joints().size(),
                  tensegrity.interval_count(), tensegrity.face_count());
        if (tensegrity.growing() || !tensegrity.pull_complexes().empty()) {
            log->warn("Stopped after {} iterations with growth or connections pending", used);
        }

        if (ctx.pretense) {
            if (tensegrity.growing()) {
                throw std::runtime_error("Cannot pretense: growth did not complete");
            }
            tensegrity.request_transition(LifeTransition{Stage::Slack, true, false});
            tensegrity.request_transition(LifeTransition{Stage::Pretensing});
            used += run_until(tensegrity, Stage::Pretenst, max_iterations);
            log->info("Stage {} after {} iterations", stage_name(tensegrity.life().stage()), used);
        }

        write_fabric(output_path, tensegrity, ctx.input_path, config, used);

        log->info("Wrote fabric to {}", output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << tensegrity.joints().size() << " joints, "
                  << tensegrity.interval_count() << " intervals)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace pretenst::cli
