#include "cli_common.hpp"
#include "run_support.hpp"
#include <tensegrity/mobius_builder.hpp>
#include <common/logging.hpp>

namespace pretenst::cli {

namespace {
constexpr uint32_t DEFAULT_SEGMENTS = 30;
constexpr int DEFAULT_ITERATIONS = 200;
}

int command_mobius(int argc, char** argv) {
    auto log = pretenst::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.output_path.empty()) {
            std::cerr << "Usage: pretenst mobius -o <output.fabric.json> [-c config.json] "
                         "[--segments N] [--iterations N]\n";
            return ctx.help ? 0 : 1;
        }
        uint32_t segments = ctx.segments.value_or(DEFAULT_SEGMENTS);
        int iterations = ctx.iterations.value_or(DEFAULT_ITERATIONS);

        RunConfig config = load_run_config(ctx.config_path);
        RelaxationFabric engine(config.features.numeric_feature(), config.engine);
        Tensegrity tensegrity(engine, config.features.numeric_feature());
        tensegrity.set_name("Mobius");

        MobiusBuilder(segments).build(tensegrity);
        tensegrity.finish_growing();

        for (int i = 0; i < iterations; ++i) {
            tensegrity.iterate();
        }

        write_fabric(ctx.output_path, tensegrity, "", config, iterations);

        log->info("Wrote mobius ribbon to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << segments << " segments)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace pretenst::cli
