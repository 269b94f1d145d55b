#ifndef PRETENST_CLI_RUN_SUPPORT_HPP
#define PRETENST_CLI_RUN_SUPPORT_HPP

#include "cli_common.hpp"
#include <common/logging.hpp>
#include <engine/relaxation_fabric.hpp>
#include <fabric/features.hpp>
#include <serialization/config_json.hpp>
#include <serialization/fabric_json.hpp>
#include <serialization/json_serialization.hpp>
#include <tensegrity/tensegrity.hpp>
#include <optional>
#include <string>

namespace pretenst::cli {

constexpr float PUSH_RADIUS = 0.04f;
constexpr float PULL_RADIUS = 0.008f;
constexpr float JOINT_RADIUS = 0.06f;

// Everything a run reads from -c config.json
struct RunConfig {
    FeatureSet features;
    RelaxationConfig engine;

    nlohmann::json to_json() const {
        return {{"features", features}, {"engine", engine}};
    }
};

inline RunConfig load_run_config(const std::optional<std::string>& path) {
    RunConfig config;
    if (!path) {
        return config;
    }
    auto log = pretenst::logging::get_logger();
    nlohmann::json j = json::read_json_file(*path);
    if (j.contains("features")) {
        config.features = j["features"].get<FeatureSet>();
    }
    if (j.contains("engine")) {
        config.engine = j["engine"].get<RelaxationConfig>();
    }
    log->info("Loaded config from {} ({} feature overrides)", *path, config.features.overrides().size());
    return config;
}

// Iterate until the structure settles into the wanted stage with nothing
// left to grow or connect. Returns the number of iterations used.
inline int run_until(Tensegrity& tensegrity, Stage wanted, int max_iterations) {
    int used = 0;
    while (used < max_iterations) {
        tensegrity.iterate();
        used++;
        bool settled = !tensegrity.growing() && tensegrity.pull_complexes().empty() &&
                       tensegrity.life().stage() == wanted;
        if (settled) {
            break;
        }
    }
    return used;
}

inline void write_fabric(const std::string& path, const Tensegrity& tensegrity, const std::string& source,
                         const RunConfig& config, int iterations) {
    json::SerializedData data;
    data.step = json::STEP_FABRIC;
    data.timestamp = json::get_timestamp();
    data.source_file = source;
    data.config = config.to_json();
    data.data = nlohmann::json(tensegrity.fabric_output(PUSH_RADIUS, PULL_RADIUS, JOINT_RADIUS));
    data.stats = {
        {"joints", tensegrity.joints().size()},
        {"intervals", tensegrity.interval_count()},
        {"faces", tensegrity.face_count()},
        {"stage", tensegrity.life().stage()},
        {"iterations", iterations}
    };
    json::write_serialized(path, data);
}

}  // namespace pretenst::cli

#endif // PRETENST_CLI_RUN_SUPPORT_HPP
