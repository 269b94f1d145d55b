#ifndef PRETENST_SERIALIZATION_CONFIG_JSON_HPP
#define PRETENST_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec3.hpp>
#include <fabric/features.hpp>
#include <engine/relaxation_fabric.hpp>
#include <stdexcept>
#include <string>

namespace pretenst {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j[0].get<float>();
    v.y = j[1].get<float>();
    v.z = j[2].get<float>();
}

// FeatureSet serialization: every feature by snake_case name
inline void to_json(nlohmann::json& j, const FeatureSet& features) {
    j = nlohmann::json::object();
    for (WorldFeature feature : ALL_WORLD_FEATURES) {
        j[feature_name(feature)] = features.value(feature);
    }
}

// Only the listed features are overridden; an unknown name is an error
inline void from_json(const nlohmann::json& j, FeatureSet& features) {
    for (const auto& [key, value] : j.items()) {
        auto feature = feature_from_name(key);
        if (!feature) {
            throw std::runtime_error("Unknown feature: " + key);
        }
        features.set(*feature, value.get<float>());
    }
}

// RelaxationConfig serialization
inline void to_json(nlohmann::json& j, const RelaxationConfig& config) {
    j = {
        {"dt", config.dt},
        {"min_mass", config.min_mass},
        {"floor_altitude", config.floor_altitude},
        {"num_threads", config.num_threads}
    };
}

inline void from_json(const nlohmann::json& j, RelaxationConfig& config) {
    config.dt = j.value("dt", 0.2f);
    config.min_mass = j.value("min_mass", 0.1f);
    config.floor_altitude = j.value("floor_altitude", 0.0f);
    config.num_threads = j.value("num_threads", 0);
}

}  // namespace pretenst

#endif // PRETENST_SERIALIZATION_CONFIG_JSON_HPP
