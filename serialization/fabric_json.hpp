#ifndef PRETENST_SERIALIZATION_FABRIC_JSON_HPP
#define PRETENST_SERIALIZATION_FABRIC_JSON_HPP

#include <nlohmann/json.hpp>
#include <engine/stage.hpp>
#include <fabric/interval_role.hpp>
#include <tensegrity/fabric_output.hpp>

namespace pretenst {

NLOHMANN_JSON_SERIALIZE_ENUM(Stage, {
    {Stage::Growing, "Growing"},
    {Stage::Shaping, "Shaping"},
    {Stage::Slack, "Slack"},
    {Stage::Pretensing, "Pretensing"},
    {Stage::Pretenst, "Pretenst"},
})

// OutputJoint serialization
inline void to_json(nlohmann::json& j, const OutputJoint& joint) {
    j = {
        {"index", joint.index},
        {"radius", joint.radius},
        {"x", joint.x},
        {"y", joint.y},
        {"z", joint.z}
    };
}

inline void from_json(const nlohmann::json& j, OutputJoint& joint) {
    joint.index = j.at("index").get<uint32_t>();
    joint.radius = j.value("radius", 0.0f);
    joint.x = j.value("x", 0.0f);
    joint.y = j.value("y", 0.0f);
    joint.z = j.value("z", 0.0f);
}

// OutputInterval serialization
inline void to_json(nlohmann::json& j, const OutputInterval& interval) {
    j = {
        {"index", interval.index},
        {"joints", interval.joints},
        {"type", interval.type},
        {"strain", interval.strain},
        {"stiffness", interval.stiffness},
        {"linear_density", interval.linear_density},
        {"role", interval.role},
        {"scale", interval.scale},
        {"ideal_length", interval.ideal_length},
        {"is_push", interval.is_push},
        {"length", interval.length},
        {"radius", interval.radius}
    };
}

inline void from_json(const nlohmann::json& j, OutputInterval& interval) {
    interval.index = j.at("index").get<uint32_t>();
    interval.joints = j.at("joints").get<std::array<uint32_t, 2>>();
    interval.type = j.value("type", "Pull");
    interval.strain = j.value("strain", 0.0f);
    interval.stiffness = j.value("stiffness", 0.0f);
    interval.linear_density = j.value("linear_density", 0.0f);
    interval.role = j.value("role", "");
    interval.scale = j.value("scale", 100.0f);
    interval.ideal_length = j.value("ideal_length", 0.0f);
    interval.is_push = j.value("is_push", false);
    interval.length = j.value("length", 0.0f);
    interval.radius = j.value("radius", 0.0f);
}

// FabricOutput serialization
inline void to_json(nlohmann::json& j, const FabricOutput& output) {
    j = {
        {"name", output.name},
        {"joints", output.joints},
        {"intervals", output.intervals}
    };
}

inline void from_json(const nlohmann::json& j, FabricOutput& output) {
    output.name = j.value("name", "");
    output.joints = j.at("joints").get<std::vector<OutputJoint>>();
    output.intervals = j.at("intervals").get<std::vector<OutputInterval>>();
}

}  // namespace pretenst

#endif // PRETENST_SERIALIZATION_FABRIC_JSON_HPP
