#ifndef PRETENST_SERIALIZATION_TENSCRIPT_JSON_HPP
#define PRETENST_SERIALIZATION_TENSCRIPT_JSON_HPP

#include <nlohmann/json.hpp>
#include <tenscript/ast.hpp>
#include <stdexcept>
#include <string>

namespace pretenst {

NLOHMANN_JSON_SERIALIZE_ENUM(Spin, {
    {Spin::Left, "Left"},
    {Spin::Right, "Right"},
    {Spin::LeftRight, "LeftRight"},
    {Spin::RightLeft, "RightLeft"},
})

// Percent as its bare value
inline void to_json(nlohmann::json& j, const Percent& percent) {
    j = percent.value;
}

inline void from_json(const nlohmann::json& j, Percent& percent) {
    percent.value = j.get<float>();
}

namespace tenscript {

NLOHMANN_JSON_SERIALIZE_ENUM(MarkAction, {
    {MarkAction::Subtree, "subtree"},
    {MarkAction::BaseFace, "base"},
    {MarkAction::JoinFaces, "join"},
    {MarkAction::FaceDistance, "distance"},
    {MarkAction::Anchor, "anchor"},
})

inline FaceName face_name_from_json(const nlohmann::json& j) {
    std::string text = j.get<std::string>();
    auto name = text.size() == 1 ? face_name_from_char(text[0]) : std::nullopt;
    if (!name) {
        throw std::runtime_error("Invalid face name: " + text);
    }
    return *name;
}

// Mark serialization
inline void to_json(nlohmann::json& j, const Mark& mark) {
    j["action"] = mark.action;
    if (mark.scale) j["scale"] = *mark.scale;
}

inline void from_json(const nlohmann::json& j, Mark& mark) {
    mark.action = j.at("action").get<MarkAction>();
    if (j.contains("scale")) {
        mark.scale = j["scale"].get<Percent>();
    }
}

// TreeNode and Subtree are mutually recursive
inline void to_json(nlohmann::json& j, const TreeNode& node);
inline void from_json(const nlohmann::json& j, TreeNode& node);

inline void to_json(nlohmann::json& j, const Subtree& subtree) {
    j["face"] = std::string(1, face_name_char(subtree.face));
    to_json(j["tree"], subtree.tree);
}

inline void from_json(const nlohmann::json& j, Subtree& subtree) {
    subtree.face = face_name_from_json(j.at("face"));
    from_json(j.at("tree"), subtree.tree);
}

inline void to_json(nlohmann::json& j, const TreeNode& node) {
    j["forward"] = node.forward;
    j["scale"] = node.scale;
    j["omni"] = node.omni;
    nlohmann::json subtrees = nlohmann::json::array();
    for (const auto& subtree : node.subtrees) {
        nlohmann::json s;
        to_json(s, subtree);
        subtrees.push_back(s);
    }
    j["subtrees"] = subtrees;
    nlohmann::json marks = nlohmann::json::object();
    for (const auto& [face, number] : node.marks) {
        marks[std::string(1, face_name_char(face))] = number;
    }
    j["marks"] = marks;
}

inline void from_json(const nlohmann::json& j, TreeNode& node) {
    node.forward = j.value("forward", 0);
    node.scale = Percent{j.value("scale", 100.0f)};
    node.omni = j.value("omni", false);
    node.subtrees.clear();
    if (j.contains("subtrees")) {
        for (const auto& s : j["subtrees"]) {
            Subtree subtree;
            from_json(s, subtree);
            node.subtrees.push_back(std::move(subtree));
        }
    }
    node.marks.clear();
    if (j.contains("marks")) {
        for (const auto& [face, number] : j["marks"].items()) {
            node.marks[face_name_from_json(face)] = number.get<int>();
        }
    }
}

// Tenscript serialization
inline void to_json(nlohmann::json& j, const Tenscript& script) {
    j["name"] = script.name;
    j["spin"] = script.spin;
    j["pushes_per_twist"] = script.pushes_per_twist;
    to_json(j["tree"], script.tree);
    nlohmann::json marks = nlohmann::json::object();
    for (const auto& [number, mark] : script.marks) {
        marks[std::to_string(number)] = mark;
    }
    j["marks"] = marks;
}

inline void from_json(const nlohmann::json& j, Tenscript& script) {
    script.name = j.value("name", "");
    script.spin = j.at("spin").get<Spin>();
    script.pushes_per_twist = j.value("pushes_per_twist", 3u);
    from_json(j.at("tree"), script.tree);
    script.marks.clear();
    if (j.contains("marks")) {
        for (const auto& [number, mark] : j["marks"].items()) {
            script.marks[std::stoi(number)] = mark.get<Mark>();
        }
    }
}

}  // namespace tenscript
}  // namespace pretenst

#endif // PRETENST_SERIALIZATION_TENSCRIPT_JSON_HPP
