#include "interpreter.hpp"
#include <common/logging.hpp>
#include <optional>
#include <tensegrity/tensegrity.hpp>
#include <tensegrity/tensegrity_builder.hpp>

namespace pretenst {
namespace tenscript {

namespace {

// A twist's face that is still part of the structure. Faces joined to a
// base or to the next twist are gone, and omni faces exist only on omni twists.
std::optional<FaceId> live_face(const Tensegrity& tensegrity, const Twist& twist, FaceName name) {
    if (!twist.has_face(name)) {
        return std::nullopt;
    }
    FaceId id = twist.face(name);
    if (!tensegrity.has_face(id)) {
        return std::nullopt;
    }
    return id;
}

}  // namespace

Bud create_bud(TensegrityBuilder& builder, const Tenscript& script, const Vec3& origin) {
    Bud bud;
    bud.tree = &script.tree;
    bud.twist = builder.create_twist_at(origin, script.spin, Percent{});
    bud.next_face = FaceName::A;
    // The first twist counts as the first forward step
    bud.remaining = script.tree.forward > 0 ? script.tree.forward - 1 : 0;
    return bud;
}

std::vector<Bud> execute(TensegrityBuilder& builder, const std::vector<Bud>& buds) {
    auto log = pretenst::logging::get_logger();
    Tensegrity& tensegrity = builder.tensegrity();

    std::vector<Bud> next;
    for (const auto& bud : buds) {
        const TreeNode& tree = *bud.tree;
        if (bud.remaining > 0) {
            bool omni = tree.omni && bud.remaining == 1;
            auto base = live_face(tensegrity, bud.twist, bud.next_face);
            if (!base) {
                log->warn("Cannot grow on face {}: it is no longer available", face_name_char(bud.next_face));
                continue;
            }
            Bud grown;
            grown.tree = bud.tree;
            grown.twist = builder.create_twist_on(*base, tree.scale, omni);
            grown.next_face = FaceName::A;
            grown.remaining = bud.remaining - 1;
            log->debug("Grew {} twist, {} forward remaining", omni ? "omni" : "plain", grown.remaining);
            next.push_back(std::move(grown));
            continue;
        }

        for (const auto& [name, mark] : tree.marks) {
            auto face = live_face(tensegrity, bud.twist, name);
            if (!face) {
                log->warn("Cannot mark face {} with {}: it is no longer available", face_name_char(name), mark);
                continue;
            }
            tensegrity.face(*face).mark = mark;
        }
        for (const auto& subtree : tree.subtrees) {
            if (!live_face(tensegrity, bud.twist, subtree.face)) {
                log->warn("Cannot branch from face {}: it is no longer available", face_name_char(subtree.face));
                continue;
            }
            Bud child;
            child.tree = &subtree.tree;
            child.twist = bud.twist;
            child.next_face = subtree.face;
            child.remaining = subtree.tree.forward;
            next.push_back(std::move(child));
        }
    }
    return next;
}

}  // namespace tenscript
}  // namespace pretenst
