#ifndef PRETENST_TENSCRIPT_INTERPRETER_HPP
#define PRETENST_TENSCRIPT_INTERPRETER_HPP

#include "ast.hpp"
#include <math/vec3.hpp>
#include <tensegrity/twist.hpp>
#include <vector>

namespace pretenst {

class TensegrityBuilder;

namespace tenscript {

// Resumable position within a tree: the twist grown so far, the face the
// next twist grows on, and how many forward twists remain.
struct Bud {
    const TreeNode* tree = nullptr;
    Twist twist;
    FaceName next_face = FaceName::A;
    int remaining = 0;
};

// Grow the first twist at the origin and return the bud that continues it
Bud create_bud(TensegrityBuilder& builder, const Tenscript& script, const Vec3& origin);

// Advance every pending bud by one step. A bud with forward twists left
// grows one twist; otherwise it marks its faces and branches into one bud
// per subtree. An empty result means growth is complete.
std::vector<Bud> execute(TensegrityBuilder& builder, const std::vector<Bud>& buds);

}  // namespace tenscript
}  // namespace pretenst

#endif // PRETENST_TENSCRIPT_INTERPRETER_HPP
