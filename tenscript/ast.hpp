#ifndef PRETENST_TENSCRIPT_AST_HPP
#define PRETENST_TENSCRIPT_AST_HPP

#include <tensegrity/tensegrity_types.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pretenst {
namespace tenscript {

// What happens to the faces carrying a mark once growth is complete
enum class MarkAction {
    Subtree,
    BaseFace,
    JoinFaces,
    FaceDistance,
    Anchor,
};

const char* mark_action_name(MarkAction action);

struct Mark {
    MarkAction action = MarkAction::JoinFaces;
    std::optional<Percent> scale;
};

// Forward declaration
struct Subtree;

// One branch of growth: forward twists, then marks and sub-branches on
// the faces of the last twist.
struct TreeNode {
    int forward = 0;
    Percent scale;
    bool omni = false;            // last forward twist is an omni twist
    std::vector<Subtree> subtrees;
    std::map<FaceName, int> marks;
};

struct Subtree {
    FaceName face = FaceName::A;
    TreeNode tree;
};

struct Tenscript {
    std::string name;
    Spin spin = Spin::Left;
    uint32_t pushes_per_twist = 3;
    TreeNode tree;
    std::map<int, Mark> marks;
};

}  // namespace tenscript
}  // namespace pretenst

#endif // PRETENST_TENSCRIPT_AST_HPP
