#include "ast.hpp"

namespace pretenst {
namespace tenscript {

const char* mark_action_name(MarkAction action) {
    switch (action) {
        case MarkAction::Subtree: return "subtree";
        case MarkAction::BaseFace: return "base";
        case MarkAction::JoinFaces: return "join";
        case MarkAction::FaceDistance: return "distance";
        case MarkAction::Anchor: return "anchor";
    }
    return "unknown";
}

}  // namespace tenscript
}  // namespace pretenst
