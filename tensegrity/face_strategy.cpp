#include "face_strategy.hpp"
#include "tensegrity_builder.hpp"
#include <common/logging.hpp>

namespace pretenst {

FaceStrategy::FaceStrategy(std::vector<FaceId> faces, tenscript::Mark mark)
    : faces_(std::move(faces)), mark_(mark) {}

void FaceStrategy::execute(TensegrityBuilder& builder) const {
    auto log = pretenst::logging::get_logger();
    log->debug("Face strategy {} on {} faces", tenscript::mark_action_name(mark_.action), faces_.size());

    switch (mark_.action) {
        case tenscript::MarkAction::Subtree:
        case tenscript::MarkAction::Anchor:
            break;
        case tenscript::MarkAction::BaseFace:
            builder.face_to_origin(faces_[0]);
            break;
        case tenscript::MarkAction::JoinFaces:
        case tenscript::MarkAction::FaceDistance:
            builder.create_radial_pulls(faces_, mark_.action, mark_.scale);
            break;
    }
}

std::vector<FaceStrategy> face_strategies(const std::vector<Face>& faces,
                                          const std::map<int, tenscript::Mark>& marks) {
    std::map<int, std::vector<FaceId>> collated;
    for (const auto& face : faces) {
        if (face.mark) {
            collated[*face.mark].push_back(face.id);
        }
    }

    std::vector<FaceStrategy> strategies;
    for (auto& [number, marked] : collated) {
        tenscript::Mark mark;
        auto declared = marks.find(number);
        if (declared != marks.end()) {
            mark = declared->second;
        } else {
            mark.action = marked.size() == 1 ? tenscript::MarkAction::BaseFace : tenscript::MarkAction::JoinFaces;
        }
        strategies.emplace_back(std::move(marked), mark);
    }
    return strategies;
}

}  // namespace pretenst
