#include "life.hpp"
#include "optimizer.hpp"
#include "tensegrity.hpp"
#include <common/logging.hpp>
#include <stdexcept>
#include <string>

namespace pretenst {

Life::Life(Tensegrity& tensegrity, Stage stage)
    : tensegrity_(&tensegrity), stage_(stage) {}

bool Life::is_legal(Stage from, Stage to) {
    switch (from) {
        case Stage::Growing:
            return to == Stage::Shaping;
        case Stage::Shaping:
            return to == Stage::Slack || to == Stage::Pretensing;
        case Stage::Slack:
            return to == Stage::Shaping || to == Stage::Pretensing;
        case Stage::Pretensing:
            return to == Stage::Pretenst;
        case Stage::Pretenst:
            return to == Stage::Slack;
    }
    return false;
}

Life Life::with_transition(const LifeTransition& transition) const {
    if (transition.stage == stage_) {
        return *this;
    }
    if (!is_legal(stage_, transition.stage)) {
        throw std::logic_error(std::string("No transition ") + stage_name(stage_) +
                               " to " + stage_name(transition.stage));
    }
    if (transition.stage == Stage::Slack) {
        if (stage_ == Stage::Shaping) {
            shaping_to_slack(transition);
        } else {
            pretenst_to_slack(transition);
        }
    }
    return Life(*tensegrity_, transition.stage);
}

// Only an adopt-lengths request commits the shape; otherwise the
// scaffolding stays and converging connectors keep going.
void Life::shaping_to_slack(const LifeTransition& transition) const {
    if (!transition.adopt_lengths) {
        return;
    }
    auto& engine = tensegrity_->engine();
    engine.adopt_lengths();
    if (!tensegrity_->face_anchors().empty()) {
        engine.set_altitude(0.0f);
    }
    tensegrity_->remove_face_anchors();
    tensegrity_->remove_pull_complexes();
    engine.save_snapshot();
}

void Life::pretenst_to_slack(const LifeTransition& transition) const {
    auto log = pretenst::logging::get_logger();
    auto& engine = tensegrity_->engine();

    if (transition.strain_to_stiffness) {
        // Strains are measured on the pretenst shape, applied to the slack one
        auto adjusted = adjusted_stiffness(*tensegrity_);
        if (engine.has_snapshot()) {
            engine.restore_snapshot();
        }
        apply_stiffness(*tensegrity_, adjusted);
        log->info("Adjusted stiffness of {} intervals from strain", adjusted.size());
    } else if (transition.adopt_lengths) {
        engine.adopt_lengths();
        engine.save_snapshot();
    }
}

}  // namespace pretenst
