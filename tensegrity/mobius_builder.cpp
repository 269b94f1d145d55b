#include "mobius_builder.hpp"
#include "tensegrity.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace pretenst {

namespace {

const Percent CROSS_SCALE = percent_from_factor(std::sqrt(5.0f));
constexpr Percent WIDTH_SCALE = percent_from_factor(1.0f);
constexpr Percent LENGTH_SCALE = percent_from_factor(0.4f);

}  // namespace

MobiusBuilder::MobiusBuilder(uint32_t segments) : segments_(segments) {
    if (segments_ < 3) {
        throw std::invalid_argument("MobiusBuilder: need at least 3 segments");
    }
}

void MobiusBuilder::build(Tensegrity& tensegrity) const {
    auto log = pretenst::logging::get_logger();

    if (!tensegrity.joints().empty()) {
        throw std::logic_error("MobiusBuilder::build: structure is not empty");
    }

    const float two_pi = 2.0f * std::numbers::pi_v<float>;
    float radius = static_cast<float>(segments_) * factor_from_percent(LENGTH_SCALE) / two_pi;
    auto location = [radius](bool bottom, float angle) {
        return Vec3(std::sin(angle) * radius, bottom ? -0.5f : 0.5f, std::cos(angle) * radius);
    };

    std::vector<JointId> joints;
    for (uint32_t segment = 0; segment < segments_; ++segment) {
        float angle = static_cast<float>(segment) / static_cast<float>(segments_) * two_pi;
        joints.push_back(tensegrity.create_joint(location(true, angle)));
        joints.push_back(tensegrity.create_joint(location(false, angle)));
    }

    for (uint32_t segment = 0; segment + 1 < segments_; ++segment) {
        const JointId* joint = &joints[segment * 2];
        tensegrity.create_interval(joint[0], joint[1], IntervalRole::RibbonShort, WIDTH_SCALE);
        tensegrity.create_interval(joint[0], joint[2], IntervalRole::RibbonLong, LENGTH_SCALE);
        tensegrity.create_interval(joint[1], joint[3], IntervalRole::RibbonLong, LENGTH_SCALE);
    }
    for (uint32_t segment = 0; segment + 2 < segments_; ++segment) {
        const JointId* joint = &joints[segment * 2];
        tensegrity.create_interval(joint[0], joint[5], IntervalRole::RibbonPush, CROSS_SCALE);
        tensegrity.create_interval(joint[1], joint[4], IntervalRole::RibbonPush, CROSS_SCALE);
    }

    // Close the loop with a half twist: bottom meets top
    auto end_joint = [&](bool bottom, bool near, bool step_back) {
        uint32_t index = near ? (step_back ? 2 : 0) : (segments_ - (step_back ? 2 : 1)) * 2;
        return joints[index + (bottom ? 0 : 1)];
    };
    JointId bot_near = end_joint(true, true, false);
    JointId top_near = end_joint(false, true, false);
    JointId bot_far = end_joint(true, false, false);
    JointId top_far = end_joint(false, false, false);
    tensegrity.create_interval(bot_far, top_far, IntervalRole::RibbonShort, WIDTH_SCALE);
    tensegrity.create_interval(bot_near, top_far, IntervalRole::RibbonLong, LENGTH_SCALE);
    tensegrity.create_interval(bot_far, top_near, IntervalRole::RibbonLong, LENGTH_SCALE);

    JointId bot_near_x = end_joint(true, true, true);
    JointId top_near_x = end_joint(false, true, true);
    JointId bot_far_x = end_joint(true, false, true);
    JointId top_far_x = end_joint(false, false, true);
    tensegrity.create_interval(bot_near, bot_far_x, IntervalRole::RibbonPush, CROSS_SCALE);
    tensegrity.create_interval(bot_far, bot_near_x, IntervalRole::RibbonPush, CROSS_SCALE);
    tensegrity.create_interval(top_near_x, top_far, IntervalRole::RibbonPush, CROSS_SCALE);
    tensegrity.create_interval(top_far_x, top_near, IntervalRole::RibbonPush, CROSS_SCALE);

    log->info("Mobius ribbon: {} segments, {} joints, {} intervals",
              segments_, joints.size(), tensegrity.interval_count());
}

}  // namespace pretenst
