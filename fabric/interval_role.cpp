#include "interval_role.hpp"
#include <stdexcept>

namespace pretenst {

bool is_push_role(IntervalRole role) {
    switch (role) {
        case IntervalRole::RootPush:
        case IntervalRole::PhiPush:
        case IntervalRole::TipPush:
        case IntervalRole::RibbonPush:
            return true;
        case IntervalRole::Twist:
        case IntervalRole::PhiTriangle:
        case IntervalRole::Ring:
        case IntervalRole::Cross:
        case IntervalRole::InterTwist:
        case IntervalRole::RadialPull:
        case IntervalRole::ConnectorPull:
        case IntervalRole::FaceDistancer:
        case IntervalRole::FaceAnchor:
        case IntervalRole::TipInner:
        case IntervalRole::TipOuter:
        case IntervalRole::InterTip:
        case IntervalRole::RibbonShort:
        case IntervalRole::RibbonLong:
            return false;
    }
    return false;
}

bool is_ribbon_role(IntervalRole role) {
    return role == IntervalRole::RibbonPush ||
           role == IntervalRole::RibbonShort ||
           role == IntervalRole::RibbonLong;
}

bool is_scaffold_role(IntervalRole role) {
    return role == IntervalRole::RadialPull ||
           role == IntervalRole::ConnectorPull ||
           role == IntervalRole::FaceDistancer ||
           role == IntervalRole::FaceAnchor;
}

WorldFeature role_length_feature(IntervalRole role) {
    switch (role) {
        case IntervalRole::RootPush:
        case IntervalRole::PhiPush:
            return WorldFeature::PushLength;
        case IntervalRole::Twist:
        case IntervalRole::PhiTriangle:
            return WorldFeature::TriangleLength;
        case IntervalRole::Ring:
            return WorldFeature::RingLength;
        case IntervalRole::Cross:
        case IntervalRole::InterTwist:
            return WorldFeature::CrossLength;
        case IntervalRole::RadialPull:
        case IntervalRole::FaceDistancer:
            return WorldFeature::RadialLength;
        case IntervalRole::ConnectorPull:
            return WorldFeature::ConnectorRestLength;
        case IntervalRole::FaceAnchor:
            return WorldFeature::AnchorLength;
        case IntervalRole::TipPush:
            return WorldFeature::TipPushLength;
        case IntervalRole::TipInner:
        case IntervalRole::TipOuter:
            return WorldFeature::TipPullLength;
        case IntervalRole::InterTip:
            return WorldFeature::InterTipLength;
        case IntervalRole::RibbonPush:
            return WorldFeature::RibbonPushLength;
        case IntervalRole::RibbonShort:
            return WorldFeature::RibbonShortLength;
        case IntervalRole::RibbonLong:
            return WorldFeature::RibbonLongLength;
    }
    throw std::invalid_argument("role_length_feature: unknown role");
}

const char* role_name(IntervalRole role) {
    switch (role) {
        case IntervalRole::RootPush: return "RootPush";
        case IntervalRole::PhiPush: return "PhiPush";
        case IntervalRole::Twist: return "Twist";
        case IntervalRole::PhiTriangle: return "PhiTriangle";
        case IntervalRole::Ring: return "Ring";
        case IntervalRole::Cross: return "Cross";
        case IntervalRole::InterTwist: return "InterTwist";
        case IntervalRole::RadialPull: return "RadialPull";
        case IntervalRole::ConnectorPull: return "ConnectorPull";
        case IntervalRole::FaceDistancer: return "FaceDistancer";
        case IntervalRole::FaceAnchor: return "FaceAnchor";
        case IntervalRole::TipPush: return "TipPush";
        case IntervalRole::TipInner: return "TipInner";
        case IntervalRole::TipOuter: return "TipOuter";
        case IntervalRole::InterTip: return "InterTip";
        case IntervalRole::RibbonPush: return "RibbonPush";
        case IntervalRole::RibbonShort: return "RibbonShort";
        case IntervalRole::RibbonLong: return "RibbonLong";
    }
    return "Unknown";
}

}  // namespace pretenst
