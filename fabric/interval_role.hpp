#ifndef PRETENST_FABRIC_INTERVAL_ROLE_HPP
#define PRETENST_FABRIC_INTERVAL_ROLE_HPP

#include "features.hpp"

namespace pretenst {

// Structural purpose of an interval. Determines its default length and
// whether it pushes or pulls.
enum class IntervalRole {
    RootPush,
    PhiPush,
    Twist,
    PhiTriangle,
    Ring,
    Cross,
    InterTwist,
    RadialPull,
    ConnectorPull,
    FaceDistancer,
    FaceAnchor,
    TipPush,
    TipInner,
    TipOuter,
    InterTip,
    RibbonPush,
    RibbonShort,
    RibbonLong,
};

bool is_push_role(IntervalRole role);

// Ribbon members are left alone by the stiffness optimizer
bool is_ribbon_role(IntervalRole role);

// Temporary scaffolding removed before the structure goes slack
bool is_scaffold_role(IntervalRole role);

WorldFeature role_length_feature(IntervalRole role);

const char* role_name(IntervalRole role);

}  // namespace pretenst

#endif // PRETENST_FABRIC_INTERVAL_ROLE_HPP
