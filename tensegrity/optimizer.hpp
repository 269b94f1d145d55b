#ifndef PRETENST_TENSEGRITY_OPTIMIZER_HPP
#define PRETENST_TENSEGRITY_OPTIMIZER_HPP

#include "tensegrity_types.hpp"
#include <vector>

namespace pretenst {

class Tensegrity;

struct StiffnessAdjustment {
    IntervalId interval = 0;
    float stiffness = 0.0f;
    float linear_density = 0.0f;
};

// Stiffness proportional to each member's share of the average absolute
// strain. Ribbon members and members resting on the ground are left out.
std::vector<StiffnessAdjustment> adjusted_stiffness(const Tensegrity& tensegrity);

void apply_stiffness(Tensegrity& tensegrity, const std::vector<StiffnessAdjustment>& adjustments);

}  // namespace pretenst

#endif // PRETENST_TENSEGRITY_OPTIMIZER_HPP
