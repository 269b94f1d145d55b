#ifndef PRETENST_TENSEGRITY_TWIST_HPP
#define PRETENST_TENSEGRITY_TWIST_HPP

#include "tensegrity_types.hpp"
#include <vector>

namespace pretenst {

// Result of a construction step. Faces are held by stable id; the
// interval indices are only valid until the next removal.
struct Twist {
    Percent scale;
    std::vector<FaceId> faces;
    std::vector<IntervalId> pushes;
    std::vector<IntervalId> pulls;
    bool omni = false;

    // Plain twist: a is the base face and A the top face.
    // Omni twist over n corners: faces are [a, b.., B.., A] with n lower
    // and n upper touching faces.
    FaceId face(FaceName name) const;
    bool has_face(FaceName name) const;
};

}  // namespace pretenst

#endif // PRETENST_TENSEGRITY_TWIST_HPP
