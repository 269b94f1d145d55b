#ifndef PRETENST_TENSEGRITY_TYPES_HPP
#define PRETENST_TENSEGRITY_TYPES_HPP

#include <fabric/fabric_geometry.hpp>
#include <fabric/interval_role.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pretenst {

using JointId = uint32_t;
using IntervalId = uint32_t;
using FaceId = uint32_t;

// Rotational handedness. The two omni spins build a left and a right
// twist back to back.
enum class Spin {
    Left,
    Right,
    LeftRight,
    RightLeft,
};

Spin opposite_spin(Spin spin);
bool is_omni_spin(Spin spin);
const char* spin_name(Spin spin);

// Face names within a twist. Lower case names are on the base side,
// upper case on the top side.
enum class FaceName : uint8_t {
    a, b, c, d, e, f, g, h,
    A, B, C, D, E, F, G, H,
};

std::optional<FaceName> face_name_from_char(char letter);
char face_name_char(FaceName name);
bool is_lower_face(FaceName name);
// Position within its case: a and A are 0, b and B are 1, ...
uint32_t face_name_ordinal(FaceName name);

struct Joint {
    JointId index = 0;
};

struct Interval {
    IntervalId index = 0;
    JointId alpha = 0;
    JointId omega = 0;
    IntervalRole role = IntervalRole::Twist;
    Percent scale;
    bool removed = false;

    bool is_push() const { return is_push_role(role); }
    bool touches(JointId joint) const { return alpha == joint || omega == joint; }
    bool connects(JointId a, JointId b) const {
        return (alpha == a && omega == b) || (alpha == b && omega == a);
    }
    JointId other_joint(JointId joint) const { return alpha == joint ? omega : alpha; }
};

// A push through a face's midpoint with pulls from every corner to both
// of its ends
struct Tip {
    IntervalId push = 0;
    std::vector<IntervalId> inner_pulls;
    std::vector<IntervalId> outer_pulls;
};

struct Face {
    FaceId id = 0;            // stable, never reused
    uint32_t index = 0;       // engine slot, renumbered on removal
    std::vector<JointId> ends;
    bool omni = false;
    Spin spin = Spin::Left;
    Percent scale;
    std::vector<IntervalId> pulls;
    std::optional<int> mark;
    std::optional<Tip> tip;
};

// Hub and spoke scaffold drawing two faces together
struct PullComplex {
    JointId alpha_hub = 0;
    JointId omega_hub = 0;
    IntervalId hub = 0;
    std::vector<IntervalId> alpha_spokes;
    std::vector<IntervalId> omega_spokes;
    FaceId alpha_face = 0;
    FaceId omega_face = 0;
    bool connector = true;
};

// Temporary ground anchor below a face
struct FaceAnchor {
    JointId anchor = 0;
    FaceId face = 0;
    std::vector<IntervalId> pulls;
};

}  // namespace pretenst

#endif // PRETENST_TENSEGRITY_TYPES_HPP
