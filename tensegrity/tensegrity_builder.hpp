#ifndef PRETENST_TENSEGRITY_BUILDER_HPP
#define PRETENST_TENSEGRITY_BUILDER_HPP

#include "tensegrity_types.hpp"
#include "twist.hpp"
#include <math/vec3.hpp>
#include <tenscript/ast.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace pretenst {

class Tensegrity;

// Locations for the two ends of one push
struct PointPair {
    Vec3 alpha;
    Vec3 omega;
};

// Roles of the members laid down when two faces are connected
struct ConnectRoles {
    IntervalRole ring = IntervalRole::Ring;
    IntervalRole up = IntervalRole::InterTwist;
    IntervalRole down = IntervalRole::InterTwist;
};

// Plain faces are bridged with rings and inter-twist members, omni faces
// with cross members, and two omni faces with uniform phi triangles.
ConnectRoles connect_roles(bool alpha_omni, bool omega_omni);

// Point pairs for a twist around a unit circle in the horizontal plane
std::vector<PointPair> first_twist_point_pairs(const Vec3& location, uint32_t pushes_per_twist,
                                               Spin spin, Percent scale, const NumericFeature& numeric_feature);

// Point pairs for a twist rising from a ring of base points
std::vector<PointPair> twist_point_pairs(const std::vector<Vec3>& base, Spin spin, Percent scale,
                                         const NumericFeature& numeric_feature);

// Builds topology on a structure graph. Holds no state of its own.
class TensegrityBuilder {
public:
    explicit TensegrityBuilder(Tensegrity& tensegrity);

    Tensegrity& tensegrity() { return tensegrity_; }

    Twist create_twist_at(const Vec3& location, Spin spin, Percent scale);
    // Grows a twist out of the base face, consuming it
    Twist create_twist_on(FaceId base, Percent twist_scale, bool omni);

    // Replace the face's ring with a push through its middle
    Tip create_tip_on(FaceId face);
    IntervalId create_inter_tip(FaceId tip_face_a, FaceId tip_face_b, Percent distance_scale);

    // Re-express the whole structure so the face sits at the origin, facing down
    void face_to_origin(FaceId face);

    void create_radial_pulls(const std::vector<FaceId>& faces, tenscript::MarkAction action,
                             std::optional<Percent> action_scale = std::nullopt);

    // Connect the faces of every connector complex whose hub has closed to
    // within the connector length, removing its scaffolding. Connector
    // complexes that lost a face are dropped. Returns the number connected.
    size_t check_connectors(std::vector<PullComplex>& complexes,
                            const std::function<void(const PullComplex&)>& remove);

    // Bridge two faces with a band of members and remove both faces.
    // Returns the members created.
    std::vector<IntervalId> connect(FaceId face_a, FaceId face_b, const ConnectRoles& roles);

    // Rotate B's ends so they line up with A's reversed ends
    void rotate_for_best_ring(FaceId face_a, FaceId face_b);

private:
    Twist create_twist(const std::vector<PointPair>& points, Percent scale, Spin spin,
                       IntervalRole push_role, IntervalRole pull_role);
    Twist create_omni_twist(const Twist& bottom, const Twist& top, size_t first_interval);
    std::vector<PointPair> face_twist_point_pairs(FaceId face, Percent scale) const;
    PointPair tip_point_pair(FaceId face) const;

    Tensegrity& tensegrity_;
};

}  // namespace pretenst

#endif // PRETENST_TENSEGRITY_BUILDER_HPP
