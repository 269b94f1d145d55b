#ifndef PRETENST_TENSEGRITY_HPP
#define PRETENST_TENSEGRITY_HPP

#include "tensegrity_types.hpp"
#include "fabric_output.hpp"
#include "life.hpp"
#include <engine/fabric_engine.hpp>
#include <fabric/features.hpp>
#include <tenscript/ast.hpp>
#include <tenscript/interpreter.hpp>
#include <deque>
#include <functional>
#include <optional>
#include <vector>

namespace pretenst {

using LifeObserver = std::function<void(const Life&)>;

// The structure graph. Owns the joints, intervals, faces and scaffolding
// of one tensegrity and is the only code that registers or removes
// elements in the engine.
//
// Interval and face indices always equal their position in the engine's
// arrays: removing one renumbers every index above it, including the
// indices cached in faces, tips, pull complexes and face anchors.
class Tensegrity {
public:
    Tensegrity(FabricEngine& engine, NumericFeature numeric_feature, uint32_t pushes_per_twist = 3);

    Tensegrity(const Tensegrity&) = delete;
    Tensegrity& operator=(const Tensegrity&) = delete;

    // Start growing a tenscript: builds the first twist at the origin
    void grow(const tenscript::Tenscript& script, const Vec3& origin = Vec3{});
    bool growing() const { return buds_.has_value(); }
    size_t pending_buds() const { return buds_ ? buds_->size() : 0; }
    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    // Joints
    JointId create_joint(const Vec3& location);
    const std::vector<Joint>& joints() const { return joints_; }
    Vec3 joint_location(JointId joint) const;
    float joint_distance(JointId alpha, JointId omega) const;

    // Intervals
    IntervalId create_interval(JointId alpha, JointId omega, IntervalRole role, Percent scale);
    IntervalId create_connector(JointId alpha, JointId omega, float stiffness, float linear_density);
    void remove_interval(IntervalId index);
    void change_interval_scale(IntervalId index, float factor);
    Interval& interval(IntervalId index);
    const Interval& interval(IntervalId index) const;
    size_t interval_count() const { return intervals_.size(); }
    const std::vector<Interval>& intervals() const { return intervals_; }
    std::optional<IntervalId> find_interval(JointId joint1, JointId joint2) const;
    float interval_length(IntervalId index) const;
    // The joint at the other end of this joint's push
    JointId across_push(JointId joint) const;

    // Faces. Boundary pulls are looked up newest first when not supplied.
    FaceId create_face(std::vector<JointId> ends, bool omni, Spin spin, Percent scale,
                       std::optional<std::vector<IntervalId>> known_pulls = std::nullopt);
    void remove_face(FaceId id);
    Face& face(FaceId id);
    const Face& face(FaceId id) const;
    bool has_face(FaceId id) const;
    size_t face_count() const { return faces_.size(); }
    const std::vector<Face>& faces() const { return faces_; }
    std::vector<Vec3> face_locations(FaceId id) const;
    Vec3 face_location(FaceId id) const;

    // Scaffolding
    PullComplex& create_pull_complex(FaceId alpha, FaceId omega,
                                     std::optional<Percent> pull_scale = std::nullopt);
    // Removes the hub and spokes; the complex itself stays where it is listed
    void remove_pull_complex(const PullComplex& complex);
    void remove_pull_complexes();
    std::vector<PullComplex>& pull_complexes() { return pull_complexes_; }
    const std::vector<PullComplex>& pull_complexes() const { return pull_complexes_; }

    FaceAnchor& create_face_anchor(FaceId face, const Vec3& ground_point);
    void remove_face_anchors();
    const std::vector<FaceAnchor>& face_anchors() const { return face_anchors_; }

    // Lifecycle
    const Life& life() const { return life_; }
    void on_life_change(LifeObserver observer);
    // Queued, applied on the next iterate()
    void request_transition(const LifeTransition& transition);
    // Applied immediately
    void transition(const LifeTransition& transition);
    // Leave the growing stage once construction is complete
    void finish_growing();

    // One tick: apply a queued transition, advance the engine, then do one
    // unit of growth or one convergence check. Returns nothing while the
    // engine is busy.
    std::optional<Stage> iterate();

    FabricOutput fabric_output(float push_radius, float pull_radius, float joint_radius) const;

    FabricEngine& engine() { return engine_; }
    const FabricEngine& engine() const { return engine_; }
    const NumericFeature& numeric_feature() const { return numeric_feature_; }
    uint32_t pushes_per_twist() const { return pushes_per_twist_; }

private:
    IntervalId register_interval(JointId alpha, JointId omega, IntervalRole role, Percent scale,
                                 IntervalClass interval_class, float ideal_length, float rest_length,
                                 float stiffness, float linear_density, float countdown);
    IntervalId find_recent_pull(JointId alpha, JointId omega) const;
    void renumber_after(IntervalId removed);
    void run_face_strategies();

    FabricEngine& engine_;
    NumericFeature numeric_feature_;
    uint32_t pushes_per_twist_;
    std::string name_;

    std::vector<Joint> joints_;
    std::vector<Interval> intervals_;
    std::vector<Face> faces_;
    std::vector<PullComplex> pull_complexes_;
    std::vector<FaceAnchor> face_anchors_;
    FaceId next_face_id_ = 0;

    std::optional<tenscript::Tenscript> script_;
    std::optional<std::vector<tenscript::Bud>> buds_;

    std::deque<LifeTransition> transition_queue_;
    Life life_;
    std::vector<LifeObserver> observers_;
};

}  // namespace pretenst

#endif // PRETENST_TENSEGRITY_HPP
