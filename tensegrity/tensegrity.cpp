#include "tensegrity.hpp"
#include "face_strategy.hpp"
#include "tensegrity_builder.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace pretenst {

namespace {

// Drop the removed index from a cached list and shift the ones above it
void renumber_ids(std::vector<IntervalId>& ids, IntervalId removed) {
    ids.erase(std::remove(ids.begin(), ids.end(), removed), ids.end());
    for (auto& id : ids) {
        if (id > removed) {
            id--;
        }
    }
}

}  // namespace

Tensegrity::Tensegrity(FabricEngine& engine, NumericFeature numeric_feature, uint32_t pushes_per_twist)
    : engine_(engine),
      numeric_feature_(std::move(numeric_feature)),
      pushes_per_twist_(pushes_per_twist),
      life_(*this, Stage::Growing) {
    if (pushes_per_twist_ < 3) {
        throw std::invalid_argument("Tensegrity: a twist needs at least 3 pushes");
    }
    engine_.clear();
}

void Tensegrity::grow(const tenscript::Tenscript& script, const Vec3& origin) {
    auto log = pretenst::logging::get_logger();

    if (buds_ || !joints_.empty()) {
        throw std::logic_error("Tensegrity::grow: structure already started");
    }
    if (script.pushes_per_twist < 3) {
        throw std::invalid_argument("Tensegrity::grow: a twist needs at least 3 pushes");
    }
    script_ = script;
    name_ = script.name;
    pushes_per_twist_ = script.pushes_per_twist;

    TensegrityBuilder builder(*this);
    buds_ = std::vector<tenscript::Bud>{tenscript::create_bud(builder, *script_, origin)};
    log->info("Growing '{}' with {} pushes per twist", name_, pushes_per_twist_);
}

// ============================================================================
// Joints
// ============================================================================

JointId Tensegrity::create_joint(const Vec3& location) {
    JointId index = engine_.create_joint(location);
    joints_.push_back(Joint{index});
    return index;
}

Vec3 Tensegrity::joint_location(JointId joint) const {
    return engine_.joint_location(joint);
}

float Tensegrity::joint_distance(JointId alpha, JointId omega) const {
    return joint_location(alpha).distance_to(joint_location(omega));
}

// ============================================================================
// Intervals
// ============================================================================

IntervalId Tensegrity::register_interval(JointId alpha, JointId omega, IntervalRole role, Percent scale,
                                         IntervalClass interval_class, float ideal_length, float rest_length,
                                         float stiffness, float linear_density, float countdown) {
    if (alpha >= joints_.size() || omega >= joints_.size()) {
        throw std::out_of_range("Tensegrity::create_interval: invalid joint id");
    }
    IntervalId index = engine_.create_interval(alpha, omega, interval_class, ideal_length, rest_length,
                                               stiffness, linear_density, countdown);
    if (index != intervals_.size()) {
        throw std::logic_error("Tensegrity::create_interval: engine interval index out of step");
    }
    intervals_.push_back(Interval{index, alpha, omega, role, scale, false});
    return index;
}

IntervalId Tensegrity::create_interval(JointId alpha, JointId omega, IntervalRole role, Percent scale) {
    float current_length = joint_distance(alpha, omega);
    float ideal_length = factor_from_percent(scale) * role_default_length(role, numeric_feature_);
    float countdown = numeric_feature_(WorldFeature::IntervalCountdown) * std::abs(current_length - ideal_length);
    float stiffness = scale_to_initial_stiffness(scale, numeric_feature_);
    float linear_density = stiffness_to_linear_density(stiffness);
    IntervalClass interval_class = is_push_role(role) ? IntervalClass::Push : IntervalClass::Pull;
    return register_interval(alpha, omega, role, scale, interval_class, ideal_length, ideal_length,
                             stiffness, linear_density, countdown);
}

IntervalId Tensegrity::create_connector(JointId alpha, JointId omega, float stiffness, float linear_density) {
    float ideal_length = joint_distance(alpha, omega);
    float rest_length = numeric_feature_(WorldFeature::ConnectorRestLength);
    float countdown = numeric_feature_(WorldFeature::IntervalCountdown) * std::abs(rest_length - ideal_length);
    return register_interval(alpha, omega, IntervalRole::ConnectorPull, Percent{}, IntervalClass::Connector,
                             ideal_length, rest_length, stiffness, linear_density, countdown);
}

void Tensegrity::remove_interval(IntervalId index) {
    if (index >= intervals_.size()) {
        throw std::out_of_range("Tensegrity::remove_interval: invalid interval id");
    }
    intervals_[index].removed = true;
    engine_.remove_interval(index);
    intervals_.erase(intervals_.begin() + index);
    renumber_after(index);
}

void Tensegrity::renumber_after(IntervalId removed) {
    for (auto& interval : intervals_) {
        if (interval.index > removed) {
            interval.index--;
        }
    }
    for (auto& face : faces_) {
        renumber_ids(face.pulls, removed);
        if (face.tip) {
            if (face.tip->push == removed) {
                face.tip.reset();
            } else {
                if (face.tip->push > removed) {
                    face.tip->push--;
                }
                renumber_ids(face.tip->inner_pulls, removed);
                renumber_ids(face.tip->outer_pulls, removed);
            }
        }
    }
    for (auto& complex : pull_complexes_) {
        if (complex.hub > removed) {
            complex.hub--;
        }
        renumber_ids(complex.alpha_spokes, removed);
        renumber_ids(complex.omega_spokes, removed);
    }
    for (auto& anchor : face_anchors_) {
        renumber_ids(anchor.pulls, removed);
    }
}

void Tensegrity::change_interval_scale(IntervalId index, float factor) {
    auto& found = interval(index);
    found.scale = percent_from_factor(factor_from_percent(found.scale) * factor);
    engine_.multiply_rest_length(index, factor, 100);
}

Interval& Tensegrity::interval(IntervalId index) {
    if (index >= intervals_.size()) {
        throw std::out_of_range("Tensegrity::interval: invalid interval id");
    }
    return intervals_[index];
}

const Interval& Tensegrity::interval(IntervalId index) const {
    if (index >= intervals_.size()) {
        throw std::out_of_range("Tensegrity::interval: invalid interval id");
    }
    return intervals_[index];
}

std::optional<IntervalId> Tensegrity::find_interval(JointId joint1, JointId joint2) const {
    for (const auto& interval : intervals_) {
        if (interval.connects(joint1, joint2)) {
            return interval.index;
        }
    }
    return std::nullopt;
}

float Tensegrity::interval_length(IntervalId index) const {
    const auto& found = interval(index);
    return joint_distance(found.alpha, found.omega);
}

JointId Tensegrity::across_push(JointId joint) const {
    for (const auto& interval : intervals_) {
        if (interval.is_push() && interval.touches(joint)) {
            return interval.other_joint(joint);
        }
    }
    throw std::runtime_error("Tensegrity::across_push: joint " + std::to_string(joint) + " has no push");
}

// ============================================================================
// Faces
// ============================================================================

IntervalId Tensegrity::find_recent_pull(JointId alpha, JointId omega) const {
    // Newest first: rebuilt faces coexist briefly with stale duplicates
    for (size_t walk = intervals_.size(); walk > 0; --walk) {
        const auto& interval = intervals_[walk - 1];
        if (!interval.is_push() && interval.connects(alpha, omega)) {
            return interval.index;
        }
    }
    throw std::runtime_error("Tensegrity::create_face: could not find pull between joints " +
                             std::to_string(alpha) + " and " + std::to_string(omega));
}

FaceId Tensegrity::create_face(std::vector<JointId> ends, bool omni, Spin spin, Percent scale,
                               std::optional<std::vector<IntervalId>> known_pulls) {
    if (ends.size() < 3) {
        throw std::invalid_argument("Tensegrity::create_face: a face needs at least 3 ends");
    }
    std::vector<IntervalId> pulls;
    if (known_pulls) {
        pulls = std::move(*known_pulls);
    } else {
        for (size_t i = 0; i < ends.size(); ++i) {
            pulls.push_back(find_recent_pull(ends[i], ends[(i + 1) % ends.size()]));
        }
    }
    size_t count = ends.size();
    uint32_t index = engine_.create_face(ends[0], ends[count / 3], ends[2 * count / 3]);

    Face face;
    face.id = next_face_id_++;
    face.index = index;
    face.ends = std::move(ends);
    face.omni = omni;
    face.spin = spin;
    face.scale = scale;
    face.pulls = std::move(pulls);
    faces_.push_back(std::move(face));
    return faces_.back().id;
}

void Tensegrity::remove_face(FaceId id) {
    auto it = std::find_if(faces_.begin(), faces_.end(), [id](const Face& face) { return face.id == id; });
    if (it == faces_.end()) {
        throw std::out_of_range("Tensegrity::remove_face: unknown face id " + std::to_string(id));
    }
    // Each removal drops the pull from the face's own list
    while (!it->pulls.empty()) {
        remove_interval(it->pulls.back());
    }
    uint32_t index = it->index;
    engine_.remove_face(index);
    faces_.erase(it);
    for (auto& face : faces_) {
        if (face.index > index) {
            face.index--;
        }
    }
}

Face& Tensegrity::face(FaceId id) {
    for (auto& face : faces_) {
        if (face.id == id) {
            return face;
        }
    }
    throw std::out_of_range("Tensegrity::face: unknown face id " + std::to_string(id));
}

const Face& Tensegrity::face(FaceId id) const {
    for (const auto& face : faces_) {
        if (face.id == id) {
            return face;
        }
    }
    throw std::out_of_range("Tensegrity::face: unknown face id " + std::to_string(id));
}

bool Tensegrity::has_face(FaceId id) const {
    return std::any_of(faces_.begin(), faces_.end(), [id](const Face& face) { return face.id == id; });
}

std::vector<Vec3> Tensegrity::face_locations(FaceId id) const {
    std::vector<Vec3> locations;
    for (JointId end : face(id).ends) {
        locations.push_back(joint_location(end));
    }
    return locations;
}

Vec3 Tensegrity::face_location(FaceId id) const {
    return midpoint(face_locations(id));
}

// ============================================================================
// Scaffolding
// ============================================================================

PullComplex& Tensegrity::create_pull_complex(FaceId alpha, FaceId omega, std::optional<Percent> pull_scale) {
    auto log = pretenst::logging::get_logger();

    Percent alpha_scale = face(alpha).scale;
    Percent omega_scale = face(omega).scale;
    std::vector<JointId> alpha_ends = face(alpha).ends;
    std::vector<JointId> omega_ends = face(omega).ends;

    float stiffness = scale_to_initial_stiffness(Percent{}, numeric_feature_);
    float linear_density = stiffness_to_linear_density(stiffness);
    JointId alpha_hub = create_joint(face_location(alpha));
    JointId omega_hub = create_joint(face_location(omega));

    PullComplex complex;
    complex.alpha_hub = alpha_hub;
    complex.omega_hub = omega_hub;
    complex.alpha_face = alpha;
    complex.omega_face = omega;
    complex.connector = !pull_scale.has_value();
    if (complex.connector) {
        complex.hub = create_connector(alpha_hub, omega_hub, stiffness, linear_density);
    } else {
        float distance = joint_distance(alpha_hub, omega_hub);
        float rest_length = factor_from_percent(*pull_scale) * distance;
        float countdown = numeric_feature_(WorldFeature::IntervalCountdown) * std::abs(rest_length - distance);
        complex.hub = register_interval(alpha_hub, omega_hub, IntervalRole::FaceDistancer, *pull_scale,
                                        IntervalClass::Pull, distance, rest_length,
                                        stiffness, linear_density, countdown);
    }
    for (JointId end : alpha_ends) {
        complex.alpha_spokes.push_back(create_interval(alpha_hub, end, IntervalRole::RadialPull, alpha_scale));
    }
    for (JointId end : omega_ends) {
        complex.omega_spokes.push_back(create_interval(omega_hub, end, IntervalRole::RadialPull, omega_scale));
    }
    log->debug("Pull complex between faces {} and {} ({})", alpha, omega,
               complex.connector ? "connector" : "distance");
    pull_complexes_.push_back(std::move(complex));
    return pull_complexes_.back();
}

void Tensegrity::remove_pull_complex(const PullComplex& complex) {
    // Copy first: the complex may live in the list being renumbered
    std::vector<IntervalId> doomed = complex.alpha_spokes;
    doomed.insert(doomed.end(), complex.omega_spokes.begin(), complex.omega_spokes.end());
    doomed.push_back(complex.hub);
    // Highest first so the remaining indices stay valid
    std::sort(doomed.begin(), doomed.end(), std::greater<IntervalId>());
    for (IntervalId index : doomed) {
        remove_interval(index);
    }
}

void Tensegrity::remove_pull_complexes() {
    while (!pull_complexes_.empty()) {
        PullComplex complex = pull_complexes_.back();
        pull_complexes_.pop_back();
        remove_pull_complex(complex);
    }
}

FaceAnchor& Tensegrity::create_face_anchor(FaceId face_id, const Vec3& ground_point) {
    const Face& anchored = face(face_id);
    std::vector<JointId> ends = anchored.ends;
    JointId anchor_joint = create_joint(ground_point);

    FaceAnchor anchor;
    anchor.anchor = anchor_joint;
    anchor.face = face_id;
    float anchor_length = role_default_length(IntervalRole::FaceAnchor, numeric_feature_);
    for (JointId end : ends) {
        // Scaled so the pull starts at its current length
        float distance = joint_distance(end, anchor_joint);
        Percent scale = percent_from_factor(distance / anchor_length);
        anchor.pulls.push_back(create_interval(end, anchor_joint, IntervalRole::FaceAnchor, scale));
    }
    face_anchors_.push_back(std::move(anchor));
    return face_anchors_.back();
}

void Tensegrity::remove_face_anchors() {
    while (!face_anchors_.empty()) {
        FaceAnchor anchor = face_anchors_.back();
        face_anchors_.pop_back();
        std::sort(anchor.pulls.begin(), anchor.pulls.end(), std::greater<IntervalId>());
        for (IntervalId index : anchor.pulls) {
            remove_interval(index);
        }
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void Tensegrity::on_life_change(LifeObserver observer) {
    observers_.push_back(std::move(observer));
}

void Tensegrity::request_transition(const LifeTransition& transition) {
    transition_queue_.push_back(transition);
}

void Tensegrity::transition(const LifeTransition& transition) {
    if (transition.stage == life_.stage()) {
        return;
    }
    auto log = pretenst::logging::get_logger();
    Stage from = life_.stage();
    life_ = life_.with_transition(transition);
    log->info("Life: {} -> {}", stage_name(from), stage_name(life_.stage()));
    for (const auto& observer : observers_) {
        observer(life_);
    }
}

void Tensegrity::finish_growing() {
    buds_.reset();
    transition(LifeTransition{engine_.finish_growing()});
}

void Tensegrity::run_face_strategies() {
    static const std::map<int, tenscript::Mark> no_marks;
    TensegrityBuilder builder(*this);
    for (const auto& strategy : face_strategies(faces_, script_ ? script_->marks : no_marks)) {
        strategy.execute(builder);
    }
}

std::optional<Stage> Tensegrity::iterate() {
    if (!transition_queue_.empty()) {
        LifeTransition next = transition_queue_.front();
        transition_queue_.pop_front();
        transition(next);
    }

    auto stage = engine_.iterate(life_.stage());
    if (!stage) {
        return std::nullopt;
    }

    if (buds_) {
        if (!buds_->empty()) {
            TensegrityBuilder builder(*this);
            *buds_ = tenscript::execute(builder, *buds_);
        }
        if (buds_->empty()) {
            buds_.reset();
            run_face_strategies();
            if (*stage == Stage::Growing) {
                finish_growing();
                return life_.stage();
            }
        }
        return Stage::Growing;
    }

    if (!pull_complexes_.empty()) {
        TensegrityBuilder builder(*this);
        builder.check_connectors(pull_complexes_,
                                 [this](const PullComplex& complex) { remove_pull_complex(complex); });
    }

    if (life_.stage() == Stage::Pretensing && *stage == Stage::Pretenst) {
        transition(LifeTransition{Stage::Pretenst});
    }
    return stage;
}

// ============================================================================
// Export
// ============================================================================

FabricOutput Tensegrity::fabric_output(float push_radius, float pull_radius, float joint_radius) const {
    FabricOutput output;
    output.name = name_;
    for (const auto& joint : joints_) {
        Vec3 location = joint_location(joint.index);
        output.joints.push_back(OutputJoint{joint.index, joint_radius, location.x, location.z, location.y});
    }
    for (const auto& interval : intervals_) {
        bool push = interval.is_push();
        OutputInterval out;
        out.index = interval.index;
        out.joints = {interval.alpha, interval.omega};
        out.type = push ? "Push" : "Pull";
        out.strain = engine_.strain(interval.index);
        out.stiffness = engine_.stiffness(interval.index);
        out.linear_density = engine_.linear_density(interval.index);
        out.role = role_name(interval.role);
        out.scale = interval.scale.value;
        out.ideal_length = engine_.ideal_length(interval.index);
        out.is_push = push;
        out.length = interval_length(interval.index);
        out.radius = push ? push_radius : pull_radius;
        output.intervals.push_back(std::move(out));
    }
    return output;
}

}  // namespace pretenst
