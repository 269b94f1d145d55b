#include "relaxation_fabric.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace pretenst {

RelaxationFabric::RelaxationFabric(NumericFeature numeric_feature, const RelaxationConfig& config)
    : numeric_feature_(std::move(numeric_feature)), config_(config) {
    #ifdef _OPENMP
    if (config_.num_threads > 0) {
        omp_set_num_threads(config_.num_threads);
    }
    #endif
}

void RelaxationFabric::clear() {
    joints_.clear();
    intervals_.clear();
    faces_.clear();
    snapshot_.reset();
    stage_ = Stage::Growing;
    pretense_ticks_ = 0;
    pretense_countdown_ = 0;
}

uint32_t RelaxationFabric::create_joint(const Vec3& location) {
    Joint joint;
    joint.location = location;
    joints_.push_back(joint);
    return static_cast<uint32_t>(joints_.size() - 1);
}

uint32_t RelaxationFabric::create_interval(uint32_t alpha, uint32_t omega, IntervalClass interval_class,
                                           float ideal_length, float rest_length,
                                           float stiffness, float linear_density,
                                           float countdown) {
    if (alpha >= joints_.size() || omega >= joints_.size()) {
        throw std::out_of_range("RelaxationFabric::create_interval: invalid joint index");
    }
    Interval interval;
    interval.alpha = alpha;
    interval.omega = omega;
    interval.interval_class = interval_class;
    interval.ideal_length = ideal_length;
    interval.start_length = joints_[alpha].location.distance_to(joints_[omega].location);
    interval.rest_length = rest_length;
    interval.stiffness = stiffness;
    interval.linear_density = linear_density;
    interval.countdown = static_cast<int>(std::lround(std::max(countdown, 0.0f)));
    interval.max_countdown = interval.countdown;
    intervals_.push_back(interval);
    return static_cast<uint32_t>(intervals_.size() - 1);
}

void RelaxationFabric::remove_interval(uint32_t index) {
    if (index >= intervals_.size()) {
        throw std::out_of_range("RelaxationFabric::remove_interval: invalid interval index");
    }
    intervals_.erase(intervals_.begin() + index);
}

uint32_t RelaxationFabric::create_face(uint32_t joint0, uint32_t joint1, uint32_t joint2) {
    Face face;
    face.joints[0] = joint0;
    face.joints[1] = joint1;
    face.joints[2] = joint2;
    faces_.push_back(face);
    return static_cast<uint32_t>(faces_.size() - 1);
}

void RelaxationFabric::remove_face(uint32_t index) {
    if (index >= faces_.size()) {
        throw std::out_of_range("RelaxationFabric::remove_face: invalid face index");
    }
    faces_.erase(faces_.begin() + index);
}

RelaxationFabric::Interval& RelaxationFabric::interval(uint32_t index) {
    if (index >= intervals_.size()) {
        throw std::out_of_range("RelaxationFabric::interval: invalid interval index");
    }
    return intervals_[index];
}

const RelaxationFabric::Interval& RelaxationFabric::interval(uint32_t index) const {
    if (index >= intervals_.size()) {
        throw std::out_of_range("RelaxationFabric::interval: invalid interval index");
    }
    return intervals_[index];
}

const RelaxationFabric::Joint& RelaxationFabric::joint(uint32_t index) const {
    if (index >= joints_.size()) {
        throw std::out_of_range("RelaxationFabric::joint: invalid joint index");
    }
    return joints_[index];
}

Vec3 RelaxationFabric::joint_location(uint32_t index) const {
    return joint(index).location;
}

Vec3 RelaxationFabric::interval_unit(uint32_t index) const {
    const auto& found = interval(index);
    return (joints_[found.omega].location - joints_[found.alpha].location).normalized();
}

float RelaxationFabric::interval_length(uint32_t index) const {
    const auto& found = interval(index);
    return joints_[found.alpha].location.distance_to(joints_[found.omega].location);
}

float RelaxationFabric::strain(uint32_t index) const {
    return interval(index).strain;
}

float RelaxationFabric::stiffness(uint32_t index) const {
    return interval(index).stiffness;
}

float RelaxationFabric::ideal_length(uint32_t index) const {
    return interval(index).ideal_length;
}

float RelaxationFabric::linear_density(uint32_t index) const {
    return interval(index).linear_density;
}

Vec3 RelaxationFabric::midpoint() const {
    Vec3 sum;
    if (joints_.empty()) {
        return sum;
    }
    for (const auto& joint : joints_) {
        sum += joint.location;
    }
    return sum / static_cast<float>(joints_.size());
}

void RelaxationFabric::set_stiffness(uint32_t index, float stiffness) {
    interval(index).stiffness = stiffness;
}

void RelaxationFabric::set_linear_density(uint32_t index, float linear_density) {
    interval(index).linear_density = linear_density;
}

void RelaxationFabric::set_joint_location(uint32_t index, const Vec3& location) {
    if (index >= joints_.size()) {
        throw std::out_of_range("RelaxationFabric::set_joint_location: invalid joint index");
    }
    joints_[index].location = location;
    joints_[index].velocity = Vec3::zero();
}

void RelaxationFabric::adopt_lengths() {
    for (auto& interval : intervals_) {
        float length = joints_[interval.alpha].location.distance_to(joints_[interval.omega].location);
        interval.ideal_length = length;
        interval.start_length = length;
        interval.rest_length = length;
        interval.countdown = 0;
        interval.max_countdown = 0;
        interval.strain = 0.0f;
    }
    for (auto& joint : joints_) {
        joint.velocity = Vec3::zero();
    }
}

void RelaxationFabric::multiply_rest_length(uint32_t index, float factor, int countdown) {
    auto& found = interval(index);
    found.start_length = target_length(found);
    found.rest_length *= factor;
    found.ideal_length *= factor;
    found.countdown = std::max(countdown, 0);
    found.max_countdown = found.countdown;
}

void RelaxationFabric::apply_transform(const Transform& transform) {
    for (auto& joint : joints_) {
        joint.location = transform.apply(joint.location);
        joint.velocity = transform.apply_direction(joint.velocity);
    }
}

void RelaxationFabric::set_altitude(float altitude) {
    if (joints_.empty()) {
        return;
    }
    float lowest = std::numeric_limits<float>::max();
    for (const auto& joint : joints_) {
        lowest = std::min(lowest, joint.location.y);
    }
    float lift = altitude - lowest;
    for (auto& joint : joints_) {
        joint.location.y += lift;
        joint.velocity = Vec3::zero();
    }
}

void RelaxationFabric::save_snapshot() {
    snapshot_ = Snapshot{joints_, intervals_, faces_};
}

void RelaxationFabric::restore_snapshot() {
    if (!snapshot_) {
        throw std::logic_error("RelaxationFabric::restore_snapshot: no snapshot saved");
    }
    joints_ = snapshot_->joints;
    intervals_ = snapshot_->intervals;
    faces_ = snapshot_->faces;
}

bool RelaxationFabric::busy() const {
    return std::any_of(intervals_.begin(), intervals_.end(),
                       [](const Interval& interval) { return interval.countdown > 0; });
}

std::optional<Stage> RelaxationFabric::iterate(Stage requested) {
    auto log = pretenst::logging::get_logger();

    if (requested == Stage::Pretensing && stage_ != Stage::Pretensing) {
        pretense_ticks_ = std::max(1, static_cast<int>(numeric_feature_(WorldFeature::PretenseTicks)));
        pretense_countdown_ = pretense_ticks_;
        log->debug("RelaxationFabric: pretensing over {} ticks", pretense_ticks_);
    }
    stage_ = requested;

    // Slack structures are frozen
    if (requested == Stage::Slack) {
        return Stage::Slack;
    }

    int ticks = std::max(1, static_cast<int>(numeric_feature_(WorldFeature::TicksPerFrame)));
    for (int i = 0; i < ticks; ++i) {
        tick(requested);
    }

    switch (requested) {
        case Stage::Growing:
            if (busy()) {
                return std::nullopt;
            }
            return Stage::Growing;
        case Stage::Pretensing:
            if (pretense_countdown_ == 0) {
                stage_ = Stage::Pretenst;
                log->info("RelaxationFabric: pretensing complete");
            }
            return stage_;
        case Stage::Shaping:
        case Stage::Slack:
        case Stage::Pretenst:
            return requested;
    }
    return requested;
}

Stage RelaxationFabric::finish_growing() {
    stage_ = Stage::Shaping;
    return stage_;
}

float RelaxationFabric::target_length(const Interval& interval) const {
    if (interval.countdown <= 0 || interval.max_countdown <= 0) {
        return interval.rest_length;
    }
    float max = static_cast<float>(interval.max_countdown);
    float progress = (max - static_cast<float>(interval.countdown)) / max;
    return interval.start_length * (1.0f - progress) + interval.rest_length * progress;
}

float RelaxationFabric::pretensed_length(const Interval& interval, float pretense) const {
    float length = target_length(interval);
    switch (interval.interval_class) {
        case IntervalClass::Push:
            return length * (1.0f + pretense);
        case IntervalClass::Pull:
            return length * (1.0f - pretense);
        case IntervalClass::Connector:
            return length;
    }
    return length;
}

float RelaxationFabric::stage_length(uint32_t index, Stage stage) const {
    return pretensed_length(interval(index),
                            numeric_feature_(WorldFeature::PretenseFactor) * pretense_nuance(stage));
}

float RelaxationFabric::pretense_nuance(Stage stage) const {
    switch (stage) {
        case Stage::Pretensing:
            return 1.0f - static_cast<float>(pretense_countdown_) / static_cast<float>(std::max(pretense_ticks_, 1));
        case Stage::Pretenst:
            return 1.0f;
        case Stage::Growing:
        case Stage::Shaping:
        case Stage::Slack:
            return 0.0f;
    }
    return 0.0f;
}

void RelaxationFabric::tick(Stage stage) {
    for (auto& joint : joints_) {
        joint.force = Vec3::zero();
        joint.mass = 0.0f;
    }

    compute_interval_forces(stage);

    bool pretensing = stage == Stage::Pretensing || stage == Stage::Pretenst;
    if (pretensing) {
        compute_gravity_force(numeric_feature_(WorldFeature::Gravity) * pretense_nuance(stage));
    }

    integrate(numeric_feature_(WorldFeature::Drag));

    if (pretensing) {
        apply_floor_constraint();
    }

    for (auto& interval : intervals_) {
        if (interval.countdown > 0) {
            interval.countdown--;
        }
    }
    if (stage == Stage::Pretensing && pretense_countdown_ > 0) {
        pretense_countdown_--;
    }
}

void RelaxationFabric::compute_interval_forces(Stage stage) {
    const size_t num_joints = joints_.size();
    const float pretense = numeric_feature_(WorldFeature::PretenseFactor) * pretense_nuance(stage);

    // Thread-local force and mass accumulation
    #pragma omp parallel if(intervals_.size() > 50)
    {
        std::vector<Vec3> thread_forces(num_joints, Vec3::zero());
        std::vector<float> thread_masses(num_joints, 0.0f);

        #pragma omp for schedule(static)
        for (size_t i = 0; i < intervals_.size(); ++i) {
            auto& interval = intervals_[i];
            float ideal = pretensed_length(interval, pretense);
            bool push = interval.interval_class == IntervalClass::Push;

            const Vec3& alpha = joints_[interval.alpha].location;
            const Vec3& omega = joints_[interval.omega].location;
            Vec3 delta = omega - alpha;
            float length = delta.length();

            float half_mass = ideal * interval.linear_density / 2.0f;
            thread_masses[interval.alpha] += half_mass;
            thread_masses[interval.omega] += half_mass;

            if (length < 1e-6f || ideal < 1e-6f) {
                interval.strain = 0.0f;
                continue;
            }

            float strain = (length - ideal) / ideal;
            // Pulls go slack rather than push
            if (!push && strain < 0.0f) {
                strain = 0.0f;
            }
            interval.strain = strain;

            Vec3 force = (delta / length) * (strain * interval.stiffness / 2.0f);
            thread_forces[interval.alpha] += force;
            thread_forces[interval.omega] -= force;
        }

        #pragma omp critical
        {
            for (size_t i = 0; i < num_joints; ++i) {
                joints_[i].force += thread_forces[i];
                joints_[i].mass += thread_masses[i];
            }
        }
    }
}

void RelaxationFabric::compute_gravity_force(float strength) {
    #pragma omp parallel for schedule(static) if(joints_.size() > 50)
    for (size_t i = 0; i < joints_.size(); ++i) {
        auto& joint = joints_[i];
        float mass = std::max(joint.mass, config_.min_mass);
        joint.force.y -= mass * strength;
    }
}

void RelaxationFabric::integrate(float drag) {
    const float dt = config_.dt;
    const float keep = std::clamp(1.0f - drag, 0.0f, 1.0f);

    #pragma omp parallel for schedule(static) if(joints_.size() > 50)
    for (size_t i = 0; i < joints_.size(); ++i) {
        auto& joint = joints_[i];
        float inv_mass = 1.0f / std::max(joint.mass, config_.min_mass);
        joint.velocity = joint.velocity * keep + joint.force * (inv_mass * dt);
        joint.location += joint.velocity * dt;
    }
}

void RelaxationFabric::apply_floor_constraint() {
    #pragma omp parallel for schedule(static) if(joints_.size() > 50)
    for (size_t i = 0; i < joints_.size(); ++i) {
        auto& joint = joints_[i];
        if (joint.location.y < config_.floor_altitude) {
            joint.location.y = config_.floor_altitude;
            // Joints on the floor do not slide
            joint.velocity = Vec3::zero();
        }
    }
}

}  // namespace pretenst
