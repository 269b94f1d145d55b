#ifndef PRETENST_ENGINE_RELAXATION_FABRIC_HPP
#define PRETENST_ENGINE_RELAXATION_FABRIC_HPP

#include "fabric_engine.hpp"
#include <fabric/features.hpp>
#include <vector>

namespace pretenst {

// Integration settings that are not world features
struct RelaxationConfig {
    // Time step per tick
    float dt = 0.2f;

    // Joints never weigh less than this
    float min_mass = 0.1f;

    // Ground plane altitude, enforced once pretensing starts
    float floor_altitude = 0.0f;

    // Parallelization settings
    int num_threads = 0;  // 0 = auto-detect, > 0 = use specific count
};

// Damped spring relaxation: every interval is a spring whose target length
// ramps toward its rest length over its countdown, joints carry half the
// mass of each interval they touch, and velocities are integrated
// explicitly with drag.
class RelaxationFabric : public FabricEngine {
public:
    explicit RelaxationFabric(NumericFeature numeric_feature,
                              const RelaxationConfig& config = RelaxationConfig{});

    void clear() override;

    uint32_t create_joint(const Vec3& location) override;
    uint32_t create_interval(uint32_t alpha, uint32_t omega, IntervalClass interval_class,
                             float ideal_length, float rest_length,
                             float stiffness, float linear_density,
                             float countdown) override;
    void remove_interval(uint32_t index) override;
    uint32_t create_face(uint32_t joint0, uint32_t joint1, uint32_t joint2) override;
    void remove_face(uint32_t index) override;

    size_t joint_count() const override { return joints_.size(); }
    size_t interval_count() const override { return intervals_.size(); }
    size_t face_count() const override { return faces_.size(); }

    Vec3 joint_location(uint32_t joint) const override;
    Vec3 interval_unit(uint32_t index) const override;
    float interval_length(uint32_t index) const override;
    float strain(uint32_t index) const override;
    float stiffness(uint32_t index) const override;
    float ideal_length(uint32_t index) const override;
    float linear_density(uint32_t index) const override;
    Vec3 midpoint() const override;

    void set_stiffness(uint32_t index, float stiffness) override;
    void set_linear_density(uint32_t index, float linear_density) override;

    void adopt_lengths() override;
    void multiply_rest_length(uint32_t index, float factor, int countdown) override;
    void apply_transform(const Transform& transform) override;
    void set_altitude(float altitude) override;

    void save_snapshot() override;
    void restore_snapshot() override;
    bool has_snapshot() const override { return snapshot_.has_value(); }

    std::optional<Stage> iterate(Stage requested) override;
    Stage finish_growing() override;

    // Single tick at the given stage (for debugging or interactive use)
    void tick(Stage stage);

    // Move a joint directly, discarding its velocity
    void set_joint_location(uint32_t joint, const Vec3& location);

    // True while any interval is still ramping toward its rest length
    bool busy() const;

    // Length the interval is pulled toward at the given stage, including
    // the pretense stretch of pushes and squeeze of pulls
    float stage_length(uint32_t index, Stage stage) const;

    Stage stage() const { return stage_; }
    const RelaxationConfig& config() const { return config_; }

private:
    struct Joint {
        Vec3 location;
        Vec3 velocity;
        Vec3 force;
        float mass = 0.0f;
    };

    struct Interval {
        uint32_t alpha = 0;
        uint32_t omega = 0;
        IntervalClass interval_class = IntervalClass::Pull;
        float ideal_length = 1.0f;
        float start_length = 1.0f;
        float rest_length = 1.0f;
        float stiffness = 1.0f;
        float linear_density = 1.0f;
        int countdown = 0;
        int max_countdown = 0;
        float strain = 0.0f;
    };

    struct Face {
        uint32_t joints[3] = {0, 0, 0};
    };

    struct Snapshot {
        std::vector<Joint> joints;
        std::vector<Interval> intervals;
        std::vector<Face> faces;
    };

    Interval& interval(uint32_t index);
    const Interval& interval(uint32_t index) const;
    const Joint& joint(uint32_t index) const;

    float target_length(const Interval& interval) const;
    float pretensed_length(const Interval& interval, float pretense) const;
    float pretense_nuance(Stage stage) const;

    void compute_interval_forces(Stage stage);
    void compute_gravity_force(float strength);
    void integrate(float drag);
    void apply_floor_constraint();

    NumericFeature numeric_feature_;
    RelaxationConfig config_;

    std::vector<Joint> joints_;
    std::vector<Interval> intervals_;
    std::vector<Face> faces_;
    std::optional<Snapshot> snapshot_;

    Stage stage_ = Stage::Growing;
    int pretense_ticks_ = 0;
    int pretense_countdown_ = 0;
};

}  // namespace pretenst

#endif // PRETENST_ENGINE_RELAXATION_FABRIC_HPP
