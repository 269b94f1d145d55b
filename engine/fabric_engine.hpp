#ifndef PRETENST_ENGINE_FABRIC_ENGINE_HPP
#define PRETENST_ENGINE_FABRIC_ENGINE_HPP

#include "stage.hpp"
#include <math/vec3.hpp>
#include <math/transform.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace pretenst {

// How the engine treats an interval's force
enum class IntervalClass {
    Push,       // resists compression and extension
    Pull,       // carries tension only
    Connector,  // tension only, excluded from pretensing
};

// Physics instance the structure graph registers its elements with.
//
// Joints, intervals and faces are addressed by index. Removing an
// interval or face repacks the engine's arrays, so every index above the
// removed one moves down by one; the caller is responsible for
// renumbering what it holds.
class FabricEngine {
public:
    virtual ~FabricEngine() = default;

    virtual void clear() = 0;

    virtual uint32_t create_joint(const Vec3& location) = 0;

    // The interval's target length ramps from its length at creation to
    // rest_length over countdown ticks. ideal_length is the length the
    // interval was designed for and is reported back unchanged.
    virtual uint32_t create_interval(uint32_t alpha, uint32_t omega, IntervalClass interval_class,
                                     float ideal_length, float rest_length,
                                     float stiffness, float linear_density,
                                     float countdown) = 0;
    virtual void remove_interval(uint32_t index) = 0;

    virtual uint32_t create_face(uint32_t joint0, uint32_t joint1, uint32_t joint2) = 0;
    virtual void remove_face(uint32_t index) = 0;

    virtual size_t joint_count() const = 0;
    virtual size_t interval_count() const = 0;
    virtual size_t face_count() const = 0;

    // Queries
    virtual Vec3 joint_location(uint32_t joint) const = 0;
    virtual Vec3 interval_unit(uint32_t index) const = 0;
    virtual float interval_length(uint32_t index) const = 0;
    virtual float strain(uint32_t index) const = 0;
    virtual float stiffness(uint32_t index) const = 0;
    virtual float ideal_length(uint32_t index) const = 0;
    virtual float linear_density(uint32_t index) const = 0;
    virtual Vec3 midpoint() const = 0;

    virtual void set_stiffness(uint32_t index, float stiffness) = 0;
    virtual void set_linear_density(uint32_t index, float linear_density) = 0;

    // Commands
    virtual void adopt_lengths() = 0;
    virtual void multiply_rest_length(uint32_t index, float factor, int countdown) = 0;
    virtual void apply_transform(const Transform& transform) = 0;
    // Shift vertically so that the lowest joint sits at the given altitude
    virtual void set_altitude(float altitude) = 0;

    virtual void save_snapshot() = 0;
    virtual void restore_snapshot() = 0;
    virtual bool has_snapshot() const = 0;

    // Advance by one frame of ticks. Returns the stage the engine ends up
    // in, or nothing while it is busy adjusting interval lengths.
    virtual std::optional<Stage> iterate(Stage requested) = 0;

    // Leave the growing stage; returns the stage the engine moves to
    virtual Stage finish_growing() = 0;
};

}  // namespace pretenst

#endif // PRETENST_ENGINE_FABRIC_ENGINE_HPP
