#include "tensegrity_builder.hpp"
#include "tensegrity.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <set>
#include <stdexcept>

namespace pretenst {

ConnectRoles connect_roles(bool alpha_omni, bool omega_omni) {
    if (!alpha_omni && !omega_omni) {
        return {IntervalRole::Ring, IntervalRole::InterTwist, IntervalRole::InterTwist};
    }
    if (alpha_omni && !omega_omni) {
        return {IntervalRole::Ring, IntervalRole::Cross, IntervalRole::InterTwist};
    }
    if (!alpha_omni && omega_omni) {
        return {IntervalRole::Ring, IntervalRole::InterTwist, IntervalRole::Cross};
    }
    return {IntervalRole::PhiTriangle, IntervalRole::PhiTriangle, IntervalRole::PhiTriangle};
}

std::vector<PointPair> first_twist_point_pairs(const Vec3& location, uint32_t pushes_per_twist,
                                               Spin spin, Percent scale, const NumericFeature& numeric_feature) {
    std::vector<Vec3> base;
    for (uint32_t i = 0; i < pushes_per_twist; ++i) {
        float angle = static_cast<float>(i) * 2.0f * std::numbers::pi_v<float> / static_cast<float>(pushes_per_twist);
        base.push_back(location + Vec3(std::cos(angle), 0.0f, std::sin(angle)));
    }
    return twist_point_pairs(base, spin, scale, numeric_feature);
}

std::vector<PointPair> twist_point_pairs(const std::vector<Vec3>& base, Spin spin, Percent scale,
                                         const NumericFeature& numeric_feature) {
    const float root3 = std::sqrt(3.0f);
    size_t count = base.size();
    float initial_length = role_default_length(IntervalRole::PhiTriangle, numeric_feature) *
                           factor_from_percent(scale) / root3;
    float tiny_radius = initial_length * static_cast<float>(count) / 3.0f / root3;
    Vec3 mid = midpoint(base);
    Vec3 up = normal(base) * -initial_length;

    std::vector<PointPair> points;
    for (size_t i = 0; i < count; ++i) {
        Vec3 a = base[(i + count - 1) % count] - mid;
        Vec3 b = base[i] - mid;
        Vec3 c = base[(i + 1) % count] - mid;
        Vec3 d = base[(i + 2) % count] - mid;
        Vec3 alpha = mid;
        Vec3 omega = mid + up;
        alpha.add_scaled(avg(b, c), tiny_radius);
        if (spin == Spin::Left) {
            omega.add_scaled(avg(c, d), tiny_radius);
        } else {
            omega.add_scaled(avg(b, a), tiny_radius);
        }
        points.push_back({alpha, omega});
    }
    return points;
}

TensegrityBuilder::TensegrityBuilder(Tensegrity& tensegrity) : tensegrity_(tensegrity) {}

// ============================================================================
// Twists
// ============================================================================

Twist TensegrityBuilder::create_twist_at(const Vec3& location, Spin spin, Percent scale) {
    const auto& nf = tensegrity_.numeric_feature();
    uint32_t pushes = tensegrity_.pushes_per_twist();
    if (is_omni_spin(spin)) {
        size_t first_interval = tensegrity_.interval_count();
        Spin bottom_spin = spin == Spin::LeftRight ? Spin::Left : Spin::Right;
        Twist bottom = create_twist(first_twist_point_pairs(location, pushes, bottom_spin, scale, nf),
                                    scale, bottom_spin, IntervalRole::PhiPush, IntervalRole::PhiTriangle);
        FaceId bottom_top = bottom.face(FaceName::A);
        Twist top = create_twist(face_twist_point_pairs(bottom_top, scale), scale,
                                 opposite_spin(tensegrity_.face(bottom_top).spin),
                                 IntervalRole::PhiPush, IntervalRole::PhiTriangle);
        return create_omni_twist(bottom, top, first_interval);
    }
    return create_twist(first_twist_point_pairs(location, pushes, spin, scale, nf),
                        scale, spin, IntervalRole::RootPush, IntervalRole::Twist);
}

Twist TensegrityBuilder::create_twist_on(FaceId base, Percent twist_scale, bool omni) {
    const Face& base_face = tensegrity_.face(base);
    Spin base_spin = base_face.spin;
    bool base_omni = base_face.omni;
    Percent scale = percent_from_factor(factor_from_percent(twist_scale) * factor_from_percent(base_face.scale));

    if (omni) {
        size_t first_interval = tensegrity_.interval_count();
        Twist bottom = create_twist(face_twist_point_pairs(base, scale), scale, opposite_spin(base_spin),
                                    IntervalRole::PhiPush, IntervalRole::PhiTriangle);
        FaceId bottom_top = bottom.face(FaceName::A);
        Twist top = create_twist(face_twist_point_pairs(bottom_top, scale), scale,
                                 opposite_spin(tensegrity_.face(bottom_top).spin),
                                 IntervalRole::PhiPush, IntervalRole::PhiTriangle);
        Twist twist = create_omni_twist(bottom, top, first_interval);
        connect(base, twist.face(FaceName::a), connect_roles(base_omni, true));
        return twist;
    }
    Twist twist = create_twist(face_twist_point_pairs(base, scale), scale, opposite_spin(base_spin),
                               IntervalRole::RootPush, IntervalRole::Twist);
    connect(base, twist.face(FaceName::a), connect_roles(base_omni, false));
    return twist;
}

Twist TensegrityBuilder::create_twist(const std::vector<PointPair>& points, Percent scale, Spin spin,
                                      IntervalRole push_role, IntervalRole pull_role) {
    Twist twist;
    twist.scale = scale;
    size_t count = points.size();

    std::vector<JointId> alpha_ends;
    std::vector<JointId> omega_ends;
    for (const auto& pair : points) {
        alpha_ends.push_back(tensegrity_.create_joint(pair.alpha));
        omega_ends.push_back(tensegrity_.create_joint(pair.omega));
    }
    for (size_t i = 0; i < count; ++i) {
        twist.pushes.push_back(tensegrity_.create_interval(alpha_ends[i], omega_ends[i], push_role, scale));
    }

    std::vector<IntervalId> ring;
    for (size_t i = 0; i < count; ++i) {
        ring.push_back(tensegrity_.create_interval(alpha_ends[i], alpha_ends[(i + 1) % count], pull_role, scale));
    }
    twist.pulls.insert(twist.pulls.end(), ring.begin(), ring.end());
    twist.faces.push_back(tensegrity_.create_face(alpha_ends, false, spin, scale, ring));

    std::vector<JointId> top_ends(omega_ends.rbegin(), omega_ends.rend());
    ring.clear();
    for (size_t i = 0; i < count; ++i) {
        ring.push_back(tensegrity_.create_interval(top_ends[i], top_ends[(i + 1) % count], pull_role, scale));
    }
    twist.pulls.insert(twist.pulls.end(), ring.begin(), ring.end());
    twist.faces.push_back(tensegrity_.create_face(top_ends, false, spin, scale, ring));

    size_t offset = spin == Spin::Left ? count - 1 : 1;
    for (size_t i = 0; i < count; ++i) {
        twist.pulls.push_back(tensegrity_.create_interval(alpha_ends[i], omega_ends[(i + offset) % count],
                                                          pull_role, scale));
    }
    pretenst::logging::get_logger()->debug("Created {} twist of {} pushes at {}%", spin_name(spin), count,
                                           scale.value);
    return twist;
}

Twist TensegrityBuilder::create_omni_twist(const Twist& bottom, const Twist& top, size_t first_interval) {
    FaceId top_face = top.faces[1];
    FaceId bottom_face = bottom.faces[0];
    connect(bottom.faces[1], top.faces[0], connect_roles(true, true));

    std::set<JointId> outer;
    for (JointId end : tensegrity_.face(top_face).ends) {
        outer.insert(end);
    }
    for (JointId end : tensegrity_.face(bottom_face).ends) {
        outer.insert(end);
    }

    // Everything built since the bottom twist began is still numbered above it
    std::vector<IntervalId> pushes;
    std::vector<IntervalId> pulls;
    for (size_t i = first_interval; i < tensegrity_.interval_count(); ++i) {
        const auto& interval = tensegrity_.interval(static_cast<IntervalId>(i));
        if (interval.is_push()) {
            pushes.push_back(interval.index);
        } else {
            pulls.push_back(interval.index);
        }
    }

    Percent scale = bottom.scale;
    auto create_face_touching = [&](JointId joint, Spin spin) {
        std::vector<JointId> ends;
        for (IntervalId pull : pulls) {
            const auto& interval = tensegrity_.interval(pull);
            if (interval.touches(joint)) {
                JointId other = interval.other_joint(joint);
                if (outer.count(other) == 0) {
                    ends.push_back(other);
                }
            }
        }
        bool closed = ends.size() == 2 && std::any_of(pulls.begin(), pulls.end(), [&](IntervalId pull) {
            return tensegrity_.interval(pull).connects(ends[0], ends[1]);
        });
        if (!closed) {
            throw std::runtime_error("TensegrityBuilder::create_omni_twist: interval not found at joint " +
                                     std::to_string(joint));
        }
        ends.push_back(joint);
        if (spin == Spin::Left) {
            std::reverse(ends.begin(), ends.end());
        }
        return tensegrity_.create_face(ends, false, spin, scale);
    };

    std::vector<JointId> top_ends = tensegrity_.face(top_face).ends;
    std::vector<JointId> bottom_ends = tensegrity_.face(bottom_face).ends;
    Spin top_touching_spin = opposite_spin(tensegrity_.face(top_face).spin);
    Spin bottom_touching_spin = opposite_spin(tensegrity_.face(bottom_face).spin);

    std::vector<FaceId> top_touching;
    for (JointId end : top_ends) {
        top_touching.push_back(create_face_touching(end, top_touching_spin));
    }
    std::vector<FaceId> bottom_touching;
    for (JointId end : bottom_ends) {
        bottom_touching.push_back(create_face_touching(end, bottom_touching_spin));
    }
    tensegrity_.face(bottom_face).omni = true;
    tensegrity_.face(top_face).omni = true;

    Twist twist;
    twist.scale = scale;
    twist.omni = true;
    twist.pushes = std::move(pushes);
    twist.pulls = std::move(pulls);
    twist.faces.push_back(bottom_face);
    twist.faces.insert(twist.faces.end(), bottom_touching.begin(), bottom_touching.end());
    twist.faces.insert(twist.faces.end(), top_touching.begin(), top_touching.end());
    twist.faces.push_back(top_face);
    return twist;
}

std::vector<PointPair> TensegrityBuilder::face_twist_point_pairs(FaceId face, Percent scale) const {
    std::vector<Vec3> base = tensegrity_.face_locations(face);
    std::reverse(base.begin(), base.end());
    return twist_point_pairs(base, opposite_spin(tensegrity_.face(face).spin), scale,
                             tensegrity_.numeric_feature());
}

// ============================================================================
// Tips
// ============================================================================

PointPair TensegrityBuilder::tip_point_pair(FaceId face) const {
    std::vector<Vec3> base = tensegrity_.face_locations(face);
    std::reverse(base.begin(), base.end());
    Vec3 mid = midpoint(base);
    Vec3 out = normal(base);
    float tip_length = factor_from_percent(tensegrity_.face(face).scale) *
                       role_default_length(IntervalRole::TipPush, tensegrity_.numeric_feature());
    Vec3 alpha = mid;
    Vec3 omega = mid;
    alpha.add_scaled(out, 0.1f * tip_length);
    omega.add_scaled(out, -0.1f * tip_length);
    return {alpha, omega};
}

Tip TensegrityBuilder::create_tip_on(FaceId face) {
    PointPair pair = tip_point_pair(face);
    std::vector<JointId> ends = tensegrity_.face(face).ends;
    Percent scale = tensegrity_.face(face).scale;

    JointId alpha = tensegrity_.create_joint(pair.alpha);
    JointId omega = tensegrity_.create_joint(pair.omega);
    Tip tip;
    tip.push = tensegrity_.create_interval(alpha, omega, IntervalRole::TipPush, scale);
    for (JointId end : ends) {
        tip.inner_pulls.push_back(tensegrity_.create_interval(end, alpha, IntervalRole::TipInner, scale));
        tip.outer_pulls.push_back(tensegrity_.create_interval(end, omega, IntervalRole::TipOuter, scale));
    }

    // Attach first so the removals below renumber the tip too
    Face& tipped = tensegrity_.face(face);
    tipped.tip = tip;
    while (!tensegrity_.face(face).pulls.empty()) {
        tensegrity_.remove_interval(tensegrity_.face(face).pulls.back());
    }
    return *tensegrity_.face(face).tip;
}

IntervalId TensegrityBuilder::create_inter_tip(FaceId tip_face_a, FaceId tip_face_b, Percent distance_scale) {
    const auto& tip_a = tensegrity_.face(tip_face_a).tip;
    const auto& tip_b = tensegrity_.face(tip_face_b).tip;
    if (!tip_a || !tip_b) {
        throw std::logic_error("TensegrityBuilder::create_inter_tip: face has no tip");
    }
    JointId alpha = tensegrity_.interval(tip_a->push).alpha;
    JointId omega = tensegrity_.interval(tip_b->push).alpha;
    float distance = tensegrity_.joint_distance(alpha, omega);
    Percent scale = percent_from_factor(factor_from_percent(distance_scale) * distance);
    return tensegrity_.create_interval(alpha, omega, IntervalRole::InterTip, scale);
}

// ============================================================================
// Placement
// ============================================================================

void TensegrityBuilder::face_to_origin(FaceId face) {
    std::vector<Vec3> locations = tensegrity_.face_locations(face);
    Vec3 mid = midpoint(locations);
    Transform transform;
    transform.origin = mid;
    transform.y_axis = -normal(locations);
    transform.x_axis = (locations[0] - mid).normalized();
    transform.z_axis = transform.x_axis.cross(transform.y_axis);
    tensegrity_.engine().apply_transform(transform);
}

// ============================================================================
// Radial pulls
// ============================================================================

void TensegrityBuilder::create_radial_pulls(const std::vector<FaceId>& faces, tenscript::MarkAction action,
                                            std::optional<Percent> action_scale) {
    auto log = pretenst::logging::get_logger();

    auto centre_brick = [&]() {
        std::vector<Percent> scales;
        std::vector<Vec3> locations;
        for (FaceId face : faces) {
            scales.push_back(tensegrity_.face(face).scale);
            locations.push_back(tensegrity_.face_location(face));
        }
        Twist brick = create_twist_at(midpoint(locations), Spin::LeftRight, average_percent(scales));
        std::set<FaceId> chosen;
        for (size_t i = 0; i < faces.size(); ++i) {
            Spin spin = tensegrity_.face(faces[i]).spin;
            std::optional<FaceId> closest;
            float closest_distance = std::numeric_limits<float>::max();
            for (FaceId candidate : brick.faces) {
                if (chosen.count(candidate) > 0 || !tensegrity_.has_face(candidate)) {
                    continue;
                }
                const Face& opposing = tensegrity_.face(candidate);
                if (opposing.pulls.empty() || opposing.spin == spin) {
                    continue;
                }
                float distance = tensegrity_.face_location(candidate).distance_to(locations[i]);
                if (distance < closest_distance) {
                    closest_distance = distance;
                    closest = candidate;
                }
            }
            if (!closest) {
                throw std::runtime_error("TensegrityBuilder::create_radial_pulls: no opposing face on connecting twist");
            }
            chosen.insert(*closest);
            tensegrity_.create_pull_complex(*closest, faces[i]);
        }
    };

    switch (action) {
        case tenscript::MarkAction::FaceDistance: {
            Percent pull_scale = action_scale.value_or(percent_from_factor(0.75f));
            for (size_t a = 0; a < faces.size(); ++a) {
                for (size_t b = 0; b < a; ++b) {
                    tensegrity_.create_pull_complex(faces[a], faces[b], pull_scale);
                }
            }
            break;
        }
        case tenscript::MarkAction::JoinFaces:
            if (faces.size() == 2) {
                if (tensegrity_.face(faces[0]).spin == tensegrity_.face(faces[1]).spin) {
                    centre_brick();
                } else {
                    tensegrity_.create_pull_complex(faces[0], faces[1]);
                }
            } else if (faces.size() == 3) {
                centre_brick();
            } else {
                log->warn("Cannot join {} faces", faces.size());
            }
            break;
        default:
            break;
    }
}

size_t TensegrityBuilder::check_connectors(std::vector<PullComplex>& complexes,
                                           const std::function<void(const PullComplex&)>& remove) {
    auto log = pretenst::logging::get_logger();
    float connector_length = tensegrity_.numeric_feature()(WorldFeature::ConnectorLength);

    size_t connected = 0;
    size_t i = 0;
    while (i < complexes.size()) {
        const PullComplex& complex = complexes[i];
        bool faces_live = tensegrity_.has_face(complex.alpha_face) && tensegrity_.has_face(complex.omega_face);
        if (complex.connector && !faces_live) {
            // Nothing left to connect to
            log->warn("Dropping connector between faces {} and {}: a face is gone",
                      complex.alpha_face, complex.omega_face);
            PullComplex orphan = complex;
            complexes.erase(complexes.begin() + static_cast<std::ptrdiff_t>(i));
            remove(orphan);
            continue;
        }
        bool ready = complex.connector && faces_live &&
                     tensegrity_.interval(complex.hub).role == IntervalRole::ConnectorPull &&
                     tensegrity_.joint_distance(complex.alpha_hub, complex.omega_hub) <= connector_length;
        if (!ready) {
            ++i;
            continue;
        }
        FaceId alpha = complex.alpha_face;
        FaceId omega = complex.omega_face;
        rotate_for_best_ring(alpha, omega);
        connect(alpha, omega, connect_roles(tensegrity_.face(alpha).omni, tensegrity_.face(omega).omni));
        // The connection renumbered the complex in place
        PullComplex done = complexes[i];
        complexes.erase(complexes.begin() + static_cast<std::ptrdiff_t>(i));
        remove(done);
        connected++;
    }
    if (connected > 0) {
        log->info("Connected {} face pairs, {} complexes remaining", connected, complexes.size());
    }
    return connected;
}

// ============================================================================
// Connection
// ============================================================================

void TensegrityBuilder::rotate_for_best_ring(FaceId face_a, FaceId face_b) {
    std::vector<Vec3> a = tensegrity_.face_locations(face_a);
    std::reverse(a.begin(), a.end());
    std::vector<Vec3> b = tensegrity_.face_locations(face_b);
    if (a.size() != b.size()) {
        throw std::invalid_argument("TensegrityBuilder::rotate_for_best_ring: faces differ in size");
    }
    size_t count = a.size();
    size_t best_rotation = 0;
    float best_total = std::numeric_limits<float>::max();
    for (size_t rotation = 0; rotation < count; ++rotation) {
        float total = 0.0f;
        for (size_t i = 0; i < count; ++i) {
            total += a[i].distance_to(b[(i + rotation) % count]);
        }
        if (total < best_total) {
            best_total = total;
            best_rotation = rotation;
        }
    }
    if (best_rotation == 0) {
        return;
    }
    Face& rotated = tensegrity_.face(face_b);
    std::rotate(rotated.ends.begin(), rotated.ends.begin() + static_cast<std::ptrdiff_t>(best_rotation),
                rotated.ends.end());
    if (rotated.pulls.size() == count) {
        std::rotate(rotated.pulls.begin(), rotated.pulls.begin() + static_cast<std::ptrdiff_t>(best_rotation),
                    rotated.pulls.end());
    }
}

std::vector<IntervalId> TensegrityBuilder::connect(FaceId face_a, FaceId face_b, const ConnectRoles& roles) {
    auto log = pretenst::logging::get_logger();

    const Face& first = tensegrity_.face(face_a);
    const Face& second = tensegrity_.face(face_b);
    if (first.ends.size() != second.ends.size()) {
        throw std::invalid_argument("TensegrityBuilder::connect: faces differ in size");
    }
    Spin spin_a = first.spin;
    Spin spin_b = second.spin;
    Percent scale = percent_from_factor((factor_from_percent(first.scale) + factor_from_percent(second.scale)) / 2.0f);

    std::vector<JointId> b(first.ends.rbegin(), first.ends.rend());
    std::vector<JointId> c = second.ends;
    std::vector<JointId> a;
    std::vector<JointId> d;
    for (JointId joint : b) {
        a.push_back(tensegrity_.across_push(joint));
    }
    for (JointId joint : c) {
        d.push_back(tensegrity_.across_push(joint));
    }
    size_t count = b.size();
    auto next = [count](size_t i) { return (i + 1) % count; };
    auto prev = [count](size_t i) { return (i + count - 1) % count; };

    std::vector<IntervalId> pulls;
    for (size_t i = 0; i < count; ++i) {
        pulls.push_back(tensegrity_.create_interval(b[i], c[i], roles.ring, scale));
        pulls.push_back(tensegrity_.create_interval(c[i], b[next(i)], roles.ring, scale));
    }
    for (size_t i = 0; i < count; ++i) {
        JointId down_end = spin_a == Spin::Left ? a[next(i)] : a[i];
        pulls.push_back(tensegrity_.create_interval(c[i], down_end, roles.down, scale));
        JointId up_start = spin_b == Spin::Left ? b[next(i)] : b[i];
        pulls.push_back(tensegrity_.create_interval(up_start, d[i], roles.up, scale));
    }
    if (roles.ring == IntervalRole::Ring) {
        for (size_t i = 0; i < count; ++i) {
            if (spin_a == Spin::Left) {
                tensegrity_.create_face({c[i], a[next(i)], b[i]}, false, opposite_spin(spin_a), scale);
            } else {
                tensegrity_.create_face({c[i], b[next(i)], a[i]}, false, opposite_spin(spin_a), scale);
            }
            if (spin_b == Spin::Left) {
                tensegrity_.create_face({b[next(i)], d[i], c[next(i)]}, false, opposite_spin(spin_b), scale);
            } else {
                tensegrity_.create_face({b[i], c[prev(i)], d[i]}, false, opposite_spin(spin_b), scale);
            }
        }
    }

    // The consumed rings are numbered below the new members, which shift down
    std::vector<IntervalId> consumed = tensegrity_.face(face_a).pulls;
    const auto& more = tensegrity_.face(face_b).pulls;
    consumed.insert(consumed.end(), more.begin(), more.end());
    tensegrity_.remove_face(face_b);
    tensegrity_.remove_face(face_a);
    for (auto& pull : pulls) {
        IntervalId original = pull;
        for (IntervalId gone : consumed) {
            if (gone < original) {
                pull--;
            }
        }
    }
    log->debug("Connected faces {} and {} with {} members", face_a, face_b, pulls.size());
    return pulls;
}

}  // namespace pretenst
