#include "reference_geometry_block.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace wishbone {

const char* to_string(LoopStage stage) {
    switch (stage) {
        case LoopStage::SHOCK_ROCKER: return "shock/rocker loop";
        case LoopStage::PUSHROD_ROCKER: return "pushrod/rocker loop";
        case LoopStage::SHOCK_LOWER_ARM: return "shock/lower-arm loop";
        case LoopStage::CONTROL_ARM_UPRIGHT: return "control-arm/upright loop";
        case LoopStage::WHEEL_TRAVEL_INVERSION: return "wheel travel inversion";
    }
    return "unknown stage";
}

// =============================================================================
// REFERENCE GEOMETRY
// =============================================================================

const LoopReference& ReferenceGeometry::loop(LoopStage stage) const {
    for (const auto& entry : loops) {
        if (entry.stage == stage) {
            return entry;
        }
    }
    throw ConfigurationError(std::string("Loop stage '") + to_string(stage) + "' is not part of the " +
                             SuspensionTopology::type_name(topology.type()) + " topology");
}

LoopInput ReferenceGeometry::shock_rocker_input(double shock_length) const {
    return LoopInput(rocker_ground.length, rocker_ground.angle,
                     shock_ground.length, shock_ground.angle,
                     rocker_shock_arm.length, shock_length);
}

LoopInput ReferenceGeometry::pushrod_rocker_input(double rocker_angle) const {
    // Pushrod arm is rigid with the shock arm; closure back through LCA_IN -> CAM_HINGE
    return LoopInput(rocker_pushrod_arm.length, rocker_angle + rocker_arm_offset,
                     rocker_ground.length, LinkGeometryBlock::wrap_angle(rocker_ground.angle + M_PI),
                     pushrod.length, lower_arm_mount.length);
}

LoopInput ReferenceGeometry::shock_lower_arm_input(double shock_length) const {
    return LoopInput(shock_ground.length, shock_ground.angle, 0.0, 0.0,
                     lower_arm_mount.length, shock_length);
}

LoopInput ReferenceGeometry::control_arm_input(double lower_arm_angle) const {
    return LoopInput(chassis_cross.length, chassis_cross.angle,
                     lower_arm.length, lower_arm_angle,
                     upper_arm.length, upright.length);
}

// =============================================================================
// REFERENCE GEOMETRY BLOCK
// =============================================================================

ReferenceGeometry ReferenceGeometryBlock::calculate(const SuspensionTopology& topology) {
    double calculation_time_ms = 0.0;
    ReferenceGeometry reference(topology);

    {
        ScopedTimer timer(calculation_time_ms);

        check_unit_consistency(topology);

        const bool pushrod = topology.type() == TopologyType::PUSHROD;
        const SuspensionPoint mount = pushrod ? SuspensionPoint::PUSHROD_OUT : SuspensionPoint::SHOCK_OUT;

        reference.upper_arm = link(topology, SuspensionPoint::UCA_IN, SuspensionPoint::UCA_OUT);
        reference.lower_arm = link(topology, SuspensionPoint::LCA_OUT, SuspensionPoint::LCA_IN);
        reference.upright = link(topology, SuspensionPoint::UCA_OUT, SuspensionPoint::LCA_OUT);
        reference.chassis_cross = link(topology, SuspensionPoint::LCA_IN, SuspensionPoint::UCA_IN);
        reference.wheel_arm = link(topology, SuspensionPoint::LCA_OUT, SuspensionPoint::WHEEL_CENTER);
        reference.shock = link(topology, SuspensionPoint::SHOCK_IN, SuspensionPoint::SHOCK_OUT);
        reference.shock_ground = link(topology, SuspensionPoint::LCA_IN, SuspensionPoint::SHOCK_IN);
        reference.lower_arm_mount = link(topology, mount, SuspensionPoint::LCA_IN);

        reference.lower_arm_mount_offset = reference.lower_arm.angle - reference.lower_arm_mount.angle;
        reference.wheel_center_offset = reference.wheel_arm.angle - reference.upright.angle;
        reference.reference_wheel_center = topology.point(SuspensionPoint::WHEEL_CENTER);

        if (pushrod) {
            reference.rocker_shock_arm = link(topology, SuspensionPoint::SHOCK_OUT, SuspensionPoint::CAM_HINGE);
            reference.rocker_pushrod_arm = link(topology, SuspensionPoint::CAM_HINGE, SuspensionPoint::PUSHROD_IN);
            reference.rocker_ground = link(topology, SuspensionPoint::CAM_HINGE, SuspensionPoint::LCA_IN);
            reference.pushrod = link(topology, SuspensionPoint::PUSHROD_IN, SuspensionPoint::PUSHROD_OUT);

            reference.rocker_arm_offset = reference.rocker_pushrod_arm.angle - reference.rocker_shock_arm.angle;
            reference.rocker_included_angle = LinkGeometryBlock::included_angle(
                -reference.rocker_shock_arm.vector(), reference.rocker_pushrod_arm.vector());

            reference.loops.push_back(select_branch(
                LoopStage::SHOCK_ROCKER, reference.shock_rocker_input(reference.shock.length),
                reference.rocker_shock_arm.angle, reference.shock.angle));
            reference.loops.push_back(select_branch(
                LoopStage::PUSHROD_ROCKER, reference.pushrod_rocker_input(reference.rocker_shock_arm.angle),
                reference.pushrod.angle, reference.lower_arm_mount.angle));
        } else {
            reference.loops.push_back(select_branch(
                LoopStage::SHOCK_LOWER_ARM, reference.shock_lower_arm_input(reference.shock.length),
                reference.lower_arm_mount.angle, reference.shock.angle));
        }

        reference.loops.push_back(select_branch(
            LoopStage::CONTROL_ARM_UPRIGHT, reference.control_arm_input(reference.lower_arm.angle),
            reference.upper_arm.angle, reference.upright.angle));
    }

    reference.calculation_time_ms = calculation_time_ms;
    return reference;
}

ReferenceGeometry ReferenceGeometryBlock::recalculate_with_point(const ReferenceGeometry& reference,
                                                                 SuspensionPoint point,
                                                                 const Eigen::Vector2d& new_position) {
    return calculate(reference.topology.with_point(point, new_position));
}

double ReferenceGeometryBlock::link_length_ratio(const SuspensionTopology& topology) {
    double shortest = std::numeric_limits<double>::infinity();
    double longest = 0.0;

    for (const PlanarLink& planar : SuspensionTopology::kinematic_links(topology.type())) {
        const double length = link(topology, planar.from, planar.to).length;
        shortest = std::min(shortest, length);
        longest = std::max(longest, length);
    }
    return longest / shortest;
}

void ReferenceGeometryBlock::check_unit_consistency(const SuspensionTopology& topology) {
    const double ratio = link_length_ratio(topology);
    if (ratio > MAX_LINK_LENGTH_RATIO) {
        std::ostringstream message;
        message << "Longest/shortest link ratio " << ratio << " exceeds " << MAX_LINK_LENGTH_RATIO
                << ": check that all points are in " << SuspensionTopology::unit_symbol(topology.unit());
        throw ConfigurationError(message.str());
    }
}

LinkGeometry ReferenceGeometryBlock::link(const SuspensionTopology& topology,
                                          SuspensionPoint from, SuspensionPoint to) {
    return LinkGeometryBlock::calculate(topology.point(from), topology.point(to),
                                        SuspensionTopology::point_name(from) + "->" +
                                        SuspensionTopology::point_name(to));
}

LoopReference ReferenceGeometryBlock::select_branch(LoopStage stage, const LoopInput& input,
                                                    double reference_phi1, double reference_phi2) {
    LoopReference best(stage, reference_phi1, reference_phi2, 1, std::numeric_limits<double>::infinity());

    for (int branch : {1, -1}) {
        const LoopResult result = LoopSolverBlock::solve_closed_form(input, branch);
        if (!result.solving_successful) {
            continue;
        }

        const double error = std::max(
            std::abs(LinkGeometryBlock::wrap_angle(result.phi1 - reference_phi1)),
            std::abs(LinkGeometryBlock::wrap_angle(result.phi2 - reference_phi2)));

        if (error < best.branch_error) {
            best.branch = branch;
            best.branch_error = error;
        }
    }

    if (!(best.branch_error < BRANCH_MATCH_TOLERANCE)) {
        std::ostringstream message;
        message << "Reference geometry not reproducible in the " << to_string(stage)
                << " (best branch error " << best.branch_error << " rad)";
        throw ConfigurationError(message.str());
    }

    best.assembly = LoopSolverBlock::assembly_mode(reference_phi1, reference_phi2);
    return best;
}

} // namespace wishbone
