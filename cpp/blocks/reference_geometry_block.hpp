#ifndef WISHBONE_BLOCKS_REFERENCE_GEOMETRY_BLOCK_HPP
#define WISHBONE_BLOCKS_REFERENCE_GEOMETRY_BLOCK_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "../core/constants.hpp"
#include "../core/errors.hpp"
#include "../core/timing.hpp"
#include "../geometry/suspension_topology.hpp"
#include "link_geometry_block.hpp"
#include "loop_solver_block.hpp"

namespace wishbone {

// Two-unknown sub-loops, and the wheel travel inversion stage for failure reports
enum class LoopStage {
    SHOCK_ROCKER,           // Pushrod state A: shock length -> rocker angle
    PUSHROD_ROCKER,         // Pushrod state B: rocker angle -> lower arm angle
    SHOCK_LOWER_ARM,        // Basic: shock length -> lower arm angle
    CONTROL_ARM_UPRIGHT,    // State C: lower arm angle -> upper arm and upright
    WHEEL_TRAVEL_INVERSION  // Outer search on shock compression
};

const char* to_string(LoopStage stage);

struct LoopReference {
    LoopStage stage;
    double phi1;             // Reference angle of the first unknown link
    double phi2;             // Reference angle of the second unknown link
    int branch;              // Closed-form root reproducing the reference angles
    double branch_error;     // Largest angle error of that root at the reference
    int assembly;            // Sign of sin(phi2 - phi1) at the reference, 0 if folded

    LoopReference(LoopStage loop_stage = LoopStage::CONTROL_ARM_UPRIGHT, double angle1 = 0.0,
                  double angle2 = 0.0, int root = 1, double error = 0.0, int mode = 0)
        : stage(loop_stage), phi1(angle1), phi2(angle2), branch(root), branch_error(error)
        , assembly(mode) {}
};

struct ReferenceGeometry {
    SuspensionTopology topology;

    // Links shared by both variants (direction is the loop direction)
    LinkGeometry upper_arm;            // UCA_IN -> UCA_OUT
    LinkGeometry lower_arm;            // LCA_OUT -> LCA_IN
    LinkGeometry upright;              // UCA_OUT -> LCA_OUT
    LinkGeometry chassis_cross;        // LCA_IN -> UCA_IN
    LinkGeometry wheel_arm;            // LCA_OUT -> WHEEL_CENTER
    LinkGeometry shock;                // SHOCK_IN -> SHOCK_OUT
    LinkGeometry shock_ground;         // LCA_IN -> SHOCK_IN
    LinkGeometry lower_arm_mount;      // PUSHROD_OUT (or SHOCK_OUT) -> LCA_IN

    // Pushrod variant only
    LinkGeometry rocker_shock_arm;     // SHOCK_OUT -> CAM_HINGE
    LinkGeometry rocker_pushrod_arm;   // CAM_HINGE -> PUSHROD_IN
    LinkGeometry rocker_ground;        // CAM_HINGE -> LCA_IN
    LinkGeometry pushrod;              // PUSHROD_IN -> PUSHROD_OUT

    // Rigid-body offsets
    double rocker_arm_offset;          // Signed, pushrod arm angle minus shock arm angle
    double rocker_included_angle;      // Unsigned bell-crank angle, display only
    double lower_arm_mount_offset;     // Lower arm angle minus mount link angle
    double wheel_center_offset;        // Wheel arm angle minus upright angle

    std::vector<LoopReference> loops;  // In solve order
    Eigen::Vector2d reference_wheel_center;
    double calculation_time_ms;

    explicit ReferenceGeometry(const SuspensionTopology& source)
        : topology(source), rocker_arm_offset(0.0), rocker_included_angle(0.0)
        , lower_arm_mount_offset(0.0), wheel_center_offset(0.0)
        , reference_wheel_center(Eigen::Vector2d::Zero()), calculation_time_ms(0.0) {}

    bool is_pushrod() const { return topology.type() == TopologyType::PUSHROD; }
    double reference_shock_length() const { return shock.length; }

    // Throws ConfigurationError if the stage is not part of this topology
    const LoopReference& loop(LoopStage stage) const;

    // Loop inputs for the current values of the upstream unknowns
    LoopInput shock_rocker_input(double shock_length) const;
    LoopInput pushrod_rocker_input(double rocker_angle) const;
    LoopInput shock_lower_arm_input(double shock_length) const;
    LoopInput control_arm_input(double lower_arm_angle) const;
};

class ReferenceGeometryBlock {
public:
    // Main interface: reference links, offsets and per-loop branches.
    // Throws DegenerateLinkError for coincident points and ConfigurationError
    // when link lengths suggest mixed units or the reference cannot be reproduced.
    static ReferenceGeometry calculate(const SuspensionTopology& topology);

    // Coordinate edit: new topology, full recomputation
    static ReferenceGeometry recalculate_with_point(const ReferenceGeometry& reference,
                                                    SuspensionPoint point,
                                                    const Eigen::Vector2d& new_position);

    // Longest over shortest kinematic link
    static double link_length_ratio(const SuspensionTopology& topology);

private:
    static void check_unit_consistency(const SuspensionTopology& topology);

    static LinkGeometry link(const SuspensionTopology& topology, SuspensionPoint from, SuspensionPoint to);

    // Evaluate both closed-form roots and keep the one matching the reference angles.
    // Also records the assembly mode the iterative solver must stay in.
    static LoopReference select_branch(LoopStage stage, const LoopInput& input,
                                       double reference_phi1, double reference_phi2);
};

} // namespace wishbone

#endif // WISHBONE_BLOCKS_REFERENCE_GEOMETRY_BLOCK_HPP
