#ifndef WISHBONE_BLOCKS_KINEMATIC_CHAIN_BLOCK_HPP
#define WISHBONE_BLOCKS_KINEMATIC_CHAIN_BLOCK_HPP

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>
#include "../core/constants.hpp"
#include "../core/errors.hpp"
#include "../core/timing.hpp"
#include "../geometry/suspension_topology.hpp"
#include "loop_solver_block.hpp"
#include "reference_geometry_block.hpp"

namespace wishbone {

struct LoopAngles {
    LoopStage stage;
    double phi1;
    double phi2;
    int iterations_used;

    LoopAngles(LoopStage loop_stage = LoopStage::CONTROL_ARM_UPRIGHT, double angle1 = 0.0,
               double angle2 = 0.0, int iterations = 0)
        : stage(loop_stage), phi1(angle1), phi2(angle2), iterations_used(iterations) {}
};

// Solved mechanism state at one shock compression
struct Pose {
    double driving_input = 0.0;                   // Shock compression
    double shock_length = 0.0;
    std::vector<LoopAngles> loops;                // In solve order

    // Link angles, atan2 convention of LinkGeometry
    double shock_angle = 0.0;                     // SHOCK_IN -> SHOCK_OUT
    double lower_arm_angle = 0.0;                 // LCA_OUT -> LCA_IN
    double upper_arm_angle = 0.0;                 // UCA_IN -> UCA_OUT
    double upright_angle = 0.0;                   // UCA_OUT -> LCA_OUT
    std::optional<double> rocker_angle;           // SHOCK_OUT -> CAM_HINGE, pushrod only
    std::optional<double> pushrod_angle;          // PUSHROD_IN -> PUSHROD_OUT, pushrod only

    SuspensionTopology::PointMap joints;          // Every point at this pose, fixed ones included
    Eigen::Vector2d wheel_center = Eigen::Vector2d::Zero();

    double wheel_displacement = 0.0;              // Vertical, from the reference wheel center
    double wheel_lateral_displacement = 0.0;      // Scrub
    double camber_change = 0.0;                   // Upright angle change, rad

    // Angles of every loop flattened (phi1, phi2, ...), used for continuity checks
    std::vector<double> solved_angles() const;
};

struct PoseResult {
    Pose pose;
    bool solving_successful;
    FailureKind failure;
    LoopStage failed_stage;
    double driving_input;                         // Input that was requested
    int total_iterations;                         // Summed over loops (iterative method)
    bool retried_from_reference;                  // Iterative retry was needed
    double calculation_time_ms;
    std::string error_message;

    PoseResult(const Pose& solved, int iterations, bool retried, double time_ms)
        : pose(solved), solving_successful(true), failure(FailureKind::NONE)
        , failed_stage(LoopStage::CONTROL_ARM_UPRIGHT), driving_input(solved.driving_input)
        , total_iterations(iterations), retried_from_reference(retried)
        , calculation_time_ms(time_ms) {}

    // Error constructor
    PoseResult(FailureKind kind, LoopStage stage, double input, double time_ms, const std::string& error)
        : solving_successful(false), failure(kind), failed_stage(stage), driving_input(input)
        , total_iterations(0), retried_from_reference(false), calculation_time_ms(time_ms)
        , error_message(error) {}
};

struct KinematicsSettings {
    SolverMethod method = SolverMethod::CLOSED_FORM;
    double tolerance = LOOP_SOLVER_TOLERANCE;
    int max_iterations = LOOP_SOLVER_MAX_ITERATIONS;
};

class KinematicChainBlock {
public:
    // Main interface: solve every loop in order for one shock compression.
    // The iterative method seeds from seed's angles when given, else from the reference.
    static PoseResult solve_pose(const ReferenceGeometry& reference,
                                 double shock_compression,
                                 const KinematicsSettings& settings = KinematicsSettings(),
                                 const Pose* seed = nullptr);

    // Drive by wheel vertical displacement: secant search on shock compression
    static PoseResult solve_pose_at_wheel_travel(const ReferenceGeometry& reference,
                                                 double target_wheel_displacement,
                                                 const KinematicsSettings& settings = KinematicsSettings(),
                                                 double seed_compression = 0.0,
                                                 double tolerance = WHEEL_TRAVEL_TOLERANCE,
                                                 int max_iterations = WHEEL_TRAVEL_MAX_ITERATIONS);

private:
    static void validate_settings(const KinematicsSettings& settings);

    // One attempt through the chain; seed_angles empty means reference seeds
    static PoseResult solve_chain(const ReferenceGeometry& reference, double shock_compression,
                                  const KinematicsSettings& settings,
                                  const std::vector<double>& seed_angles);

    static LoopResult solve_loop(const LoopInput& input, const LoopReference& loop_reference,
                                 const KinematicsSettings& settings,
                                 const std::vector<double>& seed_angles, size_t loop_index);

    // Joint positions and wheel measures from solved angles
    static void reconstruct(const ReferenceGeometry& reference, Pose& pose);

    static std::string failure_message(LoopStage stage, double shock_compression, const LoopResult& result);
};

} // namespace wishbone

#endif // WISHBONE_BLOCKS_KINEMATIC_CHAIN_BLOCK_HPP
