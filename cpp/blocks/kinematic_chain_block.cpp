#include "kinematic_chain_block.hpp"
#include "link_geometry_block.hpp"
#include <cmath>
#include <sstream>

namespace wishbone {

namespace {

Eigen::Vector2d direction(double angle) {
    return Eigen::Vector2d(std::cos(angle), std::sin(angle));
}

} // namespace

std::vector<double> Pose::solved_angles() const {
    std::vector<double> angles;
    angles.reserve(loops.size() * 2);
    for (const auto& loop : loops) {
        angles.push_back(loop.phi1);
        angles.push_back(loop.phi2);
    }
    return angles;
}

PoseResult KinematicChainBlock::solve_pose(const ReferenceGeometry& reference,
                                           double shock_compression,
                                           const KinematicsSettings& settings,
                                           const Pose* seed) {
    validate_settings(settings);
    if (!std::isfinite(shock_compression)) {
        throw ConfigurationError("Shock compression must be finite");
    }

    Timer timer;

    std::vector<double> seed_angles;
    if (seed != nullptr && settings.method == SolverMethod::ITERATIVE) {
        seed_angles = seed->solved_angles();
    }

    PoseResult result = solve_chain(reference, shock_compression, settings, seed_angles);

    // A stale seed can land in a poor basin; the reference always sits on the right branch
    const bool seed_failed = result.failure == FailureKind::CONVERGENCE_FAILURE ||
                             result.failure == FailureKind::BRANCH_DISCONTINUITY;
    if (!result.solving_successful && seed_failed && !seed_angles.empty()) {
        result = solve_chain(reference, shock_compression, settings, std::vector<double>());
        result.retried_from_reference = true;
    }

    result.calculation_time_ms = timer.elapsed_ms();
    return result;
}

PoseResult KinematicChainBlock::solve_pose_at_wheel_travel(const ReferenceGeometry& reference,
                                                           double target_wheel_displacement,
                                                           const KinematicsSettings& settings,
                                                           double seed_compression,
                                                           double tolerance,
                                                           int max_iterations) {
    validate_settings(settings);
    if (!std::isfinite(target_wheel_displacement) || !std::isfinite(seed_compression)) {
        throw ConfigurationError("Wheel travel target and seed compression must be finite");
    }
    if (!(tolerance > 0.0) || max_iterations <= 0) {
        throw ConfigurationError("Wheel travel inversion needs tolerance > 0 and max_iterations > 0");
    }

    Timer timer;
    const double absolute_tolerance = tolerance * reference.upright.length;
    const double step_floor = tolerance * reference.reference_shock_length();
    const LoopStage stage = LoopStage::WHEEL_TRAVEL_INVERSION;

    auto fail = [&](FailureKind kind, const std::string& message) {
        std::ostringstream text;
        text << message << " (target wheel travel " << target_wheel_displacement << ")";
        return PoseResult(kind, stage, target_wheel_displacement, timer.elapsed_ms(), text.str());
    };
    auto finish = [&](PoseResult result) {
        result.calculation_time_ms = timer.elapsed_ms();
        return result;
    };

    PoseResult previous = solve_pose(reference, seed_compression, settings);
    if (!previous.solving_successful) {
        previous = solve_pose(reference, 0.0, settings);
    }
    if (!previous.solving_successful) {
        return fail(previous.failure, "Reference pose failed: " + previous.error_message);
    }

    double error_previous = previous.pose.wheel_displacement - target_wheel_displacement;
    if (std::abs(error_previous) < absolute_tolerance) {
        return finish(previous);
    }

    const double probe = WHEEL_TRAVEL_PROBE_FRACTION * reference.reference_shock_length();
    PoseResult current = solve_pose(reference, previous.pose.driving_input + probe, settings, &previous.pose);
    if (!current.solving_successful) {
        current = solve_pose(reference, previous.pose.driving_input - probe, settings, &previous.pose);
    }
    if (!current.solving_successful) {
        return fail(FailureKind::INFEASIBLE, "Mechanism cannot move away from the seed compression");
    }

    bool boundary_limited = false;
    double last_trial = current.pose.driving_input;
    LoopStage blocking_stage = stage;

    for (int iteration = 0; iteration < max_iterations; ++iteration) {
        const double error_current = current.pose.wheel_displacement - target_wheel_displacement;
        if (std::abs(error_current) < absolute_tolerance) {
            return finish(current);
        }

        const double c0 = previous.pose.driving_input;
        const double c1 = current.pose.driving_input;
        const double slope_denominator = error_current - error_previous;
        if (slope_denominator == 0.0 || !std::isfinite(slope_denominator)) {
            return fail(FailureKind::CONVERGENCE_FAILURE, "Wheel travel is stationary in shock compression");
        }

        double trial = c1 - error_current * (c1 - c0) / slope_denominator;
        PoseResult next = solve_pose(reference, trial, settings, &current.pose);

        // Pull infeasible trials back toward the last feasible compression
        int pullbacks = 0;
        while (!next.solving_successful && pullbacks < WHEEL_TRAVEL_MAX_PULLBACKS) {
            blocking_stage = next.failed_stage;
            trial = c1 + 0.5 * (trial - c1);
            next = solve_pose(reference, trial, settings, &current.pose);
            ++pullbacks;
        }
        if (!next.solving_successful) {
            std::ostringstream message;
            message << "Target lies outside the reachable wheel travel: " << to_string(next.failed_stage)
                    << " " << to_string(next.failure) << " at trial compression " << trial
                    << " after " << pullbacks << " pullbacks";
            return fail(FailureKind::INFEASIBLE, message.str());
        }

        boundary_limited = pullbacks > 0;
        if (boundary_limited && std::abs(trial - c1) < step_floor) {
            std::ostringstream message;
            message << "Target lies outside the reachable wheel travel: " << to_string(blocking_stage)
                    << " limits the step to trial compression " << trial << ", less than " << step_floor
                    << " past the feasible compression " << c1;
            return fail(FailureKind::INFEASIBLE, message.str());
        }

        last_trial = trial;
        previous = current;
        error_previous = error_current;
        current = next;
    }

    if (boundary_limited) {
        std::ostringstream message;
        message << "Target lies outside the reachable wheel travel: " << to_string(blocking_stage)
                << " still limits trial compression " << last_trial << " after " << max_iterations
                << " iterations";
        return fail(FailureKind::INFEASIBLE, message.str());
    }
    return fail(FailureKind::CONVERGENCE_FAILURE,
                "Wheel travel inversion did not converge in " + std::to_string(max_iterations) + " iterations");
}

PoseResult KinematicChainBlock::solve_chain(const ReferenceGeometry& reference, double shock_compression,
                                            const KinematicsSettings& settings,
                                            const std::vector<double>& seed_angles) {
    Pose pose;
    pose.driving_input = shock_compression;
    pose.shock_length = reference.reference_shock_length() - shock_compression;

    const LoopStage first_stage = reference.loops.front().stage;
    if (pose.shock_length < DEGENERATE_LINK_TOLERANCE) {
        std::ostringstream message;
        message << "Shock compression " << shock_compression << " leaves no shock length in the "
                << to_string(first_stage);
        return PoseResult(FailureKind::INFEASIBLE, first_stage, shock_compression, 0.0, message.str());
    }

    const std::vector<double> seeds =
        (seed_angles.size() == reference.loops.size() * 2) ? seed_angles : std::vector<double>();
    int total_iterations = 0;
    double lower_arm_angle = 0.0;

    for (size_t i = 0; i < reference.loops.size(); ++i) {
        const LoopReference& loop_reference = reference.loops[i];

        LoopInput input;
        switch (loop_reference.stage) {
            case LoopStage::SHOCK_ROCKER:
                input = reference.shock_rocker_input(pose.shock_length);
                break;
            case LoopStage::PUSHROD_ROCKER:
                input = reference.pushrod_rocker_input(*pose.rocker_angle);
                break;
            case LoopStage::SHOCK_LOWER_ARM:
                input = reference.shock_lower_arm_input(pose.shock_length);
                break;
            case LoopStage::CONTROL_ARM_UPRIGHT:
                input = reference.control_arm_input(lower_arm_angle);
                break;
            case LoopStage::WHEEL_TRAVEL_INVERSION:
                throw ConfigurationError("Wheel travel inversion is not a loop stage");
        }

        const LoopResult solved = solve_loop(input, loop_reference, settings, seeds, i);
        if (!solved.solving_successful) {
            return PoseResult(failure_kind_from(solved.status), loop_reference.stage, shock_compression,
                              0.0, failure_message(loop_reference.stage, shock_compression, solved));
        }

        total_iterations += solved.iterations_used;
        pose.loops.emplace_back(loop_reference.stage, solved.phi1, solved.phi2, solved.iterations_used);

        switch (loop_reference.stage) {
            case LoopStage::SHOCK_ROCKER:
                pose.rocker_angle = solved.phi1;
                pose.shock_angle = solved.phi2;
                break;
            case LoopStage::PUSHROD_ROCKER:
                pose.pushrod_angle = solved.phi1;
                lower_arm_angle = LinkGeometryBlock::wrap_angle(solved.phi2 + reference.lower_arm_mount_offset);
                break;
            case LoopStage::SHOCK_LOWER_ARM:
                pose.shock_angle = solved.phi2;
                lower_arm_angle = LinkGeometryBlock::wrap_angle(solved.phi1 + reference.lower_arm_mount_offset);
                break;
            case LoopStage::CONTROL_ARM_UPRIGHT:
                pose.upper_arm_angle = solved.phi1;
                pose.upright_angle = solved.phi2;
                break;
            case LoopStage::WHEEL_TRAVEL_INVERSION:
                break;
        }
    }

    pose.lower_arm_angle = lower_arm_angle;
    reconstruct(reference, pose);

    return PoseResult(pose, total_iterations, false, 0.0);
}

LoopResult KinematicChainBlock::solve_loop(const LoopInput& input, const LoopReference& loop_reference,
                                           const KinematicsSettings& settings,
                                           const std::vector<double>& seed_angles, size_t loop_index) {
    LoopSolverSettings loop_settings;
    loop_settings.method = settings.method;
    loop_settings.branch = loop_reference.branch;
    loop_settings.assembly = loop_reference.assembly;
    loop_settings.tolerance = settings.tolerance;
    loop_settings.max_iterations = settings.max_iterations;

    if (seed_angles.empty()) {
        loop_settings.phi1_guess = loop_reference.phi1;
        loop_settings.phi2_guess = loop_reference.phi2;
    } else {
        loop_settings.phi1_guess = seed_angles[2 * loop_index];
        loop_settings.phi2_guess = seed_angles[2 * loop_index + 1];
    }

    return LoopSolverBlock::solve(input, loop_settings);
}

void KinematicChainBlock::reconstruct(const ReferenceGeometry& reference, Pose& pose) {
    const SuspensionTopology& topology = reference.topology;
    pose.joints = topology.points();

    const Eigen::Vector2d& lca_in = topology.point(SuspensionPoint::LCA_IN);
    const Eigen::Vector2d& uca_in = topology.point(SuspensionPoint::UCA_IN);
    const Eigen::Vector2d& shock_in = topology.point(SuspensionPoint::SHOCK_IN);

    const Eigen::Vector2d lca_out = lca_in - reference.lower_arm.length * direction(pose.lower_arm_angle);
    const Eigen::Vector2d uca_out = uca_in + reference.upper_arm.length * direction(pose.upper_arm_angle);
    const Eigen::Vector2d wheel_center = lca_out + reference.wheel_arm.length *
                                         direction(pose.upright_angle + reference.wheel_center_offset);

    pose.joints[SuspensionPoint::LCA_OUT] = lca_out;
    pose.joints[SuspensionPoint::UCA_OUT] = uca_out;
    pose.joints[SuspensionPoint::WHEEL_CENTER] = wheel_center;
    pose.joints[SuspensionPoint::SHOCK_OUT] = shock_in + pose.shock_length * direction(pose.shock_angle);

    if (reference.is_pushrod()) {
        const Eigen::Vector2d& cam_hinge = topology.point(SuspensionPoint::CAM_HINGE);
        const double mount_angle = pose.lower_arm_angle - reference.lower_arm_mount_offset;

        pose.joints[SuspensionPoint::PUSHROD_IN] = cam_hinge + reference.rocker_pushrod_arm.length *
                                                   direction(*pose.rocker_angle + reference.rocker_arm_offset);
        pose.joints[SuspensionPoint::PUSHROD_OUT] = lca_in - reference.lower_arm_mount.length *
                                                    direction(mount_angle);
    }

    pose.wheel_center = wheel_center;
    pose.wheel_displacement = wheel_center.y() - reference.reference_wheel_center.y();
    pose.wheel_lateral_displacement = wheel_center.x() - reference.reference_wheel_center.x();
    pose.camber_change = LinkGeometryBlock::wrap_angle(pose.upright_angle - reference.upright.angle);
}

std::string KinematicChainBlock::failure_message(LoopStage stage, double shock_compression,
                                                 const LoopResult& result) {
    std::ostringstream message;
    message << to_string(stage) << " " << to_string(result.status) << " at shock compression "
            << shock_compression << ": " << result.error_message;
    return message.str();
}

void KinematicChainBlock::validate_settings(const KinematicsSettings& settings) {
    if (settings.method == SolverMethod::ITERATIVE &&
        (!(settings.tolerance > 0.0) || settings.max_iterations <= 0)) {
        throw ConfigurationError("Iterative kinematics needs tolerance > 0 and max_iterations > 0");
    }
}

} // namespace wishbone
