#ifndef WISHBONE_BLOCKS_TRAVEL_SWEEP_BLOCK_HPP
#define WISHBONE_BLOCKS_TRAVEL_SWEEP_BLOCK_HPP

#include <functional>
#include <limits>
#include <string>
#include <vector>
#include "../core/constants.hpp"
#include "../core/errors.hpp"
#include "../core/timing.hpp"
#include "kinematic_chain_block.hpp"
#include "reference_geometry_block.hpp"

namespace wishbone {

enum class DriveMode {
    SHOCK_COMPRESSION,      // Sweep values are shock compression
    WHEEL_TRAVEL            // Sweep values are wheel vertical displacement
};

enum class InfeasibilityPolicy {
    TRUNCATE,               // Stop at the last good step
    SKIP_FAILED_STEPS       // Keep going; output spacing becomes uneven
};

enum class SeedPolicy {
    PREVIOUS_STEP,          // Seed from the last accepted pose (steps depend on each other)
    REFERENCE               // Seed from the reference (steps independent)
};

struct SweepSettings {
    DriveMode drive_mode = DriveMode::SHOCK_COMPRESSION;
    InfeasibilityPolicy infeasibility_policy = InfeasibilityPolicy::TRUNCATE;
    SeedPolicy seed_policy = SeedPolicy::PREVIOUS_STEP;
    KinematicsSettings kinematics;
    double max_angle_jump = MAX_ANGLE_JUMP_RAD;                 // Branch continuity guard
    double singular_tolerance = SINGULAR_MOTION_RATIO_TOLERANCE;
    bool verbose = false;
    std::function<bool()> cancel_requested;                     // Polled between steps
};

struct MotionRatioStatistics {
    double mean;
    double min;
    double max;
    int valid_count;         // Non-NaN motion ratio entries

    MotionRatioStatistics()
        : mean(std::numeric_limits<double>::quiet_NaN())
        , min(std::numeric_limits<double>::quiet_NaN())
        , max(std::numeric_limits<double>::quiet_NaN())
        , valid_count(0) {}
};

// Where and why a sweep stopped (or a step was skipped)
struct SweepTermination {
    FailureKind kind;
    LoopStage stage;
    double driving_input;
    std::string message;

    SweepTermination(FailureKind failure = FailureKind::NONE,
                     LoopStage loop_stage = LoopStage::CONTROL_ARM_UPRIGHT,
                     double input = 0.0, const std::string& text = "")
        : kind(failure), stage(loop_stage), driving_input(input), message(text) {}

    bool occurred() const { return kind != FailureKind::NONE; }
};

struct SweepResult {
    std::vector<double> driving_inputs;              // Accepted sweep values, increasing
    std::vector<Pose> poses;
    std::vector<double> shock_travel;                // Shock compression per pose
    std::vector<double> wheel_displacement;          // Vertical, from the reference
    std::vector<double> wheel_lateral_displacement;
    std::vector<double> camber_change;
    std::vector<double> motion_ratio;                // One fewer than wheel_displacement
    std::vector<double> wheel_travel_mid;            // Wheel travel at motion ratio midpoints
    MotionRatioStatistics statistics;

    DriveMode drive_mode;
    double requested_min;
    double requested_max;
    double actual_min;                               // NaN when no step solved
    double actual_max;
    int requested_steps;

    SweepTermination termination;                    // kind NONE if the range completed
    std::vector<SweepTermination> skipped_steps;     // SKIP_FAILED_STEPS only
    bool sweep_complete;                             // Every requested step accepted
    double calculation_time_ms;

    SweepResult(DriveMode mode, double min_value, double max_value, int steps)
        : drive_mode(mode), requested_min(min_value), requested_max(max_value)
        , actual_min(std::numeric_limits<double>::quiet_NaN())
        , actual_max(std::numeric_limits<double>::quiet_NaN())
        , requested_steps(steps), sweep_complete(false), calculation_time_ms(0.0) {}

    size_t size() const { return driving_inputs.size(); }
};

class TravelSweepBlock {
public:
    // Main interface: solve a pose at every value of [min_value, max_value] spaced by step.
    // Throws ConfigurationError for an invalid range or settings; per-step failures
    // end up in the termination record.
    static SweepResult sweep(const ReferenceGeometry& reference,
                             double min_value, double max_value, double step,
                             const SweepSettings& settings = SweepSettings());

    // min + i*step for every i that stays within max (tolerant endpoint, snapped to max)
    static std::vector<double> generate_inputs(double min_value, double max_value, double step);

    // Finite difference d(shock travel) / d(wheel displacement) per interval.
    // NaN where the wheel does not move.
    static std::vector<double> motion_ratio(const std::vector<double>& shock_travel,
                                            const std::vector<double>& wheel_displacement,
                                            double singular_tolerance = SINGULAR_MOTION_RATIO_TOLERANCE);

    static std::vector<double> midpoints(const std::vector<double>& values);

    // Mean, min and max over non-NaN entries
    static MotionRatioStatistics statistics(const std::vector<double>& motion_ratio);

    // Largest wrapped change of any solved loop angle between two poses
    static double max_angle_change(const Pose& previous, const Pose& current, LoopStage* stage = nullptr);

private:
    static void validate_settings(const SweepSettings& settings);

    static PoseResult solve_step(const ReferenceGeometry& reference, double value,
                                 const SweepSettings& settings, const Pose* previous);

    static void derive_curves(SweepResult& result, double singular_tolerance);
};

} // namespace wishbone

#endif // WISHBONE_BLOCKS_TRAVEL_SWEEP_BLOCK_HPP
