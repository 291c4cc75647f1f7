#include "travel_sweep_block.hpp"
#include "link_geometry_block.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace wishbone {

SweepResult TravelSweepBlock::sweep(const ReferenceGeometry& reference,
                                    double min_value, double max_value, double step,
                                    const SweepSettings& settings) {
    validate_settings(settings);
    const std::vector<double> inputs = generate_inputs(min_value, max_value, step);

    SweepResult result(settings.drive_mode, min_value, max_value, static_cast<int>(inputs.size()));
    double calculation_time_ms = 0.0;

    {
        ScopedTimer timer(calculation_time_ms);

        if (settings.verbose) {
            std::cout << "🔄 Sweeping " << inputs.size() << " steps of "
                      << (settings.drive_mode == DriveMode::SHOCK_COMPRESSION ? "shock compression" : "wheel travel")
                      << " from " << min_value << " to " << max_value << " "
                      << SuspensionTopology::unit_symbol(reference.topology.unit()) << std::endl;
        }

        result.poses.reserve(inputs.size());
        const Pose* previous = nullptr;

        for (double value : inputs) {
            if (settings.cancel_requested && settings.cancel_requested()) {
                result.termination = SweepTermination(FailureKind::CANCELLED, LoopStage::CONTROL_ARM_UPRIGHT,
                                                      value, "Sweep cancelled before this step");
                if (settings.verbose) {
                    std::cout << "⚠️ Sweep cancelled at " << value << " after "
                              << result.size() << " steps" << std::endl;
                }
                break;
            }

            const PoseResult pose_result = solve_step(reference, value, settings, previous);

            SweepTermination failure;
            if (!pose_result.solving_successful) {
                failure = SweepTermination(pose_result.failure, pose_result.failed_stage, value,
                                           pose_result.error_message);
            } else if (previous != nullptr) {
                LoopStage jump_stage = LoopStage::CONTROL_ARM_UPRIGHT;
                const double jump = max_angle_change(*previous, pose_result.pose, &jump_stage);
                if (jump > settings.max_angle_jump) {
                    std::ostringstream message;
                    message << to_string(jump_stage) << " angle jumped " << jump << " rad at " << value;
                    failure = SweepTermination(FailureKind::BRANCH_DISCONTINUITY, jump_stage, value,
                                               message.str());
                }
            }

            if (failure.occurred()) {
                if (settings.infeasibility_policy == InfeasibilityPolicy::TRUNCATE) {
                    result.termination = failure;
                    if (settings.verbose) {
                        std::cout << "⚠️ Sweep truncated: " << failure.message << std::endl;
                    }
                    break;
                }
                if (settings.verbose) {
                    std::cout << "⚠️ Skipping step: " << failure.message << std::endl;
                }
                result.skipped_steps.push_back(failure);
                continue;
            }

            result.driving_inputs.push_back(value);
            result.poses.push_back(pose_result.pose);
            previous = &result.poses.back();
        }

        derive_curves(result, settings.singular_tolerance);
    }

    result.calculation_time_ms = calculation_time_ms;
    result.sweep_complete = !result.termination.occurred() && result.skipped_steps.empty();

    if (settings.verbose) {
        std::cout << (result.sweep_complete ? "✅" : "⚠️") << " Sweep finished: " << result.size() << "/"
                  << result.requested_steps << " steps, mean motion ratio " << result.statistics.mean
                  << " (" << calculation_time_ms << "ms)" << std::endl;
    }

    return result;
}

std::vector<double> TravelSweepBlock::generate_inputs(double min_value, double max_value, double step) {
    if (!std::isfinite(min_value) || !std::isfinite(max_value) || !std::isfinite(step)) {
        throw ConfigurationError("Sweep range and step must be finite");
    }
    if (!(step > 0.0)) {
        throw ConfigurationError("Sweep step must be positive");
    }
    if (min_value > max_value) {
        throw ConfigurationError("Sweep min must not exceed max");
    }

    const double intervals = std::floor((max_value - min_value) / step + SWEEP_ENDPOINT_TOLERANCE);
    if (intervals + 1.0 > MAX_SWEEP_STEPS) {
        throw ConfigurationError("Sweep needs more than " + std::to_string(MAX_SWEEP_STEPS) + " steps");
    }

    const int count = static_cast<int>(intervals) + 1;
    std::vector<double> values;
    values.reserve(count);
    for (int i = 0; i < count; ++i) {
        values.push_back(min_value + i * step);
    }

    if (std::abs(values.back() - max_value) <= SWEEP_ENDPOINT_TOLERANCE * step) {
        values.back() = max_value;
    }
    return values;
}

std::vector<double> TravelSweepBlock::motion_ratio(const std::vector<double>& shock_travel,
                                                   const std::vector<double>& wheel_displacement,
                                                   double singular_tolerance) {
    if (shock_travel.size() != wheel_displacement.size()) {
        throw ConfigurationError("Shock travel and wheel displacement must have the same length");
    }

    std::vector<double> ratios;
    if (shock_travel.size() < 2) {
        return ratios;
    }

    ratios.reserve(shock_travel.size() - 1);
    for (size_t i = 0; i + 1 < shock_travel.size(); ++i) {
        const double delta_wheel = wheel_displacement[i + 1] - wheel_displacement[i];
        if (std::abs(delta_wheel) < singular_tolerance) {
            ratios.push_back(std::numeric_limits<double>::quiet_NaN());
        } else {
            ratios.push_back((shock_travel[i + 1] - shock_travel[i]) / delta_wheel);
        }
    }
    return ratios;
}

std::vector<double> TravelSweepBlock::midpoints(const std::vector<double>& values) {
    std::vector<double> mids;
    for (size_t i = 0; i + 1 < values.size(); ++i) {
        mids.push_back(0.5 * (values[i] + values[i + 1]));
    }
    return mids;
}

MotionRatioStatistics TravelSweepBlock::statistics(const std::vector<double>& motion_ratio) {
    MotionRatioStatistics stats;
    double sum = 0.0;

    for (double value : motion_ratio) {
        if (std::isnan(value)) continue;

        if (stats.valid_count == 0) {
            stats.min = value;
            stats.max = value;
        } else {
            stats.min = std::min(stats.min, value);
            stats.max = std::max(stats.max, value);
        }
        sum += value;
        ++stats.valid_count;
    }

    if (stats.valid_count > 0) {
        stats.mean = sum / stats.valid_count;
    }
    return stats;
}

double TravelSweepBlock::max_angle_change(const Pose& previous, const Pose& current, LoopStage* stage) {
    const std::vector<double> before = previous.solved_angles();
    const std::vector<double> after = current.solved_angles();
    const size_t count = std::min(before.size(), after.size());

    double largest = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const double change = std::abs(LinkGeometryBlock::wrap_angle(after[i] - before[i]));
        if (change > largest) {
            largest = change;
            if (stage != nullptr) {
                *stage = current.loops[i / 2].stage;
            }
        }
    }
    return largest;
}

PoseResult TravelSweepBlock::solve_step(const ReferenceGeometry& reference, double value,
                                        const SweepSettings& settings, const Pose* previous) {
    const Pose* seed = (settings.seed_policy == SeedPolicy::PREVIOUS_STEP) ? previous : nullptr;

    if (settings.drive_mode == DriveMode::WHEEL_TRAVEL) {
        const double seed_compression = (seed != nullptr) ? seed->driving_input : 0.0;
        return KinematicChainBlock::solve_pose_at_wheel_travel(reference, value, settings.kinematics,
                                                               seed_compression);
    }
    return KinematicChainBlock::solve_pose(reference, value, settings.kinematics, seed);
}

void TravelSweepBlock::derive_curves(SweepResult& result, double singular_tolerance) {
    for (const Pose& pose : result.poses) {
        result.shock_travel.push_back(pose.driving_input);
        result.wheel_displacement.push_back(pose.wheel_displacement);
        result.wheel_lateral_displacement.push_back(pose.wheel_lateral_displacement);
        result.camber_change.push_back(pose.camber_change);
    }

    result.motion_ratio = motion_ratio(result.shock_travel, result.wheel_displacement, singular_tolerance);
    result.wheel_travel_mid = midpoints(result.wheel_displacement);
    result.statistics = statistics(result.motion_ratio);

    if (!result.driving_inputs.empty()) {
        result.actual_min = result.driving_inputs.front();
        result.actual_max = result.driving_inputs.back();
    }
}

void TravelSweepBlock::validate_settings(const SweepSettings& settings) {
    if (!(settings.max_angle_jump > 0.0)) {
        throw ConfigurationError("max_angle_jump must be positive");
    }
    if (!(settings.singular_tolerance >= 0.0)) {
        throw ConfigurationError("singular_tolerance must be non-negative");
    }
    if (settings.kinematics.method == SolverMethod::ITERATIVE &&
        (!(settings.kinematics.tolerance > 0.0) || settings.kinematics.max_iterations <= 0)) {
        throw ConfigurationError("Iterative kinematics needs tolerance > 0 and max_iterations > 0");
    }
}

} // namespace wishbone
