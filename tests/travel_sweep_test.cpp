#include <iostream>
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>
#include "blocks/reference_geometry_block.hpp"
#include "blocks/travel_sweep_block.hpp"
#include "utils/geometry_loader.hpp"
#include "test_support.hpp"

using namespace wishbone;

namespace {

bool strictly_increasing_within(const std::vector<double>& values, double lo, double hi) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] < lo || values[i] > hi) return false;
        if (i > 0 && !(values[i] > values[i - 1])) return false;
    }
    return true;
}

double max_difference(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) return std::numeric_limits<double>::infinity();
    double largest = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        largest = std::max(largest, std::abs(a[i] - b[i]));
    }
    return largest;
}

} // namespace

int main() {
    std::cout << "🧪 Travel sweep block test..." << std::endl;
    test::TestReport report;

    ReferenceGeometry pushrod = ReferenceGeometryBlock::calculate(test::planar_pushrod_sample());

    std::cout << "  Testing input generation..." << std::endl;
    auto inputs = TravelSweepBlock::generate_inputs(-1.5, 1.5, 0.1);
    report.check(inputs.size() == 31, "31 values from -1.5 to 1.5 by 0.1");
    report.check(inputs.front() == -1.5 && inputs.back() == 1.5, "Endpoints exact");
    report.check(strictly_increasing_within(inputs, -1.5, 1.5), "Strictly increasing within range");
    report.check(TravelSweepBlock::generate_inputs(0.0, 1.0, 0.3).size() == 4, "No extra value beyond max");
    report.check(TravelSweepBlock::generate_inputs(2.0, 2.0, 0.5).size() == 1, "Zero-width range gives one value");

    int rejected = 0;
    for (auto bad : std::vector<std::vector<double>>{{0.0, 1.0, 0.0}, {0.0, 1.0, -0.1}, {1.0, 0.0, 0.1},
                                                     {0.0, std::numeric_limits<double>::infinity(), 0.1}}) {
        try {
            TravelSweepBlock::sweep(pushrod, bad[0], bad[1], bad[2]);
        } catch (const ConfigurationError&) {
            ++rejected;
        }
    }
    report.check(rejected == 4, "Invalid ranges throw ConfigurationError");

    std::cout << "  Testing motion ratio regression..." << std::endl;
    SweepResult baseline = TravelSweepBlock::sweep(pushrod, -1.5, 1.5, 0.1);
    report.check(baseline.sweep_complete && baseline.size() == 31, "All 31 steps solved");
    report.check(baseline.motion_ratio.size() == baseline.wheel_displacement.size() - 1,
                 "One motion ratio per interval");
    report.check(baseline.wheel_travel_mid.size() == baseline.motion_ratio.size(), "Midpoint per interval");
    report.check_near(baseline.statistics.mean, 0.636013059262585, 1e-6, "Mean motion ratio");
    report.check_near(baseline.statistics.min, 0.5749094358221526, 1e-6, "Min motion ratio");
    report.check_near(baseline.statistics.max, 0.6751582195941831, 1e-6, "Max motion ratio");
    report.check(baseline.statistics.valid_count == 30, "No singular intervals");
    report.check_near(baseline.wheel_displacement.front(), -2.4465638919468713, 1e-6, "Wheel drop at -1.5 in");
    report.check_near(baseline.wheel_displacement.back(), 2.2825752354446553, 1e-6, "Wheel rise at +1.5 in");
    report.check(strictly_increasing_within(baseline.driving_inputs, -1.5, 1.5), "Driving input ordering");
    report.check(baseline.shock_travel == baseline.driving_inputs, "Shock travel equals compression");

    SweepSettings iterative;
    iterative.kinematics.method = SolverMethod::ITERATIVE;
    SweepResult newton = TravelSweepBlock::sweep(pushrod, -1.5, 1.5, 0.1, iterative);
    report.check_near(newton.statistics.mean, baseline.statistics.mean, 1e-6, "Iterative sweep agrees");

    SweepSettings independent = iterative;
    independent.seed_policy = SeedPolicy::REFERENCE;
    SweepResult from_reference = TravelSweepBlock::sweep(pushrod, -1.5, 1.5, 0.1, independent);
    report.check_near(from_reference.statistics.mean, baseline.statistics.mean, 1e-6,
                      "Reference seeding agrees");

    std::cout << "  Testing truncation..." << std::endl;
    SweepResult truncated = TravelSweepBlock::sweep(pushrod, 0.0, 3.0, 0.1);
    report.check(!truncated.sweep_complete, "Sweep to 3 in is incomplete");
    report.check(truncated.size() == 20, "Stops after 1.9 in (" + std::to_string(truncated.size()) + " steps)");
    report.check_near(truncated.actual_max, 1.9, 1e-9, "Actual max");
    report.check(truncated.termination.kind == FailureKind::INFEASIBLE, "Termination is infeasible");
    report.check(truncated.termination.stage == LoopStage::SHOCK_ROCKER, "Shock/rocker loop fails first");
    report.check_near(truncated.termination.driving_input, 2.0, 1e-9, "Termination input");
    report.check(truncated.requested_max == 3.0, "Requested range kept");

    SweepSettings skipping;
    skipping.infeasibility_policy = InfeasibilityPolicy::SKIP_FAILED_STEPS;
    SweepResult skipped = TravelSweepBlock::sweep(pushrod, 0.0, 3.0, 0.1, skipping);
    report.check(skipped.size() == 20 && skipped.skipped_steps.size() == 11, "Skip policy records 11 failures");
    report.check(!skipped.termination.occurred(), "Skip policy runs to the end");

    std::cout << "  Testing branch guard and cancellation..." << std::endl;
    SweepSettings strict;
    strict.max_angle_jump = 0.01;
    SweepResult guarded = TravelSweepBlock::sweep(pushrod, 0.0, 1.0, 0.1, strict);
    report.check(guarded.termination.kind == FailureKind::BRANCH_DISCONTINUITY, "Tight guard trips");
    report.check(guarded.size() == 1, "Only the first step survives");

    int polls = 0;
    SweepSettings cancelling;
    cancelling.cancel_requested = [&polls]() { return ++polls > 5; };
    SweepResult cancelled = TravelSweepBlock::sweep(pushrod, -1.5, 1.5, 0.1, cancelling);
    report.check(cancelled.termination.kind == FailureKind::CANCELLED, "Cancellation recorded");
    report.check(cancelled.size() == 5, "Five steps before cancel");

    std::cout << "  Testing unit scaling..." << std::endl;
    ReferenceGeometry metric = ReferenceGeometryBlock::calculate(
        test::planar_pushrod_sample().converted_to(LengthUnit::MILLIMETER));
    SweepResult metric_sweep = TravelSweepBlock::sweep(metric, -1.5 * 25.4, 1.5 * 25.4, 0.1 * 25.4);
    report.check(metric_sweep.size() == 31, "Metric sweep has 31 steps");
    bool scaled = metric_sweep.size() == baseline.size();
    for (size_t i = 0; scaled && i < baseline.motion_ratio.size(); ++i) {
        scaled = std::abs(metric_sweep.motion_ratio[i] - baseline.motion_ratio[i]) < 1e-9 &&
                 std::abs(metric_sweep.wheel_displacement[i] - 25.4 * baseline.wheel_displacement[i]) < 1e-7;
    }
    report.check(scaled, "x25.4 gives identical ratios and x25.4 displacement");

    std::cout << "  Testing wheel travel drive..." << std::endl;
    SweepSettings by_wheel;
    by_wheel.drive_mode = DriveMode::WHEEL_TRAVEL;
    SweepResult wheel_sweep = TravelSweepBlock::sweep(pushrod, -1.0, 1.0, 0.25, by_wheel);
    report.check(wheel_sweep.sweep_complete && wheel_sweep.size() == 9, "Wheel-driven sweep complete");
    bool on_target = true;
    for (size_t i = 0; i < wheel_sweep.size(); ++i) {
        on_target = on_target && std::abs(wheel_sweep.wheel_displacement[i] - wheel_sweep.driving_inputs[i]) < 1e-6;
    }
    report.check(on_target, "Every pose sits at its wheel travel");
    report.check(wheel_sweep.statistics.min > 0.5 && wheel_sweep.statistics.max < 0.7,
                 "Wheel-driven motion ratio in the same band");

    std::cout << "  Testing basic sample..." << std::endl;
    ReferenceGeometry basic = ReferenceGeometryBlock::calculate(
        GeometryLoader::sample_geometry(TopologyType::BASIC).to_topology());
    SweepResult basic_sweep = TravelSweepBlock::sweep(basic, -1.0, 1.0, 0.1);
    report.check(basic_sweep.sweep_complete && basic_sweep.size() == 21, "Basic sweep complete");
    report.check_near(basic_sweep.statistics.mean, 0.5328479218478961, 1e-6, "Basic mean motion ratio");

    std::cout << "  Testing iterative sweeps to the travel limits..." << std::endl;
    SweepSettings newton_from_previous;
    newton_from_previous.kinematics.method = SolverMethod::ITERATIVE;
    SweepSettings newton_from_reference = newton_from_previous;
    newton_from_reference.seed_policy = SeedPolicy::REFERENCE;

    SweepResult deep_droop = TravelSweepBlock::sweep(basic, -8.0, -7.0, 0.1);
    report.check(deep_droop.sweep_complete && deep_droop.size() == 11, "Basic droop sweep complete");
    report.check_near(deep_droop.statistics.mean, 0.5280201072745225, 1e-6, "Basic droop mean motion ratio");
    for (const SweepSettings* settings : {&newton_from_previous, &newton_from_reference}) {
        const std::string label = settings->seed_policy == SeedPolicy::REFERENCE ? "reference seed" : "previous seed";
        SweepResult droop_newton = TravelSweepBlock::sweep(basic, -8.0, -7.0, 0.1, *settings);
        report.check(droop_newton.sweep_complete && droop_newton.size() == 11,
                     "Iterative basic droop sweep complete, " + label);
        report.check_near(droop_newton.statistics.mean, deep_droop.statistics.mean, 1e-6,
                          "Iterative basic droop mean, " + label);
        report.check(max_difference(droop_newton.wheel_displacement, deep_droop.wheel_displacement) < 1e-6,
                     "Iterative basic droop wheel travel, " + label);
    }

    struct FullRange {
        const ReferenceGeometry* reference;
        double min;
        double max;
        size_t steps;
        std::string name;
    };
    for (const FullRange& range : {FullRange{&basic, -8.0, 4.7, 128, "basic"},
                                   FullRange{&pushrod, -3.04, 1.86, 50, "pushrod"}}) {
        SweepResult exact = TravelSweepBlock::sweep(*range.reference, range.min, range.max, 0.1);
        report.check(exact.sweep_complete && exact.size() == range.steps,
                     "Closed-form " + range.name + " sweep covers the full travel");
        for (const SweepSettings* settings : {&newton_from_previous, &newton_from_reference}) {
            const std::string label = range.name + ", " +
                (settings->seed_policy == SeedPolicy::REFERENCE ? "reference seed" : "previous seed");
            SweepResult newton_full = TravelSweepBlock::sweep(*range.reference, range.min, range.max, 0.1, *settings);
            report.check(newton_full.sweep_complete && newton_full.size() == range.steps,
                         "Iterative sweep covers the full travel, " + label);
            report.check(max_difference(newton_full.wheel_displacement, exact.wheel_displacement) < 1e-6,
                         "Iterative wheel travel matches closed form, " + label);
        }
    }

    std::cout << "  Testing motion ratio helpers..." << std::endl;
    auto ratios = TravelSweepBlock::motion_ratio({0.0, 1.0, 2.0}, {0.0, 2.0, 2.0});
    report.check(ratios.size() == 2 && ratios[0] == 0.5 && std::isnan(ratios[1]), "Stationary wheel gives NaN");
    auto stats = TravelSweepBlock::statistics(ratios);
    report.check(stats.valid_count == 1 && stats.mean == 0.5, "Statistics skip NaN");
    report.check(std::isnan(TravelSweepBlock::statistics({}).mean), "Empty statistics are NaN");

    return report.finish("travel sweep");
}
