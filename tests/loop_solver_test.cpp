#include <iostream>
#include <cmath>
#include <Eigen/Dense>
#include "blocks/link_geometry_block.hpp"
#include "blocks/loop_solver_block.hpp"
#include "test_support.hpp"

using namespace wishbone;

namespace {

// Shock/rocker loop of the planar pushrod sample at a given shock length
LoopInput shock_rocker_loop(double shock_length) {
    auto rocker_ground = LinkGeometryBlock::calculate(Eigen::Vector2d(6.5, 13.0), Eigen::Vector2d(10.0, 4.0));
    auto shock_ground = LinkGeometryBlock::calculate(Eigen::Vector2d(10.0, 4.0), Eigen::Vector2d(1.0, 12.0));
    auto rocker_arm = LinkGeometryBlock::calculate(Eigen::Vector2d(5.0, 15.0), Eigen::Vector2d(6.5, 13.0));
    return LoopInput(rocker_ground.length, rocker_ground.angle, shock_ground.length, shock_ground.angle,
                     rocker_arm.length, shock_length);
}

double angle_error(double a, double b) {
    return std::abs(LinkGeometryBlock::wrap_angle(a - b));
}

} // namespace

int main() {
    std::cout << "🧪 Loop solver block test..." << std::endl;
    test::TestReport report;

    std::cout << "  Testing closed form at the reference..." << std::endl;
    LoopInput reference_loop = shock_rocker_loop(5.0);
    LoopResult closed = LoopSolverBlock::solve_closed_form(reference_loop, -1);
    report.check(closed.solving_successful && closed.status == LoopStatus::SOLVED, "Closed form solved");
    report.check_near(closed.phi1, -0.9272952180016122, 1e-9, "Rocker arm angle");
    report.check_near(closed.phi2, 0.6435011087932844, 1e-9, "Shock angle");
    report.check(closed.residual < 1e-9, "Closure residual is tiny");
    report.check(closed.discriminant > 0.0, "Two real roots");

    LoopResult other = LoopSolverBlock::solve_closed_form(reference_loop, 1);
    report.check(other.solving_successful && other.residual < 1e-9, "Other branch also closes");
    report.check(angle_error(other.phi2, closed.phi2) > 1e-3, "Other branch is a different assembly");

    std::cout << "  Testing iterative path..." << std::endl;
    LoopInput compressed = shock_rocker_loop(4.5);
    LoopResult closed_compressed = LoopSolverBlock::solve_closed_form(compressed, -1);
    report.check_near(closed_compressed.phi1, -0.7258212974827765, 1e-9, "Closed form at 4.5");

    LoopResult newton = LoopSolverBlock::solve_iterative(compressed, closed.phi1, closed.phi2);
    report.check(newton.solving_successful, "Newton converged from the reference seed");
    report.check(angle_error(newton.phi1, closed_compressed.phi1) < 1e-9 &&
                 angle_error(newton.phi2, closed_compressed.phi2) < 1e-9, "Newton matches the closed form");
    report.check(newton.iterations_used > 0 && newton.iterations_used <= 10,
                 "Newton iterations: " + std::to_string(newton.iterations_used));

    LoopSolverSettings settings;
    settings.method = SolverMethod::ITERATIVE;
    settings.phi1_guess = closed.phi1;
    settings.phi2_guess = closed.phi2;
    LoopResult dispatched = LoopSolverBlock::solve(compressed, settings);
    report.check(dispatched.solving_successful && angle_error(dispatched.phi1, newton.phi1) < 1e-12,
                 "solve() dispatches to the iterative path");

    std::cout << "  Testing assembly modes..." << std::endl;
    report.check(LoopSolverBlock::assembly_mode(closed.phi1, closed.phi2) == 1 &&
                 LoopSolverBlock::assembly_mode(other.phi1, other.phi2) == -1,
                 "The two roots are opposite assembly modes");
    report.check(LoopSolverBlock::assembly_mode(0.3, 0.3) == 0, "Folded links have no mode");

    const Eigen::Vector2d mirrored = LoopSolverBlock::mirrored_solution(reference_loop, other.phi1, other.phi2);
    report.check(angle_error(mirrored.x(), closed.phi1) < 1e-9 && angle_error(mirrored.y(), closed.phi2) < 1e-9,
                 "Reflecting one root gives the other");

    // Seeded exactly on the other root, Newton stops there unless the mode is pinned
    LoopResult other_compressed = LoopSolverBlock::solve_closed_form(compressed, 1);
    LoopResult free_mode = LoopSolverBlock::solve_iterative(compressed, other_compressed.phi1, other_compressed.phi2);
    report.check(free_mode.solving_successful && angle_error(free_mode.phi1, other_compressed.phi1) < 1e-9,
                 "Unconstrained Newton keeps the seeded assembly");

    LoopResult pinned_mode = LoopSolverBlock::solve_iterative(compressed, other_compressed.phi1, other_compressed.phi2,
                                                              LOOP_SOLVER_TOLERANCE, LOOP_SOLVER_MAX_ITERATIONS, 1);
    report.check(pinned_mode.solving_successful && pinned_mode.residual < 1e-9, "Pinned assembly still closes");
    report.check(angle_error(pinned_mode.phi1, closed_compressed.phi1) < 1e-9 &&
                 angle_error(pinned_mode.phi2, closed_compressed.phi2) < 1e-9,
                 "Pinned assembly lands on the closed-form branch");

    settings.phi1_guess = other_compressed.phi1;
    settings.phi2_guess = other_compressed.phi2;
    settings.assembly = 1;
    LoopResult pinned_dispatch = LoopSolverBlock::solve(compressed, settings);
    report.check(pinned_dispatch.solving_successful && angle_error(pinned_dispatch.phi1, closed_compressed.phi1) < 1e-9,
                 "solve() forwards the assembly mode");

    bool bad_assembly = false;
    try {
        LoopSolverBlock::solve_iterative(compressed, closed.phi1, closed.phi2, LOOP_SOLVER_TOLERANCE,
                                         LOOP_SOLVER_MAX_ITERATIONS, 2);
    } catch (const ConfigurationError&) {
        bad_assembly = true;
    }
    report.check(bad_assembly, "Assembly mode 2 rejected");

    std::cout << "  Testing failure statuses..." << std::endl;
    LoopInput unreachable = shock_rocker_loop(20.0);
    LoopResult infeasible = LoopSolverBlock::solve_closed_form(unreachable, -1);
    report.check(!infeasible.solving_successful && infeasible.status == LoopStatus::INFEASIBLE,
                 "Closed form reports INFEASIBLE");
    report.check(infeasible.discriminant < 0.0, "Negative discriminant recorded");

    LoopResult infeasible_newton = LoopSolverBlock::solve_iterative(unreachable, closed.phi1, closed.phi2);
    report.check(infeasible_newton.status == LoopStatus::INFEASIBLE, "Triangle inequality caught before Newton");
    report.check(infeasible_newton.calculation_time_ms > 0.0, "Infeasible iterative solve is still timed");

    LoopResult singular = LoopSolverBlock::solve_iterative(reference_loop, 0.0, 0.0);
    report.check(singular.status == LoopStatus::NOT_CONVERGED, "Parallel unknown links: singular Jacobian");

    LoopResult capped = LoopSolverBlock::solve_iterative(reference_loop, 1.0, -2.0, LOOP_SOLVER_TOLERANCE, 1);
    report.check(capped.status == LoopStatus::NOT_CONVERGED && capped.iterations_used == 1,
                 "Iteration cap reports NOT_CONVERGED");

    std::cout << "  Testing triangle and degenerate quadratic..." << std::endl;
    LoopInput triangle(5.0, 0.0, 0.0, 0.0, 4.0, 3.0);
    for (int branch : {1, -1}) {
        LoopResult result = LoopSolverBlock::solve_closed_form(triangle, branch);
        const Eigen::Vector2d joint = Eigen::Vector2d(5.0, 0.0) + 4.0 * Eigen::Vector2d(std::cos(result.phi1),
                                                                                       std::sin(result.phi1));
        report.check(result.solving_successful && std::abs(joint.x() - 1.8) < 1e-9 &&
                     std::abs(std::abs(joint.y()) - 2.4) < 1e-9,
                     "3-4-5 triangle, branch " + std::to_string(branch));
    }

    // a == 0: one root is the linear root, the other sits at phi2 = pi
    LoopInput collapsed(std::sqrt(2.0), M_PI / 4.0, 0.0, 0.0, 1.0, 1.0);
    LoopResult linear = LoopSolverBlock::solve_closed_form(collapsed, -1);
    LoopResult at_pi = LoopSolverBlock::solve_closed_form(collapsed, 1);
    report.check_near(linear.phi2, -M_PI / 2.0, 1e-9, "Linear root");
    report.check_near(std::abs(at_pi.phi2), M_PI, 1e-9, "Root at infinity");
    report.check(linear.residual < 1e-9 && at_pi.residual < 1e-9, "Both degenerate roots close");

    std::cout << "  Testing input validation..." << std::endl;
    bool bad_branch = false;
    try {
        LoopSolverBlock::solve_closed_form(reference_loop, 0);
    } catch (const ConfigurationError&) {
        bad_branch = true;
    }
    report.check(bad_branch, "Branch 0 rejected");

    bool bad_length = false;
    try {
        LoopSolverBlock::solve_closed_form(LoopInput(1.0, 0.0, 0.0, 0.0, 0.0, 1.0), 1);
    } catch (const ConfigurationError&) {
        bad_length = true;
    }
    report.check(bad_length, "Zero unknown length rejected");

    return report.finish("loop solver");
}
