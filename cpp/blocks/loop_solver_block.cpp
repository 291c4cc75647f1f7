#include "loop_solver_block.hpp"
#include "link_geometry_block.hpp"
#include <cmath>
#include <sstream>

namespace wishbone {

Eigen::Vector2d LoopInput::known_resultant() const {
    return Eigen::Vector2d(r1 * std::cos(theta1) + r2 * std::cos(theta2),
                           r1 * std::sin(theta1) + r2 * std::sin(theta2));
}

LoopResult LoopSolverBlock::solve(const LoopInput& input, const LoopSolverSettings& settings) {
    validate_settings(settings);

    if (settings.method == SolverMethod::ITERATIVE) {
        return solve_iterative(input, settings.phi1_guess, settings.phi2_guess,
                               settings.tolerance, settings.max_iterations, settings.assembly);
    }
    return solve_closed_form(input, settings.branch);
}

LoopResult LoopSolverBlock::solve_closed_form(const LoopInput& input, int branch) {
    validate_input(input);
    if (branch != 1 && branch != -1) {
        throw ConfigurationError("Loop branch must be +1 or -1, got " + std::to_string(branch));
    }

    double calculation_time_ms = 0.0;
    double phi1 = 0.0;
    double phi2 = 0.0;
    double discriminant = 0.0;
    bool feasible = true;

    {
        ScopedTimer timer(calculation_time_ms);

        const Eigen::Vector2d rk = input.known_resultant();
        const double rk_sq = rk.squaredNorm();
        const double k = input.u1 * input.u1 - input.u2 * input.u2 - rk_sq;

        const double a = k + 2.0 * input.u2 * rk.x();
        const double b = -4.0 * input.u2 * rk.y();
        const double c = k - 2.0 * input.u2 * rk.x();
        discriminant = b * b - 4.0 * a * c;

        if (discriminant < 0.0) {
            feasible = false;
        } else {
            const double scale = input.u1 * input.u1 + input.u2 * input.u2 + rk_sq;

            if (std::abs(a) < QUADRATIC_DEGENERATE_TOLERANCE * scale) {
                // Quadratic collapses: one root is linear, the other sits at t -> infinity (phi2 = pi)
                const bool linear_root = std::abs(b) >= QUADRATIC_DEGENERATE_TOLERANCE * scale &&
                                         branch * (b > 0.0 ? 1 : -1) > 0;
                phi2 = linear_root ? 2.0 * std::atan(-c / b) : M_PI;
            } else {
                const double t = (-b + branch * std::sqrt(discriminant)) / (2.0 * a);
                phi2 = 2.0 * std::atan(t);
            }

            phi1 = std::atan2((-input.u2 * std::sin(phi2) - rk.y()) / input.u1,
                              (-input.u2 * std::cos(phi2) - rk.x()) / input.u1);
        }
    }

    if (!feasible) {
        std::ostringstream message;
        message << "Loop cannot close: discriminant " << discriminant << " < 0";
        return LoopResult(LoopStatus::INFEASIBLE, calculation_time_ms, message.str(), 0, discriminant);
    }

    const double residual = closure_residual(input, phi1, phi2).norm();
    return LoopResult(phi1, phi2, 0, residual, discriminant, calculation_time_ms);
}

LoopResult LoopSolverBlock::solve_iterative(const LoopInput& input, double phi1_guess, double phi2_guess,
                                            double tolerance, int max_iterations, int assembly) {
    validate_input(input);
    if (!(tolerance > 0.0) || max_iterations <= 0) {
        throw ConfigurationError("Iterative loop solver needs tolerance > 0 and max_iterations > 0");
    }
    if (!std::isfinite(phi1_guess) || !std::isfinite(phi2_guess)) {
        throw ConfigurationError("Iterative loop solver seed must be finite");
    }
    if (assembly < -1 || assembly > 1) {
        throw ConfigurationError("Assembly mode must be -1, 0 or +1, got " + std::to_string(assembly));
    }

    double calculation_time_ms = 0.0;
    const double absolute_tolerance = tolerance * loop_size(input);

    Eigen::Vector2d phi(phi1_guess, phi2_guess);
    Eigen::Vector2d residual = closure_residual(input, phi.x(), phi.y());
    int iterations = 0;
    bool feasible = true;
    bool mirrored = false;
    LoopStatus status = LoopStatus::SOLVED;
    std::string error;

    {
        ScopedTimer timer(calculation_time_ms);

        feasible = can_close(input, absolute_tolerance);
        if (feasible) {
            status = newton(input, phi, residual, absolute_tolerance, max_iterations, iterations, error);

            const int found = assembly_mode(phi.x(), phi.y());
            if (status == LoopStatus::SOLVED && assembly != 0 && found != 0 && found != assembly) {
                mirrored = true;
                phi = mirrored_solution(input, phi.x(), phi.y());
                residual = closure_residual(input, phi.x(), phi.y());
                int polish_iterations = 0;
                status = newton(input, phi, residual, absolute_tolerance, max_iterations,
                                polish_iterations, error);
                iterations += polish_iterations;

                const int polished = assembly_mode(phi.x(), phi.y());
                if (status == LoopStatus::SOLVED && polished != 0 && polished != assembly) {
                    status = LoopStatus::WRONG_ASSEMBLY;
                    error = "Root stays in assembly mode " + std::to_string(polished) +
                            " after reflection, expected " + std::to_string(assembly);
                }
            }
        }
    }

    if (!feasible) {
        return LoopResult(LoopStatus::INFEASIBLE, calculation_time_ms,
                          "Loop cannot close: known resultant violates the triangle inequality");
    }
    if (status != LoopStatus::SOLVED) {
        if (mirrored) {
            error += " (after reflecting onto the requested assembly mode)";
        }
        return LoopResult(status, calculation_time_ms, error, iterations);
    }

    return LoopResult(LinkGeometryBlock::wrap_angle(phi.x()), LinkGeometryBlock::wrap_angle(phi.y()),
                      iterations, residual.norm(), 0.0, calculation_time_ms);
}

int LoopSolverBlock::assembly_mode(double phi1, double phi2) {
    const double s = std::sin(phi2 - phi1);
    if (std::abs(s) < ASSEMBLY_FOLD_TOLERANCE) {
        return 0;
    }
    return s > 0.0 ? 1 : -1;
}

Eigen::Vector2d LoopSolverBlock::mirrored_solution(const LoopInput& input, double phi1, double phi2) {
    // u1*e1 + u2*e2 = -rk is preserved by reflection across the line of -rk
    const Eigen::Vector2d rk = input.known_resultant();
    const double axis = std::atan2(-rk.y(), -rk.x());
    return Eigen::Vector2d(LinkGeometryBlock::wrap_angle(2.0 * axis - phi1),
                           LinkGeometryBlock::wrap_angle(2.0 * axis - phi2));
}

LoopStatus LoopSolverBlock::newton(const LoopInput& input, Eigen::Vector2d& phi, Eigen::Vector2d& residual,
                                   double absolute_tolerance, int max_iterations, int& iterations,
                                   std::string& error) {
    while (true) {
        if (residual.norm() < absolute_tolerance) {
            return LoopStatus::SOLVED;
        }
        if (iterations >= max_iterations) {
            std::ostringstream message;
            message << "No convergence within " << max_iterations << " iterations (residual "
                    << residual.norm() << ")";
            error = message.str();
            return LoopStatus::NOT_CONVERGED;
        }

        const Eigen::Matrix2d J = jacobian(input, phi.x(), phi.y());
        if (std::abs(J.determinant()) < LOOP_SOLVER_SINGULAR_DETERMINANT * input.u1 * input.u2) {
            error = "Singular Jacobian after " + std::to_string(iterations) + " iterations";
            return LoopStatus::NOT_CONVERGED;
        }

        const Eigen::Vector2d step = -J.inverse() * residual;

        // Backtracking: halve the step until the residual decreases
        double alpha = 1.0;
        Eigen::Vector2d candidate = phi + step;
        Eigen::Vector2d candidate_residual = closure_residual(input, candidate.x(), candidate.y());
        int halvings = 0;
        while (candidate_residual.norm() >= residual.norm() && halvings < LOOP_SOLVER_MAX_STEP_HALVINGS) {
            alpha *= 0.5;
            candidate = phi + alpha * step;
            candidate_residual = closure_residual(input, candidate.x(), candidate.y());
            ++halvings;
        }

        phi = candidate;
        residual = candidate_residual;
        ++iterations;
    }
}

Eigen::Vector2d LoopSolverBlock::closure_residual(const LoopInput& input, double phi1, double phi2) {
    return input.known_resultant() +
           Eigen::Vector2d(input.u1 * std::cos(phi1) + input.u2 * std::cos(phi2),
                           input.u1 * std::sin(phi1) + input.u2 * std::sin(phi2));
}

bool LoopSolverBlock::can_close(const LoopInput& input, double slack) {
    const double rk = input.known_resultant().norm();
    return rk <= input.u1 + input.u2 + slack && rk >= std::abs(input.u1 - input.u2) - slack;
}

Eigen::Matrix2d LoopSolverBlock::jacobian(const LoopInput& input, double phi1, double phi2) {
    Eigen::Matrix2d J;
    J << -input.u1 * std::sin(phi1), -input.u2 * std::sin(phi2),
          input.u1 * std::cos(phi1),  input.u2 * std::cos(phi2);
    return J;
}

double LoopSolverBlock::loop_size(const LoopInput& input) {
    return input.r1 + input.r2 + input.u1 + input.u2;
}

void LoopSolverBlock::validate_input(const LoopInput& input) {
    const bool finite = std::isfinite(input.r1) && std::isfinite(input.theta1) &&
                        std::isfinite(input.r2) && std::isfinite(input.theta2) &&
                        std::isfinite(input.u1) && std::isfinite(input.u2);
    if (!finite) {
        throw ConfigurationError("Loop input contains non-finite values");
    }
    if (input.r1 < 0.0 || input.r2 < 0.0) {
        throw ConfigurationError("Known link lengths must be non-negative");
    }
    if (input.u1 < DEGENERATE_LINK_TOLERANCE || input.u2 < DEGENERATE_LINK_TOLERANCE) {
        throw ConfigurationError("Unknown link lengths must be positive");
    }
}

void LoopSolverBlock::validate_settings(const LoopSolverSettings& settings) {
    if (settings.method == SolverMethod::CLOSED_FORM && settings.branch != 1 && settings.branch != -1) {
        throw ConfigurationError("Loop branch must be +1 or -1");
    }
    if (settings.method == SolverMethod::ITERATIVE &&
        (!(settings.tolerance > 0.0) || settings.max_iterations <= 0)) {
        throw ConfigurationError("Iterative loop solver needs tolerance > 0 and max_iterations > 0");
    }
    if (settings.assembly < -1 || settings.assembly > 1) {
        throw ConfigurationError("Assembly mode must be -1, 0 or +1");
    }
}

} // namespace wishbone
