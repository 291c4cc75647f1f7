#ifndef WISHBONE_BLOCKS_LOOP_SOLVER_BLOCK_HPP
#define WISHBONE_BLOCKS_LOOP_SOLVER_BLOCK_HPP

#include <Eigen/Dense>
#include <string>
#include "../core/constants.hpp"
#include "../core/errors.hpp"
#include "../core/timing.hpp"

namespace wishbone {

enum class SolverMethod {
    CLOSED_FORM,    // Tangent half-angle quadratic, O(1)
    ITERATIVE       // Newton-Raphson on the closure residual
};

// One planar vector loop:
//   r1*e^(i*theta1) + r2*e^(i*theta2) + u1*e^(i*phi1) + u2*e^(i*phi2) = 0
// r1, theta1, r2, theta2, u1, u2 known; phi1, phi2 unknown. r2 may be zero.
struct LoopInput {
    double r1;
    double theta1;
    double r2;
    double theta2;
    double u1;
    double u2;

    LoopInput(double known1_length = 0.0, double known1_angle = 0.0,
              double known2_length = 0.0, double known2_angle = 0.0,
              double unknown1_length = 0.0, double unknown2_length = 0.0)
        : r1(known1_length), theta1(known1_angle), r2(known2_length), theta2(known2_angle)
        , u1(unknown1_length), u2(unknown2_length) {}

    // Sum of the two known vectors
    Eigen::Vector2d known_resultant() const;
};

struct LoopSolverSettings {
    SolverMethod method = SolverMethod::CLOSED_FORM;
    int branch = 1;                                   // Closed form: +1 or -1
    double phi1_guess = 0.0;                          // Iterative seed
    double phi2_guess = 0.0;
    int assembly = 0;                                 // Iterative: required assembly mode, 0 for either
    double tolerance = LOOP_SOLVER_TOLERANCE;         // Relative to loop size
    int max_iterations = LOOP_SOLVER_MAX_ITERATIONS;
};

struct LoopResult {
    double phi1;                     // Solved angle of the first unknown link
    double phi2;                     // Solved angle of the second unknown link
    LoopStatus status;
    int iterations_used;             // 0 for the closed form
    double residual;                 // Closure error magnitude at the solution
    double discriminant;             // Closed form only, 0 otherwise
    double calculation_time_ms;
    bool solving_successful;
    std::string error_message;

    LoopResult(double angle1, double angle2, int iterations, double closure_residual,
               double disc, double time_ms)
        : phi1(angle1), phi2(angle2), status(LoopStatus::SOLVED), iterations_used(iterations)
        , residual(closure_residual), discriminant(disc), calculation_time_ms(time_ms)
        , solving_successful(true) {}

    // Error constructor
    LoopResult(LoopStatus failure, double time_ms, const std::string& error,
               int iterations = 0, double disc = 0.0)
        : phi1(0.0), phi2(0.0), status(failure), iterations_used(iterations)
        , residual(0.0), discriminant(disc), calculation_time_ms(time_ms)
        , solving_successful(false), error_message(error) {}
};

class LoopSolverBlock {
public:
    // Main interface: dispatches on settings.method.
    // Throws ConfigurationError for non-physical lengths or bad settings.
    static LoopResult solve(const LoopInput& input, const LoopSolverSettings& settings = LoopSolverSettings());

    // Closed form through the tangent half-angle substitution t = tan(phi2 / 2).
    // Negative discriminant reports INFEASIBLE.
    static LoopResult solve_closed_form(const LoopInput& input, int branch);

    // Newton iteration from (phi1_guess, phi2_guess) with backtracking step halving.
    // With assembly set to +1 or -1, a root in the other mode is reflected onto the
    // requested one and polished; WRONG_ASSEMBLY if that still fails.
    static LoopResult solve_iterative(const LoopInput& input, double phi1_guess, double phi2_guess,
                                      double tolerance = LOOP_SOLVER_TOLERANCE,
                                      int max_iterations = LOOP_SOLVER_MAX_ITERATIONS,
                                      int assembly = 0);

    // Assembly mode of a solution: sign of sin(phi2 - phi1), 0 at the fold where both modes meet.
    // The two roots of a loop are mirror images across the known resultant and carry opposite signs.
    static int assembly_mode(double phi1, double phi2);

    // The other root: both unknown links reflected across the known resultant line
    static Eigen::Vector2d mirrored_solution(const LoopInput& input, double phi1, double phi2);

    // Closure error vector for a candidate pair of angles
    static Eigen::Vector2d closure_residual(const LoopInput& input, double phi1, double phi2);

    // Triangle inequality |u1 - u2| <= |r| <= u1 + u2 on the known resultant
    static bool can_close(const LoopInput& input, double slack = 0.0);

private:
    static void validate_input(const LoopInput& input);
    static void validate_settings(const LoopSolverSettings& settings);

    static Eigen::Matrix2d jacobian(const LoopInput& input, double phi1, double phi2);

    // Damped Newton on phi in place; returns SOLVED or NOT_CONVERGED
    static LoopStatus newton(const LoopInput& input, Eigen::Vector2d& phi, Eigen::Vector2d& residual,
                             double absolute_tolerance, int max_iterations, int& iterations,
                             std::string& error);

    // Loop scale used to make tolerances dimensionless
    static double loop_size(const LoopInput& input);
};

} // namespace wishbone

#endif // WISHBONE_BLOCKS_LOOP_SOLVER_BLOCK_HPP
