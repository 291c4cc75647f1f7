#ifndef WISHBONE_CORE_CONSTANTS_HPP
#define WISHBONE_CORE_CONSTANTS_HPP

#include <cmath>

namespace wishbone {

// Unit Conversion
constexpr double MILLIMETERS_PER_INCH = 25.4;

// Geometry Validation Constants
constexpr double DEGENERATE_LINK_TOLERANCE = 1e-9;      // Links shorter than this are rejected
constexpr double MAX_LINK_LENGTH_RATIO = 100.0;         // Longest/shortest link, mixed-unit heuristic
constexpr double BRANCH_MATCH_TOLERANCE = 1e-6;         // Reference angle reproduction (rad)

// Loop Solver Configuration Constants
constexpr double LOOP_SOLVER_TOLERANCE = 1e-10;         // Closure residual, relative to loop size
constexpr int LOOP_SOLVER_MAX_ITERATIONS = 100;         // Hard cap on Newton iterations
constexpr int LOOP_SOLVER_MAX_STEP_HALVINGS = 20;       // Backtracking limit per Newton step
constexpr double LOOP_SOLVER_SINGULAR_DETERMINANT = 1e-12;
constexpr double ASSEMBLY_FOLD_TOLERANCE = 1e-9;        // |sin(phi2 - phi1)| below this is a fold, either mode
constexpr double QUADRATIC_DEGENERATE_TOLERANCE = 1e-12; // |a| below this collapses to a linear root

// Wheel Travel Inversion Constants
constexpr double WHEEL_TRAVEL_TOLERANCE = 1e-9;         // Relative to reference upright length
constexpr int WHEEL_TRAVEL_MAX_ITERATIONS = 50;
constexpr int WHEEL_TRAVEL_MAX_PULLBACKS = 30;
constexpr double WHEEL_TRAVEL_PROBE_FRACTION = 1e-3;    // Probe compression as a fraction of shock length

// Sweep Configuration Constants
constexpr double SWEEP_ENDPOINT_TOLERANCE = 1e-9;       // Fraction of step for endpoint inclusion
constexpr double SINGULAR_MOTION_RATIO_TOLERANCE = 1e-12; // |delta wheel| below this yields NaN
constexpr double MAX_ANGLE_JUMP_RAD = M_PI / 2.0;       // Per-step angle change treated as a branch flip
constexpr int MAX_SWEEP_STEPS = 1000000;

} // namespace wishbone

#endif // WISHBONE_CORE_CONSTANTS_HPP
