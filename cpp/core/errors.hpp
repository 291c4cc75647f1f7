#ifndef WISHBONE_CORE_ERRORS_HPP
#define WISHBONE_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace wishbone {

// Thrown when two mount points of a link coincide (zero-length link)
class DegenerateLinkError : public std::invalid_argument {
public:
    explicit DegenerateLinkError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Thrown for invalid sweep ranges, missing points, bad settings or suspected unit mixing
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Outcome of a single loop solve
enum class LoopStatus {
    SOLVED,
    INFEASIBLE,        // No real solution: the linkage cannot reach this pose
    NOT_CONVERGED,     // Iterative solver hit its cap or a singular Jacobian
    WRONG_ASSEMBLY     // Iterative solver closed the loop in the mirrored assembly mode
};

// Why a pose solve or a sweep stopped
enum class FailureKind {
    NONE,
    INFEASIBLE,
    CONVERGENCE_FAILURE,
    BRANCH_DISCONTINUITY,
    CANCELLED
};

inline const char* to_string(LoopStatus status) {
    switch (status) {
        case LoopStatus::SOLVED: return "solved";
        case LoopStatus::INFEASIBLE: return "infeasible";
        case LoopStatus::NOT_CONVERGED: return "not converged";
        case LoopStatus::WRONG_ASSEMBLY: return "wrong assembly";
    }
    return "unknown";
}

inline const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE: return "none";
        case FailureKind::INFEASIBLE: return "infeasible";
        case FailureKind::CONVERGENCE_FAILURE: return "convergence failure";
        case FailureKind::BRANCH_DISCONTINUITY: return "branch discontinuity";
        case FailureKind::CANCELLED: return "cancelled";
    }
    return "unknown";
}

inline FailureKind failure_kind_from(LoopStatus status) {
    switch (status) {
        case LoopStatus::SOLVED: return FailureKind::NONE;
        case LoopStatus::INFEASIBLE: return FailureKind::INFEASIBLE;
        case LoopStatus::NOT_CONVERGED: return FailureKind::CONVERGENCE_FAILURE;
        case LoopStatus::WRONG_ASSEMBLY: return FailureKind::BRANCH_DISCONTINUITY;
    }
    return FailureKind::CONVERGENCE_FAILURE;
}

} // namespace wishbone

#endif // WISHBONE_CORE_ERRORS_HPP
