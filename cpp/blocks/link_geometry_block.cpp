#include "link_geometry_block.hpp"
#include <algorithm>
#include <cmath>

namespace wishbone {

LinkGeometry LinkGeometryBlock::calculate(const Eigen::Vector2d& p1, const Eigen::Vector2d& p2,
                                          const std::string& link_name) {
    if (!p1.allFinite() || !p2.allFinite()) {
        throw ConfigurationError("Link " + link_name + " has non-finite coordinates");
    }

    const double dy = p2.x() - p1.x();
    const double dz = p2.y() - p1.y();
    const double length = std::sqrt(dy * dy + dz * dz);

    if (length < DEGENERATE_LINK_TOLERANCE) {
        throw DegenerateLinkError("Link " + link_name + " is degenerate: mount points coincide");
    }

    return LinkGeometry(length, std::atan2(dz, dy));
}

Eigen::Vector2d LinkGeometryBlock::effective_pivot(const Eigen::Vector2d& front, const Eigen::Vector2d& rear) {
    return (front + rear) / 2.0;
}

Eigen::Vector3d LinkGeometryBlock::effective_pivot(const Eigen::Vector3d& front, const Eigen::Vector3d& rear) {
    return (front + rear) / 2.0;
}

Eigen::Vector2d LinkGeometryBlock::project_to_plane(const Eigen::Vector3d& point) {
    // X is longitudinal and dropped; Y lateral, Z vertical
    return Eigen::Vector2d(point.y(), point.z());
}

double LinkGeometryBlock::included_angle(const Eigen::Vector2d& v1, const Eigen::Vector2d& v2) {
    const double norms = v1.norm() * v2.norm();
    if (norms < DEGENERATE_LINK_TOLERANCE) {
        throw DegenerateLinkError("Included angle undefined for a zero-length arm");
    }
    return std::acos(std::max(-1.0, std::min(1.0, v1.dot(v2) / norms)));
}

double LinkGeometryBlock::wrap_angle(double angle) {
    double wrapped = std::atan2(std::sin(angle), std::cos(angle));
    // atan2 returns -pi for the negative branch cut; keep the (-pi, pi] convention
    if (wrapped <= -M_PI) {
        wrapped += 2.0 * M_PI;
    }
    return wrapped;
}

} // namespace wishbone
