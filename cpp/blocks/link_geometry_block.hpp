#ifndef WISHBONE_BLOCKS_LINK_GEOMETRY_BLOCK_HPP
#define WISHBONE_BLOCKS_LINK_GEOMETRY_BLOCK_HPP

#include <Eigen/Dense>
#include <string>
#include "../core/constants.hpp"
#include "../core/errors.hpp"

namespace wishbone {

// Planar link: length and angle from the Y axis, atan2(dz, dy), in (-pi, pi]
struct LinkGeometry {
    double length;
    double angle;

    LinkGeometry(double len = 0.0, double ang = 0.0) : length(len), angle(ang) {}

    // Vector from the link's first point to its second point
    Eigen::Vector2d vector() const {
        return Eigen::Vector2d(length * std::cos(angle), length * std::sin(angle));
    }
};

class LinkGeometryBlock {
public:
    // Main interface: length and angle of the link P1 -> P2.
    // Throws DegenerateLinkError when the points coincide.
    static LinkGeometry calculate(const Eigen::Vector2d& p1, const Eigen::Vector2d& p2,
                                  const std::string& link_name = "link");

    // Effective pivot of a dual-mount control arm: unweighted mean of the two bushings.
    // The planar model loses independent front/rear bushing behaviour.
    static Eigen::Vector2d effective_pivot(const Eigen::Vector2d& front, const Eigen::Vector2d& rear);
    static Eigen::Vector3d effective_pivot(const Eigen::Vector3d& front, const Eigen::Vector3d& rear);

    // Front-view projection: (X, Y, Z) -> (Y, Z)
    static Eigen::Vector2d project_to_plane(const Eigen::Vector3d& point);

    // Unsigned angle between two vectors via arccos of the normalized dot product
    static double included_angle(const Eigen::Vector2d& v1, const Eigen::Vector2d& v2);

    // Wrap an angle into (-pi, pi]
    static double wrap_angle(double angle);
};

} // namespace wishbone

#endif // WISHBONE_BLOCKS_LINK_GEOMETRY_BLOCK_HPP
