#ifndef WISHBONE_GEOMETRY_SUSPENSION_TOPOLOGY_HPP
#define WISHBONE_GEOMETRY_SUSPENSION_TOPOLOGY_HPP

#include <Eigen/Dense>
#include <array>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "../core/constants.hpp"
#include "../core/errors.hpp"

namespace wishbone {

enum class TopologyType {
    BASIC,      // Shock directly between chassis and lower arm
    PUSHROD     // Pushrod -> bell-crank -> shock
};

enum class LengthUnit {
    INCH,
    MILLIMETER
};

// Planar (Y, Z) named points after bushing averaging and projection
enum class SuspensionPoint {
    UCA_IN = 0,
    LCA_IN,
    UCA_OUT,
    LCA_OUT,
    PUSHROD_IN,
    PUSHROD_OUT,
    CAM_HINGE,
    SHOCK_OUT,
    SHOCK_IN,
    WHEEL_CENTER
};

constexpr int SUSPENSION_POINT_COUNT = 10;

// Columns of a 3 x N (X, Y, Z) mount array
enum class MountPoint {
    UCA_FRONT_IN = 0,
    UCA_REAR_IN,
    LCA_FRONT_IN,
    LCA_REAR_IN,
    PUSHROD_IN,
    UCA_OUT,
    LCA_OUT,
    PUSHROD_OUT,
    CAM_HINGE,
    SHOCK_OUT,
    SHOCK_IN,
    WHEEL_CENTER
};

struct PlanarLink {
    SuspensionPoint from;
    SuspensionPoint to;
};

class SuspensionTopology {
public:
    using PointMap = std::map<SuspensionPoint, Eigen::Vector2d>;

    // Validates that every point required by the variant is present and finite
    SuspensionTopology(TopologyType type, LengthUnit unit, const PointMap& points);

    // Build from a 3 x N mount array laid out as mount_columns(type).
    // Dual chassis bushings are averaged into one pivot, then X is dropped.
    static SuspensionTopology from_mount_array(TopologyType type, LengthUnit unit,
                                               const Eigen::Matrix3Xd& mounts);

    TopologyType type() const { return type_; }
    LengthUnit unit() const { return unit_; }

    bool has_point(SuspensionPoint id) const;
    const Eigen::Vector2d& point(SuspensionPoint id) const;
    PointMap points() const;

    // Coordinate edit: returns a new topology, the original is left untouched
    SuspensionTopology with_point(SuspensionPoint id, const Eigen::Vector2d& position) const;

    // Same geometry expressed in another unit
    SuspensionTopology converted_to(LengthUnit unit) const;

    // Static description of each variant
    static std::vector<SuspensionPoint> required_points(TopologyType type);
    static std::vector<PlanarLink> kinematic_links(TopologyType type);
    static std::vector<MountPoint> mount_columns(TopologyType type);
    static std::vector<std::pair<int, int>> mount_members(TopologyType type);

    static std::string point_name(SuspensionPoint id);
    static SuspensionPoint point_from_name(const std::string& name);   // Throws ConfigurationError
    static std::string mount_name(MountPoint id);
    static std::string unit_symbol(LengthUnit unit);
    static std::string type_name(TopologyType type);
    static double unit_scale(LengthUnit from, LengthUnit to);

private:
    TopologyType type_;
    LengthUnit unit_;
    std::array<Eigen::Vector2d, SUSPENSION_POINT_COUNT> points_;
    std::array<bool, SUSPENSION_POINT_COUNT> present_;

    void validate() const;
    static int index_of(SuspensionPoint id) { return static_cast<int>(id); }
};

} // namespace wishbone

#endif // WISHBONE_GEOMETRY_SUSPENSION_TOPOLOGY_HPP
