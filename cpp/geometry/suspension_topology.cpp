#include "suspension_topology.hpp"
#include "../blocks/link_geometry_block.hpp"
#include <algorithm>

namespace wishbone {

SuspensionTopology::SuspensionTopology(TopologyType type, LengthUnit unit, const PointMap& points)
    : type_(type), unit_(unit) {
    points_.fill(Eigen::Vector2d::Zero());
    present_.fill(false);

    for (const auto& [id, position] : points) {
        points_[index_of(id)] = position;
        present_[index_of(id)] = true;
    }

    validate();
}

void SuspensionTopology::validate() const {
    std::string missing;
    for (SuspensionPoint id : required_points(type_)) {
        if (!present_[index_of(id)]) {
            missing += (missing.empty() ? "" : ", ") + point_name(id);
        }
    }
    if (!missing.empty()) {
        throw ConfigurationError(type_name(type_) + " topology is missing required points: " + missing);
    }

    for (int i = 0; i < SUSPENSION_POINT_COUNT; ++i) {
        if (present_[i] && !points_[i].allFinite()) {
            throw ConfigurationError("Point " + point_name(static_cast<SuspensionPoint>(i)) +
                                     " has non-finite coordinates");
        }
    }
}

SuspensionTopology SuspensionTopology::from_mount_array(TopologyType type, LengthUnit unit,
                                                        const Eigen::Matrix3Xd& mounts) {
    const std::vector<MountPoint> columns = mount_columns(type);
    if (mounts.cols() != static_cast<Eigen::Index>(columns.size())) {
        throw ConfigurationError(type_name(type) + " mount array needs " + std::to_string(columns.size()) +
                                 " columns, got " + std::to_string(mounts.cols()));
    }

    auto column = [&](MountPoint id) -> Eigen::Vector3d {
        auto it = std::find(columns.begin(), columns.end(), id);
        return mounts.col(std::distance(columns.begin(), it));
    };
    auto planar = [&](MountPoint id) { return LinkGeometryBlock::project_to_plane(column(id)); };

    PointMap points;
    points[SuspensionPoint::UCA_IN] = LinkGeometryBlock::project_to_plane(
        LinkGeometryBlock::effective_pivot(column(MountPoint::UCA_FRONT_IN), column(MountPoint::UCA_REAR_IN)));
    points[SuspensionPoint::LCA_IN] = LinkGeometryBlock::project_to_plane(
        LinkGeometryBlock::effective_pivot(column(MountPoint::LCA_FRONT_IN), column(MountPoint::LCA_REAR_IN)));
    points[SuspensionPoint::UCA_OUT] = planar(MountPoint::UCA_OUT);
    points[SuspensionPoint::LCA_OUT] = planar(MountPoint::LCA_OUT);
    points[SuspensionPoint::SHOCK_IN] = planar(MountPoint::SHOCK_IN);
    points[SuspensionPoint::SHOCK_OUT] = planar(MountPoint::SHOCK_OUT);
    points[SuspensionPoint::WHEEL_CENTER] = planar(MountPoint::WHEEL_CENTER);

    if (type == TopologyType::PUSHROD) {
        points[SuspensionPoint::PUSHROD_IN] = planar(MountPoint::PUSHROD_IN);
        points[SuspensionPoint::PUSHROD_OUT] = planar(MountPoint::PUSHROD_OUT);
        points[SuspensionPoint::CAM_HINGE] = planar(MountPoint::CAM_HINGE);
    }

    return SuspensionTopology(type, unit, points);
}

bool SuspensionTopology::has_point(SuspensionPoint id) const {
    return present_[index_of(id)];
}

const Eigen::Vector2d& SuspensionTopology::point(SuspensionPoint id) const {
    if (!present_[index_of(id)]) {
        throw ConfigurationError("Point " + point_name(id) + " is not part of the " +
                                 type_name(type_) + " topology");
    }
    return points_[index_of(id)];
}

SuspensionTopology::PointMap SuspensionTopology::points() const {
    PointMap out;
    for (int i = 0; i < SUSPENSION_POINT_COUNT; ++i) {
        if (present_[i]) {
            out[static_cast<SuspensionPoint>(i)] = points_[i];
        }
    }
    return out;
}

SuspensionTopology SuspensionTopology::with_point(SuspensionPoint id, const Eigen::Vector2d& position) const {
    PointMap edited = points();
    edited[id] = position;
    return SuspensionTopology(type_, unit_, edited);
}

SuspensionTopology SuspensionTopology::converted_to(LengthUnit unit) const {
    const double scale = unit_scale(unit_, unit);
    PointMap converted = points();
    for (auto& entry : converted) {
        entry.second *= scale;
    }
    return SuspensionTopology(type_, unit, converted);
}

// =============================================================================
// VARIANT TABLES
// =============================================================================

std::vector<SuspensionPoint> SuspensionTopology::required_points(TopologyType type) {
    std::vector<SuspensionPoint> required = {
        SuspensionPoint::UCA_IN, SuspensionPoint::LCA_IN,
        SuspensionPoint::UCA_OUT, SuspensionPoint::LCA_OUT,
        SuspensionPoint::SHOCK_IN, SuspensionPoint::SHOCK_OUT,
        SuspensionPoint::WHEEL_CENTER
    };
    if (type == TopologyType::PUSHROD) {
        required.push_back(SuspensionPoint::PUSHROD_IN);
        required.push_back(SuspensionPoint::PUSHROD_OUT);
        required.push_back(SuspensionPoint::CAM_HINGE);
    }
    return required;
}

std::vector<PlanarLink> SuspensionTopology::kinematic_links(TopologyType type) {
    std::vector<PlanarLink> links = {
        {SuspensionPoint::UCA_IN, SuspensionPoint::UCA_OUT},
        {SuspensionPoint::LCA_OUT, SuspensionPoint::LCA_IN},
        {SuspensionPoint::UCA_OUT, SuspensionPoint::LCA_OUT},
        {SuspensionPoint::LCA_IN, SuspensionPoint::UCA_IN},
        {SuspensionPoint::LCA_OUT, SuspensionPoint::WHEEL_CENTER},
        {SuspensionPoint::SHOCK_IN, SuspensionPoint::SHOCK_OUT}
    };

    if (type == TopologyType::BASIC) {
        links.push_back({SuspensionPoint::SHOCK_OUT, SuspensionPoint::LCA_IN});
        links.push_back({SuspensionPoint::LCA_IN, SuspensionPoint::SHOCK_IN});
    } else {
        links.push_back({SuspensionPoint::SHOCK_OUT, SuspensionPoint::CAM_HINGE});
        links.push_back({SuspensionPoint::CAM_HINGE, SuspensionPoint::LCA_IN});
        links.push_back({SuspensionPoint::LCA_IN, SuspensionPoint::SHOCK_IN});
        links.push_back({SuspensionPoint::CAM_HINGE, SuspensionPoint::PUSHROD_IN});
        links.push_back({SuspensionPoint::PUSHROD_IN, SuspensionPoint::PUSHROD_OUT});
        links.push_back({SuspensionPoint::PUSHROD_OUT, SuspensionPoint::LCA_IN});
    }
    return links;
}

std::vector<MountPoint> SuspensionTopology::mount_columns(TopologyType type) {
    if (type == TopologyType::BASIC) {
        // Shock top sits in the pushrod-inboard column, shock bottom in the pushrod-outboard column
        return {
            MountPoint::UCA_FRONT_IN, MountPoint::UCA_REAR_IN,
            MountPoint::LCA_FRONT_IN, MountPoint::LCA_REAR_IN,
            MountPoint::SHOCK_IN, MountPoint::UCA_OUT, MountPoint::LCA_OUT,
            MountPoint::SHOCK_OUT, MountPoint::WHEEL_CENTER
        };
    }
    return {
        MountPoint::UCA_FRONT_IN, MountPoint::UCA_REAR_IN,
        MountPoint::LCA_FRONT_IN, MountPoint::LCA_REAR_IN,
        MountPoint::PUSHROD_IN, MountPoint::UCA_OUT, MountPoint::LCA_OUT,
        MountPoint::PUSHROD_OUT, MountPoint::CAM_HINGE,
        MountPoint::SHOCK_OUT, MountPoint::SHOCK_IN, MountPoint::WHEEL_CENTER
    };
}

std::vector<std::pair<int, int>> SuspensionTopology::mount_members(TopologyType type) {
    if (type == TopologyType::BASIC) {
        return {
            {0, 5},     // UCA_FrontIN -> UCA_OUT
            {1, 5},     // UCA_RearIN -> UCA_OUT
            {2, 6},     // LCA_FrontIN -> LCA_OUT
            {3, 6},     // LCA_RearIN -> LCA_OUT
            {4, 7}      // Shock top -> Shock bottom
        };
    }
    return {
        {0, 5},         // UCA_FrontIN -> UCA_OUT
        {1, 5},         // UCA_RearIN -> UCA_OUT
        {2, 6},         // LCA_FrontIN -> LCA_OUT
        {3, 6},         // LCA_RearIN -> LCA_OUT
        {4, 7},         // PushRodIN -> PushRodOUT
        {4, 8},         // PushRodIN -> Cam_Hinge
        {4, 9},         // PushRodIN -> Shock_OUT
        {9, 10},        // Shock_OUT -> Shock_IN
        {8, 9},         // Cam_Hinge -> Shock_OUT
        {5, 11},        // UCA_OUT -> Wheel_Center
        {6, 11}         // LCA_OUT -> Wheel_Center
    };
}

// =============================================================================
// NAMES AND UNITS
// =============================================================================

std::string SuspensionTopology::point_name(SuspensionPoint id) {
    switch (id) {
        case SuspensionPoint::UCA_IN: return "UCA_IN";
        case SuspensionPoint::LCA_IN: return "LCA_IN";
        case SuspensionPoint::UCA_OUT: return "UCA_OUT";
        case SuspensionPoint::LCA_OUT: return "LCA_OUT";
        case SuspensionPoint::PUSHROD_IN: return "PushRodIN";
        case SuspensionPoint::PUSHROD_OUT: return "PushRodOUT";
        case SuspensionPoint::CAM_HINGE: return "Cam_Hinge";
        case SuspensionPoint::SHOCK_OUT: return "Shock_OUT";
        case SuspensionPoint::SHOCK_IN: return "Shock_IN";
        case SuspensionPoint::WHEEL_CENTER: return "Wheel_Center";
    }
    return "unknown";
}

SuspensionPoint SuspensionTopology::point_from_name(const std::string& name) {
    for (int i = 0; i < SUSPENSION_POINT_COUNT; ++i) {
        const SuspensionPoint id = static_cast<SuspensionPoint>(i);
        if (point_name(id) == name) {
            return id;
        }
    }
    throw ConfigurationError("Unknown suspension point: " + name);
}

std::string SuspensionTopology::mount_name(MountPoint id) {
    switch (id) {
        case MountPoint::UCA_FRONT_IN: return "UCA_FrontIN";
        case MountPoint::UCA_REAR_IN: return "UCA_RearIN";
        case MountPoint::LCA_FRONT_IN: return "LCA_FrontIN";
        case MountPoint::LCA_REAR_IN: return "LCA_RearIN";
        case MountPoint::PUSHROD_IN: return "PushRodIN";
        case MountPoint::UCA_OUT: return "UCA_OUT";
        case MountPoint::LCA_OUT: return "LCA_OUT";
        case MountPoint::PUSHROD_OUT: return "PushRodOUT";
        case MountPoint::CAM_HINGE: return "Cam_Hinge";
        case MountPoint::SHOCK_OUT: return "Shock_OUT";
        case MountPoint::SHOCK_IN: return "Shock_IN";
        case MountPoint::WHEEL_CENTER: return "Wheel_Center";
    }
    return "unknown";
}

std::string SuspensionTopology::unit_symbol(LengthUnit unit) {
    return unit == LengthUnit::INCH ? "in" : "mm";
}

std::string SuspensionTopology::type_name(TopologyType type) {
    return type == TopologyType::BASIC ? "Basic" : "Pushrod";
}

double SuspensionTopology::unit_scale(LengthUnit from, LengthUnit to) {
    if (from == to) return 1.0;
    return (from == LengthUnit::INCH) ? MILLIMETERS_PER_INCH : 1.0 / MILLIMETERS_PER_INCH;
}

} // namespace wishbone
