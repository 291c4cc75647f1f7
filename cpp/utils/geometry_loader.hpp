#pragma once

#include <optional>
#include <string>
#include <Eigen/Dense>
#include "../geometry/suspension_topology.hpp"

namespace wishbone {

// Raw 3 x N (X, Y, Z) mount array as stored on disk
struct MountGeometry {
    TopologyType type;
    LengthUnit unit;
    Eigen::Matrix3Xd mounts;

    MountGeometry(TopologyType topology_type = TopologyType::PUSHROD,
                  LengthUnit length_unit = LengthUnit::INCH,
                  const Eigen::Matrix3Xd& mount_array = Eigen::Matrix3Xd())
        : type(topology_type), unit(length_unit), mounts(mount_array) {}

    // Averages the chassis bushings and projects; throws ConfigurationError on bad data
    SuspensionTopology to_topology() const {
        return SuspensionTopology::from_mount_array(type, unit, mounts);
    }
};

/**
 * Geometry Loader Utility
 * Supplies suspension mount arrays: built-in samples, HDF5 files and plain text
 */
class GeometryLoader {
public:
    // =============================================================================
    // SAMPLE GEOMETRY
    // =============================================================================

    /**
     * Built-in sample mount array (inches)
     *
     * @param type Basic (9 columns) or pushrod (12 columns)
     * @return Sample geometry ready for to_topology()
     */
    static MountGeometry sample_geometry(TopologyType type);

    // =============================================================================
    // LOADING FUNCTIONS
    // =============================================================================

    /**
     * Load mount array from HDF5 file
     * Dataset /mounts (3 x N float64), root attributes topology and length_unit
     *
     * @param filepath Path to HDF5 file
     * @return Geometry, empty if failed
     */
    static std::optional<MountGeometry> load_hdf5(const std::string& filepath);

    /**
     * Load mount array from text file (one "X Y Z" line per column, # comments)
     *
     * @param filepath Path to text file
     * @param type Topology the columns are laid out for
     * @param unit Unit the coordinates are written in
     * @return Geometry, empty if failed
     */
    static std::optional<MountGeometry> load_text(const std::string& filepath,
                                                  TopologyType type, LengthUnit unit);

    /**
     * Save mount array to HDF5 file, overwriting any existing file
     *
     * @param geometry Geometry to save
     * @param filepath Output file path
     * @return true if save successful
     */
    static bool save_hdf5(const MountGeometry& geometry, const std::string& filepath);

    // =============================================================================
    // VALIDATION AND UTILITIES
    // =============================================================================

    /**
     * Validate column count for the topology and coordinate finiteness
     *
     * @param geometry Geometry to validate
     * @return true if validation passed
     */
    static bool validate_geometry(const MountGeometry& geometry);

    /**
     * Get mount statistics for debugging
     *
     * @param geometry Geometry
     * @return Statistics string
     */
    static std::string get_mount_statistics(const MountGeometry& geometry);

    static bool file_exists_and_readable(const std::string& filepath);
};

namespace GeometryLoaderConstants {
    constexpr int BASIC_MOUNT_COLUMNS = 9;
    constexpr int PUSHROD_MOUNT_COLUMNS = 12;
    constexpr const char* MOUNTS_DATASET = "/mounts";
    constexpr const char* TOPOLOGY_ATTRIBUTE = "topology";        // 0 basic, 1 pushrod
    constexpr const char* UNIT_ATTRIBUTE = "length_unit";         // 0 inch, 1 millimeter
}

} // namespace wishbone
