#include "geometry_loader.hpp"
#include <hdf5.h>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>
#include <sys/stat.h>

namespace wishbone {

namespace {

// Sample car, inches. Rows X, Y, Z; columns per SuspensionTopology::mount_columns.
const double BASIC_SAMPLE[3][GeometryLoaderConstants::BASIC_MOUNT_COLUMNS] = {
    {22.0, 28.75, 20.5, 28.75, 25.01, 25.125, 25.095, 25.01, 25.0},
    {9.812, 9.12, 10.0, 9.31, 12.625, 19.0, 20.625, 15.8125, 24.0},
    {8.875, 9.125, 4.0, 4.0, 14.75, 11.875, 5.125, 5.75, 8.5}
};

const double PUSHROD_SAMPLE[3][GeometryLoaderConstants::PUSHROD_MOUNT_COLUMNS] = {
    {22.0, 28.75, 20.5, 28.75, 25.01, 25.125, 25.095, 25.0, 25.0, 25.0, 25.0, 25.0},
    {9.812, 9.12, 10.0, 9.31, 12.625, 19.0, 20.625, 15.8125, 11.0, 9.5, 5.0, 24.0},
    {8.875, 9.125, 4.0, 4.0, 14.75, 11.875, 5.125, 5.75, 13.0, 15.0, 12.0, 8.5}
};

int expected_columns(TopologyType type) {
    return type == TopologyType::BASIC ? GeometryLoaderConstants::BASIC_MOUNT_COLUMNS
                                       : GeometryLoaderConstants::PUSHROD_MOUNT_COLUMNS;
}

} // namespace

// =============================================================================
// SAMPLE GEOMETRY
// =============================================================================

MountGeometry GeometryLoader::sample_geometry(TopologyType type) {
    const int columns = expected_columns(type);
    Eigen::Matrix3Xd mounts(3, columns);

    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < columns; ++col) {
            mounts(row, col) = (type == TopologyType::BASIC) ? BASIC_SAMPLE[row][col] : PUSHROD_SAMPLE[row][col];
        }
    }
    return MountGeometry(type, LengthUnit::INCH, mounts);
}

// =============================================================================
// LOADING FUNCTIONS
// =============================================================================

std::optional<MountGeometry> GeometryLoader::load_hdf5(const std::string& filepath) {
    std::cout << "🔄 Loading mount geometry from HDF5 file: " << filepath << std::endl;

    if (!file_exists_and_readable(filepath)) {
        std::cerr << "❌ HDF5 file not found: " << filepath << std::endl;
        return std::nullopt;
    }

    hid_t file_id = H5Fopen(filepath.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    if (file_id < 0) {
        std::cerr << "❌ Failed to open HDF5 file: " << filepath << std::endl;
        return std::nullopt;
    }

    auto read_int_attr = [file_id](const char* name, int& value) -> bool {
        hid_t attr_id = H5Aopen(file_id, name, H5P_DEFAULT);
        if (attr_id < 0) return false;
        herr_t status = H5Aread(attr_id, H5T_NATIVE_INT, &value);
        H5Aclose(attr_id);
        return status >= 0;
    };

    int topology_code = -1;
    int unit_code = -1;
    if (!read_int_attr(GeometryLoaderConstants::TOPOLOGY_ATTRIBUTE, topology_code) ||
        !read_int_attr(GeometryLoaderConstants::UNIT_ATTRIBUTE, unit_code)) {
        std::cerr << "❌ Failed to read required attributes from HDF5 file" << std::endl;
        H5Fclose(file_id);
        return std::nullopt;
    }

    if ((topology_code != 0 && topology_code != 1) || (unit_code != 0 && unit_code != 1)) {
        std::cerr << "❌ Unknown topology (" << topology_code << ") or length unit ("
                  << unit_code << ") code" << std::endl;
        H5Fclose(file_id);
        return std::nullopt;
    }

    hid_t dataset_id = H5Dopen2(file_id, GeometryLoaderConstants::MOUNTS_DATASET, H5P_DEFAULT);
    if (dataset_id < 0) {
        std::cerr << "❌ Failed to open mounts dataset" << std::endl;
        H5Fclose(file_id);
        return std::nullopt;
    }

    hid_t space_id = H5Dget_space(dataset_id);
    const int rank = H5Sget_simple_extent_ndims(space_id);
    hsize_t dims[2] = {0, 0};
    if (rank == 2) {
        H5Sget_simple_extent_dims(space_id, dims, NULL);
    }
    H5Sclose(space_id);

    if (rank != 2 || dims[0] != 3) {
        std::cerr << "❌ Mounts dataset must be 3 x N, got rank " << rank << std::endl;
        H5Dclose(dataset_id);
        H5Fclose(file_id);
        return std::nullopt;
    }

    // Row-major on disk: X row, Y row, Z row
    std::vector<double> flat(dims[0] * dims[1]);
    herr_t status = H5Dread(dataset_id, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL,
                            H5P_DEFAULT, flat.data());
    H5Dclose(dataset_id);
    H5Fclose(file_id);

    if (status < 0) {
        std::cerr << "❌ Failed to read mounts dataset" << std::endl;
        return std::nullopt;
    }

    const Eigen::Index columns = static_cast<Eigen::Index>(dims[1]);
    const Eigen::Matrix3Xd mounts = Eigen::Map<const Eigen::Matrix<double, 3, Eigen::Dynamic, Eigen::RowMajor>>(
        flat.data(), 3, columns);
    MountGeometry geometry(topology_code == 0 ? TopologyType::BASIC : TopologyType::PUSHROD,
                           unit_code == 0 ? LengthUnit::INCH : LengthUnit::MILLIMETER,
                           mounts);

    if (!validate_geometry(geometry)) {
        return std::nullopt;
    }

    std::cout << "✅ Loaded " << SuspensionTopology::type_name(geometry.type) << " geometry with "
              << geometry.mounts.cols() << " mounts ("
              << SuspensionTopology::unit_symbol(geometry.unit) << ")" << std::endl;
    return geometry;
}

std::optional<MountGeometry> GeometryLoader::load_text(const std::string& filepath,
                                                       TopologyType type, LengthUnit unit) {
    std::cout << "🔄 Loading mount geometry from text file: " << filepath << std::endl;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "❌ Could not open text file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::vector<Eigen::Vector3d> points;
    std::string line;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        line_number++;

        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::istringstream iss(line);
        double x, y, z;
        if (!(iss >> x >> y >> z)) {
            std::cerr << "❌ Could not parse line " << line_number << ": " << line << std::endl;
            return std::nullopt;
        }
        points.emplace_back(x, y, z);
    }

    MountGeometry geometry(type, unit, Eigen::Matrix3Xd(3, static_cast<Eigen::Index>(points.size())));
    for (size_t i = 0; i < points.size(); ++i) {
        geometry.mounts.col(static_cast<Eigen::Index>(i)) = points[i];
    }

    if (!validate_geometry(geometry)) {
        return std::nullopt;
    }

    std::cout << "✅ Loaded " << points.size() << " mounts from text file" << std::endl;
    return geometry;
}

bool GeometryLoader::save_hdf5(const MountGeometry& geometry, const std::string& filepath) {
    std::cout << "🔄 Saving mount geometry to HDF5 file: " << filepath << std::endl;

    if (!validate_geometry(geometry)) {
        return false;
    }

    hid_t file_id = H5Fcreate(filepath.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (file_id < 0) {
        std::cerr << "❌ Failed to create HDF5 file: " << filepath << std::endl;
        return false;
    }

    auto write_int_attr = [file_id](const char* name, int value) -> bool {
        hid_t scalar_id = H5Screate(H5S_SCALAR);
        hid_t attr_id = H5Acreate2(file_id, name, H5T_STD_I32LE, scalar_id, H5P_DEFAULT, H5P_DEFAULT);
        herr_t status = -1;
        if (attr_id >= 0) {
            status = H5Awrite(attr_id, H5T_NATIVE_INT, &value);
            H5Aclose(attr_id);
        }
        H5Sclose(scalar_id);
        return status >= 0;
    };

    const int topology_code = geometry.type == TopologyType::BASIC ? 0 : 1;
    const int unit_code = geometry.unit == LengthUnit::INCH ? 0 : 1;
    if (!write_int_attr(GeometryLoaderConstants::TOPOLOGY_ATTRIBUTE, topology_code) ||
        !write_int_attr(GeometryLoaderConstants::UNIT_ATTRIBUTE, unit_code)) {
        std::cerr << "❌ Failed to write geometry attributes" << std::endl;
        H5Fclose(file_id);
        return false;
    }

    const Eigen::Matrix<double, 3, Eigen::Dynamic, Eigen::RowMajor> row_major = geometry.mounts;
    hsize_t dims[2] = {3, static_cast<hsize_t>(geometry.mounts.cols())};

    hid_t space_id = H5Screate_simple(2, dims, NULL);
    hid_t dataset_id = H5Dcreate2(file_id, GeometryLoaderConstants::MOUNTS_DATASET, H5T_IEEE_F64LE,
                                  space_id, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    herr_t status = -1;
    if (dataset_id >= 0) {
        status = H5Dwrite(dataset_id, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, row_major.data());
        H5Dclose(dataset_id);
    }
    H5Sclose(space_id);
    H5Fclose(file_id);

    if (status < 0) {
        std::cerr << "❌ Failed to write mounts dataset" << std::endl;
        return false;
    }

    std::cout << "✅ Saved " << geometry.mounts.cols() << " mounts to " << filepath << std::endl;
    return true;
}

// =============================================================================
// VALIDATION AND UTILITIES
// =============================================================================

bool GeometryLoader::validate_geometry(const MountGeometry& geometry) {
    const int columns = expected_columns(geometry.type);
    if (geometry.mounts.cols() != columns) {
        std::cerr << "❌ " << SuspensionTopology::type_name(geometry.type) << " geometry needs "
                  << columns << " mounts, got " << geometry.mounts.cols() << std::endl;
        return false;
    }

    const std::vector<MountPoint> layout = SuspensionTopology::mount_columns(geometry.type);
    size_t invalid_count = 0;
    for (Eigen::Index i = 0; i < geometry.mounts.cols(); ++i) {
        if (!geometry.mounts.col(i).allFinite()) {
            invalid_count++;
            std::cerr << "⚠️  Invalid mount " << SuspensionTopology::mount_name(layout[i]) << ": ("
                      << geometry.mounts(0, i) << ", " << geometry.mounts(1, i) << ", "
                      << geometry.mounts(2, i) << ")" << std::endl;
        }
    }

    if (invalid_count > 0) {
        std::cerr << "❌ Geometry validation failed: " << invalid_count << " invalid mounts" << std::endl;
        return false;
    }
    return true;
}

std::string GeometryLoader::get_mount_statistics(const MountGeometry& geometry) {
    if (geometry.mounts.cols() == 0) {
        return "No mounts";
    }

    const Eigen::Vector3d min_bounds = geometry.mounts.rowwise().minCoeff();
    const Eigen::Vector3d max_bounds = geometry.mounts.rowwise().maxCoeff();
    const Eigen::Vector3d size = max_bounds - min_bounds;

    std::ostringstream stats;
    stats << std::fixed << std::setprecision(3);
    stats << "Mount Statistics (" << SuspensionTopology::type_name(geometry.type) << ", "
          << SuspensionTopology::unit_symbol(geometry.unit) << "):\n";
    stats << "  Count: " << geometry.mounts.cols() << "\n";
    stats << "  Bounds: X[" << min_bounds.x() << ", " << max_bounds.x() << "] ";
    stats << "Y[" << min_bounds.y() << ", " << max_bounds.y() << "] ";
    stats << "Z[" << min_bounds.z() << ", " << max_bounds.z() << "]\n";
    stats << "  Size: (" << size.x() << ", " << size.y() << ", " << size.z() << ")";

    return stats.str();
}

bool GeometryLoader::file_exists_and_readable(const std::string& filepath) {
    struct stat buffer;
    return (stat(filepath.c_str(), &buffer) == 0);
}

} // namespace wishbone
