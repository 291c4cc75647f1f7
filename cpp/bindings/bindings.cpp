#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include "../blocks/link_geometry_block.hpp"
#include "../blocks/reference_geometry_block.hpp"
#include "../blocks/kinematic_chain_block.hpp"
#include "../blocks/travel_sweep_block.hpp"
#include "../geometry/suspension_topology.hpp"
#include "../utils/geometry_loader.hpp"

namespace py = pybind11;

namespace {

wishbone::TopologyType topology_from_string(const std::string& name) {
    if (name == "basic") return wishbone::TopologyType::BASIC;
    if (name == "pushrod") return wishbone::TopologyType::PUSHROD;
    throw wishbone::ConfigurationError("Unknown topology '" + name + "' (expected 'basic' or 'pushrod')");
}

wishbone::LengthUnit unit_from_string(const std::string& name) {
    if (name == "in") return wishbone::LengthUnit::INCH;
    if (name == "mm") return wishbone::LengthUnit::MILLIMETER;
    throw wishbone::ConfigurationError("Unknown length unit '" + name + "' (expected 'in' or 'mm')");
}

wishbone::KinematicsSettings kinematics_settings(bool iterative) {
    wishbone::KinematicsSettings settings;
    settings.method = iterative ? wishbone::SolverMethod::ITERATIVE : wishbone::SolverMethod::CLOSED_FORM;
    return settings;
}

py::dict joints_to_dict(const wishbone::SuspensionTopology::PointMap& joints) {
    py::dict out;
    for (const auto& [id, position] : joints) {
        out[py::str(wishbone::SuspensionTopology::point_name(id))] = position;
    }
    return out;
}

py::tuple pose_result_to_tuple(const wishbone::PoseResult& result) {
    const wishbone::Pose& pose = result.pose;
    py::object rocker = pose.rocker_angle.has_value() ? py::cast(pose.rocker_angle.value()) : py::none();
    py::object pushrod = pose.pushrod_angle.has_value() ? py::cast(pose.pushrod_angle.value()) : py::none();

    auto angles_tuple = py::make_tuple(pose.shock_angle, pose.lower_arm_angle, pose.upper_arm_angle,
                                       pose.upright_angle, rocker, pushrod);
    auto wheel_tuple = py::make_tuple(pose.wheel_center, pose.wheel_displacement,
                                      pose.wheel_lateral_displacement, pose.camber_change);

    return py::make_tuple(result.solving_successful, wishbone::to_string(result.failure),
                          wishbone::to_string(result.failed_stage), result.error_message,
                          pose.driving_input, pose.shock_length, angles_tuple, wheel_tuple,
                          joints_to_dict(pose.joints), result.calculation_time_ms);
}

} // namespace

PYBIND11_MODULE(wishbone_kinematics_cpp, m) {
    m.doc() = "Double-wishbone suspension kinematics - block-based planar loop solver";

    // ===== CONSTANTS =====
    m.attr("MILLIMETERS_PER_INCH") = wishbone::MILLIMETERS_PER_INCH;
    m.attr("DEGENERATE_LINK_TOLERANCE") = wishbone::DEGENERATE_LINK_TOLERANCE;
    m.attr("MAX_LINK_LENGTH_RATIO") = wishbone::MAX_LINK_LENGTH_RATIO;
    m.attr("LOOP_SOLVER_TOLERANCE") = wishbone::LOOP_SOLVER_TOLERANCE;
    m.attr("LOOP_SOLVER_MAX_ITERATIONS") = wishbone::LOOP_SOLVER_MAX_ITERATIONS;
    m.attr("MAX_ANGLE_JUMP_RAD") = wishbone::MAX_ANGLE_JUMP_RAD;

    // ===== ERRORS =====
    py::register_exception<wishbone::DegenerateLinkError>(m, "DegenerateLinkError", PyExc_ValueError);
    py::register_exception<wishbone::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);

    // ===== REFERENCE GEOMETRY =====
    py::class_<wishbone::ReferenceGeometry>(m, "ReferenceGeometry")
        .def_property_readonly("topology", [](const wishbone::ReferenceGeometry& r) {
            return r.is_pushrod() ? "pushrod" : "basic";
        })
        .def_property_readonly("unit", [](const wishbone::ReferenceGeometry& r) {
            return wishbone::SuspensionTopology::unit_symbol(r.topology.unit());
        })
        .def_property_readonly("reference_shock_length", &wishbone::ReferenceGeometry::reference_shock_length)
        .def_readonly("rocker_arm_offset", &wishbone::ReferenceGeometry::rocker_arm_offset)
        .def_readonly("rocker_included_angle", &wishbone::ReferenceGeometry::rocker_included_angle)
        .def_readonly("lower_arm_mount_offset", &wishbone::ReferenceGeometry::lower_arm_mount_offset)
        .def_readonly("wheel_center_offset", &wishbone::ReferenceGeometry::wheel_center_offset)
        .def_readonly("reference_wheel_center", &wishbone::ReferenceGeometry::reference_wheel_center)
        .def_readonly("calculation_time_ms", &wishbone::ReferenceGeometry::calculation_time_ms)
        .def_property_readonly("points", [](const wishbone::ReferenceGeometry& r) {
            return joints_to_dict(r.topology.points());
        })
        .def_property_readonly("branches", [](const wishbone::ReferenceGeometry& r) {
            std::vector<std::tuple<std::string, int, double, double>> out;
            for (const auto& loop : r.loops) {
                out.emplace_back(wishbone::to_string(loop.stage), loop.branch, loop.phi1, loop.phi2);
            }
            return out;
        })
        .def_property_readonly("link_lengths", [](const wishbone::ReferenceGeometry& r) {
            py::dict out;
            out["upper_arm"] = r.upper_arm.length;
            out["lower_arm"] = r.lower_arm.length;
            out["upright"] = r.upright.length;
            out["shock"] = r.shock.length;
            out["wheel_arm"] = r.wheel_arm.length;
            if (r.is_pushrod()) {
                out["pushrod"] = r.pushrod.length;
                out["rocker_shock_arm"] = r.rocker_shock_arm.length;
                out["rocker_pushrod_arm"] = r.rocker_pushrod_arm.length;
            }
            return out;
        });

    m.def("compute_reference_geometry", [](const std::string& topology, const Eigen::Matrix3Xd& mounts,
                                           const std::string& unit) {
        auto source = wishbone::SuspensionTopology::from_mount_array(
            topology_from_string(topology), unit_from_string(unit), mounts);
        return wishbone::ReferenceGeometryBlock::calculate(source);
    }, "Reference links, offsets and branches from a 3 x N mount array",
       py::arg("topology"), py::arg("mounts"), py::arg("unit") = "in");

    m.def("compute_reference_geometry_from_points", [](const std::string& topology,
                                                       const std::map<std::string, Eigen::Vector2d>& points,
                                                       const std::string& unit) {
        wishbone::SuspensionTopology::PointMap named;
        for (const auto& [name, position] : points) {
            named[wishbone::SuspensionTopology::point_from_name(name)] = position;
        }
        wishbone::SuspensionTopology source(topology_from_string(topology), unit_from_string(unit), named);
        return wishbone::ReferenceGeometryBlock::calculate(source);
    }, "Reference geometry from named planar (Y, Z) points",
       py::arg("topology"), py::arg("points"), py::arg("unit") = "in");

    m.def("recalculate_with_point", [](const wishbone::ReferenceGeometry& reference, const std::string& point,
                                       double y, double z) {
        return wishbone::ReferenceGeometryBlock::recalculate_with_point(
            reference, wishbone::SuspensionTopology::point_from_name(point), Eigen::Vector2d(y, z));
    }, "Edit one planar point and recompute the reference geometry",
       py::arg("reference"), py::arg("point"), py::arg("y"), py::arg("z"));

    m.def("convert_units", [](const wishbone::ReferenceGeometry& reference, const std::string& unit) {
        return wishbone::ReferenceGeometryBlock::calculate(reference.topology.converted_to(unit_from_string(unit)));
    }, "Same geometry in another length unit", py::arg("reference"), py::arg("unit"));

    // ===== KINEMATIC CHAIN BLOCK =====
    m.def("solve_pose", [](const wishbone::ReferenceGeometry& reference, double shock_compression, bool iterative) {
        auto result = wishbone::KinematicChainBlock::solve_pose(reference, shock_compression,
                                                                kinematics_settings(iterative));
        return pose_result_to_tuple(result);
    }, "Solve every loop for one shock compression",
       py::arg("reference"), py::arg("shock_compression"), py::arg("iterative") = false);

    m.def("solve_pose_at_wheel_travel", [](const wishbone::ReferenceGeometry& reference, double wheel_travel,
                                           bool iterative) {
        auto result = wishbone::KinematicChainBlock::solve_pose_at_wheel_travel(reference, wheel_travel,
                                                                                kinematics_settings(iterative));
        return pose_result_to_tuple(result);
    }, "Solve the pose reaching a wheel vertical displacement",
       py::arg("reference"), py::arg("wheel_travel"), py::arg("iterative") = false);

    // ===== TRAVEL SWEEP BLOCK =====
    m.def("sweep", [](const wishbone::ReferenceGeometry& reference, double min_value, double max_value,
                      double step, const std::string& drive, bool skip_failed_steps, bool seed_from_reference,
                      bool iterative, double max_angle_jump, bool verbose,
                      const std::function<bool()>& cancel_requested) {
        wishbone::SweepSettings settings;
        if (drive == "wheel") {
            settings.drive_mode = wishbone::DriveMode::WHEEL_TRAVEL;
        } else if (drive != "shock") {
            throw wishbone::ConfigurationError("Unknown drive '" + drive + "' (expected 'shock' or 'wheel')");
        }
        settings.infeasibility_policy = skip_failed_steps ? wishbone::InfeasibilityPolicy::SKIP_FAILED_STEPS
                                                          : wishbone::InfeasibilityPolicy::TRUNCATE;
        settings.seed_policy = seed_from_reference ? wishbone::SeedPolicy::REFERENCE
                                                   : wishbone::SeedPolicy::PREVIOUS_STEP;
        settings.kinematics = kinematics_settings(iterative);
        settings.max_angle_jump = max_angle_jump;
        settings.verbose = verbose;
        settings.cancel_requested = cancel_requested;

        auto run_sweep = [&]() {
            py::gil_scoped_release release;
            return wishbone::TravelSweepBlock::sweep(reference, min_value, max_value, step, settings);
        };
        const wishbone::SweepResult result = run_sweep();

        py::dict out;
        out["driving_input"] = result.driving_inputs;
        out["shock_travel"] = result.shock_travel;
        out["wheel_displacement"] = result.wheel_displacement;
        out["wheel_lateral_displacement"] = result.wheel_lateral_displacement;
        out["camber_change"] = result.camber_change;
        out["motion_ratio"] = result.motion_ratio;
        out["wheel_travel_mid"] = result.wheel_travel_mid;
        out["statistics"] = py::make_tuple(result.statistics.mean, result.statistics.min,
                                           result.statistics.max, result.statistics.valid_count);
        out["requested_range"] = py::make_tuple(result.requested_min, result.requested_max);
        out["actual_range"] = py::make_tuple(result.actual_min, result.actual_max);
        out["termination"] = py::make_tuple(wishbone::to_string(result.termination.kind),
                                            wishbone::to_string(result.termination.stage),
                                            result.termination.driving_input, result.termination.message);
        out["skipped_inputs"] = [&result]() {
            std::vector<double> values;
            for (const auto& skipped : result.skipped_steps) values.push_back(skipped.driving_input);
            return values;
        }();
        out["complete"] = result.sweep_complete;
        out["calculation_time_ms"] = result.calculation_time_ms;

        std::vector<Eigen::Vector2d> wheel_path;
        for (const auto& pose : result.poses) wheel_path.push_back(pose.wheel_center);
        out["wheel_center"] = wheel_path;
        return out;
    }, "Sweep shock compression or wheel travel and derive the motion ratio curve",
       py::arg("reference"), py::arg("min_value"), py::arg("max_value"), py::arg("step"),
       py::arg("drive") = "shock", py::arg("skip_failed_steps") = false,
       py::arg("seed_from_reference") = false, py::arg("iterative") = false,
       py::arg("max_angle_jump") = wishbone::MAX_ANGLE_JUMP_RAD, py::arg("verbose") = false,
       py::arg("cancel_requested") = std::function<bool()>());

    // ===== GEOMETRY LOADER =====
    m.def("sample_mount_array", [](const std::string& topology) {
        auto geometry = wishbone::GeometryLoader::sample_geometry(topology_from_string(topology));
        return std::make_tuple(geometry.mounts, wishbone::SuspensionTopology::unit_symbol(geometry.unit));
    }, "Built-in sample mount array (3 x N) and its unit", py::arg("topology"));

    m.def("mount_members", [](const std::string& topology) {
        return wishbone::SuspensionTopology::mount_members(topology_from_string(topology));
    }, "Column index pairs drawn as members", py::arg("topology"));

    m.def("load_geometry_hdf5", [](const std::string& filepath) -> py::object {
        auto geometry = wishbone::GeometryLoader::load_hdf5(filepath);
        if (!geometry.has_value()) {
            return py::none();
        }
        return py::make_tuple(geometry->type == wishbone::TopologyType::BASIC ? "basic" : "pushrod",
                              geometry->mounts, wishbone::SuspensionTopology::unit_symbol(geometry->unit));
    }, "Load (topology, mounts, unit) from HDF5, None on failure", py::arg("filepath"));

    m.def("save_geometry_hdf5", [](const std::string& filepath, const std::string& topology,
                                   const Eigen::Matrix3Xd& mounts, const std::string& unit) {
        wishbone::MountGeometry geometry(topology_from_string(topology), unit_from_string(unit), mounts);
        return wishbone::GeometryLoader::save_hdf5(geometry, filepath);
    }, "Save a mount array to HDF5",
       py::arg("filepath"), py::arg("topology"), py::arg("mounts"), py::arg("unit") = "in");
}
