#include <iostream>
#include <cmath>
#include <cstdio>
#include <fstream>
#include "blocks/reference_geometry_block.hpp"
#include "blocks/travel_sweep_block.hpp"
#include "utils/geometry_loader.hpp"
#include "test_support.hpp"

using namespace wishbone;

int main() {
    std::cout << "🧪 Geometry loader test..." << std::endl;
    test::TestReport report;

    std::cout << "  Testing samples..." << std::endl;
    MountGeometry basic = GeometryLoader::sample_geometry(TopologyType::BASIC);
    MountGeometry pushrod = GeometryLoader::sample_geometry(TopologyType::PUSHROD);
    report.check(basic.mounts.cols() == GeometryLoaderConstants::BASIC_MOUNT_COLUMNS, "Basic sample has 9 mounts");
    report.check(pushrod.mounts.cols() == GeometryLoaderConstants::PUSHROD_MOUNT_COLUMNS,
                 "Pushrod sample has 12 mounts");
    report.check(GeometryLoader::validate_geometry(basic) && GeometryLoader::validate_geometry(pushrod),
                 "Samples validate");
    std::cout << GeometryLoader::get_mount_statistics(pushrod) << std::endl;

    MountGeometry wrong_shape(TopologyType::PUSHROD, LengthUnit::INCH, basic.mounts);
    report.check(!GeometryLoader::validate_geometry(wrong_shape), "Column count checked against topology");

    MountGeometry with_nan = pushrod;
    with_nan.mounts(1, 3) = NAN;
    report.check(!GeometryLoader::validate_geometry(with_nan), "Non-finite mount rejected");

    std::cout << "  Testing HDF5 round trip..." << std::endl;
    const std::string h5_path = "/tmp/wishbone_geometry_loader_test.h5";
    MountGeometry metric(TopologyType::BASIC, LengthUnit::MILLIMETER, basic.mounts * MILLIMETERS_PER_INCH);
    report.check(GeometryLoader::save_hdf5(metric, h5_path), "Saved to HDF5");

    auto loaded = GeometryLoader::load_hdf5(h5_path);
    report.check(loaded.has_value(), "Loaded from HDF5");
    if (loaded) {
        report.check(loaded->type == TopologyType::BASIC, "Topology attribute restored");
        report.check(loaded->unit == LengthUnit::MILLIMETER, "Unit attribute restored");
        report.check(loaded->mounts.isApprox(metric.mounts, 1e-15), "Mount coordinates restored");
        report.check(loaded->mounts(0, 1) == metric.mounts(0, 1) && loaded->mounts(2, 4) == metric.mounts(2, 4),
                     "Row/column layout preserved");
    }
    std::remove(h5_path.c_str());

    report.check(!GeometryLoader::load_hdf5("/tmp/wishbone_no_such_file.h5").has_value(),
                 "Missing HDF5 file gives no geometry");
    report.check(!GeometryLoader::save_hdf5(wrong_shape, h5_path), "Invalid geometry is not saved");

    std::cout << "  Testing text loading..." << std::endl;
    const std::string text_path = "/tmp/wishbone_geometry_loader_test.txt";
    {
        std::ofstream out(text_path);
        out << "# X Y Z per mount\n";
        for (Eigen::Index i = 0; i < pushrod.mounts.cols(); ++i) {
            out << pushrod.mounts(0, i) << " " << pushrod.mounts(1, i) << " " << pushrod.mounts(2, i) << "\n";
        }
    }
    auto text = GeometryLoader::load_text(text_path, TopologyType::PUSHROD, LengthUnit::INCH);
    report.check(text.has_value() && text->mounts.isApprox(pushrod.mounts, 1e-12), "Text mounts parsed");

    {
        std::ofstream out(text_path);
        out << "1.0 2.0\n";
    }
    report.check(!GeometryLoader::load_text(text_path, TopologyType::PUSHROD, LengthUnit::INCH).has_value(),
                 "Short line rejected");
    std::remove(text_path.c_str());

    std::cout << "  Testing loaded pushrod geometry..." << std::endl;
    ReferenceGeometry reference = ReferenceGeometryBlock::calculate(pushrod.to_topology());
    report.check_near(reference.reference_shock_length(), 5.408326913195984, 1e-9, "Pushrod sample shock length");
    report.check(reference.loop(LoopStage::SHOCK_ROCKER).branch == -1 &&
                 reference.loop(LoopStage::PUSHROD_ROCKER).branch == 1 &&
                 reference.loop(LoopStage::CONTROL_ARM_UPRIGHT).branch == 1, "Pushrod sample branches");

    SweepResult sweep = TravelSweepBlock::sweep(reference, -1.0, 1.0, 0.1);
    report.check(sweep.sweep_complete && sweep.size() == 21, "Pushrod sample sweep complete");
    report.check_near(sweep.statistics.mean, 0.6284300844059825, 1e-6, "Pushrod sample mean motion ratio");
    report.check_near(sweep.statistics.min, 0.5294383479590445, 1e-6, "Pushrod sample min motion ratio");
    report.check_near(sweep.statistics.max, 0.7236180127039606, 1e-6, "Pushrod sample max motion ratio");

    return report.finish("geometry loader");
}
