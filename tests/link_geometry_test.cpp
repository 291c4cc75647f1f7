#include <iostream>
#include <cmath>
#include <Eigen/Dense>
#include "blocks/link_geometry_block.hpp"
#include "test_support.hpp"

using namespace wishbone;

int main() {
    std::cout << "🧪 Link geometry block test..." << std::endl;
    test::TestReport report;

    std::cout << "  Testing length and angle..." << std::endl;
    auto shock = LinkGeometryBlock::calculate(Eigen::Vector2d(1.0, 12.0), Eigen::Vector2d(5.0, 15.0), "shock");
    report.check_near(shock.length, 5.0, 1e-12, "Shock length");
    report.check_near(shock.angle, std::atan2(3.0, 4.0), 1e-12, "Shock angle");

    auto reversed = LinkGeometryBlock::calculate(Eigen::Vector2d(5.0, 15.0), Eigen::Vector2d(1.0, 12.0));
    report.check_near(std::cos(reversed.angle - shock.angle), -1.0, 1e-12, "Reversed link points the other way");
    report.check((shock.vector() - Eigen::Vector2d(4.0, 3.0)).norm() < 1e-12, "Link vector reconstruction");

    std::cout << "  Testing degenerate links..." << std::endl;
    bool degenerate_thrown = false;
    try {
        LinkGeometryBlock::calculate(Eigen::Vector2d(3.0, 3.0), Eigen::Vector2d(3.0, 3.0), "collapsed");
    } catch (const DegenerateLinkError& e) {
        degenerate_thrown = true;
        std::cout << "    " << e.what() << std::endl;
    }
    report.check(degenerate_thrown, "Coincident points throw DegenerateLinkError");

    bool non_finite_thrown = false;
    try {
        LinkGeometryBlock::calculate(Eigen::Vector2d(NAN, 0.0), Eigen::Vector2d(1.0, 0.0));
    } catch (const ConfigurationError&) {
        non_finite_thrown = true;
    }
    report.check(non_finite_thrown, "Non-finite point throws ConfigurationError");

    std::cout << "  Testing pivots and projection..." << std::endl;
    Eigen::Vector3d pivot = LinkGeometryBlock::effective_pivot(Eigen::Vector3d(22.0, 9.812, 8.875),
                                                               Eigen::Vector3d(28.75, 9.12, 9.125));
    Eigen::Vector2d planar = LinkGeometryBlock::project_to_plane(pivot);
    report.check_near(planar.x(), 9.466, 1e-12, "Averaged UCA pivot Y");
    report.check_near(planar.y(), 9.0, 1e-12, "Averaged UCA pivot Z");

    std::cout << "  Testing angle helpers..." << std::endl;
    report.check_near(LinkGeometryBlock::included_angle(Eigen::Vector2d(1.0, 0.0), Eigen::Vector2d(0.0, -2.0)),
                      M_PI / 2.0, 1e-12, "Included angle is unsigned");
    report.check_near(LinkGeometryBlock::wrap_angle(-M_PI), M_PI, 1e-12, "wrap_angle(-pi) -> pi");
    report.check_near(LinkGeometryBlock::wrap_angle(3.0 * M_PI / 2.0), -M_PI / 2.0, 1e-12, "wrap_angle(3pi/2)");

    return report.finish("link geometry");
}
