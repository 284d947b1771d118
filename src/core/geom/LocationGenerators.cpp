#include "LocationGenerators.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <string>

namespace scopecad::core::geom {

namespace {

void requirePositiveCount(int count, const char* name) {
    if (count < 1) {
        throw std::invalid_argument(std::string(name) + " must be at least 1, got " +
                                    std::to_string(count));
    }
}

} // namespace

std::vector<Location> gridLocations(double xSpacing, double ySpacing,
                                    int xCount, int yCount, bool centered) {
    requirePositiveCount(xCount, "xCount");
    requirePositiveCount(yCount, "yCount");

    const double xOffset = centered ? xSpacing * (xCount - 1) / 2.0 : 0.0;
    const double yOffset = centered ? ySpacing * (yCount - 1) / 2.0 : 0.0;

    std::vector<Location> locations;
    locations.reserve(static_cast<size_t>(xCount) * static_cast<size_t>(yCount));
    for (int i = 0; i < xCount; ++i) {
        for (int j = 0; j < yCount; ++j) {
            locations.push_back(Pos(i * xSpacing - xOffset, j * ySpacing - yOffset, 0.0));
        }
    }
    return locations;
}

std::vector<Location> polarLocations(double radius, int count,
                                     double startAngle, double angularRange, bool rotate) {
    requirePositiveCount(count, "count");

    const bool fullCircle = std::abs(std::abs(angularRange) - 360.0) < 1e-9;
    double step = 0.0;
    if (fullCircle) {
        step = angularRange / count;
    } else if (count > 1) {
        step = angularRange / (count - 1);
    }

    std::vector<Location> locations;
    locations.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        const double angle = startAngle + step * i;
        const double radians = angle * std::numbers::pi / 180.0;
        const Vec3d position(radius * std::cos(radians), radius * std::sin(radians), 0.0);
        locations.push_back(rotate ? Location(position, Vec3d::UnitZ(), angle) : Location(position));
    }
    return locations;
}

std::vector<Location> hexLocations(double apothem, int xCount, int yCount, bool centered) {
    requirePositiveCount(xCount, "xCount");
    requirePositiveCount(yCount, "yCount");

    const double diagonal = 4.0 * apothem / std::sqrt(3.0);
    const double xSpacing = 3.0 * diagonal / 4.0;
    const double ySpacing = diagonal * std::sqrt(3.0) / 2.0;

    std::vector<Vec3d> points;
    points.reserve(static_cast<size_t>(xCount) * static_cast<size_t>(yCount));
    for (int x = 0; x < xCount; x += 2) {
        for (int y = 0; y < yCount; ++y) {
            points.emplace_back(xSpacing * x, ySpacing * y + ySpacing / 2.0, 0.0);
        }
    }
    for (int x = 1; x < xCount; x += 2) {
        for (int y = 0; y < yCount; ++y) {
            points.emplace_back(xSpacing * x, ySpacing * y + ySpacing, 0.0);
        }
    }

    Vec3d shift = Vec3d::Zero();
    if (centered) {
        Vec3d minCorner = Vec3d::Constant(std::numeric_limits<double>::max());
        Vec3d maxCorner = Vec3d::Constant(std::numeric_limits<double>::lowest());
        for (const auto& p : points) {
            minCorner = minCorner.cwiseMin(p);
            maxCorner = maxCorner.cwiseMax(p);
        }
        shift = (minCorner + maxCorner) / 2.0;
    } else {
        shift = Vec3d(0.0, ySpacing / 2.0, 0.0);
    }

    std::vector<Location> locations;
    locations.reserve(points.size());
    for (const auto& p : points) {
        locations.push_back(Pos(p - shift));
    }
    return locations;
}

} // namespace scopecad::core::geom
