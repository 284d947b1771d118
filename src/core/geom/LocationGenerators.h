/**
 * @file LocationGenerators.h
 * @brief Pure generators of placement frames (grid, polar, hex).
 *
 * The generated lists are local to the frame they are pushed into; the
 * builder placement contexts push them onto a session's LocationStack and
 * algebra code multiplies them directly (Location * std::vector<Location>).
 */
#ifndef SCOPECAD_CORE_GEOM_LOCATION_GENERATORS_H
#define SCOPECAD_CORE_GEOM_LOCATION_GENERATORS_H

#include "Location.h"

#include <vector>

namespace scopecad::core::geom {

/**
 * @brief Rectangular grid, x-major order
 *
 * @param centered When true the grid is centered on the origin, otherwise
 *        the first point sits at the origin.
 * @throws std::invalid_argument when a count is below 1
 */
std::vector<Location> gridLocations(double xSpacing, double ySpacing,
                                    int xCount, int yCount, bool centered = true);

/**
 * @brief Points on a circle in the XY plane
 *
 * A full 360 degree range spreads count points without repeating the start;
 * a partial range includes both ends. With rotate each frame is turned about
 * Z by its polar angle.
 */
std::vector<Location> polarLocations(double radius, int count,
                                     double startAngle = 0.0,
                                     double angularRange = 360.0,
                                     bool rotate = true);

/**
 * @brief Hexagonally packed points (column-staggered) for hexagons of the
 * given apothem.
 */
std::vector<Location> hexLocations(double apothem, int xCount, int yCount, bool centered = true);

} // namespace scopecad::core::geom

#endif // SCOPECAD_CORE_GEOM_LOCATION_GENERATORS_H
