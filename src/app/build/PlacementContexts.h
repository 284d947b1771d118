/**
 * @file PlacementContexts.h
 * @brief RAII guards pushing placement frames onto a session.
 *
 * While a guard is alive every primitive created in the session's active
 * scope is replicated once per effective frame. Guards nest: the frames of
 * an inner guard are composed relative to each frame of the outer one.
 *
 * @code
 *   BuildPart part(session);
 *   {
 *       GridLocations grid(session, 10, 10, 2, 2);
 *       part.cylinder(1, 5);   // four cylinders
 *   }
 * @endcode
 */
#ifndef SCOPECAD_APP_BUILD_PLACEMENT_CONTEXTS_H
#define SCOPECAD_APP_BUILD_PLACEMENT_CONTEXTS_H

#include "BuildSession.h"

#include <cstddef>
#include <vector>

namespace scopecad::app::build {

class Locations {
public:
    /// @throws std::invalid_argument for an empty list
    Locations(BuildSession& session, const std::vector<Location>& locations);
    virtual ~Locations();

    Locations(const Locations&) = delete;
    Locations& operator=(const Locations&) = delete;

    /// Pop the frames early; the destructor then does nothing
    void release();

    /// Effective frames pushed by this guard
    const std::vector<Location>& frames() const { return frames_; }

private:
    BuildSession& session_;
    std::vector<Location> frames_;
    size_t depth_ = 0;
    bool active_ = false;
};

class GridLocations : public Locations {
public:
    GridLocations(BuildSession& session, double xSpacing, double ySpacing,
                  int xCount, int yCount, bool centered = true);
};

class PolarLocations : public Locations {
public:
    PolarLocations(BuildSession& session, double radius, int count,
                   double startAngle = 0.0, double angularRange = 360.0, bool rotate = true);
};

class HexLocations : public Locations {
public:
    HexLocations(BuildSession& session, double apothem, int xCount, int yCount, bool centered = true);
};

} // namespace scopecad::app::build

#endif // SCOPECAD_APP_BUILD_PLACEMENT_CONTEXTS_H
