#include "PlacementContexts.h"
#include "../../core/geom/LocationGenerators.h"

#include <QDebug>
#include <QLoggingCategory>

namespace scopecad::app::build {

Q_LOGGING_CATEGORY(logPlacement, "scopecad.build.scope")

Locations::Locations(BuildSession& session, const std::vector<Location>& locations)
    : session_(session) {
    depth_ = session_.locations().push(locations);
    frames_ = session_.locations().top();
    active_ = true;
    qCDebug(logPlacement) << "locations:push"
                          << "depth=" << static_cast<int>(depth_)
                          << "frames=" << static_cast<int>(frames_.size());
}

Locations::~Locations() {
    if (!active_) {
        return;
    }
    // Session teardown may already have cleared the stack
    if (session_.locations().depth() != depth_) {
        qCWarning(logPlacement) << "locations:skip-pop"
                                << "expected=" << static_cast<int>(depth_)
                                << "actual=" << static_cast<int>(session_.locations().depth());
        return;
    }
    session_.locations().pop(depth_);
}

void Locations::release() {
    if (!active_) {
        return;
    }
    session_.locations().pop(depth_);
    active_ = false;
}

GridLocations::GridLocations(BuildSession& session, double xSpacing, double ySpacing,
                             int xCount, int yCount, bool centered)
    : Locations(session, core::geom::gridLocations(xSpacing, ySpacing, xCount, yCount, centered)) {}

PolarLocations::PolarLocations(BuildSession& session, double radius, int count,
                               double startAngle, double angularRange, bool rotate)
    : Locations(session, core::geom::polarLocations(radius, count, startAngle, angularRange, rotate)) {}

HexLocations::HexLocations(BuildSession& session, double apothem, int xCount, int yCount, bool centered)
    : Locations(session, core::geom::hexLocations(apothem, xCount, yCount, centered)) {}

} // namespace scopecad::app::build
