/**
 * @file LocationJson.h
 * @brief JSON form of locations and named joint maps
 */

#pragma once

#include "../core/geom/Location.h"

#include <QJsonObject>
#include <QString>
#include <map>
#include <optional>
#include <string>

namespace scopecad::io {

/**
 * @brief Serialization of Location values
 *
 * A location is written as
 * {"position": [x, y, z], "orientation": [rx, ry, rz]}
 * with intrinsic XYZ Euler angles in degrees.
 */
class LocationJson {
public:
    static QJsonObject toJson(const core::geom::Location& location);

    /**
     * @brief Parse a location object
     * @return nullopt with errorMessage set when a field is missing or malformed
     */
    static std::optional<core::geom::Location> fromJson(const QJsonObject& json,
                                                        QString& errorMessage);

    static QJsonObject toJson(const std::map<std::string, core::geom::Location>& joints);
    static std::optional<std::map<std::string, core::geom::Location>> jointsFromJson(
        const QJsonObject& json, QString& errorMessage);

    /**
     * @brief Write / read a joint map as an indented JSON file
     */
    static bool saveJoints(const QString& path,
                           const std::map<std::string, core::geom::Location>& joints,
                           QString& errorMessage);
    static std::optional<std::map<std::string, core::geom::Location>> loadJoints(
        const QString& path, QString& errorMessage);
};

} // namespace scopecad::io
