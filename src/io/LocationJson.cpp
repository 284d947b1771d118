/**
 * @file LocationJson.cpp
 * @brief Implementation of location serialization
 */

#include "LocationJson.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>

namespace scopecad::io {

Q_LOGGING_CATEGORY(logIo, "scopecad.io")

using core::geom::Location;
using core::geom::Vec3d;

namespace {

QJsonArray vecToJson(const Vec3d& v) {
    return QJsonArray{v.x(), v.y(), v.z()};
}

bool vecFromJson(const QJsonObject& json, const char* key, Vec3d& out, QString& errorMessage) {
    const QJsonValue value = json.value(QLatin1String(key));
    if (!value.isArray()) {
        errorMessage = QStringLiteral("'%1' must be an array of three numbers").arg(QLatin1String(key));
        return false;
    }
    const QJsonArray array = value.toArray();
    if (array.size() != 3) {
        errorMessage = QStringLiteral("'%1' has %2 components, expected 3").arg(QLatin1String(key)).arg(array.size());
        return false;
    }
    for (int i = 0; i < 3; ++i) {
        if (!array.at(i).isDouble()) {
            errorMessage = QStringLiteral("'%1'[%2] is not a number").arg(QLatin1String(key)).arg(i);
            return false;
        }
        out[i] = array.at(i).toDouble();
    }
    return true;
}

} // namespace

QJsonObject LocationJson::toJson(const Location& location) {
    QJsonObject json;
    json["position"] = vecToJson(location.position());
    json["orientation"] = vecToJson(location.orientation());
    return json;
}

std::optional<Location> LocationJson::fromJson(const QJsonObject& json, QString& errorMessage) {
    Vec3d position = Vec3d::Zero();
    Vec3d orientation = Vec3d::Zero();
    if (!vecFromJson(json, "position", position, errorMessage)) {
        return std::nullopt;
    }
    // Orientation is optional; a bare position is a translation
    if (json.contains("orientation") && !vecFromJson(json, "orientation", orientation, errorMessage)) {
        return std::nullopt;
    }
    return Location(position, orientation);
}

QJsonObject LocationJson::toJson(const std::map<std::string, Location>& joints) {
    QJsonObject json;
    for (const auto& [name, location] : joints) {
        json[QString::fromStdString(name)] = toJson(location);
    }
    return json;
}

std::optional<std::map<std::string, Location>> LocationJson::jointsFromJson(const QJsonObject& json,
                                                                           QString& errorMessage) {
    std::map<std::string, Location> joints;
    for (auto it = json.begin(); it != json.end(); ++it) {
        if (!it.value().isObject()) {
            errorMessage = QStringLiteral("joint '%1' is not an object").arg(it.key());
            return std::nullopt;
        }
        QString fieldError;
        auto location = fromJson(it.value().toObject(), fieldError);
        if (!location) {
            errorMessage = QStringLiteral("joint '%1': %2").arg(it.key(), fieldError);
            return std::nullopt;
        }
        joints.emplace(it.key().toStdString(), *location);
    }
    return joints;
}

bool LocationJson::saveJoints(const QString& path, const std::map<std::string, Location>& joints,
                              QString& errorMessage) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        errorMessage = QStringLiteral("Cannot open %1 for writing: %2").arg(path, file.errorString());
        qCWarning(logIo) << "saveJoints:open-failed" << path << file.errorString();
        return false;
    }
    const QByteArray data = QJsonDocument(toJson(joints)).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        errorMessage = QStringLiteral("Short write to %1: %2").arg(path, file.errorString());
        qCWarning(logIo) << "saveJoints:write-failed" << path << file.errorString();
        return false;
    }
    qCDebug(logIo) << "saveJoints:done" << path << "count=" << static_cast<int>(joints.size());
    return true;
}

std::optional<std::map<std::string, Location>> LocationJson::loadJoints(const QString& path,
                                                                       QString& errorMessage) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        errorMessage = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        qCWarning(logIo) << "loadJoints:open-failed" << path << file.errorString();
        return std::nullopt;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        errorMessage = QStringLiteral("JSON parse error in %1: %2").arg(path, parseError.errorString());
        qCWarning(logIo) << "loadJoints:parse-failed" << path << parseError.errorString();
        return std::nullopt;
    }
    if (!doc.isObject()) {
        errorMessage = QStringLiteral("%1 does not hold a JSON object").arg(path);
        return std::nullopt;
    }
    return jointsFromJson(doc.object(), errorMessage);
}

} // namespace scopecad::io
