#include "SessionConfig.h"

#include <QDebug>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QString>

namespace scopecad::app {

Q_LOGGING_CATEGORY(logConfig, "scopecad.config")

namespace {

void readPositive(const char* name, double& target, bool allowZero) {
    const QString raw = qEnvironmentVariable(name).trimmed();
    if (raw.isEmpty()) {
        return;
    }
    bool ok = false;
    const double value = raw.toDouble(&ok);
    if (!ok || value < 0.0 || (!allowZero && value == 0.0)) {
        qCWarning(logConfig) << "env:invalid-value" << name << raw;
        return;
    }
    target = value;
}

void readFlag(const char* name, bool& target) {
    const QString raw = qEnvironmentVariable(name).trimmed().toLower();
    if (raw.isEmpty()) {
        return;
    }
    if (raw == "1" || raw == "true" || raw == "yes" || raw == "on") {
        target = true;
    } else if (raw == "0" || raw == "false" || raw == "no" || raw == "off") {
        target = false;
    } else {
        qCWarning(logConfig) << "env:invalid-flag" << name << raw;
    }
}

void readJsonNumber(const QJsonObject& json, const char* key, double& target, bool allowZero) {
    if (!json.contains(key)) {
        return;
    }
    const QJsonValue value = json.value(key);
    if (!value.isDouble() || value.toDouble() < 0.0 || (!allowZero && value.toDouble() == 0.0)) {
        qCWarning(logConfig) << "json:invalid-number" << key;
        return;
    }
    target = value.toDouble();
}

void readJsonBool(const QJsonObject& json, const char* key, bool& target) {
    if (!json.contains(key)) {
        return;
    }
    const QJsonValue value = json.value(key);
    if (!value.isBool()) {
        qCWarning(logConfig) << "json:invalid-bool" << key;
        return;
    }
    target = value.toBool();
}

} // namespace

SessionConfig SessionConfig::fromEnvironment() {
    SessionConfig config;
    readPositive("SCOPECAD_LINEAR_TOLERANCE", config.linearTolerance, false);
    readPositive("SCOPECAD_BOOLEAN_FUZZY", config.booleanFuzzyValue, true);
    readFlag("SCOPECAD_CLEAN", config.cleanAfterBoolean);
    readFlag("SCOPECAD_VALIDATE", config.validateResults);
    qCDebug(logConfig) << "config:environment"
                       << "linearTolerance=" << config.linearTolerance
                       << "fuzzy=" << config.booleanFuzzyValue
                       << "clean=" << config.cleanAfterBoolean
                       << "validate=" << config.validateResults;
    return config;
}

SessionConfig SessionConfig::fromJson(const QJsonObject& json) {
    SessionConfig config;
    readJsonNumber(json, "linearTolerance", config.linearTolerance, false);
    readJsonNumber(json, "angularTolerance", config.angularTolerance, false);
    readJsonNumber(json, "booleanFuzzyValue", config.booleanFuzzyValue, true);
    readJsonNumber(json, "groupTolerance", config.groupTolerance, false);
    readJsonBool(json, "cleanAfterBoolean", config.cleanAfterBoolean);
    readJsonBool(json, "validateResults", config.validateResults);

    if (json.contains("defaultMode")) {
        const auto mode = build::modeFromName(json.value("defaultMode").toString().toStdString());
        if (mode) {
            config.defaultMode = *mode;
        } else {
            qCWarning(logConfig) << "json:invalid-mode" << json.value("defaultMode").toString();
        }
    }
    return config;
}

QJsonObject SessionConfig::toJson() const {
    QJsonObject json;
    json["linearTolerance"] = linearTolerance;
    json["angularTolerance"] = angularTolerance;
    json["booleanFuzzyValue"] = booleanFuzzyValue;
    json["cleanAfterBoolean"] = cleanAfterBoolean;
    json["groupTolerance"] = groupTolerance;
    json["validateResults"] = validateResults;
    json["defaultMode"] = QString::fromLatin1(build::modeName(defaultMode));
    return json;
}

kernel::ops::KernelOptions SessionConfig::toKernelOptions() const {
    kernel::ops::KernelOptions options;
    options.fuzzyValue = booleanFuzzyValue;
    options.cleanAfterBoolean = cleanAfterBoolean;
    options.validateResults = validateResults;
    options.linearTolerance = linearTolerance;
    return options;
}

} // namespace scopecad::app
