/**
 * @file SessionConfig.h
 * @brief Tolerances and kernel switches of a build session.
 */
#ifndef SCOPECAD_APP_SESSION_CONFIG_H
#define SCOPECAD_APP_SESSION_CONFIG_H

#include "build/Mode.h"
#include "../kernel/ops/KernelResult.h"

#include <QJsonObject>

namespace scopecad::app {

struct SessionConfig {
    double linearTolerance = 1e-6;
    /// Radians
    double angularTolerance = 1e-6;
    /// 0 runs exact booleans
    double booleanFuzzyValue = 0.0;
    bool cleanAfterBoolean = true;
    /// Key tolerance for groupBy
    double groupTolerance = 1e-4;
    bool validateResults = false;
    build::Mode defaultMode = build::Mode::Add;

    /**
     * @brief Defaults overridden by SCOPECAD_LINEAR_TOLERANCE,
     * SCOPECAD_BOOLEAN_FUZZY, SCOPECAD_CLEAN and SCOPECAD_VALIDATE
     *
     * Unparsable values keep the default and log a warning.
     */
    static SessionConfig fromEnvironment();

    /// Missing keys keep the defaults; invalid values are logged and ignored
    static SessionConfig fromJson(const QJsonObject& json);
    QJsonObject toJson() const;

    kernel::ops::KernelOptions toKernelOptions() const;
};

} // namespace scopecad::app

#endif // SCOPECAD_APP_SESSION_CONFIG_H
