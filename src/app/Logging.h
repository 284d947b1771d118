/**
 * @file Logging.h
 * @brief Process-wide Qt message handler for ScopeCAD runs.
 *
 * Every subsystem logs through its own "scopecad.*" category. initialize()
 * routes all categories to the console and to one log file per run.
 */
#ifndef SCOPECAD_APP_LOGGING_H
#define SCOPECAD_APP_LOGGING_H

#include <QString>
#include <QStringList>

namespace scopecad::app {

class Logging {
public:
    /**
     * @brief Install the handler and the category filter rules
     *
     * Safe to call more than once; later calls are no-ops until shutdown().
     * Environment:
     *  - SCOPECAD_LOG_DIR: preferred log directory
     *  - SCOPECAD_LOG_DEBUG: enable debug output for all scopecad categories
     *  - SCOPECAD_LOG_DEBUG_CATEGORIES: comma separated categories that get
     *    debug output when SCOPECAD_LOG_DEBUG is off
     */
    static bool initialize(const QString& appName, bool debugBuild);

    /// Restore the previous message handler and close the log file
    static void shutdown();

    static QString logFilePath();
    static bool isDebugLoggingEnabled();
    static bool isInitialized();

    /// Filter rules initialize() would apply for the current environment
    static QStringList filterRules(bool debugBuild);

private:
    Logging() = delete;
};

} // namespace scopecad::app

#endif // SCOPECAD_APP_LOGGING_H
