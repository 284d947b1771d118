#include "Logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>
#include <QThread>

#include <cstdlib>
#include <iostream>

namespace scopecad::app {
namespace {

constexpr int kLogRetentionDays = 30;
constexpr int kMaxRunLogFiles = 30;

const QString kDefaultDebugCategories = QStringLiteral("scopecad.build,scopecad.algebra");

struct LogState {
    QMutex mutex;
    QFile file;
    QString filePath;
    QtMessageHandler previousHandler = nullptr;
    bool initialized = false;
    bool debugEnabled = false;
};

LogState& state() {
    static LogState s;
    return s;
}

const char* levelName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:
            return "DEBUG";
        case QtInfoMsg:
            return "INFO";
        case QtWarningMsg:
            return "WARN";
        case QtCriticalMsg:
            return "ERROR";
        case QtFatalMsg:
            return "FATAL";
    }
    return "UNKNOWN";
}

bool envFlag(const char* name) {
    const QString value = qEnvironmentVariable(name).trimmed().toLower();
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

QStringList debugCategoriesFromEnvironment() {
    QString configured = qEnvironmentVariable("SCOPECAD_LOG_DEBUG_CATEGORIES").trimmed();
    if (configured.isEmpty()) {
        configured = kDefaultDebugCategories;
    }
    QStringList categories;
    for (const QString& token : configured.split(',', Qt::SkipEmptyParts)) {
        const QString category = token.trimmed();
        if (!category.isEmpty() && !categories.contains(category)) {
            categories.push_back(category);
        }
    }
    return categories;
}

QString formatLine(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString location = (context.file && context.line > 0)
                                 ? QStringLiteral("%1:%2").arg(QFileInfo(context.file).fileName()).arg(context.line)
                                 : QStringLiteral("<unknown>");
    return QStringLiteral("%1 [%2] [tid=0x%3] [%4] [%5] [%6] %7")
        .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs),
             QString::fromLatin1(levelName(type)),
             QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()), 16),
             context.category ? QString::fromUtf8(context.category) : QStringLiteral("default"),
             location,
             context.function ? QString::fromUtf8(context.function) : QStringLiteral("<unknown>"),
             msg);
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString line = formatLine(type, context, msg);
    {
        LogState& s = state();
        QMutexLocker lock(&s.mutex);
        if (s.file.isOpen()) {
            QTextStream stream(&s.file);
            stream << line << Qt::endl;
            s.file.flush();
        }
    }

    if (type == QtDebugMsg || type == QtInfoMsg) {
        std::cout << line.toStdString() << std::endl;
    } else {
        std::cerr << line.toStdString() << std::endl;
    }
    if (type == QtFatalMsg) {
        std::abort();
    }
}

QStringList candidateDirectories() {
    QStringList paths;
    auto add = [&paths](const QString& path) {
        const QString cleaned = QDir::cleanPath(path.trimmed());
        if (!cleaned.isEmpty() && cleaned != QStringLiteral(".") && !paths.contains(cleaned)) {
            paths.push_back(cleaned);
        }
    };

    add(qEnvironmentVariable("SCOPECAD_LOG_DIR"));
    const QString appData = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (!appData.isEmpty()) {
        add(QDir(appData).filePath(QStringLiteral("logs")));
    }
    add(QDir::current().filePath(QStringLiteral("logs")));
    const QString temp = QStandardPaths::writableLocation(QStandardPaths::TempLocation);
    if (!temp.isEmpty()) {
        add(QDir(temp).filePath(QStringLiteral("scopecad/logs")));
    }
    return paths;
}

void pruneLogs(const QDir& dir, const QString& keep) {
    const QDateTime cutoff = QDateTime::currentDateTime().addDays(-kLogRetentionDays);
    int kept = 0;
    // Newest first
    const QFileInfoList files = dir.entryInfoList({QStringLiteral("*.log")}, QDir::Files, QDir::Time);
    for (const QFileInfo& info : files) {
        if (info.absoluteFilePath() == keep) {
            ++kept;
            continue;
        }
        const bool expired = info.lastModified().isValid() && info.lastModified() < cutoff;
        if (expired || kept >= kMaxRunLogFiles) {
            QFile::remove(info.absoluteFilePath());
            continue;
        }
        ++kept;
    }
}

} // namespace

QStringList Logging::filterRules(bool debugBuild) {
    const bool debugEnabled = debugBuild || envFlag("SCOPECAD_LOG_DEBUG");

    QStringList rules;
    rules << QStringLiteral("*.debug=false");
    rules << QStringLiteral("*.info=false");
    rules << QStringLiteral("default.info=true");
    rules << QStringLiteral("scopecad.*.info=true");
    rules << QStringLiteral("*.warning=true");
    rules << QStringLiteral("*.critical=true");

    if (debugEnabled) {
        rules << QStringLiteral("scopecad.*.debug=true");
    } else {
        for (const QString& category : debugCategoriesFromEnvironment()) {
            rules << QStringLiteral("%1.debug=true").arg(category);
            rules << QStringLiteral("%1.*.debug=true").arg(category);
        }
    }
    return rules;
}

bool Logging::initialize(const QString& appName, bool debugBuild) {
    QStringList warnings;
    QString openedPath;
    QString openedDir;

    {
        LogState& s = state();
        QMutexLocker lock(&s.mutex);
        if (s.initialized) {
            return true;
        }

        s.debugEnabled = debugBuild || envFlag("SCOPECAD_LOG_DEBUG");
        QLoggingCategory::setFilterRules(filterRules(debugBuild).join('\n'));

        const QString fileName = QStringLiteral("%1_%2_%3.log")
                                     .arg(appName.toLower(),
                                          QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss_zzz")))
                                     .arg(QCoreApplication::applicationPid());

        for (const QString& path : candidateDirectories()) {
            QDir dir(path);
            if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
                warnings << QStringLiteral("Cannot create log directory %1").arg(path);
                continue;
            }
            s.file.setFileName(dir.filePath(fileName));
            if (!s.file.open(QIODevice::WriteOnly | QIODevice::Text)) {
                warnings << QStringLiteral("Cannot open log file %1").arg(s.file.fileName());
                continue;
            }
            s.filePath = s.file.fileName();
            openedPath = s.filePath;
            openedDir = dir.absolutePath();
            break;
        }

        s.previousHandler = qInstallMessageHandler(messageHandler);
        s.initialized = true;
        if (openedPath.isEmpty()) {
            warnings << QStringLiteral("File logging disabled, console only");
        }
    }

    for (const QString& warning : warnings) {
        qWarning().noquote() << warning;
    }
    qInfo().noquote() << "Logging initialized"
                      << "logFile=" << (openedPath.isEmpty() ? QStringLiteral("<disabled>") : openedPath)
                      << "debugBuild=" << debugBuild
                      << "debugLogsEnabled=" << isDebugLoggingEnabled();

    if (!openedPath.isEmpty()) {
        pruneLogs(QDir(openedDir), openedPath);
    }
    return true;
}

void Logging::shutdown() {
    if (!isInitialized()) {
        return;
    }
    qInfo().noquote() << "Logging shutdown" << "logFile=" << logFilePath();

    LogState& s = state();
    QMutexLocker lock(&s.mutex);
    qInstallMessageHandler(s.previousHandler);
    s.previousHandler = nullptr;
    if (s.file.isOpen()) {
        s.file.flush();
        s.file.close();
    }
    s.filePath.clear();
    s.initialized = false;
}

QString Logging::logFilePath() {
    LogState& s = state();
    QMutexLocker lock(&s.mutex);
    return s.filePath;
}

bool Logging::isDebugLoggingEnabled() {
    LogState& s = state();
    QMutexLocker lock(&s.mutex);
    return s.debugEnabled;
}

bool Logging::isInitialized() {
    LogState& s = state();
    QMutexLocker lock(&s.mutex);
    return s.initialized;
}

} // namespace scopecad::app
