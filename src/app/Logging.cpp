/**
 * @file Logging.cpp
 * @brief Message handler, per-run log files and terminate logging.
 */
#include "Logging.h"

#include <QCoreApplication>
#include <QDateTime>
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
#include <exception>
#include <iostream>

namespace boxjoint::app {
namespace {

constexpr int kLogRetentionDays = 30;
constexpr int kMaxRunLogFiles = 30;

// Categories that stay at debug level in release builds unless overridden.
constexpr const char* kReleaseDebugCategories =
    "boxjoint.app.*,"
    "boxjoint.io.*,"
    "boxjoint.core.joint.applier";

struct LogState {
    QMutex mutex;
    QFile file;
    QString filePath;
    QtMessageHandler previousHandler = nullptr;
    std::terminate_handler previousTerminate = nullptr;
    bool initialized = false;
    bool debugEnabled = false;
};

LogState& state() {
    static LogState instance;
    return instance;
}

const char* levelName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "DEBUG";
        case QtInfoMsg: return "INFO";
        case QtWarningMsg: return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg: return "FATAL";
    }
    return "UNKNOWN";
}

bool envFlag(const char* name) {
    const QString value = qEnvironmentVariable(name).trimmed().toLower();
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

QString buildFilterRules(bool debugEnabled) {
    QStringList rules{
        QStringLiteral("*.info=true"),
        QStringLiteral("*.warning=true"),
        QStringLiteral("*.critical=true"),
    };
    if (debugEnabled) {
        rules << QStringLiteral("*.debug=true");
        return rules.join('\n');
    }

    rules << QStringLiteral("*.debug=false");
    QString selected = qEnvironmentVariable("BOXJOINT_LOG_DEBUG_CATEGORIES").trimmed();
    if (selected.isEmpty()) {
        selected = QString::fromLatin1(kReleaseDebugCategories);
    }
    QStringList categories;
    for (const QString& token : selected.split(',', Qt::SkipEmptyParts)) {
        const QString category = token.trimmed();
        if (!category.isEmpty() && !categories.contains(category)) {
            categories << category;
            rules << QStringLiteral("%1.debug=true").arg(category);
        }
    }
    return rules.join('\n');
}

QString formatLine(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString where = (context.file && context.line > 0)
                              ? QStringLiteral("%1:%2").arg(QFileInfo(context.file).fileName()).arg(context.line)
                              : QStringLiteral("<unknown>");
    return QStringLiteral("%1 [%2] [tid=0x%3] [%4] [%5] [%6] %7")
        .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs),
             QString::fromLatin1(levelName(type)),
             QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()), 16),
             context.category ? QString::fromUtf8(context.category) : QStringLiteral("default"),
             where,
             context.function ? QString::fromUtf8(context.function) : QStringLiteral("<unknown>"),
             msg);
}

void appendToFile(const QString& line) {
    LogState& s = state();
    QMutexLocker lock(&s.mutex);
    if (!s.file.isOpen()) {
        return;
    }
    QTextStream stream(&s.file);
    stream << line << Qt::endl;
    s.file.flush();
}

void handleMessage(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString line = formatLine(type, context, msg);
    appendToFile(line);

    const bool severe = type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg;
    std::ostream& console = severe ? std::cerr : std::cout;
    console << line.toStdString() << std::endl;

    if (QtMessageHandler previous = state().previousHandler) {
        previous(type, context, msg);
    }
    if (type == QtFatalMsg) {
        std::abort();
    }
}

QString activeExceptionText() {
    const std::exception_ptr current = std::current_exception();
    if (!current) {
        return QStringLiteral("no active exception");
    }
    try {
        std::rethrow_exception(current);
    } catch (const std::exception& e) {
        return QString::fromUtf8(e.what());
    } catch (...) {
        return QStringLiteral("non-standard exception");
    }
}

[[noreturn]] void handleTerminate() {
    const QString line = QStringLiteral("%1 [FATAL] [terminate] Unhandled exception: %2")
                             .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs), activeExceptionText());
    appendToFile(line);
    std::cerr << line.toStdString() << std::endl;

    if (std::terminate_handler previous = state().previousTerminate) {
        previous();
    }
    std::abort();
}

QString logDirectory() {
    const QString configured = qEnvironmentVariable("BOXJOINT_LOG_DIR").trimmed();
    if (!configured.isEmpty()) {
        return configured;
    }
    const QString appData = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    return appData.isEmpty() ? QDir::current().filePath(QStringLiteral("logs"))
                             : QDir(appData).filePath(QStringLiteral("logs"));
}

/**
 * @brief Removes run logs older than the retention window or beyond the newest kMaxRunLogFiles.
 *
 * The current run's file is never removed and counts toward the limit.
 */
int pruneRunLogs(const QDir& dir, const QString& currentPath) {
    const QDateTime cutoff = QDateTime::currentDateTime().addDays(-kLogRetentionDays);
    const QFileInfoList newestFirst = dir.entryInfoList({QStringLiteral("*.log")}, QDir::Files, QDir::Time);

    int kept = 0;
    int removed = 0;
    for (const QFileInfo& info : newestFirst) {
        const QString path = info.absoluteFilePath();
        if (path == currentPath) {
            ++kept;
            continue;
        }
        const bool expired = info.lastModified().isValid() && info.lastModified() < cutoff;
        if (expired || kept >= kMaxRunLogFiles) {
            if (QFile::remove(path)) {
                ++removed;
            }
            continue;
        }
        ++kept;
    }
    return removed;
}

} // namespace

bool Logging::initialize(const QString& appName, bool debugBuild) {
    LogState& s = state();
    QString openedPath;
    QString directoryPath;

    {
        QMutexLocker lock(&s.mutex);
        if (s.initialized) {
            return true;
        }

        s.debugEnabled = debugBuild || envFlag("BOXJOINT_LOG_DEBUG");
        QLoggingCategory::setFilterRules(buildFilterRules(s.debugEnabled));

        QDir dir(logDirectory());
        if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
            std::cerr << "Failed to create log directory: " << dir.path().toStdString() << std::endl;
            return false;
        }

        const QString fileName = QStringLiteral("%1_%2_%3.log")
                                     .arg(appName.toLower(),
                                          QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss_zzz")))
                                     .arg(QCoreApplication::applicationPid());
        s.filePath = QFileInfo(dir.filePath(fileName)).absoluteFilePath();
        s.file.setFileName(s.filePath);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Text)) {
            std::cerr << "Failed to open log file: " << s.filePath.toStdString() << std::endl;
            s.filePath.clear();
            return false;
        }

        s.previousHandler = qInstallMessageHandler(handleMessage);
        s.previousTerminate = std::set_terminate(handleTerminate);
        s.initialized = true;
        openedPath = s.filePath;
        directoryPath = dir.absolutePath();
    }

    qInfo().noquote() << "logging:initialized"
                      << "file=" << openedPath
                      << "debugBuild=" << debugBuild
                      << "debugLogs=" << s.debugEnabled;

    const int removed = pruneRunLogs(QDir(directoryPath), openedPath);
    qInfo().noquote() << "logging:retention"
                      << "days=" << kLogRetentionDays
                      << "maxFiles=" << kMaxRunLogFiles
                      << "removed=" << removed;
    return true;
}

void Logging::shutdown() {
    LogState& s = state();
    QString closingPath;
    {
        QMutexLocker lock(&s.mutex);
        if (!s.initialized) {
            return;
        }
        closingPath = s.filePath;
    }

    qInfo().noquote() << "logging:shutdown" << "file=" << closingPath;

    QMutexLocker lock(&s.mutex);
    qInstallMessageHandler(s.previousHandler);
    s.previousHandler = nullptr;
    std::set_terminate(s.previousTerminate);
    s.previousTerminate = nullptr;
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

} // namespace boxjoint::app
