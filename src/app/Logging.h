/**
 * @file Logging.h
 * @brief Process-wide Qt message handler writing to console and a per-run log file.
 */
#ifndef BOXJOINT_APP_LOGGING_H
#define BOXJOINT_APP_LOGGING_H

#include <QString>

namespace boxjoint::app {

class Logging {
public:
    /**
     * @brief Installs the message handler and opens a new log file.
     *
     * Safe to call more than once; later calls return true without reopening.
     */
    static bool initialize(const QString& appName, bool debugBuild);
    static void shutdown();
    static QString logFilePath();
    static bool isDebugLoggingEnabled();
};

} // namespace boxjoint::app

#endif // BOXJOINT_APP_LOGGING_H
