#pragma once
#include <QString>

// Process-wide Qt message handler for vmssh.
// Records go to <AppLocalData>/logs/<app>.log, or stderr if no file is open.
namespace Logger {
    // Also reads VMSSH_LOG_LEVEL (0..2) if set.
    void install(const QString& appName);

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);
    int  logLevel();

    QString logFilePath();

    // Reopens the sink at this file; empty => keep current, next install() uses default.
    void setLogFilePathOverride(const QString& absoluteFilePath);
}
