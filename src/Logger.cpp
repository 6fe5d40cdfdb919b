// Logger.cpp
#include "Logger.h"

#include <QAtomicInt>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>
#include <QtGlobal>

#include <cstdio>
#include <memory>

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#include <QStringConverter>
#endif

// =====================================================
// Global logger state (process-wide)
// =====================================================

static std::unique_ptr<QFile> g_file;  // Open log file handle
static QMutex     g_mutex;             // Guards the sink
static QString    g_path;              // Absolute path to log file
static QAtomicInt g_level(1);          // 0=Errors only, 1=Normal, 2=Debug
static QString    g_pathOverride;

// Prevent recursion if something inside the handler triggers Qt logging again
static thread_local bool g_inHandler = false;

static const char* levelName(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

// 0 = WARN/ERROR/FATAL, 1 = + INFO, 2 = everything
static bool allowMessage(QtMsgType type)
{
    switch (g_level.loadAcquire()) {
        case 0:  return type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg;
        case 1:  return type != QtDebugMsg;
        default: return true;
    }
}

// One record = one physical line.
static QString oneLine(QString s)
{
    s.replace("\r\n", "\n");
    s.replace('\r', '\n');
    s.replace('\n', ' ');
    s.replace('\t', ' ');
    return s.simplified();
}

static void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    // Qt aborts after the handler returns for QtFatalMsg; never drop those.
    if (type != QtFatalMsg && (!allowMessage(type) || g_inHandler))
        return;

    g_inHandler = true;

    const QString ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    const QString where =
        (ctx.file && ctx.function)
            ? QString("%1:%2 %3")
                  .arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName())
                  .arg(ctx.line)
                  .arg(QString::fromUtf8(ctx.function))
            : QString();

    QString line = QString("%1 [%2] ").arg(ts, QLatin1String(levelName(type)));
    if (!where.isEmpty())
        line += where + " - ";
    line += oneLine(msg);

    {
        QMutexLocker lock(&g_mutex);

        if (g_file && g_file->isOpen()) {
            QTextStream out(g_file.get());
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
            out.setEncoding(QStringConverter::Utf8);
#else
            out.setCodec("UTF-8");
#endif
            out << line << "\n";
            out.flush();
        } else {
            std::fprintf(stderr, "%s\n", line.toUtf8().constData());
            std::fflush(stderr);
        }
    }

    g_inHandler = false;
}

// =====================================================
// Log rotation (size-based): log -> .1 -> .2 -> .3
// =====================================================
static void rotateIfNeeded(const QString& path,
                           qint64 maxBytes = 2 * 1024 * 1024,
                           int keep = 3)
{
    QFileInfo fi(path);
    if (!fi.exists() || fi.size() < maxBytes)
        return;

    QFile::remove(path + "." + QString::number(keep));
    for (int i = keep - 1; i >= 1; --i) {
        const QString older = path + "." + QString::number(i);
        if (QFileInfo::exists(older))
            QFile::rename(older, path + "." + QString::number(i + 1));
    }
    QFile::rename(path, path + ".1");
}

// Caller holds g_mutex.
static bool openSinkLocked(const QString& path)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    if (g_file && g_file->isOpen())
        g_file->close();

    g_file.reset(new QFile(path));
    if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "Logger: failed to open log file: %s\n", path.toUtf8().constData());
        std::fflush(stderr);
        g_file.reset();
        g_path.clear();
        return false;
    }

    g_path = path;
    return true;
}

// =====================================================
// Public Logger API
// =====================================================

namespace Logger {

void install(const QString& appName)
{
    bool ok = false;
    const int envLevel = qEnvironmentVariableIntValue("VMSSH_LOG_LEVEL", &ok);
    if (ok)
        setLogLevel(envLevel);

    const QString defaultPath =
        QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)
        + "/logs/" + appName + ".log";

    {
        QMutexLocker lock(&g_mutex);
        const QString chosen = g_pathOverride.isEmpty() ? defaultPath : g_pathOverride;
        openSinkLocked(chosen);
    }

    qInstallMessageHandler(handler);

    const QString path = logFilePath();
    qInfo().noquote() << QString("Logger initialized: %1")
                         .arg(path.isEmpty() ? QStringLiteral("<stderr>") : path);
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

void setLogFilePathOverride(const QString& absoluteFilePath)
{
    QMutexLocker lock(&g_mutex);

    g_pathOverride = absoluteFilePath.trimmed().isEmpty()
                         ? QString()
                         : QDir::cleanPath(absoluteFilePath.trimmed());

    if (!g_pathOverride.isEmpty())
        openSinkLocked(g_pathOverride);
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(0, level, 2));
}

int logLevel()
{
    return g_level.loadAcquire();
}

} // namespace Logger
