#include <QDateTime>
#include <QStandardPaths>
#include <QTextStream>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QMutex>
#include <QMutexLocker>
#include <unistd.h>

#include "logger.h"
#include "app.h"
#include "qoutstream.h"
#include "exccommon.h"
#include "util.h"

const qint64 logger::MAX_LOGFILE_SIZE = 50000;

namespace  {

QString g_logPreamble;
int g_verbosityOrdinal = 2;
pid_t g_pid;
// messages arrive from the verification workers as well
QMutex g_logMutex;
QFile g_logFile;
QTextStream g_logStream;


/// Order of the Qt message types, matching app::verbosities()
int ordinal(QtMsgType msgType)
{
    switch (msgType) {
    case QtDebugMsg: return 0;
    case QtInfoMsg: return 1;
    case QtWarningMsg: return 2;
    case QtCriticalMsg: return 3;
    case QtFatalMsg: return 4;
    }
    return 2;
}

const char* levelName(QtMsgType msgType)
{
    switch (msgType) {
    case QtDebugMsg: return "dbg";
    case QtInfoMsg: return "info";
    case QtWarningMsg: return "warning";
    case QtCriticalMsg: return "critical";
    case QtFatalMsg: return "fatal";
    }
    return "warning";
}

/// @throws QExcIo
void openLogFile(const QString& path){
    g_logFile.setFileName(path);
    if(! g_logFile.open(QFile::Append | QFile::Text)){
        throw QExcIo(qtr("Failed to open logfile at %1 - %2").arg(path,
                     g_logFile.errorString()));
    }
}

void messageHandler(QtMsgType msgType, const QMessageLogContext &context, const QString &msg)
{
    const int typeOrdinal = ordinal(msgType);
    QMutexLocker lock(&g_logMutex);

    if (msgType == QtDebugMsg) {
#ifndef NDEBUG
        if(typeOrdinal >= g_verbosityOrdinal){
            QErr() << g_logPreamble << " dbg "
                   << "(" << QFileInfo(context.file).fileName() << ":" << context.line << "): "
                   << msg << '\n';
        }
#else
        Q_UNUSED(context)
#endif
        return;
    }

    const QString dateTime = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss");
    if(typeOrdinal >= g_verbosityOrdinal){
        QErr() << g_logPreamble << ' ' << dateTime << ' ' << levelName(msgType)
               << ": " << msg << '\n';
    }
    if(g_logFile.isOpen()){
        g_logStream << dateTime << ' ' << levelName(msgType)
                    << " pid " << g_pid << ": " << msg << '\n';
        g_logStream.flush();
    }
}

} // namespace


/// @param preamble: printed before every message on stderr
void logger::setup(const QString& preamble)
{
    g_logPreamble = preamble;
    g_pid = getpid();
    qInstallMessageHandler(messageHandler);
}

/// Append messages to logDir()/log_<filename>. A file larger than
/// MAX_LOGFILE_SIZE is moved to *_old first.
/// @throws QExcIo
void logger::enableLogToFile(const QString& filename)
{
    if( ! QDir().mkpath(logDir())){
        throw QExcIo(qtr("Failed to create %1").arg(logDir()));
    }
    const QString path = logDir() + "/log_" + filename;

    QMutexLocker lock(&g_logMutex);
    g_logStream.setDevice(nullptr);
    g_logFile.close();
    openLogFile(path);
    if(g_logFile.size() > MAX_LOGFILE_SIZE){
        g_logFile.close();
        const QString oldPath = path + "_old";
        QFile::remove(oldPath);
        if(! QFile::rename(path, oldPath)){
            QIErr() << qtr("Failed to rotate logfile %1").arg(path);
        }
        openLogFile(path);
    }
    g_logStream.setDevice(&g_logFile);
}

void logger::setVerbosityLevel(QtMsgType lvl)
{
    g_verbosityOrdinal = ordinal(lvl);
}

/// @param verbosity: one of app::verbosities()
/// @throws QExcIllegalArgument
void logger::setVerbosityLevel(const QString &verbosity)
{
    const int idx = app::verbosities().indexOf(verbosity);
    if(idx == -1){
        throw QExcIllegalArgument(qtr("Unknown verbosity '%1'").arg(verbosity));
    }
    g_verbosityOrdinal = idx;
}

const QString& logger::logDir()
{
    static const QString logDir = QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
    return logDir;
}
