#pragma once

#include <QtGlobal>
#include <QDebug>
#include <QString>

#define logDebug qDebug()
#define logInfo qInfo().noquote()
#define logWarning qWarning().noquote()
#define logCritical qCritical().noquote()


/// Log messages go to stderr as
/// <preamble> <date> <level>: <message>
/// if their level reaches the verbosity. Optionally all messages
/// except debug ones are appended to a log file as well.
namespace logger {

extern const qint64 MAX_LOGFILE_SIZE;

void setup(const QString &preamble);

void enableLogToFile(const QString &filename);

void setVerbosityLevel(QtMsgType lvl);
void setVerbosityLevel(const QString& verbosity);

const QString &logDir();

}
