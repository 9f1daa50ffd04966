#pragma once

#include <QFile>

/// A QFile which throws QExcIo instead of returning error codes
class QFileThrow : public QFile
{
public:
    using QFile::QFile;

    void flush();

    bool open(QFile::OpenMode flags) override;

    bool seek(qint64 offset) override;

    void rename(const QString& newName);

protected:
    qint64 readData(char *data, qint64 maxlen) override;
    qint64 readLineData(char *data, qint64 maxlen) override;
    qint64 writeData(const char *data, qint64 len) override;

};
