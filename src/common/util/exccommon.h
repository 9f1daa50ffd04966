#pragma once

#include <exception>
#include <QString>
#include <QByteArray>


/// Base of all exceptions thrown by wbmstore. The description
/// is translated and optionally followed by a stacktrace.
class QExcCommon : public std::exception
{
public:
    explicit QExcCommon(QString  text, bool collectStacktrace=true);

    const char *what () const noexcept override;
    QString descrip() const;
    void setDescrip(const QString &descrip);

protected:
    void appendStacktraceToDescrip();

    QString m_descrip;

private:
    mutable QByteArray m_local8Bit;
};


class QExcIllegalArgument : public QExcCommon
{
public:
    QExcIllegalArgument(const QString & text);
};

/// Thrown in case of a detected bug^^
class QExcProgramming : public QExcCommon
{
public:
    QExcProgramming(const QString & text);
};


class QExcIo : public QExcCommon
{
public:
    explicit QExcIo(QString  text, bool collectStacktrace=true);
    int errorNumber() const;
private:
    int m_errorNumber;
};
