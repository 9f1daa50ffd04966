#pragma once

#include <cstdio>
#include <QString>
#include <QTextStream>


/// Print QString's and other QTextStream compatible types
/// to a standard stream, flushed on destruction.
class QStdStream
{
public:
    explicit QStdStream(FILE* f);
    ~QStdStream();

    template<class T>
    QStdStream& operator<<(const T& t) {
        m_ts << t;
        return *this;
    }
protected:
    QTextStream m_ts;
};

/// stdout, used for the command results of wbmd
class QOut : public QStdStream
{
public:
    QOut() : QStdStream(stdout) {}
};

/// stderr, used by the logger
class QErr : public QStdStream
{
public:
    QErr() : QStdStream(stderr) {}
};


/// Informative stderr for messages to the user of the command line.
/// Each message starts with the preamble (the application name),
/// streamed values are separated by whitespace and a newline is
/// added on destruction:
/// QIErr() << "Invalid command:" << cmd;
class QIErr
{
public:
    QIErr();
    ~QIErr();

    template<class T>
    QIErr& operator<<(const T& t) {
        if(m_writtenTo){
            m_ts << ' ';
        } else {
            m_writtenTo = true;
        }
        m_ts << t;
        return *this;
    }

    static void setPreamble(const QString& preamble);
private:
    bool m_writtenTo {false};
    QTextStream m_ts;
    static QString s_preamble;
};
