#include <utility>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <execinfo.h>

#include "exccommon.h"

namespace  {

/// @param startIdx: frames to skip, so this function and the
/// exception constructor do not show up.
QString generateTrace(int startIdx=2)
{
    const int MAX_STACKTRACE_SIZE = 10;
    void *frames[MAX_STACKTRACE_SIZE];
    const int size = backtrace(frames, MAX_STACKTRACE_SIZE);
    char **symbols = backtrace_symbols(frames, size);
    if(symbols == nullptr){
        return QString();
    }
    QString trace;
    for (int i = startIdx; i < size; i++){
        trace += QString(" at ") + symbols[i] + "\n";
    }
    free(symbols);
    return trace;
}

} // namespace


QExcCommon::QExcCommon(QString text, bool collectStacktrace) :
    m_descrip(std::move(text))
{
    if(collectStacktrace){
       appendStacktraceToDescrip();
    }

}

const char *QExcCommon::what() const noexcept
{
    m_local8Bit = m_descrip.toLocal8Bit();
    return m_local8Bit.constData();
}

QString QExcCommon::descrip() const
{
    return m_descrip;
}

void QExcCommon::setDescrip(const QString &descrip)
{
    m_descrip = descrip;
    m_local8Bit = descrip.toLocal8Bit();
}

void QExcCommon::appendStacktraceToDescrip()
{
    m_descrip += "\n" + generateTrace();
}



QExcIllegalArgument::QExcIllegalArgument(const QString &text) :
    QExcCommon (text, false)
{

}

QExcProgramming::QExcProgramming(const QString &text) :
    QExcCommon (text)
{

}

/// Appends the current errno (if any) to the description.
QExcIo::QExcIo(QString text, bool collectStacktrace) :
    QExcCommon("", false)
{
    m_errorNumber = errno;
    if(errno != 0){
        text += " (" + QString::number(errno) +
                "): " + QString::fromLocal8Bit(strerror(errno));
    }

    this->setDescrip(text);
    if(collectStacktrace){
        appendStacktraceToDescrip();
    }
}

int QExcIo::errorNumber() const
{
    return m_errorNumber;
}
