#include "qoutstream.h"


QStdStream::QStdStream(FILE *f) :
    m_ts(f)
{}

QStdStream::~QStdStream()
{
    m_ts.flush();
}


QString QIErr::s_preamble;

QIErr::QIErr() :
    m_ts(stderr)
{
    m_ts << s_preamble;
}

QIErr::~QIErr()
{
    m_ts << '\n';
    m_ts.flush();
}

void QIErr::setPreamble(const QString &preamble){
    s_preamble = preamble;
}
