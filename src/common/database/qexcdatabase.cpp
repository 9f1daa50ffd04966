#include "qexcdatabase.h"


QExcDatabase::QExcDatabase(const QString &preamble, const QSqlError &err) :
    QExcCommon (preamble, false),
    m_nativeErrorCode(-1)
{
    bool ok;
    const int code = err.nativeErrorCode().toInt(&ok);
    if(ok){
        m_nativeErrorCode = code;
    }
    if(! descrip().isEmpty()){
        setDescrip( descrip() + ": ");
    }
    setDescrip( descrip() + err.text()
                + " ("+ err.nativeErrorCode() + ')');
}

QExcDatabase::QExcDatabase(const QString &preamble) :
    QExcCommon (preamble, false),
    m_nativeErrorCode(-1)
{}

int QExcDatabase::nativeErrorCode() const
{
    return m_nativeErrorCode;
}
