#pragma once

#include <QSqlError>

#include "exccommon.h"

/// Failure to open, set up or query the database.
class QExcDatabase : public QExcCommon
{
public:
     QExcDatabase(const QString & preamble,
                  const QSqlError & err);
     explicit QExcDatabase(const QString & preamble);

     /// The sqlite result code, if any, otherwise -1
     int nativeErrorCode() const;

private:
     int m_nativeErrorCode;
};
