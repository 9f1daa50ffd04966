#pragma once

#include <memory>

#include <QMutex>
#include <QSqlDatabase>
#include <QStringList>

#include "qsqlquerythrow.h"
#include "util.h"

typedef std::shared_ptr<QSqlQueryThrow> QueryPtr;

/// Connection to one sqlite database file. A QSqlDatabase may only be used
/// from the thread which created it, so every thread obtains its own
/// connection to the same file. All of them are closed on destruction.
class DbConnection
{
public:
    explicit DbConnection(QString dbPath);
    ~DbConnection();

    QSqlDatabase database();
    QueryPtr mkQuery();

    const QString& dbPath() const;

public:
    Q_DISABLE_COPY(DbConnection)
    DISABLE_MOVE(DbConnection)

private:
    QString m_dbPath;
    QString m_connectionPrefix;
    QMutex m_mutex;
    QStringList m_connectionNames;
};
