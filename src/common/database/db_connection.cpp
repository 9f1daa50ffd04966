#include <QAtomicInt>
#include <QMutexLocker>
#include <QSqlError>
#include <utility>

#include "db_connection.h"
#include "qexcdatabase.h"
#include "logger.h"

namespace  {
QAtomicInt g_connectionCounter;
QAtomicInt g_threadCounter;

/// Unlike QThread::currentThreadId() never reused for a later thread
int threadSerial(){
    static thread_local const int serial = g_threadCounter.fetchAndAddRelaxed(1);
    return serial;
}

} // namespace


DbConnection::DbConnection(QString dbPath) :
    m_dbPath(std::move(dbPath)),
    m_connectionPrefix(QString("wbmstore_%1_").arg(g_connectionCounter.fetchAndAddRelaxed(1)))
{}

DbConnection::~DbConnection()
{
    QMutexLocker lock(&m_mutex);
    for(const QString& name : m_connectionNames){
        QSqlDatabase::removeDatabase(name);
    }
}

/// @return the (open) connection of the calling thread
/// @throws QExcDatabase
QSqlDatabase DbConnection::database()
{
    const QString name = m_connectionPrefix + QString::number(threadSerial());
    if(QSqlDatabase::contains(name)){
        QSqlDatabase db = QSqlDatabase::database(name, false);
        if(db.isOpen()){
            return db;
        }
    }

    QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", name);
    if(! db.isValid()){
        throw QExcDatabase(qtr("Failed to add qt's sqlite database driver. "
                               "Is the driver installed?"));
    }
    {
        QMutexLocker lock(&m_mutex);
        if(! m_connectionNames.contains(name)){
            m_connectionNames.push_back(name);
        }
    }
    // give enough time for concurrent writers
    db.setConnectOptions("QSQLITE_BUSY_TIMEOUT=15000");
    db.setDatabaseName(m_dbPath);
    if(! db.open()) {
        throw QExcDatabase(qtr("Failed to open database %1").arg(m_dbPath), db.lastError());
    }
    logDebug << "opened database connection" << name;
    QSqlQueryThrow query(db);
    query.exec("PRAGMA foreign_keys=ON");
    return db;
}

/// @throws QExcDatabase
QueryPtr DbConnection::mkQuery()
{
    return std::make_shared<QSqlQueryThrow>(database());
}

const QString &DbConnection::dbPath() const
{
    return m_dbPath;
}
