#include <QSqlError>
#include <QStringList>
#include <QThread>
#include <cstdio>
#include <exception>

#include "qsqlquerythrow.h"
#include "qexcdatabase.h"
#include "logger.h"
#include "util.h"

namespace  {

enum SQLITE_ERR { SQLITE_ERR_BUSY = 5, SQLITE_ERR_LOCKED = 6 };

const int MAX_BUSY_RETRIES = 10;

/// The native error code is empty for errors raised by qt itself.
int sqlerrToNumber(const QSqlError & err){
    bool ok;
    const int nb = err.nativeErrorCode().toInt(&ok);
    return (ok) ? nb : -1;
}

} // namespace


QSqlQueryThrow::QSqlQueryThrow(const QSqlDatabase& db)
    : QSqlQuery (db),
      m_execWasCalled(false),
      m_withinTransaction(false)
{}

QSqlQueryThrow::~QSqlQueryThrow()
{
    if(! m_withinTransaction){
        return;
    }
    try {
        if (std::uncaught_exception()) {
            this->rollback();
        } else {
            this->commit();
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "%s: %s\n", __func__, e.what());
    }
}

/// @throws QExcDatabase
void QSqlQueryThrow::exec()
{
    this->doExec(QString());
}

/// @throws QExcDatabase
void QSqlQueryThrow::exec(const QString &query)
{
    this->doExec(query);
}

/// @throws QExcDatabase
void QSqlQueryThrow::prepare(const QString &query)
{
    if(! QSqlQuery::prepare(query)){
        throw QExcDatabase(qtr("prepare <%1> failed").arg(query), this->lastError());
    }
    m_execWasCalled = false;
}

/// @param throwIfEmpty: throw, if there is no (further) result.
/// @throws QExcDatabase
bool QSqlQueryThrow::next(bool throwIfEmpty)
{
    if(! m_execWasCalled){
        throw QExcDatabase(QString("%1 was called without previous exec ")
                           .arg(__func__));
    }
    bool ret = QSqlQuery::next();
    if(throwIfEmpty && ! ret){
         throw QExcDatabase(qtr("The query %1 was expected to have (another) result which is "
                                "not the case").arg(this->lastQuery()));
    }
    return ret;
}

void QSqlQueryThrow::addBindValues(const QVariantList &vals)
{
    for(const auto& val : vals){
        this->addBindValue(val);
    }
}


/// Note: while qt's QSqlDatabase starts transactions in SQLITE in 'deferred' mode,
/// we rather choose 'immediate', so the write lock is obtained up front. See also
/// https://www.sqlite.org/lang_transaction.html
/// @throws QExcDatabase
void QSqlQueryThrow::transaction()
{
    if(m_withinTransaction){
        throw QExcProgramming(qtr("transaction() called twice"));
    }
    this->exec("BEGIN IMMEDIATE");
    m_withinTransaction = true;
}

/// @throws QExcDatabase
void QSqlQueryThrow::commit()
{
    if(! m_withinTransaction){
        throw QExcProgramming(qtr("commit() called outside of a transaction"));
    }
    m_withinTransaction = false;
    this->exec("COMMIT");
}

/// @throws QExcDatabase
void QSqlQueryThrow::rollback()
{
    if(! m_withinTransaction){
        throw QExcProgramming(qtr("rollback() called outside of a transaction"));
    }
    m_withinTransaction = false;
    this->exec("ROLLBACK");
}

bool QSqlQueryThrow::withinTransaction() const
{
    return m_withinTransaction;
}


QString QSqlQueryThrow::generateExcMsgExec(const QString &queryStr)
{
    QStringList vals;
    for(const auto& entry : this->boundValues()){
        vals.push_back(entry.toString());
    }

    QString valStr;
    if(! vals.isEmpty()){
        valStr = " with values <" + vals.join(", ") + ">";
    }

    QString msg = "exec <" + queryStr + ">" + valStr + " failed";
    return msg;
}

/// Execute the query, retrying a few times if the database is busy
/// (busy timeout of the connection exceeded).
void QSqlQueryThrow::doExec(const QString &query)
{
    for(int i=0; i < MAX_BUSY_RETRIES; i++){
        bool success = query.isEmpty() ? QSqlQuery::exec() : QSqlQuery::exec(query);
        if(success){
            m_execWasCalled = true;
            return;
        }
        const int errNb = sqlerrToNumber(this->lastError());
        if(errNb == SQLITE_ERR_BUSY || errNb == SQLITE_ERR_LOCKED){
            logInfo << "Sqlquery failed with busy timeout. trying again in a "
                       "moment:" << (query.isEmpty()?this->lastQuery():query) ;
            QThread::msleep(static_cast<unsigned long>(200 * (i + 1)));
        } else {
            // throw immediatly (below)
            break;
        }
    }
    throw QExcDatabase(generateExcMsgExec(query.isEmpty()?this->lastQuery():query),
                       this->lastError());
}
