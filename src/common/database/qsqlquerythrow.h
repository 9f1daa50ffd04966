#pragma once

#include <QSqlQuery>
#include <QVariant>
#include <QVector>

/// A QSqlQuery which throws QExcDatabase on error. A transaction
/// started with transaction() is committed on destruction, or rolled
/// back, if the query is destroyed during stack unwinding.
class QSqlQueryThrow : public QSqlQuery
{
public:
    explicit QSqlQueryThrow(const QSqlDatabase& db);
    ~QSqlQueryThrow();

    void exec();
    void exec(const QString& query);

    void prepare(const QString& query);

    bool next(bool throwIfEmpty=false);

    void addBindValues(const QVariantList& vals);

    void transaction();
    void commit();
    void rollback();

    bool withinTransaction() const;

public:
    // disable-copies: transactions cannot be copied...
    QSqlQueryThrow(const QSqlQueryThrow &) = delete ;
    void operator=(const QSqlQueryThrow &) = delete ;

private:
    void doExec(const QString& query);
    QString generateExcMsgExec(const QString& queryStr);

    bool m_execWasCalled;
    bool m_withinTransaction;
};
