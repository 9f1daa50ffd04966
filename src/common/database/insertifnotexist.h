#pragma once

#include <QVariant>
#include <QVector>
#include <QStringList>


class QSqlQueryThrow;

namespace db_tweet {

/// Insert values in a sql table, if these values do not already exist.
/// Requires an existing column named `id`. Columns are compared with
/// `is`, so NULL values match each other.
class InsertIfNotExist {
public:
    InsertIfNotExist(QSqlQueryThrow& parentQuery,
                     QString tablename);

    void add(const QString& colname, const QVariant& value);

    qint64 exec(bool* existed=nullptr);

private:
    QSqlQueryThrow& m_query;
    QString m_tablename;
    QStringList m_colnames;
    QVariantList m_values;
};

}
