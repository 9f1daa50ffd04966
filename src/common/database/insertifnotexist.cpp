#include <QStringList>
#include <utility>

#include "insertifnotexist.h"
#include "qsqlquerythrow.h"
#include "util.h"

db_tweet::InsertIfNotExist::InsertIfNotExist(QSqlQueryThrow &parentQuery,
                                             QString tablename) :
    m_query(parentQuery),
    m_tablename(std::move(tablename))
{}

/// Add a columnname-value pair for the prospective select/insert query.
void db_tweet::InsertIfNotExist::add(const QString &colname, const QVariant &value)
{
    m_colnames.push_back(colname);
    m_values.push_back(value);
}

/// Execute the insert-if-not exist query using the
/// previously added column-value-pairs.
/// @param existed: If non-null, set it to true, if
/// the entry already existed (so no insert was necessary).
/// @return: the existing or newly created id
/// @throws QExcDatabase
qint64 db_tweet::InsertIfNotExist::exec(bool *existed)
{
    QStringList conditions;
    for(const auto& col : m_colnames){
        conditions.push_back(col + " is ?");
    }
    m_query.prepare("select id from " + m_tablename + " where " +
                    conditions.join(" and "));
    m_query.addBindValues(m_values);
    m_query.exec();

    const bool found = m_query.next();
    if(existed != nullptr){
        *existed = found;
    }
    if(found){
        return qVariantTo_throw<qint64>(m_query.value(0));
    }

    // record did not exist, insert it
    QStringList placeholders;
    for(int i=0; i < m_colnames.size(); i++){
        placeholders.push_back("?");
    }
    m_query.prepare("insert into " + m_tablename + " (" + m_colnames.join(',') +
                    ") values (" + placeholders.join(',') + ')');
    m_query.addBindValues(m_values);
    m_query.exec();
    return qVariantTo_throw<qint64>(m_query.lastInsertId());
}
