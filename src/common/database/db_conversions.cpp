#include <cstring>

#include "db_conversions.h"
#include "util.h"

QVariant db_conversions::fromTwitterId(quint64 id)
{
    qint64 signedId;
    static_assert(sizeof(signedId) == sizeof(id), "unexpected size of qint64");
    memcpy(&signedId, &id, sizeof(id));
    return QVariant(signedId);
}

QVariant db_conversions::fromTwitterId(const NullableValue<quint64> &id)
{
    if(id.isNull()){
        return QVariant(QVariant::LongLong);
    }
    return fromTwitterId(id.value());
}

/// @throws ExcQVariantConvert
quint64 db_conversions::toTwitterId(const QVariant &var)
{
    const qint64 signedId = qVariantTo_throw<qint64>(var);
    quint64 id;
    memcpy(&id, &signedId, sizeof(id));
    return id;
}

/// Seconds since epoch, milliseconds are dropped.
QVariant db_conversions::fromDateTime(const QDateTime &dt)
{
    return QVariant(dt.toMSecsSinceEpoch() / 1000);
}

/// @throws ExcQVariantConvert
QDateTime db_conversions::toDateTime(const QVariant &var)
{
    const qint64 secs = qVariantTo_throw<qint64>(var);
    return QDateTime::fromMSecsSinceEpoch(secs * 1000, Qt::UTC);
}
