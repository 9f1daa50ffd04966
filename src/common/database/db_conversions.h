#pragma once

#include <QDateTime>
#include <QVariant>

#include "nullable_value.h"

/// Conversions between application types and the values stored in sqlite.
namespace db_conversions {

    // sqlite only knows signed 64 bit integers: twitter ids are stored
    // bit-identical as qint64.
    QVariant fromTwitterId(quint64 id);
    QVariant fromTwitterId(const NullableValue<quint64>& id);
    quint64 toTwitterId(const QVariant& var);

    // timestamps are stored as seconds since epoch (UTC)
    QVariant fromDateTime(const QDateTime& dt);
    QDateTime toDateTime(const QVariant& var);
}
