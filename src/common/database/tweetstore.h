#pragma once

#include <QReadWriteLock>
#include <QString>
#include <QVector>

#include "db_connection.h"
#include "nullable_value.h"
#include "tweetinfo.h"

/// Sqlite index of tweets and the archived files which captured them.
/// Identical tweets of different captures are stored only once, but
/// every occurrence is linked to its file (tweet_file). Writers are
/// serialized, readers may run concurrently.
class TweetStore
{
public:
    static const QString DEFAULT_SCHEMA_PATH;

    TweetStore(const QString& path, bool recreate,
               const QString& schemaPath=QString());

    NullableValue<qint64> checkDigest(const QString& digest);

    qint64 addTweets(const QString& digest,
                     const NullableValue<quint64>& primaryTwitterId,
                     const TweetInfos& tweets);

    QVector<TweetWithDigest> getTweets(const QVector<quint64>& statusIds);

    QVector<UserRecord> queryUsers();

    TweetCounts counts();

    const QString& path() const;

public:
    Q_DISABLE_COPY(TweetStore)
    DISABLE_MOVE(TweetStore)

private:
    void setupSchema(bool recreate, const QString& schemaPath);

    DbConnection m_conn;
    QReadWriteLock m_lock;
};
