#include <QDir>
#include <QFileInfo>
#include <QReadLocker>
#include <QWriteLocker>

#include "tweetstore.h"
#include "compat.h"
#include "db_conversions.h"
#include "digest.h"
#include "insertifnotexist.h"
#include "qexcdatabase.h"
#include "qfilethrow.h"
#include "staticinitializer.h"
#include "logger.h"

using db_conversions::fromTwitterId;
using db_conversions::toTwitterId;

const QString TweetStore::DEFAULT_SCHEMA_PATH = QStringLiteral(":/schemas/tweet.sql");

// resources of a static library must be initialized explicitly
// (outside of any namespace).
static void initSchemaResource(){
    Q_INIT_RESOURCE(schemas);
}

namespace  {

/// NOT NULL columns: bind an empty string instead of a null QString
QString nonNull(const QString& str){
    return (str.isNull()) ? QString("") : str;
}

bool tweetTableExists(QSqlQueryThrow& query){
    query.exec("SELECT name FROM sqlite_master WHERE type='table' AND name='tweet'");
    return query.next();
}

/// @throws QExcIo
QStringList readSchemaStatements(const QString& schemaPath){
    QFileThrow f(schemaPath);
    f.open(QFile::ReadOnly | QFile::Text);
    const QString schema = QString::fromUtf8(f.readAll());
    QStringList statements;
    for(const QString& stmt : schema.split(';', Qt::SkipEmptyParts)){
        if(! stmt.trimmed().isEmpty()){
            statements.push_back(stmt);
        }
    }
    return statements;
}

qint64 countRows(QSqlQueryThrow& query, const QString& table){
    query.exec("select count(*) from " + table);
    query.next(true);
    return qVariantTo_throw<qint64>(query.value(0));
}

} // namespace


/// Open or create the database at path.
/// @param recreate: drop and re-create all tables of an existing database
/// @param schemaPath: sql file to create the tables. If empty, the
/// built-in schema is used.
/// @throws QExcDatabase, QExcIo
TweetStore::TweetStore(const QString &path, bool recreate, const QString &schemaPath) :
    m_conn(path)
{
    static StaticInitializer loader( [](){
        initSchemaResource();
    });
    const QString dir = QFileInfo(path).absolutePath();
    if(! QDir().mkpath(dir)){
        throw QExcIo(qtr("Failed to create the directory for the database at %1")
                     .arg(dir));
    }
    setupSchema(recreate, schemaPath.isEmpty() ? DEFAULT_SCHEMA_PATH : schemaPath);
}

/// @return the file id for the digest or null, if it is not indexed
/// @throws QExcDatabase
NullableValue<qint64> TweetStore::checkDigest(const QString &digest)
{
    QReadLocker lock(&m_lock);
    auto query = m_conn.mkQuery();
    query->prepare("select id from file where digest = ?");
    query->addBindValue(digest::normalizeDigest(digest));
    query->exec();
    if(! query->next()){
        return {};
    }
    return qVariantTo_throw<qint64>(query->value(0));
}

/// Index the tweets of one archived file within a single transaction.
/// The file must not be indexed yet (see checkDigest), otherwise the unique
/// constraint on the digest fails and nothing is written.
/// @return the id of the new file row
/// @throws QExcDatabase
qint64 TweetStore::addTweets(const QString &digest,
                             const NullableValue<quint64> &primaryTwitterId,
                             const TweetInfos &tweets)
{
    QWriteLocker lock(&m_lock);
    auto query = m_conn.mkQuery();
    // committed on success, rolled back if an exception leaves this scope
    query->transaction();

    query->prepare("insert into file (digest, primary_twitter_id) values (?, ?)");
    query->addBindValue(digest::normalizeDigest(digest));
    query->addBindValue(fromTwitterId(primaryTwitterId));
    query->exec();
    const qint64 fileId = qVariantTo_throw<qint64>(query->lastInsertId());

    int newTweetCount = 0;
    for(const TweetInfo& tweet : tweets){
        db_tweet::InsertIfNotExist userInsert(*query, "user");
        userInsert.add("twitter_id", fromTwitterId(tweet.userId));
        userInsert.add("screen_name", nonNull(tweet.userScreenName));
        userInsert.add("name", nonNull(tweet.userName));
        const qint64 userId = userInsert.exec();

        // no parent: the tweet references itself
        db_tweet::InsertIfNotExist tweetInsert(*query, "tweet");
        tweetInsert.add("twitter_id", fromTwitterId(tweet.id));
        tweetInsert.add("parent_twitter_id", fromTwitterId(tweet.parentId.valueOr(tweet.id)));
        tweetInsert.add("ts", db_conversions::fromDateTime(tweet.time));
        tweetInsert.add("user_twitter_id", fromTwitterId(tweet.userId));
        tweetInsert.add("content", nonNull(tweet.text));
        bool existed;
        const qint64 tweetId = tweetInsert.exec(&existed);
        if(! existed){
            ++newTweetCount;
        }

        query->prepare("insert into tweet_file (tweet_id, file_id, user_id) values (?, ?, ?)");
        query->addBindValues({tweetId, fileId, userId});
        query->exec();
    }
    query->commit();
    logDebug << "indexed" << tweets.size() << "tweets (" << newTweetCount << "new) of"
             << digest;
    return fileId;
}

/// For every id select the stored revision with the longest content.
/// Ids which are not found (or fail) are logged and omitted.
QVector<TweetWithDigest> TweetStore::getTweets(const QVector<quint64> &statusIds)
{
    QReadLocker lock(&m_lock);
    QVector<TweetWithDigest> result;
    auto query = m_conn.mkQuery();
    query->prepare(
        "select tweet.parent_twitter_id, tweet.ts, tweet.user_twitter_id, "
               "user.screen_name, user.name, tweet.content, file.digest "
        "from tweet "
        "join tweet_file on tweet_file.tweet_id = tweet.id "
        "join file on file.id = tweet_file.file_id "
        "join user on user.id = tweet_file.user_id "
        "where tweet.twitter_id = ? "
        "order by length(tweet.content) desc, tweet_file.id asc "
        "limit 1");

    for(const quint64 id : statusIds){
        try {
            query->bindValue(0, fromTwitterId(id));
            query->exec();
            if(! query->next()){
                logWarning << qtr("No tweet found for id %1").arg(id);
                continue;
            }
            TweetWithDigest t;
            t.tweet.id = id;
            const quint64 parent = toTwitterId(query->value(0));
            if(parent != id){
                t.tweet.parentId = parent;
            }
            t.tweet.time = db_conversions::toDateTime(query->value(1));
            t.tweet.userId = toTwitterId(query->value(2));
            t.tweet.userScreenName = query->value(3).toString();
            t.tweet.userName = query->value(4).toString();
            t.tweet.text = query->value(5).toString();
            t.digest = query->value(6).toString();
            result.push_back(t);
        } catch (const QExcCommon& ex) {
            logWarning << qtr("Failed to query tweet %1: %2").arg(id).arg(ex.descrip());
        }
    }
    return result;
}

/// @return one record per twitter user id, ordered by id
/// @throws QExcDatabase
QVector<UserRecord> TweetStore::queryUsers()
{
    QReadLocker lock(&m_lock);
    auto query = m_conn.mkQuery();
    query->exec(
        "select user.twitter_id, user.screen_name, user.name, "
               "(select max(ts) from tweet where tweet.user_twitter_id = user.twitter_id) "
        "from user order by user.twitter_id, user.id");

    QVector<UserRecord> users;
    while (query->next()) {
        const quint64 twitterId = toTwitterId(query->value(0));
        if(users.isEmpty() || users.last().twitterId != twitterId){
            UserRecord r;
            r.twitterId = twitterId;
            if(! query->value(3).isNull()){
                r.lastSeen = db_conversions::toDateTime(query->value(3));
            }
            users.push_back(r);
        }
        UserRecord& r = users.last();
        const QString screenName = query->value(1).toString();
        const QString name = query->value(2).toString();
        if(! r.screenNames.contains(screenName)){
            r.screenNames.push_back(screenName);
        }
        if(! r.names.contains(name)){
            r.names.push_back(name);
        }
    }
    return users;
}

/// @throws QExcDatabase
TweetCounts TweetStore::counts()
{
    QReadLocker lock(&m_lock);
    auto query = m_conn.mkQuery();
    TweetCounts c;
    c.users = countRows(*query, "user");
    c.files = countRows(*query, "file");
    c.tweets = countRows(*query, "tweet");
    c.tweetFiles = countRows(*query, "tweet_file");
    return c;
}

const QString &TweetStore::path() const
{
    return m_conn.dbPath();
}

void TweetStore::setupSchema(bool recreate, const QString &schemaPath)
{
    QWriteLocker lock(&m_lock);
    auto query = m_conn.mkQuery();
    const bool exists = tweetTableExists(*query);
    if(exists && ! recreate){
        return;
    }
    const QStringList statements = readSchemaStatements(schemaPath);

    query->transaction();
    if(exists){
        logInfo << qtr("Dropping all tables of %1").arg(m_conn.dbPath());
        for(const char* table : {"tweet_file", "tweet", "file", "user"}){
            query->exec(QString("DROP TABLE IF EXISTS ") + table);
        }
    } else {
        logInfo << qtr("Creating new tweet database at %1").arg(m_conn.dbPath());
    }
    for(const QString& stmt : statements){
        query->exec(stmt);
    }
    query->commit();
}
