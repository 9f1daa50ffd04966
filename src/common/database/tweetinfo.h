#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVector>

#include "exccommon.h"
#include "nullable_value.h"

class QJsonObject;

/// A json document does not describe a valid tweet
class ExcTweetJson : public QExcCommon
{
public:
    explicit ExcTweetJson(const QString& text) : QExcCommon(text, false) {}
};

/// A tweet as parsed from a captured page.
struct TweetInfo {
    quint64 id {};
    /// null, if the tweet is no reply
    NullableValue<quint64> parentId;
    QDateTime time;
    quint64 userId {};
    QString userScreenName;
    QString userName;
    QString text;

    void write(QJsonObject& json) const;
    static TweetInfo fromJson(const QJsonObject& json);

    bool operator==(const TweetInfo& rhs) const;
    bool operator!=(const TweetInfo& rhs) const { return ! (*this == rhs); }
};

typedef QVector<TweetInfo> TweetInfos;

/// The tweets parsed from one archived file, as handed over
/// by the page parser.
struct TweetImport {
    QString digest;
    NullableValue<quint64> primaryTwitterId;
    TweetInfos tweets;

    static TweetImport fromJson(const QJsonObject& json);
};

struct TweetWithDigest {
    TweetInfo tweet;
    QString digest;

    void write(QJsonObject& json) const;
};

/// All screen names and names observed for one twitter user.
struct UserRecord {
    quint64 twitterId {};
    QDateTime lastSeen;
    QStringList screenNames;
    QStringList names;

    void write(QJsonObject& json) const;
};

struct TweetCounts {
    qint64 users {};
    qint64 files {};
    qint64 tweets {};
    qint64 tweetFiles {};
};
