#include <QJsonArray>
#include <QJsonObject>

#include "tweetinfo.h"
#include "digest.h"
#include "util.h"

namespace  {

const double TWO_POW_64 = 18446744073709551616.0;

/// Twitter ids exceed the precision of a double, so they are
/// written as strings. Reading accepts both, strings and (small) numbers.
quint64 idFromJson(const QJsonObject& json, const QString& key){
    const QJsonValue val = json.value(key);
    if(val.isString()){
        bool ok;
        quint64 id = val.toString().toULongLong(&ok);
        if(ok){
            return id;
        }
    } else if(val.isDouble()){
        const double d = val.toDouble();
        // the cast is only defined for values quint64 can hold
        if(d >= 0 && d < TWO_POW_64 &&
                d == static_cast<double>(static_cast<quint64>(d))){
            return static_cast<quint64>(d);
        }
    }
    throw ExcTweetJson(qtr("Invalid or missing id '%1'").arg(key));
}

QString stringFromJson(const QJsonObject& json, const QString& key){
    const QJsonValue val = json.value(key);
    if(! val.isString()){
        throw ExcTweetJson(qtr("Invalid or missing string '%1'").arg(key));
    }
    return val.toString();
}

NullableValue<quint64> nullableIdFromJson(const QJsonObject& json, const QString& key){
    const QJsonValue val = json.value(key);
    if(val.isNull() || val.isUndefined()){
        return {};
    }
    return idFromJson(json, key);
}

QJsonValue idToJson(quint64 id){
    return QString::number(id);
}

} // namespace


void TweetInfo::write(QJsonObject &json) const
{
    json["id"] = idToJson(id);
    json["parent_id"] = (parentId.isNull()) ? QJsonValue() : idToJson(parentId.value());
    json["time"] = time.toUTC().toString(Qt::ISODate);
    json["user_id"] = idToJson(userId);
    json["user_screen_name"] = userScreenName;
    json["user_name"] = userName;
    json["text"] = text;
}

/// @throws ExcTweetJson
TweetInfo TweetInfo::fromJson(const QJsonObject &json)
{
    TweetInfo t;
    t.id = idFromJson(json, "id");
    t.parentId = nullableIdFromJson(json, "parent_id");
    const QString timeStr = stringFromJson(json, "time");
    t.time = QDateTime::fromString(timeStr, Qt::ISODate);
    if(! t.time.isValid()){
        throw ExcTweetJson(qtr("Invalid time '%1' of tweet %2").arg(timeStr).arg(t.id));
    }
    if(t.time.timeSpec() == Qt::LocalTime){
        // no offset given
        t.time.setTimeSpec(Qt::UTC);
    }
    // stored with seconds resolution
    t.time = t.time.toUTC().addMSecs(-t.time.time().msec());
    t.userId = idFromJson(json, "user_id");
    t.userScreenName = stringFromJson(json, "user_screen_name");
    t.userName = stringFromJson(json, "user_name");
    t.text = stringFromJson(json, "text");
    return t;
}

bool TweetInfo::operator==(const TweetInfo &rhs) const
{
    return id == rhs.id &&
           parentId == rhs.parentId &&
           time == rhs.time &&
           userId == rhs.userId &&
           userScreenName == rhs.userScreenName &&
           userName == rhs.userName &&
           text == rhs.text;
}


/// @throws ExcTweetJson
TweetImport TweetImport::fromJson(const QJsonObject &json)
{
    TweetImport imp;
    imp.digest = digest::normalizeDigest(stringFromJson(json, "digest"));
    if(! digest::isWellFormedDigest(imp.digest)){
        throw ExcTweetJson(qtr("Invalid digest '%1'").arg(imp.digest));
    }
    imp.primaryTwitterId = nullableIdFromJson(json, "primary_twitter_id");
    const QJsonValue tweets = json.value("tweets");
    if(! tweets.isArray()){
        throw ExcTweetJson(qtr("Invalid or missing array 'tweets'"));
    }
    for(const QJsonValue& val : tweets.toArray()){
        if(! val.isObject()){
            throw ExcTweetJson(qtr("Tweet is not a json object"));
        }
        imp.tweets.push_back(TweetInfo::fromJson(val.toObject()));
    }
    return imp;
}


void TweetWithDigest::write(QJsonObject &json) const
{
    tweet.write(json);
    json["digest"] = digest;
}


void UserRecord::write(QJsonObject &json) const
{
    json["id"] = idToJson(twitterId);
    json["last_seen"] = lastSeen.toUTC().toString(Qt::ISODate);
    json["screen_names"] = QJsonArray::fromStringList(screenNames);
    json["names"] = QJsonArray::fromStringList(names);
}
