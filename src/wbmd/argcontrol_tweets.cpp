#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include "argcontrol_tweets.h"

#include "app.h"
#include "cpp_exit.h"
#include "logger.h"
#include "qfilethrow.h"
#include "qoptargparse.h"
#include "qoutstream.h"
#include "settings.h"
#include "tweetstore.h"

namespace  {

const char* CMD_TWEETS_ADD = "tweets-add";
const char* CMD_TWEETS_GET = "tweets-get";
const char* CMD_TWEETS_USERS = "tweets-users";


QOptArg mkArgDb(){
    return QOptArg("", "db", qtr("Path of the tweet database. Defaults to %1")
                   .arg(Settings::instance().tweetDatabase()));
}

QString dbPath(const QOptArg& argDb){
    return argDb.getValue<QString>(Settings::instance().tweetDatabase());
}

void printJson(QOut& out, const QJsonObject& obj){
    out << QJsonDocument(obj).toJson(QJsonDocument::Compact) << "\n";
}

TweetImport readImport(const QString& path){
    QFileThrow f(path);
    f.open(QFile::ReadOnly);
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &err);
    if(err.error != QJsonParseError::NoError){
        throw ExcTweetJson(qtr("Failed to parse %1 at offset %2: %3")
                           .arg(path).arg(err.offset).arg(err.errorString()));
    }
    if(! doc.isObject()){
        throw ExcTweetJson(qtr("%1 does not contain a json object").arg(path));
    }
    return TweetImport::fromJson(doc.object());
}

[[noreturn]]
void tweetsAdd(int argc, char *argv[]){
    QOptArgParse parser;
    parser.setHelpIntroduction(qtr("Add the tweets parsed from one archived file "
                                   "to the index. The input is a json document of the form\n"
                                   "{\"digest\": \"...\", \"primary_twitter_id\": \"123\"|null, "
                                   "\"tweets\": [{\"id\": \"1\", \"parent_id\": \"1\"|null, "
                                   "\"time\": \"2019-01-01T10:00:00Z\", \"user_id\": \"7\", "
                                   "\"user_screen_name\": \"...\", \"user_name\": \"...\", "
                                   "\"text\": \"...\"}]}") + "\n");
    auto argDb = mkArgDb();
    parser.addArg(&argDb);
    QOptArg argInput("i", "input", qtr("The json file to import"));
    argInput.setRequired(true);
    parser.addArg(&argInput);
    QOptArg argRecreate("", "recreate", qtr("Drop all tables of an existing "
                                            "database before importing"), false);
    parser.addArg(&argRecreate);
    parser.parse(argc, argv);
    if(parser.rest().len != 0){
        QIErr() << qtr("Invalid parameters passed: %1.\n"
                       "Show help with --help").
                   arg(argvToQStr(parser.rest().len, parser.rest().argv));
        cpp_exit(1);
    }

    const TweetImport imp = readImport(argInput.getValue<QString>());
    TweetStore store(dbPath(argDb), argRecreate.wasParsed(),
                     Settings::instance().tweetSchema());
    if(! store.checkDigest(imp.digest).isNull()){
        logWarning << qtr("Tweets of %1 are already indexed - skipping").arg(imp.digest);
        cpp_exit(0);
    }
    const qint64 fileId = store.addTweets(imp.digest, imp.primaryTwitterId, imp.tweets);
    logInfo << qtr("Indexed %1 tweets of %2 (file id %3)")
               .arg(imp.tweets.size()).arg(imp.digest).arg(fileId);
    cpp_exit(0);
}

[[noreturn]]
void tweetsGet(int argc, char *argv[]){
    QOptArgParse parser;
    parser.setHelpIntroduction(qtr("Print the longest revision of each passed tweet "
                                   "as json, one object per line:\n"
                                   "%1 %2 [options] ID...").arg(app::WBMD, CMD_TWEETS_GET) + "\n");
    auto argDb = mkArgDb();
    parser.addArg(&argDb);
    parser.parse(argc, argv);

    QVector<quint64> ids;
    for(int i=0; i < parser.rest().len; i++){
        bool ok;
        const quint64 id = QString(parser.rest().argv[i]).toULongLong(&ok);
        if(! ok){
            throw ExcOptArgParse(qtr("Invalid tweet id: %1").arg(parser.rest().argv[i]));
        }
        ids.push_back(id);
    }
    if(ids.isEmpty()){
        QIErr() << qtr("No tweet id passed. Show help with --help");
        cpp_exit(1);
    }

    TweetStore store(dbPath(argDb), false, Settings::instance().tweetSchema());
    QOut out;
    for(const TweetWithDigest& t : store.getTweets(ids)){
        QJsonObject obj;
        t.write(obj);
        printJson(out, obj);
    }
    cpp_exit(0);
}

[[noreturn]]
void tweetsUsers(int argc, char *argv[]){
    QOptArgParse parser;
    parser.setHelpIntroduction(qtr("Print all known users with their screen names "
                                   "and names as json, one object per line.") + "\n");
    auto argDb = mkArgDb();
    parser.addArg(&argDb);
    parser.parse(argc, argv);
    if(parser.rest().len != 0){
        QIErr() << qtr("Invalid parameters passed: %1.\n"
                       "Show help with --help").
                   arg(argvToQStr(parser.rest().len, parser.rest().argv));
        cpp_exit(1);
    }

    TweetStore store(dbPath(argDb), false, Settings::instance().tweetSchema());
    QOut out;
    for(const UserRecord& u : store.queryUsers()){
        QJsonObject obj;
        u.write(obj);
        printJson(out, obj);
    }
    cpp_exit(0);
}

} // namespace


bool argcontrol_tweets::isTweetsCmd(const QString &cmd)
{
    static const QStringList cmds = {CMD_TWEETS_ADD, CMD_TWEETS_GET, CMD_TWEETS_USERS};
    return cmds.contains(cmd);
}

void argcontrol_tweets::parse(const QString &cmd, int argc, char *argv[])
{
    if(cmd == CMD_TWEETS_ADD){
        tweetsAdd(argc, argv);
    }
    if(cmd == CMD_TWEETS_GET){
        tweetsGet(argc, argv);
    }
    if(cmd == CMD_TWEETS_USERS){
        tweetsUsers(argc, argv);
    }
    throw QExcProgramming(qtr("Not a tweets command: %1").arg(cmd));
}
