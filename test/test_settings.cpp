#include <QDir>
#include <QFileInfo>
#include <QTest>

#include "autotest.h"
#include "exccfg.h"
#include "helper_for_test.h"
#include "settings.h"


class SettingsTest : public QObject {
    Q_OBJECT

private slots:
    void tDefaults() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        const QString cfgPath = tmp->path() + "/cfg/config.ini";
        auto& sets = Settings::instance();
        sets.load(cfgPath);
        QVERIFY(sets.settingsLoaded());
        QCOMPARE(sets.cfgFilepath(), cfgPath);
        QCOMPARE(sets.archiveDir(), Settings::defaultDataDir() + "/archive");
        QCOMPARE(sets.tweetDatabase(), Settings::defaultDataDir() + "/tweets.db");
        QVERIFY(sets.tweetSchema().isEmpty());
        QCOMPARE(sets.parallelism(), 6);
        QCOMPARE(sets.verbosity(), QString("warning"));
        QVERIFY(! sets.logToFile());

        // a new config file is written with the defaults as comments
        QVERIFY(QFileInfo::exists(cfgPath));
        const QString stored = testhelper::readStringFromFile(cfgPath);
        QVERIFY(stored.contains("[archive]"));
        QVERIFY(stored.contains("# parallelism = 6"));
    }

    void tValues() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        const QString cfgPath = tmp->path() + "/config.ini";
        testhelper::writeStringToFile(cfgPath,
                                      "[archive]\n"
                                      "dir = ~/my_archive\n"
                                      "parallelism = 2\n"
                                      "[tweets]\n"
                                      "database = /tmp/tweets.db\n"
                                      "[logging]\n"
                                      "verbosity = info\n"
                                      "unexpected_key = 1\n");
        auto& sets = Settings::instance();
        sets.load(cfgPath);
        QCOMPARE(sets.archiveDir(), QDir::homePath() + "/my_archive");
        QCOMPARE(sets.parallelism(), 2);
        QCOMPARE(sets.tweetDatabase(), QString("/tmp/tweets.db"));
        QCOMPARE(sets.verbosity(), QString("info"));
    }

    void tInvalid() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        const QString cfgPath = tmp->path() + "/config.ini";
        auto& sets = Settings::instance();

        testhelper::writeStringToFile(cfgPath, "[archive]\nparallelism = 0\n");
        QVERIFY_EXCEPTION_THROWN(sets.load(cfgPath), qsimplecfg::ExcCfg);

        testhelper::writeStringToFile(cfgPath, "[logging]\nverbosity = loud\n");
        QVERIFY_EXCEPTION_THROWN(sets.load(cfgPath), qsimplecfg::ExcCfg);

        testhelper::writeStringToFile(cfgPath, "no section = 1\n");
        QVERIFY_EXCEPTION_THROWN(sets.load(cfgPath), qsimplecfg::ExcCfg);
    }
};

DECLARE_TEST(SettingsTest)

#include "test_settings.moc"
