#include <memory>
#include <QTest>
#include <QTemporaryFile>
#include <QTextStream>
#include <QDebug>

#include "cfg.h"
#include "exccfg.h"
#include "helper_for_test.h"

#include "autotest.h"

using qsimplecfg::Cfg;


class CfgTest : public QObject {
    Q_OBJECT

    const QString CONFIG_TXT = R"SOMERANDOMTEXT(
# Initial
# comment

[archive]
# archive
# comment
dir=/srv/archive
parallelism =  4

[tweets]
# tweets
# comment
schema = '''create table a(id int);
    create table b(id int)'''
note='''
one
    two

three
'''

[logging]
verbosity = '''
'''
)SOMERANDOMTEXT";

    void verifyStdCfg(Cfg& cfg){
        QVERIFY(cfg.m_parsedSections.find("archive") != cfg.m_parsedSections.end());
        auto archive = cfg["archive"];
        archive->setComments("archive\ncomment");
        QCOMPARE(archive->getValue<QString>("dir"), QString("/srv/archive") );
        QCOMPARE(archive->getValue<int>("parallelism"), 4 );

        auto tweets = cfg["tweets"];
        QCOMPARE(tweets->getValue<QString>("schema"),
                 QString("create table a(id int);\ncreate table b(id int)") );
        QCOMPARE(tweets->getValue<QString>("note"), QString("one\ntwo\n\nthree") );

        auto logging = cfg["logging"];
        QCOMPARE(logging->getValue<QString>("verbosity", "warning"), QString("warning"));

        QVERIFY(cfg.unknownKeys().isEmpty());
    }

    std::unique_ptr<QTemporaryFile> writeToTmpConfigFile(const QString& txt){
        auto file = std::unique_ptr<QTemporaryFile>(new QTemporaryFile);
        if(! file->open()){
            return file;
        }
        QTextStream stream(file.get());
        stream << txt;
        file->close();
        return file;
    }

private slots:
    void tgeneral() {
        auto file = writeToTmpConfigFile(CONFIG_TXT);
        QVERIFY(! file->fileName().isEmpty());

        Cfg cfg;
        // parse, verify, store and verify again
        cfg.parse(file->fileName());
        verifyStdCfg(cfg);
        cfg.store();

        cfg.parse(file->fileName());
        verifyStdCfg(cfg);
    }

    void tDefaultsAndUnknownKeys(){
        auto file = writeToTmpConfigFile("[sect]\nknown = 5\nunknown = foo\n"
                                         "[other]\nkey = 1\n");
        QVERIFY(! file->fileName().isEmpty());

        Cfg cfg;
        cfg.parse(file->fileName());
        auto sect = cfg["sect"];
        QCOMPARE(sect->getValue<int>("known", 1), 5);
        QCOMPARE(sect->getValue<int>("missing", 42), 42);
        QCOMPARE(sect->getValue<QString>("inserted", "dflt", true), QString("dflt"));

        const auto unknown = cfg.unknownKeys();
        QCOMPARE(unknown.size(), 2);
        QCOMPARE(unknown.at(0).first, QString("sect"));
        QCOMPARE(unknown.at(0).second, QStringList{"unknown"});
        QCOMPARE(unknown.at(1).first, QString("other"));
        QCOMPARE(unknown.at(1).second, QStringList{"key"});

        cfg.store();
        const QString stored = testhelper::readStringFromFile(file->fileName());
        QVERIFY(stored.contains("known = 5"));
        QVERIFY(stored.contains("# missing = 42"));
        QVERIFY(stored.contains("\ninserted = dflt"));
        QVERIFY(stored.contains("unknown = foo"));
        // sections never requested are not written
        QVERIFY(! stored.contains("[other]"));

        // the commented default is not parsed again
        cfg.parse(file->fileName());
        sect = cfg["sect"];
        QCOMPARE(sect->getValue<int>("missing", 43), 43);
    }

    void tInvalidValue(){
        auto file = writeToTmpConfigFile("[sect]\nnumber = notanumber\n");
        QVERIFY(! file->fileName().isEmpty());
        Cfg cfg;
        cfg.parse(file->fileName());
        QVERIFY_EXCEPTION_THROWN(cfg["sect"]->getValue<int>("number"), qsimplecfg::ExcCfg);

        auto unclosed = writeToTmpConfigFile("[sect]\nmulti = '''foo\nbar\n");
        QVERIFY_EXCEPTION_THROWN(cfg.parse(unclosed->fileName()), qsimplecfg::ExcCfg);

        auto noEqual = writeToTmpConfigFile("[sect]\njust text\n");
        QVERIFY_EXCEPTION_THROWN(cfg.parse(noEqual->fileName()), qsimplecfg::ExcCfg);
    }

};

DECLARE_TEST(CfgTest)

#include "test_cfg.moc"
