#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <QTest>

#include <memory>

#include "archivestore.h"
#include "autotest.h"
#include "digest.h"
#include "excdigest.h"
#include "helper_for_test.h"


class ArchiveStoreTest : public QObject {
    Q_OBJECT

    /// Add content via a temporary input file and return its digest
    QString putContent(const ArchiveStore& store, const QString& inputDir,
                       const QByteArray& content){
        const QString input = inputDir + "/page.html";
        testhelper::writeBytesToFile(input, content);
        const FileLocation loc = store.addFile(input);
        if(loc.status != FileLocation::Free){
            throw QExcProgramming("unexpected location status");
        }
        return loc.digest;
    }

    QStringList listAll(const ArchiveStore& store, const QString& prefix,
                        int* errorCount=nullptr){
        QStringList digests;
        auto it = store.pathsForPrefix(prefix);
        while(true){
            try {
                if(! it->next()){
                    break;
                }
                digests.push_back(it->value().digest);
            } catch (const ExcArchiveEntry&) {
                if(errorCount != nullptr){
                    ++(*errorCount);
                }
            }
        }
        return digests;
    }

private slots:
    void initTestCase(){
        logger::setVerbosityLevel(QtMsgType::QtWarningMsg);
    }

    void tCreate() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        const QString root = tmp->path() + "/store";
        auto store = ArchiveStore::create(root);
        QCOMPARE(store.root(), root);
        const auto shards = QDir(root).entryList(QDir::Dirs | QDir::NoDotAndDotDot);
        QCOMPARE(shards.size(), ArchiveStore::SHARD_COUNT);
        QVERIFY(shards.contains("00"));
        QVERIFY(shards.contains("ff"));

        // again: no-op
        ArchiveStore::create(root);
        QCOMPARE(QDir(root).entryList(QDir::Dirs | QDir::NoDotAndDotDot).size(),
                 ArchiveStore::SHARD_COUNT);

        const QString otherRoot = tmp->path() + "/other";
        QVERIFY(QDir().mkpath(otherRoot));
        testhelper::writeStringToFile(otherRoot + "/notes.txt", "foo");
        QVERIFY_EXCEPTION_THROWN(ArchiveStore::create(otherRoot), QExcIo);
    }

    void tPathForDigest() {
        ArchiveStore store("/tmp/somestore");
        QCOMPARE(store.pathForDigest("a9993e364706816aba3e25717850c26c9cd0d89d"),
                 QString("/tmp/somestore/a9/993e364706816aba3e25717850c26c9cd0d89d.gz"));
        QCOMPARE(store.pathForDigest("A9993E364706816ABA3E25717850C26C9CD0D89D"),
                 QString("/tmp/somestore/a9/993e364706816aba3e25717850c26c9cd0d89d.gz"));
        QVERIFY_EXCEPTION_THROWN(store.pathForDigest("a9993e"), QExcIllegalArgument);
        QVERIFY_EXCEPTION_THROWN(store.pathsForPrefix("xyz"), QExcIllegalArgument);
    }

    void tAddExtract() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        auto store = ArchiveStore::create(tmp->path() + "/store");
        const QString content = QString::fromUtf8("<p>Gr\xc3\xbc\xc3\x9f" "e</p>");
        const QString input = tmp->path() + "/page.html";
        testhelper::writeBytesToFile(input, content.toUtf8());

        const FileLocation before1 = store.checkFileLocation(input);
        const FileLocation before2 = store.checkFileLocation(input);
        QCOMPARE(int(before1.status), int(FileLocation::Free));
        QCOMPARE(before1.targetPath, before2.targetPath);
        QCOMPARE(before1.digest, digest::computeDigest(content.toUtf8()));
        QVERIFY(! QFileInfo::exists(before1.targetPath));

        const FileLocation added = store.addFile(input);
        QCOMPARE(int(added.status), int(FileLocation::Free));
        QCOMPARE(added.targetPath, store.pathForDigest(added.digest));
        QVERIFY(QFileInfo::exists(added.targetPath));

        const FileLocation after = store.checkFileLocation(input);
        QCOMPARE(int(after.status), int(FileLocation::AlreadyPresent));
        QCOMPARE(int(store.addFile(input).status), int(FileLocation::AlreadyPresent));

        auto extracted = store.extract(added.digest);
        QVERIFY(! extracted.isNull());
        QCOMPARE(extracted.value(), content);

        QVERIFY(store.extract("0000000000000000000000000000000000000000").isNull());

        // no temporary files left behind
        const auto shardEntries = QDir(QFileInfo(added.targetPath).absolutePath())
                .entryList(QDir::Files | QDir::Hidden);
        QCOMPARE(shardEntries.size(), 1);
    }

    void tDigestMismatch() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        auto store = ArchiveStore::create(tmp->path() + "/store");
        const QString wrongName = "a9993e364706816aba3e25717850c26c9cd0d89d";
        const QString input = tmp->path() + '/' + wrongName;
        testhelper::writeBytesToFile(input, "not abc");

        const FileLocation loc = store.checkFileLocation(input);
        QCOMPARE(int(loc.status), int(FileLocation::DigestMismatch));
        QCOMPARE(loc.expectedDigest, wrongName);
        QCOMPARE(loc.digest, digest::computeDigest(QByteArray("not abc")));

        QCOMPARE(int(store.addFile(input).status), int(FileLocation::DigestMismatch));
        QVERIFY(! QFileInfo::exists(loc.targetPath));

        // correctly named
        const QString rightInput = tmp->path() + '/' + wrongName + ".html";
        testhelper::writeBytesToFile(rightInput, "abc");
        const FileLocation okLoc = store.addFile(rightInput);
        QCOMPARE(int(okLoc.status), int(FileLocation::Free));
        QCOMPARE(okLoc.digest, wrongName);
    }

    void tNonUtf8() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        auto store = ArchiveStore::create(tmp->path() + "/store");
        const QString d = putContent(store, tmp->path(), QByteArray("ab\xff\xfe" "cd"));
        QVERIFY_EXCEPTION_THROWN(store.extract(d), ExcDecode);
    }

    void tPrefixPartition() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        auto store = ArchiveStore::create(tmp->path() + "/store");
        QSet<QString> added;
        for(int i=0; i < 60; i++){
            added.insert(putContent(store, tmp->path(),
                                    QByteArray("content number ") + QByteArray::number(i)));
        }
        const QStringList all = listAll(store, QString());
        QCOMPARE(all.size(), added.size());
        QCOMPARE(QSet<QString>::fromList(all), added);

        QSet<QString> unionOfPrefixes;
        int total = 0;
        for(const char c : QByteArray("0123456789abcdef")){
            const QString prefix(c);
            for(const QString& d : listAll(store, prefix)){
                QVERIFY(d.startsWith(prefix));
                unionOfPrefixes.insert(d);
                ++total;
            }
        }
        QCOMPARE(total, all.size());
        QCOMPARE(unionOfPrefixes, added);

        const QString someDigest = all.first();
        const QStringList longPrefix = listAll(store, someDigest.left(5));
        QVERIFY(longPrefix.contains(someDigest));
        for(const QString& d : longPrefix){
            QVERIFY(d.startsWith(someDigest.left(5)));
        }
        QCOMPARE(listAll(store, someDigest), QStringList{someDigest});
        QCOMPARE(listAll(store, someDigest.toUpper()), QStringList{someDigest});
    }

    void tUnexpectedEntries() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        auto store = ArchiveStore::create(tmp->path() + "/store");
        QSet<QString> added;
        for(int i=0; i < 10; i++){
            added.insert(putContent(store, tmp->path(), QByteArray::number(i)));
        }
        testhelper::writeStringToFile(store.root() + "/ab/notadigest.gz", "x");
        testhelper::writeStringToFile(store.root() + "/README", "x");
        // hidden entries are temporary files of a concurrent add
        testhelper::writeStringToFile(store.root() + "/cd/.add-123456", "x");

        int errors = 0;
        const QStringList all = listAll(store, QString(), &errors);
        QCOMPARE(errors, 2);
        QCOMPARE(QSet<QString>::fromList(all), added);

        errors = 0;
        listAll(store, "ab", &errors);
        QCOMPARE(errors, 1);

        errors = 0;
        listAll(store, "0", &errors);
        QCOMPARE(errors, 0);
    }

    void tVerify() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        auto store = ArchiveStore::create(tmp->path() + "/store");
        QStringList digests;
        for(int i=0; i < 25; i++){
            digests.push_back(putContent(store, tmp->path(),
                                         QByteArray("entry ") + QByteArray::number(i)));
        }
        const QString corrupted = digests.at(3);
        testhelper::writeBytesToFile(store.pathForDigest(corrupted),
                                     testhelper::gzipBytes("tampered"));
        const QString broken = digests.at(7);
        testhelper::writeBytesToFile(store.pathForDigest(broken), "plain text");

        for(int parallelism : {1, 4}){
            auto verifier = store.computeDigests(QString(), parallelism);
            int valid = 0;
            QStringList invalid;
            QStringList brokenPaths;
            while(verifier->next()){
                const DigestCheck& c = verifier->value();
                if(c.isBroken()){
                    brokenPaths.push_back(c.path);
                } else if(c.isValid()){
                    ++valid;
                } else {
                    invalid.push_back(c.expected);
                    QCOMPARE(c.actual, digest::computeDigest(QByteArray("tampered")));
                }
            }
            QCOMPARE(valid, digests.size() - 2);
            QCOMPARE(invalid, QStringList{corrupted});
            QCOMPARE(brokenPaths, QStringList{store.pathForDigest(broken)});
        }
    }

    void tVerifyDropEarly() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        auto store = ArchiveStore::create(tmp->path() + "/store");
        for(int i=0; i < 100; i++){
            putContent(store, tmp->path(), QByteArray("drop ") + QByteArray::number(i));
        }
        {
            auto verifier = store.computeDigests(QString(), 3);
            QVERIFY(verifier->next());
            QVERIFY(verifier->value().isValid());
        }
        {
            // never started
            auto verifier = store.computeDigests("0", 2);
        }
        auto verifier = store.computeDigests("ff", 2);
        while(verifier->next()){
            QVERIFY(verifier->value().expected.startsWith("ff"));
        }
    }

    void tDigestRawDirectory() {
        auto tmp = testhelper::mkAutoDelTmpDir();
        const QString dir = tmp->path();
        testhelper::writeBytesToFile(dir + "/one.gz", testhelper::gzipBytes("one"));
        testhelper::writeBytesToFile(dir + "/two.gz", testhelper::gzipBytes("two"));
        testhelper::writeBytesToFile(dir + "/bad.gz", "not compressed");
        QVERIFY(QDir(dir).mkdir("sub"));

        const QVector<RawDigest> raws = ArchiveStore::digestRawDirectory(dir);
        QCOMPARE(raws.size(), 3);
        QCOMPARE(raws[0].name, QString("bad"));
        QVERIFY(! raws[0].error.isEmpty());
        QCOMPARE(raws[1].name, QString("one"));
        QCOMPARE(raws[1].digest, digest::computeDigest(QByteArray("one")));
        QVERIFY(raws[1].error.isEmpty());
        QCOMPARE(raws[2].name, QString("two"));
        QCOMPARE(raws[2].digest, digest::computeDigest(QByteArray("two")));

        QVERIFY_EXCEPTION_THROWN(ArchiveStore::digestRawDirectory(dir + "/missing"), QExcIo);
    }
};

DECLARE_TEST(ArchiveStoreTest)

#include "test_archive_store.moc"
