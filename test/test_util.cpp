#include <QTest>
#include <QDebug>
#include <QDir>

#include "autotest.h"
#include "cleanupresource.h"
#include "nullable_value.h"


class UtilTest : public QObject {
    Q_OBJECT

private slots:
    void testExpandHome() {
        QCOMPARE(expandHome("~"), QDir::homePath());
        QCOMPARE(expandHome("~/archive"), QDir::homePath() + "/archive");
        QCOMPARE(expandHome("$HOME/archive"), QDir::homePath() + "/archive");
        QCOMPARE(expandHome("/tmp/~/archive"), QString("/tmp/~/archive"));
        QCOMPARE(expandHome("~other/archive"), QString("~other/archive"));
    }

    void testPathJoin() {
        QCOMPARE(pathJoinFilename(QString("/"), QString("foo")), QString("/foo"));
        QCOMPARE(pathJoinFilename(QString("/home/user"), QString("foo")),
                 QString("/home/user/foo"));
    }

    void testArgvToQStr() {
        QVector<const char*> argv = {"list", "--prefix", "ab", nullptr};
        QCOMPARE(argvToQStr(argv.size() - 1, (char**)argv.data()), QString("list --prefix ab"));
    }

    void testVariantConvert() {
        QCOMPARE(qVariantTo_throw<int>(QString("12")), 12);
        QVERIFY_EXCEPTION_THROWN(qVariantTo_throw<int>(QString("twelve"), false),
                                 ExcQVariantConvert);
    }

    void testNullableValue() {
        NullableValue<quint64> v;
        QVERIFY(v.isNull());
        QCOMPARE(v.valueOr(3), quint64(3));
        QVERIFY_EXCEPTION_THROWN(v.value(), QExcNullDeref);
        v = 5;
        QCOMPARE(v.value(), quint64(5));
        QVERIFY(v == NullableValue<quint64>(5));
        QVERIFY(v != NullableValue<quint64>());
    }

    void testFinally() {
        int calls = 0;
        {
            auto f = finally([&calls] { ++calls; });
        }
        QCOMPARE(calls, 1);
        {
            auto f = finally([&calls] { ++calls; });
            f.setEnabled(false);
        }
        QCOMPARE(calls, 1);
    }
};


DECLARE_TEST(UtilTest)

#include "test_util.moc"
