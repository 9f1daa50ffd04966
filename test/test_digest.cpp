#include <QBuffer>
#include <QTest>

#include "autotest.h"
#include "digest.h"
#include "excdigest.h"
#include "helper_for_test.h"

namespace {

QBuffer* openBuffer(QBuffer* buf, const QByteArray& data){
    buf->setData(data);
    buf->open(QBuffer::ReadOnly);
    return buf;
}

} // namespace


class DigestTest : public QObject {
    Q_OBJECT

private slots:
    void tKnownVectors() {
        QCOMPARE(digest::computeDigest(QByteArray()),
                 QString("da39a3ee5e6b4b0d3255bfef95601890afd80709"));
        QCOMPARE(digest::computeDigest(QByteArray("abc")),
                 QString("a9993e364706816aba3e25717850c26c9cd0d89d"));
    }

    void tDeviceMatchesBytes() {
        QByteArray content;
        for(int i=0; i < 200000; i++){
            content.append(char(i % 251));
        }
        QBuffer buf;
        openBuffer(&buf, content);
        const QString d = digest::computeDigest(buf);
        QCOMPARE(d, digest::computeDigest(content));
        QCOMPARE(d.size(), digest::DIGEST_LENGTH);
        QVERIFY(digest::isWellFormedDigest(d));
    }

    void tGzRoundTrip() {
        const QByteArray content("<html><body>Hello archive</body></html>");
        const QByteArray gz = testhelper::gzipBytes(content);
        QVERIFY(gz != content);

        QBuffer buf;
        openBuffer(&buf, gz);
        QCOMPARE(digest::computeDigestGz(buf), digest::computeDigest(content));

        QBuffer buf2;
        openBuffer(&buf2, gz);
        QCOMPARE(digest::gunzip(buf2), content);
    }

    void tMultiMember() {
        const QByteArray gz = testhelper::gzipBytes("foo") + testhelper::gzipBytes("bar");
        QBuffer buf;
        openBuffer(&buf, gz);
        QCOMPARE(digest::gunzip(buf), QByteArray("foobar"));

        QBuffer buf2;
        openBuffer(&buf2, gz);
        QCOMPARE(digest::computeDigestGz(buf2), digest::computeDigest(QByteArray("foobar")));
    }

    void tInvalidGzip() {
        QBuffer notGz;
        openBuffer(&notGz, "this is not gzip at all");
        QVERIFY_EXCEPTION_THROWN(digest::computeDigestGz(notGz), ExcDecompress);

        QBuffer empty;
        openBuffer(&empty, QByteArray());
        QVERIFY_EXCEPTION_THROWN(digest::computeDigestGz(empty), ExcDecompress);

        QByteArray content;
        for(int i=0; i < 5000; i++){
            content.append(QByteArray::number(i));
        }
        const QByteArray gz = testhelper::gzipBytes(content);
        QBuffer truncated;
        openBuffer(&truncated, gz.left(gz.size() / 2));
        QVERIFY_EXCEPTION_THROWN(digest::gunzip(truncated), ExcDecompress);
    }

    void tWellFormed() {
        QVERIFY(digest::isWellFormedDigest("a9993e364706816aba3e25717850c26c9cd0d89d"));
        QVERIFY(! digest::isWellFormedDigest("a9993e364706816aba3e25717850c26c9cd0d89"));
        QVERIFY(! digest::isWellFormedDigest("g9993e364706816aba3e25717850c26c9cd0d89d"));
        QCOMPARE(digest::normalizeDigest("A9993E364706816ABA3E25717850C26C9CD0D89D"),
                 QString("a9993e364706816aba3e25717850c26c9cd0d89d"));
        QVERIFY(digest::isHex(""));
        QVERIFY(! digest::isHex("0x"));
    }
};

DECLARE_TEST(DigestTest)

#include "test_digest.moc"
