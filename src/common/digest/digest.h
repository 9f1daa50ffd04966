#pragma once

#include <QString>
#include <QByteArray>

class QIODevice;

/// SHA-1 content digests, as 40 lower case hex characters,
/// and the gzip helpers used to store content compressed.
namespace digest {

const int DIGEST_LENGTH = 40;

QString computeDigest(QIODevice& dev);
QString computeDigest(const QByteArray& content);
QString computeDigestGz(QIODevice& dev);

QByteArray gunzip(QIODevice& dev);
void gzip(QIODevice& in, QIODevice& out, int level=-1);

bool isHex(const QString& str);
bool isWellFormedDigest(const QString& digest);
QString normalizeDigest(const QString& digest);

}
