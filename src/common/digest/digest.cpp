#include <QCryptographicHash>
#include <QIODevice>
#include <zlib.h>

#include "digest.h"
#include "gzipreader.h"
#include "excdigest.h"
#include "cleanupresource.h"
#include "util.h"

namespace  {

QString hexResult(const QCryptographicHash& hash){
    return QString::fromLatin1(hash.result().toHex());
}

/// @throws QExcIo
void writeAll(QIODevice& out, const char* data, qint64 len){
    if(out.write(data, len) != len){
        throw QExcIo(qtr("Failed to write compressed data: %1").arg(out.errorString()));
    }
}

} // namespace


/// Read the device to its end and return the digest of its content.
/// @throws QExcIo
QString digest::computeDigest(QIODevice &dev)
{
    QCryptographicHash hash(QCryptographicHash::Sha1);
    QByteArray buf(GzipReader::CHUNK_SIZE, Qt::Uninitialized);
    while (true) {
        const qint64 n = dev.read(buf.data(), buf.size());
        if(n < 0){
            throw QExcIo(qtr("Failed to read input for digest: %1").arg(dev.errorString()));
        }
        if(n == 0){
            break;
        }
        hash.addData(buf.constData(), static_cast<int>(n));
    }
    return hexResult(hash);
}

QString digest::computeDigest(const QByteArray &content)
{
    QCryptographicHash hash(QCryptographicHash::Sha1);
    hash.addData(content);
    return hexResult(hash);
}

/// Decompress the gzip framed device on the fly and return the digest
/// of the decompressed content.
/// @throws ExcDecompress, QExcIo
QString digest::computeDigestGz(QIODevice &dev)
{
    QCryptographicHash hash(QCryptographicHash::Sha1);
    GzipReader reader(dev);
    QByteArray chunk;
    while(reader.readChunk(&chunk)){
        hash.addData(chunk);
    }
    return hexResult(hash);
}

/// @throws ExcDecompress, QExcIo
QByteArray digest::gunzip(QIODevice &dev)
{
    QByteArray content;
    GzipReader reader(dev);
    QByteArray chunk;
    while(reader.readChunk(&chunk)){
        content.append(chunk);
    }
    return content;
}

/// Compress 'in' as a single gzip member into 'out'.
/// @param level: zlib compression level, -1 for zlib's default.
/// @throws ExcDecompress, QExcIo
void digest::gzip(QIODevice &in, QIODevice &out, int level)
{
    z_stream strm;
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    int res = deflateInit2(&strm, level, Z_DEFLATED, MAX_WBITS + 16, 8,
                           Z_DEFAULT_STRATEGY);
    if(res != Z_OK){
        throw ExcDecompress(qtr("Failed to initialize zlib deflate (%1)").arg(res));
    }
    auto endDeflate = finally([&strm] { deflateEnd(&strm); });

    QByteArray inBuf(GzipReader::CHUNK_SIZE, Qt::Uninitialized);
    QByteArray outBuf(GzipReader::CHUNK_SIZE, Qt::Uninitialized);
    int flush = Z_NO_FLUSH;
    do {
        const qint64 n = in.read(inBuf.data(), inBuf.size());
        if(n < 0){
            throw QExcIo(qtr("Failed to read input for compression: %1")
                         .arg(in.errorString()));
        }
        flush = (n == 0) ? Z_FINISH : Z_NO_FLUSH;
        strm.next_in = reinterpret_cast<Bytef*>(inBuf.data());
        strm.avail_in = static_cast<uInt>(n);
        do {
            strm.next_out = reinterpret_cast<Bytef*>(outBuf.data());
            strm.avail_out = static_cast<uInt>(outBuf.size());
            res = deflate(&strm, flush);
            if(res == Z_STREAM_ERROR){
                throw ExcDecompress(qtr("deflate failed: %1")
                                    .arg((strm.msg != Z_NULL) ? strm.msg : "unknown error"));
            }
            writeAll(out, outBuf.constData(), outBuf.size() - static_cast<int>(strm.avail_out));
        } while (strm.avail_out == 0);
    } while (flush != Z_FINISH);

    if(res != Z_STREAM_END){
        throw ExcDecompress(qtr("deflate did not finish the stream (%1)").arg(res));
    }
}

bool digest::isHex(const QString &str)
{
    for(const QChar& c : str){
        const ushort u = c.unicode();
        if(! ((u >= '0' && u <= '9') || (u >= 'a' && u <= 'f') || (u >= 'A' && u <= 'F'))){
            return false;
        }
    }
    return true;
}

bool digest::isWellFormedDigest(const QString &digest)
{
    return digest.size() == DIGEST_LENGTH && isHex(digest);
}

QString digest::normalizeDigest(const QString &digest)
{
    return digest.toLower();
}
