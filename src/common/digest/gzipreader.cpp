#include <QIODevice>

#include "gzipreader.h"
#include "excdigest.h"

const int GzipReader::CHUNK_SIZE = 64 * 1024;

/// @throws ExcDecompress
GzipReader::GzipReader(QIODevice &dev) :
    m_dev(dev),
    m_inBuf(CHUNK_SIZE, Qt::Uninitialized),
    m_outBuf(CHUNK_SIZE, Qt::Uninitialized),
    m_inputEof(false),
    m_memberEnded(false),
    m_finished(false),
    m_membersRead(0)
{
    m_strm.zalloc = Z_NULL;
    m_strm.zfree = Z_NULL;
    m_strm.opaque = Z_NULL;
    m_strm.next_in = Z_NULL;
    m_strm.avail_in = 0;
    // +16: expect a gzip header and trailer instead of zlib's
    const int res = inflateInit2(&m_strm, MAX_WBITS + 16);
    if(res != Z_OK){
        throw ExcDecompress(qtr("Failed to initialize zlib inflate (%1)").arg(res));
    }
}

GzipReader::~GzipReader()
{
    inflateEnd(&m_strm);
}

/// Decompress the next chunk of data.
/// @param chunk: receives the decompressed bytes. Is never empty, if
/// true is returned.
/// @return false at the end of the stream
/// @throws ExcDecompress, QExcIo
bool GzipReader::readChunk(QByteArray *chunk)
{
    chunk->clear();
    if(m_finished){
        return false;
    }
    while(chunk->isEmpty()){
        if(m_strm.avail_in == 0 && ! m_inputEof){
            fillInput();
        }
        if(m_strm.avail_in == 0 && m_inputEof){
            if(m_memberEnded){
                m_finished = true;
                return false;
            }
            if(m_membersRead == 0 && m_strm.total_in == 0){
                throw ExcDecompress(qtr("Input is empty, expected gzip data"));
            }
            throw ExcDecompress(qtr("Unexpected end of gzip stream (truncated input)"));
        }
        if(m_memberEnded){
            // another gzip member follows
            inflateReset(&m_strm);
            m_memberEnded = false;
        }

        m_strm.next_out = reinterpret_cast<Bytef*>(m_outBuf.data());
        m_strm.avail_out = static_cast<uInt>(m_outBuf.size());
        const int res = inflate(&m_strm, Z_NO_FLUSH);
        switch (res) {
        case Z_OK:
            break;
        case Z_STREAM_END:
            m_memberEnded = true;
            ++m_membersRead;
            break;
        case Z_BUF_ERROR:
            // no progress possible, need more input
            break;
        default:
            throw ExcDecompress(qtr("Invalid gzip data: %1 (%2)")
                                .arg((m_strm.msg != Z_NULL) ? m_strm.msg : "unknown error")
                                .arg(res));
        }
        const int produced = m_outBuf.size() - static_cast<int>(m_strm.avail_out);
        chunk->append(m_outBuf.constData(), produced);
    }
    return true;
}

/// @throws QExcIo
void GzipReader::fillInput()
{
    const qint64 n = m_dev.read(m_inBuf.data(), m_inBuf.size());
    if(n < 0){
        throw QExcIo(qtr("Failed to read gzip input: %1").arg(m_dev.errorString()));
    }
    m_inputEof = (n == 0);
    m_strm.next_in = reinterpret_cast<Bytef*>(m_inBuf.data());
    m_strm.avail_in = static_cast<uInt>(n);
}
