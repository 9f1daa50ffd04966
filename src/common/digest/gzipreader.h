#pragma once

#include <QByteArray>
#include <zlib.h>

#include "util.h"

class QIODevice;

/// Pull decoder for gzip framed devices. Multiple concatenated gzip
/// members are decoded as one stream (like gzip -d does).
/// Usage:
///     GzipReader reader(file);
///     QByteArray chunk;
///     while(reader.readChunk(&chunk)) { ... }
class GzipReader
{
public:
    static const int CHUNK_SIZE;

    explicit GzipReader(QIODevice& dev);
    ~GzipReader();

    bool readChunk(QByteArray* chunk);

public:
    Q_DISABLE_COPY(GzipReader)
    DISABLE_MOVE(GzipReader)

private:
    void fillInput();

    QIODevice& m_dev;
    z_stream m_strm;
    QByteArray m_inBuf;
    QByteArray m_outBuf;
    bool m_inputEof;
    bool m_memberEnded;
    bool m_finished;
    int m_membersRead;
};
