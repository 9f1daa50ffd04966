#pragma once

#include <memory>

#include <QString>
#include <QVector>

#include "archivetypes.h"
#include "digestverifier.h"
#include "nullable_value.h"
#include "storepathiterator.h"

/// Content addressed store of gzip compressed files. An entry lives at
/// <root>/<first two digest chars>/<remaining 38 digest chars>.gz, where
/// the digest is computed from the *decompressed* content. The file system
/// is the only source of truth, nothing is cached.
class ArchiveStore
{
public:
    static const QString ENTRY_SUFFIX;
    static const int SHARD_COUNT;

    static ArchiveStore create(const QString& root);
    static QVector<RawDigest> digestRawDirectory(const QString& dir);
    static bool isShardName(const QString& name);

    explicit ArchiveStore(QString root);

    const QString& root() const;

    QString pathForDigest(const QString& digest) const;

    NullableValue<QString> extract(const QString& digest) const;

    std::unique_ptr<StorePathIterator> pathsForPrefix(const QString& prefix=QString()) const;

    std::unique_ptr<DigestVerifier> computeDigests(const QString& prefix, int parallelism) const;

    FileLocation checkFileLocation(const QString& inputPath) const;
    FileLocation addFile(const QString& inputPath) const;

private:
    QString m_root;
};
