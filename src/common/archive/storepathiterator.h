#pragma once

#include <QFileInfoList>
#include <QStringList>

#include "archivetypes.h"
#include "util.h"

/// Lazily walks the shard directories of an archive store and yields
/// each entry whose digest starts with a given prefix. Shards and
/// entries are visited in sorted order.
/// Usage:
///     while(it.next()) { it.value().digest ... }
class StorePathIterator
{
public:
    StorePathIterator(QString root, QString prefix);

    bool next();
    const StoreEntry& value() const;

public:
    Q_DISABLE_COPY(StorePathIterator)
    DISABLE_MOVE(StorePathIterator)

private:
    void listRoot();
    void openShard(const QString& shardPath);
    bool handleEntry(const QFileInfo& info);
    bool matchesPrefix(const QString& name) const;

    QString m_root;
    QString m_prefix;
    bool m_rootListed;
    QStringList m_shards;
    int m_shardIdx;
    QString m_currentShard;
    QFileInfoList m_entries;
    int m_entryIdx;
    QStringList m_pendingErrors;
    StoreEntry m_value;
};
