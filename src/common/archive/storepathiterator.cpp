#include <QDir>
#include <QFileInfo>
#include <utility>

#include "storepathiterator.h"
#include "archivestore.h"
#include "digest.h"
#include "logger.h"

namespace  {

const QDir::Filters DIR_FILTERS = QDir::AllEntries | QDir::NoDotAndDotDot |
                                  QDir::Hidden | QDir::System;

} // namespace

/// @param prefix: expected to be normalized and validated by the caller
StorePathIterator::StorePathIterator(QString root, QString prefix) :
    m_root(std::move(root)),
    m_prefix(std::move(prefix)),
    m_rootListed(false),
    m_shardIdx(0),
    m_entryIdx(0)
{}

/// Advance to the next entry.
/// @return false, if no more entries exist
/// @throws ExcArchiveEntry for a single bad entry. The iterator
/// is already advanced, so the next call continues with the
/// following entry.
bool StorePathIterator::next()
{
    if(! m_rootListed){
        m_rootListed = true;
        listRoot();
    }
    while (true) {
        if(! m_pendingErrors.isEmpty()){
            throw ExcArchiveEntry(m_pendingErrors.takeFirst());
        }
        if(m_entryIdx < m_entries.size()){
            const QFileInfo& info = m_entries.at(m_entryIdx++);
            if(handleEntry(info)){
                return true;
            }
            continue;
        }
        if(m_shardIdx >= m_shards.size()){
            return false;
        }
        openShard(m_shards.at(m_shardIdx++));
    }
}

const StoreEntry &StorePathIterator::value() const
{
    return m_value;
}

void StorePathIterator::listRoot()
{
    QFileInfo rootInfo(m_root);
    if(! rootInfo.isDir() || ! rootInfo.isReadable()){
        m_pendingErrors.push_back(qtr("Store root %1 is not a readable directory")
                                  .arg(m_root));
        return;
    }
    const auto infos = QDir(m_root).entryInfoList(DIR_FILTERS, QDir::Name);
    for(const QFileInfo& info : infos){
        const QString name = info.fileName();
        if(! ArchiveStore::isShardName(name) || ! info.isDir()){
            if(m_prefix.isEmpty() || name.startsWith(m_prefix.left(2))){
                m_pendingErrors.push_back(qtr("Unexpected entry in store root: %1")
                                          .arg(info.absoluteFilePath()));
            }
            continue;
        }
        if(m_prefix.isEmpty() || name.startsWith(m_prefix.left(2))){
            m_shards.push_back(info.absoluteFilePath());
        }
    }
}

void StorePathIterator::openShard(const QString &shardPath)
{
    m_entries.clear();
    m_entryIdx = 0;
    m_currentShard = QFileInfo(shardPath).fileName();
    QFileInfo shardInfo(shardPath);
    if(! shardInfo.isReadable() || ! shardInfo.isExecutable()){
        m_pendingErrors.push_back(qtr("Shard directory %1 is not readable")
                                  .arg(shardPath));
        return;
    }
    m_entries = QDir(shardPath).entryInfoList(DIR_FILTERS, QDir::Name);
}

/// @return true, if the entry matches the prefix and is a valid
/// store entry. Bad entries are queued as errors.
bool StorePathIterator::handleEntry(const QFileInfo &info)
{
    const QString name = info.fileName();
    if(name.startsWith('.')){
        // temporary file of a concurrent add
        logDebug << "ignoring hidden entry" << info.absoluteFilePath();
        return false;
    }
    const QString suffix = ArchiveStore::ENTRY_SUFFIX;
    const QString stem = name.endsWith(suffix) ? name.left(name.size() - suffix.size())
                                               : QString();
    const QString fullDigest = digest::normalizeDigest(m_currentShard + stem);
    if(stem.isEmpty() || ! info.isFile() || ! digest::isWellFormedDigest(fullDigest)){
        if(matchesPrefix(m_currentShard + name)){
            m_pendingErrors.push_back(qtr("Unexpected entry in store: %1")
                                      .arg(info.absoluteFilePath()));
        }
        return false;
    }
    if(! matchesPrefix(fullDigest)){
        return false;
    }
    m_value.digest = fullDigest;
    m_value.path = info.absoluteFilePath();
    return true;
}

bool StorePathIterator::matchesPrefix(const QString &name) const
{
    return name.startsWith(m_prefix, Qt::CaseInsensitive);
}
