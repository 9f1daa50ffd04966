#include <QDir>
#include <QFileInfo>
#include <QTemporaryFile>
#include <QTextCodec>
#include <utility>

#include "archivestore.h"
#include "digest.h"
#include "excdigest.h"
#include "qfilethrow.h"
#include "cleanupresource.h"
#include "logger.h"

const QString ArchiveStore::ENTRY_SUFFIX = QStringLiteral(".gz");
const int ArchiveStore::SHARD_COUNT = 256;

namespace  {

QString shardName(int i){
    return QString("%1").arg(i, 2, 16, QChar('0'));
}

/// @throws QExcIllegalArgument
QString validatedPrefix(const QString& prefix){
    const QString p = digest::normalizeDigest(prefix);
    if(p.size() > digest::DIGEST_LENGTH || ! digest::isHex(p)){
        throw QExcIllegalArgument(qtr("Invalid digest prefix: %1").arg(prefix));
    }
    return p;
}

/// @throws ExcDecode
QString decodeUtf8(const QByteArray& content, const QString& digestStr){
    QTextCodec* codec = QTextCodec::codecForName("UTF-8");
    QTextCodec::ConverterState state;
    QString text = codec->toUnicode(content.constData(), content.size(), &state);
    if(state.invalidChars > 0 || state.remainingChars > 0){
        throw ExcDecode(qtr("Content of %1 is not valid UTF-8").arg(digestStr));
    }
    return text;
}

} // namespace


/// Create the shard directories below root (and root itself if it does
/// not exist). Calling it again on a store is a no-op.
/// @throws QExcIo if root contains anything but shard directories
/// or a directory cannot be created.
ArchiveStore ArchiveStore::create(const QString &root)
{
    QDir rootDir(root);
    if(rootDir.exists()){
        const auto infos = rootDir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot |
                                                 QDir::Hidden | QDir::System);
        for(const QFileInfo& info : infos){
            if(! info.isDir() || info.isSymLink() || ! isShardName(info.fileName())){
                throw QExcIo(qtr("Cannot create store at %1: unexpected entry %2")
                             .arg(root, info.fileName()), false);
            }
        }
    } else {
        logInfo << qtr("Creating store directory %1").arg(root);
        if(! rootDir.mkpath(".")){
            throw QExcIo(qtr("Failed to create store directory %1").arg(root));
        }
    }

    for(int i=0; i < SHARD_COUNT; i++){
        const QString name = shardName(i);
        if(rootDir.exists(name)){
            continue;
        }
        if(! rootDir.mkdir(name)){
            throw QExcIo(qtr("Failed to create shard directory %1 in %2").arg(name, root));
        }
    }
    return ArchiveStore(root);
}

/// Compute the gzip aware digest of every regular file directly within dir,
/// sorted by name. A file which cannot be read or decompressed yields an
/// item with error set.
/// @throws QExcIo if dir is not a readable directory
QVector<RawDigest> ArchiveStore::digestRawDirectory(const QString &dir)
{
    QFileInfo dirInfo(dir);
    if(! dirInfo.isDir() || ! dirInfo.isReadable()){
        throw QExcIo(qtr("%1 is not a readable directory").arg(dir), false);
    }
    QVector<RawDigest> result;
    const auto infos = QDir(dir).entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot |
                                               QDir::Hidden | QDir::System, QDir::Name);
    for(const QFileInfo& info : infos){
        if(! info.isFile()){
            logInfo << qtr("Ignoring directory: %1").arg(info.absoluteFilePath());
            continue;
        }
        RawDigest raw;
        raw.name = info.completeBaseName();
        QFile file(info.absoluteFilePath());
        if(! file.open(QFile::ReadOnly)){
            raw.error = qtr("Failed to open %1: %2").arg(file.fileName(), file.errorString());
        } else {
            try {
                raw.digest = digest::computeDigestGz(file);
            } catch (const ExcDecompress& ex) {
                raw.error = ex.descrip();
            } catch (const QExcIo& ex) {
                raw.error = ex.descrip();
            }
        }
        result.push_back(raw);
    }
    return result;
}

bool ArchiveStore::isShardName(const QString &name)
{
    return name.size() == 2 && digest::isHex(name) && name == name.toLower();
}


ArchiveStore::ArchiveStore(QString root) :
    m_root(std::move(root))
{}

const QString &ArchiveStore::root() const
{
    return m_root;
}

/// @throws QExcIllegalArgument if the digest is malformed
QString ArchiveStore::pathForDigest(const QString &digest) const
{
    const QString d = digest::normalizeDigest(digest);
    if(! digest::isWellFormedDigest(d)){
        throw QExcIllegalArgument(qtr("Malformed digest: %1").arg(digest));
    }
    return m_root + '/' + d.left(2) + '/' + d.mid(2) + ENTRY_SUFFIX;
}

/// @return the decompressed content of the entry or null, if
/// no entry exists for the digest.
/// @throws QExcIllegalArgument, QExcIo, ExcDecompress, ExcDecode
NullableValue<QString> ArchiveStore::extract(const QString &digest) const
{
    const QString path = pathForDigest(digest);
    QFile file(path);
    if(! file.open(QFile::ReadOnly)){
        if(! file.exists()){
            return {};
        }
        throw QExcIo(qtr("Failed to open %1: %2").arg(path, file.errorString()));
    }
    const QByteArray content = digest::gunzip(file);
    return decodeUtf8(content, digest);
}

/// @param prefix: lists all entries, if empty
/// @throws QExcIllegalArgument if the prefix is no hex string
/// or longer than a digest.
std::unique_ptr<StorePathIterator> ArchiveStore::pathsForPrefix(const QString &prefix) const
{
    return std::unique_ptr<StorePathIterator>(
                new StorePathIterator(m_root, validatedPrefix(prefix)));
}

/// Re-compute the digests of all entries matching prefix using
/// parallelism worker threads.
/// @throws QExcIllegalArgument
std::unique_ptr<DigestVerifier> ArchiveStore::computeDigests(const QString &prefix,
                                                             int parallelism) const
{
    return std::unique_ptr<DigestVerifier>(
                new DigestVerifier(pathsForPrefix(prefix), parallelism));
}

/// Decide, whether the (uncompressed) file at inputPath may be added.
/// The file stem of inputPath may encode an expected digest which has to
/// match the actual one. Does not modify the file system.
/// @throws QExcIo
FileLocation ArchiveStore::checkFileLocation(const QString &inputPath) const
{
    QFileThrow file(inputPath);
    file.open(QFile::ReadOnly);

    FileLocation loc;
    loc.digest = digest::computeDigest(file);
    loc.targetPath = pathForDigest(loc.digest);
    if(QFileInfo::exists(loc.targetPath)){
        loc.status = FileLocation::AlreadyPresent;
        return loc;
    }
    const QString stem = digest::normalizeDigest(QFileInfo(inputPath).completeBaseName());
    if(digest::isWellFormedDigest(stem) && stem != loc.digest){
        loc.status = FileLocation::DigestMismatch;
        loc.expectedDigest = stem;
        return loc;
    }
    loc.status = FileLocation::Free;
    return loc;
}

/// Compress the file at inputPath into the store, unless it is already
/// present or its name encodes a different digest. The entry is written to
/// a temporary file within the shard directory and renamed afterwards.
/// @throws QExcIo, ExcDecompress
FileLocation ArchiveStore::addFile(const QString &inputPath) const
{
    FileLocation loc = checkFileLocation(inputPath);
    if(loc.status != FileLocation::Free){
        return loc;
    }
    const QString shardDir = QFileInfo(loc.targetPath).absolutePath();
    if(! QDir().mkpath(shardDir)){
        throw QExcIo(qtr("Failed to create shard directory %1").arg(shardDir));
    }

    QFileThrow input(inputPath);
    input.open(QFile::ReadOnly);

    QTemporaryFile tmp(shardDir + "/.add-XXXXXX");
    tmp.setAutoRemove(false);
    if(! tmp.open()){
        throw QExcIo(qtr("Failed to create temporary file in %1: %2")
                     .arg(shardDir, tmp.errorString()));
    }
    auto removeTmp = finally([&tmp] { tmp.remove(); });
    digest::gzip(input, tmp);
    if(! tmp.flush()){
        throw QExcIo(qtr("Failed to flush %1: %2").arg(tmp.fileName(), tmp.errorString()));
    }
    tmp.close();
    // rename does not overwrite: a concurrent add of the same content wins
    if(! tmp.rename(loc.targetPath)){
        if(QFileInfo::exists(loc.targetPath)){
            logInfo << qtr("%1 was added concurrently").arg(loc.targetPath);
            loc.status = FileLocation::AlreadyPresent;
            return loc;
        }
        throw QExcIo(qtr("Failed to move %1 to %2: %3")
                     .arg(tmp.fileName(), loc.targetPath, tmp.errorString()));
    }
    removeTmp.setEnabled(false);
    logInfo << qtr("Added %1 as %2").arg(inputPath, loc.targetPath);
    return loc;
}
