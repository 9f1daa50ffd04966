#pragma once

#include <QString>

#include "exccommon.h"

/// An entry of the archive store: its digest and where it is stored.
struct StoreEntry {
    QString digest;
    QString path;
};

/// Result of re-computing the digest of one stored entry. An entry is
/// broken, if it could not be listed, read or decompressed.
struct DigestCheck {
    QString path;
    QString expected;
    QString actual;
    QString error;

    bool isBroken() const { return ! error.isEmpty(); }
    bool isValid() const { return ! isBroken() && expected == actual; }
};

/// Decision whether (and where) a file may be added to the store.
struct FileLocation {
    enum Status { AlreadyPresent, Free, DigestMismatch };

    Status status {Free};
    QString digest;
    QString targetPath;
    /// only set for DigestMismatch
    QString expectedDigest;
};

struct RawDigest {
    QString name;
    QString digest;
    QString error;
};


/// Unexpected or unreadable entry within the store's directory tree.
class ExcArchiveEntry : public QExcIo
{
public:
    explicit ExcArchiveEntry(const QString & text) :
        QExcIo(text, false) {}
};
