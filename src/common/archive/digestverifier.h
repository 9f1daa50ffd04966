#pragma once

#include <memory>

#include <QMutex>
#include <QQueue>
#include <QThreadPool>
#include <QWaitCondition>

#include "archivetypes.h"
#include "util.h"

class StorePathIterator;

/// Re-computes the digests of archive entries using a pool of
/// worker threads which share one path iterator. Results are
/// returned in completion order. Destroying the verifier cancels
/// the remaining work and waits for the running workers.
/// Usage:
///     while(verifier->next()) { verifier->value().isValid() ... }
class DigestVerifier
{
public:
    static const int MAX_QUEUED_RESULTS;

    DigestVerifier(std::unique_ptr<StorePathIterator> paths, int parallelism);
    ~DigestVerifier();

    bool next();
    const DigestCheck& value() const;

public:
    Q_DISABLE_COPY(DigestVerifier)
    DISABLE_MOVE(DigestVerifier)

private:
    friend class VerifyTask;

    void start();
    bool takeEntry(StoreEntry* entry, QString* error);
    bool pushResult(const DigestCheck& check);
    void workerFinished();

    std::unique_ptr<StorePathIterator> m_paths;
    QMutex m_pathMutex;
    int m_parallelism;
    bool m_started;

    QMutex m_resultMutex;
    QWaitCondition m_resultAvailable;
    QWaitCondition m_spaceAvailable;
    QQueue<DigestCheck> m_results;
    int m_runningWorkers;
    bool m_cancelled;

    DigestCheck m_current;
    QThreadPool m_pool;
};
