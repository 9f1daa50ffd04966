#include <QFile>
#include <QMutexLocker>
#include <QRunnable>
#include <utility>

#include "digestverifier.h"
#include "storepathiterator.h"
#include "digest.h"
#include "excdigest.h"
#include "logger.h"

const int DigestVerifier::MAX_QUEUED_RESULTS = 256;


/// Pulls entries from the shared path iterator until it is
/// exhausted or the verifier gets cancelled.
class VerifyTask : public QRunnable
{
public:
    explicit VerifyTask(DigestVerifier& verifier) :
        m_verifier(verifier)
    {}

    void run() override {
        StoreEntry entry;
        QString listError;
        while (m_verifier.takeEntry(&entry, &listError)) {
            DigestCheck check;
            if(! listError.isEmpty()){
                check.error = listError;
            } else {
                check.path = entry.path;
                check.expected = entry.digest;
                verify(&check);
            }
            if(! m_verifier.pushResult(check)){
                break;
            }
        }
        m_verifier.workerFinished();
    }

private:
    static void verify(DigestCheck* check){
        QFile file(check->path);
        if(! file.open(QFile::ReadOnly)){
            check->error = qtr("Failed to open %1: %2").arg(check->path, file.errorString());
            return;
        }
        try {
            check->actual = digest::computeDigestGz(file);
        } catch (const ExcDecompress& ex) {
            check->error = qtr("%1: %2").arg(check->path, ex.descrip());
        } catch (const QExcIo& ex) {
            check->error = qtr("%1: %2").arg(check->path, ex.descrip());
        } catch (const std::exception& ex) {
            check->error = qtr("%1: %2").arg(check->path, ex.what());
        }
    }

    DigestVerifier& m_verifier;
};


DigestVerifier::DigestVerifier(std::unique_ptr<StorePathIterator> paths, int parallelism) :
    m_paths(std::move(paths)),
    m_parallelism(std::max(1, parallelism)),
    m_started(false),
    m_runningWorkers(0),
    m_cancelled(false)
{
    m_pool.setMaxThreadCount(m_parallelism);
}

DigestVerifier::~DigestVerifier()
{
    {
        QMutexLocker lock(&m_resultMutex);
        m_cancelled = true;
        m_spaceAvailable.wakeAll();
    }
    m_pool.clear();
    m_pool.waitForDone();
}

/// Wait for the next result.
/// @return false, if all entries were verified.
bool DigestVerifier::next()
{
    if(! m_started){
        start();
    }
    QMutexLocker lock(&m_resultMutex);
    while (m_results.isEmpty() && m_runningWorkers > 0) {
        m_resultAvailable.wait(&m_resultMutex);
    }
    if(m_results.isEmpty()){
        return false;
    }
    m_current = m_results.dequeue();
    m_spaceAvailable.wakeOne();
    return true;
}

const DigestCheck &DigestVerifier::value() const
{
    return m_current;
}

void DigestVerifier::start()
{
    m_started = true;
    logDebug << "starting digest verification with" << m_parallelism << "workers";
    {
        QMutexLocker lock(&m_resultMutex);
        m_runningWorkers = m_parallelism;
    }
    for(int i=0; i < m_parallelism; i++){
        // the pool takes ownership
        m_pool.start(new VerifyTask(*this));
    }
}

/// @return false if no more entries exist or verification was cancelled.
/// A listing error is passed via 'error', otherwise it is cleared.
bool DigestVerifier::takeEntry(StoreEntry *entry, QString *error)
{
    {
        QMutexLocker lock(&m_resultMutex);
        if(m_cancelled){
            return false;
        }
    }
    QMutexLocker lock(&m_pathMutex);
    error->clear();
    try {
        if(! m_paths->next()){
            return false;
        }
        *entry = m_paths->value();
    } catch (const ExcArchiveEntry& ex) {
        *error = ex.descrip();
    }
    return true;
}

/// Enqueue a result, blocking while the queue is full.
/// @return false, if the verification was cancelled.
bool DigestVerifier::pushResult(const DigestCheck &check)
{
    QMutexLocker lock(&m_resultMutex);
    while (m_results.size() >= MAX_QUEUED_RESULTS && ! m_cancelled) {
        m_spaceAvailable.wait(&m_resultMutex);
    }
    if(m_cancelled){
        return false;
    }
    m_results.enqueue(check);
    m_resultAvailable.wakeOne();
    return true;
}

void DigestVerifier::workerFinished()
{
    QMutexLocker lock(&m_resultMutex);
    --m_runningWorkers;
    m_resultAvailable.wakeAll();
}
