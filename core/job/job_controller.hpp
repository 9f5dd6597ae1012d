#ifndef JOB_CONTROLLER_H
#define JOB_CONTROLLER_H

#include "disk_space_guard.hpp"
#include "job_outcome.hpp"
#include "core/encoder/job.hpp"
#include "core/settings/engine_config.hpp"

#include <QHash>
#include <QObject>

class QThread;
class TranscodeJob;

using JobId = quint64;

//!
//! \brief Entry point for running jobs.
//! \details Each job runs on a worker thread of its own. Every signal is delivered on the thread the
//! controller lives in, and outcomeReady() is always the last signal emitted for a job.
//!
class JobController final : public QObject
{
    Q_OBJECT

public:
    explicit JobController(EngineConfig config, QObject* parent = nullptr);
    JobController(EngineConfig config, DiskSpaceGuard::FreeSpaceQuery freeSpace, QObject* parent = nullptr);
    ~JobController() override;

    //! Schedules a job and returns immediately.
    JobId startJob(const Job& job);

    //! Requests cancellation. Unknown or finished jobs are ignored.
    void cancelJob(JobId id);

    [[nodiscard]] bool isActive(JobId id) const;
    [[nodiscard]] int activeJobCount() const;

signals:
    void progressChanged(JobId id, int percent);
    void warningRaised(JobId id, const QString& warning);
    void outcomeReady(JobId id, const JobOutcome& outcome);

private:
    struct ActiveJob {
        QThread* thread;
        TranscodeJob* job;
    };

    void Retire(JobId id);

    const EngineConfig config;
    const DiskSpaceGuard::FreeSpaceQuery freeSpace;

    QHash<JobId, ActiveJob> jobs;
    JobId nextId = 1;
};

#endif
