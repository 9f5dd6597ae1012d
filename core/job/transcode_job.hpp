#ifndef TRANSCODE_JOB_H
#define TRANSCODE_JOB_H

#include "disk_space_guard.hpp"
#include "job_outcome.hpp"
#include "core/encoder/job.hpp"
#include "core/settings/engine_config.hpp"

#include <QObject>

class ProcessSupervisor;

//!
//! \brief One job, living on its own worker thread.
//! \details Validation, launch and supervision are separate queued steps so that a cancel request
//! delivered in between is seen before the engine is spawned. Exactly one outcomeReady() is emitted.
//!
class TranscodeJob final : public QObject
{
    Q_OBJECT

public:
    TranscodeJob(Job job, EngineConfig config, DiskSpaceGuard::FreeSpaceQuery freeSpace, QObject* parent = nullptr);
    ~TranscodeJob() override;

    //! Absolute, cleaned paths with forward slashes. Convert mode always targets the canonical container.
    static Job normalized(const Job& job);

public slots:
    void Start();
    void Cancel();

signals:
    void progressChanged(int percent);
    void warningRaised(const QString& warning);
    void outcomeReady(const JobOutcome& outcome);

private:
    enum class Stage
    {
        Pending,
        Validated,
        Running,
        Finished
    };

    void Launch();
    void Finish(const JobOutcome& outcome);
    void WarnAboutFileName(const QString& path);

    Job job;
    const EngineConfig config;
    const DiskSpaceGuard diskGuard;

    Stage stage = Stage::Pending;
    ProcessSupervisor* supervisor = nullptr;
};

#endif
