#include "job_controller.hpp"

#include "transcode_job.hpp"
#include "core/utils/logging.hpp"

#include <QThread>

JobController::JobController(EngineConfig config, QObject* parent)
    : JobController(std::move(config), &DiskSpaceGuard::queryStorage, parent)
{
}

JobController::JobController(EngineConfig config, DiskSpaceGuard::FreeSpaceQuery freeSpace, QObject* parent)
    : QObject(parent)
    , config(std::move(config))
    , freeSpace(std::move(freeSpace))
{
    qRegisterMetaType<JobOutcome>();
    qRegisterMetaType<JobId>("JobId");
}

JobController::~JobController()
{
    for (const ActiveJob& active : std::as_const(jobs))
    {
        active.job->disconnect(this);
        QMetaObject::invokeMethod(active.job, &TranscodeJob::Cancel, Qt::QueuedConnection);
    }

    // retired threads may still be winding down; a running engine is killed when its job is deleted
    for (QThread* thread : findChildren<QThread*>(Qt::FindDirectChildrenOnly))
    {
        thread->quit();
        thread->wait();
    }
}

JobId JobController::startJob(const Job& job)
{
    const JobId id = nextId++;

    auto* thread = new QThread(this);
    auto* worker = new TranscodeJob(job, config, freeSpace);

    thread->setObjectName(QString("job-%1").arg(id));
    worker->moveToThread(thread);

    connect(thread, &QThread::started, worker, &TranscodeJob::Start);
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);

    connect(worker, &TranscodeJob::progressChanged, this, [this, id](int percent) {
        emit progressChanged(id, percent);
    });

    connect(worker, &TranscodeJob::warningRaised, this, [this, id](const QString& warning) {
        emit warningRaised(id, warning);
    });

    connect(worker, &TranscodeJob::outcomeReady, this, [this, id](const JobOutcome& outcome) {
        Retire(id);
        emit outcomeReady(id, outcome);
    });

    jobs.insert(id, { thread, worker });

    qCDebug(lcJob) << "Scheduling job" << id;
    thread->start();

    return id;
}

void JobController::cancelJob(JobId id)
{
    const auto it = jobs.constFind(id);

    if (it == jobs.constEnd())
    {
        qCDebug(lcJob) << "Ignoring cancel request for inactive job" << id;
        return;
    }

    QMetaObject::invokeMethod(it->job, &TranscodeJob::Cancel, Qt::QueuedConnection);
}

bool JobController::isActive(JobId id) const
{
    return jobs.contains(id);
}

int JobController::activeJobCount() const
{
    return static_cast<int>(jobs.size());
}

void JobController::Retire(JobId id)
{
    const auto it = jobs.find(id);
    if (it == jobs.end())
        return;

    it->thread->quit();
    jobs.erase(it);
}
