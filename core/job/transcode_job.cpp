#include "transcode_job.hpp"

#include "preflight.hpp"
#include "core/encoder/command_builder.hpp"
#include "core/encoder/process_supervisor.hpp"
#include "core/formats/container.hpp"
#include "core/formats/duration_probe.hpp"
#include "core/utils/filename_check.hpp"
#include "core/utils/logging.hpp"

#include <QDir>
#include <QFileInfo>

TranscodeJob::TranscodeJob(Job job, EngineConfig config, DiskSpaceGuard::FreeSpaceQuery freeSpace, QObject* parent)
    : QObject(parent)
    , job(std::move(job))
    , config(std::move(config))
    , diskGuard(this->config.diskSafetyMargin, std::move(freeSpace))
{
}

TranscodeJob::~TranscodeJob() = default;

Job TranscodeJob::normalized(const Job& job)
{
    const auto clean = [](const QString& path) {
        return QDir::fromNativeSeparators(QDir::cleanPath(QFileInfo(path).absoluteFilePath()));
    };

    Job result = job;
    result.inputPath = clean(job.inputPath);
    result.outputPath = clean(job.outputPath);

    if (result.mode == JobMode::Convert)
    {
        const QFileInfo output(result.outputPath);
        const QString extension(CANONICAL_CONTAINER_EXTENSION);

        if (output.suffix().compare(extension, Qt::CaseInsensitive) != 0)
            result.outputPath = output.dir().filePath(output.completeBaseName() + '.' + extension);
    }

    return result;
}

void TranscodeJob::Start()
{
    if (stage != Stage::Pending)
        return;

    job = normalized(job);

    qCInfo(lcJob).noquote() << jobModeName(job.mode) << job.inputPath << "->" << job.outputPath
                            << "quality" << qualityTierName(job.quality);

    WarnAboutFileName(job.inputPath);
    WarnAboutFileName(job.outputPath);

    if (const auto error = Preflight(config).run(job.inputPath))
    {
        Finish(JobOutcome::failed(*error));
        return;
    }

    const auto required = static_cast<qint64>(QFileInfo(job.inputPath).size() * config.diskEstimateFactor);

    if (const auto error = diskGuard.check(job.outputPath, required))
    {
        Finish(JobOutcome::failed(*error));
        return;
    }

    stage = Stage::Validated;

    QMetaObject::invokeMethod(this, &TranscodeJob::Launch, Qt::QueuedConnection);
}

void TranscodeJob::Launch()
{
    // cancelled while the launch was queued
    if (stage != Stage::Validated)
        return;

    const double duration = DurationProbe(config.ffprobePath, config.durationProbeTimeoutMs).probeSeconds(job.inputPath);

    if (duration <= 0)
        qCInfo(lcJob) << "Duration of" << job.inputPath << "is unknown, progress will not be reported";

    const auto command = CommandBuilder::forJob(job);

    if (std::holds_alternative<QStringList>(command))
    {
        Finish(JobOutcome::failed(ErrorKind::UnexpectedFailure, std::get<QStringList>(command).join('\n')));
        return;
    }

    supervisor = new ProcessSupervisor(config.ffmpegPath, config.terminateGraceMs, this);

    connect(supervisor, &ProcessSupervisor::progressChanged, this, &TranscodeJob::progressChanged);
    connect(supervisor, &ProcessSupervisor::finished, this, &TranscodeJob::Finish);

    stage = Stage::Running;
    supervisor->Start(std::get<EngineCommand>(command), job.outputPath, duration);
}

void TranscodeJob::Cancel()
{
    switch (stage)
    {
    case Stage::Finished:
        qCDebug(lcJob) << "Ignoring cancel request for a finished job";
        return;

    case Stage::Running:
        supervisor->Cancel();
        return;

    default:
        qCInfo(lcJob) << "Job cancelled before the engine was started";
        Finish(JobOutcome::cancelled());
        return;
    }
}

void TranscodeJob::Finish(const JobOutcome& outcome)
{
    if (stage == Stage::Finished)
        return;

    stage = Stage::Finished;

    if (outcome.isFailed())
        qCWarning(lcJob).noquote() << "Job failed:" << errorKindName(outcome.error().kind) << outcome.error().detail;
    else
        qCInfo(lcJob) << "Job finished:" << (outcome.isSucceeded() ? "succeeded" : "cancelled");

    emit outcomeReady(outcome);
}

void TranscodeJob::WarnAboutFileName(const QString& path)
{
    if (const auto problem = problematicFileName(path, config.maxFileNameLength))
    {
        qCWarning(lcJob).noquote() << *problem;
        emit warningRaised(*problem);
    }
}
