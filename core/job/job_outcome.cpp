#include "job_outcome.hpp"

#include <QObject>
#include <stdexcept>

JobOutcome::JobOutcome()
    : value(Cancelled {})
{
}

JobOutcome::JobOutcome(Value value)
    : value(std::move(value))
{
}

JobOutcome JobOutcome::succeeded(const QString& outputPath)
{
    return JobOutcome(Value(Succeeded { outputPath }));
}

JobOutcome JobOutcome::failed(const JobError& error)
{
    return JobOutcome(Value(error));
}

JobOutcome JobOutcome::failed(ErrorKind kind, const QString& detail)
{
    return JobOutcome(Value(JobError { kind, detail }));
}

JobOutcome JobOutcome::cancelled()
{
    return JobOutcome(Value(Cancelled {}));
}

QString JobOutcome::outputPath() const
{
    if (!isSucceeded())
        return {};

    return std::get<Succeeded>(value).outputPath;
}

const JobError& JobOutcome::error() const
{
    if (!isFailed())
        throw std::logic_error("JobOutcome::error() called on an outcome that did not fail.");

    return std::get<JobError>(value);
}

QString errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::ToolNotFound:
        return "ToolNotFound";
    case ErrorKind::InputMissing:
        return "InputMissing";
    case ErrorKind::InputEmpty:
        return "InputEmpty";
    case ErrorKind::InputCorrupted:
        return "InputCorrupted";
    case ErrorKind::InsufficientDiskSpace:
        return "InsufficientDiskSpace";
    case ErrorKind::EngineFailure:
        return "EngineFailure";
    case ErrorKind::UnexpectedFailure:
        return "UnexpectedFailure";
    }

    return "UnexpectedFailure";
}

Message messageForOutcome(const JobOutcome& outcome)
{
    if (outcome.isSucceeded())
    {
        return Message(
            Severity::Info,
            QObject::tr("Process completed"),
            QObject::tr("The video was written to '%1'.").arg(outcome.outputPath())
        );
    }

    if (outcome.isCancelled())
        return Message(Severity::Info, QObject::tr("Conversion cancelled"), QObject::tr("The conversion was cancelled by the user."));

    const JobError& error = outcome.error();

    switch (error.kind)
    {
    case ErrorKind::ToolNotFound:
        return Message(
            Severity::Error,
            QObject::tr("Could not locate FFmpeg"),
            QObject::tr("Please make sure FFmpeg and FFprobe are in your PATH, or configure their location."),
            error.detail
        );
    case ErrorKind::InputMissing:
        return Message(Severity::Error, QObject::tr("Input not found"), error.detail);
    case ErrorKind::InputEmpty:
        return Message(Severity::Error, QObject::tr("Input is empty"), error.detail);
    case ErrorKind::InputCorrupted:
        return Message(Severity::Error, QObject::tr("Input is not a valid video"), error.detail);
    case ErrorKind::InsufficientDiskSpace:
        return Message(Severity::Error, QObject::tr("Not enough disk space"), error.detail);
    case ErrorKind::EngineFailure:
        return Message(
            Severity::Error,
            QObject::tr("Conversion failed"),
            QObject::tr("FFmpeg exited with code %1.").arg(error.exitCode.value_or(-1)),
            error.detail
        );
    case ErrorKind::UnexpectedFailure:
        return Message(Severity::Error, QObject::tr("Unexpected failure"), error.detail, "", true);
    }

    return Message(Severity::Error, QObject::tr("Unexpected failure"), error.detail, "", true);
}
