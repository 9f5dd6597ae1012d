#include "preflight.hpp"

#include "core/utils/logging.hpp"
#include "core/utils/tool_query.hpp"

#include <QFileInfo>
#include <QObject>

Preflight::Preflight(EngineConfig config)
    : config(std::move(config))
{
}

std::optional<JobError> Preflight::run(const QString& inputPath) const
{
    if (auto error = checkTools())
        return error;

    if (auto error = checkInputFile(inputPath))
        return error;

    return checkVideoStream(inputPath);
}

std::optional<JobError> Preflight::checkTools() const
{
    if (auto error = checkTool(config.ffmpegPath))
        return error;

    return checkTool(config.ffprobePath);
}

std::optional<JobError> Preflight::checkTool(const QString& program) const
{
    const ToolQueryResult result = queryTool(program, { "-version" }, config.versionCheckTimeoutMs);

    if (result.succeeded())
        return std::nullopt;

    qCWarning(lcJob) << program << "is not usable:" << (result.started ? QString("exit code %1").arg(result.exitCode) : result.errorString);

    return JobError {
        ErrorKind::ToolNotFound,
        QObject::tr("'%1' could not be run. Install FFmpeg and add it to your PATH.").arg(program)
    };
}

std::optional<JobError> Preflight::checkInputFile(const QString& inputPath) const
{
    const QFileInfo input(inputPath);

    if (!input.exists() || !input.isFile())
        return JobError { ErrorKind::InputMissing, QObject::tr("The input file does not exist: %1").arg(inputPath) };

    if (input.size() == 0)
        return JobError { ErrorKind::InputEmpty, QObject::tr("The input file is empty: %1").arg(inputPath) };

    return std::nullopt;
}

std::optional<JobError> Preflight::checkVideoStream(const QString& inputPath) const
{
    const QStringList arguments {
        "-v", "error",
        "-select_streams", "v:0",
        "-show_entries", "stream=codec_type",
        "-of", "csv=p=0",
        inputPath
    };

    const ToolQueryResult result = queryTool(config.ffprobePath, arguments, config.streamCheckTimeoutMs);

    if (result.timedOut)
    {
        return JobError {
            ErrorKind::InputCorrupted,
            QObject::tr("Timed out after %1 seconds while validating the video file.").arg(config.streamCheckTimeoutMs / 1000.0)
        };
    }

    if (!result.succeeded())
    {
        return JobError {
            ErrorKind::InputCorrupted,
            (QObject::tr("The file is not a valid video or is corrupted.") + '\n' + QString::fromUtf8(result.standardError)).trimmed()
        };
    }

    if (QString::fromUtf8(result.standardOutput).trimmed().isEmpty())
        return JobError { ErrorKind::InputCorrupted, QObject::tr("The file does not contain a valid video stream.") };

    return std::nullopt;
}
