#include "command_builder.hpp"

#include "core/formats/container.hpp"

#include <QFileInfo>
#include <QObject>

QString EngineCommand::commandLine(const QString& program) const
{
    return QStringList { CommandBuilder::quotePath(program), arguments.join(' ') }.join(' ');
}

CommandBuilder::self& CommandBuilder::inputFrom(const QString& inputPath)
{
    if (inputPath.isEmpty())
    {
        errors.append(QObject::tr("Input path is empty."));
        return *this;
    }

    this->inputPath = inputPath;
    return *this;
}

CommandBuilder::self& CommandBuilder::outputTo(const QString& outputPath)
{
    if (outputPath.isEmpty())
    {
        errors.append(QObject::tr("Output path is empty."));
        return *this;
    }

    this->outputPath = outputPath;
    return *this;
}

CommandBuilder::self& CommandBuilder::inMode(JobMode mode)
{
    this->mode = mode;
    return *this;
}

CommandBuilder::self& CommandBuilder::withQuality(QualityTier tier)
{
    this->quality = tier;
    return *this;
}

std::variant<EngineCommand, QStringList> CommandBuilder::build() const
{
    QStringList problems = errors;

    if (!inputPath.has_value() && problems.isEmpty())
        problems.append(QObject::tr("No input path was specified."));

    if (!outputPath.has_value() && problems.isEmpty())
        problems.append(QObject::tr("No output path was specified."));

    if (!problems.isEmpty())
        return problems;

    QStringList arguments { "-i", quotePath(*inputPath) };
    arguments += mode == JobMode::Convert ? convertArguments() : compressArguments();
    arguments << quotePath(*outputPath) << "-y";

    return EngineCommand { arguments };
}

std::variant<EngineCommand, QStringList> CommandBuilder::forJob(const Job& job)
{
    return CommandBuilder()
        .inputFrom(job.inputPath)
        .outputTo(job.outputPath)
        .inMode(job.mode)
        .withQuality(job.quality)
        .build();
}

QString CommandBuilder::quotePath(const QString& path)
{
    QString escaped = path;
    escaped.replace('"', QStringLiteral("\"\"\""));

    return '"' + escaped + '"';
}

QStringList CommandBuilder::convertArguments() const
{
    // stream copy, the quality tier is irrelevant here
    return { "-c:v", "copy", "-c:a", "copy" };
}

QStringList CommandBuilder::compressArguments() const
{
    const QualityPreset& preset = qualityPresetFor(quality);
    const Container& container = containerForExtension(QFileInfo(*outputPath).suffix());

    QStringList arguments { "-c:v", container.videoEncoder };

    if (container.qscale.has_value())
    {
        arguments << "-qscale:v" << QString::number(*container.qscale);
    }
    else
    {
        arguments << "-crf" << preset.crf;

        if (!preset.speedPreset.isEmpty())
            arguments << "-preset" << preset.speedPreset;
    }

    arguments << "-c:a" << container.audioEncoder << "-b:a" << preset.audioBitrate;

    return arguments;
}
