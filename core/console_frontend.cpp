#include "console_frontend.hpp"

#include "formats/container.hpp"
#include "utils/logging.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QTextStream>

#include <atomic>
#include <cstdio>

static std::atomic<bool> interruptRequested = false;

ConsoleFrontend::ConsoleFrontend(
    std::shared_ptr<Settings> settings,
    Notifier& notifier,
    PlatformInfo& platformInfo,
    const FrontendOptions& options
)
    : settings(std::move(settings))
    , notifier(notifier)
    , options(options)
    , controller(EngineConfig::fromSettings(*this->settings, platformInfo))
{
    connect(&controller, &JobController::progressChanged, this, &ConsoleFrontend::ReportProgress);
    connect(&controller, &JobController::outcomeReady, this, &ConsoleFrontend::ReportOutcome);
    connect(&controller, &JobController::warningRaised, this, [this](JobId, const QString& warning) {
        this->notifier.Notify(Warning, tr("Problematic file name"), warning);
    });

    interruptTimer.setInterval(100);
    connect(&interruptTimer, &QTimer::timeout, this, &ConsoleFrontend::PollInterrupt);
}

void ConsoleFrontend::Run()
{
    jobId = controller.startJob(options.job);
    interruptTimer.start();
}

std::variant<FrontendOptions, QString> ConsoleFrontend::parseArguments(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Converts or compresses a video file with FFmpeg."));
    parser.addHelpOption();

    const QCommandLineOption modeOption(
        "mode", QCoreApplication::translate("main", "Job mode: convert or compress."), "mode", jobModeName(JobMode::Compress)
    );
    const QCommandLineOption qualityOption(
        "quality", QCoreApplication::translate("main", "Quality tier: %1.").arg(qualityTierNames().join(", ")), "quality",
        qualityTierName(QualityTier::Balanced)
    );
    const QCommandLineOption configOption(
        "config", QCoreApplication::translate("main", "Settings file to read."), "file", "config.ini"
    );

    parser.addOptions({ modeOption, qualityOption, configOption });
    parser.addPositionalArgument("input", QCoreApplication::translate("main", "Video file to process."));
    parser.addPositionalArgument("output", QCoreApplication::translate("main", "Destination file (optional)."), "[output]");

    if (!parser.parse(arguments))
        return parser.errorText() + '\n' + parser.helpText();

    if (parser.isSet("help"))
        return parser.helpText();

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty() || positional.size() > 2)
        return parser.helpText();

    const std::optional<JobMode> mode = jobModeFromName(parser.value(modeOption));
    if (!mode.has_value())
        return QCoreApplication::translate("main", "Unknown mode '%1'.\n").arg(parser.value(modeOption)) + parser.helpText();

    FrontendOptions options;
    options.configFile = parser.value(configOption);
    options.job.mode = *mode;
    options.job.inputPath = positional.first();
    options.job.outputPath = positional.size() == 2 ? positional.last() : defaultOutputPath(positional.first(), *mode);

    if (const auto quality = qualityTierFromName(parser.value(qualityOption)))
    {
        options.job.quality = *quality;
    }
    else
    {
        qCWarning(lcJob) << "Unknown quality" << parser.value(qualityOption) << "- using balanced";
        options.job.quality = QualityTier::Balanced;
    }

    return options;
}

QString ConsoleFrontend::defaultOutputPath(const QString& inputPath, JobMode mode)
{
    const QFileInfo input(inputPath);
    const QString base = input.path() + '/' + input.completeBaseName();

    if (mode == JobMode::Convert)
    {
        const QString output = base + '.' + QString(CANONICAL_CONTAINER_EXTENSION);
        return QFileInfo(output).absoluteFilePath() == input.absoluteFilePath() ? base + "_converted." + CANONICAL_CONTAINER_EXTENSION
                                                                                  : output;
    }

    return input.suffix().isEmpty() ? base + "_compressed" : base + "_compressed." + input.suffix();
}

void ConsoleFrontend::RequestInterrupt()
{
    interruptRequested = true;
}

void ConsoleFrontend::PollInterrupt()
{
    if (!interruptRequested.exchange(false) || !jobId.has_value())
        return;

    qCInfo(lcJob) << "Interrupted, cancelling job" << *jobId;
    controller.cancelJob(*jobId);
}

void ConsoleFrontend::ReportProgress(JobId, int percent)
{
    QTextStream out(stdout);
    out << QString("\rProgress: %1%").arg(percent, 3) << Qt::flush;
}

void ConsoleFrontend::ReportOutcome(JobId, const JobOutcome& outcome)
{
    interruptTimer.stop();

    QTextStream out(stdout);
    out << Qt::endl;

    notifier.Notify(messageForOutcome(outcome));

    if (outcome.isSucceeded())
        QCoreApplication::exit(ExitSuccess);
    else if (outcome.isCancelled())
        QCoreApplication::exit(ExitCancelled);
    else
        QCoreApplication::exit(ExitFailure);
}
