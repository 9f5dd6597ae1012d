#ifndef CONSOLE_FRONTEND_H
#define CONSOLE_FRONTEND_H

#include "encoder/job.hpp"
#include "job/job_controller.hpp"
#include "notifier/notifier.hpp"
#include "settings/settings.hpp"
#include "utils/platform_info.hpp"

#include <QObject>
#include <QTimer>
#include <boost/di.hpp>
#include <memory>
#include <variant>

struct FrontendOptions {
    Job job;
    QString configFile;
};

//!
//! \brief Runs a single job from the command line and turns its outcome into an exit status.
//!
class ConsoleFrontend final : public QObject
{
    Q_OBJECT

public:
    enum ExitCode
    {
        ExitSuccess = 0,
        ExitFailure = 1,
        ExitCancelled = 2,
        ExitUsage = 64
    };

    BOOST_DI_INJECT(
        ConsoleFrontend,
        std::shared_ptr<Settings> settings,
        Notifier& notifier,
        PlatformInfo& platformInfo,
        const FrontendOptions& options
    );

    void Run();

    //! Returns the options, or a usage error to print.
    static std::variant<FrontendOptions, QString> parseArguments(const QStringList& arguments);

    //! Output used when none is given on the command line.
    static QString defaultOutputPath(const QString& inputPath, JobMode mode);

    //! Asks the running job to stop. Safe to call from a signal handler.
    static void RequestInterrupt();

private:
    void PollInterrupt();
    void ReportProgress(JobId id, int percent);
    void ReportOutcome(JobId id, const JobOutcome& outcome);

    std::shared_ptr<Settings> settings;
    Notifier& notifier;
    const FrontendOptions options;

    JobController controller;
    QTimer interruptTimer;
    std::optional<JobId> jobId;
};

#endif
