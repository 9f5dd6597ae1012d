#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "core/job/job_controller.hpp"
#include "core/job/transcode_job.hpp"
#include "fake_tools.hpp"

class TestJobController : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void compressMkvEndToEnd();
    void compressAviUsesQscale();
    void convertForcesMp4();
    void cancelRunningJob();
    void cancelStubbornEngine();
    void cancelUnknownJobIsIgnored();
    void emptyInputNeverSpawnsEngine();
    void missingToolsAreReported();
    void diskShortfallNeverSpawnsEngine();
    void unknownFreeSpaceProceeds();
    void engineFailureCarriesExitCode();
    void problematicNamesRaiseWarnings();
    void jobsRunConcurrently();
    void pathsAreNormalized();

private:
    EngineConfig config() const;
    JobOutcome waitForOutcome(QSignalSpy& spy, JobId id) const;
    bool engineWasSpawned() const;

    std::unique_ptr<QTemporaryDir> dir;
    QString clip;
};

static DiskSpaceGuard::FreeSpaceQuery freeBytes(std::optional<qint64> bytes)
{
    return [bytes](const QString&) { return bytes; };
}

static constexpr qint64 GB = 1024LL * 1024 * 1024;

void TestJobController::init()
{
    dir = std::make_unique<QTemporaryDir>();
    QVERIFY(dir->isValid());

    clip = writeFile(*dir, "clip.mkv", QByteArray(4096, 'v'));
    QVERIFY(!clip.isEmpty());
    QVERIFY(!writeFakeProbe(*dir).isEmpty());
    QVERIFY(!writeFakeEngine(*dir, ENGINE_SUCCEEDS).isEmpty());
}

EngineConfig TestJobController::config() const
{
    EngineConfig config;
    config.ffmpegPath = dir->filePath("ffmpeg");
    config.ffprobePath = dir->filePath("ffprobe");
    config.terminateGraceMs = 300;

    return config;
}

JobOutcome TestJobController::waitForOutcome(QSignalSpy& spy, JobId id) const
{
    QElapsedTimer timer;
    timer.start();

    while (timer.elapsed() < 15000)
    {
        for (qsizetype i = 0; i < spy.size(); ++i)
        {
            if (spy.at(i).at(0).value<JobId>() == id)
                return spy.takeAt(i).at(1).value<JobOutcome>();
        }

        spy.wait(200);
    }

    return JobOutcome::failed(ErrorKind::UnexpectedFailure, "no outcome");
}

bool TestJobController::engineWasSpawned() const
{
    return QFile::exists(dir->filePath("args.txt"));
}

void TestJobController::compressMkvEndToEnd()
{
    JobController controller(config(), freeBytes(100 * GB));
    QSignalSpy progress(&controller, &JobController::progressChanged);
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const QString output = dir->filePath("out.mkv");
    const JobId id = controller.startJob({ clip, output, JobMode::Compress, QualityTier::Balanced });

    QVERIFY(controller.isActive(id));

    const JobOutcome outcome = waitForOutcome(outcomes, id);

    QVERIFY(outcome.isSucceeded());
    QCOMPARE(outcome.outputPath(), output);
    QVERIFY(!controller.isActive(id));

    QCOMPARE(progress.count(), 2);
    QCOMPARE(progress.at(0).at(1).toInt(), 50);
    QCOMPARE(progress.at(1).at(1).toInt(), 100);

    const QStringList arguments = recordedArguments(*dir);
    QCOMPARE(
        arguments,
        QStringList({ "-i", clip, "-c:v", "libx264", "-crf", "23", "-preset", "medium", "-c:a", "aac", "-b:a", "128k", output, "-y" })
    );
}

void TestJobController::compressAviUsesQscale()
{
    const QString avi = writeFile(*dir, "clip.avi", QByteArray(4096, 'v'));

    JobController controller(config(), freeBytes(100 * GB));
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const JobId id = controller.startJob({ avi, dir->filePath("out.avi"), JobMode::Compress, QualityTier::Balanced });

    QVERIFY(waitForOutcome(outcomes, id).isSucceeded());

    const QStringList arguments = recordedArguments(*dir);
    QVERIFY(arguments.contains("-qscale:v"));
    QVERIFY(!arguments.contains("-crf"));
}

void TestJobController::convertForcesMp4()
{
    JobController controller(config(), freeBytes(100 * GB));
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const JobId id = controller.startJob({ clip, dir->filePath("copy.mkv"), JobMode::Convert, QualityTier::High });
    const JobOutcome outcome = waitForOutcome(outcomes, id);

    QVERIFY(outcome.isSucceeded());
    QCOMPARE(outcome.outputPath(), dir->filePath("copy.mp4"));

    const QStringList arguments = recordedArguments(*dir);
    QCOMPARE(arguments, QStringList({ "-i", clip, "-c:v", "copy", "-c:a", "copy", dir->filePath("copy.mp4"), "-y" }));
}

void TestJobController::cancelRunningJob()
{
    QVERIFY(!writeFakeEngine(*dir, ENGINE_RUNS_FOREVER).isEmpty());

    JobController controller(config(), freeBytes(100 * GB));
    QSignalSpy progress(&controller, &JobController::progressChanged);
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const JobId id = controller.startJob({ clip, dir->filePath("out.mkv"), JobMode::Compress, QualityTier::Balanced });

    QVERIFY(progress.wait(10000));
    controller.cancelJob(id);

    const JobOutcome outcome = waitForOutcome(outcomes, id);
    QVERIFY(outcome.isCancelled());

    controller.cancelJob(id);
    QTest::qWait(200);
    QCOMPARE(outcomes.count(), 0);
}

void TestJobController::cancelStubbornEngine()
{
    QVERIFY(!writeFakeEngine(*dir, ENGINE_IGNORES_TERM).isEmpty());

    JobController controller(config(), freeBytes(100 * GB));
    QSignalSpy progress(&controller, &JobController::progressChanged);
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const JobId id = controller.startJob({ clip, dir->filePath("out.mkv"), JobMode::Compress, QualityTier::Balanced });

    QVERIFY(progress.wait(10000));
    controller.cancelJob(id);

    const JobOutcome outcome = waitForOutcome(outcomes, id);
    QVERIFY(outcome.isCancelled());
    QVERIFY(!outcome.isFailed());
}

void TestJobController::cancelUnknownJobIsIgnored()
{
    JobController controller(config(), freeBytes(100 * GB));
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    controller.cancelJob(42);
    QTest::qWait(100);

    QCOMPARE(outcomes.count(), 0);
    QCOMPARE(controller.activeJobCount(), 0);
}

void TestJobController::emptyInputNeverSpawnsEngine()
{
    const QString empty = writeFile(*dir, "empty.mkv", {});

    JobController controller(config(), freeBytes(100 * GB));
    QSignalSpy progress(&controller, &JobController::progressChanged);
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const JobId id = controller.startJob({ empty, dir->filePath("out.mkv"), JobMode::Compress, QualityTier::Balanced });
    const JobOutcome outcome = waitForOutcome(outcomes, id);

    QVERIFY(outcome.isFailed());
    QCOMPARE(outcome.error().kind, ErrorKind::InputEmpty);
    QCOMPARE(progress.count(), 0);
    QVERIFY(!engineWasSpawned());
}

void TestJobController::missingToolsAreReported()
{
    EngineConfig broken = config();
    broken.ffmpegPath = dir->filePath("no-such-ffmpeg");

    JobController controller(broken, freeBytes(100 * GB));
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const JobId id = controller.startJob({ clip, dir->filePath("out.mkv"), JobMode::Compress, QualityTier::Balanced });
    const JobOutcome outcome = waitForOutcome(outcomes, id);

    QVERIFY(outcome.isFailed());
    QCOMPARE(outcome.error().kind, ErrorKind::ToolNotFound);
}

void TestJobController::diskShortfallNeverSpawnsEngine()
{
    JobController controller(config(), freeBytes(0));
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const JobId id = controller.startJob({ clip, dir->filePath("out.mkv"), JobMode::Compress, QualityTier::Balanced });
    const JobOutcome outcome = waitForOutcome(outcomes, id);

    QVERIFY(outcome.isFailed());
    QCOMPARE(outcome.error().kind, ErrorKind::InsufficientDiskSpace);
    QVERIFY(!engineWasSpawned());
}

void TestJobController::unknownFreeSpaceProceeds()
{
    JobController controller(config(), freeBytes(std::nullopt));
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const JobId id = controller.startJob({ clip, dir->filePath("out.mkv"), JobMode::Compress, QualityTier::Balanced });

    QVERIFY(waitForOutcome(outcomes, id).isSucceeded());
    QVERIFY(engineWasSpawned());
}

void TestJobController::engineFailureCarriesExitCode()
{
    QVERIFY(!writeFakeEngine(*dir, ENGINE_FAILS).isEmpty());

    JobController controller(config(), freeBytes(100 * GB));
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const JobId id = controller.startJob({ clip, dir->filePath("out.mkv"), JobMode::Compress, QualityTier::Balanced });
    const JobOutcome outcome = waitForOutcome(outcomes, id);

    QVERIFY(outcome.isFailed());
    QCOMPARE(outcome.error().kind, ErrorKind::EngineFailure);
    QCOMPARE(outcome.error().exitCode, std::optional<int>(3));
}

void TestJobController::problematicNamesRaiseWarnings()
{
    const QString accented = writeFile(*dir, QString::fromUtf8("canción.mkv"), QByteArray(4096, 'v'));

    JobController controller(config(), freeBytes(100 * GB));
    QSignalSpy warnings(&controller, &JobController::warningRaised);
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const JobId id = controller.startJob({ accented, dir->filePath("out.mkv"), JobMode::Compress, QualityTier::Balanced });

    QVERIFY(waitForOutcome(outcomes, id).isSucceeded());
    QCOMPARE(warnings.count(), 1);
    QCOMPARE(warnings.at(0).at(0).value<JobId>(), id);
}

void TestJobController::jobsRunConcurrently()
{
    JobController controller(config(), freeBytes(100 * GB));
    QSignalSpy outcomes(&controller, &JobController::outcomeReady);

    const JobId first = controller.startJob({ clip, dir->filePath("first.mkv"), JobMode::Compress, QualityTier::High });
    const JobId second = controller.startJob({ clip, dir->filePath("second.mp4"), JobMode::Convert, QualityTier::High });

    QVERIFY(first != second);
    QCOMPARE(controller.activeJobCount(), 2);

    QVERIFY(waitForOutcome(outcomes, first).isSucceeded());
    QVERIFY(waitForOutcome(outcomes, second).isSucceeded());
    QCOMPARE(controller.activeJobCount(), 0);
}

void TestJobController::pathsAreNormalized()
{
    const Job job = TranscodeJob::normalized({ "videos/./a/../clip.mkv", "out\\dir/../result.avi", JobMode::Convert, QualityTier::Balanced });

    QVERIFY(QFileInfo(job.inputPath).isAbsolute());
    QVERIFY(job.inputPath.endsWith("/videos/clip.mkv"));
    QVERIFY(!job.inputPath.contains("/./"));
    QVERIFY(QFileInfo(job.outputPath).isAbsolute());
    QVERIFY(job.outputPath.endsWith("/result.mp4"));
}

QTEST_MAIN(TestJobController)
#include "test_job_controller.moc"
