#include <QtTest/QtTest>

#include "console_frontend.hpp"

class TestConsoleFrontend : public QObject
{
    Q_OBJECT

private slots:
    void defaultOutputPath_data();
    void defaultOutputPath();
    void parsesFullCommandLine();
    void defaultsToBalancedCompression();
    void unknownQualityFallsBackToBalanced();
    void usageErrors_data();
    void usageErrors();
};

void TestConsoleFrontend::defaultOutputPath_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<JobMode>("mode");
    QTest::addColumn<QString>("output");

    QTest::newRow("convert avi") << "/videos/clip.avi" << JobMode::Convert << "/videos/clip.mp4";
    QTest::newRow("convert mp4") << "/videos/clip.mp4" << JobMode::Convert << "/videos/clip_converted.mp4";
    QTest::newRow("compress mkv") << "/videos/clip.mkv" << JobMode::Compress << "/videos/clip_compressed.mkv";
    QTest::newRow("compress dotted") << "/videos/my.trip.webm" << JobMode::Compress << "/videos/my.trip_compressed.webm";
}

void TestConsoleFrontend::defaultOutputPath()
{
    QFETCH(QString, input);
    QFETCH(JobMode, mode);
    QFETCH(QString, output);

    QCOMPARE(ConsoleFrontend::defaultOutputPath(input, mode), output);
}

void TestConsoleFrontend::parsesFullCommandLine()
{
    const auto parsed = ConsoleFrontend::parseArguments(
        { "video-converter", "--mode", "convert", "--quality", "high", "--config", "custom.ini", "in.avi", "out.mov" }
    );

    QVERIFY(std::holds_alternative<FrontendOptions>(parsed));

    const FrontendOptions& options = std::get<FrontendOptions>(parsed);
    QCOMPARE(options.configFile, QString("custom.ini"));
    QCOMPARE(options.job.mode, JobMode::Convert);
    QCOMPARE(options.job.quality, QualityTier::High);
    QCOMPARE(options.job.inputPath, QString("in.avi"));
    QCOMPARE(options.job.outputPath, QString("out.mov"));
}

void TestConsoleFrontend::defaultsToBalancedCompression()
{
    const auto parsed = ConsoleFrontend::parseArguments({ "video-converter", "/videos/clip.mkv" });

    QVERIFY(std::holds_alternative<FrontendOptions>(parsed));

    const FrontendOptions& options = std::get<FrontendOptions>(parsed);
    QCOMPARE(options.job.mode, JobMode::Compress);
    QCOMPARE(options.job.quality, QualityTier::Balanced);
    QCOMPARE(options.job.outputPath, QString("/videos/clip_compressed.mkv"));
    QCOMPARE(options.configFile, QString("config.ini"));
}

void TestConsoleFrontend::unknownQualityFallsBackToBalanced()
{
    const auto parsed = ConsoleFrontend::parseArguments({ "video-converter", "--quality", "ultra", "clip.mkv" });

    QVERIFY(std::holds_alternative<FrontendOptions>(parsed));
    QCOMPARE(std::get<FrontendOptions>(parsed).job.quality, QualityTier::Balanced);
}

void TestConsoleFrontend::usageErrors_data()
{
    QTest::addColumn<QStringList>("arguments");

    QTest::newRow("no input") << QStringList { "video-converter" };
    QTest::newRow("too many files") << QStringList { "video-converter", "a.mkv", "b.mkv", "c.mkv" };
    QTest::newRow("unknown mode") << QStringList { "video-converter", "--mode", "shrink", "a.mkv" };
    QTest::newRow("unknown option") << QStringList { "video-converter", "--fast", "a.mkv" };
}

void TestConsoleFrontend::usageErrors()
{
    QFETCH(QStringList, arguments);

    QVERIFY(std::holds_alternative<QString>(ConsoleFrontend::parseArguments(arguments)));
}

QTEST_MAIN(TestConsoleFrontend)
#include "test_console_frontend.moc"
