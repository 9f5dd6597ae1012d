#include "console_frontend.hpp"
#include "notifier/console_notifier.hpp"
#include "settings/ini_settings.hpp"

#include <boost/di.hpp>

namespace di = boost::di;

#include <QCoreApplication>
#include <QDir>
#include <QTextStream>

#include <csignal>

static void handleInterrupt(int)
{
    ConsoleFrontend::RequestInterrupt();
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("video-converter");

    const auto parsed = ConsoleFrontend::parseArguments(app.arguments());

    if (const auto* usage = std::get_if<QString>(&parsed))
    {
        QTextStream(stderr) << *usage << Qt::endl;
        return ConsoleFrontend::ExitUsage;
    }

    const FrontendOptions& options = std::get<FrontendOptions>(parsed);
    const QString defaults = QDir(QCoreApplication::applicationDirPath()).filePath("config_default.ini");

    const auto injector = di::make_injector(
        di::bind<Settings>.to([&options, &defaults]
                              { return std::make_shared<IniSettings>(options.configFile, defaults); }),
        di::bind<Notifier>.to(std::make_shared<ConsoleNotifier>()),
        di::bind<FrontendOptions>.to(options)
    );

    const auto frontend = injector.create<std::shared_ptr<ConsoleFrontend>>();

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    frontend->Run();

    return app.exec();
}
