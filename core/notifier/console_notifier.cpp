#include "console_notifier.hpp"

#include <QFile>
#include <QMutexLocker>
#include <QTextStream>

#include <cstdio>

ConsoleNotifier::ConsoleNotifier()
    : device(standardError())
{
}

ConsoleNotifier::ConsoleNotifier(QIODevice* device)
    : device(device)
{
}

void ConsoleNotifier::Notify(const Message& message) const
{
    if (message.asksForBugReport())
        Notify(message.severity, message.title, message.message + bugReportPrompt, message.details);
    else
        Notify(message.severity, message.title, message.message, message.details);
}

void ConsoleNotifier::Notify(Severity severity, const QString& title, const QString& message, const QString& details) const
{
    QMutexLocker locker(&mutex);

    if (device == nullptr || !device->isWritable())
        return;

    QTextStream stream(device);
    stream << QString("[%1] %2: %3").arg(severityLabel(severity), title, message) << Qt::endl;

    if (!details.isEmpty())
        stream << details.trimmed() << Qt::endl;

    stream.flush();
}

QIODevice* ConsoleNotifier::standardError()
{
    static QFile file;

    if (!file.isOpen() && !file.open(stderr, QIODevice::WriteOnly | QIODevice::Text))
        return nullptr;

    return &file;
}
