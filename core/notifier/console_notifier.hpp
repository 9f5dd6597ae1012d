#ifndef CONSOLE_NOTIFIER_H
#define CONSOLE_NOTIFIER_H

#include "notifier.hpp"

#include <QMutex>

class QIODevice;

//!
//! \brief Prints messages to the standard error stream, or to the given device.
//!
class ConsoleNotifier : public Notifier
{
public:
    ConsoleNotifier();
    explicit ConsoleNotifier(QIODevice* device);

    void Notify(const Message& message) const override;
    void Notify(Severity severity, const QString& title, const QString& message, const QString& details) const override;

private:
    static QIODevice* standardError();

    QIODevice* device;
    mutable QMutex mutex;

    const QString bugReportPrompt = "\nLooks like this issue could be a bug. Kindly report it along with the details above.";
};

#endif
