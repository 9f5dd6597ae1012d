#ifndef MESSAGE_H
#define MESSAGE_H

#include <QString>

enum Severity {
    Info,
    Warning,
    Error
};

//! Lower-case name of a severity, used as a prefix on the console.
inline QString severityLabel(Severity severity)
{
    switch (severity)
    {
    case Info:
        return "info";
    case Warning:
        return "warning";
    case Error:
        return "error";
    }

    return "error";
}

//!
//! \brief Something the user should read, such as a job result or a warning about their files.
//! \details Details are printed verbatim after the message, typically the engine's last diagnostic lines.
//!
struct Message {
    Message(Severity severity, QString title, QString message, QString details = "", bool isLikelyBug = false)
        : severity(severity)
        , title(std::move(title))
        , message(std::move(message))
        , details(std::move(details))
        , isLikelyBug(isLikelyBug)
    {
    }

    [[nodiscard]] bool asksForBugReport() const { return isLikelyBug; }

    const Severity severity;
    const QString title;
    const QString message;
    const QString details;
    const bool isLikelyBug;
};

#endif
