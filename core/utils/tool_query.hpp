#ifndef TOOL_QUERY_HPP
#define TOOL_QUERY_HPP

#include <QByteArray>
#include <QProcess>
#include <QStringList>

//!
//! \brief Outcome of a short, bounded invocation of a command-line tool.
//!
struct ToolQueryResult {
    bool started = false;
    bool timedOut = false;
    QProcess::ExitStatus exitStatus = QProcess::NormalExit;
    int exitCode = -1;
    QByteArray standardOutput;
    QByteArray standardError;
    QString errorString;

    [[nodiscard]] bool succeeded() const { return started && !timedOut && exitStatus == QProcess::NormalExit && exitCode == 0; }
};

//!
//! \brief Runs a tool to completion and collects its output.
//! \details Blocks the calling thread for at most timeoutMs. A tool still running by then is killed.
//!
ToolQueryResult queryTool(const QString& program, const QStringList& arguments, int timeoutMs);

#endif
