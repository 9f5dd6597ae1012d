#include "tool_query.hpp"

#include "logging.hpp"

ToolQueryResult queryTool(const QString& program, const QStringList& arguments, int timeoutMs)
{
    ToolQueryResult result;

    QProcess process;
    process.start(program, arguments, QIODevice::ReadOnly);

    if (!process.waitForStarted(timeoutMs))
    {
        result.errorString = process.errorString();
        qCDebug(lcProbe) << program << "could not be started:" << result.errorString;
        return result;
    }

    result.started = true;

    if (!process.waitForFinished(timeoutMs))
    {
        result.timedOut = process.state() != QProcess::NotRunning;
        result.errorString = process.errorString();

        if (result.timedOut)
        {
            qCWarning(lcProbe) << program << arguments << "did not finish within" << timeoutMs << "ms";
            process.kill();
            process.waitForFinished(-1);
            return result;
        }
    }

    result.exitStatus = process.exitStatus();
    result.exitCode = process.exitCode();
    result.standardOutput = process.readAllStandardOutput();
    result.standardError = process.readAllStandardError();

    return result;
}
