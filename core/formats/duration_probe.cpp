#include "duration_probe.hpp"

#include "core/utils/logging.hpp"
#include "core/utils/tool_query.hpp"

#include <cmath>

DurationProbe::DurationProbe(QString ffprobePath, int timeoutMs)
    : ffprobePath(std::move(ffprobePath))
    , timeoutMs(timeoutMs)
{
}

double DurationProbe::probeSeconds(const QString& path) const
{
    const QStringList arguments {
        "-v", "error",
        "-show_entries", "format=duration",
        "-of", "default=noprint_wrappers=1:nokey=1",
        path
    };

    const ToolQueryResult result = queryTool(ffprobePath, arguments, timeoutMs);

    if (!result.succeeded())
    {
        qCWarning(lcProbe) << "Duration of" << path << "is unknown, FFprobe failed:"
                           << (result.timedOut ? QString("timeout") : QString::fromUtf8(result.standardError).trimmed());
        return 0;
    }

    const std::optional<double> duration = parseDuration(result.standardOutput);

    if (!duration.has_value())
    {
        qCWarning(lcProbe) << "Duration of" << path << "is unknown, FFprobe returned" << result.standardOutput.trimmed();
        return 0;
    }

    qCDebug(lcProbe) << path << "lasts" << *duration << "seconds";
    return *duration;
}

std::optional<double> DurationProbe::parseDuration(const QByteArray& output)
{
    bool ok = false;
    const double seconds = QString::fromUtf8(output).trimmed().toDouble(&ok);

    if (!ok || !std::isfinite(seconds) || seconds < 0)
        return std::nullopt;

    return seconds;
}
