#include "progress_parser.hpp"

#include <QRegularExpression>
#include <QtGlobal>

#include <cmath>

ProgressParser::ProgressParser(double totalDurationSeconds)
    : totalDurationSeconds(totalDurationSeconds)
{
}

std::optional<int> ProgressParser::parse(const QString& line) const
{
    if (!hasDuration())
        return std::nullopt;

    const std::optional<double> elapsed = elapsedSeconds(line);
    if (!elapsed.has_value())
        return std::nullopt;

    const double percent = std::floor(*elapsed / totalDurationSeconds * 100);
    return qBound(0, static_cast<int>(qMin(percent, 100.0)), 100);
}

std::optional<double> ProgressParser::elapsedSeconds(const QString& line)
{
    static const QRegularExpression regex(R"(time=(\d+):(\d+):(\d+)\.(\d+))");
    const QRegularExpressionMatch match = regex.match(line);

    if (!match.hasMatch())
        return std::nullopt;

    bool hoursOk = false;
    bool minutesOk = false;
    bool secondsOk = false;

    const double hours = match.captured(1).toDouble(&hoursOk);
    const double minutes = match.captured(2).toDouble(&minutesOk);
    const double seconds = (match.captured(3) + '.' + match.captured(4)).toDouble(&secondsOk);

    if (!hoursOk || !minutesOk || !secondsOk)
        return std::nullopt;

    return hours * 3600 + minutes * 60 + seconds;
}
