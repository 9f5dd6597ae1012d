#ifndef DURATION_PROBE_H
#define DURATION_PROBE_H

#include <QByteArray>
#include <QString>
#include <optional>

//!
//! \brief Asks FFprobe for the total duration of a media file.
//! \details Never fails: any problem yields 0, which means the duration is unknown and progress cannot be computed.
//!
class DurationProbe
{
public:
    DurationProbe(QString ffprobePath, int timeoutMs);

    [[nodiscard]] double probeSeconds(const QString& path) const;

    //! Parses FFprobe's bare `format=duration` output.
    [[nodiscard]] static std::optional<double> parseDuration(const QByteArray& output);

private:
    QString ffprobePath;
    int timeoutMs;
};

#endif
