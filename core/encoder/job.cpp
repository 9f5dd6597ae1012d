#include "job.hpp"

QString jobModeName(JobMode mode)
{
    return mode == JobMode::Convert ? "convert" : "compress";
}

std::optional<JobMode> jobModeFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();

    if (key == jobModeName(JobMode::Convert))
        return JobMode::Convert;

    if (key == jobModeName(JobMode::Compress))
        return JobMode::Compress;

    return std::nullopt;
}
