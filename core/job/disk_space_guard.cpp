#include "disk_space_guard.hpp"

#include "core/utils/logging.hpp"

#include <QDir>
#include <QFileInfo>
#include <QObject>
#include <QStorageInfo>

DiskSpaceGuard::DiskSpaceGuard(double safetyMargin, FreeSpaceQuery query)
    : safetyMargin(safetyMargin)
    , query(std::move(query))
{
}

std::optional<JobError> DiskSpaceGuard::check(const QString& outputPath, qint64 requiredBytes) const
{
    // an existing output is overwritten, its space is given back
    if (const QFileInfo output(outputPath); output.exists() && output.isFile())
        requiredBytes -= output.size();

    if (requiredBytes <= 0)
        return std::nullopt;

    const std::optional<qint64> freeBytes = query ? query(outputPath) : std::nullopt;

    if (!freeBytes.has_value())
    {
        qCWarning(lcJob) << "Could not determine free space for" << outputPath << "- proceeding anyway";
        return std::nullopt;
    }

    const double neededBytes = static_cast<double>(requiredBytes) * safetyMargin;

    if (static_cast<double>(*freeBytes) >= neededBytes)
        return std::nullopt;

    constexpr qint64 mebibyte = 1024 * 1024;
    const qint64 shortfallMb = static_cast<qint64>(neededBytes - static_cast<double>(*freeBytes)) / mebibyte;

    return JobError {
        ErrorKind::InsufficientDiskSpace,
        QObject::tr("Not enough disk space. %1 MB are required, %2 MB are missing.")
            .arg(QString::number(requiredBytes / mebibyte), QString::number(shortfallMb))
    };
}

std::optional<qint64> DiskSpaceGuard::queryStorage(const QString& path)
{
    // the output does not exist yet, its directory does
    const QString directory = QFileInfo(path).absoluteDir().absolutePath();
    const QStorageInfo storage(directory);

    if (!storage.isValid() || !storage.isReady())
        return std::nullopt;

    const qint64 available = storage.bytesAvailable();
    if (available < 0)
        return std::nullopt;

    return available;
}
