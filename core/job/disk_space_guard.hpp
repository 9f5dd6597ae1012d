#ifndef DISK_SPACE_GUARD_H
#define DISK_SPACE_GUARD_H

#include "job_outcome.hpp"

#include <QtGlobal>
#include <functional>
#include <optional>

//!
//! \brief Advisory check that the output volume can hold the result.
//! \details When free space cannot be determined the job is allowed to proceed.
//!
class DiskSpaceGuard
{
public:
    //! Returns the free bytes on the volume holding the given path, or nothing when unknown.
    using FreeSpaceQuery = std::function<std::optional<qint64>(const QString& path)>;

    explicit DiskSpaceGuard(double safetyMargin = 1.1, FreeSpaceQuery query = &DiskSpaceGuard::queryStorage);

    [[nodiscard]] std::optional<JobError> check(const QString& outputPath, qint64 requiredBytes) const;

    static std::optional<qint64> queryStorage(const QString& path);

private:
    double safetyMargin;
    FreeSpaceQuery query;
};

#endif
