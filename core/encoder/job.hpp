#ifndef JOB_H
#define JOB_H

#include "quality_preset.hpp"

#include <QMetaType>
#include <QString>
#include <optional>

enum class JobMode
{
    //! Repackages the streams into the canonical container without re-encoding.
    Convert,
    //! Re-encodes into the output's container using a quality tier.
    Compress
};

struct Job {
    QString inputPath;
    QString outputPath;
    JobMode mode = JobMode::Compress;
    QualityTier quality = QualityTier::Balanced;
};

[[nodiscard]] QString jobModeName(JobMode mode);
[[nodiscard]] std::optional<JobMode> jobModeFromName(const QString& name);

Q_DECLARE_METATYPE(JobMode)
Q_DECLARE_METATYPE(Job)

#endif
