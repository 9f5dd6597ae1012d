#ifndef QUALITY_PRESET_H
#define QUALITY_PRESET_H

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <optional>

enum class QualityTier
{
    High,
    Balanced,
    Compressed,
    Extreme
};

struct QualityPreset {
    QString crf;
    QString speedPreset;
    QString audioBitrate;
};

[[nodiscard]] const QualityPreset& qualityPresetFor(QualityTier tier);

[[nodiscard]] QString qualityTierName(QualityTier tier);
[[nodiscard]] QStringList qualityTierNames();

//! Parses a tier name case-insensitively. Returns nothing for unknown names.
[[nodiscard]] std::optional<QualityTier> qualityTierFromName(const QString& name);

Q_DECLARE_METATYPE(QualityTier)

#endif
