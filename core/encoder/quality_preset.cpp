#include "quality_preset.hpp"

const QualityPreset& qualityPresetFor(QualityTier tier)
{
    static const QualityPreset high { "18", "slow", "192k" };
    static const QualityPreset balanced { "23", "medium", "128k" };
    static const QualityPreset compressed { "28", "fast", "96k" };
    static const QualityPreset extreme { "32", "veryfast", "64k" };

    switch (tier)
    {
    case QualityTier::High:
        return high;
    case QualityTier::Balanced:
        return balanced;
    case QualityTier::Compressed:
        return compressed;
    case QualityTier::Extreme:
        return extreme;
    }

    return balanced;
}

QString qualityTierName(QualityTier tier)
{
    switch (tier)
    {
    case QualityTier::High:
        return "high";
    case QualityTier::Balanced:
        return "balanced";
    case QualityTier::Compressed:
        return "compressed";
    case QualityTier::Extreme:
        return "extreme";
    }

    return "balanced";
}

QStringList qualityTierNames()
{
    return {
        qualityTierName(QualityTier::High),
        qualityTierName(QualityTier::Balanced),
        qualityTierName(QualityTier::Compressed),
        qualityTierName(QualityTier::Extreme),
    };
}

std::optional<QualityTier> qualityTierFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();

    for (const QualityTier tier : { QualityTier::High, QualityTier::Balanced, QualityTier::Compressed, QualityTier::Extreme })
    {
        if (qualityTierName(tier) == key)
            return tier;
    }

    return std::nullopt;
}
