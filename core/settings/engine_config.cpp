#include "engine_config.hpp"

#include "core/utils/logging.hpp"
#include "core/utils/platform_info.hpp"
#include "settings.hpp"

static QString readString(const Settings& settings, const QString& key, const QString& fallback)
{
    const QString value = settings.get(key).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

static int readPositiveInt(const Settings& settings, const QString& key, int fallback)
{
    const QVariant value = settings.get(key);
    if (!value.isValid())
        return fallback;

    bool ok = false;
    const int number = value.toInt(&ok);

    if (!ok || number <= 0)
    {
        qCWarning(lcConfig) << "Ignoring invalid value" << value << "for" << key << "- using" << fallback;
        return fallback;
    }

    return number;
}

static double readDouble(const Settings& settings, const QString& key, double fallback, double minimum)
{
    const QVariant value = settings.get(key);
    if (!value.isValid())
        return fallback;

    bool ok = false;
    const double number = value.toDouble(&ok);

    if (!ok || number < minimum)
    {
        qCWarning(lcConfig) << "Ignoring invalid value" << value << "for" << key << "- using" << fallback;
        return fallback;
    }

    return number;
}

EngineConfig EngineConfig::defaults(const PlatformInfo& platform)
{
    EngineConfig config;
    config.ffmpegPath = platform.executableName("ffmpeg");
    config.ffprobePath = platform.executableName("ffprobe");

    return config;
}

EngineConfig EngineConfig::fromSettings(const Settings& settings, const PlatformInfo& platform)
{
    const EngineConfig fallback = defaults(platform);
    EngineConfig config = fallback;

    config.ffmpegPath = readString(settings, "Tools/sFFmpeg", fallback.ffmpegPath);
    config.ffprobePath = readString(settings, "Tools/sFFprobe", fallback.ffprobePath);

    config.versionCheckTimeoutMs = readPositiveInt(settings, "Timeouts/iVersionCheckMs", fallback.versionCheckTimeoutMs);
    config.streamCheckTimeoutMs = readPositiveInt(settings, "Timeouts/iStreamCheckMs", fallback.streamCheckTimeoutMs);
    config.durationProbeTimeoutMs = readPositiveInt(settings, "Timeouts/iDurationProbeMs", fallback.durationProbeTimeoutMs);
    config.terminateGraceMs = readPositiveInt(settings, "Timeouts/iTerminateGraceMs", fallback.terminateGraceMs);

    config.diskEstimateFactor = readDouble(settings, "Disk/dEstimateFactor", fallback.diskEstimateFactor, 0.0);
    config.diskSafetyMargin = readDouble(settings, "Disk/dSafetyMargin", fallback.diskSafetyMargin, 1.0);

    config.maxFileNameLength = readPositiveInt(settings, "Files/iMaxFileNameLength", fallback.maxFileNameLength);

    qCDebug(lcConfig) << "Using" << config.ffmpegPath << "and" << config.ffprobePath << "from" << settings.fileName();

    return config;
}
