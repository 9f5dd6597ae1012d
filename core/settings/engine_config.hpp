#ifndef ENGINE_CONFIG_HPP
#define ENGINE_CONFIG_HPP

#include <QString>

struct Settings;
class PlatformInfo;

//!
//! \brief Tool locations, timeouts and disk policy used by every job.
//! \details Defaults match config_default.ini, so a job can run without any settings file.
//!
struct EngineConfig {
    QString ffmpegPath = "ffmpeg";
    QString ffprobePath = "ffprobe";

    int versionCheckTimeoutMs = 10000;
    int streamCheckTimeoutMs = 10000;
    int durationProbeTimeoutMs = 30000;
    int terminateGraceMs = 5000;

    double diskEstimateFactor = 2.0;
    double diskSafetyMargin = 1.1;

    int maxFileNameLength = 100;

    static EngineConfig defaults(const PlatformInfo& platform);
    static EngineConfig fromSettings(const Settings& settings, const PlatformInfo& platform);
};

#endif
