#ifndef PLATFORM_INFO_HPP
#define PLATFORM_INFO_HPP

#include <QString>
#include <QSysInfo>

class PlatformInfo
{
public:
    //! Name of a command-line tool as it is spelled on this platform, e.g. `ffmpeg.exe` on Windows.
    QString executableName(const QString& tool) const;

private:
    const bool m_isWindows = QSysInfo::kernelType() == "winnt";
};

#endif
