#include "platform_info.hpp"

QString PlatformInfo::executableName(const QString& tool) const
{
    if (m_isWindows && !tool.endsWith(".exe", Qt::CaseInsensitive))
        return tool + ".exe";

    return tool;
}
