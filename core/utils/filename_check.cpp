#include "filename_check.hpp"

#include <QFileInfo>
#include <QObject>

std::optional<QString> problematicFileName(const QString& path, int maxLength)
{
    const QString name = QFileInfo(path).fileName();

    if (name.size() > maxLength)
    {
        return QObject::tr("The file name '%1' is longer than %2 characters and may not be handled correctly by FFmpeg.")
            .arg(name, QString::number(maxLength));
    }

    for (const QChar c : name)
    {
        if (c.unicode() >= 128)
            return QObject::tr("The file name '%1' contains non-ASCII characters and may not be handled correctly by FFmpeg.").arg(name);
    }

    return std::nullopt;
}
