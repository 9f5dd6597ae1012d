#include "container.hpp"

const QList<Container>& supportedContainers()
{
    // MP4 must stay first, it is the fallback
    static const QList<Container> containers {
        { "mp4", "libx264", "aac", std::nullopt },
        { "webm", "libvpx-vp9", "libopus", std::nullopt },
        { "mov", "libx264", "aac", std::nullopt },
        { "mkv", "libx264", "aac", std::nullopt },
        { "avi", "mpeg4", "mp3", 5 },
    };

    return containers;
}

const Container& containerForExtension(const QString& extension)
{
    QString key = extension.trimmed().toLower();
    if (key.startsWith('.'))
        key.remove(0, 1);

    const QList<Container>& containers = supportedContainers();

    for (const Container& container : containers)
    {
        if (container.extension == key)
            return container;
    }

    return containers.first();
}
