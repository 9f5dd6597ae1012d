#ifndef CONTAINER_H
#define CONTAINER_H

#include <QList>
#include <QMetaType>
#include <QString>
#include <optional>

//!
//! \brief Codec profile used when compressing into a given container.
//! \details Containers with a qscale value use a constant quantizer instead of the quality tier's CRF.
//!
struct Container {
    QString extension;
    //! FFmpeg encoder names, as passed to -c:v and -c:a.
    QString videoEncoder;
    QString audioEncoder;
    std::optional<int> qscale;
};

Q_DECLARE_METATYPE(Container)

//! Extension of the container every Convert job writes to.
inline constexpr auto CANONICAL_CONTAINER_EXTENSION = "mp4";

[[nodiscard]] const QList<Container>& supportedContainers();

//!
//! \brief Looks up the container registered for a file extension.
//! \param extension Extension with or without the leading dot, in any case.
//! \return The matching container, or the MP4 container when the extension is unknown.
//!
[[nodiscard]] const Container& containerForExtension(const QString& extension);

#endif
