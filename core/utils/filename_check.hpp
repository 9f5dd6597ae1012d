#ifndef FILENAME_CHECK_HPP
#define FILENAME_CHECK_HPP

#include <QString>
#include <optional>

//!
//! \brief Detects file names that FFmpeg builds on some platforms choke on.
//! \return A description of the problem, or nothing when the name looks safe.
//! \remark Only the file name is inspected, not its directory.
//!
std::optional<QString> problematicFileName(const QString& path, int maxLength = 100);

#endif
