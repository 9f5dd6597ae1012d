#ifndef COMMAND_BUILDER_H
#define COMMAND_BUILDER_H

#include "job.hpp"

#include <QStringList>
#include <optional>
#include <variant>

using std::optional;

//!
//! \brief Engine arguments ready to be handed to QProcess::startCommand().
//! \details Paths are already quoted, so the arguments must not be passed to QProcess::start() as-is.
//!
struct EngineCommand {
    QStringList arguments;

    [[nodiscard]] QString commandLine(const QString& program) const;
};

//!
//! \brief Synthesizes the engine invocation for a job.
//! \details Building has no side effects: the same inputs always give the same arguments.
//!
class CommandBuilder
{
    typedef CommandBuilder self;

public:
    self& inputFrom(const QString& inputPath);
    self& outputTo(const QString& outputPath);
    self& inMode(JobMode mode);
    self& withQuality(QualityTier tier);

    [[nodiscard]] std::variant<EngineCommand, QStringList> build() const;

    static std::variant<EngineCommand, QStringList> forJob(const Job& job);

    //!
    //! \brief Quotes a path for QProcess's command splitting.
    //! \details The result is wrapped in double quotes and embedded quotes are tripled, which is how
    //! QProcess::splitCommand() spells a literal quote. No shell is involved.
    //!
    [[nodiscard]] static QString quotePath(const QString& path);

private:
    [[nodiscard]] QStringList convertArguments() const;
    [[nodiscard]] QStringList compressArguments() const;

    optional<QString> inputPath;
    optional<QString> outputPath;
    JobMode mode = JobMode::Compress;
    QualityTier quality = QualityTier::Balanced;

    QStringList errors;
};

#endif
