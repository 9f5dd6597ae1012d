#ifndef PREFLIGHT_H
#define PREFLIGHT_H

#include "job_outcome.hpp"
#include "core/settings/engine_config.hpp"

#include <optional>

//!
//! \brief Validates the environment and the input before the engine is started.
//! \details Every check fails fast with the first problem found. Nothing here writes to disk.
//!
class Preflight
{
public:
    explicit Preflight(EngineConfig config);

    //! Runs every check below, in order.
    [[nodiscard]] std::optional<JobError> run(const QString& inputPath) const;

    [[nodiscard]] std::optional<JobError> checkTools() const;
    [[nodiscard]] std::optional<JobError> checkInputFile(const QString& inputPath) const;
    [[nodiscard]] std::optional<JobError> checkVideoStream(const QString& inputPath) const;

private:
    [[nodiscard]] std::optional<JobError> checkTool(const QString& program) const;

    EngineConfig config;
};

#endif
