#ifndef JOB_OUTCOME_H
#define JOB_OUTCOME_H

#include "core/notifier/message.hpp"

#include <QMetaType>
#include <QString>
#include <optional>
#include <variant>

enum class ErrorKind
{
    ToolNotFound,
    InputMissing,
    InputEmpty,
    InputCorrupted,
    InsufficientDiskSpace,
    EngineFailure,
    UnexpectedFailure
};

struct JobError {
    ErrorKind kind;
    QString detail;
    std::optional<int> exitCode = std::nullopt;
};

//!
//! \brief Terminal result of a job. Exactly one is produced per job.
//! \details Cancellation is not an error, even though the engine usually exits with a non-zero code when stopped.
//!
class JobOutcome
{
public:
    struct Succeeded {
        QString outputPath;
    };

    struct Cancelled { };

    JobOutcome();

    static JobOutcome succeeded(const QString& outputPath);
    static JobOutcome failed(const JobError& error);
    static JobOutcome failed(ErrorKind kind, const QString& detail);
    static JobOutcome cancelled();

    [[nodiscard]] bool isSucceeded() const { return std::holds_alternative<Succeeded>(value); }
    [[nodiscard]] bool isFailed() const { return std::holds_alternative<JobError>(value); }
    [[nodiscard]] bool isCancelled() const { return std::holds_alternative<Cancelled>(value); }

    [[nodiscard]] QString outputPath() const;
    [[nodiscard]] const JobError& error() const;

private:
    using Value = std::variant<Succeeded, JobError, Cancelled>;

    explicit JobOutcome(Value value);

    Value value;
};

[[nodiscard]] QString errorKindName(ErrorKind kind);

//! Human-readable summary of an outcome, suitable for a notifier.
[[nodiscard]] Message messageForOutcome(const JobOutcome& outcome);

Q_DECLARE_METATYPE(JobError)
Q_DECLARE_METATYPE(JobOutcome)

#endif
