#ifndef PROCESS_SUPERVISOR_H
#define PROCESS_SUPERVISOR_H

#include "command_builder.hpp"
#include "progress_parser.hpp"
#include "core/job/job_outcome.hpp"

#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QStringList>

//!
//! \brief Owns one engine process from spawn to exit.
//! \details Diagnostic lines are fed to a ProgressParser as they arrive. Cancelling asks the engine to terminate
//! and kills it if it is still alive after the grace period. Exactly one finished() is emitted per Start().
//! \remark Not thread-safe: call Start() and Cancel() from the thread the supervisor lives in.
//!
class ProcessSupervisor final : public QObject
{
    Q_OBJECT

public:
    enum class State
    {
        Idle,
        Running,
        Succeeded,
        Failed,
        Cancelling,
        Cancelled
    };
    Q_ENUM(State)

    ProcessSupervisor(QString program, int terminateGraceMs, QObject* parent = nullptr);
    ~ProcessSupervisor() override;

    void Start(const EngineCommand& command, const QString& outputPath, double totalDurationSeconds);
    void Cancel();

    [[nodiscard]] State state() const { return m_state; }

    static constexpr int DIAGNOSTIC_TAIL_LINES = 20;

signals:
    void progressChanged(int percent);
    void finished(const JobOutcome& outcome);

private:
    void ReadDiagnostics();
    void FlushDiagnostics();
    void HandleLine(const QString& line);
    void HandleFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void HandleError(QProcess::ProcessError error);
    void Finish(State state, const JobOutcome& outcome);

    QString diagnosticTail() const;

    const QString m_program;
    const int m_terminateGraceMs;

    QProcess* m_process;
    State m_state = State::Idle;
    ProgressParser m_parser { 0 };
    int m_lastPercent = -1;
    QString m_outputPath;

    QByteArray m_pending;
    QStringList m_tail;
};

#endif
