#include "process_supervisor.hpp"

#include "core/utils/logging.hpp"

#ifdef Q_OS_UNIX
#include <unistd.h>
#endif

ProcessSupervisor::ProcessSupervisor(QString program, int terminateGraceMs, QObject* parent)
    : QObject(parent)
    , m_program(std::move(program))
    , m_terminateGraceMs(terminateGraceMs)
    , m_process(new QProcess(this))
{
    m_process->setProcessChannelMode(QProcess::SeparateChannels);
    m_process->setReadChannel(QProcess::StandardError);
    m_process->setStandardInputFile(QProcess::nullDevice());
    m_process->setStandardOutputFile(QProcess::nullDevice());

#ifdef Q_OS_UNIX
    // keep terminal interrupts away from the engine, stopping it is up to Cancel()
    m_process->setChildProcessModifier([] { ::setpgid(0, 0); });
#endif

    connect(m_process, &QProcess::readyReadStandardError, this, &ProcessSupervisor::ReadDiagnostics);
    connect(m_process, &QProcess::finished, this, &ProcessSupervisor::HandleFinished);
    connect(m_process, &QProcess::errorOccurred, this, &ProcessSupervisor::HandleError);
}

ProcessSupervisor::~ProcessSupervisor()
{
    if (m_process->state() == QProcess::NotRunning)
        return;

    qCWarning(lcProcess) << "Supervisor destroyed while" << m_program << "is running, killing it";

    m_process->disconnect(this);
    m_process->kill();
    m_process->waitForFinished(-1);
}

void ProcessSupervisor::Start(const EngineCommand& command, const QString& outputPath, double totalDurationSeconds)
{
    if (m_state != State::Idle)
    {
        qCWarning(lcProcess) << "Ignoring start request, supervisor is" << m_state;
        return;
    }

    m_parser = ProgressParser(totalDurationSeconds);
    m_outputPath = outputPath;
    m_state = State::Running;

    const QString commandLine = command.commandLine(m_program);
    qCInfo(lcProcess).noquote() << "Starting" << commandLine;

    m_process->startCommand(commandLine);
}

void ProcessSupervisor::Cancel()
{
    if (m_state != State::Running)
    {
        qCDebug(lcProcess) << "Ignoring cancel request, supervisor is" << m_state;
        return;
    }

    m_state = State::Cancelling;
    qCInfo(lcProcess) << "Cancelling" << m_program;

    m_process->terminate();

    if (!m_process->waitForFinished(m_terminateGraceMs))
    {
        qCWarning(lcProcess) << m_program << "ignored the termination request for" << m_terminateGraceMs << "ms, killing it";
        m_process->kill();
        m_process->waitForFinished(-1);
    }

    // finished() is normally handled inside waitForFinished()
    if (m_state == State::Cancelling && m_process->state() == QProcess::NotRunning)
        Finish(State::Cancelled, JobOutcome::cancelled());
}

void ProcessSupervisor::ReadDiagnostics()
{
    m_pending += m_process->readAllStandardError();

    // the engine rewrites its status line with carriage returns
    qsizetype start = 0;
    for (qsizetype i = 0; i < m_pending.size(); ++i)
    {
        const char c = m_pending.at(i);
        if (c != '\n' && c != '\r')
            continue;

        if (i > start)
            HandleLine(QString::fromUtf8(m_pending.mid(start, i - start)));

        start = i + 1;
    }

    m_pending.remove(0, start);
}

void ProcessSupervisor::FlushDiagnostics()
{
    ReadDiagnostics();

    if (!m_pending.isEmpty())
        HandleLine(QString::fromUtf8(m_pending));

    m_pending.clear();
}

void ProcessSupervisor::HandleLine(const QString& line)
{
    const QString trimmed = line.trimmed();
    if (trimmed.isEmpty())
        return;

    m_tail.append(trimmed);
    while (m_tail.size() > DIAGNOSTIC_TAIL_LINES)
        m_tail.removeFirst();

    if (m_state != State::Running)
        return;

    const std::optional<int> percent = m_parser.parse(trimmed);

    if (percent.has_value() && *percent > m_lastPercent)
    {
        m_lastPercent = *percent;
        emit progressChanged(*percent);
    }
}

void ProcessSupervisor::HandleFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    FlushDiagnostics();

    qCInfo(lcProcess) << m_program << "exited with code" << exitCode << exitStatus << "while" << m_state;

    switch (m_state)
    {
    case State::Cancelling:
        Finish(State::Cancelled, JobOutcome::cancelled());
        return;

    case State::Running:
        break;

    default:
        return;
    }

    // on Unix a crashed engine reports the terminating signal as its exit code
    if (exitStatus == QProcess::CrashExit || exitCode != 0)
    {
        Finish(State::Failed, JobOutcome::failed(JobError {
            ErrorKind::EngineFailure,
            tr("FFmpeg error. Code: %1\n%2").arg(QString::number(exitCode), diagnosticTail()).trimmed(),
            exitCode
        }));
        return;
    }

    m_lastPercent = 100;
    emit progressChanged(100);

    Finish(State::Succeeded, JobOutcome::succeeded(m_outputPath));
}

void ProcessSupervisor::HandleError(QProcess::ProcessError error)
{
    // crashes are reported through finished()
    if (error != QProcess::FailedToStart)
    {
        qCDebug(lcProcess) << m_program << "reported" << error;
        return;
    }

    if (m_state == State::Cancelling)
    {
        Finish(State::Cancelled, JobOutcome::cancelled());
        return;
    }

    if (m_state != State::Running)
        return;

    qCWarning(lcProcess) << m_program << "failed to start:" << m_process->errorString();

    Finish(State::Failed, JobOutcome::failed(ErrorKind::UnexpectedFailure, tr("FFmpeg could not be started: %1").arg(m_process->errorString())));
}

void ProcessSupervisor::Finish(State state, const JobOutcome& outcome)
{
    if (m_state == State::Succeeded || m_state == State::Failed || m_state == State::Cancelled)
        return;

    m_state = state;
    emit finished(outcome);
}

QString ProcessSupervisor::diagnosticTail() const
{
    return m_tail.join('\n');
}
