module;
#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <QTemporaryFile>

#include <memory>
#include <utility>

module boxlink.core.enginesupervisor;

namespace {
constexpr int kSpawnTimeoutMs = 5000;
constexpr int kSettleDelayMs = 500;
constexpr int kReadinessTimeoutMs = 5000;
constexpr int kReadinessPollMs = 200;
constexpr int kReadinessProbeTimeoutMs = 1000;
constexpr int kTerminateTimeoutMs = 5000;
constexpr int kKillTimeoutMs = 2000;
constexpr int kRecentOutputLines = 20;

class BusyGuard
{
public:
    explicit BusyGuard(bool& flag)
        : m_flag(flag)
    {
        m_flag = true;
    }

    ~BusyGuard()
    {
        m_flag = false;
    }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

private:
    bool& m_flag;
};

EngineSupervisor::Result successResult(const QString& message = QString())
{
    return EngineSupervisor::Result {true, EngineSupervisor::FailureKind::None, message};
}

EngineSupervisor::Result failureResult(EngineSupervisor::FailureKind kind, const QString& message)
{
    return EngineSupervisor::Result {false, kind, message};
}

QStringList engineExecutableNames()
{
    return {
#ifdef Q_OS_WIN
        QStringLiteral("sing-box.exe"),
#else
        QStringLiteral("sing-box"),
#endif
    };
}
}

EngineSupervisor::EngineSupervisor(const CoreSettings& settings, SystemLog *log, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_api(settings.controlApiHost, settings.controlApiPort, settings.controlApiSecret, log)
    , m_log(log)
{
    m_process.setProcessChannelMode(QProcess::MergedChannels);
    connect(&m_process, &QProcess::readyReadStandardOutput, this, &EngineSupervisor::onReadyRead);
    connect(&m_process, &QProcess::finished, this, &EngineSupervisor::onProcessFinished);
}

EngineSupervisor::~EngineSupervisor()
{
    if (m_state != State::Stopped || m_process.state() != QProcess::NotRunning) {
        stop();
    }
}

void EngineSupervisor::setCoreSettings(const CoreSettings& settings)
{
    m_settings = settings;
}

const CoreSettings& EngineSupervisor::coreSettings() const
{
    return m_settings;
}

EngineSupervisor::State EngineSupervisor::state() const
{
    return m_state;
}

bool EngineSupervisor::isRunning() const
{
    return m_state == State::Running;
}

QString EngineSupervisor::binaryPath() const
{
    return m_binaryPath;
}

QString EngineSupervisor::configFilePath() const
{
    return m_configFile ? m_configFile->fileName() : QString();
}

qint64 EngineSupervisor::processId() const
{
    return m_process.state() == QProcess::NotRunning ? 0 : m_process.processId();
}

EngineSupervisor::Result EngineSupervisor::start(const QJsonObject& config)
{
    if (m_busy) {
        return failureResult(FailureKind::Busy, QStringLiteral("Engine start/stop already in progress."));
    }

    if (m_state != State::Stopped || m_process.state() != QProcess::NotRunning) {
        const Result stopped = stop();
        if (!stopped.success) {
            return stopped;
        }
    }

    BusyGuard guard(m_busy);
    setState(State::Starting);

    m_binaryPath = locateEngineBinary(m_settings.engineExecutablePath);
    if (m_binaryPath.isEmpty()) {
        return failStart(FailureKind::BinaryNotFound,
                         QStringLiteral("sing-box executable not found (configured: '%1').")
                             .arg(m_settings.engineExecutablePath));
    }

    m_api.setEndpoint(m_settings.controlApiHost, m_settings.controlApiPort);
    m_api.setSecret(m_settings.controlApiSecret);

    QString writeError;
    const QJsonObject runConfig = injectControlApi(config, m_api.controllerAddress(), m_settings.controlApiSecret);
    if (!writeConfigFile(runConfig, &writeError)) {
        return failStart(FailureKind::ConfigWriteFailed, writeError);
    }

    m_outputBuffer.clear();
    m_recentOutput.clear();
    m_process.setProgram(m_binaryPath);
    m_process.setArguments(m_settings.engineArguments(m_configFile->fileName()));
    m_process.start();
    if (!m_process.waitForStarted(kSpawnTimeoutMs)) {
        return failStart(FailureKind::BinaryNotFound,
                         QStringLiteral("Failed to launch %1: %2").arg(m_binaryPath, m_process.errorString()));
    }

    // A config the engine rejects makes it exit almost at once.
    if (m_process.waitForFinished(kSettleDelayMs)) {
        onReadyRead();
        const QString output = recentOutput();
        return failStart(FailureKind::ProcessExitedImmediately,
                         QStringLiteral("sing-box exited with code %1: %2")
                             .arg(m_process.exitCode())
                             .arg(output.isEmpty() ? QStringLiteral("no output") : output));
    }

    QString readinessError;
    if (!waitForControlApi(&readinessError)) {
        const FailureKind kind = m_process.state() == QProcess::NotRunning
            ? FailureKind::ProcessExitedImmediately
            : FailureKind::ReadinessTimeout;
        return failStart(kind, readinessError);
    }

    setState(State::Running);
    appendSystemLog(m_log, QStringLiteral("[Engine] sing-box started, PID %1, control API %2")
        .arg(m_process.processId())
        .arg(m_api.controllerAddress()));
    return successResult();
}

EngineSupervisor::Result EngineSupervisor::stop()
{
    if (m_busy) {
        return failureResult(FailureKind::Busy, QStringLiteral("Engine start/stop already in progress."));
    }

    if (m_state == State::Stopped && m_process.state() == QProcess::NotRunning) {
        return successResult();
    }

    BusyGuard guard(m_busy);
    setState(State::Stopping);

    const bool graceful = terminateProcess();
    finishStop();

    if (!graceful) {
        const QString message = QStringLiteral("sing-box ignored terminate and was killed.");
        appendSystemLog(m_log, QStringLiteral("[Engine] %1").arg(message));
        return successResult(message);
    }
    appendSystemLog(m_log, QStringLiteral("[Engine] sing-box stopped."));
    return successResult();
}

EngineSupervisor::Result EngineSupervisor::restart(const QJsonObject& config)
{
    const Result stopped = stop();
    if (!stopped.success) {
        return stopped;
    }
    return start(config);
}

EngineSupervisor::Result EngineSupervisor::reloadConfig(const QJsonObject& config)
{
    if (m_busy) {
        return failureResult(FailureKind::Busy, QStringLiteral("Engine start/stop already in progress."));
    }
    if (m_state != State::Running) {
        return start(config);
    }

    {
        BusyGuard guard(m_busy);
        QString writeError;
        const QJsonObject runConfig = injectControlApi(config, m_api.controllerAddress(), m_settings.controlApiSecret);
        if (writeConfigFile(runConfig, &writeError) && m_api.reloadConfig(m_configFile->fileName())) {
            appendSystemLog(m_log, QStringLiteral("[Engine] Configuration reloaded in place."));
            return successResult();
        }
        if (!writeError.isEmpty()) {
            appendSystemLog(m_log, QStringLiteral("[Engine] %1").arg(writeError));
        }
    }

    appendSystemLog(m_log, QStringLiteral("[Engine] Hot reload rejected, restarting."));
    return restart(config);
}

int EngineSupervisor::addStopObserver(std::function<void()> callback)
{
    return m_stopObservers.add(std::move(callback));
}

bool EngineSupervisor::removeStopObserver(int handle)
{
    return m_stopObservers.remove(handle);
}

QJsonObject EngineSupervisor::version()
{
    return isRunning() ? m_api.version() : QJsonObject();
}

TrafficStats EngineSupervisor::traffic()
{
    return isRunning() ? m_api.traffic() : TrafficStats {};
}

QList<ConnectionInfo> EngineSupervisor::connections()
{
    return isRunning() ? m_api.connections() : QList<ConnectionInfo>();
}

bool EngineSupervisor::closeConnection(const QString& id)
{
    return isRunning() && m_api.closeConnection(id);
}

bool EngineSupervisor::closeAllConnections()
{
    return isRunning() && m_api.closeAllConnections();
}

QJsonObject EngineSupervisor::proxies()
{
    return isRunning() ? m_api.proxies() : QJsonObject();
}

int EngineSupervisor::testDelay(const QString& proxyName, const QString& url, int timeoutMs)
{
    return isRunning() ? m_api.testDelay(proxyName, url, timeoutMs) : -1;
}

QJsonObject EngineSupervisor::configs()
{
    return isRunning() ? m_api.configs() : QJsonObject();
}

std::unique_ptr<LogStream> EngineSupervisor::openLogStream(const QString& level)
{
    return isRunning() ? m_api.openLogStream(level) : nullptr;
}

QJsonObject EngineSupervisor::injectControlApi(const QJsonObject& config, const QString& controller, const QString& secret)
{
    QJsonObject result = config;
    QJsonObject experimental = result.value(QStringLiteral("experimental")).toObject();
    experimental[QStringLiteral("clash_api")] = QJsonObject {
        {QStringLiteral("external_controller"), controller},
        {QStringLiteral("secret"), secret}
    };
    result[QStringLiteral("experimental")] = experimental;
    return result;
}

QString EngineSupervisor::locateEngineBinary(const QString& configuredPath)
{
    const QString configured = configuredPath.trimmed();
    if (!configured.isEmpty()) {
        const QFileInfo info(configured);
        if (info.exists() && info.isFile() && info.isExecutable()) {
            return info.absoluteFilePath();
        }
        const QString onPath = QStandardPaths::findExecutable(configured);
        if (!onPath.isEmpty()) {
            return onPath;
        }
    }

    if (QCoreApplication::instance()) {
        const QDir appDir(QCoreApplication::applicationDirPath());
        for (const QString& name : engineExecutableNames()) {
            const QFileInfo info(appDir.filePath(name));
            if (info.exists() && info.isFile() && info.isExecutable()) {
                return info.absoluteFilePath();
            }
        }
    }

    for (const QString& name : engineExecutableNames()) {
        const QString path = QStandardPaths::findExecutable(name);
        if (!path.isEmpty()) {
            return path;
        }
    }
    return QString();
}

void EngineSupervisor::onReadyRead()
{
    m_outputBuffer.append(m_process.readAllStandardOutput());

    int newline = m_outputBuffer.indexOf('\n');
    while (newline >= 0) {
        const QString line = QString::fromUtf8(m_outputBuffer.left(newline)).trimmed();
        m_outputBuffer.remove(0, newline + 1);
        if (!line.isEmpty()) {
            m_recentOutput.append(line);
            while (m_recentOutput.size() > kRecentOutputLines) {
                m_recentOutput.removeFirst();
            }
            appendSystemLog(m_log, QStringLiteral("[sing-box] %1").arg(line));
            emit engineOutput(line);
        }
        newline = m_outputBuffer.indexOf('\n');
    }
}

void EngineSupervisor::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    // Exits during start/stop are handled by the blocking sequence itself.
    if (m_state != State::Running || m_busy) {
        return;
    }

    onReadyRead();
    appendSystemLog(m_log, QStringLiteral("[Engine] sing-box exited unexpectedly (code %1%2).")
        .arg(exitCode)
        .arg(exitStatus == QProcess::CrashExit ? QStringLiteral(", crashed") : QString()));

    {
        BusyGuard guard(m_busy);
        setState(State::Stopping);
        finishStop();
    }
    emit unexpectedExit(exitCode);
}

EngineSupervisor::Result EngineSupervisor::failStart(FailureKind kind, const QString& message)
{
    terminateProcess();
    discardConfigFile();
    setState(State::Stopped);
    appendSystemLog(m_log, QStringLiteral("[Engine] Start failed: %1").arg(message));
    return failureResult(kind, message);
}

bool EngineSupervisor::writeConfigFile(const QJsonObject& config, QString *errorMessage)
{
    if (!m_configFile) {
        auto file = std::make_unique<QTemporaryFile>(QDir(QDir::tempPath()).filePath(QStringLiteral("boxlink-XXXXXX.json")));
        if (!file->open()) {
            *errorMessage = QStringLiteral("Failed to create temporary config: %1").arg(file->errorString());
            return false;
        }
        file->setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
        file->close();
        m_configFile = std::move(file);
    }

    if (!m_configFile->open() || !m_configFile->resize(0)) {
        *errorMessage = QStringLiteral("Failed to open temporary config: %1").arg(m_configFile->errorString());
        return false;
    }

    const QByteArray payload = QJsonDocument(config).toJson(QJsonDocument::Indented);
    const bool written = m_configFile->write(payload) == payload.size() && m_configFile->flush();
    m_configFile->close();
    if (!written) {
        *errorMessage = QStringLiteral("Failed to write temporary config: %1").arg(m_configFile->errorString());
        return false;
    }
    return true;
}

bool EngineSupervisor::waitForControlApi(QString *errorMessage)
{
    ControlApiClient probe(m_settings.controlApiHost, m_settings.controlApiPort, m_settings.controlApiSecret);
    probe.setRequestTimeout(kReadinessProbeTimeoutMs);

    QElapsedTimer elapsed;
    elapsed.start();
    while (elapsed.elapsed() < kReadinessTimeoutMs) {
        if (m_process.state() == QProcess::NotRunning) {
            onReadyRead();
            *errorMessage = QStringLiteral("sing-box exited before the control API came up: %1").arg(recentOutput());
            return false;
        }
        if (!probe.version().isEmpty()) {
            return true;
        }
        m_process.waitForFinished(kReadinessPollMs);
    }

    *errorMessage = QStringLiteral("Control API at %1 did not respond within %2 ms.")
        .arg(probe.controllerAddress())
        .arg(kReadinessTimeoutMs);
    return false;
}

bool EngineSupervisor::terminateProcess()
{
    if (m_process.state() == QProcess::NotRunning) {
        return true;
    }

    m_process.terminate();
    if (m_process.waitForFinished(kTerminateTimeoutMs)) {
        return true;
    }

    m_process.kill();
    m_process.waitForFinished(kKillTimeoutMs);
    return false;
}

void EngineSupervisor::discardConfigFile()
{
    // QTemporaryFile removes the file on destruction.
    m_configFile.reset();
}

void EngineSupervisor::finishStop()
{
    onReadyRead();
    discardConfigFile();
    setState(State::Stopped);
    m_stopObservers.notify(m_log);
}

void EngineSupervisor::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

QString EngineSupervisor::recentOutput() const
{
    return m_recentOutput.join(QLatin1Char('\n'));
}
