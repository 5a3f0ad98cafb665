/*!
 * @file        enginesupervisor.cppm
 * @brief       sing-box process lifecycle and control-API bridge.
 *
 * @details
 * Owns the engine child process and the temporary configuration file it
 * runs from. Start is a bounded blocking sequence: resolve the binary,
 * inject the control-API controller, write the config, spawn, wait for an
 * early exit, then poll `/version` until the engine answers. Stop escalates
 * from terminate to kill and always removes the temporary file. Telemetry
 * calls are forwarded to the control API only while the engine is running.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QTemporaryFile>

#include <functional>
#include <memory>

#ifndef Q_MOC_RUN
export module boxlink.core.enginesupervisor;
import boxlink.core.controlapiclient;
import boxlink.core.observerlist;
import boxlink.core.settings;
import boxlink.core.systemlog;
#endif

#ifdef Q_MOC_RUN
#define BOXLINK_MODULE_EXPORT
#else
#define BOXLINK_MODULE_EXPORT export
#endif

/**
 * @class EngineSupervisor
 * @brief Starts, stops and queries one engine process.
 *
 * @details
 * At most one child process and one temporary config file exist per
 * instance. Start and stop are single-flight: a call arriving while another
 * is in progress fails with `FailureKind::Busy`.
 */
BOXLINK_MODULE_EXPORT class EngineSupervisor : public QObject
{
    Q_OBJECT
    Q_PROPERTY(State state READ state NOTIFY stateChanged)

public:
    /**
     * @enum State
     * @brief Engine lifecycle state.
     */
    enum class State
    {
        Stopped,  //!< No process.
        Starting, //!< Spawned, waiting for the control API.
        Running,  //!< Control API answered.
        Stopping  //!< Shutdown in progress.
    };
    Q_ENUM(State)

    /**
     * @enum FailureKind
     * @brief Reason a lifecycle call failed.
     */
    enum class FailureKind
    {
        None,                     //!< No failure.
        BinaryNotFound,           //!< No engine executable could be resolved or spawned.
        ConfigWriteFailed,        //!< Temporary config could not be written.
        ProcessExitedImmediately, //!< Engine exited during the settle delay or readiness poll.
        ReadinessTimeout,         //!< Control API never answered.
        Busy                      //!< Another start/stop is in progress.
    };
    Q_ENUM(FailureKind)

    /**
     * @struct Result
     * @brief Outcome of start/stop/reload.
     */
    struct Result {
        bool success = false;                  //!< Operation succeeded.
        FailureKind kind = FailureKind::None;  //!< Failure reason.
        QString message;                       //!< Human readable detail.
    };

    /**
     * @brief Construct a stopped supervisor.
     * @param settings Engine binary, invocation and control-API settings.
     * @param log Optional diagnostics sink.
     * @param parent Optional QObject parent.
     */
    explicit EngineSupervisor(const CoreSettings& settings, SystemLog *log = nullptr, QObject *parent = nullptr);
    ~EngineSupervisor() override;

    /**
     * @brief Replace settings; effective from the next start.
     * @param settings New settings.
     */
    void setCoreSettings(const CoreSettings& settings);
    const CoreSettings& coreSettings() const;

    State state() const;
    bool isRunning() const;

    /**
     * @brief Binary used by the last start attempt.
     * @return Executable path, empty before the first start.
     */
    QString binaryPath() const;

    /**
     * @brief Path of the live temporary config.
     * @return File path, empty when stopped.
     */
    QString configFilePath() const;

    /**
     * @brief Process id of the running engine.
     * @return PID, 0 when stopped.
     */
    qint64 processId() const;

    /**
     * @brief Start the engine with a run configuration.
     * @details A running engine is stopped first.
     * @param config Run configuration; the control-API block is injected.
     * @return Outcome; on failure the supervisor is Stopped with no process or file.
     */
    Result start(const QJsonObject& config);

    /**
     * @brief Stop the engine.
     * @details Succeeds without side effects when already stopped.
     * @return Outcome.
     */
    Result stop();

    /**
     * @brief Stop then start with a new configuration.
     * @param config Run configuration.
     * @return Outcome of the start.
     */
    Result restart(const QJsonObject& config);

    /**
     * @brief Rewrite the config file and ask the engine to reload it.
     * @details Falls back to restart() when the control API rejects the
     * reload; starts the engine when it is not running.
     * @param config Run configuration.
     * @return Outcome.
     */
    Result reloadConfig(const QJsonObject& config);

    /**
     * @brief Register a callback run once after every stop of a started engine.
     * @param callback Observer.
     * @return Handle for removeStopObserver().
     */
    int addStopObserver(std::function<void()> callback);
    bool removeStopObserver(int handle);

    QJsonObject version();
    TrafficStats traffic();
    QList<ConnectionInfo> connections();
    bool closeConnection(const QString& id);
    bool closeAllConnections();
    QJsonObject proxies();
    int testDelay(const QString& proxyName, const QString& url, int timeoutMs = 5000);
    QJsonObject configs();

    /**
     * @brief Follow the engine log.
     * @param level Minimum level.
     * @return Stream owned by the caller, nullptr unless running.
     */
    std::unique_ptr<LogStream> openLogStream(const QString& level = QStringLiteral("info"));

    /**
     * @brief Copy of a config with `experimental.clash_api` set.
     * @param config Run configuration.
     * @param controller `host:port` of the control API.
     * @param secret Bearer token.
     * @return Config with the controller injected, other experimental keys kept.
     */
    static QJsonObject injectControlApi(const QJsonObject& config, const QString& controller, const QString& secret);

    /**
     * @brief Resolve the engine executable.
     * @details Checks the configured path, then the application directory,
     * then `PATH`.
     * @param configuredPath Explicit path or executable name, may be empty.
     * @return Absolute executable path, empty when none was found.
     */
    static QString locateEngineBinary(const QString& configuredPath);

signals:
    //! Emitted on every state transition.
    void stateChanged(EngineSupervisor::State state);
    //! Emitted for each line the engine writes.
    void engineOutput(const QString& line);
    //! Emitted when a running engine exits without being asked to.
    void unexpectedExit(int exitCode);

private slots:
    void onReadyRead();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);

private:
    Result failStart(FailureKind kind, const QString& message);
    bool writeConfigFile(const QJsonObject& config, QString *errorMessage);
    bool waitForControlApi(QString *errorMessage);
    bool terminateProcess();
    void discardConfigFile();
    void finishStop();
    void setState(State state);
    QString recentOutput() const;

    QProcess m_process;                           //!< Engine child process.
    std::unique_ptr<QTemporaryFile> m_configFile; //!< Live config, removed on stop.
    CoreSettings m_settings;                      //!< Settings applied at start.
    ControlApiClient m_api;                       //!< Control-API client for the running engine.
    ObserverList<> m_stopObservers {QStringLiteral("Engine")}; //!< On-stop observers.
    SystemLog *m_log = nullptr;                   //!< Optional diagnostics sink.
    QString m_binaryPath;                         //!< Last resolved binary.
    QByteArray m_outputBuffer;                    //!< Partial output line.
    QStringList m_recentOutput;                   //!< Tail of engine output for error reports.
    State m_state = State::Stopped;               //!< Current state.
    bool m_busy = false;                          //!< Start/stop in progress.
};

#include "enginesupervisor.moc"
