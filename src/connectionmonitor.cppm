/*!
 * @file        connectionmonitor.cppm
 * @brief       Periodic proxy and VPN health checks.
 *
 * @details
 * Samples the engine control API and the corporate VPN connection on a timer
 * and reports transitions to registered observers. Each sample is an
 * immutable `ConnectionStatus` snapshot.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QDateTime>
#include <QObject>
#include <QString>
#include <QTimer>

#include <functional>

#ifndef Q_MOC_RUN
export module boxlink.core.connectionmonitor;
import boxlink.core.enginesupervisor;
import boxlink.core.observerlist;
import boxlink.core.settings;
import boxlink.core.systemlog;
import boxlink.core.vpnstatus;
#endif

#ifdef Q_MOC_RUN
#define BOXLINK_MODULE_EXPORT
#else
#define BOXLINK_MODULE_EXPORT export
#endif

/**
 * @struct ConnectionStatus
 * @brief One health sample.
 */
BOXLINK_MODULE_EXPORT struct ConnectionStatus {
    bool proxyOk = false;    //!< Engine running and control API answering.
    bool vpnOk = false;      //!< VPN up, or VPN integration not in use.
    QDateTime lastCheckTime; //!< Sample time (UTC), invalid before the first check.
    QString proxyError;      //!< Reason for a failed proxy check.
    QString vpnError;        //!< Reason for a failed VPN check.
};

/**
 * @class ConnectionMonitor
 * @brief Timer driven health checker.
 *
 * @details
 * Timer ticks notify observers only when `(proxyOk, vpnOk)` changes.
 * checkNow() always notifies. Checks never overlap.
 */
BOXLINK_MODULE_EXPORT class ConnectionMonitor : public QObject
{
    Q_OBJECT

public:
    using StatusObserver = std::function<void(const ConnectionStatus& previous, const ConnectionStatus& current)>;

    /**
     * @brief Construct an idle monitor.
     * @param supervisor Engine to probe; may be null (proxy always reported down).
     * @param vpnStatus VPN state source; may be null (VPN reported down when required).
     * @param log Optional diagnostics sink.
     * @param parent Optional QObject parent.
     */
    ConnectionMonitor(EngineSupervisor *supervisor, VpnStatusProvider *vpnStatus,
                      SystemLog *log = nullptr, QObject *parent = nullptr);

    void setMonitoringSettings(const MonitoringSettings& settings);
    const MonitoringSettings& monitoringSettings() const;

    void setVpnSettings(const VpnSettings& settings);
    const VpnSettings& vpnSettings() const;

    /**
     * @brief Run an initial check and start the timer.
     * @details Does nothing when monitoring is disabled or already active.
     */
    void start();

    //! Stop the timer and reset both snapshots.
    void stop();

    bool isActive() const;

    /**
     * @brief Check once and notify regardless of change.
     * @details Runs even when monitoring is disabled.
     * @return The new snapshot.
     */
    ConnectionStatus checkNow();

    ConnectionStatus status() const;
    ConnectionStatus previousStatus() const;

    int addStatusObserver(StatusObserver observer);
    bool removeStatusObserver(int handle);

private slots:
    void onTick();

private:
    /**
     * @brief Take a sample and rotate the snapshots.
     * @return True when a sample was taken.
     */
    bool sample();
    void checkProxy(ConnectionStatus& status);
    void checkVpn(ConnectionStatus& status);
    void notifyObservers();

    EngineSupervisor *m_supervisor = nullptr;  //!< Probed engine.
    VpnStatusProvider *m_vpnStatus = nullptr;  //!< VPN state source.
    SystemLog *m_log = nullptr;                //!< Optional diagnostics sink.
    MonitoringSettings m_settings;             //!< Interval and enable switch.
    VpnSettings m_vpnSettings;                 //!< VPN integration settings.
    QTimer m_timer;                            //!< Periodic tick.
    ConnectionStatus m_status;                 //!< Latest sample.
    ConnectionStatus m_previousStatus;         //!< Sample before the latest.
    ObserverList<const ConnectionStatus&, const ConnectionStatus&> m_observers {QStringLiteral("Monitor")};
    bool m_checking = false;                   //!< A check is in progress.
};

#include "connectionmonitor.moc"
