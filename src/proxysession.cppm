/*!
 * @file        proxysession.cppm
 * @brief       Connect/disconnect orchestration for one profile store.
 *
 * @details
 * Ties the pipeline together: resolve a stored profile, compile its
 * outbound, assemble the run configuration from per-profile overrides or
 * global settings, hand it to the engine supervisor, then update the proxy
 * state and the health monitor. Every collaborator is owned by the caller.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QJsonObject>
#include <QString>

#include <optional>

export module boxlink.core.proxysession;
import boxlink.core.connectionmonitor;
import boxlink.core.enginesupervisor;
import boxlink.core.profilestore;
import boxlink.core.proxystate;
import boxlink.core.settings;
import boxlink.core.systemlog;
import boxlink.core.vpnstatus;

/**
 * @struct SessionSettings
 * @brief Global settings applied when a profile carries no override.
 */
export struct SessionSettings {
    CoreSettings core;             //!< Listener, engine and control-API settings.
    RoutingSettings routing;       //!< Global routing policy.
    VpnSettings vpn;               //!< Global VPN integration.
    DnsSettings dns;               //!< Resolver settings.
    MonitoringSettings monitoring; //!< Health monitor settings.
    QString configDirectory;       //!< Holds the Custom-mode list files; empty to keep in-memory lists.
};

/**
 * @class ProxySession
 * @brief Runs one stored profile at a time through the engine.
 */
export class ProxySession
{
public:
    /**
     * @brief Construct a session over caller-owned collaborators.
     * @param store Profile store.
     * @param supervisor Engine supervisor.
     * @param state Proxy state updated on connect/disconnect.
     * @param monitor Optional health monitor started after connect.
     * @param vpnStatus Optional VPN status source.
     * @param log Optional diagnostics sink.
     */
    ProxySession(ProfileStore& store, EngineSupervisor& supervisor, ProxyState& state,
                 ConnectionMonitor *monitor = nullptr, VpnStatusProvider *vpnStatus = nullptr,
                 SystemLog *log = nullptr);
    ~ProxySession();

    ProxySession(const ProxySession&) = delete;
    ProxySession& operator=(const ProxySession&) = delete;

    void setSettings(const SessionSettings& settings);
    const SessionSettings& settings() const;

    /**
     * @brief Run configuration for a stored profile.
     * @param entryId Profile identifier.
     * @param errorMessage Optional output message on failure.
     * @return Configuration document, or empty optional when the profile is unknown or incomplete.
     */
    std::optional<QJsonObject> buildConfig(int entryId, QString *errorMessage = nullptr) const;

    /**
     * @brief Start the engine with a stored profile.
     * @param entryId Profile identifier.
     * @return Supervisor outcome; compile failures are reported as ConfigWriteFailed.
     */
    EngineSupervisor::Result connectProfile(int entryId);

    /**
     * @brief Stop the engine and the monitor.
     * @return Supervisor outcome.
     */
    EngineSupervisor::Result disconnect();

    /**
     * @brief Rebuild the running profile's configuration and hot-reload it.
     * @return Supervisor outcome; fails when nothing is running.
     */
    EngineSupervisor::Result reload();

private:
    void onEngineStopped();

    ProfileStore& m_store;                      //!< Profile source.
    EngineSupervisor& m_supervisor;             //!< Engine lifecycle.
    ProxyState& m_state;                        //!< Session state.
    ConnectionMonitor *m_monitor = nullptr;     //!< Optional health monitor.
    VpnStatusProvider *m_vpnStatus = nullptr;   //!< Optional VPN status source.
    SystemLog *m_log = nullptr;                 //!< Optional diagnostics sink.
    SessionSettings m_settings;                 //!< Global settings.
    int m_stopObserver = 0;                     //!< Handle on the supervisor's stop observers.
};
