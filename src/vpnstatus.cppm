/*!
 * @file        vpnstatus.cppm
 * @brief       VPN connection status queries.
 *
 * @details
 * Declares the interface the run-config assembler and the connection
 * monitor use to ask whether a named VPN connection is up and which network
 * interface carries it, plus a NetworkManager implementation that shells out
 * to `nmcli`.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>
#include <QStringList>

export module boxlink.core.vpnstatus;
import boxlink.core.systemlog;

/**
 * @class VpnStatusProvider
 * @brief Read-only view of the host's VPN connections.
 */
export class VpnStatusProvider
{
public:
    virtual ~VpnStatusProvider() = default;

    /**
     * @brief Whether the named connection is currently active.
     * @param connectionName Connection name as known to the OS.
     * @return Active state; false when it cannot be determined.
     */
    virtual bool isActive(const QString& connectionName) = 0;

    /**
     * @brief Network interface carrying an active connection.
     * @param connectionName Connection name as known to the OS.
     * @return Interface name, empty when inactive or unknown.
     */
    virtual QString interfaceName(const QString& connectionName) = 0;

    /**
     * @brief Names of configured VPN-like connections.
     * @return Connection names, empty when unavailable.
     */
    virtual QStringList connectionNames() = 0;
};

/**
 * @class NmcliVpnStatusProvider
 * @brief `VpnStatusProvider` backed by NetworkManager's command line client.
 *
 * @details
 * Every query runs a short-lived `nmcli` (or `ip`) child with a 5 second
 * budget. Missing tools and timeouts are reported as "not active".
 */
export class NmcliVpnStatusProvider : public VpnStatusProvider
{
public:
    explicit NmcliVpnStatusProvider(SystemLog *log = nullptr);

    bool isActive(const QString& connectionName) override;
    QString interfaceName(const QString& connectionName) override;
    QStringList connectionNames() override;

private:
    /**
     * @brief Run a helper tool and capture its standard output.
     * @param program Executable name.
     * @param arguments Command line arguments.
     * @param output Receives trimmed standard output on success.
     * @return True when the tool ran and exited with status 0.
     */
    bool runTool(const QString& program, const QStringList& arguments, QString *output) const;

    SystemLog *m_log = nullptr; //!< Optional diagnostics sink.
};
