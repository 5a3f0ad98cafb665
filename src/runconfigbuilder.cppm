/*!
 * @file        runconfigbuilder.cppm
 * @brief       sing-box run configuration assembler.
 *
 * @details
 * Combines a compiled proxy outbound with routing, VPN and DNS settings into
 * the complete document handed to the engine: log, dns, inbounds, outbounds
 * and route. Rule order is significant; VPN rules come first, then the
 * local-network bypass, then the user lists, and everything else falls
 * through to the proxy.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QtTypes>

export module boxlink.core.runconfigbuilder;
import boxlink.core.settings;
import boxlink.core.systemlog;
import boxlink.core.vpnstatus;

/**
 * @class RunConfigBuilder
 * @brief Builds sing-box run configurations.
 */
export class RunConfigBuilder
{
public:
    /**
     * @struct BuildOptions
     * @brief Local listener and log settings for the generated document.
     */
    struct BuildOptions {
        QString inboundAddress = QStringLiteral("127.0.0.1"); //!< Mixed inbound listen host.
        quint16 inboundPort = 2080;                            //!< Mixed inbound listen port.
        QString logLevel = QStringLiteral("info");             //!< Engine log level.

        static BuildOptions fromCoreSettings(const CoreSettings& core);
    };

    /**
     * @brief Assemble a full run configuration.
     * @param outbound Compiled proxy outbound; tagged "proxy" when it has no tag.
     * @param routing Routing policy and lists (lists already loaded).
     * @param vpn VPN integration settings.
     * @param dns Resolver settings.
     * @param options Listener and log options.
     * @param vpnStatus VPN status source, may be nullptr (VPN treated as down).
     * @param log Optional diagnostics sink.
     * @return sing-box configuration document.
     */
    static QJsonObject build(const QJsonObject& outbound,
                             const RoutingSettings& routing,
                             const VpnSettings& vpn,
                             const DnsSettings& dns,
                             const BuildOptions& options,
                             VpnStatusProvider *vpnStatus = nullptr,
                             SystemLog *log = nullptr);

    /**
     * @brief Loopback, RFC1918, link-local and unique-local ranges.
     * @return CIDR list, IPv4 first.
     */
    static QStringList localNetworks();

private:
    /**
     * @brief Resolve the VPN interface when integration applies.
     * @return Interface name, empty when the VPN is disabled, down or unresolved.
     */
    static QString resolveVpnInterface(const VpnSettings& vpn, VpnStatusProvider *vpnStatus, SystemLog *log);

    /**
     * @brief Build the `dns` section.
     * @param dns Resolver settings.
     * @param proxyTag Tag of the proxy outbound used as detour.
     * @param proxyServer Proxy server host; routed to the local resolver.
     * @param localDomains Domain suffixes resolved by the local resolver.
     * @return DNS object.
     */
    static QJsonObject buildDns(const DnsSettings& dns, const QString& proxyTag,
                                const QString& proxyServer, const QStringList& localDomains);

    /**
     * @brief Build the `main-dns` server entry from a resolver URL.
     * @param url Resolver URL or "local".
     * @return Server object without detour.
     */
    static QJsonObject buildMainDnsServer(const QString& url);
};
