/*!
 * @file        settings.cppm
 * @brief       Declarative routing, VPN, DNS, monitoring and core settings.
 *
 * @details
 * Holds every user-facing knob consumed by the run-config assembler, the
 * engine supervisor, the connection monitor and the subscription updater.
 * Each settings group loads from and saves to `QSettings`; routing and VPN
 * settings also have a JSON form used for per-profile overrides.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QJsonObject>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <optional>

export module boxlink.core.settings;

/**
 * @enum RoutingMode
 * @brief Policy selecting which traffic bypasses the proxy.
 */
export enum class RoutingMode
{
    ProxyAll,    //!< Everything through the proxy (local ranges only when requested).
    BypassLocal, //!< Local and private ranges go direct.
    Custom       //!< Local bypass plus user proxy/direct/vpn lists.
};

export QString routingModeName(RoutingMode mode);
export RoutingMode routingModeFromName(const QString& name);

/**
 * @struct RoutingEntries
 * @brief Routing list entries split by match kind.
 */
export struct RoutingEntries {
    QStringList domains; //!< Domain suffixes.
    QStringList cidrs;   //!< IP ranges in CIDR notation.

    bool isEmpty() const
    {
        return domains.isEmpty() && cidrs.isEmpty();
    }
};

/**
 * @struct RoutingSettings
 * @brief Routing policy and user lists.
 */
export struct RoutingSettings {
    RoutingMode mode = RoutingMode::BypassLocal; //!< Active policy.
    QStringList proxyList;                       //!< Entries forced through the proxy.
    QStringList directList;                      //!< Entries forced direct.
    QStringList vpnList;                         //!< Entries sent through the VPN interface.
    bool bypassLocalNetworks = false;            //!< Local bypass in ProxyAll mode.
    QStringList ruleOrder {                      //!< Group order for custom list rules.
        QStringLiteral("direct"),
        QStringLiteral("vpn"),
        QStringLiteral("proxy"),
    };

    /**
     * @brief Rule order restricted to known groups, deduplicated and completed.
     * @return Permutation of direct/vpn/proxy.
     */
    QStringList effectiveRuleOrder() const;

    /**
     * @brief Replace the three lists with `proxy_list.txt`, `direct_list.txt`, `vpn_list.txt`.
     * @param directory Configuration directory.
     */
    void loadListsFromDirectory(const QString& directory);

    /**
     * @brief Write the three lists back as newline-delimited files.
     * @param directory Configuration directory.
     * @return True when every file was committed.
     */
    bool saveListsToDirectory(const QString& directory) const;

    /**
     * @brief Read a newline-delimited list, skipping blanks and `#` comments.
     * @param filePath List file.
     * @return Entries, empty when the file is missing or unreadable.
     */
    static QStringList loadListFile(const QString& filePath);

    /**
     * @brief Classify entries as CIDR or domain suffix.
     * @details Comma separated entries are split; bare IPv4 becomes /32 and bare IPv6 /128.
     * @param entries Raw entries.
     * @return Classified entries in input order.
     */
    static RoutingEntries parseEntries(const QStringList& entries);

    QJsonObject toJson() const;
    static RoutingSettings fromJson(const QJsonObject& json);

    static RoutingSettings load(QSettings& settings);
    void save(QSettings& settings) const;
};

/**
 * @struct VpnSettings
 * @brief Corporate VPN integration: which traffic is bound to the VPN interface.
 */
export struct VpnSettings {
    bool enabled = false;        //!< Integration switch.
    QString connectionName;      //!< VPN connection name as known to the OS.
    QString interfaceName;       //!< Explicit interface override; auto-detected when empty.
    QString directInterface;     //!< Interface for direct traffic while the VPN is up.
    QStringList overVpnNetworks; //!< CIDRs routed through the VPN.
    QStringList overVpnDomains;  //!< Domain suffixes routed through the VPN.
    QStringList directNetworks;  //!< CIDRs kept direct while the VPN is up.
    QStringList directDomains;   //!< Domain suffixes kept direct while the VPN is up.

    QJsonObject toJson() const;
    static VpnSettings fromJson(const QJsonObject& json);

    static VpnSettings load(QSettings& settings);
    void save(QSettings& settings) const;
};

/**
 * @struct DnsSettings
 * @brief Main resolver selection.
 */
export struct DnsSettings {
    QString provider = QStringLiteral("system"); //!< system/google/cloudflare/adguard.
    QString customUrl;                           //!< Overrides provider when set.
    bool useProxy = true;                        //!< Detour main resolver through the proxy.

    /**
     * @brief Effective resolver URL, or "local" for the system resolver.
     * @return Resolver address.
     */
    QString resolverUrl() const;

    static QStringList knownProviders();

    static DnsSettings load(QSettings& settings);
    void save(QSettings& settings) const;
};

/**
 * @struct MonitoringSettings
 * @brief Health monitor knobs.
 */
export struct MonitoringSettings {
    bool enabled = true;
    int checkIntervalSeconds = 10;
    QString testUrl = QStringLiteral("https://www.gstatic.com/generate_204");

    static MonitoringSettings load(QSettings& settings);
    void save(QSettings& settings) const;
};

/**
 * @enum EngineInvocation
 * @brief Command line convention used to hand the config file to the engine.
 */
export enum class EngineInvocation
{
    RunDashC,   //!< `run -c <file>`.
    DashConfig  //!< `-config <file>`.
};

/**
 * @struct CoreSettings
 * @brief Local listener, engine binary and control-API settings.
 */
export struct CoreSettings {
    QString inboundAddress = QStringLiteral("127.0.0.1"); //!< Mixed inbound listen host.
    quint16 inboundPort = 2080;                            //!< Mixed inbound listen port.
    QString logLevel = QStringLiteral("info");             //!< Engine log level.
    bool skipCertVerify = false;                           //!< Force insecure TLS for every outbound.

    QString controlApiHost = QStringLiteral("127.0.0.1");  //!< Control-API listen host.
    quint16 controlApiPort = 9090;                         //!< Control-API listen port.
    QString controlApiSecret;                              //!< Bearer token, optional.

    QString engineExecutablePath;                          //!< Explicit engine binary path.
    EngineInvocation invocation = EngineInvocation::RunDashC;
    QString userAgent = QStringLiteral("BoxLink-Subscription/1.0");

    /**
     * @brief Engine arguments for a config file path.
     * @param configPath Config file.
     * @return Argument list.
     */
    QStringList engineArguments(const QString& configPath) const;

    static CoreSettings load(QSettings& settings);
    void save(QSettings& settings) const;
};
