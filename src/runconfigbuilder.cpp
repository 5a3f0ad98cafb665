module;
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QUrl>

module boxlink.core.runconfigbuilder;
import boxlink.core.proxyprofile;

namespace {
const QString kProxyTag = QStringLiteral("proxy");
const QString kDirectTag = QStringLiteral("direct");
const QString kVpnTag = QStringLiteral("vpn");
const QString kMainDnsTag = QStringLiteral("main-dns");
const QString kLocalDnsTag = QStringLiteral("local-dns");

constexpr int kDefaultDohPort = 443;
constexpr int kDefaultDotPort = 853;
constexpr int kDefaultDnsPort = 53;

QJsonArray toArray(const QStringList& values)
{
    QJsonArray out;
    for (const QString& value : values) {
        out.append(value);
    }
    return out;
}

void appendRules(QJsonArray& rules, const RoutingEntries& entries, const QString& outboundTag)
{
    if (!entries.cidrs.isEmpty()) {
        rules.append(QJsonObject {
            {QStringLiteral("ip_cidr"), toArray(entries.cidrs)},
            {QStringLiteral("outbound"), outboundTag}
        });
    }
    if (!entries.domains.isEmpty()) {
        rules.append(QJsonObject {
            {QStringLiteral("domain_suffix"), toArray(entries.domains)},
            {QStringLiteral("outbound"), outboundTag}
        });
    }
}

RoutingEntries vpnEntries(const QStringList& networks, const QStringList& domains)
{
    RoutingEntries entries;
    entries.cidrs = RoutingSettings::parseEntries(networks).cidrs;
    entries.domains = RoutingSettings::parseEntries(domains).domains;
    return entries;
}

bool wantsLocalBypass(const RoutingSettings& routing)
{
    switch (routing.mode) {
    case RoutingMode::ProxyAll:
        return routing.bypassLocalNetworks;
    case RoutingMode::BypassLocal:
    case RoutingMode::Custom:
        return true;
    }
    return true;
}
}

RunConfigBuilder::BuildOptions RunConfigBuilder::BuildOptions::fromCoreSettings(const CoreSettings& core)
{
    BuildOptions options;
    options.inboundAddress = core.inboundAddress;
    options.inboundPort = core.inboundPort;
    options.logLevel = core.logLevel;
    return options;
}

QStringList RunConfigBuilder::localNetworks()
{
    return {
        QStringLiteral("127.0.0.0/8"),
        QStringLiteral("10.0.0.0/8"),
        QStringLiteral("172.16.0.0/12"),
        QStringLiteral("192.168.0.0/16"),
        QStringLiteral("169.254.0.0/16"),
        QStringLiteral("::1/128"),
        QStringLiteral("fc00::/7"),
        QStringLiteral("fe80::/10"),
    };
}

QJsonObject RunConfigBuilder::build(const QJsonObject& outbound,
                                    const RoutingSettings& routing,
                                    const VpnSettings& vpn,
                                    const DnsSettings& dns,
                                    const BuildOptions& options,
                                    VpnStatusProvider *vpnStatus,
                                    SystemLog *log)
{
    QJsonObject proxyOutbound = outbound;
    if (proxyOutbound.value(QStringLiteral("tag")).toString().isEmpty()) {
        proxyOutbound[QStringLiteral("tag")] = kProxyTag;
    }
    const QString proxyTag = proxyOutbound.value(QStringLiteral("tag")).toString();

    const QString vpnInterface = resolveVpnInterface(vpn, vpnStatus, log);
    const bool vpnActive = !vpnInterface.isEmpty();

    QJsonArray rules;
    QStringList localDnsDomains;

    if (vpnActive) {
        const RoutingEntries overVpn = vpnEntries(vpn.overVpnNetworks, vpn.overVpnDomains);
        appendRules(rules, overVpn, kVpnTag);
        appendRules(rules, vpnEntries(vpn.directNetworks, vpn.directDomains), kDirectTag);
        localDnsDomains += overVpn.domains;
    }

    if (wantsLocalBypass(routing)) {
        rules.append(QJsonObject {
            {QStringLiteral("ip_cidr"), toArray(localNetworks())},
            {QStringLiteral("outbound"), kDirectTag}
        });
    }

    if (routing.mode == RoutingMode::Custom) {
        const QStringList order = routing.effectiveRuleOrder();
        for (const QString& group : order) {
            if (group == QStringLiteral("direct")) {
                appendRules(rules, RoutingSettings::parseEntries(routing.directList), kDirectTag);
            } else if (group == QStringLiteral("vpn")) {
                if (!vpnActive) {
                    continue;
                }
                const RoutingEntries vpnList = RoutingSettings::parseEntries(routing.vpnList);
                appendRules(rules, vpnList, kVpnTag);
                localDnsDomains += vpnList.domains;
            } else if (group == QStringLiteral("proxy")) {
                appendRules(rules, RoutingSettings::parseEntries(routing.proxyList), proxyTag);
            }
        }
    }
    localDnsDomains.removeDuplicates();

    QJsonObject directOutbound {
        {QStringLiteral("type"), QStringLiteral("direct")},
        {QStringLiteral("tag"), kDirectTag}
    };
    if (vpnActive && !vpn.directInterface.trimmed().isEmpty()) {
        directOutbound[QStringLiteral("bind_interface")] = vpn.directInterface.trimmed();
    }

    QJsonArray outbounds {proxyOutbound, directOutbound};
    if (vpnActive) {
        outbounds.append(QJsonObject {
            {QStringLiteral("type"), QStringLiteral("direct")},
            {QStringLiteral("tag"), kVpnTag},
            {QStringLiteral("bind_interface"), vpnInterface}
        });
        appendSystemLog(log, QStringLiteral("[Config] VPN outbound bound to %1").arg(vpnInterface));
    }

    const QJsonObject inbound {
        {QStringLiteral("type"), QStringLiteral("mixed")},
        {QStringLiteral("tag"), QStringLiteral("mixed-in")},
        {QStringLiteral("listen"), options.inboundAddress},
        {QStringLiteral("listen_port"), static_cast<int>(options.inboundPort)},
        {QStringLiteral("sniff"), true}
    };

    const QJsonObject route {
        {QStringLiteral("rules"), rules},
        {QStringLiteral("final"), proxyTag},
        {QStringLiteral("auto_detect_interface"), false}
    };

    appendSystemLog(log, QStringLiteral("[Config] Routing mode %1, %2 rule(s), final %3")
        .arg(routingModeName(routing.mode))
        .arg(rules.size())
        .arg(proxyTag));

    return QJsonObject {
        {QStringLiteral("log"), QJsonObject {
            {QStringLiteral("level"), options.logLevel},
            {QStringLiteral("timestamp"), true}
        }},
        {QStringLiteral("dns"), buildDns(dns, proxyTag,
                                         proxyOutbound.value(QStringLiteral("server")).toString(),
                                         localDnsDomains)},
        {QStringLiteral("inbounds"), QJsonArray {inbound}},
        {QStringLiteral("outbounds"), outbounds},
        {QStringLiteral("route"), route}
    };
}

QString RunConfigBuilder::resolveVpnInterface(const VpnSettings& vpn, VpnStatusProvider *vpnStatus, SystemLog *log)
{
    if (!vpn.enabled) {
        return QString();
    }

    const QString connection = vpn.connectionName.trimmed();
    if (vpnStatus == nullptr || connection.isEmpty() || !vpnStatus->isActive(connection)) {
        appendSystemLog(log, QStringLiteral("[Config] VPN integration enabled but connection '%1' is not active.")
            .arg(connection));
        return QString();
    }

    QString interfaceName = vpn.interfaceName.trimmed();
    if (interfaceName.isEmpty()) {
        interfaceName = vpnStatus->interfaceName(connection).trimmed();
    }
    if (interfaceName.isEmpty()) {
        appendSystemLog(log, QStringLiteral("[Config] VPN is active but its interface was not found."));
    }
    return interfaceName;
}

QJsonObject RunConfigBuilder::buildDns(const DnsSettings& dns, const QString& proxyTag,
                                       const QString& proxyServer, const QStringList& localDomains)
{
    QJsonObject mainServer = buildMainDnsServer(dns.resolverUrl());
    // No detour means a direct dial; sing-box rejects `detour: direct`.
    if (dns.useProxy && mainServer.value(QStringLiteral("type")).toString() != QStringLiteral("local")) {
        mainServer[QStringLiteral("detour")] = proxyTag;
    }

    const QJsonArray servers {
        mainServer,
        QJsonObject {
            {QStringLiteral("tag"), kLocalDnsTag},
            {QStringLiteral("type"), QStringLiteral("local")}
        }
    };

    QJsonArray rules;
    const QString server = proxyServer.trimmed();
    if (!server.isEmpty() && !isIpAddress(server)) {
        // Resolving the proxy through itself would never bootstrap.
        rules.append(QJsonObject {
            {QStringLiteral("domain"), QJsonArray {server}},
            {QStringLiteral("server"), kLocalDnsTag}
        });
    }
    if (!localDomains.isEmpty()) {
        rules.append(QJsonObject {
            {QStringLiteral("domain_suffix"), toArray(localDomains)},
            {QStringLiteral("server"), kLocalDnsTag}
        });
    }

    return QJsonObject {
        {QStringLiteral("servers"), servers},
        {QStringLiteral("rules"), rules},
        {QStringLiteral("final"), kMainDnsTag}
    };
}

QJsonObject RunConfigBuilder::buildMainDnsServer(const QString& url)
{
    const QString value = url.trimmed();
    if (value.isEmpty() || value == QStringLiteral("local")) {
        return QJsonObject {
            {QStringLiteral("tag"), kMainDnsTag},
            {QStringLiteral("type"), QStringLiteral("local")}
        };
    }

    if (value.startsWith(QStringLiteral("https://"), Qt::CaseInsensitive)) {
        const QUrl parsed(value);
        const QString path = parsed.path().isEmpty() ? QStringLiteral("/dns-query") : parsed.path();
        return QJsonObject {
            {QStringLiteral("tag"), kMainDnsTag},
            {QStringLiteral("type"), QStringLiteral("https")},
            {QStringLiteral("server"), parsed.host()},
            {QStringLiteral("server_port"), parsed.port(kDefaultDohPort)},
            {QStringLiteral("path"), path}
        };
    }

    if (value.startsWith(QStringLiteral("tls://"), Qt::CaseInsensitive)) {
        const QUrl parsed(value);
        return QJsonObject {
            {QStringLiteral("tag"), kMainDnsTag},
            {QStringLiteral("type"), QStringLiteral("tls")},
            {QStringLiteral("server"), parsed.host()},
            {QStringLiteral("server_port"), parsed.port(kDefaultDotPort)}
        };
    }

    // Plain address, optionally prefixed with udp:// or tcp://.
    QString type = QStringLiteral("udp");
    QString address = value;
    if (value.startsWith(QStringLiteral("tcp://"), Qt::CaseInsensitive)) {
        type = QStringLiteral("tcp");
        address = value.mid(6);
    } else if (value.startsWith(QStringLiteral("udp://"), Qt::CaseInsensitive)) {
        address = value.mid(6);
    }

    QJsonObject server {
        {QStringLiteral("tag"), kMainDnsTag},
        {QStringLiteral("type"), type},
        {QStringLiteral("server"), address}
    };
    const QUrl parsed(type + QStringLiteral("://") + address);
    if (parsed.isValid() && !parsed.host().isEmpty()) {
        server[QStringLiteral("server")] = parsed.host();
        server[QStringLiteral("server_port")] = parsed.port(kDefaultDnsPort);
    }
    return server;
}
