module;
#include <QDir>
#include <QFile>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonObject>
#include <QSaveFile>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QTextStream>

module boxlink.core.settings;

namespace {
constexpr int kMaxPrefixIpv4 = 32;
constexpr int kMaxPrefixIpv6 = 128;

const QStringList& routingGroups()
{
    static const QStringList groups {
        QStringLiteral("direct"),
        QStringLiteral("vpn"),
        QStringLiteral("proxy"),
    };
    return groups;
}

QJsonArray toArray(const QStringList& values)
{
    QJsonArray arr;
    for (const QString& value : values) {
        arr.append(value);
    }
    return arr;
}

QStringList fromArray(const QJsonValue& value)
{
    QStringList result;
    for (const QJsonValue& item : value.toArray()) {
        const QString text = item.toString().trimmed();
        if (!text.isEmpty()) {
            result.append(text);
        }
    }
    return result;
}

QStringList splitLines(const QString& text)
{
    QStringList result;
    for (const QString& line : text.split(QLatin1Char('\n'))) {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty()) {
            result.append(trimmed);
        }
    }
    return result;
}

bool writeListFile(const QString& filePath, const QStringList& entries)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        return false;
    }
    file.write(entries.join(QLatin1Char('\n')).toUtf8());
    return file.commit();
}

void classifyEntry(const QString& entry, RoutingEntries& out)
{
    const int slash = entry.indexOf(QLatin1Char('/'));
    if (slash > 0) {
        bool ok = false;
        const int prefix = entry.mid(slash + 1).toInt(&ok);
        QHostAddress address;
        if (ok && prefix >= 0 && address.setAddress(entry.left(slash))) {
            const int limit = address.protocol() == QAbstractSocket::IPv6Protocol ? kMaxPrefixIpv6 : kMaxPrefixIpv4;
            if (prefix <= limit) {
                out.cidrs.append(entry);
                return;
            }
        }
    }

    QHostAddress address;
    if (address.setAddress(entry)) {
        const bool ipv6 = address.protocol() == QAbstractSocket::IPv6Protocol;
        out.cidrs.append(QStringLiteral("%1/%2").arg(entry).arg(ipv6 ? kMaxPrefixIpv6 : kMaxPrefixIpv4));
        return;
    }

    QString domain = entry.toLower();
    if (domain.startsWith(QStringLiteral("*."))) {
        domain.remove(0, 2);
    } else if (domain.startsWith(QLatin1Char('.'))) {
        domain.remove(0, 1);
    }
    if (!domain.isEmpty()) {
        out.domains.append(domain);
    }
}
}

QString routingModeName(RoutingMode mode)
{
    switch (mode) {
    case RoutingMode::ProxyAll:
        return QStringLiteral("proxy_all");
    case RoutingMode::BypassLocal:
        return QStringLiteral("bypass_local");
    case RoutingMode::Custom:
        return QStringLiteral("custom");
    }
    return QStringLiteral("bypass_local");
}

RoutingMode routingModeFromName(const QString& name)
{
    const QString normalized = name.trimmed().toLower().replace(QLatin1Char('-'), QLatin1Char('_'));
    if (normalized == QStringLiteral("proxy_all")) {
        return RoutingMode::ProxyAll;
    }
    if (normalized == QStringLiteral("custom")) {
        return RoutingMode::Custom;
    }
    return RoutingMode::BypassLocal;
}

QStringList RoutingSettings::effectiveRuleOrder() const
{
    QStringList result;
    for (const QString& group : ruleOrder) {
        const QString normalized = group.trimmed().toLower();
        if (routingGroups().contains(normalized) && !result.contains(normalized)) {
            result.append(normalized);
        }
    }
    for (const QString& group : routingGroups()) {
        if (!result.contains(group)) {
            result.append(group);
        }
    }
    return result;
}

void RoutingSettings::loadListsFromDirectory(const QString& directory)
{
    const QDir dir(directory);
    proxyList = loadListFile(dir.filePath(QStringLiteral("proxy_list.txt")));
    directList = loadListFile(dir.filePath(QStringLiteral("direct_list.txt")));
    vpnList = loadListFile(dir.filePath(QStringLiteral("vpn_list.txt")));
}

bool RoutingSettings::saveListsToDirectory(const QString& directory) const
{
    QDir dir(directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return false;
    }

    const bool proxyOk = writeListFile(dir.filePath(QStringLiteral("proxy_list.txt")), proxyList);
    const bool directOk = writeListFile(dir.filePath(QStringLiteral("direct_list.txt")), directList);
    const bool vpnOk = writeListFile(dir.filePath(QStringLiteral("vpn_list.txt")), vpnList);
    return proxyOk && directOk && vpnOk;
}

QStringList RoutingSettings::loadListFile(const QString& filePath)
{
    QStringList result;
    QFile file(filePath);
    if (!file.exists() || !file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return result;
    }

    QTextStream stream(&file);
    while (!stream.atEnd()) {
        const QString line = stream.readLine().trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }
        result.append(line);
    }
    return result;
}

RoutingEntries RoutingSettings::parseEntries(const QStringList& entries)
{
    RoutingEntries result;
    for (const QString& raw : entries) {
        for (const QString& part : raw.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
            const QString entry = part.trimmed();
            if (entry.isEmpty() || entry.startsWith(QLatin1Char('#'))) {
                continue;
            }
            classifyEntry(entry, result);
        }
    }
    return result;
}

QJsonObject RoutingSettings::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("mode")] = routingModeName(mode);
    json[QStringLiteral("proxyList")] = toArray(proxyList);
    json[QStringLiteral("directList")] = toArray(directList);
    json[QStringLiteral("vpnList")] = toArray(vpnList);
    json[QStringLiteral("bypassLocalNetworks")] = bypassLocalNetworks;
    json[QStringLiteral("ruleOrder")] = toArray(ruleOrder);
    return json;
}

RoutingSettings RoutingSettings::fromJson(const QJsonObject& json)
{
    RoutingSettings settings;
    settings.mode = routingModeFromName(json.value(QStringLiteral("mode")).toString());
    settings.proxyList = fromArray(json.value(QStringLiteral("proxyList")));
    settings.directList = fromArray(json.value(QStringLiteral("directList")));
    settings.vpnList = fromArray(json.value(QStringLiteral("vpnList")));
    settings.bypassLocalNetworks = json.value(QStringLiteral("bypassLocalNetworks")).toBool(false);
    const QStringList order = fromArray(json.value(QStringLiteral("ruleOrder")));
    if (!order.isEmpty()) {
        settings.ruleOrder = order;
    }
    return settings;
}

RoutingSettings RoutingSettings::load(QSettings& settings)
{
    RoutingSettings routing;
    routing.mode = routingModeFromName(
        settings.value(QStringLiteral("routing/mode"), routingModeName(routing.mode)).toString());
    routing.bypassLocalNetworks = settings.value(QStringLiteral("routing/bypassLocalNetworks"), false).toBool();
    const QStringList order = settings.value(QStringLiteral("routing/ruleOrder")).toStringList();
    if (!order.isEmpty()) {
        routing.ruleOrder = order;
    }
    return routing;
}

void RoutingSettings::save(QSettings& settings) const
{
    settings.setValue(QStringLiteral("routing/mode"), routingModeName(mode));
    settings.setValue(QStringLiteral("routing/bypassLocalNetworks"), bypassLocalNetworks);
    settings.setValue(QStringLiteral("routing/ruleOrder"), ruleOrder);
}

QJsonObject VpnSettings::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("enabled")] = enabled;
    json[QStringLiteral("connectionName")] = connectionName;
    json[QStringLiteral("interfaceName")] = interfaceName;
    json[QStringLiteral("directInterface")] = directInterface;
    json[QStringLiteral("overVpnNetworks")] = toArray(overVpnNetworks);
    json[QStringLiteral("overVpnDomains")] = toArray(overVpnDomains);
    json[QStringLiteral("directNetworks")] = toArray(directNetworks);
    json[QStringLiteral("directDomains")] = toArray(directDomains);
    return json;
}

VpnSettings VpnSettings::fromJson(const QJsonObject& json)
{
    VpnSettings settings;
    settings.enabled = json.value(QStringLiteral("enabled")).toBool(false);
    settings.connectionName = json.value(QStringLiteral("connectionName")).toString().trimmed();
    settings.interfaceName = json.value(QStringLiteral("interfaceName")).toString().trimmed();
    settings.directInterface = json.value(QStringLiteral("directInterface")).toString().trimmed();
    settings.overVpnNetworks = fromArray(json.value(QStringLiteral("overVpnNetworks")));
    settings.overVpnDomains = fromArray(json.value(QStringLiteral("overVpnDomains")));
    settings.directNetworks = fromArray(json.value(QStringLiteral("directNetworks")));
    settings.directDomains = fromArray(json.value(QStringLiteral("directDomains")));
    return settings;
}

VpnSettings VpnSettings::load(QSettings& settings)
{
    VpnSettings vpn;
    vpn.enabled = settings.value(QStringLiteral("vpn/enabled"), false).toBool();
    vpn.connectionName = settings.value(QStringLiteral("vpn/connectionName")).toString().trimmed();
    vpn.interfaceName = settings.value(QStringLiteral("vpn/interfaceName")).toString().trimmed();
    vpn.directInterface = settings.value(QStringLiteral("vpn/directInterface")).toString().trimmed();
    vpn.overVpnNetworks = splitLines(settings.value(QStringLiteral("vpn/overVpnNetworks")).toString());
    vpn.overVpnDomains = splitLines(settings.value(QStringLiteral("vpn/overVpnDomains")).toString());
    vpn.directNetworks = splitLines(settings.value(QStringLiteral("vpn/directNetworks")).toString());
    vpn.directDomains = splitLines(settings.value(QStringLiteral("vpn/directDomains")).toString());
    return vpn;
}

void VpnSettings::save(QSettings& settings) const
{
    settings.setValue(QStringLiteral("vpn/enabled"), enabled);
    settings.setValue(QStringLiteral("vpn/connectionName"), connectionName);
    settings.setValue(QStringLiteral("vpn/interfaceName"), interfaceName);
    settings.setValue(QStringLiteral("vpn/directInterface"), directInterface);
    settings.setValue(QStringLiteral("vpn/overVpnNetworks"), overVpnNetworks.join(QLatin1Char('\n')));
    settings.setValue(QStringLiteral("vpn/overVpnDomains"), overVpnDomains.join(QLatin1Char('\n')));
    settings.setValue(QStringLiteral("vpn/directNetworks"), directNetworks.join(QLatin1Char('\n')));
    settings.setValue(QStringLiteral("vpn/directDomains"), directDomains.join(QLatin1Char('\n')));
}

QString DnsSettings::resolverUrl() const
{
    const QString custom = customUrl.trimmed();
    if (!custom.isEmpty()) {
        return custom;
    }

    const QString key = provider.trimmed().toLower();
    if (key == QStringLiteral("google")) {
        return QStringLiteral("https://dns.google/dns-query");
    }
    if (key == QStringLiteral("cloudflare")) {
        return QStringLiteral("https://cloudflare-dns.com/dns-query");
    }
    if (key == QStringLiteral("adguard")) {
        return QStringLiteral("https://dns.adguard.com/dns-query");
    }
    return QStringLiteral("local");
}

QStringList DnsSettings::knownProviders()
{
    return {
        QStringLiteral("system"),
        QStringLiteral("google"),
        QStringLiteral("cloudflare"),
        QStringLiteral("adguard"),
    };
}

DnsSettings DnsSettings::load(QSettings& settings)
{
    DnsSettings dns;
    dns.provider = settings.value(QStringLiteral("dns/provider"), dns.provider).toString().trimmed().toLower();
    if (!knownProviders().contains(dns.provider)) {
        dns.provider = QStringLiteral("system");
    }
    dns.customUrl = settings.value(QStringLiteral("dns/customUrl")).toString().trimmed();
    dns.useProxy = settings.value(QStringLiteral("dns/useProxy"), dns.useProxy).toBool();
    return dns;
}

void DnsSettings::save(QSettings& settings) const
{
    settings.setValue(QStringLiteral("dns/provider"), provider);
    settings.setValue(QStringLiteral("dns/customUrl"), customUrl);
    settings.setValue(QStringLiteral("dns/useProxy"), useProxy);
}

MonitoringSettings MonitoringSettings::load(QSettings& settings)
{
    MonitoringSettings monitoring;
    monitoring.enabled = settings.value(QStringLiteral("monitoring/enabled"), monitoring.enabled).toBool();
    monitoring.checkIntervalSeconds = qMax(1, settings.value(
        QStringLiteral("monitoring/intervalSeconds"), monitoring.checkIntervalSeconds).toInt());
    monitoring.testUrl = settings.value(QStringLiteral("monitoring/testUrl"), monitoring.testUrl).toString().trimmed();
    return monitoring;
}

void MonitoringSettings::save(QSettings& settings) const
{
    settings.setValue(QStringLiteral("monitoring/enabled"), enabled);
    settings.setValue(QStringLiteral("monitoring/intervalSeconds"), checkIntervalSeconds);
    settings.setValue(QStringLiteral("monitoring/testUrl"), testUrl);
}

QStringList CoreSettings::engineArguments(const QString& configPath) const
{
    if (invocation == EngineInvocation::DashConfig) {
        return {QStringLiteral("-config"), configPath};
    }
    return {QStringLiteral("run"), QStringLiteral("-c"), configPath};
}

CoreSettings CoreSettings::load(QSettings& settings)
{
    CoreSettings core;
    core.inboundAddress = settings.value(QStringLiteral("inbound/address"), core.inboundAddress).toString().trimmed();
    core.inboundPort = static_cast<quint16>(settings.value(QStringLiteral("inbound/port"), core.inboundPort).toUInt());
    core.logLevel = settings.value(QStringLiteral("engine/logLevel"), core.logLevel).toString().trimmed().toLower();
    core.skipCertVerify = settings.value(QStringLiteral("engine/skipCertVerify"), false).toBool();

    core.controlApiHost = settings.value(QStringLiteral("controlApi/host"), core.controlApiHost).toString().trimmed();
    core.controlApiPort = static_cast<quint16>(
        settings.value(QStringLiteral("controlApi/port"), core.controlApiPort).toUInt());
    core.controlApiSecret = settings.value(QStringLiteral("controlApi/secret")).toString();

    core.engineExecutablePath = settings.value(QStringLiteral("engine/executablePath")).toString().trimmed();
    const QString invocation = settings.value(QStringLiteral("engine/invocation"), QStringLiteral("run-c")).toString();
    core.invocation = invocation == QStringLiteral("config")
        ? EngineInvocation::DashConfig
        : EngineInvocation::RunDashC;
    core.userAgent = settings.value(QStringLiteral("subscription/userAgent"), core.userAgent).toString().trimmed();

    if (core.inboundPort == 0) {
        core.inboundPort = 2080;
    }
    if (core.controlApiPort == 0) {
        core.controlApiPort = 9090;
    }
    return core;
}

void CoreSettings::save(QSettings& settings) const
{
    settings.setValue(QStringLiteral("inbound/address"), inboundAddress);
    settings.setValue(QStringLiteral("inbound/port"), inboundPort);
    settings.setValue(QStringLiteral("engine/logLevel"), logLevel);
    settings.setValue(QStringLiteral("engine/skipCertVerify"), skipCertVerify);
    settings.setValue(QStringLiteral("controlApi/host"), controlApiHost);
    settings.setValue(QStringLiteral("controlApi/port"), controlApiPort);
    settings.setValue(QStringLiteral("controlApi/secret"), controlApiSecret);
    settings.setValue(QStringLiteral("engine/executablePath"), engineExecutablePath);
    settings.setValue(QStringLiteral("engine/invocation"),
                      invocation == EngineInvocation::DashConfig ? QStringLiteral("config") : QStringLiteral("run-c"));
    settings.setValue(QStringLiteral("subscription/userAgent"), userAgent);
}
