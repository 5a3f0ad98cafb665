module;
#include <QHostAddress>
#include <QJsonObject>
#include <QString>

#include <optional>
#include <variant>

module boxlink.core.proxyprofile;

namespace {
constexpr int kMaxPort = 65535;

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

QString readString(const QJsonObject& json, const QString& key, const QString& fallback = QString())
{
    const QJsonValue value = json.value(key);
    return value.isString() ? value.toString() : fallback;
}

QJsonObject settingsToJson(const ProtocolSettings& settings)
{
    return std::visit(Overloaded {
        [](const VlessSettings& s) {
            QJsonObject json;
            json[QStringLiteral("uuid")] = s.uuid;
            json[QStringLiteral("flow")] = s.flow;
            json[QStringLiteral("encryption")] = s.encryption;
            return json;
        },
        [](const TrojanSettings& s) {
            QJsonObject json;
            json[QStringLiteral("password")] = s.password;
            return json;
        },
        [](const VmessSettings& s) {
            QJsonObject json;
            json[QStringLiteral("uuid")] = s.uuid;
            json[QStringLiteral("alterId")] = s.alterId;
            json[QStringLiteral("security")] = s.security;
            return json;
        },
        [](const ShadowsocksSettings& s) {
            QJsonObject json;
            json[QStringLiteral("method")] = s.method;
            json[QStringLiteral("password")] = s.password;
            json[QStringLiteral("plugin")] = s.plugin;
            json[QStringLiteral("uotVersion")] = s.uotVersion;
            return json;
        },
        [](const SocksSettings& s) {
            QJsonObject json;
            json[QStringLiteral("username")] = s.username;
            json[QStringLiteral("password")] = s.password;
            json[QStringLiteral("version")] = socksVersionName(s.version);
            return json;
        },
        [](const HttpSettings& s) {
            QJsonObject json;
            json[QStringLiteral("username")] = s.username;
            json[QStringLiteral("password")] = s.password;
            return json;
        },
    }, settings);
}

void settingsFromJson(ProtocolSettings& settings, const QJsonObject& json)
{
    std::visit(Overloaded {
        [&json](VlessSettings& s) {
            s.uuid = readString(json, QStringLiteral("uuid"));
            s.flow = readString(json, QStringLiteral("flow"));
            s.encryption = readString(json, QStringLiteral("encryption"), QStringLiteral("none"));
        },
        [&json](TrojanSettings& s) {
            s.password = readString(json, QStringLiteral("password"));
        },
        [&json](VmessSettings& s) {
            s.uuid = readString(json, QStringLiteral("uuid"));
            s.alterId = json.value(QStringLiteral("alterId")).toInt(0);
            s.security = readString(json, QStringLiteral("security"), QStringLiteral("auto"));
        },
        [&json](ShadowsocksSettings& s) {
            s.method = readString(json, QStringLiteral("method"));
            s.password = readString(json, QStringLiteral("password"));
            s.plugin = readString(json, QStringLiteral("plugin"));
            s.uotVersion = json.value(QStringLiteral("uotVersion")).toInt(0);
        },
        [&json](SocksSettings& s) {
            s.username = readString(json, QStringLiteral("username"));
            s.password = readString(json, QStringLiteral("password"));
            const QString version = readString(json, QStringLiteral("version"), QStringLiteral("5"));
            if (version == QStringLiteral("4")) {
                s.version = SocksVersion::V4;
            } else if (version == QStringLiteral("4a")) {
                s.version = SocksVersion::V4a;
            } else {
                s.version = SocksVersion::V5;
            }
        },
        [&json](HttpSettings& s) {
            s.username = readString(json, QStringLiteral("username"));
            s.password = readString(json, QStringLiteral("password"));
        },
    }, settings);
}
}

QString proxyTypeName(ProxyType type)
{
    switch (type) {
    case ProxyType::Vless:
        return QStringLiteral("vless");
    case ProxyType::Trojan:
        return QStringLiteral("trojan");
    case ProxyType::Vmess:
        return QStringLiteral("vmess");
    case ProxyType::Shadowsocks:
        return QStringLiteral("shadowsocks");
    case ProxyType::Socks:
        return QStringLiteral("socks");
    case ProxyType::Http:
        return QStringLiteral("http");
    }
    return QString();
}

std::optional<ProxyType> proxyTypeFromName(const QString& name)
{
    const QString normalized = name.trimmed().toLower();
    for (const ProxyType type : {ProxyType::Vless, ProxyType::Trojan, ProxyType::Vmess,
                                 ProxyType::Shadowsocks, ProxyType::Socks, ProxyType::Http}) {
        if (proxyTypeName(type) == normalized) {
            return type;
        }
    }
    return std::nullopt;
}

QString socksVersionName(SocksVersion version)
{
    switch (version) {
    case SocksVersion::V4:
        return QStringLiteral("4");
    case SocksVersion::V4a:
        return QStringLiteral("4a");
    case SocksVersion::V5:
        return QStringLiteral("5");
    }
    return QStringLiteral("5");
}

bool TransportSettings::hasTls() const
{
    return security == QStringLiteral("tls") || security == QStringLiteral("reality");
}

QJsonObject TransportSettings::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("network")] = network;
    json[QStringLiteral("path")] = path;
    json[QStringLiteral("host")] = host;
    json[QStringLiteral("headerType")] = headerType;

    json[QStringLiteral("security")] = security;
    json[QStringLiteral("sni")] = sni;
    json[QStringLiteral("alpn")] = alpn;
    json[QStringLiteral("allowInsecure")] = allowInsecure;
    json[QStringLiteral("certificate")] = certificate;
    json[QStringLiteral("utlsFingerprint")] = utlsFingerprint;

    json[QStringLiteral("realityPublicKey")] = realityPublicKey;
    json[QStringLiteral("realityShortId")] = realityShortId;
    json[QStringLiteral("realitySpiderX")] = realitySpiderX;

    json[QStringLiteral("wsEarlyDataLength")] = wsEarlyDataLength;
    json[QStringLiteral("wsEarlyDataHeaderName")] = wsEarlyDataHeaderName;
    json[QStringLiteral("packetEncoding")] = packetEncoding;
    return json;
}

TransportSettings TransportSettings::fromJson(const QJsonObject& json)
{
    TransportSettings settings;
    settings.network = readString(json, QStringLiteral("network"), settings.network).toLower();
    settings.path = readString(json, QStringLiteral("path"));
    settings.host = readString(json, QStringLiteral("host"));
    settings.headerType = readString(json, QStringLiteral("headerType")).toLower();

    settings.security = readString(json, QStringLiteral("security")).toLower();
    settings.sni = readString(json, QStringLiteral("sni"));
    settings.alpn = readString(json, QStringLiteral("alpn"));
    settings.allowInsecure = json.value(QStringLiteral("allowInsecure")).toBool(false);
    settings.certificate = readString(json, QStringLiteral("certificate"));
    settings.utlsFingerprint = readString(json, QStringLiteral("utlsFingerprint"));

    settings.realityPublicKey = readString(json, QStringLiteral("realityPublicKey"));
    settings.realityShortId = readString(json, QStringLiteral("realityShortId"));
    settings.realitySpiderX = readString(json, QStringLiteral("realitySpiderX"));

    settings.wsEarlyDataLength = json.value(QStringLiteral("wsEarlyDataLength")).toInt(0);
    settings.wsEarlyDataHeaderName = readString(json, QStringLiteral("wsEarlyDataHeaderName"),
                                                settings.wsEarlyDataHeaderName);
    settings.packetEncoding = readString(json, QStringLiteral("packetEncoding"), settings.packetEncoding);
    return settings;
}

ProxyProfile ProxyProfile::create(ProxyType type)
{
    ProxyProfile profile;
    switch (type) {
    case ProxyType::Vless:
        profile.settings = VlessSettings {};
        break;
    case ProxyType::Trojan:
        profile.settings = TrojanSettings {};
        break;
    case ProxyType::Vmess:
        profile.settings = VmessSettings {};
        break;
    case ProxyType::Shadowsocks:
        profile.settings = ShadowsocksSettings {};
        break;
    case ProxyType::Socks:
        profile.settings = SocksSettings {};
        break;
    case ProxyType::Http:
        profile.settings = HttpSettings {};
        break;
    }

    profile.transport = TransportSettings {};
    if (type == ProxyType::Trojan) {
        profile.transport->security = QStringLiteral("tls");
    }
    return profile;
}

ProxyType ProxyProfile::type() const
{
    return static_cast<ProxyType>(settings.index());
}

QString ProxyProfile::displayAddress() const
{
    return formatAddress(serverAddress, serverPort);
}

QString ProxyProfile::displayName() const
{
    const QString trimmed = name.trimmed();
    return trimmed.isEmpty() ? displayAddress() : trimmed;
}

QString ProxyProfile::displayTypeAndName() const
{
    return QStringLiteral("[%1] %2").arg(proxyTypeName(type()).toUpper(), displayName());
}

bool ProxyProfile::isValid() const
{
    if (serverAddress.trimmed().isEmpty() || serverPort == 0) {
        return false;
    }

    return std::visit(Overloaded {
        [](const VlessSettings& s) { return !s.uuid.trimmed().isEmpty(); },
        [](const TrojanSettings& s) { return !s.password.isEmpty(); },
        [](const VmessSettings& s) { return !s.uuid.trimmed().isEmpty(); },
        [](const ShadowsocksSettings& s) { return !s.method.trimmed().isEmpty() && !s.password.isEmpty(); },
        [](const SocksSettings&) { return true; },
        [](const HttpSettings&) { return true; },
    }, settings);
}

QJsonObject ProxyProfile::toJson() const
{
    QJsonObject bean = settingsToJson(settings);
    bean[QStringLiteral("name")] = name;
    bean[QStringLiteral("serverAddress")] = serverAddress;
    bean[QStringLiteral("serverPort")] = static_cast<int>(serverPort);
    if (transport.has_value()) {
        bean[QStringLiteral("stream")] = transport->toJson();
    }

    QJsonObject json;
    json[QStringLiteral("type")] = proxyTypeName(type());
    json[QStringLiteral("id")] = id;
    json[QStringLiteral("groupId")] = groupId;
    json[QStringLiteral("bean")] = bean;
    return json;
}

std::optional<ProxyProfile> ProxyProfile::fromJson(const QJsonObject& json)
{
    const auto type = proxyTypeFromName(json.value(QStringLiteral("type")).toString());
    if (!type.has_value()) {
        return std::nullopt;
    }

    ProxyProfile profile = create(type.value());
    profile.id = json.value(QStringLiteral("id")).toInt(-1);
    profile.groupId = json.value(QStringLiteral("groupId")).toInt(0);

    const QJsonObject bean = json.value(QStringLiteral("bean")).toObject();
    profile.name = readString(bean, QStringLiteral("name"));
    profile.serverAddress = readString(bean, QStringLiteral("serverAddress")).trimmed();
    const int port = bean.value(QStringLiteral("serverPort")).toInt();
    if (port < 0 || port > kMaxPort) {
        return std::nullopt;
    }
    profile.serverPort = static_cast<quint16>(port);
    settingsFromJson(profile.settings, bean);

    if (bean.value(QStringLiteral("stream")).isObject()) {
        profile.transport = TransportSettings::fromJson(bean.value(QStringLiteral("stream")).toObject());
    } else {
        profile.transport.reset();
    }

    return profile;
}

bool isIpAddress(const QString& value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return false;
    }
    QHostAddress address;
    return address.setAddress(trimmed);
}

QString formatAddress(const QString& host, quint16 port)
{
    if (host.contains(QLatin1Char(':')) && !host.startsWith(QLatin1Char('['))) {
        return QStringLiteral("[%1]:%2").arg(host).arg(port);
    }
    return QStringLiteral("%1:%2").arg(host).arg(port);
}
