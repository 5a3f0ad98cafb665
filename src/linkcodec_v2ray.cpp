module;
#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <QUrl>
#include <QUrlQuery>

#include <optional>

module boxlink.core.linkcodec;

namespace {
constexpr int kDefaultTlsPort = 443;
constexpr int kMaxPort = 65535;

QString jsonText(const QJsonObject& obj, const QString& key)
{
    const QJsonValue value = obj.value(key);
    if (value.isDouble()) {
        return QString::number(value.toInteger());
    }
    return value.toString().trimmed();
}

int jsonInt(const QJsonObject& obj, const QString& key, int fallback)
{
    const QJsonValue value = obj.value(key);
    if (value.isDouble()) {
        return value.toInt(fallback);
    }
    bool ok = false;
    const int parsed = value.toString().trimmed().toInt(&ok);
    return ok ? parsed : fallback;
}

QString linkName(const QUrl& url)
{
    return url.fragment(QUrl::FullyDecoded).trimmed();
}
}

std::optional<ProxyProfile> LinkCodec::parseVless(const QString& link, QString *errorMessage)
{
    const QUrl url(link);
    if (!url.isValid() || url.host().isEmpty()) {
        setError(errorMessage, QStringLiteral("VLESS link has no server address."));
        return std::nullopt;
    }

    ProxyProfile profile = ProxyProfile::create(ProxyType::Vless);
    profile.name = linkName(url);
    profile.serverAddress = url.host();
    profile.serverPort = static_cast<quint16>(url.port(kDefaultTlsPort));

    const QUrlQuery query(url);
    auto *vless = profile.as<VlessSettings>();
    vless->uuid = url.userName(QUrl::FullyDecoded).trimmed();
    vless->flow = query.queryItemValue(QStringLiteral("flow"), QUrl::FullyDecoded).trimmed();
    const QString encryption = query.queryItemValue(QStringLiteral("encryption"), QUrl::FullyDecoded).trimmed();
    if (!encryption.isEmpty()) {
        vless->encryption = encryption;
    }

    applyStreamQuery(query, *profile.transport, ProxyType::Vless);

    if (!profile.isValid()) {
        setError(errorMessage, QStringLiteral("VLESS link is missing required fields."));
        return std::nullopt;
    }
    return profile;
}

std::optional<ProxyProfile> LinkCodec::parseTrojan(const QString& link, QString *errorMessage)
{
    const QUrl url(link);
    if (!url.isValid() || url.host().isEmpty()) {
        setError(errorMessage, QStringLiteral("Trojan link has no server address."));
        return std::nullopt;
    }

    ProxyProfile profile = ProxyProfile::create(ProxyType::Trojan);
    profile.name = linkName(url);
    profile.serverAddress = url.host();
    profile.serverPort = static_cast<quint16>(url.port(kDefaultTlsPort));

    // Passwords may legitimately contain ':'; keep the whole userinfo.
    profile.as<TrojanSettings>()->password = url.userInfo(QUrl::FullyDecoded);

    const QUrlQuery query(url);
    applyStreamQuery(query, *profile.transport, ProxyType::Trojan);

    if (!profile.isValid()) {
        setError(errorMessage, QStringLiteral("Trojan link is missing required fields."));
        return std::nullopt;
    }
    return profile;
}

std::optional<ProxyProfile> LinkCodec::parseVmess(const QString& link, QString *errorMessage)
{
    QString payload = link.mid(link.indexOf(QStringLiteral("://")) + 3).trimmed();
    QString fragmentName;

    const int fragmentIdx = payload.indexOf(QLatin1Char('#'));
    if (fragmentIdx >= 0) {
        fragmentName = percentDecode(payload.mid(fragmentIdx + 1)).trimmed();
        payload = payload.left(fragmentIdx);
    }

    if (!payload.contains(QLatin1Char('@'))) {
        QString legacyError;
        auto legacy = parseLegacyVmess(payload, fragmentName, &legacyError);
        if (!legacyError.isEmpty()) {
            setError(errorMessage, legacyError);
            return std::nullopt;
        }
        if (legacy.has_value()) {
            if (!legacy->isValid()) {
                setError(errorMessage, QStringLiteral("VMess link is missing required fields."));
                return std::nullopt;
            }
            return legacy;
        }
    }

    const QUrl url(QStringLiteral("vmess://") + payload);
    if (!url.isValid() || url.host().isEmpty()) {
        setError(errorMessage, QStringLiteral("VMess link is neither base64 JSON nor a URL."));
        return std::nullopt;
    }

    ProxyProfile profile = ProxyProfile::create(ProxyType::Vmess);
    profile.name = fragmentName;
    profile.serverAddress = url.host();
    profile.serverPort = static_cast<quint16>(url.port(kDefaultTlsPort));

    const QUrlQuery query(url);
    auto *vmess = profile.as<VmessSettings>();
    vmess->uuid = url.userName(QUrl::FullyDecoded).trimmed();
    const QString cipher = query.queryItemValue(QStringLiteral("encryption"), QUrl::FullyDecoded).trimmed();
    if (!cipher.isEmpty()) {
        vmess->security = cipher;
    }
    bool ok = false;
    const int alterId = query.queryItemValue(QStringLiteral("aid")).toInt(&ok);
    if (ok && alterId > 0) {
        vmess->alterId = alterId;
    }

    applyStreamQuery(query, *profile.transport, ProxyType::Vmess);

    if (!profile.isValid()) {
        setError(errorMessage, QStringLiteral("VMess link is missing required fields."));
        return std::nullopt;
    }
    return profile;
}

std::optional<ProxyProfile> LinkCodec::parseLegacyVmess(const QString& payload, const QString& fallbackName,
                                                        QString *errorMessage)
{
    const QByteArray decoded = decodeFlexibleBase64(payload);
    if (decoded.isEmpty()) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(decoded, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }

    const QJsonObject obj = doc.object();

    ProxyProfile profile = ProxyProfile::create(ProxyType::Vmess);
    profile.name = jsonText(obj, QStringLiteral("ps"));
    if (profile.name.isEmpty()) {
        profile.name = fallbackName;
    }
    profile.serverAddress = jsonText(obj, QStringLiteral("add"));
    const int port = jsonInt(obj, QStringLiteral("port"), kDefaultTlsPort);
    if (port < 1 || port > kMaxPort) {
        setError(errorMessage, QStringLiteral("VMess link has an invalid port: %1").arg(port));
        return std::nullopt;
    }
    profile.serverPort = static_cast<quint16>(port);

    auto *vmess = profile.as<VmessSettings>();
    vmess->uuid = jsonText(obj, QStringLiteral("id"));
    vmess->alterId = jsonInt(obj, QStringLiteral("aid"), 0);
    const QString cipher = jsonText(obj, QStringLiteral("scy"));
    if (!cipher.isEmpty()) {
        vmess->security = cipher;
    }

    TransportSettings& transport = *profile.transport;
    QString network = jsonText(obj, QStringLiteral("net")).toLower();
    if (network == QStringLiteral("h2")) {
        network = QStringLiteral("http");
    }
    if (!network.isEmpty()) {
        transport.network = network;
    }

    transport.host = jsonText(obj, QStringLiteral("host"));
    transport.path = jsonText(obj, QStringLiteral("path"));
    transport.sni = jsonText(obj, QStringLiteral("sni"));
    transport.alpn = jsonText(obj, QStringLiteral("alpn"));
    transport.utlsFingerprint = jsonText(obj, QStringLiteral("fp"));

    const QString headerType = jsonText(obj, QStringLiteral("type")).toLower();
    if (transport.network == QStringLiteral("tcp") && headerType != QStringLiteral("none")) {
        transport.headerType = headerType;
    }

    const QString tls = jsonText(obj, QStringLiteral("tls")).toLower();
    transport.security = (tls == QStringLiteral("tls") || tls == QStringLiteral("reality"))
        ? QStringLiteral("tls")
        : QString();

    return profile;
}

QString LinkCodec::serializeVless(const ProxyProfile& profile)
{
    const auto *vless = profile.as<VlessSettings>();
    QueryItems items;
    items.append({QStringLiteral("encryption"), vless->encryption});
    items.append({QStringLiteral("flow"), vless->flow});
    if (profile.transport.has_value()) {
        appendStreamQuery(profile.transport.value(), items);
    }
    return buildLink(QStringLiteral("vless"), percentEncode(vless->uuid), profile, items);
}

QString LinkCodec::serializeTrojan(const ProxyProfile& profile)
{
    const auto *trojan = profile.as<TrojanSettings>();
    QueryItems items;
    if (profile.transport.has_value()) {
        appendStreamQuery(profile.transport.value(), items);
    }
    return buildLink(QStringLiteral("trojan"), percentEncode(trojan->password), profile, items);
}

QString LinkCodec::serializeVmess(const ProxyProfile& profile)
{
    const auto *vmess = profile.as<VmessSettings>();
    QueryItems items;
    items.append({QStringLiteral("encryption"), vmess->security});
    if (vmess->alterId > 0) {
        items.append({QStringLiteral("aid"), QString::number(vmess->alterId)});
    }
    if (profile.transport.has_value()) {
        appendStreamQuery(profile.transport.value(), items);
    } else {
        items.append({QStringLiteral("security"), QStringLiteral("none")});
    }
    return buildLink(QStringLiteral("vmess"), percentEncode(vmess->uuid), profile, items);
}

QString LinkCodec::toLegacyVmessLink(const ProxyProfile& profile)
{
    const auto *vmess = profile.as<VmessSettings>();
    if (!vmess) {
        return QString();
    }

    const TransportSettings transport = profile.transport.value_or(TransportSettings {});

    QJsonObject obj;
    obj[QStringLiteral("v")] = QStringLiteral("2");
    obj[QStringLiteral("ps")] = profile.name;
    obj[QStringLiteral("add")] = profile.serverAddress;
    obj[QStringLiteral("port")] = QString::number(profile.serverPort);
    obj[QStringLiteral("id")] = vmess->uuid;
    obj[QStringLiteral("aid")] = QString::number(vmess->alterId);
    obj[QStringLiteral("scy")] = vmess->security;
    obj[QStringLiteral("net")] = transport.network;
    obj[QStringLiteral("type")] = transport.headerType.isEmpty() ? QStringLiteral("none") : transport.headerType;
    obj[QStringLiteral("host")] = transport.host;
    obj[QStringLiteral("path")] = transport.path;
    obj[QStringLiteral("tls")] = transport.hasTls() ? QStringLiteral("tls") : QString();
    obj[QStringLiteral("sni")] = transport.sni;
    obj[QStringLiteral("alpn")] = transport.alpn;
    obj[QStringLiteral("fp")] = transport.utlsFingerprint;

    const QByteArray json = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    return QStringLiteral("vmess://") + QString::fromLatin1(json.toBase64());
}
