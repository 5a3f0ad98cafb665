module;
#include <QByteArray>
#include <QList>
#include <QPair>
#include <QRegularExpression>
#include <QString>
#include <QStringDecoder>
#include <QStringList>
#include <QUrl>
#include <QUrlQuery>

#include <array>
#include <optional>

module boxlink.core.linkcodec;

namespace {
const QString kDefaultEarlyDataHeader = QStringLiteral("Sec-WebSocket-Protocol");

QString queryValue(const QUrlQuery& query, const QString& key)
{
    return query.queryItemValue(key, QUrl::FullyDecoded).trimmed();
}
}

std::optional<ProxyProfile> LinkCodec::parseLink(const QString& text, QString *errorMessage)
{
    const QString link = text.trimmed();
    if (link.isEmpty()) {
        setError(errorMessage, QStringLiteral("Link is empty."));
        return std::nullopt;
    }

    const auto type = detectLinkType(link);
    if (!type.has_value()) {
        setError(errorMessage, QStringLiteral("Not a share link."));
        return std::nullopt;
    }

    auto profile = protocolEntry(type.value()).parse(link, errorMessage);
    if (profile.has_value()) {
        profile->id = -1;
    }
    return profile;
}

std::optional<ProxyType> LinkCodec::detectLinkType(const QString& text)
{
    const QString link = text.trimmed();
    for (const SchemeEntry& entry : schemeRegistry()) {
        if (link.startsWith(entry.prefix, Qt::CaseInsensitive)) {
            return entry.type;
        }
    }
    return std::nullopt;
}

QString LinkCodec::toShareLink(const ProxyProfile& profile)
{
    return protocolEntry(profile.type()).serialize(profile);
}

QList<ProxyProfile> LinkCodec::parseSubscriptionContent(const QString& content)
{
    QString body = content.trimmed();

    // Whole-body base64 is usually line wrapped; decode it once.
    QString compact = body;
    compact.remove(QRegularExpression(QStringLiteral("\\s+")));
    if (!compact.isEmpty() && !compact.contains(QStringLiteral("://"))) {
        const auto decoded = decodeBase64Text(compact);
        if (decoded.has_value()) {
            body = decoded.value();
        }
    }

    QList<ProxyProfile> profiles;
    const QStringList lines = body.split(QRegularExpression(QStringLiteral("[\\r\\n]+")), Qt::SkipEmptyParts);
    for (const QString& rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }

        auto profile = parseLink(line);
        if (profile.has_value()) {
            profiles.append(profile.value());
        }
    }
    return profiles;
}

QStringList LinkCodec::supportedSchemes()
{
    QStringList schemes;
    for (const SchemeEntry& entry : schemeRegistry()) {
        schemes.append(entry.prefix);
    }
    return schemes;
}

const QList<LinkCodec::SchemeEntry>& LinkCodec::schemeRegistry()
{
    static const QList<SchemeEntry> registry {
        {QStringLiteral("vless://"), ProxyType::Vless},
        {QStringLiteral("trojan://"), ProxyType::Trojan},
        {QStringLiteral("vmess://"), ProxyType::Vmess},
        {QStringLiteral("ss://"), ProxyType::Shadowsocks},
        {QStringLiteral("socks://"), ProxyType::Socks},
        {QStringLiteral("socks4://"), ProxyType::Socks},
        {QStringLiteral("socks4a://"), ProxyType::Socks},
        {QStringLiteral("socks5://"), ProxyType::Socks},
        {QStringLiteral("http://"), ProxyType::Http},
        {QStringLiteral("https://"), ProxyType::Http},
    };
    return registry;
}

const LinkCodec::ProtocolEntry& LinkCodec::protocolEntry(ProxyType type)
{
    static const std::array<ProtocolEntry, 6> entries {{
        {ProxyType::Vless, &LinkCodec::parseVless, &LinkCodec::serializeVless},
        {ProxyType::Trojan, &LinkCodec::parseTrojan, &LinkCodec::serializeTrojan},
        {ProxyType::Vmess, &LinkCodec::parseVmess, &LinkCodec::serializeVmess},
        {ProxyType::Shadowsocks, &LinkCodec::parseShadowsocks, &LinkCodec::serializeShadowsocks},
        {ProxyType::Socks, &LinkCodec::parseSocks, &LinkCodec::serializeSocks},
        {ProxyType::Http, &LinkCodec::parseHttp, &LinkCodec::serializeHttp},
    }};
    return entries[static_cast<std::size_t>(type)];
}

void LinkCodec::applyStreamQuery(const QUrlQuery& query, TransportSettings& transport, ProxyType type)
{
    QString network = queryValue(query, QStringLiteral("type")).toLower();
    if (network.isEmpty()) {
        network = QStringLiteral("tcp");
    } else if (network == QStringLiteral("h2")) {
        network = QStringLiteral("http");
    } else if (network == QStringLiteral("xhttp") && type == ProxyType::Trojan) {
        network = QStringLiteral("http");
    }
    transport.network = network;

    const bool hasSecurity = query.hasQueryItem(QStringLiteral("security"));
    QString security = queryValue(query, QStringLiteral("security")).toLower();
    if (!hasSecurity) {
        // Trojan always runs over TLS; VMess URL links assume TLS when unspecified.
        security = (type == ProxyType::Trojan || type == ProxyType::Vmess) ? QStringLiteral("tls") : QString();
    }
    if (security == QStringLiteral("reality")) {
        security = QStringLiteral("tls");
    } else if (security == QStringLiteral("none")) {
        security.clear();
    }
    transport.security = security;

    transport.sni = queryValue(query, QStringLiteral("sni"));
    if (transport.sni.isEmpty()) {
        transport.sni = queryValue(query, QStringLiteral("peer"));
    }
    transport.alpn = queryValue(query, QStringLiteral("alpn"));
    transport.allowInsecure = isTruthy(queryValue(query, QStringLiteral("allowInsecure")))
        || isTruthy(queryValue(query, QStringLiteral("insecure")));
    transport.utlsFingerprint = queryValue(query, QStringLiteral("fp"));

    transport.realityPublicKey = queryValue(query, QStringLiteral("pbk"));
    transport.realityShortId = queryValue(query, QStringLiteral("sid"));
    transport.realitySpiderX = queryValue(query, QStringLiteral("spx"));

    const QString packetEncoding = queryValue(query, QStringLiteral("packetEncoding"));
    if (!packetEncoding.isEmpty()) {
        transport.packetEncoding = packetEncoding;
    }

    if (network == QStringLiteral("ws") || network == QStringLiteral("httpupgrade")) {
        transport.path = queryValue(query, QStringLiteral("path"));
        transport.host = queryValue(query, QStringLiteral("host"));
        bool ok = false;
        const int earlyData = queryValue(query, QStringLiteral("ed")).toInt(&ok);
        if (ok && earlyData > 0) {
            transport.wsEarlyDataLength = earlyData;
        }
        const QString earlyDataHeader = queryValue(query, QStringLiteral("eh"));
        if (!earlyDataHeader.isEmpty()) {
            transport.wsEarlyDataHeaderName = earlyDataHeader;
        }
    } else if (network == QStringLiteral("http")) {
        transport.path = queryValue(query, QStringLiteral("path"));
        transport.host = queryValue(query, QStringLiteral("host")).replace(QLatin1Char('|'), QLatin1Char(','));
    } else if (network == QStringLiteral("grpc")) {
        transport.path = queryValue(query, QStringLiteral("serviceName"));
    } else if (network == QStringLiteral("tcp")) {
        transport.headerType = queryValue(query, QStringLiteral("headerType")).toLower();
        if (transport.headerType == QStringLiteral("none")) {
            transport.headerType.clear();
        }
        if (transport.headerType == QStringLiteral("http")) {
            transport.path = queryValue(query, QStringLiteral("path"));
            transport.host = queryValue(query, QStringLiteral("host"));
        }
    }
}

void LinkCodec::appendStreamQuery(const TransportSettings& transport, QueryItems& items)
{
    items.append({QStringLiteral("type"), transport.network});

    QString security = transport.security;
    if (!transport.realityPublicKey.isEmpty()) {
        security = QStringLiteral("reality");
    } else if (security.isEmpty()) {
        security = QStringLiteral("none");
    }
    items.append({QStringLiteral("security"), security});

    items.append({QStringLiteral("sni"), transport.sni});
    items.append({QStringLiteral("alpn"), transport.alpn});
    items.append({QStringLiteral("fp"), transport.utlsFingerprint});
    if (transport.allowInsecure) {
        items.append({QStringLiteral("allowInsecure"), QStringLiteral("1")});
    }
    items.append({QStringLiteral("pbk"), transport.realityPublicKey});
    items.append({QStringLiteral("sid"), transport.realityShortId});
    items.append({QStringLiteral("spx"), transport.realitySpiderX});
    if (transport.packetEncoding != QStringLiteral("xudp")) {
        items.append({QStringLiteral("packetEncoding"), transport.packetEncoding});
    }

    const QString& network = transport.network;
    if (network == QStringLiteral("ws") || network == QStringLiteral("httpupgrade")) {
        items.append({QStringLiteral("path"), transport.path});
        items.append({QStringLiteral("host"), transport.host});
        if (transport.wsEarlyDataLength > 0) {
            items.append({QStringLiteral("ed"), QString::number(transport.wsEarlyDataLength)});
        }
        if (transport.wsEarlyDataHeaderName != kDefaultEarlyDataHeader) {
            items.append({QStringLiteral("eh"), transport.wsEarlyDataHeaderName});
        }
    } else if (network == QStringLiteral("http")) {
        items.append({QStringLiteral("path"), transport.path});
        items.append({QStringLiteral("host"), transport.host});
    } else if (network == QStringLiteral("grpc")) {
        items.append({QStringLiteral("serviceName"), transport.path});
    } else if (network == QStringLiteral("tcp") && !transport.headerType.isEmpty()) {
        items.append({QStringLiteral("headerType"), transport.headerType});
        if (transport.headerType == QStringLiteral("http")) {
            items.append({QStringLiteral("path"), transport.path});
            items.append({QStringLiteral("host"), transport.host});
        }
    }
}

QString LinkCodec::buildLink(const QString& scheme, const QString& userInfo,
                             const ProxyProfile& profile, const QueryItems& items)
{
    QString link = scheme + QStringLiteral("://");
    if (!userInfo.isEmpty()) {
        link += userInfo + QLatin1Char('@');
    }
    link += formatAddress(profile.serverAddress, profile.serverPort);

    QStringList pairs;
    for (const auto& item : items) {
        if (item.second.isEmpty()) {
            continue;
        }
        pairs.append(item.first + QLatin1Char('=') + percentEncode(item.second));
    }
    if (!pairs.isEmpty()) {
        link += QLatin1Char('?') + pairs.join(QLatin1Char('&'));
    }

    if (!profile.name.isEmpty()) {
        link += QLatin1Char('#') + percentEncode(profile.name);
    }
    return link;
}

bool LinkCodec::splitHostPort(const QString& text, QString *host, int *port)
{
    const QString endpoint = text.trimmed();
    *port = -1;

    if (endpoint.startsWith(QLatin1Char('['))) {
        const int close = endpoint.indexOf(QLatin1Char(']'));
        if (close < 0) {
            return false;
        }
        *host = endpoint.mid(1, close - 1);
        const QString rest = endpoint.mid(close + 1);
        if (rest.isEmpty()) {
            return !host->isEmpty();
        }
        if (!rest.startsWith(QLatin1Char(':'))) {
            return false;
        }
        bool ok = false;
        *port = rest.mid(1).toInt(&ok);
        return ok && !host->isEmpty() && *port > 0 && *port <= 65535;
    }

    const int colon = endpoint.lastIndexOf(QLatin1Char(':'));
    if (colon < 0) {
        *host = endpoint;
        return !host->isEmpty();
    }

    *host = endpoint.left(colon);
    bool ok = false;
    *port = endpoint.mid(colon + 1).toInt(&ok);
    return ok && !host->isEmpty() && *port > 0 && *port <= 65535;
}

QString LinkCodec::percentEncode(const QString& value)
{
    return QString::fromUtf8(QUrl::toPercentEncoding(value));
}

QString LinkCodec::percentDecode(const QString& value)
{
    return QUrl::fromPercentEncoding(value.toUtf8());
}

QByteArray LinkCodec::decodeFlexibleBase64(const QString& value)
{
    QByteArray raw = value.trimmed().toUtf8();
    raw.replace('-', '+');
    raw.replace('_', '/');
    while (raw.endsWith('=')) {
        raw.chop(1);
    }

    const int padding = raw.size() % 4;
    if (padding == 1) {
        return QByteArray();
    }
    if (padding > 0) {
        raw.append(QByteArray(4 - padding, '='));
    }

    return QByteArray::fromBase64(raw, QByteArray::AbortOnBase64DecodingErrors);
}

std::optional<QString> LinkCodec::decodeBase64Text(const QString& value)
{
    const QByteArray decoded = decodeFlexibleBase64(value);
    if (decoded.isEmpty()) {
        return std::nullopt;
    }

    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString text = decoder.decode(decoded);
    if (decoder.hasError()) {
        return std::nullopt;
    }

    for (const QChar ch : text) {
        if (ch.category() == QChar::Other_Control && ch != QLatin1Char('\n')
            && ch != QLatin1Char('\r') && ch != QLatin1Char('\t')) {
            return std::nullopt;
        }
    }
    return text;
}

bool LinkCodec::isTruthy(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    return normalized == QStringLiteral("1") || normalized == QStringLiteral("true");
}

void LinkCodec::setError(QString *errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}
