module;
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QUrlQuery>

#include <optional>

module boxlink.core.linkcodec;

namespace {
constexpr int kDefaultSocksPort = 1080;
constexpr int kDefaultHttpPort = 80;
constexpr int kDefaultHttpsPort = 443;

bool isShadowsocks2022(const QString& method)
{
    return method.startsWith(QStringLiteral("2022-"), Qt::CaseInsensitive);
}

void applyTlsQuery(const QUrlQuery& query, TransportSettings& transport)
{
    if (query.hasQueryItem(QStringLiteral("security"))) {
        const QString security = query.queryItemValue(QStringLiteral("security")).trimmed().toLower();
        transport.security = (security == QStringLiteral("tls") || security == QStringLiteral("reality"))
            ? QStringLiteral("tls")
            : QString();
    }
    const QString sni = query.queryItemValue(QStringLiteral("sni"), QUrl::FullyDecoded).trimmed();
    if (!sni.isEmpty()) {
        transport.sni = sni;
    }
}
}

std::optional<ProxyProfile> LinkCodec::parseShadowsocks(const QString& link, QString *errorMessage)
{
    QString body = link.mid(link.indexOf(QStringLiteral("://")) + 3).trimmed();

    ProxyProfile profile = ProxyProfile::create(ProxyType::Shadowsocks);
    auto *ss = profile.as<ShadowsocksSettings>();

    const int fragmentIdx = body.indexOf(QLatin1Char('#'));
    if (fragmentIdx >= 0) {
        profile.name = percentDecode(body.mid(fragmentIdx + 1)).trimmed();
        body = body.left(fragmentIdx);
    }

    QString queryText;
    const int queryIdx = body.indexOf(QLatin1Char('?'));
    if (queryIdx >= 0) {
        queryText = body.mid(queryIdx + 1);
        body = body.left(queryIdx);
    }
    while (body.endsWith(QLatin1Char('/'))) {
        body.chop(1);
    }

    QString userInfo;
    QString endpoint;
    bool userInfoDecoded = false;

    // Legacy dialect: the whole body is base64(method:password@host:port).
    if (!body.contains(QLatin1Char('@'))) {
        const auto decoded = decodeBase64Text(body);
        if (!decoded.has_value() || !decoded->contains(QLatin1Char('@'))) {
            setError(errorMessage, QStringLiteral("Shadowsocks link is neither base64 nor a URL."));
            return std::nullopt;
        }
        const int at = decoded->lastIndexOf(QLatin1Char('@'));
        userInfo = decoded->left(at);
        endpoint = decoded->mid(at + 1);
        userInfoDecoded = true;
    } else {
        const int at = body.lastIndexOf(QLatin1Char('@'));
        userInfo = body.left(at);
        endpoint = body.mid(at + 1);
    }

    QString host;
    int port = -1;
    if (!splitHostPort(endpoint, &host, &port) || port <= 0) {
        setError(errorMessage, QStringLiteral("Shadowsocks link has no valid server endpoint."));
        return std::nullopt;
    }
    profile.serverAddress = host;
    profile.serverPort = static_cast<quint16>(port);

    if (userInfoDecoded) {
        const int colon = userInfo.indexOf(QLatin1Char(':'));
        if (colon <= 0) {
            setError(errorMessage, QStringLiteral("Shadowsocks link has no method:password pair."));
            return std::nullopt;
        }
        ss->method = userInfo.left(colon);
        ss->password = userInfo.mid(colon + 1);
    } else if (userInfo.contains(QLatin1Char(':'))) {
        const int colon = userInfo.indexOf(QLatin1Char(':'));
        ss->method = percentDecode(userInfo.left(colon));
        const QString rawPassword = percentDecode(userInfo.mid(colon + 1));
        if (isShadowsocks2022(ss->method)) {
            ss->password = rawPassword;
        } else {
            ss->password = decodeBase64Text(rawPassword).value_or(rawPassword);
        }
    } else {
        const auto decoded = decodeBase64Text(percentDecode(userInfo));
        const int colon = decoded.has_value() ? decoded->indexOf(QLatin1Char(':')) : -1;
        if (colon <= 0) {
            setError(errorMessage, QStringLiteral("Shadowsocks userinfo is not base64(method:password)."));
            return std::nullopt;
        }
        ss->method = decoded->left(colon);
        ss->password = decoded->mid(colon + 1);
    }
    ss->method = ss->method.trimmed().toLower();

    if (!queryText.isEmpty()) {
        const QUrlQuery query(queryText);
        ss->plugin = query.queryItemValue(QStringLiteral("plugin"), QUrl::FullyDecoded).trimmed();

        QString uot = query.queryItemValue(QStringLiteral("uot")).trimmed();
        if (uot.isEmpty()) {
            uot = query.queryItemValue(QStringLiteral("udp-over-tcp")).trimmed();
        }
        bool ok = false;
        const int uotVersion = uot.toInt(&ok);
        if (ok && uotVersion > 0) {
            ss->uotVersion = uotVersion;
        } else if (isTruthy(uot)) {
            ss->uotVersion = 2;
        }
    }

    if (!profile.isValid()) {
        setError(errorMessage, QStringLiteral("Shadowsocks link is missing required fields."));
        return std::nullopt;
    }
    return profile;
}

std::optional<ProxyProfile> LinkCodec::parseSocks(const QString& link, QString *errorMessage)
{
    const QUrl url(link);
    if (!url.isValid() || url.host().isEmpty()) {
        setError(errorMessage, QStringLiteral("SOCKS link has no server address."));
        return std::nullopt;
    }

    ProxyProfile profile = ProxyProfile::create(ProxyType::Socks);
    auto *socks = profile.as<SocksSettings>();

    const QString scheme = url.scheme().toLower();
    if (scheme == QStringLiteral("socks4")) {
        socks->version = SocksVersion::V4;
    } else if (scheme == QStringLiteral("socks4a")) {
        socks->version = SocksVersion::V4a;
    } else {
        socks->version = SocksVersion::V5;
    }

    profile.name = url.fragment(QUrl::FullyDecoded).trimmed();
    profile.serverAddress = url.host();
    profile.serverPort = static_cast<quint16>(url.port(kDefaultSocksPort));
    socks->username = url.userName(QUrl::FullyDecoded);
    socks->password = url.password(QUrl::FullyDecoded);

    // Legacy dialect: a single userinfo slot carrying base64("user:pass").
    if (socks->password.isEmpty() && !socks->username.isEmpty()) {
        const auto decoded = decodeBase64Text(socks->username);
        if (decoded.has_value() && decoded->contains(QLatin1Char(':'))) {
            const int colon = decoded->indexOf(QLatin1Char(':'));
            socks->username = decoded->left(colon);
            socks->password = decoded->mid(colon + 1);
        }
    }

    applyTlsQuery(QUrlQuery(url), *profile.transport);

    if (!profile.isValid()) {
        setError(errorMessage, QStringLiteral("SOCKS link is missing required fields."));
        return std::nullopt;
    }
    return profile;
}

std::optional<ProxyProfile> LinkCodec::parseHttp(const QString& link, QString *errorMessage)
{
    const QUrl url(link);
    if (!url.isValid() || url.host().isEmpty()) {
        setError(errorMessage, QStringLiteral("HTTP link has no server address."));
        return std::nullopt;
    }

    ProxyProfile profile = ProxyProfile::create(ProxyType::Http);
    auto *http = profile.as<HttpSettings>();

    const bool secure = url.scheme().compare(QStringLiteral("https"), Qt::CaseInsensitive) == 0;
    profile.name = url.fragment(QUrl::FullyDecoded).trimmed();
    profile.serverAddress = url.host();
    profile.serverPort = static_cast<quint16>(url.port(secure ? kDefaultHttpsPort : kDefaultHttpPort));
    http->username = url.userName(QUrl::FullyDecoded);
    http->password = url.password(QUrl::FullyDecoded);

    if (secure) {
        profile.transport->security = QStringLiteral("tls");
    }
    applyTlsQuery(QUrlQuery(url), *profile.transport);

    if (!profile.isValid()) {
        setError(errorMessage, QStringLiteral("HTTP link is missing required fields."));
        return std::nullopt;
    }
    return profile;
}

QString LinkCodec::serializeShadowsocks(const ProxyProfile& profile)
{
    const auto *ss = profile.as<ShadowsocksSettings>();

    QString userInfo;
    if (isShadowsocks2022(ss->method)) {
        userInfo = percentEncode(ss->method) + QLatin1Char(':') + percentEncode(ss->password);
    } else {
        const QByteArray methodPassword = (ss->method + QLatin1Char(':') + ss->password).toUtf8();
        userInfo = QString::fromLatin1(methodPassword.toBase64(
            QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals));
    }

    QueryItems items;
    items.append({QStringLiteral("plugin"), ss->plugin});
    if (ss->uotVersion > 0) {
        items.append({QStringLiteral("uot"), QString::number(ss->uotVersion)});
    }
    return buildLink(QStringLiteral("ss"), userInfo, profile, items);
}

QString LinkCodec::serializeSocks(const ProxyProfile& profile)
{
    const auto *socks = profile.as<SocksSettings>();

    QString scheme = QStringLiteral("socks5");
    if (socks->version == SocksVersion::V4) {
        scheme = QStringLiteral("socks4");
    } else if (socks->version == SocksVersion::V4a) {
        scheme = QStringLiteral("socks4a");
    }

    QString userInfo = percentEncode(socks->username);
    if (!socks->password.isEmpty()) {
        userInfo += QLatin1Char(':') + percentEncode(socks->password);
    }

    QueryItems items;
    if (profile.transport.has_value() && profile.transport->hasTls()) {
        items.append({QStringLiteral("security"), QStringLiteral("tls")});
        items.append({QStringLiteral("sni"), profile.transport->sni});
    }
    return buildLink(scheme, userInfo, profile, items);
}

QString LinkCodec::serializeHttp(const ProxyProfile& profile)
{
    const auto *http = profile.as<HttpSettings>();
    const bool secure = profile.transport.has_value() && profile.transport->hasTls();

    QString userInfo = percentEncode(http->username);
    if (!http->password.isEmpty()) {
        userInfo += QLatin1Char(':') + percentEncode(http->password);
    }

    QueryItems items;
    if (secure) {
        items.append({QStringLiteral("sni"), profile.transport->sni});
    }
    return buildLink(secure ? QStringLiteral("https") : QStringLiteral("http"), userInfo, profile, items);
}
