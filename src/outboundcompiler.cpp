module;
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

module boxlink.core.outboundcompiler;

namespace {
const QString kEarlyDataMarker = QStringLiteral("?ed=");
const QString kDefaultEarlyDataHeader = QStringLiteral("Sec-WebSocket-Protocol");

QJsonArray splitToArray(const QString& value)
{
    QJsonArray out;
    const QStringList parts = value.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            out.append(trimmed);
        }
    }
    return out;
}

QString normalizeFlow(const QString& flow)
{
    QString out = flow.trimmed();
    if (out.endsWith(QStringLiteral("-udp443"))) {
        out.chop(7);
    } else if (out == QStringLiteral("none")) {
        out.clear();
    }
    return out;
}

QJsonObject buildWebSocketTransport(const TransportSettings& transport)
{
    QJsonObject ws {
        {QStringLiteral("type"), QStringLiteral("ws")}
    };

    if (!transport.host.isEmpty()) {
        ws[QStringLiteral("headers")] = QJsonObject {
            {QStringLiteral("Host"), transport.host}
        };
    }

    // Early data may ride on the path as `/path?ed=2048`.
    QString path = transport.path;
    const int edIdx = path.indexOf(kEarlyDataMarker);
    if (edIdx >= 0) {
        bool ok = false;
        const int length = path.mid(edIdx + kEarlyDataMarker.size()).toInt(&ok);
        path = path.left(edIdx);
        if (ok && length > 0) {
            ws[QStringLiteral("max_early_data")] = length;
            ws[QStringLiteral("early_data_header_name")] = kDefaultEarlyDataHeader;
        }
    }
    if (!path.isEmpty()) {
        ws[QStringLiteral("path")] = path;
    }

    if (transport.wsEarlyDataLength > 0) {
        ws[QStringLiteral("max_early_data")] = transport.wsEarlyDataLength;
        ws[QStringLiteral("early_data_header_name")] = transport.wsEarlyDataHeaderName.isEmpty()
            ? kDefaultEarlyDataHeader
            : transport.wsEarlyDataHeaderName;
    }
    return ws;
}
}

std::optional<QJsonObject> OutboundCompiler::compileTransport(const TransportSettings& transport)
{
    const QString network = transport.network.isEmpty() ? QStringLiteral("tcp") : transport.network;

    if (network == QStringLiteral("tcp")) {
        if (transport.headerType != QStringLiteral("http")) {
            return std::nullopt;
        }
        QJsonObject http {
            {QStringLiteral("type"), QStringLiteral("http")},
            {QStringLiteral("method"), QStringLiteral("GET")}
        };
        if (!transport.path.isEmpty()) {
            http[QStringLiteral("path")] = transport.path;
        }
        if (!transport.host.isEmpty()) {
            http[QStringLiteral("headers")] = QJsonObject {
                {QStringLiteral("Host"), splitToArray(transport.host)}
            };
        }
        return http;
    }

    if (network == QStringLiteral("ws")) {
        return buildWebSocketTransport(transport);
    }

    QJsonObject out {
        {QStringLiteral("type"), network}
    };

    if (network == QStringLiteral("http")) {
        if (!transport.path.isEmpty()) {
            out[QStringLiteral("path")] = transport.path;
        }
        if (!transport.host.isEmpty()) {
            out[QStringLiteral("host")] = splitToArray(transport.host);
        }
    } else if (network == QStringLiteral("grpc")) {
        if (!transport.path.isEmpty()) {
            out[QStringLiteral("service_name")] = transport.path;
        }
    } else if (network == QStringLiteral("httpupgrade")) {
        if (!transport.path.isEmpty()) {
            out[QStringLiteral("path")] = transport.path;
        }
        if (!transport.host.isEmpty()) {
            out[QStringLiteral("host")] = transport.host;
        }
    }

    return out;
}

std::optional<QJsonObject> OutboundCompiler::compileTls(const TransportSettings& transport, bool skipCertVerify)
{
    if (transport.security != QStringLiteral("tls") && transport.security != QStringLiteral("reality")) {
        return std::nullopt;
    }

    QJsonObject tls {
        {QStringLiteral("enabled"), true}
    };

    if (transport.allowInsecure || skipCertVerify) {
        tls[QStringLiteral("insecure")] = true;
    }

    const QString sni = transport.sni.trimmed();
    if (!sni.isEmpty()) {
        tls[QStringLiteral("server_name")] = sni;
    }

    const QString certificate = transport.certificate.trimmed();
    if (!certificate.isEmpty()) {
        tls[QStringLiteral("certificate")] = certificate;
    }

    const QJsonArray alpn = splitToArray(transport.alpn);
    if (!alpn.isEmpty()) {
        tls[QStringLiteral("alpn")] = alpn;
    }

    QString fingerprint = transport.utlsFingerprint.trimmed();
    const QString publicKey = transport.realityPublicKey.trimmed();
    if (!publicKey.isEmpty()) {
        // Only the first of several advertised short ids is used.
        const QString shortId = transport.realityShortId.section(QLatin1Char(','), 0, 0).trimmed();
        tls[QStringLiteral("reality")] = QJsonObject {
            {QStringLiteral("enabled"), true},
            {QStringLiteral("public_key"), publicKey},
            {QStringLiteral("short_id"), shortId}
        };
        // Reality handshakes require uTLS.
        if (fingerprint.isEmpty()) {
            fingerprint = QStringLiteral("random");
        }
    }

    if (!fingerprint.isEmpty()) {
        tls[QStringLiteral("utls")] = QJsonObject {
            {QStringLiteral("enabled"), true},
            {QStringLiteral("fingerprint"), fingerprint}
        };
    }

    return tls;
}

OutboundCompiler::CompileResult OutboundCompiler::compileOutbound(const ProxyProfile& profile, bool skipCertVerify)
{
    CompileResult result;
    if (!profile.isValid()) {
        result.error = QStringLiteral("Profile %1 is incomplete.").arg(profile.displayTypeAndName());
        return result;
    }

    QJsonObject outbound;
    switch (profile.type()) {
    case ProxyType::Vless: {
        const auto *vless = profile.as<VlessSettings>();
        outbound = baseOutbound(QStringLiteral("vless"), profile);
        outbound[QStringLiteral("uuid")] = vless->uuid.trimmed();
        const QString flow = normalizeFlow(vless->flow);
        if (!flow.isEmpty()) {
            outbound[QStringLiteral("flow")] = flow;
        }
        break;
    }
    case ProxyType::Trojan:
        outbound = baseOutbound(QStringLiteral("trojan"), profile);
        outbound[QStringLiteral("password")] = profile.as<TrojanSettings>()->password;
        break;
    case ProxyType::Vmess: {
        const auto *vmess = profile.as<VmessSettings>();
        outbound = baseOutbound(QStringLiteral("vmess"), profile);
        outbound[QStringLiteral("uuid")] = vmess->uuid.trimmed();
        outbound[QStringLiteral("security")] = vmess->security.isEmpty() ? QStringLiteral("auto") : vmess->security;
        outbound[QStringLiteral("alter_id")] = vmess->alterId;
        break;
    }
    case ProxyType::Shadowsocks: {
        const auto *ss = profile.as<ShadowsocksSettings>();
        outbound = baseOutbound(QStringLiteral("shadowsocks"), profile);
        outbound[QStringLiteral("method")] = ss->method;
        outbound[QStringLiteral("password")] = ss->password;
        if (ss->uotVersion > 0) {
            outbound[QStringLiteral("udp_over_tcp")] = QJsonObject {
                {QStringLiteral("enabled"), true},
                {QStringLiteral("version"), ss->uotVersion}
            };
        } else {
            outbound[QStringLiteral("udp_over_tcp")] = false;
        }
        const QString plugin = ss->plugin.trimmed();
        if (!plugin.isEmpty()) {
            const int separator = plugin.indexOf(QLatin1Char(';'));
            outbound[QStringLiteral("plugin")] = separator < 0 ? plugin : plugin.left(separator);
            if (separator >= 0) {
                outbound[QStringLiteral("plugin_opts")] = plugin.mid(separator + 1);
            }
        }
        break;
    }
    case ProxyType::Socks: {
        const auto *socks = profile.as<SocksSettings>();
        outbound = baseOutbound(QStringLiteral("socks"), profile);
        outbound[QStringLiteral("version")] = socksVersionName(socks->version);
        if (!socks->username.isEmpty() && !socks->password.isEmpty()) {
            outbound[QStringLiteral("username")] = socks->username;
            outbound[QStringLiteral("password")] = socks->password;
        }
        break;
    }
    case ProxyType::Http: {
        const auto *http = profile.as<HttpSettings>();
        outbound = baseOutbound(QStringLiteral("http"), profile);
        if (!http->username.isEmpty() && !http->password.isEmpty()) {
            outbound[QStringLiteral("username")] = http->username;
            outbound[QStringLiteral("password")] = http->password;
        }
        break;
    }
    }

    applyStream(outbound, profile, skipCertVerify);
    result.outbound = outbound;
    return result;
}

QJsonObject OutboundCompiler::baseOutbound(const QString& type, const ProxyProfile& profile)
{
    QJsonObject outbound {
        {QStringLiteral("type"), type},
        {QStringLiteral("server"), profile.serverAddress},
        {QStringLiteral("server_port"), static_cast<int>(profile.serverPort)}
    };
    if (!profile.name.isEmpty()) {
        outbound[QStringLiteral("tag")] = profile.name;
    }
    return outbound;
}

void OutboundCompiler::applyStream(QJsonObject& outbound, const ProxyProfile& profile, bool skipCertVerify)
{
    if (!profile.transport.has_value()) {
        return;
    }

    const TransportSettings& transport = profile.transport.value();
    if (const auto block = compileTransport(transport)) {
        outbound[QStringLiteral("transport")] = block.value();
    }
    if (const auto tls = compileTls(transport, skipCertVerify)) {
        outbound[QStringLiteral("tls")] = tls.value();
    }

    const ProxyType type = profile.type();
    if (type == ProxyType::Vmess || type == ProxyType::Vless) {
        outbound[QStringLiteral("packet_encoding")] = transport.packetEncoding;
    }
}
