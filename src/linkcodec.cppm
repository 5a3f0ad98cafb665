/*!
 * @file        linkcodec.cppm
 * @brief       Share-link and subscription codec.
 *
 * @details
 * Declares parsing and serialization APIs converting VLESS, Trojan, VMess,
 * Shadowsocks, SOCKS and HTTP share links into `ProxyProfile` values and
 * back. Dispatch goes through a static registry keyed by scheme and by
 * protocol tag; every parser tolerates the historical dialects of its
 * protocol and reports structural defects through an optional message.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QUrlQuery>

#include <optional>

export module boxlink.core.linkcodec;
import boxlink.core.proxyprofile;

/**
 * @class LinkCodec
 * @brief Converts share links and subscription bodies to and from profiles.
 *
 * @details
 * Parsers never throw; an unrecognized scheme is reported as "not a share
 * link" rather than an error. Profiles returned by the codec carry id -1;
 * identifiers are assigned by the owning store.
 */
export class LinkCodec
{
public:
    /**
     * @brief Parse one share link.
     * @param text Raw link text (surrounding whitespace ignored).
     * @param errorMessage Optional output message on failure.
     * @return Parsed profile or empty optional.
     */
    static std::optional<ProxyProfile> parseLink(const QString& text, QString *errorMessage = nullptr);

    /**
     * @brief Protocol selected by the link scheme.
     * @param text Raw link text.
     * @return Protocol tag or empty optional for unknown schemes.
     */
    static std::optional<ProxyType> detectLinkType(const QString& text);

    /**
     * @brief Serialize a profile into a re-parseable share link.
     * @param profile Source profile.
     * @return Share link.
     */
    static QString toShareLink(const ProxyProfile& profile);

    /**
     * @brief Serialize a VMess profile in the base64 JSON dialect.
     * @param profile VMess profile.
     * @return Share link, or empty string for other protocols.
     */
    static QString toLegacyVmessLink(const ProxyProfile& profile);

    /**
     * @brief Parse a subscription body.
     * @details A whole-body base64 payload is decoded once. Blank lines and
     * `#` comments are skipped; lines that fail to parse are dropped.
     * @param content Subscription body.
     * @return Parsed profiles in source order.
     */
    static QList<ProxyProfile> parseSubscriptionContent(const QString& content);

    /**
     * @brief Schemes accepted by parseLink(), including the `://` suffix.
     * @return Scheme prefixes.
     */
    static QStringList supportedSchemes();

private:
    using Parser = std::optional<ProxyProfile> (*)(const QString& link, QString *errorMessage);
    using Serializer = QString (*)(const ProxyProfile& profile);
    using QueryItems = QList<QPair<QString, QString>>;

    struct SchemeEntry {
        QString prefix;  //!< Lowercase scheme including `://`.
        ProxyType type;  //!< Protocol handled by this scheme.
    };

    struct ProtocolEntry {
        ProxyType type;        //!< Protocol tag.
        Parser parse;          //!< Link parser.
        Serializer serialize;  //!< Link serializer.
    };

    static const QList<SchemeEntry>& schemeRegistry();
    static const ProtocolEntry& protocolEntry(ProxyType type);

    static std::optional<ProxyProfile> parseVless(const QString& link, QString *errorMessage);
    static std::optional<ProxyProfile> parseTrojan(const QString& link, QString *errorMessage);
    static std::optional<ProxyProfile> parseVmess(const QString& link, QString *errorMessage);
    static std::optional<ProxyProfile> parseShadowsocks(const QString& link, QString *errorMessage);
    static std::optional<ProxyProfile> parseSocks(const QString& link, QString *errorMessage);
    static std::optional<ProxyProfile> parseHttp(const QString& link, QString *errorMessage);

    static QString serializeVless(const ProxyProfile& profile);
    static QString serializeTrojan(const ProxyProfile& profile);
    static QString serializeVmess(const ProxyProfile& profile);
    static QString serializeShadowsocks(const ProxyProfile& profile);
    static QString serializeSocks(const ProxyProfile& profile);
    static QString serializeHttp(const ProxyProfile& profile);

    /**
     * @brief Parse the legacy VMess base64 JSON payload.
     * @param payload Link body after the scheme, fragment removed.
     * @param fallbackName Name taken from the fragment.
     * @return Parsed profile or empty optional when the payload is not JSON.
     */
    static std::optional<ProxyProfile> parseLegacyVmess(const QString& payload, const QString& fallbackName,
                                                       QString *errorMessage = nullptr);

    /**
     * @brief Apply VLESS/Trojan/VMess style query keys to a transport.
     * @param query Link query.
     * @param transport Target transport (defaults already applied).
     * @param type Protocol, used for protocol specific defaults.
     */
    static void applyStreamQuery(const QUrlQuery& query, TransportSettings& transport, ProxyType type);

    /**
     * @brief Append transport query keys for serialization.
     * @param transport Source transport.
     * @param items Query items being built.
     */
    static void appendStreamQuery(const TransportSettings& transport, QueryItems& items);

    /**
     * @brief Assemble `scheme://userinfo@host:port?query#name`.
     * @param scheme Scheme without `://`.
     * @param userInfo Already percent-encoded userinfo, may be empty.
     * @param profile Source of host, port and name.
     * @param items Query items; empty values are skipped.
     * @return Share link.
     */
    static QString buildLink(const QString& scheme, const QString& userInfo,
                             const ProxyProfile& profile, const QueryItems& items);

    /**
     * @brief Split `host:port` / `[v6]:port`.
     * @param text Endpoint text.
     * @param host Output host without brackets.
     * @param port Output port, -1 when absent.
     * @return False when the endpoint is malformed.
     */
    static bool splitHostPort(const QString& text, QString *host, int *port);

    static QString percentEncode(const QString& value);

    static QString percentDecode(const QString& value);

    /**
     * @brief Decode URL-safe or standard base64 text, padded or not.
     * @param value Encoded input.
     * @return Decoded bytes (empty on failure).
     */
    static QByteArray decodeFlexibleBase64(const QString& value);

    /**
     * @brief Decode base64 text that must yield valid UTF-8.
     * @param value Encoded input.
     * @return Decoded text or empty optional.
     */
    static std::optional<QString> decodeBase64Text(const QString& value);

    static bool isTruthy(const QString& value);

    static void setError(QString *errorMessage, const QString& error);
};
