/*!
 * @file        proxyprofile.cppm
 * @brief       Proxy profile and transport data model for BoxLink.
 *
 * @details
 * Defines the `ProxyProfile` tagged union covering every supported proxy
 * protocol, the shared `TransportSettings` stream layer, and the JSON
 * representation used for persistence. The protocol tag is derived from
 * the active alternative so it can never disagree with the stored fields.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QJsonObject>
#include <QString>
#include <QtTypes>

#include <optional>
#include <variant>

export module boxlink.core.proxyprofile;

/**
 * @enum ProxyType
 * @brief Closed set of supported proxy protocols.
 *
 * @details
 * Order matches the alternatives of `ProtocolSettings`.
 */
export enum class ProxyType
{
    Vless,       //!< VLESS.
    Trojan,      //!< Trojan.
    Vmess,       //!< VMess.
    Shadowsocks, //!< Shadowsocks (including 2022 ciphers).
    Socks,       //!< SOCKS 4/4a/5.
    Http         //!< HTTP CONNECT proxy (optionally over TLS).
};

/**
 * @brief Canonical lowercase name of a protocol ("vless", "shadowsocks", ...).
 * @param type Protocol tag.
 * @return Protocol name.
 */
export QString proxyTypeName(ProxyType type);

/**
 * @brief Resolve a protocol tag from its canonical name.
 * @param name Name as produced by proxyTypeName().
 * @return Protocol tag or empty optional for unknown names.
 */
export std::optional<ProxyType> proxyTypeFromName(const QString& name);

/**
 * @enum SocksVersion
 * @brief SOCKS protocol revision.
 */
export enum class SocksVersion
{
    V4,
    V4a,
    V5
};

/**
 * @brief Wire spelling of a SOCKS version ("4", "4a", "5").
 * @param version Version value.
 * @return Version string.
 */
export QString socksVersionName(SocksVersion version);

/**
 * @struct TransportSettings
 * @brief Stream layer shared by every protocol: network, TLS and Reality.
 *
 * @details
 * `security` holds "" or "tls" after parsing; Reality key material is
 * retained separately in the `reality*` fields.
 */
export struct TransportSettings {
    QString network = QStringLiteral("tcp");   //!< tcp/ws/http/grpc/httpupgrade/quic.
    QString path;                              //!< HTTP/WS path or gRPC service name.
    QString host;                              //!< Host header, comma separated for http.
    QString headerType;                        //!< TCP header disguise ("http" or empty).

    QString security;                          //!< "", "tls" or "reality".
    QString sni;                               //!< TLS server name.
    QString alpn;                              //!< Comma separated ALPN list.
    bool allowInsecure = false;                //!< Skip certificate verification.
    QString certificate;                       //!< PEM text of a pinned certificate.
    QString utlsFingerprint;                   //!< uTLS client fingerprint.

    QString realityPublicKey;                  //!< Reality server public key.
    QString realityShortId;                    //!< Reality short-id, raw (may be comma separated).
    QString realitySpiderX;                    //!< Reality spider-x path.

    int wsEarlyDataLength = 0;                 //!< WebSocket max early data.
    QString wsEarlyDataHeaderName = QStringLiteral("Sec-WebSocket-Protocol"); //!< Early data header.

    QString packetEncoding = QStringLiteral("xudp"); //!< UDP packet encoding for VMess/VLESS.

    /**
     * @brief True when a TLS layer (plain or Reality) is configured.
     * @return TLS state.
     */
    bool hasTls() const;

    QJsonObject toJson() const;
    static TransportSettings fromJson(const QJsonObject& json);

    bool operator==(const TransportSettings& other) const = default;
};

//! VLESS credentials.
export struct VlessSettings {
    QString uuid;
    QString flow;
    QString encryption = QStringLiteral("none");

    bool operator==(const VlessSettings& other) const = default;
};

//! Trojan credentials.
export struct TrojanSettings {
    QString password;

    bool operator==(const TrojanSettings& other) const = default;
};

//! VMess credentials.
export struct VmessSettings {
    QString uuid;
    int alterId = 0;
    QString security = QStringLiteral("auto"); //!< Cipher.

    bool operator==(const VmessSettings& other) const = default;
};

//! Shadowsocks credentials and plugin.
export struct ShadowsocksSettings {
    QString method;
    QString password;
    QString plugin;     //!< `name;opt=value;...` as carried in share links.
    int uotVersion = 0; //!< UDP-over-TCP version, 0 when disabled.

    bool operator==(const ShadowsocksSettings& other) const = default;
};

//! SOCKS credentials.
export struct SocksSettings {
    QString username;
    QString password;
    SocksVersion version = SocksVersion::V5;

    bool operator==(const SocksSettings& other) const = default;
};

//! HTTP proxy credentials.
export struct HttpSettings {
    QString username;
    QString password;

    bool operator==(const HttpSettings& other) const = default;
};

/**
 * @brief Per-protocol payload of a profile.
 *
 * @details
 * Alternative order matches `ProxyType`.
 */
export using ProtocolSettings = std::variant<
    VlessSettings,
    TrojanSettings,
    VmessSettings,
    ShadowsocksSettings,
    SocksSettings,
    HttpSettings>;

/**
 * @struct ProxyProfile
 * @brief One upstream proxy endpoint with its protocol and stream settings.
 *
 * @details
 * `id` and `groupId` are assigned by the owning `ProfileStore`; the codec
 * leaves `id` at -1.
 */
export struct ProxyProfile {
    int id = -1;                                //!< Store-assigned identifier.
    int groupId = 0;                            //!< Owning group.
    QString name;                               //!< Human readable name.
    QString serverAddress;                      //!< Remote host or IP literal.
    quint16 serverPort = 0;                     //!< Remote port.
    ProtocolSettings settings;                  //!< Protocol specific fields.
    std::optional<TransportSettings> transport; //!< Stream layer when the protocol carries one.

    /**
     * @brief Create an empty profile of the given protocol with its default transport.
     * @param type Protocol tag.
     * @return Profile whose transport follows the protocol defaults.
     */
    static ProxyProfile create(ProxyType type);

    /**
     * @brief Protocol tag derived from the active alternative.
     * @return Protocol tag.
     */
    ProxyType type() const;

    template <typename T>
    const T *as() const
    {
        return std::get_if<T>(&settings);
    }

    template <typename T>
    T *as()
    {
        return std::get_if<T>(&settings);
    }

    /**
     * @brief `host:port`, bracketing IPv6 literals.
     * @return Endpoint string.
     */
    QString displayAddress() const;

    /**
     * @brief Name when set, endpoint otherwise.
     * @return Label for lists and outbound tags.
     */
    QString displayName() const;

    /**
     * @brief `[TYPE] name` label.
     * @return Label with protocol prefix.
     */
    QString displayTypeAndName() const;

    /**
     * @brief Validate endpoint and required credentials.
     * @return True when the profile can be compiled.
     */
    bool isValid() const;

    /**
     * @brief Serialize as `{type, bean}` for persistence.
     * @return JSON object.
     */
    QJsonObject toJson() const;

    /**
     * @brief Restore a profile written by toJson().
     * @param json Source object.
     * @return Parsed profile or empty optional on unknown type or out-of-range port.
     */
    static std::optional<ProxyProfile> fromJson(const QJsonObject& json);

    bool operator==(const ProxyProfile& other) const = default;
};

/**
 * @brief Whether the text is an IPv4 or IPv6 literal.
 * @param value Candidate host.
 * @return True for IP literals.
 */
export bool isIpAddress(const QString& value);

/**
 * @brief Join host and port, bracketing IPv6 literals.
 * @param host Host or IP literal.
 * @param port Port number.
 * @return `host:port`.
 */
export QString formatAddress(const QString& host, quint16 port);
