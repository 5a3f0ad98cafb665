/*!
 * @file        outboundcompiler.cppm
 * @brief       sing-box outbound generator.
 *
 * @details
 * Turns a `ProxyProfile` into the sing-box outbound object for its protocol,
 * including the optional `transport` and `tls` blocks derived from the
 * profile's stream settings. The compiler is a pure function of its input.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QJsonObject>
#include <QString>

#include <optional>

export module boxlink.core.outboundcompiler;
import boxlink.core.proxyprofile;

/**
 * @class OutboundCompiler
 * @brief Builds sing-box outbound documents from proxy profiles.
 */
export class OutboundCompiler
{
public:
    /**
     * @struct CompileResult
     * @brief Compiled outbound or the reason it could not be produced.
     */
    struct CompileResult {
        QJsonObject outbound; //!< Outbound object, empty on failure.
        QString error;        //!< Failure description, empty on success.

        bool ok() const
        {
            return error.isEmpty();
        }
    };

    /**
     * @brief Compile one profile.
     * @param profile Source profile.
     * @param skipCertVerify Force `insecure` on the TLS block.
     * @return Outbound with `tag` set to the profile name when it has one.
     */
    static CompileResult compileOutbound(const ProxyProfile& profile, bool skipCertVerify = false);

    /**
     * @brief Build the `transport` block.
     * @param transport Stream settings.
     * @return Transport object, or empty optional for plain TCP.
     */
    static std::optional<QJsonObject> compileTransport(const TransportSettings& transport);

    /**
     * @brief Build the `tls` block.
     * @param transport Stream settings.
     * @param skipCertVerify Force `insecure`.
     * @return TLS object, or empty optional when the stream carries no TLS.
     */
    static std::optional<QJsonObject> compileTls(const TransportSettings& transport, bool skipCertVerify);

private:
    static QJsonObject baseOutbound(const QString& type, const ProxyProfile& profile);
    static void applyStream(QJsonObject& outbound, const ProxyProfile& profile, bool skipCertVerify);
};
