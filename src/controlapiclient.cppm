/*!
 * @file        controlapiclient.cppm
 * @brief       Blocking client for the engine's Clash-compatible control API.
 *
 * @details
 * Declares the HTTP client used to query version, traffic, connections and
 * proxies of a running engine, to close connections, run latency probes,
 * hot-reload configuration and follow the live log stream. Every call is
 * bounded by a transfer timeout; failures degrade to sentinel values and are
 * recorded in the system log.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QUrlQuery>
#include <QtTypes>

#include <memory>
#include <optional>

export module boxlink.core.controlapiclient;
import boxlink.core.systemlog;

/**
 * @struct TrafficStats
 * @brief Cumulative byte counters reported by the engine.
 */
export struct TrafficStats {
    qint64 uploadTotal = 0;   //!< Bytes sent since start.
    qint64 downloadTotal = 0; //!< Bytes received since start.
};

/**
 * @struct ConnectionInfo
 * @brief One tracked connection as listed by `/connections`.
 */
export struct ConnectionInfo {
    QString id;            //!< Engine connection id.
    QJsonObject metadata;  //!< Source/destination metadata.
    qint64 upload = 0;     //!< Bytes sent.
    qint64 download = 0;   //!< Bytes received.
    QString start;         //!< Start timestamp as reported.
    QStringList chains;    //!< Outbound chain, innermost first.
    QString rule;          //!< Matched rule.
    QString rulePayload;   //!< Matched rule payload.

    static ConnectionInfo fromJson(const QJsonObject& json);
};

/**
 * @class LogStream
 * @brief Line reader over the streaming `/logs` response.
 *
 * @details
 * Owned by the caller. The underlying reply is aborted on close() or
 * destruction.
 */
export class LogStream
{
public:
    explicit LogStream(QNetworkReply *reply);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    /**
     * @brief Wait for the next complete line.
     * @param timeoutMs Maximum wait.
     * @return Line without terminator, or empty optional on timeout or end of stream.
     */
    std::optional<QString> readLine(int timeoutMs);

    /**
     * @brief Whether more lines may still arrive.
     * @return Open state.
     */
    bool isOpen() const;

    //! Abort the stream and release the reply.
    void close();

private:
    std::optional<QString> takeBufferedLine();

    QPointer<QNetworkReply> m_reply; //!< Streaming reply, owned.
    QByteArray m_buffer;             //!< Bytes received but not yet returned.
};

/**
 * @class ControlApiClient
 * @brief Synchronous wrapper over the control-API endpoints.
 *
 * @details
 * Calls block the caller on a local event loop until the reply finishes or
 * the transfer timeout fires.
 */
export class ControlApiClient
{
public:
    /**
     * @brief Construct a client.
     * @param host Control-API host.
     * @param port Control-API port.
     * @param secret Bearer token, empty for none.
     * @param log Optional diagnostics sink.
     */
    ControlApiClient(const QString& host, quint16 port, const QString& secret = QString(), SystemLog *log = nullptr);

    ControlApiClient(const ControlApiClient&) = delete;
    ControlApiClient& operator=(const ControlApiClient&) = delete;

    void setEndpoint(const QString& host, quint16 port);
    void setSecret(const QString& secret);

    /**
     * @brief Set the transfer timeout used by non-probe calls.
     * @param timeoutMs Timeout in milliseconds.
     */
    void setRequestTimeout(int timeoutMs);
    int requestTimeout() const;

    /**
     * @brief `host:port` as written to `experimental.clash_api.external_controller`.
     * @return Controller address.
     */
    QString controllerAddress() const;

    /**
     * @brief GET /version.
     * @return Version object, empty on failure.
     */
    QJsonObject version();

    /**
     * @brief Totals from GET /connections.
     * @return Counters, zeros on failure.
     */
    TrafficStats traffic();

    /**
     * @brief Active connections from GET /connections.
     * @return Connections, empty on failure.
     */
    QList<ConnectionInfo> connections();

    /**
     * @brief DELETE /connections/{id}.
     * @param id Connection id.
     * @return True on success.
     */
    bool closeConnection(const QString& id);

    /**
     * @brief DELETE /connections.
     * @return True on success.
     */
    bool closeAllConnections();

    /**
     * @brief `proxies` object from GET /proxies.
     * @return Outbounds keyed by tag, empty on failure.
     */
    QJsonObject proxies();

    /**
     * @brief Latency probe through one outbound.
     * @param proxyName Outbound tag.
     * @param url Probe URL.
     * @param timeoutMs Probe timeout handed to the engine.
     * @return Delay in milliseconds, -1 on failure or timeout.
     */
    int testDelay(const QString& proxyName,
                  const QString& url = QStringLiteral("https://www.gstatic.com/generate_204"),
                  int timeoutMs = 5000);

    /**
     * @brief GET /configs.
     * @return Running configuration summary, empty on failure.
     */
    QJsonObject configs();

    /**
     * @brief PUT /configs?force=true with a config file path.
     * @param configPath File readable by the engine.
     * @return True when the engine accepted the reload.
     */
    bool reloadConfig(const QString& configPath);

    /**
     * @brief Open GET /logs?level=.
     * @param level Minimum log level.
     * @return Stream owned by the caller, nullptr when the request could not be issued.
     */
    std::unique_ptr<LogStream> openLogStream(const QString& level = QStringLiteral("info"));

private:
    struct Response {
        bool ok = false;     //!< Transport succeeded and status is 2xx.
        int status = 0;      //!< HTTP status, 0 when none.
        QByteArray body;     //!< Response payload.
        QString error;       //!< Transport or status error text.
    };

    QUrl endpointUrl(const QString& encodedPath, const QUrlQuery& query = QUrlQuery()) const;
    QNetworkRequest makeRequest(const QUrl& url, int timeoutMs) const;
    Response send(const QByteArray& verb, const QString& encodedPath, const QUrlQuery& query,
                  const QByteArray& body, int timeoutMs);
    std::optional<QJsonObject> getObject(const QString& encodedPath);

    QNetworkAccessManager m_manager; //!< Transport for every call.
    QString m_host;                  //!< Control-API host.
    quint16 m_port = 0;              //!< Control-API port.
    QString m_secret;                //!< Bearer token.
    int m_timeoutMs = 5000;          //!< Transfer timeout for regular calls.
    SystemLog *m_log = nullptr;      //!< Optional diagnostics sink.
};
