module;
#include <QByteArray>
#include <QEventLoop>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QString>
#include <QTimer>
#include <QUrl>
#include <QUrlQuery>

#include <algorithm>
#include <memory>
#include <optional>

module boxlink.core.controlapiclient;

namespace {
// Extra time granted on top of a probe timeout so the engine can answer first.
constexpr int kDelayProbeSlackMs = 500;
// Local guard in case a reply never finishes despite its transfer timeout.
constexpr int kWatchdogSlackMs = 1000;

qint64 jsonInt64(const QJsonValue& value)
{
    return value.isDouble() ? static_cast<qint64>(value.toDouble()) : 0;
}

bool waitForReply(QNetworkReply *reply, int timeoutMs)
{
    if (reply->isFinished()) {
        return true;
    }

    QEventLoop loop;
    QTimer watchdog;
    watchdog.setSingleShot(true);
    QObject::connect(&watchdog, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    watchdog.start(timeoutMs);
    loop.exec();

    if (!reply->isFinished()) {
        reply->abort();
        return false;
    }
    return true;
}
}

ConnectionInfo ConnectionInfo::fromJson(const QJsonObject& json)
{
    ConnectionInfo info;
    info.id = json.value(QStringLiteral("id")).toString();
    info.metadata = json.value(QStringLiteral("metadata")).toObject();
    info.upload = jsonInt64(json.value(QStringLiteral("upload")));
    info.download = jsonInt64(json.value(QStringLiteral("download")));
    info.start = json.value(QStringLiteral("start")).toString();
    for (const QJsonValue& chain : json.value(QStringLiteral("chains")).toArray()) {
        info.chains.append(chain.toString());
    }
    info.rule = json.value(QStringLiteral("rule")).toString();
    info.rulePayload = json.value(QStringLiteral("rulePayload")).toString();
    return info;
}

LogStream::LogStream(QNetworkReply *reply)
    : m_reply(reply)
{
}

LogStream::~LogStream()
{
    close();
}

std::optional<QString> LogStream::readLine(int timeoutMs)
{
    if (auto line = takeBufferedLine()) {
        return line;
    }
    if (!m_reply) {
        return std::nullopt;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(m_reply.data(), &QNetworkReply::readyRead, &loop, &QEventLoop::quit);
    QObject::connect(m_reply.data(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(std::max(0, timeoutMs));

    while (true) {
        if (m_reply->bytesAvailable() > 0) {
            m_buffer.append(m_reply->readAll());
            if (auto line = takeBufferedLine()) {
                return line;
            }
        }
        if (m_reply->isFinished() || !timer.isActive()) {
            break;
        }
        loop.exec();
    }

    if (m_reply->isFinished()) {
        m_buffer.append(m_reply->readAll());
        if (auto line = takeBufferedLine()) {
            return line;
        }
        // Final unterminated line.
        if (!m_buffer.isEmpty()) {
            const QString tail = QString::fromUtf8(m_buffer).trimmed();
            m_buffer.clear();
            if (!tail.isEmpty()) {
                return tail;
            }
        }
    }
    return std::nullopt;
}

bool LogStream::isOpen() const
{
    return !m_buffer.isEmpty() || (m_reply && !m_reply->isFinished());
}

void LogStream::close()
{
    if (!m_reply) {
        return;
    }
    QNetworkReply *reply = m_reply.data();
    m_reply.clear();
    reply->abort();
    reply->deleteLater();
}

std::optional<QString> LogStream::takeBufferedLine()
{
    while (true) {
        const int newline = m_buffer.indexOf('\n');
        if (newline < 0) {
            return std::nullopt;
        }
        const QString line = QString::fromUtf8(m_buffer.left(newline)).trimmed();
        m_buffer.remove(0, newline + 1);
        if (!line.isEmpty()) {
            return line;
        }
    }
}

ControlApiClient::ControlApiClient(const QString& host, quint16 port, const QString& secret, SystemLog *log)
    : m_host(host.trimmed())
    , m_port(port)
    , m_secret(secret)
    , m_log(log)
{
}

void ControlApiClient::setEndpoint(const QString& host, quint16 port)
{
    m_host = host.trimmed();
    m_port = port;
}

void ControlApiClient::setSecret(const QString& secret)
{
    m_secret = secret;
}

void ControlApiClient::setRequestTimeout(int timeoutMs)
{
    m_timeoutMs = std::max(1, timeoutMs);
}

int ControlApiClient::requestTimeout() const
{
    return m_timeoutMs;
}

QString ControlApiClient::controllerAddress() const
{
    const bool ipv6 = QHostAddress(m_host).protocol() == QAbstractSocket::IPv6Protocol;
    const QString host = ipv6 ? QStringLiteral("[%1]").arg(m_host) : m_host;
    return QStringLiteral("%1:%2").arg(host).arg(m_port);
}

QJsonObject ControlApiClient::version()
{
    return getObject(QStringLiteral("/version")).value_or(QJsonObject());
}

TrafficStats ControlApiClient::traffic()
{
    TrafficStats stats;
    const auto root = getObject(QStringLiteral("/connections"));
    if (root.has_value()) {
        stats.uploadTotal = jsonInt64(root->value(QStringLiteral("uploadTotal")));
        stats.downloadTotal = jsonInt64(root->value(QStringLiteral("downloadTotal")));
    }
    return stats;
}

QList<ConnectionInfo> ControlApiClient::connections()
{
    QList<ConnectionInfo> result;
    const auto root = getObject(QStringLiteral("/connections"));
    if (!root.has_value()) {
        return result;
    }
    for (const QJsonValue& value : root->value(QStringLiteral("connections")).toArray()) {
        if (value.isObject()) {
            result.append(ConnectionInfo::fromJson(value.toObject()));
        }
    }
    return result;
}

bool ControlApiClient::closeConnection(const QString& id)
{
    if (id.trimmed().isEmpty()) {
        return false;
    }
    const QString path = QStringLiteral("/connections/")
        + QString::fromLatin1(QUrl::toPercentEncoding(id.trimmed()));
    return send("DELETE", path, QUrlQuery(), QByteArray(), m_timeoutMs).ok;
}

bool ControlApiClient::closeAllConnections()
{
    return send("DELETE", QStringLiteral("/connections"), QUrlQuery(), QByteArray(), m_timeoutMs).ok;
}

QJsonObject ControlApiClient::proxies()
{
    const auto root = getObject(QStringLiteral("/proxies"));
    if (!root.has_value()) {
        return QJsonObject();
    }
    return root->value(QStringLiteral("proxies")).toObject();
}

int ControlApiClient::testDelay(const QString& proxyName, const QString& url, int timeoutMs)
{
    const int probeTimeout = std::max(1, timeoutMs);
    const QString path = QStringLiteral("/proxies/%1/delay")
        .arg(QString::fromLatin1(QUrl::toPercentEncoding(proxyName)));

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("url"), QString::fromLatin1(QUrl::toPercentEncoding(url)));
    query.addQueryItem(QStringLiteral("timeout"), QString::number(probeTimeout));

    const Response response = send("GET", path, query, QByteArray(), probeTimeout + kDelayProbeSlackMs);
    if (!response.ok) {
        return -1;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(response.body);
    const QJsonValue delay = doc.object().value(QStringLiteral("delay"));
    return delay.isDouble() ? delay.toInt(-1) : -1;
}

QJsonObject ControlApiClient::configs()
{
    return getObject(QStringLiteral("/configs")).value_or(QJsonObject());
}

bool ControlApiClient::reloadConfig(const QString& configPath)
{
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("force"), QStringLiteral("true"));

    const QJsonObject body {
        {QStringLiteral("path"), configPath}
    };
    const Response response = send("PUT", QStringLiteral("/configs"), query,
                                   QJsonDocument(body).toJson(QJsonDocument::Compact), m_timeoutMs);
    return response.ok;
}

std::unique_ptr<LogStream> ControlApiClient::openLogStream(const QString& level)
{
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("level"), level.trimmed().isEmpty() ? QStringLiteral("info") : level.trimmed());

    // Streaming reply: no transfer timeout, the caller bounds each read.
    QNetworkRequest request = makeRequest(endpointUrl(QStringLiteral("/logs"), query), 0);
    QNetworkReply *reply = m_manager.get(request);
    if (!reply) {
        appendSystemLog(m_log, QStringLiteral("[ControlApi] Could not open log stream."));
        return nullptr;
    }
    return std::make_unique<LogStream>(reply);
}

QUrl ControlApiClient::endpointUrl(const QString& encodedPath, const QUrlQuery& query) const
{
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(m_host);
    url.setPort(m_port);
    url.setPath(encodedPath, QUrl::TolerantMode);
    if (!query.isEmpty()) {
        url.setQuery(query);
    }
    return url;
}

QNetworkRequest ControlApiClient::makeRequest(const QUrl& url, int timeoutMs) const
{
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("User-Agent", "BoxLink-ControlApi/1.0");
    if (!m_secret.isEmpty()) {
        request.setRawHeader("Authorization", QByteArrayLiteral("Bearer ") + m_secret.toUtf8());
    }
    if (timeoutMs > 0) {
        request.setTransferTimeout(timeoutMs);
    }
    return request;
}

ControlApiClient::Response ControlApiClient::send(const QByteArray& verb, const QString& encodedPath,
                                                  const QUrlQuery& query, const QByteArray& body, int timeoutMs)
{
    Response response;
    const QNetworkRequest request = makeRequest(endpointUrl(encodedPath, query), timeoutMs);

    QNetworkReply *reply = body.isEmpty()
        ? m_manager.sendCustomRequest(request, verb)
        : m_manager.sendCustomRequest(request, verb, body);

    if (!waitForReply(reply, timeoutMs + kWatchdogSlackMs)) {
        response.error = QStringLiteral("timed out");
    }

    response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (response.error.isEmpty() && reply->error() != QNetworkReply::NoError) {
        response.error = reply->errorString().trimmed();
    }
    if (response.error.isEmpty()) {
        response.body = reply->readAll();
    }
    reply->deleteLater();

    response.ok = response.error.isEmpty() && response.status >= 200 && response.status < 300;
    if (!response.ok) {
        if (response.error.isEmpty()) {
            response.error = QStringLiteral("HTTP %1").arg(response.status);
        }
        appendSystemLog(m_log, QStringLiteral("[ControlApi] %1 %2 failed: %3")
            .arg(QString::fromLatin1(verb), encodedPath, response.error));
    }
    return response;
}

std::optional<QJsonObject> ControlApiClient::getObject(const QString& encodedPath)
{
    const Response response = send("GET", encodedPath, QUrlQuery(), QByteArray(), m_timeoutMs);
    if (!response.ok) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(response.body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        appendSystemLog(m_log, QStringLiteral("[ControlApi] GET %1 returned invalid JSON.").arg(encodedPath));
        return std::nullopt;
    }
    return doc.object();
}
