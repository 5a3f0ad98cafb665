module;
#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QString>
#include <QTimer>
#include <QUrl>

module boxlink.core.subscriptionupdater;
import boxlink.core.linkcodec;
import boxlink.core.proxyprofile;

namespace {
void setError(QString *errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}
}

SubscriptionUpdater::SubscriptionUpdater(ProfileStore& store, SystemLog *log, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_log(log)
{
}

void SubscriptionUpdater::setUserAgent(const QString& userAgent)
{
    m_userAgent = userAgent.trimmed();
}

QString SubscriptionUpdater::userAgent() const
{
    return m_userAgent;
}

bool SubscriptionUpdater::isPending(int groupId) const
{
    return m_pending.value(groupId, false);
}

bool SubscriptionUpdater::update(int groupId, const QString& url, bool clearExisting)
{
    const ProfileGroup *group = m_store.group(groupId);
    if (group == nullptr) {
        fail(groupId, QStringLiteral("Group %1 does not exist.").arg(groupId));
        return false;
    }
    if (isPending(groupId)) {
        fail(groupId, QStringLiteral("A refresh of group '%1' is already running.").arg(group->name));
        return false;
    }

    const QString source = url.trimmed().isEmpty() ? group->subscriptionUrl.trimmed() : url.trimmed();
    const QUrl parsedUrl(source);
    const QString scheme = parsedUrl.scheme().toLower();
    if (!parsedUrl.isValid() || (scheme != QStringLiteral("http") && scheme != QStringLiteral("https"))) {
        fail(groupId, QStringLiteral("Subscription URL must be a valid http(s) link."));
        return false;
    }

    QNetworkRequest request(parsedUrl);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setTransferTimeout(kFetchTimeoutMs);
    if (!m_userAgent.isEmpty()) {
        request.setRawHeader("User-Agent", m_userAgent.toUtf8());
    }

    m_pending.insert(groupId, true);
    appendSystemLog(m_log, QStringLiteral("[Subscription] Fetching %1").arg(source));

    QNetworkReply *reply = m_manager.get(request);
    connect(reply, &QNetworkReply::finished, this, [this, reply, groupId, source, clearExisting]() {
        m_pending.remove(groupId);
        const bool hadError = reply->error() != QNetworkReply::NoError;
        const QString netError = reply->errorString().trimmed();
        const QByteArray userInfo = reply->rawHeader("subscription-userinfo");
        QByteArray payload;
        if (reply->isOpen()) {
            payload = reply->readAll();
        }
        reply->deleteLater();

        if (hadError) {
            fail(groupId, netError.isEmpty()
                ? QStringLiteral("Failed to fetch subscription URL.")
                : QStringLiteral("Subscription fetch failed: %1").arg(netError));
            return;
        }

        QString error;
        const int count = applyContent(groupId, QString::fromUtf8(payload), clearExisting, &error);
        if (count == 0) {
            fail(groupId, error);
            return;
        }

        if (ProfileGroup *group = m_store.group(groupId)) {
            group->subscriptionUrl = source;
            if (!userInfo.isEmpty()) {
                group->subscriptionUserInfo = QString::fromUtf8(userInfo).trimmed();
            }
        }
        appendSystemLog(m_log, QStringLiteral("[Subscription] Imported %1 profile(s) from %2.")
            .arg(count)
            .arg(source));
        emit finished(groupId, count, QString());
    });
    return true;
}

int SubscriptionUpdater::applyContent(int groupId, const QString& content, bool clearExisting, QString *errorMessage)
{
    ProfileGroup *group = m_store.group(groupId);
    if (group == nullptr) {
        setError(errorMessage, QStringLiteral("Group %1 does not exist.").arg(groupId));
        return 0;
    }

    const QList<ProxyProfile> profiles = LinkCodec::parseSubscriptionContent(content);
    if (profiles.isEmpty()) {
        setError(errorMessage, QStringLiteral("Subscription payload has no supported links."));
        return 0;
    }

    if (clearExisting) {
        m_store.clearGroup(groupId);
    }

    int imported = 0;
    for (const ProxyProfile& profile : profiles) {
        if (m_store.addProfile(profile, groupId) >= 0) {
            ++imported;
        }
    }

    group->isSubscription = true;
    group->lastUpdated = QDateTime::currentDateTimeUtc();
    return imported;
}

void SubscriptionUpdater::fail(int groupId, const QString& error)
{
    appendSystemLog(m_log, QStringLiteral("[Subscription] %1").arg(error));
    // Deferred so callers always observe `finished` after update() returns.
    QTimer::singleShot(0, this, [this, groupId, error]() {
        emit finished(groupId, 0, error);
    });
}
