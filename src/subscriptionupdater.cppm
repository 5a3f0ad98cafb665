/*!
 * @file        subscriptionupdater.cppm
 * @brief       Subscription download and group refresh.
 *
 * @details
 * Fetches a subscription body over HTTP(S), decodes it into profiles and
 * replaces the profiles of the target group in a `ProfileStore`. Fetches are
 * asynchronous; completion is reported through the `finished` signal. The
 * caller persists the store.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QHash>
#include <QNetworkAccessManager>
#include <QObject>
#include <QString>

#ifndef Q_MOC_RUN
export module boxlink.core.subscriptionupdater;
import boxlink.core.profilestore;
import boxlink.core.systemlog;
#endif

#ifdef Q_MOC_RUN
#define BOXLINK_MODULE_EXPORT
#else
#define BOXLINK_MODULE_EXPORT export
#endif

/**
 * @class SubscriptionUpdater
 * @brief Refreshes subscription groups of one profile store.
 */
BOXLINK_MODULE_EXPORT class SubscriptionUpdater : public QObject
{
    Q_OBJECT

public:
    static constexpr int kFetchTimeoutMs = 30000;

    /**
     * @brief Construct an updater bound to a store.
     * @param store Store receiving refreshed profiles; must outlive the updater.
     * @param log Optional diagnostics sink.
     * @param parent Optional QObject parent.
     */
    explicit SubscriptionUpdater(ProfileStore& store, SystemLog *log = nullptr, QObject *parent = nullptr);

    void setUserAgent(const QString& userAgent);
    QString userAgent() const;

    /**
     * @brief Start fetching a subscription into a group.
     * @param groupId Target group.
     * @param url Subscription URL; the group's stored URL is used when empty.
     * @param clearExisting Drop the group's current profiles before importing.
     * @return False when the request could not be issued; `finished` is still emitted.
     */
    bool update(int groupId, const QString& url = QString(), bool clearExisting = true);

    /**
     * @brief Whether a fetch for a group is in flight.
     * @param groupId Group identifier.
     * @return Pending state.
     */
    bool isPending(int groupId) const;

    /**
     * @brief Import an already downloaded subscription body.
     * @param groupId Target group.
     * @param content Raw body (plain or base64 link list).
     * @param clearExisting Drop the group's current profiles first.
     * @param errorMessage Optional output message on failure.
     * @return Number of imported profiles; the group is untouched when 0.
     */
    int applyContent(int groupId, const QString& content, bool clearExisting, QString *errorMessage = nullptr);

signals:
    /**
     * @brief Emitted once per update() call.
     * @param groupId Target group.
     * @param count Imported profiles, 0 on failure.
     * @param error Failure description, empty on success.
     */
    void finished(int groupId, int count, const QString& error);

private:
    void fail(int groupId, const QString& error);

    ProfileStore& m_store;                 //!< Target store.
    SystemLog *m_log = nullptr;            //!< Optional diagnostics sink.
    QNetworkAccessManager m_manager;       //!< Transport.
    QString m_userAgent = QStringLiteral("BoxLink-Subscription/1.0");
    QHash<int, bool> m_pending;            //!< Groups with a fetch in flight.
};

#include "subscriptionupdater.moc"
