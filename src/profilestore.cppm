/*!
 * @file        profilestore.cppm
 * @brief       Profile groups, persisted entries and their owning store.
 *
 * @details
 * Declares `ProfileGroup`, `ProfileEntry` and `ProfileStore`. The store is
 * the only place profile and group identifiers are assigned; it keeps the
 * default group alive and persists a full JSON snapshot on save.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QString>

#include <optional>

export module boxlink.core.profilestore;
import boxlink.core.proxyprofile;
import boxlink.core.settings;

/**
 * @struct ProfileGroup
 * @brief Named collection of profiles, optionally backed by a subscription.
 */
export struct ProfileGroup {
    int id = 0;                   //!< Store-assigned identifier; 0 is "Default".
    QString name;                 //!< Display name.
    bool isSubscription = false;  //!< Whether profiles come from a subscription URL.
    QString subscriptionUrl;      //!< Subscription source.
    QDateTime lastUpdated;        //!< Last successful subscription refresh (UTC).
    QString subscriptionUserInfo; //!< Raw `subscription-userinfo` header value.

    QJsonObject toJson() const;
    static std::optional<ProfileGroup> fromJson(const QJsonObject& json);
};

/**
 * @struct ProfileEntry
 * @brief Persisted wrapper owning one profile.
 */
export struct ProfileEntry {
    int id = -1;                            //!< Same value as `profile.id`.
    int groupId = 0;                        //!< Same value as `profile.groupId`.
    ProxyProfile profile;                   //!< Owned profile.
    int latencyMs = -1;                     //!< Last measured delay, -1 when unknown.
    QDateTime lastUsed;                     //!< Last connection time (UTC).
    std::optional<RoutingSettings> routing; //!< Per-profile routing override.
    std::optional<VpnSettings> vpn;         //!< Per-profile VPN override.

    QJsonObject toJson() const;
    static std::optional<ProfileEntry> fromJson(const QJsonObject& json);
};

/**
 * @class ProfileStore
 * @brief Owns groups and profile entries and assigns their identifiers.
 *
 * @details
 * Identifiers are monotonic and never reused within one store. Group 0
 * ("Default") always exists.
 */
export class ProfileStore
{
public:
    static constexpr int kDefaultGroupId = 0;

    ProfileStore();

    /**
     * @brief Create a group.
     * @param name Display name.
     * @param subscriptionUrl Subscription source; empty for a manual group.
     * @return New group identifier.
     */
    int addGroup(const QString& name, const QString& subscriptionUrl = QString());

    /**
     * @brief Remove a group and every profile in it.
     * @param groupId Group identifier.
     * @return False for the default group or unknown ids.
     */
    bool removeGroup(int groupId);

    /**
     * @brief Remove every profile in a group.
     * @param groupId Group identifier.
     * @return Number of removed profiles.
     */
    int clearGroup(int groupId);

    ProfileGroup *group(int groupId);
    const ProfileGroup *group(int groupId) const;
    QList<ProfileGroup> groups() const;

    int currentGroupId() const;
    bool setCurrentGroupId(int groupId);

    /**
     * @brief Take ownership of a profile and assign its identifier.
     * @param profile Parsed or edited profile.
     * @param groupId Target group, or -1 for the current group.
     * @return New profile identifier, or -1 when the group does not exist.
     */
    int addProfile(ProxyProfile profile, int groupId = -1);

    bool removeProfile(int profileId);

    ProfileEntry *entry(int profileId);
    const ProfileEntry *entry(int profileId) const;

    /**
     * @brief Entries of one group in identifier order.
     * @param groupId Group identifier.
     * @return Entry copies.
     */
    QList<ProfileEntry> profilesInGroup(int groupId) const;

    int profileCount() const;

    /**
     * @brief Write `groups.json`, `profiles.json` and `meta.json` into a directory.
     * @param directory Target directory, created when missing.
     * @param errorMessage Optional output message on failure.
     * @return True when every file was committed.
     */
    bool save(const QString& directory, QString *errorMessage = nullptr) const;

    /**
     * @brief Replace the store contents with a snapshot written by save().
     * @param directory Source directory.
     * @param errorMessage Optional output message on failure.
     * @return True on success; missing files yield an empty store.
     */
    bool load(const QString& directory, QString *errorMessage = nullptr);

private:
    void ensureDefaultGroup();

    static void setError(QString *errorMessage, const QString& error);

    QMap<int, ProfileGroup> m_groups;   //!< Groups keyed by id.
    QMap<int, ProfileEntry> m_entries;  //!< Entries keyed by id.
    int m_nextGroupId = 1;              //!< Next group identifier.
    int m_nextProfileId = 0;            //!< Next profile identifier.
    int m_currentGroupId = kDefaultGroupId;
};
