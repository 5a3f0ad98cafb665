module;
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QString>

#include <algorithm>
#include <optional>
#include <utility>

module boxlink.core.profilestore;

namespace {
bool writeJsonFile(const QString& path, const QJsonDocument& doc)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    file.write(doc.toJson(QJsonDocument::Indented));
    return file.commit();
}

std::optional<QJsonDocument> readJsonFile(const QString& path, QString *error)
{
    QFile file(path);
    if (!file.exists()) {
        return QJsonDocument();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        *error = QStringLiteral("Failed to open %1.").arg(path);
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        *error = QStringLiteral("%1 is not valid JSON: %2").arg(path, parseError.errorString());
        return std::nullopt;
    }
    return doc;
}

QString toIso(const QDateTime& value)
{
    return value.isValid() ? value.toUTC().toString(Qt::ISODate) : QString();
}

QDateTime fromIso(const QJsonValue& value)
{
    const QString text = value.toString();
    if (text.isEmpty()) {
        return QDateTime();
    }
    return QDateTime::fromString(text, Qt::ISODate);
}
}

QJsonObject ProfileGroup::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("id")] = id;
    json[QStringLiteral("name")] = name;
    json[QStringLiteral("isSubscription")] = isSubscription;
    json[QStringLiteral("subscriptionUrl")] = subscriptionUrl;
    json[QStringLiteral("lastUpdated")] = toIso(lastUpdated);
    json[QStringLiteral("subscriptionUserInfo")] = subscriptionUserInfo;
    return json;
}

std::optional<ProfileGroup> ProfileGroup::fromJson(const QJsonObject& json)
{
    if (!json.value(QStringLiteral("id")).isDouble()) {
        return std::nullopt;
    }

    ProfileGroup group;
    group.id = json.value(QStringLiteral("id")).toInt();
    group.name = json.value(QStringLiteral("name")).toString().trimmed();
    group.isSubscription = json.value(QStringLiteral("isSubscription")).toBool(false);
    group.subscriptionUrl = json.value(QStringLiteral("subscriptionUrl")).toString().trimmed();
    group.lastUpdated = fromIso(json.value(QStringLiteral("lastUpdated")));
    group.subscriptionUserInfo = json.value(QStringLiteral("subscriptionUserInfo")).toString();
    return group;
}

QJsonObject ProfileEntry::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("id")] = id;
    json[QStringLiteral("groupId")] = groupId;
    json[QStringLiteral("profile")] = profile.toJson();
    json[QStringLiteral("latencyMs")] = latencyMs;
    json[QStringLiteral("lastUsed")] = toIso(lastUsed);
    if (routing.has_value()) {
        json[QStringLiteral("routing")] = routing->toJson();
    }
    if (vpn.has_value()) {
        json[QStringLiteral("vpn")] = vpn->toJson();
    }
    return json;
}

std::optional<ProfileEntry> ProfileEntry::fromJson(const QJsonObject& json)
{
    auto profile = ProxyProfile::fromJson(json.value(QStringLiteral("profile")).toObject());
    if (!profile.has_value()) {
        return std::nullopt;
    }

    ProfileEntry entry;
    entry.id = json.value(QStringLiteral("id")).toInt(-1);
    entry.groupId = json.value(QStringLiteral("groupId")).toInt(0);
    entry.profile = profile.value();
    entry.profile.id = entry.id;
    entry.profile.groupId = entry.groupId;
    entry.latencyMs = json.value(QStringLiteral("latencyMs")).toInt(-1);
    entry.lastUsed = fromIso(json.value(QStringLiteral("lastUsed")));
    if (json.value(QStringLiteral("routing")).isObject()) {
        entry.routing = RoutingSettings::fromJson(json.value(QStringLiteral("routing")).toObject());
    }
    if (json.value(QStringLiteral("vpn")).isObject()) {
        entry.vpn = VpnSettings::fromJson(json.value(QStringLiteral("vpn")).toObject());
    }

    if (entry.id < 0) {
        return std::nullopt;
    }
    return entry;
}

ProfileStore::ProfileStore()
{
    ensureDefaultGroup();
}

int ProfileStore::addGroup(const QString& name, const QString& subscriptionUrl)
{
    ProfileGroup group;
    group.id = m_nextGroupId++;
    group.name = name.trimmed();
    group.subscriptionUrl = subscriptionUrl.trimmed();
    group.isSubscription = !group.subscriptionUrl.isEmpty();
    m_groups.insert(group.id, group);
    return group.id;
}

bool ProfileStore::removeGroup(int groupId)
{
    if (groupId == kDefaultGroupId || !m_groups.contains(groupId)) {
        return false;
    }

    clearGroup(groupId);
    m_groups.remove(groupId);
    if (m_currentGroupId == groupId) {
        m_currentGroupId = kDefaultGroupId;
    }
    return true;
}

int ProfileStore::clearGroup(int groupId)
{
    int removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->groupId == groupId) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

ProfileGroup *ProfileStore::group(int groupId)
{
    auto it = m_groups.find(groupId);
    return it == m_groups.end() ? nullptr : &it.value();
}

const ProfileGroup *ProfileStore::group(int groupId) const
{
    auto it = m_groups.constFind(groupId);
    return it == m_groups.constEnd() ? nullptr : &it.value();
}

QList<ProfileGroup> ProfileStore::groups() const
{
    return m_groups.values();
}

int ProfileStore::currentGroupId() const
{
    return m_currentGroupId;
}

bool ProfileStore::setCurrentGroupId(int groupId)
{
    if (!m_groups.contains(groupId)) {
        return false;
    }
    m_currentGroupId = groupId;
    return true;
}

int ProfileStore::addProfile(ProxyProfile profile, int groupId)
{
    const int targetGroup = groupId < 0 ? m_currentGroupId : groupId;
    if (!m_groups.contains(targetGroup)) {
        return -1;
    }

    ProfileEntry entry;
    entry.id = m_nextProfileId++;
    entry.groupId = targetGroup;
    entry.profile = std::move(profile);
    entry.profile.id = entry.id;
    entry.profile.groupId = targetGroup;
    m_entries.insert(entry.id, entry);
    return entry.id;
}

bool ProfileStore::removeProfile(int profileId)
{
    return m_entries.remove(profileId) > 0;
}

ProfileEntry *ProfileStore::entry(int profileId)
{
    auto it = m_entries.find(profileId);
    return it == m_entries.end() ? nullptr : &it.value();
}

const ProfileEntry *ProfileStore::entry(int profileId) const
{
    auto it = m_entries.constFind(profileId);
    return it == m_entries.constEnd() ? nullptr : &it.value();
}

QList<ProfileEntry> ProfileStore::profilesInGroup(int groupId) const
{
    QList<ProfileEntry> result;
    for (const ProfileEntry& entry : m_entries) {
        if (entry.groupId == groupId) {
            result.append(entry);
        }
    }
    return result;
}

int ProfileStore::profileCount() const
{
    return static_cast<int>(m_entries.size());
}

bool ProfileStore::save(const QString& directory, QString *errorMessage) const
{
    QDir dir(directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        setError(errorMessage, QStringLiteral("Failed to create profile directory: %1").arg(directory));
        return false;
    }

    QJsonArray groupsArray;
    for (const ProfileGroup& group : m_groups) {
        groupsArray.append(group.toJson());
    }

    QJsonArray profilesArray;
    for (const ProfileEntry& entry : m_entries) {
        profilesArray.append(entry.toJson());
    }

    QJsonObject meta;
    meta[QStringLiteral("nextGroupId")] = m_nextGroupId;
    meta[QStringLiteral("nextProfileId")] = m_nextProfileId;
    meta[QStringLiteral("currentGroupId")] = m_currentGroupId;

    if (!writeJsonFile(dir.filePath(QStringLiteral("groups.json")), QJsonDocument(groupsArray))) {
        setError(errorMessage, QStringLiteral("Failed to write groups.json."));
        return false;
    }
    if (!writeJsonFile(dir.filePath(QStringLiteral("profiles.json")), QJsonDocument(profilesArray))) {
        setError(errorMessage, QStringLiteral("Failed to write profiles.json."));
        return false;
    }
    if (!writeJsonFile(dir.filePath(QStringLiteral("meta.json")), QJsonDocument(meta))) {
        setError(errorMessage, QStringLiteral("Failed to write meta.json."));
        return false;
    }
    return true;
}

bool ProfileStore::load(const QString& directory, QString *errorMessage)
{
    const QDir dir(directory);
    QString error;

    const auto groupsDoc = readJsonFile(dir.filePath(QStringLiteral("groups.json")), &error);
    const auto profilesDoc = groupsDoc ? readJsonFile(dir.filePath(QStringLiteral("profiles.json")), &error) : std::nullopt;
    const auto metaDoc = profilesDoc ? readJsonFile(dir.filePath(QStringLiteral("meta.json")), &error) : std::nullopt;
    if (!metaDoc.has_value()) {
        setError(errorMessage, error);
        return false;
    }

    QMap<int, ProfileGroup> groups;
    for (const QJsonValue& value : groupsDoc->array()) {
        const auto group = ProfileGroup::fromJson(value.toObject());
        if (group.has_value()) {
            groups.insert(group->id, group.value());
        }
    }

    QMap<int, ProfileEntry> entries;
    for (const QJsonValue& value : profilesDoc->array()) {
        const auto entry = ProfileEntry::fromJson(value.toObject());
        if (entry.has_value()) {
            entries.insert(entry->id, entry.value());
        }
    }

    m_groups = groups;
    m_entries = entries;
    ensureDefaultGroup();

    // Entries whose group vanished fall back to the default group.
    for (ProfileEntry& entry : m_entries) {
        if (!m_groups.contains(entry.groupId)) {
            entry.groupId = kDefaultGroupId;
            entry.profile.groupId = kDefaultGroupId;
        }
    }

    const QJsonObject meta = metaDoc->object();
    const int maxGroupId = m_groups.isEmpty() ? 0 : m_groups.lastKey();
    const int maxProfileId = m_entries.isEmpty() ? -1 : m_entries.lastKey();
    m_nextGroupId = std::max(meta.value(QStringLiteral("nextGroupId")).toInt(1), maxGroupId + 1);
    m_nextProfileId = std::max(meta.value(QStringLiteral("nextProfileId")).toInt(0), maxProfileId + 1);
    m_currentGroupId = meta.value(QStringLiteral("currentGroupId")).toInt(kDefaultGroupId);
    if (!m_groups.contains(m_currentGroupId)) {
        m_currentGroupId = kDefaultGroupId;
    }
    return true;
}

void ProfileStore::ensureDefaultGroup()
{
    if (m_groups.contains(kDefaultGroupId)) {
        return;
    }

    ProfileGroup group;
    group.id = kDefaultGroupId;
    group.name = QStringLiteral("Default");
    m_groups.insert(group.id, group);
}

void ProfileStore::setError(QString *errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}
