module;
#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <optional>

module boxlink.core.proxysession;
import boxlink.core.outboundcompiler;
import boxlink.core.runconfigbuilder;

namespace {
void setError(QString *errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}
}

ProxySession::ProxySession(ProfileStore& store, EngineSupervisor& supervisor, ProxyState& state,
                           ConnectionMonitor *monitor, VpnStatusProvider *vpnStatus, SystemLog *log)
    : m_store(store)
    , m_supervisor(supervisor)
    , m_state(state)
    , m_monitor(monitor)
    , m_vpnStatus(vpnStatus)
    , m_log(log)
{
    m_stopObserver = m_supervisor.addStopObserver([this]() { onEngineStopped(); });
}

ProxySession::~ProxySession()
{
    m_supervisor.removeStopObserver(m_stopObserver);
}

void ProxySession::setSettings(const SessionSettings& settings)
{
    m_settings = settings;
    m_supervisor.setCoreSettings(settings.core);
    if (m_monitor) {
        m_monitor->setMonitoringSettings(settings.monitoring);
    }
}

const SessionSettings& ProxySession::settings() const
{
    return m_settings;
}

std::optional<QJsonObject> ProxySession::buildConfig(int entryId, QString *errorMessage) const
{
    const ProfileEntry *entry = m_store.entry(entryId);
    if (entry == nullptr) {
        setError(errorMessage, QStringLiteral("Profile %1 not found.").arg(entryId));
        return std::nullopt;
    }

    const OutboundCompiler::CompileResult compiled =
        OutboundCompiler::compileOutbound(entry->profile, m_settings.core.skipCertVerify);
    if (!compiled.ok()) {
        setError(errorMessage, compiled.error);
        return std::nullopt;
    }

    RoutingSettings routing = entry->routing.value_or(m_settings.routing);
    if (!entry->routing && routing.mode == RoutingMode::Custom && !m_settings.configDirectory.isEmpty()) {
        routing.loadListsFromDirectory(m_settings.configDirectory);
    }
    const VpnSettings vpn = entry->vpn.value_or(m_settings.vpn);

    return RunConfigBuilder::build(compiled.outbound, routing, vpn, m_settings.dns,
                                   RunConfigBuilder::BuildOptions::fromCoreSettings(m_settings.core),
                                   m_vpnStatus, m_log);
}

EngineSupervisor::Result ProxySession::connectProfile(int entryId)
{
    QString error;
    const std::optional<QJsonObject> config = buildConfig(entryId, &error);
    if (!config) {
        appendSystemLog(m_log, QStringLiteral("[Session] Cannot connect: %1").arg(error));
        return EngineSupervisor::Result {false, EngineSupervisor::FailureKind::ConfigWriteFailed, error};
    }

    const EngineSupervisor::Result result = m_supervisor.start(*config);
    if (!result.success) {
        m_state.setStopped();
        return result;
    }

    if (ProfileEntry *entry = m_store.entry(entryId)) {
        entry->lastUsed = QDateTime::currentDateTimeUtc();
        appendSystemLog(m_log, QStringLiteral("[Session] Connected: %1").arg(entry->profile.displayTypeAndName()));
        if (m_monitor) {
            m_monitor->setVpnSettings(entry->vpn.value_or(m_settings.vpn));
        }
    }
    m_state.setRunning(entryId);
    if (m_monitor) {
        m_monitor->start();
    }
    return result;
}

EngineSupervisor::Result ProxySession::disconnect()
{
    if (m_monitor) {
        m_monitor->stop();
    }
    const EngineSupervisor::Result result = m_supervisor.stop();
    if (result.success) {
        m_state.setStopped();
    }
    return result;
}

EngineSupervisor::Result ProxySession::reload()
{
    if (!m_state.isRunning()) {
        return EngineSupervisor::Result {false, EngineSupervisor::FailureKind::None,
                                         QStringLiteral("No profile is running.")};
    }

    const int entryId = m_state.startedProfileId();
    QString error;
    const std::optional<QJsonObject> config = buildConfig(entryId, &error);
    if (!config) {
        appendSystemLog(m_log, QStringLiteral("[Session] Cannot reload: %1").arg(error));
        return EngineSupervisor::Result {false, EngineSupervisor::FailureKind::ConfigWriteFailed, error};
    }

    const EngineSupervisor::Result result = m_supervisor.reloadConfig(*config);
    if (result.success) {
        m_state.setRunning(entryId);
    }
    return result;
}

void ProxySession::onEngineStopped()
{
    if (m_monitor) {
        m_monitor->stop();
    }
    m_state.setStopped();
}
