module;
#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QTimer>

#include <utility>

module boxlink.core.connectionmonitor;

namespace {
constexpr int kMillisecondsPerSecond = 1000;

bool sameHealth(const ConnectionStatus& left, const ConnectionStatus& right)
{
    return left.proxyOk == right.proxyOk && left.vpnOk == right.vpnOk;
}
}

ConnectionMonitor::ConnectionMonitor(EngineSupervisor *supervisor, VpnStatusProvider *vpnStatus,
                                     SystemLog *log, QObject *parent)
    : QObject(parent)
    , m_supervisor(supervisor)
    , m_vpnStatus(vpnStatus)
    , m_log(log)
{
    connect(&m_timer, &QTimer::timeout, this, &ConnectionMonitor::onTick);
}

void ConnectionMonitor::setMonitoringSettings(const MonitoringSettings& settings)
{
    m_settings = settings;
    if (!m_timer.isActive()) {
        return;
    }
    if (!m_settings.enabled) {
        stop();
        return;
    }
    m_timer.setInterval(qMax(1, m_settings.checkIntervalSeconds) * kMillisecondsPerSecond);
}

const MonitoringSettings& ConnectionMonitor::monitoringSettings() const
{
    return m_settings;
}

void ConnectionMonitor::setVpnSettings(const VpnSettings& settings)
{
    m_vpnSettings = settings;
}

const VpnSettings& ConnectionMonitor::vpnSettings() const
{
    return m_vpnSettings;
}

void ConnectionMonitor::start()
{
    if (m_timer.isActive()) {
        return;
    }
    if (!m_settings.enabled) {
        appendSystemLog(m_log, QStringLiteral("[Monitor] Monitoring is disabled, not starting."));
        return;
    }

    const int intervalSeconds = qMax(1, m_settings.checkIntervalSeconds);
    appendSystemLog(m_log, QStringLiteral("[Monitor] Started, interval %1 s.").arg(intervalSeconds));
    m_timer.start(intervalSeconds * kMillisecondsPerSecond);
    onTick();
}

void ConnectionMonitor::stop()
{
    if (!m_timer.isActive()) {
        return;
    }
    m_timer.stop();
    m_status = ConnectionStatus();
    m_previousStatus = ConnectionStatus();
    appendSystemLog(m_log, QStringLiteral("[Monitor] Stopped."));
}

bool ConnectionMonitor::isActive() const
{
    return m_timer.isActive();
}

ConnectionStatus ConnectionMonitor::checkNow()
{
    const bool wasEnabled = m_settings.enabled;
    m_settings.enabled = true;
    const bool sampled = sample();
    m_settings.enabled = wasEnabled;

    if (sampled) {
        notifyObservers();
    }
    return m_status;
}

ConnectionStatus ConnectionMonitor::status() const
{
    return m_status;
}

ConnectionStatus ConnectionMonitor::previousStatus() const
{
    return m_previousStatus;
}

int ConnectionMonitor::addStatusObserver(StatusObserver observer)
{
    return m_observers.add(std::move(observer));
}

bool ConnectionMonitor::removeStatusObserver(int handle)
{
    return m_observers.remove(handle);
}

void ConnectionMonitor::onTick()
{
    if (!m_settings.enabled) {
        stop();
        return;
    }
    if (sample() && !sameHealth(m_previousStatus, m_status)) {
        notifyObservers();
    }
}

bool ConnectionMonitor::sample()
{
    if (m_checking || !m_settings.enabled) {
        return false;
    }
    m_checking = true;

    ConnectionStatus next;
    checkProxy(next);
    checkVpn(next);
    next.lastCheckTime = QDateTime::currentDateTimeUtc();

    m_previousStatus = m_status;
    m_status = next;
    m_checking = false;
    return true;
}

void ConnectionMonitor::checkProxy(ConnectionStatus& status)
{
    if (m_supervisor == nullptr || !m_supervisor->isRunning()) {
        status.proxyError = QStringLiteral("Engine is not running.");
        return;
    }

    const QJsonObject version = m_supervisor->version();
    if (version.isEmpty()) {
        status.proxyError = QStringLiteral("Control API is not responding.");
        appendSystemLog(m_log, QStringLiteral("[Monitor] Proxy check failed: %1").arg(status.proxyError));
        return;
    }
    status.proxyOk = true;
}

void ConnectionMonitor::checkVpn(ConnectionStatus& status)
{
    const QString connection = m_vpnSettings.connectionName.trimmed();
    if (!m_vpnSettings.enabled || connection.isEmpty()) {
        status.vpnOk = true;
        return;
    }

    if (m_vpnStatus != nullptr && m_vpnStatus->isActive(connection)) {
        status.vpnOk = true;
        return;
    }
    status.vpnError = QStringLiteral("VPN '%1' is not active.").arg(connection);
}

void ConnectionMonitor::notifyObservers()
{
    m_observers.notify(m_log, m_previousStatus, m_status);
}
