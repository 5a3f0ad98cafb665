module;
#include <QString>

#include <utility>

module boxlink.core.proxystate;

ProxyState::ProxyState(SystemLog *log)
    : m_log(log)
{
}

void ProxyState::setRunning(int profileId)
{
    update(true, profileId);
}

void ProxyState::setStopped()
{
    update(false, -1);
}

bool ProxyState::isRunning() const
{
    return m_running;
}

int ProxyState::startedProfileId() const
{
    return m_profileId;
}

int ProxyState::addObserver(Observer observer)
{
    return m_observers.add(std::move(observer));
}

bool ProxyState::removeObserver(int handle)
{
    return m_observers.remove(handle);
}

void ProxyState::update(bool running, int profileId)
{
    if (m_running == running && m_profileId == profileId) {
        return;
    }
    m_running = running;
    m_profileId = profileId;
    appendSystemLog(m_log, running
        ? QStringLiteral("[Proxy] Running profile %1.").arg(profileId)
        : QStringLiteral("[Proxy] Stopped."));
    m_observers.notify(m_log, m_running, m_profileId);
}
