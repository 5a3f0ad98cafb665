module;
#include <QString>
#include <QStringList>

#include <algorithm>

module boxlink.core.systemlog;

SystemLog::SystemLog(int maxLines, QObject *parent)
    : QObject(parent)
    , m_maxLines(std::max(1, maxLines))
{
}

void SystemLog::append(const QString& message)
{
    if (!m_enabled) {
        return;
    }

    const bool duplicate = !m_lines.isEmpty() && m_lines.last() == message;
    if (duplicate) {
        return;
    }

    m_lines.append(message);
    while (m_lines.size() > m_maxLines) {
        m_lines.removeFirst();
    }

    emit lineAppended(message);
    emit logsChanged();
}

QStringList SystemLog::lines() const
{
    return m_lines;
}

void SystemLog::clear()
{
    if (m_lines.isEmpty()) {
        return;
    }
    m_lines.clear();
    emit logsChanged();
}

bool SystemLog::isEnabled() const
{
    return m_enabled;
}

void SystemLog::setEnabled(bool enabled)
{
    if (m_enabled == enabled) {
        return;
    }
    m_enabled = enabled;
    emit enabledChanged();
}

int SystemLog::maxLines() const
{
    return m_maxLines;
}

void appendSystemLog(SystemLog *log, const QString& message)
{
    if (log) {
        log->append(message);
    }
}
