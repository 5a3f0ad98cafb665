module;
#include <QProcess>
#include <QString>
#include <QStringList>

module boxlink.core.vpnstatus;

namespace {
constexpr int kToolStartTimeoutMs = 5000;
constexpr int kToolFinishTimeoutMs = 5000;

QString deviceFromOutput(const QString& output)
{
    // `nmcli -t` prints `FIELD:value` for single-field queries on some builds.
    const QString firstLine = output.section(QLatin1Char('\n'), 0, 0).trimmed();
    const QString device = firstLine.contains(QLatin1Char(':'))
        ? firstLine.section(QLatin1Char(':'), 1).trimmed()
        : firstLine;
    return device == QStringLiteral("--") ? QString() : device;
}
}

NmcliVpnStatusProvider::NmcliVpnStatusProvider(SystemLog *log)
    : m_log(log)
{
}

bool NmcliVpnStatusProvider::isActive(const QString& connectionName)
{
    const QString name = connectionName.trimmed();
    if (name.isEmpty()) {
        return false;
    }

    QString output;
    if (!runTool(QStringLiteral("nmcli"),
                 {QStringLiteral("-t"), QStringLiteral("-f"), QStringLiteral("NAME"),
                  QStringLiteral("connection"), QStringLiteral("show"), QStringLiteral("--active")},
                 &output)) {
        return false;
    }

    const QStringList active = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString& line : active) {
        if (line.trimmed() == name) {
            return true;
        }
    }
    return false;
}

QString NmcliVpnStatusProvider::interfaceName(const QString& connectionName)
{
    if (!isActive(connectionName)) {
        return QString();
    }

    const QString name = connectionName.trimmed();
    QString output;
    if (runTool(QStringLiteral("nmcli"),
                {QStringLiteral("-t"), QStringLiteral("-f"), QStringLiteral("GENERAL.DEVICES"),
                 QStringLiteral("connection"), QStringLiteral("show"), name},
                &output)) {
        const QString device = deviceFromOutput(output);
        if (!device.isEmpty()) {
            return device;
        }
    }

    if (runTool(QStringLiteral("nmcli"),
                {QStringLiteral("-t"), QStringLiteral("-f"), QStringLiteral("DEVICE"),
                 QStringLiteral("connection"), QStringLiteral("show"), QStringLiteral("--active"), name},
                &output)) {
        const QString device = deviceFromOutput(output);
        if (!device.isEmpty()) {
            return device;
        }
    }

    // Plugin based VPNs (OpenVPN, OpenConnect) often report no device; fall
    // back to the first tun/tap link.
    if (runTool(QStringLiteral("ip"), {QStringLiteral("-o"), QStringLiteral("link"), QStringLiteral("show")}, &output)) {
        const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
        for (const QString& line : lines) {
            const QString link = line.section(QLatin1Char(':'), 1, 1).trimmed().section(QLatin1Char('@'), 0, 0);
            if (link.startsWith(QStringLiteral("tun")) || link.startsWith(QStringLiteral("tap"))) {
                return link;
            }
        }
    }

    appendSystemLog(m_log, QStringLiteral("[VPN] Could not determine interface for %1").arg(name));
    return QString();
}

QStringList NmcliVpnStatusProvider::connectionNames()
{
    QString output;
    if (!runTool(QStringLiteral("nmcli"),
                 {QStringLiteral("-t"), QStringLiteral("-f"), QStringLiteral("NAME,TYPE"),
                  QStringLiteral("connection"), QStringLiteral("show")},
                 &output)) {
        return {};
    }

    QStringList names;
    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString& line : lines) {
        const int colon = line.lastIndexOf(QLatin1Char(':'));
        if (colon <= 0) {
            continue;
        }
        const QString type = line.mid(colon + 1).trimmed();
        if (type == QStringLiteral("vpn") || type == QStringLiteral("wireguard") || type == QStringLiteral("tun")) {
            names.append(line.left(colon));
        }
    }
    return names;
}

bool NmcliVpnStatusProvider::runTool(const QString& program, const QStringList& arguments, QString *output) const
{
    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted(kToolStartTimeoutMs)) {
        appendSystemLog(m_log, QStringLiteral("[VPN] %1 is not available.").arg(program));
        return false;
    }

    if (!process.waitForFinished(kToolFinishTimeoutMs)) {
        process.kill();
        process.waitForFinished(500);
        appendSystemLog(m_log, QStringLiteral("[VPN] %1 timed out.").arg(program));
        return false;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        return false;
    }

    if (output) {
        *output = QString::fromUtf8(process.readAllStandardOutput()).trimmed();
    }
    return true;
}
