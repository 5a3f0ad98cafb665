#include <QJsonObject>
#include <QObject>
#include <QPair>
#include <QStringList>
#include <QtTest/QtTest>

#include <stdexcept>

#include "support/fakecontrolserver.h"

#ifndef Q_MOC_RUN
import boxlink.core.connectionmonitor;
import boxlink.core.enginesupervisor;
import boxlink.core.proxystate;
import boxlink.core.settings;
import boxlink.core.systemlog;
import boxlink.core.vpnstatus;
#endif

namespace {
class FakeVpnStatus : public VpnStatusProvider {
public:
  bool active = false;
  QStringList queried;

  bool isActive(const QString& connectionName) override {
    queried.append(connectionName);
    return active;
  }
  QString interfaceName(const QString&) override { return active ? QStringLiteral("tun0") : QString(); }
  QStringList connectionNames() override { return {QStringLiteral("corp")}; }
};

VpnSettings corpVpn() {
  VpnSettings vpn;
  vpn.enabled = true;
  vpn.connectionName = QStringLiteral(" corp ");
  return vpn;
}

MonitoringSettings fastMonitoring(bool enabled = true) {
  MonitoringSettings settings;
  settings.enabled = enabled;
  settings.checkIntervalSeconds = 1;
  return settings;
}

quint16 freePort() {
  QTcpServer server;
  if (!server.listen(QHostAddress::LocalHost, 0)) {
    return 0;
  }
  const quint16 port = server.serverPort();
  server.close();
  return port;
}
}

class ConnectionMonitorTest : public QObject {
  Q_OBJECT

private slots:
  void checkNowAlwaysNotifies();
  void disabledMonitorDoesNotStart();
  void vpnCheckFollowsProvider();
  void ticksNotifyOnlyOnChange();
  void runningEngineIsHealthy();
  void proxyStateNotifiesTransitions();
  void throwingObserversAreIsolated();
};

void ConnectionMonitorTest::checkNowAlwaysNotifies() {
  EngineSupervisor supervisor(CoreSettings {});
  FakeVpnStatus vpn;
  ConnectionMonitor monitor(&supervisor, &vpn);
  monitor.setMonitoringSettings(fastMonitoring(false));

  int notifications = 0;
  monitor.addStatusObserver([&notifications](const ConnectionStatus&, const ConnectionStatus&) { ++notifications; });

  const ConnectionStatus first = monitor.checkNow();
  const ConnectionStatus second = monitor.checkNow();
  QCOMPARE(notifications, 2);
  QVERIFY(!second.proxyOk);
  QCOMPARE(second.proxyError, QStringLiteral("Engine is not running."));
  QVERIFY(second.vpnOk);
  QVERIFY(second.lastCheckTime.isValid());
  QCOMPARE(monitor.previousStatus().lastCheckTime, first.lastCheckTime);
  QVERIFY(vpn.queried.isEmpty());
  QVERIFY(!monitor.isActive());
  QVERIFY(!monitor.monitoringSettings().enabled);
}

void ConnectionMonitorTest::disabledMonitorDoesNotStart() {
  EngineSupervisor supervisor(CoreSettings {});
  ConnectionMonitor monitor(&supervisor, nullptr);
  monitor.setMonitoringSettings(fastMonitoring(false));

  int notifications = 0;
  monitor.addStatusObserver([&notifications](const ConnectionStatus&, const ConnectionStatus&) { ++notifications; });
  monitor.start();
  QVERIFY(!monitor.isActive());
  QCOMPARE(notifications, 0);
  QVERIFY(!monitor.status().lastCheckTime.isValid());

  // Disabling a running monitor stops it.
  monitor.setMonitoringSettings(fastMonitoring(true));
  monitor.start();
  QVERIFY(monitor.isActive());
  monitor.setMonitoringSettings(fastMonitoring(false));
  QVERIFY(!monitor.isActive());
}

void ConnectionMonitorTest::vpnCheckFollowsProvider() {
  EngineSupervisor supervisor(CoreSettings {});
  FakeVpnStatus vpn;
  ConnectionMonitor monitor(&supervisor, &vpn);
  monitor.setVpnSettings(corpVpn());

  ConnectionStatus status = monitor.checkNow();
  QVERIFY(!status.vpnOk);
  QCOMPARE(status.vpnError, QStringLiteral("VPN 'corp' is not active."));
  QCOMPARE(vpn.queried, QStringList {QStringLiteral("corp")});

  vpn.active = true;
  status = monitor.checkNow();
  QVERIFY(status.vpnOk);
  QVERIFY(status.vpnError.isEmpty());

  VpnSettings unnamed = corpVpn();
  unnamed.connectionName.clear();
  monitor.setVpnSettings(unnamed);
  vpn.active = false;
  QVERIFY(monitor.checkNow().vpnOk);

  ConnectionMonitor withoutProvider(&supervisor, nullptr);
  withoutProvider.setVpnSettings(corpVpn());
  QVERIFY(!withoutProvider.checkNow().vpnOk);
}

void ConnectionMonitorTest::ticksNotifyOnlyOnChange() {
  EngineSupervisor supervisor(CoreSettings {});
  FakeVpnStatus vpn;
  ConnectionMonitor monitor(&supervisor, &vpn);
  monitor.setMonitoringSettings(fastMonitoring());
  monitor.setVpnSettings(corpVpn());

  QList<QPair<bool, bool>> transitions;
  const int handle = monitor.addStatusObserver(
      [&transitions](const ConnectionStatus& previous, const ConnectionStatus& current) {
        transitions.append({previous.vpnOk, current.vpnOk});
      });

  // The immediate first sample matches the all-false initial snapshot.
  monitor.start();
  QVERIFY(monitor.isActive());
  QVERIFY(monitor.status().lastCheckTime.isValid());
  QCOMPARE(transitions.size(), 0);

  vpn.active = true;
  QTRY_COMPARE_WITH_TIMEOUT(transitions.size(), 1, 5000);
  QCOMPARE(transitions.constFirst(), qMakePair(false, true));

  const int queries = static_cast<int>(vpn.queried.size());
  QTRY_VERIFY_WITH_TIMEOUT(vpn.queried.size() > queries, 5000);
  QCOMPARE(transitions.size(), 1);

  QVERIFY(monitor.removeStatusObserver(handle));
  QVERIFY(!monitor.removeStatusObserver(handle));
  monitor.stop();
  QVERIFY(!monitor.isActive());
  QVERIFY(!monitor.status().lastCheckTime.isValid());
  QVERIFY(!monitor.previousStatus().lastCheckTime.isValid());
}

void ConnectionMonitorTest::runningEngineIsHealthy() {
  const quint16 port = freePort();
  QVERIFY(port != 0);
  CoreSettings settings;
  settings.engineExecutablePath = QStringLiteral(BOXLINK_FAKE_ENGINE_PATH);
  settings.controlApiPort = port;

  EngineSupervisor supervisor(settings);
  const EngineSupervisor::Result started = supervisor.start(QJsonObject());
  QVERIFY2(started.success, qPrintable(started.message));

  ConnectionMonitor monitor(&supervisor, nullptr);
  const ConnectionStatus status = monitor.checkNow();
  QVERIFY(status.proxyOk);
  QVERIFY(status.proxyError.isEmpty());
  QVERIFY(status.vpnOk);

  QVERIFY(supervisor.stop().success);
  QCOMPARE(monitor.checkNow().proxyError, QStringLiteral("Engine is not running."));
}

void ConnectionMonitorTest::proxyStateNotifiesTransitions() {
  ProxyState state;
  QList<QPair<bool, int>> changes;
  const int handle = state.addObserver([&changes](bool running, int profileId) {
    changes.append({running, profileId});
  });

  QVERIFY(!state.isRunning());
  QCOMPARE(state.startedProfileId(), -1);

  state.setRunning(4);
  state.setRunning(4);
  QVERIFY(state.isRunning());
  QCOMPARE(state.startedProfileId(), 4);
  state.setRunning(7);
  state.setStopped();
  state.setStopped();

  const QList<QPair<bool, int>> expected {{true, 4}, {true, 7}, {false, -1}};
  QCOMPARE(changes, expected);

  QVERIFY(state.removeObserver(handle));
  state.setRunning(1);
  QCOMPARE(changes.size(), 3);
}

void ConnectionMonitorTest::throwingObserversAreIsolated() {
  SystemLog log;
  ProxyState state(&log);

  QList<int> reached;
  state.addObserver([](bool, int) { throw std::runtime_error("standard failure"); });
  state.addObserver([](bool, int) { throw 42; });
  state.addObserver([&reached](bool, int profileId) { reached.append(profileId); });

  state.setRunning(3);
  state.setStopped();
  QCOMPARE(reached, (QList<int> {3, -1}));

  const QString lines = log.lines().join(QLatin1Char('\n'));
  QVERIFY2(lines.contains(QStringLiteral("standard failure")), qPrintable(lines));
  QVERIFY2(lines.contains(QStringLiteral("unknown exception")), qPrintable(lines));
}

QTEST_GUILESS_MAIN(ConnectionMonitorTest)
#include "tst_connectionmonitor.moc"
