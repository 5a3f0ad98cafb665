#include <QJsonArray>
#include <QJsonObject>
#include <QObject>
#include <QStringList>
#include <QtTest/QtTest>

#ifndef Q_MOC_RUN
import boxlink.core.runconfigbuilder;
import boxlink.core.settings;
import boxlink.core.vpnstatus;
#endif

namespace {
class FakeVpnStatus : public VpnStatusProvider {
public:
  bool active = true;
  QString device = QStringLiteral("tun0");
  int queries = 0;

  bool isActive(const QString&) override {
    ++queries;
    return active;
  }
  QString interfaceName(const QString&) override { return active ? device : QString(); }
  QStringList connectionNames() override { return {QStringLiteral("corp")}; }
};

QJsonObject proxyOutbound(const QString& tag = QString()) {
  QJsonObject outbound {
      {QStringLiteral("type"), QStringLiteral("trojan")},
      {QStringLiteral("server"), QStringLiteral("proxy.example.com")},
      {QStringLiteral("server_port"), 443},
      {QStringLiteral("password"), QStringLiteral("secret")},
  };
  if (!tag.isEmpty()) {
    outbound[QStringLiteral("tag")] = tag;
  }
  return outbound;
}

QJsonArray toArray(const QStringList& values) {
  QJsonArray out;
  for (const QString& value : values) {
    out.append(value);
  }
  return out;
}

QJsonObject findObjectByTag(const QJsonArray& arr, const QString& tag) {
  for (const auto& v : arr) {
    const QJsonObject obj = v.toObject();
    if (obj.value(QStringLiteral("tag")).toString() == tag) {
      return obj;
    }
  }
  return QJsonObject();
}

QJsonObject rule(const QString& key, const QStringList& values, const QString& outbound) {
  return QJsonObject {
      {key, toArray(values)},
      {QStringLiteral("outbound"), outbound},
  };
}

QJsonObject mainDns(const QJsonObject& config) {
  const QJsonArray servers = config.value(QStringLiteral("dns")).toObject().value(QStringLiteral("servers")).toArray();
  return findObjectByTag(servers, QStringLiteral("main-dns"));
}

VpnSettings corporateVpn() {
  VpnSettings vpn;
  vpn.enabled = true;
  vpn.connectionName = QStringLiteral("corp");
  vpn.directInterface = QStringLiteral("eth0");
  vpn.overVpnNetworks = {QStringLiteral("10.10.0.0/16")};
  vpn.overVpnDomains = {QStringLiteral("corp.example")};
  return vpn;
}
}

class RunConfigBuilderTest : public QObject {
  Q_OBJECT

private slots:
  void bypassLocalBuildsCompleteDocument();
  void proxyAllHonoursBypassSwitch();
  void customOrderWithActiveVpn();
  void inactiveVpnDropsVpnRouting();
  void untaggedOutboundFallsBackToProxy();
  void mainDnsFollowsProvider();
  void proxyHostResolvedLocally();
};

void RunConfigBuilderTest::bypassLocalBuildsCompleteDocument() {
  RoutingSettings routing;
  routing.mode = RoutingMode::BypassLocal;
  RunConfigBuilder::BuildOptions options;
  options.inboundAddress = QStringLiteral("0.0.0.0");
  options.inboundPort = 7890;
  options.logLevel = QStringLiteral("debug");

  const QJsonObject config = RunConfigBuilder::build(proxyOutbound(QStringLiteral("node")), routing,
                                                     VpnSettings {}, DnsSettings {}, options);

  for (const QString& key : {QStringLiteral("log"), QStringLiteral("dns"), QStringLiteral("inbounds"),
                             QStringLiteral("outbounds"), QStringLiteral("route")}) {
    QVERIFY2(config.contains(key), qPrintable(key));
  }
  QCOMPARE(config.value(QStringLiteral("log")).toObject().value(QStringLiteral("level")).toString(),
           QStringLiteral("debug"));

  const QJsonObject inbound = config.value(QStringLiteral("inbounds")).toArray().first().toObject();
  QCOMPARE(inbound.value(QStringLiteral("type")).toString(), QStringLiteral("mixed"));
  QCOMPARE(inbound.value(QStringLiteral("listen")).toString(), QStringLiteral("0.0.0.0"));
  QCOMPARE(inbound.value(QStringLiteral("listen_port")).toInt(), 7890);

  const QJsonArray outbounds = config.value(QStringLiteral("outbounds")).toArray();
  QCOMPARE(outbounds.size(), 2);
  QCOMPARE(outbounds.at(0).toObject().value(QStringLiteral("tag")).toString(), QStringLiteral("node"));
  const QJsonObject direct = findObjectByTag(outbounds, QStringLiteral("direct"));
  QCOMPARE(direct.value(QStringLiteral("type")).toString(), QStringLiteral("direct"));
  QVERIFY(!direct.contains(QStringLiteral("bind_interface")));

  const QJsonObject route = config.value(QStringLiteral("route")).toObject();
  QCOMPARE(route.value(QStringLiteral("final")).toString(), QStringLiteral("node"));
  const QJsonArray rules = route.value(QStringLiteral("rules")).toArray();
  QCOMPARE(rules.size(), 1);
  QCOMPARE(rules.at(0).toObject(),
           rule(QStringLiteral("ip_cidr"), RunConfigBuilder::localNetworks(), QStringLiteral("direct")));
}

void RunConfigBuilderTest::proxyAllHonoursBypassSwitch() {
  RoutingSettings routing;
  routing.mode = RoutingMode::ProxyAll;
  routing.proxyList = {QStringLiteral("ignored.example")};

  QJsonObject config = RunConfigBuilder::build(proxyOutbound(), routing, VpnSettings {}, DnsSettings {},
                                               RunConfigBuilder::BuildOptions {});
  QVERIFY(config.value(QStringLiteral("route")).toObject().value(QStringLiteral("rules")).toArray().isEmpty());

  routing.bypassLocalNetworks = true;
  config = RunConfigBuilder::build(proxyOutbound(), routing, VpnSettings {}, DnsSettings {},
                                   RunConfigBuilder::BuildOptions {});
  QCOMPARE(config.value(QStringLiteral("route")).toObject().value(QStringLiteral("rules")).toArray().size(), 1);
}

void RunConfigBuilderTest::customOrderWithActiveVpn() {
  RoutingSettings routing;
  routing.mode = RoutingMode::Custom;
  routing.directList = {QStringLiteral("lan.example"), QStringLiteral("192.168.5.0/24")};
  routing.proxyList = {QStringLiteral("*.blocked.example")};
  routing.vpnList = {QStringLiteral("intra.example")};
  routing.ruleOrder = {QStringLiteral("proxy"), QStringLiteral("direct")};

  FakeVpnStatus vpnStatus;
  const QJsonObject config = RunConfigBuilder::build(proxyOutbound(QStringLiteral("node")), routing,
                                                     corporateVpn(), DnsSettings {},
                                                     RunConfigBuilder::BuildOptions {}, &vpnStatus);

  const QJsonArray rules = config.value(QStringLiteral("route")).toObject().value(QStringLiteral("rules")).toArray();
  const QJsonArray expected {
      rule(QStringLiteral("ip_cidr"), {QStringLiteral("10.10.0.0/16")}, QStringLiteral("vpn")),
      rule(QStringLiteral("domain_suffix"), {QStringLiteral("corp.example")}, QStringLiteral("vpn")),
      rule(QStringLiteral("ip_cidr"), RunConfigBuilder::localNetworks(), QStringLiteral("direct")),
      rule(QStringLiteral("domain_suffix"), {QStringLiteral("blocked.example")}, QStringLiteral("node")),
      rule(QStringLiteral("ip_cidr"), {QStringLiteral("192.168.5.0/24")}, QStringLiteral("direct")),
      rule(QStringLiteral("domain_suffix"), {QStringLiteral("lan.example")}, QStringLiteral("direct")),
      rule(QStringLiteral("domain_suffix"), {QStringLiteral("intra.example")}, QStringLiteral("vpn")),
  };
  QCOMPARE(rules, expected);

  const QJsonArray outbounds = config.value(QStringLiteral("outbounds")).toArray();
  QCOMPARE(outbounds.size(), 3);
  QCOMPARE(findObjectByTag(outbounds, QStringLiteral("vpn")).value(QStringLiteral("bind_interface")).toString(),
           QStringLiteral("tun0"));
  QCOMPARE(findObjectByTag(outbounds, QStringLiteral("direct")).value(QStringLiteral("bind_interface")).toString(),
           QStringLiteral("eth0"));

  // Domains reached over the VPN resolve through the system resolver.
  const QJsonArray dnsRules = config.value(QStringLiteral("dns")).toObject().value(QStringLiteral("rules")).toArray();
  const QJsonObject localDomains {
      {QStringLiteral("domain_suffix"), QJsonArray {QStringLiteral("corp.example"), QStringLiteral("intra.example")}},
      {QStringLiteral("server"), QStringLiteral("local-dns")},
  };
  QVERIFY(dnsRules.contains(localDomains));
}

void RunConfigBuilderTest::inactiveVpnDropsVpnRouting() {
  RoutingSettings routing;
  routing.mode = RoutingMode::Custom;
  routing.vpnList = {QStringLiteral("intra.example")};

  FakeVpnStatus vpnStatus;
  vpnStatus.active = false;
  const QJsonObject config = RunConfigBuilder::build(proxyOutbound(), routing, corporateVpn(), DnsSettings {},
                                                     RunConfigBuilder::BuildOptions {}, &vpnStatus);
  QCOMPARE(vpnStatus.queries, 1);

  const QJsonArray outbounds = config.value(QStringLiteral("outbounds")).toArray();
  QCOMPARE(outbounds.size(), 2);
  QVERIFY(findObjectByTag(outbounds, QStringLiteral("vpn")).isEmpty());
  QVERIFY(!findObjectByTag(outbounds, QStringLiteral("direct")).contains(QStringLiteral("bind_interface")));

  const QJsonArray rules = config.value(QStringLiteral("route")).toObject().value(QStringLiteral("rules")).toArray();
  for (const auto& value : rules) {
    QVERIFY(value.toObject().value(QStringLiteral("outbound")).toString() != QStringLiteral("vpn"));
  }

  // Disabled integration never asks the provider.
  VpnSettings disabled = corporateVpn();
  disabled.enabled = false;
  RunConfigBuilder::build(proxyOutbound(), routing, disabled, DnsSettings {}, RunConfigBuilder::BuildOptions {},
                          &vpnStatus);
  QCOMPARE(vpnStatus.queries, 1);
}

void RunConfigBuilderTest::untaggedOutboundFallsBackToProxy() {
  const QJsonObject config = RunConfigBuilder::build(proxyOutbound(), RoutingSettings {}, VpnSettings {},
                                                     DnsSettings {}, RunConfigBuilder::BuildOptions {});
  const QJsonArray outbounds = config.value(QStringLiteral("outbounds")).toArray();
  QCOMPARE(outbounds.at(0).toObject().value(QStringLiteral("tag")).toString(), QStringLiteral("proxy"));
  QCOMPARE(config.value(QStringLiteral("route")).toObject().value(QStringLiteral("final")).toString(),
           QStringLiteral("proxy"));
}

void RunConfigBuilderTest::mainDnsFollowsProvider() {
  DnsSettings dns;
  dns.provider = QStringLiteral("cloudflare");
  dns.useProxy = true;
  QJsonObject server = mainDns(RunConfigBuilder::build(proxyOutbound(QStringLiteral("node")), RoutingSettings {},
                                                       VpnSettings {}, dns, RunConfigBuilder::BuildOptions {}));
  QCOMPARE(server.value(QStringLiteral("type")).toString(), QStringLiteral("https"));
  QCOMPARE(server.value(QStringLiteral("server")).toString(), QStringLiteral("cloudflare-dns.com"));
  QCOMPARE(server.value(QStringLiteral("server_port")).toInt(), 443);
  QCOMPARE(server.value(QStringLiteral("path")).toString(), QStringLiteral("/dns-query"));
  QCOMPARE(server.value(QStringLiteral("detour")).toString(), QStringLiteral("node"));

  dns.useProxy = false;
  server = mainDns(RunConfigBuilder::build(proxyOutbound(), RoutingSettings {}, VpnSettings {}, dns,
                                           RunConfigBuilder::BuildOptions {}));
  QVERIFY(!server.contains(QStringLiteral("detour")));

  dns.useProxy = true;
  dns.provider = QStringLiteral("system");
  server = mainDns(RunConfigBuilder::build(proxyOutbound(), RoutingSettings {}, VpnSettings {}, dns,
                                           RunConfigBuilder::BuildOptions {}));
  QCOMPARE(server.value(QStringLiteral("type")).toString(), QStringLiteral("local"));
  QVERIFY(!server.contains(QStringLiteral("detour")));

  dns.customUrl = QStringLiteral("tls://1.1.1.1");
  server = mainDns(RunConfigBuilder::build(proxyOutbound(), RoutingSettings {}, VpnSettings {}, dns,
                                           RunConfigBuilder::BuildOptions {}));
  QCOMPARE(server.value(QStringLiteral("type")).toString(), QStringLiteral("tls"));
  QCOMPARE(server.value(QStringLiteral("server_port")).toInt(), 853);

  dns.customUrl = QStringLiteral("8.8.8.8");
  server = mainDns(RunConfigBuilder::build(proxyOutbound(), RoutingSettings {}, VpnSettings {}, dns,
                                           RunConfigBuilder::BuildOptions {}));
  QCOMPARE(server.value(QStringLiteral("type")).toString(), QStringLiteral("udp"));
  QCOMPARE(server.value(QStringLiteral("server")).toString(), QStringLiteral("8.8.8.8"));
  QCOMPARE(server.value(QStringLiteral("server_port")).toInt(), 53);
}

void RunConfigBuilderTest::proxyHostResolvedLocally() {
  QJsonObject config = RunConfigBuilder::build(proxyOutbound(), RoutingSettings {}, VpnSettings {},
                                               DnsSettings {}, RunConfigBuilder::BuildOptions {});
  QJsonObject dns = config.value(QStringLiteral("dns")).toObject();
  QCOMPARE(dns.value(QStringLiteral("final")).toString(), QStringLiteral("main-dns"));
  QCOMPARE(dns.value(QStringLiteral("rules")).toArray().first().toObject(),
           (QJsonObject {
               {QStringLiteral("domain"), QJsonArray {QStringLiteral("proxy.example.com")}},
               {QStringLiteral("server"), QStringLiteral("local-dns")},
           }));

  QJsonObject literal = proxyOutbound();
  literal[QStringLiteral("server")] = QStringLiteral("203.0.113.7");
  config = RunConfigBuilder::build(literal, RoutingSettings {}, VpnSettings {}, DnsSettings {},
                                   RunConfigBuilder::BuildOptions {});
  dns = config.value(QStringLiteral("dns")).toObject();
  QVERIFY(dns.value(QStringLiteral("rules")).toArray().isEmpty());
}

QTEST_GUILESS_MAIN(RunConfigBuilderTest)
#include "tst_runconfigbuilder.moc"
