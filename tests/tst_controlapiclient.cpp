#include <QElapsedTimer>
#include <QJsonDocument>
#include <QJsonObject>
#include <QObject>
#include <QtTest/QtTest>

#include <memory>

#include "support/fakecontrolserver.h"

#ifndef Q_MOC_RUN
import boxlink.core.controlapiclient;
#endif

namespace {
QByteArray json(const QJsonObject& object) {
  return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

// A port nothing listens on: bind an ephemeral one, then release it.
quint16 closedPort() {
  QTcpServer server;
  if (!server.listen(QHostAddress::LocalHost, 0)) {
    return 1;
  }
  const quint16 port = server.serverPort();
  server.close();
  return port;
}
}

class ControlApiClientTest : public QObject {
  Q_OBJECT

private slots:
  void sendsBearerSecret();
  void readsTrafficAndConnections();
  void closesConnectionsById();
  void reloadPutsConfigPath();
  void delayProbeParsesResult();
  void delayProbeGivesUpOnHungServer();
  void unreachableEndpointReturnsSentinels();
  void logStreamYieldsLines();
  void formatsIpv6Controller();
};

void ControlApiClientTest::sendsBearerSecret() {
  FakeControlServer server;
  QVERIFY2(server.listen(), qPrintable(server.errorString()));
  server.setHandler([](const RecordedRequest&) {
    return CannedResponse {200, json({{QStringLiteral("version"), QStringLiteral("1.11.0")}}), false};
  });

  ControlApiClient client(QStringLiteral("127.0.0.1"), server.port(), QStringLiteral("s3cret"));
  const QJsonObject version = client.version();
  QCOMPARE(version.value(QStringLiteral("version")).toString(), QStringLiteral("1.11.0"));

  QCOMPARE(server.requests().size(), 1);
  const RecordedRequest& request = server.requests().constFirst();
  QCOMPARE(request.method, QByteArray("GET"));
  QCOMPARE(request.target, QByteArray("/version"));
  QCOMPARE(request.headers.value("authorization"), QByteArray("Bearer s3cret"));

  client.setSecret(QString());
  QVERIFY(!client.version().isEmpty());
  QVERIFY(!server.requests().constLast().headers.contains("authorization"));
}

void ControlApiClientTest::readsTrafficAndConnections() {
  FakeControlServer server;
  QVERIFY(server.listen());
  server.setHandler([](const RecordedRequest&) {
    return CannedResponse {200, QByteArrayLiteral(
        "{\"uploadTotal\":2048,\"downloadTotal\":4096,\"connections\":["
        "{\"id\":\"c1\",\"upload\":10,\"download\":20,\"chains\":[\"proxy\"],\"rule\":\"final\","
        "\"metadata\":{\"host\":\"example.com\"}},"
        "\"not-an-object\"]}"), false};
  });

  ControlApiClient client(QStringLiteral("127.0.0.1"), server.port());
  const TrafficStats stats = client.traffic();
  QCOMPARE(stats.uploadTotal, qint64(2048));
  QCOMPARE(stats.downloadTotal, qint64(4096));

  const QList<ConnectionInfo> connections = client.connections();
  QCOMPARE(connections.size(), 1);
  QCOMPARE(connections.constFirst().id, QStringLiteral("c1"));
  QCOMPARE(connections.constFirst().download, qint64(20));
  QCOMPARE(connections.constFirst().chains, QStringList {QStringLiteral("proxy")});
  QCOMPARE(connections.constFirst().metadata.value(QStringLiteral("host")).toString(),
           QStringLiteral("example.com"));
}

void ControlApiClientTest::closesConnectionsById() {
  FakeControlServer server;
  QVERIFY(server.listen());
  server.setHandler([](const RecordedRequest& request) {
    return CannedResponse {request.target.endsWith("/missing") ? 404 : 204, QByteArray(), false};
  });

  ControlApiClient client(QStringLiteral("127.0.0.1"), server.port());
  QVERIFY(client.closeConnection(QStringLiteral("a b")));
  QCOMPARE(server.requests().constLast().method, QByteArray("DELETE"));
  QCOMPARE(server.requests().constLast().target, QByteArray("/connections/a%20b"));

  QVERIFY(!client.closeConnection(QStringLiteral("missing")));
  QVERIFY(!client.closeConnection(QStringLiteral("  ")));
  QCOMPARE(server.requests().size(), 2);

  QVERIFY(client.closeAllConnections());
  QCOMPARE(server.requests().constLast().target, QByteArray("/connections"));
}

void ControlApiClientTest::reloadPutsConfigPath() {
  FakeControlServer server;
  QVERIFY(server.listen());
  server.setHandler([](const RecordedRequest&) { return CannedResponse {204, QByteArray(), false}; });

  ControlApiClient client(QStringLiteral("127.0.0.1"), server.port());
  QVERIFY(client.reloadConfig(QStringLiteral("/tmp/boxlink-test.json")));

  const RecordedRequest& request = server.requests().constLast();
  QCOMPARE(request.method, QByteArray("PUT"));
  QVERIFY(request.target.startsWith("/configs?"));
  QVERIFY(request.target.contains("force=true"));
  const QJsonObject body = QJsonDocument::fromJson(request.body).object();
  QCOMPARE(body.value(QStringLiteral("path")).toString(), QStringLiteral("/tmp/boxlink-test.json"));

  server.setHandler([](const RecordedRequest&) { return CannedResponse {400, QByteArray(), false}; });
  QVERIFY(!client.reloadConfig(QStringLiteral("/tmp/boxlink-test.json")));
}

void ControlApiClientTest::delayProbeParsesResult() {
  FakeControlServer server;
  QVERIFY(server.listen());
  server.setHandler([](const RecordedRequest& request) {
    if (request.target.startsWith("/proxies/bad/")) {
      return CannedResponse {200, json({{QStringLiteral("message"), QStringLiteral("timeout")}}), false};
    }
    return CannedResponse {200, json({{QStringLiteral("delay"), 123}}), false};
  });

  ControlApiClient client(QStringLiteral("127.0.0.1"), server.port());
  QCOMPARE(client.testDelay(QStringLiteral("proxy"), QStringLiteral("https://example.com/204"), 2000), 123);
  const QByteArray target = server.requests().constLast().target;
  QVERIFY(target.startsWith("/proxies/proxy/delay?"));
  QVERIFY(target.contains("timeout=2000"));

  QCOMPARE(client.testDelay(QStringLiteral("bad")), -1);
}

void ControlApiClientTest::delayProbeGivesUpOnHungServer() {
  FakeControlServer server;
  QVERIFY(server.listen());
  server.setHandler([](const RecordedRequest&) { return CannedResponse {200, QByteArray(), true}; });

  ControlApiClient client(QStringLiteral("127.0.0.1"), server.port());
  QElapsedTimer elapsed;
  elapsed.start();
  QCOMPARE(client.testDelay(QStringLiteral("proxy"), QStringLiteral("https://example.com/204"), 1000), -1);
  QVERIFY2(elapsed.elapsed() < 2500, qPrintable(QString::number(elapsed.elapsed())));
}

void ControlApiClientTest::unreachableEndpointReturnsSentinels() {
  ControlApiClient client(QStringLiteral("127.0.0.1"), closedPort());
  client.setRequestTimeout(1000);

  QVERIFY(client.version().isEmpty());
  QCOMPARE(client.traffic().uploadTotal, qint64(0));
  QCOMPARE(client.traffic().downloadTotal, qint64(0));
  QVERIFY(client.connections().isEmpty());
  QVERIFY(client.proxies().isEmpty());
  QVERIFY(client.configs().isEmpty());
  QVERIFY(!client.closeAllConnections());
  QVERIFY(!client.reloadConfig(QStringLiteral("/tmp/none.json")));
  QCOMPARE(client.testDelay(QStringLiteral("proxy"), QStringLiteral("https://example.com"), 500), -1);
}

void ControlApiClientTest::logStreamYieldsLines() {
  FakeControlServer server;
  QVERIFY(server.listen());
  server.setHandler([](const RecordedRequest&) {
    return CannedResponse {200, QByteArrayLiteral(
        "{\"type\":\"info\",\"payload\":\"first\"}\n\n{\"type\":\"warn\",\"payload\":\"second\"}"), false};
  });

  ControlApiClient client(QStringLiteral("127.0.0.1"), server.port());
  std::unique_ptr<LogStream> stream = client.openLogStream(QStringLiteral("warning"));
  QVERIFY(stream != nullptr);

  const auto first = stream->readLine(3000);
  QVERIFY(first.has_value());
  QVERIFY(first->contains(QStringLiteral("first")));
  const auto second = stream->readLine(3000);
  QVERIFY(second.has_value());
  QVERIFY(second->contains(QStringLiteral("second")));
  QVERIFY(!stream->readLine(200).has_value());
  QVERIFY(!stream->isOpen());

  QVERIFY(server.requests().constFirst().target.startsWith("/logs?level=warning"));
  stream->close();
}

void ControlApiClientTest::formatsIpv6Controller() {
  ControlApiClient client(QStringLiteral("::1"), 9090);
  QCOMPARE(client.controllerAddress(), QStringLiteral("[::1]:9090"));
  client.setEndpoint(QStringLiteral(" 127.0.0.1 "), 9191);
  QCOMPARE(client.controllerAddress(), QStringLiteral("127.0.0.1:9191"));
}

QTEST_GUILESS_MAIN(ControlApiClientTest)
#include "tst_controlapiclient.moc"
