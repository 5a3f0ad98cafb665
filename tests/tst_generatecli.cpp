#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QObject>
#include <QProcess>
#include <QStringList>
#include <QTemporaryDir>
#include <QtTest/QtTest>

namespace {
struct RunResult {
  int exitCode = -1;
  QByteArray out;
  QByteArray err;
};

RunResult runGenerate(const QStringList& arguments, const QByteArray& input) {
  RunResult result;
  QProcess process;
  process.start(QStringLiteral(BOXLINK_GENERATE_PATH), arguments);
  if (!process.waitForStarted(5000)) {
    result.err = process.errorString().toUtf8();
    return result;
  }
  process.write(input);
  process.closeWriteChannel();
  if (!process.waitForFinished(10000)) {
    process.kill();
    process.waitForFinished(1000);
    result.err = QByteArrayLiteral("boxlink-generate did not finish");
    return result;
  }
  result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
  result.out = process.readAllStandardOutput();
  result.err = process.readAllStandardError();
  return result;
}

bool writeText(const QString& path, const QByteArray& text) {
  QFile file(path);
  return file.open(QIODevice::WriteOnly | QIODevice::Truncate) && file.write(text) == text.size();
}

bool routeMentions(const QByteArray& json, const QString& key, const QString& value) {
  const QJsonObject config = QJsonDocument::fromJson(json).object();
  const QJsonArray rules = config.value(QStringLiteral("route")).toObject().value(QStringLiteral("rules")).toArray();
  for (const QJsonValue& rule : rules) {
    if (rule.toObject().value(key).toArray().contains(value)) {
      return true;
    }
  }
  return false;
}

const QByteArray kLink = QByteArrayLiteral("trojan://secret@t.example.com:443#cli\n");
}

class GenerateCliTest : public QObject {
  Q_OBJECT

private slots:
  void customModeReadsListsBesideSettings();
  void configDirOverridesSettingsDirectory();
  void listsIgnoredOutsideCustomMode();
  void exitCodes();
};

void GenerateCliTest::customModeReadsListsBesideSettings() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QDir root(dir.path());
  QVERIFY(writeText(root.filePath(QStringLiteral("settings.ini")), "[routing]\nmode=custom\n"));
  QVERIFY(writeText(root.filePath(QStringLiteral("proxy_list.txt")), "# proxied\nblocked.example\n"));
  QVERIFY(writeText(root.filePath(QStringLiteral("direct_list.txt")), "198.51.100.0/24\n"));

  const RunResult result = runGenerate({QStringLiteral("-s"), root.filePath(QStringLiteral("settings.ini"))}, kLink);
  QVERIFY2(result.exitCode == 0, result.err.constData());
  QVERIFY2(routeMentions(result.out, QStringLiteral("domain_suffix"), QStringLiteral("blocked.example")),
           result.out.constData());
  QVERIFY(routeMentions(result.out, QStringLiteral("ip_cidr"), QStringLiteral("198.51.100.0/24")));
}

void GenerateCliTest::configDirOverridesSettingsDirectory() {
  QTemporaryDir settingsDir;
  QTemporaryDir listDir;
  QVERIFY(settingsDir.isValid());
  QVERIFY(listDir.isValid());
  const QString settingsPath = QDir(settingsDir.path()).filePath(QStringLiteral("settings.ini"));
  QVERIFY(writeText(settingsPath, "[routing]\nmode=custom\n"));
  QVERIFY(writeText(QDir(settingsDir.path()).filePath(QStringLiteral("proxy_list.txt")), "beside.example\n"));
  QVERIFY(writeText(QDir(listDir.path()).filePath(QStringLiteral("proxy_list.txt")), "elsewhere.example\n"));

  const RunResult result = runGenerate(
      {QStringLiteral("-s"), settingsPath, QStringLiteral("--config-dir"), listDir.path()}, kLink);
  QVERIFY2(result.exitCode == 0, result.err.constData());
  QVERIFY(routeMentions(result.out, QStringLiteral("domain_suffix"), QStringLiteral("elsewhere.example")));
  QVERIFY(!routeMentions(result.out, QStringLiteral("domain_suffix"), QStringLiteral("beside.example")));
}

void GenerateCliTest::listsIgnoredOutsideCustomMode() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QDir root(dir.path());
  QVERIFY(writeText(root.filePath(QStringLiteral("settings.ini")), "[routing]\nmode=proxy_all\n"));
  QVERIFY(writeText(root.filePath(QStringLiteral("proxy_list.txt")), "blocked.example\n"));

  const RunResult result = runGenerate({QStringLiteral("-s"), root.filePath(QStringLiteral("settings.ini"))}, kLink);
  QVERIFY2(result.exitCode == 0, result.err.constData());
  QVERIFY(!routeMentions(result.out, QStringLiteral("domain_suffix"), QStringLiteral("blocked.example")));
}

void GenerateCliTest::exitCodes() {
  QCOMPARE(runGenerate({}, QByteArrayLiteral("not a link\n")).exitCode, 1);
  QCOMPARE(runGenerate({QStringLiteral("-s"), QStringLiteral("/nonexistent/settings.ini")}, kLink).exitCode, 1);

  const RunResult normalized = runGenerate({QStringLiteral("--normalize")}, kLink);
  QCOMPARE(normalized.exitCode, 0);
  QVERIFY(normalized.out.startsWith("trojan://"));
}

QTEST_GUILESS_MAIN(GenerateCliTest)
#include "tst_generatecli.moc"
