#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QSaveFile>
#include <QSettings>
#include <QTextStream>

#include <cstdio>
#include <optional>

import boxlink.core.linkcodec;
import boxlink.core.outboundcompiler;
import boxlink.core.proxyprofile;
import boxlink.core.runconfigbuilder;
import boxlink.core.settings;
import boxlink.core.systemlog;
import boxlink.core.vpnstatus;

namespace {
std::optional<ProxyProfile> firstParseableLink(const QString& input, QTextStream& err)
{
    const QList<ProxyProfile> profiles = LinkCodec::parseSubscriptionContent(input);
    if (!profiles.isEmpty()) {
        return profiles.constFirst();
    }

    // Retry as a single link to report why it was rejected.
    QString error;
    std::optional<ProxyProfile> single = LinkCodec::parseLink(input.trimmed(), &error);
    if (!single) {
        err << "No parseable link: " << error << Qt::endl;
    }
    return single;
}
}

auto main(int argc, char *argv[]) -> int
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("BoxLink"));
    QCoreApplication::setApplicationName(QStringLiteral("boxlink-generate"));
#ifdef APP_VERSION
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
#else
    QCoreApplication::setApplicationVersion(QStringLiteral("0.0.0"));
#endif

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Reads share links (or a subscription body) from standard input and prints "
        "the sing-box run configuration for the first parseable link."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption settingsOption(
        {QStringLiteral("s"), QStringLiteral("settings")},
        QStringLiteral("INI file with routing, vpn, dns and engine settings."),
        QStringLiteral("file"));
    const QCommandLineOption configDirOption(
        QStringLiteral("config-dir"),
        QStringLiteral("Directory holding proxy_list.txt, direct_list.txt and vpn_list.txt for custom "
                       "routing. Defaults to the settings file's directory."),
        QStringLiteral("dir"));
    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        QStringLiteral("Write the configuration to a file instead of standard output."),
        QStringLiteral("file"));
    const QCommandLineOption outboundOnlyOption(
        QStringLiteral("outbound-only"),
        QStringLiteral("Print only the compiled outbound."));
    const QCommandLineOption normalizeOption(
        QStringLiteral("normalize"),
        QStringLiteral("Print the canonical share link instead of a configuration."));
    const QCommandLineOption verboseOption(
        {QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Print diagnostics to standard error."));
    parser.addOptions({settingsOption, configDirOption, outputOption, outboundOnlyOption, normalizeOption, verboseOption});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    SystemLog log;
    log.setEnabled(parser.isSet(verboseOption));
    QObject::connect(&log, &SystemLog::lineAppended, &app, [&err](const QString& line) {
        err << line << Qt::endl;
    });

    QFile input;
    if (!input.open(stdin, QIODevice::ReadOnly)) {
        err << "Cannot read standard input." << Qt::endl;
        return 1;
    }
    const std::optional<ProxyProfile> profile = firstParseableLink(QString::fromUtf8(input.readAll()), err);
    if (!profile) {
        return 1;
    }
    appendSystemLog(&log, QStringLiteral("[Generate] Using %1").arg(profile->displayTypeAndName()));

    if (parser.isSet(normalizeOption)) {
        out << LinkCodec::toShareLink(*profile) << Qt::endl;
        return 0;
    }

    CoreSettings core;
    RoutingSettings routing;
    VpnSettings vpn;
    DnsSettings dns;
    QString listDirectory = parser.value(configDirOption);
    if (parser.isSet(settingsOption)) {
        const QString settingsPath = parser.value(settingsOption);
        if (!QFile::exists(settingsPath)) {
            err << "Settings file not found: " << settingsPath << Qt::endl;
            return 1;
        }
        QSettings settings(settingsPath, QSettings::IniFormat);
        core = CoreSettings::load(settings);
        routing = RoutingSettings::load(settings);
        vpn = VpnSettings::load(settings);
        dns = DnsSettings::load(settings);
        if (listDirectory.isEmpty()) {
            listDirectory = QFileInfo(settingsPath).absolutePath();
        }
    }
    if (routing.mode == RoutingMode::Custom && !listDirectory.isEmpty()) {
        routing.loadListsFromDirectory(listDirectory);
        appendSystemLog(&log, QStringLiteral("[Generate] Routing lists from %1").arg(listDirectory));
    }

    const OutboundCompiler::CompileResult compiled = OutboundCompiler::compileOutbound(*profile, core.skipCertVerify);
    if (!compiled.ok()) {
        err << compiled.error << Qt::endl;
        return 2;
    }

    QJsonObject document = compiled.outbound;
    if (!parser.isSet(outboundOnlyOption)) {
        NmcliVpnStatusProvider vpnStatus(&log);
        document = RunConfigBuilder::build(compiled.outbound, routing, vpn, dns,
                                           RunConfigBuilder::BuildOptions::fromCoreSettings(core),
                                           &vpnStatus, &log);
    }
    const QByteArray json = QJsonDocument(document).toJson(QJsonDocument::Indented);

    if (!parser.isSet(outputOption)) {
        out << QString::fromUtf8(json);
        return 0;
    }

    QSaveFile file(parser.value(outputOption));
    if (!file.open(QIODevice::WriteOnly) || file.write(json) != json.size() || !file.commit()) {
        err << "Cannot write " << file.fileName() << ": " << file.errorString() << Qt::endl;
        return 1;
    }
    return 0;
}
