#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QNetworkAccessManager>
#include <QSettings>
#include <QStandardPaths>
#include <QStringList>
#include <QTextStream>
#include <QUrl>

import porter.core.artifact;
import porter.core.download_config;
import porter.core.download_registry;
import porter.services.connectivity_monitor;
import porter.services.http_transport;
import porter.services.hub_client;
import porter.services.installed_store;
import porter.services.request_scheduler;
import porter.utils.category_utils;
import porter.utils.download_utils;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace utils = porter::utils;

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Porter"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Downloads model weights, bundles, datasets and embedding models."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("model | bundle | dataset | embedding | list [category]"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."), QStringLiteral("[args...]"));

    const QCommandLineOption sizeOption(QStringLiteral("size"), QStringLiteral("Catalog size in bytes."), QStringLiteral("bytes"));
    const QCommandLineOption urlOption(QStringLiteral("url"), QStringLiteral("Direct download URL."), QStringLiteral("url"));
    const QCommandLineOption shaOption(QStringLiteral("sha256"), QStringLiteral("Expected SHA-256."), QStringLiteral("hex"));
    const QCommandLineOption titleOption(QStringLiteral("title"), QStringLiteral("Dataset display name."), QStringLiteral("title"));
    const QCommandLineOption tokenOption(QStringLiteral("token"), QStringLiteral("Hub access token."), QStringLiteral("token"));
    const QCommandLineOption rootOption(QStringLiteral("root"), QStringLiteral("Storage root for every artifact kind."), QStringLiteral("dir"));
    const QCommandLineOption offlineOption(QStringLiteral("offline"), QStringLiteral("Disable all network activity."));
    parser.addOptions({ sizeOption, urlOption, shaOption, titleOption, tokenOption, rootOption, offlineOption });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) parser.showHelp(1);
    const QString command = args.first();

    QSettings settings;
    DownloadConfig config = DownloadConfig::load(settings);
    if (parser.isSet(rootOption)) {
        const QDir root(parser.value(rootOption));
        config.modelsRoot = root.filePath(QStringLiteral("models"));
        config.datasetsRoot = root.filePath(QStringLiteral("datasets"));
        config.bundlesRoot = root.filePath(QStringLiteral("bundles"));
        config.embeddingsRoot = root.filePath(QStringLiteral("embeddings"));
    }
    if (parser.isSet(tokenOption)) config.hubToken = parser.value(tokenOption);
    if (parser.isSet(offlineOption)) config.offline = true;

    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(dataDir);
    InstalledStore installed(QDir(dataDir).filePath(QStringLiteral("installed.json")));

    if (command == QLatin1String("list")) {
        const QString category = args.value(1);
        if (!category.isEmpty() && !utils::categoryNames().contains(category, Qt::CaseInsensitive)) {
            err << "Unknown category " << category << ", expected one of: "
                << utils::categoryNames().join(QStringLiteral(", ")) << Qt::endl;
            return 1;
        }
        for (const InstalledArtifact& a : installed.artifacts()) {
            const QString kind = utils::detectCategory(a.path);
            if (!category.isEmpty() && kind.compare(category, Qt::CaseInsensitive) != 0) continue;
            out << artifactKindName(a.kind) << '\t' << kind << '\t' << a.identity << '\t'
                << utils::humanReadableBytes(a.sizeBytes) << '\t' << a.path << Qt::endl;
        }
        return 0;
    }

    QNetworkAccessManager network;
    NetworkRequestSender sender(&network);
    RequestScheduler scheduler(&sender, config.maxConcurrentRequests);
    scheduler.setMaxAttempts(config.maxRequestAttempts);
    scheduler.setTimeoutMs(config.requestTimeoutMs);

    HubClient hub(&scheduler, config.hubBaseUrl);
    hub.setToken(config.hubToken);
    hub.setUserAgent(config.userAgent);

    ConnectivityMonitor connectivity;
    if (!connectivity.attachSystemBackend()) {
        qInfo() << "[Connectivity] no reachability backend, assuming online";
    }

    HttpTransport transport(&network);

    RegistryServices services;
    services.transport = &transport;
    services.installer = &installed;
    services.hub = &hub;
    services.scheduler = &scheduler;
    services.connectivity = &connectivity;
    DownloadRegistry registry(config, services);

    const QStringList rest = args.mid(1);
    const qint64 size = parser.value(sizeOption).toLongLong();
    bool started = false;

    if (command == QLatin1String("model") && rest.size() >= 3) {
        ModelSpec spec;
        spec.modelId = rest.at(0);
        spec.quantLabel = rest.at(1);
        spec.url = QUrl(rest.at(2));
        spec.sizeBytes = size;
        spec.sha256 = parser.value(shaOption);
        started = registry.startModel(spec);
    } else if (command == QLatin1String("bundle") && rest.size() >= 1) {
        BundleSpec spec;
        spec.slug = rest.at(0);
        spec.url = QUrl(parser.value(urlOption));
        spec.sizeBytes = size;
        spec.sha256 = parser.value(shaOption);
        started = registry.startBundle(spec);
    } else if (command == QLatin1String("dataset") && rest.size() >= 2) {
        DatasetSpec spec;
        spec.datasetId = rest.at(0);
        spec.displayName = parser.value(titleOption);
        for (const QString& value : rest.mid(1)) {
            DatasetFile file;
            file.url = QUrl(value);
            file.name = utils::fileNameFromUrl(file.url);
            spec.files.append(file);
        }
        started = registry.startDataset(spec);
    } else if (command == QLatin1String("embedding") && rest.size() >= 2) {
        EmbeddingSpec spec;
        spec.repoId = rest.at(0);
        spec.url = QUrl(rest.at(1));
        started = registry.startEmbedding(spec);
    } else {
        err << "Unknown command or missing arguments: " << args.join(' ') << Qt::endl;
        parser.showHelp(1);
    }

    if (!started) {
        err << "Nothing to do." << Qt::endl;
        return 1;
    }

    int exitCode = 0;
    int lastPercent = -1;
    QObject::connect(&registry, &DownloadRegistry::progressChanged, &app, [&]() {
        const int percent = int(registry.overallProgress() * 100.0);
        if (percent == lastPercent) return;
        lastPercent = percent;
        out << "\r" << percent << "%" << Qt::flush;
    });
    QObject::connect(&registry, &DownloadRegistry::downloadFinished, &app, [&](ArtifactKind kind, const QString& identity) {
        out << "\n" << artifactKindName(kind) << ' ' << identity << " installed" << Qt::endl;
    });
    QObject::connect(&registry, &DownloadRegistry::downloadFailed, &app, [&](ArtifactKind, const QString& identity, const QString& message) {
        err << "\n" << identity << ": " << message << Qt::endl;
        exitCode = 2;
    });
    QObject::connect(&registry, &DownloadRegistry::itemRemoved, &app, [&]() {
        if (registry.orchestrators().isEmpty()) QCoreApplication::exit(exitCode);
    });

    return app.exec();
}
