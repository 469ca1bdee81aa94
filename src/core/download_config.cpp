module;
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QtGlobal>

module porter.core.download_config;

static QString safeRelativePath(const QString& id)
{
    QStringList segments;
    for (const QString& segment : id.split('/', Qt::SkipEmptyParts)) {
        if (segment == "." || segment == "..") continue;
        segments.append(segment);
    }
    return segments.join('/');
}

DownloadConfig DownloadConfig::defaults()
{
    DownloadConfig cfg;
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) base = QDir::homePath() + "/.porter";
    QDir root(base);
    cfg.modelsRoot = root.filePath("models");
    cfg.datasetsRoot = root.filePath("datasets");
    cfg.bundlesRoot = root.filePath("bundles");
    cfg.embeddingsRoot = root.filePath("embeddings");
    return cfg;
}

QString DownloadConfig::settingsGroup()
{
    return QStringLiteral("downloads");
}

DownloadConfig DownloadConfig::load(QSettings& settings)
{
    DownloadConfig cfg = defaults();
    settings.beginGroup(settingsGroup());
    cfg.modelsRoot = settings.value(QStringLiteral("modelsRoot"), cfg.modelsRoot).toString();
    cfg.datasetsRoot = settings.value(QStringLiteral("datasetsRoot"), cfg.datasetsRoot).toString();
    cfg.bundlesRoot = settings.value(QStringLiteral("bundlesRoot"), cfg.bundlesRoot).toString();
    cfg.embeddingsRoot = settings.value(QStringLiteral("embeddingsRoot"), cfg.embeddingsRoot).toString();
    const QUrl hub(settings.value(QStringLiteral("hubBaseUrl"), cfg.hubBaseUrl.toString()).toString());
    if (hub.isValid() && !hub.scheme().isEmpty()) cfg.hubBaseUrl = hub;
    cfg.hubToken = settings.value(QStringLiteral("hubToken"), cfg.hubToken).toString().trimmed();
    cfg.bundleRepo = settings.value(QStringLiteral("bundleRepo"), cfg.bundleRepo).toString();
    cfg.userAgent = settings.value(QStringLiteral("userAgent"), cfg.userAgent).toString();
    cfg.maxConcurrentRequests = qMax(1, settings.value(QStringLiteral("maxConcurrentRequests"), cfg.maxConcurrentRequests).toInt());
    cfg.maxRequestAttempts = qMax(1, settings.value(QStringLiteral("maxRequestAttempts"), cfg.maxRequestAttempts).toInt());
    cfg.requestTimeoutMs = qMax(1000, settings.value(QStringLiteral("requestTimeoutMs"), cfg.requestTimeoutMs).toInt());
    cfg.maxNetworkBackoffSec = qMax(1, settings.value(QStringLiteral("maxNetworkBackoffSec"), cfg.maxNetworkBackoffSec).toInt());
    cfg.maxFileAttempts = qMax(1, settings.value(QStringLiteral("maxFileAttempts"), cfg.maxFileAttempts).toInt());
    cfg.finishedGraceMs = qMax(0, settings.value(QStringLiteral("finishedGraceMs"), cfg.finishedGraceMs).toInt());
    cfg.failedGraceMs = qMax(0, settings.value(QStringLiteral("failedGraceMs"), cfg.failedGraceMs).toInt());
    cfg.offline = settings.value(QStringLiteral("offline"), cfg.offline).toBool();
    settings.endGroup();
    return cfg;
}

void DownloadConfig::save(QSettings& settings) const
{
    settings.beginGroup(settingsGroup());
    settings.setValue(QStringLiteral("modelsRoot"), modelsRoot);
    settings.setValue(QStringLiteral("datasetsRoot"), datasetsRoot);
    settings.setValue(QStringLiteral("bundlesRoot"), bundlesRoot);
    settings.setValue(QStringLiteral("embeddingsRoot"), embeddingsRoot);
    settings.setValue(QStringLiteral("hubBaseUrl"), hubBaseUrl.toString());
    settings.setValue(QStringLiteral("hubToken"), hubToken);
    settings.setValue(QStringLiteral("bundleRepo"), bundleRepo);
    settings.setValue(QStringLiteral("userAgent"), userAgent);
    settings.setValue(QStringLiteral("maxConcurrentRequests"), maxConcurrentRequests);
    settings.setValue(QStringLiteral("maxRequestAttempts"), maxRequestAttempts);
    settings.setValue(QStringLiteral("requestTimeoutMs"), requestTimeoutMs);
    settings.setValue(QStringLiteral("maxNetworkBackoffSec"), maxNetworkBackoffSec);
    settings.setValue(QStringLiteral("maxFileAttempts"), maxFileAttempts);
    settings.setValue(QStringLiteral("finishedGraceMs"), finishedGraceMs);
    settings.setValue(QStringLiteral("failedGraceMs"), failedGraceMs);
    settings.setValue(QStringLiteral("offline"), offline);
    settings.endGroup();
}

QString DownloadConfig::modelDirectory(const QString& modelId) const
{
    return QDir(modelsRoot).filePath(safeRelativePath(modelId));
}

QString DownloadConfig::datasetDirectory(const QString& datasetId) const
{
    return QDir(datasetsRoot).filePath(safeRelativePath(datasetId));
}

QString DownloadConfig::bundleDirectory(const QString& slug) const
{
    return QDir(bundlesRoot).filePath(safeRelativePath(slug));
}

QString DownloadConfig::embeddingDirectory(const QString& repoId) const
{
    return QDir(embeddingsRoot).filePath(safeRelativePath(repoId));
}
