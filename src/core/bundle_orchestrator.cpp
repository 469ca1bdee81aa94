module;
#include <QByteArray>
#include <QByteArrayView>
#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFuture>
#include <QFutureWatcher>
#include <QList>
#include <QString>
#include <QUrl>
#include <QtConcurrent/QtConcurrentRun>
#include <optional>

module porter.core.bundle_orchestrator;

import porter.core.download_config;
import porter.core.download_error;
import porter.services.hub_client;
import porter.utils.download_utils;

namespace utils = porter::utils;

BundleOrchestrator::BundleOrchestrator(const BundleSpec& spec, const DownloadContext& context, QObject* parent)
    : DownloadOrchestrator(ArtifactKind::Bundle, spec.identity(), context, parent)
    , m_spec(spec)
    , m_sha256(utils::normalizeChecksum(spec.sha256))
{
    m_directory = config().bundleDirectory(spec.slug);
}

QString BundleOrchestrator::sha256OfFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) return QString();
    QCryptographicHash hash(QCryptographicHash::Sha256);
    QByteArray buffer;
    buffer.resize(1024 * 1024);
    while (!file.atEnd()) {
        const qint64 readBytes = file.read(buffer.data(), buffer.size());
        if (readBytes <= 0) break;
        hash.addData(QByteArrayView(buffer.constData(), static_cast<qsizetype>(readBytes)));
    }
    file.close();
    return QString::fromUtf8(hash.result().toHex());
}

void BundleOrchestrator::run()
{
    if (!QDir().mkpath(m_directory)) {
        failPermanently(DownloadError::permanent("Failed to create bundle directory"));
        return;
    }
    updateItem([this](DownloadItem& it) { it.directory = m_directory; });

    if (m_spec.url.isValid() && !m_spec.url.isEmpty()) {
        QString name = utils::fileNameFromUrl(m_spec.url);
        if (name.isEmpty()) name = m_spec.slug + ".bundle";
        startBundle(m_spec.url, name, m_spec.sizeBytes);
        return;
    }

    if (!m_ctx.hub) {
        failPermanently(DownloadError::permanent("No source for bundle " + m_spec.slug));
        return;
    }

    const quint64 gen = generation();
    const QString repo = config().bundleRepo;
    m_ctx.hub->listFiles(repo, this, [this, gen, repo](const QList<HubFile>& files, bool answered) {
        if (!isCurrent(gen)) return;
        if (files.isEmpty() && !answered) {
            scheduleRetry(DownloadError::network("Bundle listing unavailable"));
            return;
        }
        const std::optional<HubFile> file = HubClient::findBundle(files, m_spec.slug);
        if (!file) {
            failPermanently(DownloadError::permanent("Bundle not found: " + m_spec.slug));
            return;
        }
        if (m_sha256.isEmpty()) m_sha256 = file->sha256;
        startBundle(m_ctx.hub->fileUrl(repo, file->name), QFileInfo(file->name).fileName(),
                    m_spec.sizeBytes > 0 ? m_spec.sizeBytes : file->size);
    });
}

void BundleOrchestrator::startBundle(const QUrl& url, const QString& fileName, qint64 sizeBytes)
{
    const QString path = QDir(m_directory).filePath(fileName);
    updateItem([&path, sizeBytes](DownloadItem& it) { it.ensurePart(kBundlePart, path, sizeBytes); });
    logDetectedSize(sizeBytes);

    if (utils::fileExistsPath(path) && !utils::fileExistsPath(utils::tempPathFor(path))) {
        markPartCompleted(kBundlePart, utils::fileSizeOnDisk(path));
        finishIfComplete();
        return;
    }
    if (!beginTransfer(makeRequest(kBundlePart, url, path, sizeBytes))) {
        failPermanently(DownloadError::permanent("Could not start download"));
    }
}

void BundleOrchestrator::completeDownload()
{
    const std::optional<DownloadItem> current = item();
    const PartState* part = current ? current->part(kBundlePart) : nullptr;
    if (!part) return;

    if (m_sha256.isEmpty()) {
        finish(buildArtifact(*current));
        return;
    }

    updateItem([](DownloadItem& it) { it.verifying = true; });
    qInfo() << "[Download] verifying" << part->finalPath;

    const QString path = part->finalPath;
    const QString expected = m_sha256;
    const quint64 gen = generation();
    auto* watcher = new QFutureWatcher<QString>(this);
    connect(watcher, &QFutureWatcher<QString>::finished, this, [this, watcher, path, expected, gen]() {
        const QString actual = watcher->result();
        watcher->deleteLater();
        if (gen != generation()) return;

        updateItem([](DownloadItem& it) { it.verifying = false; });
        if (actual.isEmpty() || actual != expected) {
            qWarning() << "[Download] checksum mismatch for" << path << "expected" << expected << "got" << actual;
            utils::removeArtifactFiles(path);
            failPermanently(DownloadError::permanent("Checksum mismatch"));
            return;
        }
        if (const std::optional<DownloadItem> done = item()) finish(buildArtifact(*done));
    });
    watcher->setFuture(QtConcurrent::run([path]() { return sha256OfFile(path); }));
}

InstalledArtifact BundleOrchestrator::buildArtifact(const DownloadItem& item) const
{
    InstalledArtifact artifact = DownloadOrchestrator::buildArtifact(item);
    artifact.format = "bundle";
    artifact.sha256 = m_sha256;
    return artifact;
}
