module;
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QString>
#include <optional>

module porter.core.embedding_orchestrator;

import porter.core.download_config;
import porter.core.download_error;
import porter.services.hub_client;
import porter.utils.download_utils;

namespace utils = porter::utils;

EmbeddingOrchestrator::EmbeddingOrchestrator(const EmbeddingSpec& spec, const DownloadContext& context, QObject* parent)
    : DownloadOrchestrator(ArtifactKind::Embedding, spec.identity(), context, parent)
    , m_spec(spec)
{
    QString name = spec.fileName.isEmpty() ? utils::fileNameFromUrl(spec.url) : spec.fileName;
    if (name.isEmpty()) name = "model.gguf";
    m_destination = QDir(config().embeddingDirectory(spec.repoId)).filePath(QFileInfo(name).fileName());
}

void EmbeddingOrchestrator::run()
{
    const QString directory = QFileInfo(m_destination).absolutePath();
    updateItem([this, &directory](DownloadItem& it) {
        it.directory = directory;
        it.ensurePart(kEmbeddingPart, m_destination);
    });

    const bool onDisk = utils::fileExistsPath(m_destination) && !utils::fileExistsPath(utils::tempPathFor(m_destination));
    if (onDisk) {
        qInfo() << "[Download] embedding" << identity() << "already installed";
        markPartCompleted(kEmbeddingPart, utils::fileSizeOnDisk(m_destination));
        finishIfComplete();
        return;
    }

    if (!QDir().mkpath(directory)) {
        failPermanently(DownloadError::permanent("Failed to create embedding directory"));
        return;
    }

    if (!m_ctx.hub) {
        startTransfer();
        return;
    }

    const quint64 gen = generation();
    m_ctx.hub->remoteSize(m_spec.url, this, [this, gen](qint64 bytes) {
        if (!isCurrent(gen)) return;
        if (bytes > 0) {
            updateItem([bytes](DownloadItem& it) {
                if (PartState* p = it.part(kEmbeddingPart)) p->catalogBytes = bytes;
            });
            logDetectedSize(bytes);
        }
        startTransfer();
    });
}

void EmbeddingOrchestrator::startTransfer()
{
    const std::optional<DownloadItem> current = item();
    const PartState* p = current ? current->part(kEmbeddingPart) : nullptr;
    const qint64 expected = p ? p->effectiveExpected() : 0;
    if (!beginTransfer(makeRequest(kEmbeddingPart, m_spec.url, m_destination, expected))) {
        failPermanently(DownloadError::permanent("Could not start download"));
    }
}

InstalledArtifact EmbeddingOrchestrator::buildArtifact(const DownloadItem& item) const
{
    InstalledArtifact artifact = DownloadOrchestrator::buildArtifact(item);
    artifact.path = m_destination;
    artifact.modelId = m_spec.repoId;
    artifact.format = QFileInfo(m_destination).suffix();
    return artifact;
}
