module;
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QList>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <functional>
#include <optional>

module porter.core.model_orchestrator;

import porter.core.download_config;
import porter.utils.download_utils;

namespace utils = porter::utils;

ModelOrchestrator::ModelOrchestrator(const ModelSpec& spec, const DownloadContext& context, QObject* parent)
    : DownloadOrchestrator(ArtifactKind::Model, spec.identity(), context, parent)
    , m_spec(spec)
{
    m_directory = config().modelDirectory(spec.modelId);
    QString name = utils::fileNameFromUrl(spec.url);
    if (name.isEmpty()) name = QString("%1.%2").arg(spec.quantLabel, spec.format);
    m_weightsPath = QDir(m_directory).filePath(name);
}

QString ModelOrchestrator::title() const
{
    return QString("%1 (%2)").arg(m_spec.modelId, m_spec.quantLabel);
}

void ModelOrchestrator::updateManifest(const std::function<void(ModelManifest&)>& mutator)
{
    ModelManifest manifest = ModelManifest::load(m_directory);
    mutator(manifest);
    if (!manifest.save(m_directory)) {
        qWarning() << "[Manifest] could not write" << ModelManifest::pathIn(m_directory);
    }
}

void ModelOrchestrator::run()
{
    if (!QDir().mkpath(m_directory)) {
        failPermanently(DownloadError::permanent("Failed to create model directory"));
        return;
    }
    if (!utils::writeTextHint(QDir(m_directory).filePath("repo.txt"), m_spec.modelId)) {
        qWarning() << "[Download] could not write repo hint in" << m_directory;
    }

    updateItem([this](DownloadItem& it) {
        it.directory = m_directory;
        it.ensurePart(kWeightsPart, m_weightsPath, m_spec.sizeBytes);
    });
    logDetectedSize(m_spec.sizeBytes);

    const std::optional<DownloadItem> current = item();
    const PartState* projector = current ? current->part(kProjectorPart) : nullptr;
    if ((projector && projector->completed) || !m_spec.supportsProjector()) {
        startWeights();
        return;
    }

    const ModelManifest manifest = ModelManifest::load(m_directory);
    if (manifest.mmprojChecked && manifest.mmproj.isEmpty()) {
        startWeights();
        return;
    }
    if (manifest.hasProjector()) {
        const QString path = QDir(m_directory).filePath(manifest.mmproj);
        const bool onDisk = utils::fileExistsPath(path) && utils::hasGgufMagic(path);
        if (onDisk || !m_projectorUrl.isEmpty()) {
            startProjector(path, m_projectorSize);
            startWeights();
            return;
        }
    }

    if (!m_ctx.hub) {
        startWeights();
        return;
    }

    QStringList repos;
    const QString quantRepo = utils::huggingFaceRepoId(m_spec.url);
    if (!quantRepo.isEmpty()) repos.append(quantRepo);
    if (!m_spec.modelId.isEmpty() && !repos.contains(m_spec.modelId)) repos.append(m_spec.modelId);
    probeProjector(repos, 0, true, generation());
}

void ModelOrchestrator::probeProjector(const QStringList& repos, int index, bool allAnswered, quint64 gen)
{
    if (index >= repos.size()) {
        // Absence is only recorded when every repository gave a real answer.
        if (allAnswered) {
            updateManifest([](ModelManifest& m) {
                m.mmprojChecked = true;
                m.mmproj.clear();
            });
            qInfo() << "[Download]" << identity() << "has no projector";
        }
        startWeights();
        return;
    }

    const QString repo = repos.at(index);
    m_ctx.hub->listFiles(repo, this, [this, repos, index, allAnswered, gen, repo](const QList<HubFile>& files, bool answered) {
        if (!isCurrent(gen)) return;

        const std::optional<HubFile> projector = HubClient::findProjector(files);
        if (!projector) {
            probeProjector(repos, index + 1, allAnswered && answered, gen);
            return;
        }

        const QString name = QFileInfo(projector->name).fileName();
        m_projectorUrl = m_ctx.hub->fileUrl(repo, projector->name);
        m_projectorSize = projector->size;
        updateManifest([&name](ModelManifest& m) {
            m.mmprojChecked = true;
            m.mmproj = name;
        });
        qInfo() << "[Download]" << identity() << "projector" << name << "found in" << repo;

        startProjector(QDir(m_directory).filePath(name), projector->size);
        startWeights();
    });
}

void ModelOrchestrator::startProjector(const QString& path, qint64 sizeBytes)
{
    updateItem([&path, sizeBytes](DownloadItem& it) { it.ensurePart(kProjectorPart, path, sizeBytes); });

    if (utils::fileExistsPath(path) && !utils::fileExistsPath(utils::tempPathFor(path)) && utils::hasGgufMagic(path)) {
        markPartCompleted(kProjectorPart, utils::fileSizeOnDisk(path));
        return;
    }
    if (m_projectorUrl.isEmpty()) {
        dropPart(kProjectorPart);
        return;
    }

    if (sizeBytes <= 0 && m_ctx.hub) {
        const quint64 gen = generation();
        m_ctx.hub->remoteSize(m_projectorUrl, this, [this, gen](qint64 bytes) {
            if (!isCurrent(gen) || bytes <= 0) return;
            updateItem([bytes](DownloadItem& it) {
                if (PartState* p = it.part(kProjectorPart)) p->catalogBytes = bytes;
            });
            refreshProgress();
            if (const std::optional<DownloadItem> current = item()) logDetectedSize(current->expectedBytes());
        });
    }

    if (!beginTransfer(makeRequest(kProjectorPart, m_projectorUrl, path, sizeBytes))) {
        dropPart(kProjectorPart);
    }
}

void ModelOrchestrator::startWeights()
{
    if (utils::fileExistsPath(m_weightsPath) && !utils::fileExistsPath(utils::tempPathFor(m_weightsPath))) {
        qInfo() << "[Download]" << identity() << "weights already on disk";
        markPartCompleted(kWeightsPart, utils::fileSizeOnDisk(m_weightsPath));
        onPartAccepted(kWeightsPart);
        finishIfComplete();
        return;
    }

    if (m_spec.sizeBytes <= 0 && m_ctx.hub) {
        const quint64 gen = generation();
        m_ctx.hub->remoteSize(m_spec.url, this, [this, gen](qint64 bytes) {
            if (!isCurrent(gen) || bytes <= 0) return;
            updateItem([bytes](DownloadItem& it) {
                if (PartState* p = it.part(kWeightsPart)) p->catalogBytes = bytes;
            });
            refreshProgress();
            if (const std::optional<DownloadItem> current = item()) logDetectedSize(current->expectedBytes());
        });
    }

    if (!beginTransfer(makeRequest(kWeightsPart, m_spec.url, m_weightsPath, m_spec.sizeBytes))) {
        failPermanently(DownloadError::permanent("Could not start download"));
    }
}

void ModelOrchestrator::onPartFailed(const QString& part, const DownloadError& error)
{
    if (part == kProjectorPart && !error.isRetryable()) {
        qWarning() << "[Download]" << identity() << "projector skipped:" << error.message();
        const std::optional<DownloadItem> current = item();
        if (const PartState* p = current ? current->part(kProjectorPart) : nullptr) {
            utils::removeArtifactFiles(p->finalPath);
        }
        dropPart(kProjectorPart);
        finishIfComplete();
        return;
    }
    DownloadOrchestrator::onPartFailed(part, error);
}

bool ModelOrchestrator::acceptFinalFile(const PartState& part) const
{
    if (part.name == kProjectorPart) return utils::hasGgufMagic(part.finalPath);
    return DownloadOrchestrator::acceptFinalFile(part);
}

void ModelOrchestrator::onPartAccepted(const QString& part)
{
    if (part == kWeightsPart) {
        const QString name = QFileInfo(m_weightsPath).fileName();
        updateManifest([&name](ModelManifest& m) { m.weights = name; });
        return;
    }

    const std::optional<DownloadItem> current = item();
    const PartState* p = current ? current->part(part) : nullptr;
    if (!p) return;
    const QString name = QFileInfo(p->finalPath).fileName();
    updateManifest([&name](ModelManifest& m) {
        m.mmprojChecked = true;
        m.mmproj = name;
    });
}

void ModelOrchestrator::onPartRejected(const QString& part)
{
    if (part != kProjectorPart) {
        DownloadOrchestrator::onPartRejected(part);
        return;
    }

    qWarning() << "[Download]" << identity() << "projector has no GGUF header, dropping it";
    const std::optional<DownloadItem> current = item();
    if (const PartState* p = current ? current->part(part) : nullptr) {
        utils::removeArtifactFiles(p->finalPath);
    }
    dropPart(part);
    finishIfComplete();
}

void ModelOrchestrator::onPartDropped(const QString& part)
{
    if (part != kProjectorPart) return;
    m_projectorUrl.clear();
    m_projectorSize = 0;
    updateManifest([](ModelManifest& m) {
        m.mmprojChecked = true;
        m.mmproj.clear();
    });
}

InstalledArtifact ModelOrchestrator::buildArtifact(const DownloadItem& item) const
{
    InstalledArtifact artifact = DownloadOrchestrator::buildArtifact(item);
    artifact.path = m_weightsPath;
    artifact.modelId = m_spec.modelId;
    artifact.quantLabel = m_spec.quantLabel;
    artifact.format = m_spec.format;
    artifact.sha256 = m_spec.sha256;
    if (const PartState* projector = item.part(kProjectorPart)) {
        if (projector->completed) artifact.projectorPath = projector->finalPath;
    }
    return artifact;
}

PartProbe ModelOrchestrator::probeFor(const PartState& part) const
{
    PartProbe probe = DownloadOrchestrator::probeFor(part);
    if (part.name == kProjectorPart) {
        probe.searchDir = m_directory;
        probe.nameHints = { QStringLiteral("mmproj"), QStringLiteral("projector") };
    }
    return probe;
}
