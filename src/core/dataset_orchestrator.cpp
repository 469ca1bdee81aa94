module;
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QList>
#include <QString>
#include <QTimer>
#include <optional>

module porter.core.dataset_orchestrator;

import porter.core.download_config;
import porter.services.connectivity_monitor;
import porter.services.hub_client;
import porter.utils.category_utils;
import porter.utils.download_utils;
import porter.utils.retry_utils;

namespace utils = porter::utils;

DatasetOrchestrator::DatasetOrchestrator(const DatasetSpec& spec, const DownloadContext& context, QObject* parent)
    : DownloadOrchestrator(ArtifactKind::Dataset, spec.identity(), context, parent)
    , m_spec(spec)
    , m_files(selectFiles(spec))
{
    m_directory = config().datasetDirectory(spec.datasetId);
}

QList<DatasetFile> DatasetOrchestrator::selectFiles(const DatasetSpec& spec)
{
    QList<DatasetFile> supported;
    for (const DatasetFile& file : spec.files) {
        if (utils::isDatasetFile(file.name)) supported.append(file);
    }

    if (spec.datasetId.startsWith("OTL/")) {
        for (const DatasetFile& file : supported) {
            if (file.name.endsWith(".pdf", Qt::CaseInsensitive)) return { file };
        }
    }
    return supported;
}

QString DatasetOrchestrator::title() const
{
    return m_spec.displayName.isEmpty() ? m_spec.datasetId : m_spec.displayName;
}

bool DatasetOrchestrator::containsPath(const QString& path) const
{
    const QString root = QFileInfo(m_directory).absoluteFilePath();
    const QString candidate = QFileInfo(utils::finalPathFor(path)).absoluteFilePath();
    return candidate == root || candidate.startsWith(root + '/');
}

void DatasetOrchestrator::run()
{
    m_fileAttempts.clear();
    m_pendingProbes = 0;

    if (!QDir().mkpath(m_directory)) {
        failPermanently(DownloadError::permanent("Failed to create dataset directory"));
        return;
    }
    if (m_files.isEmpty()) {
        failPermanently(DownloadError::permanent("No supported files in dataset"));
        return;
    }
    if (!utils::writeTextHint(QDir(m_directory).filePath("title.txt"), title())) {
        qWarning() << "[Download] could not write title hint in" << m_directory;
    }

    updateItem([this](DownloadItem& it) {
        it.directory = m_directory;
        for (const DatasetFile& file : m_files) {
            it.ensurePart(file.name, QDir(m_directory).filePath(QFileInfo(file.name).fileName()), file.sizeBytes);
        }
    });

    const quint64 gen = generation();
    if (m_ctx.hub) {
        const std::optional<DownloadItem> current = item();
        for (const DatasetFile& file : m_files) {
            const PartState* p = current ? current->part(file.name) : nullptr;
            if (!p || p->completed || p->effectiveExpected() > 0) continue;

            ++m_pendingProbes;
            const QString part = file.name;
            m_ctx.hub->remoteSize(file.url, this, [this, gen, part](qint64 bytes) {
                if (!isCurrent(gen)) return;
                if (bytes > 0) {
                    updateItem([&part, bytes](DownloadItem& it) {
                        if (PartState* p = it.part(part)) p->catalogBytes = bytes;
                    });
                    refreshProgress();
                }
                if (--m_pendingProbes == 0) {
                    if (const std::optional<DownloadItem> current = item()) logDetectedSize(current->expectedBytes());
                    startNextFile();
                }
            });
        }
    }
    if (m_pendingProbes > 0) return;

    if (const std::optional<DownloadItem> current = item()) logDetectedSize(current->expectedBytes());
    startNextFile();
}

void DatasetOrchestrator::startNextFile()
{
    if (state() != State::Running) return;

    for (const DatasetFile& file : m_files) {
        const std::optional<DownloadItem> current = item();
        const PartState* p = current ? current->part(file.name) : nullptr;
        if (!p || p->completed) continue;
        if (hasActiveTransfer(file.name)) return;

        if (utils::fileExistsPath(p->finalPath) && !utils::fileExistsPath(utils::tempPathFor(p->finalPath))) {
            markPartCompleted(file.name, utils::fileSizeOnDisk(p->finalPath));
            continue;
        }
        if (!startFile(file)) failPermanently(DownloadError::permanent("Could not start download"));
        return;
    }
    finishIfComplete();
}

bool DatasetOrchestrator::startFile(const DatasetFile& file)
{
    const std::optional<DownloadItem> current = item();
    const PartState* p = current ? current->part(file.name) : nullptr;
    if (!p) return false;
    qDebug() << "[Download]" << identity() << "file" << file.name;
    return beginTransfer(makeRequest(file.name, file.url, p->finalPath, p->effectiveExpected()));
}

void DatasetOrchestrator::onPartFinished(const QString& part)
{
    m_fileAttempts.remove(part);
    DownloadOrchestrator::onPartFinished(part);
    startNextFile();
}

void DatasetOrchestrator::onPartFailed(const QString& part, const DownloadError& error)
{
    if (!error.isRetryable()) {
        DownloadOrchestrator::onPartFailed(part, error);
        return;
    }

    const int attempts = ++m_fileAttempts[part];
    if (attempts >= config().maxFileAttempts) {
        m_fileAttempts.clear();
        scheduleRetry(error);
        return;
    }
    retryFile(part, error);
}

void DatasetOrchestrator::retryFile(const QString& part, const DownloadError& error)
{
    const int attempts = m_fileAttempts.value(part);
    const int delaySec = utils::networkBackoffSeconds(attempts, config().maxNetworkBackoffSec);
    qWarning() << "[Download]" << identity() << part << error.message()
               << "- file attempt" << attempts << "retry in" << delaySec << "s";

    updateItem([&error](DownloadItem& it) {
        it.error = error;
        it.speed = 0.0;
        for (PartState& p : it.parts) p.speed = 0.0;
    });

    const quint64 gen = generation();
    QTimer::singleShot(delaySec * 1000, Qt::PreciseTimer, this, [this, gen]() {
        if (!isCurrent(gen)) return;
        auto resume = [this, gen]() {
            if (!isCurrent(gen)) return;
            startNextFile();
        };
        if (m_ctx.connectivity) {
            m_ctx.connectivity->whenOnline(this, resume);
        } else {
            resume();
        }
    });
}

void DatasetOrchestrator::onStopped()
{
    m_fileAttempts.clear();
    m_pendingProbes = 0;
}
