module;
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QPointer>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QUrl>
#include <QtGlobal>
#include <optional>

module porter.core.download_orchestrator;

import porter.core.byte_reconciler;
import porter.utils.download_utils;
import porter.utils.retry_utils;

namespace utils = porter::utils;

namespace {

bool samePath(const QString& a, const QString& b)
{
    if (a.isEmpty() || b.isEmpty()) return false;
    return QFileInfo(a).absoluteFilePath() == QFileInfo(b).absoluteFilePath();
}

bool sameFileName(const QString& a, const QString& b)
{
    if (a.isEmpty() || b.isEmpty()) return false;
    return QFileInfo(a).fileName() == QFileInfo(b).fileName();
}

// Moves a complete temp file into place. minimumBytes guards against
// promoting a file that is still being written.
bool promoteTempFile(const QString& finalPath, qint64 minimumBytes = 0)
{
    const QString temp = utils::tempPathFor(finalPath);
    if (!utils::fileExistsPath(temp)) return utils::fileExistsPath(finalPath);
    if (minimumBytes > 0 && utils::fileSizeOnDisk(temp) < minimumBytes) return false;
    if (QFile::exists(finalPath) && !QFile::remove(finalPath)) return false;
    if (!QFile::rename(temp, finalPath)) {
        qWarning() << "[Download] rename failed" << temp << "->" << finalPath;
        return false;
    }
    return true;
}

} // namespace

DownloadOrchestrator::DownloadOrchestrator(ArtifactKind kind, const QString& identity,
                                           const DownloadContext& context, QObject* parent)
    : QObject(parent)
    , m_ctx(context)
    , m_kind(kind)
    , m_identity(identity)
{
}

bool DownloadOrchestrator::isActive() const
{
    return m_state == State::Running || m_state == State::Paused || m_state == State::BackoffRetry;
}

QString DownloadOrchestrator::stateName(State state)
{
    switch (state) {
    case State::Idle: return "idle";
    case State::Running: return "running";
    case State::Paused: return "paused";
    case State::BackoffRetry: return "backoffRetry";
    case State::PermanentlyFailed: return "permanentlyFailed";
    case State::Cancelled: return "cancelled";
    case State::Finished: return "finished";
    }
    return QString();
}

std::optional<DownloadItem> DownloadOrchestrator::item() const
{
    return m_ctx.store->item(m_kind, m_identity);
}

void DownloadOrchestrator::setState(State state)
{
    if (m_state == state) return;
    m_state = state;
    qDebug() << "[Download]" << m_identity << stateName(state);
    emit stateChanged(state);
}

void DownloadOrchestrator::start()
{
    if (m_state == State::Running || m_state == State::Finished) return;

    ++m_generation;
    m_streams.clear();
    m_ctx.store->ensure(m_kind, m_identity, title());
    setState(State::Running);
    run();
}

void DownloadOrchestrator::pause()
{
    if (m_state != State::Running && m_state != State::BackoffRetry) return;

    haltTransfers(false);
    m_ctx.speed->forget(m_identity);
    updateItem([](DownloadItem& it) {
        it.speed = 0.0;
        it.verifying = false;
        for (PartState& p : it.parts) p.speed = 0.0;
    });
    setState(State::Paused);
    onStopped();
}

void DownloadOrchestrator::cancel()
{
    if (m_state == State::Cancelled) return;

    haltTransfers(true);
    if (const std::optional<DownloadItem> current = item()) {
        for (const PartState& p : current->parts) {
            m_ctx.transport->cancel(p.finalPath);
            if (!utils::removeArtifactFiles(p.finalPath)) {
                qWarning() << "[Download] could not remove" << p.finalPath;
            }
        }
    }
    m_ctx.speed->forget(m_identity);
    m_ctx.store->remove(m_kind, m_identity);
    setState(State::Cancelled);
    onStopped();
    qInfo() << "[Download]" << artifactKindName(m_kind) << m_identity << "cancelled";
    emit removed(m_identity);
}

void DownloadOrchestrator::haltTransfers(bool discard)
{
    // Bumped first: transports may report the halt synchronously.
    ++m_generation;
    const QHash<QString, QPointer<TransferStream>> streams = m_streams;
    m_streams.clear();
    for (const QPointer<TransferStream>& stream : streams) {
        if (!stream || stream->isFinished()) continue;
        const QString destination = stream->request().destination;
        if (discard) {
            m_ctx.transport->cancel(destination);
        } else {
            m_ctx.transport->pause(destination);
        }
    }
}

bool DownloadOrchestrator::hasActiveTransfer(const QString& part) const
{
    const QPointer<TransferStream> stream = m_streams.value(part);
    return stream && !stream->isFinished();
}

TransferRequest DownloadOrchestrator::makeRequest(const QString& part, const QUrl& url,
                                                  const QString& destination, qint64 expectedBytes) const
{
    TransferRequest request;
    request.identity = m_identity;
    request.kind = m_kind;
    request.part = part;
    request.url = url;
    request.destination = destination;
    request.expectedBytes = qMax<qint64>(0, expectedBytes);
    request.headers.append({ QByteArrayLiteral("User-Agent"), config().userAgent.toUtf8() });
    if (!config().hubToken.isEmpty() && url.host() == config().hubBaseUrl.host()) {
        request.headers.append({ QByteArrayLiteral("Authorization"), "Bearer " + config().hubToken.toUtf8() });
    }
    return request;
}

bool DownloadOrchestrator::beginTransfer(const TransferRequest& request)
{
    TransferStream* stream = m_ctx.transport->download(request);
    if (!stream) {
        qWarning() << "[Download] transport refused" << request.url.toString();
        return false;
    }

    const quint64 gen = m_generation;
    const QString part = request.part;
    m_streams.insert(part, stream);
    connect(stream, &TransferStream::transferEvent, this, [this, gen, part](const TransferEvent& event) {
        if (gen != m_generation) return;
        handleEvent(part, event);
    });
    return true;
}

bool DownloadOrchestrator::updateItem(const DownloadStore::Mutator& mutator)
{
    return m_ctx.store->update(m_kind, m_identity, mutator);
}

void DownloadOrchestrator::recompute(DownloadItem& item, double computed)
{
    if (item.completed) return;
    item.progress = qMin(kProgressCeiling, qMax(item.progress, computed));
}

void DownloadOrchestrator::refreshProgress()
{
    updateItem([this](DownloadItem& it) { recompute(it, computeProgress(it)); });
}

double DownloadOrchestrator::computeProgress(const DownloadItem& item) const
{
    if (item.parts.isEmpty()) return 0.0;

    bool sizesKnown = true;
    for (const PartState& p : item.parts) {
        if (!p.completed && p.expectedBytes <= 0 && p.catalogBytes <= 0) {
            sizesKnown = false;
            break;
        }
    }
    if (sizesKnown) return item.combinedProgress();

    // Equal share per part while some size is unknown.
    double sum = 0.0;
    for (const PartState& p : item.parts) sum += p.completed ? 1.0 : p.progress;
    return sum / double(item.parts.size());
}

void DownloadOrchestrator::handleEvent(const QString& part, const TransferEvent& event)
{
    switch (event.type) {
    case TransferEvent::Type::Started:
        if (event.expectedBytes > 0) {
            updateItem([this, &part, &event](DownloadItem& it) {
                if (PartState* p = it.part(part)) p->expectedBytes = event.expectedBytes;
                it.error.reset();
                recompute(it, computeProgress(it));
            });
            if (const std::optional<DownloadItem> current = item()) logDetectedSize(current->expectedBytes());
        }
        break;

    case TransferEvent::Type::Progress:
        applyProgress(part, event);
        break;

    case TransferEvent::Type::Verifying:
        updateItem([](DownloadItem& it) { it.verifying = true; });
        break;

    case TransferEvent::Type::Paused:
        m_streams.remove(part);
        if (m_state != State::Running) break;
        pause();
        break;

    case TransferEvent::Type::NetworkError:
        m_streams.remove(part);
        onPartFailed(part, event.error.value_or(DownloadError::network("Network error")));
        break;

    case TransferEvent::Type::Failed:
        m_streams.remove(part);
        onPartFailed(part, event.error.value_or(DownloadError::permanent("Download failed")));
        break;

    case TransferEvent::Type::Cancelled:
        m_streams.remove(part);
        cancel();
        break;

    case TransferEvent::Type::Finished:
        m_streams.remove(part);
        onPartFinished(part);
        break;
    }
}

void DownloadOrchestrator::applyProgress(const QString& part, const TransferEvent& event)
{
    const qint64 now = SpeedEstimator::nowMs();
    updateItem([this, &part, &event, now](DownloadItem& it) {
        PartState* p = it.part(part);
        if (!p || p->completed) return;

        if (event.expectedBytes > 0) p->expectedBytes = event.expectedBytes;
        const qint64 known = p->expectedBytes > 0 ? p->expectedBytes : p->catalogBytes;
        const double fraction = qBound(0.0, event.fraction, kProgressCeiling);

        PartProbe probe = probeFor(*p);
        probe.counterBytes = event.bytesWritten >= 0 ? event.bytesWritten : qint64(fraction * double(known));
        const ByteCounts counts = ByteReconciler::reconcile(probe);

        p->writtenBytes = counts.written;
        if (known > 0) {
            p->expectedBytes = counts.expected;
            p->progress = qMin(kProgressCeiling, counts.fraction());
        } else {
            p->progress = fraction;
        }

        p->speed = event.instantSpeed > 0.0
            ? m_ctx.speed->addRateSample(m_identity, part, event.instantSpeed, counts.written, now)
            : m_ctx.speed->addByteSample(m_identity, part, counts.written, now);
        it.speed = m_ctx.speed->speed(m_identity);
        it.error.reset();
        recompute(it, computeProgress(it));
    });
}

PartProbe DownloadOrchestrator::probeFor(const PartState& part) const
{
    PartProbe probe;
    probe.finalPath = part.finalPath;
    probe.expectedBytes = part.expectedBytes;
    probe.catalogBytes = part.catalogBytes;
    return probe;
}

void DownloadOrchestrator::onPartFinished(const QString& part)
{
    const std::optional<DownloadItem> current = item();
    const PartState* p = current ? current->part(part) : nullptr;
    if (!p) return;

    if (!acceptFinalFile(*p)) {
        onPartRejected(part);
        return;
    }
    markPartCompleted(part, utils::fileSizeOnDisk(p->finalPath));
    onPartAccepted(part);
    finishIfComplete();
}

void DownloadOrchestrator::onPartFailed(const QString& part, const DownloadError& error)
{
    qWarning() << "[Download]" << m_identity << part << error.message();
    if (error.isRetryable()) {
        scheduleRetry(error);
    } else {
        failPermanently(error);
    }
}

bool DownloadOrchestrator::acceptFinalFile(const PartState& part) const
{
    return utils::fileExistsPath(part.finalPath);
}

void DownloadOrchestrator::onPartAccepted(const QString& part)
{
    Q_UNUSED(part);
}

void DownloadOrchestrator::onPartRejected(const QString& part)
{
    const std::optional<DownloadItem> current = item();
    if (const PartState* p = current ? current->part(part) : nullptr) {
        utils::removeArtifactFiles(p->finalPath);
    }
    failPermanently(DownloadError::permanent("Downloaded file failed validation"));
}

void DownloadOrchestrator::onPartDropped(const QString& part)
{
    Q_UNUSED(part);
}

InstalledArtifact DownloadOrchestrator::buildArtifact(const DownloadItem& item) const
{
    InstalledArtifact artifact;
    artifact.identity = m_identity;
    artifact.kind = m_kind;
    artifact.path = item.parts.isEmpty() ? item.directory : item.parts.first().finalPath;
    artifact.sizeBytes = item.writtenBytes();
    return artifact;
}

void DownloadOrchestrator::completeDownload()
{
    if (const std::optional<DownloadItem> current = item()) finish(buildArtifact(*current));
}

void DownloadOrchestrator::markPartCompleted(const QString& part, qint64 sizeOnDisk)
{
    m_ctx.speed->forgetPart(m_identity, part);
    updateItem([this, &part, sizeOnDisk](DownloadItem& it) {
        PartState* p = it.part(part);
        if (!p) return;
        p->completed = true;
        p->progress = 1.0;
        p->speed = 0.0;
        if (sizeOnDisk > 0) {
            p->writtenBytes = sizeOnDisk;
            p->expectedBytes = sizeOnDisk;
        } else {
            p->writtenBytes = p->effectiveExpected();
        }
        it.speed = m_ctx.speed->speed(m_identity);
        recompute(it, computeProgress(it));
    });
}

void DownloadOrchestrator::dropPart(const QString& part)
{
    m_streams.remove(part);
    m_ctx.speed->forgetPart(m_identity, part);
    updateItem([this, &part](DownloadItem& it) {
        it.removePart(part);
        it.speed = m_ctx.speed->speed(m_identity);
        recompute(it, computeProgress(it));
    });
    onPartDropped(part);
}

void DownloadOrchestrator::finishIfComplete()
{
    if (m_state == State::Finished || m_state == State::Cancelled) return;
    const std::optional<DownloadItem> current = item();
    if (current && !current->completed && current->allPartsCompleted()) completeDownload();
}

void DownloadOrchestrator::scheduleRetry(const DownloadError& error)
{
    if (m_state == State::Finished || m_state == State::Cancelled) return;

    haltTransfers(false);
    const quint64 gen = m_generation;
    m_ctx.speed->forget(m_identity);

    int retryCount = 0;
    m_ctx.store->ensure(m_kind, m_identity, title());
    updateItem([&error, &retryCount](DownloadItem& it) {
        it.retryCount += 1;
        retryCount = it.retryCount;
        it.error = error;
        it.speed = 0.0;
        it.verifying = false;
        for (PartState& p : it.parts) p.speed = 0.0;
    });
    setState(State::BackoffRetry);

    const int delaySec = utils::networkBackoffSeconds(retryCount, config().maxNetworkBackoffSec);
    qWarning() << "[Download]" << m_identity << error.message()
               << "- retry" << retryCount << "in" << delaySec << "s";

    QTimer::singleShot(delaySec * 1000, Qt::PreciseTimer, this, [this, gen]() {
        if (gen != m_generation || m_state != State::BackoffRetry) return;
        auto restart = [this, gen]() {
            if (gen != m_generation || m_state != State::BackoffRetry) return;
            start();
        };
        if (m_ctx.connectivity) {
            m_ctx.connectivity->whenOnline(this, restart);
        } else {
            restart();
        }
    });
}

void DownloadOrchestrator::failPermanently(const DownloadError& error)
{
    if (m_state == State::Finished || m_state == State::Cancelled) return;

    haltTransfers(false);
    m_ctx.speed->forget(m_identity);
    m_ctx.store->ensure(m_kind, m_identity, title());
    updateItem([&error](DownloadItem& it) {
        it.error = error;
        it.speed = 0.0;
        it.verifying = false;
        for (PartState& p : it.parts) p.speed = 0.0;
    });
    setState(State::PermanentlyFailed);
    qWarning() << "[Download]" << artifactKindName(m_kind) << m_identity << "failed:" << error.message();
    emit failed(m_identity, error.message());
    scheduleRemoval(config().failedGraceMs);
}

void DownloadOrchestrator::finish(const InstalledArtifact& artifact)
{
    if (m_state == State::Finished || m_state == State::Cancelled) return;

    haltTransfers(false);
    m_ctx.speed->forget(m_identity);

    InstalledArtifact record = artifact;
    record.identity = m_identity;
    record.kind = m_kind;
    if (!record.installedAt.isValid()) record.installedAt = QDateTime::currentDateTimeUtc();

    m_ctx.store->ensure(m_kind, m_identity, title());
    updateItem([](DownloadItem& it) {
        for (PartState& p : it.parts) {
            p.completed = true;
            p.progress = 1.0;
            p.speed = 0.0;
            p.expectedBytes = p.writtenBytes > 0 ? p.writtenBytes : p.effectiveExpected();
        }
        it.progress = 1.0;
        it.speed = 0.0;
        it.completed = true;
        it.verifying = false;
        it.error.reset();
    });

    if (m_ctx.installer) m_ctx.installer->install(record);

    setState(State::Finished);
    qInfo().noquote() << "[Download]" << artifactKindName(m_kind) << m_identity << "finished"
                      << utils::humanReadableBytes(record.sizeBytes);
    emit finished(m_identity);
    scheduleRemoval(config().finishedGraceMs);
}

void DownloadOrchestrator::scheduleRemoval(int delayMs)
{
    const quint64 gen = m_generation;
    QTimer::singleShot(qMax(0, delayMs), this, [this, gen]() {
        if (gen != m_generation) return;
        if (m_state != State::Finished && m_state != State::PermanentlyFailed) return;
        m_ctx.store->remove(m_kind, m_identity);
        emit removed(m_identity);
    });
}

void DownloadOrchestrator::logDetectedSize(qint64 bytes)
{
    if (bytes <= 0 || m_loggedSizes.contains(bytes)) return;
    m_loggedSizes.insert(bytes);
    qInfo().noquote() << "[Download]" << artifactKindName(m_kind) << m_identity
                      << "size" << utils::humanReadableBytes(bytes);
}

DownloadOrchestrator::PathMatch DownloadOrchestrator::matchPath(const QString& path) const
{
    const std::optional<DownloadItem> current = item();
    if (!current || path.isEmpty()) return PathMatch::None;

    const QString finalPath = utils::finalPathFor(path);
    for (int i = 0; i < current->parts.size(); ++i) {
        if (samePath(current->parts.at(i).finalPath, finalPath)) {
            return i == 0 ? PathMatch::Primary : PathMatch::Auxiliary;
        }
    }
    for (int i = 0; i < current->parts.size(); ++i) {
        if (sameFileName(current->parts.at(i).finalPath, finalPath)) {
            return i == 0 ? PathMatch::Primary : PathMatch::Auxiliary;
        }
    }
    return PathMatch::None;
}

bool DownloadOrchestrator::finalizeFromDisk(FinalizeSource source)
{
    if (m_state == State::Finished || m_state == State::Cancelled) return false;
    const std::optional<DownloadItem> current = item();
    if (!current || current->completed || current->parts.isEmpty()) return false;

    QStringList present;
    QStringList missing;
    QHash<QString, QString> relocated;
    for (int i = 0; i < current->parts.size(); ++i) {
        PartState p = current->parts.at(i);
        if (p.completed) continue;

        const bool transferring = hasActiveTransfer(p.name);
        if (source == FinalizeSource::Notification && !transferring) {
            promoteTempFile(p.finalPath);
        } else if (source == FinalizeSource::Sweep && i > 0) {
            if (p.effectiveExpected() > 0 && p.writtenBytes >= p.effectiveExpected()) {
                promoteTempFile(p.finalPath, p.effectiveExpected());
            }
            if (!utils::fileExistsPath(p.finalPath)) {
                const QString located = locateOnDisk(*current, p);
                if (!located.isEmpty()) {
                    p.finalPath = located;
                    relocated.insert(p.name, located);
                }
            }
        }

        if (utils::fileExistsPath(p.finalPath) && acceptFinalFile(p)) {
            present.append(p.name);
        } else if (i == 0 || source == FinalizeSource::Sweep) {
            return false;
        } else if (!transferring) {
            missing.append(p.name);
        }
    }

    qInfo() << "[Download]" << artifactKindName(m_kind) << m_identity << "finalized from disk";
    for (const PartState& p : current->parts) {
        if (present.contains(p.name)) {
            const QString path = relocated.value(p.name, p.finalPath);
            if (path != p.finalPath) {
                qInfo() << "[Download]" << m_identity << p.name << "found on disk as" << path;
                updateItem([&p, &path](DownloadItem& it) {
                    if (PartState* part = it.part(p.name)) part->finalPath = path;
                });
            }
            m_streams.remove(p.name);
            markPartCompleted(p.name, utils::fileSizeOnDisk(path));
            onPartAccepted(p.name);
        } else if (missing.contains(p.name)) {
            utils::removeArtifactFiles(p.finalPath);
            dropPart(p.name);
        }
    }
    finishIfComplete();
    return true;
}

QString DownloadOrchestrator::locateOnDisk(const DownloadItem& item, const PartState& part) const
{
    const QString located = ByteReconciler::locate(probeFor(part));
    if (located.isEmpty()) return QString();
    for (const PartState& other : item.parts) {
        if (samePath(other.finalPath, located)) return QString();
    }
    const qint64 expected = part.effectiveExpected();
    if (expected > 0 && utils::fileSizeOnDisk(located) < expected) return QString();
    return located;
}

bool DownloadOrchestrator::completeAuxiliary(const QString& path)
{
    if (m_state == State::Finished || m_state == State::Cancelled) return false;
    const std::optional<DownloadItem> current = item();
    if (!current || current->completed) return false;

    const QString finalPath = utils::finalPathFor(path);
    for (int i = 1; i < current->parts.size(); ++i) {
        const PartState& p = current->parts.at(i);
        if (!samePath(p.finalPath, finalPath) && !sameFileName(p.finalPath, finalPath)) continue;
        if (p.completed) return false;

        m_streams.remove(p.name);
        promoteTempFile(p.finalPath);
        if (utils::fileExistsPath(p.finalPath) && acceptFinalFile(p)) {
            markPartCompleted(p.name, utils::fileSizeOnDisk(p.finalPath));
            onPartAccepted(p.name);
        } else {
            qWarning() << "[Download]" << m_identity << "dropping" << p.name << "after background completion";
            utils::removeArtifactFiles(p.finalPath);
            dropPart(p.name);
        }
        finishIfComplete();
        return true;
    }
    return false;
}
