module;
#include <QDebug>
#include <QHash>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QVector>
#include <functional>
#include <optional>
#include <utility>

module porter.core.download_registry;

import porter.core.background_reconciler;
import porter.core.bundle_orchestrator;
import porter.core.dataset_orchestrator;
import porter.core.download_item;
import porter.core.embedding_orchestrator;
import porter.core.model_orchestrator;
import porter.utils.download_utils;

namespace utils = porter::utils;

DownloadRegistry::DownloadRegistry(const DownloadConfig& config, const RegistryServices& services, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_services(services)
    , m_store(new DownloadStore(this))
{
    m_ctx.config = &m_config;
    m_ctx.hub = services.hub;
    m_ctx.transport = services.transport;
    m_ctx.installer = services.installer;
    m_ctx.connectivity = services.connectivity;
    m_ctx.store = m_store;
    m_ctx.speed = &m_speed;

    connect(m_store, &DownloadStore::itemChanged, this, &DownloadRegistry::progressChanged);
    if (m_services.transport) {
        connect(m_services.transport, &ArtifactTransport::backgroundTransferCompleted,
                this, &DownloadRegistry::handleBackgroundCompletion);
    }

    m_tickTimer.setInterval(kTickIntervalMs);
    connect(&m_tickTimer, &QTimer::timeout, this, &DownloadRegistry::tick);
    m_tickTimer.start();

    if (m_config.offline) setOffline(true);
}

DownloadRegistry::~DownloadRegistry()
{
    m_tickTimer.stop();
    for (DownloadOrchestrator* o : std::as_const(m_orchestrators)) {
        disconnect(o, nullptr, this, nullptr);
    }
}

QString DownloadRegistry::keyFor(ArtifactKind kind, const QString& identity)
{
    return artifactKindName(kind) + ':' + identity;
}

bool DownloadRegistry::startModel(const ModelSpec& spec)
{
    return startWith(ArtifactKind::Model, spec.identity(), [this, &spec]() {
        return new ModelOrchestrator(spec, m_ctx, this);
    });
}

bool DownloadRegistry::startBundle(const BundleSpec& spec)
{
    return startWith(ArtifactKind::Bundle, spec.identity(), [this, &spec]() {
        return new BundleOrchestrator(spec, m_ctx, this);
    });
}

bool DownloadRegistry::startDataset(const DatasetSpec& spec)
{
    return startWith(ArtifactKind::Dataset, spec.identity(), [this, &spec]() {
        return new DatasetOrchestrator(spec, m_ctx, this);
    });
}

bool DownloadRegistry::startEmbedding(const EmbeddingSpec& spec)
{
    return startWith(ArtifactKind::Embedding, spec.identity(), [this, &spec]() {
        return new EmbeddingOrchestrator(spec, m_ctx, this);
    });
}

bool DownloadRegistry::startWith(ArtifactKind kind, const QString& identity, const Factory& factory)
{
    if (identity.isEmpty()) {
        qWarning() << "[Registry] refusing a download without identity";
        return false;
    }

    const QString key = keyFor(kind, identity);
    if (DownloadOrchestrator* existing = m_orchestrators.value(key)) {
        if (existing->isActive() || existing->state() == DownloadOrchestrator::State::Finished) return false;
        m_store->setPaused(identity, false);
        existing->start();
        return true;
    }

    DownloadOrchestrator* orchestrator = factory();
    m_orchestrators.insert(key, orchestrator);
    attach(orchestrator);
    m_store->setPaused(identity, false);
    qInfo() << "[Registry] start" << key;
    orchestrator->start();
    return true;
}

void DownloadRegistry::attach(DownloadOrchestrator* orchestrator)
{
    const QString key = keyFor(orchestrator->kind(), orchestrator->identity());
    connect(orchestrator, &DownloadOrchestrator::stateChanged, this, [this, orchestrator, key](DownloadOrchestrator::State state) {
        // Only a running orchestrator holds a task handle.
        if (state == DownloadOrchestrator::State::Running) {
            m_tasks.insert(key);
        } else {
            m_tasks.remove(key);
        }

        if (state == DownloadOrchestrator::State::Paused) {
            m_store->setPaused(orchestrator->identity(), true);
        } else if (state == DownloadOrchestrator::State::Running) {
            m_store->setPaused(orchestrator->identity(), false);
        }
    });
    connect(orchestrator, &DownloadOrchestrator::finished, this, [this, orchestrator](const QString& identity) {
        emit downloadFinished(orchestrator->kind(), identity);
    });
    connect(orchestrator, &DownloadOrchestrator::failed, this, [this, orchestrator](const QString& identity, const QString& message) {
        emit downloadFailed(orchestrator->kind(), identity, message);
    });
    connect(orchestrator, &DownloadOrchestrator::removed, this, [this, orchestrator]() {
        release(orchestrator);
    });
}

void DownloadRegistry::release(DownloadOrchestrator* orchestrator)
{
    const ArtifactKind kind = orchestrator->kind();
    const QString identity = orchestrator->identity();
    const QString key = keyFor(kind, identity);
    if (m_orchestrators.value(key) == orchestrator) {
        m_orchestrators.remove(key);
        m_tasks.remove(key);
    }

    disconnect(orchestrator, nullptr, this, nullptr);
    orchestrator->deleteLater();
    if (orchestratorsFor(identity).isEmpty()) m_store->setPaused(identity, false);
    emit itemRemoved(kind, identity);
    emit progressChanged();
}

QList<DownloadOrchestrator*> DownloadRegistry::orchestratorsFor(const QString& identity) const
{
    QList<DownloadOrchestrator*> out;
    for (DownloadOrchestrator* o : m_orchestrators) {
        if (o->identity() == identity) out.append(o);
    }
    return out;
}

DownloadOrchestrator* DownloadRegistry::orchestrator(ArtifactKind kind, const QString& identity) const
{
    return m_orchestrators.value(keyFor(kind, identity), nullptr);
}

QList<DownloadOrchestrator*> DownloadRegistry::orchestrators() const
{
    return m_orchestrators.values();
}

bool DownloadRegistry::pause(const QString& identity)
{
    const QList<DownloadOrchestrator*> targets = orchestratorsFor(identity);
    if (targets.isEmpty()) return false;

    m_store->setPaused(identity, true);
    for (DownloadOrchestrator* o : targets) o->pause();
    qInfo() << "[Registry] paused" << identity;
    return true;
}

bool DownloadRegistry::resume(const QString& identity)
{
    const QList<DownloadOrchestrator*> targets = orchestratorsFor(identity);
    if (targets.isEmpty()) return false;

    m_store->setPaused(identity, false);
    for (DownloadOrchestrator* o : targets) {
        m_store->update(o->kind(), identity, [](DownloadItem& it) {
            it.error.reset();
            it.retryCount = 0;
        });
        if (o->state() == DownloadOrchestrator::State::Running) continue;
        o->start();
    }
    qInfo() << "[Registry] resumed" << identity;
    return true;
}

bool DownloadRegistry::cancel(const QString& identity)
{
    bool removed = false;
    for (DownloadOrchestrator* o : orchestratorsFor(identity)) {
        o->cancel();
        removed = true;
    }

    // Items whose orchestrator is already gone still own files on disk.
    const QVector<DownloadItem> items = m_store->allItems();
    for (const DownloadItem& item : items) {
        if (item.identity != identity) continue;
        for (const PartState& part : item.parts) {
            if (m_services.transport) m_services.transport->cancel(part.finalPath);
            utils::removeArtifactFiles(part.finalPath);
        }
    }
    if (m_store->removeEverywhere(identity) > 0) removed = true;
    m_store->setPaused(identity, false);
    m_speed.forget(identity);

    if (removed) qInfo() << "[Registry] cancelled" << identity;
    return removed;
}

void DownloadRegistry::setOffline(bool offline)
{
    m_config.offline = offline;
    if (m_services.scheduler) m_services.scheduler->setOffline(offline);
    if (m_services.connectivity) m_services.connectivity->setForcedOffline(offline);
    qInfo() << "[Registry] offline" << offline;
}

double DownloadRegistry::overallProgress() const
{
    double weighted = 0.0;
    double total = 0.0;
    for (const DownloadItem& item : m_store->allItems()) {
        const qint64 expected = item.expectedBytes();
        const double weight = expected > 0 ? double(expected) : 1.0;
        const double progress = item.completed ? 1.0 : qBound(0.0, item.progress, 1.0);
        weighted += weight * progress;
        total += weight;
    }
    return total > 0.0 ? weighted / total : 0.0;
}

bool DownloadRegistry::allCompleted() const
{
    const QVector<DownloadItem>& items = m_store->allItems();
    if (items.isEmpty()) return false;
    for (const DownloadItem& item : items) {
        if (!item.completed) return false;
    }
    return true;
}

void DownloadRegistry::handleBackgroundCompletion(const QString& destination, const QString& errorMessage)
{
    BackgroundReconciler::handleCompletion(orchestrators(), destination, errorMessage);
}

void DownloadRegistry::tick()
{
    const QStringList zeroed = m_speed.sweep(SpeedEstimator::nowMs(), m_store->pausedIdentities());
    for (const QString& identity : zeroed) {
        for (const ArtifactKind kind : allArtifactKinds()) {
            m_store->update(kind, identity, [this, &identity](DownloadItem& it) {
                for (PartState& p : it.parts) p.speed = m_speed.partSpeed(identity, p.name);
                it.speed = m_speed.speed(identity);
            });
        }
    }

    const int finalized = BackgroundReconciler::sweep(orchestrators());
    if (finalized > 0) qInfo() << "[Registry] sweep finalized" << finalized << "download(s)";
}
