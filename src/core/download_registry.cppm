/*!
 * @file        download_registry.cppm
 * @brief       Entry point of the download engine.
 * @details     The registry owns the item store, the speed estimator and one
 *              orchestrator per shown download. It exposes the start, pause,
 *              resume and cancel operations for every artifact kind, computes
 *              aggregate progress across all of them, and drives the 1 Hz
 *              maintenance tick (stale speed sweep and background completion
 *              sweep).
 *
 *              Responsibilities include:
 *              - Orchestrator lifecycle (create, start, pause, resume, cancel)
 *              - Pause set and per-identity cleanup across kinds
 *              - Aggregate progress weighted by expected bytes
 *              - Out-of-band completions reported by the transport
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>
#include <QString>
#include <QTimer>
#include <functional>

#ifndef Q_MOC_RUN
export module porter.core.download_registry;
import porter.core.artifact;
import porter.core.download_config;
import porter.core.download_orchestrator;
import porter.core.download_store;
import porter.core.speed_estimator;
import porter.core.transfer;
import porter.services.connectivity_monitor;
import porter.services.hub_client;
import porter.services.request_scheduler;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief Collaborators of a registry.
 *
 * transport and installer are required. hub, scheduler and connectivity are
 * optional; without them metadata probes are skipped, the offline switch only
 * affects the registry configuration and retries do not wait for connectivity.
 */
PORTER_MODULE_EXPORT struct RegistryServices {
    ArtifactTransport* transport = nullptr;
    ArtifactInstaller* installer = nullptr;
    HubClient* hub = nullptr;
    RequestScheduler* scheduler = nullptr;
    ConnectivityMonitor* connectivity = nullptr;
};

/**
 * @brief Central coordinator of all artifact downloads.
 */
PORTER_MODULE_EXPORT class DownloadRegistry : public QObject {

    Q_OBJECT

    //!< @brief Item store, usable as a list model.
    Q_PROPERTY(DownloadStore* store READ store CONSTANT)

    //!< @brief Progress across every download, weighted by expected bytes.
    Q_PROPERTY(double overallProgress READ overallProgress NOTIFY progressChanged)

    //!< @brief True when there is at least one item and every item is completed.
    Q_PROPERTY(bool allCompleted READ allCompleted NOTIFY progressChanged)

public:
    //!< @brief Interval of the maintenance tick.
    static constexpr int kTickIntervalMs = 1000;

    /**
     * @brief Construct a registry.
     * @param config Engine configuration, copied.
     * @param services Shared collaborators, not owned.
     * @param parent Optional parent QObject.
     */
    DownloadRegistry(const DownloadConfig& config, const RegistryServices& services, QObject* parent = nullptr);
    ~DownloadRegistry() override;

    DownloadStore* store() const { return m_store; }
    const DownloadConfig& config() const { return m_config; }
    SpeedEstimator& speedEstimator() { return m_speed; }

    /**
     * @brief Starts a model download.
     *
     * Idempotent: returns false while a download of the same identity is
     * running, paused, backing off or finished. A permanently failed one is
     * restarted.
     *
     * @param spec Model and quantization.
     * @return true if a download was started.
     */
    bool startModel(const ModelSpec& spec);

    //!< @brief Starts a bundle download; same contract as startModel().
    bool startBundle(const BundleSpec& spec);

    //!< @brief Starts a dataset download; same contract as startModel().
    bool startDataset(const DatasetSpec& spec);

    //!< @brief Starts an embedding model download; same contract as startModel().
    bool startEmbedding(const EmbeddingSpec& spec);

    /**
     * @brief Pauses every download of an identity.
     * @return true if a download with this identity exists.
     */
    bool pause(const QString& identity);

    /**
     * @brief Resumes downloads of an identity.
     *
     * Clears the pause flag, the error and the retry count, then starts again
     * from whatever is on disk.
     *
     * @return true if a download with this identity exists.
     */
    bool resume(const QString& identity);

    /**
     * @brief Cancels every download of an identity.
     *
     * Files of every part are deleted and the identity disappears from every
     * kind's collection, including items no orchestrator owns anymore.
     *
     * @return true if anything was removed.
     */
    bool cancel(const QString& identity);

    //!< @brief Global kill switch for network activity.
    void setOffline(bool offline);
    bool isOffline() const { return m_config.offline; }

    double overallProgress() const;
    bool allCompleted() const;

    /**
     * @brief Orchestrator owning the item of one download.
     *
     * Stays available while the item is shown, including the grace delay
     * after a finish or a permanent failure.
     *
     * @return nullptr once the item was removed.
     */
    DownloadOrchestrator* orchestrator(ArtifactKind kind, const QString& identity) const;

    //!< @brief Every orchestrator owning a shown item.
    QList<DownloadOrchestrator*> orchestrators() const;

    //!< @brief Whether a task is actively running for the download.
    bool hasTask(ArtifactKind kind, const QString& identity) const { return m_tasks.contains(keyFor(kind, identity)); }

    //!< @brief Number of actively running tasks.
    int taskCount() const { return m_tasks.size(); }

public slots:
    /**
     * @brief Handles a transfer that completed while nobody was listening.
     * @param destination Temp or final path.
     * @param errorMessage Empty on success.
     */
    void handleBackgroundCompletion(const QString& destination, const QString& errorMessage);

    //!< @brief One maintenance pass: stale speed sweep and completion sweep.
    void tick();

signals:
    //!< @brief Emitted whenever any item changed.
    void progressChanged();

    void downloadFinished(ArtifactKind kind, const QString& identity);
    void downloadFailed(ArtifactKind kind, const QString& identity, const QString& message);
    void itemRemoved(ArtifactKind kind, const QString& identity);

private:
    using Factory = std::function<DownloadOrchestrator*()>;

    static QString keyFor(ArtifactKind kind, const QString& identity);
    bool startWith(ArtifactKind kind, const QString& identity, const Factory& factory);
    void attach(DownloadOrchestrator* orchestrator);
    void release(DownloadOrchestrator* orchestrator);
    QList<DownloadOrchestrator*> orchestratorsFor(const QString& identity) const;

    DownloadConfig m_config;
    RegistryServices m_services;
    DownloadStore* m_store = nullptr;
    SpeedEstimator m_speed;
    DownloadContext m_ctx;
    QHash<QString, DownloadOrchestrator*> m_orchestrators;   //!< "<kind>:<identity>" -> owner of a shown item.
    QSet<QString> m_tasks;                                  //!< Keys of running orchestrators.
    QTimer m_tickTimer;
};

#include "download_registry.moc"
