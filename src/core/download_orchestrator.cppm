/*!
 * @file        download_orchestrator.cppm
 * @brief       Shared lifecycle of a single artifact download.
 * @details     A DownloadOrchestrator drives the transfers of one identity,
 *              translates their event streams into item state in the
 *              DownloadStore, and owns the retry, pause, cancel and finalize
 *              paths. Kind specific orchestrators implement run() and a small
 *              set of hooks; everything else is shared.
 *
 *              Every asynchronous continuation is tagged with a generation
 *              counter. pause(), cancel() and every restart bump the
 *              generation, which turns callbacks of earlier runs into no-ops.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QObject>
#include <QPointer>
#include <QSet>
#include <QString>
#include <QUrl>
#include <QtGlobal>
#include <optional>

#ifndef Q_MOC_RUN
export module porter.core.download_orchestrator;
import porter.core.artifact;
import porter.core.byte_reconciler;
import porter.core.download_config;
import porter.core.download_error;
import porter.core.download_item;
import porter.core.download_store;
import porter.core.speed_estimator;
import porter.core.transfer;
import porter.services.connectivity_monitor;
import porter.services.hub_client;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief Collaborators shared by every orchestrator of a registry.
 *
 * The registry owns all of them; orchestrators only borrow.
 * hub and connectivity may be null, in which case metadata probes are
 * skipped and retries restart as soon as their backoff elapsed.
 */
PORTER_MODULE_EXPORT struct DownloadContext {
    const DownloadConfig* config = nullptr;
    HubClient* hub = nullptr;
    ArtifactTransport* transport = nullptr;
    ArtifactInstaller* installer = nullptr;
    ConnectivityMonitor* connectivity = nullptr;
    DownloadStore* store = nullptr;
    SpeedEstimator* speed = nullptr;
};

/**
 * @brief Base class of the per-kind download orchestrators.
 */
PORTER_MODULE_EXPORT class DownloadOrchestrator : public QObject {

    Q_OBJECT

    Q_PROPERTY(QString identity READ identity CONSTANT)

public:
    enum class State {
        Idle,
        Running,
        Paused,
        BackoffRetry,
        PermanentlyFailed,
        Cancelled,
        Finished
    };
    Q_ENUM(State)

    //!< @brief Which of the item's files a path refers to.
    enum class PathMatch {
        None,
        Primary,    //!< First part (weights, bundle file, first dataset file).
        Auxiliary   //!< Any other part.
    };

    //!< @brief Where a finalize request comes from.
    enum class FinalizeSource {
        Notification,   //!< Out-of-band completion; temp files may be promoted.
        Sweep           //!< Periodic sweep; only final files count.
    };

    //!< @brief Upper bound of item progress before a true completion.
    static constexpr double kProgressCeiling = 0.999;

    /**
     * @brief Construct an orchestrator.
     * @param kind Artifact kind.
     * @param identity Download identity.
     * @param context Shared collaborators.
     * @param parent Owning registry.
     */
    DownloadOrchestrator(ArtifactKind kind, const QString& identity,
                         const DownloadContext& context, QObject* parent = nullptr);
    ~DownloadOrchestrator() override = default;

    ArtifactKind kind() const { return m_kind; }
    QString identity() const { return m_identity; }
    State state() const { return m_state; }

    //!< @brief Running, paused or waiting for a retry.
    bool isActive() const;

    //!< @brief Display name of a state.
    static QString stateName(State state);

    //!< @brief Current item, if present in the store.
    std::optional<DownloadItem> item() const;

    /**
     * @brief Starts or restarts the download.
     *
     * No-op while running or after a successful finish.
     */
    void start();

    //!< @brief Halts every transfer, keeping temp files for a later resume.
    void pause();

    /**
     * @brief Aborts the download.
     *
     * Cancels every transfer, deletes temp and final files of every part and
     * removes the item from the store immediately.
     */
    void cancel();

    /**
     * @brief Matches a destination notification against the item's parts.
     * @param path Temp or final path.
     * @return Which part, if any, the path belongs to.
     */
    virtual PathMatch matchPath(const QString& path) const;

    /**
     * @brief Completes the download from the files present on disk.
     *
     * Idempotent: returns false without side effects when the item is already
     * completed, gone, or its primary file is not on disk. A notification
     * leaves auxiliary parts that are still transferring running; the download
     * then finishes with them.
     *
     * @param source Notification promotes temp files of idle parts, Sweep only
     *               promotes auxiliary temp files that are fully written.
     * @return true if files were taken over by this call.
     */
    virtual bool finalizeFromDisk(FinalizeSource source);

    /**
     * @brief Completes an auxiliary part from a destination notification.
     * @param path Temp or final path of the part.
     * @return true if a part was completed or dropped.
     */
    bool completeAuxiliary(const QString& path);

signals:
    void stateChanged(DownloadOrchestrator::State state);

    //!< @brief The artifact was finalized and installed.
    void finished(const QString& identity);

    //!< @brief The download failed permanently.
    void failed(const QString& identity, const QString& message);

    //!< @brief The item left the store (grace delay elapsed or cancelled).
    void removed(const QString& identity);

protected:
    //!< @brief Kind specific start; called in the Running state.
    virtual void run() = 0;

    //!< @brief Title of the item.
    virtual QString title() const { return m_identity; }

    /**
     * @brief Handles a part whose transfer finished.
     *
     * The default validates the file, marks the part completed and finishes
     * the download once every part is complete.
     */
    virtual void onPartFinished(const QString& part);

    //!< @brief Retryable errors back off and restart; the rest fail the download.
    virtual void onPartFailed(const QString& part, const DownloadError& error);

    //!< @brief Validation of a finished part file.
    virtual bool acceptFinalFile(const PartState& part) const;

    //!< @brief Called after a part was validated and marked completed.
    virtual void onPartAccepted(const QString& part);

    //!< @brief Called when a finished part failed validation.
    virtual void onPartRejected(const QString& part);

    //!< @brief Called after an auxiliary part was removed from the item.
    virtual void onPartDropped(const QString& part);

    //!< @brief Record handed to the installer.
    virtual InstalledArtifact buildArtifact(const DownloadItem& item) const;

    //!< @brief Final step once every part is complete; the default installs right away.
    virtual void completeDownload();

    //!< @brief Combined item progress before clamping.
    virtual double computeProgress(const DownloadItem& item) const;

    /**
     * @brief Reconciler inputs for a part.
     *
     * The default only probes the part's own paths. Kinds whose companion
     * files may land under another name add a search directory and hints.
     */
    virtual PartProbe probeFor(const PartState& part) const;

    //!< @brief Called after pause() or cancel() stopped every transfer.
    virtual void onStopped() {}

    /**
     * @brief Starts a transfer and routes its events to this orchestrator.
     * @return false when the transport refused the request.
     */
    bool beginTransfer(const TransferRequest& request);

    //!< @brief Request for one part with the hub headers attached when needed.
    TransferRequest makeRequest(const QString& part, const QUrl& url,
                                const QString& destination, qint64 expectedBytes) const;

    //!< @brief Applies a mutation to the item.
    bool updateItem(const DownloadStore::Mutator& mutator);

    //!< @brief Recomputes item progress without letting it regress.
    void refreshProgress();

    //!< @brief Marks a part complete with the given size on disk.
    void markPartCompleted(const QString& part, qint64 sizeOnDisk);

    //!< @brief Removes a part whose file will not be delivered.
    void dropPart(const QString& part);

    //!< @brief Finishes the download when every part is complete.
    void finishIfComplete();

    //!< @brief Backs off, waits for connectivity and restarts.
    void scheduleRetry(const DownloadError& error);

    //!< @brief Surfaces a permanent error and removes the item after the grace delay.
    void failPermanently(const DownloadError& error);

    //!< @brief Installs the artifact and removes the item after the grace delay.
    void finish(const InstalledArtifact& artifact);

    //!< @brief Logs a detected total size once per size.
    void logDetectedSize(qint64 bytes);

    //!< @brief Whether a callback captured under @p generation may still act.
    bool isCurrent(quint64 generation) const { return generation == m_generation && m_state == State::Running; }

    quint64 generation() const { return m_generation; }
    const DownloadConfig& config() const { return *m_ctx.config; }
    bool hasActiveTransfer(const QString& part) const;

    DownloadContext m_ctx;

private:
    void setState(State state);
    void handleEvent(const QString& part, const TransferEvent& event);
    void applyProgress(const QString& part, const TransferEvent& event);
    QString locateOnDisk(const DownloadItem& item, const PartState& part) const;
    void haltTransfers(bool discard);
    void scheduleRemoval(int delayMs);
    static void recompute(DownloadItem& item, double computed);

    ArtifactKind m_kind;
    QString m_identity;
    State m_state = State::Idle;
    quint64 m_generation = 0;
    QHash<QString, QPointer<TransferStream>> m_streams;
    QSet<qint64> m_loggedSizes;
};

#include "download_orchestrator.moc"
