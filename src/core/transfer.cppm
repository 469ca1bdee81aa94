/*!
 * @file        transfer.cppm
 * @brief       Contracts between the orchestration core and its collaborators.
 * @details     Declares the typed event stream a transport emits for one
 *              transfer, the request describing that transfer, the abstract
 *              transport that produces streams, and the installer that receives
 *              finalized artifacts.
 *
 *              The core never talks to the network for artifact bytes directly;
 *              it only consumes TransferStream events. A default HTTP transport
 *              lives in the services layer and tests substitute their own.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QList>
#include <QObject>
#include <QPair>
#include <QString>
#include <QUrl>
#include <QtGlobal>
#include <optional>

#ifndef Q_MOC_RUN
export module porter.core.transfer;
import porter.core.artifact;
import porter.core.download_error;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief One event of a transfer's lifecycle.
 *
 * Byte counts of -1 mean "not reported by the transport".
 */
PORTER_MODULE_EXPORT struct TransferEvent {
    enum class Type {
        Started,
        Progress,
        Verifying,
        Paused,
        NetworkError,
        Failed,
        Cancelled,
        Finished
    };

    Type type = Type::Progress;
    double fraction = 0.0;                      //!< Transport reported fraction in [0, 1].
    qint64 bytesWritten = -1;                   //!< Bytes written so far including resumed bytes.
    qint64 expectedBytes = -1;                  //!< Total size reported by the session.
    double instantSpeed = 0.0;                  //!< Transport measured rate in bytes/sec, 0 when unknown.
    std::optional<DownloadError> error;         //!< Set for NetworkError and Failed.
    std::optional<InstalledArtifact> artifact;  //!< Set for Finished.

    static TransferEvent started(qint64 expectedBytes);
    static TransferEvent progress(double fraction, qint64 bytesWritten, qint64 expectedBytes, double instantSpeed = 0.0);
    static TransferEvent verifying();
    static TransferEvent paused(double fraction);
    static TransferEvent networkError(const DownloadError& error, double fraction);
    static TransferEvent failed(const DownloadError& error);
    static TransferEvent cancelled();
    static TransferEvent finished(const InstalledArtifact& artifact);

    //!< @brief True for events after which the stream emits nothing else.
    bool isTerminal() const;
};

/**
 * @brief Description of one physical file transfer.
 */
PORTER_MODULE_EXPORT struct TransferRequest {
    QString identity;               //!< Identity of the owning download.
    ArtifactKind kind = ArtifactKind::Model;
    QString part;                   //!< Sub-part name within the download.
    QUrl url;                       //!< Source URL.
    QString destination;            //!< Final path; the temp file sits next to it.
    qint64 expectedBytes = 0;       //!< Best known size, 0 when unknown.
    QList<QPair<QByteArray, QByteArray>> headers; //!< Extra request headers.
};

/**
 * @brief Ordered event stream of a single transfer.
 *
 * Events are delivered in emission order. Once a terminal event has been
 * emitted the stream ignores further events and schedules its own deletion.
 */
PORTER_MODULE_EXPORT class TransferStream : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a stream for a request.
     * @param request Transfer request the stream reports on.
     * @param parent Owning transport.
     */
    explicit TransferStream(const TransferRequest& request, QObject* parent = nullptr);

    //!< @brief Request this stream reports on.
    const TransferRequest& request() const { return m_request; }

    //!< @brief True once a terminal event has been emitted.
    bool isFinished() const { return m_finished; }

    //!< @brief Whether anyone is connected to transferEvent().
    bool hasListeners() const;

    /**
     * @brief Emits an event unless the stream already terminated.
     * @param event Event to deliver.
     */
    void emitEvent(const TransferEvent& event);

signals:
    //!< @brief Delivered for every accepted event.
    void transferEvent(const TransferEvent& event);

private:
    TransferRequest m_request;
    bool m_finished = false;
};

/**
 * @brief Abstract producer of artifact transfers.
 *
 * Implementations must deliver stream events asynchronously, never from
 * inside download(), so callers can connect to the returned stream first.
 */
PORTER_MODULE_EXPORT class ArtifactTransport : public QObject {

    Q_OBJECT

public:
    using QObject::QObject;
    ~ArtifactTransport() override = default;

    /**
     * @brief Starts or resumes a transfer.
     *
     * Resuming is implicit: an existing temp file next to the destination is
     * continued from its current size.
     *
     * @param request Transfer description.
     * @return Stream owned by the transport, or nullptr if nothing could be started.
     */
    virtual TransferStream* download(const TransferRequest& request) = 0;

    //!< @brief Halts a transfer while keeping its temp file.
    virtual void pause(const QString& destination) = 0;

    //!< @brief Aborts a transfer and discards its temp file.
    virtual void cancel(const QString& destination) = 0;

signals:
    /**
     * @brief A transfer finished while its owner was not listening.
     * @param destination Destination or temp path of the transfer.
     * @param errorMessage Empty on success.
     */
    void backgroundTransferCompleted(const QString& destination, const QString& errorMessage);
};

/**
 * @brief Receiver of finalized artifacts.
 */
PORTER_MODULE_EXPORT class ArtifactInstaller {
public:
    virtual ~ArtifactInstaller() = default;

    //!< @brief Registers a finalized artifact.
    virtual void install(const InstalledArtifact& artifact) = 0;

    //!< @brief Whether an artifact with this identity is already registered.
    virtual bool isInstalled(ArtifactKind kind, const QString& identity) const = 0;
};

#include "transfer.moc"
