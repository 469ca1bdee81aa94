/*!
 * @file        http_transport.cppm
 * @brief       Resumable single-stream HTTP transport for artifact files.
 * @details     Default ArtifactTransport of the engine. Each transfer streams
 *              one URL into `<destination>.download`, resuming from the size
 *              of an existing temp file with a Range request, and renames the
 *              temp file to the destination once the body is complete.
 *
 *              Pausing aborts the request but keeps the temp file; cancelling
 *              aborts and removes it. Outcomes are reported on the
 *              TransferStream returned by download(), with transport errors
 *              classified into retryable and permanent failures.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QElapsedTimer>
#include <QFile>
#include <QHash>
#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QtGlobal>
#include <memory>

#ifndef Q_MOC_RUN
export module porter.services.http_transport;
import porter.core.transfer;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief QNetworkAccessManager based artifact transport.
 *
 * At most one transfer runs per destination; asking for a destination that
 * is already transferring returns the existing stream.
 */
PORTER_MODULE_EXPORT class HttpTransport : public ArtifactTransport {

    Q_OBJECT

public:
    /**
     * @brief Construct a transport.
     * @param manager Network access manager, not owned. A private one is created when null.
     * @param parent Optional parent QObject.
     */
    explicit HttpTransport(QNetworkAccessManager* manager = nullptr, QObject* parent = nullptr);
    ~HttpTransport() override;

    TransferStream* download(const TransferRequest& request) override;
    void pause(const QString& destination) override;
    void cancel(const QString& destination) override;

    void setUserAgent(const QString& userAgent) { m_userAgent = userAgent; }

    //!< @brief Minimum gap between progress events in milliseconds.
    void setProgressIntervalMs(int ms) { m_progressIntervalMs = qMax(0, ms); }

    //!< @brief Number of running transfers.
    int activeCount() const { return m_transfers.size(); }

private:
    struct Transfer;

    void startRequest(Transfer* transfer);
    void onMetaData(Transfer* transfer);
    void onReadyRead(Transfer* transfer);
    bool writeAvailable(Transfer* transfer, QNetworkReply* reply);
    void onFinished(Transfer* transfer);
    void finishSuccess(Transfer* transfer);
    void emitProgress(Transfer* transfer, bool force);
    void release(Transfer* transfer);
    double fractionOf(const Transfer* transfer) const;

    QNetworkAccessManager* m_manager = nullptr;
    std::unique_ptr<QNetworkAccessManager> m_ownedManager;
    QHash<QString, Transfer*> m_transfers;  //!< Destination -> running transfer.
    QList<Transfer*> m_released;            //!< Finished transfers awaiting deletion.
    QString m_userAgent = QStringLiteral("porter/1.0");
    int m_progressIntervalMs = 200;
};

#include "http_transport.moc"
