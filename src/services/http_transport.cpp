module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QNetworkRequest>
#include <QTimer>
#include <QtAlgorithms>
#include <utility>

module porter.services.http_transport;

import porter.core.artifact;
import porter.core.download_error;
import porter.utils.download_utils;

namespace utils = porter::utils;

struct HttpTransport::Transfer {
    TransferRequest request;
    QPointer<TransferStream> stream;
    QPointer<QNetworkReply> reply;
    std::unique_ptr<QFile> file;
    QString tempPath;
    qint64 offset = 0;          //!< Bytes present before this request.
    qint64 received = 0;        //!< Bytes written by this request.
    qint64 total = 0;           //!< Full size, 0 when unknown.
    QElapsedTimer clock;
    qint64 lastProgressMs = -1;
    qint64 lastSpeedBytes = 0;
    qint64 lastSpeedMs = 0;
    bool started = false;
    bool pausing = false;
    bool cancelling = false;
};

HttpTransport::HttpTransport(QNetworkAccessManager* manager, QObject* parent)
    : ArtifactTransport(parent)
    , m_manager(manager)
{
    if (!m_manager) {
        m_ownedManager = std::make_unique<QNetworkAccessManager>();
        m_manager = m_ownedManager.get();
    }
}

HttpTransport::~HttpTransport()
{
    const QList<Transfer*> transfers = m_transfers.values();
    m_transfers.clear();
    for (Transfer* t : transfers) {
        if (t->reply) {
            t->reply->disconnect(this);
            t->reply->abort();
            t->reply->deleteLater();
        }
        if (t->file) t->file->close();
        delete t;
    }
    qDeleteAll(std::exchange(m_released, {}));
}

TransferStream* HttpTransport::download(const TransferRequest& request)
{
    const QString destination = utils::normalizeFilePath(request.destination);
    if (destination.isEmpty() || !request.url.isValid()) {
        qWarning() << "[Transport] invalid request for" << request.identity << request.url;
        return nullptr;
    }

    const auto existing = m_transfers.constFind(destination);
    if (existing != m_transfers.constEnd() && (*existing)->stream) {
        return (*existing)->stream;
    }

    QDir().mkpath(QFileInfo(destination).absolutePath());

    auto* transfer = new Transfer;
    transfer->request = request;
    transfer->request.destination = destination;
    transfer->tempPath = utils::tempPathFor(destination);
    transfer->stream = new TransferStream(transfer->request, this);
    transfer->total = request.expectedBytes;
    m_transfers.insert(destination, transfer);

    TransferStream* stream = transfer->stream;
    // Events must not be emitted before the caller had a chance to connect.
    QTimer::singleShot(0, this, [this, destination, transfer]() {
        if (m_transfers.value(destination) != transfer) return;
        startRequest(transfer);
    });
    return stream;
}

void HttpTransport::startRequest(Transfer* transfer)
{
    const qint64 existingSize = qMax<qint64>(0, utils::fileSizeOnDisk(transfer->tempPath));
    const bool resume = existingSize > 0;

    transfer->file = std::make_unique<QFile>(transfer->tempPath);
    const QIODevice::OpenMode mode = QIODevice::WriteOnly | (resume ? QIODevice::Append : QIODevice::Truncate);
    if (!transfer->file->open(mode)) {
        qWarning() << "[Transport] cannot open output file" << transfer->tempPath;
        if (transfer->stream) {
            transfer->stream->emitEvent(TransferEvent::failed(
                DownloadError::permanent(QStringLiteral("Cannot open %1 for writing").arg(transfer->tempPath))));
        }
        release(transfer);
        return;
    }

    transfer->offset = resume ? existingSize : 0;
    transfer->received = 0;
    transfer->clock.start();
    transfer->lastProgressMs = -1;
    transfer->lastSpeedBytes = transfer->offset;
    transfer->lastSpeedMs = 0;

    QNetworkRequest req(transfer->request.url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setRawHeader("User-Agent", m_userAgent.toUtf8());
    for (const auto& h : transfer->request.headers) {
        req.setRawHeader(h.first, h.second);
    }
    if (resume) {
        req.setRawHeader("Range", QByteArray("bytes=") + QByteArray::number(existingSize) + "-");
    }

    qDebug() << "[Transport] GET" << transfer->request.url.toString()
             << (resume ? QStringLiteral("from %1").arg(existingSize) : QStringLiteral("from 0"));

    QNetworkReply* reply = m_manager->get(req);
    transfer->reply = reply;

    connect(reply, &QNetworkReply::metaDataChanged, this, [this, transfer, reply]() {
        if (transfer->reply != reply) return;
        onMetaData(transfer);
    });
    connect(reply, &QNetworkReply::readyRead, this, [this, transfer, reply]() {
        if (transfer->reply != reply) return;
        onReadyRead(transfer);
    });
    connect(reply, &QNetworkReply::finished, this, [this, transfer, reply]() {
        reply->deleteLater();
        if (transfer->reply != reply) return;
        onFinished(transfer);
    });
}

void HttpTransport::onMetaData(Transfer* transfer)
{
    QNetworkReply* reply = transfer->reply;
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 300 && status < 400) return; // redirect hop

    if (status == 200 && transfer->offset > 0) {
        // Range ignored by the server: start over.
        transfer->file->close();
        if (!transfer->file->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            qWarning() << "[Transport] cannot reopen output file for restart" << transfer->tempPath;
        }
        qInfo() << "[Transport] resume not supported, restarting" << transfer->request.url.toString();
        transfer->offset = 0;
        transfer->lastSpeedBytes = 0;
    }

    if (status == 200 || status == 206) {
        const QVariant cl = reply->header(QNetworkRequest::ContentLengthHeader);
        if (cl.isValid() && cl.toLongLong() > 0) {
            transfer->total = transfer->offset + cl.toLongLong();
        }
        if (!transfer->started && transfer->stream) {
            transfer->started = true;
            transfer->stream->emitEvent(TransferEvent::started(transfer->total > 0 ? transfer->total : -1));
        }
    }
}

void HttpTransport::onReadyRead(Transfer* transfer)
{
    if (writeAvailable(transfer, transfer->reply)) emitProgress(transfer, false);
}

bool HttpTransport::writeAvailable(Transfer* transfer, QNetworkReply* reply)
{
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 400) return true; // error bodies are not artifact bytes

    const QByteArray data = reply->readAll();
    if (data.isEmpty() || !transfer->file) return true;
    if (transfer->file->write(data) == data.size()) {
        transfer->received += data.size();
        return true;
    }

    qWarning() << "[Transport] write failed" << transfer->tempPath << transfer->file->errorString();
    if (transfer->stream) {
        transfer->stream->emitEvent(TransferEvent::failed(
            DownloadError::permanent(QStringLiteral("Write failed: %1").arg(transfer->file->errorString()))));
    }
    transfer->reply = nullptr;
    reply->abort();
    release(transfer);
    return false;
}

double HttpTransport::fractionOf(const Transfer* transfer) const
{
    if (transfer->total <= 0) return 0.0;
    return qBound(0.0, double(transfer->offset + transfer->received) / double(transfer->total), 1.0);
}

void HttpTransport::emitProgress(Transfer* transfer, bool force)
{
    if (!transfer->stream) return;
    const qint64 now = transfer->clock.elapsed();
    if (!force && transfer->lastProgressMs >= 0 && now - transfer->lastProgressMs < m_progressIntervalMs) return;
    transfer->lastProgressMs = now;

    const qint64 written = transfer->offset + transfer->received;
    double speed = 0.0;
    const qint64 dt = now - transfer->lastSpeedMs;
    if (dt >= 250) {
        speed = double(written - transfer->lastSpeedBytes) * 1000.0 / double(dt);
        transfer->lastSpeedBytes = written;
        transfer->lastSpeedMs = now;
    }
    transfer->stream->emitEvent(TransferEvent::progress(fractionOf(transfer), written,
                                                        transfer->total > 0 ? transfer->total : -1,
                                                        qMax(0.0, speed)));
}

void HttpTransport::onFinished(Transfer* transfer)
{
    QNetworkReply* reply = transfer->reply;
    transfer->reply = nullptr;

    if (!transfer->pausing && !transfer->cancelling && reply->bytesAvailable() > 0) {
        if (!writeAvailable(transfer, reply)) return;
    }
    if (transfer->file) transfer->file->close();

    if (transfer->cancelling) {
        QFile::remove(transfer->tempPath);
        if (transfer->stream) transfer->stream->emitEvent(TransferEvent::cancelled());
        release(transfer);
        return;
    }
    if (transfer->pausing) {
        if (transfer->stream) transfer->stream->emitEvent(TransferEvent::paused(fractionOf(transfer)));
        release(transfer);
        return;
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status == 416 && transfer->offset > 0) {
        // Nothing left to fetch; the temp file already holds the whole body.
        transfer->total = transfer->offset;
        finishSuccess(transfer);
        return;
    }

    const QNetworkReply::NetworkError code = reply->error();
    if (code != QNetworkReply::NoError || status >= 400) {
        const DownloadError error = DownloadError::fromTransport(code, status, reply->errorString());
        qWarning() << "[Transport] GET error:" << transfer->request.url.toString() << error.message();
        if (transfer->stream) {
            transfer->stream->emitEvent(error.isRetryable()
                ? TransferEvent::networkError(error, fractionOf(transfer))
                : TransferEvent::failed(error));
        }
        release(transfer);
        return;
    }

    finishSuccess(transfer);
}

void HttpTransport::finishSuccess(Transfer* transfer)
{
    emitProgress(transfer, true);
    const QString destination = transfer->request.destination;
    if (QFile::exists(destination) && !QFile::remove(destination)) {
        qWarning() << "[Transport] cannot replace" << destination;
    }
    if (!QFile::rename(transfer->tempPath, destination)) {
        if (transfer->stream) {
            transfer->stream->emitEvent(TransferEvent::failed(
                DownloadError::permanent(QStringLiteral("Failed to move downloaded file into place"))));
        }
        release(transfer);
        return;
    }

    InstalledArtifact artifact;
    artifact.identity = transfer->request.identity;
    artifact.kind = transfer->request.kind;
    artifact.path = destination;
    artifact.sizeBytes = QFileInfo(destination).size();
    artifact.installedAt = QDateTime::currentDateTimeUtc();

    TransferStream* stream = transfer->stream;
    const bool listening = stream && stream->hasListeners();
    release(transfer);
    if (stream) stream->emitEvent(TransferEvent::finished(artifact));
    if (!listening) emit backgroundTransferCompleted(destination, QString());
}

void HttpTransport::release(Transfer* transfer)
{
    const QString destination = transfer->request.destination;
    if (m_transfers.value(destination) == transfer) m_transfers.remove(destination);
    if (transfer->file && transfer->file->isOpen()) transfer->file->close();

    // Reply callbacks of the current turn may still read the transfer.
    m_released.append(transfer);
    QTimer::singleShot(0, this, [this, transfer]() {
        m_released.removeOne(transfer);
        delete transfer;
    });
}

void HttpTransport::pause(const QString& destination)
{
    Transfer* transfer = m_transfers.value(utils::normalizeFilePath(destination));
    if (!transfer) return;
    transfer->pausing = true;
    if (transfer->reply) {
        transfer->reply->abort();
        return;
    }
    // Not started yet.
    if (transfer->stream) transfer->stream->emitEvent(TransferEvent::paused(0.0));
    release(transfer);
}

void HttpTransport::cancel(const QString& destination)
{
    const QString normalized = utils::normalizeFilePath(destination);
    Transfer* transfer = m_transfers.value(normalized);
    if (!transfer) {
        QFile::remove(utils::tempPathFor(normalized));
        return;
    }
    transfer->cancelling = true;
    if (transfer->reply) {
        transfer->reply->abort();
        return;
    }
    QFile::remove(transfer->tempPath);
    if (transfer->stream) transfer->stream->emitEvent(TransferEvent::cancelled());
    release(transfer);
}
