module;
#include <QMetaMethod>
#include <QObject>
#include <QString>

module porter.core.transfer;

TransferEvent TransferEvent::started(qint64 expectedBytes)
{
    TransferEvent e;
    e.type = Type::Started;
    e.expectedBytes = expectedBytes;
    return e;
}

TransferEvent TransferEvent::progress(double fraction, qint64 bytesWritten, qint64 expectedBytes, double instantSpeed)
{
    TransferEvent e;
    e.type = Type::Progress;
    e.fraction = fraction;
    e.bytesWritten = bytesWritten;
    e.expectedBytes = expectedBytes;
    e.instantSpeed = instantSpeed;
    return e;
}

TransferEvent TransferEvent::verifying()
{
    TransferEvent e;
    e.type = Type::Verifying;
    return e;
}

TransferEvent TransferEvent::paused(double fraction)
{
    TransferEvent e;
    e.type = Type::Paused;
    e.fraction = fraction;
    return e;
}

TransferEvent TransferEvent::networkError(const DownloadError& error, double fraction)
{
    TransferEvent e;
    e.type = Type::NetworkError;
    e.error = error;
    e.fraction = fraction;
    return e;
}

TransferEvent TransferEvent::failed(const DownloadError& error)
{
    TransferEvent e;
    e.type = Type::Failed;
    e.error = error;
    return e;
}

TransferEvent TransferEvent::cancelled()
{
    TransferEvent e;
    e.type = Type::Cancelled;
    return e;
}

TransferEvent TransferEvent::finished(const InstalledArtifact& artifact)
{
    TransferEvent e;
    e.type = Type::Finished;
    e.fraction = 1.0;
    e.artifact = artifact;
    return e;
}

bool TransferEvent::isTerminal() const
{
    switch (type) {
    case Type::Paused:
    case Type::NetworkError:
    case Type::Failed:
    case Type::Cancelled:
    case Type::Finished:
        return true;
    default:
        return false;
    }
}

TransferStream::TransferStream(const TransferRequest& request, QObject* parent)
    : QObject(parent)
    , m_request(request)
{
}

bool TransferStream::hasListeners() const
{
    return isSignalConnected(QMetaMethod::fromSignal(&TransferStream::transferEvent));
}

void TransferStream::emitEvent(const TransferEvent& event)
{
    if (m_finished) return;
    if (event.isTerminal()) m_finished = true;
    emit transferEvent(event);
    if (m_finished) deleteLater();
}
