module;
#include <QRandomGenerator>
#include <QString>
#include <QtMath>

module porter.utils.retry_utils;

namespace porter::utils {

int networkBackoffSeconds(int retryCount, int capSeconds)
{
    const int exponent = qBound(0, retryCount, 30);
    const qint64 delay = qint64(1) << exponent;
    return int(qMin<qint64>(delay, qMax(1, capSeconds)));
}

double requestBackoffSeconds(int attempt, double jitterSeconds)
{
    const int exponent = qBound(0, attempt - 1, 16);
    const double base = qMin(qPow(2.0, exponent), kMaxRequestBackoffSec);
    return base + qBound(0.0, jitterSeconds, kMaxJitterSec);
}

double randomJitterSeconds()
{
    return QRandomGenerator::global()->generateDouble() * kMaxJitterSec;
}

double clampRetryAfter(double seconds)
{
    return qBound(kMinRetryAfterSec, seconds, kMaxRetryAfterSec);
}

double parseRetryAfter(const QByteArray& value, const QDateTime& now, bool* ok)
{
    if (ok) *ok = false;
    const QByteArray trimmed = value.trimmed();
    if (trimmed.isEmpty()) return 0.0;

    bool numeric = false;
    const double seconds = trimmed.toDouble(&numeric);
    if (numeric) {
        if (ok) *ok = true;
        return qMax(0.0, seconds);
    }

    const QDateTime when = QDateTime::fromString(QString::fromLatin1(trimmed), Qt::RFC2822Date);
    if (!when.isValid()) return 0.0;
    if (ok) *ok = true;
    return qMax(0.0, now.msecsTo(when) / 1000.0);
}

bool isRetryableStatus(int status)
{
    return status == 429 || (status >= 500 && status <= 599);
}

bool isTransientNetworkError(QNetworkReply::NetworkError error)
{
    switch (error) {
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TimeoutError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyConnectionClosedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ProxyTimeoutError:
        return true;
    default:
        return false;
    }
}

} // namespace porter::utils
