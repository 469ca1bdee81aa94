module;
#include <QNetworkReply>
#include <QString>

module porter.core.download_error;

import porter.utils.retry_utils;

namespace utils = porter::utils;

DownloadError DownloadError::network(const QString& message)
{
    return DownloadError(Kind::Network, message);
}

DownloadError DownloadError::permanent(const QString& message)
{
    return DownloadError(Kind::Permanent, message);
}

DownloadError DownloadError::fromTransport(QNetworkReply::NetworkError code,
                                           int httpStatus,
                                           const QString& detail)
{
    if (httpStatus >= 500 && httpStatus <= 599) {
        return network(QString("Server error (%1)").arg(httpStatus));
    }

    switch (code) {
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::UnknownNetworkError:
        return network("No internet connection");
    case QNetworkReply::TimeoutError:
    case QNetworkReply::ProxyTimeoutError:
        return network("Connection timed out");
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::ProxyNotFoundError:
        return network("DNS lookup failed");
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::ProxyConnectionRefusedError:
        return network("Cannot reach server");
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::ProxyConnectionClosedError:
        return network("Connection lost");
    default:
        break;
    }

    if (utils::isTransientNetworkError(code)) {
        return network(detail.isEmpty() ? QString("Network error") : detail);
    }
    if (httpStatus >= 400) {
        return permanent(QString("HTTP error (%1)").arg(httpStatus));
    }
    return permanent(detail.isEmpty() ? QString("Download failed") : detail);
}
