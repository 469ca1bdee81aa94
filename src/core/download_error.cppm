/*!
 * @file        download_error.cppm
 * @brief       Retryable versus permanent download failures.
 * @details     DownloadError is the single error value carried by items,
 *              transfer events and hub responses. Its kind alone decides
 *              whether a failure is retried with backoff or surfaced to the
 *              user, and the classification from transport error codes and
 *              HTTP statuses lives here so every component agrees on it.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QNetworkReply>
#include <QString>

#ifndef Q_MOC_RUN
export module porter.core.download_error;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief Tagged download failure.
 *
 * Network errors (lost connectivity, timeouts, DNS failures, unreachable
 * hosts, server 5xx) are always retryable. Everything else, including
 * validation failures and local filesystem errors, is permanent.
 */
PORTER_MODULE_EXPORT class DownloadError {
public:
    enum class Kind {
        Network,
        Permanent
    };

    DownloadError() = default;

    //!< @brief Builds a retryable network error.
    static DownloadError network(const QString& message);

    //!< @brief Builds a permanent error.
    static DownloadError permanent(const QString& message);

    /**
     * @brief Classifies a transport outcome.
     *
     * Server 5xx responses are upgraded to network errors regardless of the
     * transport code.
     *
     * @param code Transport error code.
     * @param httpStatus HTTP status, 0 when no response was received.
     * @param detail Transport supplied description, used for permanent errors.
     * @return Classified error.
     */
    static DownloadError fromTransport(QNetworkReply::NetworkError code,
                                       int httpStatus,
                                       const QString& detail = QString());

    Kind kind() const { return m_kind; }
    QString message() const { return m_message; }

    //!< @brief True for network errors.
    bool isRetryable() const { return m_kind == Kind::Network; }

    bool operator==(const DownloadError& other) const
    {
        return m_kind == other.m_kind && m_message == other.m_message;
    }

private:
    DownloadError(Kind kind, const QString& message) : m_kind(kind), m_message(message) {}

    Kind m_kind = Kind::Permanent;
    QString m_message;
};
