/*!
 * @file        retry_utils.cppm
 * @brief       Backoff and retry classification helpers.
 * @details     Centralizes the timing rules used when a transfer or a hub
 *              request has to be repeated: exponential backoff for artifact
 *              transfers, capped backoff with jitter for metadata requests,
 *              Retry-After parsing, and the list of HTTP statuses and network
 *              errors that are worth another attempt.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QDateTime>
#include <QNetworkReply>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module porter.utils.retry_utils;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

PORTER_MODULE_EXPORT namespace porter::utils {

//!< @brief Shortest honored Retry-After delay in seconds.
inline constexpr double kMinRetryAfterSec = 0.5;

//!< @brief Longest honored Retry-After delay in seconds.
inline constexpr double kMaxRetryAfterSec = 10.0;

//!< @brief Upper bound of the request backoff before jitter, in seconds.
inline constexpr double kMaxRequestBackoffSec = 8.0;

//!< @brief Upper bound of the random jitter added to request backoff, in seconds.
inline constexpr double kMaxJitterSec = 0.25;

/**
 * @brief Backoff before restarting a transfer after a network failure.
 * @param retryCount Number of retries so far, starting at 1.
 * @param capSeconds Upper bound in seconds.
 * @return min(2^retryCount, capSeconds) seconds.
 */
int networkBackoffSeconds(int retryCount, int capSeconds = 60);

/**
 * @brief Backoff before repeating a hub request.
 * @param attempt Attempt that just failed, starting at 1.
 * @param jitterSeconds Random jitter in [0, kMaxJitterSec].
 * @return min(2^(attempt-1), kMaxRequestBackoffSec) + jitter, in seconds.
 */
double requestBackoffSeconds(int attempt, double jitterSeconds);

//!< @brief Draws a jitter value in [0, kMaxJitterSec].
double randomJitterSeconds();

/**
 * @brief Clamps a server supplied Retry-After delay.
 * @param seconds Delay requested by the server.
 * @return Delay bounded to [kMinRetryAfterSec, kMaxRetryAfterSec].
 */
double clampRetryAfter(double seconds);

/**
 * @brief Parses a Retry-After header value.
 *
 * Accepts both delta-seconds and HTTP-date forms.
 *
 * @param value Raw header value.
 * @param now Reference time for HTTP-date values.
 * @param ok Set to true when a delay could be parsed.
 * @return Delay in seconds (unclamped, never negative).
 */
double parseRetryAfter(const QByteArray& value, const QDateTime& now, bool* ok);

/**
 * @brief Checks whether an HTTP status warrants another attempt.
 * @param status HTTP status code.
 * @return true for 429 and every 5xx status.
 */
bool isRetryableStatus(int status);

/**
 * @brief Checks whether a transport error is transient.
 *
 * Timeouts, DNS and host lookup failures, refused or dropped connections and
 * temporary network failures are transient. Everything else is not.
 *
 * @param error Transport error code.
 * @return true if the request may succeed when repeated.
 */
bool isTransientNetworkError(QNetworkReply::NetworkError error);

} // namespace porter::utils
