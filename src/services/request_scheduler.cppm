/*!
 * @file        request_scheduler.cppm
 * @brief       Rate-limited, deduplicating scheduler for hub metadata requests.
 * @details     All metadata and HEAD requests to the shared model hub pass
 *              through one RequestScheduler. It bounds the number of requests
 *              in flight with a counting permit and a FIFO queue of waiters,
 *              folds identical concurrent requests into a single round trip,
 *              and repeats requests that failed with 429, 5xx or a transient
 *              transport error.
 *
 *              Retry rules:
 *              - Up to maxAttempts() attempts per request
 *              - Retry-After is honored, clamped to [0.5 s, 10 s]
 *              - Otherwise min(2^(attempt-1), 8) s plus up to 0.25 s of jitter
 *              - When attempts run out the last response is returned as is
 *
 *              The HTTP round trip itself is behind RequestSender so the
 *              scheduler can be driven without a network.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QFuture>
#include <QHash>
#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QPair>
#include <QPointer>
#include <QQueue>
#include <QSet>
#include <QString>
#include <QUrl>
#include <QtGlobal>
#include <functional>
#include <memory>

#ifndef Q_MOC_RUN
export module porter.services.request_scheduler;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

//!< @brief Raw HTTP header list.
PORTER_MODULE_EXPORT using HeaderList = QList<QPair<QByteArray, QByteArray>>;

/**
 * @brief One hub request.
 */
PORTER_MODULE_EXPORT struct HubRequest {
    QUrl url;
    QByteArray method = QByteArrayLiteral("GET");
    HeaderList headers;
    QString cacheKey;           //!< Overrides the derived dedup key when set.
    int timeoutMs = 0;          //!< Per-attempt timeout, 0 for the scheduler default.

    //!< @brief Dedup key: cacheKey, or method, URL and headers.
    QString key() const;
};

/**
 * @brief Outcome of a hub request.
 *
 * A response with an HTTP status carries NoError; error is only set when no
 * usable HTTP response was received.
 */
PORTER_MODULE_EXPORT struct HubResponse {
    int status = 0;
    HeaderList headers;
    QByteArray body;
    QNetworkReply::NetworkError error = QNetworkReply::NoError;
    QString errorString;
    int attempts = 0;           //!< Attempts spent on the request.

    //!< @brief True for a 2xx response without transport error.
    bool ok() const { return error == QNetworkReply::NoError && status >= 200 && status < 300; }

    //!< @brief Case-insensitive header lookup.
    QByteArray header(const QByteArray& name) const;

    /**
     * @brief Size advertised by the response.
     * @return Content-Length, else the total of Content-Range, else 0.
     */
    qint64 contentLength() const;
};

/**
 * @brief Performs a single HTTP round trip.
 */
PORTER_MODULE_EXPORT class RequestSender {
public:
    using Callback = std::function<void(const HubResponse&)>;

    virtual ~RequestSender() = default;

    /**
     * @brief Sends a request.
     *
     * The callback is invoked exactly once unless the request is aborted.
     *
     * @param request Request to send.
     * @param callback Completion callback.
     * @return Ticket identifying the request.
     */
    virtual quint64 send(const HubRequest& request, Callback callback) = 0;

    //!< @brief Aborts a request; its callback is not invoked afterwards.
    virtual void abort(quint64 ticket) = 0;
};

/**
 * @brief RequestSender backed by QNetworkAccessManager.
 */
PORTER_MODULE_EXPORT class NetworkRequestSender : public QObject, public RequestSender {
public:
    /**
     * @brief Construct a sender.
     * @param manager Network access manager, not owned.
     * @param parent Optional parent QObject.
     */
    explicit NetworkRequestSender(QNetworkAccessManager* manager, QObject* parent = nullptr);

    quint64 send(const HubRequest& request, Callback callback) override;
    void abort(quint64 ticket) override;

private:
    QNetworkAccessManager* m_manager = nullptr;
    quint64 m_nextTicket = 1;
    QHash<quint64, QPointer<QNetworkReply>> m_replies;
};

/**
 * @brief Concurrency-bounded, deduplicating hub request scheduler.
 */
PORTER_MODULE_EXPORT class RequestScheduler : public QObject {

    Q_OBJECT

    //!< @brief Maximum number of requests in flight.
    Q_PROPERTY(int maxConcurrent READ maxConcurrent WRITE setMaxConcurrent NOTIFY maxConcurrentChanged)

    //!< @brief Offline kill switch.
    Q_PROPERTY(bool offline READ isOffline WRITE setOffline NOTIFY offlineChanged)

public:
    /**
     * @brief Construct a scheduler.
     * @param sender Request sender, not owned.
     * @param maxConcurrent Maximum number of requests in flight.
     * @param parent Optional parent QObject.
     */
    explicit RequestScheduler(RequestSender* sender, int maxConcurrent = 2, QObject* parent = nullptr);
    ~RequestScheduler() override;

    /**
     * @brief Schedules a request.
     *
     * A request whose key matches one already queued or in flight shares
     * that request's future instead of issuing another round trip.
     *
     * @param request Request description.
     * @return Future resolved with the final response.
     */
    QFuture<HubResponse> request(const HubRequest& request);

    //!< @brief Convenience overload building the HubRequest.
    QFuture<HubResponse> request(const QUrl& url,
                                 const QByteArray& method = QByteArrayLiteral("GET"),
                                 const HeaderList& headers = {},
                                 const QString& cacheKey = QString());

    /**
     * @brief Cancels all queued and in-flight requests.
     *
     * Every pending future resolves with OperationCanceledError and all
     * permits are returned.
     */
    void cancelAll();

    int maxConcurrent() const { return m_maxConcurrent; }
    void setMaxConcurrent(int value);

    int maxAttempts() const { return m_maxAttempts; }
    void setMaxAttempts(int value);

    int timeoutMs() const { return m_timeoutMs; }
    void setTimeoutMs(int value);

    bool isOffline() const { return m_offline; }

    /**
     * @brief Enables or disables the offline kill switch.
     *
     * Going offline cancels all work; while offline new requests fail
     * immediately with NetworkSessionFailedError.
     */
    void setOffline(bool offline);

    //!< @brief Requests currently holding a permit.
    int activeCount() const { return m_active; }

    //!< @brief Requests waiting for a permit.
    int queuedCount() const { return m_waiters.size(); }

signals:
    void maxConcurrentChanged();
    void offlineChanged(bool offline);

    /**
     * @brief Emitted once per completed request.
     * @param key Dedup key.
     * @param status Final HTTP status, 0 without response.
     * @param attempts Attempts spent.
     */
    void requestCompleted(const QString& key, int status, int attempts);

private:
    struct Job;
    using JobPtr = std::shared_ptr<Job>;

    void acquire(const JobPtr& job);
    void dispatch(const JobPtr& job);
    void handleResponse(const JobPtr& job, const HubResponse& response);
    void complete(const JobPtr& job, const HubResponse& response);
    void releasePermit(const JobPtr& job);

    static QFuture<HubResponse> readyFuture(const HubResponse& response);

    RequestSender* m_sender = nullptr;
    int m_maxConcurrent = 2;
    int m_maxAttempts = 5;
    int m_timeoutMs = 10000;
    int m_active = 0;
    bool m_offline = false;
    QHash<QString, JobPtr> m_inFlight;   //!< Dedup map, key -> job.
    QQueue<JobPtr> m_waiters;            //!< Jobs waiting for a permit.
};

#include "request_scheduler.moc"
