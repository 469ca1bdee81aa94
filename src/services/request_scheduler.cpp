module;
#include <QDateTime>
#include <QDebug>
#include <QFuture>
#include <QNetworkRequest>
#include <QPromise>
#include <QTimer>
#include <QtGlobal>

module porter.services.request_scheduler;

import porter.utils.retry_utils;

namespace utils = porter::utils;

struct RequestScheduler::Job {
    HubRequest request;
    QString key;
    std::shared_ptr<QPromise<HubResponse>> promise;
    QFuture<HubResponse> future;
    int attempt = 0;
    quint64 ticket = 0;
    bool holdsPermit = false;
    bool cancelled = false;
};

QString HubRequest::key() const
{
    if (!cacheKey.isEmpty()) return cacheKey;
    QString out = QString::fromLatin1(method) + ' ' + url.toString(QUrl::FullyEncoded);
    for (const auto& h : headers) {
        out += '|' + QString::fromLatin1(h.first).toLower() + '=' + QString::fromLatin1(h.second);
    }
    return out;
}

QByteArray HubResponse::header(const QByteArray& name) const
{
    for (const auto& h : headers) {
        if (h.first.compare(name, Qt::CaseInsensitive) == 0) return h.second;
    }
    return QByteArray();
}

qint64 HubResponse::contentLength() const
{
    bool ok = false;
    const qint64 length = header("Content-Length").trimmed().toLongLong(&ok);
    if (ok && length > 0) return length;

    // "bytes 0-0/12345"
    const QByteArray range = header("Content-Range");
    const int slash = range.lastIndexOf('/');
    if (slash >= 0) {
        const qint64 total = range.mid(slash + 1).trimmed().toLongLong(&ok);
        if (ok && total > 0) return total;
    }
    return 0;
}

NetworkRequestSender::NetworkRequestSender(QNetworkAccessManager* manager, QObject* parent)
    : QObject(parent)
    , m_manager(manager)
{
}

quint64 NetworkRequestSender::send(const HubRequest& request, Callback callback)
{
    const quint64 ticket = m_nextTicket++;

    QNetworkRequest req{request.url};
    for (const auto& h : request.headers) {
        req.setRawHeader(h.first, h.second);
    }
    if (request.timeoutMs > 0) req.setTransferTimeout(request.timeoutMs);

    QNetworkReply* reply = nullptr;
    if (request.method == "GET") reply = m_manager->get(req);
    else if (request.method == "HEAD") reply = m_manager->head(req);
    else reply = m_manager->sendCustomRequest(req, request.method);

    m_replies.insert(ticket, reply);
    connect(reply, &QNetworkReply::finished, this, [this, reply, ticket, callback]() {
        reply->deleteLater();
        if (!m_replies.contains(ticket)) return;
        m_replies.remove(ticket);

        HubResponse response;
        response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        response.headers = reply->rawHeaderPairs();
        response.body = reply->readAll();
        response.error = reply->error();
        response.errorString = reply->errorString();

        // Content and server errors mirror the HTTP status, which is what callers inspect.
        if (response.status > 0 && response.error >= QNetworkReply::ContentAccessDenied) {
            response.error = QNetworkReply::NoError;
            response.errorString.clear();
        }
        // A transfer timeout surfaces as a cancellation we did not ask for.
        if (response.error == QNetworkReply::OperationCanceledError) {
            response.error = QNetworkReply::TimeoutError;
        }
        if (callback) callback(response);
    });
    return ticket;
}

void NetworkRequestSender::abort(quint64 ticket)
{
    QPointer<QNetworkReply> reply = m_replies.take(ticket);
    if (reply) reply->abort();
}

RequestScheduler::RequestScheduler(RequestSender* sender, int maxConcurrent, QObject* parent)
    : QObject(parent)
    , m_sender(sender)
    , m_maxConcurrent(qMax(1, maxConcurrent))
{
}

RequestScheduler::~RequestScheduler()
{
    cancelAll();
}

QFuture<HubResponse> RequestScheduler::readyFuture(const HubResponse& response)
{
    QPromise<HubResponse> promise;
    promise.start();
    promise.addResult(response);
    promise.finish();
    return promise.future();
}

QFuture<HubResponse> RequestScheduler::request(const QUrl& url,
                                               const QByteArray& method,
                                               const HeaderList& headers,
                                               const QString& cacheKey)
{
    HubRequest req;
    req.url = url;
    req.method = method;
    req.headers = headers;
    req.cacheKey = cacheKey;
    return request(req);
}

QFuture<HubResponse> RequestScheduler::request(const HubRequest& request)
{
    if (m_offline || !m_sender) {
        HubResponse response;
        response.error = QNetworkReply::NetworkSessionFailedError;
        response.errorString = QStringLiteral("Network access is disabled");
        return readyFuture(response);
    }

    const QString key = request.key();
    const auto existing = m_inFlight.constFind(key);
    if (existing != m_inFlight.constEnd()) {
        return (*existing)->future;
    }

    auto job = std::make_shared<Job>();
    job->request = request;
    if (job->request.timeoutMs <= 0) job->request.timeoutMs = m_timeoutMs;
    job->key = key;
    job->promise = std::make_shared<QPromise<HubResponse>>();
    job->promise->start();
    job->future = job->promise->future();
    m_inFlight.insert(key, job);

    acquire(job);
    return job->future;
}

void RequestScheduler::acquire(const JobPtr& job)
{
    if (m_active < m_maxConcurrent) {
        ++m_active;
        job->holdsPermit = true;
        dispatch(job);
        return;
    }
    m_waiters.enqueue(job);
}

void RequestScheduler::dispatch(const JobPtr& job)
{
    if (job->cancelled) return;
    ++job->attempt;

    QPointer<RequestScheduler> self(this);
    job->ticket = m_sender->send(job->request, [self, job](const HubResponse& response) {
        if (!self) return;
        self->handleResponse(job, response);
    });
}

void RequestScheduler::handleResponse(const JobPtr& job, const HubResponse& response)
{
    if (job->cancelled) return;
    job->ticket = 0;

    HubResponse result = response;
    result.attempts = job->attempt;

    bool retry = false;
    double delaySec = 0.0;
    if (result.error == QNetworkReply::NoError && utils::isRetryableStatus(result.status)) {
        retry = true;
        bool hasRetryAfter = false;
        const double retryAfter = utils::parseRetryAfter(result.header("Retry-After"),
                                                         QDateTime::currentDateTimeUtc(),
                                                         &hasRetryAfter);
        delaySec = hasRetryAfter
            ? utils::clampRetryAfter(retryAfter)
            : utils::requestBackoffSeconds(job->attempt, utils::randomJitterSeconds());
    } else if (result.error != QNetworkReply::NoError && utils::isTransientNetworkError(result.error)) {
        retry = true;
        delaySec = utils::requestBackoffSeconds(job->attempt, utils::randomJitterSeconds());
    }

    if (retry && job->attempt < m_maxAttempts && !m_offline) {
        qDebug() << "[Hub] retrying" << job->request.url.toString()
                 << "status" << result.status << "attempt" << job->attempt
                 << "in" << delaySec << "s";
        QTimer::singleShot(qRound(delaySec * 1000.0), Qt::PreciseTimer, this, [this, job]() {
            if (!job->cancelled) dispatch(job);
        });
        return;
    }

    complete(job, result);
}

void RequestScheduler::complete(const JobPtr& job, const HubResponse& response)
{
    if (job->cancelled) return;
    job->cancelled = true;

    const auto it = m_inFlight.find(job->key);
    if (it != m_inFlight.end() && it.value() == job) m_inFlight.erase(it);

    job->promise->addResult(response);
    job->promise->finish();
    emit requestCompleted(job->key, response.status, response.attempts);

    releasePermit(job);
}

void RequestScheduler::releasePermit(const JobPtr& job)
{
    if (!job->holdsPermit) return;
    job->holdsPermit = false;

    while (!m_waiters.isEmpty()) {
        JobPtr next = m_waiters.dequeue();
        if (next->cancelled) continue;
        next->holdsPermit = true;
        dispatch(next);
        return;
    }
    m_active = qMax(0, m_active - 1);
}

void RequestScheduler::cancelAll()
{
    const QList<JobPtr> jobs = m_inFlight.values();
    m_inFlight.clear();
    m_waiters.clear();
    m_active = 0;

    HubResponse cancelled;
    cancelled.error = QNetworkReply::OperationCanceledError;
    cancelled.errorString = QStringLiteral("Operation cancelled");

    for (const JobPtr& job : jobs) {
        if (job->cancelled) continue;
        job->cancelled = true;
        job->holdsPermit = false;
        if (job->ticket && m_sender) m_sender->abort(job->ticket);
        job->ticket = 0;
        HubResponse result = cancelled;
        result.attempts = job->attempt;
        job->promise->addResult(result);
        job->promise->finish();
    }
    if (!jobs.isEmpty()) qDebug() << "[Hub] cancelled" << jobs.size() << "pending requests";
}

void RequestScheduler::setMaxConcurrent(int value)
{
    value = qMax(1, value);
    if (m_maxConcurrent == value) return;
    m_maxConcurrent = value;
    while (m_active < m_maxConcurrent && !m_waiters.isEmpty()) {
        JobPtr next = m_waiters.dequeue();
        if (next->cancelled) continue;
        ++m_active;
        next->holdsPermit = true;
        dispatch(next);
    }
    emit maxConcurrentChanged();
}

void RequestScheduler::setMaxAttempts(int value)
{
    m_maxAttempts = qMax(1, value);
}

void RequestScheduler::setTimeoutMs(int value)
{
    m_timeoutMs = qMax(1, value);
}

void RequestScheduler::setOffline(bool offline)
{
    if (m_offline == offline) return;
    m_offline = offline;
    if (offline) cancelAll();
    emit offlineChanged(offline);
}
