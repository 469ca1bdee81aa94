module;
#include <QDebug>
#include <QFileInfo>
#include <QFuture>
#include <QFutureWatcher>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QNetworkReply>
#include <QPointer>
#include <QUrlQuery>

module porter.services.hub_client;

import porter.utils.download_utils;
import porter.utils.category_utils;
import porter.utils.retry_utils;

namespace utils = porter::utils;

static qint64 jsonSize(const QJsonValue& value)
{
    if (value.isDouble()) return qint64(value.toDouble());
    if (value.isString()) return value.toString().toLongLong();
    return 0;
}

HubClient::HubClient(RequestScheduler* scheduler, const QUrl& baseUrl, QObject* parent)
    : QObject(parent)
    , m_scheduler(scheduler)
    , m_baseUrl(baseUrl)
{
}

HeaderList HubClient::headers() const
{
    HeaderList out;
    out.append({ QByteArrayLiteral("User-Agent"), m_userAgent.toUtf8() });
    if (!m_token.isEmpty()) {
        out.append({ QByteArrayLiteral("Authorization"), "Bearer " + m_token.toUtf8() });
    }
    return out;
}

QUrl HubClient::modelInfoUrl(const QString& repoId) const
{
    QUrl url(m_baseUrl);
    url.setPath(QStringLiteral("/api/models/%1").arg(repoId));
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("blobs"), QStringLiteral("true"));
    url.setQuery(query);
    return url;
}

QUrl HubClient::fileUrl(const QString& repoId, const QString& fileName) const
{
    QUrl url(m_baseUrl);
    url.setPath(QStringLiteral("/%1/resolve/main/%2").arg(repoId, fileName));
    return url;
}

void HubClient::listFiles(const QString& repoId, QObject* context, FilesCallback done)
{
    const QUrl url = modelInfoUrl(repoId);
    auto* watcher = new QFutureWatcher<HubResponse>(context ? context : this);
    QPointer<HubClient> self(this);
    connect(watcher, &QFutureWatcher<HubResponse>::finished, watcher, [self, watcher, url, done]() {
        watcher->deleteLater();
        const QFuture<HubResponse> future = watcher->future();
        const HubResponse response = future.resultCount() > 0 ? future.result() : HubResponse{};
        QList<HubFile> files;
        const bool answered = response.ok()
            || (response.error == QNetworkReply::NoError && response.status > 0
                && !utils::isRetryableStatus(response.status));
        if (response.ok()) {
            files = parseSiblings(response.body);
        } else if (self) {
            const QString message = response.error != QNetworkReply::NoError
                ? response.errorString
                : QString("HTTP %1").arg(response.status);
            qWarning() << "[Hub] listing failed" << url.toString() << message;
            emit self->requestFailed(url, message);
        }
        if (done) done(files, answered);
    });
    watcher->setFuture(m_scheduler->request(url, QByteArrayLiteral("GET"), headers()));
}

void HubClient::remoteSize(const QUrl& url, QObject* context, SizeCallback done)
{
    const QUrl probe = utils::withDownloadQuery(url);
    auto* watcher = new QFutureWatcher<HubResponse>(context ? context : this);
    QPointer<HubClient> self(this);
    connect(watcher, &QFutureWatcher<HubResponse>::finished, watcher, [self, watcher, probe, done]() {
        watcher->deleteLater();
        const QFuture<HubResponse> future = watcher->future();
        const HubResponse response = future.resultCount() > 0 ? future.result() : HubResponse{};
        const qint64 size = response.ok() ? response.contentLength() : 0;
        if (!response.ok() && self) {
            emit self->requestFailed(probe, response.errorString.isEmpty()
                                                ? QString("HTTP %1").arg(response.status)
                                                : response.errorString);
        }
        if (done) done(size);
    });
    watcher->setFuture(m_scheduler->request(probe, QByteArrayLiteral("HEAD"), headers()));
}

QList<HubFile> HubClient::parseSiblings(const QByteArray& json)
{
    QList<HubFile> files;
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[Hub] invalid model info:" << err.errorString();
        return files;
    }

    const QJsonArray siblings = doc.object().value(QStringLiteral("siblings")).toArray();
    for (const QJsonValue& v : siblings) {
        if (!v.isObject()) continue;
        const QJsonObject obj = v.toObject();
        HubFile file;
        file.name = obj.value(QStringLiteral("rfilename")).toString();
        if (file.name.isEmpty()) continue;
        const QJsonObject lfs = obj.value(QStringLiteral("lfs")).toObject();
        file.size = jsonSize(obj.value(QStringLiteral("size")));
        if (file.size <= 0) file.size = jsonSize(lfs.value(QStringLiteral("size")));
        file.sha256 = utils::normalizeChecksum(lfs.value(QStringLiteral("sha256")).toString());
        files.append(file);
    }
    return files;
}

std::optional<HubFile> HubClient::findProjector(const QList<HubFile>& files)
{
    for (const HubFile& file : files) {
        if (utils::isProjectorFile(file.name)) return file;
    }
    return std::nullopt;
}

std::optional<HubFile> HubClient::findBundle(const QList<HubFile>& files, const QString& slug)
{
    const QString preferred = slug + QStringLiteral(".bundle");
    std::optional<HubFile> first;
    for (const HubFile& file : files) {
        if (!file.name.endsWith(QStringLiteral(".bundle"), Qt::CaseInsensitive)) continue;
        if (QFileInfo(file.name).fileName().compare(preferred, Qt::CaseInsensitive) == 0) return file;
        if (!first) first = file;
    }
    return first;
}
