/*!
 * @file        hub_client.cppm
 * @brief       Typed metadata queries against the model hub.
 * @details     HubClient turns the raw responses of the RequestScheduler into
 *              the two pieces of metadata the download engine needs:
 *              repository file listings (siblings with sizes and checksums)
 *              and remote file sizes probed with HEAD requests.
 *
 *              Every query goes through the scheduler and therefore shares its
 *              concurrency limit, deduplication and retry policy. Results are
 *              delivered to callbacks on the owner thread; a failed query
 *              yields an empty result rather than an error.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QList>
#include <QObject>
#include <QString>
#include <QUrl>
#include <QtGlobal>
#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module porter.services.hub_client;
import porter.services.request_scheduler;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief One file of a hub repository.
 */
PORTER_MODULE_EXPORT struct HubFile {
    QString name;           //!< Path inside the repository (`rfilename`).
    qint64 size = 0;        //!< Size from `size` or `lfs.size`, 0 when unknown.
    QString sha256;         //!< LFS checksum, empty when unknown.
};

/**
 * @brief Hub metadata client.
 */
PORTER_MODULE_EXPORT class HubClient : public QObject {

    Q_OBJECT

public:
    using FilesCallback = std::function<void(const QList<HubFile>& files, bool answered)>;
    using SizeCallback = std::function<void(qint64)>;

    /**
     * @brief Construct a client.
     * @param scheduler Request scheduler, not owned.
     * @param baseUrl Hub origin, e.g. https://huggingface.co.
     * @param parent Optional parent QObject.
     */
    explicit HubClient(RequestScheduler* scheduler, const QUrl& baseUrl, QObject* parent = nullptr);

    QUrl baseUrl() const { return m_baseUrl; }
    void setBaseUrl(const QUrl& url) { m_baseUrl = url; }

    //!< @brief Bearer token attached to every request when not empty.
    void setToken(const QString& token) { m_token = token; }

    void setUserAgent(const QString& userAgent) { m_userAgent = userAgent; }

    /**
     * @brief Lists the files of a repository.
     * @param repoId Repository id (`owner/name`).
     * @param context Callback lifetime guard.
     * @param done Receives the files, empty on failure. `answered` is false when
     *             the hub could not be reached or kept failing with retryable errors.
     */
    void listFiles(const QString& repoId, QObject* context, FilesCallback done);

    /**
     * @brief Probes the size of a remote file.
     *
     * Sends a HEAD request with `download=1` in the query.
     *
     * @param url File URL.
     * @param context Callback lifetime guard.
     * @param done Receives the size, 0 when unknown.
     */
    void remoteSize(const QUrl& url, QObject* context, SizeCallback done);

    //!< @brief URL of a file in a repository on the main revision.
    QUrl fileUrl(const QString& repoId, const QString& fileName) const;

    //!< @brief Metadata endpoint of a repository.
    QUrl modelInfoUrl(const QString& repoId) const;

    //!< @brief Decodes `siblings[]` of a model info document.
    static QList<HubFile> parseSiblings(const QByteArray& json);

    //!< @brief First projector file (name contains "mmproj", ends with ".gguf").
    static std::optional<HubFile> findProjector(const QList<HubFile>& files);

    //!< @brief `<slug>.bundle` when listed, else the first `.bundle` file.
    static std::optional<HubFile> findBundle(const QList<HubFile>& files, const QString& slug);

signals:
    //!< @brief Emitted when a query failed; the callback still receives an empty result.
    void requestFailed(const QUrl& url, const QString& message);

private:
    HeaderList headers() const;

    RequestScheduler* m_scheduler = nullptr;
    QUrl m_baseUrl;
    QString m_token;
    QString m_userAgent = QStringLiteral("porter/1.0");
};

#include "hub_client.moc"
