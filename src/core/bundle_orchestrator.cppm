/*!
 * @file        bundle_orchestrator.cppm
 * @brief       Download of a single-file SLM bundle with checksum verification.
 * @details     The bundle file is taken from the direct URL when one is given,
 *              otherwise it is looked up in the bundle repository listing, which
 *              also provides the expected SHA-256. The hash of the finished file
 *              is computed on the Qt Concurrent pool while the item reports
 *              "verifying"; a mismatch deletes the file and fails permanently.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module porter.core.bundle_orchestrator;
import porter.core.artifact;
import porter.core.download_item;
import porter.core.download_orchestrator;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

//!< @brief Part name of the bundle file.
PORTER_MODULE_EXPORT inline constexpr const char* kBundlePart = "bundle";

PORTER_MODULE_EXPORT class BundleOrchestrator : public DownloadOrchestrator {

    Q_OBJECT

public:
    BundleOrchestrator(const BundleSpec& spec, const DownloadContext& context, QObject* parent = nullptr);

    const BundleSpec& spec() const { return m_spec; }

    //!< @brief Checksum the finished file is verified against, empty to skip.
    QString expectedChecksum() const { return m_sha256; }

    /**
     * @brief SHA-256 of a file as lowercase hex.
     * @param path File to hash.
     * @return Hex digest, or an empty string if the file cannot be read.
     */
    static QString sha256OfFile(const QString& path);

protected:
    void run() override;
    void completeDownload() override;
    InstalledArtifact buildArtifact(const DownloadItem& item) const override;

private:
    void startBundle(const QUrl& url, const QString& fileName, qint64 sizeBytes);

    BundleSpec m_spec;
    QString m_directory;
    QString m_sha256;
};

#include "bundle_orchestrator.moc"
