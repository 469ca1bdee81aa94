/*!
 * @file        download_item.cppm
 * @brief       Observable state of one logical download.
 * @details     A DownloadItem exists per identity and kind while the download
 *              is visible. It carries the combined progress and speed, the
 *              completion and verification flags, the last error and retry
 *              count, and one PartState per physical file (weights and
 *              projector for models, one per file for datasets, a single part
 *              for bundles and embeddings).
 *
 *              Items are plain values; the owning orchestrator is the only
 *              writer and mutates them through the DownloadStore.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QVector>
#include <QtGlobal>
#include <optional>

#ifndef Q_MOC_RUN
export module porter.core.download_item;
import porter.core.artifact;
import porter.core.download_error;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

//!< @brief Part name of model weights.
PORTER_MODULE_EXPORT inline constexpr const char* kWeightsPart = "weights";

//!< @brief Part name of a model's vision projector.
PORTER_MODULE_EXPORT inline constexpr const char* kProjectorPart = "mmproj";

/**
 * @brief Progress of one physical file within a download.
 */
PORTER_MODULE_EXPORT struct PartState {

    //!< @brief Part name, unique within the item.
    QString name;

    //!< @brief Final path of the file.
    QString finalPath;

    //!< @brief Part progress in [0, 1].
    double progress = 0.0;

    //!< @brief Smoothed part speed in bytes/sec.
    double speed = 0.0;

    //!< @brief Reconciled bytes written.
    qint64 writtenBytes = 0;

    //!< @brief Best known expected size, 0 when unknown.
    qint64 expectedBytes = 0;

    //!< @brief Size advertised by the catalog, 0 when unknown.
    qint64 catalogBytes = 0;

    //!< @brief Whether the file is complete on disk.
    bool completed = false;

    //!< @brief Expected size with the catalog fallback, never below the written bytes.
    qint64 effectiveExpected() const;
};

/**
 * @brief Observable state of one logical download.
 */
PORTER_MODULE_EXPORT struct DownloadItem {
    QString identity;
    ArtifactKind kind = ArtifactKind::Model;
    QString title;                      //!< Display title.
    QString directory;                  //!< Directory holding the artifact's files.
    double progress = 0.0;              //!< Combined progress, below 1 until completed.
    double speed = 0.0;                 //!< Smoothed speed in bytes/sec.
    bool completed = false;
    bool verifying = false;             //!< Checksum verification in progress.
    std::optional<DownloadError> error; //!< Last error; retryable errors mean "retrying".
    int retryCount = 0;
    QVector<PartState> parts;

    //!< @brief Finds a part by name.
    PartState* part(const QString& name);
    const PartState* part(const QString& name) const;

    /**
     * @brief Returns the named part, appending it when missing.
     * @param name Part name.
     * @param finalPath Final path, updated when non-empty.
     * @param catalogBytes Catalog size, updated when positive.
     * @return Reference to the part.
     */
    PartState& ensurePart(const QString& name, const QString& finalPath, qint64 catalogBytes = 0);

    //!< @brief Removes a part; returns false when it did not exist.
    bool removePart(const QString& name);

    //!< @brief Sum of written bytes over all parts.
    qint64 writtenBytes() const;

    //!< @brief Sum of effective expected bytes over all parts.
    qint64 expectedBytes() const;

    //!< @brief Σ written / Σ expected, 0 when nothing is known.
    double combinedProgress() const;

    //!< @brief Whether every part is complete (false for an item without parts).
    bool allPartsCompleted() const;

    //!< @brief Whether the item currently waits for a retry.
    bool isRetrying() const { return error.has_value() && error->isRetryable(); }

    //!< @brief Short status label.
    QString statusString() const;
};
