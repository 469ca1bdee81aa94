/*!
 * @file        artifact.cppm
 * @brief       Artifact kinds and catalog descriptors.
 * @details     Declares the value types describing what can be provisioned:
 *              model weights with an optional vision projector, SLM bundles,
 *              multi-file datasets, and embedding models. Each descriptor
 *              knows how to derive the identity that keys its download.
 *
 *              InstalledArtifact is the record handed to the installation
 *              collaborator once a download has been finalized.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QDateTime>
#include <QList>
#include <QString>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module porter.core.artifact;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

//!< @brief Kinds of artifacts the engine can provision.
PORTER_MODULE_EXPORT enum class ArtifactKind {
    Model,
    Bundle,
    Dataset,
    Embedding
};

/**
 * @brief Stable lower-case name of an artifact kind.
 * @param kind Artifact kind.
 * @return "model", "bundle", "dataset" or "embedding".
 */
PORTER_MODULE_EXPORT QString artifactKindName(ArtifactKind kind);

/**
 * @brief Parses a name produced by artifactKindName().
 * @param name Kind name.
 * @param ok Set to false when the name is unknown.
 * @return Parsed kind, ArtifactKind::Model when unknown.
 */
PORTER_MODULE_EXPORT ArtifactKind artifactKindFromName(const QString& name, bool* ok = nullptr);

//!< @brief Every artifact kind, in reconciliation order.
PORTER_MODULE_EXPORT QList<ArtifactKind> allArtifactKinds();

/**
 * @brief Catalog entry for one quantization of a model.
 */
PORTER_MODULE_EXPORT struct ModelSpec {
    QString modelId;        //!< Hub repository id of the base model.
    QString quantLabel;     //!< Quantization label such as "Q4_K_M".
    QUrl url;               //!< Download URL of the weights file.
    qint64 sizeBytes = 0;   //!< Catalog size of the weights, 0 when unknown.
    QString format = QStringLiteral("gguf"); //!< Weights format.
    QString sha256;         //!< Expected checksum, optional.

    //!< @brief Identity of the download, `<modelId>-<quantLabel>`.
    QString identity() const;

    //!< @brief Whether projector discovery applies to this format.
    bool supportsProjector() const;
};

/**
 * @brief Catalog entry for a packaged SLM bundle.
 */
PORTER_MODULE_EXPORT struct BundleSpec {
    QString slug;           //!< Bundle slug, also the identity.
    QUrl url;               //!< Direct download URL, resolved from the hub when empty.
    qint64 sizeBytes = 0;   //!< Catalog size, 0 when unknown.
    QString sha256;         //!< Expected checksum, resolved from the hub when empty.

    QString identity() const { return slug; }
};

/**
 * @brief One file of a dataset.
 */
PORTER_MODULE_EXPORT struct DatasetFile {
    QString name;           //!< File name inside the dataset directory.
    QUrl url;               //!< Download URL.
    qint64 sizeBytes = 0;   //!< Catalog size, 0 when unknown.
};

/**
 * @brief Catalog entry for a multi-file dataset.
 */
PORTER_MODULE_EXPORT struct DatasetSpec {
    QString datasetId;          //!< Dataset id, also the identity.
    QString displayName;        //!< Human readable title.
    QList<DatasetFile> files;   //!< Candidate files.

    QString identity() const { return datasetId; }
};

/**
 * @brief Catalog entry for a single-file embedding model.
 */
PORTER_MODULE_EXPORT struct EmbeddingSpec {
    QString repoId;         //!< Hub repository id, also the identity.
    QUrl url;               //!< Download URL.
    QString fileName;       //!< Destination file name, inferred from the URL when empty.

    QString identity() const { return repoId; }
};

/**
 * @brief Record of a finalized artifact handed to the installer.
 */
PORTER_MODULE_EXPORT struct InstalledArtifact {
    QString identity;
    ArtifactKind kind = ArtifactKind::Model;
    QString path;               //!< Primary file, or the directory for datasets.
    qint64 sizeBytes = 0;
    QString modelId;
    QString quantLabel;
    QString format;
    QString sha256;
    QString projectorPath;      //!< Companion projector, empty when absent.
    QDateTime installedAt;
};
