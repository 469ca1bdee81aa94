/*!
 * @file        model_manifest.cppm
 * @brief       Per-model sidecar recording which companion files are present.
 * @details     Every model directory may hold an `artifacts.json` file with
 *              the weights file name, the projector file name (or null when
 *              the model has none), and whether projector discovery already
 *              ran. Every field is optional; a missing or unreadable manifest
 *              simply means "unknown, probe again".
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QString>

#ifndef Q_MOC_RUN
export module porter.core.model_manifest;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief Decoded `artifacts.json`.
 */
PORTER_MODULE_EXPORT struct ModelManifest {
    QString weights;            //!< Weights file name, empty when unknown.
    QString mmproj;             //!< Projector file name, empty for none or unknown.
    bool mmprojChecked = false; //!< Whether projector discovery already ran.

    //!< @brief File name of the manifest inside a model directory.
    static QString fileName();

    //!< @brief Full manifest path for a model directory.
    static QString pathIn(const QString& directory);

    /**
     * @brief Loads the manifest of a model directory.
     *
     * Missing files, malformed JSON and unexpected field types all decode to
     * the default (unknown) values.
     *
     * @param directory Model directory.
     * @return Decoded manifest.
     */
    static ModelManifest load(const QString& directory);

    //!< @brief Decodes manifest JSON.
    static ModelManifest fromJson(const QByteArray& json);

    //!< @brief Encodes the manifest; an empty projector is written as null.
    QByteArray toJson() const;

    /**
     * @brief Atomically writes the manifest into a model directory.
     * @param directory Model directory.
     * @return true on success.
     */
    bool save(const QString& directory) const;

    //!< @brief True when discovery ran and found a projector.
    bool hasProjector() const { return mmprojChecked && !mmproj.isEmpty(); }
};
