/*!
 * @file        category_utils.cppm
 * @brief       Artifact file category detection and classification helpers.
 * @details     Provides utility functions for mapping filenames or file paths
 *              to logical artifact categories based on file extensions and
 *              well-known name fragments. Also exposes the list of file
 *              extensions accepted for dataset downloads.
 *
 *              These helpers centralize category logic so that dataset file
 *              filtering, projector detection, and post-download validation
 *              classify files consistently.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module porter.utils.category_utils;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

PORTER_MODULE_EXPORT namespace porter::utils {

/**
 * @brief Detects the logical artifact category for a given file path.
 *
 * Projector files are recognized by name before the extension is consulted,
 * since they share the `.gguf` extension with model weights.
 *
 * @param filePath Full file name or path.
 * @return One of the labels returned by categoryNames().
 */
QString detectCategory(const QString& filePath);

/**
 * @brief Returns the list of all artifact category names.
 * @return List of category name strings.
 */
QStringList categoryNames();

//!< @brief Lower-case file extensions accepted for dataset downloads.
QStringList datasetExtensions();

/**
 * @brief Checks whether a file may be part of a dataset download.
 * @param fileName File name or path.
 * @return true if its extension is listed in datasetExtensions().
 */
bool isDatasetFile(const QString& fileName);

/**
 * @brief Checks whether a file name denotes a vision projector for GGUF models.
 * @param fileName File name or path.
 * @return true if the name contains "mmproj" and ends with ".gguf".
 */
bool isProjectorFile(const QString& fileName);

} // namespace porter::utils
