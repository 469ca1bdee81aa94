/*!
 * @file        download_utils.cppm
 * @brief       Common utility helpers for artifact paths, URLs, and on-disk inspection.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across the download core and its services. These utilities handle
 *              common tasks such as path normalization, temp-file naming,
 *              filename inference, hub repository parsing, file header checks,
 *              and partial download inspection.
 *
 *              All helpers are side-effect free except the explicit removal
 *              and hint-writing helpers, which only touch the paths they are given.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QUrl>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module porter.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

PORTER_MODULE_EXPORT namespace porter::utils {

//!< @brief Suffix of an in-progress artifact next to its final path.
inline constexpr const char* kTempSuffix = ".download";

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and ensures a consistent representation
 * suitable for filesystem operations.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Returns the in-progress path for a final artifact path.
 * @param finalPath Final artifact path.
 * @return `<finalPath>.download`, or an empty string for an empty input.
 */
QString tempPathFor(const QString& finalPath);

/**
 * @brief Maps a temp path back to its final path.
 *
 * Paths without the temp suffix are returned normalized and otherwise untouched.
 *
 * @param path Temp or final path.
 * @return Final artifact path.
 */
QString finalPathFor(const QString& path);

/**
 * @brief Size of a regular file on disk.
 * @param path Filesystem path.
 * @return File size in bytes, or -1 when the file does not exist.
 */
qint64 fileSizeOnDisk(const QString& path);

/**
 * @brief Checks whether a normalized path exists and refers to a regular file.
 *
 * @param path Normalized filesystem path.
 * @return true if the path exists and is a file, false otherwise.
 */
bool fileExistsPath(const QString& path);

/**
 * @brief Removes the final file and its temp companion if present.
 * @param finalPath Final artifact path.
 * @return true if nothing is left on disk afterwards.
 */
bool removeArtifactFiles(const QString& finalPath);

/**
 * @brief Finds the first file in a directory whose name contains one of the hints.
 *
 * Matching is case-insensitive. Temp files are ignored.
 *
 * @param directory Directory to scan (non-recursive).
 * @param hints Substrings to look for.
 * @return Absolute path of the match, or an empty string.
 */
QString findFileContaining(const QString& directory, const QStringList& hints);

/**
 * @brief Writes a small UTF-8 text hint file, replacing any previous content.
 * @param path Target path.
 * @param text Content to write.
 * @return true on success.
 */
bool writeTextHint(const QString& path, const QString& text);

/**
 * @brief Decodes a URL query string value.
 *
 * Handles standard percent-decoding and converts '+' characters into spaces,
 * as commonly used in application/x-www-form-urlencoded data.
 *
 * @param value Encoded query value.
 * @return Decoded string.
 */
QString decodeQueryValue(const QString& value);

/**
 * @brief Extracts a filename from a Content-Disposition header value.
 *
 * @param value Raw Content-Disposition header value.
 * @return Extracted filename, or an empty string if none could be determined.
 */
QString filenameFromDisposition(const QString& value);

/**
 * @brief Infers a filename from a URL.
 *
 * Attempts to derive a meaningful filename from the URL path or query
 * parameters when no explicit filename is provided by the server.
 *
 * @param url Source URL.
 * @return Inferred filename string.
 */
QString fileNameFromUrl(const QUrl& url);

/**
 * @brief Extracts a hub repository id (`owner/name`) from a download URL.
 *
 * Understands `https://huggingface.co/<owner>/<repo>/resolve/...` style URLs
 * and skips leading `api`, `models` and `repos` path components.
 *
 * @param url Download or API URL.
 * @return Repository id, or an empty string when the URL is not a hub URL.
 */
QString huggingFaceRepoId(const QUrl& url);

/**
 * @brief Returns a copy of the URL with `download=1` in its query.
 * @param url Source URL.
 * @return URL suitable for size probing.
 */
QUrl withDownloadQuery(const QUrl& url);

/**
 * @brief Checks whether a file starts with the GGUF magic bytes.
 * @param path File path.
 * @return true if the first four bytes are "GGUF".
 */
bool hasGgufMagic(const QString& path);

/**
 * @brief Normalizes a checksum string.
 *
 * Converts the checksum to lowercase and removes whitespace to ensure
 * consistent comparison.
 *
 * @param value Raw checksum string.
 * @return Normalized checksum string.
 */
QString normalizeChecksum(const QString& value);

/**
 * @brief Formats a byte count for log output.
 * @param bytes Byte count.
 * @return Human readable size such as "4.07 GB".
 */
QString humanReadableBytes(qint64 bytes);

} // namespace porter::utils
