/*!
 * @file        byte_reconciler.cppm
 * @brief       Authoritative byte accounting for download sub-parts.
 * @details     Network progress events and in-memory counters can both lag
 *              behind what is already on disk, most visibly right after a
 *              resume. The reconciler combines the in-memory counter with an
 *              on-disk probe of the temp and final files and guarantees that
 *              the expected size is never smaller than the bytes written.
 *
 *              Reconciliation is a pure function of the probe and the current
 *              disk state, so repeating it yields the same counts.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module porter.core.byte_reconciler;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief Inputs for reconciling one sub-part.
 */
PORTER_MODULE_EXPORT struct PartProbe {
    QString finalPath;          //!< Final path, empty when the file name is not known yet.
    qint64 counterBytes = 0;    //!< In-memory written counter.
    qint64 expectedBytes = 0;   //!< Session reported size, 0 when unknown.
    qint64 catalogBytes = 0;    //!< Catalog size, used when the session size is unknown.
    QString searchDir;          //!< Directory scanned when the file cannot be found by name.
    QStringList nameHints;      //!< Substrings identifying the file during the scan.
};

/**
 * @brief Reconciled byte counts.
 */
PORTER_MODULE_EXPORT struct ByteCounts {
    qint64 written = 0;
    qint64 expected = 0;

    //!< @brief written / expected, 0 when the size is unknown.
    double fraction() const { return expected > 0 ? double(written) / double(expected) : 0.0; }
};

/**
 * @brief Computes written/expected counts from memory and disk.
 */
PORTER_MODULE_EXPORT class ByteReconciler {
public:
    /**
     * @brief Reconciles a sub-part.
     *
     * written = max(on-disk size, counter), where the on-disk size prefers the
     * temp file and falls back to the final file. When neither exists, the
     * counter is zero and a size is expected, the search directory is scanned
     * for a file matching one of the hints.
     *
     * expected = max(session size or catalog size, written).
     *
     * @param probe Inputs.
     * @return Reconciled counts.
     */
    static ByteCounts reconcile(const PartProbe& probe);

    /**
     * @brief Size on disk for a final path, temp file first.
     * @param finalPath Final artifact path.
     * @return Bytes on disk, or -1 when neither file exists.
     */
    static qint64 probeOnDisk(const QString& finalPath);

    /**
     * @brief Scans the probe's search directory for a file matching its hints.
     * @return Absolute path of the match, empty when none or when the probe
     *         carries no search directory.
     */
    static QString locate(const PartProbe& probe);
};
