/*!
 * @file        background_reconciler.cppm
 * @brief       Recovery of transfers that completed without their owner listening.
 * @details     Two cases are handled. A transport may report a destination
 *              whose transfer finished while nobody was connected to its
 *              stream; the destination is matched against the active model
 *              downloads (weights first, then projectors) and then against
 *              dataset directories. Independently, a periodic sweep finalizes
 *              model downloads that are nearly complete and whose final files
 *              are already on disk.
 *
 *              Both paths go through DownloadOrchestrator::finalizeFromDisk(),
 *              which is idempotent, so racing with a regular `finished` event
 *              is harmless.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QList>
#include <QString>

#ifndef Q_MOC_RUN
export module porter.core.background_reconciler;
import porter.core.download_orchestrator;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

PORTER_MODULE_EXPORT class BackgroundReconciler {
public:
    //!< @brief Progress from which the sweep looks for finished files.
    static constexpr double kSweepThreshold = 0.995;

    /**
     * @brief Handles an out-of-band completion notification.
     * @param orchestrators Orchestrators of the registry.
     * @param destination Temp or final path reported by the transport.
     * @param errorMessage Non-empty when the transfer failed; such notifications are ignored.
     * @return true if a download took the file over.
     */
    static bool handleCompletion(const QList<DownloadOrchestrator*>& orchestrators,
                                 const QString& destination, const QString& errorMessage);

    /**
     * @brief Finalizes nearly complete model downloads whose files are on disk.
     * @param orchestrators Orchestrators of the registry.
     * @return Number of downloads finalized.
     */
    static int sweep(const QList<DownloadOrchestrator*>& orchestrators);
};
