/*!
 * @file        speed_estimator.cppm
 * @brief       Smoothed per-download throughput estimation.
 * @details     Keeps one sampler per (identity, sub-part). Byte samples closer
 *              than the minimum interval are skipped, instantaneous rates are
 *              clamped to a sane maximum, and an exponential moving average
 *              smooths the result. A periodic sweep zeroes readings that went
 *              stale or belong to paused downloads.
 *
 *              Time is passed in explicitly as a millisecond timestamp so the
 *              estimator stays deterministic under test.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module porter.core.speed_estimator;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief EMA based speed estimator.
 */
PORTER_MODULE_EXPORT class SpeedEstimator {
public:
    static constexpr double kAlpha = 0.30;                          //!< EMA weight of the newest sample.
    static constexpr double kMaxSpeed = 512.0 * 1024.0 * 1024.0;    //!< Clamp in bytes/sec.
    static constexpr qint64 kMinSampleIntervalMs = 250;             //!< Minimum gap between byte samples.
    static constexpr qint64 kStaleAfterMs = 1250;                   //!< Readings older than this are zeroed.

    /**
     * @brief Feeds a cumulative byte count.
     * @param identity Download identity.
     * @param part Sub-part name.
     * @param totalBytes Bytes written so far for the part.
     * @param nowMs Sample time in milliseconds.
     * @return Smoothed speed of the part after the sample.
     */
    double addByteSample(const QString& identity, const QString& part, qint64 totalBytes, qint64 nowMs);

    /**
     * @brief Feeds a transport measured instantaneous rate.
     * @param identity Download identity.
     * @param part Sub-part name.
     * @param bytesPerSecond Measured rate.
     * @param totalBytes Bytes written so far, -1 when unknown.
     * @param nowMs Sample time in milliseconds.
     * @return Smoothed speed of the part after the sample.
     */
    double addRateSample(const QString& identity, const QString& part, double bytesPerSecond,
                         qint64 totalBytes, qint64 nowMs);

    //!< @brief Smoothed speed of one part.
    double partSpeed(const QString& identity, const QString& part) const;

    //!< @brief Sum of part speeds of an identity, clamped to kMaxSpeed.
    double speed(const QString& identity) const;

    //!< @brief Drops every sampler of an identity.
    void forget(const QString& identity);

    //!< @brief Drops the sampler of one part.
    void forgetPart(const QString& identity, const QString& part);

    /**
     * @brief Zeroes stale and paused readings.
     * @param nowMs Current time in milliseconds.
     * @param paused Identities that are paused.
     * @return Identities whose speed changed to 0.
     */
    QStringList sweep(qint64 nowMs, const QSet<QString>& paused);

    /**
     * @brief One EMA step.
     * @param previous Previous smoothed value, 0 for none.
     * @param instant New instantaneous value, clamped to [0, kMaxSpeed].
     * @return New smoothed value.
     */
    static double smooth(double previous, double instant);

    //!< @brief Wall clock in milliseconds used by callers without their own clock.
    static qint64 nowMs();

private:
    struct Sampler {
        qint64 lastSampleMs = -1;
        qint64 lastBytes = 0;
        double smoothed = 0.0;
    };

    QHash<QString, QHash<QString, Sampler>> m_samplers; //!< identity -> part -> sampler.
};
