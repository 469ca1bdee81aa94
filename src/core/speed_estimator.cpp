module;
#include <QDateTime>
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QtGlobal>

module porter.core.speed_estimator;

double SpeedEstimator::smooth(double previous, double instant)
{
    const double clamped = qBound(0.0, instant, kMaxSpeed);
    if (previous <= 0.0) return clamped;
    return qMin(kMaxSpeed, (1.0 - kAlpha) * previous + kAlpha * clamped);
}

qint64 SpeedEstimator::nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

double SpeedEstimator::addByteSample(const QString& identity, const QString& part, qint64 totalBytes, qint64 nowMs)
{
    Sampler& s = m_samplers[identity][part];
    if (s.lastSampleMs < 0 || totalBytes < s.lastBytes) {
        // First sample, or the counter was reset by a restart.
        s.lastSampleMs = nowMs;
        s.lastBytes = totalBytes;
        return s.smoothed;
    }

    const qint64 dt = nowMs - s.lastSampleMs;
    if (dt < kMinSampleIntervalMs) return s.smoothed;

    const double instant = double(totalBytes - s.lastBytes) * 1000.0 / double(dt);
    s.smoothed = smooth(s.smoothed, instant);
    s.lastSampleMs = nowMs;
    s.lastBytes = totalBytes;
    return s.smoothed;
}

double SpeedEstimator::addRateSample(const QString& identity, const QString& part, double bytesPerSecond,
                                     qint64 totalBytes, qint64 nowMs)
{
    Sampler& s = m_samplers[identity][part];
    if (s.lastSampleMs >= 0 && nowMs - s.lastSampleMs < kMinSampleIntervalMs && s.smoothed > 0.0) {
        return s.smoothed;
    }
    s.smoothed = smooth(s.smoothed, bytesPerSecond);
    s.lastSampleMs = nowMs;
    if (totalBytes >= 0) s.lastBytes = totalBytes;
    return s.smoothed;
}

double SpeedEstimator::partSpeed(const QString& identity, const QString& part) const
{
    const auto it = m_samplers.constFind(identity);
    if (it == m_samplers.constEnd()) return 0.0;
    const auto partIt = it->constFind(part);
    return partIt == it->constEnd() ? 0.0 : partIt->smoothed;
}

double SpeedEstimator::speed(const QString& identity) const
{
    const auto it = m_samplers.constFind(identity);
    if (it == m_samplers.constEnd()) return 0.0;
    double total = 0.0;
    for (const Sampler& s : *it) total += s.smoothed;
    return qMin(kMaxSpeed, total);
}

void SpeedEstimator::forget(const QString& identity)
{
    m_samplers.remove(identity);
}

void SpeedEstimator::forgetPart(const QString& identity, const QString& part)
{
    auto it = m_samplers.find(identity);
    if (it == m_samplers.end()) return;
    it->remove(part);
    if (it->isEmpty()) m_samplers.erase(it);
}

QStringList SpeedEstimator::sweep(qint64 nowMs, const QSet<QString>& paused)
{
    QStringList zeroed;
    for (auto it = m_samplers.begin(); it != m_samplers.end(); ++it) {
        const bool isPaused = paused.contains(it.key());
        bool changed = false;
        for (Sampler& s : *it) {
            if (s.smoothed <= 0.0) continue;
            if (isPaused || nowMs - s.lastSampleMs > kStaleAfterMs) {
                s.smoothed = 0.0;
                changed = true;
            }
        }
        if (changed) zeroed.append(it.key());
    }
    return zeroed;
}
