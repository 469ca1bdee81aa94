module;
#include <QString>
#include <QVector>
#include <QtGlobal>

module porter.core.download_item;

qint64 PartState::effectiveExpected() const
{
    const qint64 known = expectedBytes > 0 ? expectedBytes : catalogBytes;
    return qMax(known, writtenBytes);
}

PartState* DownloadItem::part(const QString& name)
{
    for (PartState& p : parts) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

const PartState* DownloadItem::part(const QString& name) const
{
    for (const PartState& p : parts) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

PartState& DownloadItem::ensurePart(const QString& name, const QString& finalPath, qint64 catalogBytes)
{
    PartState* existing = part(name);
    if (!existing) {
        PartState p;
        p.name = name;
        parts.append(p);
        existing = &parts.last();
    }
    if (!finalPath.isEmpty()) existing->finalPath = finalPath;
    if (catalogBytes > 0) existing->catalogBytes = catalogBytes;
    return *existing;
}

bool DownloadItem::removePart(const QString& name)
{
    for (int i = 0; i < parts.size(); ++i) {
        if (parts[i].name == name) {
            parts.removeAt(i);
            return true;
        }
    }
    return false;
}

qint64 DownloadItem::writtenBytes() const
{
    qint64 total = 0;
    for (const PartState& p : parts) total += p.writtenBytes;
    return total;
}

qint64 DownloadItem::expectedBytes() const
{
    qint64 total = 0;
    for (const PartState& p : parts) total += p.effectiveExpected();
    return total;
}

double DownloadItem::combinedProgress() const
{
    const qint64 expected = expectedBytes();
    if (expected <= 0) return 0.0;
    return qBound(0.0, double(writtenBytes()) / double(expected), 1.0);
}

bool DownloadItem::allPartsCompleted() const
{
    if (parts.isEmpty()) return false;
    for (const PartState& p : parts) {
        if (!p.completed) return false;
    }
    return true;
}

QString DownloadItem::statusString() const
{
    if (completed) return "Completed";
    if (verifying) return "Verifying";
    if (error) return error->isRetryable() ? "Retrying" : "Failed";
    return "Downloading";
}
