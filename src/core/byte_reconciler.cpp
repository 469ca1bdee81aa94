module;
#include <QString>
#include <QtGlobal>

module porter.core.byte_reconciler;

import porter.utils.download_utils;

namespace utils = porter::utils;

qint64 ByteReconciler::probeOnDisk(const QString& finalPath)
{
    if (finalPath.isEmpty()) return -1;
    const qint64 temp = utils::fileSizeOnDisk(utils::tempPathFor(finalPath));
    if (temp >= 0) return temp;
    return utils::fileSizeOnDisk(finalPath);
}

QString ByteReconciler::locate(const PartProbe& probe)
{
    if (probe.searchDir.isEmpty() || probe.nameHints.isEmpty()) return QString();
    return utils::findFileContaining(probe.searchDir, probe.nameHints);
}

ByteCounts ByteReconciler::reconcile(const PartProbe& probe)
{
    const qint64 counter = qMax<qint64>(0, probe.counterBytes);
    const qint64 known = probe.expectedBytes > 0 ? probe.expectedBytes : qMax<qint64>(0, probe.catalogBytes);

    qint64 onDisk = probeOnDisk(probe.finalPath);
    if (onDisk < 0 && counter == 0 && known > 0) {
        const QString located = locate(probe);
        if (!located.isEmpty()) onDisk = utils::fileSizeOnDisk(located);
    }

    ByteCounts counts;
    counts.written = qMax(counter, qMax<qint64>(0, onDisk));
    counts.expected = qMax(known, counts.written);
    return counts;
}
