module;
#include <QDebug>
#include <QList>
#include <QString>
#include <optional>

module porter.core.background_reconciler;

import porter.core.artifact;
import porter.core.dataset_orchestrator;
import porter.core.download_item;

bool BackgroundReconciler::handleCompletion(const QList<DownloadOrchestrator*>& orchestrators,
                                            const QString& destination, const QString& errorMessage)
{
    if (!errorMessage.isEmpty()) {
        qWarning() << "[Reconciler] background transfer failed:" << destination << errorMessage;
        return false;
    }

    for (DownloadOrchestrator* o : orchestrators) {
        if (o->kind() != ArtifactKind::Model) continue;
        if (o->matchPath(destination) == DownloadOrchestrator::PathMatch::Primary) {
            qInfo() << "[Reconciler] weights completed in background:" << destination;
            return o->finalizeFromDisk(DownloadOrchestrator::FinalizeSource::Notification);
        }
    }

    for (DownloadOrchestrator* o : orchestrators) {
        if (o->kind() != ArtifactKind::Model) continue;
        if (o->matchPath(destination) == DownloadOrchestrator::PathMatch::Auxiliary) {
            qInfo() << "[Reconciler] projector completed in background:" << destination;
            return o->completeAuxiliary(destination);
        }
    }

    for (DownloadOrchestrator* o : orchestrators) {
        auto* dataset = qobject_cast<DatasetOrchestrator*>(o);
        if (dataset && dataset->containsPath(destination)) {
            qInfo() << "[Reconciler] dataset file completed in background:" << destination;
            return dataset->finalizeFromDisk(DownloadOrchestrator::FinalizeSource::Notification);
        }
    }

    qDebug() << "[Reconciler] no download matches" << destination;
    return false;
}

int BackgroundReconciler::sweep(const QList<DownloadOrchestrator*>& orchestrators)
{
    int finalized = 0;
    for (DownloadOrchestrator* o : orchestrators) {
        if (o->kind() != ArtifactKind::Model || !o->isActive()) continue;
        const std::optional<DownloadItem> item = o->item();
        if (!item || item->completed || item->progress < kSweepThreshold) continue;
        if (o->finalizeFromDisk(DownloadOrchestrator::FinalizeSource::Sweep)) ++finalized;
    }
    return finalized;
}
