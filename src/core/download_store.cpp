module;
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QModelIndex>
#include <QSet>
#include <QString>
#include <QVariant>
#include <QVector>
#include <QtGlobal>

module porter.core.download_store;

DownloadStore::DownloadStore(QObject* parent)
    : QAbstractListModel(parent)
{
}

int DownloadStore::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid()) return 0;
    return m_items.size();
}

QVariant DownloadStore::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() >= m_items.size()) return {};
    const DownloadItem& item = m_items[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case TitleRole: return item.title.isEmpty() ? item.identity : item.title;
    case IdentityRole: return item.identity;
    case KindRole: return artifactKindName(item.kind);
    case ProgressRole: return item.progress;
    case SpeedRole: return item.speed;
    case CompletedRole: return item.completed;
    case VerifyingRole: return item.verifying;
    case StatusRole: return m_paused.contains(item.identity) && !item.completed ? QString("Paused") : item.statusString();
    case ErrorRole: return item.error ? item.error->message() : QString();
    case RetryCountRole: return item.retryCount;
    case BytesWrittenRole: return item.writtenBytes();
    case BytesExpectedRole: return item.expectedBytes();
    case PausedRole: return m_paused.contains(item.identity);
    }
    return {};
}

QHash<int, QByteArray> DownloadStore::roleNames() const
{
    return {
        { IdentityRole, "identity" },
        { KindRole, "kind" },
        { TitleRole, "title" },
        { ProgressRole, "progress" },
        { SpeedRole, "speed" },
        { CompletedRole, "completed" },
        { VerifyingRole, "verifying" },
        { StatusRole, "status" },
        { ErrorRole, "error" },
        { RetryCountRole, "retryCount" },
        { BytesWrittenRole, "bytesWritten" },
        { BytesExpectedRole, "bytesExpected" },
        { PausedRole, "paused" }
    };
}

int DownloadStore::indexOf(ArtifactKind kind, const QString& identity) const
{
    for (int i = 0; i < m_items.size(); ++i) {
        if (m_items[i].kind == kind && m_items[i].identity == identity) return i;
    }
    return -1;
}

DownloadItem DownloadStore::ensure(ArtifactKind kind, const QString& identity, const QString& title)
{
    const int existing = indexOf(kind, identity);
    if (existing >= 0) return m_items[existing];

    beginInsertRows(QModelIndex(), m_items.size(), m_items.size());
    DownloadItem item;
    item.identity = identity;
    item.kind = kind;
    item.title = title;
    m_items.append(item);
    endInsertRows();

    emit itemChanged(kind, identity);
    return item;
}

bool DownloadStore::update(ArtifactKind kind, const QString& identity, const Mutator& mutator)
{
    const int row = indexOf(kind, identity);
    if (row < 0 || !mutator) return false;
    mutator(m_items[row]);
    const QModelIndex idx = index(row);
    emit dataChanged(idx, idx);
    emit itemChanged(kind, identity);
    return true;
}

std::optional<DownloadItem> DownloadStore::item(ArtifactKind kind, const QString& identity) const
{
    const int row = indexOf(kind, identity);
    if (row < 0) return std::nullopt;
    return m_items[row];
}

bool DownloadStore::contains(ArtifactKind kind, const QString& identity) const
{
    return indexOf(kind, identity) >= 0;
}

QVector<DownloadItem> DownloadStore::items(ArtifactKind kind) const
{
    QVector<DownloadItem> out;
    for (const DownloadItem& item : m_items) {
        if (item.kind == kind) out.append(item);
    }
    return out;
}

bool DownloadStore::remove(ArtifactKind kind, const QString& identity)
{
    const int row = indexOf(kind, identity);
    if (row < 0) return false;
    beginRemoveRows(QModelIndex(), row, row);
    m_items.removeAt(row);
    endRemoveRows();
    emit itemChanged(kind, identity);
    return true;
}

int DownloadStore::removeEverywhere(const QString& identity)
{
    int removed = 0;
    for (ArtifactKind kind : allArtifactKinds()) {
        if (remove(kind, identity)) ++removed;
    }
    return removed;
}

void DownloadStore::setPaused(const QString& identity, bool paused)
{
    const bool changed = paused ? !m_paused.contains(identity) : m_paused.contains(identity);
    if (!changed) return;
    if (paused) m_paused.insert(identity);
    else m_paused.remove(identity);

    for (int i = 0; i < m_items.size(); ++i) {
        if (m_items[i].identity != identity) continue;
        const QModelIndex idx = index(i);
        emit dataChanged(idx, idx, { PausedRole, StatusRole });
        emit itemChanged(m_items[i].kind, identity);
    }
}
