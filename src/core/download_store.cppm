/*!
 * @file        download_store.cppm
 * @brief       Single-writer collection of download items.
 * @details     Holds the items of every artifact kind together with the set of
 *              paused identities. All mutations go through update(), which
 *              applies a mutator to exactly one item and notifies views, so
 *              readers always observe the latest committed state.
 *
 *              The store is also a Qt list model, exposing one row per item
 *              with roles for progress, speed, status and byte counts.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QModelIndex>
#include <QSet>
#include <QString>
#include <QVariant>
#include <QVector>
#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module porter.core.download_store;
import porter.core.artifact;
import porter.core.download_item;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief Qt list model of download items, grouped by kind.
 *
 * An identity is unique within a kind. Rows keep insertion order.
 */
PORTER_MODULE_EXPORT class DownloadStore : public QAbstractListModel {
    Q_OBJECT

public:
    /**
     * @brief Custom model roles.
     */
    enum Roles {
        IdentityRole = Qt::UserRole + 1,  //!< Download identity
        KindRole,                         //!< Artifact kind name
        TitleRole,                        //!< Display title
        ProgressRole,                     //!< Combined progress (0.0 - 1.0)
        SpeedRole,                        //!< Smoothed speed in bytes/sec
        CompletedRole,                    //!< Completion state
        VerifyingRole,                    //!< Checksum verification state
        StatusRole,                       //!< Human-readable status string
        ErrorRole,                        //!< Last error message
        RetryCountRole,                   //!< Retries so far
        BytesWrittenRole,                 //!< Reconciled bytes written
        BytesExpectedRole,                //!< Best known total bytes
        PausedRole                        //!< Pause flag
    };

    using Mutator = std::function<void(DownloadItem&)>;

    /**
     * @brief Constructs an empty store.
     *
     * @param parent Optional QObject parent.
     */
    explicit DownloadStore(QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    /**
     * @brief Returns the item of an identity, inserting a fresh one when absent.
     * @param kind Artifact kind.
     * @param identity Download identity.
     * @param title Display title used for a new item.
     * @return Copy of the stored item.
     */
    DownloadItem ensure(ArtifactKind kind, const QString& identity, const QString& title = QString());

    /**
     * @brief Applies a mutation to one item.
     * @param kind Artifact kind.
     * @param identity Download identity.
     * @param mutator Mutation to apply.
     * @return false when the item does not exist.
     */
    bool update(ArtifactKind kind, const QString& identity, const Mutator& mutator);

    //!< @brief Copy of an item, if present.
    std::optional<DownloadItem> item(ArtifactKind kind, const QString& identity) const;

    //!< @brief Whether an item exists.
    bool contains(ArtifactKind kind, const QString& identity) const;

    //!< @brief Items of one kind.
    QVector<DownloadItem> items(ArtifactKind kind) const;

    //!< @brief Items of every kind.
    const QVector<DownloadItem>& allItems() const { return m_items; }

    //!< @brief Removes one item; returns false when it did not exist.
    bool remove(ArtifactKind kind, const QString& identity);

    /**
     * @brief Removes an identity from every kind's collection.
     * @param identity Download identity.
     * @return Number of removed items.
     */
    int removeEverywhere(const QString& identity);

    //!< @brief Adds or removes an identity from the pause set.
    void setPaused(const QString& identity, bool paused);

    //!< @brief Whether an identity is paused.
    bool isPaused(const QString& identity) const { return m_paused.contains(identity); }

    //!< @brief Paused identities.
    const QSet<QString>& pausedIdentities() const { return m_paused; }

signals:
    //!< @brief Emitted after any item changed, was added or removed.
    void itemChanged(ArtifactKind kind, const QString& identity);

private:
    int indexOf(ArtifactKind kind, const QString& identity) const;

    //!< @brief Internal storage for download items.
    QVector<DownloadItem> m_items;

    //!< @brief Paused identities.
    QSet<QString> m_paused;
};

#include "download_store.moc"
