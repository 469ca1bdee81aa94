/*!
 * @file        installed_store.cppm
 * @brief       Persistent registry of installed artifacts.
 * @details     Default ArtifactInstaller. Keeps the list of finalized
 *              artifacts in memory and mirrors it to a JSON file written
 *              atomically after every change, so a later session knows which
 *              models, datasets, bundles and embeddings are already present.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QVector>

#ifndef Q_MOC_RUN
export module porter.services.installed_store;
import porter.core.artifact;
import porter.core.transfer;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief JSON backed installer.
 *
 * Artifacts are keyed by kind and identity; installing the same key again
 * replaces the previous record.
 */
PORTER_MODULE_EXPORT class InstalledStore : public QObject, public ArtifactInstaller {

    Q_OBJECT

public:
    /**
     * @brief Construct a store.
     * @param path JSON file path; an empty path keeps the store in memory only.
     * @param parent Optional parent QObject.
     */
    explicit InstalledStore(const QString& path = QString(), QObject* parent = nullptr);

    void install(const InstalledArtifact& artifact) override;
    bool isInstalled(ArtifactKind kind, const QString& identity) const override;

    //!< @brief Removes a record; returns false when it did not exist.
    bool uninstall(ArtifactKind kind, const QString& identity);

    //!< @brief All records in installation order.
    const QVector<InstalledArtifact>& artifacts() const { return m_artifacts; }

    //!< @brief Reloads the records from disk.
    void load();

    //!< @brief Writes the records to disk.
    bool save() const;

signals:
    void installed(const QString& identity);

private:
    int indexOf(ArtifactKind kind, const QString& identity) const;

    QString m_path;
    QVector<InstalledArtifact> m_artifacts;
};

#include "installed_store.moc"
