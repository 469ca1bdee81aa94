/*!
 * @file        dataset_orchestrator.cppm
 * @brief       Sequential download of the supported files of a dataset.
 * @details     Only documents and data files are fetched (see
 *              porter::utils::datasetExtensions()); `OTL/` datasets download
 *              their PDF alone when one exists. Unknown sizes are probed
 *              before the first transfer. Files are transferred one after the
 *              other, each with its own retry budget; once a file exhausts it
 *              the whole dataset backs off like any other download.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QList>
#include <QObject>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module porter.core.dataset_orchestrator;
import porter.core.artifact;
import porter.core.download_error;
import porter.core.download_item;
import porter.core.download_orchestrator;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

PORTER_MODULE_EXPORT class DatasetOrchestrator : public DownloadOrchestrator {

    Q_OBJECT

public:
    DatasetOrchestrator(const DatasetSpec& spec, const DownloadContext& context, QObject* parent = nullptr);

    const DatasetSpec& spec() const { return m_spec; }

    //!< @brief Directory holding the dataset files.
    QString directory() const { return m_directory; }

    //!< @brief Whether a path lies inside the dataset directory.
    bool containsPath(const QString& path) const;

    /**
     * @brief Files of a dataset that will actually be downloaded.
     * @param spec Dataset description.
     * @return Supported files; a single PDF for `OTL/` datasets that have one.
     */
    static QList<DatasetFile> selectFiles(const DatasetSpec& spec);

protected:
    void run() override;
    QString title() const override;
    void onPartFinished(const QString& part) override;
    void onPartFailed(const QString& part, const DownloadError& error) override;
    void onStopped() override;

private:
    void startNextFile();
    bool startFile(const DatasetFile& file);
    void retryFile(const QString& part, const DownloadError& error);

    DatasetSpec m_spec;
    QList<DatasetFile> m_files;
    QString m_directory;
    QHash<QString, int> m_fileAttempts;     //!< Failed attempts per file in the current run.
    int m_pendingProbes = 0;
};

#include "dataset_orchestrator.moc"
