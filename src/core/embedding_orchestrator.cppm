/*!
 * @file        embedding_orchestrator.cppm
 * @brief       Download of a single-file embedding model.
 * @details     Skipped when the destination already exists, in which case the
 *              file is reported as installed. The size is probed before the
 *              transfer starts.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>

#ifndef Q_MOC_RUN
export module porter.core.embedding_orchestrator;
import porter.core.artifact;
import porter.core.download_item;
import porter.core.download_orchestrator;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

//!< @brief Part name of the embedding model file.
PORTER_MODULE_EXPORT inline constexpr const char* kEmbeddingPart = "embedding";

PORTER_MODULE_EXPORT class EmbeddingOrchestrator : public DownloadOrchestrator {

    Q_OBJECT

public:
    EmbeddingOrchestrator(const EmbeddingSpec& spec, const DownloadContext& context, QObject* parent = nullptr);

    const EmbeddingSpec& spec() const { return m_spec; }

    //!< @brief Final path of the model file.
    QString destination() const { return m_destination; }

protected:
    void run() override;
    InstalledArtifact buildArtifact(const DownloadItem& item) const override;

private:
    void startTransfer();

    EmbeddingSpec m_spec;
    QString m_destination;
};

#include "embedding_orchestrator.moc"
