/*!
 * @file        model_orchestrator.cppm
 * @brief       Download of a model's weights and its optional vision projector.
 * @details     Before the weights transfer starts, the orchestrator looks for a
 *              projector (`*mmproj*.gguf`) in the quantization's repository and
 *              then in the base model repository. The outcome is recorded in the
 *              model directory's manifest so later sessions skip the lookup.
 *
 *              The projector is best effort: a failed transfer, a permanent
 *              error or a file without the GGUF magic drops the part while the
 *              weights continue.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QtGlobal>
#include <functional>

#ifndef Q_MOC_RUN
export module porter.core.model_orchestrator;
import porter.core.artifact;
import porter.core.byte_reconciler;
import porter.core.download_error;
import porter.core.download_item;
import porter.core.download_orchestrator;
import porter.core.model_manifest;
import porter.services.hub_client;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

PORTER_MODULE_EXPORT class ModelOrchestrator : public DownloadOrchestrator {

    Q_OBJECT

public:
    /**
     * @brief Construct a model orchestrator.
     * @param spec Model and quantization to download.
     * @param context Shared collaborators.
     * @param parent Owning registry.
     */
    ModelOrchestrator(const ModelSpec& spec, const DownloadContext& context, QObject* parent = nullptr);

    const ModelSpec& spec() const { return m_spec; }

    //!< @brief Directory shared by every quantization of the model.
    QString directory() const { return m_directory; }

    //!< @brief Final path of the weights file.
    QString weightsPath() const { return m_weightsPath; }

protected:
    void run() override;
    QString title() const override;
    void onPartFailed(const QString& part, const DownloadError& error) override;
    bool acceptFinalFile(const PartState& part) const override;
    void onPartAccepted(const QString& part) override;
    void onPartRejected(const QString& part) override;
    void onPartDropped(const QString& part) override;
    InstalledArtifact buildArtifact(const DownloadItem& item) const override;
    PartProbe probeFor(const PartState& part) const override;

private:
    void probeProjector(const QStringList& repos, int index, bool allAnswered, quint64 gen);
    void startProjector(const QString& path, qint64 sizeBytes);
    void startWeights();
    void updateManifest(const std::function<void(ModelManifest&)>& mutator);

    ModelSpec m_spec;
    QString m_directory;
    QString m_weightsPath;
    QUrl m_projectorUrl;
    qint64 m_projectorSize = 0;
};

#include "model_orchestrator.moc"
