/*!
 * @file        download_config.cppm
 * @brief       Explicit configuration of the download engine.
 * @details     Collects every tunable of the engine in one value type that is
 *              handed to each component through its context instead of being
 *              read from process-wide state. Values persist in QSettings under
 *              the `downloads` group; storage roots default to the
 *              application data location.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QSettings>
#include <QString>
#include <QUrl>

#ifndef Q_MOC_RUN
export module porter.core.download_config;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief Engine configuration.
 */
PORTER_MODULE_EXPORT struct DownloadConfig {
    QString modelsRoot;                 //!< Root of model directories.
    QString datasetsRoot;               //!< Root of dataset directories.
    QString bundlesRoot;                //!< Root of SLM bundle directories.
    QString embeddingsRoot;             //!< Root of embedding model directories.

    QUrl hubBaseUrl = QUrl(QStringLiteral("https://huggingface.co")); //!< Metadata and content origin.
    QString hubToken;                   //!< Optional bearer token for the hub.
    QString bundleRepo = QStringLiteral("LiquidAI/LeapBundles");      //!< Repository listing SLM bundles.
    QString userAgent = QStringLiteral("porter/1.0");

    int maxConcurrentRequests = 2;      //!< Concurrent hub requests.
    int maxRequestAttempts = 5;         //!< Attempts per hub request.
    int requestTimeoutMs = 10000;       //!< Per-request timeout of hub requests.
    int maxNetworkBackoffSec = 60;      //!< Cap of the transfer retry backoff.
    int maxFileAttempts = 3;            //!< Attempts per dataset file before the whole dataset backs off.
    int finishedGraceMs = 3000;         //!< Visibility of finished items before removal.
    int failedGraceMs = 5000;           //!< Visibility of failed items before removal.
    bool offline = false;               //!< Kill switch for all network activity.

    //!< @brief Defaults rooted at the application data location.
    static DownloadConfig defaults();

    //!< @brief Settings group holding the configuration.
    static QString settingsGroup();

    /**
     * @brief Loads a configuration, falling back to defaults for missing keys.
     * @param settings Settings store.
     * @return Loaded configuration.
     */
    static DownloadConfig load(QSettings& settings);

    //!< @brief Persists the configuration.
    void save(QSettings& settings) const;

    //!< @brief Directory of a model, one sub-directory per repository segment.
    QString modelDirectory(const QString& modelId) const;

    //!< @brief Directory of a dataset.
    QString datasetDirectory(const QString& datasetId) const;

    //!< @brief Directory of a bundle.
    QString bundleDirectory(const QString& slug) const;

    //!< @brief Directory of an embedding model.
    QString embeddingDirectory(const QString& repoId) const;
};
