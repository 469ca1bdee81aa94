/*!
 * @file        test_support.cppm
 * @brief       Fakes and helpers shared by the engine tests.
 * @details     Provides an in-process transport whose events are driven by the
 *              test, a scripted request sender for the hub scheduler, an
 *              in-memory installer, a loopback HTTP server and a fixture
 *              rooting every artifact kind in a temporary directory.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QHash>
#include <QList>
#include <QNetworkAccessManager>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QTcpServer>
#include <QTemporaryDir>
#include <QUrl>
#include <QVector>
#include <QtGlobal>
#include <functional>
#include <memory>

export module porter.tests.support;

import porter.core.artifact;
import porter.core.download_config;
import porter.core.download_error;
import porter.core.download_orchestrator;
import porter.core.download_store;
import porter.core.speed_estimator;
import porter.core.transfer;
import porter.services.connectivity_monitor;
import porter.services.hub_client;
import porter.services.request_scheduler;

export namespace porter::tests {

/**
 * @brief Pumps the event loop until a condition holds or the timeout expires.
 * @return The final value of the condition.
 */
bool waitFor(const std::function<bool()>& condition, int timeoutMs = 5000);

//!< @brief Pumps the event loop for a fixed time.
void spin(int ms);

//!< @brief Writes a file, creating parent directories.
bool writeFile(const QString& path, const QByteArray& content);

//!< @brief Content starting with the GGUF magic, padded to a size.
QByteArray ggufBytes(int size);

//!< @brief Model info document listing the given files.
QByteArray siblingsJson(const QList<HubFile>& files);

/**
 * @brief Transport whose transfers are driven by the test.
 *
 * Streams are created on download() and stay silent until the test calls one
 * of the drive helpers. URLs present in autoContent complete by themselves on
 * the next event loop turn.
 */
class FakeTransport : public ArtifactTransport {
public:
    using ArtifactTransport::ArtifactTransport;

    TransferStream* download(const TransferRequest& request) override;
    void pause(const QString& destination) override;
    void cancel(const QString& destination) override;

    bool refuse = false;                    //!< download() returns nullptr.
    QHash<QString, QByteArray> autoContent; //!< URL -> body delivered automatically.
    QList<TransferRequest> requests;        //!< Every accepted request, in order.
    QStringList paused;
    QStringList cancelled;

    //!< @brief Live stream writing to a destination.
    TransferStream* streamFor(const QString& destination) const;
    bool hasStream(const QString& destination) const { return streamFor(destination) != nullptr; }
    int requestCount(const QString& destination) const;

    void started(const QString& destination, qint64 expectedBytes);
    void progress(const QString& destination, qint64 written, qint64 expected, double instantSpeed = 0.0);

    //!< @brief Writes partial content to the temp file and reports it.
    void writePartial(const QString& destination, const QByteArray& content, qint64 expected);

    //!< @brief Moves content into place and reports completion.
    void complete(const QString& destination, const QByteArray& content);

    void networkError(const QString& destination, const DownloadError& error);
    void fail(const QString& destination, const DownloadError& error);

    //!< @brief Leaves content in the temp file and reports it out of band.
    void completeInBackground(const QString& destination, const QByteArray& content);

private:
    QHash<QString, QPointer<TransferStream>> m_streams;
};

/**
 * @brief Request sender answering from a handler.
 *
 * Responses are delivered on the next event loop turn, or held until
 * release() when holdResponses is set.
 */
class FakeSender : public RequestSender {
public:
    using Handler = std::function<HubResponse(const HubRequest&)>;

    FakeSender();
    ~FakeSender() override;

    quint64 send(const HubRequest& request, Callback callback) override;
    void abort(quint64 ticket) override;

    //!< @brief Delivers every held response; returns how many were delivered.
    int release();

    Handler handler;
    bool holdResponses = false;
    QList<HubRequest> sent;
    QList<qint64> sentAtMs;
    QList<quint64> aborted;

    static HubResponse response(int status, const QByteArray& body = QByteArray(), const HeaderList& headers = {});

private:
    struct Held {
        quint64 ticket = 0;
        HubRequest request;
        Callback callback;
    };
    void deliver(const Held& held);

    std::unique_ptr<QObject> m_context;
    QList<Held> m_held;
    quint64 m_nextTicket = 1;
};

/**
 * @brief HTTP/1.1 server on the loopback interface.
 *
 * Every connection serves one request: the responder receives the raw request
 * head and returns the complete response, after which the connection closes.
 */
class LocalHttpServer : public QObject {
public:
    using Responder = std::function<QByteArray(const QByteArray& head)>;

    explicit LocalHttpServer(Responder responder);

    bool isListening() const { return m_server.isListening(); }
    QUrl url(const QString& path) const;

    //!< @brief Value of a request header in a recorded head, empty when absent.
    static QByteArray headerOf(const QByteArray& head, const QByteArray& name);

    //!< @brief Serialized response with Content-Length and Connection: close.
    static QByteArray response(int status, const QByteArray& body = QByteArray(), const QList<QByteArray>& headers = {});

    QList<QByteArray> heads;    //!< Every request head received, in order.

private:
    void accept();

    QTcpServer m_server;
    Responder m_responder;
};

//!< @brief Network access manager bypassing any system proxy.
std::unique_ptr<QNetworkAccessManager> directNetworkManager();

//!< @brief Installer keeping records in memory.
class FakeInstaller : public ArtifactInstaller {
public:
    void install(const InstalledArtifact& artifact) override;
    bool isInstalled(ArtifactKind kind, const QString& identity) const override;

    QVector<InstalledArtifact> installed;
};

//!< @brief Temporary storage roots; removal grace periods are long unless a test shortens them.
struct Sandbox {
    Sandbox();

    QString path(const QString& relative) const;

    QTemporaryDir dir;
    DownloadConfig config;
};

/**
 * @brief Everything an orchestrator needs, wired to fakes.
 *
 * The hub answers 404 to every request unless the test installs its own
 * sender handler.
 */
struct Harness {
    Harness();

    DownloadContext context(bool withHub = true);
    DownloadConfig& config() { return sandbox.config; }

    //!< @brief Number of model info listings sent to the hub.
    int listingCount() const;

    Sandbox sandbox;
    DownloadStore store;
    SpeedEstimator speed;
    FakeTransport transport;
    FakeInstaller installer;
    ConnectivityMonitor connectivity;
    FakeSender sender;
    RequestScheduler scheduler;
    HubClient hub;
};

} // namespace porter::tests
