#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QList>
#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>
#include <QUrl>
#include <gtest/gtest.h>
#include <memory>

import porter.core.artifact;
import porter.core.download_error;
import porter.core.transfer;
import porter.services.http_transport;
import porter.tests.support;
import porter.utils.download_utils;

namespace utils = porter::utils;
using porter::tests::LocalHttpServer;
using porter::tests::waitFor;
using porter::tests::writeFile;
using Type = TransferEvent::Type;

namespace {

const QByteArray kBody = QByteArrayLiteral("hello world");

QByteArray readAll(const QString& path)
{
    QFile file(path);
    return file.open(QIODevice::ReadOnly) ? file.readAll() : QByteArray();
}

struct Recorder {
    QList<TransferEvent> events;

    void attach(TransferStream* stream)
    {
        QObject::connect(stream, &TransferStream::transferEvent, [this](const TransferEvent& event) { events.append(event); });
    }

    bool done() const { return !events.isEmpty() && events.last().isTerminal(); }
    const TransferEvent& last() const { return events.last(); }

    qint64 startedWith() const
    {
        for (const TransferEvent& e : events) {
            if (e.type == Type::Started) return e.expectedBytes;
        }
        return 0;
    }
};

class HttpTransportTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        manager = porter::tests::directNetworkManager();
        transport = std::make_unique<HttpTransport>(manager.get());
        transport->setProgressIntervalMs(0);
        destination = QDir(dir.path()).filePath("models/w.gguf");
    }

    TransferRequest requestFor(const QUrl& url) const
    {
        TransferRequest request;
        request.identity = "org/w";
        request.kind = ArtifactKind::Model;
        request.part = "weights";
        request.url = url;
        request.destination = destination;
        return request;
    }

    TransferStream* start(const LocalHttpServer& server, Recorder& recorder)
    {
        TransferStream* stream = transport->download(requestFor(server.url("/w.gguf")));
        if (stream) recorder.attach(stream);
        return stream;
    }

    QTemporaryDir dir;
    QString destination;
    std::unique_ptr<QNetworkAccessManager> manager;
    std::unique_ptr<HttpTransport> transport;
};

} // namespace

TEST_F(HttpTransportTest, DownloadsIntoPlace)
{
    LocalHttpServer server([](const QByteArray&) { return LocalHttpServer::response(200, kBody); });
    ASSERT_TRUE(server.isListening());

    Recorder recorder;
    ASSERT_NE(start(server, recorder), nullptr);
    ASSERT_TRUE(waitFor([&recorder]() { return recorder.done(); }));

    ASSERT_EQ(recorder.last().type, Type::Finished);
    EXPECT_EQ(recorder.startedWith(), kBody.size());
    ASSERT_TRUE(recorder.last().artifact.has_value());
    EXPECT_EQ(recorder.last().artifact->sizeBytes, kBody.size());
    EXPECT_EQ(recorder.last().artifact->identity, QString("org/w"));
    EXPECT_EQ(readAll(destination), kBody);
    EXPECT_FALSE(QFile::exists(utils::tempPathFor(destination)));
    EXPECT_TRUE(LocalHttpServer::headerOf(server.heads.first(), "Range").isEmpty());
    EXPECT_EQ(transport->activeCount(), 0);
}

TEST_F(HttpTransportTest, ResumesFromPartialTempFile)
{
    ASSERT_TRUE(writeFile(utils::tempPathFor(destination), kBody.left(6)));
    LocalHttpServer server([](const QByteArray& head) {
        if (LocalHttpServer::headerOf(head, "Range") != "bytes=6-") return LocalHttpServer::response(200, kBody);
        return LocalHttpServer::response(206, kBody.mid(6), { "Content-Range: bytes 6-10/11" });
    });

    Recorder recorder;
    start(server, recorder);
    ASSERT_TRUE(waitFor([&recorder]() { return recorder.done(); }));

    ASSERT_EQ(recorder.last().type, Type::Finished);
    EXPECT_EQ(LocalHttpServer::headerOf(server.heads.first(), "Range"), QByteArray("bytes=6-"));
    EXPECT_EQ(recorder.startedWith(), kBody.size());
    EXPECT_EQ(readAll(destination), kBody);
}

TEST_F(HttpTransportTest, RestartsWhenRangeIsIgnored)
{
    ASSERT_TRUE(writeFile(utils::tempPathFor(destination), "stale!"));
    LocalHttpServer server([](const QByteArray&) { return LocalHttpServer::response(200, kBody); });

    Recorder recorder;
    start(server, recorder);
    ASSERT_TRUE(waitFor([&recorder]() { return recorder.done(); }));

    ASSERT_EQ(recorder.last().type, Type::Finished);
    EXPECT_FALSE(LocalHttpServer::headerOf(server.heads.first(), "Range").isEmpty());
    EXPECT_EQ(readAll(destination), kBody);
}

TEST_F(HttpTransportTest, UnsatisfiableRangeMeansTempFileIsComplete)
{
    ASSERT_TRUE(writeFile(utils::tempPathFor(destination), kBody));
    LocalHttpServer server([](const QByteArray&) { return LocalHttpServer::response(416); });

    Recorder recorder;
    start(server, recorder);
    ASSERT_TRUE(waitFor([&recorder]() { return recorder.done(); }));

    ASSERT_EQ(recorder.last().type, Type::Finished);
    EXPECT_EQ(recorder.last().artifact->sizeBytes, kBody.size());
    EXPECT_EQ(readAll(destination), kBody);
    EXPECT_FALSE(QFile::exists(utils::tempPathFor(destination)));
}

TEST_F(HttpTransportTest, ServerErrorIsRetryable)
{
    LocalHttpServer server([](const QByteArray&) { return LocalHttpServer::response(503, "busy"); });

    Recorder recorder;
    start(server, recorder);
    ASSERT_TRUE(waitFor([&recorder]() { return recorder.done(); }));

    ASSERT_EQ(recorder.last().type, Type::NetworkError);
    ASSERT_TRUE(recorder.last().error.has_value());
    EXPECT_TRUE(recorder.last().error->isRetryable());
    EXPECT_EQ(recorder.last().error->message(), QString("Server error (503)"));
    EXPECT_FALSE(QFile::exists(destination));
    EXPECT_NE(readAll(utils::tempPathFor(destination)), QByteArray("busy"));
}

TEST_F(HttpTransportTest, ClientErrorFailsPermanently)
{
    LocalHttpServer server([](const QByteArray&) { return LocalHttpServer::response(404, "missing"); });

    Recorder recorder;
    start(server, recorder);
    ASSERT_TRUE(waitFor([&recorder]() { return recorder.done(); }));

    ASSERT_EQ(recorder.last().type, Type::Failed);
    EXPECT_FALSE(recorder.last().error->isRetryable());
    EXPECT_EQ(recorder.last().error->message(), QString("HTTP error (404)"));
}

TEST_F(HttpTransportTest, UnobservedCompletionIsAnnounced)
{
    LocalHttpServer server([](const QByteArray&) { return LocalHttpServer::response(200, kBody); });
    QStringList announced;
    QObject::connect(transport.get(), &ArtifactTransport::backgroundTransferCompleted,
                     [&announced](const QString& path, const QString& error) {
                         if (error.isEmpty()) announced.append(path);
                     });

    ASSERT_NE(transport->download(requestFor(server.url("/w.gguf"))), nullptr);
    ASSERT_TRUE(waitFor([&announced]() { return !announced.isEmpty(); }));
    EXPECT_EQ(announced, QStringList{ destination });
    EXPECT_EQ(readAll(destination), kBody);
}

TEST_F(HttpTransportTest, ObservedCompletionIsNotAnnounced)
{
    LocalHttpServer server([](const QByteArray&) { return LocalHttpServer::response(200, kBody); });
    int announced = 0;
    QObject::connect(transport.get(), &ArtifactTransport::backgroundTransferCompleted, [&announced]() { ++announced; });

    Recorder recorder;
    start(server, recorder);
    ASSERT_TRUE(waitFor([&recorder]() { return recorder.done(); }));
    EXPECT_EQ(announced, 0);
}

TEST_F(HttpTransportTest, PauseBeforeStartKeepsTempFile)
{
    ASSERT_TRUE(writeFile(utils::tempPathFor(destination), kBody.left(4)));
    LocalHttpServer server([](const QByteArray&) { return LocalHttpServer::response(200, kBody); });

    Recorder recorder;
    start(server, recorder);
    transport->pause(destination);
    ASSERT_TRUE(recorder.done());
    EXPECT_EQ(recorder.last().type, Type::Paused);
    EXPECT_EQ(transport->activeCount(), 0);
    EXPECT_EQ(readAll(utils::tempPathFor(destination)), kBody.left(4));

    // Destroyed before the released transfer's deferred deletion ran.
    transport.reset();
    EXPECT_TRUE(server.heads.isEmpty());
}

TEST_F(HttpTransportTest, CancelDiscardsTempFile)
{
    ASSERT_TRUE(writeFile(utils::tempPathFor(destination), kBody.left(4)));
    LocalHttpServer server([](const QByteArray&) { return LocalHttpServer::response(200, kBody); });

    Recorder recorder;
    start(server, recorder);
    transport->cancel(destination);
    ASSERT_TRUE(recorder.done());
    EXPECT_EQ(recorder.last().type, Type::Cancelled);
    EXPECT_FALSE(QFile::exists(utils::tempPathFor(destination)));
}
