#include <QByteArray>
#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QObject>
#include <QString>
#include <QUrl>
#include <gtest/gtest.h>
#include <optional>

import porter.core.artifact;
import porter.core.bundle_orchestrator;
import porter.core.download_item;
import porter.core.download_orchestrator;
import porter.services.hub_client;
import porter.services.request_scheduler;
import porter.tests.support;

using porter::tests::FakeSender;
using porter::tests::Harness;
using porter::tests::siblingsJson;
using porter::tests::waitFor;
using State = DownloadOrchestrator::State;

namespace {

QString sha256Of(const QByteArray& content)
{
    return QString::fromLatin1(QCryptographicHash::hash(content, QCryptographicHash::Sha256).toHex());
}

BundleSpec directBundle(const QString& sha256)
{
    BundleSpec spec;
    spec.slug = "lfm2-350m";
    spec.url = QUrl("https://cdn.test/bundles/lfm2-350m.bundle");
    spec.sizeBytes = 64;
    spec.sha256 = sha256;
    return spec;
}

} // namespace

TEST(BundleOrchestrator, HashesFiles)
{
    Harness h;
    const QString path = h.sandbox.path("blob");
    ASSERT_TRUE(porter::tests::writeFile(path, "abc"));
    EXPECT_EQ(BundleOrchestrator::sha256OfFile(path),
              QString("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    EXPECT_TRUE(BundleOrchestrator::sha256OfFile(h.sandbox.path("missing")).isEmpty());
}

TEST(BundleOrchestrator, VerifiesChecksumBeforeFinishing)
{
    Harness h;
    const QByteArray content(64, 'b');
    BundleOrchestrator bundle(directBundle(" " + sha256Of(content).toUpper() + " "), h.context());
    EXPECT_EQ(bundle.expectedChecksum(), sha256Of(content));

    bundle.start();
    const QString path = h.sandbox.path("bundles/lfm2-350m/lfm2-350m.bundle");
    ASSERT_TRUE(h.transport.hasStream(path));

    h.transport.complete(path, content);
    EXPECT_EQ(bundle.state(), State::Running);
    EXPECT_TRUE(bundle.item()->verifying);
    EXPECT_EQ(bundle.item()->statusString(), QString("Verifying"));

    ASSERT_TRUE(waitFor([&]() { return bundle.state() == State::Finished; }));
    EXPECT_FALSE(bundle.item()->verifying);
    ASSERT_EQ(h.installer.installed.size(), 1);
    EXPECT_EQ(h.installer.installed.first().sha256, sha256Of(content));
    EXPECT_EQ(h.installer.installed.first().format, QString("bundle"));
    EXPECT_EQ(h.installer.installed.first().path, path);
}

TEST(BundleOrchestrator, ChecksumMismatchDeletesFile)
{
    Harness h;
    BundleOrchestrator bundle(directBundle(sha256Of("something else")), h.context());
    QString failure;
    QObject::connect(&bundle, &DownloadOrchestrator::failed, [&failure](const QString&, const QString& message) { failure = message; });

    bundle.start();
    const QString path = h.sandbox.path("bundles/lfm2-350m/lfm2-350m.bundle");
    h.transport.complete(path, QByteArray(64, 'b'));

    ASSERT_TRUE(waitFor([&]() { return bundle.state() == State::PermanentlyFailed; }));
    EXPECT_EQ(failure, QString("Checksum mismatch"));
    EXPECT_FALSE(QFile::exists(path));
    EXPECT_TRUE(h.installer.installed.isEmpty());
}

TEST(BundleOrchestrator, SkipsVerificationWithoutChecksum)
{
    Harness h;
    BundleOrchestrator bundle(directBundle(QString()), h.context());
    bundle.start();
    h.transport.complete(h.sandbox.path("bundles/lfm2-350m/lfm2-350m.bundle"), QByteArray(64, 'b'));
    EXPECT_EQ(bundle.state(), State::Finished);
}

TEST(BundleOrchestrator, ResolvesSourceFromHubListing)
{
    Harness h;
    const QByteArray content(80, 'z');
    const QString sha = sha256Of(content);
    h.sender.handler = [sha](const HubRequest& request) {
        if (request.url.path() == "/api/models/LiquidAI/LeapBundles") {
            return FakeSender::response(200, siblingsJson({ { "README.md", 10, {} },
                                                            { "other.bundle", 50, {} },
                                                            { "packs/lfm2-350m.bundle", 80, sha } }));
        }
        return FakeSender::response(404);
    };

    BundleSpec spec;
    spec.slug = "lfm2-350m";
    BundleOrchestrator bundle(spec, h.context());
    bundle.start();

    const QString path = h.sandbox.path("bundles/lfm2-350m/lfm2-350m.bundle");
    ASSERT_TRUE(waitFor([&]() { return h.transport.hasStream(path); }));
    EXPECT_EQ(h.transport.requests.first().url,
              QUrl("https://hub.test/LiquidAI/LeapBundles/resolve/main/packs/lfm2-350m.bundle"));
    EXPECT_EQ(bundle.expectedChecksum(), sha);
    EXPECT_EQ(bundle.item()->expectedBytes(), 80);

    h.transport.complete(path, content);
    ASSERT_TRUE(waitFor([&]() { return bundle.state() == State::Finished; }));
}

TEST(BundleOrchestrator, MissingBundleFailsPermanently)
{
    Harness h;
    BundleSpec spec;
    spec.slug = "nope";
    BundleOrchestrator bundle(spec, h.context());
    QString failure;
    QObject::connect(&bundle, &DownloadOrchestrator::failed, [&failure](const QString&, const QString& message) { failure = message; });

    bundle.start();
    ASSERT_TRUE(waitFor([&]() { return bundle.state() == State::PermanentlyFailed; }));
    EXPECT_EQ(failure, QString("Bundle not found: nope"));
}

TEST(BundleOrchestrator, UnavailableListingIsRetried)
{
    Harness h;
    h.scheduler.setMaxAttempts(1);
    h.sender.handler = [](const HubRequest&) { return FakeSender::response(503); };

    BundleSpec spec;
    spec.slug = "lfm2-350m";
    BundleOrchestrator bundle(spec, h.context());
    bundle.start();

    ASSERT_TRUE(waitFor([&]() { return bundle.state() == State::BackoffRetry; }));
    const std::optional<DownloadItem> item = bundle.item();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->retryCount, 1);
    EXPECT_EQ(item->error->message(), QString("Bundle listing unavailable"));
    EXPECT_TRUE(h.transport.requests.isEmpty());
}

TEST(BundleOrchestrator, ExistingFileIsVerifiedWithoutTransfer)
{
    Harness h;
    const QByteArray content(64, 'b');
    const QString path = h.sandbox.path("bundles/lfm2-350m/lfm2-350m.bundle");
    ASSERT_TRUE(porter::tests::writeFile(path, content));

    BundleOrchestrator bundle(directBundle(sha256Of(content)), h.context());
    bundle.start();
    ASSERT_TRUE(waitFor([&]() { return bundle.state() == State::Finished; }));
    EXPECT_TRUE(h.transport.requests.isEmpty());
}
