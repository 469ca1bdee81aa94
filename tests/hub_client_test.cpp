#include <QList>
#include <QNetworkReply>
#include <QUrl>
#include <QUrlQuery>
#include <gtest/gtest.h>
#include <optional>

import porter.services.hub_client;
import porter.services.request_scheduler;
import porter.tests.support;

using porter::tests::FakeSender;
using porter::tests::siblingsJson;
using porter::tests::waitFor;

TEST(HubClient, ParsesSiblings)
{
    const QByteArray json = R"({"siblings":[
        {"rfilename":"model-Q4.gguf","size":1000},
        {"rfilename":"mmproj-f16.gguf","lfs":{"size":"250","sha256":" ABC "}},
        {"size":5},
        "junk"
    ]})";
    const QList<HubFile> files = HubClient::parseSiblings(json);
    ASSERT_EQ(files.size(), 2);
    EXPECT_EQ(files.at(0).name, QString("model-Q4.gguf"));
    EXPECT_EQ(files.at(0).size, 1000);
    EXPECT_EQ(files.at(1).size, 250);
    EXPECT_EQ(files.at(1).sha256, QString("abc"));

    EXPECT_TRUE(HubClient::parseSiblings("not json").isEmpty());
}

TEST(HubClient, FindsProjectorAndBundle)
{
    const QList<HubFile> files = {
        { "README.md", 10, {} },
        { "other.bundle", 20, {} },
        { "lfm2-350m.bundle", 30, {} },
        { "gguf/MMPROJ-model-f16.gguf", 40, {} },
    };
    const std::optional<HubFile> projector = HubClient::findProjector(files);
    ASSERT_TRUE(projector.has_value());
    EXPECT_EQ(projector->name, QString("gguf/MMPROJ-model-f16.gguf"));

    EXPECT_EQ(HubClient::findBundle(files, "lfm2-350m")->name, QString("lfm2-350m.bundle"));
    EXPECT_EQ(HubClient::findBundle(files, "unknown")->name, QString("other.bundle"));
    EXPECT_FALSE(HubClient::findBundle({ { "a.gguf", 1, {} } }, "a").has_value());
    EXPECT_FALSE(HubClient::findProjector({ { "model.gguf", 1, {} } }).has_value());
}

TEST(HubClient, BuildsUrls)
{
    FakeSender sender;
    RequestScheduler scheduler(&sender);
    HubClient hub(&scheduler, QUrl("https://hub.test"));

    EXPECT_EQ(hub.fileUrl("org/repo", "mmproj.gguf"), QUrl("https://hub.test/org/repo/resolve/main/mmproj.gguf"));
    const QUrl info = hub.modelInfoUrl("org/repo");
    EXPECT_EQ(info.path(), QString("/api/models/org/repo"));
    EXPECT_EQ(QUrlQuery(info).queryItemValue("blobs"), QString("true"));
}

TEST(HubClient, ListFilesSendsTokenAndParses)
{
    FakeSender sender;
    sender.handler = [](const HubRequest& request) {
        if (request.url.path() == "/api/models/org/repo") {
            return FakeSender::response(200, siblingsJson({ { "mmproj.gguf", 7, {} } }));
        }
        return FakeSender::response(404);
    };
    RequestScheduler scheduler(&sender);
    HubClient hub(&scheduler, QUrl("https://hub.test"));
    hub.setToken("tok");

    bool done = false;
    bool answered = false;
    QList<HubFile> files;
    hub.listFiles("org/repo", nullptr, [&](const QList<HubFile>& f, bool a) {
        files = f;
        answered = a;
        done = true;
    });
    ASSERT_TRUE(waitFor([&done]() { return done; }));
    EXPECT_TRUE(answered);
    ASSERT_EQ(files.size(), 1);
    EXPECT_EQ(files.first().size, 7);

    ASSERT_EQ(sender.sent.size(), 1);
    bool hasAuth = false;
    for (const auto& h : sender.sent.first().headers) {
        if (h.first == "Authorization") hasAuth = h.second == "Bearer tok";
    }
    EXPECT_TRUE(hasAuth);
}

TEST(HubClient, ListingAnswerDistinguishesAbsenceFromOutage)
{
    FakeSender sender;
    sender.handler = [](const HubRequest& request) {
        if (request.url.path().contains("gone")) return FakeSender::response(404);
        if (request.url.path().contains("busy")) return FakeSender::response(503);
        HubResponse offline;
        offline.error = QNetworkReply::HostNotFoundError;
        return offline;
    };
    RequestScheduler scheduler(&sender);
    scheduler.setMaxAttempts(1);
    HubClient hub(&scheduler, QUrl("https://hub.test"));

    auto answeredFor = [&hub](const QString& repo) {
        bool done = false;
        bool answered = false;
        hub.listFiles(repo, nullptr, [&](const QList<HubFile>& files, bool a) {
            EXPECT_TRUE(files.isEmpty());
            answered = a;
            done = true;
        });
        EXPECT_TRUE(waitFor([&done]() { return done; }));
        return answered;
    };

    EXPECT_TRUE(answeredFor("org/gone"));
    EXPECT_FALSE(answeredFor("org/busy"));
    EXPECT_FALSE(answeredFor("org/unreachable"));
}

TEST(HubClient, RemoteSizeUsesHead)
{
    FakeSender sender;
    sender.handler = [](const HubRequest&) {
        return FakeSender::response(200, {}, { { "Content-Length", "4096" } });
    };
    RequestScheduler scheduler(&sender);
    HubClient hub(&scheduler, QUrl("https://hub.test"));

    qint64 size = -1;
    hub.remoteSize(QUrl("https://hub.test/org/repo/resolve/main/w.gguf"), nullptr, [&size](qint64 bytes) { size = bytes; });
    ASSERT_TRUE(waitFor([&size]() { return size >= 0; }));
    EXPECT_EQ(size, 4096);

    ASSERT_EQ(sender.sent.size(), 1);
    EXPECT_EQ(sender.sent.first().method, QByteArray("HEAD"));
    EXPECT_EQ(QUrlQuery(sender.sent.first().url).queryItemValue("download"), QString("1"));
}

TEST(HubClient, RemoteSizeFailureReportsZero)
{
    FakeSender sender;
    sender.handler = [](const HubRequest&) { return FakeSender::response(404); };
    RequestScheduler scheduler(&sender);
    HubClient hub(&scheduler, QUrl("https://hub.test"));

    int failures = 0;
    QObject::connect(&hub, &HubClient::requestFailed, [&failures]() { ++failures; });

    qint64 size = -1;
    hub.remoteSize(QUrl("https://hub.test/x.gguf"), nullptr, [&size](qint64 bytes) { size = bytes; });
    ASSERT_TRUE(waitFor([&size]() { return size >= 0; }));
    EXPECT_EQ(size, 0);
    EXPECT_EQ(failures, 1);
}
