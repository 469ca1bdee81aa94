#include <QByteArray>
#include <QDir>
#include <QString>
#include <QUrl>
#include <gtest/gtest.h>

import porter.core.artifact;
import porter.core.download_orchestrator;
import porter.core.download_item;
import porter.core.embedding_orchestrator;
import porter.services.request_scheduler;
import porter.tests.support;

using porter::tests::FakeSender;
using porter::tests::Harness;
using porter::tests::waitFor;
using State = DownloadOrchestrator::State;

namespace {

EmbeddingSpec nomic()
{
    EmbeddingSpec spec;
    spec.repoId = "nomic-ai/nomic-embed-text-v1.5-GGUF";
    spec.url = QUrl("https://hub.test/nomic-ai/nomic-embed-text-v1.5-GGUF/resolve/main/nomic-embed-text-v1.5.Q4_K_M.gguf");
    return spec;
}

} // namespace

TEST(EmbeddingOrchestrator, DestinationFollowsRepository)
{
    Harness h;
    EmbeddingOrchestrator embedding(nomic(), h.context());
    EXPECT_EQ(embedding.destination(),
              h.sandbox.path("embeddings/nomic-ai/nomic-embed-text-v1.5-GGUF/nomic-embed-text-v1.5.Q4_K_M.gguf"));

    EmbeddingSpec named = nomic();
    named.fileName = "model.gguf";
    EmbeddingOrchestrator renamed(named, h.context());
    EXPECT_TRUE(renamed.destination().endsWith("/model.gguf"));
}

TEST(EmbeddingOrchestrator, ProbesSizeThenDownloads)
{
    Harness h;
    h.sender.handler = [](const HubRequest& request) {
        if (request.method == "HEAD") return FakeSender::response(200, {}, { { "Content-Length", "500" } });
        return FakeSender::response(404);
    };
    EmbeddingOrchestrator embedding(nomic(), h.context());

    embedding.start();
    ASSERT_TRUE(waitFor([&]() { return h.transport.hasStream(embedding.destination()); }));
    EXPECT_EQ(h.transport.requests.first().expectedBytes, 500);

    h.transport.progress(embedding.destination(), 250, 500);
    EXPECT_DOUBLE_EQ(embedding.item()->progress, 0.5);

    h.transport.complete(embedding.destination(), QByteArray(500, 'e'));
    ASSERT_EQ(embedding.state(), State::Finished);
    ASSERT_EQ(h.installer.installed.size(), 1);
    const InstalledArtifact& record = h.installer.installed.first();
    EXPECT_EQ(record.kind, ArtifactKind::Embedding);
    EXPECT_EQ(record.modelId, QString("nomic-ai/nomic-embed-text-v1.5-GGUF"));
    EXPECT_EQ(record.format, QString("gguf"));
    EXPECT_EQ(record.sizeBytes, 500);
}

TEST(EmbeddingOrchestrator, InstalledFileFinishesWithoutTransfer)
{
    Harness h;
    EmbeddingOrchestrator embedding(nomic(), h.context());
    ASSERT_TRUE(porter::tests::writeFile(embedding.destination(), QByteArray(42, 'e')));

    embedding.start();
    EXPECT_EQ(embedding.state(), State::Finished);
    EXPECT_TRUE(h.transport.requests.isEmpty());
    EXPECT_TRUE(h.sender.sent.isEmpty());
    ASSERT_EQ(h.installer.installed.size(), 1);
    EXPECT_EQ(h.installer.installed.first().sizeBytes, 42);
}

TEST(EmbeddingOrchestrator, StartsImmediatelyWithoutHub)
{
    Harness h;
    EmbeddingOrchestrator embedding(nomic(), h.context(false));
    embedding.start();
    EXPECT_TRUE(h.transport.hasStream(embedding.destination()));
}
