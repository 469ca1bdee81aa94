#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QList>
#include <QString>
#include <QUrl>
#include <gtest/gtest.h>

import porter.core.artifact;
import porter.core.background_reconciler;
import porter.core.dataset_orchestrator;
import porter.core.download_item;
import porter.core.download_orchestrator;
import porter.core.model_manifest;
import porter.core.model_orchestrator;
import porter.services.hub_client;
import porter.services.request_scheduler;
import porter.tests.support;
import porter.utils.download_utils;

namespace utils = porter::utils;
using porter::tests::FakeSender;
using porter::tests::Harness;
using porter::tests::ggufBytes;
using porter::tests::siblingsJson;
using porter::tests::waitFor;
using State = DownloadOrchestrator::State;
using Source = DownloadOrchestrator::FinalizeSource;

namespace {

ModelSpec weightsOnly()
{
    ModelSpec spec;
    spec.modelId = "org/plain";
    spec.quantLabel = "Q8_0";
    spec.url = QUrl("https://cdn.test/plain-Q8_0.bin");
    spec.sizeBytes = 1000;
    spec.format = "bin";
    return spec;
}

ModelSpec withProjector()
{
    ModelSpec spec;
    spec.modelId = "org/vision";
    spec.quantLabel = "Q4_0";
    spec.url = QUrl("https://hub.test/org/vision/resolve/main/vision-Q4_0.gguf");
    spec.sizeBytes = 1000;
    return spec;
}

void serveProjector(Harness& h)
{
    h.sender.handler = [](const HubRequest& request) {
        if (request.url.path() == "/api/models/org/vision") {
            return FakeSender::response(200, siblingsJson({ { "vision-Q4_0.gguf", 1000, {} }, { "mmproj-f16.gguf", 200, {} } }));
        }
        return FakeSender::response(404);
    };
}

} // namespace

TEST(BackgroundReconciler, NotificationPromotesWeightsOnce)
{
    Harness h;
    ModelOrchestrator model(weightsOnly(), h.context());
    model.start();
    model.pause();
    ASSERT_TRUE(porter::tests::writeFile(utils::tempPathFor(model.weightsPath()), QByteArray(1000, 'w')));

    const QList<DownloadOrchestrator*> all{ &model };
    EXPECT_TRUE(BackgroundReconciler::handleCompletion(all, utils::tempPathFor(model.weightsPath()), QString()));
    EXPECT_EQ(model.state(), State::Finished);
    EXPECT_TRUE(QFile::exists(model.weightsPath()));
    EXPECT_EQ(ModelManifest::load(model.directory()).weights, QString("plain-Q8_0.bin"));
    EXPECT_EQ(h.installer.installed.size(), 1);

    EXPECT_FALSE(BackgroundReconciler::handleCompletion(all, model.weightsPath(), QString()));
    EXPECT_EQ(h.installer.installed.size(), 1);
}

TEST(BackgroundReconciler, MatchesWeightsByFileName)
{
    Harness h;
    ModelOrchestrator model(weightsOnly(), h.context());
    model.start();
    model.pause();
    ASSERT_TRUE(porter::tests::writeFile(model.weightsPath(), QByteArray(1000, 'w')));

    EXPECT_EQ(model.matchPath("/elsewhere/plain-Q8_0.bin.download"), DownloadOrchestrator::PathMatch::Primary);
    EXPECT_TRUE(BackgroundReconciler::handleCompletion({ &model }, "/elsewhere/plain-Q8_0.bin", QString()));
    EXPECT_EQ(model.state(), State::Finished);
}

TEST(BackgroundReconciler, FailedNotificationsAreIgnored)
{
    Harness h;
    ModelOrchestrator model(weightsOnly(), h.context());
    model.start();
    model.pause();
    ASSERT_TRUE(porter::tests::writeFile(utils::tempPathFor(model.weightsPath()), QByteArray(1000, 'w')));

    EXPECT_FALSE(BackgroundReconciler::handleCompletion({ &model }, model.weightsPath(), "The network connection was lost"));
    EXPECT_EQ(model.state(), State::Paused);
    EXPECT_FALSE(BackgroundReconciler::handleCompletion({ &model }, h.sandbox.path("unrelated.bin"), QString()));
}

TEST(BackgroundReconciler, LiveTransferIsNotPromoted)
{
    Harness h;
    ModelOrchestrator model(weightsOnly(), h.context());
    model.start();
    h.transport.writePartial(model.weightsPath(), QByteArray(400, 'w'), 1000);

    EXPECT_FALSE(BackgroundReconciler::handleCompletion({ &model }, model.weightsPath(), QString()));
    EXPECT_EQ(model.state(), State::Running);
    EXPECT_TRUE(QFile::exists(utils::tempPathFor(model.weightsPath())));
}

TEST(BackgroundReconciler, ProjectorCompletesAsAuxiliaryPart)
{
    Harness h;
    serveProjector(h);
    ModelOrchestrator model(withProjector(), h.context());
    const QString projector = QDir(model.directory()).filePath("mmproj-f16.gguf");
    model.start();
    ASSERT_TRUE(waitFor([&]() { return h.transport.hasStream(projector); }));
    model.pause();

    ASSERT_TRUE(porter::tests::writeFile(utils::tempPathFor(projector), ggufBytes(200)));
    EXPECT_TRUE(BackgroundReconciler::handleCompletion({ &model }, utils::tempPathFor(projector), QString()));
    EXPECT_EQ(model.state(), State::Paused);
    EXPECT_TRUE(model.item()->part(kProjectorPart)->completed);
    EXPECT_EQ(ModelManifest::load(model.directory()).mmproj, QString("mmproj-f16.gguf"));

    EXPECT_FALSE(BackgroundReconciler::handleCompletion({ &model }, projector, QString()));

    ASSERT_TRUE(porter::tests::writeFile(utils::tempPathFor(model.weightsPath()), QByteArray(1000, 'w')));
    EXPECT_TRUE(BackgroundReconciler::handleCompletion({ &model }, model.weightsPath(), QString()));
    ASSERT_EQ(model.state(), State::Finished);
    EXPECT_EQ(h.installer.installed.first().projectorPath, projector);
}

TEST(BackgroundReconciler, WeightsNotificationDropsMissingProjector)
{
    Harness h;
    serveProjector(h);
    ModelOrchestrator model(withProjector(), h.context());
    model.start();
    ASSERT_TRUE(waitFor([&]() { return h.transport.hasStream(model.weightsPath()); }));
    model.pause();

    ASSERT_TRUE(porter::tests::writeFile(utils::tempPathFor(model.weightsPath()), QByteArray(1000, 'w')));
    EXPECT_TRUE(BackgroundReconciler::handleCompletion({ &model }, model.weightsPath(), QString()));
    ASSERT_EQ(model.state(), State::Finished);
    EXPECT_TRUE(h.installer.installed.first().projectorPath.isEmpty());
    EXPECT_TRUE(ModelManifest::load(model.directory()).mmprojChecked);
    EXPECT_TRUE(ModelManifest::load(model.directory()).mmproj.isEmpty());
}

TEST(BackgroundReconciler, DatasetDirectoryMatchFinalizesDataset)
{
    Harness h;
    DatasetSpec spec;
    spec.datasetId = "lab/notes";
    DatasetFile file;
    file.name = "notes.txt";
    file.url = QUrl("https://files.test/notes.txt");
    file.sizeBytes = 10;
    spec.files = { file };

    DatasetOrchestrator dataset(spec, h.context());
    ModelOrchestrator model(weightsOnly(), h.context());
    dataset.start();
    dataset.pause();

    const QString path = QDir(dataset.directory()).filePath("notes.txt");
    ASSERT_TRUE(porter::tests::writeFile(utils::tempPathFor(path), QByteArray(10, 'n')));
    EXPECT_TRUE(BackgroundReconciler::handleCompletion({ &model, &dataset }, utils::tempPathFor(path), QString()));
    EXPECT_EQ(dataset.state(), State::Finished);
    EXPECT_EQ(model.state(), State::Idle);
}

TEST(BackgroundReconciler, SweepNeedsThresholdAndFileOnDisk)
{
    Harness h;
    ModelOrchestrator model(weightsOnly(), h.context());
    model.start();
    const QList<DownloadOrchestrator*> all{ &model };

    h.transport.progress(model.weightsPath(), 990, 1000);
    EXPECT_EQ(BackgroundReconciler::sweep(all), 0);

    h.transport.progress(model.weightsPath(), 996, 1000);
    EXPECT_EQ(BackgroundReconciler::sweep(all), 0);
    EXPECT_EQ(model.state(), State::Running);

    ASSERT_TRUE(porter::tests::writeFile(model.weightsPath(), QByteArray(1000, 'w')));
    EXPECT_EQ(BackgroundReconciler::sweep(all), 1);
    EXPECT_EQ(model.state(), State::Finished);
    EXPECT_DOUBLE_EQ(model.item()->progress, 1.0);

    EXPECT_EQ(BackgroundReconciler::sweep(all), 0);
}

TEST(BackgroundReconciler, FinalizeAfterFinishIsNoOp)
{
    Harness h;
    ModelOrchestrator model(weightsOnly(), h.context());
    model.start();
    h.transport.complete(model.weightsPath(), QByteArray(1000, 'w'));
    ASSERT_EQ(model.state(), State::Finished);

    EXPECT_FALSE(model.finalizeFromDisk(Source::Notification));
    EXPECT_FALSE(model.finalizeFromDisk(Source::Sweep));
    EXPECT_EQ(h.installer.installed.size(), 1);
}
