#include <QDir>
#include <QString>
#include <QTemporaryDir>
#include <gtest/gtest.h>

import porter.core.byte_reconciler;
import porter.tests.support;
import porter.utils.download_utils;

namespace utils = porter::utils;
using porter::tests::writeFile;

TEST(ByteReconciler, CounterWithoutFile)
{
    QTemporaryDir dir;
    PartProbe probe;
    probe.finalPath = QDir(dir.path()).filePath("w.gguf");
    probe.counterBytes = 100;
    probe.expectedBytes = 1000;

    const ByteCounts counts = ByteReconciler::reconcile(probe);
    EXPECT_EQ(counts.written, 100);
    EXPECT_EQ(counts.expected, 1000);
    EXPECT_DOUBLE_EQ(counts.fraction(), 0.1);
}

TEST(ByteReconciler, DiskWinsOverStaleCounter)
{
    QTemporaryDir dir;
    const QString finalPath = QDir(dir.path()).filePath("w.gguf");
    ASSERT_TRUE(writeFile(utils::tempPathFor(finalPath), QByteArray(300, 'a')));

    PartProbe probe;
    probe.finalPath = finalPath;
    probe.counterBytes = 100;
    probe.expectedBytes = 1000;
    EXPECT_EQ(ByteReconciler::reconcile(probe).written, 300);
    EXPECT_EQ(ByteReconciler::probeOnDisk(finalPath), 300);
}

TEST(ByteReconciler, ProbePrefersTempFile)
{
    QTemporaryDir dir;
    const QString finalPath = QDir(dir.path()).filePath("w.gguf");
    EXPECT_EQ(ByteReconciler::probeOnDisk(finalPath), -1);

    ASSERT_TRUE(writeFile(finalPath, QByteArray(10, 'a')));
    EXPECT_EQ(ByteReconciler::probeOnDisk(finalPath), 10);

    ASSERT_TRUE(writeFile(utils::tempPathFor(finalPath), QByteArray(4, 'a')));
    EXPECT_EQ(ByteReconciler::probeOnDisk(finalPath), 4);
}

TEST(ByteReconciler, ExpectedNeverBelowWritten)
{
    PartProbe probe;
    probe.counterBytes = 1500;
    probe.expectedBytes = 1000;

    const ByteCounts counts = ByteReconciler::reconcile(probe);
    EXPECT_EQ(counts.written, 1500);
    EXPECT_EQ(counts.expected, 1500);
    EXPECT_DOUBLE_EQ(counts.fraction(), 1.0);
}

TEST(ByteReconciler, CatalogSizeFillsUnknownSession)
{
    PartProbe probe;
    probe.counterBytes = 50;
    probe.catalogBytes = 200;
    EXPECT_EQ(ByteReconciler::reconcile(probe).expected, 200);

    PartProbe unknown;
    unknown.counterBytes = 50;
    const ByteCounts counts = ByteReconciler::reconcile(unknown);
    EXPECT_EQ(counts.expected, 50);
}

TEST(ByteReconciler, ScansDirectoryWhenNameUnknown)
{
    QTemporaryDir dir;
    ASSERT_TRUE(writeFile(QDir(dir.path()).filePath("model-Q4_K_M.gguf"), QByteArray(250, 'a')));

    PartProbe probe;
    probe.expectedBytes = 1000;
    probe.searchDir = dir.path();
    probe.nameHints = { "Q4_K_M" };
    EXPECT_EQ(ByteReconciler::reconcile(probe).written, 250);

    // A live counter means the file is known to the transport; no scan.
    probe.counterBytes = 10;
    EXPECT_EQ(ByteReconciler::reconcile(probe).written, 10);

    EXPECT_TRUE(ByteReconciler::locate(probe).endsWith("model-Q4_K_M.gguf"));
    probe.searchDir.clear();
    EXPECT_TRUE(ByteReconciler::locate(probe).isEmpty());
}

TEST(ByteReconciler, NegativeInputsClampToZero)
{
    PartProbe probe;
    probe.counterBytes = -5;
    const ByteCounts counts = ByteReconciler::reconcile(probe);
    EXPECT_EQ(counts.written, 0);
    EXPECT_EQ(counts.expected, 0);
    EXPECT_DOUBLE_EQ(counts.fraction(), 0.0);
    EXPECT_EQ(ByteReconciler::probeOnDisk(QString()), -1);
}
