#include <QDir>
#include <QFile>
#include <QString>
#include <QTemporaryDir>
#include <QUrl>
#include <QUrlQuery>
#include <gtest/gtest.h>

import porter.tests.support;
import porter.utils.category_utils;
import porter.utils.download_utils;

namespace utils = porter::utils;
using porter::tests::writeFile;

TEST(DownloadUtils, TempAndFinalPaths)
{
    EXPECT_EQ(utils::tempPathFor("/m/a.gguf"), QString("/m/a.gguf.download"));
    EXPECT_EQ(utils::finalPathFor("/m/a.gguf.download"), QString("/m/a.gguf"));
    EXPECT_EQ(utils::finalPathFor("/m/a.gguf"), QString("/m/a.gguf"));
    EXPECT_EQ(utils::tempPathFor(QString()), QString());
    EXPECT_EQ(utils::normalizeFilePath("file:///m/a.gguf"), QString("/m/a.gguf"));
}

TEST(DownloadUtils, FileNameFromUrl)
{
    EXPECT_EQ(utils::fileNameFromUrl(QUrl("https://huggingface.co/org/repo/resolve/main/model-Q4_K_M.gguf")),
              QString("model-Q4_K_M.gguf"));
    EXPECT_EQ(utils::fileNameFromUrl(QUrl("https://cdn.test/blob?filename=weights.gguf")), QString("weights.gguf"));
    EXPECT_EQ(utils::fileNameFromUrl(QUrl("https://cdn.test/blob?rscd=attachment%3B+filename%3Dq4.gguf")),
              QString("q4.gguf"));
    EXPECT_TRUE(utils::fileNameFromUrl(QUrl()).isEmpty());
}

TEST(DownloadUtils, HuggingFaceRepoId)
{
    EXPECT_EQ(utils::huggingFaceRepoId(QUrl("https://huggingface.co/org/repo/resolve/main/x.gguf")), QString("org/repo"));
    EXPECT_EQ(utils::huggingFaceRepoId(QUrl("https://huggingface.co/api/models/org/repo")), QString("org/repo"));
    EXPECT_EQ(utils::huggingFaceRepoId(QUrl("https://hf.co/org/repo/blob/main/x.gguf")), QString("org/repo"));
    EXPECT_TRUE(utils::huggingFaceRepoId(QUrl("https://example.com/org/repo/x.gguf")).isEmpty());
    EXPECT_TRUE(utils::huggingFaceRepoId(QUrl("https://huggingface.co/org")).isEmpty());
}

TEST(DownloadUtils, DownloadQueryIsAddedOnce)
{
    const QUrl once = utils::withDownloadQuery(QUrl("https://hub.test/a/resolve/main/x.gguf?rev=1"));
    const QUrlQuery query(once);
    EXPECT_EQ(query.queryItemValue("download"), QString("1"));
    EXPECT_EQ(query.queryItemValue("rev"), QString("1"));

    const QUrl twice = utils::withDownloadQuery(once);
    EXPECT_EQ(QUrlQuery(twice).allQueryItemValues("download").size(), 1);
}

TEST(DownloadUtils, FileSizeOnDisk)
{
    QTemporaryDir dir;
    const QString finalPath = QDir(dir.path()).filePath("w.gguf");
    EXPECT_EQ(utils::fileSizeOnDisk(finalPath), -1);
    EXPECT_EQ(utils::fileSizeOnDisk(dir.path()), -1);

    ASSERT_TRUE(writeFile(finalPath, QByteArray(10, 'a')));
    EXPECT_EQ(utils::fileSizeOnDisk(finalPath), 10);
}

TEST(DownloadUtils, RemoveArtifactFilesDeletesBoth)
{
    QTemporaryDir dir;
    const QString finalPath = QDir(dir.path()).filePath("w.gguf");
    ASSERT_TRUE(writeFile(finalPath, "a"));
    ASSERT_TRUE(writeFile(utils::tempPathFor(finalPath), "b"));

    EXPECT_TRUE(utils::removeArtifactFiles(finalPath));
    EXPECT_FALSE(QFile::exists(finalPath));
    EXPECT_FALSE(QFile::exists(utils::tempPathFor(finalPath)));
    EXPECT_TRUE(utils::removeArtifactFiles(finalPath));
}

TEST(DownloadUtils, FindFileContainingSkipsTempFiles)
{
    QTemporaryDir dir;
    ASSERT_TRUE(writeFile(QDir(dir.path()).filePath("model-Q4.gguf.download"), "a"));
    EXPECT_TRUE(utils::findFileContaining(dir.path(), { "Q4" }).isEmpty());

    ASSERT_TRUE(writeFile(QDir(dir.path()).filePath("model-Q4.gguf"), "a"));
    EXPECT_TRUE(utils::findFileContaining(dir.path(), { "q4" }).endsWith("model-Q4.gguf"));
}

TEST(DownloadUtils, GgufMagic)
{
    QTemporaryDir dir;
    const QString good = QDir(dir.path()).filePath("good.gguf");
    const QString bad = QDir(dir.path()).filePath("bad.gguf");
    ASSERT_TRUE(writeFile(good, porter::tests::ggufBytes(32)));
    ASSERT_TRUE(writeFile(bad, "<html>not found</html>"));

    EXPECT_TRUE(utils::hasGgufMagic(good));
    EXPECT_FALSE(utils::hasGgufMagic(bad));
    EXPECT_FALSE(utils::hasGgufMagic(QDir(dir.path()).filePath("missing.gguf")));
}

TEST(DownloadUtils, ChecksumAndSizeFormatting)
{
    EXPECT_EQ(utils::normalizeChecksum(" AB cd "), QString("abcd"));
    EXPECT_EQ(utils::humanReadableBytes(-1), QString("unknown"));
    EXPECT_FALSE(utils::humanReadableBytes(1500000).isEmpty());
}

TEST(CategoryUtils, DetectsCategories)
{
    EXPECT_EQ(utils::detectCategory("/m/model-mmproj-f16.gguf"), QString("Projector"));
    EXPECT_EQ(utils::detectCategory("/m/model-Q4.gguf"), QString("Weights"));
    EXPECT_EQ(utils::detectCategory("/b/lfm.bundle"), QString("Bundle"));
    EXPECT_EQ(utils::detectCategory("/d/book.PDF"), QString("Documents"));
    EXPECT_EQ(utils::detectCategory("/d/rows.jsonl"), QString("Data"));
    EXPECT_EQ(utils::detectCategory("/d/archive.zip"), QString("Other"));
    EXPECT_TRUE(utils::categoryNames().contains("Projector"));
}

TEST(CategoryUtils, DatasetAndProjectorFiles)
{
    EXPECT_TRUE(utils::isDatasetFile("notes.md"));
    EXPECT_TRUE(utils::isDatasetFile("table.CSV"));
    EXPECT_FALSE(utils::isDatasetFile("setup.exe"));
    EXPECT_FALSE(utils::isDatasetFile("README"));

    EXPECT_TRUE(utils::isProjectorFile("sub/MMPROJ-model.gguf"));
    EXPECT_FALSE(utils::isProjectorFile("mmproj.bin"));
    EXPECT_FALSE(utils::isProjectorFile("model.gguf"));
}
