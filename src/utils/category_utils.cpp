module;
#include <QFileInfo>
#include <QString>
#include <QStringList>

module porter.utils.category_utils;

namespace porter::utils {

static QString extensionOf(const QString& filePath)
{
    const QString lower = QFileInfo(filePath).fileName().toLower();
    const int dot = lower.lastIndexOf('.');
    return dot >= 0 ? lower.mid(dot + 1) : QString();
}

QString detectCategory(const QString& filePath)
{
    const QString ext = extensionOf(filePath);

    const QStringList weights = { "gguf", "safetensors", "bin", "mlx", "onnx" };
    const QStringList documents = { "pdf", "epub", "txt", "md" };
    const QStringList data = { "json", "jsonl", "csv", "tsv" };

    if (isProjectorFile(filePath)) return "Projector";
    if (ext == "bundle") return "Bundle";
    if (weights.contains(ext)) return "Weights";
    if (documents.contains(ext)) return "Documents";
    if (data.contains(ext)) return "Data";
    return "Other";
}

QStringList categoryNames()
{
    return { "Weights", "Projector", "Bundle", "Documents", "Data", "Other" };
}

QStringList datasetExtensions()
{
    return { "pdf", "epub", "txt", "md", "json", "jsonl", "csv", "tsv" };
}

bool isDatasetFile(const QString& fileName)
{
    return datasetExtensions().contains(extensionOf(fileName));
}

bool isProjectorFile(const QString& fileName)
{
    const QString name = QFileInfo(fileName).fileName().toLower();
    return name.contains("mmproj") && name.endsWith(".gguf");
}

} // namespace porter::utils
