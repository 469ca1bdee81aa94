module;
#include <QList>
#include <QString>

module porter.core.artifact;

QString artifactKindName(ArtifactKind kind)
{
    switch (kind) {
    case ArtifactKind::Model: return "model";
    case ArtifactKind::Bundle: return "bundle";
    case ArtifactKind::Dataset: return "dataset";
    case ArtifactKind::Embedding: return "embedding";
    }
    return "model";
}

ArtifactKind artifactKindFromName(const QString& name, bool* ok)
{
    if (ok) *ok = true;
    const QString lower = name.trimmed().toLower();
    if (lower == "bundle") return ArtifactKind::Bundle;
    if (lower == "dataset") return ArtifactKind::Dataset;
    if (lower == "embedding") return ArtifactKind::Embedding;
    if (lower != "model" && ok) *ok = false;
    return ArtifactKind::Model;
}

QList<ArtifactKind> allArtifactKinds()
{
    return { ArtifactKind::Model, ArtifactKind::Bundle, ArtifactKind::Dataset, ArtifactKind::Embedding };
}

QString ModelSpec::identity() const
{
    return QString("%1-%2").arg(modelId, quantLabel);
}

bool ModelSpec::supportsProjector() const
{
    return format.compare("gguf", Qt::CaseInsensitive) == 0;
}
