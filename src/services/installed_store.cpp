module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

module porter.services.installed_store;

import porter.utils.download_utils;

namespace utils = porter::utils;

InstalledStore::InstalledStore(const QString& path, QObject* parent)
    : QObject(parent)
    , m_path(utils::normalizeFilePath(path))
{
    load();
}

int InstalledStore::indexOf(ArtifactKind kind, const QString& identity) const
{
    for (int i = 0; i < m_artifacts.size(); ++i) {
        if (m_artifacts[i].kind == kind && m_artifacts[i].identity == identity) return i;
    }
    return -1;
}

void InstalledStore::install(const InstalledArtifact& artifact)
{
    InstalledArtifact record = artifact;
    if (!record.installedAt.isValid()) record.installedAt = QDateTime::currentDateTimeUtc();

    const int existing = indexOf(record.kind, record.identity);
    if (existing >= 0) m_artifacts[existing] = record;
    else m_artifacts.append(record);

    qInfo() << "[Installed]" << artifactKindName(record.kind) << record.identity
            << utils::humanReadableBytes(record.sizeBytes);
    if (!save()) qWarning() << "[Installed] failed to persist" << m_path;
    emit installed(record.identity);
}

bool InstalledStore::isInstalled(ArtifactKind kind, const QString& identity) const
{
    return indexOf(kind, identity) >= 0;
}

bool InstalledStore::uninstall(ArtifactKind kind, const QString& identity)
{
    const int existing = indexOf(kind, identity);
    if (existing < 0) return false;
    m_artifacts.removeAt(existing);
    if (!save()) qWarning() << "[Installed] failed to persist" << m_path;
    return true;
}

void InstalledStore::load()
{
    m_artifacts.clear();
    if (m_path.isEmpty()) return;
    QFile file(m_path);
    if (!file.exists()) return;
    if (!file.open(QIODevice::ReadOnly)) return;

    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) return;

    const QJsonArray items = doc.object().value("artifacts").toArray();
    for (const QJsonValue& v : items) {
        if (!v.isObject()) continue;
        const QJsonObject obj = v.toObject();
        bool ok = false;
        InstalledArtifact a;
        a.kind = artifactKindFromName(obj.value("kind").toString(), &ok);
        a.identity = obj.value("identity").toString();
        if (!ok || a.identity.isEmpty()) continue;
        a.path = obj.value("path").toString();
        a.sizeBytes = static_cast<qint64>(obj.value("size").toDouble(0));
        a.modelId = obj.value("modelId").toString();
        a.quantLabel = obj.value("quant").toString();
        a.format = obj.value("format").toString();
        a.sha256 = obj.value("sha256").toString();
        a.projectorPath = obj.value("projector").toString();
        a.installedAt = QDateTime::fromString(obj.value("installedAt").toString(), Qt::ISODate);
        m_artifacts.append(a);
    }
}

bool InstalledStore::save() const
{
    if (m_path.isEmpty()) return true;

    QJsonArray items;
    for (const InstalledArtifact& a : m_artifacts) {
        QJsonObject obj;
        obj.insert("kind", artifactKindName(a.kind));
        obj.insert("identity", a.identity);
        obj.insert("path", a.path);
        obj.insert("size", static_cast<double>(a.sizeBytes));
        if (!a.modelId.isEmpty()) obj.insert("modelId", a.modelId);
        if (!a.quantLabel.isEmpty()) obj.insert("quant", a.quantLabel);
        if (!a.format.isEmpty()) obj.insert("format", a.format);
        if (!a.sha256.isEmpty()) obj.insert("sha256", a.sha256);
        if (!a.projectorPath.isEmpty()) obj.insert("projector", a.projectorPath);
        obj.insert("installedAt", a.installedAt.toString(Qt::ISODate));
        items.append(obj);
    }
    QJsonObject root;
    root.insert("artifacts", items);

    QDir().mkpath(QFileInfo(m_path).absolutePath());
    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) return false;
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return file.commit();
}
