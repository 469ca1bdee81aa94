module;
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>

module porter.core.model_manifest;

QString ModelManifest::fileName()
{
    return QStringLiteral("artifacts.json");
}

QString ModelManifest::pathIn(const QString& directory)
{
    return QDir(directory).filePath(fileName());
}

ModelManifest ModelManifest::load(const QString& directory)
{
    QFile file(pathIn(directory));
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) return ModelManifest{};
    return fromJson(file.readAll());
}

ModelManifest ModelManifest::fromJson(const QByteArray& json)
{
    ModelManifest out;
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        if (!json.isEmpty()) qWarning() << "[Manifest] ignoring unreadable manifest:" << err.errorString();
        return out;
    }

    const QJsonObject obj = doc.object();
    const QJsonValue weights = obj.value("weights");
    if (weights.isString()) out.weights = weights.toString();

    const QJsonValue mmproj = obj.value("mmproj");
    if (mmproj.isString()) out.mmproj = mmproj.toString();

    const QJsonValue checked = obj.value("mmprojChecked");
    if (checked.isBool()) out.mmprojChecked = checked.toBool();
    return out;
}

QByteArray ModelManifest::toJson() const
{
    QJsonObject obj;
    if (!weights.isEmpty()) obj.insert("weights", weights);
    obj.insert("mmproj", mmproj.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(mmproj));
    obj.insert("mmprojChecked", mmprojChecked);
    return QJsonDocument(obj).toJson(QJsonDocument::Indented);
}

bool ModelManifest::save(const QString& directory) const
{
    QSaveFile file(pathIn(directory));
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[Manifest] cannot write" << file.fileName() << file.errorString();
        return false;
    }
    file.write(toJson());
    return file.commit();
}
