module;
#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLocale>
#include <QRegularExpression>
#include <QSaveFile>
#include <QUrlQuery>
#include <QtGlobal>

module porter.utils.download_utils;

namespace porter::utils {

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

QString tempPathFor(const QString& finalPath)
{
    const QString localPath = normalizeFilePath(finalPath);
    if (localPath.isEmpty()) return QString();
    return localPath + QLatin1String(kTempSuffix);
}

QString finalPathFor(const QString& path)
{
    const QString localPath = normalizeFilePath(path);
    const QLatin1String suffix(kTempSuffix);
    if (localPath.endsWith(suffix)) return localPath.chopped(suffix.size());
    return localPath;
}

qint64 fileSizeOnDisk(const QString& path)
{
    QFileInfo info(normalizeFilePath(path));
    if (!info.exists() || !info.isFile()) return -1;
    return info.size();
}

bool fileExistsPath(const QString& path)
{
    const QString normalized = normalizeFilePath(path);
    if (normalized.isEmpty()) return false;
    QFileInfo info(normalized);
    return info.exists() && info.isFile();
}

bool removeArtifactFiles(const QString& finalPath)
{
    const QString localPath = normalizeFilePath(finalPath);
    if (localPath.isEmpty()) return true;

    bool ok = true;
    for (const QString& candidate : { tempPathFor(localPath), localPath }) {
        if (QFile::exists(candidate) && !QFile::remove(candidate)) {
            ok = false;
        }
    }
    return ok;
}

QString findFileContaining(const QString& directory, const QStringList& hints)
{
    if (directory.isEmpty() || hints.isEmpty()) return QString();
    QDir dir(normalizeFilePath(directory));
    if (!dir.exists()) return QString();

    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo& entry : entries) {
        const QString name = entry.fileName();
        if (name.endsWith(QLatin1String(kTempSuffix))) continue;
        for (const QString& hint : hints) {
            if (!hint.isEmpty() && name.contains(hint, Qt::CaseInsensitive)) {
                return entry.absoluteFilePath();
            }
        }
    }
    return QString();
}

bool writeTextHint(const QString& path, const QString& text)
{
    QSaveFile file(normalizeFilePath(path));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) return false;
    file.write(text.toUtf8());
    return file.commit();
}

QString decodeQueryValue(const QString& value)
{
    QString v = value;
    v.replace('+', ' ');
    return QUrl::fromPercentEncoding(v.toUtf8());
}

QString filenameFromDisposition(const QString& value)
{
    const QString decoded = decodeQueryValue(value);
    if (decoded.isEmpty()) return QString();
    QRegularExpression re(QStringLiteral("filename\\*?=(?:UTF-8''|\"?)([^\";]+)"));
    auto match = re.match(decoded);
    if (match.hasMatch()) return match.captured(1).trimmed();
    return QString();
}

QString fileNameFromUrl(const QUrl& url)
{
    if (!url.isValid()) return QString();
    QUrlQuery query(url);
    QString disp = query.queryItemValue(QStringLiteral("response-content-disposition"));
    if (disp.isEmpty()) disp = query.queryItemValue(QStringLiteral("rscd"));
    if (!disp.isEmpty()) {
        const QString fromDisp = filenameFromDisposition(disp);
        if (!fromDisp.isEmpty()) return fromDisp;
    }
    const QString filename = query.queryItemValue(QStringLiteral("filename"));
    if (!filename.isEmpty()) return decodeQueryValue(filename);

    return QFileInfo(url.path()).fileName();
}

QString huggingFaceRepoId(const QUrl& url)
{
    if (!url.isValid()) return QString();
    const QString host = url.host().toLower();
    if (!host.endsWith(QStringLiteral("huggingface.co")) && !host.endsWith(QStringLiteral("hf.co"))) {
        return QString();
    }

    QStringList parts = url.path().split('/', Qt::SkipEmptyParts);
    static const QStringList prefixes = {
        QStringLiteral("api"), QStringLiteral("models"), QStringLiteral("repos")
    };
    while (!parts.isEmpty() && prefixes.contains(parts.first())) {
        parts.removeFirst();
    }
    if (parts.size() < 2) return QString();
    return parts.at(0) + '/' + parts.at(1);
}

QUrl withDownloadQuery(const QUrl& url)
{
    QUrl out(url);
    QUrlQuery query(out);
    if (!query.hasQueryItem(QStringLiteral("download"))) {
        query.addQueryItem(QStringLiteral("download"), QStringLiteral("1"));
    }
    out.setQuery(query);
    return out;
}

bool hasGgufMagic(const QString& path)
{
    QFile file(normalizeFilePath(path));
    if (!file.open(QIODevice::ReadOnly)) return false;
    return file.read(4) == QByteArrayLiteral("GGUF");
}

QString normalizeChecksum(const QString& value)
{
    QString out = value.trimmed().toLower();
    out.remove(' ');
    return out;
}

QString humanReadableBytes(qint64 bytes)
{
    if (bytes < 0) return QStringLiteral("unknown");
    return QLocale::c().formattedDataSize(bytes, 2, QLocale::DataSizeSIFormat);
}

} // namespace porter::utils
