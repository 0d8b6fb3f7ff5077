module;
#include <QFileInfo>
#include <QString>
#include <QUrl>
#include <QtGlobal>

#include <cmath>

module barq.utils.download_utils;

namespace barq::utils {

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

bool isSupportedUrl(const QUrl& url)
{
    if (!url.isValid() || url.isRelative()) return false;
    const QString scheme = url.scheme().toLower();
    if (scheme != QStringLiteral("http") && scheme != QStringLiteral("https")) return false;
    return !url.host().isEmpty();
}

QString fileNameFromUrl(const QUrl& url)
{
    if (!url.isValid()) return QString();
    const QString path = url.path();
    if (path.endsWith('/')) return QString();
    return QFileInfo(path).fileName();
}

QString deriveFileName(const QUrl& url, const QString& defaultExtension, qint64 nowMs)
{
    const QString name = fileNameFromUrl(url).trimmed();
    if (!name.isEmpty() && name != QStringLiteral(".") && name != QStringLiteral(".."))
        return name;

    QString ext = defaultExtension.trimmed();
    while (ext.startsWith('.')) ext.remove(0, 1);
    if (ext.isEmpty()) return QString::number(nowMs);
    return QStringLiteral("%1.%2").arg(nowMs).arg(ext);
}

double percentComplete(qint64 received, qint64 total)
{
    if (total <= 0 || received <= 0) return 0.0;
    const double percent = static_cast<double>(received) / static_cast<double>(total) * 100.0;
    return qMin(percent, 100.0);
}

double instantaneousSpeed(qint64 chunkBytes, qint64 elapsedMicros)
{
    const double speed = static_cast<double>(chunkBytes) / static_cast<double>(elapsedMicros) * 1000000.0;
    return std::isfinite(speed) && speed >= 0.0 ? speed : 0.0;
}

QVector<ByteRange> partitionRanges(qint64 total, int parts)
{
    QVector<ByteRange> ranges;
    if (total <= 0) return ranges;

    const qint64 count = qBound<qint64>(1, parts, total);
    const qint64 partSize = total / count;
    ranges.reserve(static_cast<int>(count));
    for (qint64 i = 0; i < count; ++i) {
        ByteRange r;
        r.start = i * partSize;
        r.end = (i == count - 1) ? (total - 1) : ((i + 1) * partSize - 1);
        ranges.push_back(r);
    }
    return ranges;
}

} // namespace barq::utils
