module;
#include <QByteArray>
#include <QException>
#include <QString>

module barq.core.downloaderror;

DownloadError::DownloadError(Kind kind, const QString& message, int statusCode)
    : m_kind(kind),
    m_message(message),
    m_statusCode(statusCode)
{
    m_what = QStringLiteral("%1: %2").arg(kindName(m_kind), m_message).toUtf8();
}

DownloadError DownloadError::httpStatus(int statusCode)
{
    return DownloadError(Kind::HttpStatus,
                         QStringLiteral("Failed to download file: %1").arg(statusCode),
                         statusCode);
}

DownloadError DownloadError::network(const QString& reason)
{
    return DownloadError(Kind::Network, reason);
}

DownloadError DownloadError::cancelled()
{
    return DownloadError(Kind::Cancelled, QStringLiteral("Download canceled"));
}

DownloadError DownloadError::fileWrite(const QString& path, const QString& reason)
{
    return DownloadError(Kind::FileWrite,
                         QStringLiteral("Failed to save file %1: %2").arg(path, reason));
}

DownloadError DownloadError::invalidUrl(const QString& url)
{
    return DownloadError(Kind::InvalidUrl, QStringLiteral("Invalid URL: %1").arg(url));
}

DownloadError DownloadError::imageDecode()
{
    return DownloadError(Kind::ImageDecode, QStringLiteral("Payload is not a supported image"));
}

DownloadError DownloadError::sessionBusy()
{
    return DownloadError(Kind::SessionBusy, QStringLiteral("Another download is in progress"));
}

QString DownloadError::kindName(Kind kind)
{
    switch (kind) {
    case Kind::HttpStatus: return "HttpStatusError";
    case Kind::Network: return "NetworkError";
    case Kind::Cancelled: return "DownloadCancelled";
    case Kind::FileWrite: return "FileWriteError";
    case Kind::InvalidUrl: return "InvalidUrlError";
    case Kind::ImageDecode: return "ImageDecodeError";
    case Kind::SessionBusy: return "SessionBusyError";
    }
    return "Unknown";
}
