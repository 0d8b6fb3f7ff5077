module;
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

module barq.services.downloader_settings;

import barq.utils.download_utils;

namespace utils = barq::utils;

static QString settingsGroup()
{
    return QStringLiteral("downloader");
}

DownloaderSettings DownloaderSettings::load()
{
    DownloaderSettings out;
    QSettings settings;
    settings.beginGroup(settingsGroup());
    out.storageDirectory = settings.value(QStringLiteral("storageDirectory"), out.storageDirectory).toString();
    out.defaultExtension = settings.value(QStringLiteral("defaultExtension"), out.defaultExtension).toString();
    out.userAgent = settings.value(QStringLiteral("userAgent"), out.userAgent).toByteArray();
    out.transferTimeoutMs = settings.value(QStringLiteral("transferTimeoutMs"), out.transferTimeoutMs).toInt();
    out.maxParts = settings.value(QStringLiteral("maxParts"), out.maxParts).toInt();
    out.pausedReadBufferSize = settings.value(QStringLiteral("pausedReadBufferSize"), out.pausedReadBufferSize).toLongLong();
    settings.endGroup();
    return out.clamped();
}

DownloaderSettings DownloaderSettings::clamped() const
{
    DownloaderSettings out = *this;
    out.storageDirectory = utils::normalizeFilePath(storageDirectory.trimmed());
    out.defaultExtension = defaultExtension.trimmed();
    out.transferTimeoutMs = qMax(0, transferTimeoutMs);
    out.maxParts = qMax(1, maxParts);
    out.pausedReadBufferSize = qMax<qint64>(1, pausedReadBufferSize);
    return out;
}

void DownloaderSettings::save() const
{
    QSettings settings;
    settings.beginGroup(settingsGroup());
    settings.setValue(QStringLiteral("storageDirectory"), storageDirectory);
    settings.setValue(QStringLiteral("defaultExtension"), defaultExtension);
    settings.setValue(QStringLiteral("userAgent"), userAgent);
    settings.setValue(QStringLiteral("transferTimeoutMs"), transferTimeoutMs);
    settings.setValue(QStringLiteral("maxParts"), maxParts);
    settings.setValue(QStringLiteral("pausedReadBufferSize"), pausedReadBufferSize);
    settings.endGroup();
}

QString DownloaderSettings::resolvedStorageDirectory() const
{
    if (!storageDirectory.isEmpty()) return utils::normalizeFilePath(storageDirectory);
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}
