/*!
 * @file        downloader_settings.cppm
 * @brief       Persistent engine configuration.
 * @details     Groups the tunables of the download engine and maps them onto
 *              the `downloader` group of the application's QSettings store.
 *              Values missing from the store keep their built-in defaults.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module barq.services.downloader_settings;
#endif

#ifdef Q_MOC_RUN
#define BARQ_MODULE_EXPORT
#else
#define BARQ_MODULE_EXPORT export
#endif

/**
 * @brief Download engine configuration.
 */
BARQ_MODULE_EXPORT struct DownloaderSettings {
    QString storageDirectory;                       //!< Target folder; empty selects AppDataLocation.
    QString defaultExtension = QStringLiteral("jpg"); //!< Extension of synthesized file names.
    QByteArray userAgent = "barq/1.0";              //!< User-Agent request header.
    int transferTimeoutMs = 30000;                  //!< Stall timeout per request (0 = none).
    int maxParts = 16;                              //!< Upper bound on multipart parts.
    qint64 pausedReadBufferSize = 64 * 1024;        //!< Reply buffer cap while paused.

    /**
     * @brief Read settings from QSettings, falling back to defaults.
     * @return Loaded settings.
     */
    static DownloaderSettings load();

    //!< @brief Write settings to QSettings.
    void save() const;

    /**
     * @brief Copy with every value brought into its valid range.
     *
     * Negative timeouts become 0, maxParts and pausedReadBufferSize are at
     * least 1, and a file:// storage directory becomes a local path.
     */
    DownloaderSettings clamped() const;

    /**
     * @brief Folder downloads are written to.
     * @return storageDirectory, or the writable AppDataLocation when unset.
     */
    QString resolvedStorageDirectory() const;
};
