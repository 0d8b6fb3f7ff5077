/*!
 * @file        download_utils.cppm
 * @brief       Common helpers for URL, file name, range and rate handling.
 * @details     Provides a collection of small, reusable helper functions shared
 *              by the fetcher and the controller. These utilities handle URL
 *              validation, file name inference, byte-range partitioning for
 *              multipart transfers, and the percent/speed arithmetic reported
 *              to progress sinks.
 *
 *              All helpers are side-effect free.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QUrl>
#include <QString>
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module barq.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define BARQ_MODULE_EXPORT
#else
#define BARQ_MODULE_EXPORT export
#endif

BARQ_MODULE_EXPORT namespace barq::utils {

/**
 * @brief Inclusive byte range of a multipart transfer.
 */
struct ByteRange {
    qint64 start = 0;   //!< First byte offset.
    qint64 end = 0;     //!< Last byte offset (inclusive).

    //!< @brief Number of bytes covered by the range.
    qint64 length() const { return end - start + 1; }
};

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and ensures a consistent representation
 * suitable for filesystem operations.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Checks whether a URL can be fetched by the engine.
 * @param url Candidate URL.
 * @return true for absolute http/https URLs with a host.
 */
bool isSupportedUrl(const QUrl& url);

/**
 * @brief Infers a filename from the last segment of a URL's path.
 * @param url Source URL.
 * @return Inferred filename, or an empty string when the path ends in '/'.
 */
QString fileNameFromUrl(const QUrl& url);

/**
 * @brief Derives the on-disk name for a downloaded resource.
 *
 * Falls back to `<nowMs>.<defaultExtension>` when the URL does not carry
 * a usable name.
 *
 * @param url Source URL.
 * @param defaultExtension Extension for synthesized names (without dot).
 * @param nowMs Current time in milliseconds since epoch.
 * @return A bare file name without directory components.
 */
QString deriveFileName(const QUrl& url, const QString& defaultExtension, qint64 nowMs);

/**
 * @brief Completion percentage of a transfer.
 * @param received Bytes received so far.
 * @param total Expected total bytes, or 0 when unknown.
 * @return Percentage in [0, 100]; 0 when the total is unknown.
 */
double percentComplete(qint64 received, qint64 total);

/**
 * @brief Instantaneous rate of a single chunk.
 * @param chunkBytes Size of the chunk.
 * @param elapsedMicros Time since the previous chunk in microseconds.
 * @return Bytes per second, or 0 if the rate is not finite.
 */
double instantaneousSpeed(qint64 chunkBytes, qint64 elapsedMicros);

/**
 * @brief Splits `[0, total)` into contiguous ranges.
 *
 * The part count is clamped to [1, total]; the last range absorbs the
 * division remainder.
 *
 * @param total Resource size in bytes.
 * @param parts Requested number of parts.
 * @return Ranges in ascending order, empty when total is not positive.
 */
QVector<ByteRange> partitionRanges(qint64 total, int parts);

} // namespace barq::utils
