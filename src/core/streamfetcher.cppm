/*!
 * @file        streamfetcher.cppm
 * @brief       Single-stream and multipart HTTP fetch with progress reporting.
 * @details     StreamFetcher performs one fetch of a remote resource into
 *              memory. It issues a plain GET, or probes the resource with HEAD
 *              and fetches it as concurrent ranged GETs, reports per-chunk
 *              progress and instantaneous throughput, honors a shared
 *              cancellation flag at chunk boundaries, and can be paused and
 *              resumed between chunks.
 *
 *              A fetcher is single-use: it emits exactly one of finished() or
 *              failed(), after every network reply it owns has been released.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QElapsedTimer>
#include <QTimer>
#include <QByteArray>
#include <QVector>
#include <QUrl>

#include <atomic>
#include <memory>

#ifndef Q_MOC_RUN
export module barq.core.streamfetcher;
export import barq.core.downloaderror;
import barq.core.progresssink;
import barq.services.downloader_settings;
import barq.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define BARQ_MODULE_EXPORT
#else
#define BARQ_MODULE_EXPORT export
#endif

/**
 * @brief What to fetch and how to split it.
 */
BARQ_MODULE_EXPORT struct DownloadRequest {
    QUrl url;           //!< Resource URL.
    int partCount = 1;  //!< 1 for a single stream, more for a multipart fetch.
};

/**
 * @brief Executes one fetch of a resource into memory.
 */
BARQ_MODULE_EXPORT class StreamFetcher : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a fetcher.
     * @param manager Network manager used for all requests (not owned).
     * @param cancelFlag Shared cancellation flag, polled at chunk boundaries.
     * @param settings Engine configuration.
     * @param parent Optional parent QObject.
     */
    StreamFetcher(QNetworkAccessManager* manager,
                  std::shared_ptr<std::atomic_bool> cancelFlag,
                  const DownloaderSettings& settings,
                  QObject* parent = nullptr);

    //!< @brief Aborts and releases any reply still in flight.
    ~StreamFetcher() override;

    /**
     * @brief Set the receiver of progress samples.
     * @param sink Sink, may be null. Must outlive the fetch.
     */
    void setProgressSink(ProgressSink* sink) { m_sink = sink; }

    /**
     * @brief Start fetching.
     * @param request Resource and part count.
     */
    void fetch(const DownloadRequest& request);

    /**
     * @brief Suspend or continue chunk consumption.
     *
     * While paused, arriving data stays buffered in the replies (bounded by
     * the configured read buffer), no progress is reported and the stall
     * watchdog is suspended.
     *
     * @param paused New pause state.
     */
    void setPaused(bool paused);

    bool isPaused() const { return m_paused; }

    /**
     * @brief Run the chunk-boundary checkpoint now.
     *
     * Observes a raised cancellation flag even while paused or while the
     * transport is stalled.
     */
    void poll();

    //!< @brief Bytes received across all parts.
    qint64 receivedBytes() const { return m_received; }

    //!< @brief Expected total bytes, 0 when unknown.
    qint64 totalBytes() const { return m_total; }

    //!< @brief Number of parts of the current fetch strategy.
    int partCount() const { return m_parts.size(); }

signals:
    /**
     * @brief Emitted after every consumed chunk.
     * @param bytesReceived Received bytes across all parts.
     * @param bytesTotal Expected total, 0 when unknown.
     */
    void progress(qint64 bytesReceived, qint64 bytesTotal);

    /**
     * @brief Emitted once when the whole resource has been received.
     * @param data Resource bytes in order.
     */
    void finished(const QByteArray& data);

    /**
     * @brief Emitted once when the fetch fails or is cancelled.
     * @param error Failure description.
     */
    void failed(const DownloadError& error);

private:

    /**
     * @brief One GET of the fetch: the whole resource or one byte range.
     */
    struct Part {
        qint64 start = 0;                   //!< Range start offset.
        qint64 end = -1;                    //!< Range end offset (inclusive).
        bool ranged = false;                //!< Whether a Range header is sent.
        QNetworkReply* reply = nullptr;     //!< Active network reply.
        QByteArray data;                    //!< Received bytes.
        qint64 received = 0;                //!< Bytes received so far.
        bool statusChecked = false;         //!< Response status accepted.
        bool ended = false;                 //!< Reply reported finished.
        bool done = false;                  //!< Fully received and released.
    };

    QNetworkAccessManager* m_manager = nullptr;     //!< Network manager.
    std::shared_ptr<std::atomic_bool> m_cancelFlag; //!< Shared cancellation flag.
    DownloaderSettings m_settings;                  //!< Engine configuration.
    ProgressSink* m_sink = nullptr;                 //!< Progress receiver.

    DownloadRequest m_request;                      //!< Current request.
    QVector<Part> m_parts;                          //!< Part list, in range order.
    QNetworkReply* m_headReply = nullptr;           //!< HEAD probe reply.

    qint64 m_received = 0;                  //!< Bytes received across parts.
    qint64 m_total = 0;                     //!< Expected total, 0 if unknown.
    double m_lastPercent = 0.0;             //!< Highest percent reported.
    QElapsedTimer m_speedTimer;             //!< Time since previous chunk.
    QTimer m_stallTimer;                    //!< Fails the fetch after transferTimeoutMs without data.
    bool m_paused = false;                  //!< Consumption suspended.
    bool m_done = false;                    //!< A terminal signal was emitted.

    //!< @brief Probe size and range support, then split or fall back.
    void probeAndSplit();

    //!< @brief Fetch the resource as one plain GET.
    void startSingleStream();

    /**
     * @brief Fetch the resource as concurrent ranged GETs.
     * @param ranges Byte ranges in order.
     */
    void startParts(const QVector<barq::utils::ByteRange>& ranges);

    /**
     * @brief Dispatch the request of one part.
     * @param index Part index.
     */
    void startPart(int index);

    //!< @brief Build a request with the common headers and attributes.
    QNetworkRequest makeRequest() const;

    //!< @brief Re-arm the stall watchdog unless paused or finished.
    void touchWatchdog();

    //!< @brief Watchdog expiry: no data for transferTimeoutMs.
    void onStalled();

    /**
     * @brief Chunk-boundary check for cancellation and pause.
     * @return true if consumption may proceed.
     */
    bool checkpoint();

    /**
     * @brief Accept or reject the response status of a part.
     * @param index Part index.
     * @return true once the status is known and acceptable.
     */
    bool verifyStatus(int index);

    /**
     * @brief Consume whatever a part's reply has buffered.
     * @param index Part index.
     */
    void consumeAvailable(int index);

    /**
     * @brief Account one chunk and report it.
     * @param index Part index.
     * @param chunk Received bytes.
     */
    void consumeChunk(int index, const QByteArray& chunk);

    /**
     * @brief Drain a part and finalize it if its reply has finished.
     * @param index Part index.
     */
    void settle(int index);

    //!< @brief Settle every part, used after resume and by poll().
    void drain();

    //!< @brief Emit finished() when every part is done.
    void finishIfComplete();

    /**
     * @brief Abort everything and emit failed().
     * @param error Failure description.
     */
    void fail(const DownloadError& error);

    //!< @brief Abort and release every reply.
    void releaseConnections();
};

#include "streamfetcher.moc"
