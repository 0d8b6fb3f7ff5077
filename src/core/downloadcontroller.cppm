/*!
 * @file        downloadcontroller.cppm
 * @brief       Download session control and result handling.
 * @details     Provides the public façade of the engine. DownloadController
 *              owns the single download session: it guards against concurrent
 *              sessions, drives the Idle/Downloading/Paused state machine,
 *              hands the transfer to a StreamFetcher, and turns the fetched
 *              bytes into the caller's result (a decoded image or a file
 *              written under the storage directory).
 *
 *              Every operation resolves through a QFuture. Failures are
 *              delivered as DownloadError exceptions stored in the future.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QNetworkAccessManager>
#include <QFuture>
#include <QPromise>
#include <QPointer>
#include <QMutex>
#include <QImage>
#include <QString>
#include <QUrl>

#include <atomic>
#include <functional>
#include <memory>

#ifndef Q_MOC_RUN
export module barq.core.downloadcontroller;
export import barq.core.downloaderror;
export import barq.core.progresssink;
export import barq.core.streamfetcher;
export import barq.services.downloader_settings;
#endif

#ifdef Q_MOC_RUN
#define BARQ_MODULE_EXPORT
#else
#define BARQ_MODULE_EXPORT export
#endif

/**
 * @brief Controls the single download session of the application.
 *
 * The controller and everything it drives live on the thread that created
 * it. cancelDownload(), pauseDownload() and resumeDownload() may be called
 * from other threads; they are forwarded to the owning thread.
 */
BARQ_MODULE_EXPORT class DownloadController : public QObject {

    Q_OBJECT

    //!< @brief Current session state.
    Q_PROPERTY(State state READ state NOTIFY stateChanged)

public:
    /**
     * @brief Session state machine.
     */
    enum class State {
        Idle,           //!< No download, or the last one has ended.
        Downloading,    //!< Transfer in progress.
        Paused          //!< Transfer suspended between chunks.
    };
    Q_ENUM(State)

    /**
     * @brief Construct a controller with settings loaded from QSettings.
     * @param parent Optional parent QObject.
     */
    explicit DownloadController(QObject* parent = nullptr);

    //!< @brief Cancels any running session.
    ~DownloadController() override;

    /**
     * @brief Download an image into memory.
     * @param url Image URL.
     * @param sink Progress receiver, may be null.
     * @return Future resolving to the decoded image.
     */
    QFuture<QImage> downloadImage(const QUrl& url, ProgressSink* sink);

    /**
     * @brief Download a file into the storage directory.
     * @param url File URL.
     * @param sink Progress receiver, may be null.
     * @return Future resolving to the absolute path of the written file.
     */
    QFuture<QString> downloadFile(const QUrl& url, ProgressSink* sink);

    /**
     * @brief Download a file as concurrent ranged parts.
     *
     * Falls back to a single stream when the server does not report a size
     * or does not accept byte ranges.
     *
     * @param url File URL.
     * @param sink Progress receiver, may be null.
     * @param partCount Number of parts.
     * @return Future resolving to the absolute path of the written file.
     */
    QFuture<QString> downloadFileMultipart(const QUrl& url, ProgressSink* sink, int partCount);

    //!< @brief Suspend the running download at the next chunk boundary.
    Q_INVOKABLE void pauseDownload();

    /**
     * @brief Continue a paused download.
     * @return Future of the current session's completion, or a finished
     *         future when nothing was paused.
     */
    QFuture<void> resumeDownload();

    //!< @brief Cancel the running download; idempotent.
    Q_INVOKABLE void cancelDownload();

    //!< @brief Return the session state.
    State state() const { return m_state; }

    //!< @brief Whether a session is active or still tearing down.
    bool isBusy() const { return m_state != State::Idle || m_fetcher; }

    //!< @brief Return the engine settings.
    DownloaderSettings settings() const { return m_settings; }

    /**
     * @brief Replace the engine settings; applies to the next download.
     * @param settings New settings, clamped like DownloaderSettings::load().
     */
    void setSettings(const DownloaderSettings& settings) { m_settings = settings.clamped(); }

    /**
     * @brief Return the human-readable state string.
     */
    QString stateString() const;

signals:
    /**
     * @brief Emitted when the session state changes.
     * @param state New state.
     */
    void stateChanged(DownloadController::State state);

    /**
     * @brief Emitted after every received chunk.
     * @param bytesReceived Received bytes.
     * @param bytesTotal Expected total, 0 when unknown.
     */
    void progress(qint64 bytesReceived, qint64 bytesTotal);

protected:
    /**
     * @brief Run a session and post-process its bytes.
     * @param request What to fetch.
     * @param sink Progress receiver.
     * @param finalize Converts the fetched bytes into the result; may throw.
     * @param finalizeFailure Kind reported when finalize throws anything
     *                        other than DownloadError.
     * @return Future of the result.
     */
    template <typename T>
    QFuture<T> startSession(const DownloadRequest& request,
                            ProgressSink* sink,
                            std::function<T(const QByteArray&)> finalize,
                            DownloadError::Kind finalizeFailure);

private:
    QNetworkAccessManager* m_manager = nullptr;         //!< Network manager.
    DownloaderSettings m_settings;                      //!< Engine configuration.
    State m_state = State::Idle;                        //!< Current state.
    std::shared_ptr<std::atomic_bool> m_cancelFlag;     //!< Cancellation flag of the current session.
    quint64 m_session = 0;                              //!< Generation of the current session.
    mutable QMutex m_sessionMutex;                      //!< Guards m_cancelFlag and m_session across threads.
    std::unique_ptr<QPromise<void>> m_completion;       //!< Completion Signal of the session.
    QPointer<StreamFetcher> m_fetcher;                  //!< Active fetcher.
    ProgressSink* m_sink = nullptr;                     //!< Progress receiver of the session.

    /**
     * @brief End the session: sentinel progress, completion, state reset.
     */
    void finishSession();

    //!< @brief Finish and drop the Completion Signal.
    void releaseCompletion();

    /**
     * @brief Queue a control call onto the owning thread.
     *
     * The call is dropped if a session other than @p session is current by
     * the time it runs.
     *
     * @param call Control operation to run.
     * @param session Generation the call was made against.
     */
    void postToSession(void (DownloadController::*call)(), quint64 session);

    /**
     * @brief Change state and notify.
     * @param state New state.
     */
    void setState(State state);

    /**
     * @brief Write fetched bytes under the storage directory.
     * @param data File contents.
     * @param fileName Bare file name.
     * @return Absolute path of the written file.
     * @throws DownloadError of kind FileWrite.
     */
    QString saveToFile(const QByteArray& data, const QString& fileName) const;
};

#include "downloadcontroller.moc"
