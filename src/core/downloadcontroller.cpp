module;
#include <QNetworkAccessManager>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QFuture>
#include <QImage>
#include <QMetaObject>
#include <QMutexLocker>
#include <QPromise>
#include <QSaveFile>
#include <QThread>

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

module barq.core.downloadcontroller;

import barq.utils.download_utils;

namespace utils = barq::utils;

namespace {

template <typename T>
QFuture<T> failedFuture(const DownloadError& error)
{
    QPromise<T> promise;
    QFuture<T> future = promise.future();
    promise.start();
    promise.setException(error);
    promise.finish();
    return future;
}

QFuture<void> readyFuture()
{
    QPromise<void> promise;
    QFuture<void> future = promise.future();
    promise.start();
    promise.finish();
    return future;
}

} // namespace

DownloadController::DownloadController(QObject* parent)
    : QObject(parent),
    m_settings(DownloaderSettings::load()),
    m_cancelFlag(std::make_shared<std::atomic_bool>(false))
{
    m_manager = new QNetworkAccessManager(this);
}

DownloadController::~DownloadController()
{
    if (m_fetcher) {
        cancelDownload();
    }
}

QFuture<QImage> DownloadController::downloadImage(const QUrl& url, ProgressSink* sink)
{
    DownloadRequest request;
    request.url = url;
    return startSession<QImage>(request, sink, [](const QByteArray& data) {
        QImage image = QImage::fromData(data);
        if (image.isNull()) {
            throw DownloadError::imageDecode();
        }
        return image;
    }, DownloadError::Kind::ImageDecode);
}

QFuture<QString> DownloadController::downloadFile(const QUrl& url, ProgressSink* sink)
{
    DownloadRequest request;
    request.url = url;
    return startSession<QString>(request, sink, [this, url](const QByteArray& data) {
        const QString name = utils::deriveFileName(url, m_settings.defaultExtension,
                                                   QDateTime::currentMSecsSinceEpoch());
        return saveToFile(data, name);
    }, DownloadError::Kind::FileWrite);
}

QFuture<QString> DownloadController::downloadFileMultipart(const QUrl& url, ProgressSink* sink, int partCount)
{
    DownloadRequest request;
    request.url = url;
    request.partCount = qMax(1, partCount);
    return startSession<QString>(request, sink, [this, url](const QByteArray& data) {
        const QString name = utils::deriveFileName(url, m_settings.defaultExtension,
                                                   QDateTime::currentMSecsSinceEpoch());
        return saveToFile(data, name);
    }, DownloadError::Kind::FileWrite);
}

template <typename T>
QFuture<T> DownloadController::startSession(const DownloadRequest& request,
                                            ProgressSink* sink,
                                            std::function<T(const QByteArray&)> finalize,
                                            DownloadError::Kind finalizeFailure)
{
    if (isBusy()) {
        qWarning() << "Download rejected, session busy:" << request.url;
        return failedFuture<T>(DownloadError::sessionBusy());
    }

    auto promise = std::make_shared<QPromise<T>>();
    QFuture<T> future = promise->future();
    promise->start();

    {
        QMutexLocker lock(&m_sessionMutex);
        ++m_session;
        m_cancelFlag = std::make_shared<std::atomic_bool>(false);
    }
    m_completion = std::make_unique<QPromise<void>>();
    m_completion->start();
    m_sink = sink;
    setState(State::Downloading);

    if (!utils::isSupportedUrl(request.url)) {
        qWarning() << "Invalid URL:" << request.url;
        finishSession();
        promise->setException(DownloadError::invalidUrl(request.url.toString()));
        promise->finish();
        return future;
    }

    qDebug() << "DownloadController::start for" << request.url;
    StreamFetcher* fetcher = new StreamFetcher(m_manager, m_cancelFlag, m_settings, this);
    fetcher->setProgressSink(sink);
    m_fetcher = fetcher;

    connect(fetcher, &StreamFetcher::progress, this, &DownloadController::progress);

    connect(fetcher, &StreamFetcher::finished, this,
            [this, promise, finalize, finalizeFailure](const QByteArray& data) {
        std::optional<T> result;
        std::optional<DownloadError> error;
        try {
            result = finalize(data);
        } catch (const DownloadError& e) {
            error = e;
        } catch (const std::exception& e) {
            error = DownloadError(finalizeFailure, QString::fromLocal8Bit(e.what()));
        }

        finishSession();
        if (error) {
            qWarning() << "Download failed:" << error->message();
            promise->setException(*error);
        } else {
            promise->addResult(std::move(*result));
        }
        promise->finish();
    });

    connect(fetcher, &StreamFetcher::failed, this, [this, promise](const DownloadError& error) {
        finishSession();
        promise->setException(error);
        promise->finish();
    });

    fetcher->fetch(request);
    return future;
}

template QFuture<QImage> DownloadController::startSession<QImage>(
    const DownloadRequest&, ProgressSink*, std::function<QImage(const QByteArray&)>, DownloadError::Kind);
template QFuture<QString> DownloadController::startSession<QString>(
    const DownloadRequest&, ProgressSink*, std::function<QString(const QByteArray&)>, DownloadError::Kind);

void DownloadController::postToSession(void (DownloadController::*call)(), quint64 session)
{
    QMetaObject::invokeMethod(this, [this, call, session] {
        if (session != m_session) {
            qDebug() << "Dropping control call queued for an earlier session";
            return;
        }
        (this->*call)();
    }, Qt::QueuedConnection);
}

void DownloadController::pauseDownload()
{
    if (QThread::currentThread() != thread()) {
        quint64 session = 0;
        {
            QMutexLocker lock(&m_sessionMutex);
            session = m_session;
        }
        postToSession(&DownloadController::pauseDownload, session);
        return;
    }
    if (m_state != State::Downloading)
        return;

    qDebug() << "Pause requested";
    setState(State::Paused);
    if (m_fetcher) m_fetcher->setPaused(true);
}

QFuture<void> DownloadController::resumeDownload()
{
    if (QThread::currentThread() != thread()) {
        QFuture<void> future;
        QMetaObject::invokeMethod(this, [this, &future] { future = resumeDownload(); },
                                  Qt::BlockingQueuedConnection);
        return future;
    }
    if (m_state != State::Paused)
        return readyFuture();

    qDebug() << "Resume requested";
    setState(State::Downloading);
    if (m_fetcher) m_fetcher->setPaused(false);
    return m_completion ? m_completion->future() : readyFuture();
}

void DownloadController::cancelDownload()
{
    if (QThread::currentThread() != thread()) {
        quint64 session = 0;
        {
            QMutexLocker lock(&m_sessionMutex);
            m_cancelFlag->store(true);
            session = m_session;
        }
        postToSession(&DownloadController::cancelDownload, session);
        return;
    }

    m_cancelFlag->store(true);

    qDebug() << "Cancel requested";
    releaseCompletion();
    setState(State::Idle);
    if (m_fetcher) m_fetcher->poll();
}

void DownloadController::finishSession()
{
    if (m_sink) {
        m_sink->onProgress(100.0, 0.0);
        m_sink->onProgress(0.0, 0.0);
        m_sink = nullptr;
    }
    releaseCompletion();
    if (m_fetcher) {
        QObject::disconnect(m_fetcher, nullptr, this, nullptr);
        m_fetcher->deleteLater();
        m_fetcher = nullptr;
    }
    setState(State::Idle);
}

void DownloadController::releaseCompletion()
{
    if (!m_completion) return;
    m_completion->finish();
    m_completion.reset();
}

void DownloadController::setState(State state)
{
    if (m_state == state) return;
    m_state = state;
    emit stateChanged(m_state);
}

QString DownloadController::stateString() const
{
    switch (m_state) {
    case State::Idle: return "Idle";
    case State::Downloading: return "Downloading";
    case State::Paused: return "Paused";
    }
    return "Unknown";
}

QString DownloadController::saveToFile(const QByteArray& data, const QString& fileName) const
{
    const QString dirPath = m_settings.resolvedStorageDirectory();
    if (dirPath.isEmpty() || !QDir().mkpath(dirPath)) {
        qWarning() << "Cannot create storage directory" << dirPath;
        throw DownloadError::fileWrite(dirPath, QStringLiteral("cannot create directory"));
    }

    const QString path = QDir(dirPath).filePath(fileName);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Cannot open output file" << path << file.errorString();
        throw DownloadError::fileWrite(path, file.errorString());
    }
    if (file.write(data) != data.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        qWarning() << "Cannot write output file" << path << reason;
        throw DownloadError::fileWrite(path, reason);
    }
    if (!file.commit()) {
        qWarning() << "Cannot commit output file" << path << file.errorString();
        throw DownloadError::fileWrite(path, file.errorString());
    }
    return QFileInfo(path).absoluteFilePath();
}
