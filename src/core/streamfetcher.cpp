module;
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QDebug>
#include <QTimer>
#include <QPointer>
#include <QSslError>

#include <atomic>
#include <memory>
#include <utility>

module barq.core.streamfetcher;

import barq.utils.download_utils;

namespace utils = barq::utils;

StreamFetcher::StreamFetcher(QNetworkAccessManager* manager,
                             std::shared_ptr<std::atomic_bool> cancelFlag,
                             const DownloaderSettings& settings,
                             QObject* parent)
    : QObject(parent),
    m_manager(manager),
    m_cancelFlag(std::move(cancelFlag)),
    m_settings(settings)
{
    if (!m_cancelFlag) {
        m_cancelFlag = std::make_shared<std::atomic_bool>(false);
    }
    m_stallTimer.setSingleShot(true);
    connect(&m_stallTimer, &QTimer::timeout, this, &StreamFetcher::onStalled);
}

StreamFetcher::~StreamFetcher()
{
    releaseConnections();
}

void StreamFetcher::fetch(const DownloadRequest& request)
{
    m_request = request;
    m_received = 0;
    m_total = 0;
    m_lastPercent = 0.0;
    m_done = false;
    m_speedTimer.invalidate();
    touchWatchdog();

    qDebug() << "StreamFetcher::fetch" << request.url << "parts:" << request.partCount;
    if (request.partCount > 1) {
        probeAndSplit();
    } else {
        startSingleStream();
    }
}

QNetworkRequest StreamFetcher::makeRequest() const
{
    QNetworkRequest req(m_request.url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setRawHeader("User-Agent", m_settings.userAgent);
    // Byte counts and ranges refer to the bytes as served.
    req.setRawHeader("Accept-Encoding", "identity");
    // Stalls are detected by m_stallTimer, which is suspended while paused.
    return req;
}

void StreamFetcher::touchWatchdog()
{
    if (m_done || m_paused || m_settings.transferTimeoutMs <= 0) {
        m_stallTimer.stop();
        return;
    }
    m_stallTimer.start(m_settings.transferTimeoutMs);
}

void StreamFetcher::onStalled()
{
    if (m_done || m_paused) return;
    qWarning() << "No data for" << m_settings.transferTimeoutMs << "ms from" << m_request.url;
    fail(DownloadError::network(
        QStringLiteral("Transfer stalled for %1 ms").arg(m_settings.transferTimeoutMs)));
}

void StreamFetcher::probeAndSplit()
{
    QNetworkReply* headReply = m_manager->head(makeRequest());
    m_headReply = headReply;

#if QT_CONFIG(ssl)
    connect(headReply, &QNetworkReply::sslErrors, this, [](const QList<QSslError>& errors) {
        qWarning() << "HEAD SSL errors:" << errors;
    });
#endif

    connect(headReply, &QNetworkReply::finished, this, [this, headReply]() {
        m_headReply = nullptr;
        headReply->deleteLater();
        if (m_done) return;
        touchWatchdog();
        if (m_cancelFlag->load()) {
            fail(DownloadError::cancelled());
            return;
        }

        const int status = headReply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (headReply->error() != QNetworkReply::NoError || status != 200) {
            qDebug() << "HEAD failed, fallback to single stream:" << status << headReply->errorString();
            startSingleStream();
            return;
        }

        const QVariant cl = headReply->header(QNetworkRequest::ContentLengthHeader);
        const QByteArray acceptRanges = headReply->rawHeader("Accept-Ranges");
        if (!cl.isValid() || cl.toLongLong() <= 0) {
            qDebug() << "No Content-Length → single stream";
            startSingleStream();
            return;
        }
        if (acceptRanges.trimmed().toLower() != "bytes") {
            qDebug() << "Server does not support ranges → single stream";
            startSingleStream();
            return;
        }

        m_total = cl.toLongLong();
        const int wanted = qMin(m_request.partCount, m_settings.maxParts);
        const QVector<utils::ByteRange> ranges = utils::partitionRanges(m_total, wanted);
        if (ranges.size() <= 1) {
            startSingleStream();
            return;
        }
        startParts(ranges);
    });
}

void StreamFetcher::startSingleStream()
{
    m_parts.clear();
    m_parts.push_back(Part{});
    startPart(0);
}

void StreamFetcher::startParts(const QVector<utils::ByteRange>& ranges)
{
    qDebug() << "Multipart fetch of" << m_total << "bytes in" << ranges.size() << "parts";
    m_parts.clear();
    m_parts.reserve(ranges.size());
    for (const utils::ByteRange& r : ranges) {
        Part p;
        p.start = r.start;
        p.end = r.end;
        p.ranged = true;
        p.data.reserve(static_cast<qsizetype>(r.length()));
        m_parts.push_back(p);
    }
    for (int i = 0; i < m_parts.size(); ++i) {
        startPart(i);
        if (m_done) return;
    }
}

void StreamFetcher::startPart(int index)
{
    QNetworkRequest req = makeRequest();
    Part& part = m_parts[index];
    if (part.ranged) {
        req.setRawHeader(
            "Range",
            QString("bytes=%1-%2").arg(part.start).arg(part.end).toUtf8());
    }

    QNetworkReply* reply = m_manager->get(req);
    part.reply = reply;
    if (m_paused) {
        reply->setReadBufferSize(m_settings.pausedReadBufferSize);
    }
    QPointer<QNetworkReply> replyPtr(reply);

#if QT_CONFIG(ssl)
    connect(reply, &QNetworkReply::sslErrors, this, [](const QList<QSslError>& errors) {
        qWarning() << "GET SSL errors:" << errors;
    });
#endif

    connect(reply, &QNetworkReply::readyRead, this, [this, index, replyPtr]() {
        if (!replyPtr || index >= m_parts.size() || replyPtr != m_parts[index].reply) return;
        if (!checkpoint()) return;
        touchWatchdog();
        consumeAvailable(index);
    });

    connect(reply, &QNetworkReply::finished, this, [this, index, replyPtr]() {
        if (!replyPtr || index >= m_parts.size() || replyPtr != m_parts[index].reply) return;
        m_parts[index].ended = true;
        settle(index);
    });
}

bool StreamFetcher::checkpoint()
{
    if (m_done) return false;
    if (m_cancelFlag->load()) {
        qDebug() << "Cancellation observed for" << m_request.url;
        fail(DownloadError::cancelled());
        return false;
    }
    return !m_paused;
}

bool StreamFetcher::verifyStatus(int index)
{
    Part& part = m_parts[index];
    if (part.statusChecked) return true;

    QNetworkReply* reply = part.reply;
    const QVariant attr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!attr.isValid()) {
        if (reply->isFinished()) {
            qWarning() << "GET error:" << reply->errorString();
            fail(DownloadError::network(reply->errorString()));
        }
        return false;
    }

    const int status = attr.toInt();
    if (part.ranged && status == 200) {
        qWarning() << "Range ignored by server, falling back to single stream";
        releaseConnections();
        m_received = 0;
        m_total = 0;
        QTimer::singleShot(0, this, [this] {
            if (!m_done) startSingleStream();
        });
        return false;
    }

    const int expected = part.ranged ? 206 : 200;
    if (status != expected) {
        qWarning() << "GET HTTP error status" << status << "for" << m_request.url;
        fail(DownloadError::httpStatus(status));
        return false;
    }

    part.statusChecked = true;
    if (!part.ranged) {
        const QVariant cl = reply->header(QNetworkRequest::ContentLengthHeader);
        m_total = cl.isValid() ? qMax<qint64>(0, cl.toLongLong()) : 0;
    }
    if (!m_speedTimer.isValid()) {
        m_speedTimer.start();
    }
    return true;
}

void StreamFetcher::consumeAvailable(int index)
{
    if (!m_parts[index].reply) return;
    if (!verifyStatus(index)) return;
    const QByteArray chunk = m_parts[index].reply->readAll();
    if (chunk.isEmpty()) return;
    consumeChunk(index, chunk);
}

void StreamFetcher::consumeChunk(int index, const QByteArray& chunk)
{
    Part& part = m_parts[index];
    part.data.append(chunk);
    part.received += chunk.size();
    m_received += chunk.size();

    const qint64 elapsedMicros = m_speedTimer.nsecsElapsed() / 1000;
    m_speedTimer.restart();
    const double speed = utils::instantaneousSpeed(chunk.size(), elapsedMicros);
    const double percent = qMax(m_lastPercent, utils::percentComplete(m_received, m_total));
    m_lastPercent = percent;

    emit progress(m_received, m_total);
    if (m_sink && !m_done) {
        m_sink->onProgress(percent, speed);
    }
}

void StreamFetcher::settle(int index)
{
    if (!checkpoint()) return;
    consumeAvailable(index);
    if (m_done || index >= m_parts.size()) return;

    Part& part = m_parts[index];
    if (!part.ended || !part.reply) return;

    QNetworkReply* reply = part.reply;
    if (!part.statusChecked) {
        // Finished without a usable status; verifyStatus() reports it.
        verifyStatus(index);
        return;
    }
    if (reply->error() != QNetworkReply::NoError) {
        qWarning() << "GET error:" << reply->errorString();
        fail(DownloadError::network(reply->errorString()));
        return;
    }
    if (part.ranged && part.received != part.end - part.start + 1) {
        fail(DownloadError::network(
            QStringLiteral("Part %1 received %2 of %3 bytes")
                .arg(index).arg(part.received).arg(part.end - part.start + 1)));
        return;
    }
    if (!part.ranged && m_total > 0 && part.received < m_total) {
        fail(DownloadError::network(
            QStringLiteral("Body truncated at %1 of %2 bytes").arg(part.received).arg(m_total)));
        return;
    }

    QObject::disconnect(reply, nullptr, this, nullptr);
    reply->deleteLater();
    part.reply = nullptr;
    part.done = true;
    finishIfComplete();
}

void StreamFetcher::drain()
{
    for (int i = 0; i < m_parts.size(); ++i) {
        if (m_done || m_paused) return;
        if (m_parts[i].reply) settle(i);
    }
}

void StreamFetcher::finishIfComplete()
{
    if (m_done) return;
    for (const Part& p : m_parts) {
        if (!p.done) return;
    }

    QByteArray out;
    if (m_parts.size() == 1) {
        out = m_parts.first().data;
    } else {
        out.reserve(static_cast<qsizetype>(m_received));
        for (const Part& p : m_parts) out.append(p.data);
    }
    m_parts.clear();
    m_done = true;
    m_stallTimer.stop();
    qDebug() << "StreamFetcher finished" << m_request.url << out.size() << "bytes";
    emit finished(out);
}

void StreamFetcher::setPaused(bool paused)
{
    if (m_paused == paused) return;
    m_paused = paused;

    for (Part& p : m_parts) {
        if (p.reply) {
            p.reply->setReadBufferSize(m_paused ? m_settings.pausedReadBufferSize : 0);
        }
    }
    touchWatchdog();
    if (!m_paused) {
        QTimer::singleShot(0, this, [this] { drain(); });
    }
}

void StreamFetcher::poll()
{
    if (m_done) return;
    if (m_cancelFlag->load()) {
        checkpoint();
        return;
    }
    drain();
}

void StreamFetcher::fail(const DownloadError& error)
{
    if (m_done) return;
    m_done = true;
    m_stallTimer.stop();
    releaseConnections();
    if (error.kind() != DownloadError::Kind::Cancelled) {
        qWarning() << "Download failed:" << error.message();
    }
    emit failed(error);
}

void StreamFetcher::releaseConnections()
{
    for (Part& p : m_parts) {
        if (p.reply) {
            QObject::disconnect(p.reply, nullptr, this, nullptr);
            p.reply->abort();
            p.reply->deleteLater();
            p.reply = nullptr;
        }
    }
    if (m_headReply) {
        QObject::disconnect(m_headReply, nullptr, this, nullptr);
        m_headReply->abort();
        m_headReply->deleteLater();
        m_headReply = nullptr;
    }
}
