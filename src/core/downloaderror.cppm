/*!
 * @file        downloaderror.cppm
 * @brief       Error type carried by failed download futures.
 * @details     DownloadError derives from QException so it can be stored in a
 *              QPromise and rethrown by QFuture::result(), waitForFinished()
 *              or handled through QFuture::onFailed().
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QException>
#include <QString>

#ifndef Q_MOC_RUN
export module barq.core.downloaderror;
#endif

#ifdef Q_MOC_RUN
#define BARQ_MODULE_EXPORT
#else
#define BARQ_MODULE_EXPORT export
#endif

/**
 * @brief Failure of a download operation.
 */
BARQ_MODULE_EXPORT class DownloadError : public QException {
public:
    /**
     * @brief Failure category.
     */
    enum class Kind {
        HttpStatus,     //!< Server answered with an unexpected status code.
        Network,        //!< Transport failure (DNS, connect, timeout, truncation).
        Cancelled,      //!< Cancelled by the caller.
        FileWrite,      //!< Result could not be persisted.
        InvalidUrl,     //!< URL is not an absolute http(s) URL.
        ImageDecode,    //!< Payload is not a decodable image.
        SessionBusy     //!< Another download is already active.
    };

    /**
     * @brief Construct an error.
     * @param kind Failure category.
     * @param message Human-readable description.
     * @param statusCode HTTP status for Kind::HttpStatus, 0 otherwise.
     */
    DownloadError(Kind kind, const QString& message, int statusCode = 0);

    //!< @brief Unexpected HTTP status.
    static DownloadError httpStatus(int statusCode);

    //!< @brief Transport failure with the reply's error string.
    static DownloadError network(const QString& reason);

    //!< @brief Caller-initiated cancellation.
    static DownloadError cancelled();

    //!< @brief Persistence failure.
    static DownloadError fileWrite(const QString& path, const QString& reason);

    //!< @brief Rejected URL.
    static DownloadError invalidUrl(const QString& url);

    //!< @brief Undecodable image payload.
    static DownloadError imageDecode();

    //!< @brief Rejected because a session is active.
    static DownloadError sessionBusy();

    Kind kind() const { return m_kind; }
    int statusCode() const { return m_statusCode; }
    QString message() const { return m_message; }

    //!< @brief Stable name of a kind, used in logs.
    static QString kindName(Kind kind);

    const char* what() const noexcept override { return m_what.constData(); }
    void raise() const override { throw *this; }
    DownloadError* clone() const override { return new DownloadError(*this); }

private:
    Kind m_kind;
    QString m_message;
    int m_statusCode = 0;
    QByteArray m_what;
};
