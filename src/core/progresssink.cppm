/*!
 * @file        progresssink.cppm
 * @brief       Progress reporting capability passed to download operations.
 * @details     A ProgressSink receives one sample per received chunk, followed
 *              by the (100, 0) and (0, 0) pair once the download has ended,
 *              whatever its outcome.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <functional>
#include <utility>

#ifndef Q_MOC_RUN
export module barq.core.progresssink;
#endif

#ifdef Q_MOC_RUN
#define BARQ_MODULE_EXPORT
#else
#define BARQ_MODULE_EXPORT export
#endif

/**
 * @brief One progress report.
 */
BARQ_MODULE_EXPORT struct ProgressSample {
    double percent = 0.0;   //!< Completion in [0, 100].
    double speed = 0.0;     //!< Instantaneous rate in bytes/sec.
};

/**
 * @brief Receiver of download progress.
 *
 * Implementations are invoked on the controller's thread and may be called
 * many times per second.
 */
BARQ_MODULE_EXPORT class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    /**
     * @brief Report progress.
     * @param percent Completion in [0, 100].
     * @param speedBytesPerSec Rate of the latest chunk, never negative.
     */
    virtual void onProgress(double percent, double speedBytesPerSec) = 0;
};

/**
 * @brief ProgressSink adapter for a plain callable.
 */
BARQ_MODULE_EXPORT class CallbackProgressSink : public ProgressSink {
public:
    using Callback = std::function<void(double percent, double speedBytesPerSec)>;

    explicit CallbackProgressSink(Callback callback)
        : m_callback(std::move(callback)) {}

    void onProgress(double percent, double speedBytesPerSec) override
    {
        if (m_callback) m_callback(percent, speedBytesPerSec);
    }

private:
    Callback m_callback;
};
