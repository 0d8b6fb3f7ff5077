#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFutureWatcher>
#include <QImage>
#include <QTextStream>
#include <QUrl>

import barq.core.downloadcontroller;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace {

class ConsoleProgress : public ProgressSink {
public:
    void onProgress(double percent, double speedBytesPerSec) override
    {
        QTextStream out(stdout);
        out << QStringLiteral("\r%1%  %2 KiB/s   ")
                   .arg(percent, 6, 'f', 2)
                   .arg(speedBytesPerSec / 1024.0, 0, 'f', 1);
        out.flush();
    }
};

template <typename T>
int reportFailure(const QFuture<T>& future)
{
    QTextStream err(stderr);
    try {
        future.waitForFinished();
    } catch (const DownloadError& error) {
        err << "\nerror: " << error.what() << Qt::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Barq"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Download a file or image over HTTP."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption partsOption(QStringList{ "p", "parts" },
                                   QStringLiteral("Fetch as <count> concurrent ranged parts."),
                                   QStringLiteral("count"), QStringLiteral("1"));
    QCommandLineOption imageOption(QStringList{ "i", "image" },
                                   QStringLiteral("Decode the payload as an image instead of saving it."));
    QCommandLineOption outputOption(QStringList{ "o", "output-dir" },
                                    QStringLiteral("Store files in <dir>."),
                                    QStringLiteral("dir"));
    parser.addOption(partsOption);
    parser.addOption(imageOption);
    parser.addOption(outputOption);
    parser.addPositionalArgument(QStringLiteral("url"), QStringLiteral("Resource to download."));
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(1);
    }
    const QUrl url = QUrl::fromUserInput(args.first());

    DownloadController controller;
    if (parser.isSet(outputOption)) {
        DownloaderSettings settings = controller.settings();
        settings.storageDirectory = parser.value(outputOption);
        controller.setSettings(settings);
    }

    ConsoleProgress sink;
    QTextStream out(stdout);

    if (parser.isSet(imageOption)) {
        QFutureWatcher<QImage> watcher;
        QObject::connect(&watcher, &QFutureWatcher<QImage>::finished, &app, [&]() {
            const int rc = reportFailure(watcher.future());
            if (rc == 0) {
                const QImage image = watcher.result();
                out << "\nimage " << image.width() << "x" << image.height() << Qt::endl;
            }
            QCoreApplication::exit(rc);
        });
        watcher.setFuture(controller.downloadImage(url, &sink));
        return app.exec();
    }

    const int parts = qMax(1, parser.value(partsOption).toInt());
    QFutureWatcher<QString> watcher;
    QObject::connect(&watcher, &QFutureWatcher<QString>::finished, &app, [&]() {
        const int rc = reportFailure(watcher.future());
        if (rc == 0) {
            out << "\nsaved " << watcher.result() << Qt::endl;
        }
        QCoreApplication::exit(rc);
    });
    watcher.setFuture(parts > 1 ? controller.downloadFileMultipart(url, &sink, parts)
                                : controller.downloadFile(url, &sink));
    return app.exec();
}
