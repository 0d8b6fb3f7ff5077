#include "test_http_server.h"

#include <QHostAddress>
#include <QPointer>
#include <QTcpSocket>
#include <QTimer>

namespace barq::test {

namespace {

QByteArray reasonPhrase(int status)
{
    switch (status) {
    case 200: return "OK";
    case 206: return "Partial Content";
    case 404: return "Not Found";
    case 416: return "Range Not Satisfiable";
    case 500: return "Internal Server Error";
    }
    return "Status";
}

bool parseRange(const QByteArray& value, qint64 size, qint64& start, qint64& end)
{
    const QByteArray v = value.trimmed();
    if (!v.startsWith("bytes=")) return false;
    const QByteArray bounds = v.mid(6);
    const int dash = bounds.indexOf('-');
    if (dash <= 0) return false;
    bool okStart = false;
    start = bounds.left(dash).toLongLong(&okStart);
    if (!okStart) return false;
    const QByteArray endPart = bounds.mid(dash + 1);
    if (endPart.isEmpty()) {
        end = size - 1;
    } else {
        bool okEnd = false;
        end = endPart.toLongLong(&okEnd);
        if (!okEnd) return false;
    }
    end = qMin(end, size - 1);
    return start <= end;
}

} // namespace

TestHttpServer::TestHttpServer()
{
    QObject::connect(&m_server, &QTcpServer::newConnection, &m_server, [this] { onNewConnection(); });
    m_server.listen(QHostAddress::LocalHost, 0);
}

TestHttpServer::~TestHttpServer()
{
    m_server.close();
}

QUrl TestHttpServer::url(const QString& path) const
{
    return QUrl(QStringLiteral("http://127.0.0.1:%1%2").arg(port()).arg(path));
}

int TestHttpServer::requestCount(const QByteArray& method) const
{
    int count = 0;
    for (const RecordedRequest& r : m_requests) {
        if (r.method == method) ++count;
    }
    return count;
}

quint16 TestHttpServer::unusedPort()
{
    QTcpServer probe;
    probe.listen(QHostAddress::LocalHost, 0);
    const quint16 port = probe.serverPort();
    probe.close();
    return port;
}

void TestHttpServer::onNewConnection()
{
    while (QTcpSocket* socket = m_server.nextPendingConnection()) {
        auto buffer = std::make_shared<QByteArray>();
        auto handled = std::make_shared<bool>(false);
        QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket, buffer, handled] {
            buffer->append(socket->readAll());
            if (*handled) return;
            const int headerEnd = buffer->indexOf("\r\n\r\n");
            if (headerEnd < 0) return;
            *handled = true;
            respond(socket, buffer->left(headerEnd));
        });
    }
}

void TestHttpServer::respond(QTcpSocket* socket, const QByteArray& head)
{
    const QList<QByteArray> lines = head.split('\n');
    const QList<QByteArray> requestLine = lines.value(0).trimmed().split(' ');

    RecordedRequest recorded;
    recorded.method = requestLine.value(0);
    recorded.path = QUrl(QString::fromUtf8(requestLine.value(1))).path();
    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        const int sep = line.indexOf(':');
        if (sep <= 0) continue;
        if (line.left(sep).trimmed().toLower() == "range") {
            recorded.range = line.mid(sep + 1).trimmed();
        }
    }
    m_requests.append(recorded);

    Route route;
    if (m_routes.contains(recorded.path)) {
        route = m_routes.value(recorded.path);
    } else {
        route.status = 404;
        route.body = "not found";
    }

    int status = route.status;
    QByteArray payload = route.body;
    QByteArray headers;
    if (status == 200 && !recorded.range.isEmpty() && route.acceptRanges && route.honorRanges) {
        qint64 start = 0;
        qint64 end = 0;
        const qint64 size = route.body.size();
        if (parseRange(recorded.range, size, start, end)) {
            if (route.shortRanges && end > start) --end;
            status = 206;
            payload = route.body.mid(start, end - start + 1);
            headers += "Content-Range: bytes " + QByteArray::number(start) + "-"
                       + QByteArray::number(end) + "/" + QByteArray::number(size) + "\r\n";
        } else {
            status = 416;
            payload.clear();
        }
    }

    QByteArray response = "HTTP/1.1 " + QByteArray::number(status) + " " + reasonPhrase(status) + "\r\n";
    response += "Connection: close\r\n";
    response += "Content-Type: application/octet-stream\r\n";
    if (route.acceptRanges) response += "Accept-Ranges: bytes\r\n";
    if (route.contentLength) response += "Content-Length: " + QByteArray::number(payload.size()) + "\r\n";
    response += headers;
    response += "\r\n";
    socket->write(response);

    if (route.truncateAt >= 0) payload.truncate(route.truncateAt);

    if (recorded.method == "HEAD" || payload.isEmpty()) {
        socket->disconnectFromHost();
        return;
    }
    if (route.chunkSize <= 0) {
        socket->write(payload);
        socket->disconnectFromHost();
        return;
    }
    writePaced(socket, payload, route);
}

void TestHttpServer::writePaced(QTcpSocket* socket, const QByteArray& payload, const Route& route)
{
    QPointer<QTcpSocket> socketPtr(socket);
    auto offset = std::make_shared<qint64>(0);
    auto* timer = new QTimer(socket);
    timer->setInterval(route.chunkIntervalMs);
    const int chunkSize = route.chunkSize;
    QObject::connect(timer, &QTimer::timeout, socket, [socketPtr, timer, payload, offset, chunkSize] {
        if (!socketPtr || socketPtr->state() != QAbstractSocket::ConnectedState) {
            timer->stop();
            return;
        }
        const QByteArray slice = payload.mid(*offset, chunkSize);
        socketPtr->write(slice);
        socketPtr->flush();
        *offset += slice.size();
        if (*offset >= payload.size()) {
            timer->stop();
            socketPtr->disconnectFromHost();
        }
    });
    timer->start();
}

} // namespace barq::test
