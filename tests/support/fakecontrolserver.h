#ifndef BOXLINK_TESTS_FAKECONTROLSERVER_H
#define BOXLINK_TESTS_FAKECONTROLSERVER_H

#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QList>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>

#include <functional>
#include <utility>

// Minimal HTTP/1.1 responder standing in for the engine's control API.
// One request per connection; the connection closes after the reply.

struct RecordedRequest {
  QByteArray method;
  QByteArray target;
  QHash<QByteArray, QByteArray> headers; // Lower-case names.
  QByteArray body;
};

struct CannedResponse {
  int status = 200;
  QByteArray body;
  bool hang = false; // Never answer; the client must time out.
};

class FakeControlServer {
public:
  using Handler = std::function<CannedResponse(const RecordedRequest&)>;

  FakeControlServer() {
    QObject::connect(&m_server, &QTcpServer::newConnection, &m_server, [this]() { acceptPending(); });
  }

  bool listen(const QHostAddress& address = QHostAddress::LocalHost, quint16 port = 0) {
    return m_server.listen(address, port);
  }

  void close() { m_server.close(); }
  quint16 port() const { return m_server.serverPort(); }
  QString errorString() const { return m_server.errorString(); }

  void setHandler(Handler handler) { m_handler = std::move(handler); }
  const QList<RecordedRequest>& requests() const { return m_requests; }

private:
  void acceptPending() {
    while (QTcpSocket *socket = m_server.nextPendingConnection()) {
      QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket]() { readFrom(socket); });
      QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
    }
  }

  void readFrom(QTcpSocket *socket) {
    QByteArray& buffer = m_buffers[socket];
    buffer.append(socket->readAll());

    const qsizetype headerEnd = buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
      return;
    }

    RecordedRequest request;
    const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
    const QList<QByteArray> requestLine = lines.value(0).trimmed().split(' ');
    request.method = requestLine.value(0);
    request.target = requestLine.value(1);
    for (qsizetype i = 1; i < lines.size(); ++i) {
      const QByteArray line = lines.at(i).trimmed();
      const qsizetype colon = line.indexOf(':');
      if (colon > 0) {
        request.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
      }
    }

    const qsizetype contentLength = request.headers.value("content-length", "0").toLongLong();
    if (buffer.size() - (headerEnd + 4) < contentLength) {
      return;
    }
    request.body = buffer.mid(headerEnd + 4, contentLength);
    m_buffers.remove(socket);
    m_requests.append(request);

    const CannedResponse response = m_handler ? m_handler(request) : CannedResponse {404, QByteArray(), false};
    if (response.hang) {
      return;
    }

    QByteArray reply = "HTTP/1.1 " + QByteArray::number(response.status) + " Status\r\n";
    reply += "Content-Type: application/json\r\n";
    reply += "Content-Length: " + QByteArray::number(response.body.size()) + "\r\n";
    reply += "Connection: close\r\n\r\n";
    reply += response.body;
    socket->write(reply);
    socket->disconnectFromHost();
  }

  QTcpServer m_server;
  Handler m_handler;
  QHash<QTcpSocket *, QByteArray> m_buffers;
  QList<RecordedRequest> m_requests;
};

#endif // BOXLINK_TESTS_FAKECONTROLSERVER_H
