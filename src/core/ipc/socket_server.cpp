#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"
#include <QJsonObject>

namespace sl {

namespace {

// A leftover socket file from a crashed engine refuses connections; a live
// engine accepts them.
bool socketHasActivePeer(const QString& socketPath)
{
    QLocalSocket peer;
    peer.connectToServer(socketPath);
    const bool connected = peer.waitForConnected(150);
    if (connected) {
        peer.disconnectFromServer();
    }
    return connected;
}

uint64_t requestId(const QJsonObject& message)
{
    return static_cast<uint64_t>(message.value(QStringLiteral("id")).toInteger());
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>(this))
{
    connect(m_server.get(), &QLocalServer::newConnection,
            this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    if (m_server->listen(socketPath)) {
        LOG_INFO(slIpc, "Listening on %s", qPrintable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        const QString err = m_server->errorString();
        LOG_ERROR(slIpc, "Failed to listen on %s: %s", qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    if (socketHasActivePeer(socketPath)) {
        const QString err = QStringLiteral("Socket already served by a running engine: %1")
                                .arg(socketPath);
        LOG_ERROR(slIpc, "%s", qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_WARN(slIpc, "Removing stale socket %s", qPrintable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        const QString err = m_server->errorString();
        LOG_ERROR(slIpc, "Failed to listen on %s after stale cleanup: %s",
                  qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_INFO(slIpc, "Listening on %s", qPrintable(socketPath));
    return true;
}

void SocketServer::close()
{
    if (m_closing) {
        return;
    }
    m_closing = true;

    const QList<QLocalSocket*> clients = m_clients;
    m_clients.clear();
    m_readBuffers.clear();
    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        if (client->state() != QLocalSocket::UnconnectedState) {
            client->disconnectFromServer();
        }
        client->deleteLater();
    }

    if (m_server->isListening()) {
        const QString path = m_server->fullServerName();
        m_server->close();
        LOG_INFO(slIpc, "Server closed: %s", qPrintable(path));
    }

    m_closing = false;
}

bool SocketServer::isListening() const
{
    return m_server->isListening();
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        m_clients.append(client);
        m_readBuffers.insert(client, QByteArray());

        connect(client, &QLocalSocket::readyRead,
                this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected,
                this, &SocketServer::onClientDisconnected);

        LOG_DEBUG(slIpc, "Client connected (%d active)", clientCount());
        emit clientConnected();
    }
}

void SocketServer::onClientReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client || !m_readBuffers.contains(client)) {
        return;
    }

    QByteArray& buffer = m_readBuffers[client];
    buffer.append(client->readAll());
    if (buffer.size() > kMaxReadBufferSize) {
        LOG_ERROR(slIpc, "Client exceeded %d buffered bytes, dropping connection",
                  kMaxReadBufferSize);
        if (detachClient(client)) {
            client->disconnectFromServer();
            client->deleteLater();
            emit clientDisconnected();
        }
        return;
    }

    processBuffer(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (client && detachClient(client)) {
        LOG_DEBUG(slIpc, "Client disconnected");
        client->deleteLater();
        emit clientDisconnected();
    }
}

bool SocketServer::detachClient(QLocalSocket* client)
{
    const bool removedClient = m_clients.removeOne(client);
    const bool removedBuffer = m_readBuffers.remove(client) > 0;
    return removedClient || removedBuffer;
}

void SocketServer::processBuffer(QLocalSocket* client)
{
    while (m_readBuffers.contains(client)) {
        QByteArray& buffer = m_readBuffers[client];
        const auto decoded = IpcMessage::decode(buffer);
        if (!decoded) {
            return;
        }
        buffer.remove(0, decoded->bytesConsumed);

        const QJsonObject& incoming = decoded->json;
        const QString type = incoming.value(QStringLiteral("type")).toString();
        if (type != QLatin1String("request")) {
            LOG_WARN(slIpc, "Ignoring message of type '%s'", qPrintable(type));
            continue;
        }

        LOG_DEBUG(slIpc, "Request method=%s id=%llu",
                  qPrintable(incoming.value(QStringLiteral("method")).toString()),
                  static_cast<unsigned long long>(requestId(incoming)));

        if (!m_handler) {
            writeResponse(client, IpcMessage::makeError(requestId(incoming), IpcErrorCode::InternalError,
                                                        QStringLiteral("No request handler registered")));
            continue;
        }

        const QPointer<QLocalSocket> target(client);
        const Responder respond = [this, target](const QJsonObject& envelope) {
            QMetaObject::invokeMethod(
                this, [this, target, envelope]() { writeResponse(target, envelope); },
                Qt::QueuedConnection);
        };
        const std::optional<QJsonObject> response = m_handler(incoming, respond);
        if (response) {
            writeResponse(client, *response);
        }
    }
}

void SocketServer::writeResponse(const QPointer<QLocalSocket>& client, const QJsonObject& envelope)
{
    if (!client || !m_clients.contains(client.data())) {
        LOG_DEBUG(slIpc, "Dropping response id=%llu for a closed client",
                  static_cast<unsigned long long>(requestId(envelope)));
        return;
    }
    const QByteArray encoded = IpcMessage::encode(envelope);
    if (!encoded.isEmpty()) {
        client->write(encoded);
        client->flush();
    }
}

} // namespace sl
