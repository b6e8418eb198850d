#include "core/ipc/socket_client.h"
#include "core/shared/logging.h"
#include <QElapsedTimer>
#include <QJsonObject>

#include <algorithm>

namespace sl {

namespace {

bool isTransientConnectError(QLocalSocket::LocalSocketError error)
{
    switch (error) {
    case QLocalSocket::ServerNotFoundError:
    case QLocalSocket::ConnectionRefusedError:
    case QLocalSocket::SocketTimeoutError:
        return true;
    default:
        return false;
    }
}

} // namespace

SocketClient::SocketClient(QObject* parent)
    : QObject(parent)
    , m_socket(std::make_unique<QLocalSocket>(this))
{
    connect(m_socket.get(), &QLocalSocket::readyRead,
            this, &SocketClient::onReadyRead);
    connect(m_socket.get(), &QLocalSocket::disconnected,
            this, &SocketClient::onDisconnected);
}

SocketClient::~SocketClient()
{
    disconnect();
}

bool SocketClient::connectToServer(const QString& socketPath, int timeoutMs)
{
    const QString path = socketPath.trimmed();
    if (path.isEmpty() || timeoutMs <= 0) {
        const QString err = QStringLiteral("Invalid connect request: path='%1' timeout=%2ms")
                                .arg(path).arg(timeoutMs);
        LOG_ERROR(slIpc, "%s", qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    if (m_socket->state() == QLocalSocket::ConnectedState && m_socket->serverName() == path) {
        return true;
    }

    m_socket->abort();
    m_readBuffer.clear();
    m_pending.clear();

    m_socket->connectToServer(path);
    if (!m_socket->waitForConnected(timeoutMs)) {
        const auto error = m_socket->error();
        const QString err = m_socket->errorString();
        if (isTransientConnectError(error)) {
            LOG_DEBUG(slIpc, "Engine not ready at %s yet: %s", qPrintable(path), qPrintable(err));
        } else {
            LOG_ERROR(slIpc, "Connect failure for %s: %s (error=%d)",
                      qPrintable(path), qPrintable(err), static_cast<int>(error));
            emit errorOccurred(err);
        }
        return false;
    }

    LOG_INFO(slIpc, "Connected to %s", qPrintable(path));
    return true;
}

void SocketClient::disconnect()
{
    if (m_socket->state() != QLocalSocket::UnconnectedState) {
        m_socket->disconnectFromServer();
    }
    m_readBuffer.clear();
    m_pending.clear();
}

bool SocketClient::isConnected() const
{
    return m_socket->state() == QLocalSocket::ConnectedState;
}

std::optional<QJsonObject> SocketClient::sendRequest(const QString& method,
                                                     const QJsonObject& params,
                                                     int timeoutMs)
{
    if (!isConnected()) {
        LOG_WARN(slIpc, "Cannot send %s: not connected", qPrintable(method));
        return std::nullopt;
    }

    const uint64_t id = m_nextRequestId++;
    const QByteArray encoded = IpcMessage::encode(IpcMessage::makeRequest(id, method, params));
    if (encoded.isEmpty()) {
        LOG_WARN(slIpc, "Failed to encode request for method=%s", qPrintable(method));
        return std::nullopt;
    }

    auto pending = std::make_shared<PendingRequest>();
    m_pending[id] = pending;

    m_socket->write(encoded);
    m_socket->flush();

    // Wait on the socket itself rather than spinning the event loop.
    QElapsedTimer timer;
    timer.start();
    while (!pending->completed && timer.elapsed() < timeoutMs) {
        const int remainingMs = std::max(0, timeoutMs - static_cast<int>(timer.elapsed()));
        if (remainingMs == 0) {
            break;
        }
        if (m_socket->bytesAvailable() == 0) {
            m_socket->waitForReadyRead(std::min(remainingMs, 50));
        }
        if (m_socket->bytesAvailable() > 0 || m_socket->state() != QLocalSocket::ConnectedState) {
            onReadyRead();
        }
        if (m_socket->state() != QLocalSocket::ConnectedState && !pending->completed) {
            onDisconnected();
        }
    }

    m_pending.remove(id);

    if (!pending->completed) {
        LOG_WARN(slIpc, "Request timed out: method=%s id=%llu timeout=%dms",
                 qPrintable(method), static_cast<unsigned long long>(id), timeoutMs);
        return std::nullopt;
    }
    return pending->response;
}

void SocketClient::onReadyRead()
{
    m_readBuffer.append(m_socket->readAll());

    if (m_readBuffer.size() > kMaxReadBufferSize) {
        LOG_ERROR(slIpc, "Read buffer exceeded %d bytes, disconnecting", kMaxReadBufferSize);
        m_readBuffer.clear();
        m_socket->disconnectFromServer();
        return;
    }

    while (true) {
        auto result = IpcMessage::decode(m_readBuffer);
        if (!result) {
            break;
        }
        m_readBuffer.remove(0, result->bytesConsumed);

        const QJsonObject& msg = result->json;
        const QString type = msg.value(QStringLiteral("type")).toString();
        if (type != QLatin1String("response") && type != QLatin1String("error")) {
            LOG_WARN(slIpc, "Unexpected message type: %s", qPrintable(type));
            continue;
        }

        const uint64_t id = static_cast<uint64_t>(msg.value(QStringLiteral("id")).toInteger());
        auto it = m_pending.find(id);
        if (it == m_pending.end()) {
            LOG_WARN(slIpc, "Response for unknown request id=%llu",
                     static_cast<unsigned long long>(id));
            continue;
        }
        it.value()->response = msg;
        it.value()->completed = true;
    }
}

void SocketClient::onDisconnected()
{
    for (auto it = m_pending.begin(); it != m_pending.end(); ++it) {
        if (it.value()->completed) {
            continue;
        }
        it.value()->completed = true;
        it.value()->response = IpcMessage::makeError(it.key(), IpcErrorCode::EngineUnavailable,
                                                     QStringLiteral("Connection lost"));
    }
    emit disconnected();
}

} // namespace sl
