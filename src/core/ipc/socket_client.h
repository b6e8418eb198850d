#pragma once

#include "core/ipc/message.h"
#include <QLocalSocket>
#include <QMap>
#include <QObject>
#include <memory>
#include <optional>

namespace sl {

// Blocking request/response client for the engine socket.
class SocketClient : public QObject {
    Q_OBJECT
public:
    explicit SocketClient(QObject* parent = nullptr);
    ~SocketClient() override;

    static constexpr int kMaxReadBufferSize = IpcMessage::kMaxMessageSize + 4;

    bool connectToServer(const QString& socketPath, int timeoutMs = 5000);
    void disconnect();
    bool isConnected() const;

    // Returns the response or error envelope, nullopt on timeout or when
    // not connected.
    std::optional<QJsonObject> sendRequest(const QString& method,
                                           const QJsonObject& params = {},
                                           int timeoutMs = 30000);

signals:
    void disconnected();
    void errorOccurred(const QString& error);

private slots:
    void onReadyRead();
    void onDisconnected();

private:
    std::unique_ptr<QLocalSocket> m_socket;
    QByteArray m_readBuffer;
    uint64_t m_nextRequestId = 1;

    struct PendingRequest {
        QJsonObject response;
        bool completed = false;
    };
    QMap<uint64_t, std::shared_ptr<PendingRequest>> m_pending;
};

} // namespace sl
