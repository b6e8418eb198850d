#pragma once

#include "core/ipc/message.h"
#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QMap>
#include <QPointer>
#include <functional>
#include <memory>
#include <optional>

namespace sl {

// Local-socket front end of the engine. Frames are decoded per client and
// handed to the registered handler, which either answers at once or keeps
// the responder and answers later from any thread.
class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    // Thread-safe. The envelope is written on the server's thread and dropped
    // if the client has disconnected by then.
    using Responder = std::function<void(const QJsonObject& envelope)>;
    // nullopt means the handler kept `respond` and will answer later.
    using RequestHandler =
        std::function<std::optional<QJsonObject>(const QJsonObject& request, const Responder& respond)>;

    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;

    void setRequestHandler(RequestHandler handler);

    int clientCount() const { return static_cast<int>(m_clients.size()); }

    static constexpr int kMaxReadBufferSize = IpcMessage::kMaxMessageSize + 4;

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private slots:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    bool detachClient(QLocalSocket* client);
    void processBuffer(QLocalSocket* client);
    void writeResponse(const QPointer<QLocalSocket>& client, const QJsonObject& envelope);

    std::unique_ptr<QLocalServer> m_server;
    QList<QLocalSocket*> m_clients;
    QMap<QLocalSocket*, QByteArray> m_readBuffers;
    RequestHandler m_handler;
    bool m_closing = false;
};

} // namespace sl
