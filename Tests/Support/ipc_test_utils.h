#pragma once

#include "core/ipc/socket_client.h"

#include <QJsonObject>
#include <QLocalSocket>
#include <QString>

#include <vector>

namespace sl::test {

QString resolveServiceBinary(const QString& binaryName);
bool waitForSocketFile(const QString& socketPath, int timeoutMs);
bool waitForServiceReady(SocketClient& client, const QString& socketPath, int timeoutMs,
                         int pingTimeoutMs);

// Never returns an empty object: a failed or timed-out request becomes a
// synthetic error envelope carrying diagnostics.
QJsonObject requestOrFailWithDiagnostics(SocketClient& client,
                                         const QString& method,
                                         const QJsonObject& params = {},
                                         int timeoutMs = 3000,
                                         const QString& socketPath = {});

// Writes several requests without waiting and records envelopes in arrival
// order. Waiting spins the caller's event loop, so an in-process server
// keeps serving.
class PipelinedConnection {
public:
    bool connectTo(const QString& socketPath, int timeoutMs = 2000);
    void send(uint64_t id, const QString& method, const QJsonObject& params = {});
    bool waitForResponses(int count, int timeoutMs);
    const std::vector<QJsonObject>& responses() const { return m_responses; }

private:
    void drain();

    QLocalSocket m_socket;
    QByteArray m_buffer;
    std::vector<QJsonObject> m_responses;
};

bool isResponse(const QJsonObject& message);
bool isError(const QJsonObject& message);
QJsonObject resultPayload(const QJsonObject& message);
QJsonObject errorPayload(const QJsonObject& message);

} // namespace sl::test
