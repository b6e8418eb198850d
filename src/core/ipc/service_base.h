#pragma once

#include "core/ipc/socket_server.h"
#include <QCoreApplication>
#include <QString>
#include <QThreadPool>
#include <memory>

namespace sl {

// Base for socket-served processes: owns the SocketServer, resolves the
// socket location and answers the built-in ping/shutdown methods. Methods a
// subclass marks long-running are answered from a worker pool so the event
// loop keeps serving the rest.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Listens and prints "ready" for a supervisor.
    bool start();
    // start(), then the event loop.
    int run();

    // $SOURCELIGHT_SOCKET_DIR, else $SOURCELIGHT_RUNTIME_DIR, else /tmp/sourcelight-<uid>.
    static QString runtimeDirectory();
    static QString socketDirectory();
    static QString socketPath(const QString& serviceName);

protected:
    // Called on a worker thread for long-running methods.
    virtual QJsonObject handleRequest(const QJsonObject& request);
    virtual bool isLongRunning(const QString& method) const;

    // Blocks until every queued long-running request has answered.
    void waitForWorkers();

    QJsonObject handlePing(uint64_t id);
    QJsonObject handleShutdown(uint64_t id);

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
    QThreadPool m_workers;
};

} // namespace sl
