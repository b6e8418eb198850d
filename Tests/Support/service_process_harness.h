#pragma once

#include "core/ipc/socket_client.h"

#include <QHash>
#include <QJsonObject>
#include <QProcess>
#include <QString>
#include <QTemporaryDir>

namespace sl::test {

struct ServiceLaunchConfig {
    QString dataDir;                 // exported as SOURCELIGHT_DATA_DIR
    QHash<QString, QString> env;
    bool forwardChannels = true;
    int startTimeoutMs = 5000;
    int readyTimeoutMs = 20000;
    int requestDefaultTimeoutMs = 10000;
};

// Runs an engine binary on a private socket directory and keeps a client
// connected to it.
class ServiceProcessHarness {
public:
    ServiceProcessHarness(QString serviceName, QString binaryName);
    ~ServiceProcessHarness();

    ServiceProcessHarness(const ServiceProcessHarness&) = delete;
    ServiceProcessHarness& operator=(const ServiceProcessHarness&) = delete;

    bool start(const ServiceLaunchConfig& config = {});
    void stop();

    bool isRunning() const;
    QString socketPath() const { return m_socketPath; }
    QString binaryPath() const { return m_binaryPath; }
    QProcess& process() { return m_process; }

    QJsonObject request(const QString& method, const QJsonObject& params = {}, int timeoutMs = -1);

private:
    QString m_serviceName;
    QString m_binaryName;
    QString m_binaryPath;

    QTemporaryDir m_socketDir;
    QString m_socketPath;

    QProcess m_process;
    SocketClient m_client;
    bool m_started = false;
    int m_requestDefaultTimeoutMs = 10000;
};

} // namespace sl::test
