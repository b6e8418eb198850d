#include "core/ipc/service_base.h"
#include "core/shared/logging.h"
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QJsonObject>

#include <unistd.h>

#include <cstdio>

namespace sl {

namespace {

QString envPath(const char* envName)
{
    const QString value = qEnvironmentVariable(envName).trimmed();
    return value.isEmpty() ? QString() : QDir::cleanPath(value);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>(this))
{
    m_server->setRequestHandler([this](const QJsonObject& request,
                                       const SocketServer::Responder& respond)
                                    -> std::optional<QJsonObject> {
        if (!isLongRunning(request.value(QStringLiteral("method")).toString())) {
            return handleRequest(request);
        }
        m_workers.start([this, request, respond]() { respond(handleRequest(request)); });
        return std::nullopt;
    });
}

ServiceBase::~ServiceBase()
{
    waitForWorkers();
}

void ServiceBase::waitForWorkers()
{
    m_workers.waitForDone();
}

bool ServiceBase::isLongRunning(const QString& /*method*/) const
{
    return false;
}

bool ServiceBase::start()
{
    const QString path = socketPath(m_serviceName);
    const QDir dir = QFileInfo(path).dir();
    if (!dir.exists() && !QDir().mkpath(dir.path())) {
        LOG_ERROR(slIpc, "Failed to create socket directory: %s", qPrintable(dir.path()));
        return false;
    }

    if (!m_server->listen(path)) {
        LOG_ERROR(slIpc, "Service '%s' failed to start", qPrintable(m_serviceName));
        return false;
    }

    LOG_INFO(slIpc, "Service '%s' started on %s", qPrintable(m_serviceName), qPrintable(path));
    std::fprintf(stdout, "ready\n");
    std::fflush(stdout);
    return true;
}

int ServiceBase::run()
{
    if (!start()) {
        return 1;
    }
    return QCoreApplication::exec();
}

QString ServiceBase::runtimeDirectory()
{
    const QString runtimeDir = envPath("SOURCELIGHT_RUNTIME_DIR");
    if (!runtimeDir.isEmpty()) {
        return runtimeDir;
    }
    return QStringLiteral("/tmp/sourcelight-%1").arg(getuid());
}

QString ServiceBase::socketDirectory()
{
    const QString socketDir = envPath("SOURCELIGHT_SOCKET_DIR");
    return socketDir.isEmpty() ? runtimeDirectory() : socketDir;
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir::cleanPath(socketDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".sock"));
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger());

    if (method == QLatin1String("ping")) {
        return handlePing(id);
    }
    if (method == QLatin1String("shutdown")) {
        return handleShutdown(id);
    }

    LOG_WARN(slIpc, "Unknown method '%s' in service '%s'",
             qPrintable(method), qPrintable(m_serviceName));
    return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown method: %1").arg(method));
}

QJsonObject ServiceBase::handlePing(uint64_t id)
{
    QJsonObject result;
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    result[QStringLiteral("service")] = m_serviceName;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject ServiceBase::handleShutdown(uint64_t id)
{
    LOG_INFO(slIpc, "Shutdown requested for service '%s'", qPrintable(m_serviceName));

    // Quit after the response has been written.
    QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                              Qt::QueuedConnection);

    QJsonObject result;
    result[QStringLiteral("shutting_down")] = true;
    return IpcMessage::makeResponse(id, result);
}

} // namespace sl
