#include <QtTest/QtTest>

#include "core/ipc/message.h"
#include "core/ipc/service_base.h"
#include "ipc_test_utils.h"

#include <QDir>
#include <QJsonArray>
#include <QTemporaryDir>
#include <QThread>

namespace {

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* key, const QByteArray& value)
        : m_key(key)
        , m_hadOriginal(qEnvironmentVariableIsSet(key))
        , m_original(qgetenv(key))
    {
        qputenv(m_key, value);
    }

    ~ScopedEnvVar()
    {
        if (m_hadOriginal) {
            qputenv(m_key, m_original);
        } else {
            qunsetenv(m_key);
        }
    }

private:
    const char* m_key;
    bool m_hadOriginal = false;
    QByteArray m_original;
};

class TestServiceBaseImpl final : public sl::ServiceBase {
public:
    explicit TestServiceBaseImpl(const QString& serviceName)
        : sl::ServiceBase(serviceName)
    {
    }

    QJsonObject dispatch(const QJsonObject& request)
    {
        return handleRequest(request);
    }
};

// Routes "suggestions" itself and leaves everything else to the base.
class SuggestingService final : public sl::ServiceBase {
public:
    SuggestingService()
        : sl::ServiceBase(QStringLiteral("rag"))
    {
    }

    QJsonObject dispatch(const QJsonObject& request)
    {
        return handleRequest(request);
    }

protected:
    QJsonObject handleRequest(const QJsonObject& request) override
    {
        if (request.value(QStringLiteral("method")).toString() == QLatin1String("suggestions")) {
            const uint64_t id = static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger());
            QJsonObject result;
            result[QStringLiteral("suggestions")] = QJsonArray{QStringLiteral("write-ahead log")};
            return sl::IpcMessage::makeResponse(id, result);
        }
        return sl::ServiceBase::handleRequest(request);
    }
};

// "slow" sleeps on the worker pool before answering.
class SlowService final : public sl::ServiceBase {
public:
    SlowService()
        : sl::ServiceBase(QStringLiteral("slow-unit"))
    {
    }

protected:
    QJsonObject handleRequest(const QJsonObject& request) override
    {
        if (request.value(QStringLiteral("method")).toString() == QLatin1String("slow")) {
            QThread::msleep(400);
            QJsonObject result;
            result[QStringLiteral("done")] = true;
            return sl::IpcMessage::makeResponse(
                static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger()), result);
        }
        return sl::ServiceBase::handleRequest(request);
    }

    bool isLongRunning(const QString& method) const override
    {
        return method == QLatin1String("slow");
    }
};

} // namespace

class TestServiceBase : public QObject {
    Q_OBJECT

private slots:
    void testSocketDirectoryOverrideAndPathNormalization();
    void testSocketFallsBackToRuntimeDirectory();
    void testDefaultRuntimeDirectoryIsPerUser();
    void testHandlePingRequest();
    void testUnknownMethodReturnsNotFoundError();
    void testSubclassRoutesBeforeBuiltins();
    void testShutdownAcknowledges();
    void testLongRunningMethodLeavesEventLoopFree();
};

void TestServiceBase::testSocketDirectoryOverrideAndPathNormalization()
{
    const QByteArray runtimeRaw = "/tmp/sl-runtime/../sl-runtime";
    const QByteArray socketRaw = "/tmp/sl-sockets/./nested/..";

    ScopedEnvVar runtimeEnv("SOURCELIGHT_RUNTIME_DIR", runtimeRaw);
    ScopedEnvVar socketEnv("SOURCELIGHT_SOCKET_DIR", socketRaw);

    QCOMPARE(sl::ServiceBase::runtimeDirectory(),
             QDir::cleanPath(QString::fromUtf8(runtimeRaw)));
    QCOMPARE(sl::ServiceBase::socketDirectory(),
             QDir::cleanPath(QString::fromUtf8(socketRaw)));
    QCOMPARE(sl::ServiceBase::socketPath(QStringLiteral("rag")),
             QDir::cleanPath(QString::fromUtf8(socketRaw) + "/rag.sock"));
}

void TestServiceBase::testSocketFallsBackToRuntimeDirectory()
{
    const QByteArray runtimeRaw = "/tmp/sl-runtime-fallback/./nested/..";

    ScopedEnvVar runtimeEnv("SOURCELIGHT_RUNTIME_DIR", runtimeRaw);
    ScopedEnvVar socketEnv("SOURCELIGHT_SOCKET_DIR", QByteArray());

    const QString runtime = QDir::cleanPath(QString::fromUtf8(runtimeRaw));
    QCOMPARE(sl::ServiceBase::runtimeDirectory(), runtime);
    QCOMPARE(sl::ServiceBase::socketDirectory(), runtime);
}

void TestServiceBase::testDefaultRuntimeDirectoryIsPerUser()
{
    ScopedEnvVar runtimeEnv("SOURCELIGHT_RUNTIME_DIR", QByteArray("   "));
    ScopedEnvVar socketEnv("SOURCELIGHT_SOCKET_DIR", QByteArray());

    QVERIFY(sl::ServiceBase::runtimeDirectory().startsWith(QStringLiteral("/tmp/sourcelight-")));
    QVERIFY(sl::ServiceBase::socketPath(QStringLiteral("rag")).endsWith(QStringLiteral("/rag.sock")));
}

void TestServiceBase::testHandlePingRequest()
{
    TestServiceBaseImpl service(QStringLiteral("service-base-unit"));
    const QJsonObject request = sl::IpcMessage::makeRequest(11, QStringLiteral("ping"));

    const QJsonObject response = service.dispatch(request);
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    QCOMPARE(response.value(QStringLiteral("id")).toInteger(), 11);

    const QJsonObject result = response.value(QStringLiteral("result")).toObject();
    QCOMPARE(result.value(QStringLiteral("ok")).toBool(), true);
    QCOMPARE(result.value(QStringLiteral("pong")).toBool(), true);
    QCOMPARE(result.value(QStringLiteral("service")).toString(), QStringLiteral("service-base-unit"));
    QVERIFY(result.value(QStringLiteral("timestamp")).toInteger() > 0);
}

void TestServiceBase::testUnknownMethodReturnsNotFoundError()
{
    TestServiceBaseImpl service(QStringLiteral("service-base-unit"));
    const QJsonObject request =
        sl::IpcMessage::makeRequest(27, QStringLiteral("unknown.method"));

    const QJsonObject response = service.dispatch(request);
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("error"));
    QCOMPARE(response.value(QStringLiteral("id")).toInteger(), 27);
    QCOMPARE(response.value(QStringLiteral("ok")).toBool(true), false);

    const QJsonObject error = response.value(QStringLiteral("error")).toObject();
    QCOMPARE(error.value(QStringLiteral("code")).toInt(),
             static_cast<int>(sl::IpcErrorCode::NotFound));
    QCOMPARE(error.value(QStringLiteral("codeString")).toString(),
             sl::ipcErrorCodeToString(sl::IpcErrorCode::NotFound));
    QVERIFY(error.value(QStringLiteral("message"))
                .toString()
                .contains(QStringLiteral("unknown.method")));
}

void TestServiceBase::testSubclassRoutesBeforeBuiltins()
{
    SuggestingService service;
    QJsonObject response = service.dispatch(
        sl::IpcMessage::makeRequest(3, QStringLiteral("suggestions"),
                                    QJsonObject{{QStringLiteral("q"), QStringLiteral("wal")}}));
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    const QJsonObject result = response.value(QStringLiteral("result")).toObject();
    QCOMPARE(result.value(QStringLiteral("suggestions")).toArray().size(), 1);
    QCOMPARE(result.value(QStringLiteral("ok")).toBool(), true);

    response = service.dispatch(sl::IpcMessage::makeRequest(4, QStringLiteral("ping")));
    QCOMPARE(response.value(QStringLiteral("result")).toObject()
                 .value(QStringLiteral("service")).toString(),
             QStringLiteral("rag"));

    response = service.dispatch(sl::IpcMessage::makeRequest(5, QStringLiteral("search")));
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("error"));
}

void TestServiceBase::testShutdownAcknowledges()
{
    TestServiceBaseImpl service(QStringLiteral("service-base-unit"));
    const QJsonObject response =
        service.dispatch(sl::IpcMessage::makeRequest(9, QStringLiteral("shutdown")));
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    QCOMPARE(response.value(QStringLiteral("result")).toObject()
                 .value(QStringLiteral("shutting_down")).toBool(),
             true);
}

void TestServiceBase::testLongRunningMethodLeavesEventLoopFree()
{
    QTemporaryDir socketDir;
    QVERIFY(socketDir.isValid());
    ScopedEnvVar socketEnv("SOURCELIGHT_SOCKET_DIR", socketDir.path().toUtf8());

    SlowService service;
    QVERIFY(service.start());

    sl::test::PipelinedConnection connection;
    QVERIFY(connection.connectTo(sl::ServiceBase::socketPath(QStringLiteral("slow-unit"))));
    connection.send(1, QStringLiteral("slow"));
    connection.send(2, QStringLiteral("ping"));
    connection.send(3, QStringLiteral("slow"));
    QVERIFY(connection.waitForResponses(3, 5000));

    const std::vector<QJsonObject>& responses = connection.responses();
    QCOMPARE(responses.front().value(QStringLiteral("id")).toInteger(), 2);
    QCOMPARE(responses.front().value(QStringLiteral("result")).toObject()
                 .value(QStringLiteral("pong")).toBool(),
             true);

    QSet<qint64> slowIds;
    for (size_t i = 1; i < responses.size(); ++i) {
        QCOMPARE(responses[i].value(QStringLiteral("result")).toObject()
                     .value(QStringLiteral("done")).toBool(),
                 true);
        slowIds.insert(responses[i].value(QStringLiteral("id")).toInteger());
    }
    QCOMPARE(slowIds, (QSet<qint64>{1, 3}));
}

QTEST_MAIN(TestServiceBase)
#include "test_service_base.moc"
