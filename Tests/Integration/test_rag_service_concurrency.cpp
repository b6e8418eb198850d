#include <QtTest/QtTest>

#include "rag_service.h"

#include "corpus_fixture.h"
#include "ipc_test_utils.h"
#include "test_doubles.h"

#include <QDir>
#include <QJsonArray>
#include <QJsonObject>
#include <QTemporaryDir>

#include <memory>

namespace {

class ScopedSocketDir {
public:
    explicit ScopedSocketDir(const QString& path)
        : m_original(qgetenv("SOURCELIGHT_SOCKET_DIR"))
        , m_hadOriginal(qEnvironmentVariableIsSet("SOURCELIGHT_SOCKET_DIR"))
    {
        qputenv("SOURCELIGHT_SOCKET_DIR", path.toUtf8());
    }

    ~ScopedSocketDir()
    {
        if (m_hadOriginal) {
            qputenv("SOURCELIGHT_SOCKET_DIR", m_original);
        } else {
            qunsetenv("SOURCELIGHT_SOCKET_DIR");
        }
    }

private:
    QByteArray m_original;
    bool m_hadOriginal = false;
};

} // namespace

class TestRagServiceConcurrency : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void testHealthAnswersDuringSlowSearch();
    void testConcurrentSearchesAllAnswer();

private:
    std::unique_ptr<sl::RagService> makeService(const std::shared_ptr<sl::test::CountingJudge>& judge);

    QTemporaryDir m_dataDir;
    QTemporaryDir m_socketDir;
};

void TestRagServiceConcurrency::initTestCase()
{
    QVERIFY(m_dataDir.isValid());
    QVERIFY(m_socketDir.isValid());
    QString error;
    QVERIFY2(sl::test::writeCorpus(m_dataDir.path(), QStringLiteral("OReilly"),
                                   sl::test::sampleLibrary(), {}, &error),
             qPrintable(error));
}

std::unique_ptr<sl::RagService> TestRagServiceConcurrency::makeService(
    const std::shared_ptr<sl::test::CountingJudge>& judge)
{
    sl::EngineConfig config;
    config.dataRoot = m_dataDir.path();
    config.publishers = QStringList{QStringLiteral("OReilly")};
    config.recentQueryLog = QDir(m_dataDir.path()).filePath(QStringLiteral("recent.json"));
    config.retrievalWorkers = 2;
    config.judgeBudgetMs = 4000;
    config.queryTimeoutMs = 8000;

    auto orchestrator = std::make_unique<sl::QueryOrchestrator>(
        config, sl::QueryOrchestrator::Dependencies{std::make_shared<sl::test::HashingEmbedder>(), judge});
    if (!orchestrator->initialize()) {
        return nullptr;
    }
    return std::make_unique<sl::RagService>(std::move(orchestrator));
}

void TestRagServiceConcurrency::testHealthAnswersDuringSlowSearch()
{
    ScopedSocketDir socketEnv(m_socketDir.path());
    auto judge = std::make_shared<sl::test::CountingJudge>();
    judge->setDelayMs(800);
    std::unique_ptr<sl::RagService> service = makeService(judge);
    QVERIFY(service);
    QVERIFY(service->start());

    sl::test::PipelinedConnection connection;
    QVERIFY(connection.connectTo(sl::ServiceBase::socketPath(QString::fromLatin1(sl::RagService::kServiceName))));

    QJsonObject params;
    params[QStringLiteral("query")] = QStringLiteral("write-ahead log crash recovery");
    params[QStringLiteral("mode")] = QStringLiteral("thorough");
    connection.send(1, QStringLiteral("search"), params);
    connection.send(2, QStringLiteral("health"));
    connection.send(3, QStringLiteral("ping"));
    QVERIFY(connection.waitForResponses(3, 10000));

    const std::vector<QJsonObject>& responses = connection.responses();
    QCOMPARE(responses[0].value(QStringLiteral("id")).toInteger(), 2);
    QVERIFY(sl::test::isResponse(responses[0]));
    QCOMPARE(sl::test::resultPayload(responses[0]).value(QStringLiteral("corpus_count")).toInt(), 1);
    QCOMPARE(responses[1].value(QStringLiteral("id")).toInteger(), 3);

    const QJsonObject search = responses[2];
    QCOMPARE(search.value(QStringLiteral("id")).toInteger(), 1);
    QVERIFY(sl::test::isResponse(search));
    const QJsonObject judgeMeta = sl::test::resultPayload(search).value(QStringLiteral("meta")).toObject()
                                      .value(QStringLiteral("judge")).toObject();
    QCOMPARE(judgeMeta.value(QStringLiteral("served_by")).toString(), QStringLiteral("real"));
    QCOMPARE(judge->invocations(), int64_t(1));
}

void TestRagServiceConcurrency::testConcurrentSearchesAllAnswer()
{
    ScopedSocketDir socketEnv(m_socketDir.path());
    auto judge = std::make_shared<sl::test::CountingJudge>();
    judge->setDelayMs(300);
    std::unique_ptr<sl::RagService> service = makeService(judge);
    QVERIFY(service);
    QVERIFY(service->start());

    sl::test::PipelinedConnection connection;
    QVERIFY(connection.connectTo(sl::ServiceBase::socketPath(QString::fromLatin1(sl::RagService::kServiceName))));

    const QStringList queries = {
        QStringLiteral("b-trees storage engines"),
        QStringLiteral("inverted index postings"),
        QStringLiteral("bm25 ranking"),
    };
    for (int i = 0; i < queries.size(); ++i) {
        QJsonObject params;
        params[QStringLiteral("query")] = queries.at(i);
        params[QStringLiteral("mode")] = QStringLiteral("thorough");
        connection.send(static_cast<uint64_t>(10 + i), QStringLiteral("search"), params);
    }
    QVERIFY(connection.waitForResponses(static_cast<int>(queries.size()), 10000));

    QSet<qint64> ids;
    for (const QJsonObject& response : connection.responses()) {
        QVERIFY(sl::test::isResponse(response));
        const qint64 id = response.value(QStringLiteral("id")).toInteger();
        ids.insert(id);
        QCOMPARE(sl::test::resultPayload(response).value(QStringLiteral("query")).toString(),
                 queries.at(static_cast<int>(id - 10)));
    }
    QCOMPARE(ids, (QSet<qint64>{10, 11, 12}));
}

QTEST_MAIN(TestRagServiceConcurrency)
#include "test_rag_service_concurrency.moc"
