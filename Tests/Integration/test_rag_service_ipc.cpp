#include <QtTest/QtTest>

#include "core/shared/ipc_messages.h"
#include "corpus_fixture.h"
#include "ipc_test_utils.h"
#include "service_process_harness.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <memory>

class TestRagServiceIpc : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    void testHealthReportsLexicalCorpus();
    void testSearchOverSocket();
    void testInvalidParamsEnvelope();
    void testMissingPublishersEnvelope();
    void testReaderChunkAndSuggestions();
    void testStatsAndRefresh();
    void testUnknownMethod();
    void testShutdownStopsProcess();

private:
    QTemporaryDir m_dataDir;
    std::unique_ptr<sl::test::ServiceProcessHarness> m_harness;
};

void TestRagServiceIpc::initTestCase()
{
    QVERIFY(m_dataDir.isValid());
    QString error;
    QVERIFY2(sl::test::writeCorpus(m_dataDir.path(), QStringLiteral("OReilly"),
                                   sl::test::sampleLibrary(), {}, &error),
             qPrintable(error));

    const QString modelsDir = QDir(m_dataDir.path()).filePath(QStringLiteral("no-models"));
    QVERIFY(QDir().mkpath(modelsDir));

    QJsonObject config;
    config[QStringLiteral("publishers")] = QJsonArray{QStringLiteral("OReilly"), QStringLiteral("Pearson")};
    config[QStringLiteral("queryTimeoutMs")] = 5000;
    const QString configPath = QDir(m_dataDir.path()).filePath(QStringLiteral("engine.json"));
    QFile configFile(configPath);
    QVERIFY(configFile.open(QIODevice::WriteOnly | QIODevice::Truncate));
    configFile.write(QJsonDocument(config).toJson(QJsonDocument::Compact));
    configFile.close();

    sl::test::ServiceLaunchConfig launch;
    launch.dataDir = m_dataDir.path();
    launch.env.insert(QStringLiteral("SOURCELIGHT_CONFIG"), configPath);
    launch.env.insert(QStringLiteral("SOURCELIGHT_MODELS_DIR"), modelsDir);
    launch.env.insert(QStringLiteral("SOURCELIGHT_RECENT_LOG"),
                      QDir(m_dataDir.path()).filePath(QStringLiteral("recent.json")));

    m_harness = std::make_unique<sl::test::ServiceProcessHarness>(
        QStringLiteral("rag"), QStringLiteral("sourcelight-rag"));
    QVERIFY2(m_harness->start(launch), "Failed to start rag service");
}

void TestRagServiceIpc::cleanupTestCase()
{
    if (m_harness) {
        m_harness->stop();
    }
}

void TestRagServiceIpc::testHealthReportsLexicalCorpus()
{
    const QJsonObject response = m_harness->request(QStringLiteral("health"));
    QVERIFY(sl::test::isResponse(response));
    const QJsonObject result = sl::test::resultPayload(response);
    QCOMPARE(result.value(QStringLiteral("ok")).toBool(), true);
    QCOMPARE(result.value(QStringLiteral("corpus_count")).toInt(), 1);
    QCOMPARE(result.value(QStringLiteral("publishers")).toArray(), QJsonArray{QStringLiteral("OReilly")});
    QCOMPARE(result.value(QStringLiteral("embedder")).toObject()
                 .value(QStringLiteral("available")).toBool(true),
             false);
}

void TestRagServiceIpc::testSearchOverSocket()
{
    QJsonObject params;
    params[QStringLiteral("query")] = QStringLiteral("inverted index postings");
    params[QStringLiteral("mode")] = QStringLiteral("balanced");
    params[QStringLiteral("pubs")] = QJsonArray{QStringLiteral("OReilly")};
    const QJsonObject response = m_harness->request(QStringLiteral("search"), params);
    QVERIFY2(sl::test::isResponse(response),
             qPrintable(QString::fromUtf8(QJsonDocument(response).toJson(QJsonDocument::Compact))));

    const QJsonObject result = sl::test::resultPayload(response);
    QCOMPARE(result.value(QStringLiteral("ok")).toBool(), true);
    QCOMPARE(result.value(QStringLiteral("query")).toString(), QStringLiteral("inverted index postings"));
    const QJsonArray hits = result.value(QStringLiteral("hits")).toArray();
    QVERIFY(!hits.isEmpty());
    QCOMPARE(hits.first().toObject().value(QStringLiteral("section")).toString(),
             QStringLiteral("Inverted index"));
    QVERIFY(result.contains(QStringLiteral("coverage")));
    QVERIFY(result.contains(QStringLiteral("answer")));
    QCOMPARE(result.value(QStringLiteral("meta")).toObject()
                 .value(QStringLiteral("judge")).toObject()
                 .value(QStringLiteral("served_by")).toString(),
             QStringLiteral("proxy"));
}

void TestRagServiceIpc::testInvalidParamsEnvelope()
{
    QJsonObject params;
    params[QStringLiteral("query")] = QStringLiteral("b-trees");
    params[QStringLiteral("mode")] = QStringLiteral("exhaustive");
    const QJsonObject response = m_harness->request(QStringLiteral("search"), params);
    QVERIFY(sl::test::isError(response));
    QCOMPARE(response.value(QStringLiteral("ok")).toBool(true), false);

    const QJsonObject error = sl::test::errorPayload(response);
    QCOMPARE(error.value(QStringLiteral("codeString")).toString(), QStringLiteral("INVALID_PARAMS"));
    QVERIFY(error.value(QStringLiteral("fields")).toObject().contains(QStringLiteral("mode")));
}

void TestRagServiceIpc::testMissingPublishersEnvelope()
{
    QJsonObject params;
    params[QStringLiteral("query")] = QStringLiteral("b-trees");
    params[QStringLiteral("pubs")] = QJsonArray{QStringLiteral("Pearson")};
    const QJsonObject response = m_harness->request(QStringLiteral("search"), params);
    QVERIFY(sl::test::isError(response));

    const QJsonObject error = sl::test::errorPayload(response);
    QCOMPARE(error.value(QStringLiteral("code")).toInt(),
             static_cast<int>(sl::IpcErrorCode::MissingPublishers));
    QCOMPARE(error.value(QStringLiteral("codeString")).toString(), QStringLiteral("MISSING_PUBLISHERS"));
    QCOMPARE(error.value(QStringLiteral("missing")).toArray(), QJsonArray{QStringLiteral("Pearson")});
    QVERIFY(error.value(QStringLiteral("error_id")).toString().startsWith(QStringLiteral("err-")));
}

void TestRagServiceIpc::testReaderChunkAndSuggestions()
{
    QJsonObject params;
    params[QStringLiteral("book")] = QStringLiteral("Database_Internals");
    params[QStringLiteral("chunk_idx")] = 1;
    QJsonObject response = m_harness->request(QStringLiteral("readerChunk"), params);
    QVERIFY(sl::test::isResponse(response));
    const QJsonArray chunks = sl::test::resultPayload(response).value(QStringLiteral("chunks")).toArray();
    QCOMPARE(chunks.size(), 2);
    QCOMPARE(chunks.last().toObject().value(QStringLiteral("section")).toString(),
             QStringLiteral("Write-ahead log"));

    params[QStringLiteral("chunk_idx")] = 40;
    response = m_harness->request(QStringLiteral("readerChunk"), params);
    QVERIFY(sl::test::isError(response));
    QCOMPARE(sl::test::errorPayload(response).value(QStringLiteral("codeString")).toString(),
             QStringLiteral("NOT_FOUND"));

    response = m_harness->request(QStringLiteral("suggestions"),
                                  QJsonObject{{QStringLiteral("q"), QStringLiteral("postings")}});
    QVERIFY(sl::test::isResponse(response));
    const QJsonArray suggestions =
        sl::test::resultPayload(response).value(QStringLiteral("suggestions")).toArray();
    QVERIFY(suggestions.contains(QStringLiteral("inverted index postings")));
}

void TestRagServiceIpc::testStatsAndRefresh()
{
    QJsonObject response = m_harness->request(QStringLiteral("stats"));
    QVERIFY(sl::test::isResponse(response));
    QJsonObject result = sl::test::resultPayload(response);
    QCOMPARE(result.value(QStringLiteral("total_chunks")).toInt(), 9);
    QVERIFY(result.value(QStringLiteral("queries")).toInteger() >= 1);
    QCOMPARE(result.value(QStringLiteral("corpora")).toObject()
                 .value(QStringLiteral("OReilly")).toObject()
                 .value(QStringLiteral("dense_enabled")).toBool(true),
             false);

    response = m_harness->request(QStringLiteral("refresh"));
    QVERIFY(sl::test::isResponse(response));
    result = sl::test::resultPayload(response);
    QCOMPARE(result.value(QStringLiteral("publishers")).toArray(), QJsonArray{QStringLiteral("OReilly")});
    QCOMPARE(result.value(QStringLiteral("corpora")).toArray().size(), 2);
}

void TestRagServiceIpc::testUnknownMethod()
{
    const QJsonObject response = m_harness->request(QStringLiteral("reindex"));
    QVERIFY(sl::test::isError(response));
    QCOMPARE(sl::test::errorPayload(response).value(QStringLiteral("codeString")).toString(),
             QStringLiteral("NOT_FOUND"));
}

void TestRagServiceIpc::testShutdownStopsProcess()
{
    const QJsonObject response = m_harness->request(QStringLiteral("shutdown"));
    QVERIFY(sl::test::isResponse(response));
    QVERIFY(m_harness->process().waitForFinished(5000));
    QCOMPARE(m_harness->process().exitStatus(), QProcess::NormalExit);
}

QTEST_MAIN(TestRagServiceIpc)
#include "test_rag_service_ipc.moc"
