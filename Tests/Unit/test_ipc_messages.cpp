#include <QtTest/QtTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QtEndian>
#include "core/ipc/message.h"
#include "core/shared/ipc_messages.h"

#include <cstring>

class TestIpcMessages : public QObject {
    Q_OBJECT

private slots:
    // ── Encode/Decode ────────────────────────────────────────────
    void testSearchRequestSurvivesFraming();
    void testErrorEnvelopeSurvivesFraming();

    // ── Envelope structure ───────────────────────────────────────
    void testMakeRequestOmitsEmptyParams();
    void testMakeResponseStampsOk();
    void testMakeResponseOverridesCallerOk();
    void testMakeErrorCarriesDetails();
    void testErrorCodeStrings();

    // ── Decode edge cases ────────────────────────────────────────
    void testDecodeIncompleteHeader();
    void testDecodePartialPayload();
    void testDecodeConsumesOneFrameAtATime();
    void testDecodeRejectsOversizedLength();
    void testDecodeRejectsNonObjectPayload();

    // ── Unicode content ──────────────────────────────────────────
    void testUnicodeQuerySurvivesFraming();
};

// ── Encode/Decode ────────────────────────────────────────────────

void TestIpcMessages::testSearchRequestSurvivesFraming()
{
    QJsonObject params{{QStringLiteral("query"), QStringLiteral("write-ahead log")},
                       {QStringLiteral("mode"), QStringLiteral("quick")}};
    const QByteArray encoded = sl::IpcMessage::encode(
        sl::IpcMessage::makeRequest(42, QStringLiteral("search"), params));
    QVERIFY(!encoded.isEmpty());

    quint32 rawLen = 0;
    std::memcpy(&rawLen, encoded.constData(), 4);
    QCOMPARE(static_cast<int>(qFromBigEndian(rawLen)), encoded.size() - 4);

    const auto decoded = sl::IpcMessage::decode(encoded);
    QVERIFY(decoded.has_value());
    QCOMPARE(decoded->bytesConsumed, static_cast<int>(encoded.size()));
    QCOMPARE(decoded->json[QStringLiteral("type")].toString(), QStringLiteral("request"));
    QCOMPARE(decoded->json[QStringLiteral("id")].toInteger(), 42);
    QCOMPARE(decoded->json[QStringLiteral("method")].toString(), QStringLiteral("search"));
    QCOMPARE(decoded->json[QStringLiteral("params")].toObject(), params);
}

void TestIpcMessages::testErrorEnvelopeSurvivesFraming()
{
    const QJsonObject error = sl::IpcMessage::makeError(
        7, sl::IpcErrorCode::EmptyCorpus, QStringLiteral("No corpora loaded"));
    const auto decoded = sl::IpcMessage::decode(sl::IpcMessage::encode(error));
    QVERIFY(decoded.has_value());
    QCOMPARE(decoded->json, error);
}

// ── Envelope structure ───────────────────────────────────────────

void TestIpcMessages::testMakeRequestOmitsEmptyParams()
{
    const QJsonObject req = sl::IpcMessage::makeRequest(1, QStringLiteral("ping"));
    QCOMPARE(req[QStringLiteral("type")].toString(), QStringLiteral("request"));
    QCOMPARE(req[QStringLiteral("id")].toInteger(), 1);
    QVERIFY(!req.contains(QStringLiteral("params")));
}

void TestIpcMessages::testMakeResponseStampsOk()
{
    const QJsonObject resp = sl::IpcMessage::makeResponse(
        10, QJsonObject{{QStringLiteral("corpus_count"), 2}});
    QCOMPARE(resp[QStringLiteral("type")].toString(), QStringLiteral("response"));
    QCOMPARE(resp[QStringLiteral("id")].toInteger(), 10);

    const QJsonObject result = resp[QStringLiteral("result")].toObject();
    QCOMPARE(result[QStringLiteral("ok")].toBool(), true);
    QCOMPARE(result[QStringLiteral("corpus_count")].toInt(), 2);
}

void TestIpcMessages::testMakeResponseOverridesCallerOk()
{
    const QJsonObject resp = sl::IpcMessage::makeResponse(
        1, QJsonObject{{QStringLiteral("ok"), false}});
    QCOMPARE(resp[QStringLiteral("result")].toObject()[QStringLiteral("ok")].toBool(), true);
}

void TestIpcMessages::testMakeErrorCarriesDetails()
{
    QJsonObject details;
    details[QStringLiteral("missing")] = QJsonArray{QStringLiteral("Pearson")};
    details[QStringLiteral("request_id")] = QStringLiteral("1a2b3c4d");

    const QJsonObject err = sl::IpcMessage::makeError(
        3, sl::IpcErrorCode::MissingPublishers, QStringLiteral("Requested publishers not loaded"), details);
    QCOMPARE(err[QStringLiteral("type")].toString(), QStringLiteral("error"));
    QCOMPARE(err[QStringLiteral("id")].toInteger(), 3);
    QCOMPARE(err[QStringLiteral("ok")].toBool(), false);

    const QJsonObject errObj = err[QStringLiteral("error")].toObject();
    QCOMPARE(errObj[QStringLiteral("code")].toInt(), static_cast<int>(sl::IpcErrorCode::MissingPublishers));
    QCOMPARE(errObj[QStringLiteral("codeString")].toString(), QStringLiteral("MISSING_PUBLISHERS"));
    QCOMPARE(errObj[QStringLiteral("message")].toString(), QStringLiteral("Requested publishers not loaded"));
    QCOMPARE(errObj[QStringLiteral("missing")].toArray().first().toString(), QStringLiteral("Pearson"));
    QCOMPARE(errObj[QStringLiteral("request_id")].toString(), QStringLiteral("1a2b3c4d"));
}

void TestIpcMessages::testErrorCodeStrings()
{
    QCOMPARE(sl::ipcErrorCodeToString(sl::IpcErrorCode::EngineUnavailable), QStringLiteral("ENGINE_UNAVAILABLE"));
    QCOMPARE(sl::ipcErrorCodeToString(sl::IpcErrorCode::EmptyCorpus), QStringLiteral("EMPTY_CORPUS"));
    QCOMPARE(sl::ipcErrorCodeToString(sl::IpcErrorCode::MissingPublishers), QStringLiteral("MISSING_PUBLISHERS"));
    QCOMPARE(sl::ipcErrorCodeToString(sl::IpcErrorCode::SearchTimeout), QStringLiteral("SEARCH_TIMEOUT"));
    QCOMPARE(sl::ipcErrorCodeToString(sl::IpcErrorCode::SearchError), QStringLiteral("SEARCH_ERROR"));
    QCOMPARE(sl::ipcErrorCodeToString(sl::IpcErrorCode::InvalidParams), QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(sl::ipcErrorCodeToString(sl::IpcErrorCode::NotFound), QStringLiteral("NOT_FOUND"));
}

// ── Decode edge cases ────────────────────────────────────────────

void TestIpcMessages::testDecodeIncompleteHeader()
{
    QVERIFY(!sl::IpcMessage::decode(QByteArray()).has_value());
    QVERIFY(!sl::IpcMessage::decode(QByteArray(2, '\0')).has_value());
}

void TestIpcMessages::testDecodePartialPayload()
{
    const QByteArray encoded = sl::IpcMessage::encode(
        sl::IpcMessage::makeRequest(1, QStringLiteral("health")));
    QVERIFY(!sl::IpcMessage::decode(encoded.left(encoded.size() - 1)).has_value());
}

void TestIpcMessages::testDecodeConsumesOneFrameAtATime()
{
    QByteArray combined = sl::IpcMessage::encode(sl::IpcMessage::makeRequest(1, QStringLiteral("search")));
    combined.append(sl::IpcMessage::encode(sl::IpcMessage::makeRequest(2, QStringLiteral("stats"))));

    const auto first = sl::IpcMessage::decode(combined);
    QVERIFY(first.has_value());
    QCOMPARE(first->json[QStringLiteral("method")].toString(), QStringLiteral("search"));
    QVERIFY(first->bytesConsumed < combined.size());

    const auto second = sl::IpcMessage::decode(combined.mid(first->bytesConsumed));
    QVERIFY(second.has_value());
    QCOMPARE(second->json[QStringLiteral("method")].toString(), QStringLiteral("stats"));
}

void TestIpcMessages::testDecodeRejectsOversizedLength()
{
    QByteArray buf(4, '\0');
    const quint32 hugeLen = qToBigEndian(static_cast<quint32>(sl::IpcMessage::kMaxMessageSize + 1));
    std::memcpy(buf.data(), &hugeLen, 4);
    buf.append(QByteArray(100, 'x'));
    QVERIFY(!sl::IpcMessage::decode(buf).has_value());
}

void TestIpcMessages::testDecodeRejectsNonObjectPayload()
{
    const QByteArray payload("[1,2,3]");
    QByteArray buf(4, '\0');
    const quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    std::memcpy(buf.data(), &len, 4);
    buf.append(payload);
    QVERIFY(!sl::IpcMessage::decode(buf).has_value());
}

// ── Unicode content ──────────────────────────────────────────────

void TestIpcMessages::testUnicodeQuerySurvivesFraming()
{
    const QString query = QStringLiteral("résumé 日本語");
    const auto decoded = sl::IpcMessage::decode(sl::IpcMessage::encode(
        sl::IpcMessage::makeRequest(1, QStringLiteral("search"), QJsonObject{{QStringLiteral("query"), query}})));
    QVERIFY(decoded.has_value());
    QCOMPARE(decoded->json[QStringLiteral("params")].toObject()[QStringLiteral("query")].toString(), query);
}

QTEST_MAIN(TestIpcMessages)
#include "test_ipc_messages.moc"
