#include "rag_service.h"

#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QJsonArray>

namespace sl {

RagService::RagService(std::unique_ptr<QueryOrchestrator> orchestrator, QObject* parent)
    : ServiceBase(QString::fromLatin1(kServiceName), parent)
    , m_orchestrator(std::move(orchestrator))
{
    LOG_INFO(slIpc, "RagService created");
}

RagService::~RagService()
{
    // In-flight searches still use the judge chain.
    waitForWorkers();
    if (m_orchestrator) {
        m_orchestrator->shutdown();
    }
}

bool RagService::isLongRunning(const QString& method) const
{
    return method == QLatin1String("search") || method == QLatin1String("chat");
}

QJsonObject RagService::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger());
    const QJsonObject params = request.value(QStringLiteral("params")).toObject();

    if (method == QLatin1String("search"))      return handleSearch(id, params);
    if (method == QLatin1String("chat"))        return handleChat(id, params);
    if (method == QLatin1String("health"))      return handleHealth(id);
    if (method == QLatin1String("stats"))       return handleStats(id);
    if (method == QLatin1String("suggestions")) return handleSuggestions(id, params);
    if (method == QLatin1String("readerChunk")
        || method == QLatin1String("reader_chunk")) return handleReaderChunk(id, params);
    if (method == QLatin1String("refresh"))     return handleRefresh(id);

    return ServiceBase::handleRequest(request);
}

QJsonObject RagService::toEnvelope(uint64_t id, const QueryOutcome& outcome)
{
    if (outcome.ok) {
        return IpcMessage::makeResponse(id, outcome.result);
    }
    return IpcMessage::makeError(id, outcome.code, outcome.message, outcome.details);
}

QJsonObject RagService::handleSearch(uint64_t id, const QJsonObject& params)
{
    if (!m_orchestrator) {
        return IpcMessage::makeError(id, IpcErrorCode::EngineUnavailable,
                                     QStringLiteral("Engine is not available"));
    }
    return toEnvelope(id, m_orchestrator->search(params));
}

QJsonObject RagService::handleChat(uint64_t id, const QJsonObject& params)
{
    if (!m_orchestrator) {
        return IpcMessage::makeError(id, IpcErrorCode::EngineUnavailable,
                                     QStringLiteral("Engine is not available"));
    }
    return toEnvelope(id, m_orchestrator->chat(params));
}

QJsonObject RagService::handleHealth(uint64_t id)
{
    if (!m_orchestrator) {
        QJsonObject result;
        result[QStringLiteral("ok")] = false;
        result[QStringLiteral("corpus_count")] = 0;
        result[QStringLiteral("publishers")] = QJsonArray();
        result[QStringLiteral("engine_version")] = QStringLiteral("unavailable");
        result[QStringLiteral("error")] = QStringLiteral("Engine is not available");
        return IpcMessage::makeResponse(id, result);
    }
    // makeResponse stamps ok:true; health reports its own readiness.
    const QJsonObject health = m_orchestrator->health();
    QJsonObject envelope = IpcMessage::makeResponse(id, health);
    QJsonObject result = envelope.value(QStringLiteral("result")).toObject();
    result[QStringLiteral("ok")] = health.value(QStringLiteral("ok")).toBool();
    envelope[QStringLiteral("result")] = result;
    return envelope;
}

QJsonObject RagService::handleStats(uint64_t id)
{
    if (!m_orchestrator) {
        return IpcMessage::makeError(id, IpcErrorCode::EngineUnavailable,
                                     QStringLiteral("Engine is not available"));
    }
    return toEnvelope(id, m_orchestrator->stats());
}

QJsonObject RagService::handleSuggestions(uint64_t id, const QJsonObject& params)
{
    if (!m_orchestrator) {
        QJsonObject result;
        result[QStringLiteral("suggestions")] = QJsonArray();
        return IpcMessage::makeResponse(id, result);
    }
    return IpcMessage::makeResponse(
        id, m_orchestrator->suggestions(params.value(QStringLiteral("q")).toString()));
}

QJsonObject RagService::handleReaderChunk(uint64_t id, const QJsonObject& params)
{
    if (!m_orchestrator) {
        return IpcMessage::makeError(id, IpcErrorCode::EngineUnavailable,
                                     QStringLiteral("Engine is not available"));
    }
    return toEnvelope(id, m_orchestrator->readerChunk(params));
}

QJsonObject RagService::handleRefresh(uint64_t id)
{
    if (!m_orchestrator || !m_orchestrator->isInitialized()) {
        return IpcMessage::makeError(id, IpcErrorCode::EngineUnavailable,
                                     QStringLiteral("Engine is not available"));
    }
    QJsonArray reports;
    for (const CorpusReport& report : m_orchestrator->refreshCorpora()) {
        reports.append(report.toJson());
    }
    QJsonObject result;
    result[QStringLiteral("corpora")] = reports;
    result[QStringLiteral("publishers")] =
        QJsonArray::fromStringList(m_orchestrator->registry().loadedPublishers());
    return IpcMessage::makeResponse(id, result);
}

} // namespace sl
