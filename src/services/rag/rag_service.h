#pragma once

#include "core/ipc/service_base.h"
#include "core/query/query_orchestrator.h"

#include <memory>

namespace sl {

// Socket front end for the engine. Methods: search, chat, health, stats,
// suggestions, readerChunk, refresh, plus the built-in ping and shutdown.
// search and chat run on the worker pool; the rest answer on the event loop.
class RagService : public ServiceBase {
    Q_OBJECT
public:
    explicit RagService(std::unique_ptr<QueryOrchestrator> orchestrator, QObject* parent = nullptr);
    ~RagService() override;

    QueryOrchestrator* orchestrator() const { return m_orchestrator.get(); }

    static constexpr const char* kServiceName = "rag";

protected:
    QJsonObject handleRequest(const QJsonObject& request) override;
    bool isLongRunning(const QString& method) const override;

private:
    QJsonObject handleSearch(uint64_t id, const QJsonObject& params);
    QJsonObject handleChat(uint64_t id, const QJsonObject& params);
    QJsonObject handleHealth(uint64_t id);
    QJsonObject handleStats(uint64_t id);
    QJsonObject handleSuggestions(uint64_t id, const QJsonObject& params);
    QJsonObject handleReaderChunk(uint64_t id, const QJsonObject& params);
    QJsonObject handleRefresh(uint64_t id);

    static QJsonObject toEnvelope(uint64_t id, const QueryOutcome& outcome);

    std::unique_ptr<QueryOrchestrator> m_orchestrator;
};

} // namespace sl
