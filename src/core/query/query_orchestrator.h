#pragma once

#include "core/corpus/corpus_registry.h"
#include "core/query/recent_queries.h"
#include "core/query/search_request.h"
#include "core/ranking/coverage_estimator.h"
#include "core/ranking/judge_chain.h"
#include "core/shared/engine_config.h"
#include "core/shared/ipc_messages.h"
#include "core/shared/task_pool.h"

#include <QJsonObject>
#include <QString>

#include <atomic>
#include <limits>
#include <memory>

namespace sl {

class CachedQueryEmbedder;
class QueryEmbedder;

enum class QueryStage {
    Validating,
    Embedding,
    Retrieving,
    Fusing,
    Selecting,
    Judging,
    Estimating,
    Composing,
};

QString queryStageToString(QueryStage stage);

// Either a response body or an error destined for an IPC error envelope.
struct QueryOutcome {
    bool ok = false;
    IpcErrorCode code = IpcErrorCode::InternalError;
    QString message;
    QJsonObject details;
    QJsonObject result;

    static QueryOutcome success(QJsonObject result);
    static QueryOutcome failure(IpcErrorCode code, const QString& message,
                                QJsonObject details = {});
};

// Runs the retrieval pipeline for the engine API:
//   embed -> per-publisher dense || lexical -> RRF -> merge -> MMR
//   -> judge chain -> coverage/confidence -> answer -> page.
//
// Corpora are loaded once by initialize()/refreshCorpora() and shared
// read-only across concurrent queries.
class QueryOrchestrator {
public:
    struct Dependencies {
        std::shared_ptr<QueryEmbedder> embedder;      // may be null or unavailable
        std::shared_ptr<JudgeStrategy> realJudge;     // may be null or unavailable
    };

    QueryOrchestrator(EngineConfig config, Dependencies deps);
    ~QueryOrchestrator();

    QueryOrchestrator(const QueryOrchestrator&) = delete;
    QueryOrchestrator& operator=(const QueryOrchestrator&) = delete;

    // Loads corpora and starts the worker pools. Returns false only when
    // no configured publisher could be loaded; the engine then answers
    // EMPTY_CORPUS until a refresh succeeds.
    bool initialize(QString* errorOut = nullptr);
    void shutdown();
    bool isInitialized() const { return m_initialized.load(); }

    std::vector<CorpusReport> refreshCorpora();

    QueryOutcome search(const QJsonObject& params);
    QueryOutcome run(const SearchRequest& request, const QString& requestId = {});
    QueryOutcome chat(const QJsonObject& params);
    QueryOutcome readerChunk(const QJsonObject& params) const;
    QueryOutcome stats() const;
    QJsonObject health() const;
    QJsonObject suggestions(const QString& fragment) const;

    const EngineConfig& config() const { return m_config; }
    const CorpusRegistry& registry() const { return m_registry; }

    // "err-" + first 10 hex chars of SHA-1 over the seed.
    static QString makeErrorId(const QString& seed);
    static QJsonObject hitToJson(const EvidenceHit& hit, const EngineConfig& config);

    static constexpr const char* kEngineVersion = "1.0.0";
    static constexpr int kReaderWindow = 2;
    static constexpr int kMaxReaderWindow = 10;
    static constexpr int kMaxChunkIdx = std::numeric_limits<int>::max() - kMaxReaderWindow;
    static constexpr int kChatSources = 3;

private:
    EmbedderIdentity embedderIdentity() const;
    // internalDetail goes to the log under the error id, never to the client.
    QueryOutcome fail(IpcErrorCode code, QueryStage stage, const QString& message,
                      const QString& requestId, QJsonObject details = {},
                      const QString& internalDetail = QString()) const;

    EngineConfig m_config;
    std::shared_ptr<QueryEmbedder> m_embedder;
    CachedQueryEmbedder* m_cachedEmbedder = nullptr;
    std::shared_ptr<JudgeStrategy> m_realJudge;
    CorpusRegistry m_registry;
    std::unique_ptr<JudgeChain> m_judgeChain;
    std::unique_ptr<TaskPool> m_retrievalPool;
    std::unique_ptr<RecentQueries> m_recent;
    std::atomic<bool> m_initialized{false};
    std::atomic<int64_t> m_queries{0};
    std::atomic<int64_t> m_failures{0};
};

} // namespace sl
