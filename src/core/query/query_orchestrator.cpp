#include "core/query/query_orchestrator.h"

#include "core/embedding/cached_query_embedder.h"
#include "core/ranking/answer_composer.h"
#include "core/ranking/cross_encoder_judge.h"
#include "core/ranking/diversity_selector.h"
#include "core/ranking/rank_fusion.h"
#include "core/retrieval/dense_retriever.h"
#include "core/retrieval/lexical_retriever.h"
#include "core/retrieval/query_expander.h"
#include "core/shared/logging.h"

#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QUuid>

#include <algorithm>
#include <cmath>
#include <future>

namespace sl {

namespace {

double round2(double value)
{
    return std::round(value * 100.0) / 100.0;
}

QJsonObject cacheStatsJson(uint64_t hits, uint64_t misses, uint64_t evictions, int size)
{
    QJsonObject json;
    json[QStringLiteral("hits")] = static_cast<qint64>(hits);
    json[QStringLiteral("misses")] = static_cast<qint64>(misses);
    json[QStringLiteral("evictions")] = static_cast<qint64>(evictions);
    json[QStringLiteral("size")] = size;
    return json;
}

QJsonObject warning(const QString& code, const QString& message)
{
    QJsonObject json;
    json[QStringLiteral("code")] = code;
    json[QStringLiteral("message")] = message;
    return json;
}

struct LexicalOutcome {
    bool ok = true;
    QString error;
    std::vector<ScoredChunk> hits;
};

struct PublisherWork {
    std::shared_ptr<CorpusHandle> corpus;
    std::future<DenseRetriever::Result> dense;
    std::future<LexicalOutcome> lexical;
    bool hasDense = false;
};

// Waits for `future` until `deadline`. Returns false on timeout or when the
// pool dropped the task after its deadline.
template <typename T>
bool awaitResult(std::future<T>& future, TaskPool::Clock::time_point deadline, T* out)
{
    if (future.wait_until(deadline) != std::future_status::ready) {
        return false;
    }
    try {
        *out = future.get();
    } catch (const std::future_error&) {
        return false;
    }
    return true;
}

} // namespace

QString queryStageToString(QueryStage stage)
{
    switch (stage) {
    case QueryStage::Validating: return QStringLiteral("validating");
    case QueryStage::Embedding:  return QStringLiteral("embedding");
    case QueryStage::Retrieving: return QStringLiteral("retrieving");
    case QueryStage::Fusing:     return QStringLiteral("fusing");
    case QueryStage::Selecting:  return QStringLiteral("selecting");
    case QueryStage::Judging:    return QStringLiteral("judging");
    case QueryStage::Estimating: return QStringLiteral("estimating");
    case QueryStage::Composing:  return QStringLiteral("composing");
    }
    return QStringLiteral("unknown");
}

QueryOutcome QueryOutcome::success(QJsonObject result)
{
    QueryOutcome outcome;
    outcome.ok = true;
    outcome.result = std::move(result);
    return outcome;
}

QueryOutcome QueryOutcome::failure(IpcErrorCode code, const QString& message, QJsonObject details)
{
    QueryOutcome outcome;
    outcome.ok = false;
    outcome.code = code;
    outcome.message = message;
    outcome.details = std::move(details);
    return outcome;
}

QueryOrchestrator::QueryOrchestrator(EngineConfig config, Dependencies deps)
    : m_config(std::move(config))
    , m_realJudge(std::move(deps.realJudge))
    , m_registry(m_config.dataRoot, m_config.publishers)
{
    if (deps.embedder) {
        auto cached = std::make_shared<CachedQueryEmbedder>(std::move(deps.embedder),
                                                            m_config.embedCacheSize);
        m_cachedEmbedder = cached.get();
        m_embedder = std::move(cached);
    }

    QString recentPath = m_config.recentQueryLog;
    if (recentPath.isEmpty()) {
        recentPath = QDir(m_config.dataRoot).filePath(QStringLiteral("recent_queries.json"));
    }
    m_recent = std::make_unique<RecentQueries>(recentPath, m_config.recentQueryLimit);
}

QueryOrchestrator::~QueryOrchestrator()
{
    shutdown();
}

bool QueryOrchestrator::initialize(QString* errorOut)
{
    if (m_initialized.load()) {
        return true;
    }

    m_retrievalPool = std::make_unique<TaskPool>(QStringLiteral("retrieval"),
                                                 std::max(1, m_config.retrievalWorkers),
                                                 std::max(16, m_config.retrievalWorkers * 16));

    JudgeChain::Options judgeOptions;
    judgeOptions.workers = m_config.judgeWorkers;
    judgeOptions.queueLimit = m_config.judgeQueueLimit;
    judgeOptions.budgetMs = m_config.judgeBudgetMs;
    m_judgeChain = std::make_unique<JudgeChain>(
        m_realJudge,
        std::make_shared<ProxyJudge>(m_config.proxySemanticWeight, m_config.proxyLexicalWeight),
        std::make_shared<OffJudge>(), judgeOptions);

    const std::vector<CorpusReport> reports = m_registry.refresh(embedderIdentity());
    m_initialized.store(true);

    const int ready = static_cast<int>(std::count_if(reports.begin(), reports.end(),
                                                     [](const CorpusReport& r) { return r.ready; }));
    LOG_INFO(slCore, "Engine initialized: %d/%d corpora ready, embedder=%s, real judge=%s",
             ready, static_cast<int>(reports.size()),
             embedderIdentity().available ? "yes" : "no",
             m_judgeChain->realAvailable() ? "yes" : "no");

    if (ready == 0) {
        if (errorOut) {
            *errorOut = QStringLiteral("No corpus could be loaded from %1").arg(m_config.dataRoot);
        }
        return false;
    }
    return true;
}

void QueryOrchestrator::shutdown()
{
    if (!m_initialized.exchange(false)) {
        return;
    }
    if (m_retrievalPool) {
        m_retrievalPool->stop();
    }
    m_judgeChain.reset();
    LOG_INFO(slCore, "Engine shut down after %lld queries",
             static_cast<long long>(m_queries.load()));
}

std::vector<CorpusReport> QueryOrchestrator::refreshCorpora()
{
    return m_registry.refresh(embedderIdentity());
}

EmbedderIdentity QueryOrchestrator::embedderIdentity() const
{
    EmbedderIdentity identity;
    if (m_embedder && m_embedder->isAvailable()) {
        identity.available = true;
        identity.modelId = m_embedder->modelId();
        identity.dimensions = m_embedder->dimensions();
    }
    return identity;
}

QString QueryOrchestrator::makeErrorId(const QString& seed)
{
    const QByteArray digest = QCryptographicHash::hash(seed.toUtf8(), QCryptographicHash::Sha1);
    return QStringLiteral("err-") + QString::fromLatin1(digest.toHex().left(10));
}

QueryOutcome QueryOrchestrator::fail(IpcErrorCode code, QueryStage stage, const QString& message,
                                     const QString& requestId, QJsonObject details,
                                     const QString& internalDetail) const
{
    const QString errorId = makeErrorId(requestId + QLatin1Char('|') + message + QLatin1Char('|')
                                        + QString::number(QDateTime::currentMSecsSinceEpoch()));
    details[QStringLiteral("error_id")] = errorId;
    details[QStringLiteral("stage")] = queryStageToString(stage);
    if (!requestId.isEmpty()) {
        details[QStringLiteral("request_id")] = requestId;
    }
    LOG_WARN(slCore, "Query %s failed at %s: %s [%s] (%s)", qUtf8Printable(requestId),
             qUtf8Printable(queryStageToString(stage)), qUtf8Printable(ipcErrorCodeToString(code)),
             qUtf8Printable(message), qUtf8Printable(errorId));
    if (!internalDetail.isEmpty()) {
        LOG_ERROR(slCore, "Query %s (%s) cause: %s", qUtf8Printable(requestId),
                  qUtf8Printable(errorId), qUtf8Printable(internalDetail));
    }
    return QueryOutcome::failure(code, message, details);
}

QueryOutcome QueryOrchestrator::search(const QJsonObject& params)
{
    const QString requestId = params.value(QStringLiteral("request_id")).toString(
        QUuid::createUuid().toString(QUuid::WithoutBraces).left(8));

    if (!m_initialized.load()) {
        return fail(IpcErrorCode::EngineUnavailable, QueryStage::Validating,
                    QStringLiteral("Engine is not initialized"), requestId);
    }

    QJsonObject fieldErrors;
    const std::optional<SearchRequest> request = SearchRequest::fromJson(params, m_config, &fieldErrors);
    if (!request) {
        QJsonObject details;
        details[QStringLiteral("fields")] = fieldErrors;
        return QueryOutcome::failure(IpcErrorCode::InvalidParams,
                                     QStringLiteral("Invalid search parameters"), details);
    }
    return run(*request, requestId);
}

QueryOutcome QueryOrchestrator::run(const SearchRequest& request, const QString& requestIdIn)
{
    const QString requestId = requestIdIn.isEmpty()
        ? QUuid::createUuid().toString(QUuid::WithoutBraces).left(8)
        : requestIdIn;

    if (!m_initialized.load() || !m_retrievalPool || !m_judgeChain) {
        return fail(IpcErrorCode::EngineUnavailable, QueryStage::Validating,
                    QStringLiteral("Engine is not initialized"), requestId);
    }
    m_queries.fetch_add(1);

    QElapsedTimer total;
    total.start();
    const auto deadline = TaskPool::Clock::now() + std::chrono::milliseconds(m_config.queryTimeoutMs);

    QueryStage stage = QueryStage::Validating;
    try {
        // Publisher resolution
        const QStringList loaded = m_registry.loadedPublishers();
        if (loaded.isEmpty()) {
            m_failures.fetch_add(1);
            return fail(IpcErrorCode::EmptyCorpus, stage,
                        QStringLiteral("No corpus is loaded"), requestId);
        }

        const QStringList requested = request.effectivePublishers(m_config);
        QStringList used;
        QStringList missing;
        for (const QString& pub : requested) {
            (loaded.contains(pub) ? used : missing).append(pub);
        }

        QJsonArray warnings;
        if (used.isEmpty()) {
            m_failures.fetch_add(1);
            QJsonObject details;
            details[QStringLiteral("requested")] = QJsonArray::fromStringList(requested);
            details[QStringLiteral("missing")] = QJsonArray::fromStringList(missing);
            details[QStringLiteral("loaded")] = QJsonArray::fromStringList(loaded);
            return fail(IpcErrorCode::MissingPublishers, stage,
                        QStringLiteral("None of the requested publishers is loaded"), requestId,
                        details);
        }
        if (!missing.isEmpty()) {
            warnings.append(warning(QStringLiteral("MISSING_PUBLISHERS"),
                                    QStringLiteral("Not loaded: %1").arg(missing.join(QStringLiteral(", ")))));
        }

        const ModeProfile& profile = m_config.modes.profile(request.mode);
        const JudgeMode judgeMode = request.effectiveJudgeMode(m_config.modes);
        const QueryExpansion expansion = QueryExpander::expand(request.query);

        std::vector<std::shared_ptr<CorpusHandle>> corpora;
        bool anyDense = false;
        for (const QString& pub : used) {
            std::shared_ptr<CorpusHandle> corpus = m_registry.handle(pub);
            if (!corpus) {
                continue;
            }
            anyDense = anyDense || corpus->denseEnabled();
            corpora.push_back(std::move(corpus));
        }

        // Embedding
        stage = QueryStage::Embedding;
        QElapsedTimer stageTimer;
        stageTimer.start();
        std::vector<float> queryVector;
        if (anyDense && m_embedder && m_embedder->isAvailable()) {
            std::shared_ptr<QueryEmbedder> embedder = m_embedder;
            const QString text = request.query;
            auto embedFuture = m_retrievalPool->run<std::vector<float>>(
                [embedder, text]() { return embedder->embedQuery(text); }, deadline);
            if (!embedFuture) {
                queryVector = m_embedder->embedQuery(text);
            } else if (!awaitResult(*embedFuture, deadline, &queryVector)) {
                m_failures.fetch_add(1);
                return fail(IpcErrorCode::SearchTimeout, stage,
                            QStringLiteral("Query exceeded %1 ms").arg(m_config.queryTimeoutMs),
                            requestId);
            }
            if (queryVector.empty()) {
                warnings.append(warning(QStringLiteral("EMBEDDING_FAILED"),
                                        QStringLiteral("Dense retrieval skipped")));
            }
        } else if (anyDense) {
            warnings.append(warning(QStringLiteral("EMBEDDER_UNAVAILABLE"),
                                    QStringLiteral("Dense retrieval skipped")));
        }
        const qint64 embedMs = stageTimer.restart();

        // Retrieval fan-out
        stage = QueryStage::Retrieving;
        std::vector<PublisherWork> work;
        work.reserve(corpora.size());
        for (const auto& corpus : corpora) {
            PublisherWork item;
            item.corpus = corpus;

            if (!queryVector.empty() && corpus->denseEnabled()) {
                const int denseK = profile.denseK;
                const double minScore = m_config.minDenseScore;
                std::function<DenseRetriever::Result()> denseTask =
                    [corpus, queryVector, denseK, minScore]() {
                        return DenseRetriever::retrieve(queryVector, *corpus, denseK, minScore);
                    };
                auto future = m_retrievalPool->run<DenseRetriever::Result>(denseTask, deadline);
                if (!future) {
                    std::promise<DenseRetriever::Result> inlinePromise;
                    inlinePromise.set_value(denseTask());
                    future = inlinePromise.get_future();
                }
                item.dense = std::move(*future);
                item.hasDense = true;
            }

            const int lexK = profile.lexK;
            const QString lexQuery = expansion.expanded;
            std::function<LexicalOutcome()> lexicalTask = [corpus, lexQuery, lexK]() {
                LexicalOutcome out;
                auto hits = LexicalRetriever::retrieve(lexQuery, *corpus, lexK, &out.error);
                if (!hits) {
                    out.ok = false;
                } else {
                    out.hits = std::move(*hits);
                }
                return out;
            };
            auto lexFuture = m_retrievalPool->run<LexicalOutcome>(lexicalTask, deadline);
            if (!lexFuture) {
                std::promise<LexicalOutcome> inlinePromise;
                inlinePromise.set_value(lexicalTask());
                lexFuture = inlinePromise.get_future();
            }
            item.lexical = std::move(*lexFuture);
            work.push_back(std::move(item));
        }

        int denseHits = 0;
        int lexHits = 0;
        int belowThreshold = 0;
        int missingRows = 0;
        const FusionConfig fusion{m_config.rrfK, m_config.denseWeight, m_config.lexicalWeight};
        std::vector<std::vector<Candidate>> perCorpus;
        std::vector<std::pair<std::vector<ScoredChunk>, std::vector<ScoredChunk>>> lists;
        for (PublisherWork& item : work) {
            DenseRetriever::Result dense;
            if (item.hasDense && !awaitResult(item.dense, deadline, &dense)) {
                m_failures.fetch_add(1);
                return fail(IpcErrorCode::SearchTimeout, stage,
                            QStringLiteral("Query exceeded %1 ms").arg(m_config.queryTimeoutMs),
                            requestId);
            }
            LexicalOutcome lexical;
            if (!awaitResult(item.lexical, deadline, &lexical)) {
                m_failures.fetch_add(1);
                return fail(IpcErrorCode::SearchTimeout, stage,
                            QStringLiteral("Query exceeded %1 ms").arg(m_config.queryTimeoutMs),
                            requestId);
            }
            if (!lexical.ok) {
                m_failures.fetch_add(1);
                QJsonObject details;
                details[QStringLiteral("publisher")] = item.corpus->publisher;
                return fail(IpcErrorCode::SearchError, stage, QStringLiteral("Search failed"),
                            requestId, details,
                            QStringLiteral("lexical retrieval for %1: %2")
                                .arg(item.corpus->publisher, lexical.error));
            }
            denseHits += static_cast<int>(dense.hits.size());
            lexHits += static_cast<int>(lexical.hits.size());
            belowThreshold += dense.belowThreshold;
            missingRows += dense.missingRows;
            lists.emplace_back(std::move(dense.hits), std::move(lexical.hits));
        }
        const qint64 retrieveMs = stageTimer.restart();

        // Fusion
        stage = QueryStage::Fusing;
        for (const auto& pair : lists) {
            perCorpus.push_back(RankFusion::fuse(pair.first, pair.second, fusion, profile.mmrK));
        }
        std::vector<Candidate> fused = RankFusion::mergeCorpora(perCorpus, profile.mmrK);
        for (Candidate& candidate : fused) {
            if (candidate.chunk.label < 0) {
                continue;
            }
            const std::shared_ptr<CorpusHandle> corpus = m_registry.handle(candidate.chunk.publisher);
            if (corpus && corpus->denseEnabled()) {
                candidate.embedding =
                    corpus->index->vectorForLabel(static_cast<uint64_t>(candidate.chunk.label));
            }
        }
        const qint64 fuseMs = stageTimer.restart();

        // Diversity
        stage = QueryStage::Selecting;
        const std::vector<Candidate> selected =
            DiversitySelector::select(fused, profile.finalK, profile.mmrLambda);
        const qint64 mmrMs = stageTimer.restart();

        // Judge
        stage = QueryStage::Judging;
        const JudgeResult judged = m_judgeChain->judge(request.query, selected, judgeMode);
        if (judged.report.timedOut) {
            QJsonObject timeout = warning(QStringLiteral("SEARCH_TIMEOUT"),
                                          QStringLiteral("Judge exceeded %1 ms, scores fall back to f_score")
                                              .arg(m_config.judgeBudgetMs));
            timeout[QStringLiteral("stage")] = queryStageToString(QueryStage::Judging);
            warnings.append(timeout);
        } else if (judged.report.degraded) {
            warnings.append(warning(QStringLiteral("JUDGE_DEGRADED"), judged.report.fallbackReason));
        }
        const qint64 judgeMs = stageTimer.restart();

        // Coverage and answer
        stage = QueryStage::Estimating;
        const std::vector<EvidenceHit> graded =
            CoverageEstimator::grade(selected, judged.scores, m_config.tiers);
        CoverageEstimator::Options estimateOptions;
        estimateOptions.jmin = request.jmin;
        estimateOptions.sortKey = request.sort;
        estimateOptions.nearMissFraction = m_config.nearMissFraction;
        estimateOptions.nearMissMax = m_config.nearMissMax;
        const Estimate estimate = CoverageEstimator::estimate(graded, estimateOptions);

        stage = QueryStage::Composing;
        const ComposedAnswer answer = AnswerComposer::compose(estimate);

        const int totalHits = static_cast<int>(estimate.hits.size());
        const int first = (request.page - 1) * request.pageSize;
        const int last = std::min(totalHits, first + request.pageSize);
        QJsonArray hitsJson;
        for (int i = first; i < last; ++i) {
            hitsJson.append(hitToJson(estimate.hits[static_cast<size_t>(i)], m_config));
        }
        QJsonArray nearMissJson;
        if (request.showNearMiss) {
            for (const EvidenceHit& hit : estimate.nearMiss) {
                nearMissJson.append(hitToJson(hit, m_config));
            }
        }
        QJsonArray sourcesJson;
        for (const EvidenceHit& hit : answer.sources) {
            sourcesJson.append(hitToJson(hit, m_config));
        }
        const qint64 composeMs = stageTimer.restart();

        // Meta
        QJsonObject modeCfg;
        modeCfg[QStringLiteral("mode")] = queryModeToString(request.mode);
        modeCfg[QStringLiteral("final_k")] = profile.finalK;
        modeCfg[QStringLiteral("mmr_k")] = profile.mmrK;
        modeCfg[QStringLiteral("dense_k")] = profile.denseK;
        modeCfg[QStringLiteral("lex_k")] = profile.lexK;
        modeCfg[QStringLiteral("mmr_lambda")] = profile.mmrLambda;
        modeCfg[QStringLiteral("judge_mode")] = judgeModeToString(judgeMode);

        QJsonObject timings;
        timings[QStringLiteral("embed_ms")] = embedMs;
        timings[QStringLiteral("retrieve_ms")] = retrieveMs;
        timings[QStringLiteral("fuse_ms")] = fuseMs;
        timings[QStringLiteral("mmr_ms")] = mmrMs;
        timings[QStringLiteral("judge_ms")] = judgeMs;
        timings[QStringLiteral("compose_ms")] = composeMs;
        timings[QStringLiteral("total_ms")] = total.elapsed();

        QJsonObject counts;
        counts[QStringLiteral("dense")] = denseHits;
        counts[QStringLiteral("lexical")] = lexHits;
        counts[QStringLiteral("dense_below_threshold")] = belowThreshold;
        counts[QStringLiteral("dense_missing_rows")] = missingRows;
        counts[QStringLiteral("fused")] = static_cast<int>(fused.size());
        counts[QStringLiteral("selected")] = static_cast<int>(selected.size());
        counts[QStringLiteral("hits")] = totalHits;
        counts[QStringLiteral("near_miss")] = static_cast<int>(estimate.nearMiss.size());

        QJsonObject publishers;
        publishers[QStringLiteral("requested")] = QJsonArray::fromStringList(requested);
        publishers[QStringLiteral("used")] = QJsonArray::fromStringList(used);
        publishers[QStringLiteral("missing")] = QJsonArray::fromStringList(missing);

        QJsonObject page;
        page[QStringLiteral("page")] = request.page;
        page[QStringLiteral("page_size")] = request.pageSize;
        page[QStringLiteral("total")] = totalHits;
        page[QStringLiteral("pages")] = totalHits == 0
            ? 0
            : (totalHits + request.pageSize - 1) / request.pageSize;

        QJsonObject caches;
        if (m_cachedEmbedder) {
            const auto s = m_cachedEmbedder->cacheStats();
            caches[QStringLiteral("embedding")] = cacheStatsJson(s.hits, s.misses, s.evictions, s.size);
        }
        if (auto* crossEncoder = dynamic_cast<CrossEncoderJudge*>(m_realJudge.get())) {
            const auto s = crossEncoder->cacheStats();
            caches[QStringLiteral("judge")] = cacheStatsJson(s.hits, s.misses, s.evictions, s.size);
        }

        QJsonObject meta;
        meta[QStringLiteral("request_id")] = requestId;
        meta[QStringLiteral("mode_cfg")] = modeCfg;
        meta[QStringLiteral("t")] = timings;
        meta[QStringLiteral("n")] = counts;
        meta[QStringLiteral("judge")] = judged.report.toJson();
        meta[QStringLiteral("publishers")] = publishers;
        meta[QStringLiteral("expansion")] = expansion.toJson();
        meta[QStringLiteral("page")] = page;
        meta[QStringLiteral("caches")] = caches;
        meta[QStringLiteral("warnings")] = warnings;
        meta[QStringLiteral("request")] = request.toJson();

        QJsonObject result;
        result[QStringLiteral("query")] = request.query;
        result[QStringLiteral("hits")] = hitsJson;
        result[QStringLiteral("near_miss")] = nearMissJson;
        result[QStringLiteral("coverage")] = coverageToString(estimate.coverage);
        result[QStringLiteral("confidence")] = estimate.confidence;
        result[QStringLiteral("no_evidence")] = estimate.noEvidence;
        result[QStringLiteral("answer")] = answer.text;
        result[QStringLiteral("abstained")] = answer.abstained;
        result[QStringLiteral("sources")] = sourcesJson;
        result[QStringLiteral("meta")] = meta;

        m_recent->record(request.query, used);

        LOG_INFO(slCore, "Query %s mode=%s judge=%s pubs=%s hits=%d near=%d coverage=%s in %lld ms",
                 qUtf8Printable(requestId), qUtf8Printable(queryModeToString(request.mode)),
                 qUtf8Printable(judged.report.servedBy),
                 qUtf8Printable(used.join(QLatin1Char(','))), totalHits,
                 static_cast<int>(estimate.nearMiss.size()),
                 qUtf8Printable(coverageToString(estimate.coverage)),
                 static_cast<long long>(total.elapsed()));
        return QueryOutcome::success(result);
    } catch (const std::exception& e) {
        m_failures.fetch_add(1);
        return fail(IpcErrorCode::SearchError, stage, QStringLiteral("Search failed"), requestId, {},
                    QString::fromUtf8(e.what()));
    }
}

QJsonObject QueryOrchestrator::hitToJson(const EvidenceHit& hit, const EngineConfig& config)
{
    const Candidate& c = hit.candidate;
    const ChunkRecord& chunk = c.chunk;

    QString snippet = chunk.text.left(config.snippetChars);
    if (chunk.text.size() > config.snippetChars) {
        snippet += QStringLiteral("...");
    }

    QJsonObject json;
    json[QStringLiteral("id")] = QStringLiteral("%1:%2:%3")
                                     .arg(chunk.publisher, chunk.book)
                                     .arg(chunk.chunkIdx);
    json[QStringLiteral("title")] = chunk.title.isEmpty() ? chunk.book : chunk.title;
    json[QStringLiteral("section")] = chunk.section.isEmpty()
        ? QStringLiteral("Chunk %1").arg(chunk.chunkIdx)
        : chunk.section;
    json[QStringLiteral("publisher")] = chunk.publisher;
    json[QStringLiteral("book")] = chunk.book;
    json[QStringLiteral("chunk_idx")] = chunk.chunkIdx;
    json[QStringLiteral("snippet")] = snippet;
    json[QStringLiteral("full_text")] = chunk.text.left(config.maxTextChars);
    json[QStringLiteral("judge01")] = c.judgeScore;
    json[QStringLiteral("j_score")] = round2(c.judgeScore);
    json[QStringLiteral("s_score")] = round2(c.sScore);
    json[QStringLiteral("l_score")] = round2(c.lScore);
    json[QStringLiteral("f_score")] = c.fScore;
    json[QStringLiteral("tier")] = tierToString(hit.tier);
    json[QStringLiteral("fused_rank")] = c.fusedRank;
    json[QStringLiteral("dense_rank")] = c.denseRank;
    json[QStringLiteral("lexical_rank")] = c.lexicalRank;
    return json;
}

QueryOutcome QueryOrchestrator::chat(const QJsonObject& params)
{
    const QString message = params.value(QStringLiteral("message")).toString().trimmed();
    if (message.isEmpty()) {
        QJsonObject fields;
        fields[QStringLiteral("message")] = QStringLiteral("must be a non-empty string");
        QJsonObject details;
        details[QStringLiteral("fields")] = fields;
        return QueryOutcome::failure(IpcErrorCode::InvalidParams,
                                     QStringLiteral("Invalid chat parameters"), details);
    }
    if (params.contains(QStringLiteral("history"))
        && !params.value(QStringLiteral("history")).isArray()) {
        QJsonObject fields;
        fields[QStringLiteral("history")] = QStringLiteral("must be an array");
        QJsonObject details;
        details[QStringLiteral("fields")] = fields;
        return QueryOutcome::failure(IpcErrorCode::InvalidParams,
                                     QStringLiteral("Invalid chat parameters"), details);
    }

    QJsonObject searchParams;
    searchParams[QStringLiteral("query")] = message;
    searchParams[QStringLiteral("mode")] = QStringLiteral("thorough");
    if (params.contains(QStringLiteral("request_id"))) {
        searchParams[QStringLiteral("request_id")] = params.value(QStringLiteral("request_id"));
    }
    QueryOutcome outcome = search(searchParams);
    if (!outcome.ok) {
        return outcome;
    }

    // History is accepted for API compatibility; answers are single-turn.
    const QJsonArray hits = outcome.result.value(QStringLiteral("hits")).toArray();
    QJsonArray sources;
    for (int i = 0; i < hits.size() && i < kChatSources; ++i) {
        sources.append(hits.at(i));
    }

    QJsonObject result;
    result[QStringLiteral("answer")] = outcome.result.value(QStringLiteral("answer"));
    result[QStringLiteral("sources")] = sources;
    result[QStringLiteral("coverage")] = outcome.result.value(QStringLiteral("coverage"));
    result[QStringLiteral("confidence")] = outcome.result.value(QStringLiteral("confidence"));
    result[QStringLiteral("no_evidence")] = outcome.result.value(QStringLiteral("no_evidence"));
    result[QStringLiteral("meta")] = outcome.result.value(QStringLiteral("meta"));
    return QueryOutcome::success(result);
}

QueryOutcome QueryOrchestrator::readerChunk(const QJsonObject& params) const
{
    if (!m_initialized.load()) {
        return QueryOutcome::failure(IpcErrorCode::EngineUnavailable,
                                     QStringLiteral("Engine is not initialized"));
    }

    QString book = params.value(QStringLiteral("book")).toString();
    if (book.isEmpty()) {
        book = params.value(QStringLiteral("fp")).toString();
    }
    const QJsonValue idxValue = params.value(QStringLiteral("chunk_idx"));
    QJsonObject fields;
    if (book.isEmpty()) {
        fields[QStringLiteral("book")] = QStringLiteral("book or fp is required");
    }
    if (!idxValue.isDouble() || idxValue.toDouble() < 0
        || idxValue.toDouble() != std::floor(idxValue.toDouble())
        || idxValue.toDouble() > static_cast<double>(kMaxChunkIdx)) {
        fields[QStringLiteral("chunk_idx")] =
            QStringLiteral("must be an integer in [0, %1]").arg(kMaxChunkIdx);
    }
    int window = kReaderWindow;
    if (params.contains(QStringLiteral("window"))) {
        const QJsonValue w = params.value(QStringLiteral("window"));
        if (!w.isDouble() || w.toInt(-1) < 0 || w.toInt(-1) > kMaxReaderWindow) {
            fields[QStringLiteral("window")] =
                QStringLiteral("must be an integer in [0, %1]").arg(kMaxReaderWindow);
        } else {
            window = w.toInt();
        }
    }
    const QString publisher = params.value(QStringLiteral("publisher")).toString();
    if (!publisher.isEmpty() && !m_config.publishers.contains(publisher)) {
        fields[QStringLiteral("publisher")] = QStringLiteral("unknown publisher");
    }
    if (!fields.isEmpty()) {
        QJsonObject details;
        details[QStringLiteral("fields")] = fields;
        return QueryOutcome::failure(IpcErrorCode::InvalidParams,
                                     QStringLiteral("Invalid reader parameters"), details);
    }
    const int chunkIdx = idxValue.toInt();

    const QStringList candidates = publisher.isEmpty() ? m_registry.loadedPublishers()
                                                       : QStringList{publisher};
    for (const QString& pub : candidates) {
        const std::shared_ptr<CorpusHandle> corpus = m_registry.handle(pub);
        if (!corpus) {
            continue;
        }
        const std::vector<ChunkRecord> chunks = corpus->store->chunkWindow(book, chunkIdx, window);
        const bool hasTarget = std::any_of(chunks.begin(), chunks.end(), [chunkIdx](const ChunkRecord& c) {
            return c.chunkIdx == chunkIdx;
        });
        if (!hasTarget) {
            continue;
        }

        QJsonArray items;
        QString title;
        QString bookName;
        for (const ChunkRecord& chunk : chunks) {
            QJsonObject item;
            item[QStringLiteral("chunk_idx")] = chunk.chunkIdx;
            item[QStringLiteral("section")] = chunk.section;
            item[QStringLiteral("text")] = chunk.text.left(m_config.maxSnippetChars);
            item[QStringLiteral("truncated")] = chunk.text.size() > m_config.maxSnippetChars;
            item[QStringLiteral("is_target")] = chunk.chunkIdx == chunkIdx;
            items.append(item);
            if (chunk.chunkIdx == chunkIdx) {
                title = chunk.title;
                bookName = chunk.book;
            }
        }

        QJsonObject result;
        result[QStringLiteral("publisher")] = pub;
        result[QStringLiteral("book")] = bookName;
        result[QStringLiteral("title")] = title;
        result[QStringLiteral("chunk_idx")] = chunkIdx;
        result[QStringLiteral("window")] = window;
        result[QStringLiteral("chunks")] = items;
        return QueryOutcome::success(result);
    }

    return QueryOutcome::failure(IpcErrorCode::NotFound,
                                 QStringLiteral("No chunk %1 for %2").arg(chunkIdx).arg(book));
}

QueryOutcome QueryOrchestrator::stats() const
{
    if (!m_initialized.load()) {
        return QueryOutcome::failure(IpcErrorCode::EngineUnavailable,
                                     QStringLiteral("Engine is not initialized"));
    }

    QJsonObject corpora;
    int totalChunks = 0;
    int totalDocuments = 0;
    for (const QString& pub : m_registry.loadedPublishers()) {
        const std::shared_ptr<CorpusHandle> corpus = m_registry.handle(pub);
        if (!corpus) {
            continue;
        }
        const int chunks = corpus->store->chunkCount();
        const int documents = corpus->store->documentCount();
        totalChunks += std::max(0, chunks);
        totalDocuments += std::max(0, documents);

        QJsonObject entry;
        entry[QStringLiteral("chunk_count")] = chunks;
        entry[QStringLiteral("document_count")] = documents;
        entry[QStringLiteral("index_bytes")] = corpus->indexBytes;
        entry[QStringLiteral("db_bytes")] = corpus->dbBytes;
        entry[QStringLiteral("dense_enabled")] = corpus->denseEnabled();
        entry[QStringLiteral("vectors")] = corpus->denseEnabled()
            ? static_cast<qint64>(corpus->index->totalElements())
            : 0;
        entry[QStringLiteral("embedding_model")] = corpus->manifest.embeddingModel;
        entry[QStringLiteral("dimensions")] = corpus->manifest.dimensions;
        entry[QStringLiteral("built_at")] = corpus->manifest.builtAt;
        corpora[pub] = entry;
    }

    QJsonObject result;
    result[QStringLiteral("corpora")] = corpora;
    result[QStringLiteral("total_chunks")] = totalChunks;
    result[QStringLiteral("total_documents")] = totalDocuments;
    result[QStringLiteral("queries")] = static_cast<qint64>(m_queries.load());
    result[QStringLiteral("failures")] = static_cast<qint64>(m_failures.load());
    if (m_judgeChain) {
        result[QStringLiteral("judge")] = m_judgeChain->status();
    }
    if (m_retrievalPool) {
        const TaskPool::Counters counters = m_retrievalPool->counters();
        QJsonObject pool;
        pool[QStringLiteral("workers")] = m_retrievalPool->workerCount();
        pool[QStringLiteral("submitted")] = static_cast<qint64>(counters.submitted);
        pool[QStringLiteral("completed")] = static_cast<qint64>(counters.completed);
        pool[QStringLiteral("rejected")] = static_cast<qint64>(counters.rejected);
        pool[QStringLiteral("expired")] = static_cast<qint64>(counters.expired);
        result[QStringLiteral("retrieval_pool")] = pool;
    }
    return QueryOutcome::success(result);
}

QJsonObject QueryOrchestrator::health() const
{
    QJsonObject result;
    if (!m_initialized.load()) {
        result[QStringLiteral("ok")] = false;
        result[QStringLiteral("corpus_count")] = 0;
        result[QStringLiteral("publishers")] = QJsonArray();
        result[QStringLiteral("engine_version")] = QStringLiteral("unavailable");
        result[QStringLiteral("error")] = QStringLiteral("Engine is not initialized");
        return result;
    }

    const QStringList ready = m_registry.loadedPublishers();
    QJsonObject corpora;
    for (const CorpusReport& report : m_registry.reports()) {
        corpora[report.publisher] = report.toJson();
    }

    const EmbedderIdentity identity = embedderIdentity();
    QJsonObject embedder;
    embedder[QStringLiteral("available")] = identity.available;
    embedder[QStringLiteral("model_id")] = identity.modelId;
    embedder[QStringLiteral("dimensions")] = identity.dimensions;

    result[QStringLiteral("ok")] = !ready.isEmpty();
    result[QStringLiteral("corpus_count")] = ready.size();
    result[QStringLiteral("publishers")] = QJsonArray::fromStringList(ready);
    result[QStringLiteral("engine_version")] = QString::fromLatin1(kEngineVersion);
    result[QStringLiteral("corpora")] = corpora;
    result[QStringLiteral("embedder")] = embedder;
    if (m_judgeChain) {
        result[QStringLiteral("judge")] = m_judgeChain->status();
    }
    return result;
}

QJsonObject QueryOrchestrator::suggestions(const QString& fragment) const
{
    QJsonObject result;
    result[QStringLiteral("suggestions")] = QJsonArray::fromStringList(
        m_recent->suggestions(fragment.trimmed()));
    return result;
}

} // namespace sl
