#pragma once

#include "core/ranking/judge.h"
#include "core/shared/lru_cache.h"

#include <memory>
#include <string>

namespace sl {

class ModelRegistry;

struct CrossEncoderJudgeConfig {
    int topK = 12;                 // candidates scored by the model per call
    int cacheSize = 256;
    int cacheTtlSec = 600;
    double proxySemanticWeight = 0.6;
    double proxyLexicalWeight = 0.4;
};

// ONNX cross-encoder over "[CLS] query [SEP] chunk [SEP]", scored as
// sigmoid(logit). Candidates past topK receive proxy scores. Scores are
// cached per (query, chunk content hash).
class CrossEncoderJudge : public JudgeStrategy {
public:
    CrossEncoderJudge(ModelRegistry* registry, CrossEncoderJudgeConfig config = {});
    ~CrossEncoderJudge() override;

    CrossEncoderJudge(const CrossEncoderJudge&) = delete;
    CrossEncoderJudge& operator=(const CrossEncoderJudge&) = delete;

    bool initialize();

    QString name() const override { return QStringLiteral("real"); }
    bool isAvailable() const override;
    std::optional<std::vector<double>> score(const QString& query,
                                             const std::vector<Candidate>& candidates,
                                             QString* errorOut = nullptr) override;
    int64_t invocations() const override { return m_invocations.load(); }

    LruCache<double>::Stats cacheStats() const { return m_cache.stats(); }

    static QString cacheKey(const QString& query, const ChunkRecord& chunk);

private:
    std::optional<std::vector<double>> runModel(const QString& query,
                                                const std::vector<const Candidate*>& batch,
                                                QString* errorOut);

    class Impl;
    std::unique_ptr<Impl> m_impl;

    ModelRegistry* m_registry = nullptr;
    CrossEncoderJudgeConfig m_config;
    ProxyJudge m_proxy;
    LruCache<double> m_cache;
    std::atomic<int64_t> m_invocations{0};
    bool m_available = false;
};

} // namespace sl
