#pragma once

#include "core/embedding/query_embedder.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace sl {

class ModelRegistry;
class WordPieceTokenizer;

// Stops calling the model after repeated failures, then lets a single
// attempt through once the cool-down has passed.
struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureMs{0};
    static constexpr int kOpenThreshold = 5;
    static constexpr int kHalfOpenDelayMs = 30000;

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

// Bi-encoder from the "bi-encoder" manifest role. Pools a [batch, seq, hidden]
// output per the manifest's poolingStrategy (attention-masked mean unless it
// says "cls"), takes a [batch, hidden] output as already pooled, and
// L2-normalizes the result.
class EmbeddingManager : public QueryEmbedder {
public:
    explicit EmbeddingManager(ModelRegistry* registry);
    ~EmbeddingManager() override;

    EmbeddingManager(const EmbeddingManager&) = delete;
    EmbeddingManager& operator=(const EmbeddingManager&) = delete;

    bool initialize();

    bool isAvailable() const override;
    QString modelId() const override;
    int dimensions() const override;
    std::vector<float> embedQuery(const QString& text) override;

    static void normalizeInPlace(std::vector<float>& vec);

    // Pools row-major token vectors [seqLength, dimensions]. "cls" takes
    // token 0; anything else averages the tokens whose mask entry is set.
    static std::vector<float> poolTokens(const float* data, int seqLength, int dimensions,
                                         const std::vector<int64_t>& attentionMask,
                                         const QString& strategy);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;

    ModelRegistry* m_registry = nullptr;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    QString m_modelId;
    QString m_queryPrefix;
    QString m_poolingStrategy;
    int m_dimensions = 0;
    bool m_available = false;
    EmbeddingCircuitBreaker m_breaker;
};

} // namespace sl
