#pragma once

#include "core/embedding/query_embedder.h"
#include "core/shared/lru_cache.h"

#include <memory>

namespace sl {

// Memoizes another embedder by (model id, exact query text). Failed embeddings are
// not cached.
class CachedQueryEmbedder : public QueryEmbedder {
public:
    CachedQueryEmbedder(std::shared_ptr<QueryEmbedder> inner, int capacity);

    bool isAvailable() const override;
    QString modelId() const override;
    int dimensions() const override;
    std::vector<float> embedQuery(const QString& text) override;

    LruCache<std::vector<float>>::Stats cacheStats() const { return m_cache.stats(); }

private:
    std::shared_ptr<QueryEmbedder> m_inner;
    LruCache<std::vector<float>> m_cache;
};

} // namespace sl
