#include "core/embedding/cached_query_embedder.h"

namespace sl {

CachedQueryEmbedder::CachedQueryEmbedder(std::shared_ptr<QueryEmbedder> inner, int capacity)
    : m_inner(std::move(inner))
    , m_cache(capacity)
{
}

bool CachedQueryEmbedder::isAvailable() const
{
    return m_inner && m_inner->isAvailable();
}

QString CachedQueryEmbedder::modelId() const
{
    return m_inner ? m_inner->modelId() : QString();
}

int CachedQueryEmbedder::dimensions() const
{
    return m_inner ? m_inner->dimensions() : 0;
}

std::vector<float> CachedQueryEmbedder::embedQuery(const QString& text)
{
    if (!m_inner) {
        return {};
    }
    const QString key = m_inner->modelId() + QLatin1Char('\n') + text;
    if (std::optional<std::vector<float>> hit = m_cache.get(key)) {
        return std::move(hit.value());
    }

    std::vector<float> vec = m_inner->embedQuery(text);
    if (!vec.empty()) {
        m_cache.put(key, vec);
    }
    return vec;
}

} // namespace sl
