#pragma once

#include <QString>

#include <vector>

namespace sl {

// Turns a query string into a unit-length vector in the same space as the
// corpus embeddings. An empty result means the embedding failed.
class QueryEmbedder {
public:
    virtual ~QueryEmbedder() = default;

    virtual bool isAvailable() const = 0;
    virtual QString modelId() const = 0;
    virtual int dimensions() const = 0;
    virtual std::vector<float> embedQuery(const QString& text) = 0;
};

} // namespace sl
