#pragma once

#include "core/corpus/chunk_store.h"
#include "core/corpus/corpus_manifest.h"
#include "core/vector/vector_index.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace sl {

// Readiness of one publisher corpus, as surfaced by `health`.
struct CorpusReport {
    QString publisher;
    bool exists = false;      // publisher directory present
    bool index = false;       // index.hnsw present
    bool db = false;          // meta.sqlite present
    bool manifest = false;    // manifest.json present
    QStringList missing;
    QStringList reasons;
    QString failureReason;
    bool dimOk = false;
    bool denseLoaded = false;
    bool dbLoaded = false;
    bool ready = false;
    int indexDim = 0;
    int embedDim = 0;

    QJsonObject toJson() const;
};

// What the registry needs to know about the query embedder to validate a
// corpus against it. `available == false` loads corpora lexical-only.
struct EmbedderIdentity {
    bool available = false;
    QString modelId;
    int dimensions = 0;
};

// A loaded corpus. Immutable after load and shared across queries.
struct CorpusHandle {
    QString publisher;
    QString directory;
    CorpusManifest manifest;
    std::unique_ptr<VectorIndex> index; // null when dense retrieval is disabled
    std::unique_ptr<ChunkStore> store;
    qint64 indexBytes = 0;
    qint64 dbBytes = 0;

    bool denseEnabled() const { return index && index->isAvailable(); }
};

class CorpusRegistry {
public:
    CorpusRegistry(const QString& dataRoot, const QStringList& publishers);

    static constexpr const char* kIndexFile = "index.hnsw";
    static constexpr const char* kIndexMetaFile = "index.meta.json";
    static constexpr const char* kDbFile = "meta.sqlite";
    static constexpr const char* kManifestFile = "manifest.json";

    const QString& dataRoot() const { return m_dataRoot; }
    const QStringList& publishers() const { return m_publishers; }
    QString publisherDir(const QString& publisher) const;

    // Filesystem check only: index and metadata store both exist.
    bool isReady(const QString& publisher) const;

    // Presence report without opening anything.
    CorpusReport inspect(const QString& publisher) const;

    // Opens and validates one corpus. Returns nullptr and fills errorOut on
    // any mismatch; `reportOut` always receives the resulting report.
    std::shared_ptr<CorpusHandle> load(const QString& publisher, const EmbedderIdentity& embedder,
                                       CorpusReport* reportOut = nullptr,
                                       QString* errorOut = nullptr) const;

    // Reloads every configured publisher and swaps the live handle set.
    std::vector<CorpusReport> refresh(const EmbedderIdentity& embedder);

    std::shared_ptr<CorpusHandle> handle(const QString& publisher) const;
    QStringList loadedPublishers() const;
    std::vector<CorpusReport> reports() const;

private:
    QString m_dataRoot;
    QStringList m_publishers;

    mutable std::mutex m_mutex;
    std::map<QString, std::shared_ptr<CorpusHandle>> m_handles;
    std::map<QString, CorpusReport> m_reports;
};

} // namespace sl
