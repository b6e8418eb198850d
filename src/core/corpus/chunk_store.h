#pragma once

#include "core/shared/evidence.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

struct sqlite3;

namespace sl {

// ChunkStore -- read-only view of a publisher's meta.sqlite.
//
// Schema (built offline):
//   chunks(cid TEXT PRIMARY KEY, fp TEXT, sec TEXT, cidx INTEGER, tx TEXT, i64 INTEGER)
//   chunks_fts USING fts5(cid, fp, sec, tx)
//
// The connection is opened with SQLITE_OPEN_FULLMUTEX so one store can be
// shared by concurrent queries.
class ChunkStore {
public:
    ~ChunkStore();

    ChunkStore(ChunkStore&& other) noexcept;
    ChunkStore& operator=(ChunkStore&& other) noexcept;
    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    static std::optional<ChunkStore> open(const QString& dbPath, const QString& publisher,
                                          QString* errorOut = nullptr);

    struct FtsRow {
        ChunkRecord chunk;
        double bm25 = 0.0; // lower is better, as sqlite reports it
    };

    // `matchExpr` must already be a valid FTS5 expression. Returns nullopt
    // on a sqlite error; an expression with no matches yields an empty list.
    std::optional<std::vector<FtsRow>> searchFts(const QString& matchExpr, int limit,
                                                 QString* errorOut = nullptr) const;

    std::unordered_map<int64_t, ChunkRecord> chunksByLabels(const std::vector<int64_t>& labels) const;

    // Chunks of one book with |cidx - chunkIdx| <= window, ordered by cidx.
    // `bookOrPath` matches either the stored fp or its stem.
    std::vector<ChunkRecord> chunkWindow(const QString& bookOrPath, int chunkIdx, int window) const;

    int chunkCount() const;
    int documentCount() const;

    const QString& publisher() const { return m_publisher; }
    const QString& path() const { return m_path; }

    static QString bookFromPath(const QString& filePath);
    static QString titleFromBook(const QString& book);

private:
    ChunkStore() = default;
    int scalarInt(const char* sql) const;

    sqlite3* m_db = nullptr;
    QString m_publisher;
    QString m_path;
};

} // namespace sl
