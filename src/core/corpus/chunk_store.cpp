#include "core/corpus/chunk_store.h"

#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QFileInfo>

#include <algorithm>

namespace sl {

namespace {

// Shared column list; every row reader below expects this order.
constexpr const char* kChunkColumns = "c.cid, c.fp, c.sec, c.cidx, c.tx, c.i64";

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

ChunkRecord readChunk(sqlite3_stmt* stmt, const QString& publisher)
{
    ChunkRecord chunk;
    chunk.cid = columnText(stmt, 0);
    chunk.filePath = columnText(stmt, 1);
    chunk.section = columnText(stmt, 2);
    chunk.chunkIdx = sqlite3_column_int(stmt, 3);
    chunk.text = columnText(stmt, 4);
    chunk.label = sqlite3_column_type(stmt, 5) == SQLITE_NULL ? -1 : sqlite3_column_int64(stmt, 5);
    chunk.book = ChunkStore::bookFromPath(chunk.filePath);
    chunk.title = ChunkStore::titleFromBook(chunk.book);
    chunk.publisher = publisher;
    return chunk;
}

} // namespace

ChunkStore::~ChunkStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

ChunkStore::ChunkStore(ChunkStore&& other) noexcept
    : m_db(other.m_db)
    , m_publisher(std::move(other.m_publisher))
    , m_path(std::move(other.m_path))
{
    other.m_db = nullptr;
}

ChunkStore& ChunkStore::operator=(ChunkStore&& other) noexcept
{
    if (this != &other) {
        if (m_db) {
            sqlite3_close(m_db);
        }
        m_db = other.m_db;
        m_publisher = std::move(other.m_publisher);
        m_path = std::move(other.m_path);
        other.m_db = nullptr;
    }
    return *this;
}

std::optional<ChunkStore> ChunkStore::open(const QString& dbPath, const QString& publisher,
                                           QString* errorOut)
{
    ChunkStore store;
    store.m_publisher = publisher;
    store.m_path = dbPath;

    const int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &store.m_db,
                                   SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        const QString message = QStringLiteral("cannot open %1: %2")
                                    .arg(dbPath, QString::fromUtf8(sqlite3_errmsg(store.m_db)));
        LOG_ERROR(slCorpus, "%s", qPrintable(message));
        if (errorOut) {
            *errorOut = message;
        }
        return std::nullopt;
    }
    sqlite3_busy_timeout(store.m_db, 5000);

    // The file may exist but lack the expected tables.
    sqlite3_stmt* stmt = nullptr;
    int tables = 0;
    if (sqlite3_prepare_v2(store.m_db,
                           "SELECT count(*) FROM sqlite_master WHERE name IN ('chunks', 'chunks_fts')",
                           -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        tables = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    if (tables != 2) {
        if (errorOut) {
            *errorOut = QStringLiteral("%1 lacks chunks/chunks_fts tables").arg(dbPath);
        }
        return std::nullopt;
    }

    return store;
}

std::optional<std::vector<ChunkStore::FtsRow>> ChunkStore::searchFts(const QString& matchExpr,
                                                                     int limit,
                                                                     QString* errorOut) const
{
    std::vector<FtsRow> rows;
    if (matchExpr.isEmpty() || limit <= 0) {
        return rows;
    }

    const QByteArray sql = QStringLiteral(
        "SELECT %1, bm25(chunks_fts) AS score "
        "FROM chunks_fts JOIN chunks c ON c.cid = chunks_fts.cid "
        "WHERE chunks_fts MATCH ?1 "
        "ORDER BY score ASC, c.cidx ASC "
        "LIMIT ?2").arg(QLatin1String(kChunkColumns)).toUtf8();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        if (errorOut) {
            *errorOut = QString::fromUtf8(sqlite3_errmsg(m_db));
        }
        LOG_ERROR(slRetrieval, "FTS prepare failed (%s): %s",
                  qPrintable(m_publisher), sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QByteArray matchUtf8 = matchExpr.toUtf8();
    sqlite3_bind_text(stmt, 1, matchUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, limit);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        FtsRow row;
        row.chunk = readChunk(stmt, m_publisher);
        row.bm25 = sqlite3_column_double(stmt, 6);
        rows.push_back(std::move(row));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        if (errorOut) {
            *errorOut = QString::fromUtf8(sqlite3_errmsg(m_db));
        }
        LOG_ERROR(slRetrieval, "FTS step failed (%s): %s", qPrintable(m_publisher), sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return rows;
}

std::unordered_map<int64_t, ChunkRecord> ChunkStore::chunksByLabels(const std::vector<int64_t>& labels) const
{
    std::unordered_map<int64_t, ChunkRecord> out;
    if (labels.empty()) {
        return out;
    }

    const QByteArray sql = QStringLiteral("SELECT %1 FROM chunks c WHERE c.i64 = ?1 LIMIT 1")
                               .arg(QLatin1String(kChunkColumns)).toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(slCorpus, "chunksByLabels prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }

    for (const int64_t label : labels) {
        sqlite3_reset(stmt);
        sqlite3_bind_int64(stmt, 1, label);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            out.emplace(label, readChunk(stmt, m_publisher));
        }
    }
    sqlite3_finalize(stmt);
    return out;
}

std::vector<ChunkRecord> ChunkStore::chunkWindow(const QString& bookOrPath, int chunkIdx, int window) const
{
    std::vector<ChunkRecord> out;
    const int64_t lo = static_cast<int64_t>(chunkIdx) - std::max(window, 0);
    const int64_t hi = static_cast<int64_t>(chunkIdx) + std::max(window, 0);

    const QByteArray sql = QStringLiteral(
        "SELECT %1 FROM chunks c WHERE c.cidx BETWEEN ?1 AND ?2 ORDER BY c.cidx ASC")
                               .arg(QLatin1String(kChunkColumns)).toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(slCorpus, "chunkWindow prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    sqlite3_bind_int64(stmt, 1, lo);
    sqlite3_bind_int64(stmt, 2, hi);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ChunkRecord chunk = readChunk(stmt, m_publisher);
        if (chunk.filePath == bookOrPath || chunk.book == bookOrPath) {
            out.push_back(std::move(chunk));
        }
    }
    sqlite3_finalize(stmt);
    return out;
}

int ChunkStore::scalarInt(const char* sql) const
{
    sqlite3_stmt* stmt = nullptr;
    int value = 0;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        value = sqlite3_column_int(stmt, 0);
    } else {
        LOG_WARN(slCorpus, "query failed (%s): %s", qPrintable(m_publisher), sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return value;
}

int ChunkStore::chunkCount() const
{
    return scalarInt("SELECT count(*) FROM chunks");
}

int ChunkStore::documentCount() const
{
    return scalarInt("SELECT count(DISTINCT fp) FROM chunks");
}

QString ChunkStore::bookFromPath(const QString& filePath)
{
    return QFileInfo(filePath).completeBaseName();
}

QString ChunkStore::titleFromBook(const QString& book)
{
    QString title = book;
    title.replace(QLatin1Char('_'), QLatin1Char(' '));
    title.replace(QLatin1Char('-'), QLatin1Char(' '));
    return title.trimmed();
}

} // namespace sl
