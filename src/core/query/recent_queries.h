#pragma once

#include <QString>
#include <QStringList>

#include <mutex>
#include <vector>

namespace sl {

// Small JSON log of recently issued queries, most recent first and
// deduplicated by text. Backs the `suggestions` call.
//
// File format: [{"q": "...", "ts": <epoch seconds>, "pubs": ["..."]}, ...]
class RecentQueries {
public:
    RecentQueries(const QString& path, int limit = 12);

    // Failures to persist are logged and otherwise ignored.
    void record(const QString& query, const QStringList& pubs);

    // Most recent first, capped at `limit`.
    QStringList recent(int limit = 5) const;

    // Recent queries containing `fragment` (case-insensitive), capped at `limit`.
    QStringList suggestions(const QString& fragment, int limit = 5) const;

    const QString& path() const { return m_path; }

private:
    struct Entry {
        QString query;
        double ts = 0.0;
        QStringList pubs;
    };

    std::vector<Entry> readEntries() const;

    QString m_path;
    int m_limit;
    mutable std::mutex m_mutex;
};

} // namespace sl
