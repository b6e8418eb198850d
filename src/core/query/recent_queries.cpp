#include "core/query/recent_queries.h"

#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QSet>

#include <algorithm>

namespace sl {

RecentQueries::RecentQueries(const QString& path, int limit)
    : m_path(path)
    , m_limit(std::max(limit, 1))
{
}

std::vector<RecentQueries::Entry> RecentQueries::readEntries() const
{
    std::vector<Entry> entries;
    QFile file(m_path);
    if (m_path.isEmpty() || !file.open(QIODevice::ReadOnly)) {
        return entries;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    for (const QJsonValue& value : doc.array()) {
        const QJsonObject obj = value.toObject();
        Entry entry;
        entry.query = obj.value(QStringLiteral("q")).toString().trimmed();
        entry.ts = obj.value(QStringLiteral("ts")).toDouble(0.0);
        for (const QJsonValue& pub : obj.value(QStringLiteral("pubs")).toArray()) {
            entry.pubs << pub.toString();
        }
        if (!entry.query.isEmpty()) {
            entries.push_back(std::move(entry));
        }
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const Entry& a, const Entry& b) { return a.ts > b.ts; });
    return entries;
}

void RecentQueries::record(const QString& query, const QStringList& pubs)
{
    const QString text = query.trimmed();
    if (text.isEmpty() || m_path.isEmpty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Entry> entries = readEntries();

    Entry fresh;
    fresh.query = text;
    fresh.ts = static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
    fresh.pubs = pubs;
    fresh.pubs.removeDuplicates();
    fresh.pubs.sort();
    entries.insert(entries.begin(), fresh);

    QJsonArray out;
    QSet<QString> seen;
    for (const Entry& entry : entries) {
        if (seen.contains(entry.query)) {
            continue;
        }
        seen.insert(entry.query);
        QJsonObject obj;
        obj[QStringLiteral("q")] = entry.query;
        obj[QStringLiteral("ts")] = entry.ts;
        obj[QStringLiteral("pubs")] = QJsonArray::fromStringList(entry.pubs);
        out.append(obj);
        if (out.size() >= m_limit) {
            break;
        }
    }

    QDir().mkpath(QFileInfo(m_path).absolutePath());
    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)
        || file.write(QJsonDocument(out).toJson(QJsonDocument::Compact)) < 0
        || !file.commit()) {
        LOG_WARN(slCore, "RecentQueries: cannot write %s", qPrintable(m_path));
    }
}

QStringList RecentQueries::recent(int limit) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QStringList out;
    for (const Entry& entry : readEntries()) {
        if (out.size() >= limit) {
            break;
        }
        out << entry.query;
    }
    return out;
}

QStringList RecentQueries::suggestions(const QString& fragment, int limit) const
{
    const QString needle = fragment.trimmed();
    std::lock_guard<std::mutex> lock(m_mutex);
    QStringList out;
    for (const Entry& entry : readEntries()) {
        if (out.size() >= limit) {
            break;
        }
        if (needle.isEmpty() || entry.query.contains(needle, Qt::CaseInsensitive)) {
            out << entry.query;
        }
    }
    return out;
}

} // namespace sl
