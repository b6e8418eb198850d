#include "core/corpus/corpus_registry.h"

#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>

namespace sl {

QJsonObject CorpusReport::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("publisher")] = publisher;
    json[QStringLiteral("exists")] = exists;
    json[QStringLiteral("index")] = index;
    json[QStringLiteral("db")] = db;
    json[QStringLiteral("manifest")] = manifest;
    json[QStringLiteral("missing")] = QJsonArray::fromStringList(missing);
    json[QStringLiteral("reasons")] = QJsonArray::fromStringList(reasons);
    json[QStringLiteral("failure_reason")] =
        failureReason.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(failureReason);
    json[QStringLiteral("dim_ok")] = dimOk;
    json[QStringLiteral("dense_loaded")] = denseLoaded;
    json[QStringLiteral("db_loaded")] = dbLoaded;
    json[QStringLiteral("ready")] = ready;
    json[QStringLiteral("ix_dim")] = indexDim;
    json[QStringLiteral("embed_dim")] = embedDim;
    return json;
}

CorpusRegistry::CorpusRegistry(const QString& dataRoot, const QStringList& publishers)
    : m_dataRoot(dataRoot)
    , m_publishers(publishers)
{
}

QString CorpusRegistry::publisherDir(const QString& publisher) const
{
    return QDir(m_dataRoot).filePath(publisher);
}

bool CorpusRegistry::isReady(const QString& publisher) const
{
    const QDir dir(publisherDir(publisher));
    return QFileInfo::exists(dir.filePath(QLatin1String(kIndexFile)))
        && QFileInfo::exists(dir.filePath(QLatin1String(kDbFile)));
}

CorpusReport CorpusRegistry::inspect(const QString& publisher) const
{
    CorpusReport report;
    report.publisher = publisher;

    const QDir dir(publisherDir(publisher));
    report.exists = dir.exists();
    if (!report.exists) {
        report.failureReason = QStringLiteral("corpus folder missing");
        report.reasons << report.failureReason;
        return report;
    }

    report.index = QFileInfo::exists(dir.filePath(QLatin1String(kIndexFile)));
    report.db = QFileInfo::exists(dir.filePath(QLatin1String(kDbFile)));
    report.manifest = QFileInfo::exists(dir.filePath(QLatin1String(kManifestFile)));
    if (!report.index) {
        report.missing << QLatin1String(kIndexFile);
    }
    if (!report.db) {
        report.missing << QLatin1String(kDbFile);
    }
    if (!report.manifest) {
        report.missing << QLatin1String(kManifestFile);
    }
    if (!report.missing.isEmpty()) {
        report.failureReason = QStringLiteral("missing: %1").arg(report.missing.join(QStringLiteral(", ")));
        report.reasons << report.failureReason;
    }
    return report;
}

std::shared_ptr<CorpusHandle> CorpusRegistry::load(const QString& publisher,
                                                   const EmbedderIdentity& embedder,
                                                   CorpusReport* reportOut,
                                                   QString* errorOut) const
{
    CorpusReport report = inspect(publisher);
    report.embedDim = embedder.available ? embedder.dimensions : 0;

    auto fail = [&](const QString& reason) -> std::shared_ptr<CorpusHandle> {
        if (report.failureReason.isEmpty()) {
            report.failureReason = reason;
        }
        if (!report.reasons.contains(reason)) {
            report.reasons << reason;
        }
        report.ready = false;
        LOG_WARN(slCorpus, "Corpus %s not ready: %s", qPrintable(publisher), qPrintable(reason));
        if (reportOut) {
            *reportOut = report;
        }
        if (errorOut) {
            *errorOut = reason;
        }
        return nullptr;
    };

    if (!report.exists || !report.missing.isEmpty()) {
        return fail(report.failureReason);
    }

    const QDir dir(publisherDir(publisher));
    auto handle = std::make_shared<CorpusHandle>();
    handle->publisher = publisher;
    handle->directory = dir.absolutePath();

    QString error;
    std::optional<CorpusManifest> manifest =
        CorpusManifest::loadFromFile(dir.filePath(QLatin1String(kManifestFile)), &error);
    if (!manifest) {
        return fail(QStringLiteral("manifest invalid: %1").arg(error));
    }
    handle->manifest = manifest.value();

    std::optional<ChunkStore> store = ChunkStore::open(dir.filePath(QLatin1String(kDbFile)), publisher, &error);
    if (!store) {
        return fail(QStringLiteral("metadata db unavailable: %1").arg(error));
    }
    handle->store = std::make_unique<ChunkStore>(std::move(store.value()));
    report.dbLoaded = true;
    handle->dbBytes = QFileInfo(dir.filePath(QLatin1String(kDbFile))).size();
    handle->indexBytes = QFileInfo(dir.filePath(QLatin1String(kIndexFile))).size();

    if (!embedder.available) {
        // Dense retrieval needs an embedder; serve this corpus from FTS alone.
        report.indexDim = handle->manifest.dimensions;
        report.dimOk = true;
        report.reasons << QStringLiteral("embedder unavailable: lexical only");
    } else {
        if (embedder.modelId != handle->manifest.embeddingModel) {
            return fail(QStringLiteral("embedding model mismatch: embedder %1 vs corpus %2")
                            .arg(embedder.modelId, handle->manifest.embeddingModel));
        }

        auto index = std::make_unique<VectorIndex>();
        if (!index->load(dir.filePath(QLatin1String(kIndexFile)),
                         dir.filePath(QLatin1String(kIndexMetaFile)), &error)) {
            return fail(QStringLiteral("index load error: %1").arg(error));
        }
        report.indexDim = index->dimensions();

        if (index->dimensions() != embedder.dimensions) {
            return fail(QStringLiteral("dim mismatch: emb %1 vs ix %2")
                            .arg(embedder.dimensions).arg(index->dimensions()));
        }
        if (index->dimensions() != handle->manifest.dimensions) {
            return fail(QStringLiteral("dim mismatch: manifest %1 vs ix %2")
                            .arg(handle->manifest.dimensions).arg(index->dimensions()));
        }
        report.dimOk = true;

        if (index->totalElements() != handle->manifest.chunkCount) {
            return fail(QStringLiteral("chunk count mismatch: manifest %1 vs ix %2")
                            .arg(handle->manifest.chunkCount).arg(index->totalElements()));
        }
        handle->index = std::move(index);
        report.denseLoaded = true;
    }

    const int rows = handle->store->chunkCount();
    if (rows != handle->manifest.chunkCount) {
        LOG_WARN(slCorpus, "Corpus %s: manifest lists %d chunks, store holds %d",
                 qPrintable(publisher), handle->manifest.chunkCount, rows);
    }

    report.ready = true;
    report.failureReason.clear();
    LOG_INFO(slCorpus, "Corpus %s loaded (%d chunks, dense=%s)", qPrintable(publisher), rows,
             handle->denseEnabled() ? "on" : "off");
    if (reportOut) {
        *reportOut = report;
    }
    return handle;
}

std::vector<CorpusReport> CorpusRegistry::refresh(const EmbedderIdentity& embedder)
{
    std::map<QString, std::shared_ptr<CorpusHandle>> handles;
    std::map<QString, CorpusReport> reports;
    for (const QString& publisher : m_publishers) {
        CorpusReport report;
        std::shared_ptr<CorpusHandle> handle = load(publisher, embedder, &report);
        if (handle) {
            handles.emplace(publisher, std::move(handle));
        }
        reports.emplace(publisher, std::move(report));
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handles.swap(handles);
        m_reports.swap(reports);
    }
    return this->reports();
}

std::shared_ptr<CorpusHandle> CorpusRegistry::handle(const QString& publisher) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_handles.find(publisher);
    return it == m_handles.end() ? nullptr : it->second;
}

QStringList CorpusRegistry::loadedPublishers() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QStringList out;
    for (const QString& publisher : m_publishers) {
        if (m_handles.count(publisher) > 0) {
            out << publisher;
        }
    }
    return out;
}

std::vector<CorpusReport> CorpusRegistry::reports() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<CorpusReport> out;
    for (const QString& publisher : m_publishers) {
        auto it = m_reports.find(publisher);
        if (it != m_reports.end()) {
            out.push_back(it->second);
        } else {
            out.push_back(inspect(publisher));
        }
    }
    return out;
}

} // namespace sl
