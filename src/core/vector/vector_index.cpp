#include "core/vector/vector_index.h"

#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>

namespace sl {

namespace {

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

VectorIndex::VectorIndex() = default;

VectorIndex::~VectorIndex() = default;

bool VectorIndex::create(int dimensions, const QString& modelId, int capacity)
{
    if (dimensions <= 0) {
        LOG_ERROR(slCorpus, "VectorIndex::create: invalid dimensions %d", dimensions);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(dimensions));
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(), static_cast<size_t>(std::max(capacity, 1)),
            static_cast<size_t>(kM), static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
    } catch (const std::exception& e) {
        LOG_ERROR(slCorpus, "VectorIndex::create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }

    m_metadata = IndexMetadata{};
    m_metadata.dimensions = dimensions;
    m_metadata.modelId = modelId;
    return true;
}

bool VectorIndex::addVector(uint64_t label, const std::vector<float>& embedding)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index || static_cast<int>(embedding.size()) != m_metadata.dimensions) {
        return false;
    }

    try {
        if (m_index->getCurrentElementCount() >= m_index->getMaxElements()) {
            m_index->resizeIndex(m_index->getMaxElements() * 2);
        }
        m_index->addPoint(embedding.data(), static_cast<hnswlib::labeltype>(label));
    } catch (const std::exception& e) {
        LOG_ERROR(slCorpus, "VectorIndex::addVector(%llu) failed: %s",
                  static_cast<unsigned long long>(label), e.what());
        return false;
    }
    m_metadata.nextLabel = std::max(m_metadata.nextLabel, label + 1);
    m_metadata.totalElements = static_cast<int>(m_index->getCurrentElementCount());
    return true;
}

bool VectorIndex::save(const QString& indexPath, const QString& metaPath)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index) {
        return false;
    }

    try {
        m_index->saveIndex(indexPath.toStdString());
    } catch (const std::exception& e) {
        LOG_ERROR(slCorpus, "VectorIndex::save failed: %s", e.what());
        return false;
    }

    QJsonObject meta;
    meta.insert(QStringLiteral("dimensions"), m_metadata.dimensions);
    meta.insert(QStringLiteral("model_id"), m_metadata.modelId);
    meta.insert(QStringLiteral("total_elements"), m_metadata.totalElements);
    meta.insert(QStringLiteral("next_label"), static_cast<qint64>(m_metadata.nextLabel));
    meta.insert(QStringLiteral("m"), kM);
    meta.insert(QStringLiteral("ef_construction"), kEfConstruction);
    meta.insert(QStringLiteral("last_persisted"),
                QDateTime::currentDateTimeUtc().toString(Qt::ISODate));

    QFile metaFile(metaPath);
    if (!metaFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(slCorpus, "VectorIndex::save cannot write %s", qPrintable(metaPath));
        return false;
    }
    return metaFile.write(QJsonDocument(meta).toJson(QJsonDocument::Indented)) >= 0;
}

std::optional<VectorIndex::IndexMetadata> VectorIndex::readMetadata(const QString& metaPath,
                                                                    QString* errorOut)
{
    QFile metaFile(metaPath);
    if (!metaFile.open(QIODevice::ReadOnly)) {
        setError(errorOut, QStringLiteral("cannot open %1").arg(metaPath));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(metaFile.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(errorOut, QStringLiteral("invalid index metadata: %1").arg(parseError.errorString()));
        return std::nullopt;
    }

    const QJsonObject meta = doc.object();
    IndexMetadata md;
    md.dimensions = meta.value(QStringLiteral("dimensions")).toInt(-1);
    md.modelId = meta.value(QStringLiteral("model_id")).toString(md.modelId);
    md.totalElements = meta.value(QStringLiteral("total_elements")).toInt(0);
    md.nextLabel = meta.value(QStringLiteral("next_label")).toVariant().toULongLong();
    if (md.dimensions <= 0) {
        setError(errorOut, QStringLiteral("index metadata has no dimensions"));
        return std::nullopt;
    }
    return md;
}

bool VectorIndex::load(const QString& indexPath, const QString& metaPath, QString* errorOut)
{
    const QFileInfo indexInfo(indexPath);
    // Truncated payloads crash hnswlib during deserialization.
    constexpr qint64 kMinSerializedIndexBytes = 96;
    if (!indexInfo.isFile() || indexInfo.size() < kMinSerializedIndexBytes) {
        setError(errorOut, QStringLiteral("index file missing or truncated: %1").arg(indexPath));
        return false;
    }

    std::optional<IndexMetadata> md = readMetadata(metaPath, errorOut);
    if (!md) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(md->dimensions));
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(), indexPath.toStdString());
        m_index->setEf(static_cast<size_t>(kEfSearch));
    } catch (const std::exception& e) {
        setError(errorOut, QStringLiteral("hnsw load failed: %1").arg(QString::fromUtf8(e.what())));
        m_index.reset();
        m_space.reset();
        return false;
    }

    // The serialized layout keeps each vector between offsetData_ and label_offset_.
    const size_t storedDims = (m_index->label_offset_ - m_index->offsetData_) / sizeof(float);
    if (storedDims != static_cast<size_t>(md->dimensions)) {
        setError(errorOut, QStringLiteral("dimension mismatch: metadata says %1, index stores %2")
                               .arg(md->dimensions)
                               .arg(static_cast<qulonglong>(storedDims)));
        m_index.reset();
        m_space.reset();
        return false;
    }

    m_metadata = md.value();
    const int loaded = static_cast<int>(m_index->getCurrentElementCount());
    if (m_metadata.totalElements != 0 && m_metadata.totalElements != loaded) {
        LOG_WARN(slCorpus, "VectorIndex: meta says %d elements, index has %d",
                 m_metadata.totalElements, loaded);
    }
    m_metadata.totalElements = loaded;
    return true;
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(const std::vector<float>& query, int k) const
{
    std::vector<KnnResult> results;
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index || k <= 0 || static_cast<int>(query.size()) != m_metadata.dimensions) {
        return results;
    }

    const size_t limit = std::min(static_cast<size_t>(k), m_index->getCurrentElementCount());
    if (limit == 0) {
        return results;
    }

    try {
        m_index->setEf(std::max(static_cast<size_t>(kEfSearch), limit));
        auto queue = m_index->searchKnn(query.data(), limit);
        results.reserve(queue.size());
        while (!queue.empty()) {
            results.push_back(KnnResult{static_cast<uint64_t>(queue.top().second), queue.top().first});
            queue.pop();
        }
    } catch (const std::exception& e) {
        LOG_ERROR(slRetrieval, "VectorIndex::search failed: %s", e.what());
        return {};
    }

    std::sort(results.begin(), results.end(), [](const KnnResult& a, const KnnResult& b) {
        if (a.distance != b.distance) {
            return a.distance < b.distance;
        }
        return a.label < b.label;
    });
    return results;
}

std::optional<std::vector<float>> VectorIndex::vectorForLabel(uint64_t label) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index) {
        return std::nullopt;
    }
    try {
        return m_index->getDataByLabel<float>(static_cast<hnswlib::labeltype>(label));
    } catch (const std::exception&) {
        // Unknown or deleted label.
        return std::nullopt;
    }
}

bool VectorIndex::isAvailable() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index != nullptr;
}

int VectorIndex::totalElements() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index ? static_cast<int>(m_index->getCurrentElementCount()) : 0;
}

int VectorIndex::dimensions() const
{
    return m_metadata.dimensions;
}

const VectorIndex::IndexMetadata& VectorIndex::metadata() const
{
    return m_metadata;
}

} // namespace sl
