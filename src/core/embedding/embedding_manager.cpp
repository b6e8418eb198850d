#include "core/embedding/embedding_manager.h"

#include "core/embedding/tokenizer.h"
#include "core/models/model_registry.h"
#include "core/models/model_session.h"
#include "core/shared/logging.h"

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <mutex>
#include <string>

namespace sl {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    return steadyNowMs() - lastFailureMs.load() < kHalfOpenDelayMs;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureMs.store(steadyNowMs());
}

class EmbeddingManager::Impl {
public:
    Ort::Session* session = nullptr; // owned by the registry
    std::vector<std::string> inputNames;
    std::string outputName;
    std::mutex runMutex;
};

EmbeddingManager::EmbeddingManager(ModelRegistry* registry)
    : m_impl(std::make_unique<Impl>())
    , m_registry(registry)
{
}

EmbeddingManager::~EmbeddingManager() = default;

bool EmbeddingManager::initialize()
{
    m_available = false;
    if (!m_registry) {
        return false;
    }

    ModelSession* modelSession = m_registry->getSession(ModelRegistry::kBiEncoderRole);
    if (!modelSession || !modelSession->isAvailable()) {
        LOG_WARN(slRetrieval, "EmbeddingManager: bi-encoder unavailable, dense retrieval disabled");
        return false;
    }

    const ModelManifestEntry& entry = modelSession->manifest();
    m_tokenizer = WordPieceTokenizer::fromManifest(entry, m_registry->modelsDir());
    if (!m_tokenizer) {
        LOG_WARN(slRetrieval, "EmbeddingManager: no tokenizer for '%s'", qPrintable(entry.name));
        return false;
    }
    if (entry.dimensions <= 0) {
        LOG_WARN(slRetrieval, "EmbeddingManager: manifest dimensions missing for '%s'",
                 qPrintable(entry.name));
        return false;
    }

    m_dimensions = entry.dimensions;
    m_modelId = entry.modelId;
    m_queryPrefix = entry.queryPrefix;
    m_poolingStrategy = entry.poolingStrategy;
    m_impl->session = modelSession->session();
    m_impl->inputNames = modelSession->inputNames();
    if (modelSession->outputNames().empty()) {
        LOG_WARN(slRetrieval, "EmbeddingManager: model declares no outputs");
        return false;
    }
    m_impl->outputName = modelSession->outputNames().front();

    LOG_INFO(slRetrieval, "EmbeddingManager: ready (%s, %d dims)", qPrintable(m_modelId), m_dimensions);
    m_available = true;
    return true;
}

bool EmbeddingManager::isAvailable() const
{
    return m_available;
}

QString EmbeddingManager::modelId() const
{
    return m_modelId;
}

int EmbeddingManager::dimensions() const
{
    return m_dimensions;
}

void EmbeddingManager::normalizeInPlace(std::vector<float>& vec)
{
    double sumSquares = 0.0;
    for (const float v : vec) {
        sumSquares += static_cast<double>(v) * static_cast<double>(v);
    }
    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return;
    }
    for (float& v : vec) {
        v = static_cast<float>(static_cast<double>(v) / norm);
    }
}

std::vector<float> EmbeddingManager::poolTokens(const float* data, int seqLength, int dimensions,
                                                const std::vector<int64_t>& attentionMask,
                                                const QString& strategy)
{
    std::vector<float> pooled(static_cast<size_t>(std::max(dimensions, 0)), 0.0f);
    if (!data || seqLength <= 0 || dimensions <= 0) {
        return pooled;
    }
    if (strategy == QLatin1String("cls")) {
        std::copy(data, data + dimensions, pooled.begin());
        return pooled;
    }

    std::vector<double> sums(static_cast<size_t>(dimensions), 0.0);
    int counted = 0;
    for (int t = 0; t < seqLength; ++t) {
        const bool masked = static_cast<size_t>(t) < attentionMask.size() && attentionMask[t] == 0;
        if (masked) {
            continue;
        }
        const float* row = data + static_cast<size_t>(t) * static_cast<size_t>(dimensions);
        for (int d = 0; d < dimensions; ++d) {
            sums[d] += row[d];
        }
        ++counted;
    }
    if (counted == 0) {
        return pooled;
    }
    for (int d = 0; d < dimensions; ++d) {
        pooled[d] = static_cast<float>(sums[d] / counted);
    }
    return pooled;
}

std::vector<float> EmbeddingManager::embedQuery(const QString& text)
{
    if (!m_available || text.trimmed().isEmpty()) {
        return {};
    }
    if (m_breaker.isOpen()) {
        LOG_DEBUG(slRetrieval, "EmbeddingManager: circuit open, skipping inference");
        return {};
    }

    const Encoding enc = m_tokenizer->encode(m_queryPrefix + text);
    if (enc.rows != 1 || enc.seqLength <= 0) {
        return {};
    }

    const int64_t shape[2] = {1, static_cast<int64_t>(enc.seqLength)};

    try {
        Ort::MemoryInfo memoryInfo =
            Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator, OrtMemTypeDefault);

        std::vector<Ort::Value> inputs;
        std::vector<const char*> inputNames;
        for (const std::string& name : m_impl->inputNames) {
            const std::vector<int64_t>* source = nullptr;
            if (name == "input_ids") {
                source = &enc.inputIds;
            } else if (name == "attention_mask") {
                source = &enc.attentionMask;
            } else if (name == "token_type_ids") {
                source = &enc.tokenTypeIds;
            } else {
                continue;
            }
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                memoryInfo, const_cast<int64_t*>(source->data()), source->size(), shape, 2));
            inputNames.push_back(name.c_str());
        }
        const char* outputNames[1] = {m_impl->outputName.c_str()};

        std::vector<Ort::Value> outputs;
        {
            std::lock_guard<std::mutex> lock(m_impl->runMutex);
            outputs = m_impl->session->Run(Ort::RunOptions{nullptr}, inputNames.data(),
                                           inputs.data(), inputs.size(), outputNames, 1);
        }

        if (outputs.empty() || !outputs[0].IsTensor()) {
            m_breaker.recordFailure();
            return {};
        }

        const std::vector<int64_t> outShape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();
        const bool pooled = outShape.size() == 2 && outShape[1] == m_dimensions;
        const bool perToken = outShape.size() == 3 && outShape[1] >= 1 && outShape[2] == m_dimensions;
        if (!data || !(pooled || perToken)) {
            LOG_WARN(slRetrieval, "EmbeddingManager: unexpected output rank %zu", outShape.size());
            m_breaker.recordFailure();
            return {};
        }

        std::vector<float> embedding;
        if (pooled) {
            embedding.assign(data, data + m_dimensions);
        } else {
            embedding = poolTokens(data, static_cast<int>(outShape[1]), m_dimensions,
                                   enc.attentionMask, m_poolingStrategy);
        }
        normalizeInPlace(embedding);
        m_breaker.recordSuccess();
        return embedding;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(slRetrieval, "EmbeddingManager: inference failed: %s", ex.what());
        m_breaker.recordFailure();
        return {};
    }
}

} // namespace sl
