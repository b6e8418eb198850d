#include "core/ranking/cross_encoder_judge.h"

#include "core/embedding/tokenizer.h"
#include "core/models/model_registry.h"
#include "core/models/model_session.h"
#include "core/shared/logging.h"

#include <QCryptographicHash>

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <cmath>
#include <mutex>

namespace sl {

namespace {

QString passageText(const ChunkRecord& chunk)
{
    if (chunk.section.isEmpty()) {
        return chunk.text;
    }
    return chunk.section + QStringLiteral(" | ") + chunk.text;
}

double sigmoid(float logit)
{
    return 1.0 / (1.0 + std::exp(-static_cast<double>(logit)));
}

} // namespace

class CrossEncoderJudge::Impl {
public:
    Ort::Session* session = nullptr; // owned by the registry
    std::vector<std::string> inputNames;
    std::string outputName;
    std::unique_ptr<WordPieceTokenizer> tokenizer;
    std::mutex runMutex;
};

CrossEncoderJudge::CrossEncoderJudge(ModelRegistry* registry, CrossEncoderJudgeConfig config)
    : m_impl(std::make_unique<Impl>())
    , m_registry(registry)
    , m_config(config)
    , m_proxy(config.proxySemanticWeight, config.proxyLexicalWeight)
    , m_cache(config.cacheSize, std::chrono::seconds(config.cacheTtlSec))
{
}

CrossEncoderJudge::~CrossEncoderJudge() = default;

bool CrossEncoderJudge::initialize()
{
    m_available = false;
    if (!m_registry) {
        return false;
    }

    ModelSession* modelSession = m_registry->getSession(ModelRegistry::kCrossEncoderRole);
    if (!modelSession || !modelSession->isAvailable()) {
        LOG_WARN(slRanking, "CrossEncoderJudge: cross-encoder unavailable, real judge disabled");
        return false;
    }

    m_impl->tokenizer = WordPieceTokenizer::fromManifest(modelSession->manifest(), m_registry->modelsDir());
    if (!m_impl->tokenizer) {
        LOG_WARN(slRanking, "CrossEncoderJudge: tokenizer unavailable");
        return false;
    }

    m_impl->session = modelSession->session();
    m_impl->inputNames = modelSession->inputNames();
    if (modelSession->outputNames().empty()) {
        LOG_WARN(slRanking, "CrossEncoderJudge: model declares no outputs");
        return false;
    }
    m_impl->outputName = modelSession->outputNames().front();
    m_available = true;
    LOG_INFO(slRanking, "CrossEncoderJudge: ready (%s)", qPrintable(modelSession->manifest().modelId));
    return true;
}

bool CrossEncoderJudge::isAvailable() const
{
    return m_available;
}

QString CrossEncoderJudge::cacheKey(const QString& query, const ChunkRecord& chunk)
{
    QCryptographicHash hash(QCryptographicHash::Sha1);
    hash.addData(chunk.publisher.toUtf8());
    hash.addData(QByteArrayLiteral("\x1f"));
    hash.addData(chunk.cid.toUtf8());
    hash.addData(QByteArrayLiteral("\x1f"));
    hash.addData(chunk.text.toUtf8());
    return query.trimmed().toLower() + QLatin1Char('\x1f')
        + QString::fromLatin1(hash.result().toHex());
}

std::optional<std::vector<double>> CrossEncoderJudge::score(const QString& query,
                                                            const std::vector<Candidate>& candidates,
                                                            QString* errorOut)
{
    if (!m_available) {
        if (errorOut) {
            *errorOut = QStringLiteral("cross-encoder unavailable");
        }
        return std::nullopt;
    }

    std::vector<double> scores(candidates.size(), 0.0);
    std::vector<const Candidate*> pending;
    std::vector<size_t> pendingSlots;
    std::vector<QString> pendingKeys;

    const size_t modelLimit = static_cast<size_t>(std::max(m_config.topK, 0));
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (i >= modelLimit) {
            scores[i] = m_proxy.scoreOne(candidates[i]);
            continue;
        }
        const QString key = cacheKey(query, candidates[i].chunk);
        if (std::optional<double> cached = m_cache.get(key)) {
            scores[i] = cached.value();
            continue;
        }
        pending.push_back(&candidates[i]);
        pendingSlots.push_back(i);
        pendingKeys.push_back(key);
    }

    if (!pending.empty()) {
        std::optional<std::vector<double>> fresh = runModel(query, pending, errorOut);
        if (!fresh) {
            return std::nullopt;
        }
        for (size_t j = 0; j < pending.size(); ++j) {
            scores[pendingSlots[j]] = fresh->at(j);
            m_cache.put(pendingKeys[j], fresh->at(j));
        }
    }
    return scores;
}

std::optional<std::vector<double>> CrossEncoderJudge::runModel(const QString& query,
                                                               const std::vector<const Candidate*>& batch,
                                                               QString* errorOut)
{
    std::vector<std::pair<QString, QString>> pairs;
    pairs.reserve(batch.size());
    for (const Candidate* c : batch) {
        pairs.emplace_back(query, passageText(c->chunk));
    }

    const Encoding enc = m_impl->tokenizer->encodePairs(pairs);
    if (enc.rows != static_cast<int>(batch.size()) || enc.seqLength <= 0) {
        if (errorOut) {
            *errorOut = QStringLiteral("tokenization failed");
        }
        return std::nullopt;
    }

    const int64_t shape[2] = {static_cast<int64_t>(enc.rows), static_cast<int64_t>(enc.seqLength)};

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
            m_invocations.fetch_add(1);
            outputs = m_impl->session->Run(Ort::RunOptions{nullptr}, inputNames.data(),
                                           inputs.data(), inputs.size(), outputNames, 1);
        }

        if (outputs.empty() || !outputs[0].IsTensor()) {
            if (errorOut) {
                *errorOut = QStringLiteral("cross-encoder returned no tensor");
            }
            return std::nullopt;
        }

        const std::vector<int64_t> outShape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* logits = outputs[0].GetTensorData<float>();
        // [batch] or [batch, classes]; the last class is the relevance logit.
        const int64_t stride = outShape.size() >= 2 ? std::max<int64_t>(outShape[1], 1) : 1;
        if (!logits || outShape.empty() || outShape[0] != enc.rows) {
            if (errorOut) {
                *errorOut = QStringLiteral("unexpected cross-encoder output shape");
            }
            return std::nullopt;
        }

        std::vector<double> scores;
        scores.reserve(batch.size());
        for (int64_t row = 0; row < enc.rows; ++row) {
            scores.push_back(sigmoid(logits[row * stride + (stride - 1)]));
        }
        return scores;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(slRanking, "CrossEncoderJudge: inference failed: %s", ex.what());
        if (errorOut) {
            *errorOut = QStringLiteral("inference failed");
        }
        return std::nullopt;
    }
}

} // namespace sl
