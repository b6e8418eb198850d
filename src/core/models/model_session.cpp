#include "core/models/model_session.h"

#include "core/shared/logging.h"

#include <QFile>

#include <onnxruntime_cxx_api.h>

#include <algorithm>

namespace sl {

namespace {

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "sourcelight-models");
    return env;
}

std::vector<std::string> collectNames(const Ort::Session& session, bool inputs)
{
    Ort::AllocatorWithDefaultOptions allocator;
    const size_t count = inputs ? session.GetInputCount() : session.GetOutputCount();
    std::vector<std::string> names;
    names.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        Ort::AllocatedStringPtr name = inputs ? session.GetInputNameAllocated(i, allocator)
                                              : session.GetOutputNameAllocated(i, allocator);
        if (name.get() != nullptr && name.get()[0] != '\0') {
            names.emplace_back(name.get());
        }
    }
    return names;
}

} // namespace

class ModelSession::Impl {
public:
    Ort::SessionOptions options;
    std::unique_ptr<Ort::Session> session;
};

ModelSession::ModelSession(const ModelManifestEntry& manifest)
    : m_impl(std::make_unique<Impl>())
    , m_manifest(manifest)
{
}

ModelSession::~ModelSession() = default;

bool ModelSession::initialize(const QString& modelPath)
{
    m_available = false;
    if (modelPath.isEmpty() || !QFile::exists(modelPath)) {
        LOG_WARN(slCore, "ModelSession: model file missing at %s", qPrintable(modelPath));
        return false;
    }

    try {
        m_impl->options.SetIntraOpNumThreads(2);
        m_impl->options.SetInterOpNumThreads(1);
        m_impl->options.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        m_impl->options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_impl->session = std::make_unique<Ort::Session>(
            ortEnvironment(), modelPath.toUtf8().constData(), m_impl->options);

        m_inputNames = collectNames(*m_impl->session, /*inputs=*/true);
        m_outputNames = collectNames(*m_impl->session, /*inputs=*/false);
    } catch (const Ort::Exception& ex) {
        LOG_WARN(slCore, "ModelSession: failed to load '%s': %s",
                 qPrintable(m_manifest.name), ex.what());
        m_impl->session.reset();
        return false;
    }

    for (const QString& expected : m_manifest.inputs) {
        const std::string name = expected.toStdString();
        if (std::find(m_inputNames.begin(), m_inputNames.end(), name) == m_inputNames.end()) {
            LOG_WARN(slCore, "ModelSession: '%s' lacks required input '%s'",
                     qPrintable(m_manifest.name), name.c_str());
            m_impl->session.reset();
            return false;
        }
    }

    if (m_outputNames.empty()) {
        LOG_WARN(slCore, "ModelSession: '%s' exposes no outputs", qPrintable(m_manifest.name));
        m_impl->session.reset();
        return false;
    }

    LOG_INFO(slCore, "ModelSession: loaded '%s' (%zu inputs, %zu outputs)",
             qPrintable(m_manifest.name), m_inputNames.size(), m_outputNames.size());
    m_available = true;
    return true;
}

bool ModelSession::isAvailable() const
{
    return m_available;
}

const ModelManifestEntry& ModelSession::manifest() const
{
    return m_manifest;
}

const std::vector<std::string>& ModelSession::inputNames() const
{
    return m_inputNames;
}

const std::vector<std::string>& ModelSession::outputNames() const
{
    return m_outputNames;
}

Ort::Session* ModelSession::session() const
{
    return m_impl->session.get();
}

} // namespace sl
