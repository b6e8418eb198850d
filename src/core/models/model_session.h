#pragma once

#include "core/models/model_manifest.h"

#include <QString>

#include <memory>
#include <string>
#include <vector>

namespace Ort {
struct Session;
} // namespace Ort

namespace sl {

// Owns one ONNX Runtime session for a manifest role. CPU provider only.
class ModelSession {
public:
    explicit ModelSession(const ModelManifestEntry& manifest);
    ~ModelSession();

    ModelSession(const ModelSession&) = delete;
    ModelSession& operator=(const ModelSession&) = delete;

    // Creates the session and checks that every manifest input exists in
    // the graph. Returns false (and logs) on any failure.
    bool initialize(const QString& modelPath);
    bool isAvailable() const;

    const ModelManifestEntry& manifest() const;
    const std::vector<std::string>& inputNames() const;
    const std::vector<std::string>& outputNames() const;

    // Borrowed pointer, valid for the lifetime of this object.
    Ort::Session* session() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;

    ModelManifestEntry m_manifest;
    std::vector<std::string> m_inputNames;
    std::vector<std::string> m_outputNames;
    bool m_available = false;
};

} // namespace sl
