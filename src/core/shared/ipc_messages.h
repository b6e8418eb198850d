#pragma once

#include <QString>
#include <cstdint>

namespace sl {

// Error codes carried in IPC error envelopes. The string forms are the
// stable contract seen by API clients.
enum class IpcErrorCode : int {
    InvalidParams     = 1,
    NotFound          = 2,
    InternalError     = 3,
    EngineUnavailable = 10,
    EmptyCorpus       = 11,
    MissingPublishers = 12,
    SearchTimeout     = 13,
    SearchError       = 14,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:     return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::NotFound:          return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::InternalError:     return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::EngineUnavailable: return QStringLiteral("ENGINE_UNAVAILABLE");
    case IpcErrorCode::EmptyCorpus:       return QStringLiteral("EMPTY_CORPUS");
    case IpcErrorCode::MissingPublishers: return QStringLiteral("MISSING_PUBLISHERS");
    case IpcErrorCode::SearchTimeout:     return QStringLiteral("SEARCH_TIMEOUT");
    case IpcErrorCode::SearchError:       return QStringLiteral("SEARCH_ERROR");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace sl
