#pragma once

#include "core/shared/ipc_messages.h"
#include <QByteArray>
#include <QJsonObject>
#include <optional>

namespace sl {

// Wire framing for the engine socket: 4-byte big-endian payload length
// followed by compact UTF-8 JSON.
class IpcMessage {
public:
    static QByteArray encode(const QJsonObject& json);

    struct DecodeResult {
        QJsonObject json;
        int bytesConsumed = 0;
    };
    // Returns nullopt until the buffer holds one complete frame.
    static std::optional<DecodeResult> decode(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});

    // Success envelope. "ok": true is stamped into the result object.
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);

    // Error envelope: {type, id, ok:false, error:{code, codeString, message, ...details}}.
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message,
                                 const QJsonObject& details = {});

    static constexpr int kMaxMessageSize = 16 * 1024 * 1024;
};

} // namespace sl
