#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace sl {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(slIpc, "Refusing to encode %d byte frame (limit %d)",
                 static_cast<int>(payload.size()), kMaxMessageSize);
        return {};
    }

    const quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    QByteArray frame;
    frame.reserve(4 + payload.size());
    frame.append(reinterpret_cast<const char*>(&len), 4);
    frame.append(payload);
    return frame;
}

std::optional<IpcMessage::DecodeResult> IpcMessage::decode(const QByteArray& buffer)
{
    if (buffer.size() < 4) {
        return std::nullopt;
    }

    quint32 rawLen = 0;
    std::memcpy(&rawLen, buffer.constData(), 4);
    const quint32 payloadLen = qFromBigEndian(rawLen);
    if (payloadLen > static_cast<quint32>(kMaxMessageSize)) {
        LOG_WARN(slIpc, "Frame length %u exceeds limit %d", payloadLen, kMaxMessageSize);
        return std::nullopt;
    }

    const int frameLen = 4 + static_cast<int>(payloadLen);
    if (buffer.size() < frameLen) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(
        buffer.mid(4, static_cast<int>(payloadLen)), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(slIpc, "Frame JSON parse error: %s", qPrintable(parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        LOG_WARN(slIpc, "Frame payload is not a JSON object");
        return std::nullopt;
    }

    DecodeResult result;
    result.json = doc.object();
    result.bytesConsumed = frameLen;
    return result;
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("request");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject payload = result;
    payload[QStringLiteral("ok")] = true;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("result")] = payload;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message,
                                  const QJsonObject& details)
{
    QJsonObject errorObj = details;
    errorObj[QStringLiteral("code")] = static_cast<int>(code);
    errorObj[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    errorObj[QStringLiteral("message")] = message;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("ok")] = false;
    json[QStringLiteral("error")] = errorObj;
    return json;
}

} // namespace sl
