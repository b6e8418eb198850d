#include "core/ipc/service_base.h"
#include "core/ipc/socket_client.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>

#include <cstdio>

// Thin socket client for the engine:
//   sourcelight-query search "what is rag" --params '{"mode":"quick"}'
//   sourcelight-query health
int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("sourcelight-query"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Send one request to the SourceLight engine"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("method"),
                                 QStringLiteral("search, chat, health, stats, suggestions, "
                                                "readerChunk, refresh, ping or shutdown"));
    parser.addPositionalArgument(QStringLiteral("text"),
                                 QStringLiteral("Query, chat message or suggestion fragment"),
                                 QStringLiteral("[text]"));
    QCommandLineOption paramsOption(QStringLiteral("params"),
                                    QStringLiteral("Extra request parameters as a JSON object"),
                                    QStringLiteral("json"));
    QCommandLineOption socketOption(QStringLiteral("socket"),
                                    QStringLiteral("Engine socket path"), QStringLiteral("path"),
                                    sl::ServiceBase::socketPath(QStringLiteral("rag")));
    QCommandLineOption timeoutOption(QStringLiteral("timeout"),
                                     QStringLiteral("Request timeout in milliseconds"),
                                     QStringLiteral("ms"), QStringLiteral("30000"));
    parser.addOption(paramsOption);
    parser.addOption(socketOption);
    parser.addOption(timeoutOption);
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString method = args.at(0);

    QJsonObject params;
    if (parser.isSet(paramsOption)) {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(parser.value(paramsOption).toUtf8(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            std::fprintf(stderr, "--params must be a JSON object: %s\n",
                         qPrintable(parseError.errorString()));
            return 2;
        }
        params = doc.object();
    }
    if (args.size() > 1) {
        const QString text = args.mid(1).join(QLatin1Char(' '));
        if (method == QLatin1String("chat")) {
            params[QStringLiteral("message")] = text;
        } else if (method == QLatin1String("suggestions")) {
            params[QStringLiteral("q")] = text;
        } else {
            params[QStringLiteral("query")] = text;
        }
    }

    sl::SocketClient client;
    if (!client.connectToServer(parser.value(socketOption), 3000)) {
        std::fprintf(stderr, "Engine not reachable at %s\n", qPrintable(parser.value(socketOption)));
        return 3;
    }

    const std::optional<QJsonObject> response =
        client.sendRequest(method, params, parser.value(timeoutOption).toInt());
    if (!response) {
        std::fprintf(stderr, "No response for %s\n", qPrintable(method));
        return 4;
    }

    std::fprintf(stdout, "%s\n", QJsonDocument(*response).toJson(QJsonDocument::Indented).constData());
    return response->value(QStringLiteral("type")).toString() == QLatin1String("error") ? 1 : 0;
}
