#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(slCore, "sourcelight.core")
Q_LOGGING_CATEGORY(slCorpus, "sourcelight.corpus")
Q_LOGGING_CATEGORY(slRetrieval, "sourcelight.retrieval")
Q_LOGGING_CATEGORY(slRanking, "sourcelight.ranking")
Q_LOGGING_CATEGORY(slIpc, "sourcelight.ipc")
